#ifndef SENSISCAN_REVIEW_REVIEW_SESSION_HPP
#define SENSISCAN_REVIEW_REVIEW_SESSION_HPP

#include <optional>
#include <string>
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "review/feedback_ledger.hpp"
#include "review/review_queue.hpp"
#include "storage/findings_store.hpp"
#include "util/logger.hpp"

/**
 * @file review_session.hpp
 * @brief One reviewer's pass over a ReviewQueue.
 *
 * STATES:
 *   Presenting --present()--> AwaitingVerdict --submitVerdict()--> Committing
 *   Committing --ok--> Presenting
 *   Committing --ReviewTransactionError--> AwaitingVerdict (same item)
 *   AwaitingVerdict --pass()--> Presenting (nothing written)
 *   any --quit()--> Done;  Presenting --queue exhausted--> Done
 *
 * Committed verdicts stay committed after quit(). An item that was presented
 * but not committed is simply dropped.
 *
 * USAGE:
 *   ReviewSession session(ReviewQueue(scan), store, ledger);
 *   while (auto item = session.present()) {
 *       session.submitVerdict(item->match.matchId, Verdict::TruePositive, std::nullopt);
 *   }
 */

namespace sensiscan {
namespace review {

class ReviewSession
{
public:
    enum class State { Presenting, AwaitingVerdict, Committing, Done };

    ReviewSession(ReviewQueue queue, storage::SecureFindingsStore &store, FeedbackLedger &ledger)
        : queue_(std::move(queue)), store_(store), ledger_(ledger)
    {
    }

    State state() const { return state_; }
    size_t committedCount() const { return committed_; }
    const std::optional<ReviewItem>& current() const { return current_; }

    /**
     * @brief Expose the next item for a verdict.
     *
     * Called again while a verdict is outstanding it returns the same item.
     * @return nullopt once the queue is exhausted or the session is done.
     */
    std::optional<ReviewItem> present()
    {
        if (state_ == State::AwaitingVerdict) {
            return current_;
        }
        if (state_ != State::Presenting) {
            return std::nullopt;
        }
        current_ = queue_.next();
        if (!current_) {
            util::logger::info("ReviewSession: queue for scan " + queue_.scanId() + " exhausted after "
                               + std::to_string(committed_) + " verdicts.");
            state_ = State::Done;
            return std::nullopt;
        }
        state_ = State::AwaitingVerdict;
        return current_;
    }

    /**
     * @brief Commit a verdict for the presented match.
     *
     * Accepts TP, FP and UNSURE (stored as SKIPPED).
     * @throw core::ReviewTransactionError(invalid_state) for a wrong state,
     *        an id other than the presented one, or another verdict. The
     *        session state is unchanged.
     * @throw core::ReviewTransactionError from the store; the session goes
     *        back to AwaitingVerdict on the same item.
     */
    core::ReviewFeedbackRecord submitVerdict(const std::string &matchId,
                                             core::Verdict verdict,
                                             const std::optional<std::string> &reason)
    {
        if (state_ != State::AwaitingVerdict || !current_) {
            throw core::ReviewTransactionError(core::ErrorCode::InvalidState, "no match presented");
        }
        if (matchId != current_->match.matchId) {
            throw core::ReviewTransactionError(core::ErrorCode::InvalidState, matchId);
        }
        if (verdict != core::Verdict::TruePositive && verdict != core::Verdict::FalsePositive
            && verdict != core::Verdict::Unsure) {
            throw core::ReviewTransactionError(core::ErrorCode::InvalidState, core::toString(verdict));
        }

        state_ = State::Committing;
        try {
            core::ReviewFeedbackRecord rec = store_.commitVerdict(matchId, verdict, reason, ledger_);
            ++committed_;
            current_.reset();
            state_ = State::Presenting;
            return rec;
        }
        catch (const core::ReviewTransactionError &ex) {
            util::logger::warn("ReviewSession: verdict for " + matchId + " not committed: " + ex.what());
            state_ = State::AwaitingVerdict;
            throw;
        }
    }

    /**
     * @brief Move past the presented item without a verdict. Used for items
     *        that already carry one, which the store will not overwrite.
     * @throw core::ReviewTransactionError(invalid_state) unless an item is presented.
     */
    void pass()
    {
        if (state_ != State::AwaitingVerdict || !current_) {
            throw core::ReviewTransactionError(core::ErrorCode::InvalidState, "no match presented");
        }
        current_.reset();
        state_ = State::Presenting;
    }

    void quit()
    {
        if (state_ != State::Done) {
            util::logger::info("ReviewSession: quit with " + std::to_string(committed_) + " verdicts committed.");
        }
        current_.reset();
        state_ = State::Done;
    }

private:
    ReviewQueue queue_;
    storage::SecureFindingsStore &store_;
    FeedbackLedger &ledger_;
    State state_ = State::Presenting;
    std::optional<ReviewItem> current_;
    size_t committed_ = 0;
};

} // namespace review
} // namespace sensiscan

#endif // SENSISCAN_REVIEW_REVIEW_SESSION_HPP
