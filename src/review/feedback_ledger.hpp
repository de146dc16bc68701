#ifndef SENSISCAN_REVIEW_FEEDBACK_LEDGER_HPP
#define SENSISCAN_REVIEW_FEEDBACK_LEDGER_HPP

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "core/entity_types.hpp"
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "util/json_text.hpp"
#include "util/logger.hpp"
#include "util/time_format.hpp"

/**
 * @file feedback_ledger.hpp
 * @brief Append-only JSON-lines ledger of reviewer verdicts, consumed by the
 *        external retraining job.
 *
 * DESIGN GOALS:
 *   - Stable field names: match_id, entity_type, verdict,
 *     confidence_at_review, detector_source, context_snippet, reason,
 *     timestamp.
 *   - append() returns the ledger size before the write, so a caller whose
 *     surrounding transaction fails can truncateTo() that size.
 *   - Only anonymized context is ever written.
 */

namespace sensiscan {
namespace review {

struct LedgerStats
{
    size_t total = 0;
    size_t truePositives = 0;
    size_t falsePositives = 0;
    size_t skipped = 0;
    std::map<core::EntityType, size_t> byEntity;
};

class FeedbackLedger
{
public:
    explicit FeedbackLedger(std::string path)
        : path_(std::move(path))
    {
    }

    const std::string& path() const { return path_; }

    /**
     * @return Size in bytes of the ledger before this append.
     * @throw core::ReviewTransactionError(ledger_write_failed)
     */
    uint64_t append(const core::ReviewFeedbackRecord &record)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t prior = currentSize();

        std::ofstream out(path_, std::ios::app);
        if (!out.is_open()) {
            util::logger::error("FeedbackLedger: cannot open " + path_);
            throw core::ReviewTransactionError(core::ErrorCode::LedgerWriteFailed, path_);
        }
        out << toJsonLine(record) << '\n';
        out.flush();
        if (!out) {
            out.close();
            truncateLocked(prior);
            util::logger::error("FeedbackLedger: write failed on " + path_);
            throw core::ReviewTransactionError(core::ErrorCode::LedgerWriteFailed, path_);
        }
        return prior;
    }

    /**
     * @brief Cut the ledger back to `size` bytes.
     * @throw core::ReviewTransactionError(ledger_write_failed)
     */
    void truncateTo(uint64_t size)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        truncateLocked(size);
    }

    uint64_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentSize();
    }

    std::vector<core::ReviewFeedbackRecord> readAll() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::ReviewFeedbackRecord> records;
        std::ifstream in(path_);
        if (!in.is_open()) {
            return records;
        }
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                records.push_back(fromJsonLine(line));
            }
            catch (const std::exception &ex) {
                util::logger::warn("FeedbackLedger: skipping malformed line " + std::to_string(lineNo)
                                   + ": " + ex.what());
            }
        }
        return records;
    }

    LedgerStats stats() const
    {
        LedgerStats s;
        for (const auto &r : readAll()) {
            ++s.total;
            ++s.byEntity[r.entityType];
            switch (r.verdict) {
            case core::Verdict::TruePositive:  ++s.truePositives;  break;
            case core::Verdict::FalsePositive: ++s.falsePositives; break;
            case core::Verdict::Skipped:
            case core::Verdict::Unsure:        ++s.skipped;        break;
            case core::Verdict::Pending:                           break;
            }
        }
        return s;
    }

    static std::string toJsonLine(const core::ReviewFeedbackRecord &r)
    {
        using util::json::quote;
        std::ostringstream oss;
        oss << "{\"match_id\":" << quote(r.matchId)
            << ",\"entity_type\":" << quote(core::toString(r.entityType))
            << ",\"verdict\":" << quote(core::toString(r.verdict))
            << ",\"confidence_at_review\":" << r.confidenceAtReview
            << ",\"detector_source\":" << quote(core::toString(r.detectorSource))
            << ",\"context_snippet\":" << quote(r.contextSnippet)
            << ",\"reason\":" << (r.reason ? quote(*r.reason) : "null")
            << ",\"timestamp\":" << quote(util::toIso8601(r.timestamp))
            << "}";
        return oss.str();
    }

    static core::ReviewFeedbackRecord fromJsonLine(const std::string &line)
    {
        auto fields = util::json::parseFlatObject(line);
        core::ReviewFeedbackRecord r;
        r.matchId = fields.at("match_id").text;

        auto type = core::entityTypeFromString(fields.at("entity_type").text);
        auto verdict = core::verdictFromString(fields.at("verdict").text);
        auto source = core::detectorSourceFromString(fields.at("detector_source").text);
        if (!type || !verdict || !source) {
            throw std::runtime_error("unknown enum value");
        }
        r.entityType = *type;
        r.verdict = *verdict;
        r.detectorSource = *source;
        r.confidenceAtReview = fields.at("confidence_at_review").asNumber();
        r.contextSnippet = fields.at("context_snippet").text;
        auto reason = fields.find("reason");
        if (reason != fields.end() && !reason->second.isNull()) {
            r.reason = reason->second.text;
        }
        r.timestamp = util::fromIso8601(fields.at("timestamp").text);
        return r;
    }

private:
    std::string path_;
    mutable std::mutex mutex_;

    uint64_t currentSize() const
    {
        std::error_code ec;
        auto n = std::filesystem::file_size(path_, ec);
        return ec ? 0 : static_cast<uint64_t>(n);
    }

    void truncateLocked(uint64_t size)
    {
        std::error_code ec;
        std::filesystem::resize_file(path_, size, ec);
        if (ec) {
            util::logger::critical("FeedbackLedger: truncate failed on " + path_ + ": " + ec.message());
            throw core::ReviewTransactionError(core::ErrorCode::LedgerWriteFailed, path_);
        }
    }
};

} // namespace review
} // namespace sensiscan

#endif // SENSISCAN_REVIEW_FEEDBACK_LEDGER_HPP
