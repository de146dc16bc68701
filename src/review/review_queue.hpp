#ifndef SENSISCAN_REVIEW_REVIEW_QUEUE_HPP
#define SENSISCAN_REVIEW_REVIEW_QUEUE_HPP

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include "core/match_types.hpp"

/**
 * @file review_queue.hpp
 * @brief Ordered, restartable sequence of matches awaiting human review.
 *
 * Order: ascending final confidence, then entity type name, then file path,
 * then span start. The least certain matches come first.
 *
 * The queue is a snapshot of one loaded ScanRecord. Verdicts committed while
 * walking it do not reorder it; rebuild from a fresh load to drop them.
 */

namespace sensiscan {
namespace review {

struct ReviewItem
{
    std::string filePath;
    core::ResolvedMatch match;
};

class ReviewQueue
{
public:
    enum class Scope { PendingOnly, All };

    ReviewQueue(const core::ScanRecord &scan, Scope scope = Scope::PendingOnly)
        : scanId_(scan.scanId)
    {
        for (const auto &f : scan.fileResults) {
            for (const auto &m : f.matches) {
                if (scope == Scope::PendingOnly && m.verdict != core::Verdict::Pending) {
                    continue;
                }
                items_.push_back(ReviewItem{f.path, m});
            }
        }
        std::stable_sort(items_.begin(), items_.end(), &ReviewQueue::before);
    }

    const std::string& scanId() const { return scanId_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    size_t position() const { return next_; }

    /// The next item, or nullopt once exhausted.
    std::optional<ReviewItem> next()
    {
        if (next_ >= items_.size()) {
            return std::nullopt;
        }
        return items_[next_++];
    }

    /// Start again from the first item.
    void restart() { next_ = 0; }

    const std::vector<ReviewItem>& items() const { return items_; }

private:
    std::string scanId_;
    std::vector<ReviewItem> items_;
    size_t next_ = 0;

    static bool before(const ReviewItem &a, const ReviewItem &b)
    {
        if (a.match.finalConfidence != b.match.finalConfidence) {
            return a.match.finalConfidence < b.match.finalConfidence;
        }
        int byName = std::strcmp(core::toString(a.match.entityType), core::toString(b.match.entityType));
        if (byName != 0) {
            return byName < 0;
        }
        if (a.filePath != b.filePath) {
            return a.filePath < b.filePath;
        }
        return a.match.span.start < b.match.span.start;
    }
};

} // namespace review
} // namespace sensiscan

#endif // SENSISCAN_REVIEW_REVIEW_QUEUE_HPP
