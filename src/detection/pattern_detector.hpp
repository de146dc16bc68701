#ifndef SENSISCAN_DETECTION_PATTERN_DETECTOR_HPP
#define SENSISCAN_DETECTION_PATTERN_DETECTOR_HPP

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "core/match_types.hpp"
#include "detection/pattern_table.hpp"

/**
 * @file pattern_detector.hpp
 * @brief Regex + checksum detector over extracted text.
 *
 * DESIGN GOALS:
 *   - PatternCursor walks the rule table one rule at a time and yields one
 *     PatternHit per call to next(). Nothing is computed ahead of demand and
 *     reset() starts the walk over.
 *   - Hits failing their rule's validator are dropped. Hits that look like
 *     test data are kept and flagged.
 *   - The detector holds only a shared pointer to the immutable table, so
 *     any number of cursors may run concurrently.
 *
 * USAGE:
 *   @code
 *   sensiscan::detection::PatternDetector detector;
 *   auto cursor = detector.cursor(text);
 *   while (auto hit = cursor.next()) {
 *       // hit->rule->entityType, hit->span, hit->isTestData ...
 *   }
 *   @endcode
 */

namespace sensiscan {
namespace detection {

/// Bytes of surrounding text captured on each side of a hit.
constexpr size_t kContextRadius = 50;

/**
 * @struct PatternHit
 * @brief A raw rule match before confidence is assigned.
 */
struct PatternHit
{
    const PatternRule *rule = nullptr;
    core::Span span;
    std::string value;
    bool validated = false;      ///< rule had a validator and it passed
    bool isTestData = false;
    std::string context;
};

class PatternCursor
{
public:
    PatternCursor(std::shared_ptr<const PatternTable> table, std::string text, size_t markerWindow)
        : table_(std::move(table)), text_(std::move(text)), markerWindow_(markerWindow)
    {
        lineStarts_.push_back(0);
        for (size_t i = 0; i < text_.size(); ++i) {
            if (text_[i] == '\n') {
                lineStarts_.push_back(i + 1);
            }
        }
    }

    // Iterators point into text_; the cursor stays where it was built.
    PatternCursor(const PatternCursor &) = delete;
    PatternCursor& operator=(const PatternCursor &) = delete;

    /**
     * @brief Next hit, or std::nullopt once every rule is exhausted.
     */
    std::optional<PatternHit> next()
    {
        const auto &rules = table_->rules();
        while (ruleIndex_ < rules.size()) {
            const PatternRule &rule = rules[ruleIndex_];
            if (!started_) {
                it_ = std::sregex_iterator(text_.cbegin(), text_.cend(), rule.regex);
                started_ = true;
            }
            while (it_ != std::sregex_iterator()) {
                std::smatch m = *it_;
                ++it_;
                auto hit = buildHit(rule, m);
                if (hit) {
                    return hit;
                }
            }
            ++ruleIndex_;
            started_ = false;
        }
        return std::nullopt;
    }

    void reset()
    {
        ruleIndex_ = 0;
        started_ = false;
        it_ = std::sregex_iterator();
    }

    const std::string& text() const { return text_; }

private:
    std::shared_ptr<const PatternTable> table_;
    std::string text_;
    size_t markerWindow_;
    std::vector<size_t> lineStarts_;

    size_t ruleIndex_ = 0;
    bool started_ = false;
    std::sregex_iterator it_;

    std::optional<PatternHit> buildHit(const PatternRule &rule, const std::smatch &m) const
    {
        const int group = (rule.valueGroup > 0 && m[rule.valueGroup].matched) ? rule.valueGroup : 0;
        std::string value = m.str(group);
        if (value.empty()) {
            return std::nullopt;
        }

        bool validated = false;
        if (rule.validator) {
            if (!rule.validator(value)) {
                return std::nullopt;
            }
            validated = true;
        }

        PatternHit hit;
        hit.rule = &rule;
        hit.span.start = static_cast<size_t>(m.position(group));
        hit.span.end = hit.span.start + value.size();
        hit.span.line = lineOf(hit.span.start);
        hit.value = std::move(value);
        hit.validated = validated;
        hit.isTestData = PatternTable::isKnownTestValue(rule, hit.value)
                         || hasMarkerNearby(hit.span);
        hit.context = window(hit.span, kContextRadius);
        return hit;
    }

    size_t lineOf(size_t offset) const
    {
        auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
        return static_cast<size_t>(it - lineStarts_.begin());
    }

    std::string window(const core::Span &span, size_t radius) const
    {
        size_t begin = span.start > radius ? span.start - radius : 0;
        size_t end = std::min(text_.size(), span.end + radius);
        while (begin > 0 && (static_cast<unsigned char>(text_[begin]) & 0xC0) == 0x80) {
            --begin;
        }
        while (end < text_.size() && (static_cast<unsigned char>(text_[end]) & 0xC0) == 0x80) {
            ++end;
        }
        return text_.substr(begin, end - begin);
    }

    /**
     * @brief True if a marker word lies within `markerWindow_` bytes before
     *        or after the span. A marker must be a whole word, optionally
     *        plural: "samples" counts, "Demographics" and "latest" do not.
     */
    bool hasMarkerNearby(const core::Span &span) const
    {
        if (markerWindow_ == 0) {
            return false;
        }
        size_t beforeBegin = span.start > markerWindow_ ? span.start - markerWindow_ : 0;
        size_t afterEnd = std::min(text_.size(), span.end + markerWindow_);

        std::string before = lower(text_.substr(beforeBegin, span.start - beforeBegin));
        std::string after = lower(text_.substr(span.end, afterEnd - span.end));
        // Characters just outside each window decide the boundary of a marker at its edge.
        char beforePrev = beforeBegin > 0 ? text_[beforeBegin - 1] : ' ';
        char beforeNext = text_[span.start];
        char afterPrev = text_[span.end - 1];
        char afterNext = afterEnd < text_.size() ? text_[afterEnd] : ' ';

        for (const auto &marker : PatternTable::testMarkers()) {
            if (containsWord(before, marker, beforePrev, beforeNext)
                || containsWord(after, marker, afterPrev, afterNext)) {
                return true;
            }
        }
        return false;
    }

    static std::string lower(std::string s)
    {
        for (char &c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }

    static bool isWordChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || (static_cast<unsigned char>(c) & 0x80);
    }

    static bool containsWord(const std::string &hay, const std::string &word,
                             char prevOutside, char nextOutside)
    {
        size_t pos = 0;
        while ((pos = hay.find(word, pos)) != std::string::npos) {
            char prev = pos == 0 ? prevOutside : hay[pos - 1];
            size_t end = pos + word.size();
            if (end < hay.size() && hay[end] == 's') {
                ++end;
            }
            char next = end < hay.size() ? hay[end] : nextOutside;
            if (!isWordChar(prev) && !isWordChar(next)) {
                return true;
            }
            ++pos;
        }
        return false;
    }
};

/**
 * @class PatternDetector
 * @brief Factory for cursors over a shared rule table.
 */
class PatternDetector
{
public:
    explicit PatternDetector(std::shared_ptr<const PatternTable> table = PatternTable::defaults(),
                             size_t markerWindow = 32)
        : table_(std::move(table)), markerWindow_(markerWindow)
    {
    }

    PatternCursor cursor(const std::string &text) const
    {
        return PatternCursor(table_, text, markerWindow_);
    }

    /**
     * @brief Drain a fresh cursor into a vector.
     */
    std::vector<PatternHit> scan(const std::string &text) const
    {
        std::vector<PatternHit> hits;
        PatternCursor c(table_, text, markerWindow_);
        while (auto hit = c.next()) {
            hits.push_back(std::move(*hit));
        }
        return hits;
    }

    const std::shared_ptr<const PatternTable>& table() const { return table_; }

private:
    std::shared_ptr<const PatternTable> table_;
    size_t markerWindow_;
};

} // namespace detection
} // namespace sensiscan

#endif // SENSISCAN_DETECTION_PATTERN_DETECTOR_HPP
