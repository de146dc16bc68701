#ifndef SENSISCAN_CORE_MATCH_TYPES_HPP
#define SENSISCAN_CORE_MATCH_TYPES_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/entity_types.hpp"
#include "core/errors.hpp"
#include "util/time_format.hpp"

/**
 * @file match_types.hpp
 * @brief The scan data model.
 *
 *   ScanRecord ──owns──> FileResult ──owns──> ResolvedMatch
 *
 * CandidateMatch is the per-detector, pre-fusion value. It holds the raw
 * matched text and therefore never leaves the detection/fusion stages.
 * ResolvedMatch carries only a redacted projection of the value.
 *
 * AuditLogEntry and ReviewFeedbackRecord are independent append-only log
 * records that refer to scans and matches by id only.
 */

namespace sensiscan {
namespace core {

/**
 * @struct Span
 * @brief Byte offsets into the extracted text, end exclusive; line is 1-based.
 */
struct Span
{
    size_t start = 0;
    size_t end = 0;
    size_t line = 1;

    bool overlaps(const Span &other) const
    {
        return start < other.end && other.start < end;
    }

    bool operator==(const Span &o) const
    {
        return start == o.start && end == o.end && line == o.line;
    }
};

/**
 * @class CandidateMatch
 * @brief An unverified detection from a single signal source. Immutable.
 */
class CandidateMatch
{
public:
    CandidateMatch(EntityType type,
                   DetectorSource source,
                   Span span,
                   std::string rawValue,
                   double rawConfidence,
                   bool isTestData = false,
                   std::string context = "",
                   std::optional<std::string> modelVersion = std::nullopt)
        : type_(type)
        , source_(source)
        , span_(span)
        , rawValue_(std::move(rawValue))
        , rawConfidence_(rawConfidence < 0.0 ? 0.0 : (rawConfidence > 1.0 ? 1.0 : rawConfidence))
        , isTestData_(isTestData)
        , context_(std::move(context))
        , modelVersion_(std::move(modelVersion))
    {
    }

    EntityType entityType() const { return type_; }
    DetectorSource source() const { return source_; }
    const Span& span() const { return span_; }
    const std::string& rawValue() const { return rawValue_; }
    double rawConfidence() const { return rawConfidence_; }
    bool isTestData() const { return isTestData_; }
    const std::string& context() const { return context_; }
    const std::optional<std::string>& modelVersion() const { return modelVersion_; }

private:
    EntityType type_;
    DetectorSource source_;
    Span span_;
    std::string rawValue_;
    double rawConfidence_;
    bool isTestData_;
    std::string context_;
    std::optional<std::string> modelVersion_;
};

/**
 * @struct ResolvedMatch
 * @brief Fused, calibrated, redacted result of one or more candidates.
 */
struct ResolvedMatch
{
    std::string matchId;                        ///< assigned by the findings store
    EntityType entityType = EntityType::Identifier;
    std::string redactedValue;
    double finalConfidence = 0.0;
    std::set<DetectorSource> contributingSources;
    bool isTestData = false;
    Verdict verdict = Verdict::Pending;
    std::optional<std::string> modelVersion;
    Span span;
    std::string contextSnippet;                 ///< context with the value replaced by its entity token

    /// Lowest-priority-number source, used as the tie-break when ordering matches.
    DetectorSource leadingSource() const
    {
        return contributingSources.empty() ? DetectorSource::Pattern : *contributingSources.begin();
    }

    /// Compares everything except the store-internal matchId.
    bool sameContent(const ResolvedMatch &o) const
    {
        return entityType == o.entityType && redactedValue == o.redactedValue
            && finalConfidence == o.finalConfidence
            && contributingSources == o.contributingSources && isTestData == o.isTestData
            && verdict == o.verdict && modelVersion == o.modelVersion && span == o.span
            && contextSnippet == o.contextSnippet;
    }
};

/**
 * @struct FileResult
 * @brief Findings for one scanned file.
 */
struct FileResult
{
    std::string path;
    uint64_t sizeBytes = 0;
    std::vector<ResolvedMatch> matches;
    std::optional<LabelRecommendation> labelRecommendation;
    std::optional<ScanError> error;
    int64_t scanTimeMs = 0;

    bool hasSensitiveData() const
    {
        for (const auto &m : matches) {
            if (!m.isTestData && m.verdict != Verdict::FalsePositive) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @struct ScanRecord
 * @brief Root aggregate of one scan.
 */
struct ScanRecord
{
    std::string scanId;
    util::TimePoint startedAt;
    std::optional<util::TimePoint> completedAt;
    std::string sourcePath;
    std::vector<FileResult> fileResults;

    size_t totalMatches() const
    {
        size_t n = 0;
        for (const auto &f : fileResults) {
            n += f.matches.size();
        }
        return n;
    }

    size_t filesErrored() const
    {
        size_t n = 0;
        for (const auto &f : fileResults) {
            if (f.error) {
                ++n;
            }
        }
        return n;
    }
};

/**
 * @struct AuditLogEntry
 * @brief One line of the store's audit log.
 */
struct AuditLogEntry
{
    util::TimePoint timestamp;
    std::string action;
    std::string actor;
    uint64_t affectedRecordCount = 0;
    std::optional<std::string> scanId;
    bool success = true;
    std::optional<std::string> errorCode;
};

/**
 * @struct ReviewFeedbackRecord
 * @brief One line of the feedback ledger consumed by retraining.
 */
struct ReviewFeedbackRecord
{
    std::string matchId;
    EntityType entityType = EntityType::Identifier;
    Verdict verdict = Verdict::Pending;
    double confidenceAtReview = 0.0;
    DetectorSource detectorSource = DetectorSource::Pattern;
    std::string contextSnippet;
    std::optional<std::string> reason;
    util::TimePoint timestamp;
};

} // namespace core
} // namespace sensiscan

#endif // SENSISCAN_CORE_MATCH_TYPES_HPP
