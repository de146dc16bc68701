#ifndef SENSISCAN_STORAGE_SCAN_JSON_HPP
#define SENSISCAN_STORAGE_SCAN_JSON_HPP

#include <iomanip>
#include <sstream>
#include <string>
#include "core/match_types.hpp"
#include "util/json_text.hpp"
#include "util/time_format.hpp"

/**
 * @file scan_json.hpp
 * @brief Read-only JSON rendering of a ScanRecord for reporting tools.
 *
 * Only redacted values and anonymized contexts are emitted.
 */

namespace sensiscan {
namespace storage {

inline std::string errorToJson(const std::optional<core::ScanError> &err)
{
    if (!err) {
        return "null";
    }
    using util::json::quote;
    return "{\"kind\":" + quote(core::toString(err->kind))
         + ",\"code\":" + quote(core::toString(err->code))
         + ",\"detail\":" + quote(err->detail) + "}";
}

inline std::string matchToJson(const core::ResolvedMatch &m)
{
    using util::json::quote;
    std::ostringstream oss;
    oss << std::setprecision(4);
    oss << "{\"match_id\":" << quote(m.matchId)
        << ",\"entity_type\":" << quote(core::toString(m.entityType))
        << ",\"redacted_value\":" << quote(m.redactedValue)
        << ",\"final_confidence\":" << m.finalConfidence
        << ",\"sources\":[";
    bool first = true;
    for (auto s : m.contributingSources) {
        oss << (first ? "" : ",") << quote(core::toString(s));
        first = false;
    }
    oss << "],\"is_test_data\":" << (m.isTestData ? "true" : "false")
        << ",\"verdict\":" << quote(core::toString(m.verdict))
        << ",\"model_version\":" << (m.modelVersion ? quote(*m.modelVersion) : "null")
        << ",\"line\":" << m.span.line
        << ",\"start\":" << m.span.start
        << ",\"end\":" << m.span.end
        << ",\"context\":" << quote(m.contextSnippet)
        << "}";
    return oss.str();
}

inline std::string fileToJson(const core::FileResult &f)
{
    using util::json::quote;
    std::ostringstream oss;
    oss << "{\"path\":" << quote(f.path)
        << ",\"size_bytes\":" << f.sizeBytes
        << ",\"scan_time_ms\":" << f.scanTimeMs
        << ",\"label_recommendation\":"
        << (f.labelRecommendation ? quote(core::toString(*f.labelRecommendation)) : "null")
        << ",\"error\":" << errorToJson(f.error)
        << ",\"matches\":[";
    for (size_t i = 0; i < f.matches.size(); ++i) {
        oss << (i ? "," : "") << matchToJson(f.matches[i]);
    }
    oss << "]}";
    return oss.str();
}

inline std::string scanToJson(const core::ScanRecord &rec)
{
    using util::json::quote;
    std::ostringstream oss;
    oss << "{\"scan_id\":" << quote(rec.scanId)
        << ",\"source_path\":" << quote(rec.sourcePath)
        << ",\"started_at\":" << quote(util::toIso8601(rec.startedAt))
        << ",\"completed_at\":" << (rec.completedAt ? quote(util::toIso8601(*rec.completedAt)) : "null")
        << ",\"total_matches\":" << rec.totalMatches()
        << ",\"files_errored\":" << rec.filesErrored()
        << ",\"files\":[";
    for (size_t i = 0; i < rec.fileResults.size(); ++i) {
        oss << (i ? "," : "") << fileToJson(rec.fileResults[i]);
    }
    oss << "]}";
    return oss.str();
}

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_SCAN_JSON_HPP
