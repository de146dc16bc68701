#ifndef SENSISCAN_CONFIG_SCAN_CONFIG_HPP
#define SENSISCAN_CONFIG_SCAN_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>
#include "core/entity_types.hpp"
#include "core/redaction.hpp"

/**
 * @file scan_config.hpp
 * @brief Process-scoped settings for SensiScan.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Constructed once at startup and passed by const reference into the
 *     components that need it. Nothing reads it through a global.
 */

namespace sensiscan {
namespace config {

/**
 * @struct ScanConfig
 * @brief Thresholds, limits, file locations and table overrides.
 */
struct ScanConfig
{
    ScanConfig()
        : reviewThreshold(0.85),
          corroborationBonus(0.10),
          recognizerThreshold(0.5),
          testContextWindow(32),
          maxFileSizeBytes(100ULL * 1024 * 1024),
          workerCount(0),
          perFileTimeoutMs(30000),
          databasePath("./sensiscan_data/findings.db"),
          auditLogPath(""),
          feedbackLedgerPath("./sensiscan_data/reviews.jsonl"),
          keyFilePath("./sensiscan_data/findings.key"),
          keyVaultUrl(""),
          keyVaultTokenEnv("SENSISCAN_VAULT_TOKEN"),
          actor("sensiscan"),
          logLevel("info"),
          logFile("")
    {
    }

    /// Matches at or above this confidence are auto-accepted as TP.
    double reviewThreshold;

    /// Added per additional independent detector that agrees on a match.
    double corroborationBonus;

    /// Recognizer spans scoring below this are dropped by the normalizer.
    double recognizerThreshold;

    /// Characters inspected on each side of a pattern hit for test markers.
    uint32_t testContextWindow;

    /// Files larger than this are rejected before extraction.
    uint64_t maxFileSizeBytes;

    /// Scanner worker threads; 0 = hardware concurrency.
    uint32_t workerCount;

    /// Extraction + detection budget per file.
    uint32_t perFileTimeoutMs;

    std::string databasePath;

    /// Empty = "<databasePath>.audit.jsonl".
    std::string auditLogPath;

    std::string feedbackLedgerPath;

    /// Used when keyVaultUrl is empty.
    std::string keyFilePath;

    /// When set, the store key is fetched from this endpoint.
    std::string keyVaultUrl;

    /// Environment variable holding the vault bearer token.
    std::string keyVaultTokenEnv;

    /// Recorded as the actor of audit entries.
    std::string actor;

    std::string logLevel;
    std::string logFile;

    /// Overrides for the entity -> label tier table.
    std::map<core::EntityType, core::LabelRecommendation> labelTierOverrides;

    /// Overrides for the redaction table.
    std::map<core::EntityType, core::RedactionRule> redactionOverrides;

    std::string effectiveAuditLogPath() const
    {
        return auditLogPath.empty() ? databasePath + ".audit.jsonl" : auditLogPath;
    }

    core::RedactionTable buildRedactionTable() const
    {
        core::RedactionTable table;
        for (const auto &kv : redactionOverrides) {
            table.setRule(kv.first, kv.second);
        }
        return table;
    }
};

} // namespace config
} // namespace sensiscan

#endif // SENSISCAN_CONFIG_SCAN_CONFIG_HPP
