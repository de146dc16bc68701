#ifndef SENSISCAN_UTIL_CONFIG_PARSER_HPP
#define SENSISCAN_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <limits>
#include <mutex>
#include "config/scan_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" configuration file into config::ScanConfig.
 *
 * FORMAT:
 *   - One key=value per line, '#' starts a comment line, blank lines ignored.
 *   - Table overrides use dotted keys:
 *       label_tier.email=confidential
 *       redaction.ssn=0,4
 *   - Unknown keys are logged and ignored; malformed lines and values throw.
 *
 * USAGE:
 *   @code
 *   sensiscan::config::ScanConfig cfg;
 *   sensiscan::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("sensiscan.conf");
 *   @endcode
 */

namespace sensiscan {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(sensiscan::config::ScanConfig &scanConfig)
        : config_(scanConfig)
    {
    }

    /**
     * @brief Parse the given file. A missing file leaves the defaults in place.
     * @throw std::runtime_error on malformed lines or values.
     */
    void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found, using defaults: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        std::stringstream buffer;
        buffer << inFile.rdbuf();
        parseLines(buffer.str());
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse configuration text directly.
     */
    void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parseLines(text);
    }

private:
    sensiscan::config::ScanConfig &config_;
    std::mutex mutex_;

    void parseLines(const std::string &text)
    {
        std::istringstream in(text);
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "review_threshold") {
            config_.reviewThreshold = parseUnitInterval(key, val);
        }
        else if (key == "corroboration_bonus") {
            config_.corroborationBonus = parseUnitInterval(key, val);
        }
        else if (key == "recognizer_threshold") {
            config_.recognizerThreshold = parseUnitInterval(key, val);
        }
        else if (key == "test_context_window") {
            config_.testContextWindow = parseUInt32(key, val);
        }
        else if (key == "max_file_size_bytes") {
            config_.maxFileSizeBytes = parseUInt(val);
        }
        else if (key == "worker_count") {
            config_.workerCount = parseUInt32(key, val);
        }
        else if (key == "per_file_timeout_ms") {
            config_.perFileTimeoutMs = parseUInt32(key, val);
        }
        else if (key == "database_path") {
            config_.databasePath = val;
        }
        else if (key == "audit_log_path") {
            config_.auditLogPath = val;
        }
        else if (key == "feedback_ledger_path") {
            config_.feedbackLedgerPath = val;
        }
        else if (key == "key_file_path") {
            config_.keyFilePath = val;
        }
        else if (key == "key_vault_url") {
            config_.keyVaultUrl = val;
        }
        else if (key == "key_vault_token_env") {
            config_.keyVaultTokenEnv = val;
        }
        else if (key == "actor") {
            config_.actor = val;
        }
        else if (key == "log_level") {
            logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "log_file") {
            config_.logFile = val;
        }
        else if (key.rfind("label_tier.", 0) == 0) {
            auto type = parseEntity(key, key.substr(11));
            auto label = core::labelFromString(val);
            if (!label) {
                throw std::runtime_error("ConfigParser: unknown label '" + val + "' for " + key);
            }
            config_.labelTierOverrides[type] = *label;
        }
        else if (key.rfind("redaction.", 0) == 0) {
            auto type = parseEntity(key, key.substr(10));
            auto comma = val.find(',');
            if (comma == std::string::npos) {
                throw std::runtime_error("ConfigParser: " + key + " expects '<lead>,<trail>'");
            }
            std::string lead = val.substr(0, comma);
            std::string trail = val.substr(comma + 1);
            trim(lead);
            trim(trail);
            core::RedactionRule rule;
            rule.keepLeading = static_cast<size_t>(parseUInt(lead));
            rule.keepTrailing = static_cast<size_t>(parseUInt(trail));
            config_.redactionOverrides[type] = rule;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    static core::EntityType parseEntity(const std::string &key, const std::string &name)
    {
        auto type = core::entityTypeFromString(name);
        if (!type) {
            throw std::runtime_error("ConfigParser: unknown entity type in key " + key);
        }
        return *type;
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    static uint64_t parseUInt(const std::string &val)
    {
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size() || val[0] == '-') {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    static uint32_t parseUInt32(const std::string &key, const std::string &val)
    {
        uint64_t n = parseUInt(val);
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("ConfigParser: " + key + " out of range: " + val);
        }
        return static_cast<uint32_t>(n);
    }

    static double parseUnitInterval(const std::string &key, const std::string &val)
    {
        double d = 0.0;
        try {
            size_t idx = 0;
            d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &) {
            throw std::runtime_error("ConfigParser: " + key + " is not a number: '" + val + "'");
        }
        if (d < 0.0 || d > 1.0) {
            throw std::runtime_error("ConfigParser: " + key + " must lie in [0,1], got " + val);
        }
        return d;
    }
};

} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_CONFIG_PARSER_HPP
