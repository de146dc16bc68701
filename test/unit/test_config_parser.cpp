// test/unit/test_config_parser.cpp
// -----------------------------------------------------------
// key=value configuration into config::ScanConfig.

#include <gtest/gtest.h>
#include <stdexcept>
#include "config/scan_config.hpp"
#include "util/config_parser.hpp"

namespace {

using namespace sensiscan;

TEST(ConfigParserTest, DefaultsAreDocumentedValues) {
    config::ScanConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.reviewThreshold, 0.85);
    EXPECT_DOUBLE_EQ(cfg.corroborationBonus, 0.10);
    EXPECT_EQ(cfg.effectiveAuditLogPath(), cfg.databasePath + ".audit.jsonl");
}

TEST(ConfigParserTest, ParsesKeysAndTables) {
    config::ScanConfig cfg;
    util::ConfigParser parser(cfg);
    parser.loadFromString(
        "# scanner settings\n"
        "review_threshold = 0.9\n"
        "corroboration_bonus=0.05\n"
        "worker_count=3\n"
        "per_file_timeout_ms=1500\n"
        "database_path=/var/lib/sensiscan/f.db\n"
        "actor=alice\n"
        "log_level=DEBUG\n"
        "label_tier.email=confidential\n"
        "redaction.ssn=1, 2\n"
        "\n"
        "some_future_key=1\n");

    EXPECT_DOUBLE_EQ(cfg.reviewThreshold, 0.9);
    EXPECT_DOUBLE_EQ(cfg.corroborationBonus, 0.05);
    EXPECT_EQ(cfg.workerCount, 3u);
    EXPECT_EQ(cfg.perFileTimeoutMs, 1500u);
    EXPECT_EQ(cfg.databasePath, "/var/lib/sensiscan/f.db");
    EXPECT_EQ(cfg.effectiveAuditLogPath(), "/var/lib/sensiscan/f.db.audit.jsonl");
    EXPECT_EQ(cfg.actor, "alice");
    EXPECT_EQ(cfg.labelTierOverrides.at(core::EntityType::Email), core::LabelRecommendation::Confidential);
    EXPECT_EQ(cfg.redactionOverrides.at(core::EntityType::Ssn).keepLeading, 1u);
    EXPECT_EQ(cfg.redactionOverrides.at(core::EntityType::Ssn).keepTrailing, 2u);

    EXPECT_EQ(cfg.buildRedactionTable().redact("219-09-9999", core::EntityType::Ssn), "2********99");
}

TEST(ConfigParserTest, MalformedInputThrows) {
    config::ScanConfig cfg;
    util::ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("review_threshold\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("review_threshold=high\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("review_threshold=1.5\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("worker_count=-2\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("label_tier.shoe_size=internal\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("label_tier.email=secret\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("redaction.ssn=4\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("log_level=chatty\n"), std::runtime_error);
}

TEST(ConfigParserTest, ThirtyTwoBitSettingsAreRangeChecked) {
    config::ScanConfig cfg;
    util::ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("worker_count=4294967296\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("per_file_timeout_ms=4294967297\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("test_context_window=18446744073709551615\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("worker_count=99999999999999999999999\n"), std::runtime_error);

    parser.loadFromString("per_file_timeout_ms=4294967295\nmax_file_size_bytes=8589934592\n");
    EXPECT_EQ(cfg.perFileTimeoutMs, 4294967295u);
    EXPECT_EQ(cfg.maxFileSizeBytes, 8589934592ull);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    config::ScanConfig cfg;
    util::ConfigParser parser(cfg);
    parser.loadFromFile("/nonexistent/sensiscan.conf");
    EXPECT_DOUBLE_EQ(cfg.reviewThreshold, 0.85);
}

} // namespace
