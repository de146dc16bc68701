// test/unit/test_scanner.cpp
// -----------------------------------------------------------
// Directory walk, size and type policy, per-file timeout, cancellation and
// plain-text extraction.

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "config/scan_config.hpp"
#include "detection/detector.hpp"
#include "pipeline/file_classifier.hpp"
#include "pipeline/scanner.hpp"
#include "pipeline/text_extractor.hpp"

namespace {

using namespace sensiscan;
namespace fs = std::filesystem;

class SlowExtractor : public pipeline::TextExtractor
{
public:
    bool canHandle(const std::string &) const override { return true; }
    pipeline::ExtractionResult extract(const std::string &) const override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        pipeline::ExtractionResult r;
        r.text = "nothing here";
        return r;
    }
};

class BrokenRecognizer : public detection::EntityRecognizer
{
public:
    std::string name() const override { return "broken"; }
    std::vector<detection::RecognizedSpan> recognize(const std::string &) const override
    {
        throw std::runtime_error("model not loaded");
    }
};

class ScannerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("sensiscan_scan_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(dir_);
        cfg_.workerCount = 2;
        cfg_.perFileTimeoutMs = 5000;
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const fs::path &rel, const std::string &content)
    {
        fs::path p = dir_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
    }

    static const core::FileResult* find(const core::ScanRecord &rec, const std::string &suffix)
    {
        for (const auto &f : rec.fileResults) {
            if (f.path.size() >= suffix.size()
                && f.path.compare(f.path.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return &f;
            }
        }
        return nullptr;
    }

    fs::path dir_;
    config::ScanConfig cfg_;
};

TEST_F(ScannerTest, WalksTreeSkippingExcludedDirectories) {
    write("notes.txt", "Patient SSN: 219-09-9999\n");
    write("sub/contacts.csv", "name,email\nJane,jane.roe@corp-mail.com\n");
    write(".git/config", "SSN 219-09-9999\n");
    write("node_modules/pkg/readme.md", "SSN 219-09-9999\n");
    write("empty.log", "");

    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_));
    core::ScanRecord rec = scanner.scan(dir_.string());

    EXPECT_FALSE(rec.scanId.empty());
    ASSERT_TRUE(rec.completedAt.has_value());
    ASSERT_EQ(rec.fileResults.size(), 3u);
    for (size_t i = 1; i < rec.fileResults.size(); ++i) {
        EXPECT_LT(rec.fileResults[i - 1].path, rec.fileResults[i].path);
    }
    for (const auto &f : rec.fileResults) {
        EXPECT_EQ(f.path.find(".git"), std::string::npos);
        EXPECT_EQ(f.path.find("node_modules"), std::string::npos);
    }

    const core::FileResult *notes = find(rec, "notes.txt");
    ASSERT_NE(notes, nullptr);
    ASSERT_EQ(notes->matches.size(), 1u);
    EXPECT_EQ(notes->matches[0].entityType, core::EntityType::Ssn);
    ASSERT_TRUE(notes->labelRecommendation.has_value());
    EXPECT_EQ(*notes->labelRecommendation, core::LabelRecommendation::HighlyConfidential);

    const core::FileResult *empty = find(rec, "empty.log");
    ASSERT_NE(empty, nullptr);
    EXPECT_TRUE(empty->matches.empty());
    EXPECT_FALSE(empty->labelRecommendation.has_value());
    EXPECT_FALSE(empty->error.has_value());
}

TEST_F(ScannerTest, SizeAndTypePolicy) {
    cfg_.maxFileSizeBytes = 16;
    write("big.txt", std::string(64, 'x'));
    write("image.png", "\x89PNG");
    write("small.txt", "hello");

    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_));
    core::ScanRecord rec = scanner.scan(dir_.string());
    ASSERT_EQ(rec.fileResults.size(), 3u);
    EXPECT_EQ(rec.filesErrored(), 2u);

    const core::FileResult *big = find(rec, "big.txt");
    ASSERT_NE(big, nullptr);
    ASSERT_TRUE(big->error.has_value());
    EXPECT_EQ(big->error->code, core::ErrorCode::Oversized);
    EXPECT_EQ(big->sizeBytes, 64u);

    const core::FileResult *png = find(rec, "image.png");
    ASSERT_NE(png, nullptr);
    ASSERT_TRUE(png->error.has_value());
    EXPECT_EQ(png->error->code, core::ErrorCode::Unsupported);

    EXPECT_FALSE(find(rec, "small.txt")->error.has_value());
}

TEST_F(ScannerTest, SlowFileTimesOut) {
    cfg_.perFileTimeoutMs = 50;
    write("slow.txt", "x");

    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_),
                              std::make_shared<SlowExtractor>());
    core::FileResult result = scanner.scanFile((dir_ / "slow.txt").string());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, core::ErrorCode::Timeout);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(pipeline::Scanner::abandonedTasks(), 1u);

    // The detached extraction finishes on its own and is no longer counted.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pipeline::Scanner::abandonedTasks() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(pipeline::Scanner::abandonedTasks(), 0u);
}

TEST_F(ScannerTest, CancelledScanRecordsNothing) {
    write("a.txt", "SSN 219-09-9999");
    write("b.txt", "SSN 219-09-9999");

    auto cancel = std::make_shared<pipeline::ScanCancellation>();
    cancel->cancel();
    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_));
    core::ScanRecord rec = scanner.scan(dir_.string(), cancel);
    EXPECT_TRUE(rec.fileResults.empty());
    EXPECT_TRUE(rec.completedAt.has_value());
}

TEST_F(ScannerTest, SingleFileAndMissingPath) {
    write("one.txt", "mail jane.roe@corp-mail.com");
    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_));

    core::ScanRecord one = scanner.scan((dir_ / "one.txt").string());
    ASSERT_EQ(one.fileResults.size(), 1u);
    EXPECT_EQ(one.totalMatches(), 1u);

    core::ScanRecord none = scanner.scan((dir_ / "missing").string());
    EXPECT_TRUE(none.fileResults.empty());
    EXPECT_NE(one.scanId, none.scanId);
}

TEST_F(ScannerTest, DetectorFailureIsRecordedOnTheFile) {
    write("notes.txt", "Patient SSN: 219-09-9999\n");
    pipeline::Scanner scanner(cfg_, pipeline::FileClassifier::fromConfig(cfg_, std::make_shared<BrokenRecognizer>()));
    core::ScanRecord rec = scanner.scan(dir_.string());

    ASSERT_EQ(rec.fileResults.size(), 1u);
    const core::FileResult &f = rec.fileResults[0];
    EXPECT_EQ(f.matches.size(), 1u);
    ASSERT_TRUE(f.error.has_value());
    EXPECT_EQ(f.error->kind, core::ErrorKind::Detector);
    EXPECT_EQ(f.error->code, core::ErrorCode::DetectorFailed);
    EXPECT_EQ(f.error->detail, "recognizer:broken");
}

TEST(FileClassifierTest, MarkerLikeHeadingDoesNotDowngradeRealSsn) {
    config::ScanConfig cfg;
    auto classifier = pipeline::FileClassifier::fromConfig(cfg);

    for (const std::string text : {"Patient Demographics\nSSN: 219-09-9999\n",
                                   "Last Will and Testament\nSSN 219-09-9999\n"}) {
        pipeline::Classification c = classifier->classify(text);
        ASSERT_EQ(c.matches.size(), 1u) << text;
        EXPECT_EQ(c.matches[0].entityType, core::EntityType::Ssn);
        EXPECT_FALSE(c.matches[0].isTestData);
        EXPECT_EQ(c.matches[0].verdict, core::Verdict::TruePositive);
        ASSERT_TRUE(c.label.has_value());
        EXPECT_EQ(*c.label, core::LabelRecommendation::HighlyConfidential);
    }
}

TEST(ScannerGlobTest, StarPatterns) {
    using pipeline::Scanner;
    EXPECT_TRUE(Scanner::globMatch("*.egg-info", "sensiscan.egg-info"));
    EXPECT_TRUE(Scanner::globMatch("node_modules", "node_modules"));
    EXPECT_TRUE(Scanner::globMatch("*", ""));
    EXPECT_TRUE(Scanner::globMatch("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(Scanner::globMatch("*.egg-info", "egg-info.txt"));
    EXPECT_FALSE(Scanner::globMatch("build", "builds"));
}

TEST(PlainTextExtractorTest, StripsBomAndFallsBackToLatin1) {
    fs::path dir = fs::temp_directory_path() / ("sensiscan_extract_" + std::to_string(std::random_device()()));
    fs::create_directories(dir);
    {
        std::ofstream bom(dir / "bom.txt", std::ios::binary);
        bom << "\xEF\xBB\xBFhello";
        std::ofstream latin(dir / "latin.txt", std::ios::binary);
        latin << "caf\xE9";
    }

    pipeline::PlainTextExtractor extractor;
    EXPECT_TRUE(extractor.canHandle("notes.TXT"));
    EXPECT_TRUE(extractor.canHandle("/srv/app/.env"));
    EXPECT_FALSE(extractor.canHandle("scan.pdf"));

    pipeline::ExtractionResult bom = extractor.extract((dir / "bom.txt").string());
    EXPECT_FALSE(bom.error.has_value());
    EXPECT_EQ(bom.text, "hello");

    pipeline::ExtractionResult latin = extractor.extract((dir / "latin.txt").string());
    EXPECT_EQ(latin.text, "caf\xC3\xA9");

    pipeline::ExtractionResult missing = extractor.extract((dir / "nope.txt").string());
    ASSERT_TRUE(missing.error.has_value());
    EXPECT_EQ(missing.error->code, core::ErrorCode::Unreadable);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace
