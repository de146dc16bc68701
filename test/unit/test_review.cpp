// test/unit/test_review.cpp
// -----------------------------------------------------------
// Review queue ordering, the review session state machine and the
// feedback ledger format.

#include <gtest/gtest.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "review/feedback_ledger.hpp"
#include "review/review_queue.hpp"
#include "review/review_session.hpp"
#include "storage/findings_store.hpp"
#include "storage/key_provider.hpp"
#include "util/time_format.hpp"

namespace {

using namespace sensiscan;
using core::EntityType;
using core::Verdict;
namespace fs = std::filesystem;

core::ResolvedMatch match(EntityType type, double confidence, size_t start,
                          Verdict verdict = Verdict::Pending)
{
    core::ResolvedMatch m;
    m.entityType = type;
    m.finalConfidence = confidence;
    m.verdict = verdict;
    m.span = core::Span{start, start + 8, 1};
    m.redactedValue = "********";
    m.contributingSources.insert(core::DetectorSource::Pattern);
    m.contextSnippet = "near " + core::entityToken(type);
    return m;
}

core::ScanRecord makeScan(const std::string &scanId)
{
    core::ScanRecord rec;
    rec.scanId = scanId;
    rec.startedAt = util::fromEpochMillis(1700000000000);
    rec.completedAt = util::fromEpochMillis(1700000000900);
    rec.sourcePath = "/srv/docs";

    core::FileResult b;
    b.path = "/srv/docs/b.txt";
    b.matches = {match(EntityType::Email, 0.40, 5)};
    core::FileResult a;
    a.path = "/srv/docs/a.txt";
    a.matches = {match(EntityType::Ssn, 0.91, 0),
                 match(EntityType::Phone, 0.73, 30),
                 match(EntityType::Email, 0.40, 60),
                 match(EntityType::Name, 0.95, 90, Verdict::TruePositive),
                 match(EntityType::Cvv, 0.40, 120)};
    rec.fileResults = {b, a};
    return rec;
}

TEST(ReviewQueueTest, LeastConfidentFirst) {
    review::ReviewQueue queue(makeScan("s1"));
    ASSERT_EQ(queue.size(), 5u);

    std::vector<std::pair<EntityType, std::string>> order;
    while (auto item = queue.next()) {
        order.emplace_back(item->match.entityType, item->filePath);
    }
    // 0.40 ties break on entity name, then path.
    std::vector<std::pair<EntityType, std::string>> expected = {
        {EntityType::Cvv, "/srv/docs/a.txt"},
        {EntityType::Email, "/srv/docs/a.txt"},
        {EntityType::Email, "/srv/docs/b.txt"},
        {EntityType::Phone, "/srv/docs/a.txt"},
        {EntityType::Ssn, "/srv/docs/a.txt"},
    };
    EXPECT_EQ(order, expected);
    EXPECT_FALSE(queue.next().has_value());
}

TEST(ReviewQueueTest, ScopeAndRestart) {
    review::ReviewQueue all(makeScan("s1"), review::ReviewQueue::Scope::All);
    EXPECT_EQ(all.size(), 6u);
    EXPECT_EQ(all.items().back().match.entityType, EntityType::Name);

    review::ReviewQueue pending(makeScan("s1"));
    pending.next();
    pending.next();
    EXPECT_EQ(pending.position(), 2u);
    pending.restart();
    EXPECT_EQ(pending.position(), 0u);
    EXPECT_EQ(pending.next()->match.entityType, EntityType::Cvv);
}

TEST(ReviewQueueTest, EmptyScan) {
    core::ScanRecord rec;
    rec.scanId = "empty";
    review::ReviewQueue queue(rec);
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.next().has_value());
}

class ReviewSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("sensiscan_review_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(dir_);
        storage::StoreSettings settings;
        settings.databasePath = (dir_ / "findings.db").string();
        settings.auditLogPath = (dir_ / "audit.jsonl").string();
        settings.actor = "reviewer";
        storage::StaticKeyProvider keys(std::vector<uint8_t>(storage::kKeyBytes, 0x33));
        store_ = storage::SecureFindingsStore::open(settings, keys);
        scan_ = store_->storeScan(makeScan("scan-r"));
    }

    void TearDown() override
    {
        store_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static core::ErrorCode codeOf(const std::function<void()> &fn)
    {
        try {
            fn();
        }
        catch (const core::ReviewTransactionError &ex) {
            return ex.code();
        }
        ADD_FAILURE() << "no ReviewTransactionError";
        return core::ErrorCode::TransactionFailed;
    }

    fs::path dir_;
    std::unique_ptr<storage::SecureFindingsStore> store_;
    core::ScanRecord scan_;
};

TEST_F(ReviewSessionTest, WalksQueueAndCommits) {
    review::FeedbackLedger ledger((dir_ / "ledger.jsonl").string());
    review::ReviewSession session(review::ReviewQueue(scan_), *store_, ledger);
    EXPECT_EQ(session.state(), review::ReviewSession::State::Presenting);

    auto first = session.present();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(session.state(), review::ReviewSession::State::AwaitingVerdict);
    EXPECT_EQ(session.present()->match.matchId, first->match.matchId);

    session.submitVerdict(first->match.matchId, Verdict::FalsePositive, std::string("sample data"));
    EXPECT_EQ(session.state(), review::ReviewSession::State::Presenting);

    size_t seen = 1;
    while (auto item = session.present()) {
        session.submitVerdict(item->match.matchId, Verdict::TruePositive, std::nullopt);
        ++seen;
    }
    EXPECT_EQ(seen, 5u);
    EXPECT_EQ(session.committedCount(), 5u);
    EXPECT_EQ(session.state(), review::ReviewSession::State::Done);

    review::LedgerStats stats = ledger.stats();
    EXPECT_EQ(stats.total, 5u);
    EXPECT_EQ(stats.falsePositives, 1u);
    EXPECT_EQ(stats.truePositives, 4u);
    EXPECT_EQ(stats.byEntity[EntityType::Email], 2u);

    review::ReviewQueue after(store_->loadScan("scan-r"));
    EXPECT_TRUE(after.empty());
}

TEST_F(ReviewSessionTest, RejectsOutOfStateSubmissions) {
    review::FeedbackLedger ledger((dir_ / "ledger.jsonl").string());
    review::ReviewSession session(review::ReviewQueue(scan_), *store_, ledger);

    EXPECT_EQ(codeOf([&] { session.submitVerdict("nothing", Verdict::TruePositive, std::nullopt); }),
              core::ErrorCode::InvalidState);

    auto item = session.present();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(codeOf([&] { session.submitVerdict("other-id", Verdict::TruePositive, std::nullopt); }),
              core::ErrorCode::InvalidState);
    EXPECT_EQ(codeOf([&] { session.submitVerdict(item->match.matchId, Verdict::Pending, std::nullopt); }),
              core::ErrorCode::InvalidState);
    EXPECT_EQ(codeOf([&] { session.submitVerdict(item->match.matchId, Verdict::Skipped, std::nullopt); }),
              core::ErrorCode::InvalidState);
    EXPECT_EQ(session.state(), review::ReviewSession::State::AwaitingVerdict);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(ReviewSessionTest, FailedCommitReturnsToSameItem) {
    fs::path ledgerPath = dir_ / "ledger.jsonl";
    fs::create_directories(ledgerPath);
    review::FeedbackLedger ledger(ledgerPath.string());
    review::ReviewSession session(review::ReviewQueue(scan_), *store_, ledger);

    auto item = session.present();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(codeOf([&] { session.submitVerdict(item->match.matchId, Verdict::TruePositive, std::nullopt); }),
              core::ErrorCode::LedgerWriteFailed);
    EXPECT_EQ(session.state(), review::ReviewSession::State::AwaitingVerdict);
    EXPECT_EQ(session.committedCount(), 0u);
    EXPECT_EQ(session.present()->match.matchId, item->match.matchId);

    fs::remove(ledgerPath);
    session.submitVerdict(item->match.matchId, Verdict::Unsure, std::nullopt);
    EXPECT_EQ(session.committedCount(), 1u);
    ASSERT_EQ(ledger.readAll().size(), 1u);
    EXPECT_EQ(ledger.readAll()[0].verdict, Verdict::Skipped);
}

TEST_F(ReviewSessionTest, QuitKeepsCommittedVerdicts) {
    review::FeedbackLedger ledger((dir_ / "ledger.jsonl").string());
    review::ReviewSession session(review::ReviewQueue(scan_), *store_, ledger);

    auto first = session.present();
    ASSERT_TRUE(first.has_value());
    session.submitVerdict(first->match.matchId, Verdict::TruePositive, std::nullopt);
    auto second = session.present();
    ASSERT_TRUE(second.has_value());
    session.quit();

    EXPECT_EQ(session.state(), review::ReviewSession::State::Done);
    EXPECT_FALSE(session.present().has_value());
    EXPECT_EQ(codeOf([&] { session.submitVerdict(second->match.matchId, Verdict::TruePositive, std::nullopt); }),
              core::ErrorCode::InvalidState);

    review::ReviewQueue remaining(store_->loadScan("scan-r"));
    EXPECT_EQ(remaining.size(), 4u);
    EXPECT_EQ(remaining.items().front().match.matchId, second->match.matchId);
}

TEST_F(ReviewSessionTest, DecidedMatchesArePassedNotOverwritten) {
    review::FeedbackLedger ledger((dir_ / "ledger.jsonl").string());
    review::ReviewSession session(review::ReviewQueue(scan_, review::ReviewQueue::Scope::All), *store_, ledger);
    EXPECT_EQ(codeOf([&] { session.pass(); }), core::ErrorCode::InvalidState);

    size_t passed = 0;
    while (auto item = session.present()) {
        if (item->match.verdict != Verdict::Pending) {
            EXPECT_EQ(codeOf([&] { session.submitVerdict(item->match.matchId, Verdict::FalsePositive, std::nullopt); }),
                      core::ErrorCode::InvalidState);
            EXPECT_EQ(session.state(), review::ReviewSession::State::AwaitingVerdict);
            session.pass();
            ++passed;
            continue;
        }
        session.submitVerdict(item->match.matchId, Verdict::TruePositive, std::nullopt);
    }
    EXPECT_EQ(passed, 1u);
    EXPECT_EQ(session.committedCount(), 5u);
    EXPECT_EQ(ledger.readAll().size(), 5u);

    core::ScanRecord after = store_->loadScan("scan-r");
    for (const auto &f : after.fileResults) {
        for (const auto &m : f.matches) {
            EXPECT_EQ(m.verdict, Verdict::TruePositive) << core::toString(m.entityType);
        }
    }
}

TEST(FeedbackLedgerTest, JsonLineRoundTrip) {
    core::ReviewFeedbackRecord r;
    r.matchId = "m-1";
    r.entityType = EntityType::CreditCard;
    r.verdict = Verdict::FalsePositive;
    r.confidenceAtReview = 0.62;
    r.detectorSource = core::DetectorSource::Recognizer;
    r.contextSnippet = "card \"" + core::entityToken(EntityType::CreditCard) + "\"\nnext line";
    r.reason = std::string("vendor test \\ sample");
    r.timestamp = util::fromEpochMillis(1700000123456);

    std::string line = review::FeedbackLedger::toJsonLine(r);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_NE(line.find("\"match_id\":\"m-1\""), std::string::npos);
    EXPECT_NE(line.find("\"confidence_at_review\""), std::string::npos);

    core::ReviewFeedbackRecord back = review::FeedbackLedger::fromJsonLine(line);
    EXPECT_EQ(back.matchId, r.matchId);
    EXPECT_EQ(back.entityType, r.entityType);
    EXPECT_EQ(back.verdict, r.verdict);
    EXPECT_NEAR(back.confidenceAtReview, 0.62, 1e-9);
    EXPECT_EQ(back.detectorSource, r.detectorSource);
    EXPECT_EQ(back.contextSnippet, r.contextSnippet);
    EXPECT_EQ(back.reason.value_or(""), "vendor test \\ sample");
    EXPECT_TRUE(back.timestamp == r.timestamp);
}

} // namespace
