// test/unit/test_findings_store.cpp
// -----------------------------------------------------------
// Encrypted store: round trips, audit trail, purge atomicity, verdict and
// ledger atomicity, model relabeling, export/import and key handling.

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "config/scan_config.hpp"
#include "pipeline/file_classifier.hpp"
#include "review/feedback_ledger.hpp"
#include "storage/findings_store.hpp"
#include "storage/key_provider.hpp"
#include "storage/scan_json.hpp"

namespace {

using namespace sensiscan;
namespace fs = std::filesystem;

// Card: test data (FP). SSN and email: above threshold (TP). Phone: PENDING.
const char *kSampleText =
    "Example card 4111111111111111\n"
    "Patient SSN: 219-09-9999\n"
    "mail jane.roe@corp-mail.com\n"
    "call 415-867-5309\n";

std::string readBytes(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class FindingsStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("sensiscan_store_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(dir_);
        settings_.databasePath = (dir_ / "findings.db").string();
        settings_.auditLogPath = (dir_ / "audit.jsonl").string();
        settings_.actor = "tester";
        key_ = std::vector<uint8_t>(storage::kKeyBytes, 0x5A);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::unique_ptr<storage::SecureFindingsStore> openStore()
    {
        storage::StaticKeyProvider keys(key_);
        return storage::SecureFindingsStore::open(settings_, keys);
    }

    static core::ScanRecord makeScan(const std::string &scanId)
    {
        config::ScanConfig cfg;
        auto classifier = pipeline::FileClassifier::fromConfig(cfg);
        pipeline::Classification c = classifier->classify(kSampleText);

        core::ScanRecord rec;
        rec.scanId = scanId;
        rec.startedAt = util::fromEpochMillis(1700000000000);
        rec.completedAt = util::fromEpochMillis(1700000001500);
        rec.sourcePath = "/data/share";

        core::FileResult a;
        a.path = "/data/share/patients.txt";
        a.sizeBytes = 82;
        a.matches = c.matches;
        a.labelRecommendation = c.label;
        a.scanTimeMs = 12;
        rec.fileResults.push_back(a);

        core::FileResult b;
        b.path = "/data/share/scan.bin";
        b.sizeBytes = 4096;
        b.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Unsupported, b.path);
        rec.fileResults.push_back(b);
        return rec;
    }

    static const core::ResolvedMatch* findType(const core::ScanRecord &rec, core::EntityType type)
    {
        for (const auto &f : rec.fileResults) {
            for (const auto &m : f.matches) {
                if (m.entityType == type) {
                    return &m;
                }
            }
        }
        return nullptr;
    }

    static void expectSameContent(const core::ScanRecord &a, const core::ScanRecord &b)
    {
        EXPECT_EQ(a.scanId, b.scanId);
        EXPECT_EQ(a.sourcePath, b.sourcePath);
        EXPECT_TRUE(a.startedAt == b.startedAt);
        EXPECT_TRUE(a.completedAt == b.completedAt);
        ASSERT_EQ(a.fileResults.size(), b.fileResults.size());
        for (size_t i = 0; i < a.fileResults.size(); ++i) {
            const auto &fa = a.fileResults[i];
            const auto &fb = b.fileResults[i];
            EXPECT_EQ(fa.path, fb.path);
            EXPECT_EQ(fa.sizeBytes, fb.sizeBytes);
            EXPECT_TRUE(fa.labelRecommendation == fb.labelRecommendation);
            EXPECT_TRUE(fa.error == fb.error);
            EXPECT_EQ(fa.scanTimeMs, fb.scanTimeMs);
            ASSERT_EQ(fa.matches.size(), fb.matches.size());
            for (size_t j = 0; j < fa.matches.size(); ++j) {
                EXPECT_TRUE(fa.matches[j].sameContent(fb.matches[j])) << fa.path << " #" << j;
            }
        }
    }

    fs::path dir_;
    storage::StoreSettings settings_;
    std::vector<uint8_t> key_;
};

TEST_F(FindingsStoreTest, StoreAndLoadRoundTrip) {
    auto store = openStore();
    core::ScanRecord original = makeScan("scan-1");
    ASSERT_EQ(original.totalMatches(), 4u);

    core::ScanRecord stored = store->storeScan(original);
    for (const auto &f : stored.fileResults) {
        for (const auto &m : f.matches) {
            EXPECT_FALSE(m.matchId.empty());
        }
    }

    core::ScanRecord loaded = store->loadScan("scan-1");
    expectSameContent(original, loaded);
    EXPECT_EQ(loaded.fileResults[0].matches[0].matchId, stored.fileResults[0].matches[0].matchId);
}

TEST_F(FindingsStoreTest, EveryOperationAppendsOneAuditEntry) {
    auto store = openStore();
    auto entries = store->auditEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, "key_retrieve");
    EXPECT_EQ(entries[1].action, "db_open");

    auto expectOneMore = [&](const std::string &action, bool success) {
        auto now = store->auditEntries();
        ASSERT_EQ(now.size(), entries.size() + 1) << action;
        EXPECT_EQ(now.back().action, action);
        EXPECT_EQ(now.back().success, success);
        EXPECT_EQ(now.back().actor, "tester");
        entries = now;
    };

    store->storeScan(makeScan("scan-a"));
    expectOneMore("scan_store", true);
    store->loadScan("scan-a");
    expectOneMore("scan_read", true);
    store->listScans();
    expectOneMore("scan_list", true);
    store->stats();
    expectOneMore("stats_read", true);
    auto bundle = store->exportScan("scan-a");
    expectOneMore("scan_export", true);

    EXPECT_THROW(store->loadScan("missing"), core::StoreError);
    expectOneMore("scan_read", false);
    EXPECT_EQ(entries.back().errorCode.value_or(""), "not_found");

    EXPECT_THROW(store->storeScan(makeScan("scan-a")), core::StoreError);
    expectOneMore("scan_store", false);
    EXPECT_EQ(entries.back().errorCode.value_or(""), "duplicate_scan");

    EXPECT_THROW(store->importScan(bundle), core::StoreError);
    expectOneMore("scan_import", false);

    store->purgeScan("scan-a");
    expectOneMore("scan_purge", true);
    EXPECT_EQ(entries.back().scanId.value_or(""), "scan-a");
    EXPECT_GT(entries.back().affectedRecordCount, 0u);
}

TEST_F(FindingsStoreTest, NoRawValuesReachDisk) {
    {
        auto store = openStore();
        store->storeScan(makeScan("scan-raw"));
        store->loadScan("scan-raw");
    }
    std::string bytes;
    for (const auto &entry : fs::directory_iterator(dir_)) {
        bytes += readBytes(entry.path());
    }
    ASSERT_FALSE(bytes.empty());
    EXPECT_EQ(bytes.find("219-09-9999"), std::string::npos);
    EXPECT_EQ(bytes.find("219090"), std::string::npos);
    EXPECT_EQ(bytes.find("jane.roe"), std::string::npos);
    EXPECT_EQ(bytes.find("4111111111111111"), std::string::npos);
    EXPECT_EQ(bytes.find("415-867-5309"), std::string::npos);
    // Descriptive columns are sealed too.
    EXPECT_EQ(bytes.find("/data/share/patients.txt"), std::string::npos);
}

TEST_F(FindingsStoreTest, PurgeRemovesEverything) {
    auto store = openStore();
    core::ScanRecord rec = makeScan("scan-p");
    store->storeScan(rec);
    store->storeScan(makeScan("scan-keep"));

    uint64_t removed = store->purgeScan("scan-p");
    EXPECT_EQ(removed, 1 + rec.fileResults.size() + rec.totalMatches());
    EXPECT_THROW(store->loadScan("scan-p"), core::StoreError);
    EXPECT_NO_THROW(store->loadScan("scan-keep"));

    auto summaries = store->listScans();
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].scanId, "scan-keep");
    EXPECT_THROW(store->purgeScan("scan-p"), core::StoreError);
}

TEST_F(FindingsStoreTest, FailedPurgeRollsBack) {
    auto store = openStore();
    core::ScanRecord rec = makeScan("scan-f");
    store->storeScan(rec);

    // Fails on the last delete of the purge, after files and matches are gone.
    sqlite3 *db = nullptr;
    ASSERT_EQ(sqlite3_open(settings_.databasePath.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db,
                           "CREATE TRIGGER block_purge BEFORE DELETE ON scans "
                           "BEGIN SELECT RAISE(ABORT, 'blocked'); END;",
                           nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    try {
        store->purgeScan("scan-f");
        FAIL() << "purge should have failed";
    }
    catch (const core::StoreError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::TransactionFailed);
    }

    core::ScanRecord after = store->loadScan("scan-f");
    EXPECT_EQ(after.totalMatches(), rec.totalMatches());
    EXPECT_EQ(after.fileResults.size(), rec.fileResults.size());

    bool sawFailedPurge = false;
    for (const auto &e : store->auditEntries()) {
        if (e.action == "scan_purge") {
            EXPECT_FALSE(e.success);
            sawFailedPurge = true;
        }
    }
    EXPECT_TRUE(sawFailedPurge);
}

TEST_F(FindingsStoreTest, CommitVerdictWritesMatchAndLedger) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-v"));
    const core::ResolvedMatch *phone = findType(stored, core::EntityType::Phone);
    ASSERT_NE(phone, nullptr);

    review::FeedbackLedger ledger((dir_ / "reviews.jsonl").string());
    core::ReviewFeedbackRecord rec =
        store->commitVerdict(phone->matchId, core::Verdict::Unsure, std::string("front desk"), ledger);
    EXPECT_EQ(rec.verdict, core::Verdict::Skipped);
    EXPECT_EQ(rec.entityType, core::EntityType::Phone);

    const core::ResolvedMatch *after = findType(store->loadScan("scan-v"), core::EntityType::Phone);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->verdict, core::Verdict::Skipped);

    auto lines = ledger.readAll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].matchId, phone->matchId);
    EXPECT_EQ(lines[0].reason.value_or(""), "front desk");
    EXPECT_EQ(lines[0].contextSnippet.find("867-5309"), std::string::npos);
    EXPECT_EQ(ledger.stats().skipped, 1u);
}

TEST_F(FindingsStoreTest, CommitVerdictRejectsBadInput) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-x"));
    review::FeedbackLedger ledger((dir_ / "reviews.jsonl").string());

    try {
        store->commitVerdict("no-such-match", core::Verdict::TruePositive, std::nullopt, ledger);
        FAIL() << "expected not_found";
    }
    catch (const core::ReviewTransactionError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::NotFound);
    }

    const std::string id = stored.fileResults[0].matches[0].matchId;
    try {
        store->commitVerdict(id, core::Verdict::Pending, std::nullopt, ledger);
        FAIL() << "expected invalid_state";
    }
    catch (const core::ReviewTransactionError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::InvalidState);
    }
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(FindingsStoreTest, LedgerFailureLeavesVerdictPending) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-l"));
    const core::ResolvedMatch *phone = findType(stored, core::EntityType::Phone);
    ASSERT_NE(phone, nullptr);
    ASSERT_EQ(phone->verdict, core::Verdict::Pending);

    // A directory cannot be opened for append.
    fs::path ledgerPath = dir_ / "ledger_dir";
    fs::create_directories(ledgerPath);
    review::FeedbackLedger ledger(ledgerPath.string());

    try {
        store->commitVerdict(phone->matchId, core::Verdict::TruePositive, std::nullopt, ledger);
        FAIL() << "expected ledger_write_failed";
    }
    catch (const core::ReviewTransactionError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::LedgerWriteFailed);
    }

    const core::ResolvedMatch *after = findType(store->loadScan("scan-l"), core::EntityType::Phone);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->verdict, core::Verdict::Pending);
    EXPECT_TRUE(fs::is_empty(ledgerPath));
    EXPECT_FALSE(store->auditEntries().back().success);
}

TEST_F(FindingsStoreTest, CommitVerdictRequiresPendingMatch) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-d"));
    const core::ResolvedMatch *email = findType(stored, core::EntityType::Email);
    ASSERT_NE(email, nullptr);
    ASSERT_EQ(email->verdict, core::Verdict::TruePositive);

    review::FeedbackLedger ledger((dir_ / "reviews.jsonl").string());
    try {
        store->commitVerdict(email->matchId, core::Verdict::FalsePositive, std::nullopt, ledger);
        FAIL() << "expected invalid_state";
    }
    catch (const core::ReviewTransactionError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::InvalidState);
    }
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(ledger.readAll().empty());

    const core::ResolvedMatch *after = findType(store->loadScan("scan-d"), core::EntityType::Email);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->verdict, core::Verdict::TruePositive);

    bool sawRejected = false;
    for (const auto &e : store->auditEntries()) {
        if (e.action == "verdict_commit") {
            EXPECT_FALSE(e.success);
            EXPECT_EQ(e.errorCode.value_or(""), "invalid_state");
            sawRejected = true;
        }
    }
    EXPECT_TRUE(sawRejected);
}

TEST_F(FindingsStoreTest, FailedCommitWithdrawsLedgerLine) {
    auto store = openStore();
    core::ScanRecord first = store->storeScan(makeScan("scan-c0"));
    core::ScanRecord stored = store->storeScan(makeScan("scan-c"));
    const core::ResolvedMatch *earlier = findType(first, core::EntityType::Phone);
    const core::ResolvedMatch *phone = findType(stored, core::EntityType::Phone);
    ASSERT_NE(earlier, nullptr);
    ASSERT_NE(phone, nullptr);

    review::FeedbackLedger ledger((dir_ / "reviews.jsonl").string());
    store->commitVerdict(earlier->matchId, core::Verdict::TruePositive, std::nullopt, ledger);
    const uint64_t sizeBefore = ledger.size();
    ASSERT_GT(sizeBefore, 0u);

    // A deferred foreign key is only checked at COMMIT, after the ledger line is written.
    sqlite3 *db = nullptr;
    ASSERT_EQ(sqlite3_open(settings_.databasePath.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db,
                           "CREATE TABLE anchor (id TEXT PRIMARY KEY);"
                           "CREATE TABLE dangling (ref TEXT REFERENCES anchor(id) DEFERRABLE INITIALLY DEFERRED);"
                           "CREATE TRIGGER orphan_on_verdict AFTER UPDATE ON matches "
                           "BEGIN INSERT INTO dangling (ref) VALUES ('nowhere'); END;",
                           nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    try {
        store->commitVerdict(phone->matchId, core::Verdict::FalsePositive, std::string("lobby"), ledger);
        FAIL() << "expected transaction_failed";
    }
    catch (const core::ReviewTransactionError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::TransactionFailed);
    }

    EXPECT_EQ(ledger.size(), sizeBefore);
    auto lines = ledger.readAll();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].matchId, earlier->matchId);

    const core::ResolvedMatch *after = findType(store->loadScan("scan-c"), core::EntityType::Phone);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->verdict, core::Verdict::Pending);

    storage::AuditQuery q;
    q.action = "verdict_commit";
    q.scanId = "scan-c";
    auto attempts = store->auditEntries(q);
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_FALSE(attempts[0].success);
}

TEST_F(FindingsStoreTest, UnwritableAuditLogLeavesDataUnchanged) {
    auto store = openStore();
    core::ScanRecord rec = store->storeScan(makeScan("scan-u"));
    const core::ResolvedMatch *phone = findType(rec, core::EntityType::Phone);
    ASSERT_NE(phone, nullptr);
    review::FeedbackLedger ledger((dir_ / "reviews.jsonl").string());

    // A directory in place of the log cannot be appended to.
    const fs::path auditPath = settings_.auditLogPath;
    const std::string savedLog = readBytes(auditPath);
    fs::remove(auditPath);
    fs::create_directories(auditPath);

    try {
        store->purgeScan("scan-u");
        FAIL() << "purge should have failed";
    }
    catch (const core::StoreError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::TransactionFailed);
    }
    EXPECT_THROW(store->storeScan(makeScan("scan-u2")), core::StoreError);
    EXPECT_THROW(store->commitVerdict(phone->matchId, core::Verdict::TruePositive, std::nullopt, ledger),
                 core::ReviewTransactionError);
    EXPECT_THROW(store->purgeAll(), core::StoreError);
    EXPECT_EQ(ledger.size(), 0u);

    fs::remove(auditPath);
    {
        std::ofstream restore(auditPath, std::ios::binary);
        restore << savedLog;
    }

    core::ScanRecord after = store->loadScan("scan-u");
    EXPECT_EQ(after.fileResults.size(), rec.fileResults.size());
    EXPECT_EQ(after.totalMatches(), rec.totalMatches());
    EXPECT_EQ(findType(after, core::EntityType::Phone)->verdict, core::Verdict::Pending);
    auto list = store->listScans();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].scanId, "scan-u");

    for (const auto &e : store->auditEntries()) {
        EXPECT_NE(e.action, "scan_purge");
        EXPECT_NE(e.action, "verdict_commit");
    }
}

TEST_F(FindingsStoreTest, PurgeAllIsOneAuditedTransaction) {
    auto store = openStore();
    core::ScanRecord a = makeScan("scan-a1");
    store->storeScan(a);
    store->storeScan(makeScan("scan-a2"));
    const size_t entriesBefore = store->auditEntries().size();

    uint64_t removed = store->purgeAll();
    EXPECT_EQ(removed, 2 * (1 + a.fileResults.size() + a.totalMatches()));
    EXPECT_TRUE(store->listScans().empty());
    EXPECT_EQ(store->stats().files, 0u);

    storage::AuditQuery q;
    q.action = "scan_purge_all";
    auto purges = store->auditEntries(q);
    ASSERT_EQ(purges.size(), 1u);
    EXPECT_TRUE(purges[0].success);
    EXPECT_EQ(purges[0].affectedRecordCount, removed);
    EXPECT_FALSE(purges[0].scanId.has_value());
    // purgeAll, listScans and stats.
    EXPECT_EQ(store->auditEntries().size(), entriesBefore + 3);

    EXPECT_EQ(store->purgeAll(), 0u);
}

TEST_F(FindingsStoreTest, KeyRotationResealsEveryRow) {
    core::ScanRecord original = makeScan("scan-r");
    const std::vector<uint8_t> nextKey(storage::kKeyBytes, 0x77);
    {
        auto store = openStore();
        store->storeScan(original);

        EXPECT_THROW(store->rotateKey(storage::KeyMaterial(std::vector<uint8_t>(8, 0x01))),
                     core::KeyUnavailableError);
        EXPECT_NO_THROW(store->loadScan("scan-r"));

        uint64_t rows = store->rotateKey(storage::KeyMaterial(nextKey));
        EXPECT_EQ(rows, 1 + 1 + original.fileResults.size() + original.totalMatches());
        expectSameContent(original, store->loadScan("scan-r"));

        storage::AuditQuery q;
        q.action = "key_rotate";
        auto rotations = store->auditEntries(q);
        ASSERT_EQ(rotations.size(), 2u);
        EXPECT_FALSE(rotations[0].success);
        EXPECT_EQ(rotations[0].errorCode.value_or(""), "key_invalid");
        EXPECT_TRUE(rotations[1].success);
        EXPECT_EQ(rotations[1].affectedRecordCount, rows);
    }

    try {
        openStore();
        FAIL() << "the old key should no longer open the store";
    }
    catch (const core::KeyUnavailableError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::KeyInvalid);
    }

    key_ = nextKey;
    auto reopened = openStore();
    expectSameContent(original, reopened->loadScan("scan-r"));
}

TEST_F(FindingsStoreTest, AuditQueriesAndStats) {
    auto store = openStore();
    store->storeScan(makeScan("scan-q1"));
    store->storeScan(makeScan("scan-q2"));
    store->loadScan("scan-q1");
    EXPECT_THROW(store->loadScan("missing"), core::StoreError);

    storage::AuditQuery byAction;
    byAction.action = "scan_store";
    EXPECT_EQ(store->auditEntries(byAction).size(), 2u);

    storage::AuditQuery byScan;
    byScan.scanId = "scan-q1";
    auto q1 = store->auditEntries(byScan);
    ASSERT_EQ(q1.size(), 2u);
    EXPECT_EQ(q1[0].action, "scan_store");
    EXPECT_EQ(q1[1].action, "scan_read");

    storage::AuditQuery limited;
    limited.limit = 3;
    auto firstThree = store->auditEntries(limited);
    ASSERT_EQ(firstThree.size(), 3u);
    EXPECT_EQ(firstThree[0].action, "key_retrieve");

    storage::AuditQuery future;
    future.since = util::Clock::now() + std::chrono::hours(1);
    EXPECT_TRUE(store->auditEntries(future).empty());

    storage::AuditQuery all;
    all.since = util::fromEpochMillis(0);
    const auto everything = store->auditEntries();
    EXPECT_EQ(store->auditEntries(all).size(), everything.size());

    storage::AuditStats stats = store->auditStats();
    EXPECT_EQ(stats.total, everything.size());
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(stats.byAction["scan_store"], 2u);
    EXPECT_EQ(stats.byAction["scan_read"], 2u);
    EXPECT_EQ(stats.byActor["tester"], everything.size());
    ASSERT_TRUE(stats.first.has_value());
    ASSERT_TRUE(stats.last.has_value());
    EXPECT_TRUE(*stats.first <= *stats.last);
}

TEST_F(FindingsStoreTest, ModelRelabelOnlyTouchesPendingWithNewerVersion) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-m"));
    const core::ResolvedMatch *phone = findType(stored, core::EntityType::Phone);
    const core::ResolvedMatch *card = findType(stored, core::EntityType::CreditCard);
    ASSERT_NE(phone, nullptr);
    ASSERT_NE(card, nullptr);
    ASSERT_EQ(phone->verdict, core::Verdict::Pending);
    ASSERT_EQ(card->verdict, core::Verdict::FalsePositive);

    std::vector<storage::RelabelScore> scores = {{phone->matchId, 0.97}, {card->matchId, 0.99}};
    EXPECT_EQ(store->applyModelRelabel("scan-m", scores, "2.0.0"), 1u);

    core::ScanRecord loaded = store->loadScan("scan-m");
    const core::ResolvedMatch *e2 = findType(loaded, core::EntityType::Phone);
    const core::ResolvedMatch *c2 = findType(loaded, core::EntityType::CreditCard);
    EXPECT_EQ(e2->verdict, core::Verdict::TruePositive);
    EXPECT_DOUBLE_EQ(e2->finalConfidence, 0.97);
    EXPECT_EQ(e2->modelVersion.value_or(""), "2.0.0");
    EXPECT_TRUE(e2->contributingSources.count(core::DetectorSource::Classifier));
    EXPECT_EQ(c2->verdict, core::Verdict::FalsePositive);

    // The phone is no longer pending; nothing else qualifies.
    EXPECT_EQ(store->applyModelRelabel("scan-m", scores, "3.0.0"), 0u);
    EXPECT_THROW(store->applyModelRelabel("missing", scores, "3.0.0"), core::StoreError);
}

TEST_F(FindingsStoreTest, ModelRelabelIgnoresOlderVersion) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-o"));
    const core::ResolvedMatch *phone = findType(stored, core::EntityType::Phone);
    ASSERT_NE(phone, nullptr);

    std::vector<storage::RelabelScore> low = {{phone->matchId, 0.40}};
    EXPECT_EQ(store->applyModelRelabel("scan-o", low, "1.5.0"), 1u);
    EXPECT_EQ(store->applyModelRelabel("scan-o", low, "1.4.9"), 0u);
    EXPECT_EQ(store->applyModelRelabel("scan-o", low, "1.5.0"), 0u);
    EXPECT_EQ(store->applyModelRelabel("scan-o", low, "1.10.0"), 1u);
}

TEST_F(FindingsStoreTest, ExportImportBetweenStores) {
    core::ScanRecord original = makeScan("scan-e");
    std::vector<uint8_t> bundle;
    {
        auto source = openStore();
        source->storeScan(original);
        bundle = source->exportScan("scan-e");
    }
    const std::string bundleText(bundle.begin(), bundle.end());
    EXPECT_EQ(bundleText.find("/data/share"), std::string::npos);

    settings_.databasePath = (dir_ / "other.db").string();
    settings_.auditLogPath = (dir_ / "other.audit.jsonl").string();
    auto target = openStore();
    core::ScanRecord imported = target->importScan(bundle);
    expectSameContent(original, imported);
    expectSameContent(original, target->loadScan("scan-e"));

    try {
        target->importScan(bundle);
        FAIL() << "expected duplicate_scan";
    }
    catch (const core::StoreError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::DuplicateScan);
    }

    bundle[bundle.size() / 2] ^= 0x01;
    try {
        target->importScan(bundle);
        FAIL() << "expected corrupt_record";
    }
    catch (const core::StoreError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::CorruptRecord);
    }
}

TEST_F(FindingsStoreTest, WrongKeyIsRejected) {
    {
        auto store = openStore();
        store->storeScan(makeScan("scan-k"));
    }
    key_ = std::vector<uint8_t>(storage::kKeyBytes, 0x33);
    try {
        openStore();
        FAIL() << "expected key_invalid";
    }
    catch (const core::KeyUnavailableError &ex) {
        EXPECT_EQ(ex.code(), core::ErrorCode::KeyInvalid);
    }
}

TEST_F(FindingsStoreTest, MissingKeyIsAudited) {
    key_.clear();
    EXPECT_THROW(openStore(), core::KeyUnavailableError);

    storage::AuditLog audit(settings_.auditLogPath);
    auto entries = audit.readAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].action, "key_retrieve");
    EXPECT_FALSE(entries[0].success);
    EXPECT_EQ(entries[0].errorCode.value_or(""), "key_missing");
}

TEST_F(FindingsStoreTest, StatsAndListing) {
    auto store = openStore();
    core::ScanRecord a = makeScan("scan-s1");
    store->storeScan(a);
    store->storeScan(makeScan("scan-s2"));

    auto list = store->listScans();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].scanId, "scan-s1");
    EXPECT_EQ(list[0].fileCount, 2u);
    EXPECT_EQ(list[0].matchCount, a.totalMatches());
    EXPECT_EQ(list[0].sourcePath, "/data/share");

    storage::StoreStats s = store->stats();
    EXPECT_EQ(s.scans, 2u);
    EXPECT_EQ(s.files, 4u);
    EXPECT_EQ(s.matches, 2 * a.totalMatches());
    EXPECT_EQ(s.byEntity[core::EntityType::Ssn], 2u);
}

TEST_F(FindingsStoreTest, ConcurrentWritersAndReaders) {
    auto store = openStore();
    store->storeScan(makeScan("scan-base"));

    std::atomic<int> readFailures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&store, i]() { store->storeScan(makeScan("scan-t" + std::to_string(i))); });
        threads.emplace_back([&store, &readFailures]() {
            for (int k = 0; k < 5; ++k) {
                if (store->loadScan("scan-base").fileResults.size() != 2) {
                    ++readFailures;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(readFailures.load(), 0);
    EXPECT_EQ(store->listScans().size(), 5u);
}

TEST_F(FindingsStoreTest, JsonRenderingUsesRedactedValues) {
    auto store = openStore();
    core::ScanRecord stored = store->storeScan(makeScan("scan-j"));
    std::string json = storage::scanToJson(store->loadScan("scan-j"));
    EXPECT_NE(json.find("\"scan_id\":\"scan-j\""), std::string::npos);
    EXPECT_NE(json.find("*******9999"), std::string::npos);
    EXPECT_EQ(json.find("219-09-9999"), std::string::npos);
    EXPECT_NE(json.find("\"code\":\"unsupported\""), std::string::npos);
}

} // namespace
