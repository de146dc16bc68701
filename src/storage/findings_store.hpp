#ifndef SENSISCAN_STORAGE_FINDINGS_STORE_HPP
#define SENSISCAN_STORAGE_FINDINGS_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "config/scan_config.hpp"
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "fusion/fusion_engine.hpp"
#include "review/feedback_ledger.hpp"
#include "storage/audit_log.hpp"
#include "storage/cipher.hpp"
#include "storage/key_provider.hpp"
#include "storage/record_codec.hpp"
#include "storage/sqlite_db.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/version_compare.hpp"

/**
 * @file findings_store.hpp
 * @brief Encrypted-at-rest persistence of scan results with an audit trail.
 *
 * SCHEMA:
 *   meta    (name TEXT PK, payload BLOB)
 *   scans   (seq INTEGER PK AUTOINCREMENT, scan_id TEXT UNIQUE, payload BLOB)
 *   files   (file_id TEXT PK, scan_id TEXT, ordinal INTEGER, payload BLOB)
 *   matches (match_id TEXT PK, file_id TEXT, scan_id TEXT, ordinal INTEGER, payload BLOB)
 *
 *   Only opaque ids and ordinals are plaintext. Each payload is
 *   encode -> zlib -> AES-256-GCM with "<table>:<row id>" as associated data.
 *
 * CONCURRENCY:
 *   - Writers take the unique side of a process-wide shared_mutex and open
 *     a BEGIN IMMEDIATE transaction. Readers take the shared side and read
 *     inside a deferred transaction on a WAL-mode database.
 *   - Each operation uses its own connection.
 *
 * AUDIT:
 *   - Every operation appends exactly one entry, success or failure.
 *   - A write appends its success entry inside the sqlite transaction, just
 *     before COMMIT. If the append fails the transaction rolls back; if the
 *     COMMIT fails the entry is truncated away. A caller that sees a failure
 *     therefore sees unchanged data, and the log never claims a write that
 *     did not happen.
 *   - Reads append after the read. If that append fails the data is
 *     withheld from the caller.
 *   - Failure entries are written after the rollback.
 *   - auditEntries() and auditStats() read the audit file, not the
 *     database, and are not themselves audited.
 */

namespace sensiscan {
namespace storage {

struct StoreSettings
{
    std::string databasePath = "./sensiscan_data/findings.db";
    std::string auditLogPath = "./sensiscan_data/findings.db.audit.jsonl";
    std::string actor = "sensiscan";
    double reviewThreshold = 0.85;

    static StoreSettings fromConfig(const config::ScanConfig &cfg)
    {
        StoreSettings s;
        s.databasePath = cfg.databasePath;
        s.auditLogPath = cfg.effectiveAuditLogPath();
        s.actor = cfg.actor;
        s.reviewThreshold = cfg.reviewThreshold;
        return s;
    }
};

struct ScanSummary
{
    std::string scanId;
    util::TimePoint startedAt;
    std::optional<util::TimePoint> completedAt;
    std::string sourcePath;
    uint64_t fileCount = 0;
    uint64_t matchCount = 0;
};

struct StoreStats
{
    uint64_t scans = 0;
    uint64_t files = 0;
    uint64_t matches = 0;
    std::map<core::Verdict, uint64_t> byVerdict;
    std::map<core::EntityType, uint64_t> byEntity;
};

/// A newer model's score for one stored match.
struct RelabelScore
{
    std::string matchId;
    double score = 0.0;
};

class SecureFindingsStore
{
public:
    /**
     * @brief Retrieve the key, open (or create) the database and verify the
     *        key against it.
     * @throw core::KeyUnavailableError if the key cannot be obtained or does
     *        not match the database.
     * @throw core::StoreError if the database cannot be opened.
     */
    static std::unique_ptr<SecureFindingsStore> open(const StoreSettings &settings,
                                                     const KeyProvider &keys)
    {
        auto audit = std::make_unique<AuditLog>(settings.auditLogPath);

        std::optional<KeyMaterial> key;
        try {
            key.emplace(keys.retrieveKey());
        }
        catch (const core::SensiScanError &ex) {
            util::logger::error("SecureFindingsStore: key retrieval from " + keys.describe()
                                + " failed: " + core::toString(ex.code()));
            appendFailure(*audit, settings.actor, "key_retrieve", std::nullopt, ex.code());
            throw;
        }
        appendEntry(*audit, settings.actor, "key_retrieve", 1, std::nullopt, true, std::nullopt);

        std::unique_ptr<SecureFindingsStore> store(
            new SecureFindingsStore(settings, RecordCipher(std::move(*key)), std::move(audit)));
        try {
            store->initialize();
        }
        catch (const core::SensiScanError &ex) {
            store->recordFailure("db_open", std::nullopt, ex.code());
            throw;
        }
        store->record("db_open", 0, std::nullopt);
        util::logger::info("SecureFindingsStore: opened " + settings.databasePath);
        return store;
    }

    SecureFindingsStore(const SecureFindingsStore &) = delete;
    SecureFindingsStore& operator=(const SecureFindingsStore &) = delete;

    /**
     * @brief Persist a scan atomically.
     * @return The record as stored, with match ids assigned.
     * @throw core::StoreError (duplicate_scan, transaction_failed)
     */
    core::ScanRecord storeScan(const core::ScanRecord &scan)
    {
        core::ScanRecord stored = scan;
        uint64_t rows = 0;
        try {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);
            rows = insertScan(db, stored);
            commitAudited(txn, "scan_store", rows, scan.scanId);
        }
        catch (const std::exception &ex) {
            recordFailure("scan_store", scan.scanId, failureCode(ex));
            throw;
        }
        util::logger::info("SecureFindingsStore: stored scan " + scan.scanId + " ("
                           + std::to_string(stored.totalMatches()) + " matches).");
        return stored;
    }

    /**
     * @throw core::StoreError (not_found, corrupt_record, transaction_failed)
     */
    core::ScanRecord loadScan(const std::string &scanId) const
    {
        core::ScanRecord rec;
        try {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Read);
            rec = readScan(db, scanId);
            txn.commit();
        }
        catch (const std::exception &ex) {
            recordFailure("scan_read", scanId, failureCode(ex));
            throw;
        }
        record("scan_read", 1 + rec.fileResults.size() + rec.totalMatches(), scanId);
        return rec;
    }

    std::vector<ScanSummary> listScans() const
    {
        std::vector<ScanSummary> out;
        try {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Read);

            Statement scans(db, "SELECT scan_id, payload FROM scans ORDER BY seq;");
            Statement fileCount(db, "SELECT COUNT(*) FROM files WHERE scan_id = ?;");
            Statement matchCount(db, "SELECT COUNT(*) FROM matches WHERE scan_id = ?;");
            while (scans.step()) {
                ScanSummary s;
                s.scanId = scans.columnText(0);
                ScanHeader h = openScanHeader(s.scanId, scans.columnBlob(1));
                s.startedAt = h.startedAt;
                s.completedAt = h.completedAt;
                s.sourcePath = h.sourcePath;

                fileCount.bind(1, s.scanId);
                if (fileCount.step()) {
                    s.fileCount = static_cast<uint64_t>(fileCount.columnInt64(0));
                }
                fileCount.reset();
                matchCount.bind(1, s.scanId);
                if (matchCount.step()) {
                    s.matchCount = static_cast<uint64_t>(matchCount.columnInt64(0));
                }
                matchCount.reset();
                out.push_back(std::move(s));
            }
            txn.commit();
        }
        catch (const std::exception &ex) {
            recordFailure("scan_list", std::nullopt, failureCode(ex));
            throw;
        }
        record("scan_list", out.size(), std::nullopt);
        return out;
    }

    /**
     * @brief Delete a scan with all its files and matches in one transaction.
     * @return Rows removed.
     * @throw core::StoreError (not_found, transaction_failed); nothing is
     *        removed when it throws.
     */
    uint64_t purgeScan(const std::string &scanId)
    {
        uint64_t removed = 0;
        try {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);

            Statement delMatches(db, "DELETE FROM matches WHERE scan_id = ?;");
            delMatches.bind(1, scanId).step();
            removed += static_cast<uint64_t>(db.changes());

            Statement delFiles(db, "DELETE FROM files WHERE scan_id = ?;");
            delFiles.bind(1, scanId).step();
            removed += static_cast<uint64_t>(db.changes());

            Statement delScan(db, "DELETE FROM scans WHERE scan_id = ?;");
            delScan.bind(1, scanId).step();
            int64_t scanRows = db.changes();
            if (scanRows == 0) {
                throw core::StoreError(core::ErrorCode::NotFound, scanId);
            }
            removed += static_cast<uint64_t>(scanRows);
            commitAudited(txn, "scan_purge", removed, scanId);
        }
        catch (const std::exception &ex) {
            util::logger::warn("SecureFindingsStore: purge of " + scanId + " failed, rolled back.");
            recordFailure("scan_purge", scanId, failureCode(ex));
            throw;
        }
        util::logger::info("SecureFindingsStore: purged scan " + scanId + " ("
                           + std::to_string(removed) + " rows).");
        return removed;
    }

    /**
     * @brief Delete every scan, file and match in one transaction.
     * @return Rows removed; zero for an empty store.
     * @throw core::StoreError(transaction_failed); nothing is removed when
     *        it throws.
     */
    uint64_t purgeAll()
    {
        uint64_t removed = 0;
        try {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);

            db.exec("DELETE FROM matches;");
            removed += static_cast<uint64_t>(db.changes());
            db.exec("DELETE FROM files;");
            removed += static_cast<uint64_t>(db.changes());
            db.exec("DELETE FROM scans;");
            removed += static_cast<uint64_t>(db.changes());
            commitAudited(txn, "scan_purge_all", removed, std::nullopt);
        }
        catch (const std::exception &ex) {
            util::logger::warn("SecureFindingsStore: purge of all scans failed, rolled back.");
            recordFailure("scan_purge_all", std::nullopt, failureCode(ex));
            throw;
        }
        util::logger::info("SecureFindingsStore: purged all scans (" + std::to_string(removed) + " rows).");
        return removed;
    }

    /**
     * @brief Re-seal every row under `next` in one write transaction, then
     *        switch to it.
     *
     * The caller persists the new key. It should stage the key durably
     * before calling and promote it only after this returns; on a throw the
     * database is still sealed under the old key.
     * @return Rows re-sealed, the key check included.
     * @throw core::KeyUnavailableError(key_invalid) for a key of the wrong size.
     * @throw core::StoreError (corrupt_record, transaction_failed)
     */
    uint64_t rotateKey(KeyMaterial next)
    {
        uint64_t rows = 0;
        try {
            RecordCipher nextCipher(std::move(next));

            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);

            rows += resealTable(db, nextCipher, "meta", "name", "meta:");
            rows += resealTable(db, nextCipher, "scans", "scan_id", "scan:");
            rows += resealTable(db, nextCipher, "files", "file_id", "file:");
            rows += resealTable(db, nextCipher, "matches", "match_id", "match:");
            commitAudited(txn, "key_rotate", rows, std::nullopt);
            cipher_ = std::move(nextCipher);
        }
        catch (const std::exception &ex) {
            util::logger::error("SecureFindingsStore: key rotation failed, store still sealed under the old key.");
            recordFailure("key_rotate", std::nullopt, failureCode(ex));
            throw;
        }
        util::logger::info("SecureFindingsStore: re-sealed " + std::to_string(rows) + " rows under a new key.");
        return rows;
    }

    /**
     * @brief Record a reviewer verdict and its ledger line atomically.
     *
     * The ledger line is appended inside the sqlite transaction. If the
     * append fails the transaction rolls back; if the commit fails the
     * ledger is truncated back to its prior size.
     *
     * @param verdict TP, FP, UNSURE or SKIPPED. UNSURE is stored as SKIPPED.
     * @throw core::ReviewTransactionError; invalid_state when the match is
     *        no longer PENDING.
     */
    core::ReviewFeedbackRecord commitVerdict(const std::string &matchId,
                                             core::Verdict verdict,
                                             const std::optional<std::string> &reason,
                                             review::FeedbackLedger &ledger)
    {
        std::optional<std::string> scanId;
        core::ReviewFeedbackRecord feedback;
        try {
            if (verdict == core::Verdict::Pending) {
                throw core::ReviewTransactionError(core::ErrorCode::InvalidState, "PENDING is not a verdict");
            }
            const core::Verdict stored = verdict == core::Verdict::Unsure ? core::Verdict::Skipped : verdict;

            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);

            Statement sel(db, "SELECT scan_id, payload FROM matches WHERE match_id = ?;");
            sel.bind(1, matchId);
            if (!sel.step()) {
                throw core::ReviewTransactionError(core::ErrorCode::NotFound, matchId);
            }
            scanId = sel.columnText(0);
            core::ResolvedMatch m = openMatch(matchId, sel.columnBlob(1));
            if (m.verdict != core::Verdict::Pending) {
                throw core::ReviewTransactionError(core::ErrorCode::InvalidState,
                                                   matchId + " is " + core::toString(m.verdict));
            }
            m.verdict = stored;

            Statement upd(db, "UPDATE matches SET payload = ? WHERE match_id = ?;");
            upd.bind(1, sealMatch(matchId, m)).bind(2, matchId).step();

            feedback.matchId = matchId;
            feedback.entityType = m.entityType;
            feedback.verdict = stored;
            feedback.confidenceAtReview = m.finalConfidence;
            feedback.detectorSource = m.leadingSource();
            feedback.contextSnippet = m.contextSnippet;
            feedback.reason = reason;
            feedback.timestamp = util::Clock::now();

            const uint64_t prior = ledger.append(feedback);
            try {
                commitAudited(txn, "verdict_commit", 1, scanId);
            }
            catch (const core::StoreError &) {
                ledger.truncateTo(prior);
                throw core::ReviewTransactionError(core::ErrorCode::TransactionFailed, matchId);
            }
        }
        catch (const core::StoreError &ex) {
            recordFailure("verdict_commit", scanId, ex.code());
            throw core::ReviewTransactionError(ex.code(), matchId);
        }
        catch (const std::exception &ex) {
            recordFailure("verdict_commit", scanId, failureCode(ex));
            throw;
        }
        return feedback;
    }

    /**
     * @brief Apply a newer model's scores to the PENDING matches of a scan.
     *
     * A match is updated only while its verdict is PENDING and only if
     * `modelVersion` is newer than the version that last scored it.
     * @return Number of matches updated.
     */
    uint64_t applyModelRelabel(const std::string &scanId,
                               const std::vector<RelabelScore> &scores,
                               const std::string &modelVersion)
    {
        uint64_t updated = 0;
        try {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);

            requireScan(db, scanId);

            std::map<std::string, double> byId;
            for (const auto &s : scores) {
                byId[s.matchId] = s.score;
            }

            std::vector<std::pair<std::string, core::ResolvedMatch>> changed;
            Statement sel(db, "SELECT match_id, payload FROM matches WHERE scan_id = ? ORDER BY ordinal;");
            sel.bind(1, scanId);
            while (sel.step()) {
                std::string id = sel.columnText(0);
                auto it = byId.find(id);
                if (it == byId.end()) {
                    continue;
                }
                core::ResolvedMatch m = openMatch(id, sel.columnBlob(1));
                if (m.verdict != core::Verdict::Pending) {
                    continue;
                }
                if (m.modelVersion && util::compareVersions(modelVersion, *m.modelVersion) <= 0) {
                    continue;
                }
                double score = it->second < 0.0 ? 0.0 : (it->second > 1.0 ? 1.0 : it->second);
                m.finalConfidence = score;
                m.modelVersion = modelVersion;
                m.contributingSources.insert(core::DetectorSource::Classifier);
                m.verdict = fusion::FusionEngine::verdictFor(score, m.isTestData, settings_.reviewThreshold);
                changed.emplace_back(std::move(id), std::move(m));
            }

            Statement upd(db, "UPDATE matches SET payload = ? WHERE match_id = ?;");
            for (const auto &kv : changed) {
                upd.bind(1, sealMatch(kv.first, kv.second)).bind(2, kv.first).step();
                upd.reset();
            }
            updated = changed.size();
            commitAudited(txn, "model_relabel", updated, scanId);
        }
        catch (const std::exception &ex) {
            recordFailure("model_relabel", scanId, failureCode(ex));
            throw;
        }
        return updated;
    }

    /**
     * @brief A sealed, compressed bundle of one scan for transfer between stores
     *        sharing the same key.
     */
    std::vector<uint8_t> exportScan(const std::string &scanId) const
    {
        std::vector<uint8_t> bundle;
        uint64_t rows = 0;
        try {
            core::ScanRecord rec;
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                Database db(settings_.databasePath);
                Transaction txn(db, Transaction::Mode::Read);
                rec = readScan(db, scanId);
                txn.commit();
            }
            rows = 1 + rec.fileResults.size() + rec.totalMatches();
            bundle = cipher_.seal(compress(encodeScanRecord(rec)), kExportAad);
        }
        catch (const std::exception &ex) {
            recordFailure("scan_export", scanId, failureCode(ex));
            throw;
        }
        record("scan_export", rows, scanId);
        return bundle;
    }

    /**
     * @throw core::StoreError (duplicate_scan, corrupt_record, transaction_failed)
     */
    core::ScanRecord importScan(const std::vector<uint8_t> &bundle)
    {
        core::ScanRecord rec;
        std::optional<std::string> scanId;
        uint64_t rows = 0;
        try {
            rec = decodeScanRecord(decompress(cipher_.open(bundle, kExportAad), "export"), "export");
            scanId = rec.scanId;

            std::unique_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Write);
            rows = insertScan(db, rec);
            commitAudited(txn, "scan_import", rows, scanId);
        }
        catch (const std::exception &ex) {
            recordFailure("scan_import", scanId, failureCode(ex));
            throw;
        }
        return rec;
    }

    StoreStats stats() const
    {
        StoreStats s;
        try {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            Database db(settings_.databasePath);
            Transaction txn(db, Transaction::Mode::Read);

            Statement scans(db, "SELECT COUNT(*) FROM scans;");
            if (scans.step()) {
                s.scans = static_cast<uint64_t>(scans.columnInt64(0));
            }
            Statement files(db, "SELECT COUNT(*) FROM files;");
            if (files.step()) {
                s.files = static_cast<uint64_t>(files.columnInt64(0));
            }
            Statement matches(db, "SELECT match_id, payload FROM matches;");
            while (matches.step()) {
                core::ResolvedMatch m = openMatch(matches.columnText(0), matches.columnBlob(1));
                ++s.matches;
                ++s.byVerdict[m.verdict];
                ++s.byEntity[m.entityType];
            }
            txn.commit();
        }
        catch (const std::exception &ex) {
            recordFailure("stats_read", std::nullopt, failureCode(ex));
            throw;
        }
        record("stats_read", s.matches, std::nullopt);
        return s;
    }

    std::vector<core::AuditLogEntry> auditEntries() const
    {
        return audit_->readAll();
    }

    std::vector<core::AuditLogEntry> auditEntries(const AuditQuery &query) const
    {
        return audit_->query(query);
    }

    AuditStats auditStats() const
    {
        return audit_->stats();
    }

    const StoreSettings& settings() const { return settings_; }

private:
    static constexpr const char *kExportAad = "export:v1";
    static constexpr const char *kKeyCheckText = "sensiscan-key-check";

    StoreSettings settings_;
    RecordCipher cipher_;
    std::unique_ptr<AuditLog> audit_;
    mutable std::shared_mutex mutex_;

    SecureFindingsStore(StoreSettings settings, RecordCipher cipher, std::unique_ptr<AuditLog> audit)
        : settings_(std::move(settings)), cipher_(std::move(cipher)), audit_(std::move(audit))
    {
    }

    void initialize()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Database db(settings_.databasePath);
        db.exec("PRAGMA journal_mode=WAL;");
        db.exec("CREATE TABLE IF NOT EXISTS meta ("
                " name TEXT PRIMARY KEY,"
                " payload BLOB NOT NULL);"
                "CREATE TABLE IF NOT EXISTS scans ("
                " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
                " scan_id TEXT NOT NULL UNIQUE,"
                " payload BLOB NOT NULL);"
                "CREATE TABLE IF NOT EXISTS files ("
                " file_id TEXT PRIMARY KEY,"
                " scan_id TEXT NOT NULL,"
                " ordinal INTEGER NOT NULL,"
                " payload BLOB NOT NULL);"
                "CREATE TABLE IF NOT EXISTS matches ("
                " match_id TEXT PRIMARY KEY,"
                " file_id TEXT NOT NULL,"
                " scan_id TEXT NOT NULL,"
                " ordinal INTEGER NOT NULL,"
                " payload BLOB NOT NULL);"
                "CREATE INDEX IF NOT EXISTS idx_files_scan ON files(scan_id, ordinal);"
                "CREATE INDEX IF NOT EXISTS idx_matches_scan ON matches(scan_id);"
                "CREATE INDEX IF NOT EXISTS idx_matches_file ON matches(file_id, ordinal);");

        Transaction txn(db, Transaction::Mode::Write);
        Statement sel(db, "SELECT payload FROM meta WHERE name = 'key_check';");
        if (sel.step()) {
            std::vector<uint8_t> plain;
            try {
                plain = cipher_.open(sel.columnBlob(0), "meta:key_check");
            }
            catch (const core::StoreError &) {
                util::logger::error("SecureFindingsStore: key does not match " + settings_.databasePath);
                throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, "key_check");
            }
            if (std::string(plain.begin(), plain.end()) != kKeyCheckText) {
                throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, "key_check");
            }
        } else {
            std::string check = kKeyCheckText;
            Statement ins(db, "INSERT INTO meta (name, payload) VALUES ('key_check', ?);");
            ins.bind(1, cipher_.seal(std::vector<uint8_t>(check.begin(), check.end()), "meta:key_check"))
               .step();
        }
        txn.commit();
    }

    static std::string fileIdFor(const std::string &scanId, size_t fileOrdinal)
    {
        return util::hashing::shortDigest(scanId + "|file|" + std::to_string(fileOrdinal));
    }

    static std::string matchIdFor(const std::string &scanId, const std::string &path,
                                  size_t matchOrdinal, const core::ResolvedMatch &m)
    {
        return util::hashing::shortDigest(scanId + "|" + path + "|" + std::to_string(matchOrdinal) + "|"
                                          + std::to_string(m.span.start) + "|"
                                          + std::to_string(m.span.end) + "|"
                                          + core::toString(m.entityType));
    }

    std::vector<uint8_t> sealMatch(const std::string &matchId, const core::ResolvedMatch &m) const
    {
        return cipher_.seal(compress(encodeMatch(m)), "match:" + matchId);
    }

    core::ResolvedMatch openMatch(const std::string &matchId, const std::vector<uint8_t> &sealed) const
    {
        const std::string aad = "match:" + matchId;
        core::ResolvedMatch m = decodeMatch(decompress(cipher_.open(sealed, aad), aad), aad);
        m.matchId = matchId;
        return m;
    }

    ScanHeader openScanHeader(const std::string &scanId, const std::vector<uint8_t> &sealed) const
    {
        const std::string aad = "scan:" + scanId;
        return decodeScanHeader(decompress(cipher_.open(sealed, aad), aad), aad);
    }

    /// Open each payload of `table` with the current cipher and seal it again with `next`.
    uint64_t resealTable(Database &db, const RecordCipher &next, const std::string &table,
                         const std::string &idColumn, const std::string &aadPrefix) const
    {
        std::vector<std::pair<std::string, std::vector<uint8_t>>> resealed;
        const std::string selectSql = "SELECT " + idColumn + ", payload FROM " + table + ";";
        const std::string updateSql = "UPDATE " + table + " SET payload = ? WHERE " + idColumn + " = ?;";
        Statement sel(db, selectSql.c_str());
        while (sel.step()) {
            std::string id = sel.columnText(0);
            const std::string aad = aadPrefix + id;
            resealed.emplace_back(id, next.seal(cipher_.open(sel.columnBlob(1), aad), aad));
        }
        Statement upd(db, updateSql.c_str());
        for (const auto &row : resealed) {
            upd.bind(1, row.second).bind(2, row.first).step();
            upd.reset();
        }
        return resealed.size();
    }

    void requireScan(Database &db, const std::string &scanId) const
    {
        Statement sel(db, "SELECT 1 FROM scans WHERE scan_id = ?;");
        sel.bind(1, scanId);
        if (!sel.step()) {
            throw core::StoreError(core::ErrorCode::NotFound, scanId);
        }
    }

    /**
     * @brief Insert scan, file and match rows; assigns match ids in `rec`.
     * @return Rows written.
     */
    uint64_t insertScan(Database &db, core::ScanRecord &rec) const
    {
        Statement dup(db, "SELECT 1 FROM scans WHERE scan_id = ?;");
        dup.bind(1, rec.scanId);
        if (dup.step()) {
            throw core::StoreError(core::ErrorCode::DuplicateScan, rec.scanId);
        }

        ScanHeader header{rec.startedAt, rec.completedAt, rec.sourcePath};
        Statement insScan(db, "INSERT INTO scans (scan_id, payload) VALUES (?, ?);");
        insScan.bind(1, rec.scanId)
               .bind(2, cipher_.seal(compress(encodeScanHeader(header)), "scan:" + rec.scanId))
               .step();
        uint64_t rows = 1;

        Statement insFile(db, "INSERT INTO files (file_id, scan_id, ordinal, payload) VALUES (?, ?, ?, ?);");
        Statement insMatch(db, "INSERT INTO matches (match_id, file_id, scan_id, ordinal, payload)"
                               " VALUES (?, ?, ?, ?, ?);");
        for (size_t i = 0; i < rec.fileResults.size(); ++i) {
            core::FileResult &f = rec.fileResults[i];
            const std::string fileId = fileIdFor(rec.scanId, i);
            insFile.bind(1, fileId)
                   .bind(2, rec.scanId)
                   .bind(3, static_cast<int64_t>(i))
                   .bind(4, cipher_.seal(compress(encodeFileHeader(f)), "file:" + fileId))
                   .step();
            insFile.reset();
            ++rows;

            for (size_t j = 0; j < f.matches.size(); ++j) {
                core::ResolvedMatch &m = f.matches[j];
                m.matchId = matchIdFor(rec.scanId, f.path, j, m);
                insMatch.bind(1, m.matchId)
                        .bind(2, fileId)
                        .bind(3, rec.scanId)
                        .bind(4, static_cast<int64_t>(j))
                        .bind(5, sealMatch(m.matchId, m))
                        .step();
                insMatch.reset();
                ++rows;
            }
        }
        return rows;
    }

    core::ScanRecord readScan(Database &db, const std::string &scanId) const
    {
        Statement selScan(db, "SELECT payload FROM scans WHERE scan_id = ?;");
        selScan.bind(1, scanId);
        if (!selScan.step()) {
            throw core::StoreError(core::ErrorCode::NotFound, scanId);
        }
        ScanHeader header = openScanHeader(scanId, selScan.columnBlob(0));

        core::ScanRecord rec;
        rec.scanId = scanId;
        rec.startedAt = header.startedAt;
        rec.completedAt = header.completedAt;
        rec.sourcePath = header.sourcePath;

        Statement selFiles(db, "SELECT file_id, payload FROM files WHERE scan_id = ? ORDER BY ordinal;");
        Statement selMatches(db, "SELECT match_id, payload FROM matches WHERE file_id = ? ORDER BY ordinal;");
        selFiles.bind(1, scanId);
        while (selFiles.step()) {
            const std::string fileId = selFiles.columnText(0);
            const std::string aad = "file:" + fileId;
            core::FileResult f = decodeFileHeader(decompress(cipher_.open(selFiles.columnBlob(1), aad), aad), aad);

            selMatches.bind(1, fileId);
            while (selMatches.step()) {
                f.matches.push_back(openMatch(selMatches.columnText(0), selMatches.columnBlob(1)));
            }
            selMatches.reset();
            rec.fileResults.push_back(std::move(f));
        }
        return rec;
    }

    static core::ErrorCode failureCode(const std::exception &ex)
    {
        if (auto *se = dynamic_cast<const core::SensiScanError*>(&ex)) {
            return se->code();
        }
        return core::ErrorCode::TransactionFailed;
    }

    void record(const std::string &action, uint64_t count, const std::optional<std::string> &scanId) const
    {
        appendEntry(*audit_, settings_.actor, action, count, scanId, true, std::nullopt);
    }

    /**
     * @brief Append the success entry, then COMMIT. The entry is withdrawn
     *        if the COMMIT fails.
     * @throw core::StoreError from either step; the transaction is still open
     *        and rolls back when `txn` goes out of scope.
     */
    void commitAudited(Transaction &txn, const std::string &action, uint64_t count,
                       const std::optional<std::string> &scanId)
    {
        audit_->appendThenCommit(makeEntry(settings_.actor, action, count, scanId, true, std::nullopt),
                                 [&txn]() { txn.commit(); });
    }

    /// Audit a failed attempt. An audit write failure here is logged so the
    /// original error reaches the caller.
    void recordFailure(const std::string &action, const std::optional<std::string> &scanId,
                       core::ErrorCode code) const
    {
        appendFailure(*audit_, settings_.actor, action, scanId, code);
    }

    static void appendFailure(AuditLog &audit, const std::string &actor, const std::string &action,
                              const std::optional<std::string> &scanId, core::ErrorCode code)
    {
        try {
            appendEntry(audit, actor, action, 0, scanId, false, std::string(core::toString(code)));
        }
        catch (const core::StoreError &auditEx) {
            util::logger::critical("SecureFindingsStore: could not audit failed " + action + ": "
                                   + auditEx.what());
        }
    }

    static void appendEntry(AuditLog &audit, const std::string &actor, const std::string &action,
                            uint64_t count, const std::optional<std::string> &scanId, bool success,
                            const std::optional<std::string> &errorCode)
    {
        audit.append(makeEntry(actor, action, count, scanId, success, errorCode));
    }

    static core::AuditLogEntry makeEntry(const std::string &actor, const std::string &action,
                                         uint64_t count, const std::optional<std::string> &scanId,
                                         bool success, const std::optional<std::string> &errorCode)
    {
        core::AuditLogEntry e;
        e.timestamp = util::Clock::now();
        e.action = action;
        e.actor = actor;
        e.affectedRecordCount = count;
        e.scanId = scanId;
        e.success = success;
        e.errorCode = errorCode;
        return e;
    }
};

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_FINDINGS_STORE_HPP
