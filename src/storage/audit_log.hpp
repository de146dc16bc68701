#ifndef SENSISCAN_STORAGE_AUDIT_LOG_HPP
#define SENSISCAN_STORAGE_AUDIT_LOG_HPP

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "util/json_text.hpp"
#include "util/logger.hpp"
#include "util/time_format.hpp"

/**
 * @file audit_log.hpp
 * @brief Append-only JSON-lines audit trail of store access.
 *
 * One line per entry:
 *   {"timestamp":"...","action":"scan_purge","actor":"alice",
 *    "affected_record_count":12,"scan_id":"9f2c...","success":true,"error_code":null}
 *
 * Entries carry ids and counts only. Lines are flushed as they are written.
 * There is no delete or rewrite operation. appendThenCommit() withdraws
 * the line it just wrote when the commit it guards fails.
 */

namespace sensiscan {
namespace storage {

/// Filters for AuditLog::query(). Unset fields match everything.
struct AuditQuery
{
    std::optional<util::TimePoint> since;       ///< entries at or after this time
    std::optional<std::string> action;
    std::optional<std::string> scanId;
    size_t limit = 1000;
};

struct AuditStats
{
    uint64_t total = 0;
    uint64_t failures = 0;
    std::map<std::string, uint64_t> byAction;
    std::map<std::string, uint64_t> byActor;
    std::optional<util::TimePoint> first;
    std::optional<util::TimePoint> last;
};

class AuditLog
{
public:
    explicit AuditLog(std::string path)
        : path_(std::move(path))
    {
    }

    const std::string& path() const { return path_; }

    /**
     * @throw core::StoreError(transaction_failed) if the line cannot be written.
     */
    void append(const core::AuditLogEntry &entry)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        appendLocked(entry);
    }

    /**
     * @brief Append `entry`, then run `commit` with the log still locked.
     *
     * If `commit` throws core::StoreError the entry is truncated away before
     * the error propagates. Holding the lock keeps other writers of this log
     * from landing a line inside the window that would be truncated.
     * @throw core::StoreError from the append or from `commit`.
     */
    template<typename Commit>
    void appendThenCommit(const core::AuditLogEntry &entry, Commit &&commit)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t prior = appendLocked(entry);
        try {
            commit();
        }
        catch (const core::StoreError &) {
            try {
                truncateLocked(prior);
            }
            catch (const core::StoreError &truncEx) {
                util::logger::critical("AuditLog: could not withdraw " + entry.action
                                       + " entry after a failed commit: " + truncEx.what());
            }
            throw;
        }
    }

    /**
     * @brief All entries in write order. A missing file is an empty log.
     */
    std::vector<core::AuditLogEntry> readAll() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::AuditLogEntry> entries;
        std::ifstream in(path_);
        if (!in.is_open()) {
            return entries;
        }
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                entries.push_back(fromJsonLine(line));
            }
            catch (const std::exception &ex) {
                util::logger::error("AuditLog: skipping malformed line " + std::to_string(lineNo)
                                    + ": " + ex.what());
            }
        }
        return entries;
    }

    /**
     * @brief Entries in write order that pass every set filter, at most
     *        `q.limit` of them.
     */
    std::vector<core::AuditLogEntry> query(const AuditQuery &q) const
    {
        std::vector<core::AuditLogEntry> out;
        if (q.limit == 0) {
            return out;
        }
        for (auto &e : readAll()) {
            if (q.since && e.timestamp < *q.since) {
                continue;
            }
            if (q.action && e.action != *q.action) {
                continue;
            }
            if (q.scanId && e.scanId != q.scanId) {
                continue;
            }
            out.push_back(std::move(e));
            if (out.size() >= q.limit) {
                break;
            }
        }
        return out;
    }

    AuditStats stats() const
    {
        AuditStats s;
        for (const auto &e : readAll()) {
            ++s.total;
            if (!e.success) {
                ++s.failures;
            }
            ++s.byAction[e.action];
            ++s.byActor[e.actor];
            if (!s.first) {
                s.first = e.timestamp;
            }
            s.last = e.timestamp;
        }
        return s;
    }

    static std::string toJsonLine(const core::AuditLogEntry &e)
    {
        using util::json::quote;
        std::ostringstream oss;
        oss << "{\"timestamp\":" << quote(util::toIso8601(e.timestamp))
            << ",\"action\":" << quote(e.action)
            << ",\"actor\":" << quote(e.actor)
            << ",\"affected_record_count\":" << e.affectedRecordCount
            << ",\"scan_id\":" << (e.scanId ? quote(*e.scanId) : "null")
            << ",\"success\":" << (e.success ? "true" : "false")
            << ",\"error_code\":" << (e.errorCode ? quote(*e.errorCode) : "null")
            << "}";
        return oss.str();
    }

    static core::AuditLogEntry fromJsonLine(const std::string &line)
    {
        auto fields = util::json::parseFlatObject(line);
        core::AuditLogEntry e;
        e.timestamp = util::fromIso8601(fields.at("timestamp").text);
        e.action = fields.at("action").text;
        e.actor = fields.at("actor").text;
        e.affectedRecordCount = static_cast<uint64_t>(fields.at("affected_record_count").asNumber());
        auto sid = fields.find("scan_id");
        if (sid != fields.end() && !sid->second.isNull()) {
            e.scanId = sid->second.text;
        }
        e.success = fields.at("success").asBool();
        auto ec = fields.find("error_code");
        if (ec != fields.end() && !ec->second.isNull()) {
            e.errorCode = ec->second.text;
        }
        return e;
    }

private:
    std::string path_;
    mutable std::mutex mutex_;

    /// @return Size in bytes before the append.
    uint64_t appendLocked(const core::AuditLogEntry &entry)
    {
        const uint64_t prior = currentSize();
        std::ofstream out(path_, std::ios::app);
        if (!out.is_open()) {
            util::logger::critical("AuditLog: cannot open " + path_);
            throw core::StoreError(core::ErrorCode::TransactionFailed, "audit_log");
        }
        out << toJsonLine(entry) << '\n';
        out.flush();
        if (!out) {
            out.close();
            truncateLocked(prior);
            util::logger::critical("AuditLog: write failed on " + path_);
            throw core::StoreError(core::ErrorCode::TransactionFailed, "audit_log");
        }
        return prior;
    }

    uint64_t currentSize() const
    {
        std::error_code ec;
        auto n = std::filesystem::file_size(path_, ec);
        return ec ? 0 : static_cast<uint64_t>(n);
    }

    void truncateLocked(uint64_t size)
    {
        std::error_code ec;
        std::filesystem::resize_file(path_, size, ec);
        if (ec) {
            util::logger::critical("AuditLog: truncate failed on " + path_ + ": " + ec.message());
            throw core::StoreError(core::ErrorCode::TransactionFailed, "audit_log");
        }
    }
};

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_AUDIT_LOG_HPP
