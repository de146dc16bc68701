#ifndef SENSISCAN_STORAGE_SQLITE_DB_HPP
#define SENSISCAN_STORAGE_SQLITE_DB_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "core/errors.hpp"
#include "util/logger.hpp"

/**
 * @file sqlite_db.hpp
 * @brief Thin RAII wrappers over the sqlite3 C API: a connection, a prepared
 *        statement and a transaction scope that rolls back unless committed.
 *
 * Every failure throws StoreError(transaction_failed). Bound values never
 * appear in error text.
 */

namespace sensiscan {
namespace storage {

class Database
{
public:
    explicit Database(const std::string &path)
        : path_(path)
    {
        int rc = sqlite3_open_v2(path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK || db_ == nullptr) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            util::logger::error("Database: could not open " + path + ": " + msg);
            throw core::StoreError(core::ErrorCode::TransactionFailed, "open");
        }
        sqlite3_busy_timeout(db_, 5000);
        // Per connection: the pragma does not persist in the file.
        if (sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            util::logger::error("Database: could not configure " + path + ": " + msg);
            throw core::StoreError(core::ErrorCode::TransactionFailed, "open");
        }
    }

    ~Database()
    {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    Database(const Database &) = delete;
    Database& operator=(const Database &) = delete;

    sqlite3* handle() const { return db_; }

    void exec(const std::string &sql)
    {
        char *errMsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string msg = errMsg ? errMsg : sqlite3_errmsg(db_);
            if (errMsg) {
                sqlite3_free(errMsg);
            }
            util::logger::error("Database: exec failed: " + msg);
            throw core::StoreError(core::ErrorCode::TransactionFailed, msg);
        }
    }

    /// Rows changed by the most recent statement.
    int64_t changes() const { return sqlite3_changes(db_); }

private:
    std::string path_;
    sqlite3 *db_ = nullptr;
};

class Statement
{
public:
    Statement(Database &db, const char *sql)
        : db_(db.handle())
    {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK || !stmt_) {
            std::string msg = sqlite3_errmsg(db_);
            util::logger::error("Statement: prepare failed: " + msg);
            throw core::StoreError(core::ErrorCode::TransactionFailed, msg);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement &) = delete;
    Statement& operator=(const Statement &) = delete;

    Statement& bind(int idx, const std::string &text)
    {
        check(sqlite3_bind_text(stmt_, idx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int idx, const std::vector<uint8_t> &blob)
    {
        check(sqlite3_bind_blob(stmt_, idx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int idx, int64_t value)
    {
        check(sqlite3_bind_int64(stmt_, idx, value));
        return *this;
    }

    /**
     * @return true if a row is available, false when done.
     */
    bool step()
    {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        std::string msg = sqlite3_errmsg(db_);
        util::logger::error("Statement: step failed: " + msg);
        throw core::StoreError(core::ErrorCode::TransactionFailed, msg);
    }

    void reset()
    {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string columnText(int col) const
    {
        const unsigned char *p = sqlite3_column_text(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p),
                               static_cast<size_t>(sqlite3_column_bytes(stmt_, col)))
                 : std::string();
    }

    std::vector<uint8_t> columnBlob(int col) const
    {
        const void *p = sqlite3_column_blob(stmt_, col);
        int n = sqlite3_column_bytes(stmt_, col);
        if (!p || n <= 0) {
            return {};
        }
        const uint8_t *b = static_cast<const uint8_t*>(p);
        return std::vector<uint8_t>(b, b + n);
    }

    int64_t columnInt64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3 *db_;
    sqlite3_stmt *stmt_ = nullptr;

    void check(int rc)
    {
        if (rc != SQLITE_OK) {
            throw core::StoreError(core::ErrorCode::TransactionFailed, sqlite3_errmsg(db_));
        }
    }
};

/**
 * @class Transaction
 * @brief BEGIN on construction, ROLLBACK on destruction unless commit() ran.
 */
class Transaction
{
public:
    enum class Mode { Read, Write };

    Transaction(Database &db, Mode mode)
        : db_(db)
    {
        db_.exec(mode == Mode::Write ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
        open_ = true;
    }

    ~Transaction()
    {
        if (open_) {
            int rc = sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
            if (rc != SQLITE_OK) {
                util::logger::error("Transaction: rollback failed: "
                                    + std::string(sqlite3_errmsg(db_.handle())));
            }
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction& operator=(const Transaction &) = delete;

    void commit()
    {
        db_.exec("COMMIT;");
        open_ = false;
    }

private:
    Database &db_;
    bool open_ = false;
};

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_SQLITE_DB_HPP
