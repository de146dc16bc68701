#ifndef SENSISCAN_CORE_ERRORS_HPP
#define SENSISCAN_CORE_ERRORS_HPP

#include <string>
#include <stdexcept>

/**
 * @file errors.hpp
 * @brief Structured error taxonomy.
 *
 * Every error carries a kind and a machine-actionable code; `detail` is an
 * optional identifier (detector name, scan id, file path) and never contains
 * a matched value.
 *
 * File- and match-scoped failures are recorded as a ScanError on the
 * FileResult. Store and review failures are thrown as SensiScanError
 * subclasses after the failing transaction has been rolled back.
 */

namespace sensiscan {
namespace core {

enum class ErrorKind {
    Extraction,
    Detector,
    Store,
    ReviewTransaction,
    KeyUnavailable
};

enum class ErrorCode {
    Unsupported,
    Oversized,
    Unreadable,
    Timeout,
    DetectorFailed,
    TransactionFailed,
    DuplicateScan,
    NotFound,
    CorruptRecord,
    LedgerWriteFailed,
    InvalidState,
    KeyMissing,
    KeyInvalid
};

inline const char* toString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Extraction:        return "extraction";
    case ErrorKind::Detector:          return "detector";
    case ErrorKind::Store:             return "store";
    case ErrorKind::ReviewTransaction: return "review_transaction";
    case ErrorKind::KeyUnavailable:    return "key_unavailable";
    }
    return "store";
}

inline const char* toString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Unsupported:       return "unsupported";
    case ErrorCode::Oversized:         return "oversized";
    case ErrorCode::Unreadable:        return "unreadable";
    case ErrorCode::Timeout:           return "timeout";
    case ErrorCode::DetectorFailed:    return "detector_failed";
    case ErrorCode::TransactionFailed: return "transaction_failed";
    case ErrorCode::DuplicateScan:     return "duplicate_scan";
    case ErrorCode::NotFound:          return "not_found";
    case ErrorCode::CorruptRecord:     return "corrupt_record";
    case ErrorCode::LedgerWriteFailed: return "ledger_write_failed";
    case ErrorCode::InvalidState:      return "invalid_state";
    case ErrorCode::KeyMissing:        return "key_missing";
    case ErrorCode::KeyInvalid:        return "key_invalid";
    }
    return "transaction_failed";
}

/**
 * @struct ScanError
 * @brief A kind, a code and an optional detail string.
 */
struct ScanError
{
    ErrorKind kind;
    ErrorCode code;
    std::string detail;

    ScanError(ErrorKind k, ErrorCode c, std::string d = "")
        : kind(k), code(c), detail(std::move(d))
    {
    }

    /// "kind/code" or "kind/code: detail"
    std::string describe() const
    {
        std::string text = std::string(toString(kind)) + "/" + toString(code);
        if (!detail.empty()) {
            text += ": " + detail;
        }
        return text;
    }

    bool operator==(const ScanError &other) const
    {
        return kind == other.kind && code == other.code && detail == other.detail;
    }
};

/**
 * @class SensiScanError
 * @brief Base exception; what() is ScanError::describe().
 */
class SensiScanError : public std::runtime_error
{
public:
    explicit SensiScanError(ScanError error)
        : std::runtime_error(error.describe()), error_(std::move(error))
    {
    }

    const ScanError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    ScanError error_;
};

class StoreError : public SensiScanError
{
public:
    explicit StoreError(ErrorCode code, std::string detail = "")
        : SensiScanError(ScanError(ErrorKind::Store, code, std::move(detail)))
    {
    }
};

class ReviewTransactionError : public SensiScanError
{
public:
    explicit ReviewTransactionError(ErrorCode code, std::string detail = "")
        : SensiScanError(ScanError(ErrorKind::ReviewTransaction, code, std::move(detail)))
    {
    }
};

class KeyUnavailableError : public SensiScanError
{
public:
    explicit KeyUnavailableError(ErrorCode code, std::string detail = "")
        : SensiScanError(ScanError(ErrorKind::KeyUnavailable, code, std::move(detail)))
    {
    }
};

} // namespace core
} // namespace sensiscan

#endif // SENSISCAN_CORE_ERRORS_HPP
