#ifndef SENSISCAN_STORAGE_RECORD_CODEC_HPP
#define SENSISCAN_STORAGE_RECORD_CODEC_HPP

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include <zlib.h>
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "util/time_format.hpp"

/**
 * @file record_codec.hpp
 * @brief Length-prefixed binary encoding of store payloads, plus zlib framing.
 *
 * DESIGN GOALS:
 *   - Integers are little-endian, strings and blobs are u32-length-prefixed,
 *     optionals carry a one-byte presence flag.
 *   - Each payload starts with a one-byte record tag so a payload decoded as
 *     the wrong record type fails loudly.
 *   - Malformed input raises StoreError(corrupt_record), never UB.
 *   - compress()/decompress() prefix the original size so decompression
 *     allocates exactly once.
 */

namespace sensiscan {
namespace storage {

enum class RecordTag : uint8_t {
    ScanHeader = 0x51,
    FileHeader = 0x46,
    Match      = 0x4D,
    Export     = 0x45,
    KeyCheck   = 0x4B
};

class ByteWriter
{
public:
    void u8(uint8_t v) { buf_.push_back(v); }

    void u32(uint32_t v)
    {
        for (int i = 0; i < 4; ++i) {
            buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void u64(uint64_t v)
    {
        for (int i = 0; i < 8; ++i) {
            buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

    void f64(double v)
    {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u64(bits);
    }

    void boolean(bool v) { u8(v ? 1 : 0); }

    void str(const std::string &s)
    {
        u32(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    void optStr(const std::optional<std::string> &s)
    {
        boolean(s.has_value());
        if (s) {
            str(*s);
        }
    }

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

class ByteReader
{
public:
    ByteReader(const std::vector<uint8_t> &buf, std::string context)
        : buf_(buf), context_(std::move(context))
    {
    }

    uint8_t u8()
    {
        need(1);
        return buf_[pos_++];
    }

    uint32_t u32()
    {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(buf_[pos_++]) << (8 * i);
        }
        return v;
    }

    uint64_t u64()
    {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(buf_[pos_++]) << (8 * i);
        }
        return v;
    }

    int64_t i64() { return static_cast<int64_t>(u64()); }

    double f64()
    {
        uint64_t bits = u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    bool boolean()
    {
        uint8_t b = u8();
        if (b > 1) {
            fail();
        }
        return b == 1;
    }

    std::string str()
    {
        uint32_t len = u32();
        need(len);
        std::string s(reinterpret_cast<const char*>(buf_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    std::optional<std::string> optStr()
    {
        if (!boolean()) {
            return std::nullopt;
        }
        return str();
    }

    void expectTag(RecordTag tag)
    {
        if (u8() != static_cast<uint8_t>(tag)) {
            fail();
        }
    }

    void expectEnd()
    {
        if (pos_ != buf_.size()) {
            fail();
        }
    }

    [[noreturn]] void fail() const
    {
        throw core::StoreError(core::ErrorCode::CorruptRecord, context_);
    }

private:
    const std::vector<uint8_t> &buf_;
    std::string context_;
    size_t pos_ = 0;

    void need(size_t n) const
    {
        if (buf_.size() - pos_ < n) {
            fail();
        }
    }
};

// ----------------------------------------------------------------------------
// zlib framing
// ----------------------------------------------------------------------------

inline std::vector<uint8_t> compress(const std::vector<uint8_t> &raw)
{
    uLongf outSize = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> out(4 + outSize);
    uint32_t n = static_cast<uint32_t>(raw.size());
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(n >> (8 * i));
    }
    if (compress2(out.data() + 4, &outSize, raw.data(), static_cast<uLong>(raw.size()),
                  Z_BEST_COMPRESSION) != Z_OK) {
        throw core::StoreError(core::ErrorCode::TransactionFailed, "compress");
    }
    out.resize(4 + outSize);
    return out;
}

inline std::vector<uint8_t> decompress(const std::vector<uint8_t> &framed, const std::string &context)
{
    if (framed.size() < 4) {
        throw core::StoreError(core::ErrorCode::CorruptRecord, context);
    }
    uint32_t n = 0;
    for (int i = 0; i < 4; ++i) {
        n |= static_cast<uint32_t>(framed[i]) << (8 * i);
    }
    std::vector<uint8_t> out(n);
    uLongf outSize = n;
    int rc = uncompress(out.data(), &outSize, framed.data() + 4, static_cast<uLong>(framed.size() - 4));
    if (rc != Z_OK || outSize != n) {
        throw core::StoreError(core::ErrorCode::CorruptRecord, context);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Record payloads
// ----------------------------------------------------------------------------

struct ScanHeader
{
    util::TimePoint startedAt;
    std::optional<util::TimePoint> completedAt;
    std::string sourcePath;
};

namespace detail {

inline void writeError(ByteWriter &w, const std::optional<core::ScanError> &err)
{
    w.boolean(err.has_value());
    if (err) {
        w.u8(static_cast<uint8_t>(err->kind));
        w.u8(static_cast<uint8_t>(err->code));
        w.str(err->detail);
    }
}

inline std::optional<core::ScanError> readError(ByteReader &r)
{
    if (!r.boolean()) {
        return std::nullopt;
    }
    uint8_t kind = r.u8();
    uint8_t code = r.u8();
    if (kind > static_cast<uint8_t>(core::ErrorKind::KeyUnavailable)
        || code > static_cast<uint8_t>(core::ErrorCode::KeyInvalid)) {
        r.fail();
    }
    std::string detail = r.str();
    return core::ScanError(static_cast<core::ErrorKind>(kind), static_cast<core::ErrorCode>(code),
                           std::move(detail));
}

inline void writeFileBody(ByteWriter &w, const core::FileResult &f)
{
    w.str(f.path);
    w.u64(f.sizeBytes);
    w.boolean(f.labelRecommendation.has_value());
    if (f.labelRecommendation) {
        w.u8(static_cast<uint8_t>(*f.labelRecommendation));
    }
    writeError(w, f.error);
    w.i64(f.scanTimeMs);
}

inline core::FileResult readFileBody(ByteReader &r)
{
    core::FileResult f;
    f.path = r.str();
    f.sizeBytes = r.u64();
    if (r.boolean()) {
        uint8_t label = r.u8();
        if (label > static_cast<uint8_t>(core::LabelRecommendation::HighlyConfidential)) {
            r.fail();
        }
        f.labelRecommendation = static_cast<core::LabelRecommendation>(label);
    }
    f.error = readError(r);
    f.scanTimeMs = r.i64();
    return f;
}

inline void writeMatchBody(ByteWriter &w, const core::ResolvedMatch &m)
{
    w.u8(static_cast<uint8_t>(m.entityType));
    w.str(m.redactedValue);
    w.f64(m.finalConfidence);
    w.u8(static_cast<uint8_t>(m.contributingSources.size()));
    for (auto s : m.contributingSources) {
        w.u8(static_cast<uint8_t>(s));
    }
    w.boolean(m.isTestData);
    w.u8(static_cast<uint8_t>(m.verdict));
    w.optStr(m.modelVersion);
    w.u64(m.span.start);
    w.u64(m.span.end);
    w.u64(m.span.line);
    w.str(m.contextSnippet);
}

inline core::ResolvedMatch readMatchBody(ByteReader &r)
{
    core::ResolvedMatch m;
    uint8_t type = r.u8();
    if (type >= core::kAllEntityTypes.size()) {
        r.fail();
    }
    m.entityType = static_cast<core::EntityType>(type);
    m.redactedValue = r.str();
    m.finalConfidence = r.f64();
    uint8_t nSources = r.u8();
    for (uint8_t i = 0; i < nSources; ++i) {
        uint8_t s = r.u8();
        if (s > static_cast<uint8_t>(core::DetectorSource::Classifier)) {
            r.fail();
        }
        m.contributingSources.insert(static_cast<core::DetectorSource>(s));
    }
    m.isTestData = r.boolean();
    uint8_t verdict = r.u8();
    if (verdict > static_cast<uint8_t>(core::Verdict::Skipped)) {
        r.fail();
    }
    m.verdict = static_cast<core::Verdict>(verdict);
    m.modelVersion = r.optStr();
    m.span.start = static_cast<size_t>(r.u64());
    m.span.end = static_cast<size_t>(r.u64());
    m.span.line = static_cast<size_t>(r.u64());
    m.contextSnippet = r.str();
    return m;
}

} // namespace detail

inline std::vector<uint8_t> encodeScanHeader(const ScanHeader &h)
{
    ByteWriter w;
    w.u8(static_cast<uint8_t>(RecordTag::ScanHeader));
    w.i64(util::toEpochMillis(h.startedAt));
    w.boolean(h.completedAt.has_value());
    if (h.completedAt) {
        w.i64(util::toEpochMillis(*h.completedAt));
    }
    w.str(h.sourcePath);
    return w.take();
}

inline ScanHeader decodeScanHeader(const std::vector<uint8_t> &buf, const std::string &context)
{
    ByteReader r(buf, context);
    r.expectTag(RecordTag::ScanHeader);
    ScanHeader h;
    h.startedAt = util::fromEpochMillis(r.i64());
    if (r.boolean()) {
        h.completedAt = util::fromEpochMillis(r.i64());
    }
    h.sourcePath = r.str();
    r.expectEnd();
    return h;
}

/// File payload without its matches (those are separate rows).
inline std::vector<uint8_t> encodeFileHeader(const core::FileResult &f)
{
    ByteWriter w;
    w.u8(static_cast<uint8_t>(RecordTag::FileHeader));
    detail::writeFileBody(w, f);
    return w.take();
}

inline core::FileResult decodeFileHeader(const std::vector<uint8_t> &buf, const std::string &context)
{
    ByteReader r(buf, context);
    r.expectTag(RecordTag::FileHeader);
    core::FileResult f = detail::readFileBody(r);
    r.expectEnd();
    return f;
}

/// Match payload; the match id is the row key and is not encoded.
inline std::vector<uint8_t> encodeMatch(const core::ResolvedMatch &m)
{
    ByteWriter w;
    w.u8(static_cast<uint8_t>(RecordTag::Match));
    detail::writeMatchBody(w, m);
    return w.take();
}

inline core::ResolvedMatch decodeMatch(const std::vector<uint8_t> &buf, const std::string &context)
{
    ByteReader r(buf, context);
    r.expectTag(RecordTag::Match);
    core::ResolvedMatch m = detail::readMatchBody(r);
    r.expectEnd();
    return m;
}

/**
 * @brief Whole-scan encoding used by export bundles. Match ids are dropped.
 */
inline std::vector<uint8_t> encodeScanRecord(const core::ScanRecord &rec)
{
    ByteWriter w;
    w.u8(static_cast<uint8_t>(RecordTag::Export));
    w.str(rec.scanId);
    w.i64(util::toEpochMillis(rec.startedAt));
    w.boolean(rec.completedAt.has_value());
    if (rec.completedAt) {
        w.i64(util::toEpochMillis(*rec.completedAt));
    }
    w.str(rec.sourcePath);
    w.u32(static_cast<uint32_t>(rec.fileResults.size()));
    for (const auto &f : rec.fileResults) {
        detail::writeFileBody(w, f);
        w.u32(static_cast<uint32_t>(f.matches.size()));
        for (const auto &m : f.matches) {
            detail::writeMatchBody(w, m);
        }
    }
    return w.take();
}

inline core::ScanRecord decodeScanRecord(const std::vector<uint8_t> &buf, const std::string &context)
{
    ByteReader r(buf, context);
    r.expectTag(RecordTag::Export);
    core::ScanRecord rec;
    rec.scanId = r.str();
    rec.startedAt = util::fromEpochMillis(r.i64());
    if (r.boolean()) {
        rec.completedAt = util::fromEpochMillis(r.i64());
    }
    rec.sourcePath = r.str();
    uint32_t nFiles = r.u32();
    for (uint32_t i = 0; i < nFiles; ++i) {
        core::FileResult f = detail::readFileBody(r);
        uint32_t nMatches = r.u32();
        for (uint32_t j = 0; j < nMatches; ++j) {
            f.matches.push_back(detail::readMatchBody(r));
        }
        rec.fileResults.push_back(std::move(f));
    }
    r.expectEnd();
    return rec;
}

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_RECORD_CODEC_HPP
