#ifndef SENSISCAN_UTIL_HASHING_HPP
#define SENSISCAN_UTIL_HASHING_HPP

#include <algorithm>
#include <string>
#include <stdexcept>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used to derive scan and match identifiers.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   using namespace sensiscan::util::hashing;
 *   std::string id = sha256Hex("some/path|1700000000");
 *   std::string shortId = shortDigest("some/path|1700000000", 16);
 *   @endcode
 */

namespace sensiscan {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of a byte range.
 */
inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

inline std::string toHex(const std::vector<uint8_t> &bytes)
{
    return toHex(bytes.data(), bytes.size());
}

/**
 * @brief Decode a hex string (either case). Throws on odd length or bad digit.
 */
inline std::vector<uint8_t> fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0) {
        throw std::runtime_error("hashing::fromHex: odd-length input.");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("hashing::fromHex: invalid hex digit.");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Compute SHA-256 of a string via the EVP interface, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Hex: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    return toHex(hash, hashLen);
}

/**
 * @brief First `hexChars` characters of the SHA-256 hex digest.
 */
inline std::string shortDigest(const std::string &input, size_t hexChars = 16)
{
    std::string full = sha256Hex(input);
    return full.substr(0, std::min(hexChars, full.size()));
}

} // namespace hashing
} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_HASHING_HPP
