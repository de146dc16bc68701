#ifndef SENSISCAN_STORAGE_CIPHER_HPP
#define SENSISCAN_STORAGE_CIPHER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include "core/errors.hpp"
#include "storage/key_provider.hpp"

/**
 * @file cipher.hpp
 * @brief AES-256-GCM sealing of store payloads.
 *
 * Sealed layout:
 *   [1 byte version = 1][12 byte nonce][ciphertext][16 byte tag]
 *
 * Every seal() uses a fresh random nonce. The caller passes associated data
 * (the row identity) so a payload cannot be moved to another row.
 * Authentication failure surfaces as StoreError(corrupt_record).
 */

namespace sensiscan {
namespace storage {

class RecordCipher
{
public:
    static constexpr uint8_t kVersion = 1;
    static constexpr size_t kNonceBytes = 12;
    static constexpr size_t kTagBytes = 16;

    explicit RecordCipher(KeyMaterial key)
        : key_(std::move(key))
    {
        if (key_.size() != kKeyBytes) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, "cipher");
        }
    }

    std::vector<uint8_t> seal(const std::vector<uint8_t> &plain, const std::string &aad) const
    {
        std::vector<uint8_t> out(1 + kNonceBytes + plain.size() + kTagBytes);
        out[0] = kVersion;
        uint8_t *nonce = out.data() + 1;
        if (RAND_bytes(nonce, static_cast<int>(kNonceBytes)) != 1) {
            throw core::StoreError(core::ErrorCode::TransactionFailed, "nonce generation");
        }

        CipherCtx ctx;
        int len = 0;
        uint8_t *ct = nonce + kNonceBytes;
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
            || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) != 1
            || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1
            || EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const uint8_t*>(aad.data()),
                                 static_cast<int>(aad.size())) != 1
            || EVP_EncryptUpdate(ctx.get(), ct, &len, plain.data(), static_cast<int>(plain.size())) != 1)
        {
            throw core::StoreError(core::ErrorCode::TransactionFailed, "encrypt");
        }
        int total = len;
        if (EVP_EncryptFinal_ex(ctx.get(), ct + total, &len) != 1) {
            throw core::StoreError(core::ErrorCode::TransactionFailed, "encrypt");
        }
        total += len;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes),
                                ct + total) != 1) {
            throw core::StoreError(core::ErrorCode::TransactionFailed, "encrypt");
        }
        return out;
    }

    /**
     * @throw core::StoreError(corrupt_record) on truncation, unknown version
     *        or authentication failure.
     */
    std::vector<uint8_t> open(const std::vector<uint8_t> &sealed, const std::string &aad) const
    {
        if (sealed.size() < 1 + kNonceBytes + kTagBytes || sealed[0] != kVersion) {
            throw core::StoreError(core::ErrorCode::CorruptRecord, aad);
        }
        const uint8_t *nonce = sealed.data() + 1;
        const uint8_t *ct = nonce + kNonceBytes;
        const size_t ctLen = sealed.size() - 1 - kNonceBytes - kTagBytes;
        std::vector<uint8_t> tag(ct + ctLen, ct + ctLen + kTagBytes);
        std::vector<uint8_t> plain(ctLen);

        CipherCtx ctx;
        int len = 0;
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
            || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) != 1
            || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1
            || EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const uint8_t*>(aad.data()),
                                 static_cast<int>(aad.size())) != 1
            || EVP_DecryptUpdate(ctx.get(), plain.data(), &len, ct, static_cast<int>(ctLen)) != 1
            || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes),
                                   tag.data()) != 1)
        {
            throw core::StoreError(core::ErrorCode::CorruptRecord, aad);
        }
        int total = len;
        if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
            throw core::StoreError(core::ErrorCode::CorruptRecord, aad);
        }
        total += len;
        plain.resize(static_cast<size_t>(total));
        return plain;
    }

private:
    struct CipherCtx
    {
        CipherCtx() : ctx_(EVP_CIPHER_CTX_new())
        {
            if (!ctx_) {
                throw core::StoreError(core::ErrorCode::TransactionFailed, "EVP_CIPHER_CTX_new");
            }
        }
        ~CipherCtx() { EVP_CIPHER_CTX_free(ctx_); }
        CipherCtx(const CipherCtx &) = delete;
        CipherCtx& operator=(const CipherCtx &) = delete;

        EVP_CIPHER_CTX* get() { return ctx_; }

        EVP_CIPHER_CTX *ctx_;
    };

    KeyMaterial key_;
};

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_CIPHER_HPP
