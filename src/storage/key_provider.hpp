#ifndef SENSISCAN_STORAGE_KEY_PROVIDER_HPP
#define SENSISCAN_STORAGE_KEY_PROVIDER_HPP

#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>
#include <curl/curl.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include "config/scan_config.hpp"
#include "core/errors.hpp"
#include "util/hashing.hpp"
#include "util/json_text.hpp"
#include "util/logger.hpp"

/**
 * @file key_provider.hpp
 * @brief Retrieval of the 256-bit key that seals the findings store.
 *
 * DESIGN GOALS:
 *   - One opaque call, retrieveKey(), returns the key or throws
 *     KeyUnavailableError (key_missing / key_invalid).
 *   - FileKeyProvider: a key file readable by its owner only. It can create
 *     the file with a fresh random key on first use, and stage a
 *     replacement key for rotation.
 *   - HttpKeyProvider: HTTPS GET against a vault endpoint, bearer token read
 *     from an environment variable at call time.
 *   - StaticKeyProvider: an in-memory key for tests and embedding.
 *   - Key bytes are wiped on destruction and never logged. describe() names
 *     the source only.
 */

namespace sensiscan {
namespace storage {

constexpr size_t kKeyBytes = 32;

/**
 * @class KeyMaterial
 * @brief Owns key bytes; cleansed on destruction.
 */
class KeyMaterial
{
public:
    explicit KeyMaterial(std::vector<uint8_t> bytes)
        : bytes_(std::move(bytes))
    {
    }

    KeyMaterial(const KeyMaterial &) = default;
    KeyMaterial(KeyMaterial &&) = default;

    // Assignment wipes the bytes being replaced.
    KeyMaterial& operator=(const KeyMaterial &other)
    {
        if (this != &other) {
            wipe();
            bytes_ = other.bytes_;
        }
        return *this;
    }

    KeyMaterial& operator=(KeyMaterial &&other) noexcept
    {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
        }
        return *this;
    }

    ~KeyMaterial() { wipe(); }

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;

    void wipe()
    {
        if (!bytes_.empty()) {
            OPENSSL_cleanse(bytes_.data(), bytes_.size());
        }
    }
};

class KeyProvider
{
public:
    virtual ~KeyProvider() = default;

    /// Where the key comes from, for logs and audit context. Never the key.
    virtual std::string describe() const = 0;

    /**
     * @throw core::KeyUnavailableError
     */
    virtual KeyMaterial retrieveKey() const = 0;

protected:
    /**
     * @brief Accept 32 raw bytes or 64 hex characters (surrounding whitespace ignored).
     */
    static KeyMaterial parseKeyText(const std::string &text, const std::string &source)
    {
        if (text.size() == kKeyBytes) {
            return KeyMaterial(std::vector<uint8_t>(text.begin(), text.end()));
        }
        std::string trimmed;
        for (char c : text) {
            if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
                trimmed.push_back(c);
            }
        }
        if (trimmed.size() == kKeyBytes * 2) {
            try {
                return KeyMaterial(util::hashing::fromHex(trimmed));
            }
            catch (const std::exception &) {
                throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, source);
            }
        }
        throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, source);
    }
};

/**
 * @class StaticKeyProvider
 */
class StaticKeyProvider : public KeyProvider
{
public:
    explicit StaticKeyProvider(std::vector<uint8_t> key)
        : key_(std::move(key))
    {
    }

    std::string describe() const override { return "static"; }

    KeyMaterial retrieveKey() const override
    {
        if (key_.empty()) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        if (key_.size() != kKeyBytes) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, describe());
        }
        return KeyMaterial(key_);
    }

private:
    std::vector<uint8_t> key_;
};

/**
 * @class FileKeyProvider
 */
class FileKeyProvider : public KeyProvider
{
public:
    FileKeyProvider(std::string path, bool createIfMissing)
        : path_(std::move(path)), createIfMissing_(createIfMissing)
    {
    }

    std::string describe() const override { return "file:" + path_; }

    KeyMaterial retrieveKey() const override
    {
        struct stat st;
        if (::stat(path_.c_str(), &st) != 0) {
            if (errno == ENOENT && createIfMissing_) {
                return createKeyFile();
            }
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        if (!S_ISREG(st.st_mode)) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, describe());
        }
        if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
            util::logger::error("FileKeyProvider: key file is accessible by group/others: " + path_);
            throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, describe());
        }

        int fd = ::open(path_.c_str(), O_RDONLY);
        if (fd < 0) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        std::string text;
        char buf[256];
        ssize_t n;
        while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
            text.append(buf, static_cast<size_t>(n));
            if (text.size() > 4096) {
                break;
            }
        }
        ::close(fd);
        if (n < 0) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        KeyMaterial key = parseKeyText(text, describe());
        OPENSSL_cleanse(&text[0], text.size());
        return key;
    }

    /// Where stageNewKey() writes the next key.
    std::string stagedPath() const { return path_ + ".next"; }

    /**
     * @brief Write a fresh random key, owner-only, to stagedPath().
     *
     * Key rotation stages the key first, re-seals the store, then calls
     * promoteStagedKey(). A crash in between leaves both keys on disk.
     */
    KeyMaterial stageNewKey() const
    {
        const std::string staged = stagedPath();
        if (::unlink(staged.c_str()) != 0 && errno != ENOENT) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, "file:" + staged);
        }
        return writeNewKey(staged);
    }

    /**
     * @brief Replace the key file with the staged key.
     * @throw core::KeyUnavailableError(key_missing) if the rename fails; the
     *        staged file is left in place.
     */
    void promoteStagedKey() const
    {
        const std::string staged = stagedPath();
        if (::rename(staged.c_str(), path_.c_str()) != 0) {
            util::logger::critical("FileKeyProvider: could not move " + staged + " over " + path_
                                   + ": " + std::strerror(errno) + ". The store is sealed under the staged key.");
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        util::logger::info("FileKeyProvider: key file " + path_ + " replaced.");
    }

    void discardStagedKey() const
    {
        const std::string staged = stagedPath();
        if (::unlink(staged.c_str()) != 0 && errno != ENOENT) {
            util::logger::warn("FileKeyProvider: could not remove " + staged + ": " + std::strerror(errno));
        }
    }

private:
    std::string path_;
    bool createIfMissing_;

    KeyMaterial createKeyFile() const
    {
        KeyMaterial key = writeNewKey(path_);
        util::logger::info("FileKeyProvider: created new key file " + path_);
        return key;
    }

    static KeyMaterial writeNewKey(const std::string &path)
    {
        std::vector<uint8_t> bytes(kKeyBytes);
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, "rand");
        }
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
        if (fd < 0) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, "file:" + path);
        }
        std::string hex = util::hashing::toHex(bytes);
        ssize_t written = ::write(fd, hex.data(), hex.size());
        bool synced = ::fsync(fd) == 0;
        ::close(fd);
        OPENSSL_cleanse(&hex[0], hex.size());
        if (written != static_cast<ssize_t>(kKeyBytes * 2) || !synced) {
            ::unlink(path.c_str());
            OPENSSL_cleanse(bytes.data(), bytes.size());
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, "file:" + path);
        }
        return KeyMaterial(std::move(bytes));
    }
};

/**
 * @class HttpKeyProvider
 *
 * The endpoint answers with either the hex key as the whole body or a flat
 * JSON object {"key": "<hex>"}.
 */
class HttpKeyProvider : public KeyProvider
{
public:
    HttpKeyProvider(std::string url, std::string tokenEnvVar, long timeoutSeconds = 15)
        : url_(std::move(url)), tokenEnvVar_(std::move(tokenEnvVar)), timeoutSeconds_(timeoutSeconds)
    {
        initCurl();
    }

    std::string describe() const override { return "vault:" + url_; }

    KeyMaterial retrieveKey() const override
    {
        const char *token = std::getenv(tokenEnvVar_.c_str());
        if (!token || !*token) {
            util::logger::error("HttpKeyProvider: token variable " + tokenEnvVar_ + " is not set.");
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }

        std::string body;
        long status = 0;
        if (!httpGet(std::string("Authorization: Bearer ") + token, body, status)) {
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }
        if (status != 200) {
            util::logger::error("HttpKeyProvider: vault returned HTTP " + std::to_string(status));
            throw core::KeyUnavailableError(core::ErrorCode::KeyMissing, describe());
        }

        std::string keyText = body;
        size_t first = body.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && body[first] == '{') {
            try {
                auto fields = util::json::parseFlatObject(body);
                auto it = fields.find("key");
                if (it == fields.end()) {
                    throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, describe());
                }
                keyText = it->second.text;
            }
            catch (const core::KeyUnavailableError &) {
                throw;
            }
            catch (const std::exception &) {
                throw core::KeyUnavailableError(core::ErrorCode::KeyInvalid, describe());
            }
        }
        KeyMaterial key = parseKeyText(keyText, describe());
        if (!body.empty()) {
            OPENSSL_cleanse(&body[0], body.size());
        }
        if (!keyText.empty()) {
            OPENSSL_cleanse(&keyText[0], keyText.size());
        }
        return key;
    }

private:
    std::string url_;
    std::string tokenEnvVar_;
    long timeoutSeconds_;

    static void initCurl()
    {
        static bool initialized = false;
        static std::mutex initMutex;
        std::lock_guard<std::mutex> lock(initMutex);
        if (!initialized) {
            curl_global_init(CURL_GLOBAL_ALL);
            initialized = true;
        }
    }

    static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp)
    {
        size_t total = size * nmemb;
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
        return total;
    }

    bool httpGet(const std::string &authHeader, std::string &responseOut, long &statusOut) const
    {
        CURL *curl = curl_easy_init();
        if (!curl) {
            return false;
        }
        struct curl_slist *headers = nullptr;
        headers = curl_slist_append(headers, authHeader.c_str());
        headers = curl_slist_append(headers, "Accept: application/json, text/plain");

        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusOut);
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            util::logger::error("HttpKeyProvider: request failed: " + std::string(curl_easy_strerror(res)));
            return false;
        }
        return true;
    }
};

/**
 * @brief The provider selected by configuration: the vault when a URL is
 *        set, otherwise the key file (created on first use).
 */
inline std::unique_ptr<KeyProvider> makeKeyProvider(const config::ScanConfig &cfg)
{
    if (!cfg.keyVaultUrl.empty()) {
        return std::make_unique<HttpKeyProvider>(cfg.keyVaultUrl, cfg.keyVaultTokenEnv);
    }
    return std::make_unique<FileKeyProvider>(cfg.keyFilePath, true);
}

} // namespace storage
} // namespace sensiscan

#endif // SENSISCAN_STORAGE_KEY_PROVIDER_HPP
