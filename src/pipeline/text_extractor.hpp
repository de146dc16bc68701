#ifndef SENSISCAN_PIPELINE_TEXT_EXTRACTOR_HPP
#define SENSISCAN_PIPELINE_TEXT_EXTRACTOR_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include "core/errors.hpp"

/**
 * @file text_extractor.hpp
 * @brief Interface to the text extraction collaborator and the plain-text
 *        extractor shipped as its default implementation.
 *
 * Extraction failures come back as an ExtractionResult carrying an
 * extraction-kind ScanError; extract() does not throw for ordinary I/O
 * problems.
 */

namespace sensiscan {
namespace pipeline {

struct ExtractionResult
{
    std::string text;
    std::optional<core::ScanError> error;
};

class TextExtractor
{
public:
    virtual ~TextExtractor() = default;

    virtual bool canHandle(const std::string &path) const = 0;

    virtual ExtractionResult extract(const std::string &path) const = 0;
};

/**
 * @class PlainTextExtractor
 * @brief Reads text, data, source and config files by extension.
 *
 * Input is taken as UTF-8 (a BOM is stripped). Input that is not valid
 * UTF-8 is decoded as Latin-1 and re-encoded, which never fails.
 */
class PlainTextExtractor : public TextExtractor
{
public:
    bool canHandle(const std::string &path) const override
    {
        static const std::set<std::string> extensions = {
            ".txt", ".text", ".log", ".md", ".markdown", ".rst",
            ".csv", ".tsv", ".json", ".jsonl", ".yaml", ".yml", ".xml", ".html", ".htm",
            ".py", ".js", ".ts", ".jsx", ".tsx", ".java", ".c", ".cpp", ".h", ".hpp",
            ".cs", ".go", ".rs", ".rb", ".php", ".sql", ".sh", ".bash", ".ps1", ".bat", ".cmd",
            ".ini", ".cfg", ".conf", ".config", ".env", ".properties", ".toml"
        };
        return extensions.count(extensionOf(path)) > 0;
    }

    ExtractionResult extract(const std::string &path) const override
    {
        ExtractionResult result;
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Unreadable, path);
            return result;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            result.error = core::ScanError(core::ErrorKind::Extraction, core::ErrorCode::Unreadable, path);
            return result;
        }

        std::string bytes = buffer.str();
        if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            bytes.erase(0, 3);
        }
        result.text = isValidUtf8(bytes) ? std::move(bytes) : latin1ToUtf8(bytes);
        return result;
    }

    static std::string extensionOf(const std::string &path)
    {
        auto slash = path.find_last_of("/\\");
        std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
        auto dot = base.find_last_of('.');
        if (dot == std::string::npos || dot == 0) {
            // ".env" style names are their own extension.
            return dot == 0 ? lower(base) : std::string();
        }
        return lower(base.substr(dot));
    }

private:
    static std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static bool isValidUtf8(const std::string &s)
    {
        size_t i = 0;
        while (i < s.size()) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
            if (len == 0 || i + len > s.size()) {
                return false;
            }
            for (size_t k = 1; k < len; ++k) {
                if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                    return false;
                }
            }
            i += len;
        }
        return true;
    }

    static std::string latin1ToUtf8(const std::string &s)
    {
        std::string out;
        out.reserve(s.size() + s.size() / 4);
        for (char ch : s) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 0x80) {
                out.push_back(ch);
            } else {
                out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
            }
        }
        return out;
    }
};

} // namespace pipeline
} // namespace sensiscan

#endif // SENSISCAN_PIPELINE_TEXT_EXTRACTOR_HPP
