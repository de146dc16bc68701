#ifndef SENSISCAN_UTIL_JSON_TEXT_HPP
#define SENSISCAN_UTIL_JSON_TEXT_HPP

#include <string>
#include <map>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <cstdlib>

/**
 * @file json_text.hpp
 * @brief Minimal JSON text helpers for the line-delimited logs (audit log,
 *        feedback ledger) and the scan report renderer.
 *
 * DESIGN GOALS:
 *   - escapeString() for writers that assemble JSON by hand.
 *   - parseFlatObject() reads one top-level object whose values are strings,
 *     numbers, booleans or null. Nested objects and arrays are rejected.
 *   - Header-only, no external JSON library.
 *
 * USAGE:
 *   @code
 *   auto fields = sensiscan::util::json::parseFlatObject(R"({"verdict":"TP","n":3})");
 *   std::string v = fields.at("verdict").text;   // "TP"
 *   double n = fields.at("n").asNumber();         // 3
 *   @endcode
 */

namespace sensiscan {
namespace util {
namespace json {

/**
 * @brief Escape characters in a string for JSON output, e.g. " -> \".
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

/**
 * @brief `"` + escapeString(s) + `"`
 */
inline std::string quote(const std::string &s)
{
    return "\"" + escapeString(s) + "\"";
}

/**
 * @struct Value
 * @brief One scalar value from a flat JSON object.
 */
struct Value
{
    enum class Kind { String, Number, Bool, Null };

    Kind kind = Kind::Null;
    std::string text;   ///< Unescaped string, or the literal token for numbers/bools

    bool isNull() const { return kind == Kind::Null; }

    double asNumber() const
    {
        if (kind != Kind::Number) {
            throw std::runtime_error("json::Value: not a number: " + text);
        }
        return std::strtod(text.c_str(), nullptr);
    }

    bool asBool() const
    {
        if (kind != Kind::Bool) {
            throw std::runtime_error("json::Value: not a boolean: " + text);
        }
        return text == "true";
    }
};

namespace detail {

inline void skipSpace(const std::string &s, size_t &pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
}

inline std::string readString(const std::string &s, size_t &pos)
{
    if (pos >= s.size() || s[pos] != '"') {
        throw std::runtime_error("json: expected '\"' at offset " + std::to_string(pos));
    }
    ++pos;
    std::string out;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos >= s.size()) {
            break;
        }
        char esc = s[pos++];
        switch (esc) {
        case '"':  out.push_back('"');  break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/');  break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u': {
            if (pos + 4 > s.size()) {
                throw std::runtime_error("json: truncated \\u escape.");
            }
            unsigned long cp = std::strtoul(s.substr(pos, 4).c_str(), nullptr, 16);
            pos += 4;
            // Writers only emit \u for control characters; anything wider is kept as '?'.
            out.push_back(cp < 0x80 ? static_cast<char>(cp) : '?');
            break;
        }
        default:
            throw std::runtime_error(std::string("json: bad escape '\\") + esc + "'");
        }
    }
    throw std::runtime_error("json: unterminated string.");
}

} // namespace detail

/**
 * @brief Parse one flat JSON object into key -> Value.
 * @throw std::runtime_error on malformed input or nested containers.
 */
inline std::map<std::string, Value> parseFlatObject(const std::string &text)
{
    std::map<std::string, Value> fields;
    size_t pos = 0;
    detail::skipSpace(text, pos);
    if (pos >= text.size() || text[pos] != '{') {
        throw std::runtime_error("json: not an object (missing '{').");
    }
    ++pos;
    detail::skipSpace(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        return fields;
    }

    while (pos < text.size()) {
        detail::skipSpace(text, pos);
        std::string key = detail::readString(text, pos);
        detail::skipSpace(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("json: missing ':' after key " + key);
        }
        ++pos;
        detail::skipSpace(text, pos);
        if (pos >= text.size()) {
            throw std::runtime_error("json: missing value for key " + key);
        }

        Value value;
        char c = text[pos];
        if (c == '"') {
            value.kind = Value::Kind::String;
            value.text = detail::readString(text, pos);
        } else if (c == '{' || c == '[') {
            throw std::runtime_error("json: nested value for key " + key + " is not supported.");
        } else {
            size_t start = pos;
            while (pos < text.size() && text[pos] != ',' && text[pos] != '}'
                   && !std::isspace(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            value.text = text.substr(start, pos - start);
            if (value.text == "null") {
                value.kind = Value::Kind::Null;
            } else if (value.text == "true" || value.text == "false") {
                value.kind = Value::Kind::Bool;
            } else {
                char *end = nullptr;
                std::strtod(value.text.c_str(), &end);
                if (value.text.empty() || *end != '\0') {
                    throw std::runtime_error("json: bad literal '" + value.text + "'");
                }
                value.kind = Value::Kind::Number;
            }
        }
        fields[key] = value;

        detail::skipSpace(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            return fields;
        }
        throw std::runtime_error("json: expected ',' or '}' at offset " + std::to_string(pos));
    }
    throw std::runtime_error("json: unterminated object.");
}

} // namespace json
} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_JSON_TEXT_HPP
