#ifndef SENSISCAN_CORE_REDACTION_HPP
#define SENSISCAN_CORE_REDACTION_HPP

#include <algorithm>
#include <map>
#include <utility>
#include <string>
#include <vector>
#include "core/entity_types.hpp"

/**
 * @file redaction.hpp
 * @brief Deterministic, format-stable redaction of matched values.
 *
 * A rule keeps `keepLeading` characters at the front and `keepTrailing` at
 * the back; every other character becomes the mask character. The output has
 * the same number of characters as the input. When the kept characters would
 * cover the whole value, everything is masked.
 *
 * Characters are UTF-8 code points, so a masked name never splits a
 * multi-byte sequence.
 */

namespace sensiscan {
namespace core {

struct RedactionRule
{
    size_t keepLeading = 2;
    size_t keepTrailing = 2;
};

class RedactionTable
{
public:
    static constexpr char kMaskChar = '*';

    RedactionTable()
    {
        rules_[EntityType::Ssn]         = {0, 4};
        rules_[EntityType::CreditCard]  = {0, 4};
        rules_[EntityType::Phone]       = {0, 4};
        rules_[EntityType::Email]       = {1, 0};
        rules_[EntityType::ApiKey]      = {4, 0};
        rules_[EntityType::Password]    = {0, 0};
        rules_[EntityType::PrivateKey]  = {0, 0};
        rules_[EntityType::Cvv]         = {0, 0};
    }

    void setRule(EntityType type, RedactionRule rule) { rules_[type] = rule; }

    RedactionRule ruleFor(EntityType type) const
    {
        auto it = rules_.find(type);
        return it == rules_.end() ? defaultRule_ : it->second;
    }

    /**
     * @brief Redact `raw` according to the rule for `type`.
     */
    std::string redact(const std::string &raw, EntityType type) const
    {
        RedactionRule rule = ruleFor(type);
        std::vector<std::string> chars = splitCodePoints(raw);
        const size_t n = chars.size();

        size_t lead = rule.keepLeading;
        size_t trail = rule.keepTrailing;
        if (lead + trail >= n) {
            lead = 0;
            trail = 0;
        }

        std::string out;
        out.reserve(raw.size());
        for (size_t i = 0; i < n; ++i) {
            if (i < lead || i >= n - trail) {
                out += chars[i];
            } else {
                out.push_back(kMaskChar);
            }
        }
        return out;
    }

    /**
     * @brief Replace every occurrence of `raw` in `context` with the entity
     *        token and clip the result to `maxChars` bytes around the first token.
     */
    static std::string anonymizeContext(const std::string &context,
                                        const std::string &raw,
                                        EntityType type,
                                        size_t maxChars = 160)
    {
        return anonymizeContext(context, std::vector<std::pair<std::string, EntityType>>{{raw, type}}, maxChars);
    }

    /**
     * @brief Same, for several values at once. The first value anchors the
     *        clip window; longer values are replaced before shorter ones.
     */
    static std::string anonymizeContext(const std::string &context,
                                        const std::vector<std::pair<std::string, EntityType>> &values,
                                        size_t maxChars = 160)
    {
        std::vector<size_t> order(values.size());
        for (size_t i = 0; i < order.size(); ++i) {
            order[i] = i;
        }
        std::stable_sort(order.begin(), order.end(), [&values](size_t a, size_t b) {
            return values[a].first.size() > values[b].first.size();
        });

        std::string out = context;
        for (size_t idx : order) {
            const std::string &raw = values[idx].first;
            if (raw.empty()) {
                continue;
            }
            const std::string token = entityToken(values[idx].second);
            size_t pos = 0;
            while ((pos = out.find(raw, pos)) != std::string::npos) {
                out.replace(pos, raw.size(), token);
                pos += token.size();
            }
        }
        size_t anchor = values.empty() ? 0 : out.find(entityToken(values.front().second));
        return clipAround(out, anchor == std::string::npos ? 0 : anchor, maxChars);
    }

    /**
     * @struct MaskedRange
     * @brief A detected value inside a text, by byte offsets (end exclusive).
     */
    struct MaskedRange
    {
        size_t start;
        size_t end;
        EntityType type;
    };

    /**
     * @brief The window of `text` around `focus`, with every range in `masks`
     *        that touches the window replaced by its entity token.
     *
     * A range cut by the window edge is replaced whole, so no fragment of a
     * neighbouring value survives.
     */
    static std::string maskedWindow(const std::string &text,
                                    const MaskedRange &focus,
                                    std::vector<MaskedRange> masks,
                                    size_t radius,
                                    size_t maxChars = 160)
    {
        size_t begin = focus.start > radius ? focus.start - radius : 0;
        size_t end = std::min(text.size(), focus.end + radius);
        while (begin > 0 && isContinuation(text[begin])) {
            --begin;
        }
        while (end < text.size() && isContinuation(text[end])) {
            ++end;
        }

        masks.push_back(focus);
        std::sort(masks.begin(), masks.end(), [](const MaskedRange &a, const MaskedRange &b) {
            return a.start != b.start ? a.start < b.start : a.end > b.end;
        });

        std::string out;
        size_t anchor = std::string::npos;
        size_t pos = begin;
        for (const auto &m : masks) {
            if (m.end <= pos) {
                continue;
            }
            if (m.start >= end) {
                break;
            }
            if (m.start > pos) {
                out.append(text, pos, m.start - pos);
            }
            if (anchor == std::string::npos && m.start <= focus.start && m.end >= focus.end) {
                anchor = out.size();
            }
            out += entityToken(m.type);
            pos = m.end;
        }
        if (pos < end) {
            out.append(text, pos, end - pos);
        }
        return clipAround(out, anchor == std::string::npos ? 0 : anchor, maxChars);
    }

private:
    static bool isContinuation(char c)
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    /// At most `maxChars` bytes of `s` centred on `anchor`, on UTF-8 boundaries.
    static std::string clipAround(const std::string &s, size_t anchor, size_t maxChars)
    {
        if (s.size() <= maxChars) {
            return s;
        }
        size_t half = maxChars / 2;
        size_t begin = anchor > half ? anchor - half : 0;
        if (begin + maxChars > s.size()) {
            begin = s.size() - maxChars;
        }
        while (begin > 0 && isContinuation(s[begin])) {
            --begin;
        }
        size_t end = std::min(s.size(), begin + maxChars);
        while (end < s.size() && isContinuation(s[end])) {
            ++end;
        }
        return s.substr(begin, end - begin);
    }

    static std::vector<std::string> splitCodePoints(const std::string &s)
    {
        std::vector<std::string> chars;
        for (size_t i = 0; i < s.size();) {
            size_t len = 1;
            while (i + len < s.size() && isContinuation(s[i + len])) {
                ++len;
            }
            chars.push_back(s.substr(i, len));
            i += len;
        }
        return chars;
    }

    RedactionRule defaultRule_{2, 2};
    std::map<EntityType, RedactionRule> rules_;
};

} // namespace core
} // namespace sensiscan

#endif // SENSISCAN_CORE_REDACTION_HPP
