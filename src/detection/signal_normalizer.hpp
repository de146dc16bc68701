#ifndef SENSISCAN_DETECTION_SIGNAL_NORMALIZER_HPP
#define SENSISCAN_DETECTION_SIGNAL_NORMALIZER_HPP

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/match_types.hpp"
#include "core/redaction.hpp"
#include "detection/external_models.hpp"
#include "detection/pattern_detector.hpp"
#include "util/logger.hpp"

/**
 * @file signal_normalizer.hpp
 * @brief Turns pattern hits, recognizer spans and classifier scores into
 *        CandidateMatch values on a common [0,1] confidence scale.
 *
 * DESIGN GOALS:
 *   - Pattern hits: rule base confidence, plus the rule's validated bonus for
 *     a checksum-validated hit that is not flagged as test data.
 *   - Recognizer spans: label mapped to EntityType through a fixed table;
 *     unknown labels and scores below the threshold are dropped.
 *   - Classifier scores: attached to the span and type of the scored
 *     candidate, with the model version.
 *   - Overlaps are left for the fusion engine.
 */

namespace sensiscan {
namespace detection {

class SignalNormalizer
{
public:
    explicit SignalNormalizer(double recognizerThreshold = 0.5)
        : recognizerThreshold_(recognizerThreshold)
    {
    }

    double recognizerThreshold() const { return recognizerThreshold_; }

    core::CandidateMatch fromPattern(const PatternHit &hit) const
    {
        double confidence = hit.rule->baseConfidence;
        if (hit.validated && !hit.isTestData) {
            confidence += hit.rule->validatedBonus;
        }
        return core::CandidateMatch(hit.rule->entityType, core::DetectorSource::Pattern, hit.span,
                                    hit.value, std::min(confidence, 1.0), hit.isTestData,
                                    hit.context);
    }

    std::vector<core::CandidateMatch> fromRecognizer(const std::vector<RecognizedSpan> &spans,
                                                     const std::string &text) const
    {
        std::vector<core::CandidateMatch> out;
        for (const auto &rs : spans) {
            auto type = mapRecognizerLabel(rs.label);
            if (!type) {
                util::logger::debug("SignalNormalizer: dropping unmapped recognizer label " + rs.label);
                continue;
            }
            if (rs.score < recognizerThreshold_) {
                continue;
            }
            if (rs.span.start >= rs.span.end || rs.span.end > text.size()) {
                util::logger::warn("SignalNormalizer: recognizer span out of range, dropped.");
                continue;
            }
            core::Span span = rs.span;
            span.line = lineOf(text, span.start);
            out.emplace_back(*type, core::DetectorSource::Recognizer, span,
                             text.substr(span.start, span.end - span.start), rs.score, false,
                             contextWindow(text, span));
        }
        return out;
    }

    /**
     * @brief Build classifier inputs for `candidates`; candidate ids are the
     *        positional keys produced by candidateKey().
     */
    static std::vector<ClassifierInput> classifierInputs(const std::vector<core::CandidateMatch> &candidates)
    {
        std::vector<ClassifierInput> inputs;
        inputs.reserve(candidates.size());
        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto &c = candidates[i];
            ClassifierInput in;
            in.candidateId = candidateKey(i);
            in.entityType = c.entityType();
            // The candidate's own value anchors; neighbouring values are masked too.
            std::vector<std::pair<std::string, core::EntityType>> values;
            values.emplace_back(c.rawValue(), c.entityType());
            for (size_t j = 0; j < candidates.size(); ++j) {
                if (j != i) {
                    values.emplace_back(candidates[j].rawValue(), candidates[j].entityType());
                }
            }
            in.context = core::RedactionTable::anonymizeContext(c.context(), values);
            inputs.push_back(std::move(in));
        }
        return inputs;
    }

    std::vector<core::CandidateMatch> fromClassifier(const std::vector<core::CandidateMatch> &scored,
                                                     const std::vector<ClassifierScore> &scores,
                                                     const std::string &modelVersion) const
    {
        std::map<std::string, size_t> byKey;
        for (size_t i = 0; i < scored.size(); ++i) {
            byKey[candidateKey(i)] = i;
        }

        std::vector<core::CandidateMatch> out;
        for (const auto &s : scores) {
            auto it = byKey.find(s.candidateId);
            if (it == byKey.end()) {
                util::logger::warn("SignalNormalizer: classifier scored unknown candidate " + s.candidateId);
                continue;
            }
            const auto &c = scored[it->second];
            out.emplace_back(c.entityType(), core::DetectorSource::Classifier, c.span(), c.rawValue(),
                             s.score, false, c.context(), modelVersion);
        }
        return out;
    }

    static std::string candidateKey(size_t index)
    {
        return "c" + std::to_string(index);
    }

    static std::optional<core::EntityType> mapRecognizerLabel(const std::string &label)
    {
        using core::EntityType;
        static const std::map<std::string, EntityType> table = {
            {"PERSON",            EntityType::Name},
            {"NRP",               EntityType::Name},
            {"LOCATION",          EntityType::Address},
            {"DATE_TIME",         EntityType::DateOfBirth},
            {"EMAIL_ADDRESS",     EntityType::Email},
            {"PHONE_NUMBER",      EntityType::Phone},
            {"US_SSN",            EntityType::Ssn},
            {"CREDIT_CARD",       EntityType::CreditCard},
            {"MEDICAL_LICENSE",   EntityType::MedicalRecordNumber},
            {"US_DRIVER_LICENSE", EntityType::Identifier},
            {"US_PASSPORT",       EntityType::Identifier},
            {"US_ITIN",           EntityType::Identifier},
            {"US_BANK_NUMBER",    EntityType::Identifier},
        };
        auto it = table.find(label);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    double recognizerThreshold_;

    static size_t lineOf(const std::string &text, size_t offset)
    {
        return 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + offset, '\n'));
    }

    static std::string contextWindow(const std::string &text, const core::Span &span)
    {
        size_t begin = span.start > kContextRadius ? span.start - kContextRadius : 0;
        size_t end = std::min(text.size(), span.end + kContextRadius);
        while (begin > 0 && (static_cast<unsigned char>(text[begin]) & 0xC0) == 0x80) {
            --begin;
        }
        while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            ++end;
        }
        return text.substr(begin, end - begin);
    }
};

} // namespace detection
} // namespace sensiscan

#endif // SENSISCAN_DETECTION_SIGNAL_NORMALIZER_HPP
