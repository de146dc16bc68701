#ifndef SENSISCAN_PIPELINE_FILE_CLASSIFIER_HPP
#define SENSISCAN_PIPELINE_FILE_CLASSIFIER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config/scan_config.hpp"
#include "core/match_types.hpp"
#include "core/redaction.hpp"
#include "detection/detector.hpp"
#include "fusion/fusion_engine.hpp"
#include "labeling/label_resolver.hpp"

/**
 * @file file_classifier.hpp
 * @brief Text in, ordered resolved matches and a label recommendation out.
 *
 * Runs the detector registry, fuses what it produced and resolves the label.
 * A failing detector does not fail the file: its candidates are dropped and
 * the failure is reported in `error`.
 */

namespace sensiscan {
namespace pipeline {

struct Classification
{
    std::vector<core::ResolvedMatch> matches;
    std::optional<core::LabelRecommendation> label;
    std::optional<core::ScanError> error;
};

class FileClassifier
{
public:
    FileClassifier(std::shared_ptr<const detection::DetectorRegistry> registry,
                   fusion::FusionEngine fusion,
                   labeling::LabelResolver labels)
        : registry_(std::move(registry)), fusion_(std::move(fusion)), labels_(std::move(labels))
    {
    }

    static std::shared_ptr<const FileClassifier> fromConfig(
        const config::ScanConfig &cfg,
        std::shared_ptr<const detection::EntityRecognizer> recognizer = nullptr,
        std::shared_ptr<const detection::MatchClassifier> classifier = nullptr)
    {
        return std::make_shared<FileClassifier>(
            detection::DetectorRegistry::build(cfg, std::move(recognizer), std::move(classifier)),
            fusion::FusionEngine::fromConfig(cfg),
            labeling::LabelResolver(labeling::LabelTierTable::fromConfig(cfg)));
    }

    Classification classify(const std::string &text) const
    {
        Classification result;
        detection::DetectionOutcome outcome = registry_->run(text);

        result.matches = fusion_.fuse(outcome.candidates);
        maskContexts(text, outcome.candidates, result.matches);
        result.label = labels_.recommend(result.matches);

        if (!outcome.errors.empty()) {
            std::string names;
            for (const auto &e : outcome.errors) {
                names += (names.empty() ? "" : ",") + e.detail;
            }
            result.error = core::ScanError(core::ErrorKind::Detector, core::ErrorCode::DetectorFailed, names);
        }
        return result;
    }

    const fusion::FusionEngine& fusion() const { return fusion_; }
    const labeling::LabelResolver& labels() const { return labels_; }

    /**
     * @brief Rebuild each match context from the text with every candidate
     *        span, not only the match's own, replaced by its entity token.
     */
    static void maskContexts(const std::string &text,
                             const std::vector<core::CandidateMatch> &candidates,
                             std::vector<core::ResolvedMatch> &matches)
    {
        std::vector<core::RedactionTable::MaskedRange> masks;
        masks.reserve(candidates.size());
        for (const auto &c : candidates) {
            masks.push_back({c.span().start, c.span().end, c.entityType()});
        }
        for (auto &m : matches) {
            m.contextSnippet = core::RedactionTable::maskedWindow(
                text, {m.span.start, m.span.end, m.entityType}, masks, detection::kContextRadius);
        }
    }

private:
    std::shared_ptr<const detection::DetectorRegistry> registry_;
    fusion::FusionEngine fusion_;
    labeling::LabelResolver labels_;
};

} // namespace pipeline
} // namespace sensiscan

#endif // SENSISCAN_PIPELINE_FILE_CLASSIFIER_HPP
