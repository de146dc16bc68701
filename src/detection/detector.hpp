#ifndef SENSISCAN_DETECTION_DETECTOR_HPP
#define SENSISCAN_DETECTION_DETECTOR_HPP

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include "config/scan_config.hpp"
#include "core/errors.hpp"
#include "core/match_types.hpp"
#include "detection/external_models.hpp"
#include "detection/pattern_detector.hpp"
#include "detection/signal_normalizer.hpp"
#include "util/logger.hpp"

/**
 * @file detector.hpp
 * @brief The Detector capability interface and the closed registry of its
 *        three variants.
 *
 * DESIGN GOALS:
 *   - Every signal source exposes detect(text, upstream) and returns
 *     normalized candidates. `upstream` holds what earlier detectors in the
 *     registry produced; the classifier variant scores those.
 *   - The registry runs detectors in order: pattern, recognizer (if one is
 *     wired in), classifier adjustment (if one is wired in).
 *   - A detector that throws is isolated. Its output for the text is dropped
 *     and a detector/detector_failed ScanError naming it is recorded.
 *
 * USAGE:
 *   @code
 *   auto registry = sensiscan::detection::DetectorRegistry::build(cfg, recognizer, classifier);
 *   auto outcome = registry->run(text);
 *   @endcode
 */

namespace sensiscan {
namespace detection {

class Detector
{
public:
    virtual ~Detector() = default;

    virtual std::string name() const = 0;

    virtual core::DetectorSource source() const = 0;

    virtual std::vector<core::CandidateMatch> detect(const std::string &text,
                                                     const std::vector<core::CandidateMatch> &upstream) const = 0;
};

class PatternSignalDetector : public Detector
{
public:
    PatternSignalDetector(PatternDetector patterns, SignalNormalizer normalizer)
        : patterns_(std::move(patterns)), normalizer_(normalizer)
    {
    }

    std::string name() const override { return "pattern"; }
    core::DetectorSource source() const override { return core::DetectorSource::Pattern; }

    std::vector<core::CandidateMatch> detect(const std::string &text,
                                             const std::vector<core::CandidateMatch> &) const override
    {
        std::vector<core::CandidateMatch> out;
        PatternCursor cursor = patterns_.cursor(text);
        while (auto hit = cursor.next()) {
            out.push_back(normalizer_.fromPattern(*hit));
        }
        return out;
    }

private:
    PatternDetector patterns_;
    SignalNormalizer normalizer_;
};

class RecognizerSignalDetector : public Detector
{
public:
    RecognizerSignalDetector(std::shared_ptr<const EntityRecognizer> recognizer, SignalNormalizer normalizer)
        : recognizer_(std::move(recognizer)), normalizer_(normalizer)
    {
    }

    std::string name() const override { return "recognizer:" + recognizer_->name(); }
    core::DetectorSource source() const override { return core::DetectorSource::Recognizer; }

    std::vector<core::CandidateMatch> detect(const std::string &text,
                                             const std::vector<core::CandidateMatch> &) const override
    {
        return normalizer_.fromRecognizer(recognizer_->recognize(text), text);
    }

private:
    std::shared_ptr<const EntityRecognizer> recognizer_;
    SignalNormalizer normalizer_;
};

class ClassifierAdjustmentDetector : public Detector
{
public:
    ClassifierAdjustmentDetector(std::shared_ptr<const MatchClassifier> classifier, SignalNormalizer normalizer)
        : classifier_(std::move(classifier)), normalizer_(normalizer)
    {
    }

    std::string name() const override { return "classifier:" + classifier_->modelVersion(); }
    core::DetectorSource source() const override { return core::DetectorSource::Classifier; }

    std::vector<core::CandidateMatch> detect(const std::string &,
                                             const std::vector<core::CandidateMatch> &upstream) const override
    {
        if (upstream.empty()) {
            return {};
        }
        auto scores = classifier_->score(SignalNormalizer::classifierInputs(upstream));
        return normalizer_.fromClassifier(upstream, scores, classifier_->modelVersion());
    }

private:
    std::shared_ptr<const MatchClassifier> classifier_;
    SignalNormalizer normalizer_;
};

/**
 * @struct DetectionOutcome
 * @brief Candidates from every detector that succeeded, plus one error per
 *        detector that failed.
 */
struct DetectionOutcome
{
    std::vector<core::CandidateMatch> candidates;
    std::vector<core::ScanError> errors;
};

class DetectorRegistry
{
public:
    static std::shared_ptr<const DetectorRegistry> build(const config::ScanConfig &cfg,
                                                         std::shared_ptr<const EntityRecognizer> recognizer = nullptr,
                                                         std::shared_ptr<const MatchClassifier> classifier = nullptr)
    {
        SignalNormalizer normalizer(cfg.recognizerThreshold);
        std::shared_ptr<DetectorRegistry> registry(new DetectorRegistry());

        registry->detectors_.push_back(std::make_shared<PatternSignalDetector>(
            PatternDetector(PatternTable::defaults(), cfg.testContextWindow), normalizer));
        if (recognizer) {
            registry->detectors_.push_back(
                std::make_shared<RecognizerSignalDetector>(std::move(recognizer), normalizer));
        }
        if (classifier) {
            registry->detectors_.push_back(
                std::make_shared<ClassifierAdjustmentDetector>(std::move(classifier), normalizer));
        }
        return registry;
    }

    DetectionOutcome run(const std::string &text) const
    {
        DetectionOutcome outcome;
        for (const auto &detector : detectors_) {
            try {
                auto produced = detector->detect(text, outcome.candidates);
                outcome.candidates.insert(outcome.candidates.end(),
                                          std::make_move_iterator(produced.begin()),
                                          std::make_move_iterator(produced.end()));
            }
            catch (const std::exception &ex) {
                util::logger::warn("DetectorRegistry: detector " + detector->name()
                                   + " failed: " + ex.what());
                outcome.errors.emplace_back(core::ErrorKind::Detector, core::ErrorCode::DetectorFailed,
                                            detector->name());
            }
        }
        return outcome;
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        for (const auto &d : detectors_) {
            out.push_back(d->name());
        }
        return out;
    }

private:
    DetectorRegistry() = default;

    std::vector<std::shared_ptr<const Detector>> detectors_;
};

} // namespace detection
} // namespace sensiscan

#endif // SENSISCAN_DETECTION_DETECTOR_HPP
