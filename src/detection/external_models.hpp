#ifndef SENSISCAN_DETECTION_EXTERNAL_MODELS_HPP
#define SENSISCAN_DETECTION_EXTERNAL_MODELS_HPP

#include <string>
#include <vector>
#include "core/entity_types.hpp"
#include "core/match_types.hpp"

/**
 * @file external_models.hpp
 * @brief Interfaces to the statistical collaborators that live outside this
 *        library: a named-entity recognizer and a trainable false-positive
 *        classifier. Both may throw; the detector registry isolates them.
 */

namespace sensiscan {
namespace detection {

/**
 * @struct RecognizedSpan
 * @brief One entity reported by a recognizer, in the recognizer's own label set.
 */
struct RecognizedSpan
{
    core::Span span;
    std::string label;      ///< e.g. "PERSON", "LOCATION", "US_SSN"
    double score = 0.0;
};

class EntityRecognizer
{
public:
    virtual ~EntityRecognizer() = default;

    virtual std::string name() const = 0;

    virtual std::vector<RecognizedSpan> recognize(const std::string &text) const = 0;
};

/**
 * @struct ClassifierInput
 * @brief What the classifier is allowed to see of a candidate. The context
 *        has the matched value replaced by its entity token.
 */
struct ClassifierInput
{
    std::string candidateId;
    core::EntityType entityType = core::EntityType::Identifier;
    std::string context;
};

/**
 * @struct ClassifierScore
 * @brief Probability that the candidate is a true positive.
 */
struct ClassifierScore
{
    std::string candidateId;
    double score = 0.0;
};

class MatchClassifier
{
public:
    virtual ~MatchClassifier() = default;

    virtual std::string modelVersion() const = 0;

    virtual std::vector<ClassifierScore> score(const std::vector<ClassifierInput> &inputs) const = 0;
};

} // namespace detection
} // namespace sensiscan

#endif // SENSISCAN_DETECTION_EXTERNAL_MODELS_HPP
