#ifndef SENSISCAN_CORE_ENTITY_TYPES_HPP
#define SENSISCAN_CORE_ENTITY_TYPES_HPP

#include <array>
#include <string>
#include <optional>
#include <stdexcept>

/**
 * @file entity_types.hpp
 * @brief Closed enumerations shared by every stage: what was found (EntityType),
 *        who found it (DetectorSource), what a reviewer decided (Verdict) and
 *        the sensitivity label suggested for a file (LabelRecommendation).
 *
 * The string names are persisted (store payloads, feedback ledger, audit log)
 * and must stay stable across releases.
 */

namespace sensiscan {
namespace core {

enum class EntityType {
    Ssn,
    CreditCard,
    Email,
    Phone,
    Name,
    Address,
    DateOfBirth,
    MedicalRecordNumber,
    HealthPlanId,
    Diagnosis,
    Medication,
    Cvv,
    ExpirationDate,
    ApiKey,
    Password,
    PrivateKey,
    Identifier      ///< generic identifier; less specific than any other type
};

constexpr std::array<EntityType, 17> kAllEntityTypes = {
    EntityType::Ssn, EntityType::CreditCard, EntityType::Email, EntityType::Phone,
    EntityType::Name, EntityType::Address, EntityType::DateOfBirth,
    EntityType::MedicalRecordNumber, EntityType::HealthPlanId, EntityType::Diagnosis,
    EntityType::Medication, EntityType::Cvv, EntityType::ExpirationDate,
    EntityType::ApiKey, EntityType::Password, EntityType::PrivateKey,
    EntityType::Identifier
};

inline const char* toString(EntityType type)
{
    switch (type) {
    case EntityType::Ssn:                 return "ssn";
    case EntityType::CreditCard:          return "credit_card";
    case EntityType::Email:               return "email";
    case EntityType::Phone:               return "phone";
    case EntityType::Name:                return "name";
    case EntityType::Address:             return "address";
    case EntityType::DateOfBirth:         return "date_of_birth";
    case EntityType::MedicalRecordNumber: return "medical_record_number";
    case EntityType::HealthPlanId:        return "health_plan_id";
    case EntityType::Diagnosis:           return "diagnosis";
    case EntityType::Medication:          return "medication";
    case EntityType::Cvv:                 return "cvv";
    case EntityType::ExpirationDate:      return "expiration_date";
    case EntityType::ApiKey:              return "api_key";
    case EntityType::Password:            return "password";
    case EntityType::PrivateKey:          return "private_key";
    case EntityType::Identifier:          return "identifier";
    }
    return "identifier";
}

inline std::optional<EntityType> entityTypeFromString(const std::string &name)
{
    for (EntityType t : kAllEntityTypes) {
        if (name == toString(t)) {
            return t;
        }
    }
    return std::nullopt;
}

/**
 * @brief Upper-case token used in anonymized contexts, e.g. "[CREDIT_CARD]".
 */
inline std::string entityToken(EntityType type)
{
    std::string token = toString(type);
    for (char &c : token) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return "[" + token + "]";
}

inline bool isGeneric(EntityType type)
{
    return type == EntityType::Identifier;
}

// ----------------------------------------------------------------------------

/// Enum order is the detector priority used when ordering matches.
enum class DetectorSource {
    Pattern = 0,
    Recognizer,
    Classifier
};

inline const char* toString(DetectorSource source)
{
    switch (source) {
    case DetectorSource::Pattern:    return "pattern";
    case DetectorSource::Recognizer: return "recognizer";
    case DetectorSource::Classifier: return "classifier";
    }
    return "pattern";
}

inline std::optional<DetectorSource> detectorSourceFromString(const std::string &name)
{
    if (name == "pattern")    return DetectorSource::Pattern;
    if (name == "recognizer") return DetectorSource::Recognizer;
    if (name == "classifier") return DetectorSource::Classifier;
    return std::nullopt;
}

// ----------------------------------------------------------------------------

enum class Verdict {
    Pending,
    TruePositive,
    FalsePositive,
    Unsure,
    Skipped
};

inline const char* toString(Verdict verdict)
{
    switch (verdict) {
    case Verdict::Pending:       return "PENDING";
    case Verdict::TruePositive:  return "TP";
    case Verdict::FalsePositive: return "FP";
    case Verdict::Unsure:        return "UNSURE";
    case Verdict::Skipped:       return "SKIPPED";
    }
    return "PENDING";
}

inline std::optional<Verdict> verdictFromString(const std::string &name)
{
    if (name == "PENDING") return Verdict::Pending;
    if (name == "TP")      return Verdict::TruePositive;
    if (name == "FP")      return Verdict::FalsePositive;
    if (name == "UNSURE")  return Verdict::Unsure;
    if (name == "SKIPPED") return Verdict::Skipped;
    return std::nullopt;
}

// ----------------------------------------------------------------------------

/// Ordered from least to most protective.
enum class LabelRecommendation {
    Public = 0,
    Internal,
    Confidential,
    HighlyConfidential
};

inline const char* toString(LabelRecommendation label)
{
    switch (label) {
    case LabelRecommendation::Public:             return "public";
    case LabelRecommendation::Internal:           return "internal";
    case LabelRecommendation::Confidential:       return "confidential";
    case LabelRecommendation::HighlyConfidential: return "highly_confidential";
    }
    return "highly_confidential";
}

inline std::optional<LabelRecommendation> labelFromString(const std::string &name)
{
    if (name == "public")              return LabelRecommendation::Public;
    if (name == "internal")            return LabelRecommendation::Internal;
    if (name == "confidential")        return LabelRecommendation::Confidential;
    if (name == "highly_confidential") return LabelRecommendation::HighlyConfidential;
    return std::nullopt;
}

} // namespace core
} // namespace sensiscan

#endif // SENSISCAN_CORE_ENTITY_TYPES_HPP
