#ifndef SENSISCAN_LABELING_LABEL_RESOLVER_HPP
#define SENSISCAN_LABELING_LABEL_RESOLVER_HPP

#include <map>
#include <optional>
#include <vector>
#include "config/scan_config.hpp"
#include "core/entity_types.hpp"
#include "core/match_types.hpp"

/**
 * @file label_resolver.hpp
 * @brief Maps a file's matches to a single sensitivity label recommendation.
 *
 * Only matches whose verdict is TP or PENDING count. The recommendation is
 * the highest tier among them; a file with no qualifying match gets no
 * recommendation at all (it is never defaulted to "public").
 */

namespace sensiscan {
namespace labeling {

class LabelTierTable
{
public:
    LabelTierTable()
    {
        using core::EntityType;
        using core::LabelRecommendation;
        for (EntityType t : {EntityType::Ssn, EntityType::CreditCard, EntityType::Cvv,
                             EntityType::MedicalRecordNumber, EntityType::HealthPlanId,
                             EntityType::PrivateKey, EntityType::ApiKey, EntityType::Password,
                             EntityType::Identifier}) {
            tiers_[t] = LabelRecommendation::HighlyConfidential;
        }
        for (EntityType t : {EntityType::Name, EntityType::Address, EntityType::DateOfBirth,
                             EntityType::Diagnosis, EntityType::Medication,
                             EntityType::ExpirationDate}) {
            tiers_[t] = LabelRecommendation::Confidential;
        }
        tiers_[EntityType::Email] = LabelRecommendation::Internal;
        tiers_[EntityType::Phone] = LabelRecommendation::Internal;
    }

    static LabelTierTable fromConfig(const config::ScanConfig &cfg)
    {
        LabelTierTable table;
        for (const auto &kv : cfg.labelTierOverrides) {
            table.setTier(kv.first, kv.second);
        }
        return table;
    }

    void setTier(core::EntityType type, core::LabelRecommendation tier) { tiers_[type] = tier; }

    core::LabelRecommendation tierFor(core::EntityType type) const
    {
        auto it = tiers_.find(type);
        return it == tiers_.end() ? core::LabelRecommendation::HighlyConfidential : it->second;
    }

private:
    std::map<core::EntityType, core::LabelRecommendation> tiers_;
};

class LabelResolver
{
public:
    explicit LabelResolver(LabelTierTable tiers = LabelTierTable())
        : tiers_(std::move(tiers))
    {
    }

    static bool qualifies(const core::ResolvedMatch &m)
    {
        return m.verdict == core::Verdict::TruePositive || m.verdict == core::Verdict::Pending;
    }

    std::optional<core::LabelRecommendation> recommend(const std::vector<core::ResolvedMatch> &matches) const
    {
        std::optional<core::LabelRecommendation> best;
        for (const auto &m : matches) {
            if (!qualifies(m)) {
                continue;
            }
            auto tier = tiers_.tierFor(m.entityType);
            if (!best || tier > *best) {
                best = tier;
            }
        }
        return best;
    }

    const LabelTierTable& tiers() const { return tiers_; }

private:
    LabelTierTable tiers_;
};

} // namespace labeling
} // namespace sensiscan

#endif // SENSISCAN_LABELING_LABEL_RESOLVER_HPP
