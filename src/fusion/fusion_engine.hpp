#ifndef SENSISCAN_FUSION_FUSION_ENGINE_HPP
#define SENSISCAN_FUSION_FUSION_ENGINE_HPP

#include <algorithm>
#include <map>
#include <numeric>
#include <set>
#include <vector>
#include "config/scan_config.hpp"
#include "core/match_types.hpp"
#include "core/redaction.hpp"
#include "labeling/label_resolver.hpp"
#include "util/version_compare.hpp"

/**
 * @file fusion_engine.hpp
 * @brief Merges overlapping candidates into calibrated, redacted matches.
 *
 * DESIGN GOALS:
 *   - Candidates whose spans overlap and whose types are compatible end up
 *     in one group. Grouping is transitive (union-find over all pairs).
 *   - One ResolvedMatch per group: most specific type, union of sources,
 *     calibrated confidence, verdict and redacted value. The raw value never
 *     leaves this stage.
 *   - Output is ordered by span start, then by the priority of the leading
 *     detector source.
 *
 * CALIBRATION:
 *   - If a classifier signal is present its score is the confidence (the
 *     highest model version wins, later signals win ties).
 *   - Otherwise: max raw confidence + corroborationBonus for each extra
 *     distinct non-classifier source, capped at 1.0.
 *   - Verdict: test data -> FP; confidence >= reviewThreshold -> TP;
 *     otherwise PENDING.
 */

namespace sensiscan {
namespace fusion {

/**
 * @brief Which distinct entity types may be merged.
 *
 * Identical types always are. The generic `identifier` type merges with the
 * specific identifier-like types listed here.
 */
class CompatibilityTable
{
public:
    static bool compatible(core::EntityType a, core::EntityType b)
    {
        if (a == b) {
            return true;
        }
        if (core::isGeneric(a)) {
            return identifierLike(b);
        }
        if (core::isGeneric(b)) {
            return identifierLike(a);
        }
        return false;
    }

private:
    static bool identifierLike(core::EntityType t)
    {
        using core::EntityType;
        return t == EntityType::Ssn || t == EntityType::MedicalRecordNumber
            || t == EntityType::HealthPlanId || t == EntityType::CreditCard
            || t == EntityType::ApiKey;
    }
};

struct FusionConfig
{
    double reviewThreshold = 0.85;
    double corroborationBonus = 0.10;

    static FusionConfig fromConfig(const config::ScanConfig &cfg)
    {
        FusionConfig fc;
        fc.reviewThreshold = cfg.reviewThreshold;
        fc.corroborationBonus = cfg.corroborationBonus;
        return fc;
    }
};

class FusionEngine
{
public:
    FusionEngine(FusionConfig cfg = FusionConfig(),
                 core::RedactionTable redaction = core::RedactionTable(),
                 labeling::LabelTierTable tiers = labeling::LabelTierTable())
        : cfg_(cfg), redaction_(std::move(redaction)), tiers_(std::move(tiers))
    {
    }

    static FusionEngine fromConfig(const config::ScanConfig &cfg)
    {
        return FusionEngine(FusionConfig::fromConfig(cfg), cfg.buildRedactionTable(),
                            labeling::LabelTierTable::fromConfig(cfg));
    }

    const FusionConfig& config() const { return cfg_; }
    const core::RedactionTable& redaction() const { return redaction_; }

    static core::Verdict verdictFor(double confidence, bool isTestData, double reviewThreshold)
    {
        if (isTestData) {
            return core::Verdict::FalsePositive;
        }
        return confidence >= reviewThreshold ? core::Verdict::TruePositive : core::Verdict::Pending;
    }

    std::vector<core::ResolvedMatch> fuse(const std::vector<core::CandidateMatch> &candidates) const
    {
        const size_t n = candidates.size();
        std::vector<size_t> parent(n);
        std::iota(parent.begin(), parent.end(), 0);

        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                const auto &a = candidates[i];
                const auto &b = candidates[j];
                if (a.span().overlaps(b.span())
                    && CompatibilityTable::compatible(a.entityType(), b.entityType())) {
                    unite(parent, i, j);
                }
            }
        }

        std::map<size_t, std::vector<size_t>> groups;
        for (size_t i = 0; i < n; ++i) {
            groups[find(parent, i)].push_back(i);
        }

        std::vector<core::ResolvedMatch> out;
        out.reserve(groups.size());
        for (const auto &kv : groups) {
            out.push_back(resolveGroup(candidates, kv.second));
        }

        std::stable_sort(out.begin(), out.end(),
                         [](const core::ResolvedMatch &x, const core::ResolvedMatch &y) {
                             if (x.span.start != y.span.start) {
                                 return x.span.start < y.span.start;
                             }
                             return x.leadingSource() < y.leadingSource();
                         });
        return out;
    }

private:
    FusionConfig cfg_;
    core::RedactionTable redaction_;
    labeling::LabelTierTable tiers_;

    static size_t find(std::vector<size_t> &parent, size_t i)
    {
        while (parent[i] != i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    }

    static void unite(std::vector<size_t> &parent, size_t a, size_t b)
    {
        size_t ra = find(parent, a);
        size_t rb = find(parent, b);
        if (ra != rb) {
            // Keep the earliest index as root so group iteration order is stable.
            if (ra < rb) {
                parent[rb] = ra;
            } else {
                parent[ra] = rb;
            }
        }
    }

    /// True if `a` should be preferred over `b` as the canonical type.
    bool moreSpecific(core::EntityType a, core::EntityType b) const
    {
        if (core::isGeneric(a) != core::isGeneric(b)) {
            return core::isGeneric(b);
        }
        auto ta = tiers_.tierFor(a);
        auto tb = tiers_.tierFor(b);
        if (ta != tb) {
            return ta > tb;
        }
        return static_cast<int>(a) < static_cast<int>(b);
    }

    core::ResolvedMatch resolveGroup(const std::vector<core::CandidateMatch> &candidates,
                                     const std::vector<size_t> &members) const
    {
        core::EntityType canonical = candidates[members.front()].entityType();
        for (size_t idx : members) {
            if (moreSpecific(candidates[idx].entityType(), canonical)) {
                canonical = candidates[idx].entityType();
            }
        }

        core::ResolvedMatch rm;
        rm.entityType = canonical;

        const core::CandidateMatch *representative = nullptr;
        const core::CandidateMatch *classifierSignal = nullptr;
        double maxRaw = 0.0;
        std::set<core::DetectorSource> nonClassifierSources;

        for (size_t idx : members) {
            const auto &c = candidates[idx];
            rm.contributingSources.insert(c.source());
            rm.isTestData = rm.isTestData || c.isTestData();

            if (c.source() == core::DetectorSource::Classifier) {
                if (!classifierSignal || newerOrEqual(c, *classifierSignal)) {
                    classifierSignal = &c;
                }
                continue;
            }
            nonClassifierSources.insert(c.source());
            maxRaw = std::max(maxRaw, c.rawConfidence());

            bool better = !representative
                || (c.entityType() == canonical && representative->entityType() != canonical)
                || (c.entityType() == representative->entityType()
                    && c.rawConfidence() > representative->rawConfidence());
            if (better) {
                representative = &c;
            }
        }
        if (!representative) {
            representative = classifierSignal;
        }

        if (classifierSignal) {
            rm.finalConfidence = classifierSignal->rawConfidence();
            rm.modelVersion = classifierSignal->modelVersion();
        } else {
            double extra = nonClassifierSources.empty() ? 0.0
                         : static_cast<double>(nonClassifierSources.size() - 1);
            rm.finalConfidence = std::min(1.0, maxRaw + cfg_.corroborationBonus * extra);
        }

        rm.verdict = verdictFor(rm.finalConfidence, rm.isTestData, cfg_.reviewThreshold);
        rm.span = representative->span();
        rm.redactedValue = redaction_.redact(representative->rawValue(), canonical);
        rm.contextSnippet = core::RedactionTable::anonymizeContext(representative->context(),
                                                                   representative->rawValue(),
                                                                   canonical);
        return rm;
    }

    static bool newerOrEqual(const core::CandidateMatch &a, const core::CandidateMatch &b)
    {
        const std::string va = a.modelVersion().value_or("");
        const std::string vb = b.modelVersion().value_or("");
        return util::compareVersions(va, vb) >= 0;
    }
};

} // namespace fusion
} // namespace sensiscan

#endif // SENSISCAN_FUSION_FUSION_ENGINE_HPP
