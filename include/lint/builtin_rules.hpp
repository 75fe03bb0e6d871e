// EN: Built-in per-area lint rules for AreaLint
// FR: Règles de lint intégrées par zone pour AreaLint

#pragma once

#include <string>

#include "lint/lint_rule.hpp"

namespace ARL::Lint {

// EN: `icon:square` absent, empty or still "pending-upload".
// FR: `icon:square` absent, vide ou encore "pending-upload".
class IconMissingRule : public LintRule {
public:
    IconMissingRule();

    const RuleInfo& info() const override { return info_; }
    std::optional<LintIssue> evaluate(const NormalizedRecord& record) const override;

private:
    RuleInfo info_;
};

// EN: Icon not hosted at <base><area id>.<ext>. The fix rewrites the tag; uploading the asset is the adapter's job.
// FR: Icône non hébergée à <base><id de zone>.<ext>. Le correctif réécrit le tag ; l'envoi du fichier revient à l'adaptateur.
class IconLegacyUrlRule : public LintRule {
public:
    explicit IconLegacyUrlRule(const std::string& icon_base_url);

    const RuleInfo& info() const override { return info_; }
    std::optional<LintIssue> evaluate(const NormalizedRecord& record) const override;
    std::optional<NormalizedRecord> autofix(const NormalizedRecord& record) const override;

    // EN: Canonical icon URL for an area, keeping a usable extension of `current` (png otherwise).
    // FR: URL d'icône canonique d'une zone, en gardant une extension utilisable de `current` (png sinon).
    std::string canonicalUrl(const std::string& area_id, const std::string& current) const;

    bool isCanonical(const std::string& area_id, const std::string& icon_url) const;

private:
    RuleInfo info_;
    std::string icon_base_url_;
};

// EN: `verified:date` (else updated_at) older than the allowed age, or no date at all.
// FR: `verified:date` (sinon updated_at) plus ancien que l'âge autorisé, ou aucune date.
class VerifiedStaleRule : public LintRule {
public:
    VerifiedStaleRule(int max_age_days, Clock clock);

    const RuleInfo& info() const override { return info_; }
    std::optional<LintIssue> evaluate(const NormalizedRecord& record) const override;
    std::optional<NormalizedRecord> autofix(const NormalizedRecord& record) const override;

private:
    RuleInfo info_;
    int max_age_days_;
    Clock clock_;
};

// EN: No boundary geometry, so no area and no country can be derived.
// FR: Pas de géométrie de limite, donc ni surface ni pays ne peuvent être dérivés.
class GeoJsonMissingRule : public LintRule {
public:
    GeoJsonMissingRule();

    const RuleInfo& info() const override { return info_; }
    std::optional<LintIssue> evaluate(const NormalizedRecord& record) const override;

private:
    RuleInfo info_;
};

// EN: Description of the corpus-level url_alias clash rule (evaluated by CorpusAuditor).
// FR: Description de la règle de collision url_alias au niveau corpus (évaluée par CorpusAuditor).
const RuleInfo& urlAliasClashRuleInfo();

} // namespace ARL::Lint
