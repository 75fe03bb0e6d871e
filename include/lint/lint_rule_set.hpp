// EN: Lint rule registry for AreaLint - fixed ordered set of rules built once at startup
// FR: Registre de règles de lint pour AreaLint - ensemble ordonné fixe construit une fois au démarrage

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lint/lint_rule.hpp"

namespace ARL::Lint {

class LintRuleSet {
public:
    explicit LintRuleSet(const std::string& version = "1");

    LintRuleSet(const LintRuleSet&) = delete;
    LintRuleSet& operator=(const LintRuleSet&) = delete;

    // EN: Append a rule. Registry order is evaluation order. Throws std::invalid_argument on a duplicate id.
    // FR: Ajoute une règle. L'ordre du registre est l'ordre d'évaluation. Lance std::invalid_argument si l'id existe.
    LintRuleSet& addRule(std::unique_ptr<LintRule> rule);

    const std::vector<std::unique_ptr<LintRule>>& rules() const { return rules_; }
    const LintRule* findRule(const std::string& rule_id) const;
    std::vector<RuleInfo> ruleInfos() const;

    // EN: Apply every rule in registry order. A throwing rule surfaces as LintRuleFault.
    // FR: Applique chaque règle dans l'ordre du registre. Une règle qui lève remonte en LintRuleFault.
    std::vector<LintIssue> evaluate(const NormalizedRecord& record) const;

    // EN: Part of the cache key; bump it whenever rule behavior changes.
    // FR: Fait partie de la clé de cache ; à incrémenter dès qu'un comportement de règle change.
    const std::string& version() const { return version_; }
    size_t size() const { return rules_.size(); }

    // EN: icon-missing, icon-legacy-url, verified-stale, geo-json-missing.
    // FR: icon-missing, icon-legacy-url, verified-stale, geo-json-missing.
    static std::unique_ptr<LintRuleSet> createDefault(const LintSettings& settings = LintSettings{},
                                                      Clock clock = systemClock());

private:
    std::string version_;
    std::vector<std::unique_ptr<LintRule>> rules_;
};

} // namespace ARL::Lint
