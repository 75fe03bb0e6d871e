// EN: Implementation of the LintRuleSet registry.
// FR: Implémentation du registre LintRuleSet.

#include "lint/lint_rule_set.hpp"
#include "infrastructure/logging/logger.hpp"
#include "lint/builtin_rules.hpp"

#include <stdexcept>

namespace ARL::Lint {

LintRuleSet::LintRuleSet(const std::string& version)
    : version_(version) {}

LintRuleSet& LintRuleSet::addRule(std::unique_ptr<LintRule> rule) {
    if (!rule) {
        throw std::invalid_argument("Cannot register a null lint rule");
    }
    const std::string& id = rule->info().id;
    if (findRule(id)) {
        throw std::invalid_argument("Duplicate lint rule id: " + id);
    }
    rules_.push_back(std::move(rule));
    return *this;
}

const LintRule* LintRuleSet::findRule(const std::string& rule_id) const {
    for (const auto& rule : rules_) {
        if (rule->info().id == rule_id) {
            return rule.get();
        }
    }
    return nullptr;
}

std::vector<RuleInfo> LintRuleSet::ruleInfos() const {
    std::vector<RuleInfo> infos;
    infos.reserve(rules_.size());
    for (const auto& rule : rules_) {
        infos.push_back(rule->info());
    }
    return infos;
}

std::vector<LintIssue> LintRuleSet::evaluate(const NormalizedRecord& record) const {
    std::vector<LintIssue> issues;

    for (const auto& rule : rules_) {
        const std::string& rule_id = rule->info().id;
        std::optional<LintIssue> issue;
        try {
            issue = rule->evaluate(record);
        } catch (const std::exception& e) {
            LOG_ERROR_META("lint_rules", "Lint rule faulted", (std::unordered_map<std::string, std::string>{
                {"rule_id", rule_id}, {"area_id", record.id}, {"error", e.what()}}));
            throw LintRuleFault(rule_id, e.what());
        }

        if (issue) {
            issues.push_back(std::move(*issue));
        }
    }

    LOG_DEBUG("lint_rules", "Area " + record.id + " evaluated by " + std::to_string(rules_.size()) +
                            " rule(s): " + std::to_string(issues.size()) + " issue(s)");
    return issues;
}

std::unique_ptr<LintRuleSet> LintRuleSet::createDefault(const LintSettings& settings, Clock clock) {
    auto rule_set = std::make_unique<LintRuleSet>(settings.ruleset_version);
    rule_set->addRule(std::make_unique<IconMissingRule>());
    rule_set->addRule(std::make_unique<IconLegacyUrlRule>(settings.icon_base_url));
    rule_set->addRule(std::make_unique<VerifiedStaleRule>(settings.verified_max_age_days, std::move(clock)));
    rule_set->addRule(std::make_unique<GeoJsonMissingRule>());
    return rule_set;
}

} // namespace ARL::Lint
