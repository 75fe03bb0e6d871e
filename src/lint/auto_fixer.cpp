// EN: Implementation of the AutoFixer.
// FR: Implémentation de l'AutoFixer.

#include "lint/auto_fixer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace ARL::Lint {

AutoFixer::AutoFixer(const Validation::SchemaValidator& validator, LintCache& cache)
    : validator_(validator), cache_(cache) {}

FixResult AutoFixer::apply(const std::string& rule_id, const NormalizedRecord& record) const {
    const LintRule* rule = cache_.ruleSet().findRule(rule_id);
    if (!rule || !rule->info().fixable) {
        throw UnknownRuleError(rule_id);
    }

    FixResult result;

    std::optional<NormalizedRecord> fixed;
    try {
        fixed = rule->autofix(record);
    } catch (const std::exception& e) {
        LOG_ERROR("auto_fixer", "Fix of rule " + rule_id + " faulted on area " + record.id + ": " + e.what());
        throw LintRuleFault(rule_id, e.what());
    }

    if (!fixed) {
        result.message = "Rule " + rule_id + " has no fix for area " + record.id;
        LOG_INFO("auto_fixer", result.message);
        return result;
    }

    // EN: A fix is never trusted without a full validation pass.
    // FR: Un correctif n'est jamais accepté sans une validation complète.
    Validation::SchemaValidationResult validation = validator_.validate(fixed->toAreaRecord());
    if (!validation.is_valid) {
        result.errors = std::move(validation.errors);
        result.message = "Fix " + rule->info().fix_action + " produced an invalid record for area " + record.id;
        LOG_WARN("auto_fixer", result.message);
        return result;
    }

    result.remaining_issues = cache_.getOrCompute(record.id, *validation.record);
    result.record = std::move(validation.record);

    const bool still_reported = std::any_of(result.remaining_issues.begin(), result.remaining_issues.end(),
                                            [&rule_id](const LintIssue& issue) { return issue.rule_id == rule_id; });
    result.success = !still_reported;
    result.message = still_reported
        ? "Rule " + rule_id + " still reports an issue after " + rule->info().fix_action
        : "Applied " + rule->info().fix_action + " to area " + record.id;

    LOG_INFO_META("auto_fixer", result.message, (std::unordered_map<std::string, std::string>{
        {"rule_id", rule_id}, {"area_id", record.id},
        {"remaining_issues", std::to_string(result.remaining_issues.size())}}));
    return result;
}

} // namespace ARL::Lint
