// EN: Auto-fix pipeline for AreaLint - apply a rule's fix, then re-validate and re-lint the result
// FR: Pipeline d'auto-correction pour AreaLint - applique le correctif d'une règle puis re-valide et re-linte le résultat

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lint/lint_cache.hpp"
#include "lint/lint_rule.hpp"
#include "validation/schema_validator.hpp"

namespace ARL::Lint {

// EN: Outcome of one fix. `record` is set only when the fixed record passed validation.
// FR: Résultat d'un correctif. `record` n'est défini que si l'enregistrement corrigé a passé la validation.
struct FixResult {
    bool success{false};
    std::optional<NormalizedRecord> record;
    std::vector<Validation::ValidationError> errors;
    std::vector<LintIssue> remaining_issues;
    std::string message;
};

class AutoFixer {
public:
    AutoFixer(const Validation::SchemaValidator& validator, LintCache& cache);

    // EN: Throws UnknownRuleError for an unregistered or non-fixable rule, LintRuleFault when the fix throws.
    // FR: Lance UnknownRuleError pour une règle inconnue ou non corrigeable, LintRuleFault si le correctif lève.
    FixResult apply(const std::string& rule_id, const NormalizedRecord& record) const;

private:
    const Validation::SchemaValidator& validator_;
    LintCache& cache_;
};

} // namespace ARL::Lint
