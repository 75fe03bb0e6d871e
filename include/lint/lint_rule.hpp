// EN: Lint rule interface for AreaLint - stateless predicates over normalized area records
// FR: Interface de règle de lint pour AreaLint - prédicats sans état sur enregistrements normalisés

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "types/area_record.hpp"

namespace ARL {
class ConfigManager;
}

namespace ARL::Lint {

// EN: Issue severities
// FR: Sévérités des problèmes
enum class Severity {
    INFO,
    WARNING,
    ERROR
};

std::string severityToString(Severity severity);
std::optional<Severity> parseSeverity(const std::string& text);

// EN: Static description of a rule
// FR: Description statique d'une règle
struct RuleInfo {
    std::string id;
    std::string name;
    std::string description;
    Severity severity{Severity::WARNING};
    bool fixable{false};
    std::string fix_action;     // EN: Empty when not fixable / FR: Vide si non corrigeable
};

// EN: One finding of one rule on one area.
// FR: Un constat d'une règle sur une zone.
struct LintIssue {
    std::string rule_id;
    std::string rule_name;
    std::string area_id;
    Severity severity{Severity::WARNING};
    std::string message;
    bool fixable{false};
    std::string fix_action;
    std::optional<std::string> current_value;
    nlohmann::json extra;       // EN: Rule-specific data (object) or null / FR: Données propres à la règle (objet) ou null

    bool operator==(const LintIssue& other) const {
        return rule_id == other.rule_id && area_id == other.area_id && severity == other.severity &&
               message == other.message && fixable == other.fixable && current_value == other.current_value &&
               extra == other.extra;
    }
    bool operator!=(const LintIssue& other) const { return !(*this == other); }
};

// EN: Thrown when a rule's evaluate or autofix raises. A defect, never a "no issue" result.
// FR: Lancée quand evaluate ou autofix d'une règle lève une exception. Un défaut, jamais un résultat "sans problème".
class LintRuleFault : public std::runtime_error {
public:
    LintRuleFault(const std::string& rule_id, const std::string& what)
        : std::runtime_error("Lint rule '" + rule_id + "' faulted: " + what), rule_id_(rule_id) {}

    const std::string& ruleId() const { return rule_id_; }

private:
    std::string rule_id_;
};

// EN: Auto-fix requested for a rule that is not registered or not fixable.
// FR: Auto-fix demandé pour une règle non enregistrée ou non corrigeable.
class UnknownRuleError : public std::runtime_error {
public:
    explicit UnknownRuleError(const std::string& rule_id)
        : std::runtime_error("Unknown or non-fixable lint rule: " + rule_id), rule_id_(rule_id) {}

    const std::string& ruleId() const { return rule_id_; }

private:
    std::string rule_id_;
};

// EN: Source of "now", injected so time-based rules are testable.
// FR: Source de "maintenant", injectée pour rendre testables les règles temporelles.
using Clock = std::function<TimePoint()>;

Clock systemClock();

// EN: Rule parameters read from the `lint` configuration section.
// FR: Paramètres des règles lus depuis la section de configuration `lint`.
struct LintSettings {
    std::string icon_base_url = "https://static.btcmap.org/images/areas/";
    int verified_max_age_days = 365;
    std::string ruleset_version = "1";

    static LintSettings fromConfig(const ConfigManager& config);
};

// EN: Base class of every rule. Implementations must be pure and must not throw for a well-formed record.
// FR: Classe de base de toute règle. Les implémentations doivent être pures et ne pas lever pour un enregistrement bien formé.
class LintRule {
public:
    virtual ~LintRule() = default;

    virtual const RuleInfo& info() const = 0;

    virtual std::optional<LintIssue> evaluate(const NormalizedRecord& record) const = 0;

    // EN: New record with the problem fixed, or nullopt when the rule cannot fix this record.
    // FR: Nouvel enregistrement corrigé, ou nullopt quand la règle ne peut pas corriger cet enregistrement.
    virtual std::optional<NormalizedRecord> autofix(const NormalizedRecord& record) const;

protected:
    LintIssue makeIssue(const NormalizedRecord& record, const std::string& message,
                        std::optional<std::string> current_value = std::nullopt) const;
};

} // namespace ARL::Lint
