// EN: Shared lint rule helpers and settings.
// FR: Utilitaires partagés des règles de lint et paramètres.

#include "lint/lint_rule.hpp"
#include "infrastructure/config/config_manager.hpp"

#include <algorithm>
#include <cctype>

namespace ARL::Lint {

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO:    return "info";
        case Severity::WARNING: return "warning";
        case Severity::ERROR:   return "error";
        default:                return "unknown";
    }
}

std::optional<Severity> parseSeverity(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "info") return Severity::INFO;
    if (lower == "warning" || lower == "warn") return Severity::WARNING;
    if (lower == "error") return Severity::ERROR;
    return std::nullopt;
}

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

LintSettings LintSettings::fromConfig(const ConfigManager& config) {
    LintSettings settings;
    settings.icon_base_url =
        config.get("lint", "icon_base_url").asOrDefault<std::string>(settings.icon_base_url);
    settings.verified_max_age_days =
        config.get("lint", "verified_max_age_days").asOrDefault<int>(settings.verified_max_age_days);

    // EN: A bare number in YAML parses as int; the version stays a string.
    // FR: Un nombre nu en YAML est parsé en int ; la version reste une chaîne.
    ConfigValue version = config.get("lint", "ruleset_version");
    if (auto text = version.tryAs<std::string>()) {
        settings.ruleset_version = *text;
    } else if (version.isValid()) {
        settings.ruleset_version = version.toString();
    }
    return settings;
}

std::optional<NormalizedRecord> LintRule::autofix(const NormalizedRecord&) const {
    return std::nullopt;
}

LintIssue LintRule::makeIssue(const NormalizedRecord& record, const std::string& message,
                              std::optional<std::string> current_value) const {
    const RuleInfo& rule = info();
    LintIssue issue;
    issue.rule_id = rule.id;
    issue.rule_name = rule.name;
    issue.area_id = record.id;
    issue.severity = rule.severity;
    issue.message = message;
    issue.fixable = rule.fixable;
    issue.fix_action = rule.fix_action;
    issue.current_value = std::move(current_value);
    return issue;
}

} // namespace ARL::Lint
