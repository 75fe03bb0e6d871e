// EN: Implementation of the AreaLint command line application.
// FR: Implémentation de l'application en ligne de commande AreaLint.

#include "app/application.hpp"

#include <memory>
#include <optional>
#include <ostream>

#include <nlohmann/json.hpp>

#include "codec/record_codec.hpp"
#include "infrastructure/logging/logger.hpp"
#include "lint/builtin_rules.hpp"
#include "lint/auto_fixer.hpp"
#include "lint/corpus_audit.hpp"
#include "lint/lint_cache.hpp"
#include "lint/lint_rule_set.hpp"
#include "validation/schema_validator.hpp"

namespace ARL {
namespace App {

namespace {

int code(ExitCode exit_code) {
    return static_cast<int>(exit_code);
}

// EN: Engine objects shared by the corpus commands, built from the loaded configuration.
// FR: Objets du moteur partagés par les commandes de corpus, construits depuis la configuration chargée.
struct Engine {
    Validation::SchemaValidator validator;
    std::unique_ptr<Lint::LintRuleSet> rules;
    std::unique_ptr<Lint::LintCache> cache;

    explicit Engine(const ConfigManager& config)
        : rules(Lint::LintRuleSet::createDefault(Lint::LintSettings::fromConfig(config))),
          cache(std::make_unique<Lint::LintCache>(*rules, Lint::LintCacheConfig::fromConfig(config))) {}
};

nlohmann::json auditResultToJson(const Lint::AreaAuditResult& result) {
    nlohmann::json json;
    json["area_id"] = result.area_id;
    json["area_name"] = result.area_name;
    json["area_type"] = areaTypeToString(result.area_type);
    json["is_deleted"] = result.is_deleted;
    json["country_id"] = result.country_id ? nlohmann::json(*result.country_id) : nlohmann::json(nullptr);
    json["country_name"] = result.country_name;

    json["validation_errors"] = nlohmann::json::array();
    for (const auto& error : result.validation_errors) {
        json["validation_errors"].push_back(RecordCodec::errorToJson(error));
    }
    json["issues"] = nlohmann::json::array();
    for (const auto& issue : result.issues) {
        json["issues"].push_back(RecordCodec::issueToJson(issue));
    }
    return json;
}

nlohmann::json summaryToJson(const Lint::AuditSummary& summary) {
    return nlohmann::json{
        {"total_areas", summary.total_areas},
        {"total_all_areas", summary.total_all_areas},
        {"deleted_areas", summary.deleted_areas},
        {"invalid_areas", summary.invalid_areas},
        {"areas_with_issues", summary.areas_with_issues},
        {"total_issues", summary.total_issues},
        {"issues_by_rule", summary.issues_by_rule},
        {"issues_by_severity", summary.issues_by_severity},
        {"areas_by_type", summary.areas_by_type},
        {"last_sync", summary.last_sync ? nlohmann::json(formatTimestamp(*summary.last_sync)) : nlohmann::json(nullptr)}
    };
}

} // namespace

Application::Application(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

std::vector<ConfigManager::ValidationRule> Application::configurationRules() {
    using Rule = ConfigManager::ValidationRule;

    Rule log_level;
    log_level.key = "logging.level";
    log_level.type = "string";
    log_level.default_value = ConfigValue(std::string("info"));
    log_level.allowed_values = {"debug", "info", "warn", "warning", "error"};
    log_level.description = "Minimum log level";

    Rule log_file;
    log_file.key = "logging.file";
    log_file.type = "string";
    log_file.default_value = ConfigValue(std::string());
    log_file.description = "NDJSON log file, empty for the console";

    Rule ttl;
    ttl.key = "lint_cache.ttl_seconds";
    ttl.type = "int";
    ttl.default_value = ConfigValue(3600);
    ttl.min_value = 0;
    ttl.description = "Lint cache entry lifetime, 0 disables expiry";

    Rule max_entries;
    max_entries.key = "lint_cache.max_entries";
    max_entries.type = "int";
    max_entries.default_value = ConfigValue(10000);
    max_entries.min_value = 1;
    max_entries.description = "Lint cache capacity before LRU eviction";

    Rule auto_cleanup;
    auto_cleanup.key = "lint_cache.auto_cleanup";
    auto_cleanup.type = "bool";
    auto_cleanup.default_value = ConfigValue(false);

    Rule cleanup_interval;
    cleanup_interval.key = "lint_cache.cleanup_interval_seconds";
    cleanup_interval.type = "int";
    cleanup_interval.default_value = ConfigValue(300);
    cleanup_interval.min_value = 1;

    Rule icon_base_url;
    icon_base_url.key = "lint.icon_base_url";
    icon_base_url.type = "string";
    icon_base_url.default_value = ConfigValue(std::string("https://static.btcmap.org/images/areas/"));
    icon_base_url.description = "Canonical icon URL prefix";

    Rule max_age;
    max_age.key = "lint.verified_max_age_days";
    max_age.type = "int";
    max_age.default_value = ConfigValue(365);
    max_age.min_value = 1;
    max_age.description = "Days before a verification date is stale";

    return {log_level, log_file, ttl, max_entries, auto_cleanup, cleanup_interval, icon_base_url, max_age};
}

CLI::CommandLineParser Application::buildParser() const {
    using CLI::CliOptionDefinition;
    using CLI::CliOptionType;

    CLI::CommandLineParser parser("arealint");
    parser.setHelpHeader("AreaLint - validation and linting of community and country areas");
    parser.setVersionInfo(kVersion);

    parser.addCommand("validate", "validate FILE", "Validate every record of a corpus (JSON array or NDJSON)");
    parser.addCommand("lint", "lint FILE", "Audit a corpus and print lint issues");
    parser.addCommand("fix", "fix FILE --rule ID", "Apply a fixable rule to every affected area");
    parser.addCommand("rules", "rules", "List the registered lint rules");
    parser.addCommand("schema", "schema TYPE", "Describe the fields of community or country areas");

    auto option = [](std::string name, std::optional<char> short_name, CliOptionType type,
                     std::string description, std::string category) {
        CliOptionDefinition definition;
        definition.long_name = std::move(name);
        definition.short_name = short_name;
        definition.type = type;
        definition.description = std::move(description);
        definition.category = std::move(category);
        return definition;
    };

    CliOptionDefinition config = option("config", 'c', CliOptionType::STRING, "YAML configuration file", "General");
    config.value_name = "FILE";
    parser.addOption(config);

    CliOptionDefinition log_level = option("log-level", 'l', CliOptionType::STRING, "Log level", "General");
    log_level.value_name = "LEVEL";
    log_level.config_path = "logging.level";
    log_level.enum_values = {"debug", "info", "warn", "error"};
    parser.addOption(log_level);

    CliOptionDefinition log_file = option("log-file", std::nullopt, CliOptionType::STRING, "Write NDJSON logs to FILE", "General");
    log_file.value_name = "FILE";
    log_file.config_path = "logging.file";
    parser.addOption(log_file);

    CliOptionDefinition cache_ttl = option("cache-ttl", std::nullopt, CliOptionType::INTEGER, "Lint cache TTL in seconds", "General");
    cache_ttl.value_name = "SECONDS";
    cache_ttl.config_path = "lint_cache.ttl_seconds";
    parser.addOption(cache_ttl);

    CliOptionDefinition rule = option("rule", 'r', CliOptionType::STRING, "Only issues of this rule", "Filter");
    rule.value_name = "ID";
    parser.addOption(rule);

    CliOptionDefinition severity = option("severity", 's', CliOptionType::STRING, "Only issues of this severity", "Filter");
    severity.value_name = "LEVEL";
    severity.enum_values = {"info", "warning", "error"};
    parser.addOption(severity);

    CliOptionDefinition type = option("type", 't', CliOptionType::STRING, "Only areas of this type", "Filter");
    type.value_name = "TYPE";
    type.enum_values = {"community", "country"};
    parser.addOption(type);

    CliOptionDefinition tag = option("tag", std::nullopt, CliOptionType::STRING, "Tag exists, or equals V (* wildcards)", "Filter");
    tag.value_name = "K[=V]";
    tag.repeatable = true;
    parser.addOption(tag);

    CliOptionDefinition country = option("country", std::nullopt, CliOptionType::STRING, "Only areas located in this country", "Filter");
    country.value_name = "ID";
    parser.addOption(country);

    parser.addOption(option("include-deleted", std::nullopt, CliOptionType::BOOLEAN, "Include deleted areas", "Filter"));
    parser.addOption(option("all", 'a', CliOptionType::BOOLEAN, "Include areas without issues", "Filter"));
    parser.addOption(option("summary", std::nullopt, CliOptionType::BOOLEAN, "Print summary counts instead of results", "Output"));

    return parser;
}

int Application::run(int argc, char* argv[]) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return run(arguments);
}

int Application::run(const std::vector<std::string>& arguments) {
    CLI::CommandLineParser parser = buildParser();
    CLI::CliParseResult args = parser.parse(arguments);

    switch (args.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            out_ << parser.generateHelpText();
            return code(ExitCode::OK);
        case CLI::CliParseStatus::VERSION_REQUESTED:
            out_ << parser.generateVersionText() << "\n";
            return code(ExitCode::OK);
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            for (const auto& error : args.errors) {
                err_ << "arealint: " << error << "\n";
            }
            err_ << "Try 'arealint --help' for more information.\n";
            return code(ExitCode::USAGE);
    }

    if (!configure(args)) {
        return code(ExitCode::USAGE);
    }

    try {
        if (args.command == "validate") return runValidate(args);
        if (args.command == "lint") return runLint(args);
        if (args.command == "fix") return runFix(args);
        if (args.command == "rules") return runRules();
        if (args.command == "schema") return runSchema(args);
    } catch (const Lint::LintRuleFault& e) {
        LOG_ERROR("cli", std::string("Rule fault: ") + e.what());
        err_ << "arealint: rule " << e.ruleId() << " failed: " << e.what() << "\n";
        return code(ExitCode::FINDINGS);
    } catch (const std::exception& e) {
        LOG_ERROR("cli", std::string("Command failed: ") + e.what());
        err_ << "arealint: " << e.what() << "\n";
        return code(ExitCode::USAGE);
    }

    err_ << "arealint: unknown command '" << args.command << "'\n";
    return code(ExitCode::USAGE);
}

bool Application::configure(const CLI::CliParseResult& args) {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();
    config.addValidationRules(configurationRules());

    if (auto file = args.value("config")) {
        if (!config.loadFromFile(*file)) {
            err_ << "arealint: cannot load configuration " << *file << "\n";
            return false;
        }
    }
    config.loadEnvironmentOverrides();
    CLI::CommandLineParser::applyOverrides(args, config);

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            err_ << "arealint: " << error << "\n";
        }
        return false;
    }

    Logger& logger = Logger::getInstance();
    logger.setConsoleSink(LogSink::STDERR);
    if (auto level = parseLogLevel(config.get("logging", "level").asOrDefault<std::string>("info"))) {
        logger.setLogLevel(*level);
    }
    const std::string log_file = config.get("logging", "file").asOrDefault<std::string>("");
    if (!log_file.empty() && !logger.setOutputFile(log_file)) {
        err_ << "arealint: cannot open log file " << log_file << "\n";
        return false;
    }

    LOG_DEBUG("cli", "Configuration ready for command " + args.command);
    return true;
}

bool Application::corpusPath(const CLI::CliParseResult& args, std::string& path) {
    if (args.positionals.size() != 1) {
        err_ << "arealint: " << args.command << " expects exactly one FILE argument\n";
        return false;
    }
    path = args.positionals.front();
    return true;
}

int Application::runValidate(const CLI::CliParseResult& args) {
    std::string path;
    if (!corpusPath(args, path)) return code(ExitCode::USAGE);

    RecordCodec::CorpusLoadResult corpus = RecordCodec::loadCorpusFile(path);
    for (const auto& problem : corpus.problems) {
        err_ << "arealint: " << path << ": " << problem << "\n";
    }

    Validation::SchemaValidator validator;
    size_t invalid = 0;
    for (const auto& record : corpus.records) {
        Validation::SchemaValidationResult result = validator.validate(record);
        if (!result.is_valid) ++invalid;
        if (result.errors.empty() && result.warnings.empty()) continue;

        nlohmann::json line{{"area_id", record.id}, {"valid", result.is_valid}};
        line["errors"] = nlohmann::json::array();
        for (const auto& error : result.errors) line["errors"].push_back(RecordCodec::errorToJson(error));
        line["warnings"] = nlohmann::json::array();
        for (const auto& warning : result.warnings) line["warnings"].push_back(RecordCodec::errorToJson(warning));
        out_ << line.dump() << "\n";
    }

    out_ << nlohmann::json{{"records", corpus.records.size()}, {"invalid", invalid},
                           {"skipped", corpus.problems.size()}}.dump() << "\n";

    LOG_INFO("cli", "Validated " + std::to_string(corpus.records.size()) + " records, " +
             std::to_string(invalid) + " invalid");
    return (invalid > 0 || !corpus.problems.empty()) ? code(ExitCode::FINDINGS) : code(ExitCode::OK);
}

int Application::runLint(const CLI::CliParseResult& args) {
    std::string path;
    if (!corpusPath(args, path)) return code(ExitCode::USAGE);

    Lint::AuditFilter filter;
    filter.rule_id = args.value("rule");
    if (auto severity = args.value("severity")) filter.severity = Lint::parseSeverity(*severity);
    if (auto type = args.value("type")) filter.area_type = parseAreaType(*type);
    filter.include_deleted = args.has("include-deleted");
    filter.issues_only = !args.has("all");
    filter.country_id = args.value("country");
    for (const auto& tag : args.all("tag")) {
        filter.tag_filters.push_back(Lint::TagFilter::parse(tag));
    }

    Engine engine(ConfigManager::getInstance());
    if (filter.rule_id && !engine.rules->findRule(*filter.rule_id) &&
        *filter.rule_id != Lint::urlAliasClashRuleInfo().id) {
        err_ << "arealint: unknown rule " << *filter.rule_id << "\n";
        return code(ExitCode::USAGE);
    }

    RecordCodec::CorpusLoadResult corpus = RecordCodec::loadCorpusFile(path);
    for (const auto& problem : corpus.problems) {
        err_ << "arealint: " << path << ": " << problem << "\n";
    }

    Lint::CorpusAuditor auditor(engine.validator, *engine.cache);
    auditor.rebuild(corpus.records);

    if (args.has("summary")) {
        out_ << summaryToJson(auditor.getSummary(filter)).dump(2) << "\n";
        return code(ExitCode::OK);
    }

    bool has_errors = false;
    for (const auto& result : auditor.getResults(filter)) {
        for (const auto& issue : result.issues) {
            has_errors = has_errors || issue.severity == Lint::Severity::ERROR;
        }
        out_ << auditResultToJson(result).dump() << "\n";
    }
    return has_errors ? code(ExitCode::FINDINGS) : code(ExitCode::OK);
}

int Application::runFix(const CLI::CliParseResult& args) {
    std::string path;
    if (!corpusPath(args, path)) return code(ExitCode::USAGE);

    auto rule_id = args.value("rule");
    if (!rule_id) {
        err_ << "arealint: fix requires --rule ID\n";
        return code(ExitCode::USAGE);
    }

    Engine engine(ConfigManager::getInstance());
    const Lint::LintRule* rule = engine.rules->findRule(*rule_id);
    if (!rule || !rule->info().fixable) {
        err_ << "arealint: " << Lint::UnknownRuleError(*rule_id).what() << "\n";
        return code(ExitCode::USAGE);
    }

    RecordCodec::CorpusLoadResult corpus = RecordCodec::loadCorpusFile(path);
    for (const auto& problem : corpus.problems) {
        err_ << "arealint: " << path << ": " << problem << "\n";
    }

    Lint::AutoFixer fixer(engine.validator, *engine.cache);
    Lint::CorpusAuditor auditor(engine.validator, *engine.cache);
    auditor.rebuild(corpus.records);

    Lint::AuditFilter filter;
    filter.rule_id = *rule_id;

    size_t failed = 0;
    for (const auto& result : auditor.getResults(filter)) {
        auto record = auditor.normalizedRecord(result.area_id);
        if (!record) continue;

        Lint::FixResult fix = fixer.apply(*rule_id, *record);

        if (!fix.success) ++failed;

        nlohmann::json line{{"area_id", result.area_id}, {"success", fix.success}, {"message", fix.message}};
        line["record"] = fix.record ? RecordCodec::toJson(*fix.record) : nlohmann::json(nullptr);
        line["errors"] = nlohmann::json::array();
        for (const auto& error : fix.errors) line["errors"].push_back(RecordCodec::errorToJson(error));
        out_ << line.dump() << "\n";
    }

    return failed > 0 ? code(ExitCode::FINDINGS) : code(ExitCode::OK);
}

int Application::runRules() {
    auto rules = Lint::LintRuleSet::createDefault(Lint::LintSettings::fromConfig(ConfigManager::getInstance()));
    for (const auto& info : rules->ruleInfos()) {
        out_ << RecordCodec::ruleToJson(info).dump() << "\n";
    }
    out_ << RecordCodec::ruleToJson(Lint::urlAliasClashRuleInfo()).dump() << "\n";
    return code(ExitCode::OK);
}

int Application::runSchema(const CLI::CliParseResult& args) {
    if (args.positionals.size() != 1) {
        err_ << "arealint: schema expects one TYPE argument (community or country)\n";
        return code(ExitCode::USAGE);
    }
    auto type = parseAreaType(args.positionals.front());
    if (!type) {
        err_ << "arealint: unknown area type " << args.positionals.front() << "\n";
        return code(ExitCode::USAGE);
    }

    Validation::SchemaValidator validator;
    out_ << validator.describe(*type);
    return code(ExitCode::OK);
}

} // namespace App
} // namespace ARL
