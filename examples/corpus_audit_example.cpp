#include "codec/record_codec.hpp"
#include "infrastructure/logging/logger.hpp"
#include "lint/corpus_audit.hpp"
#include "lint/lint_cache.hpp"
#include "lint/lint_rule_set.hpp"
#include "validation/schema_validator.hpp"

#include <iostream>

int main() {
    auto& logger = ARL::Logger::getInstance();
    logger.setLogLevel(ARL::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());

    LOG_INFO("audit_example", "AreaLint corpus audit example");

    // A country, two communities sharing a url_alias and a community with a legacy icon
    const std::string corpus_text = R"([
  {"id": "pt", "type": "country",
   "tags": {"name": "Portugal", "capital": "Lisbon",
            "icon:square": "https://static.btcmap.org/images/areas/pt.png", "verified:date": "2099-01-01",
            "geo_json": {"type": "Polygon", "coordinates": [[[-9.5, 37.0], [-6.2, 37.0], [-6.2, 42.1], [-9.5, 42.1], [-9.5, 37.0]]]}}},
  {"id": "lisbon", "type": "community",
   "tags": {"name": "Lisbon Bitcoiners", "population": 545000, "population:date": "2023-01-01",
            "url_alias": "lisbon", "icon:square": "https://i.imgur.com/lisbon.jpeg",
            "geo_json": {"type": "Polygon", "coordinates": [[[-9.2, 38.7], [-9.1, 38.7], [-9.1, 38.8], [-9.2, 38.8], [-9.2, 38.7]]]}}},
  {"id": "lisbon-2", "type": "community",
   "tags": {"name": "Lisbon Meetup", "population": 545000, "population:date": "2023-01-01", "url_alias": "lisbon"}}
])";

    ARL::RecordCodec::CorpusLoadResult corpus = ARL::RecordCodec::loadCorpus(corpus_text);
    for (const auto& problem : corpus.problems) {
        LOG_WARN("audit_example", "Skipped entry: " + problem);
    }

    ARL::Validation::SchemaValidator validator;
    auto rule_set = ARL::Lint::LintRuleSet::createDefault();
    ARL::Lint::LintCache cache(*rule_set);
    ARL::Lint::CorpusAuditor auditor(validator, cache);
    auditor.rebuild(corpus.records);

    for (const auto& result : auditor.getResults()) {
        std::cout << result.area_id << " (" << result.country_name << ")\n";
        for (const auto& issue : result.issues) {
            std::cout << "  [" << ARL::Lint::severityToString(issue.severity) << "] "
                      << issue.rule_id << ": " << issue.message << "\n";
        }
    }

    ARL::Lint::AuditSummary summary = auditor.getSummary(ARL::Lint::AuditFilter{});
    std::cout << "Areas: " << summary.total_areas << ", with issues: " << summary.areas_with_issues
              << ", issues: " << summary.total_issues << "\n";

    auto stats = cache.getStats();
    LOG_INFO("audit_example", "Lint cache hit ratio: " + std::to_string(stats.hit_ratio));

    LOG_INFO("audit_example", "Corpus audit example completed");
    return 0;
}
