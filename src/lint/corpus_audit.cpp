// EN: Implementation of the CorpusAuditor.
// FR: Implémentation du CorpusAuditor.

#include "lint/corpus_audit.hpp"
#include "lint/builtin_rules.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <set>

namespace ARL::Lint {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// EN: Text form of a tag value as filters see it: strings unquoted, everything else as JSON.
// FR: Forme texte d'une valeur de tag vue par les filtres : chaînes sans guillemets, le reste en JSON.
std::string tagText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

TagFilter TagFilter::parse(const std::string& text) {
    TagFilter filter;
    const size_t eq = text.find('=');
    if (eq == std::string::npos) {
        filter.key = text;
    } else {
        filter.key = text.substr(0, eq);
        filter.pattern = text.substr(eq + 1);
    }
    return filter;
}

CorpusAuditor::CorpusAuditor(const Validation::SchemaValidator& validator, LintCache& cache, Clock clock)
    : validator_(validator), cache_(cache), clock_(std::move(clock)) {}

AreaAuditResult CorpusAuditor::audit(const AreaRecord& record, std::optional<NormalizedRecord>& normalized) const {
    AreaAuditResult result;
    result.area_id = record.id;
    result.area_type = record.type;
    result.is_deleted = record.isDeleted();

    Validation::SchemaValidationResult validation = validator_.validate(record);
    result.validation_errors = std::move(validation.errors);

    if (validation.record) {
        normalized = std::move(validation.record);
        result.tags = normalized->allTags();
        if (!result.is_deleted) {
            result.issues = cache_.getOrCompute(record.id, *normalized);
        }
    } else {
        result.tags = record.tags;
        LOG_DEBUG("corpus_audit", "Area " + record.id + " failed validation with " +
                  std::to_string(result.validation_errors.size()) + " errors");
    }

    auto name = result.tags.find("name");
    if (name != result.tags.end() && name->second.is_string() && !name->second.get<std::string>().empty()) {
        result.area_name = name->second.get<std::string>();
    }
    return result;
}

void CorpusAuditor::storeLocked(AreaAuditResult result, std::optional<NormalizedRecord> normalized) {
    const std::string id = result.area_id;

    if (normalized) {
        normalized_[id] = std::move(*normalized);
    } else {
        normalized_.erase(id);
    }

    auto pos = positions_.find(id);
    if (pos != positions_.end()) {
        results_[pos->second] = std::move(result);
    } else {
        positions_[id] = results_.size();
        results_.push_back(std::move(result));
    }
}

void CorpusAuditor::buildCountryIndexLocked() {
    country_index_.clear();
    for (const auto& result : results_) {
        if (result.area_type != AreaType::COUNTRY || result.is_deleted) {
            continue;
        }
        auto normalized = normalized_.find(result.area_id);
        if (normalized == normalized_.end()) {
            continue;
        }
        if (const nlohmann::json* geometry = normalized->second.findTag("geo_json")) {
            country_index_.addCountry(result.area_id, result.area_name, *geometry);
        }
    }
    country_index_.build();
}

void CorpusAuditor::locateLocked(AreaAuditResult& result) const {
    result.country_id.reset();
    result.country_name = "Unknown";
    if (result.area_type == AreaType::COUNTRY) {
        return;
    }

    auto normalized = normalized_.find(result.area_id);
    if (normalized == normalized_.end()) {
        return;
    }
    const nlohmann::json* geometry = normalized->second.findTag("geo_json");
    if (!geometry) {
        return;
    }
    if (auto country = country_index_.locate(*geometry)) {
        result.country_id = country->id;
        result.country_name = country->name;
    }
}

void CorpusAuditor::detectUrlAliasClashesLocked() {
    const std::string& clash_rule = urlAliasClashRuleInfo().id;

    for (auto& result : results_) {
        result.issues.erase(std::remove_if(result.issues.begin(), result.issues.end(),
                                           [&clash_rule](const LintIssue& issue) { return issue.rule_id == clash_rule; }),
                            result.issues.end());
    }

    // EN: Alias -> positions in results_, in corpus order.
    // FR: Alias -> positions dans results_, dans l'ordre du corpus.
    std::map<std::string, std::vector<size_t>> aliases;
    for (size_t i = 0; i < results_.size(); ++i) {
        if (results_[i].is_deleted) {
            continue;
        }
        auto alias = results_[i].tags.find("url_alias");
        if (alias == results_[i].tags.end() || !alias->second.is_string()) {
            continue;
        }
        const std::string text = alias->second.get<std::string>();
        if (!text.empty()) {
            aliases[text].push_back(i);
        }
    }

    const RuleInfo& rule = urlAliasClashRuleInfo();
    size_t clashes = 0;
    for (const auto& [alias, positions] : aliases) {
        if (positions.size() < 2) {
            continue;
        }
        ++clashes;

        for (size_t current : positions) {
            nlohmann::json ids = nlohmann::json::array();
            nlohmann::json names = nlohmann::json::array();
            for (size_t other : positions) {
                if (other != current) {
                    ids.push_back(results_[other].area_id);
                    names.push_back(results_[other].area_name);
                }
            }

            LintIssue issue;
            issue.rule_id = rule.id;
            issue.rule_name = rule.name;
            issue.area_id = results_[current].area_id;
            issue.severity = rule.severity;
            issue.message = "Duplicate url_alias shared by " + std::to_string(positions.size()) + " areas";
            issue.fixable = false;
            issue.current_value = alias;
            issue.extra = {{"clashing_area_ids", ids}, {"clashing_area_names", names}};
            results_[current].issues.push_back(std::move(issue));
        }
    }

    if (clashes > 0) {
        LOG_WARN("corpus_audit", "URL alias clash detection: " + std::to_string(clashes) + " clashes found");
    }
}

AreaAuditResult CorpusAuditor::updateArea(const AreaRecord& record) {
    std::optional<NormalizedRecord> normalized;
    AreaAuditResult result = audit(record, normalized);

    std::lock_guard<std::mutex> lock(mutex_);
    storeLocked(std::move(result), std::move(normalized));

    if (record.type == AreaType::COUNTRY) {
        // EN: A country boundary may have moved, so every area is located again.
        // FR: Une frontière a pu bouger, toutes les zones sont donc relocalisées.
        buildCountryIndexLocked();
        for (auto& stored : results_) {
            locateLocked(stored);
        }
    } else {
        locateLocked(results_[positions_.at(record.id)]);
    }

    detectUrlAliasClashesLocked();
    return results_[positions_.at(record.id)];
}

void CorpusAuditor::rebuild(const std::vector<AreaRecord>& corpus) {
    LOG_INFO("corpus_audit", "Auditing corpus of " + std::to_string(corpus.size()) + " areas");

    std::vector<std::pair<AreaAuditResult, std::optional<NormalizedRecord>>> audited;
    audited.reserve(corpus.size());
    for (const auto& record : corpus) {
        std::optional<NormalizedRecord> normalized;
        AreaAuditResult result = audit(record, normalized);
        audited.emplace_back(std::move(result), std::move(normalized));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
    positions_.clear();
    normalized_.clear();
    for (auto& [result, normalized] : audited) {
        storeLocked(std::move(result), std::move(normalized));
    }

    buildCountryIndexLocked();
    for (auto& result : results_) {
        locateLocked(result);
    }
    detectUrlAliasClashesLocked();
    last_sync_ = clock_();

    size_t invalid = 0;
    size_t issues = 0;
    for (const auto& result : results_) {
        if (!result.isValid()) ++invalid;
        issues += result.issues.size();
    }
    LOG_INFO_META("corpus_audit", "Corpus audit complete", (std::unordered_map<std::string, std::string>{
        {"areas", std::to_string(results_.size())},
        {"invalid_areas", std::to_string(invalid)},
        {"issues", std::to_string(issues)},
        {"countries_indexed", std::to_string(country_index_.size())}}));
}

bool CorpusAuditor::matchesTagFilters(const TagMap& tags, const std::vector<TagFilter>& filters) {
    for (const auto& filter : filters) {
        auto tag = tags.find(filter.key);
        if (tag == tags.end() || tag->second.is_null()) {
            return false;
        }
        if (!filter.pattern) {
            continue;
        }

        const std::string value = tagText(tag->second);
        if (filter.pattern->find('*') != std::string::npos) {
            if (fnmatch(filter.pattern->c_str(), value.c_str(), 0) != 0) {
                return false;
            }
        } else if (value != *filter.pattern) {
            return false;
        }
    }
    return true;
}

std::optional<AreaAuditResult> CorpusAuditor::applyFilter(const AreaAuditResult& result, const AuditFilter& filter) {
    if (!filter.include_deleted && result.is_deleted) {
        return std::nullopt;
    }
    if (filter.area_type && result.area_type != *filter.area_type) {
        return std::nullopt;
    }
    if (filter.country_id && result.area_type != AreaType::COUNTRY && result.country_id != filter.country_id) {
        return std::nullopt;
    }
    if (!filter.tag_filters.empty() && !matchesTagFilters(result.tags, filter.tag_filters)) {
        return std::nullopt;
    }

    AreaAuditResult narrowed = result;
    narrowed.issues.erase(std::remove_if(narrowed.issues.begin(), narrowed.issues.end(),
                                         [&filter](const LintIssue& issue) {
                                             return (filter.rule_id && issue.rule_id != *filter.rule_id) ||
                                                    (filter.severity && issue.severity != *filter.severity);
                                         }),
                          narrowed.issues.end());

    if (filter.issues_only && narrowed.issues.empty()) {
        return std::nullopt;
    }
    return narrowed;
}

std::vector<AreaAuditResult> CorpusAuditor::getResults(const AuditFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AreaAuditResult> selected;
    for (const auto& result : results_) {
        if (auto narrowed = applyFilter(result, filter)) {
            selected.push_back(std::move(*narrowed));
        }
    }
    return selected;
}

AuditSummary CorpusAuditor::getSummary(const AuditFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    AuditSummary summary;
    summary.total_all_areas = results_.size();
    summary.last_sync = last_sync_;

    for (const auto& result : results_) {
        if (result.is_deleted) {
            ++summary.deleted_areas;
        }

        auto narrowed = applyFilter(result, filter);
        if (!narrowed) {
            continue;
        }

        ++summary.total_areas;
        ++summary.areas_by_type[areaTypeToString(narrowed->area_type)];
        if (!narrowed->isValid()) {
            ++summary.invalid_areas;
        }
        if (!narrowed->issues.empty()) {
            ++summary.areas_with_issues;
        }
        for (const auto& issue : narrowed->issues) {
            ++summary.total_issues;
            ++summary.issues_by_rule[issue.rule_id];
            ++summary.issues_by_severity[severityToString(issue.severity)];
        }
    }
    return summary;
}

std::vector<std::string> CorpusAuditor::getAvailableTags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> keys;
    for (const auto& result : results_) {
        for (const auto& [key, value] : result.tags) {
            if (key != "geo_json") {
                keys.insert(key);
            }
        }
    }
    return {keys.begin(), keys.end()};
}

std::vector<Geo::CountryIndex::Country> CorpusAuditor::getCountriesWithCommunities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> countries;
    for (const auto& result : results_) {
        if (result.area_type != AreaType::COUNTRY && result.country_id) {
            countries.emplace(*result.country_id, result.country_name);
        }
    }

    std::vector<Geo::CountryIndex::Country> sorted;
    sorted.reserve(countries.size());
    for (const auto& [id, name] : countries) {
        sorted.push_back(Geo::CountryIndex::Country{id, name});
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return toLower(a.name) < toLower(b.name);
    });
    return sorted;
}

std::optional<NormalizedRecord> CorpusAuditor::normalizedRecord(const std::string& area_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = normalized_.find(area_id);
    if (it == normalized_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CorpusAuditor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

void CorpusAuditor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
    positions_.clear();
    normalized_.clear();
    country_index_.clear();
    last_sync_.reset();
}

} // namespace ARL::Lint
