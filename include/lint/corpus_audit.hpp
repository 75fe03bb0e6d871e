// EN: Corpus auditor for AreaLint - validation and lint results for a whole area corpus, with filters and summaries
// FR: Auditeur de corpus pour AreaLint - résultats de validation et de lint d'un corpus complet, avec filtres et résumés

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "geo/country_index.hpp"
#include "lint/lint_cache.hpp"
#include "lint/lint_rule.hpp"
#include "types/area_record.hpp"
#include "validation/schema_validator.hpp"

namespace ARL::Lint {

// EN: Audit state of one area.
// FR: État d'audit d'une zone.
struct AreaAuditResult {
    std::string area_id;
    std::string area_name = "Unknown";
    AreaType area_type{AreaType::COMMUNITY};
    bool is_deleted{false};
    std::optional<std::string> country_id;      // EN: Unset for countries and unlocated areas / FR: Non défini pour les pays et zones non localisées
    std::string country_name = "Unknown";
    TagMap tags;
    std::vector<Validation::ValidationError> validation_errors;
    std::vector<LintIssue> issues;

    bool isValid() const { return validation_errors.empty(); }
};

// EN: Tag filter: key must exist, or its value must equal the pattern (`*` wildcards allowed).
// FR: Filtre de tag : la clé doit exister, ou sa valeur doit égaler le motif (jokers `*` permis).
struct TagFilter {
    std::string key;
    std::optional<std::string> pattern;

    // EN: Parse "key" or "key=value".
    // FR: Parse "key" ou "key=value".
    static TagFilter parse(const std::string& text);
};

struct AuditFilter {
    std::optional<std::string> rule_id;
    std::optional<Severity> severity;
    std::optional<AreaType> area_type;
    bool include_deleted{false};
    bool issues_only{true};
    std::vector<TagFilter> tag_filters;
    std::optional<std::string> country_id;   // EN: Ignored for country areas / FR: Ignoré pour les zones pays
};

struct AuditSummary {
    size_t total_areas = 0;
    size_t total_all_areas = 0;
    size_t deleted_areas = 0;
    size_t invalid_areas = 0;
    size_t areas_with_issues = 0;
    size_t total_issues = 0;
    std::map<std::string, size_t> issues_by_rule;
    std::map<std::string, size_t> issues_by_severity{{"error", 0}, {"warning", 0}, {"info", 0}};
    std::map<std::string, size_t> areas_by_type;
    std::optional<TimePoint> last_sync;
};

class CorpusAuditor {
public:
    CorpusAuditor(const Validation::SchemaValidator& validator, LintCache& cache, Clock clock = systemClock());

    CorpusAuditor(const CorpusAuditor&) = delete;
    CorpusAuditor& operator=(const CorpusAuditor&) = delete;

    // EN: Re-audit one area and return its fresh result. Deleted areas carry no lint issues.
    // FR: Ré-audite une zone et retourne son résultat frais. Les zones supprimées ne portent aucun problème de lint.
    AreaAuditResult updateArea(const AreaRecord& record);

    // EN: Replace the whole corpus: audit every record, index countries, locate areas, detect url alias clashes.
    // FR: Remplace tout le corpus : audite chaque enregistrement, indexe les pays, localise les zones, détecte les collisions d'url_alias.
    void rebuild(const std::vector<AreaRecord>& corpus);

    std::vector<AreaAuditResult> getResults(const AuditFilter& filter = AuditFilter{}) const;
    AuditSummary getSummary(const AuditFilter& filter) const;

    // EN: Every tag key seen in the corpus except geo_json, sorted.
    // FR: Toutes les clés de tag du corpus sauf geo_json, triées.
    std::vector<std::string> getAvailableTags() const;

    // EN: Countries that contain at least one non-country area, deleted ones included, sorted by name (case-insensitive).
    // FR: Pays contenant au moins une zone non-pays, supprimées comprises, triés par nom (insensible à la casse).
    std::vector<Geo::CountryIndex::Country> getCountriesWithCommunities() const;

    // EN: Last validated form of an area, nullopt when unknown or invalid.
    // FR: Dernière forme validée d'une zone, nullopt si inconnue ou invalide.
    std::optional<NormalizedRecord> normalizedRecord(const std::string& area_id) const;

    size_t size() const;
    void clear();

    static bool matchesTagFilters(const TagMap& tags, const std::vector<TagFilter>& filters);

private:
    AreaAuditResult audit(const AreaRecord& record, std::optional<NormalizedRecord>& normalized) const;

    // EN: Caller must hold mutex_.
    // FR: L'appelant doit détenir mutex_.
    void storeLocked(AreaAuditResult result, std::optional<NormalizedRecord> normalized);
    void buildCountryIndexLocked();
    void locateLocked(AreaAuditResult& result) const;
    void detectUrlAliasClashesLocked();

    // EN: Apply the filter; returns the result with its issues narrowed, or nullopt when excluded.
    // FR: Applique le filtre ; retourne le résultat avec ses problèmes restreints, ou nullopt si exclu.
    static std::optional<AreaAuditResult> applyFilter(const AreaAuditResult& result, const AuditFilter& filter);

    const Validation::SchemaValidator& validator_;
    LintCache& cache_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::vector<AreaAuditResult> results_;
    std::unordered_map<std::string, size_t> positions_;
    std::unordered_map<std::string, NormalizedRecord> normalized_;
    Geo::CountryIndex country_index_;
    std::optional<TimePoint> last_sync_;
};

} // namespace ARL::Lint
