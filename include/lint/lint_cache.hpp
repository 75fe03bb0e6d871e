// EN: Lint cache for AreaLint - memoized rule evaluation per area with single-flight computation
// FR: Cache de lint pour AreaLint - évaluation mémoïsée par zone avec calcul en vol unique

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lint/lint_rule.hpp"
#include "lint/lint_rule_set.hpp"
#include "types/area_record.hpp"

namespace ARL {
class ConfigManager;
}

namespace ARL::Lint {

// EN: Cached lint results of one area.
// FR: Résultats de lint en cache d'une zone.
struct LintCacheEntry {
    std::string area_id;
    std::string fingerprint;
    std::string ruleset_version;
    std::vector<LintIssue> issues;
    TimePoint computed_at;
    TimePoint last_accessed;
    size_t access_count = 0;
};

// EN: Configuration for cache bounds and cleanup.
// FR: Configuration des bornes du cache et du nettoyage.
struct LintCacheConfig {
    // EN: Entries older than this are recomputed and reclaimed. Zero disables expiry.
    // FR: Les entrées plus anciennes sont recalculées et récupérées. Zéro désactive l'expiration.
    std::chrono::seconds ttl{3600};

    // EN: Least recently used entries are evicted beyond this size.
    // FR: Les entrées les moins récemment utilisées sont évincées au-delà de cette taille.
    size_t max_entries = 10000;

    bool auto_cleanup = false;
    std::chrono::seconds cleanup_interval{300};

    static LintCacheConfig fromConfig(const ConfigManager& config);
};

// EN: Statistics for cache monitoring.
// FR: Statistiques pour le monitoring du cache.
struct LintCacheStats {
    size_t total_requests = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t computations = 0;       // EN: Rule set evaluations that completed / FR: Évaluations du jeu de règles terminées
    size_t coalesced_waits = 0;    // EN: Callers served by another caller's computation / FR: Appelants servis par le calcul d'un autre
    size_t evictions = 0;
    size_t invalidations = 0;
    size_t faults = 0;
    size_t entries_count = 0;
    double hit_ratio = 0.0;
};

// EN: Thread-safe lint result cache keyed by area id and validated by (fingerprint, rule set version).
//     At most one evaluation runs per area id; concurrent callers for the same record share its result.
//     Lookups for other area ids never wait on a running evaluation.
// FR: Cache thread-safe de résultats de lint indexé par id de zone et validé par (empreinte, version du jeu de règles).
//     Au plus une évaluation tourne par id de zone ; les appelants concurrents pour le même enregistrement partagent son résultat.
//     Les recherches pour d'autres ids ne patientent jamais sur une évaluation en cours.
class LintCache {
public:
    explicit LintCache(const LintRuleSet& rule_set, const LintCacheConfig& config = LintCacheConfig{},
                       Clock clock = systemClock());
    ~LintCache();

    LintCache(const LintCache&) = delete;
    LintCache& operator=(const LintCache&) = delete;

    // EN: Cached issues when the entry matches the record, otherwise evaluate once and store.
    //     A rule fault propagates as LintRuleFault to every waiting caller and nothing is stored.
    // FR: Problèmes en cache si l'entrée correspond à l'enregistrement, sinon évalue une fois et stocke.
    //     Un défaut de règle remonte en LintRuleFault à chaque appelant en attente et rien n'est stocké.
    std::vector<LintIssue> getOrCompute(const std::string& area_id, const NormalizedRecord& record);
    std::vector<LintIssue> getOrCompute(const NormalizedRecord& record) { return getOrCompute(record.id, record); }

    // EN: Drop the entry and detach any running evaluation so its result is not stored.
    // FR: Supprime l'entrée et détache toute évaluation en cours pour que son résultat ne soit pas stocké.
    void invalidate(const std::string& area_id);

    bool has(const std::string& area_id) const;
    std::optional<LintCacheEntry> peek(const std::string& area_id) const;
    size_t size() const;
    void clear();

    // EN: Remove expired entries. Returns the number removed.
    // FR: Supprime les entrées expirées. Retourne le nombre supprimé.
    size_t cleanup();

    LintCacheStats getStats() const;
    const LintCacheConfig& getConfig() const { return config_; }
    const LintRuleSet& ruleSet() const { return rule_set_; }

    void enableAutoCleanup(bool enabled, std::chrono::seconds interval = std::chrono::seconds{300});

    // EN: Deterministic content hash of a normalized record (16 hex chars, CRC-32 and Adler-32 of the canonical JSON).
    // FR: Hash de contenu déterministe d'un enregistrement normalisé (16 hex, CRC-32 et Adler-32 du JSON canonique).
    static std::string fingerprint(const NormalizedRecord& record);

private:
    struct InFlight {
        std::string fingerprint;
        std::shared_future<std::vector<LintIssue>> result;
        uint64_t token = 0;
    };

    bool isExpired(const LintCacheEntry& entry, const TimePoint& now) const;
    bool isFresh(const LintCacheEntry& entry, const std::string& fingerprint, const TimePoint& now) const;

    // EN: Caller must hold mutex_.
    // FR: L'appelant doit détenir mutex_.
    void storeLocked(const std::string& area_id, const std::string& fingerprint,
                     const std::vector<LintIssue>& issues);
    void evictLRU();

    void startCleanupThread();
    void stopCleanupThread();
    void cleanupLoop();

    const LintRuleSet& rule_set_;
    LintCacheConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, LintCacheEntry> entries_;
    std::unordered_map<std::string, InFlight> in_flight_;
    uint64_t next_token_ = 0;
    LintCacheStats stats_;

    // EN: Background cleanup thread management.
    // FR: Gestion du thread de nettoyage en arrière-plan.
    std::unique_ptr<std::thread> cleanup_thread_;
    std::atomic<bool> cleanup_enabled_{false};
    std::atomic<bool> should_stop_cleanup_{false};
    std::chrono::seconds cleanup_interval_{300};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
    std::mutex cleanup_control_mutex_;   // EN: Serializes start/stop of the thread / FR: Sérialise démarrage/arrêt du thread
};

} // namespace ARL::Lint
