// EN: Implementation of the LintCache. Single-flight evaluation, TTL expiry and LRU eviction.
// FR: Implémentation du LintCache. Évaluation en vol unique, expiration TTL et éviction LRU.

#include "lint/lint_cache.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <cstdio>

namespace ARL::Lint {

LintCacheConfig LintCacheConfig::fromConfig(const ConfigManager& config) {
    LintCacheConfig cache_config;
    cache_config.ttl = std::chrono::seconds(
        config.get("lint_cache", "ttl_seconds").asOrDefault<int>(static_cast<int>(cache_config.ttl.count())));
    cache_config.max_entries = static_cast<size_t>(
        config.get("lint_cache", "max_entries").asOrDefault<int>(static_cast<int>(cache_config.max_entries)));
    cache_config.auto_cleanup =
        config.get("lint_cache", "auto_cleanup").asOrDefault<bool>(cache_config.auto_cleanup);
    cache_config.cleanup_interval = std::chrono::seconds(
        config.get("lint_cache", "cleanup_interval_seconds")
            .asOrDefault<int>(static_cast<int>(cache_config.cleanup_interval.count())));
    return cache_config;
}

LintCache::LintCache(const LintRuleSet& rule_set, const LintCacheConfig& config, Clock clock)
    : rule_set_(rule_set), config_(config), clock_(std::move(clock)) {
    LOG_INFO("lint_cache", "Lint cache created - Max entries: " + std::to_string(config_.max_entries) +
                           ", TTL: " + std::to_string(config_.ttl.count()) + "s, rule set v" + rule_set_.version());
    if (config_.auto_cleanup) {
        enableAutoCleanup(true, config_.cleanup_interval);
    }
}

LintCache::~LintCache() {
    std::lock_guard<std::mutex> control(cleanup_control_mutex_);
    stopCleanupThread();
}

std::vector<LintIssue> LintCache::getOrCompute(const std::string& area_id, const NormalizedRecord& record) {
    // EN: Hash outside the lock, it only reads the caller's record.
    // FR: Hash hors verrou, il ne lit que l'enregistrement de l'appelant.
    const std::string record_fingerprint = fingerprint(record);

    std::unique_lock<std::mutex> lock(mutex_);
    stats_.total_requests++;

    while (true) {
        const TimePoint now = clock_();

        auto it = entries_.find(area_id);
        if (it != entries_.end()) {
            if (isFresh(it->second, record_fingerprint, now)) {
                it->second.last_accessed = now;
                it->second.access_count++;
                stats_.cache_hits++;
                LOG_DEBUG("lint_cache", "Cache hit for area " + area_id);
                return it->second.issues;
            }
            // EN: A newer fingerprint, another rule set or an expired entry replaces the old one.
            // FR: Une empreinte plus récente, un autre jeu de règles ou une entrée expirée remplace l'ancienne.
            entries_.erase(it);
            stats_.evictions++;
        }

        auto flight = in_flight_.find(area_id);
        if (flight != in_flight_.end()) {
            std::shared_future<std::vector<LintIssue>> pending = flight->second.result;
            const bool same_record = flight->second.fingerprint == record_fingerprint;
            if (same_record) {
                stats_.coalesced_waits++;
            }
            lock.unlock();

            if (same_record) {
                LOG_DEBUG("lint_cache", "Joining running evaluation for area " + area_id);
                return pending.get();
            }

            // EN: Another version of the record is being evaluated; wait for it, then look again.
            // FR: Une autre version de l'enregistrement est en évaluation ; attendre puis regarder à nouveau.
            pending.wait();
            lock.lock();
            continue;
        }

        break;
    }

    // EN: This caller leads the evaluation for the area.
    // FR: Cet appelant mène l'évaluation pour la zone.
    std::promise<std::vector<LintIssue>> promise;
    const uint64_t token = ++next_token_;
    in_flight_[area_id] = InFlight{record_fingerprint, promise.get_future().share(), token};
    stats_.cache_misses++;
    lock.unlock();

    std::vector<LintIssue> issues;
    try {
        issues = rule_set_.evaluate(record);
    } catch (...) {
        lock.lock();
        auto flight = in_flight_.find(area_id);
        if (flight != in_flight_.end() && flight->second.token == token) {
            in_flight_.erase(flight);
        }
        stats_.faults++;
        lock.unlock();

        LOG_ERROR("lint_cache", "Evaluation faulted for area " + area_id + ", nothing cached");
        promise.set_exception(std::current_exception());
        throw;
    }

    lock.lock();
    stats_.computations++;
    auto flight = in_flight_.find(area_id);
    if (flight != in_flight_.end() && flight->second.token == token) {
        in_flight_.erase(flight);
        storeLocked(area_id, record_fingerprint, issues);
    } else {
        LOG_DEBUG("lint_cache", "Area " + area_id + " invalidated during evaluation, result not stored");
    }
    lock.unlock();

    promise.set_value(issues);
    return issues;
}

void LintCache::invalidate(const std::string& area_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool had_entry = entries_.erase(area_id) > 0;
    const bool had_flight = in_flight_.erase(area_id) > 0;
    if (had_entry || had_flight) {
        stats_.invalidations++;
        LOG_DEBUG("lint_cache", "Invalidated area " + area_id);
    }
}

bool LintCache::has(const std::string& area_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(area_id) != entries_.end();
}

std::optional<LintCacheEntry> LintCache::peek(const std::string& area_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(area_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t LintCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void LintCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    // EN: Running evaluations are detached; their results are returned to callers but not stored.
    // FR: Les évaluations en cours sont détachées ; leurs résultats reviennent aux appelants sans être stockés.
    in_flight_.clear();
    stats_ = LintCacheStats{};
    LOG_INFO("lint_cache", "Cache cleared");
}

size_t LintCache::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_();
    size_t removed_count = 0;

    auto it = entries_.begin();
    while (it != entries_.end()) {
        if (isExpired(it->second, now)) {
            it = entries_.erase(it);
            removed_count++;
            stats_.evictions++;
        } else {
            ++it;
        }
    }

    if (removed_count > 0) {
        LOG_INFO("lint_cache", "Cleanup removed " + std::to_string(removed_count) + " expired entries");
    }
    return removed_count;
}

LintCacheStats LintCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    LintCacheStats current_stats = stats_;
    current_stats.entries_count = entries_.size();
    if (current_stats.total_requests > 0) {
        current_stats.hit_ratio = static_cast<double>(current_stats.cache_hits) /
                                  static_cast<double>(current_stats.total_requests);
    }
    return current_stats;
}

void LintCache::enableAutoCleanup(bool enabled, std::chrono::seconds interval) {
    std::lock_guard<std::mutex> control(cleanup_control_mutex_);
    if (enabled && !cleanup_enabled_) {
        cleanup_interval_ = interval;
        cleanup_enabled_ = true;
        startCleanupThread();
        LOG_INFO("lint_cache", "Auto cleanup enabled with " + std::to_string(interval.count()) + "s interval");
    } else if (!enabled && cleanup_enabled_) {
        cleanup_enabled_ = false;
        stopCleanupThread();
        LOG_INFO("lint_cache", "Auto cleanup disabled");
    }
}

std::string LintCache::fingerprint(const NormalizedRecord& record) {
    nlohmann::json canonical;
    canonical["id"] = record.id;
    canonical["type"] = areaTypeToString(record.type);
    canonical["fields"] = nlohmann::json(record.fields);
    canonical["custom_tags"] = nlohmann::json(record.custom_tags);
    canonical["created_at"] = record.created_at ? formatTimestamp(*record.created_at) : "";
    canonical["updated_at"] = record.updated_at ? formatTimestamp(*record.updated_at) : "";
    canonical["deleted_at"] = record.deleted_at ? formatTimestamp(*record.deleted_at) : "";

    // EN: Object keys are sorted, so equal content always dumps to the same text.
    // FR: Les clés d'objet sont triées, donc un contenu égal produit toujours le même texte.
    const std::string text = canonical.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto* data = reinterpret_cast<const Bytef*>(text.data());
    const auto length = static_cast<uInt>(text.size());

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, length);
    uLong adler = adler32(0L, Z_NULL, 0);
    adler = adler32(adler, data, length);

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%08lx%08lx", crc & 0xffffffffUL, adler & 0xffffffffUL);
    return std::string(buffer);
}

bool LintCache::isExpired(const LintCacheEntry& entry, const TimePoint& now) const {
    return config_.ttl.count() > 0 && now - entry.computed_at >= config_.ttl;
}

bool LintCache::isFresh(const LintCacheEntry& entry, const std::string& record_fingerprint,
                        const TimePoint& now) const {
    return entry.fingerprint == record_fingerprint && entry.ruleset_version == rule_set_.version() &&
           !isExpired(entry, now);
}

void LintCache::storeLocked(const std::string& area_id, const std::string& record_fingerprint,
                            const std::vector<LintIssue>& issues) {
    if (config_.max_entries == 0) {
        return;
    }
    if (entries_.find(area_id) == entries_.end()) {
        while (entries_.size() >= config_.max_entries) {
            evictLRU();
        }
    }

    const TimePoint now = clock_();
    LintCacheEntry entry;
    entry.area_id = area_id;
    entry.fingerprint = record_fingerprint;
    entry.ruleset_version = rule_set_.version();
    entry.issues = issues;
    entry.computed_at = now;
    entry.last_accessed = now;
    entries_[area_id] = std::move(entry);

    LOG_DEBUG("lint_cache", "Stored " + std::to_string(issues.size()) + " issue(s) for area " + area_id);
}

void LintCache::evictLRU() {
    if (entries_.empty()) {
        return;
    }

    // EN: Find least recently used entry.
    // FR: Trouve l'entrée la moins récemment utilisée.
    auto lru_it = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.last_accessed < lru_it->second.last_accessed) {
            lru_it = it;
        }
    }

    const std::string evicted = lru_it->first;
    entries_.erase(lru_it);
    stats_.evictions++;
    LOG_DEBUG("lint_cache", "Evicted LRU entry for area " + evicted);
}

void LintCache::startCleanupThread() {
    should_stop_cleanup_ = false;
    cleanup_thread_ = std::make_unique<std::thread>([this]() {
        cleanupLoop();
    });
}

void LintCache::stopCleanupThread() {
    if (cleanup_thread_) {
        {
            std::lock_guard<std::mutex> lock(cleanup_mutex_);
            should_stop_cleanup_ = true;
        }
        cleanup_cv_.notify_all();
        cleanup_thread_->join();
        cleanup_thread_.reset();
    }
}

void LintCache::cleanupLoop() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (!should_stop_cleanup_) {
        cleanup_cv_.wait_for(lock, cleanup_interval_, [this] { return should_stop_cleanup_.load(); });
        if (!should_stop_cleanup_) {
            lock.unlock();
            cleanup();
            lock.lock();
        }
    }
}

} // namespace ARL::Lint
