/**
 * TOLLGATE - Resilient LLM Provider Client
 * Response Cache Implementation
 */

#include "cache/response_cache.hpp"
#include "util/logger.hpp"

#include <mutex>

namespace tollgate::cache {

using util::log_component::Cache;

ResponseCache::ResponseCache(std::string name, const ResponseCacheConfig& config)
    : name_(std::move(name))
    , config_(config) {
    TOLLGATE_LOG_DEBUG(Cache, "Response cache {}: max_entries={}, ttl={}s, compress>={}B",
                       name_, config_.max_entries,
                       std::chrono::duration_cast<std::chrono::seconds>(config_.default_ttl).count(),
                       config_.compression.threshold_bytes);
}

std::optional<CachedResponse> ResponseCache::get(const CacheKey& key) {
    return get_at(key, Clock::now());
}

std::optional<CachedResponse> ResponseCache::get_at(const CacheKey& key, Clock::time_point now) {
    CacheEntry snapshot;
    std::uint64_t generation = 0;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (is_expired(it->second->entry, now)) {
            erase_node(it->second);
            ++expired_;
            ++misses_;
            TOLLGATE_LOG_TRACE(Cache, "{}: expired entry {}", name_, key.to_string());
            return std::nullopt;
        }

        auto& entry = it->second->entry;
        entry.hit_count++;
        entry.last_access = now;
        touch_node(it->second);

        // Copy under the lock so readers never see a half-replaced entry
        snapshot = entry;
        generation = it->second->generation;
        ++hits_;
    }

    CachedResponse result;
    result.hit_count = snapshot.hit_count;
    result.ttl = snapshot.ttl;
    result.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - snapshot.created_at);
    result.was_compressed = snapshot.compressed;
    result.generation = generation;

    if (snapshot.compressed) {
        auto inflated = decompress(snapshot.payload, snapshot.original_size);
        if (!inflated) {
            TOLLGATE_LOG_ERROR(Cache, "{}: corrupt compressed entry {}, dropping", name_, key.to_string());
            discard(key, generation);
            --hits_;
            ++misses_;
            return std::nullopt;
        }
        result.payload = std::move(*inflated);
    } else {
        result.payload = std::move(snapshot.payload);
    }

    return result;
}

bool ResponseCache::put(const CacheKey& key, std::string_view payload,
                        std::optional<std::chrono::milliseconds> ttl) {
    return put_at(key, payload, ttl, Clock::now());
}

bool ResponseCache::put_at(const CacheKey& key, std::string_view payload,
                           std::optional<std::chrono::milliseconds> ttl, Clock::time_point now) {
    const auto effective_ttl = ttl.value_or(config_.default_ttl);

    if (effective_ttl <= std::chrono::milliseconds::zero() || config_.max_entries == 0) {
        ++rejected_;
        return false;
    }

    if (payload.size() > config_.max_entry_bytes) {
        ++rejected_;
        TOLLGATE_LOG_DEBUG(Cache, "{}: entry too large: {} bytes > {} max",
                           name_, payload.size(), config_.max_entry_bytes);
        return false;
    }

    // Compress before taking the lock
    CacheEntry entry;
    entry.original_size = payload.size();
    if (auto compressed = try_compress(payload, config_.compression)) {
        entry.payload = std::move(*compressed);
        entry.compressed = true;
    } else {
        entry.payload.assign(payload.data(), payload.size());
    }
    entry.created_at = now;
    entry.last_access = now;
    entry.ttl = effective_ttl;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        // Last writer wins
        erase_node(it->second);
    }

    stored_bytes_ += entry.payload.size();
    original_bytes_ += entry.original_size;
    if (entry.compressed) {
        ++compressed_entries_;
    }

    TOLLGATE_LOG_TRACE(Cache, "{}: stored {} ({} -> {} bytes, ttl={}ms)",
                       name_, key.to_string(), entry.original_size, entry.payload.size(),
                       entry.ttl.count());

    lru_list_.push_front(Node{key, std::move(entry), next_generation_++});
    cache_map_[key] = lru_list_.begin();

    if (++puts_since_sweep_ >= kSweepInterval) {
        puts_since_sweep_ = 0;
        purge_expired_locked(now);
    }

    evict_if_needed();
    return true;
}

bool ResponseCache::remove(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        return false;
    }

    erase_node(it->second);
    TOLLGATE_LOG_DEBUG(Cache, "{}: entry removed: {}", name_, key.to_string());
    return true;
}

bool ResponseCache::discard(const CacheKey& key, std::uint64_t generation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end() || it->second->generation != generation) {
        return false;
    }

    erase_node(it->second);
    TOLLGATE_LOG_DEBUG(Cache, "{}: entry discarded: {}", name_, key.to_string());
    return true;
}

void ResponseCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = cache_map_.size();
    cache_map_.clear();
    lru_list_.clear();
    stored_bytes_ = 0;
    original_bytes_ = 0;
    compressed_entries_ = 0;

    TOLLGATE_LOG_INFO(Cache, "{}: cleared {} entries", name_, count);
}

std::size_t ResponseCache::purge_expired() {
    return purge_expired_at(Clock::now());
}

std::size_t ResponseCache::purge_expired_at(Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return purge_expired_locked(now);
}

std::optional<CacheEntryInfo> ResponseCache::entry_info(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        return std::nullopt;
    }

    const auto& entry = it->second->entry;
    const auto now = Clock::now();

    CacheEntryInfo info;
    info.stored_size = entry.payload.size();
    info.original_size = entry.original_size;
    info.compressed = entry.compressed;
    info.hit_count = entry.hit_count;
    info.ttl = entry.ttl;
    info.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.created_at);
    info.remaining = info.age >= info.ttl ? std::chrono::milliseconds::zero() : info.ttl - info.age;
    return info;
}

CacheStats ResponseCache::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.rejected = rejected_.load();
    stats.entries = cache_map_.size();
    stats.max_entries = config_.max_entries;
    stats.size_bytes = stored_bytes_;
    stats.original_bytes = original_bytes_;
    stats.compressed_entries = compressed_entries_;
    return stats;
}

void ResponseCache::touch_node(LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void ResponseCache::evict_if_needed() {
    // Evict from back (least recently used) until within the entry limit
    while (cache_map_.size() > config_.max_entries && !lru_list_.empty()) {
        auto last = std::prev(lru_list_.end());
        TOLLGATE_LOG_TRACE(Cache, "{}: evicting {}", name_, last->key.to_string());
        erase_node(last);
        ++evictions_;
    }
}

void ResponseCache::erase_node(LruList::iterator it) {
    stored_bytes_ -= it->entry.payload.size();
    original_bytes_ -= it->entry.original_size;
    if (it->entry.compressed) {
        --compressed_entries_;
    }
    cache_map_.erase(it->key);
    lru_list_.erase(it);
}

std::size_t ResponseCache::purge_expired_locked(Clock::time_point now) {
    std::size_t removed = 0;
    auto it = lru_list_.begin();
    while (it != lru_list_.end()) {
        auto next = std::next(it);
        if (is_expired(it->entry, now)) {
            erase_node(it);
            ++removed;
        }
        it = next;
    }

    if (removed > 0) {
        expired_ += removed;
        TOLLGATE_LOG_DEBUG(Cache, "{}: purged {} expired entries", name_, removed);
    }
    return removed;
}

bool ResponseCache::is_expired(const CacheEntry& entry, Clock::time_point now) {
    return now - entry.created_at >= entry.ttl;
}

} // namespace tollgate::cache
