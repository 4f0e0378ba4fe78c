/**
 * TOLLGATE - Resilient LLM Provider Client
 * Response Cache - Content-addressed LRU store of provider responses
 *
 * Features:
 * - Strict LRU by access order with a maximum entry count
 * - Per-entry TTL, checked on access and swept periodically
 * - zlib compression for payloads above a size threshold
 * - Last writer wins for concurrent puts to the same fingerprint
 * - Cache statistics for monitoring
 */

#ifndef TOLLGATE_CACHE_RESPONSE_CACHE_HPP
#define TOLLGATE_CACHE_RESPONSE_CACHE_HPP

#include "cache/cache_key.hpp"
#include "cache/compression.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tollgate::cache {

using Clock = std::chrono::steady_clock;

/**
 * Stored cache entry
 */
struct CacheEntry {
    std::string payload;            // Raw or compressed bytes
    std::size_t original_size{0};   // Size before compression
    bool compressed{false};

    Clock::time_point created_at;
    Clock::time_point last_access;
    std::chrono::milliseconds ttl{0};

    std::uint64_t hit_count{0};
};

/**
 * A cache hit, always decompressed
 */
struct CachedResponse {
    std::string payload;
    std::uint64_t hit_count{0};
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds ttl{0};
    bool was_compressed{false};
    std::uint64_t generation{0};   // Identifies the stored version for discard()
};

/**
 * Entry metadata without the payload
 */
struct CacheEntryInfo {
    std::size_t stored_size{0};
    std::size_t original_size{0};
    bool compressed{false};
    std::uint64_t hit_count{0};
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds ttl{0};
    std::chrono::milliseconds remaining{0};
};

/**
 * Cache statistics for monitoring
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t expired{0};
    std::uint64_t rejected{0};          // Puts refused (too large or zero TTL)

    std::size_t entries{0};
    std::size_t max_entries{0};
    std::size_t size_bytes{0};          // Stored bytes
    std::size_t original_bytes{0};      // Bytes before compression
    std::size_t compressed_entries{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Response cache configuration
 */
struct ResponseCacheConfig {
    std::size_t max_entries{1000};
    std::chrono::milliseconds default_ttl{std::chrono::seconds(300)};
    std::size_t max_entry_bytes{1024 * 1024};
    CompressionConfig compression{};
};

/**
 * Thread-safe LRU response cache for one provider
 *
 * Implementation:
 * - Hash map for O(1) lookup by fingerprint
 * - Doubly-linked list for LRU ordering (front = most recent)
 * - get() takes the exclusive lock since a hit moves the entry to the front;
 *   decompression happens after the lock is released
 *
 * The *_at variants take an explicit time so expiry can be tested
 * deterministically.
 */
class ResponseCache {
public:
    explicit ResponseCache(std::string name, const ResponseCacheConfig& config = {});
    ~ResponseCache() = default;

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;
    ResponseCache(ResponseCache&&) = delete;
    ResponseCache& operator=(ResponseCache&&) = delete;

    /**
     * Get a cached payload by fingerprint
     *
     * @return Decompressed payload if present and not expired, nullopt otherwise
     */
    std::optional<CachedResponse> get(const CacheKey& key);
    std::optional<CachedResponse> get_at(const CacheKey& key, Clock::time_point now);

    /**
     * Store a payload
     *
     * @param key Fingerprint
     * @param payload Serialized response
     * @param ttl Time to live (default_ttl when unset)
     * @return true if stored
     */
    bool put(const CacheKey& key, std::string_view payload,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    bool put_at(const CacheKey& key, std::string_view payload,
                std::optional<std::chrono::milliseconds> ttl, Clock::time_point now);

    /**
     * Remove an entry
     * @return true if entry was removed, false if not found
     */
    bool remove(const CacheKey& key);

    /**
     * Remove an entry only if it is still the version a get() returned.
     * A newer put() for the same key is left alone.
     */
    bool discard(const CacheKey& key, std::uint64_t generation);

    /**
     * Clear all entries
     */
    void clear();

    /**
     * Remove every expired entry
     * @return Number of entries removed
     */
    std::size_t purge_expired();
    std::size_t purge_expired_at(Clock::time_point now);

    /**
     * Metadata for an entry without touching its recency
     */
    std::optional<CacheEntryInfo> entry_info(const CacheKey& key) const;

    CacheStats get_stats() const;

    const std::string& name() const { return name_; }
    const ResponseCacheConfig& config() const { return config_; }

private:
    struct Node {
        CacheKey key;
        CacheEntry entry;
        std::uint64_t generation{0};
    };

    using LruList = std::list<Node>;
    using CacheMap = std::unordered_map<CacheKey, LruList::iterator, CacheKeyHash>;

    static constexpr std::uint32_t kSweepInterval = 100;

    /**
     * Move node to front of LRU list
     * Must be called with exclusive lock held
     */
    void touch_node(LruList::iterator it);

    /**
     * Evict least recently used entries until within max_entries
     * Must be called with exclusive lock held
     */
    void evict_if_needed();

    /**
     * Must be called with exclusive lock held
     */
    void erase_node(LruList::iterator it);
    std::size_t purge_expired_locked(Clock::time_point now);

    static bool is_expired(const CacheEntry& entry, Clock::time_point now);

    std::string name_;
    ResponseCacheConfig config_;

    mutable std::shared_mutex mutex_;
    LruList lru_list_;
    CacheMap cache_map_;
    std::size_t stored_bytes_{0};
    std::size_t original_bytes_{0};
    std::size_t compressed_entries_{0};
    std::uint32_t puts_since_sweep_{0};
    std::uint64_t next_generation_{1};

    // Statistics (atomic for lock-free reads)
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_RESPONSE_CACHE_HPP
