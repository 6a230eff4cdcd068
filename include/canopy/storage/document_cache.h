#pragma once

#include <canopy/core/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace canopy::storage {

/**
 * @brief In-memory map from cache key to the last committed document.
 *
 * Entries are immutable once inserted: they are only ever removed or replaced
 * as a whole. Readers that miss take a FillTicket before touching the durable
 * copy and can only populate the cache if no invalidation of that key (or a
 * bulk invalidation) happened in between. This keeps the writer's
 * invalidate / rename / invalidate sequence closed against readers running on
 * other threads.
 *
 * Per-key generations are only kept until the next bulk invalidation, which
 * rejects every outstanding ticket anyway. Once more than maxTrackedKeys keys
 * are tracked the table is dropped the same way.
 */
class DocumentCache {
public:
    struct Entry {
        std::shared_ptr<const Document> value;
        TimePoint insertedAt;
    };

    struct FillTicket {
        uint64_t keyGeneration = 0;
        uint64_t bulkGeneration = 0;
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t fills = 0;
        uint64_t rejectedFills = 0;
        uint64_t invalidations = 0;
        uint64_t evictions = 0;
        std::size_t entries = 0;

        double hitRate() const noexcept {
            auto total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
        }
    };

    static constexpr std::size_t kDefaultTrackedKeys = 4096;

    explicit DocumentCache(std::size_t maxEntries = 0,
                           std::size_t maxTrackedKeys = kDefaultTrackedKeys);

    DocumentCache(const DocumentCache&) = delete;
    DocumentCache& operator=(const DocumentCache&) = delete;

    // Returns the cached value or nullptr; counts a hit or a miss.
    std::shared_ptr<const Document> get(const std::string& key) const;

    // Snapshot to pass to fill() after reading the durable value.
    FillTicket ticket(const std::string& key) const;

    // Insert if nothing invalidated the key since the ticket was taken.
    bool fill(const std::string& key, const FillTicket& ticket, Document value);

    void invalidate(const std::string& key);
    std::size_t invalidatePrefix(std::string_view prefix);
    void clear();

    [[nodiscard]] std::size_t size() const;
    // Keys with a live invalidation generation.
    [[nodiscard]] std::size_t trackedKeys() const;
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<TimePoint> insertedAt(const std::string& key) const;
    [[nodiscard]] Stats getStats() const;

private:
    void evictOldestLocked();
    void resetGenerationsLocked();

    std::size_t maxEntries_;
    std::size_t maxTrackedKeys_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, uint64_t> generations_;
    uint64_t bulkGeneration_ = 0;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    uint64_t fills_ = 0;
    uint64_t rejectedFills_ = 0;
    uint64_t invalidations_ = 0;
    uint64_t evictions_ = 0;
};

} // namespace canopy::storage
