#include <spdlog/spdlog.h>
#include <canopy/storage/document_cache.h>

#include <chrono>
#include <mutex>

namespace canopy::storage {

DocumentCache::DocumentCache(std::size_t maxEntries, std::size_t maxTrackedKeys)
    : maxEntries_(maxEntries), maxTrackedKeys_(maxTrackedKeys) {}

std::shared_ptr<const Document> DocumentCache::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.value;
}

DocumentCache::FillTicket DocumentCache::ticket(const std::string& key) const {
    std::shared_lock lock(mutex_);
    FillTicket t;
    if (auto it = generations_.find(key); it != generations_.end()) {
        t.keyGeneration = it->second;
    }
    t.bulkGeneration = bulkGeneration_;
    return t;
}

bool DocumentCache::fill(const std::string& key, const FillTicket& ticket, Document value) {
    auto shared = std::make_shared<const Document>(std::move(value));

    std::unique_lock lock(mutex_);
    uint64_t current = 0;
    if (auto it = generations_.find(key); it != generations_.end()) {
        current = it->second;
    }
    if (current != ticket.keyGeneration || bulkGeneration_ != ticket.bulkGeneration) {
        ++rejectedFills_;
        spdlog::debug("Cache fill for {} rejected: invalidated while reading", key);
        return false;
    }

    if (maxEntries_ > 0 && entries_.size() >= maxEntries_ && !entries_.contains(key)) {
        evictOldestLocked();
    }

    entries_.insert_or_assign(key, Entry{std::move(shared), std::chrono::system_clock::now()});
    ++fills_;
    return true;
}

void DocumentCache::invalidate(const std::string& key) {
    std::unique_lock lock(mutex_);
    ++generations_[key];
    if (entries_.erase(key) > 0) {
        ++invalidations_;
    }
    if (maxTrackedKeys_ > 0 && generations_.size() > maxTrackedKeys_) {
        spdlog::debug("Cache generation table reached {} keys; resetting", generations_.size());
        resetGenerationsLocked();
    }
}

std::size_t DocumentCache::invalidatePrefix(std::string_view prefix) {
    std::unique_lock lock(mutex_);
    resetGenerationsLocked();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (std::string_view(it->first).starts_with(prefix)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    invalidations_ += removed;
    if (removed > 0) {
        spdlog::debug("Cache invalidated {} entries with prefix '{}'", removed, prefix);
    }
    return removed;
}

void DocumentCache::clear() {
    std::unique_lock lock(mutex_);
    resetGenerationsLocked();
    invalidations_ += entries_.size();
    entries_.clear();
}

std::size_t DocumentCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::size_t DocumentCache::trackedKeys() const {
    std::shared_lock lock(mutex_);
    return generations_.size();
}

bool DocumentCache::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(key);
}

std::optional<TimePoint> DocumentCache::insertedAt(const std::string& key) const {
    std::shared_lock lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second.insertedAt;
    }
    return std::nullopt;
}

DocumentCache::Stats DocumentCache::getStats() const {
    std::shared_lock lock(mutex_);
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.fills = fills_;
    s.rejectedFills = rejectedFills_;
    s.invalidations = invalidations_;
    s.evictions = evictions_;
    s.entries = entries_.size();
    return s;
}

// Bumping the bulk generation rejects every ticket taken so far, so the
// per-key generations it would have been compared against can go.
void DocumentCache::resetGenerationsLocked() {
    ++bulkGeneration_;
    generations_.clear();
}

void DocumentCache::evictOldestLocked() {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (oldest == entries_.end() || it->second.insertedAt < oldest->second.insertedAt) {
            oldest = it;
        }
    }
    if (oldest != entries_.end()) {
        entries_.erase(oldest);
        ++evictions_;
    }
}

} // namespace canopy::storage
