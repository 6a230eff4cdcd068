#pragma once

#include <canopy/core/types.h>
#include <canopy/storage/atomic_file_store.h>
#include <canopy/storage/storage_key.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace canopy::storage {

struct WriteOp {
    StorageKey key;
    Document value;
};

struct TransactionReceipt {
    std::size_t committed = 0;
};

// A rollback step that failed or did not restore the captured value.
struct IntegrityWarning {
    StorageKey key;
    std::string message;
    TimePoint at;
};

struct TransactionStats {
    uint64_t committed = 0;
    uint64_t failed = 0;
    uint64_t restoredKeys = 0;
    uint64_t integrityWarnings = 0;
    std::size_t lastCommitted = 0;
};

/**
 * @brief Applies an ordered list of writes all-or-nothing.
 *
 * Before the first write, the durable value of every distinct key is
 * captured (or recorded as absent). Writes are applied in order through the
 * store; at the first failure every key touched so far, including the one
 * that failed, is restored in reverse order and the restore is verified by
 * reading the durable value back.
 *
 * Callers are expected to hold the project's serializer lane, so no other
 * transaction touches the same keys concurrently.
 */
class TransactionCoordinator {
public:
    explicit TransactionCoordinator(AtomicFileStore& store, std::size_t maxRetainedWarnings = 256);

    TransactionCoordinator(const TransactionCoordinator&) = delete;
    TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;

    // On failure returns the error of the write that failed; nothing stays committed.
    [[nodiscard]] Result<TransactionReceipt> transact(const std::vector<WriteOp>& operations);

    [[nodiscard]] std::vector<IntegrityWarning> integrityWarnings() const;
    [[nodiscard]] TransactionStats getStats() const;

private:
    struct Backup {
        StorageKey key;
        std::optional<Document> previous;
    };

    void rollback(const std::vector<WriteOp>& operations, std::size_t failedIndex,
                  const std::vector<Backup>& backups);
    void recordWarning(const StorageKey& key, std::string message);

    AtomicFileStore& store_;
    std::size_t maxRetainedWarnings_;

    mutable std::mutex mutex_;
    std::deque<IntegrityWarning> warnings_;
    TransactionStats stats_;
};

} // namespace canopy::storage
