#include <spdlog/spdlog.h>
#include <canopy/storage/transaction_coordinator.h>

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace canopy::storage {

TransactionCoordinator::TransactionCoordinator(AtomicFileStore& store,
                                               std::size_t maxRetainedWarnings)
    : store_(store), maxRetainedWarnings_(std::max<std::size_t>(1, maxRetainedWarnings)) {}

Result<TransactionReceipt> TransactionCoordinator::transact(const std::vector<WriteOp>& operations) {
    // Reject malformed keys before any I/O
    for (const auto& op : operations) {
        if (auto valid = validateKey(op.key); !valid) {
            return valid.error();
        }
    }

    if (operations.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.lastCommitted = 0;
        return TransactionReceipt{};
    }

    // Capture backups for all distinct keys before applying anything
    std::vector<Backup> backups;
    std::unordered_set<std::string> seen;
    for (const auto& op : operations) {
        if (!seen.insert(op.key.cacheKey()).second) {
            continue;
        }
        auto previous = store_.readDurable(op.key);
        if (!previous) {
            spdlog::error("Transaction aborted: cannot capture backup of {}/{}: {}",
                          op.key.projectId, op.key.relativePath, previous.error().message);
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.failed;
            stats_.lastCommitted = 0;
            return previous.error();
        }
        backups.push_back(Backup{op.key, std::move(previous).value()});
    }

    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto result = store_.write(operations[i].key, operations[i].value);
        if (!result) {
            spdlog::warn("Transaction write {}/{} failed on {}/{}: {}; rolling back", i + 1,
                         operations.size(), operations[i].key.projectId,
                         operations[i].key.relativePath, result.error().message);
            rollback(operations, i, backups);

            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.failed;
            stats_.lastCommitted = 0;
            return result.error();
        }
    }

    spdlog::debug("Transaction committed {} writes", operations.size());
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.committed;
    stats_.lastCommitted = operations.size();
    return TransactionReceipt{operations.size()};
}

void TransactionCoordinator::rollback(const std::vector<WriteOp>& operations,
                                      std::size_t failedIndex,
                                      const std::vector<Backup>& backups) {
    std::unordered_set<std::string> restored;
    uint64_t restoredCount = 0;

    for (std::size_t i = failedIndex + 1; i-- > 0;) {
        const auto& key = operations[i].key;
        if (!restored.insert(key.cacheKey()).second) {
            continue;
        }

        auto it = std::find_if(backups.begin(), backups.end(),
                               [&key](const Backup& b) { return b.key == key; });
        if (it == backups.end()) {
            recordWarning(key, "no backup captured");
            continue;
        }

        if (it->previous) {
            if (auto r = store_.write(key, *it->previous); !r) {
                recordWarning(key, "restore failed: " + r.error().message);
                continue;
            }
        } else {
            if (auto r = store_.remove(key); !r) {
                recordWarning(key, "removal of new value failed: " + r.error().message);
                continue;
            }
        }

        // Read back what is now durable and compare with the backup
        auto current = store_.readDurable(key);
        if (!current) {
            recordWarning(key, "verification read failed: " + current.error().message);
            continue;
        }
        if (current.value() != it->previous) {
            recordWarning(key, "restored value does not match backup");
            continue;
        }
        ++restoredCount;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.restoredKeys += restoredCount;
}

void TransactionCoordinator::recordWarning(const StorageKey& key, std::string message) {
    spdlog::warn("Integrity warning for {}/{}: {}", key.projectId, key.relativePath, message);

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.integrityWarnings;
    warnings_.push_back(IntegrityWarning{key, std::move(message), std::chrono::system_clock::now()});
    while (warnings_.size() > maxRetainedWarnings_) {
        warnings_.pop_front();
    }
}

std::vector<IntegrityWarning> TransactionCoordinator::integrityWarnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {warnings_.begin(), warnings_.end()};
}

TransactionStats TransactionCoordinator::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace canopy::storage
