#pragma once

#include <canopy/core/types.h>
#include <canopy/storage/document_cache.h>
#include <canopy/storage/storage_key.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canopy::storage {

// Points in the write protocol where a fault hook is consulted.
enum class WritePhase {
    TempWritten, ///< temp file complete, final path untouched
    Renamed      ///< rename done, new value visible
};

// Test seam: returning an error at a phase aborts the write there, as a crash would.
using WriteFaultHook = std::function<Result<void>(WritePhase, const StorageKey&)>;

// Storage configuration
struct StoreConfig {
    std::filesystem::path dataDir;
    bool syncWrites = true;
    std::size_t mutexPoolSize = 64;
    WriteFaultHook faultHook;
};

struct StoredFileInfo {
    std::uint64_t size = 0;
    TimePoint lastModified;
};

struct StoreStats {
    uint64_t writes = 0;
    uint64_t failedWrites = 0;
    uint64_t durableReads = 0;
    uint64_t removes = 0;
    uint64_t tempFilesCleaned = 0;
};

/**
 * @brief Durable document storage keyed by (projectId, relativePath).
 *
 * Layout: <dataDir>/<projectId>/<relativePath>. A write goes to
 * "<name>.tmp" and is renamed onto "<name>"; the rename is the only
 * externally visible mutation, so the file at the final path is always a
 * complete, previously committed value.
 *
 * Every write and remove runs the two-phase cache protocol: invalidate,
 * mutate, invalidate again. Reads hit the cache first and populate it only
 * through a generation-checked fill (see DocumentCache).
 */
class AtomicFileStore {
public:
    AtomicFileStore(StoreConfig config, DocumentCache& cache);
    ~AtomicFileStore();

    AtomicFileStore(const AtomicFileStore&) = delete;
    AtomicFileStore& operator=(const AtomicFileStore&) = delete;

    // Create the data directory and remove temp files left behind by a crash.
    [[nodiscard]] Result<void> initialize();

    // Core operations
    [[nodiscard]] Result<void> write(const StorageKey& key, const Document& value);
    [[nodiscard]] Result<std::optional<Document>> read(const StorageKey& key);
    // Read the committed file, bypassing and not populating the cache.
    [[nodiscard]] Result<std::optional<Document>> readDurable(const StorageKey& key) const;
    // Returns false when there was nothing to remove.
    [[nodiscard]] Result<bool> remove(const StorageKey& key);
    [[nodiscard]] Result<bool> exists(const StorageKey& key) const;
    [[nodiscard]] Result<std::optional<StoredFileInfo>> stat(const StorageKey& key) const;

    // Project-level operations
    [[nodiscard]] Result<std::vector<std::string>> listFiles(std::string_view projectId) const;
    [[nodiscard]] Result<std::vector<std::string>> listProjects() const;
    [[nodiscard]] Result<bool> projectExists(std::string_view projectId) const;
    [[nodiscard]] Result<bool> deleteProject(std::string_view projectId);

    // Maintenance
    [[nodiscard]] Result<std::size_t> cleanupTempFiles();

    [[nodiscard]] std::filesystem::path pathFor(const StorageKey& key) const;
    [[nodiscard]] const std::filesystem::path& dataDir() const;
    DocumentCache& cache() noexcept;
    StoreStats getStats() const noexcept;

    // Encoded form of a document: JSON with an indent of 2.
    static Result<std::string> encode(const Document& value);
    static Result<Document> decode(std::string_view text, const std::string& origin);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    Result<void> commitLocked(const StorageKey& key, const std::filesystem::path& target,
                              const std::string& encoded);
};

} // namespace canopy::storage
