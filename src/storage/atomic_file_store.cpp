#include <spdlog/spdlog.h>
#include <canopy/storage/atomic_file_store.h>
#include <canopy/storage/platform.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>

namespace canopy::storage {

namespace fs = std::filesystem;

namespace {

constexpr int kJsonIndent = 2;

Error ioError(const std::error_code& ec, const std::string& what) {
    if (ec == std::errc::permission_denied || ec == std::errc::read_only_file_system ||
        ec == std::errc::operation_not_permitted) {
        return Error{ErrorCode::PermissionDenied, what + ": " + ec.message()};
    }
    if (ec == std::errc::no_space_on_device) {
        return Error{ErrorCode::StorageFull, what + ": " + ec.message()};
    }
    return Error{ErrorCode::WriteError, what + ": " + ec.message()};
}

bool isTempFile(const fs::path& p) {
    auto name = p.filename().string();
    return name.size() > kTempSuffix.size() && name.ends_with(kTempSuffix);
}

} // namespace

// Implementation details
struct AtomicFileStore::Impl {
    StoreConfig config;
    DocumentCache& cache;

    // Mutex pool for per-key write synchronization
    struct MutexPool {
        std::vector<std::unique_ptr<std::mutex>> mutexes;

        explicit MutexPool(size_t size) {
            mutexes.reserve(size);
            for (size_t i = 0; i < size; ++i) {
                mutexes.emplace_back(std::make_unique<std::mutex>());
            }
        }

        std::mutex& getMutex(std::string_view key) {
            auto hashValue = std::hash<std::string_view>{}(key);
            return *mutexes[hashValue % mutexes.size()];
        }
    } writeMutexPool;

    std::atomic<uint64_t> writes{0};
    std::atomic<uint64_t> failedWrites{0};
    mutable std::atomic<uint64_t> durableReads{0};
    std::atomic<uint64_t> removes{0};
    std::atomic<uint64_t> tempFilesCleaned{0};

    Impl(StoreConfig cfg, DocumentCache& c)
        : config(std::move(cfg)), cache(c),
          writeMutexPool(std::max<size_t>(1, config.mutexPoolSize)) {}
};

AtomicFileStore::AtomicFileStore(StoreConfig config, DocumentCache& cache)
    : pImpl(std::make_unique<Impl>(std::move(config), cache)) {}

AtomicFileStore::~AtomicFileStore() = default;

Result<void> AtomicFileStore::initialize() {
    std::error_code ec;
    fs::create_directories(pImpl->config.dataDir, ec);
    if (ec) {
        spdlog::error("Failed to create data directory {}: {}", pImpl->config.dataDir.string(),
                      ec.message());
        return ioError(ec, "create data directory");
    }

    auto cleaned = cleanupTempFiles();
    if (!cleaned) {
        return cleaned.error();
    }

    spdlog::debug("Initialized file store at: {}", pImpl->config.dataDir.string());
    return {};
}

fs::path AtomicFileStore::pathFor(const StorageKey& key) const {
    return pImpl->config.dataDir / key.projectId / fs::path(key.relativePath);
}

const fs::path& AtomicFileStore::dataDir() const {
    return pImpl->config.dataDir;
}

DocumentCache& AtomicFileStore::cache() noexcept {
    return pImpl->cache;
}

Result<std::string> AtomicFileStore::encode(const Document& value) {
    if (value.is_discarded()) {
        return Error{ErrorCode::InvalidData, "cannot encode a discarded document"};
    }
    try {
        return value.dump(kJsonIndent);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("document is not encodable: ") + e.what()};
    }
}

Result<Document> AtomicFileStore::decode(std::string_view text, const std::string& origin) {
    auto doc = Document::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::CorruptedData, "undecodable document at " + origin};
    }
    return doc;
}

Result<void> AtomicFileStore::write(const StorageKey& key, const Document& value) {
    if (auto valid = validateKey(key); !valid) {
        return valid;
    }

    const auto cacheKey = key.cacheKey();
    const auto target = pathFor(key);

    // Phase 1: no reader may keep serving the value about to be replaced
    pImpl->cache.invalidate(cacheKey);

    Result<void> result;
    auto encoded = encode(value);
    if (!encoded) {
        result = encoded.error();
    } else {
        std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(cacheKey));
        result = commitLocked(key, target, encoded.value());
    }

    // Phase 2: drop anything a reader cached between phase 1 and the rename
    pImpl->cache.invalidate(cacheKey);

    if (result) {
        pImpl->writes.fetch_add(1);
        spdlog::debug("Stored {}/{} ({} bytes)", key.projectId, key.relativePath,
                      encoded.value().size());
    } else {
        pImpl->failedWrites.fetch_add(1);
        spdlog::error("Failed to write {}/{}: {}", key.projectId, key.relativePath,
                      result.error().message);
    }
    return result;
}

Result<void> AtomicFileStore::commitLocked(const StorageKey& key, const fs::path& target,
                                           const std::string& encoded) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return ioError(ec, "create directory " + target.parent_path().string());
    }

    auto tempPath = target;
    tempPath += std::string(kTempSuffix);

    auto removeTemp = [&tempPath]() {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        if (rmEc) {
            spdlog::warn("Failed to remove temp file {}: {}", tempPath.string(), rmEc.message());
        }
    };

    if (auto r = platform::writeFileFully(tempPath, encoded, pImpl->config.syncWrites); !r) {
        removeTemp();
        return r;
    }

    if (pImpl->config.faultHook) {
        if (auto r = pImpl->config.faultHook(WritePhase::TempWritten, key); !r) {
            removeTemp();
            return r;
        }
    }

    // Atomic rename
    if (auto r = platform::atomicRename(tempPath, target); !r) {
        removeTemp();
        return r;
    }

    if (pImpl->config.syncWrites) {
        if (auto r = platform::syncDirectory(target.parent_path()); !r) {
            return r;
        }
    }

    if (pImpl->config.faultHook) {
        if (auto r = pImpl->config.faultHook(WritePhase::Renamed, key); !r) {
            return r;
        }
    }
    return {};
}

Result<std::optional<Document>> AtomicFileStore::read(const StorageKey& key) {
    if (auto valid = validateKey(key); !valid) {
        return valid.error();
    }

    const auto cacheKey = key.cacheKey();
    if (auto hit = pImpl->cache.get(cacheKey)) {
        return std::optional<Document>(*hit);
    }

    auto ticket = pImpl->cache.ticket(cacheKey);
    auto durable = readDurable(key);
    if (!durable) {
        return durable.error();
    }

    if (durable.value()) {
        pImpl->cache.fill(cacheKey, ticket, *durable.value());
    }
    return durable;
}

Result<std::optional<Document>> AtomicFileStore::readDurable(const StorageKey& key) const {
    if (auto valid = validateKey(key); !valid) {
        return valid.error();
    }

    const auto path = pathFor(key);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        const bool present = fs::exists(path, ec);
        if (ec) {
            return ioError(ec, "stat " + path.string());
        }
        if (!present) {
            spdlog::debug("No stored value for {}/{}", key.projectId, key.relativePath);
            return std::optional<Document>{};
        }
        return Error{ErrorCode::PermissionDenied, "cannot open " + path.string()};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::CorruptedData, "read failed for " + path.string()};
    }
    pImpl->durableReads.fetch_add(1);

    auto text = buffer.str();
    auto doc = decode(text, path.string());
    if (!doc) {
        spdlog::error("{}", doc.error().message);
        return doc.error();
    }
    return std::optional<Document>(std::move(doc).value());
}

Result<bool> AtomicFileStore::remove(const StorageKey& key) {
    if (auto valid = validateKey(key); !valid) {
        return valid.error();
    }

    const auto cacheKey = key.cacheKey();
    const auto target = pathFor(key);

    pImpl->cache.invalidate(cacheKey);
    bool removed = false;
    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(cacheKey));
        removed = fs::remove(target, ec);
        if (!ec && removed && pImpl->config.syncWrites) {
            if (auto r = platform::syncDirectory(target.parent_path()); !r) {
                pImpl->cache.invalidate(cacheKey);
                return r.error();
            }
        }
    }
    pImpl->cache.invalidate(cacheKey);

    if (ec) {
        spdlog::error("Failed to remove {}: {}", target.string(), ec.message());
        return ioError(ec, "remove " + target.string());
    }
    if (removed) {
        pImpl->removes.fetch_add(1);
        spdlog::debug("Removed {}/{}", key.projectId, key.relativePath);
    }
    return removed;
}

Result<bool> AtomicFileStore::exists(const StorageKey& key) const {
    if (auto valid = validateKey(key); !valid) {
        return valid.error();
    }
    std::error_code ec;
    bool present = fs::is_regular_file(pathFor(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ioError(ec, "stat " + pathFor(key).string());
    }
    return present;
}

Result<std::optional<StoredFileInfo>> AtomicFileStore::stat(const StorageKey& key) const {
    if (auto valid = validateKey(key); !valid) {
        return valid.error();
    }

    const auto path = pathFor(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::optional<StoredFileInfo>{};
    }

    StoredFileInfo info;
    info.size = fs::file_size(path, ec);
    if (ec) {
        return ioError(ec, "stat " + path.string());
    }
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return ioError(ec, "stat " + path.string());
    }
    info.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
    return std::optional<StoredFileInfo>(info);
}

Result<std::vector<std::string>> AtomicFileStore::listFiles(std::string_view projectId) const {
    if (auto valid = validateProjectId(projectId); !valid) {
        return valid.error();
    }

    std::vector<std::string> files;
    const auto projectDir = pImpl->config.dataDir / std::string(projectId);
    std::error_code ec;
    if (!fs::is_directory(projectDir, ec)) {
        return files;
    }

    for (auto it = fs::recursive_directory_iterator(projectDir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && !isTempFile(it->path())) {
            files.push_back(fs::relative(it->path(), projectDir).generic_string());
        }
    }
    if (ec) {
        return ioError(ec, "list " + projectDir.string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

Result<std::vector<std::string>> AtomicFileStore::listProjects() const {
    std::vector<std::string> projects;
    std::error_code ec;
    if (!fs::is_directory(pImpl->config.dataDir, ec)) {
        return projects;
    }

    for (const auto& entry : fs::directory_iterator(pImpl->config.dataDir, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (name == kGlobalProject || !validateProjectId(name)) {
            continue;
        }
        projects.push_back(std::move(name));
    }
    if (ec) {
        return ioError(ec, "list " + pImpl->config.dataDir.string());
    }

    std::sort(projects.begin(), projects.end());
    return projects;
}

Result<bool> AtomicFileStore::projectExists(std::string_view projectId) const {
    if (auto valid = validateProjectId(projectId); !valid) {
        return valid.error();
    }
    std::error_code ec;
    return fs::is_directory(pImpl->config.dataDir / std::string(projectId), ec);
}

Result<bool> AtomicFileStore::deleteProject(std::string_view projectId) {
    if (auto valid = validateProjectId(projectId); !valid) {
        return valid.error();
    }

    const auto prefix = std::string(projectId) + ":";
    const auto projectDir = pImpl->config.dataDir / std::string(projectId);

    pImpl->cache.invalidatePrefix(prefix);
    std::error_code ec;
    auto removed = fs::remove_all(projectDir, ec);
    pImpl->cache.invalidatePrefix(prefix);

    if (ec) {
        spdlog::error("Failed to delete project {}: {}", projectId, ec.message());
        return ioError(ec, "delete project " + std::string(projectId));
    }
    if (removed == 0) {
        spdlog::warn("Project directory not found during deletion: {}", projectDir.string());
        return false;
    }

    spdlog::info("Deleted project {} ({} entries)", projectId, removed);
    return true;
}

Result<std::size_t> AtomicFileStore::cleanupTempFiles() {
    std::size_t cleaned = 0;
    std::error_code ec;
    if (!fs::is_directory(pImpl->config.dataDir, ec)) {
        return cleaned;
    }

    std::vector<fs::path> stale;
    for (auto it = fs::recursive_directory_iterator(pImpl->config.dataDir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && isTempFile(it->path())) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        return ioError(ec, "scan " + pImpl->config.dataDir.string());
    }

    for (const auto& path : stale) {
        std::error_code rmEc;
        if (fs::remove(path, rmEc)) {
            ++cleaned;
        } else if (rmEc) {
            spdlog::warn("Failed to remove stale temp file {}: {}", path.string(),
                         rmEc.message());
        }
    }

    if (cleaned > 0) {
        pImpl->tempFilesCleaned.fetch_add(cleaned);
        spdlog::info("Removed {} stale temp files under {}", cleaned,
                     pImpl->config.dataDir.string());
    }
    return cleaned;
}

StoreStats AtomicFileStore::getStats() const noexcept {
    StoreStats s;
    s.writes = pImpl->writes.load();
    s.failedWrites = pImpl->failedWrites.load();
    s.durableReads = pImpl->durableReads.load();
    s.removes = pImpl->removes.load();
    s.tempFilesCleaned = pImpl->tempFilesCleaned.load();
    return s;
}

} // namespace canopy::storage
