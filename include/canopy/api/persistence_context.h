#pragma once

#include <canopy/concurrency/operation_serializer.h>
#include <canopy/config/canopy_config.h>
#include <canopy/core/types.h>
#include <canopy/session/session_registry.h>
#include <canopy/storage/atomic_file_store.h>
#include <canopy/storage/document_cache.h>
#include <canopy/storage/transaction_coordinator.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace canopy::api {

// One write of a project transaction, addressed relative to the project.
struct ProjectWrite {
    std::string relativePath;
    Document value;
};

/**
 * @brief Entry point for collaborators: owns and wires every persistence component.
 *
 * Built once per process by create() and passed by reference. Mutating
 * project calls (writeFile, transact, deleteProject) run on the project's
 * serializer lane; called from inside runSerialized() for the same project
 * they execute inline. Reads go straight to the store and its cache.
 */
class PersistenceContext {
public:
    struct Options {
        storage::WriteFaultHook faultHook;
        // Replaces the SQLite session store opened from the config.
        std::unique_ptr<session::ISessionStore> sessionStore;
    };

    static Result<std::unique_ptr<PersistenceContext>> create(const config::CanopyConfig& config);
    static Result<std::unique_ptr<PersistenceContext>> create(const config::CanopyConfig& config,
                                                              Options options);
    ~PersistenceContext();

    PersistenceContext(const PersistenceContext&) = delete;
    PersistenceContext& operator=(const PersistenceContext&) = delete;

    // Run op exclusively for projectId; blocks until it has finished.
    template <typename F> auto runSerialized(const std::string& projectId, F&& op) {
        return serializer_->run(projectId, std::forward<F>(op));
    }

    template <typename F> auto submitSerialized(const std::string& projectId, F&& op) {
        return serializer_->submit(projectId, std::forward<F>(op));
    }

    // Project documents
    Result<std::optional<Document>> readFile(const std::string& projectId,
                                             const std::string& relativePath);
    Result<void> writeFile(const std::string& projectId, const std::string& relativePath,
                           const Document& value);
    Result<storage::TransactionReceipt> transact(const std::string& projectId,
                                                 const std::vector<ProjectWrite>& writes);
    Result<bool> deleteProject(const std::string& projectId);
    Result<std::vector<std::string>> listProjects();
    Result<std::vector<std::string>> listProjectFiles(const std::string& projectId);
    Result<bool> projectExists(const std::string& projectId);

    // Documents not owned by any project
    Result<std::optional<Document>> readGlobal(const std::string& relativePath);
    Result<void> writeGlobal(const std::string& relativePath, const Document& value);

    // Dialogue sessions
    Result<void> saveSession(const session::DialogueSession& session);
    Result<std::optional<session::DialogueSession>> loadSession(const std::string& sessionId);
    Result<std::vector<session::DialogueSession>>
    listActiveSessions(const std::optional<std::string>& projectId = std::nullopt);
    Result<bool> updateSession(const std::string& sessionId, const session::SessionUpdate& update);
    Result<bool> completeSession(const std::string& sessionId, const Document& result,
                                 double finalConfidence);

    // Components
    storage::AtomicFileStore& store() { return *store_; }
    storage::DocumentCache& cache() { return *cache_; }
    storage::TransactionCoordinator& transactions() { return *coordinator_; }
    concurrency::OperationSerializer& serializer() { return *serializer_; }
    session::DialogueSessionRegistry& sessions() { return *sessions_; }
    const config::CanopyConfig& config() const { return config_; }

private:
    explicit PersistenceContext(config::CanopyConfig config);

    config::CanopyConfig config_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::unique_ptr<storage::DocumentCache> cache_;
    std::unique_ptr<storage::AtomicFileStore> store_;
    std::unique_ptr<storage::TransactionCoordinator> coordinator_;
    std::unique_ptr<concurrency::OperationSerializer> serializer_;
    std::unique_ptr<session::DialogueSessionRegistry> sessions_;
};

} // namespace canopy::api
