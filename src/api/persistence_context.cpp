#include <spdlog/spdlog.h>
#include <canopy/api/persistence_context.h>
#include <canopy/session/session_store.h>
#include <canopy/storage/storage_key.h>

namespace canopy::api {

PersistenceContext::PersistenceContext(config::CanopyConfig config) : config_(std::move(config)) {}

PersistenceContext::~PersistenceContext() {
    // Queued operations reference the components below; let them finish first
    if (pool_) {
        pool_->join();
    }
}

Result<std::unique_ptr<PersistenceContext>>
PersistenceContext::create(const config::CanopyConfig& config) {
    return create(config, Options{});
}

Result<std::unique_ptr<PersistenceContext>>
PersistenceContext::create(const config::CanopyConfig& config, Options options) {
    if (config.dataDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "data directory is not configured"};
    }

    std::unique_ptr<PersistenceContext> ctx(new PersistenceContext(config));

    ctx->cache_ = std::make_unique<storage::DocumentCache>(config.cacheMaxEntries);

    storage::StoreConfig storeConfig;
    storeConfig.dataDir = config.dataDir;
    storeConfig.syncWrites = config.syncWrites;
    storeConfig.faultHook = std::move(options.faultHook);
    ctx->store_ = std::make_unique<storage::AtomicFileStore>(std::move(storeConfig), *ctx->cache_);
    if (auto r = ctx->store_->initialize(); !r) {
        return r.error();
    }

    ctx->coordinator_ = std::make_unique<storage::TransactionCoordinator>(*ctx->store_);

    ctx->pool_ = std::make_unique<boost::asio::thread_pool>(config.serializerThreads);
    ctx->serializer_ =
        std::make_unique<concurrency::OperationSerializer>(ctx->pool_->get_executor());

    // Session storage failures never fail startup; the registry runs in memory instead
    std::unique_ptr<session::ISessionStore> sessionStore = std::move(options.sessionStore);
    if (!sessionStore && config.sessionsEnabled) {
        auto opened = session::SqliteSessionStore::open(config.dataDir / config.sessionsDbName);
        if (opened) {
            sessionStore = std::move(opened).value();
        } else {
            spdlog::warn("Dialogue session store unavailable: {}", opened.error().message);
        }
    }
    ctx->sessions_ = std::make_unique<session::DialogueSessionRegistry>(std::move(sessionStore));

    spdlog::info("Persistence context ready (data dir {}, {} serializer threads)",
                 config.dataDir.string(), config.serializerThreads);
    return std::move(ctx);
}

Result<std::optional<Document>> PersistenceContext::readFile(const std::string& projectId,
                                                             const std::string& relativePath) {
    return store_->read(storage::StorageKey{projectId, relativePath});
}

Result<void> PersistenceContext::writeFile(const std::string& projectId,
                                           const std::string& relativePath,
                                           const Document& value) {
    return serializer_->run(projectId, [this, &projectId, &relativePath, &value]() {
        return store_->write(storage::StorageKey{projectId, relativePath}, value);
    });
}

Result<storage::TransactionReceipt>
PersistenceContext::transact(const std::string& projectId,
                             const std::vector<ProjectWrite>& writes) {
    std::vector<storage::WriteOp> ops;
    ops.reserve(writes.size());
    for (const auto& w : writes) {
        ops.push_back(storage::WriteOp{storage::StorageKey{projectId, w.relativePath}, w.value});
    }

    return serializer_->run(projectId, [this, &ops]() { return coordinator_->transact(ops); });
}

Result<bool> PersistenceContext::deleteProject(const std::string& projectId) {
    if (projectId == storage::kGlobalProject) {
        return Error{ErrorCode::InvalidOperation, "the global project cannot be deleted"};
    }
    return serializer_->run(projectId,
                            [this, &projectId]() { return store_->deleteProject(projectId); });
}

Result<std::vector<std::string>> PersistenceContext::listProjects() {
    return store_->listProjects();
}

Result<std::vector<std::string>>
PersistenceContext::listProjectFiles(const std::string& projectId) {
    return store_->listFiles(projectId);
}

Result<bool> PersistenceContext::projectExists(const std::string& projectId) {
    return store_->projectExists(projectId);
}

Result<std::optional<Document>> PersistenceContext::readGlobal(const std::string& relativePath) {
    return readFile(std::string(storage::kGlobalProject), relativePath);
}

Result<void> PersistenceContext::writeGlobal(const std::string& relativePath,
                                             const Document& value) {
    return writeFile(std::string(storage::kGlobalProject), relativePath, value);
}

Result<void> PersistenceContext::saveSession(const session::DialogueSession& session) {
    return sessions_->save(session);
}

Result<std::optional<session::DialogueSession>>
PersistenceContext::loadSession(const std::string& sessionId) {
    return sessions_->load(sessionId);
}

Result<std::vector<session::DialogueSession>>
PersistenceContext::listActiveSessions(const std::optional<std::string>& projectId) {
    return sessions_->listActive(projectId);
}

Result<bool> PersistenceContext::updateSession(const std::string& sessionId,
                                               const session::SessionUpdate& update) {
    return sessions_->update(sessionId, update);
}

Result<bool> PersistenceContext::completeSession(const std::string& sessionId,
                                                 const Document& result, double finalConfidence) {
    return sessions_->complete(sessionId, result, finalConfidence);
}

} // namespace canopy::api
