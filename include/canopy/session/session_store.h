#pragma once

#include <canopy/core/types.h>
#include <canopy/metadata/database.h>
#include <canopy/session/dialogue_session.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace canopy::session {

/**
 * @brief Durable storage for dialogue sessions, keyed by session id.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    // Idempotent upsert; safe to call after every round.
    virtual Result<void> save(const DialogueSession& session) = 0;
    virtual Result<std::optional<DialogueSession>> load(const std::string& sessionId) = 0;
    // Active sessions, most recently started first.
    virtual Result<std::vector<DialogueSession>>
    listActive(const std::optional<std::string>& projectId) = 0;
    virtual Result<std::vector<DialogueSession>> listByProject(const std::string& projectId) = 0;
    // Writes only the fields set in update. Returns false when no session has that id.
    virtual Result<bool> update(const std::string& sessionId, const SessionUpdate& update) = 0;
    // Returns false when no session has that id.
    virtual Result<bool> complete(const std::string& sessionId, const Document& result,
                                  double finalConfidence) = 0;
    virtual Result<bool> remove(const std::string& sessionId) = 0;
    virtual Result<SessionStats> stats(const std::optional<std::string>& projectId) = 0;
};

/**
 * @brief ISessionStore over a single SQLite file (WAL mode).
 *
 * One connection, guarded by a mutex. Free-form session fields are stored
 * as JSON text; timestamps as epoch milliseconds.
 */
class SqliteSessionStore final : public ISessionStore {
public:
    static Result<std::unique_ptr<SqliteSessionStore>> open(const std::filesystem::path& dbPath);
    static Result<std::unique_ptr<SqliteSessionStore>> openInMemory();

    ~SqliteSessionStore() override;

    Result<void> save(const DialogueSession& session) override;
    Result<std::optional<DialogueSession>> load(const std::string& sessionId) override;
    Result<std::vector<DialogueSession>>
    listActive(const std::optional<std::string>& projectId) override;
    Result<std::vector<DialogueSession>> listByProject(const std::string& projectId) override;
    Result<bool> update(const std::string& sessionId, const SessionUpdate& update) override;
    Result<bool> complete(const std::string& sessionId, const Document& result,
                          double finalConfidence) override;
    Result<bool> remove(const std::string& sessionId) override;
    Result<SessionStats> stats(const std::optional<std::string>& projectId) override;

    [[nodiscard]] const std::string& path() const { return db_.path(); }

private:
    explicit SqliteSessionStore(metadata::Database db);

    Result<void> createSchema();
    Result<std::vector<DialogueSession>> query(const std::string& sql,
                                               const std::optional<std::string>& param);

    std::mutex mutex_;
    metadata::Database db_;
};

} // namespace canopy::session
