#pragma once

#include <canopy/core/types.h>
#include <canopy/session/dialogue_session.h>
#include <canopy/session/session_store.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace canopy::session {

/**
 * @brief In-memory view of dialogue sessions, written through to a durable store.
 *
 * Without a store, or after the store fails, the registry keeps working in
 * memory only: sessions started from then on are lost on restart. The
 * switch is logged once with spdlog::warn.
 */
class DialogueSessionRegistry {
public:
    // A null store starts the registry in memory-only mode.
    explicit DialogueSessionRegistry(std::unique_ptr<ISessionStore> store);
    ~DialogueSessionRegistry();

    DialogueSessionRegistry(const DialogueSessionRegistry&) = delete;
    DialogueSessionRegistry& operator=(const DialogueSessionRegistry&) = delete;

    // Create and persist a new active session. Generates an id when none is given.
    Result<DialogueSession> start(const std::string& projectId, const std::string& originalGoal,
                                  const std::string& context,
                                  std::optional<std::string> sessionId = std::nullopt);

    Result<void> save(const DialogueSession& session);
    Result<std::optional<DialogueSession>> load(const std::string& sessionId);
    Result<std::vector<DialogueSession>> listActive(const std::optional<std::string>& projectId);
    Result<std::vector<DialogueSession>> listByProject(const std::string& projectId);
    Result<bool> update(const std::string& sessionId, const SessionUpdate& update);
    // With a store, the completed session is dropped from memory and read back on demand.
    Result<bool> complete(const std::string& sessionId, const Document& result,
                          double finalConfidence);
    Result<bool> remove(const std::string& sessionId);
    Result<SessionStats> stats(const std::optional<std::string>& projectId);

    // The active session of a project that started last, if any.
    Result<std::optional<DialogueSession>> mostRecentActive(const std::string& projectId);

    // Reload active sessions from the store into memory; returns how many were loaded.
    Result<std::size_t> resume(const std::optional<std::string>& projectId = std::nullopt);

    [[nodiscard]] bool durable() const;
    // Sessions held in memory: active ones, plus completed ones when memory-only.
    [[nodiscard]] std::size_t cachedSessions() const;

private:
    void degrade(const std::string& operation, const Error& error);
    std::vector<DialogueSession> memoryMatching(const std::optional<std::string>& projectId,
                                                bool activeOnly) const;

    mutable std::mutex mutex_;
    std::unique_ptr<ISessionStore> store_;
    std::unordered_map<std::string, DialogueSession> sessions_;
};

} // namespace canopy::session
