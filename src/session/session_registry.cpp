#include <spdlog/spdlog.h>
#include <canopy/core/id.h>
#include <canopy/session/session_registry.h>

#include <algorithm>

namespace canopy::session {

namespace {

void sortByStartDescending(std::vector<DialogueSession>& sessions) {
    std::stable_sort(sessions.begin(), sessions.end(),
                     [](const DialogueSession& a, const DialogueSession& b) {
                         return a.startedAt > b.startedAt;
                     });
}

} // namespace

DialogueSessionRegistry::DialogueSessionRegistry(std::unique_ptr<ISessionStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        spdlog::warn("Dialogue sessions are kept in memory only and will not survive a restart");
    }
}

DialogueSessionRegistry::~DialogueSessionRegistry() = default;

void DialogueSessionRegistry::degrade(const std::string& operation, const Error& error) {
    if (!store_) {
        return;
    }
    spdlog::warn("Dialogue session store failed during {} ({}); continuing in memory only",
                 operation, error.message);
    store_.reset();
}

bool DialogueSessionRegistry::durable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_ != nullptr;
}

std::size_t DialogueSessionRegistry::cachedSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

Result<DialogueSession> DialogueSessionRegistry::start(const std::string& projectId,
                                                       const std::string& originalGoal,
                                                       const std::string& context,
                                                       std::optional<std::string> sessionId) {
    DialogueSession session;
    session.id = sessionId ? std::move(*sessionId) : core::generateId("dialogue");
    session.projectId = projectId;
    session.originalGoal = originalGoal;
    session.context = context;
    session.startedAt = core::nowMillis();
    session.lastUpdated = session.startedAt;
    session.goalEvolution = Document::array({originalGoal});

    if (auto r = save(session); !r) {
        return r.error();
    }
    spdlog::info("Started dialogue session {} for project {}", session.id, projectId);
    return session;
}

Result<void> DialogueSessionRegistry::save(const DialogueSession& session) {
    if (auto valid = validateSession(session); !valid) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        if (auto r = store_->save(session); !r) {
            if (r.error().code == ErrorCode::InvalidData) {
                return r;
            }
            degrade("save", r.error());
        }
    }
    // Completed sessions are only cached while there is no store to read them back from
    if (store_ && !session.isActive()) {
        sessions_.erase(session.id);
    } else {
        sessions_.insert_or_assign(session.id, session);
    }
    return {};
}

Result<std::optional<DialogueSession>>
DialogueSessionRegistry::load(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = sessions_.find(sessionId); it != sessions_.end()) {
        return std::optional<DialogueSession>(it->second);
    }
    if (!store_) {
        return std::optional<DialogueSession>{};
    }

    auto loaded = store_->load(sessionId);
    if (!loaded) {
        degrade("load", loaded.error());
        return std::optional<DialogueSession>{};
    }
    if (loaded.value() && loaded.value()->isActive()) {
        sessions_.insert_or_assign(sessionId, *loaded.value());
    }
    return loaded;
}

std::vector<DialogueSession>
DialogueSessionRegistry::memoryMatching(const std::optional<std::string>& projectId,
                                        bool activeOnly) const {
    std::vector<DialogueSession> out;
    for (const auto& [id, session] : sessions_) {
        if (projectId && session.projectId != *projectId)
            continue;
        if (activeOnly && !session.isActive())
            continue;
        out.push_back(session);
    }
    sortByStartDescending(out);
    return out;
}

Result<std::vector<DialogueSession>>
DialogueSessionRegistry::listActive(const std::optional<std::string>& projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        auto listed = store_->listActive(projectId);
        if (listed) {
            return listed;
        }
        degrade("listActive", listed.error());
    }
    return memoryMatching(projectId, true);
}

Result<std::vector<DialogueSession>>
DialogueSessionRegistry::listByProject(const std::string& projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        auto listed = store_->listByProject(projectId);
        if (listed) {
            return listed;
        }
        degrade("listByProject", listed.error());
    }
    return memoryMatching(projectId, false);
}

Result<bool> DialogueSessionRegistry::update(const std::string& sessionId,
                                             const SessionUpdate& update) {
    if (auto valid = validateUpdate(update); !valid) {
        return valid.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool found = false;
    if (store_) {
        auto updated = store_->update(sessionId, update);
        if (updated) {
            found = updated.value();
        } else if (updated.error().code == ErrorCode::InvalidData) {
            return updated.error();
        } else {
            degrade("update", updated.error());
        }
    }

    if (auto it = sessions_.find(sessionId); it != sessions_.end()) {
        applyUpdate(it->second, update, core::nowMillis());
        found = true;
    }
    return found;
}

Result<bool> DialogueSessionRegistry::complete(const std::string& sessionId,
                                               const Document& result, double finalConfidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool found = false;
    if (store_) {
        auto completed = store_->complete(sessionId, result, finalConfidence);
        if (completed) {
            found = completed.value();
        } else if (completed.error().code == ErrorCode::InvalidData) {
            return completed.error();
        } else {
            degrade("complete", completed.error());
        }
    }

    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return found;
    }
    if (store_ && found) {
        // The store holds the completed record; stop caching it
        sessions_.erase(it);
        return true;
    }

    auto now = core::nowMillis();
    it->second.status = SessionStatus::Completed;
    it->second.completedAt = now;
    it->second.refinedGoal = result;
    it->second.finalConfidence = finalConfidence;
    it->second.lastUpdated = now;
    return true;
}

Result<bool> DialogueSessionRegistry::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = sessions_.erase(sessionId) > 0;
    if (store_) {
        auto r = store_->remove(sessionId);
        if (r) {
            removed = removed || r.value();
        } else {
            degrade("remove", r.error());
        }
    }
    return removed;
}

Result<SessionStats> DialogueSessionRegistry::stats(const std::optional<std::string>& projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        auto s = store_->stats(projectId);
        if (s) {
            return s;
        }
        degrade("stats", s.error());
    }

    SessionStats s;
    double confidenceSum = 0.0;
    std::size_t confidenceCount = 0;
    for (const auto& session : memoryMatching(projectId, false)) {
        ++s.total;
        if (session.isActive()) {
            ++s.active;
        } else {
            ++s.completed;
            if (session.finalConfidence) {
                confidenceSum += *session.finalConfidence;
                ++confidenceCount;
            }
        }
    }
    if (confidenceCount > 0) {
        s.avgConfidence = confidenceSum / static_cast<double>(confidenceCount);
    }
    return s;
}

Result<std::optional<DialogueSession>>
DialogueSessionRegistry::mostRecentActive(const std::string& projectId) {
    auto active = listActive(projectId);
    if (!active) {
        return active.error();
    }
    if (active.value().empty()) {
        return std::optional<DialogueSession>{};
    }
    return std::optional<DialogueSession>(active.value().front());
}

Result<std::size_t> DialogueSessionRegistry::resume(const std::optional<std::string>& projectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_) {
        return std::size_t{0};
    }

    auto active = store_->listActive(projectId);
    if (!active) {
        degrade("resume", active.error());
        return std::size_t{0};
    }
    for (auto& session : active.value()) {
        auto id = session.id;
        sessions_.insert_or_assign(std::move(id), std::move(session));
    }
    spdlog::info("Resumed {} active dialogue sessions{}", active.value().size(),
                 projectId ? " for project " + *projectId : std::string{});
    return active.value().size();
}

} // namespace canopy::session
