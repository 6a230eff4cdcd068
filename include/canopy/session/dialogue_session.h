#pragma once

#include <canopy/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace canopy::session {

enum class SessionStatus { Active, Completed };

const char* toString(SessionStatus status);
std::optional<SessionStatus> parseSessionStatus(std::string_view text);

/**
 * @brief Long-lived state of one goal-clarification dialogue.
 *
 * Free-form parts (responses, uncertainty map, confidence levels, goal
 * evolution, refined goal) are opaque JSON owned by the dialogue logic.
 * Timestamps are kept at millisecond precision, the precision they are
 * stored with.
 */
struct DialogueSession {
    std::string id;
    std::string projectId;
    std::string originalGoal;
    std::string context;
    SessionStatus status = SessionStatus::Active;
    TimePoint startedAt;
    std::optional<TimePoint> completedAt;
    int currentRound = 1;
    Document responses = Document::array();
    Document uncertaintyMap = Document::object();
    Document confidenceLevels = Document::object();
    std::optional<Document> refinedGoal;
    std::optional<double> finalConfidence;
    Document goalEvolution = Document::array();
    std::optional<std::string> lastQuestion;
    TimePoint lastUpdated;

    [[nodiscard]] bool isActive() const { return status == SessionStatus::Active; }

    bool operator==(const DialogueSession&) const = default;
};

// Field-scoped change to a session; unset fields keep their stored value.
struct SessionUpdate {
    std::optional<int> currentRound;
    std::optional<Document> responses;
    std::optional<Document> uncertaintyMap;
    std::optional<Document> confidenceLevels;
    std::optional<Document> goalEvolution;
    std::optional<std::string> lastQuestion;

    [[nodiscard]] bool empty() const;
};

struct SessionStats {
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t completed = 0;
    double avgConfidence = 0.0; ///< mean final confidence of completed sessions
};

// JSON form used for logging and export; timestamps as epoch milliseconds.
Document toJson(const DialogueSession& session);
Result<DialogueSession> sessionFromJson(const Document& doc);

Result<void> validateSession(const DialogueSession& session);
Result<void> validateUpdate(const SessionUpdate& update);

// Copies the set fields of update into session and stamps lastUpdated.
void applyUpdate(DialogueSession& session, const SessionUpdate& update, TimePoint now);

} // namespace canopy::session
