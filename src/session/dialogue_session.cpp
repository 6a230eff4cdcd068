#include <canopy/core/id.h>
#include <canopy/session/dialogue_session.h>

namespace canopy::session {

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:
            return "active";
        case SessionStatus::Completed:
            return "completed";
    }
    return "active";
}

std::optional<SessionStatus> parseSessionStatus(std::string_view text) {
    if (text == "active")
        return SessionStatus::Active;
    if (text == "completed")
        return SessionStatus::Completed;
    return std::nullopt;
}

Result<void> validateSession(const DialogueSession& session) {
    if (session.id.empty()) {
        return Error{ErrorCode::ValidationError, "session id must not be empty"};
    }
    if (session.projectId.empty()) {
        return Error{ErrorCode::ValidationError, "session " + session.id + " has no project id"};
    }
    if (session.currentRound < 1) {
        return Error{ErrorCode::ValidationError, "session round must start at 1"};
    }
    return {};
}

bool SessionUpdate::empty() const {
    return !currentRound && !responses && !uncertaintyMap && !confidenceLevels && !goalEvolution &&
           !lastQuestion;
}

Result<void> validateUpdate(const SessionUpdate& update) {
    if (update.currentRound && *update.currentRound < 1) {
        return Error{ErrorCode::ValidationError, "session round must start at 1"};
    }
    return {};
}

void applyUpdate(DialogueSession& session, const SessionUpdate& update, TimePoint now) {
    if (update.currentRound)
        session.currentRound = *update.currentRound;
    if (update.responses)
        session.responses = *update.responses;
    if (update.uncertaintyMap)
        session.uncertaintyMap = *update.uncertaintyMap;
    if (update.confidenceLevels)
        session.confidenceLevels = *update.confidenceLevels;
    if (update.goalEvolution)
        session.goalEvolution = *update.goalEvolution;
    if (update.lastQuestion)
        session.lastQuestion = *update.lastQuestion;
    session.lastUpdated = now;
}

Document toJson(const DialogueSession& session) {
    Document doc = {
        {"id", session.id},
        {"projectId", session.projectId},
        {"originalGoal", session.originalGoal},
        {"context", session.context},
        {"status", toString(session.status)},
        {"startedAt", core::toEpochMillis(session.startedAt)},
        {"currentRound", session.currentRound},
        {"responses", session.responses},
        {"uncertaintyMap", session.uncertaintyMap},
        {"confidenceLevels", session.confidenceLevels},
        {"goalEvolution", session.goalEvolution},
        {"lastUpdated", core::toEpochMillis(session.lastUpdated)},
    };
    doc["completedAt"] =
        session.completedAt ? Document(core::toEpochMillis(*session.completedAt)) : Document();
    doc["refinedGoal"] = session.refinedGoal ? *session.refinedGoal : Document();
    doc["finalConfidence"] = session.finalConfidence ? Document(*session.finalConfidence) : Document();
    doc["lastQuestion"] = session.lastQuestion ? Document(*session.lastQuestion) : Document();
    return doc;
}

Result<DialogueSession> sessionFromJson(const Document& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "session document must be an object"};
    }

    try {
        DialogueSession s;
        s.id = doc.at("id").get<std::string>();
        s.projectId = doc.at("projectId").get<std::string>();
        s.originalGoal = doc.value("originalGoal", "");
        s.context = doc.value("context", "");

        auto status = parseSessionStatus(doc.value("status", "active"));
        if (!status) {
            return Error{ErrorCode::InvalidData, "unknown session status"};
        }
        s.status = *status;

        s.startedAt = core::fromEpochMillis(doc.at("startedAt").get<int64_t>());
        s.currentRound = doc.value("currentRound", 1);
        s.responses = doc.value("responses", Document::array());
        s.uncertaintyMap = doc.value("uncertaintyMap", Document::object());
        s.confidenceLevels = doc.value("confidenceLevels", Document::object());
        s.goalEvolution = doc.value("goalEvolution", Document::array());
        s.lastUpdated = core::fromEpochMillis(doc.value("lastUpdated", int64_t{0}));

        if (auto it = doc.find("completedAt"); it != doc.end() && !it->is_null()) {
            s.completedAt = core::fromEpochMillis(it->get<int64_t>());
        }
        if (auto it = doc.find("refinedGoal"); it != doc.end() && !it->is_null()) {
            s.refinedGoal = *it;
        }
        if (auto it = doc.find("finalConfidence"); it != doc.end() && !it->is_null()) {
            s.finalConfidence = it->get<double>();
        }
        if (auto it = doc.find("lastQuestion"); it != doc.end() && !it->is_null()) {
            s.lastQuestion = it->get<std::string>();
        }
        return s;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed session document: ") + e.what()};
    }
}

} // namespace canopy::session
