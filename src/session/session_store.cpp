#include <spdlog/spdlog.h>
#include <canopy/core/id.h>
#include <canopy/session/session_store.h>

#include <utility>
#include <vector>

namespace canopy::session {

namespace {

constexpr auto kBusyTimeout = std::chrono::milliseconds(5000);

constexpr const char* kSelectColumns =
    "SELECT id, project_id, original_goal, context, status, started_at, completed_at, "
    "current_round, responses, uncertainty_map, confidence_levels, refined_goal, "
    "final_confidence, goal_evolution, last_question, last_updated FROM dialogue_sessions";

Result<Document> parseColumn(const metadata::Statement& stmt, int column, Document fallback,
                             const std::string& sessionId) {
    if (stmt.isNull(column)) {
        return fallback;
    }
    auto text = stmt.getString(column);
    if (text.empty()) {
        return fallback;
    }
    auto doc = Document::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::CorruptedData,
                     "undecodable column " + std::to_string(column) + " in session " + sessionId};
    }
    return doc;
}

Result<DialogueSession> readRow(const metadata::Statement& stmt) {
    DialogueSession s;
    s.id = stmt.getString(0);
    s.projectId = stmt.getString(1);
    s.originalGoal = stmt.getString(2);
    s.context = stmt.getString(3);

    auto status = parseSessionStatus(stmt.getString(4));
    if (!status) {
        return Error{ErrorCode::CorruptedData, "unknown status in session " + s.id};
    }
    s.status = *status;
    s.startedAt = core::fromEpochMillis(stmt.getInt64(5));
    if (!stmt.isNull(6)) {
        s.completedAt = core::fromEpochMillis(stmt.getInt64(6));
    }
    s.currentRound = stmt.getInt(7);

    auto responses = parseColumn(stmt, 8, Document::array(), s.id);
    if (!responses)
        return responses.error();
    s.responses = std::move(responses).value();

    auto uncertainty = parseColumn(stmt, 9, Document::object(), s.id);
    if (!uncertainty)
        return uncertainty.error();
    s.uncertaintyMap = std::move(uncertainty).value();

    auto confidence = parseColumn(stmt, 10, Document::object(), s.id);
    if (!confidence)
        return confidence.error();
    s.confidenceLevels = std::move(confidence).value();

    if (!stmt.isNull(11)) {
        auto refined = parseColumn(stmt, 11, Document(), s.id);
        if (!refined)
            return refined.error();
        s.refinedGoal = std::move(refined).value();
    }
    if (!stmt.isNull(12)) {
        s.finalConfidence = stmt.getDouble(12);
    }

    auto evolution = parseColumn(stmt, 13, Document::array(), s.id);
    if (!evolution)
        return evolution.error();
    s.goalEvolution = std::move(evolution).value();

    if (!stmt.isNull(14)) {
        s.lastQuestion = stmt.getString(14);
    }
    s.lastUpdated = core::fromEpochMillis(stmt.getInt64(15));
    return s;
}

Result<std::string> dumpColumn(const Document& doc) {
    try {
        return doc.dump();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("session field not encodable: ") + e.what()};
    }
}

} // namespace

SqliteSessionStore::SqliteSessionStore(metadata::Database db) : db_(std::move(db)) {}

SqliteSessionStore::~SqliteSessionStore() = default;

Result<std::unique_ptr<SqliteSessionStore>>
SqliteSessionStore::open(const std::filesystem::path& dbPath) {
    std::error_code ec;
    if (dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "cannot create " + dbPath.parent_path().string() + ": " + ec.message()};
        }
    }

    metadata::OpenOptions options;
    options.busyTimeout = kBusyTimeout;
    auto db = metadata::Database::open(dbPath, options);
    if (!db) {
        return db.error();
    }

    std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(std::move(db).value()));
    if (auto r = store->createSchema(); !r) {
        return r.error();
    }
    spdlog::info("Dialogue session store opened at {}", dbPath.string());
    return std::move(store);
}

Result<std::unique_ptr<SqliteSessionStore>> SqliteSessionStore::openInMemory() {
    auto db = metadata::Database::openInMemory();
    if (!db) {
        return db.error();
    }
    std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(std::move(db).value()));
    if (auto r = store->createSchema(); !r) {
        return r.error();
    }
    return std::move(store);
}

Result<void> SqliteSessionStore::createSchema() {
    auto tx = db_.begin();
    if (!tx)
        return tx.error();

    auto r = db_.execute(R"(
        CREATE TABLE IF NOT EXISTS dialogue_sessions (
            id TEXT PRIMARY KEY,
            project_id TEXT NOT NULL,
            original_goal TEXT NOT NULL,
            context TEXT,
            status TEXT NOT NULL DEFAULT 'active',
            started_at INTEGER NOT NULL,
            completed_at INTEGER,
            current_round INTEGER DEFAULT 1,
            responses TEXT,
            uncertainty_map TEXT,
            confidence_levels TEXT,
            refined_goal TEXT,
            final_confidence REAL,
            goal_evolution TEXT,
            last_question TEXT,
            last_updated INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        )
    )");
    if (!r)
        return r;

    r = db_.execute("CREATE INDEX IF NOT EXISTS idx_dialogue_sessions_project_id "
                    "ON dialogue_sessions(project_id)");
    if (!r)
        return r;
    r = db_.execute("CREATE INDEX IF NOT EXISTS idx_dialogue_sessions_status "
                    "ON dialogue_sessions(status)");
    if (!r)
        return r;
    r = db_.execute("CREATE INDEX IF NOT EXISTS idx_dialogue_sessions_project_status "
                    "ON dialogue_sessions(project_id, status)");
    if (!r)
        return r;
    return tx.value().commit();
}

Result<void> SqliteSessionStore::save(const DialogueSession& session) {
    if (auto valid = validateSession(session); !valid) {
        return valid;
    }

    auto responses = dumpColumn(session.responses);
    if (!responses)
        return responses.error();
    auto uncertainty = dumpColumn(session.uncertaintyMap);
    if (!uncertainty)
        return uncertainty.error();
    auto confidence = dumpColumn(session.confidenceLevels);
    if (!confidence)
        return confidence.error();
    auto evolution = dumpColumn(session.goalEvolution);
    if (!evolution)
        return evolution.error();
    std::optional<std::string> refined;
    if (session.refinedGoal) {
        auto r = dumpColumn(*session.refinedGoal);
        if (!r)
            return r.error();
        refined = std::move(r).value();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(R"(
        INSERT INTO dialogue_sessions (
            id, project_id, original_goal, context, status, started_at, completed_at,
            current_round, responses, uncertainty_map, confidence_levels, refined_goal,
            final_confidence, goal_evolution, last_question, last_updated, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            project_id = excluded.project_id,
            original_goal = excluded.original_goal,
            context = excluded.context,
            status = excluded.status,
            started_at = excluded.started_at,
            completed_at = excluded.completed_at,
            current_round = excluded.current_round,
            responses = excluded.responses,
            uncertainty_map = excluded.uncertainty_map,
            confidence_levels = excluded.confidence_levels,
            refined_goal = excluded.refined_goal,
            final_confidence = excluded.final_confidence,
            goal_evolution = excluded.goal_evolution,
            last_question = excluded.last_question,
            last_updated = excluded.last_updated
    )");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    auto r = stmt.bindAll(session.id, session.projectId, session.originalGoal, session.context,
                          toString(session.status), core::toEpochMillis(session.startedAt));
    if (!r)
        return r;

    r = session.completedAt ? stmt.bind(7, core::toEpochMillis(*session.completedAt))
                            : stmt.bind(7, nullptr);
    if (!r)
        return r;
    r = stmt.bind(8, session.currentRound);
    if (!r)
        return r;
    r = stmt.bind(9, responses.value());
    if (!r)
        return r;
    r = stmt.bind(10, uncertainty.value());
    if (!r)
        return r;
    r = stmt.bind(11, confidence.value());
    if (!r)
        return r;
    r = refined ? stmt.bind(12, *refined) : stmt.bind(12, nullptr);
    if (!r)
        return r;
    r = session.finalConfidence ? stmt.bind(13, *session.finalConfidence) : stmt.bind(13, nullptr);
    if (!r)
        return r;
    r = stmt.bind(14, evolution.value());
    if (!r)
        return r;
    r = session.lastQuestion ? stmt.bind(15, *session.lastQuestion) : stmt.bind(15, nullptr);
    if (!r)
        return r;
    r = stmt.bind(16, core::toEpochMillis(session.lastUpdated));
    if (!r)
        return r;
    r = stmt.bind(17, core::toEpochMillis(core::nowMillis()));
    if (!r)
        return r;

    r = stmt.execute();
    if (!r) {
        spdlog::error("Failed to save dialogue session {}: {}", session.id, r.error().message);
        return r;
    }
    spdlog::debug("Saved dialogue session {} (round {})", session.id, session.currentRound);
    return {};
}

Result<std::optional<DialogueSession>> SqliteSessionStore::load(const std::string& sessionId) {
    auto rows = query(std::string(kSelectColumns) + " WHERE id = ?", sessionId);
    if (!rows)
        return rows.error();
    if (rows.value().empty()) {
        return std::optional<DialogueSession>{};
    }
    return std::optional<DialogueSession>(std::move(rows.value().front()));
}

Result<std::vector<DialogueSession>>
SqliteSessionStore::listActive(const std::optional<std::string>& projectId) {
    if (projectId) {
        return query(std::string(kSelectColumns) +
                         " WHERE project_id = ? AND status = 'active' ORDER BY started_at DESC",
                     projectId);
    }
    return query(std::string(kSelectColumns) + " WHERE status = 'active' ORDER BY started_at DESC",
                 std::nullopt);
}

Result<std::vector<DialogueSession>>
SqliteSessionStore::listByProject(const std::string& projectId) {
    return query(std::string(kSelectColumns) + " WHERE project_id = ? ORDER BY started_at DESC",
                 projectId);
}

Result<bool> SqliteSessionStore::update(const std::string& sessionId,
                                        const SessionUpdate& update) {
    if (auto valid = validateUpdate(update); !valid) {
        return valid.error();
    }

    // JSON columns in statement order
    std::vector<std::pair<const char*, const std::optional<Document>*>> jsonFields = {
        {"responses", &update.responses},
        {"uncertainty_map", &update.uncertaintyMap},
        {"confidence_levels", &update.confidenceLevels},
        {"goal_evolution", &update.goalEvolution},
    };

    std::string sql = "UPDATE dialogue_sessions SET ";
    std::vector<std::string> encoded;
    if (update.currentRound)
        sql += "current_round = ?, ";
    for (const auto& [column, value] : jsonFields) {
        if (!*value)
            continue;
        auto text = dumpColumn(**value);
        if (!text)
            return text.error();
        sql += column;
        sql += " = ?, ";
        encoded.push_back(std::move(text).value());
    }
    if (update.lastQuestion)
        sql += "last_question = ?, ";
    sql += "last_updated = ? WHERE id = ?";

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    int index = 1;
    if (update.currentRound) {
        if (auto r = stmt.bind(index++, *update.currentRound); !r)
            return r.error();
    }
    for (const auto& text : encoded) {
        if (auto r = stmt.bind(index++, text); !r)
            return r.error();
    }
    if (update.lastQuestion) {
        if (auto r = stmt.bind(index++, *update.lastQuestion); !r)
            return r.error();
    }
    if (auto r = stmt.bind(index++, core::toEpochMillis(core::nowMillis())); !r)
        return r.error();
    if (auto r = stmt.bind(index, sessionId); !r)
        return r.error();

    if (auto r = stmt.execute(); !r) {
        spdlog::error("Failed to update dialogue session {}: {}", sessionId, r.error().message);
        return r.error();
    }
    bool updated = db_.changes() > 0;
    if (updated) {
        spdlog::debug("Updated dialogue session {}", sessionId);
    }
    return updated;
}

Result<bool> SqliteSessionStore::complete(const std::string& sessionId, const Document& result,
                                          double finalConfidence) {
    auto encoded = dumpColumn(result);
    if (!encoded)
        return encoded.error();

    const auto now = core::toEpochMillis(core::nowMillis());

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("UPDATE dialogue_sessions SET status = 'completed', "
                                  "completed_at = ?, refined_goal = ?, final_confidence = ?, "
                                  "last_updated = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(now, encoded.value(), finalConfidence, now, sessionId); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();

    bool updated = db_.changes() > 0;
    if (updated) {
        spdlog::info("Dialogue session {} completed (confidence {:.2f})", sessionId,
                     finalConfidence);
    }
    return updated;
}

Result<bool> SqliteSessionStore::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare("DELETE FROM dialogue_sessions WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, sessionId); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes() > 0;
}

Result<SessionStats> SqliteSessionStore::stats(const std::optional<std::string>& projectId) {
    std::string sql = "SELECT status, COUNT(*), AVG(final_confidence) FROM dialogue_sessions";
    if (projectId) {
        sql += " WHERE project_id = ?";
    }
    sql += " GROUP BY status";

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    if (projectId) {
        if (auto r = stmt.bind(1, *projectId); !r)
            return r.error();
    }

    SessionStats stats;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;

        auto count = static_cast<std::size_t>(stmt.getInt64(1));
        stats.total += count;
        auto status = parseSessionStatus(stmt.getString(0));
        if (status == SessionStatus::Active) {
            stats.active = count;
        } else if (status == SessionStatus::Completed) {
            stats.completed = count;
            if (!stmt.isNull(2)) {
                stats.avgConfidence = stmt.getDouble(2);
            }
        }
    }
    return stats;
}

Result<std::vector<DialogueSession>>
SqliteSessionStore::query(const std::string& sql, const std::optional<std::string>& param) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    auto stmt = std::move(stmtResult).value();
    if (param) {
        if (auto r = stmt.bind(1, *param); !r)
            return r.error();
    }

    std::vector<DialogueSession> sessions;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;

        auto session = readRow(stmt);
        if (!session) {
            spdlog::error("{}", session.error().message);
            return session.error();
        }
        sessions.push_back(std::move(session).value());
    }
    return sessions;
}

} // namespace canopy::session
