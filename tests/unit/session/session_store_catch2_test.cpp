#include <catch2/catch.hpp>

#include <chrono>

#include <canopy/core/id.h>
#include <canopy/session/session_store.h>

#include "../../common/test_helpers_catch2.h"

using namespace canopy;
using namespace canopy::session;
using namespace std::chrono_literals;

namespace {

DialogueSession makeSession(const std::string& id, const std::string& projectId,
                            TimePoint startedAt) {
    DialogueSession s;
    s.id = id;
    s.projectId = projectId;
    s.originalGoal = "get fit";
    s.context = "busy schedule";
    s.startedAt = startedAt;
    s.lastUpdated = startedAt;
    s.goalEvolution = Document::array({"get fit"});
    return s;
}

struct SessionStoreFixture {
    SessionStoreFixture() {
        auto opened = SqliteSessionStore::open(tmp.path() / "dialogues.db");
        REQUIRE(opened.has_value());
        store = std::move(opened).value();
    }

    void reopen() {
        store.reset();
        auto opened = SqliteSessionStore::open(tmp.path() / "dialogues.db");
        REQUIRE(opened.has_value());
        store = std::move(opened).value();
    }

    canopy::test::TempDirScope tmp{"canopy_sessions"};
    std::unique_ptr<SqliteSessionStore> store;
};

} // namespace

TEST_CASE_METHOD(SessionStoreFixture, "Session save is an idempotent upsert",
                 "[session][store][catch2]") {
    auto session = makeSession("dialogue-1", "alpha", core::nowMillis());
    session.responses = Document::array({{{"round", 1}, {"answer", "mornings"}}});

    REQUIRE(store->save(session).has_value());
    REQUIRE(store->save(session).has_value());

    auto byProject = store->listByProject("alpha");
    REQUIRE(byProject.has_value());
    REQUIRE(byProject.value().size() == 1);
    CHECK(byProject.value().front() == session);

    session.currentRound = 2;
    session.responses.push_back({{"round", 2}, {"answer", "running"}});
    session.lastQuestion = "How often?";
    REQUIRE(store->save(session).has_value());

    auto loaded = store->load("dialogue-1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    CHECK(*loaded.value() == session);
}

TEST_CASE_METHOD(SessionStoreFixture, "Active sessions survive a reopen",
                 "[session][store][restart][catch2]") {
    auto session = makeSession("dialogue-1", "alpha", core::nowMillis());
    session.currentRound = 3;
    session.responses = Document::array({"a", "b"});
    session.uncertaintyMap = {{"timeline", 0.7}};
    REQUIRE(store->save(session).has_value());

    reopen();

    auto active = store->listActive(std::string("alpha"));
    REQUIRE(active.has_value());
    REQUIRE(active.value().size() == 1);
    const auto& resumed = active.value().front();
    CHECK(resumed.currentRound == 3);
    CHECK(resumed.responses == session.responses);
    CHECK(resumed == session);
}

TEST_CASE_METHOD(SessionStoreFixture, "listActive orders by start time, newest first",
                 "[session][store][catch2]") {
    auto base = core::nowMillis();
    REQUIRE(store->save(makeSession("old", "alpha", base - 2h)).has_value());
    REQUIRE(store->save(makeSession("new", "alpha", base)).has_value());
    REQUIRE(store->save(makeSession("mid", "beta", base - 1h)).has_value());

    auto alpha = store->listActive(std::string("alpha"));
    REQUIRE(alpha.has_value());
    REQUIRE(alpha.value().size() == 2);
    CHECK(alpha.value()[0].id == "new");
    CHECK(alpha.value()[1].id == "old");

    auto all = store->listActive(std::nullopt);
    REQUIRE(all.has_value());
    REQUIRE(all.value().size() == 3);
    CHECK(all.value()[1].id == "mid");
}

TEST_CASE_METHOD(SessionStoreFixture, "Completed sessions stay readable but leave the active list",
                 "[session][store][catch2]") {
    REQUIRE(store->save(makeSession("dialogue-1", "alpha", core::nowMillis())).has_value());

    Document refined = {{"goal", "run a 10k"}, {"focus", "endurance"}};
    auto completed = store->complete("dialogue-1", refined, 0.85);
    REQUIRE(completed.has_value());
    CHECK(completed.value());

    auto active = store->listActive(std::string("alpha"));
    REQUIRE(active.has_value());
    CHECK(active.value().empty());

    auto loaded = store->load("dialogue-1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    CHECK(loaded.value()->status == SessionStatus::Completed);
    REQUIRE(loaded.value()->refinedGoal.has_value());
    CHECK(*loaded.value()->refinedGoal == refined);
    CHECK(loaded.value()->finalConfidence == 0.85);
    CHECK(loaded.value()->completedAt.has_value());

    auto missing = store->complete("nope", refined, 0.5);
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing.value());
}

TEST_CASE_METHOD(SessionStoreFixture, "Session stats and removal", "[session][store][catch2]") {
    auto now = core::nowMillis();
    REQUIRE(store->save(makeSession("a", "alpha", now)).has_value());
    REQUIRE(store->save(makeSession("b", "alpha", now)).has_value());
    REQUIRE(store->save(makeSession("c", "alpha", now)).has_value());
    REQUIRE(store->save(makeSession("d", "beta", now)).has_value());
    REQUIRE(store->complete("a", Document::object(), 0.6).value());
    REQUIRE(store->complete("b", Document::object(), 0.8).value());

    auto stats = store->stats(std::string("alpha"));
    REQUIRE(stats.has_value());
    CHECK(stats.value().total == 3);
    CHECK(stats.value().active == 1);
    CHECK(stats.value().completed == 2);
    CHECK(stats.value().avgConfidence > 0.69);
    CHECK(stats.value().avgConfidence < 0.71);

    CHECK(store->stats(std::nullopt).value().total == 4);

    CHECK(store->remove("d").value());
    CHECK_FALSE(store->remove("d").value());
    CHECK_FALSE(store->load("d").value().has_value());
}

TEST_CASE_METHOD(SessionStoreFixture, "Sessions without id or project are rejected",
                 "[session][store][catch2]") {
    auto session = makeSession("", "alpha", core::nowMillis());
    auto r = store->save(session);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ValidationError);

    session.id = "x";
    session.projectId.clear();
    CHECK_FALSE(store->save(session).has_value());
}

TEST_CASE("Session store open fails cleanly on an unusable path", "[session][store][catch2]") {
    canopy::test::TempDirScope tmp{"canopy_sessions_bad"};
    // A regular file where the parent directory should be
    canopy::test::write_file(tmp.path() / "blocker", "x");

    auto opened = SqliteSessionStore::open(tmp.path() / "blocker" / "dialogues.db");
    REQUIRE_FALSE(opened.has_value());
}

TEST_CASE("In-memory session store keeps nothing on disk", "[session][store][catch2]") {
    auto opened = SqliteSessionStore::openInMemory();
    REQUIRE(opened.has_value());
    auto store = std::move(opened).value();
    CHECK(store->path() == ":memory:");

    REQUIRE(store->save(makeSession("dialogue-1", "alpha", core::nowMillis())).has_value());
    CHECK(store->listActive(std::nullopt).value().size() == 1);
}

TEST_CASE("Session JSON export carries every field", "[session][json][catch2]") {
    auto session = makeSession("dialogue-7", "alpha", core::nowMillis());
    session.status = SessionStatus::Completed;
    session.completedAt = session.startedAt + 90s;
    session.refinedGoal = Document{{"goal", "run a 10k"}};
    session.finalConfidence = 0.75;
    session.lastQuestion = "Which days?";

    auto doc = toJson(session);
    CHECK(doc["status"] == "completed");
    CHECK(doc["startedAt"] == core::toEpochMillis(session.startedAt));

    auto parsed = sessionFromJson(doc);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == session);

    auto active = toJson(makeSession("dialogue-8", "alpha", core::nowMillis()));
    CHECK(active["completedAt"].is_null());
    CHECK_FALSE(sessionFromJson(active).value().refinedGoal.has_value());
}

TEST_CASE("Malformed session documents are rejected", "[session][json][catch2]") {
    auto notObject = sessionFromJson(Document::array());
    REQUIRE_FALSE(notObject.has_value());
    CHECK(notObject.error().code == ErrorCode::InvalidData);

    auto missingId = sessionFromJson(Document{{"projectId", "alpha"}, {"startedAt", 0}});
    REQUIRE_FALSE(missingId.has_value());
    CHECK(missingId.error().code == ErrorCode::InvalidData);

    auto badStatus = sessionFromJson(
        Document{{"id", "x"}, {"projectId", "alpha"}, {"startedAt", 0}, {"status", "paused"}});
    REQUIRE_FALSE(badStatus.has_value());
}

TEST_CASE_METHOD(SessionStoreFixture, "Session update writes only the given fields",
                 "[session][store][catch2]") {
    auto session = makeSession("dialogue-1", "alpha", core::nowMillis() - 1h);
    session.uncertaintyMap = Document{{"schedule", 0.8}};
    REQUIRE(store->save(session).has_value());

    SessionUpdate update;
    update.currentRound = 3;
    update.responses = Document::array({"mornings", "twice a week"});
    update.confidenceLevels = Document{{"schedule", 0.4}};
    REQUIRE(store->update("dialogue-1", update).value());

    reopen();
    auto loaded = store->load("dialogue-1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    const auto& stored = *loaded.value();
    CHECK(stored.currentRound == 3);
    CHECK(stored.responses == *update.responses);
    CHECK(stored.confidenceLevels == *update.confidenceLevels);
    CHECK(stored.uncertaintyMap == session.uncertaintyMap);
    CHECK(stored.goalEvolution == session.goalEvolution);
    CHECK_FALSE(stored.lastQuestion.has_value());
    CHECK(stored.lastUpdated > session.lastUpdated);

    CHECK_FALSE(store->update("dialogue-missing", update).value());

    SessionUpdate rewind;
    rewind.currentRound = 0;
    auto rejected = store->update("dialogue-1", rewind);
    REQUIRE_FALSE(rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::ValidationError);
}

TEST_CASE("Session store open reports a file that is not a database",
          "[session][store][catch2]") {
    canopy::test::TempDirScope tmp{"canopy_sessions_notadb"};
    canopy::test::write_file(tmp.path() / "dialogues.db", std::string(4096, 'x'));

    auto opened = SqliteSessionStore::open(tmp.path() / "dialogues.db");
    REQUIRE_FALSE(opened.has_value());
    CHECK(opened.error().code == ErrorCode::CorruptedData);
}
