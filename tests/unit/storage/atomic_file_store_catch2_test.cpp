#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include <canopy/storage/atomic_file_store.h>

#include "../../common/test_helpers_catch2.h"

using namespace canopy;
using namespace canopy::storage;

namespace {

struct FileStoreFixture {
    FileStoreFixture() : cache(), store(makeConfig(tmp.path(), {}), cache) {
        REQUIRE(store.initialize().has_value());
    }

    static StoreConfig makeConfig(const std::filesystem::path& dir, WriteFaultHook hook) {
        StoreConfig cfg;
        cfg.dataDir = dir / "data";
        cfg.syncWrites = false;
        cfg.faultHook = std::move(hook);
        return cfg;
    }

    canopy::test::TempDirScope tmp{"canopy_store"};
    DocumentCache cache;
    AtomicFileStore store;
};

// Fails the first write of `key` at `phase`, as if the process died there.
struct CrashAt {
    WritePhase phase;
    StorageKey key;
    std::shared_ptr<std::atomic<bool>> fired = std::make_shared<std::atomic<bool>>(false);

    Result<void> operator()(WritePhase p, const StorageKey& k) const {
        if (p == phase && k == key && !fired->exchange(true)) {
            return Error{ErrorCode::WriteError, "simulated crash"};
        }
        return {};
    }
};

} // namespace

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore write then read", "[storage][file][catch2]") {
    StorageKey key{"alpha", "config.json"};
    REQUIRE(store.write(key, Document{{"goal", "learn X"}}).has_value());

    auto read = store.read(key);
    REQUIRE(read.has_value());
    REQUIRE(read.value().has_value());
    CHECK((*read.value())["goal"] == "learn X");

    // Encoded form is indented JSON; no temp file remains
    auto path = store.pathFor(key);
    CHECK(canopy::test::read_file(path) == Document{{"goal", "learn X"}}.dump(2));
    auto temp = path;
    temp += ".tmp";
    CHECK_FALSE(std::filesystem::exists(temp));
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore reports absence, not failure",
                 "[storage][file][catch2]") {
    auto read = store.read(StorageKey{"alpha", "missing.json"});
    REQUIRE(read.has_value());
    CHECK_FALSE(read.value().has_value());

    auto exists = store.exists(StorageKey{"alpha", "missing.json"});
    REQUIRE(exists.has_value());
    CHECK_FALSE(exists.value());
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore sequential writes are never torn",
                 "[storage][file][catch2]") {
    StorageKey key{"alpha", "paths/general/hta.json"};
    Document v1{{"version", 1}, {"nodes", Document::array({"a", "b"})}};
    Document v2{{"version", 2}, {"nodes", Document::array({"a", "b", "c"})}};

    REQUIRE(store.write(key, v1).has_value());
    auto between = store.read(key);
    REQUIRE(between.has_value());
    CHECK(*between.value() == v1);

    REQUIRE(store.write(key, v2).has_value());
    auto after = store.read(key);
    REQUIRE(after.has_value());
    CHECK(*after.value() == v2);
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore write invalidates the cached value",
                 "[storage][file][catch2]") {
    StorageKey key{"alpha", "config.json"};
    REQUIRE(store.write(key, Document{{"v", 1}}).has_value());
    REQUIRE(store.read(key).has_value());
    REQUIRE(cache.contains(key.cacheKey()));

    REQUIRE(store.write(key, Document{{"v", 2}}).has_value());
    CHECK_FALSE(cache.contains(key.cacheKey()));
    CHECK((*store.read(key).value())["v"] == 2);
}

TEST_CASE("AtomicFileStore crash before rename keeps the previous value",
          "[storage][file][crash][catch2]") {
    canopy::test::TempDirScope tmp{"canopy_crash"};
    StorageKey key{"alpha", "config.json"};
    CrashAt crash{WritePhase::TempWritten, key};

    DocumentCache cache;
    AtomicFileStore store(FileStoreFixture::makeConfig(tmp.path(), {}), cache);
    REQUIRE(store.initialize().has_value());
    REQUIRE(store.write(key, Document{{"v", "old"}}).has_value());

    DocumentCache crashCache;
    AtomicFileStore crashing(FileStoreFixture::makeConfig(tmp.path(), crash), crashCache);
    auto failed = crashing.write(key, Document{{"v", "new"}});
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == ErrorCode::WriteError);

    auto durable = crashing.readDurable(key);
    REQUIRE(durable.has_value());
    CHECK((*durable.value())["v"] == "old");

    auto temp = crashing.pathFor(key);
    temp += ".tmp";
    CHECK_FALSE(std::filesystem::exists(temp));
}

TEST_CASE("AtomicFileStore crash after rename keeps the new value",
          "[storage][file][crash][catch2]") {
    canopy::test::TempDirScope tmp{"canopy_crash"};
    StorageKey key{"alpha", "config.json"};
    CrashAt crash{WritePhase::Renamed, key};

    DocumentCache cache;
    AtomicFileStore store(FileStoreFixture::makeConfig(tmp.path(), crash), cache);
    REQUIRE(store.initialize().has_value());

    REQUIRE_FALSE(store.write(key, Document{{"v", "new"}}).has_value());

    auto read = store.read(key);
    REQUIRE(read.has_value());
    REQUIRE(read.value().has_value());
    CHECK((*read.value())["v"] == "new");
}

TEST_CASE("AtomicFileStore removes stale temp files at startup",
          "[storage][file][crash][catch2]") {
    canopy::test::TempDirScope tmp{"canopy_cleanup"};
    auto dataDir = tmp.path() / "data";
    canopy::test::write_file(dataDir / "alpha" / "config.json", R"({"v": 1})");
    canopy::test::write_file(dataDir / "alpha" / "config.json.tmp", R"({"v": 2, "trunc)");
    canopy::test::write_file(dataDir / "beta" / "paths" / "general" / "hta.json.tmp", "{");

    DocumentCache cache;
    AtomicFileStore store(FileStoreFixture::makeConfig(tmp.path(), {}), cache);
    REQUIRE(store.initialize().has_value());

    CHECK(store.getStats().tempFilesCleaned == 2);
    CHECK_FALSE(std::filesystem::exists(dataDir / "alpha" / "config.json.tmp"));
    auto read = store.read(StorageKey{"alpha", "config.json"});
    REQUIRE(read.has_value());
    CHECK((*read.value())["v"] == 1);
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore reports undecodable content as corrupted",
                 "[storage][file][catch2]") {
    StorageKey key{"alpha", "config.json"};
    canopy::test::write_file(store.pathFor(key), "{ not json");

    auto read = store.read(key);
    REQUIRE_FALSE(read.has_value());
    CHECK(read.error().code == ErrorCode::CorruptedData);
    CHECK_FALSE(cache.contains(key.cacheKey()));
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore rejects unencodable values",
                 "[storage][file][catch2]") {
    StorageKey key{"alpha", "hta.json"};
    auto r = store.write(key, Document("\xff\xfe"));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidData);
    CHECK_FALSE(std::filesystem::exists(store.pathFor(key)));
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore validates keys before any I/O",
                 "[storage][file][catch2]") {
    auto r = store.write(StorageKey{"../escape", "config.json"}, Document::object());
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ValidationError);
    CHECK(std::filesystem::is_empty(store.dataDir()));
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore project listing and deletion",
                 "[storage][file][catch2]") {
    REQUIRE(store.write(StorageKey{"alpha", "config.json"}, Document::object()).has_value());
    REQUIRE(store.write(StorageKey{"alpha", "paths/general/hta.json"}, Document::object())
                .has_value());
    REQUIRE(store.write(StorageKey{"beta", "config.json"}, Document::object()).has_value());
    REQUIRE(store.write(StorageKey{std::string(kGlobalProject), "settings.json"},
                        Document::object())
                .has_value());

    auto projects = store.listProjects();
    REQUIRE(projects.has_value());
    CHECK(projects.value() == std::vector<std::string>{"alpha", "beta"});

    auto files = store.listFiles("alpha");
    REQUIRE(files.has_value());
    CHECK(files.value() == std::vector<std::string>{"config.json", "paths/general/hta.json"});

    REQUIRE(store.read(StorageKey{"alpha", "config.json"}).has_value());
    auto deleted = store.deleteProject("alpha");
    REQUIRE(deleted.has_value());
    CHECK(deleted.value());
    CHECK_FALSE(cache.contains("alpha:config.json"));
    CHECK_FALSE(store.projectExists("alpha").value());
    CHECK_FALSE(store.read(StorageKey{"alpha", "config.json"}).value().has_value());

    auto again = store.deleteProject("alpha");
    REQUIRE(again.has_value());
    CHECK_FALSE(again.value());
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore remove and stat", "[storage][file][catch2]") {
    StorageKey key{"alpha", "completion-log.json"};
    REQUIRE(store.write(key, Document::array({1, 2, 3})).has_value());

    auto info = store.stat(key);
    REQUIRE(info.has_value());
    REQUIRE(info.value().has_value());
    CHECK(info.value()->size > 0);

    auto removed = store.remove(key);
    REQUIRE(removed.has_value());
    CHECK(removed.value());
    CHECK_FALSE(store.exists(key).value());
    CHECK_FALSE(store.remove(key).value());
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore readers never see a torn document",
                 "[storage][file][concurrency][catch2]") {
    StorageKey key{"alpha", "learning-history.json"};
    auto makeDoc = [](int n) {
        Document entries = Document::array();
        for (int i = 0; i < 200; ++i) {
            entries.push_back({{"n", n}, {"i", i}});
        }
        return Document{{"n", n}, {"entries", entries}};
    };
    REQUIRE(store.write(key, makeDoc(0)).has_value());

    std::atomic<bool> stop{false};
    std::atomic<int> badReads{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto read = store.read(key);
                if (!read || !read.value()) {
                    ++badReads;
                    continue;
                }
                const auto& doc = *read.value();
                int n = doc["n"].get<int>();
                if (doc["entries"].size() != 200 || doc["entries"].back()["n"].get<int>() != n) {
                    ++badReads;
                }
            }
        });
    }

    for (int n = 1; n <= 50; ++n) {
        REQUIRE(store.write(key, makeDoc(n)).has_value());
    }
    stop = true;
    for (auto& t : readers) {
        t.join();
    }

    CHECK(badReads.load() == 0);
    CHECK((*store.read(key).value())["n"] == 50);
}

TEST_CASE_METHOD(FileStoreFixture, "AtomicFileStore reports a path that cannot be examined",
                 "[storage][file][catch2]") {
    // A single path component longer than NAME_MAX fails stat with ENAMETOOLONG
    StorageKey key{"alpha", std::string(300, 'n') + ".json"};
    REQUIRE(validateKey(key).has_value());

    auto durable = store.readDurable(key);
    REQUIRE_FALSE(durable.has_value());
    CHECK(durable.error().message.find("stat") != std::string::npos);

    auto cached = store.read(key);
    REQUIRE_FALSE(cached.has_value());
    CHECK_FALSE(cache.contains(key.cacheKey()));

    // A plainly missing file is still an absent value
    auto missing = store.readDurable(StorageKey{"alpha", "missing.json"});
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing.value().has_value());
}
