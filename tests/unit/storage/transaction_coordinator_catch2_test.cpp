#include <catch2/catch.hpp>

#include <canopy/storage/atomic_file_store.h>
#include <canopy/storage/transaction_coordinator.h>

#include "../../common/test_helpers_catch2.h"

using namespace canopy;
using namespace canopy::storage;

namespace {

struct TransactionFixture {
    explicit TransactionFixture(WriteFaultHook hook = {})
        : store(makeConfig(std::move(hook)), cache), coordinator(store) {
        REQUIRE(store.initialize().has_value());
    }

    StoreConfig makeConfig(WriteFaultHook hook) {
        StoreConfig cfg;
        cfg.dataDir = tmp.path();
        cfg.syncWrites = false;
        cfg.faultHook = std::move(hook);
        return cfg;
    }

    Document readDoc(const StorageKey& key) {
        auto r = store.read(key);
        REQUIRE(r.has_value());
        REQUIRE(r.value().has_value());
        return *r.value();
    }

    canopy::test::TempDirScope tmp{"canopy_txn"};
    DocumentCache cache;
    AtomicFileStore store;
    TransactionCoordinator coordinator;
};

const StorageKey kConfig{"alpha", "config.json"};
const StorageKey kHta{"alpha", "hta.json"};
const StorageKey kHistory{"alpha", "learning-history.json"};

} // namespace

TEST_CASE_METHOD(TransactionFixture, "Transaction commits every write",
                 "[storage][transaction][catch2]") {
    auto receipt = coordinator.transact({
        {kConfig, Document{{"goal", "learn X"}}},
        {kHta, Document{{"nodes", Document::array()}}},
    });
    REQUIRE(receipt.has_value());
    CHECK(receipt.value().committed == 2);
    CHECK(readDoc(kConfig)["goal"] == "learn X");
    CHECK(coordinator.getStats().lastCommitted == 2);
}

TEST_CASE_METHOD(TransactionFixture, "Failed transaction restores the pre-transaction value",
                 "[storage][transaction][catch2]") {
    REQUIRE(store.write(kConfig, Document{{"goal", "learn X"}}).has_value());

    // Second write is not encodable, so the transaction fails after config.json was replaced
    auto receipt = coordinator.transact({
        {kConfig, Document{{"goal", "Y"}}},
        {kHta, Document("\xff\xfe")},
    });
    REQUIRE_FALSE(receipt.has_value());
    CHECK(receipt.error().code == ErrorCode::InvalidData);

    CHECK(readDoc(kConfig) == Document{{"goal", "learn X"}});
    CHECK_FALSE(store.exists(kHta).value());

    auto stats = coordinator.getStats();
    CHECK(stats.lastCommitted == 0);
    CHECK(stats.failed == 1);
    CHECK(coordinator.integrityWarnings().empty());
}

TEST_CASE_METHOD(TransactionFixture, "Transactions with a malformed key write nothing",
                 "[storage][transaction][catch2]") {
    auto receipt = coordinator.transact({
        {kHistory, Document::array({"first"})},
        {StorageKey{"alpha", "../bad"}, Document::object()},
    });
    REQUIRE_FALSE(receipt.has_value());
    CHECK(receipt.error().code == ErrorCode::ValidationError);
    // Validation happens before any write
    CHECK_FALSE(store.exists(kHistory).value());
}

TEST_CASE_METHOD(TransactionFixture, "Repeated keys are restored to the value before the call",
                 "[storage][transaction][catch2]") {
    REQUIRE(store.write(kConfig, Document{{"v", 0}}).has_value());

    auto receipt = coordinator.transact({
        {kConfig, Document{{"v", 1}}},
        {kConfig, Document{{"v", 2}}},
        {kHta, Document("\xff")},
    });
    REQUIRE_FALSE(receipt.has_value());
    CHECK(readDoc(kConfig)["v"] == 0);
}

TEST_CASE("Durability failure mid-transaction rolls back earlier writes",
          "[storage][transaction][crash][catch2]") {
    int htaFailures = 0;
    TransactionFixture fx([&htaFailures](WritePhase phase, const StorageKey& key) -> Result<void> {
        if (htaFailures > 0 && phase == WritePhase::TempWritten && key.relativePath == "hta.json") {
            --htaFailures;
            return Error{ErrorCode::StorageFull, "disk full"};
        }
        return {};
    });

    REQUIRE(fx.store.write(kConfig, Document{{"goal", "learn X"}}).has_value());
    REQUIRE(fx.store.write(kHta, Document{{"nodes", 1}}).has_value());

    htaFailures = 1;
    auto receipt = fx.coordinator.transact({
        {kConfig, Document{{"goal", "Y"}}},
        {kHta, Document{{"nodes", 2}}},
    });
    REQUIRE_FALSE(receipt.has_value());
    CHECK(receipt.error().code == ErrorCode::StorageFull);
    CHECK(isDurabilityError(receipt.error().code));
    CHECK(fx.readDoc(kConfig)["goal"] == "learn X");
    CHECK(fx.readDoc(kHta)["nodes"] == 1);
    CHECK(fx.coordinator.integrityWarnings().empty());
    CHECK(fx.coordinator.getStats().restoredKeys == 2);
}

TEST_CASE("Rollback failures become integrity warnings", "[storage][transaction][catch2]") {
    // Every write of config.json after the first one fails, including the restore
    int configWrites = 0;
    TransactionFixture fx([&configWrites](WritePhase phase, const StorageKey& key) -> Result<void> {
        if (phase == WritePhase::Renamed && key.relativePath == "config.json" &&
            ++configWrites > 1) {
            return Error{ErrorCode::WriteError, "I/O error"};
        }
        return {};
    });

    REQUIRE(fx.store.write(kConfig, Document{{"goal", "learn X"}}).has_value());

    auto receipt = fx.coordinator.transact({{kConfig, Document{{"goal", "Y"}}}});
    REQUIRE_FALSE(receipt.has_value());
    CHECK(receipt.error().code == ErrorCode::WriteError);

    auto warnings = fx.coordinator.integrityWarnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings.front().key == kConfig);
    CHECK(fx.coordinator.getStats().integrityWarnings == 1);
}
