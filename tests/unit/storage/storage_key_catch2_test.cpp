#include <catch2/catch.hpp>

#include <canopy/storage/storage_key.h>

using namespace canopy;
using namespace canopy::storage;

TEST_CASE("Project ids accept the documented alphabet", "[storage][key][catch2]") {
    CHECK(validateProjectId("learn-spanish").has_value());
    CHECK(validateProjectId("proj_2024.v1").has_value());
    CHECK(validateProjectId("7wonders").has_value());
    CHECK(validateProjectId(kGlobalProject).has_value());
}

TEST_CASE("Malformed project ids are validation errors", "[storage][key][catch2]") {
    for (const auto* bad : {"", ".hidden", "-dash", "a/b", "a b", "..", "x\\y"}) {
        INFO("projectId: " << bad);
        auto r = validateProjectId(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::ValidationError);
    }

    std::string tooLong(kMaxProjectIdLength + 1, 'a');
    CHECK_FALSE(validateProjectId(tooLong).has_value());
}

TEST_CASE("Relative paths may not escape the project", "[storage][key][catch2]") {
    CHECK(validateRelativePath("config.json").has_value());
    CHECK(validateRelativePath("paths/general/hta.json").has_value());

    for (const auto* bad : {"", "/etc/passwd", "../other/config.json", "paths/../../x",
                            "paths//hta.json", "paths/.git/config", "config.json.tmp", "trailing/"}) {
        INFO("path: " << bad);
        auto r = validateRelativePath(bad);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::ValidationError);
    }
}

TEST_CASE("Path-scoped names and cache keys", "[storage][key][catch2]") {
    CHECK(pathScoped(files::kDefaultPath, files::kHta) == "paths/general/hta.json");

    StorageKey key{"alpha", "config.json"};
    CHECK(key.cacheKey() == "alpha:config.json");
    CHECK(key == StorageKey{"alpha", "config.json"});
    CHECK_FALSE(key == StorageKey{"beta", "config.json"});
}
