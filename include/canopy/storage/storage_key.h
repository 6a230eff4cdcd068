#pragma once

#include <canopy/core/types.h>

#include <string>
#include <string_view>

namespace canopy::storage {

// Reserved project that holds documents not scoped to any user project.
inline constexpr std::string_view kGlobalProject = "_global";

// Well-known document names written by collaborators.
namespace files {
inline constexpr std::string_view kConfig = "config.json";
inline constexpr std::string_view kHta = "hta.json";
inline constexpr std::string_view kLearningHistory = "learning-history.json";
inline constexpr std::string_view kDailySchedule = "daily-schedule.json";
inline constexpr std::string_view kCompletionLog = "completion-log.json";
inline constexpr std::string_view kStrategyEvolution = "strategy-evolution.json";
inline constexpr std::string_view kDefaultPath = "general";
} // namespace files

inline constexpr std::string_view kTempSuffix = ".tmp";
inline constexpr std::size_t kMaxProjectIdLength = 128;
inline constexpr std::size_t kMaxRelativePathLength = 512;

/**
 * @brief Address of one stored document: (projectId, relativePath).
 */
struct StorageKey {
    std::string projectId;
    std::string relativePath;

    // Key used by the document cache
    [[nodiscard]] std::string cacheKey() const { return projectId + ":" + relativePath; }

    bool operator==(const StorageKey&) const = default;
};

/**
 * @brief Relative path of a document scoped to a learning path,
 * e.g. pathScoped("general", "hta.json") == "paths/general/hta.json".
 */
std::string pathScoped(std::string_view pathName, std::string_view fileName);

Result<void> validateProjectId(std::string_view projectId);
Result<void> validateRelativePath(std::string_view relativePath);
Result<void> validateKey(const StorageKey& key);

} // namespace canopy::storage
