#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace canopy::config {

/**
 * @brief Process-wide settings for the persistence core.
 *
 * Resolution order for every key: environment override, then config.toml,
 * then the defaults below.
 */
struct CanopyConfig {
    std::filesystem::path dataDir;
    bool syncWrites = true;
    std::size_t cacheMaxEntries = 0; ///< 0 = unbounded
    std::size_t serializerThreads = 4;
    bool sessionsEnabled = true;
    std::string sessionsDbName = "dialogues.db";
    std::string logLevel = "info";
};

/**
 * @brief Load configuration from the environment and the config file.
 * @param configPath Explicit config file; empty means get_config_path().
 */
CanopyConfig loadConfig(const std::filesystem::path& configPath = {});

/**
 * @brief Apply a level name ("trace".."off") to the default spdlog logger.
 * Unknown names leave the level unchanged.
 */
void applyLogLevel(const std::string& level);

} // namespace canopy::config
