#include <spdlog/spdlog.h>
#include <canopy/config/canopy_config.h>
#include <canopy/config/config_helpers.h>

#include <cstdlib>

namespace canopy::config {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    if (const char* env = std::getenv(name); env && *env) {
        return std::string(env);
    }
    return fallback;
}

} // namespace

CanopyConfig loadConfig(const std::filesystem::path& configPath) {
    CanopyConfig cfg;
    auto path = configPath.empty() ? get_config_path() : configPath;

    auto value = [&path](const std::string& section, const std::string& key) {
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) {
            return std::string{};
        }
        return parse_config_value(path, section, key);
    };

    if (const char* env = std::getenv("CANOPY_DATA_DIR"); env && *env) {
        cfg.dataDir = expand_tilde(env);
    } else if (auto dir = value("storage", "data_dir"); !dir.empty()) {
        cfg.dataDir = expand_tilde(dir);
    } else {
        cfg.dataDir = resolve_data_dir_from_config();
    }

    if (auto v = value("storage", "sync_writes"); !v.empty())
        cfg.syncWrites = parse_bool(v, cfg.syncWrites);
    if (auto v = value("cache", "max_entries"); !v.empty())
        cfg.cacheMaxEntries = parse_size(v, cfg.cacheMaxEntries);
    if (auto v = value("serializer", "threads"); !v.empty())
        cfg.serializerThreads = parse_size(v, cfg.serializerThreads);
    if (auto v = value("sessions", "enabled"); !v.empty())
        cfg.sessionsEnabled = parse_bool(v, cfg.sessionsEnabled);
    if (auto v = value("sessions", "db_name"); !v.empty())
        cfg.sessionsDbName = v;
    if (auto v = value("log", "level"); !v.empty())
        cfg.logLevel = v;

    cfg.logLevel = envOr("CANOPY_LOG_LEVEL", cfg.logLevel);

    if (cfg.serializerThreads == 0) {
        spdlog::warn("serializer.threads must be positive; using 1");
        cfg.serializerThreads = 1;
    }
    return cfg;
}

void applyLogLevel(const std::string& level) {
    if (level.empty()) {
        return;
    }
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only accept an explicit "off"
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping {}", level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace canopy::config
