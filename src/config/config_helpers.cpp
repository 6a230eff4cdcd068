#include <cstdlib>
#include <fstream>
#include <canopy/config/config_helpers.h>

namespace canopy::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside of quotes)
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (!v.empty()) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "storage.data_dir" and "[storage] data_dir"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    if (const char* cfg_env = std::getenv("CANOPY_CONFIG"); cfg_env && *cfg_env) {
        return std::filesystem::path(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "canopy" / "config.toml";
    }

    return configHome / "canopy" / "config.toml";
}

std::filesystem::path resolve_data_dir_from_config() {
    // 1) CANOPY_DATA_DIR env
    if (const char* env = std::getenv("CANOPY_DATA_DIR"); env && *env) {
        return expand_tilde(env);
    }

    // 2) config.toml storage.data_dir
    auto config_path = get_config_path();
    if (!config_path.empty()) {
        if (auto value = parse_config_value(config_path, "storage", "data_dir"); !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) HOME default
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".canopy-data";
    }

    return std::filesystem::current_path() / ".canopy-data";
}

} // namespace canopy::config
