#include <spdlog/spdlog.h>
#include <fstream>
#include <lore/config/config_helpers.h>

namespace lore::config {

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

        // Remove inline comments outside of quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

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
    if (const char* env = std::getenv("LORE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "lore" / "config.toml";
    }

    return configHome / "lore" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "lore";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "lore";
    }
    return std::filesystem::current_path() / "lore_data";
}

std::filesystem::path resolve_global_dir_from_config(const std::filesystem::path& config_path) {
    // 1) LORE_DATA_DIR env
    if (const char* env = std::getenv("LORE_DATA_DIR"); env && *env) {
        return expand_tilde(env) / "knowledge";
    }

    // 2) config.toml knowledge.global_dir
    if (!config_path.empty()) {
        if (auto value = parse_config_value(config_path, "knowledge", "global_dir");
            !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir() / "knowledge";
}

void configure_logging(const std::string& level) {
    if (level.empty()) {
        return;
    }
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept that when asked for explicitly
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("[Config] Unknown log level '{}', keeping current level", level);
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace lore::config
