#include <spdlog/spdlog.h>
#include <fstream>
#include <snipren/config/config_helpers.h>

namespace snipren::config {

std::optional<bool> parse_bool(std::string_view value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    trim(v);
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

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

        // Remove inline comments
        size_t comment = v.find('#');
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        // Support both "rename.dry_run" at top level and "[rename] dry_run"
        if ((in_target_section && k == key) ||
            (currentSection.empty() && !section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "snipren";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "snipren";
    }
    return std::filesystem::path("~/.config") / "snipren";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SNIPREN_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

Settings load_settings(const std::filesystem::path& config_path) {
    Settings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config file at {}", config_path.string());
        return settings;
    }

    settings.logLevel = parse_config_value(config_path, "logging", "level");

    auto dryRun = parse_config_value(config_path, "rename", "dry_run");
    if (!dryRun.empty()) {
        if (auto b = parse_bool(dryRun)) {
            settings.dryRun = *b;
        } else {
            spdlog::warn("Ignoring invalid rename.dry_run value '{}' in {}", dryRun,
                         config_path.string());
        }
    }

    return settings;
}

} // namespace snipren::config
