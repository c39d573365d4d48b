#include <knit/config.hpp>
#include <toml++/toml.hpp>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace knit {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KnitError{KnitError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        if (auto node = scan->get("exclude")) {
            auto arr = node->as_array();
            if (!arr) {
                return KnitError{KnitError::Config,
                    "scan.exclude must be an array of strings"};
            }
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return KnitError{KnitError::Config,
                        "scan.exclude must be an array of strings"};
                }
                cfg.scan.exclude.push_back(*s);
            }
        }
        if (auto node = scan->get("depth")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 0 || *v > INT_MAX) {
                return KnitError{KnitError::Config,
                    "scan.depth must be an integer from 0 to " + std::to_string(INT_MAX)};
            }
            cfg.scan.depth = static_cast<int>(*v);
            cfg.scan_depth_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return KnitError{KnitError::Config, "log.level must be a string"};
            }
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["enabled"].value<bool>()) {
            cfg.cache.enabled = *v;
            cfg.cache_enabled_set = true;
        }
        if (auto v = (*cache)["path"].value<std::string>()) {
            cfg.cache.path = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KnitError{KnitError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    scan.exclude.insert(scan.exclude.end(),
                        other.scan.exclude.begin(), other.scan.exclude.end());
    if (other.scan_depth_set) {
        scan.depth = other.scan.depth;
        scan_depth_set = true;
    }

    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }

    if (other.cache_enabled_set) {
        cache.enabled = other.cache.enabled;
        cache_enabled_set = true;
    }
    if (!other.cache.path.empty()) {
        cache.path = other.cache.path;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& workspace) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    return result;
}

Result<Config> Config::discover(const std::filesystem::path& workspace_root) {
    std::error_code ec;
    std::optional<Config> global;
    auto gpath = global_config_path();
    if (!gpath.empty() && std::filesystem::exists(gpath, ec)) {
        auto gc = Config::load(gpath);
        if (gc.is_err()) return std::move(gc).error();
        global = std::move(gc).value();
    }

    std::optional<Config> workspace;
    auto wpath = workspace_root / WORKSPACE_CONFIG_FILE;
    if (std::filesystem::exists(wpath, ec)) {
        auto wc = Config::load(wpath.string());
        if (wc.is_err()) return std::move(wc).error();
        workspace = std::move(wc).value();
    }

    return Result<Config>::ok(Config::effective(global, workspace));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.knit/config.toml";
}

} // namespace knit
