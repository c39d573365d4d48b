#pragma once

#include <knit/log.hpp>
#include <knit/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace knit {

// [scan] section
struct ScanConfig {
    std::vector<std::string> exclude;
    int depth = 1;
};

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    bool color = true;
};

// [cache] section
struct CacheConfig {
    bool enabled = true;
    std::string path;   // empty = SnapshotCache::default_cache_path()
};

// Layered configuration: global (~/.knit/config.toml) then workspace
// (<root>/knit.toml). Later layers override fields they set explicitly;
// exclude patterns accumulate.
struct Config {
    ScanConfig scan;
    LogConfig log;
    CacheConfig cache;

    // Track which fields were explicitly set (for merge)
    bool scan_depth_set = false;
    bool log_level_set = false;
    bool log_color_set = false;
    bool cache_enabled_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& workspace);

    // Global layer plus <workspace_root>/knit.toml, each only if present
    static Result<Config> discover(const std::filesystem::path& workspace_root);
};

// Global config file path: ~/.knit/config.toml (empty if HOME is unset)
std::string global_config_path();

// Per-workspace config file name
inline constexpr const char* WORKSPACE_CONFIG_FILE = "knit.toml";

} // namespace knit
