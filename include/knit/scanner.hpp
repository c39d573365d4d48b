#pragma once

#include <knit/log.hpp>
#include <knit/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace knit {

struct ScanOptions {
    // Glob patterns; a match excludes the manifest and stops descent
    std::vector<std::string> exclude;
    // Directory levels below the root to search. 0 = the root only.
    int depth = 1;
    std::string manifest_name = "package.json";
    // Base for relative-path matching; empty means the process cwd
    std::filesystem::path cwd;
};

// Parses a --depth argument: decimal digits only, 0 to INT_MAX.
// Fails with InvalidArg otherwise.
Result<int> parse_depth(const std::string& text);

// True if any pattern matches the manifest's absolute path, its path
// relative to `cwd`, or the directory holding either.
bool should_exclude(const std::filesystem::path& manifest_path,
                    const std::vector<std::string>& patterns,
                    const std::filesystem::path& cwd);

// Manifest paths under `root`: the root's own manifest first, then
// subdirectories in name order down to `options.depth` levels.
// Fails with a Scan error if `root` is missing or unreadable.
Result<std::vector<std::filesystem::path>> scan_workspace(
    const std::filesystem::path& root,
    const ScanOptions& options = {},
    log::Logger& logger = log::null_logger());

} // namespace knit
