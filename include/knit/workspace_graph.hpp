#pragma once

#include <knit/graph.hpp>
#include <knit/log.hpp>
#include <knit/result.hpp>
#include <knit/scanner.hpp>
#include <filesystem>
#include <string>

namespace knit {

struct WorkspaceGraphOptions {
    ScanOptions scan;
    bool use_cache = true;
    std::string cache_path;   // empty = SnapshotCache::default_cache_path()
};

// Key a workspace's snapshot is stored under: its canonical root path
std::string workspace_cache_key(const std::filesystem::path& root);

// Scans `root` and returns its dependency graph. With the cache enabled, a
// stored graph is reused while the manifest fingerprint matches; otherwise
// the graph is built and stored. Cache problems are logged as warnings and
// never fail the load. Scan and descriptor errors are returned.
Result<DependencyGraph> load_workspace_graph(const std::filesystem::path& root,
                                             const WorkspaceGraphOptions& options,
                                             log::Logger& logger = log::null_logger());

} // namespace knit
