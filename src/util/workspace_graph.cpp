#include <knit/workspace_graph.hpp>
#include <knit/builder.hpp>
#include <knit/snapshot_cache.hpp>

namespace fs = std::filesystem;

namespace knit {

std::string workspace_cache_key(const fs::path& root) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(root, ec);
    if (ec) canonical = fs::absolute(root, ec).lexically_normal();
    return canonical.generic_string();
}

Result<DependencyGraph> load_workspace_graph(const fs::path& root,
                                             const WorkspaceGraphOptions& options,
                                             log::Logger& logger) {
    auto manifests = scan_workspace(root, options.scan, logger);
    if (manifests.is_err()) return std::move(manifests).error();

    bool use_cache = options.use_cache;
    SnapshotCache cache;
    std::string root_key;
    std::string fingerprint;

    if (use_cache) {
        root_key = workspace_cache_key(root);

        auto fp = SnapshotCache::fingerprint(manifests.value());
        std::string path = options.cache_path.empty()
            ? SnapshotCache::default_cache_path() : options.cache_path;
        auto opened = fp.is_ok() ? cache.open(path) : Status(fp.error());

        if (opened.is_err()) {
            logger.warn("snapshot cache unavailable: %s", opened.error().message.c_str());
            use_cache = false;
        } else {
            fingerprint = fp.value();
            auto cached = cache.lookup(root_key, fingerprint);
            if (cached.is_ok()) {
                logger.debug("using cached graph for %s", root_key.c_str());
                return cached;
            }
            if (cached.error().code != KnitError::NotFound) {
                logger.warn("ignoring unreadable cached graph: %s",
                            cached.error().message.c_str());
            }
        }
    }

    auto graph = build_graph(manifests.value(), logger);
    if (graph.is_err()) return graph;

    if (use_cache) {
        auto stored = cache.store(root_key, fingerprint, graph.value());
        if (stored.is_err()) {
            logger.warn("could not cache graph: %s", stored.error().message.c_str());
        } else {
            logger.debug("cached graph for %s", root_key.c_str());
        }
    }
    return graph;
}

} // namespace knit
