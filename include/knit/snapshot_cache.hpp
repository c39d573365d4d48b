#pragma once

#include <knit/graph.hpp>
#include <knit/result.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace knit {

struct SnapshotEntry {
    std::string root;
    std::string fingerprint;
    std::string graph_json;
    int64_t created_at = 0;
};

// Persists graph snapshots in SQLite, keyed by workspace root. A stored
// graph is only returned while the manifest fingerprint still matches.
class SnapshotCache {
public:
    SnapshotCache();
    ~SnapshotCache();
    SnapshotCache(SnapshotCache&&) noexcept;
    SnapshotCache& operator=(SnapshotCache&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_cache_path();

    // FNV-1a digest over each manifest's path, size and mtime, in order
    static Result<std::string> fingerprint(const std::vector<std::filesystem::path>& manifests);

    // NotFound when nothing is stored for root or the fingerprint differs
    Result<DependencyGraph> lookup(const std::string& root, const std::string& fingerprint);
    Result<SnapshotEntry> lookup_entry(const std::string& root);
    Status store(const std::string& root, const std::string& fingerprint,
                 const DependencyGraph& graph);
    Status remove(const std::string& root);

    // Maintenance
    Status clear();
    Result<int64_t> entry_count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace knit
