#pragma once

#include <knit/graph.hpp>
#include <knit/result.hpp>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace knit {

// Node record of a snapshot
struct SerializedPackage {
    std::string name;
    std::string version;
    std::string path;
    std::vector<std::string> dependencies;   // declared, all categories
};

// Flat snapshot of a DependencyGraph. On disk:
//   { "packages": [ {"name", "version", "path", "dependencies": [...]}, ... ],
//     "edges":    [ ["name", ["dep", ...]], ... ] }
// Dev dependencies, local dependencies and reverse edges are not stored.
struct SerializedGraph {
    std::vector<SerializedPackage> packages;
    std::vector<std::pair<std::string, std::vector<std::string>>> edges;
};

SerializedGraph serialize(const DependencyGraph& graph);

// Restores nodes and forward edges as stored and re-derives reverse edges.
// declared_dev_dependencies and local_dependencies come back empty.
DependencyGraph deserialize(const SerializedGraph& data);

// JSON text <-> SerializedGraph. Dumping fails with an IO error when a
// name or path is not valid UTF-8; such graphs are refused, not mangled.
Result<std::string> dump_snapshot(const SerializedGraph& data, int indent = 2);
Result<SerializedGraph> parse_snapshot(const std::string& json_text);

// Snapshot files
Status save_snapshot(const DependencyGraph& graph, const std::filesystem::path& path);
Result<DependencyGraph> load_snapshot(const std::filesystem::path& path);

} // namespace knit
