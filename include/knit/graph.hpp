#pragma once

#include <knit/log.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace knit {

using NameSet = std::set<std::string>;

// Package name -> set of package names
using EdgeMap = std::map<std::string, NameSet>;

// One workspace package
struct PackageNode {
    std::string name;
    std::string version = "0.0.0";
    std::filesystem::path location;     // directory holding the manifest

    // Union of runtime, dev, peer and optional dependency names
    NameSet declared_dependencies;
    // Names declared under devDependencies only
    NameSet declared_dev_dependencies;
    // Declared dependencies that are packages of the same workspace.
    // Filled in once every node is known.
    NameSet local_dependencies;
};

// ---------------------------------------------------------------------------
// DependencyGraph — packages keyed by name plus forward and reverse edges.
// forward_edges[a] holds what a depends on; reverse_edges[b] holds who
// depends on b. reverse_edges is always derived from forward_edges.
// ---------------------------------------------------------------------------

struct DependencyGraph {
    std::map<std::string, PackageNode> nodes;
    EdgeMap forward_edges;
    EdgeMap reverse_edges;

    bool has_node(const std::string& name) const;
    const PackageNode* find(const std::string& name) const;

    // Direct local dependencies; empty for unknown names
    const NameSet& dependencies(const std::string& name) const;
    // Direct dependents; empty for unknown names or leaves
    const NameSet& dependents(const std::string& name) const;

    size_t node_count() const { return nodes.size(); }
    size_t edge_count() const;
};

// Transpose forward edges. Targets without dependents do not appear as keys.
EdgeMap reverse_edges(const EdgeMap& forward);

// Second construction pass: key parsed nodes by name (a later node with the
// same name replaces the earlier one), resolve local dependencies against the
// full key set, record forward edges and derive reverse edges.
DependencyGraph assemble_graph(std::vector<PackageNode> parsed,
                               log::Logger& logger = log::null_logger());

} // namespace knit
