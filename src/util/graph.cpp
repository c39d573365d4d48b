#include <knit/graph.hpp>

namespace knit {

static const NameSet& empty_set() {
    static const NameSet empty;
    return empty;
}

bool DependencyGraph::has_node(const std::string& name) const {
    return nodes.count(name) > 0;
}

const PackageNode* DependencyGraph::find(const std::string& name) const {
    auto it = nodes.find(name);
    return it == nodes.end() ? nullptr : &it->second;
}

const NameSet& DependencyGraph::dependencies(const std::string& name) const {
    auto it = forward_edges.find(name);
    return it == forward_edges.end() ? empty_set() : it->second;
}

const NameSet& DependencyGraph::dependents(const std::string& name) const {
    auto it = reverse_edges.find(name);
    return it == reverse_edges.end() ? empty_set() : it->second;
}

size_t DependencyGraph::edge_count() const {
    size_t n = 0;
    for (const auto& [name, targets] : forward_edges) {
        n += targets.size();
    }
    return n;
}

EdgeMap reverse_edges(const EdgeMap& forward) {
    EdgeMap reverse;
    for (const auto& [source, targets] : forward) {
        for (const auto& target : targets) {
            reverse[target].insert(source);
        }
    }
    return reverse;
}

DependencyGraph assemble_graph(std::vector<PackageNode> parsed, log::Logger& logger) {
    DependencyGraph graph;

    for (auto& node : parsed) {
        auto it = graph.nodes.find(node.name);
        if (it != graph.nodes.end()) {
            logger.warn("package '%s' at %s replaces the one at %s",
                        node.name.c_str(),
                        node.location.string().c_str(),
                        it->second.location.string().c_str());
            it->second = std::move(node);
            continue;
        }
        std::string key = node.name;
        graph.nodes.emplace(std::move(key), std::move(node));
    }

    // Every node is known from here on
    for (auto& [name, node] : graph.nodes) {
        NameSet local;
        for (const auto& dep : node.declared_dependencies) {
            if (graph.nodes.count(dep)) {
                local.insert(dep);
                logger.verbose("%s depends on local package: %s",
                               name.c_str(), dep.c_str());
            }
        }
        node.local_dependencies = local;
        graph.forward_edges[name] = std::move(local);
    }

    graph.reverse_edges = reverse_edges(graph.forward_edges);
    return graph;
}

} // namespace knit
