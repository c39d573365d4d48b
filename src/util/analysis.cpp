#include <knit/analysis.hpp>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace knit {

// ---------------------------------------------------------------------------
// Topological sort
// ---------------------------------------------------------------------------

namespace {

enum class Mark { Unvisited, InProgress, Done };

struct Frame {
    const std::string* name;
    NameSet::const_iterator next;
    NameSet::const_iterator end;
};

} // namespace

Result<std::vector<std::string>> topological_sort(const DependencyGraph& graph,
                                                  log::Logger& logger) {
    std::unordered_map<std::string, Mark> marks;
    marks.reserve(graph.nodes.size());

    std::vector<std::string> order;
    order.reserve(graph.nodes.size());

    std::vector<Frame> stack;

    auto enter = [&](const std::string& name) {
        marks[name] = Mark::InProgress;
        const NameSet& deps = graph.dependencies(name);
        stack.push_back(Frame{&name, deps.begin(), deps.end()});
    };

    for (const auto& [root, node] : graph.nodes) {
        if (marks[root] == Mark::Done) continue;
        enter(root);

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next == top.end) {
                marks[*top.name] = Mark::Done;
                order.push_back(*top.name);
                stack.pop_back();
                continue;
            }

            const std::string& dep = *top.next++;
            // Edges to unknown packages only exist in restored snapshots
            if (!graph.has_node(dep)) continue;

            Mark m = marks[dep];
            if (m == Mark::Done) continue;
            if (m == Mark::InProgress) {
                KnitError err{KnitError::Cycle,
                    "Circular dependency detected involving package: " + dep};
                err.subject = dep;
                return err;
            }
            enter(dep);
        }
    }

    logger.verbose("topological sort completed: build order determined for %zu packages",
                   order.size());
    return Result<std::vector<std::string>>::ok(std::move(order));
}

// ---------------------------------------------------------------------------
// Dependents
// ---------------------------------------------------------------------------

NameSet dependents_of(const std::string& name, const DependencyGraph& graph) {
    NameSet result;
    std::unordered_set<std::string> visited{name};
    std::vector<std::string> work{name};

    while (!work.empty()) {
        std::string current = std::move(work.back());
        work.pop_back();

        for (const auto& dependent : graph.dependents(current)) {
            if (visited.insert(dependent).second) {
                result.insert(dependent);
                work.push_back(dependent);
            }
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

ValidationReport validate(const DependencyGraph& graph) {
    ValidationReport report;

    for (const auto& [source, targets] : graph.forward_edges) {
        for (const auto& target : targets) {
            if (!graph.has_node(target)) {
                report.errors.push_back("Package " + source + " depends on " +
                                        target + " which doesn't exist");
            }
        }
    }

    auto order = topological_sort(graph);
    if (order.is_err()) {
        report.errors.push_back(order.error().message);
    }

    report.valid = report.errors.empty();
    return report;
}

// ---------------------------------------------------------------------------
// Tree display
// ---------------------------------------------------------------------------

static void tree_impl(const DependencyGraph& graph,
                      const std::string& name,
                      const std::string& prefix,
                      bool is_last,
                      bool is_root,
                      std::unordered_set<std::string>& expanded,
                      std::ostringstream& out) {
    out << prefix;
    if (!is_root) {
        out << (is_last ? "└── " : "├── ");
    }
    out << name;
    if (const auto* node = graph.find(name)) {
        out << " v" << node->version;
    }

    if (!expanded.insert(name).second) {
        out << " (*)\n";
        return;
    }
    out << "\n";

    std::string child_prefix = prefix;
    if (!is_root) {
        child_prefix += (is_last ? "    " : "│   ");
    }

    const NameSet& deps = graph.dependencies(name);
    size_t i = 0;
    for (const auto& dep : deps) {
        ++i;
        tree_impl(graph, dep, child_prefix, i == deps.size(), false, expanded, out);
    }
}

std::string format_tree(const DependencyGraph& graph, const std::string& root) {
    if (!graph.has_node(root)) return "";

    std::ostringstream out;
    std::unordered_set<std::string> expanded;
    tree_impl(graph, root, "", true, true, expanded, out);
    return out.str();
}

} // namespace knit
