#pragma once

#include <knit/graph.hpp>
#include <knit/log.hpp>
#include <knit/result.hpp>
#include <string>
#include <vector>

namespace knit {

// Build order: every package appears once, after all of its local
// dependencies. Roots are visited in name order and each package's
// dependencies are emitted before the package itself. Fails with a Cycle
// error whose `subject` is the package reached again while still in progress.
Result<std::vector<std::string>> topological_sort(const DependencyGraph& graph,
                                                  log::Logger& logger = log::null_logger());

// Every package that depends on `name` directly or transitively. `name`
// itself is never included; unknown names yield an empty set.
NameSet dependents_of(const std::string& name, const DependencyGraph& graph);

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
};

// Structural check: edges to unknown packages first, then cycles.
ValidationReport validate(const DependencyGraph& graph);

// Dependency tree of `root` with box-drawing connectors. Packages already
// printed are marked "(*)" and not expanded again. Empty for unknown roots.
std::string format_tree(const DependencyGraph& graph, const std::string& root);

} // namespace knit
