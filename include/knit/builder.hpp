#pragma once

#include <knit/descriptor.hpp>
#include <knit/graph.hpp>
#include <knit/log.hpp>
#include <filesystem>
#include <vector>

namespace knit {

// Builds a DependencyGraph from manifest paths. Every manifest is parsed
// before any local dependency is resolved; a single unparsable manifest
// fails the whole build.
class GraphBuilder {
public:
    explicit GraphBuilder(const DescriptorParser& parser,
                          log::Logger& logger = log::null_logger());

    Result<DependencyGraph> build(const std::vector<std::filesystem::path>& manifest_paths) const;

private:
    const DescriptorParser& parser_;
    log::Logger& logger_;
};

// GraphBuilder with the package.json parser
Result<DependencyGraph> build_graph(const std::vector<std::filesystem::path>& manifest_paths,
                                    log::Logger& logger = log::null_logger());

} // namespace knit
