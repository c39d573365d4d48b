#include <knit/builder.hpp>

namespace knit {

GraphBuilder::GraphBuilder(const DescriptorParser& parser, log::Logger& logger)
    : parser_(parser), logger_(logger) {}

Result<DependencyGraph> GraphBuilder::build(
    const std::vector<std::filesystem::path>& manifest_paths) const
{
    std::vector<PackageNode> parsed;
    parsed.reserve(manifest_paths.size());

    for (const auto& path : manifest_paths) {
        auto desc = parser_.parse(path);
        if (desc.is_err()) {
            logger_.error("failed to parse package descriptor %s: %s",
                          path.string().c_str(), desc.error().message.c_str());
            return std::move(desc).error();
        }

        PackageNode node = desc.value().to_node(path);
        logger_.verbose("parsed package: %s at %s",
                        node.name.c_str(), node.location.string().c_str());
        parsed.push_back(std::move(node));
    }

    DependencyGraph graph = assemble_graph(std::move(parsed), logger_);
    logger_.debug("dependency graph: %zu packages, %zu local edges",
                  graph.node_count(), graph.edge_count());
    return Result<DependencyGraph>::ok(std::move(graph));
}

Result<DependencyGraph> build_graph(const std::vector<std::filesystem::path>& manifest_paths,
                                    log::Logger& logger) {
    JsonDescriptorParser parser;
    return GraphBuilder(parser, logger).build(manifest_paths);
}

} // namespace knit
