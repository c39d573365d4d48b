#pragma once

#include <knit/result.hpp>
#include <knit/graph.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace knit {

// Parsed package.json. Dependency maps are name -> version range; ranges are
// carried but never interpreted.
struct PackageDescriptor {
    std::string name;
    std::optional<std::string> version;
    std::map<std::string, std::string> dependencies;
    std::map<std::string, std::string> dev_dependencies;
    std::map<std::string, std::string> peer_dependencies;
    std::map<std::string, std::string> optional_dependencies;

    // Parse from JSON text. `origin` names the source in error messages.
    static Result<PackageDescriptor> parse(const std::string& json_text,
                                           const std::string& origin = "");

    // Parse from a manifest file
    static Result<PackageDescriptor> load(const std::filesystem::path& path);

    // Node for this package; location is the manifest's directory and
    // local_dependencies is left empty.
    PackageNode to_node(const std::filesystem::path& manifest_path) const;
};

// Source of descriptors for the graph builder
class DescriptorParser {
public:
    virtual ~DescriptorParser() = default;
    virtual Result<PackageDescriptor> parse(const std::filesystem::path& manifest_path) const = 0;
};

// Reads package.json files from disk
class JsonDescriptorParser : public DescriptorParser {
public:
    Result<PackageDescriptor> parse(const std::filesystem::path& manifest_path) const override;
};

} // namespace knit
