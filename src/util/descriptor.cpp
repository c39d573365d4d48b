#include <knit/descriptor.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace knit {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static KnitError descriptor_error(const std::string& msg, const std::string& origin) {
    KnitError err{KnitError::Descriptor, msg};
    err.file = origin;
    return err;
}

static Status read_dependency_map(const json& doc, const char* key,
                                  std::map<std::string, std::string>& out,
                                  const std::string& origin) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return ok_status();

    if (!it->is_object()) {
        return descriptor_error(
            std::string("'") + key + "' must be an object", origin);
    }
    for (auto dep = it->begin(); dep != it->end(); ++dep) {
        out[dep.key()] = dep->is_string() ? dep->get<std::string>() : dep->dump();
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// PackageDescriptor
// ---------------------------------------------------------------------------

Result<PackageDescriptor> PackageDescriptor::parse(const std::string& json_text,
                                                   const std::string& origin) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return descriptor_error(std::string("invalid JSON: ") + e.what(), origin);
    }

    if (!doc.is_object()) {
        return descriptor_error("package descriptor must be a JSON object", origin);
    }

    PackageDescriptor desc;

    auto name = doc.find("name");
    if (name == doc.end() || !name->is_string() ||
        name->get_ref<const std::string&>().empty()) {
        KnitError err = descriptor_error(
            "package at " + (origin.empty() ? std::string("<input>") : origin) +
            " has no name field", origin);
        err.hint = "add a non-empty \"name\" string to the manifest";
        return err;
    }
    desc.name = name->get<std::string>();

    auto version = doc.find("version");
    if (version != doc.end() && !version->is_null()) {
        if (!version->is_string()) {
            return descriptor_error("'version' must be a string", origin);
        }
        if (!version->get_ref<const std::string&>().empty()) {
            desc.version = version->get<std::string>();
        }
    }

    KNIT_TRY(read_dependency_map(doc, "dependencies", desc.dependencies, origin));
    KNIT_TRY(read_dependency_map(doc, "devDependencies", desc.dev_dependencies, origin));
    KNIT_TRY(read_dependency_map(doc, "peerDependencies", desc.peer_dependencies, origin));
    KNIT_TRY(read_dependency_map(doc, "optionalDependencies", desc.optional_dependencies, origin));

    return Result<PackageDescriptor>::ok(std::move(desc));
}

Result<PackageDescriptor> PackageDescriptor::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return descriptor_error("cannot open package descriptor: " + path.string(),
                                path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return PackageDescriptor::parse(ss.str(), path.string());
}

PackageNode PackageDescriptor::to_node(const std::filesystem::path& manifest_path) const {
    PackageNode node;
    node.name = name;
    node.version = version.value_or("0.0.0");
    node.location = manifest_path.parent_path();

    for (const auto* category : {&dependencies, &dev_dependencies,
                                 &peer_dependencies, &optional_dependencies}) {
        for (const auto& [dep, range] : *category) {
            node.declared_dependencies.insert(dep);
        }
    }
    for (const auto& [dep, range] : dev_dependencies) {
        node.declared_dev_dependencies.insert(dep);
    }
    return node;
}

Result<PackageDescriptor> JsonDescriptorParser::parse(
    const std::filesystem::path& manifest_path) const
{
    return PackageDescriptor::load(manifest_path);
}

} // namespace knit
