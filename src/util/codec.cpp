#include <knit/codec.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace knit {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// JSON mapping (found by nlohmann through ADL)
// ---------------------------------------------------------------------------

void to_json(json& j, const SerializedPackage& p) {
    j = json{
        {"name", p.name},
        {"version", p.version},
        {"path", p.path},
        {"dependencies", p.dependencies},
    };
}

void from_json(const json& j, SerializedPackage& p) {
    j.at("name").get_to(p.name);
    j.at("version").get_to(p.version);
    j.at("path").get_to(p.path);
    j.at("dependencies").get_to(p.dependencies);
}

void to_json(json& j, const SerializedGraph& g) {
    json edges = json::array();
    for (const auto& [name, deps] : g.edges) {
        edges.push_back(json::array({name, deps}));
    }
    j = json{
        {"packages", g.packages},
        {"edges", std::move(edges)},
    };
}

void from_json(const json& j, SerializedGraph& g) {
    j.at("packages").get_to(g.packages);

    g.edges.clear();
    for (const auto& pair : j.at("edges")) {
        if (!pair.is_array() || pair.size() != 2) {
            throw std::invalid_argument("edge entry must be a [name, [dependencies]] pair");
        }
        g.edges.emplace_back(pair[0].get<std::string>(),
                             pair[1].get<std::vector<std::string>>());
    }
}

// ---------------------------------------------------------------------------
// Graph <-> SerializedGraph
// ---------------------------------------------------------------------------

SerializedGraph serialize(const DependencyGraph& graph) {
    SerializedGraph data;
    data.packages.reserve(graph.nodes.size());
    for (const auto& [name, node] : graph.nodes) {
        SerializedPackage p;
        p.name = node.name;
        p.version = node.version;
        p.path = node.location.string();
        p.dependencies.assign(node.declared_dependencies.begin(),
                              node.declared_dependencies.end());
        data.packages.push_back(std::move(p));
    }

    data.edges.reserve(graph.forward_edges.size());
    for (const auto& [name, deps] : graph.forward_edges) {
        data.edges.emplace_back(name, std::vector<std::string>(deps.begin(), deps.end()));
    }
    return data;
}

DependencyGraph deserialize(const SerializedGraph& data) {
    DependencyGraph graph;

    for (const auto& p : data.packages) {
        PackageNode node;
        node.name = p.name;
        node.version = p.version;
        node.location = p.path;
        node.declared_dependencies.insert(p.dependencies.begin(), p.dependencies.end());
        graph.nodes[p.name] = std::move(node);
    }

    for (const auto& [name, deps] : data.edges) {
        graph.forward_edges[name] = NameSet(deps.begin(), deps.end());
    }

    graph.reverse_edges = reverse_edges(graph.forward_edges);
    return graph;
}

// ---------------------------------------------------------------------------
// Text and files
// ---------------------------------------------------------------------------

Result<std::string> dump_snapshot(const SerializedGraph& data, int indent) {
    json j = data;
    try {
        return Result<std::string>::ok(j.dump(indent));
    } catch (const json::type_error& e) {
        return KnitError{KnitError::IO,
            std::string("cannot encode graph snapshot: ") + e.what(),
            "package names and paths must be valid UTF-8"};
    }
}

Result<SerializedGraph> parse_snapshot(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        return Result<SerializedGraph>::ok(j.get<SerializedGraph>());
    } catch (const json::parse_error& e) {
        return KnitError{KnitError::Parse,
            std::string("snapshot is not valid JSON: ") + e.what()};
    } catch (const json::exception& e) {
        return KnitError{KnitError::Parse,
            std::string("malformed graph snapshot: ") + e.what(),
            "expected {\"packages\": [...], \"edges\": [[name, [deps]], ...]}"};
    } catch (const std::invalid_argument& e) {
        return KnitError{KnitError::Parse,
            std::string("malformed graph snapshot: ") + e.what()};
    }
}

Status save_snapshot(const DependencyGraph& graph, const std::filesystem::path& path) {
    auto text = dump_snapshot(serialize(graph));
    if (text.is_err()) {
        text.error().file = path.string();
        return std::move(text).error();
    }

    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return KnitError{KnitError::IO,
                "cannot create snapshot directory: " + parent.string()};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return KnitError{KnitError::IO, "cannot write snapshot: " + path.string()};
    }
    out << text.value() << "\n";
    if (!out) {
        return KnitError{KnitError::IO, "failed writing snapshot: " + path.string()};
    }
    return ok_status();
}

Result<DependencyGraph> load_snapshot(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return KnitError{KnitError::IO, "cannot open snapshot: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto data = parse_snapshot(ss.str());
    if (data.is_err()) {
        data.error().file = path.string();
        return std::move(data).error();
    }
    return Result<DependencyGraph>::ok(deserialize(data.value()));
}

} // namespace knit
