#pragma once

#include <knit/graph.hpp>
#include <knit/log.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace knit::test {

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
            ("knit_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
        return full;
    }

    // Writes <rel>/package.json and returns its path
    fs::path write_package(const std::string& rel, const std::string& json) {
        return write_file(rel.empty() ? "package.json" : rel + "/package.json", json);
    }
};

// Keeps every message that passes the level filter
class RecordingLogger : public log::Logger {
public:
    std::vector<std::pair<log::Level, std::string>> messages;

    bool enabled(log::Level) const override { return true; }

    bool contains(log::Level lvl, const std::string& needle) const {
        for (const auto& [l, m] : messages) {
            if (l == lvl && m.find(needle) != std::string::npos) return true;
        }
        return false;
    }

protected:
    void write(log::Level lvl, const std::string& message) override {
        messages.emplace_back(lvl, message);
    }
};

// Graph straight from name -> dependency names. Every listed dependency
// becomes a forward edge, even one that names no package.
inline DependencyGraph make_graph(const std::map<std::string, std::vector<std::string>>& structure) {
    DependencyGraph g;
    for (const auto& [name, deps] : structure) {
        PackageNode node;
        node.name = name;
        node.version = "1.0.0";
        node.location = "/fake/path/" + name;
        node.declared_dependencies = NameSet(deps.begin(), deps.end());
        node.local_dependencies = node.declared_dependencies;
        g.nodes[name] = node;
        g.forward_edges[name] = node.declared_dependencies;
    }
    g.reverse_edges = reverse_edges(g.forward_edges);
    return g;
}

// Random DAG: node i may only depend on nodes with a smaller index, and
// names are shuffled so name order says nothing about dependency order.
inline DependencyGraph random_dag(std::mt19937& rng, int n, double density) {
    std::vector<std::string> names;
    for (int i = 0; i < n; ++i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "pkg%03d", i);
        names.push_back(buf);
    }
    std::shuffle(names.begin(), names.end(), rng);

    std::bernoulli_distribution edge(density);
    std::map<std::string, std::vector<std::string>> s;
    for (int i = 0; i < n; ++i) {
        auto& deps = s[names[i]];
        for (int j = 0; j < i; ++j) {
            if (edge(rng)) deps.push_back(names[j]);
        }
    }
    return make_graph(s);
}

inline size_t index_of(const std::vector<std::string>& order, const std::string& name) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] == name) return i;
    }
    return order.size();
}

} // namespace knit::test
