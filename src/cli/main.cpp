#include <knit/analysis.hpp>
#include <knit/codec.hpp>
#include <knit/config.hpp>
#include <knit/log.hpp>
#include <knit/scanner.hpp>
#include <knit/workspace_graph.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace knit;
namespace fs = std::filesystem;

static const char* USAGE =
    "Usage: knit [options] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  order                 print the build order\n"
    "  dependents <name>     print packages affected by a change to <name>\n"
    "  validate              check for missing packages and cycles\n"
    "  tree <name>           print the local dependency tree of <name>\n"
    "  snapshot save <file>  write the graph snapshot to <file>\n"
    "  snapshot show <file>  print the build order stored in <file>\n"
    "\n"
    "Options:\n"
    "  -C <dir>              workspace root (default: .)\n"
    "  --exclude <pattern>   skip manifests matching <pattern> (repeatable)\n"
    "  --depth <n>           directory levels to search below the root\n"
    "  --log-level <level>   debug, verbose, info, warn or error\n"
    "  --no-cache            do not read or write the snapshot cache\n"
    "  --no-color            disable coloured log output\n";

struct Options {
    fs::path root = ".";
    std::vector<std::string> exclude;
    int depth = -1;
    std::string log_level;
    bool no_cache = false;
    bool no_color = false;
    std::vector<std::string> args;
};

static int usage_error(const std::string& msg) {
    std::cerr << "error: " << msg << "\n\n" << USAGE;
    return 2;
}

static int report(const KnitError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

// Returns 0 on success, otherwise the exit code to use
static int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            std::cout << USAGE;
            return -1;
        } else if (arg == "-C") {
            if (!next(value)) return usage_error("-C needs a directory");
            opts.root = value;
        } else if (arg == "--exclude") {
            if (!next(value)) return usage_error("--exclude needs a pattern");
            opts.exclude.push_back(value);
        } else if (arg == "--depth") {
            if (!next(value)) return usage_error("--depth needs a number");
            auto depth = parse_depth(value);
            if (depth.is_err()) return usage_error(depth.error().message);
            opts.depth = depth.value();
        } else if (arg == "--log-level") {
            if (!next(value)) return usage_error("--log-level needs a level");
            opts.log_level = value;
        } else if (arg == "--no-cache") {
            opts.no_cache = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option: " + arg);
        } else {
            opts.args.push_back(arg);
        }
    }
    if (opts.args.empty()) return usage_error("missing command");
    return 0;
}

static Result<DependencyGraph> load_graph(const Options& opts, const Config& cfg,
                                          log::Logger& logger) {
    WorkspaceGraphOptions load;
    load.scan.exclude = cfg.scan.exclude;
    load.scan.exclude.insert(load.scan.exclude.end(), opts.exclude.begin(), opts.exclude.end());
    load.scan.depth = opts.depth >= 0 ? opts.depth : cfg.scan.depth;
    load.use_cache = cfg.cache.enabled && !opts.no_cache;
    load.cache_path = cfg.cache.path;
    return load_workspace_graph(opts.root, load, logger);
}

static int print_order(const DependencyGraph& graph, log::Logger& logger) {
    auto order = topological_sort(graph, logger);
    if (order.is_err()) return report(order.error());
    for (const auto& name : order.value()) {
        std::cout << name << "\n";
    }
    return 0;
}

static int run(const Options& opts, const Config& cfg, log::Logger& logger) {
    const std::string& cmd = opts.args[0];
    size_t nargs = opts.args.size() - 1;

    if (cmd == "snapshot") {
        if (nargs != 2) return usage_error("snapshot needs 'save <file>' or 'show <file>'");
        const std::string& action = opts.args[1];
        fs::path file = opts.args[2];

        if (action == "show") {
            auto graph = load_snapshot(file);
            if (graph.is_err()) return report(graph.error());
            return print_order(graph.value(), logger);
        }
        if (action != "save") return usage_error("unknown snapshot action: " + action);

        auto graph = load_graph(opts, cfg, logger);
        if (graph.is_err()) return report(graph.error());
        auto saved = save_snapshot(graph.value(), file);
        if (saved.is_err()) return report(saved.error());
        logger.info("wrote %zu packages to %s",
                    graph.value().node_count(), file.string().c_str());
        return 0;
    }

    bool known = cmd == "order" || cmd == "validate" ||
                 cmd == "dependents" || cmd == "tree";
    if (!known) return usage_error("unknown command: " + cmd);

    size_t expected = (cmd == "dependents" || cmd == "tree") ? 1 : 0;
    if (nargs != expected) {
        return usage_error("'" + cmd + "' takes " + std::to_string(expected) + " argument(s)");
    }

    auto loaded = load_graph(opts, cfg, logger);
    if (loaded.is_err()) return report(loaded.error());
    const DependencyGraph& graph = loaded.value();

    if (cmd == "order") {
        return print_order(graph, logger);
    }

    if (cmd == "validate") {
        auto result = validate(graph);
        for (const auto& e : result.errors) {
            std::cout << "error: " << e << "\n";
        }
        if (result.valid) {
            std::cout << "ok: " << graph.node_count() << " packages, "
                      << graph.edge_count() << " local dependencies\n";
        }
        return result.valid ? 0 : 1;
    }

    const std::string& name = opts.args[1];
    if (cmd == "dependents") {
        if (!graph.has_node(name)) {
            logger.warn("'%s' is not a package of this workspace", name.c_str());
        }
        for (const auto& dep : dependents_of(name, graph)) {
            std::cout << dep << "\n";
        }
        return 0;
    }

    // tree
    if (!graph.has_node(name)) {
        return report(KnitError{KnitError::NotFound, "no package named '" + name + "'"});
    }
    std::cout << format_tree(graph, name);
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    int rc = parse_args(argc, argv, opts);
    if (rc == -1) return 0;
    if (rc != 0) return rc;

    auto cfg = Config::discover(opts.root);
    if (cfg.is_err()) return report(cfg.error());
    Config& config = cfg.value();

    if (!opts.log_level.empty()) {
        auto lvl = log::parse_level(opts.log_level);
        if (lvl.is_err()) return usage_error(lvl.error().message);
        config.log.level = lvl.value();
    }

    log::ConsoleLogger logger(config.log.level);
    if (opts.no_color || !config.log.color) {
        logger.set_color_enabled(false);
    }

    return run(opts, config, logger);
}
