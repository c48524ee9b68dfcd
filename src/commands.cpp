#include "callscope/commands.hpp"
#include "callscope/coverage.hpp"
#include "callscope/errors.hpp"
#include "callscope/report.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <spdlog/spdlog.h>

namespace callscope {

namespace fs = std::filesystem;

Analysis run_analysis(const IndexerConfig &config) {
    Analysis analysis;

    Indexer indexer(config);
    analysis.index = indexer.index();

    // The registry is frozen from here on
    analysis.resolution =
        resolve_calls(analysis.index.registry, analysis.index.imports, config.num_threads);
    analysis.graph = assemble_graph(analysis.index.registry, analysis.resolution);

    spdlog::info("Call graph: {} nodes, {} edges", analysis.graph.num_nodes(),
                 analysis.graph.num_edges());
    return analysis;
}

std::string default_output_name(const std::string &src) {
    std::error_code ec;
    fs::path path = fs::absolute(src, ec);
    if (ec) {
        path = src;
    }
    path = path.lexically_normal();

    std::string name = path.filename().string();
    if (name.empty()) {
        // "/a/b/" normalizes to a trailing separator
        name = path.parent_path().filename().string();
    }
    return name.empty() ? "callgraph" : name;
}

bool validate_symbol(const CallGraph &graph, const std::string &symbol, NodeId &id) {
    id = graph.find(symbol);
    if (id != INVALID_NODE)
        return true;

    auto matches = graph.search({symbol});
    if (matches.size() == 1) {
        id = graph.find(matches.front());
        return true;
    }

    std::cerr << "Error: symbol not found: " << symbol << std::endl;
    if (!matches.empty()) {
        std::cerr << "Did you mean one of these?" << std::endl;
        for (size_t i = 0; i < std::min(matches.size(), size_t(5)); ++i)
            std::cerr << "  " << matches[i] << std::endl;
    }
    return false;
}

int cmd_dot(const Analysis &analysis, const std::string &output_name, const DotOptions &options) {
    std::string filename = output_name + ".dot";
    try {
        write_dot(analysis.graph, filename, options);
    } catch (const std::exception &e) {
        std::cerr << "Error generating DOT file: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Call graph generated in " << filename << std::endl;
    return 0;
}

int cmd_list(const Analysis &analysis) {
    auto records = build_records(analysis.index.registry, analysis.resolution);
    print_function_table(records, std::cout);
    return 0;
}

int cmd_export_csv(const Analysis &analysis, const std::string &filepath) {
    try {
        export_csv(build_records(analysis.index.registry, analysis.resolution), filepath);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Functions exported to " << filepath << std::endl;
    return 0;
}

int cmd_export_json(const Analysis &analysis, const std::string &filepath) {
    try {
        export_json(build_records(analysis.index.registry, analysis.resolution), filepath);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Functions exported to " << filepath << std::endl;
    return 0;
}

int cmd_graph_json(const Analysis &analysis, const std::string &filepath) {
    try {
        analysis.graph.save(filepath);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Call graph saved to " << filepath << std::endl;
    return 0;
}

int cmd_untested(const Analysis &analysis, const std::string &profile_path) {
    std::set<std::string> untested;
    try {
        untested =
            find_untested(profile_path, analysis.index.registry, analysis.index.module_root);
    } catch (const CoverageProfileOpenError &e) {
        // Only the coverage report is lost; other outputs of the run stand
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << untested.size() << " of " << analysis.index.registry.size()
              << " functions untested" << std::endl;
    print_untested(untested, analysis.index.registry, std::cout);
    return 0;
}

int cmd_search(const Analysis &analysis, const std::vector<std::string> &patterns) {
    auto matches = analysis.graph.search(patterns);

    std::cout << matches.size() << " Matches found" << std::endl;
    if (matches.empty()) {
        std::cout << "  (none found)" << std::endl;
        return 0;
    }

    for (const auto &key : matches) {
        const Node &node = analysis.graph.node(analysis.graph.find(key));
        std::cout << "  " << key;
        if (!node.file.empty()) {
            std::cout << "  " << node.file << ":" << node.line;
        }
        std::cout << std::endl;
    }
    return 0;
}

int cmd_trace(const Analysis &analysis, const std::string &symbol, Direction direction,
              size_t max_depth) {
    const CallGraph &graph = analysis.graph;

    NodeId start;
    if (!validate_symbol(graph, symbol, start))
        return 1;

    auto reached = graph.reachable(start, direction, max_depth);

    std::cout << (direction == Direction::Callees ? "Callees of " : "Callers of ")
              << graph.key(start);
    if (max_depth != 0) {
        std::cout << " (depth " << max_depth << ")";
    }
    std::cout << ": " << reached.size() << std::endl;

    if (reached.empty()) {
        std::cout << "  (none found)" << std::endl;
        return 0;
    }

    for (const auto &[id, depth] : reached) {
        const Node &node = graph.node(id);
        std::cout << std::string(depth * 2, ' ') << graph.key(id);
        if (node.kind != NodeKind::Function) {
            std::cout << " [" << node_kind_to_string(node.kind) << "]";
        }
        std::cout << std::endl;
    }
    return 0;
}

} // namespace callscope
