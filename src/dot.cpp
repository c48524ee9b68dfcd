#include "callscope/dot.hpp"
#include "callscope/imports.hpp"
#include <fstream>
#include <map>
#include <stdexcept>
#include <vector>

namespace callscope {

namespace {

constexpr const char *PACKAGE_COLOR = "#AED6F1";
constexpr const char *RECEIVER_COLOR = "#F9E79F";

bool is_visible(const Node &node, const DotOptions &options) {
    if (!is_synthetic(node.kind)) return true;
    if (options.internal_only) return false;
    if (options.hide_stdlib && node.kind == NodeKind::External &&
        is_standard_import(node.import_path)) {
        return false;
    }
    return true;
}

// Shape and style attributes per node kind
std::string node_attributes(NodeKind kind) {
    switch (kind) {
    case NodeKind::Function:
        return "shape=rectangle";
    case NodeKind::Unindexed:
        return "shape=rectangle, style=\"filled,dashed\"";
    case NodeKind::Method:
        return "shape=diamond, style=\"filled,dashed\", fillcolor=white";
    case NodeKind::External:
        return "shape=ellipse, style=\"filled,dashed\", fillcolor=\"#D5F5E3\"";
    case NodeKind::Missing:
        return "shape=octagon, style=\"filled,dashed\", color=red, fillcolor=\"#FADBD8\"";
    case NodeKind::Unknown:
        return "shape=ellipse, style=\"filled,dashed\", fillcolor=gray80";
    case NodeKind::Literal:
        return "shape=circle, style=\"filled,dashed\", fillcolor=white, fontsize=10";
    }
    return "shape=ellipse";
}

void write_node(const CallGraph &graph, const Node &node, const std::string &indent,
                std::ostream &out) {
    out << indent << "\"" << dot_node_id(graph, node.id) << "\" [label=\""
        << escape_dot_label(node.label) << "\", " << node_attributes(node.kind) << "];\n";
}

// name is sanitized; suffix keeps clusters apart when two names sanitize alike
void open_cluster(const std::string &name, const std::string &suffix, const std::string &label,
                  const char *color, const std::string &indent, std::ostream &out) {
    out << indent << "subgraph cluster_" << sanitize_identifier(name) << "_" << suffix << " {\n";
    out << indent << "    style=filled;\n";
    out << indent << "    color=\"" << color << "\";\n";
    out << indent << "    label=\"" << escape_dot_label(label) << "\";\n";
}

// Functions of one package, with methods grouped by receiver type
struct PackageCluster {
    std::string name;
    std::vector<NodeId> functions;
    std::map<std::string, std::vector<NodeId>> receivers;
};

} // namespace

std::string sanitize_identifier(const std::string &name) {
    std::string safe = name;
    for (char &c : safe) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_';
        if (!ok) c = '_';
    }
    return safe;
}

std::string escape_dot_label(const std::string &text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '\\':
            escaped += "\\\\";
            break;
        case '"':
            escaped += "\\\"";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

std::string dot_node_id(const CallGraph &graph, NodeId id) {
    // Sanitizing can map two keys to one string; the node id keeps them apart
    return sanitize_identifier(graph.key(id)) + "_" + std::to_string(id);
}

void render_dot(const CallGraph &graph, std::ostream &out, const DotOptions &options) {
    out << "digraph G {\n";
    out << "    rankdir=LR;\n";
    out << "    node [style=filled, fillcolor=lightgray];\n";
    out << "    edge [color=gray50];\n";

    // Clusters keyed by import path, so same-named packages in different directories stay apart
    std::map<std::string, PackageCluster> packages;
    std::vector<NodeId> loose;

    for (const auto &node : graph.nodes()) {
        if (!is_visible(node, options)) continue;

        if (node.kind != NodeKind::Function) {
            loose.push_back(node.id);
            continue;
        }

        const std::string &path = node.function->package_path;
        PackageCluster &cluster = packages[path.empty() ? node.package : path];
        cluster.name = node.package;
        if (node.receiver.empty()) {
            cluster.functions.push_back(node.id);
        } else {
            cluster.receivers[node.receiver].push_back(node.id);
        }
    }

    size_t package_index = 0;
    for (const auto &[path, cluster] : packages) {
        std::string package_suffix = std::to_string(package_index++);
        open_cluster("pkg_" + path, package_suffix,
                     "Package: " + cluster.name + " (" + path + ")", PACKAGE_COLOR, "    ", out);
        for (NodeId id : cluster.functions) {
            write_node(graph, graph.node(id), "        ", out);
        }
        size_t receiver_index = 0;
        for (const auto &[receiver, methods] : cluster.receivers) {
            open_cluster("struct_" + path + "_" + receiver,
                         package_suffix + "_" + std::to_string(receiver_index++),
                         "Type: " + receiver, RECEIVER_COLOR, "        ", out);
            for (NodeId id : methods) {
                write_node(graph, graph.node(id), "            ", out);
            }
            out << "        }\n";
        }
        out << "    }\n";
    }

    for (NodeId id : loose) {
        write_node(graph, graph.node(id), "    ", out);
    }

    for (const auto &[caller, callee] : graph.edges()) {
        if (!is_visible(graph.node(caller), options) || !is_visible(graph.node(callee), options))
            continue;
        out << "    \"" << dot_node_id(graph, caller) << "\" -> \"" << dot_node_id(graph, callee)
            << "\";\n";
    }

    out << "}\n";
}

void write_dot(const CallGraph &graph, const std::string &filepath, const DotOptions &options) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    render_dot(graph, file, options);
}

} // namespace callscope
