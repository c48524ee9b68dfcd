#include "callscope/graph.hpp"
#include "callscope/version.hpp"
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace callscope {

namespace {

void add_sites(CallGraph &graph, NodeId caller, const FunctionDescriptor &fn,
               const std::vector<CallSite> &sites) {
    for (const auto &site : sites) {
        NodeId callee = std::visit(
            [&](const auto &target) -> NodeId {
                using T = std::decay_t<decltype(target)>;
                if constexpr (std::is_same_v<T, LocalCall> ||
                              std::is_same_v<T, CrossModuleCall>) {
                    return graph.get_or_create(target.function->identity());
                } else {
                    return graph.add_synthetic(site.target, fn, site.line);
                }
            },
            site.target);

        graph.add_call(caller, callee);

        // Calls inside arguments and literal bodies still run on behalf of fn
        add_sites(graph, caller, fn, site.nested);
    }
}

} // namespace

const char *node_kind_to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Function:
        return "function";
    case NodeKind::Unindexed:
        return "unindexed";
    case NodeKind::Method:
        return "method";
    case NodeKind::External:
        return "external";
    case NodeKind::Missing:
        return "missing";
    case NodeKind::Unknown:
        return "unknown";
    case NodeKind::Literal:
        return "literal";
    }
    return "unknown";
}

std::string synthetic_key(const CallTarget &target, const FunctionDescriptor &caller,
                          uint32_t line) {
    return std::visit(
        [&](const auto &t) -> std::string {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, LocalCall> || std::is_same_v<T, CrossModuleCall>) {
                return t.function->identity();
            } else if constexpr (std::is_same_v<T, MethodCall>) {
                // Receiver text only means something inside the caller's package
                return "method:" + caller.scope() + ":" + t.receiver + "." + t.method;
            } else if constexpr (std::is_same_v<T, ExternalCall>) {
                switch (t.origin) {
                case ExternalOrigin::Import:
                    return "external:" + t.import_path + "." + t.name;
                case ExternalOrigin::Missing:
                    return "missing:" + t.import_path + "." + t.name;
                case ExternalOrigin::Unknown:
                    break;
                }
                return "unknown:" + caller.scope() + ":" + t.name;
            } else {
                return "literal:" + caller.file + ":" + std::to_string(line);
            }
        },
        target);
}

NodeId CallGraph::get_or_create(const std::string &key, NodeKind kind) {
    NodeId id = keys_.find(key);
    if (id != INVALID_NODE) {
        return id;
    }

    id = keys_.intern(key);
    Node node;
    node.id = id;
    node.kind = kind;
    node.label = key;
    nodes_.push_back(std::move(node));
    return id;
}

NodeId CallGraph::add_function(const FunctionDescriptor &fn) {
    NodeId id = get_or_create(fn.identity(), NodeKind::Function);

    // A node referenced before its descriptor arrived gets completed here
    Node &node = nodes_[id];
    node.kind = NodeKind::Function;
    node.label = fn.is_method() ? fn.receiver + "." + fn.name : fn.name;
    node.package = fn.package;
    node.receiver = fn.receiver;
    node.file = fn.file;
    node.line = fn.start_line;
    node.function = &fn;
    return id;
}

NodeId CallGraph::add_synthetic(const CallTarget &target, const FunctionDescriptor &caller,
                                uint32_t line) {
    std::string key = synthetic_key(target, caller, line);
    NodeId existing = keys_.find(key);
    if (existing != INVALID_NODE) {
        return existing;
    }

    NodeKind kind = NodeKind::Unknown;
    std::string label;
    std::string import_path;
    std::string file;
    uint32_t node_line = 0;

    if (auto method = std::get_if<MethodCall>(&target)) {
        kind = NodeKind::Method;
        label = method->receiver + "." + method->method;
    } else if (auto ext = std::get_if<ExternalCall>(&target)) {
        import_path = ext->import_path;
        if (ext->origin == ExternalOrigin::Import) {
            kind = NodeKind::External;
            label = ext->import_path + "." + ext->name;
        } else if (ext->origin == ExternalOrigin::Missing) {
            kind = NodeKind::Missing;
            label = ext->import_path + "." + ext->name;
        } else {
            label = ext->name;
        }
    } else if (std::holds_alternative<LiteralInvocation>(target)) {
        kind = NodeKind::Literal;
        file = caller.file;
        node_line = line;
        label = "func@" + std::filesystem::path(caller.file).filename().string() + ":" +
                std::to_string(line);
    } else {
        // Internal targets are never synthetic
        return get_or_create(key);
    }

    NodeId id = get_or_create(key, kind);
    Node &node = nodes_[id];
    node.label = std::move(label);
    node.import_path = std::move(import_path);
    node.file = std::move(file);
    node.line = node_line;
    return id;
}

bool CallGraph::add_call(NodeId caller, NodeId callee) {
    if (!nodes_[caller].calls.insert(callee).second) {
        return false;
    }
    nodes_[callee].called_by.insert(caller);
    edges_.emplace_back(caller, callee);
    return true;
}

NodeId CallGraph::find(const std::string &key) const { return keys_.find(key); }

std::vector<std::string> CallGraph::search(const std::vector<std::string> &patterns) const {
    std::vector<std::string> matches;
    if (patterns.empty())
        return matches;

    for (const auto &node : nodes_) {
        const std::string &k = keys_.get(node.id);
        bool all = std::all_of(patterns.begin(), patterns.end(), [&](const std::string &p) {
            return k.find(p) != std::string::npos;
        });
        if (all) {
            matches.push_back(k);
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<std::pair<NodeId, size_t>> CallGraph::reachable(NodeId start, Direction direction,
                                                            size_t max_depth) const {
    std::vector<std::pair<NodeId, size_t>> result;
    if (start >= nodes_.size())
        return result;

    // Iterative BFS; recursion and mutual recursion are normal in call graphs
    std::vector<bool> visited(nodes_.size(), false);
    std::deque<std::pair<NodeId, size_t>> queue;
    visited[start] = true;
    queue.emplace_back(start, 0);

    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();

        if (max_depth != 0 && depth >= max_depth)
            continue;

        const auto &next = direction == Direction::Callees ? nodes_[current].calls
                                                           : nodes_[current].called_by;
        for (NodeId n : next) {
            if (visited[n])
                continue;
            visited[n] = true;
            result.emplace_back(n, depth + 1);
            queue.emplace_back(n, depth + 1);
        }
    }

    return result;
}

json CallGraph::to_json() const {
    json j;

    // Metadata
    j["metadata"]["version"] = EXPORT_SCHEMA_VERSION;
    j["metadata"]["num_nodes"] = nodes_.size();
    j["metadata"]["num_edges"] = edges_.size();

    json nodes = json::array();
    for (const auto &node : nodes_) {
        json n;
        n["id"] = node.id;
        n["key"] = keys_.get(node.id);
        n["name"] = node.label;
        n["kind"] = node_kind_to_string(node.kind);
        n["package"] = node.package;
        n["receiver"] = node.receiver;
        if (!node.import_path.empty()) {
            n["import_path"] = node.import_path;
        }
        n["file"] = node.file;
        n["line"] = node.line;
        nodes.push_back(std::move(n));
    }
    j["nodes"] = std::move(nodes);

    json edges = json::array();
    for (const auto &[caller, callee] : edges_) {
        edges.push_back({caller, callee});
    }
    j["edges"] = std::move(edges);

    return j;
}

void CallGraph::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    file << to_json().dump(2) << "\n";
}

CallGraph assemble_graph(const Registry &registry, const Resolution &resolution) {
    CallGraph graph;

    for (const auto &fn : registry.functions()) {
        graph.add_function(*fn);
    }

    // Registry order, not hash order, so ids and edge order are reproducible
    for (const auto &fn : registry.functions()) {
        auto it = resolution.find(fn->identity());
        if (it == resolution.end())
            continue;
        add_sites(graph, graph.find(it->first), *fn, it->second);
    }

    // Call sites of callers the registry never indexed
    std::vector<std::string> orphans;
    for (const auto &[identity, sites] : resolution) {
        if (!registry.find(identity)) {
            orphans.push_back(identity);
        }
    }
    std::sort(orphans.begin(), orphans.end());

    FunctionDescriptor unknown_caller;
    for (const auto &identity : orphans) {
        NodeId caller = graph.get_or_create(identity);
        add_sites(graph, caller, unknown_caller, resolution.at(identity));
    }

    return graph;
}

} // namespace callscope
