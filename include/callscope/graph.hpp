// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "registry.hpp"
#include "resolver.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace callscope {

using json = nlohmann::json;

// Node handle, equal to the index of the node's key in the graph's string pool
using NodeId = uint32_t;
constexpr NodeId INVALID_NODE = UINT32_MAX;

enum class NodeKind : uint8_t {
    Function,  // Indexed internal function or method
    Unindexed, // Internal identity referenced but never indexed
    Method,    // Unresolved call through a value
    External,  // Call into a package outside the module
    Missing,   // Module-internal looking call the registry does not know
    Unknown,   // Bare name that is neither local nor built-in
    Literal    // Immediately invoked func literal
};

const char *node_kind_to_string(NodeKind kind);

// Synthetic nodes stand in for call targets that are not internal functions
inline bool is_synthetic(NodeKind kind) {
    return kind != NodeKind::Function && kind != NodeKind::Unindexed;
}

struct Node {
    NodeId id = INVALID_NODE;
    NodeKind kind = NodeKind::Unindexed;
    std::string label;       // Display name
    std::string package;     // Declared package of internal nodes
    std::string receiver;    // Receiver type of methods
    std::string import_path; // External and Missing nodes
    std::string file;
    uint32_t line = 0;
    const FunctionDescriptor *function = nullptr; // Set for Function nodes

    std::set<NodeId> calls;
    std::set<NodeId> called_by;
};

using Edge = std::pair<NodeId, NodeId>; // (caller, callee)

enum class Direction { Callees, Callers };

// Arena call graph. Nodes are never removed, so a NodeId stays valid for the graph's lifetime.
class CallGraph {
public:

    // Add (or complete) the node of an indexed function
    NodeId add_function(const FunctionDescriptor &fn);

    // Node for a key, created empty with the given kind on first reference
    NodeId get_or_create(const std::string &key, NodeKind kind = NodeKind::Unindexed);

    // Node for a non-internal call target made by caller at line
    NodeId add_synthetic(const CallTarget &target, const FunctionDescriptor &caller,
                         uint32_t line);

    // Insert an edge into both adjacency sets. False if it already existed.
    bool add_call(NodeId caller, NodeId callee);

    // Look up a node by key (INVALID_NODE if absent)
    NodeId find(const std::string &key) const;

    const Node &node(NodeId id) const { return nodes_[id]; }
    const std::string &key(NodeId id) const { return keys_.get(id); }

    const std::vector<Node> &nodes() const { return nodes_; }
    const std::vector<Edge> &edges() const { return edges_; }

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }

    const std::set<NodeId> &callees(NodeId id) const { return nodes_[id].calls; }
    const std::set<NodeId> &callers(NodeId id) const { return nodes_[id].called_by; }

    // Keys containing every pattern, sorted
    std::vector<std::string> search(const std::vector<std::string> &patterns) const;

    // Breadth-first closure from start, excluding start, with the depth each node was reached at.
    // max_depth 0 means unlimited.
    std::vector<std::pair<NodeId, size_t>> reachable(NodeId start, Direction direction,
                                                     size_t max_depth = 0) const;

    // Serialize to JSON
    json to_json() const;

    // Save to file
    void save(const std::string &filepath) const;

private:

    StringPool keys_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
};

// Key of the synthetic node a non-internal call target maps to
std::string synthetic_key(const CallTarget &target, const FunctionDescriptor &caller,
                          uint32_t line);

// Fold every descriptor and its call sites (nested ones included) into one graph
CallGraph assemble_graph(const Registry &registry, const Resolution &resolution);

} // namespace callscope
