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

#include "graph.hpp"
#include <ostream>
#include <string>

namespace callscope {

struct DotOptions {
    bool hide_stdlib = false;   // Drop externals whose import path is in the standard library
    bool internal_only = false; // Drop every synthetic node
};

// Replace every character outside [A-Za-z0-9_] with '_'
std::string sanitize_identifier(const std::string &name);

// Escape text for a double-quoted DOT string
std::string escape_dot_label(const std::string &text);

// DOT statement id of a node, unique within the graph
std::string dot_node_id(const CallGraph &graph, NodeId id);

// Write the graph as a digraph, internal nodes clustered by package and receiver type
void render_dot(const CallGraph &graph, std::ostream &out, const DotOptions &options = {});

// Render into a file. Throws std::runtime_error if it cannot be written.
void write_dot(const CallGraph &graph, const std::string &filepath,
               const DotOptions &options = {});

} // namespace callscope
