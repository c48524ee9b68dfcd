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

#include "dot.hpp"
#include "graph.hpp"
#include "indexer.hpp"
#include "resolver.hpp"
#include <string>
#include <vector>

namespace callscope {

// Everything one run produces: index, call sites and the assembled graph
struct Analysis {
    IndexResult index;
    Resolution resolution;
    CallGraph graph;
};

// Index, resolve and assemble. Throws on fatal errors (manifest, root).
Analysis run_analysis(const IndexerConfig &config);

// Command implementations
int cmd_dot(const Analysis &analysis, const std::string &output_name, const DotOptions &options);
int cmd_list(const Analysis &analysis);
int cmd_export_csv(const Analysis &analysis, const std::string &filepath);
int cmd_export_json(const Analysis &analysis, const std::string &filepath);
int cmd_graph_json(const Analysis &analysis, const std::string &filepath);
int cmd_untested(const Analysis &analysis, const std::string &profile_path);
int cmd_search(const Analysis &analysis, const std::vector<std::string> &patterns);
int cmd_trace(const Analysis &analysis, const std::string &symbol, Direction direction,
              size_t max_depth);

// Helper functions
std::string default_output_name(const std::string &src);
bool validate_symbol(const CallGraph &graph, const std::string &symbol, NodeId &id);

} // namespace callscope
