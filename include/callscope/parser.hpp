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

#include "types.hpp"
#include <functional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Provided by the tree-sitter-go grammar library
extern "C" {
const TSLanguage *tree_sitter_go();
}

namespace callscope {

// One import spec as written in the source
struct ImportSpec {
    std::string alias; // Explicit alias ("" when none was written, "_" or "." as written)
    std::string path;  // Import path without quotes
    uint32_t line;
};

// Parsed function or method declaration
struct FunctionDef {
    std::string name;
    std::string receiver; // Normalized receiver type, empty for plain functions
    std::vector<Parameter> params;
    std::vector<std::string> returns;
    uint32_t start_line;
    uint32_t end_line;
    bool has_body;
    TSNode node; // Original tree-sitter node, valid while the parser keeps its tree
};

// Parser for Go source files
class GoParser {
public:

    GoParser();
    ~GoParser();

    // Non-copyable
    GoParser(const GoParser &) = delete;
    GoParser &operator=(const GoParser &) = delete;

    // Movable
    GoParser(GoParser &&other) noexcept;
    GoParser &operator=(GoParser &&other) noexcept;

    // Parse source code; false if tree-sitter produced no tree at all
    bool parse(const std::string &source);

    // True if the last parse contains syntax errors
    bool has_errors() const;

    // Name from the package clause, empty if there is none
    std::string package_name() const;

    // Import specs of every import declaration
    std::vector<ImportSpec> extract_imports() const;

    // Top-level function and method declarations in source order
    std::vector<FunctionDef> extract_functions() const;

    // Get root node
    TSNode root() const;

    // Get source code
    const std::string &source() const { return source_; }

    // Source text covered by a node
    std::string node_text(TSNode node) const;

    // Position of the first row of the error nearest to the start, 1-based (0 if none)
    uint32_t first_error_line() const;

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    std::vector<Parameter> extract_parameters(TSNode list) const;
    std::vector<std::string> extract_results(TSNode result) const;

    // Recursive node visitor
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;
};

// Child node for a named field, null node if absent
TSNode child_by_field(TSNode node, const char *field);

// 1-based line numbers of a node
uint32_t start_line_of(TSNode node);
uint32_t end_line_of(TSNode node);

// Node type comparison helper
bool node_is(TSNode node, const char *type);

// Read a whole source file; false if it cannot be opened
bool load_source(const std::string &path, std::string &out);

// Strip pointer markers, parentheses and type parameters from a receiver type
std::string normalize_receiver(const std::string &type_text);

} // namespace callscope
