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

#include "parser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace callscope {

// Alias -> import path for a single file
class ImportTable {
public:
    ImportTable() = default;

    // Record an import; an empty alias defaults to the last path segment.
    // Blank imports are dropped since nothing can refer to them.
    void add(const std::string &alias, const std::string &path);

    // Import path bound to an alias, nullptr if the alias is not imported
    const std::string *find(const std::string &alias) const;

    bool contains(const std::string &alias) const { return find(alias) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::unordered_map<std::string, std::string> &entries() const { return entries_; }

private:
    std::unordered_map<std::string, std::string> entries_;
};

// Import tables keyed by file path
using ImportTables = std::unordered_map<std::string, ImportTable>;

// Build the table of a parsed file
ImportTable build_import_table(const std::vector<ImportSpec> &specs);
ImportTable build_import_table(const GoParser &parser);

// Last '/'-separated segment of an import path
std::string default_import_alias(const std::string &path);

// Standard library paths have no dot in their first segment ("fmt", "net/http")
bool is_standard_import(const std::string &path);

// True if path is the module itself or a package below it
bool is_module_import(const std::string &path, const std::string &module_path);

} // namespace callscope
