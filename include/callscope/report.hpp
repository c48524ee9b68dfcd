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
#include <nlohmann/json.hpp>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace callscope {

using json = nlohmann::json;

// One row of the function listing
struct FunctionRecord {
    const FunctionDescriptor *function = nullptr;
    const std::vector<CallSite> *sites = nullptr; // nullptr when the function was not resolved
    std::vector<ExternalCall> externals;
    std::vector<const FunctionDescriptor *> calls;
};

// Records for every indexed function, in registry order
std::vector<FunctionRecord> build_records(const Registry &registry, const Resolution &resolution);

// "name type", or just the type for unnamed parameters
std::string format_parameter(const Parameter &param);

// "importpath.Name" for imports, the bare name otherwise
std::string format_external(const ExternalCall &external);

// Function name as listed: "Recv.Name" for methods
std::string display_name(const FunctionDescriptor &fn);

// Aligned text table
void print_function_table(const std::vector<FunctionRecord> &records, std::ostream &out);

// Quote a CSV field, doubling embedded quotes
std::string csv_field(const std::string &value);

void write_csv(const std::vector<FunctionRecord> &records, std::ostream &out);
void export_csv(const std::vector<FunctionRecord> &records, const std::string &filepath);

json call_site_to_json(const CallSite &site);
json records_to_json(const std::vector<FunctionRecord> &records);
void export_json(const std::vector<FunctionRecord> &records, const std::string &filepath);

// One "identity  file:line" row per untested function, sorted by identity
void print_untested(const std::set<std::string> &untested, const Registry &registry,
                    std::ostream &out);

} // namespace callscope
