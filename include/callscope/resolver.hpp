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

#include "imports.hpp"
#include "parser.hpp"
#include "registry.hpp"
#include <atomic>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace callscope {

// Canonical identity -> ordered call sites of that function
using Resolution = std::unordered_map<std::string, std::vector<CallSite>>;

// Classifies every call expression in function bodies against a frozen registry.
// The registry must outlive the resolver and any Resolution it produces.
class CallResolver {
public:

    CallResolver(const Registry &registry, const ImportTables &imports,
                 unsigned int num_threads = 0);

    // Resolve every function in the registry, re-reading each source file once
    Resolution resolve_all();

    // Resolve the functions the registry knows in one file whose source is in memory.
    // Functions that cannot be located again get an empty list and a warning.
    void resolve_source(const std::string &file, const std::string &source,
                        Resolution &out) const;

    // Call sites in the body of one located declaration
    std::vector<CallSite> resolve_function(const FunctionDescriptor &fn, const GoParser &parser,
                                           TSNode declaration, const ImportTable &imports) const;

    struct Stats {
        std::atomic<size_t> functions_resolved{0};
        std::atomic<size_t> functions_skipped{0};
        std::atomic<size_t> call_sites{0};
    };
    const Stats &stats() const { return stats_; }

private:

    // State shared while walking one function body
    struct Context {
        const FunctionDescriptor &function;
        const GoParser &parser;
        const ImportTable &imports;
    };

    const Registry &registry_;
    const ImportTables &imports_;
    unsigned int num_threads_;
    std::unordered_map<std::string, std::vector<const FunctionDescriptor *>> by_file_;
    std::vector<std::string> files_;
    mutable Stats stats_;

    // Walk a subtree, recording each outermost call expression in out
    void collect_calls(TSNode node, const Context &ctx, std::vector<CallSite> &out) const;

    // Record one call expression (or, for built-ins, only the calls in its arguments)
    void add_call(TSNode call, const Context &ctx, InvocationMode mode, uint32_t line,
                  std::vector<CallSite> &out) const;

    // Scan every argument independently for calls
    void scan_arguments(TSNode arguments, const Context &ctx, std::vector<CallSite> &out) const;

    // Classify the callee expression of a call
    CallTarget classify(TSNode callee, const Context &ctx) const;

    // Mark every function of a file as skipped
    void skip_file(const std::string &file, const std::string &reason, Resolution &out) const;

    // Worker function for thread pool
    void resolve_files(size_t start_idx, size_t end_idx, std::vector<Resolution> &slots,
                       std::exception_ptr &failure) const;
};

// Resolve all call sites of an indexed project
Resolution resolve_calls(const Registry &registry, const ImportTables &imports,
                         unsigned int num_threads = 0);

// True for predeclared functions and conversions that are not recorded as calls
bool is_builtin(const std::string &name);

// Internal functions a call-site tree reaches, in first-call order without repeats
std::vector<const FunctionDescriptor *> internal_callees(const std::vector<CallSite> &sites);

// External references of a call-site tree, in first-call order without repeats
std::vector<ExternalCall> external_references(const std::vector<CallSite> &sites);

} // namespace callscope
