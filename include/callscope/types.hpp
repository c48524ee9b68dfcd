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

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace callscope {

// ============================================================================
// String Pool - Intern strings, index doubles as a dense handle
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    uint32_t intern(const std::string &str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        auto idx = static_cast<uint32_t>(strings_.size());
        strings_.push_back(str);
        index_.emplace(strings_.back(), idx);
        return idx;
    }

    const std::string &get(uint32_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns UINT32_MAX if not found)
    uint32_t find(const std::string &str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : UINT32_MAX;
    }

    size_t size() const { return strings_.size(); }

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, uint32_t> index_;
};

// ============================================================================
// Function descriptors
// ============================================================================

struct Parameter {
    std::string name; // Empty for unnamed parameters
    std::string type; // Type as written, "...T" for variadics

    bool operator==(const Parameter &other) const {
        return name == other.name && type == other.type;
    }
};

// Build the canonical identity of a function or method:
// "pkg/Receiver.Name" for methods, "pkg.Name" for free functions.
// pkg is the package name, or the package import path when that name is not unique in the module.
std::string make_identity(const std::string &package, const std::string &receiver,
                          const std::string &name);

// One declared function or method
struct FunctionDescriptor {
    std::string package;      // Declared package name
    std::string package_path; // Import path of the declaring directory
    std::string receiver;     // Receiver type with pointer marker stripped, empty for functions
    std::string name;

    std::string file;
    uint32_t start_line = 0;
    uint32_t end_line = 0;

    std::vector<Parameter> params;
    std::vector<std::string> returns;
    bool has_body = true;

    // Set by the registry to package_path when several directories declare the same package name
    std::string qualifier;

    std::string identity() const {
        return make_identity(qualifier.empty() ? package : qualifier, receiver, name);
    }

    // Directory-unique package key: the import path, or the name when no path is known
    const std::string &scope() const { return package_path.empty() ? package : package_path; }

    bool is_method() const { return !receiver.empty(); }
};

// ============================================================================
// Call sites
// ============================================================================

// Call of a function declared in the caller's own package
struct LocalCall {
    const FunctionDescriptor *function = nullptr;
};

// Call of a function in another package of the same module
struct CrossModuleCall {
    const FunctionDescriptor *function = nullptr;
    std::string import_path;
};

// Call through a value; the receiver is kept as opaque text
struct MethodCall {
    std::string receiver;
    std::string method;
};

enum class ExternalOrigin {
    Unknown, // Bare name not found in the registry, or an uncallable-looking target
    Import,  // Package-qualified call into a package outside the module
    Missing  // Package-qualified call into the module that the registry does not know
};

struct ExternalCall {
    std::string name;
    std::string alias;       // Import alias as written, empty for bare calls
    std::string import_path; // Empty when origin is Unknown
    ExternalOrigin origin = ExternalOrigin::Unknown;
};

// Immediately invoked func literal: func() { ... }()
struct LiteralInvocation {};

using CallTarget =
    std::variant<LocalCall, CrossModuleCall, MethodCall, ExternalCall, LiteralInvocation>;

enum class InvocationMode { Direct, Deferred, Goroutine };

struct CallSite {
    CallTarget target;
    uint32_t line = 0;
    std::string expression;             // Full text of the call expression
    std::vector<std::string> arguments; // Argument texts in order
    std::vector<CallSite> nested;       // Calls found inside the arguments (or literal body)
    InvocationMode mode = InvocationMode::Direct;
};

// Short kind name of a call target ("local", "cross-module", "method", "external", "literal")
const char *call_kind_to_string(const CallTarget &target);

const char *external_origin_to_string(ExternalOrigin origin);

const char *invocation_mode_to_string(InvocationMode mode);

// Human readable callee name, e.g. "main.Run", "w.Start", "fmt.Println", "func"
std::string call_target_name(const CallTarget &target);

} // namespace callscope
