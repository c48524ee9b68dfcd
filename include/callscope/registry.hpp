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
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace callscope {

class RegistryBuilder;

// Frozen table of every indexed function, keyed by canonical identity.
// Descriptors never move once the registry exists, so call sites may point at them.
class Registry {
public:
    Registry() = default;

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;
    Registry(Registry &&) = default;
    Registry &operator=(Registry &&) = default;

    const FunctionDescriptor *find(const std::string &identity) const;

    // Lookup by package scope (import path of the declaring directory), receiver and name
    const FunctionDescriptor *find(const std::string &scope, const std::string &receiver,
                                   const std::string &name) const;

    // All descriptors in (file, line) order
    const std::vector<std::unique_ptr<FunctionDescriptor>> &functions() const { return functions_; }

    const std::string &module_path() const { return module_path_; }

    size_t size() const { return functions_.size(); }
    bool empty() const { return functions_.empty(); }

private:
    friend class RegistryBuilder;

    std::string module_path_;
    std::vector<std::unique_ptr<FunctionDescriptor>> functions_;
    std::unordered_map<std::string, const FunctionDescriptor *> by_identity_;
    std::unordered_map<std::string, const FunctionDescriptor *> by_scope_; // scope/Recv.Name
};

// Mutable registry used while indexing. freeze() ends the indexing phase.
class RegistryBuilder {
public:
    explicit RegistryBuilder(std::string module_path = "");

    // Insert a descriptor. Returns false (and keeps the first one) when its package scope
    // already declares the same receiver and name.
    bool add(FunctionDescriptor function);

    bool contains(const std::string &scope, const std::string &receiver,
                  const std::string &name) const;

    size_t size() const { return registry_.functions_.size(); }

    size_t collisions() const { return collisions_; }

    // Assign final identities and end the indexing phase
    Registry freeze() &&;

private:
    Registry registry_;
    size_t collisions_ = 0;
};

} // namespace callscope
