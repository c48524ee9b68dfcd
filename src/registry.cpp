#include "callscope/registry.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace callscope {

const FunctionDescriptor *Registry::find(const std::string &identity) const {
    auto it = by_identity_.find(identity);
    return (it != by_identity_.end()) ? it->second : nullptr;
}

const FunctionDescriptor *Registry::find(const std::string &scope, const std::string &receiver,
                                         const std::string &name) const {
    auto it = by_scope_.find(make_identity(scope, receiver, name));
    return (it != by_scope_.end()) ? it->second : nullptr;
}

RegistryBuilder::RegistryBuilder(std::string module_path) {
    registry_.module_path_ = std::move(module_path);
}

bool RegistryBuilder::add(FunctionDescriptor function) {
    std::string key = make_identity(function.scope(), function.receiver, function.name);

    auto existing = registry_.by_scope_.find(key);
    if (existing != registry_.by_scope_.end()) {
        ++collisions_;
        const FunctionDescriptor &first = *existing->second;
        if (function.name == "init" && !function.is_method()) {
            // Several init functions per package are legal
            spdlog::debug("Skipping additional init in {}:{}", function.file, function.start_line);
        } else {
            spdlog::warn("Duplicate function {} at {}:{} (first declared at {}:{}), skipping", key,
                         function.file, function.start_line, first.file, first.start_line);
        }
        return false;
    }

    auto owned = std::make_unique<FunctionDescriptor>(std::move(function));
    registry_.by_scope_.emplace(std::move(key), owned.get());
    registry_.functions_.push_back(std::move(owned));
    return true;
}

bool RegistryBuilder::contains(const std::string &scope, const std::string &receiver,
                               const std::string &name) const {
    return registry_.by_scope_.count(make_identity(scope, receiver, name)) > 0;
}

Registry RegistryBuilder::freeze() && {
    auto &functions = registry_.functions_;
    std::stable_sort(functions.begin(), functions.end(), [](const auto &a, const auto &b) {
        if (a->file != b->file) return a->file < b->file;
        return a->start_line < b->start_line;
    });

    // cmd/a and cmd/b both declare "main": such packages are named by import path instead
    std::unordered_map<std::string, std::set<std::string>> scopes_by_name;
    for (const auto &fn : functions) {
        scopes_by_name[fn->package].insert(fn->scope());
    }

    std::vector<FunctionDescriptor *> plain;
    for (auto &fn : functions) {
        fn->qualifier.clear();
        if (scopes_by_name[fn->package].size() > 1) {
            fn->qualifier = fn->scope();
        } else {
            plain.push_back(fn.get());
        }
    }
    for (const auto &[name, scopes] : scopes_by_name) {
        if (scopes.size() > 1) {
            spdlog::debug("Package name {} is declared in {} directories, using import paths",
                          name, scopes.size());
        }
    }

    auto &by_identity = registry_.by_identity_;
    by_identity.clear();
    for (const auto &fn : functions) {
        if (!fn->qualifier.empty()) {
            by_identity.emplace(fn->identity(), fn.get());
        }
    }
    for (auto *fn : plain) {
        // A short name can still equal another package's import-path identity
        if (!by_identity.emplace(fn->identity(), fn).second) {
            fn->qualifier = fn->scope();
            by_identity.emplace(fn->identity(), fn);
        }
    }

    return std::move(registry_);
}

} // namespace callscope
