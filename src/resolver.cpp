#include "callscope/resolver.hpp"
#include "callscope/errors.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>
#include <type_traits>
#include <unordered_set>

namespace callscope {

namespace {

// Predeclared functions, and predeclared types whose conversions look like calls
const std::unordered_set<std::string> BUILTINS = {
    "append", "cap",     "clear",     "close",      "complex", "copy",    "delete",  "imag",
    "len",    "make",    "max",       "min",        "new",     "panic",   "print",   "println",
    "real",   "recover", "bool",      "byte",       "complex64", "complex128", "error",
    "float32", "float64", "int",      "int8",       "int16",   "int32",   "int64",   "rune",
    "string", "uint",    "uint8",     "uint16",     "uint32",  "uint64",  "uintptr", "any"};

bool is_comment(TSNode node) { return node_is(node, "comment"); }

// First named child that is not a comment
TSNode first_expression(TSNode node) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!is_comment(child)) return child;
    }
    return TSNode{};
}

// (f) -> f, ((f)) -> f
TSNode unwrap_parens(TSNode node) {
    while (node_is(node, "parenthesized_expression")) {
        TSNode inner = first_expression(node);
        if (ts_node_is_null(inner)) break;
        node = inner;
    }
    return node;
}

void collect_callees(const std::vector<CallSite> &sites,
                     std::vector<const FunctionDescriptor *> &out,
                     std::unordered_set<const FunctionDescriptor *> &seen) {
    for (const auto &site : sites) {
        const FunctionDescriptor *fn = nullptr;
        if (auto local = std::get_if<LocalCall>(&site.target)) {
            fn = local->function;
        } else if (auto cross = std::get_if<CrossModuleCall>(&site.target)) {
            fn = cross->function;
        }
        if (fn && seen.insert(fn).second) {
            out.push_back(fn);
        }
        collect_callees(site.nested, out, seen);
    }
}

void collect_externals(const std::vector<CallSite> &sites, std::vector<ExternalCall> &out,
                       std::unordered_set<std::string> &seen) {
    for (const auto &site : sites) {
        if (auto ext = std::get_if<ExternalCall>(&site.target)) {
            if (seen.insert(ext->import_path + "\n" + ext->name).second) {
                out.push_back(*ext);
            }
        }
        collect_externals(site.nested, out, seen);
    }
}

size_t count_sites(const std::vector<CallSite> &sites) {
    size_t total = sites.size();
    for (const auto &site : sites) {
        total += count_sites(site.nested);
    }
    return total;
}

} // namespace

bool is_builtin(const std::string &name) { return BUILTINS.count(name) > 0; }

std::vector<const FunctionDescriptor *> internal_callees(const std::vector<CallSite> &sites) {
    std::vector<const FunctionDescriptor *> result;
    std::unordered_set<const FunctionDescriptor *> seen;
    collect_callees(sites, result, seen);
    return result;
}

std::vector<ExternalCall> external_references(const std::vector<CallSite> &sites) {
    std::vector<ExternalCall> result;
    std::unordered_set<std::string> seen;
    collect_externals(sites, result, seen);
    return result;
}

CallResolver::CallResolver(const Registry &registry, const ImportTables &imports,
                           unsigned int num_threads)
    : registry_(registry), imports_(imports), num_threads_(num_threads) {
    if (num_threads_ == 0) {
        num_threads_ = std::thread::hardware_concurrency();
        if (num_threads_ == 0)
            num_threads_ = 4;
    }

    for (const auto &fn : registry_.functions()) {
        auto &list = by_file_[fn->file];
        if (list.empty()) {
            files_.push_back(fn->file);
        }
        list.push_back(fn.get());
    }
    std::sort(files_.begin(), files_.end());
}

CallTarget CallResolver::classify(TSNode callee, const Context &ctx) const {
    const GoParser &parser = ctx.parser;

    // Bare identifier: a function of the caller's own package, or unknown
    if (node_is(callee, "identifier")) {
        std::string name = parser.node_text(callee);
        if (const auto *fn = registry_.find(ctx.function.scope(), "", name)) {
            return LocalCall{fn};
        }
        return ExternalCall{name, "", "", ExternalOrigin::Unknown};
    }

    // X.Y: package-qualified when X is an import alias, otherwise a method call
    if (node_is(callee, "selector_expression")) {
        TSNode operand = child_by_field(callee, "operand");
        std::string field = parser.node_text(child_by_field(callee, "field"));

        if (node_is(operand, "identifier")) {
            std::string alias = parser.node_text(operand);
            if (const std::string *path = ctx.imports.find(alias)) {
                if (!is_module_import(*path, registry_.module_path())) {
                    return ExternalCall{field, alias, *path, ExternalOrigin::Import};
                }

                // Project packages are keyed by the import path of their directory
                if (const auto *fn = registry_.find(*path, "", field)) {
                    return CrossModuleCall{fn, *path};
                }
                spdlog::debug("Unresolved module call {}.{} in {}", *path, field,
                              ctx.function.identity());
                return ExternalCall{field, alias, *path, ExternalOrigin::Missing};
            }
        }

        return MethodCall{parser.node_text(operand), field};
    }

    if (node_is(callee, "func_literal")) {
        return LiteralInvocation{};
    }

    // Index expressions, calls returning functions, instantiations...
    return ExternalCall{parser.node_text(callee), "", "", ExternalOrigin::Unknown};
}

void CallResolver::scan_arguments(TSNode arguments, const Context &ctx,
                                  std::vector<CallSite> &out) const {
    if (ts_node_is_null(arguments)) return;

    uint32_t count = ts_node_named_child_count(arguments);
    for (uint32_t i = 0; i < count; ++i) {
        collect_calls(ts_node_named_child(arguments, i), ctx, out);
    }
}

void CallResolver::add_call(TSNode call, const Context &ctx, InvocationMode mode, uint32_t line,
                            std::vector<CallSite> &out) const {
    TSNode callee = unwrap_parens(child_by_field(call, "function"));
    TSNode arguments = child_by_field(call, "arguments");

    if (node_is(callee, "identifier")) {
        std::string name = ctx.parser.node_text(callee);
        // A package-level func min or max shadows the predeclared one
        if (is_builtin(name) && !registry_.find(ctx.function.scope(), "", name)) {
            // len(f(x)): nothing recorded for len, f still is
            scan_arguments(arguments, ctx, out);
            return;
        }
    }

    CallSite site;
    site.target = classify(callee, ctx);
    site.line = line;
    site.mode = mode;
    site.expression = ctx.parser.node_text(call);

    if (!ts_node_is_null(arguments)) {
        uint32_t count = ts_node_named_child_count(arguments);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode arg = ts_node_named_child(arguments, i);
            if (!is_comment(arg)) {
                site.arguments.push_back(ctx.parser.node_text(arg));
            }
        }
    }

    // The literal's own body belongs to this site; the callee is never re-scanned otherwise
    if (std::holds_alternative<LiteralInvocation>(site.target)) {
        collect_calls(child_by_field(callee, "body"), ctx, site.nested);
    }
    scan_arguments(arguments, ctx, site.nested);

    out.push_back(std::move(site));
}

void CallResolver::collect_calls(TSNode node, const Context &ctx,
                                 std::vector<CallSite> &out) const {
    if (ts_node_is_null(node) || is_comment(node)) return;

    if (node_is(node, "call_expression")) {
        add_call(node, ctx, InvocationMode::Direct, start_line_of(node), out);
        return;
    }

    bool deferred = node_is(node, "defer_statement");
    if (deferred || node_is(node, "go_statement")) {
        TSNode call = unwrap_parens(first_expression(node));
        if (node_is(call, "call_expression")) {
            add_call(call, ctx, deferred ? InvocationMode::Deferred : InvocationMode::Goroutine,
                     start_line_of(node), out);
            return;
        }
    }

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collect_calls(ts_node_named_child(node, i), ctx, out);
    }
}

std::vector<CallSite> CallResolver::resolve_function(const FunctionDescriptor &fn,
                                                     const GoParser &parser, TSNode declaration,
                                                     const ImportTable &imports) const {
    std::vector<CallSite> sites;
    Context ctx{fn, parser, imports};
    collect_calls(child_by_field(declaration, "body"), ctx, sites);
    return sites;
}

void CallResolver::skip_file(const std::string &file, const std::string &reason,
                             Resolution &out) const {
    auto it = by_file_.find(file);
    if (it == by_file_.end()) return;

    for (const FunctionDescriptor *fn : it->second) {
        FunctionReparseError error(fn->identity(), reason);
        spdlog::warn("{}", error.what());
        stats_.functions_skipped++;
        out[error.identity()] = {};
    }
}

void CallResolver::resolve_source(const std::string &file, const std::string &source,
                                  Resolution &out) const {
    auto it = by_file_.find(file);
    if (it == by_file_.end()) return;

    GoParser parser;
    if (!parser.parse(source)) {
        skip_file(file, "parser produced no syntax tree", out);
        return;
    }
    if (parser.has_errors()) {
        skip_file(file, "syntax error near line " + std::to_string(parser.first_error_line()),
                  out);
        return;
    }

    ImportTable local_imports;
    const ImportTable *imports = nullptr;
    auto imp = imports_.find(file);
    if (imp != imports_.end()) {
        imports = &imp->second;
    } else {
        local_imports = build_import_table(parser);
        imports = &local_imports;
    }

    auto defs = parser.extract_functions();

    for (const FunctionDescriptor *fn : it->second) {
        std::string identity = fn->identity();
        try {
            auto def = std::find_if(defs.begin(), defs.end(), [&](const FunctionDef &d) {
                return d.name == fn->name && d.receiver == fn->receiver &&
                       d.start_line == fn->start_line;
            });
            if (def == defs.end()) {
                throw FunctionReparseError(identity, "declaration not found in " + file +
                                                         " at line " +
                                                         std::to_string(fn->start_line));
            }

            auto sites = resolve_function(*fn, parser, def->node, *imports);
            stats_.call_sites += count_sites(sites);
            stats_.functions_resolved++;
            out[identity] = std::move(sites);
        } catch (const FunctionReparseError &e) {
            spdlog::warn("{}", e.what());
            stats_.functions_skipped++;
            out[identity] = {};
        }
    }
}

void CallResolver::resolve_files(size_t start_idx, size_t end_idx, std::vector<Resolution> &slots,
                                 std::exception_ptr &failure) const {
    try {
        for (size_t i = start_idx; i < end_idx; ++i) {
            const std::string &file = files_[i];

            std::string source;
            if (!load_source(file, source)) {
                skip_file(file, "cannot re-read " + file, slots[i]);
                continue;
            }
            resolve_source(file, source, slots[i]);
        }
    } catch (...) {
        failure = std::current_exception();
    }
}

Resolution CallResolver::resolve_all() {
    auto started = std::chrono::steady_clock::now();
    std::vector<Resolution> slots(files_.size());
    std::vector<std::exception_ptr> failures(num_threads_);

    // Registry and import tables are read-only from here on, so workers need no locks
    std::vector<std::thread> threads;
    size_t files_per_thread = (files_.size() + num_threads_ - 1) / num_threads_;

    for (unsigned int t = 0; t < num_threads_; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files_.size());

        if (start_idx >= files_.size())
            break;

        threads.emplace_back(&CallResolver::resolve_files, this, start_idx, end_idx,
                             std::ref(slots), std::ref(failures[t]));
    }

    for (auto &t : threads) {
        t.join();
    }

    for (const auto &failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    Resolution resolution;
    resolution.reserve(registry_.size());
    for (auto &slot : slots) {
        for (auto &[identity, sites] : slot) {
            resolution.emplace(identity, std::move(sites));
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Resolved {} call sites in {} functions ({} skipped) in {} ms",
                 stats_.call_sites.load(), stats_.functions_resolved.load(),
                 stats_.functions_skipped.load(), elapsed.count());

    return resolution;
}

Resolution resolve_calls(const Registry &registry, const ImportTables &imports,
                         unsigned int num_threads) {
    CallResolver resolver(registry, imports, num_threads);
    return resolver.resolve_all();
}

} // namespace callscope
