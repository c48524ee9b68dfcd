#include "callscope/indexer.hpp"
#include "callscope/errors.hpp"
#include "callscope/manifest.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>

namespace callscope {

namespace {

constexpr const char *SOURCE_EXTENSION = ".go";
constexpr const char *TEST_SUFFIX = "_test.go";

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string package_import_path(const std::string &module_path, const fs::path &module_root,
                                const fs::path &dir) {
    std::error_code ec;
    fs::path rel = fs::relative(fs::absolute(dir, ec), module_root, ec);
    if (ec || rel.empty() || rel == ".") {
        return module_path;
    }

    std::string rel_str = rel.generic_string();
    if (rel_str.rfind("..", 0) == 0) {
        // Outside the module root; nothing sensible to join
        return module_path;
    }
    return module_path + "/" + rel_str;
}

Indexer::Indexer(const IndexerConfig &config) : config_(config) {
    // Auto-detect thread count if not specified
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }
}

bool Indexer::should_ignore(const fs::path &path, bool is_directory) const {
    std::string name = path.filename().string();
    if (name.empty()) return false;

    // Hidden entries, and "_"-prefixed directories like the go tool
    if (name[0] == '.' && name != "." && name != "..") return true;

    if (is_directory) {
        if (name[0] == '_') return true;
        if (name == config_.vendor_dir) return true;
        return std::find(config_.ignore_patterns.begin(), config_.ignore_patterns.end(), name) !=
               config_.ignore_patterns.end();
    }

    if (!ends_with(name, SOURCE_EXTENSION)) return true;
    if (!config_.include_tests && ends_with(name, TEST_SUFFIX)) return true;
    return false;
}

std::vector<fs::path> Indexer::discover_files(const fs::path &root) {
    std::vector<fs::path> files;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IndexError("not a readable directory: " + root.string());
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        fs::directory_iterator it(current_dir, ec);
        if (ec) {
            if (current_dir == root) {
                throw IndexError("cannot list " + root.string() + ": " + ec.message());
            }
            spdlog::warn("Error accessing path {}: {}", current_dir.string(), ec.message());
            continue;
        }

        for (const auto &entry : it) {
            const fs::path &path = entry.path();
            bool is_dir = entry.is_directory(ec);
            if (ec) {
                spdlog::warn("Error accessing path {}: {}", path.string(), ec.message());
                continue;
            }

            if (should_ignore(path, is_dir))
                continue;

            if (is_dir) {
                dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(ec)) {
                files.push_back(path);
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

FileIndex Indexer::index_source(const std::string &file, const std::string &source,
                                const std::string &package_path) {
    GoParser parser;
    if (!parser.parse(source)) {
        throw FileParseError(file, "parser produced no syntax tree");
    }
    if (parser.has_errors()) {
        throw FileParseError(file, "syntax error near line " +
                                       std::to_string(parser.first_error_line()));
    }

    FileIndex result;
    result.file = file;
    result.package = parser.package_name();
    if (result.package.empty()) {
        throw FileParseError(file, "missing package clause");
    }
    result.package_path = package_path;
    result.imports = build_import_table(parser);

    for (auto &def : parser.extract_functions()) {
        FunctionDescriptor fn;
        fn.package = result.package;
        fn.package_path = package_path;
        fn.receiver = std::move(def.receiver);
        fn.name = std::move(def.name);
        fn.file = file;
        fn.start_line = def.start_line;
        fn.end_line = def.end_line;
        fn.params = std::move(def.params);
        fn.returns = std::move(def.returns);
        fn.has_body = def.has_body;
        result.functions.push_back(std::move(fn));
    }

    return result;
}

void Indexer::worker_parse_files(const std::vector<fs::path> &files, size_t start_idx,
                                 size_t end_idx, const std::string &module_path,
                                 const fs::path &module_root, std::vector<FileSlot> &slots) {
    for (size_t i = start_idx; i < end_idx; ++i) {
        const auto &filepath = files[i];
        FileSlot &slot = slots[i];

        try {
            std::string source;
            if (!load_source(filepath.string(), source)) {
                throw FileParseError(filepath.string(), "cannot read file");
            }

            std::string package_path =
                package_import_path(module_path, module_root, filepath.parent_path());
            slot.index = index_source(filepath.string(), source, package_path);

            stats_.files_indexed++;
            stats_.functions_found += slot.index->functions.size();
            spdlog::debug("Parsed: {}", filepath.string());
        } catch (const FileParseError &e) {
            slot.error = e.what();
            stats_.files_skipped++;
        } catch (...) {
            // Not a per-file problem; rethrown on the calling thread after join
            slot.failure = std::current_exception();
        }

        if (config_.progress_callback) {
            config_.progress_callback(filepath.string(), i + 1, files.size());
        }
    }
}

IndexResult Indexer::index() {
    auto started = std::chrono::steady_clock::now();

    fs::path root(config_.root_path);

    // Phase 1: Discover files and the module they belong to
    auto files = discover_files(root);
    ModuleInfo module = find_module(root);

    IndexResult result;
    result.module_path = module.path;
    result.module_root = module.root;

    if (files.empty()) {
        spdlog::warn("No Go source files found under {}", root.string());
        result.registry = RegistryBuilder(module.path).freeze();
        return result;
    }

    spdlog::info("Found {} source files in module {}", files.size(), module.path);
    spdlog::debug("Using {} threads", config_.num_threads);

    // Phase 2: Parallel parsing, one slot per file
    std::vector<FileSlot> slots(files.size());

    std::vector<std::thread> threads;
    size_t files_per_thread = (files.size() + config_.num_threads - 1) / config_.num_threads;

    for (unsigned int t = 0; t < config_.num_threads; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files.size());

        if (start_idx >= files.size())
            break;

        threads.emplace_back(&Indexer::worker_parse_files, this, std::cref(files), start_idx,
                             end_idx, std::cref(module.path), std::cref(module.root),
                             std::ref(slots));
    }

    for (auto &t : threads) {
        t.join();
    }

    for (const auto &slot : slots) {
        if (slot.failure) {
            std::rethrow_exception(slot.failure);
        }
    }

    // Phase 3: Fan-in merge in file order, so first-seen is deterministic
    RegistryBuilder builder(module.path);
    for (size_t i = 0; i < files.size(); ++i) {
        FileSlot &slot = slots[i];
        if (!slot.index) {
            spdlog::warn("Skipping file: {}", slot.error);
            result.skipped_files.push_back(files[i].string());
            continue;
        }

        FileIndex &file_index = *slot.index;
        for (auto &fn : file_index.functions) {
            builder.add(std::move(fn));
        }
        result.imports.emplace(file_index.file, std::move(file_index.imports));
        result.files.push_back(file_index.file);
    }

    stats_.duplicates = builder.collisions();
    result.registry = std::move(builder).freeze();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Indexed {} functions from {} files ({} skipped) in {} ms",
                 result.registry.size(), result.files.size(), result.skipped_files.size(),
                 elapsed.count());

    return result;
}

} // namespace callscope
