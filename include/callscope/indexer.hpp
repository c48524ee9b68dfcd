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
#include "registry.hpp"
#include <atomic>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace callscope {

namespace fs = std::filesystem;

// Callback for progress reporting, invoked from worker threads
using IndexProgressCallback =
    std::function<void(const std::string &file, size_t current, size_t total)>;

// Indexer configuration
struct IndexerConfig {
    std::string root_path = ".";
    std::string vendor_dir = "vendor";
    bool include_tests = false; // Index _test.go files too
    IndexProgressCallback progress_callback = nullptr;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // Directory names never descended into (hidden and "_" directories are always skipped)
    std::vector<std::string> ignore_patterns = {".git", "testdata", "node_modules"};
};

// Everything extracted from a single source file
struct FileIndex {
    std::string file;
    std::string package;
    std::string package_path;
    ImportTable imports;
    std::vector<FunctionDescriptor> functions;
};

// Output of the indexing phase
struct IndexResult {
    Registry registry;
    std::string module_path;
    fs::path module_root;
    ImportTables imports;                   // Per indexed file
    std::vector<std::string> files;         // Indexed successfully, sorted
    std::vector<std::string> skipped_files; // Unreadable or unparsable
};

// Import path of the package living in dir, given the module it belongs to
std::string package_import_path(const std::string &module_path, const fs::path &module_root,
                                const fs::path &dir);

class Indexer {
public:

    explicit Indexer(const IndexerConfig &config = IndexerConfig{});

    // Index the tree under config.root_path.
    // Throws IndexError if the root cannot be read, ManifestNotFound if no go.mod exists.
    IndexResult index();

    // Index one in-memory source file. Throws FileParseError.
    static FileIndex index_source(const std::string &file, const std::string &source,
                                  const std::string &package_path);

    // Get statistics
    struct Stats {
        std::atomic<size_t> files_indexed{0};
        std::atomic<size_t> files_skipped{0};
        std::atomic<size_t> functions_found{0};
        std::atomic<size_t> duplicates{0};
    };
    const Stats &stats() const { return stats_; }

private:

    // Result slot of one file, filled by exactly one worker
    struct FileSlot {
        std::optional<FileIndex> index;
        std::string error;
        std::exception_ptr failure;
    };

    IndexerConfig config_;
    Stats stats_;

    // Discover all Go source files below root
    std::vector<fs::path> discover_files(const fs::path &root);

    // Check if a directory entry should be skipped
    bool should_ignore(const fs::path &path, bool is_directory) const;

    // Worker function for thread pool
    void worker_parse_files(const std::vector<fs::path> &files, size_t start_idx, size_t end_idx,
                            const std::string &module_path, const fs::path &module_root,
                            std::vector<FileSlot> &slots);
};

} // namespace callscope
