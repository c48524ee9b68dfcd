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
#include <cstdint>
#include <filesystem>
#include <istream>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace callscope {

// One executed-or-not span of a coverage profile
struct CoverageBlock {
    uint32_t start_line = 0;
    uint32_t start_col = 0;
    uint32_t end_line = 0;
    uint32_t end_col = 0;
    uint64_t count = 0;

    bool overlaps(uint32_t first, uint32_t last) const {
        return start_line <= last && end_line >= first;
    }
};

// Parsed `go test -coverprofile` output
class CoverageProfile {
public:

    // Read a profile from disk. Throws CoverageProfileOpenError.
    static CoverageProfile load(const std::string &path);

    // Read a profile from a stream; malformed lines are skipped and counted
    static CoverageProfile parse(std::istream &in);

    // Add one data line. False if the line is malformed.
    bool add_line(const std::string &line);

    // Blocks recorded for a profile file name, nullptr if the file never appears
    const std::vector<CoverageBlock> *blocks_for(const std::string &file) const;

    const std::string &mode() const { return mode_; }
    size_t num_files() const { return blocks_.size(); }
    size_t num_blocks() const { return num_blocks_; }
    size_t malformed_lines() const { return malformed_lines_; }

private:

    std::string mode_;
    std::unordered_map<std::string, std::vector<CoverageBlock>> blocks_;
    size_t num_blocks_ = 0;
    size_t malformed_lines_ = 0;
};

struct CoverageResult {
    const FunctionDescriptor *function = nullptr;
    bool covered = false;
    size_t executed_blocks = 0; // Blocks with a hit count overlapping the function's span
};

// Classify every function in the registry, in registry order
std::vector<CoverageResult> analyze_coverage(const CoverageProfile &profile,
                                             const Registry &registry,
                                             const std::filesystem::path &module_root);

std::set<std::string> untested_identities(const std::vector<CoverageResult> &results);

// Load a profile and return the identities of untested functions
std::set<std::string> find_untested(const std::string &profile_path, const Registry &registry,
                                    const std::filesystem::path &module_root);

} // namespace callscope
