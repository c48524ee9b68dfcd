#include "callscope/coverage.hpp"
#include "callscope/errors.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace callscope {

namespace fs = std::filesystem;

namespace {

template <typename T> bool parse_number(const std::string &text, T &out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

// "12.3" -> line 12, column 3
bool parse_position(const std::string &text, uint32_t &line, uint32_t &col) {
    size_t dot = text.find('.');
    if (dot == std::string::npos) return false;
    return parse_number(text.substr(0, dot), line) && parse_number(text.substr(dot + 1), col);
}

// Names a descriptor's file may carry in a profile
std::vector<std::string> profile_names(const FunctionDescriptor &fn, const std::string &module_path,
                                       const fs::path &module_root) {
    std::vector<std::string> names;

    std::error_code ec;
    fs::path rel = fs::relative(fn.file, module_root, ec);
    if (!ec && !rel.empty() && rel.generic_string().rfind("..", 0) != 0) {
        names.push_back(module_path + "/" + rel.generic_string());
    }
    names.push_back(fn.file);

    fs::path absolute = fs::absolute(fn.file, ec);
    if (!ec) {
        names.push_back(absolute.lexically_normal().generic_string());
    }
    return names;
}

} // namespace

CoverageProfile CoverageProfile::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CoverageProfileOpenError(path);
    }

    CoverageProfile profile = parse(file);
    spdlog::debug("Loaded {} coverage blocks for {} files from {}", profile.num_blocks(),
                  profile.num_files(), path);
    if (profile.malformed_lines() > 0) {
        spdlog::warn("Skipped {} malformed lines in {}", profile.malformed_lines(), path);
    }
    return profile;
}

CoverageProfile CoverageProfile::parse(std::istream &in) {
    CoverageProfile profile;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        if (line.rfind("mode:", 0) == 0) {
            std::istringstream fields(line.substr(5));
            fields >> profile.mode_;
            continue;
        }

        if (!profile.add_line(line)) {
            spdlog::debug("Malformed coverage line {}: {}", line_number, line);
            profile.malformed_lines_++;
        }
    }

    return profile;
}

bool CoverageProfile::add_line(const std::string &line) {
    // file:startLine.startCol,endLine.endCol [numStmts] count
    std::istringstream fields(line);
    std::string location;
    std::vector<std::string> numbers;
    fields >> location;
    for (std::string field; fields >> field;) {
        numbers.push_back(field);
    }
    if (numbers.empty() || numbers.size() > 2) return false;

    size_t colon = location.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string file = location.substr(0, colon);
    std::string range = location.substr(colon + 1);

    size_t comma = range.find(',');
    if (comma == std::string::npos) return false;

    CoverageBlock block;
    if (!parse_position(range.substr(0, comma), block.start_line, block.start_col) ||
        !parse_position(range.substr(comma + 1), block.end_line, block.end_col)) {
        return false;
    }

    if (numbers.size() == 2) {
        uint32_t statements = 0;
        if (!parse_number(numbers[0], statements)) return false;
    }
    if (!parse_number(numbers.back(), block.count)) return false;

    blocks_[file].push_back(block);
    num_blocks_++;
    return true;
}

const std::vector<CoverageBlock> *CoverageProfile::blocks_for(const std::string &file) const {
    auto it = blocks_.find(file);
    return it != blocks_.end() ? &it->second : nullptr;
}

std::vector<CoverageResult> analyze_coverage(const CoverageProfile &profile,
                                             const Registry &registry,
                                             const fs::path &module_root) {
    std::vector<CoverageResult> results;
    results.reserve(registry.size());

    // Files are shared by many functions; look each one up once
    std::unordered_map<std::string, const std::vector<CoverageBlock> *> file_blocks;

    for (const auto &fn : registry.functions()) {
        auto cached = file_blocks.find(fn->file);
        if (cached == file_blocks.end()) {
            const std::vector<CoverageBlock> *blocks = nullptr;
            for (const auto &name : profile_names(*fn, registry.module_path(), module_root)) {
                blocks = profile.blocks_for(name);
                if (blocks) break;
            }
            if (!blocks) {
                spdlog::debug("No coverage entries for {}", fn->file);
            }
            cached = file_blocks.emplace(fn->file, blocks).first;
        }

        CoverageResult result;
        result.function = fn.get();

        // Declarations without a body never execute
        if (cached->second && fn->has_body) {
            for (const auto &block : *cached->second) {
                if (block.count > 0 && block.overlaps(fn->start_line, fn->end_line)) {
                    result.executed_blocks++;
                }
            }
        }
        result.covered = result.executed_blocks > 0;
        results.push_back(result);
    }

    return results;
}

std::set<std::string> untested_identities(const std::vector<CoverageResult> &results) {
    std::set<std::string> untested;
    for (const auto &result : results) {
        if (!result.covered) {
            untested.insert(result.function->identity());
        }
    }
    return untested;
}

std::set<std::string> find_untested(const std::string &profile_path, const Registry &registry,
                                    const fs::path &module_root) {
    CoverageProfile profile = CoverageProfile::load(profile_path);
    return untested_identities(analyze_coverage(profile, registry, module_root));
}

} // namespace callscope
