#include "callscope/manifest.hpp"
#include "callscope/errors.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace callscope {

namespace fs = std::filesystem;

std::string parse_module_path(const std::string &manifest_text) {
    std::istringstream in(manifest_text);
    std::string line;
    while (std::getline(in, line)) {
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line.compare(start, 7, "module ") != 0) continue;

        std::string rest = line.substr(start + 7);
        size_t comment = rest.find("//");
        if (comment != std::string::npos) {
            rest = rest.substr(0, comment);
        }

        std::istringstream fields(rest);
        std::string path;
        fields >> path;
        if (path.size() >= 2 && (path.front() == '"' || path.front() == '`')) {
            path = path.substr(1, path.size() - 2);
        }
        if (!path.empty()) {
            return path;
        }
    }
    return "";
}

ModuleInfo find_module(const fs::path &dir) {
    std::error_code ec;
    fs::path current = fs::absolute(dir, ec);
    if (ec) {
        throw ManifestNotFound("cannot resolve directory " + dir.string() + ": " + ec.message());
    }
    current = current.lexically_normal();

    while (true) {
        fs::path manifest = current / MANIFEST_FILE;
        if (fs::is_regular_file(manifest, ec)) {
            std::ifstream file(manifest);
            if (!file.is_open()) {
                throw ManifestNotFound("failed to read " + manifest.string());
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            std::string module_path = parse_module_path(buffer.str());
            if (module_path.empty()) {
                throw ManifestNotFound("module path not found in " + manifest.string());
            }
            spdlog::debug("Module {} declared in {}", module_path, manifest.string());
            return ModuleInfo{module_path, current};
        }

        fs::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            break;
        }
        current = parent;
    }

    throw ManifestNotFound(std::string(MANIFEST_FILE) + " not found in " + dir.string() +
                           " or any parent directory");
}

} // namespace callscope
