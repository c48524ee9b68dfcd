#include "callscope/imports.hpp"

namespace callscope {

std::string default_import_alias(const std::string &path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

bool is_standard_import(const std::string &path) {
    std::string first = path.substr(0, path.find('/'));
    return !first.empty() && first.find('.') == std::string::npos;
}

bool is_module_import(const std::string &path, const std::string &module_path) {
    if (module_path.empty()) return false;
    if (path == module_path) return true;
    return path.size() > module_path.size() && path.compare(0, module_path.size(), module_path) == 0 &&
           path[module_path.size()] == '/';
}

void ImportTable::add(const std::string &alias, const std::string &path) {
    std::string name = alias.empty() ? default_import_alias(path) : alias;
    if (name.empty() || name == "_") {
        return;
    }
    entries_[name] = path;
}

const std::string *ImportTable::find(const std::string &alias) const {
    auto it = entries_.find(alias);
    return (it != entries_.end()) ? &it->second : nullptr;
}

ImportTable build_import_table(const std::vector<ImportSpec> &specs) {
    ImportTable table;
    for (const auto &spec : specs) {
        table.add(spec.alias, spec.path);
    }
    return table;
}

ImportTable build_import_table(const GoParser &parser) {
    return build_import_table(parser.extract_imports());
}

} // namespace callscope
