#include "callscope/parser.hpp"
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace callscope {

TSNode child_by_field(TSNode node, const char *field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
}

uint32_t start_line_of(TSNode node) { return ts_node_start_point(node).row + 1; }

uint32_t end_line_of(TSNode node) { return ts_node_end_point(node).row + 1; }

bool node_is(TSNode node, const char *type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

bool load_source(const std::string &path, std::string &out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::string normalize_receiver(const std::string &type_text) {
    std::string type = type_text;

    bool changed = true;
    while (changed) {
        changed = false;
        size_t start = type.find_first_not_of(" \t\n");
        size_t end = type.find_last_not_of(" \t\n");
        if (start == std::string::npos) {
            return "";
        }
        type = type.substr(start, end - start + 1);

        if (type.size() >= 2 && type.front() == '(' && type.back() == ')') {
            type = type.substr(1, type.size() - 2);
            changed = true;
        } else if (!type.empty() && type.front() == '*') {
            type.erase(0, 1);
            changed = true;
        }
    }

    // Generic receivers: List[T] -> List
    size_t bracket = type.find('[');
    if (bracket != std::string::npos) {
        type = type.substr(0, bracket);
    }
    return type;
}

GoParser::GoParser() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_go())) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language to Go");
    }
}

GoParser::~GoParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

GoParser::GoParser(GoParser &&other) noexcept
    : parser_(other.parser_), tree_(other.tree_), source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

GoParser &GoParser::operator=(GoParser &&other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool GoParser::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

bool GoParser::has_errors() const {
    if (!tree_) return true;
    return ts_node_has_error(root());
}

uint32_t GoParser::first_error_line() const {
    if (!tree_) return 0;

    uint32_t line = 0;
    visit_nodes(root(), [&](TSNode node) {
        if (line != 0) return false;
        if (ts_node_is_error(node) || ts_node_is_missing(node)) {
            line = start_line_of(node);
            return false;
        }
        return ts_node_has_error(node);
    });
    return line;
}

TSNode GoParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string GoParser::node_text(TSNode node) const {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void GoParser::visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const {
    // Explicit stack; visitor returns false to skip a node's children
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current)) continue;

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

std::string GoParser::package_name() const {
    TSNode r = root();
    if (ts_node_is_null(r)) return "";

    uint32_t count = ts_node_named_child_count(r);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(r, i);
        if (!node_is(child, "package_clause")) continue;

        uint32_t n = ts_node_named_child_count(child);
        for (uint32_t j = 0; j < n; ++j) {
            TSNode ident = ts_node_named_child(child, j);
            if (node_is(ident, "package_identifier")) {
                return node_text(ident);
            }
        }
    }
    return "";
}

std::vector<ImportSpec> GoParser::extract_imports() const {
    std::vector<ImportSpec> imports;
    TSNode r = root();
    if (ts_node_is_null(r)) return imports;

    auto add_spec = [&](TSNode spec) {
        TSNode path_node = child_by_field(spec, "path");
        if (ts_node_is_null(path_node)) return;

        std::string path = node_text(path_node);
        if (path.size() >= 2 && (path.front() == '"' || path.front() == '`')) {
            path = path.substr(1, path.size() - 2);
        }

        ImportSpec imp;
        imp.path = path;
        imp.line = start_line_of(spec);
        TSNode name_node = child_by_field(spec, "name");
        if (!ts_node_is_null(name_node)) {
            imp.alias = node_text(name_node);
        }
        imports.push_back(std::move(imp));
    };

    uint32_t count = ts_node_named_child_count(r);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode decl = ts_node_named_child(r, i);
        if (!node_is(decl, "import_declaration")) continue;

        uint32_t n = ts_node_named_child_count(decl);
        for (uint32_t j = 0; j < n; ++j) {
            TSNode child = ts_node_named_child(decl, j);
            if (node_is(child, "import_spec")) {
                add_spec(child);
            } else if (node_is(child, "import_spec_list")) {
                uint32_t m = ts_node_named_child_count(child);
                for (uint32_t k = 0; k < m; ++k) {
                    TSNode spec = ts_node_named_child(child, k);
                    if (node_is(spec, "import_spec")) {
                        add_spec(spec);
                    }
                }
            }
        }
    }
    return imports;
}

std::vector<Parameter> GoParser::extract_parameters(TSNode list) const {
    std::vector<Parameter> params;
    if (ts_node_is_null(list)) return params;

    uint32_t count = ts_node_named_child_count(list);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode decl = ts_node_named_child(list, i);
        bool variadic = node_is(decl, "variadic_parameter_declaration");
        if (!variadic && !node_is(decl, "parameter_declaration")) continue;

        std::string type = node_text(child_by_field(decl, "type"));
        if (variadic) {
            type = "..." + type;
        }

        // A declaration can carry several names: a, b int
        std::vector<std::string> names;
        uint32_t child_count = ts_node_child_count(decl);
        for (uint32_t c = 0; c < child_count; ++c) {
            const char *field = ts_node_field_name_for_child(decl, c);
            if (field && strcmp(field, "name") == 0) {
                names.push_back(node_text(ts_node_child(decl, c)));
            }
        }

        if (names.empty()) {
            params.push_back({"", type});
        } else {
            for (auto &name : names) {
                params.push_back({std::move(name), type});
            }
        }
    }
    return params;
}

std::vector<std::string> GoParser::extract_results(TSNode result) const {
    std::vector<std::string> returns;
    if (ts_node_is_null(result)) return returns;

    if (!node_is(result, "parameter_list")) {
        returns.push_back(node_text(result));
        return returns;
    }

    for (const auto &param : extract_parameters(result)) {
        if (param.name.empty()) {
            returns.push_back(param.type);
        } else {
            returns.push_back(param.name + " " + param.type);
        }
    }
    return returns;
}

std::vector<FunctionDef> GoParser::extract_functions() const {
    std::vector<FunctionDef> functions;
    TSNode r = root();
    if (ts_node_is_null(r)) return functions;

    uint32_t count = ts_node_named_child_count(r);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = ts_node_named_child(r, i);
        bool is_method = node_is(node, "method_declaration");
        if (!is_method && !node_is(node, "function_declaration")) continue;

        FunctionDef func;
        func.name = node_text(child_by_field(node, "name"));
        if (func.name.empty()) continue;

        if (is_method) {
            auto receivers = extract_parameters(child_by_field(node, "receiver"));
            if (!receivers.empty()) {
                func.receiver = normalize_receiver(receivers.front().type);
            }
        }

        func.params = extract_parameters(child_by_field(node, "parameters"));
        func.returns = extract_results(child_by_field(node, "result"));
        func.has_body = !ts_node_is_null(child_by_field(node, "body"));
        func.start_line = start_line_of(node);
        func.end_line = end_line_of(node);
        func.node = node;

        functions.push_back(std::move(func));
    }

    return functions;
}

} // namespace callscope
