#include "callscope/report.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace callscope {

namespace {

constexpr const char *EMPTY_CELL = "None";

template <typename T, typename F>
std::string join(const std::vector<T> &items, const std::string &sep, F format) {
    if (items.empty()) return EMPTY_CELL;

    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += sep;
        result += format(items[i]);
    }
    return result;
}

// Cell texts of one record, shared by the table and the CSV
struct Row {
    std::string file;
    std::string function;
    std::string line;
    std::string params;
    std::string returns;
    std::string externals;
    std::string calls;
};

Row make_row(const FunctionRecord &record, const std::string &sep) {
    const FunctionDescriptor &fn = *record.function;
    Row row;
    row.file = fn.file;
    row.function = display_name(fn);
    row.line = std::to_string(fn.start_line);
    row.params = join(fn.params, sep, format_parameter);
    row.returns = join(fn.returns, sep, [](const std::string &r) { return r; });
    row.externals = join(record.externals, sep, format_external);
    row.calls = join(record.calls, sep,
                     [](const FunctionDescriptor *callee) { return callee->identity(); });
    return row;
}

std::ofstream open_output(const std::string &filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    return file;
}

} // namespace

std::vector<FunctionRecord> build_records(const Registry &registry, const Resolution &resolution) {
    std::vector<FunctionRecord> records;
    records.reserve(registry.size());

    for (const auto &fn : registry.functions()) {
        FunctionRecord record;
        record.function = fn.get();

        auto it = resolution.find(fn->identity());
        if (it != resolution.end()) {
            record.sites = &it->second;
            record.externals = external_references(it->second);
            record.calls = internal_callees(it->second);
        }
        records.push_back(std::move(record));
    }

    return records;
}

std::string format_parameter(const Parameter &param) {
    return param.name.empty() ? param.type : param.name + " " + param.type;
}

std::string format_external(const ExternalCall &external) {
    if (external.import_path.empty()) return external.name;
    return external.import_path + "." + external.name;
}

std::string display_name(const FunctionDescriptor &fn) {
    return fn.is_method() ? fn.receiver + "." + fn.name : fn.name;
}

void print_function_table(const std::vector<FunctionRecord> &records, std::ostream &out) {
    if (records.empty()) {
        out << "No functions found." << std::endl;
        return;
    }

    std::vector<Row> rows;
    rows.reserve(records.size());
    for (const auto &record : records) {
        rows.push_back(make_row(record, ", "));
    }

    Row header{"File", "Function", "Line", "Parameters", "Returns", "Externals", "FunctionCalls"};
    std::vector<std::string Row::*> columns = {&Row::file,    &Row::function, &Row::line,
                                               &Row::params,  &Row::returns,  &Row::externals,
                                               &Row::calls};

    std::vector<size_t> widths;
    for (auto column : columns) {
        size_t width = (header.*column).size();
        for (const auto &row : rows) {
            width = std::max(width, (row.*column).size());
        }
        widths.push_back(width);
    }

    auto print_row = [&](const Row &row) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << " | ";
            out << std::left << std::setw(static_cast<int>(widths[i])) << row.*columns[i];
        }
        out << "\n";
    };

    print_row(header);
    size_t total = 3 * (columns.size() - 1);
    for (size_t w : widths) total += w;
    out << std::string(total, '-') << "\n";

    for (const auto &row : rows) {
        print_row(row);
    }
    out.flush();
}

std::string csv_field(const std::string &value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void write_csv(const std::vector<FunctionRecord> &records, std::ostream &out) {
    out << "File,Function,Line,Parameters,Returns,Externals,FunctionCalls\n";
    for (const auto &record : records) {
        Row row = make_row(record, "; ");
        out << csv_field(row.file) << "," << csv_field(row.function) << "," << csv_field(row.line)
            << "," << csv_field(row.params) << "," << csv_field(row.returns) << ","
            << csv_field(row.externals) << "," << csv_field(row.calls) << "\n";
    }
}

void export_csv(const std::vector<FunctionRecord> &records, const std::string &filepath) {
    std::ofstream file = open_output(filepath);
    write_csv(records, file);
}

json call_site_to_json(const CallSite &site) {
    json j;
    j["kind"] = call_kind_to_string(site.target);
    j["target"] = call_target_name(site.target);
    j["line"] = site.line;
    j["expression"] = site.expression;
    j["arguments"] = site.arguments;
    j["mode"] = invocation_mode_to_string(site.mode);

    if (auto ext = std::get_if<ExternalCall>(&site.target)) {
        j["origin"] = external_origin_to_string(ext->origin);
        if (!ext->import_path.empty()) {
            j["import_path"] = ext->import_path;
        }
    } else if (auto cross = std::get_if<CrossModuleCall>(&site.target)) {
        j["import_path"] = cross->import_path;
    }

    json nested = json::array();
    for (const auto &child : site.nested) {
        nested.push_back(call_site_to_json(child));
    }
    j["nested"] = std::move(nested);
    return j;
}

json records_to_json(const std::vector<FunctionRecord> &records) {
    json array = json::array();

    for (const auto &record : records) {
        const FunctionDescriptor &fn = *record.function;
        json j;
        j["file"] = fn.file;
        j["package"] = fn.package;
        j["package_path"] = fn.package_path;
        j["receiver"] = fn.receiver;
        j["name"] = fn.name;
        j["identity"] = fn.identity();
        j["line"] = fn.start_line;
        j["end_line"] = fn.end_line;

        json params = json::array();
        for (const auto &param : fn.params) {
            params.push_back({{"name", param.name}, {"type", param.type}});
        }
        j["parameters"] = std::move(params);
        j["returns"] = fn.returns;

        json externals = json::array();
        for (const auto &ext : record.externals) {
            externals.push_back({{"name", ext.name},
                                 {"alias", ext.alias},
                                 {"import_path", ext.import_path},
                                 {"origin", external_origin_to_string(ext.origin)}});
        }
        j["externals"] = std::move(externals);

        json calls = json::array();
        for (const auto *callee : record.calls) {
            calls.push_back(callee->identity());
        }
        j["calls"] = std::move(calls);

        json sites = json::array();
        if (record.sites) {
            for (const auto &site : *record.sites) {
                sites.push_back(call_site_to_json(site));
            }
        }
        j["call_sites"] = std::move(sites);

        array.push_back(std::move(j));
    }

    return array;
}

void export_json(const std::vector<FunctionRecord> &records, const std::string &filepath) {
    std::ofstream file = open_output(filepath);
    file << records_to_json(records).dump(2) << "\n";
}

void print_untested(const std::set<std::string> &untested, const Registry &registry,
                    std::ostream &out) {
    size_t width = 0;
    for (const auto &identity : untested) {
        width = std::max(width, identity.size());
    }

    for (const auto &identity : untested) {
        out << std::left << std::setw(static_cast<int>(width)) << identity;
        if (const auto *fn = registry.find(identity)) {
            out << "  " << fn->file << ":" << fn->start_line;
        }
        out << "\n";
    }
    out.flush();
}

} // namespace callscope
