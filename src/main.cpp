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

#include <cxxopts.hpp>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "callscope/commands.hpp"
#include "callscope/version.hpp"

using namespace callscope;

void print_banner() {
    std::cout << "callscope - Go call graph analyzer v" << VERSION_STRING << "\n" << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "callscope", "Go call graph analyzer - index a module, resolve calls, render the graph");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("version", "Print version");
    opts("v,verbose", "Debug logging");
    opts("s,src", "Project root directory", cxxopts::value<std::string>()->default_value("."));
    opts("o,output", "Base name of the DOT file (default: root directory name)",
         cxxopts::value<std::string>());
    opts("j,jobs", "Number of worker threads (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("vendor", "Dependency directory to skip",
         cxxopts::value<std::string>()->default_value("vendor"));
    opts("include-tests", "Index _test.go files too");

    opts("dot", "Write <output>.dot (default action)");
    opts("hide-stdlib", "Leave standard library calls out of the DOT graph");
    opts("internal-only", "Only draw functions of the module");
    opts("l,list", "Print a table of all functions");
    opts("csv", "Export the function table as CSV", cxxopts::value<std::string>());
    opts("json", "Export functions and call sites as JSON", cxxopts::value<std::string>());
    opts("graph-json", "Save the call graph as JSON", cxxopts::value<std::string>());
    opts("untested", "List functions a coverage profile never executes",
         cxxopts::value<std::string>());
    opts("search", "Search symbols (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("callers", "Transitive callers of a symbol", cxxopts::value<std::string>());
    opts("callees", "Transitive callees of a symbol", cxxopts::value<std::string>());
    opts("depth", "Depth limit for --callers/--callees (0 = unlimited)",
         cxxopts::value<size_t>()->default_value("0"));

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  callscope -s ./myproject               Write myproject.dot"
                      << std::endl;
            std::cout << "  callscope --hide-stdlib -o graph       Write graph.dot without stdlib"
                      << std::endl;
            std::cout << "  callscope --list                       Print every function"
                      << std::endl;
            std::cout << "  callscope --csv funcs.csv --json funcs.json   Export listings"
                      << std::endl;
            std::cout << "  callscope --untested coverage.out      Functions without coverage"
                      << std::endl;
            std::cout << "  callscope --callers main.Run --depth 2 Who calls main.Run"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "callscope v" << VERSION_STRING << std::endl;
            return 0;
        }

        // Diagnostics go to stderr so listings on stdout stay clean
        auto logger = spdlog::stderr_color_mt("callscope");
        spdlog::set_default_logger(logger);
        spdlog::set_level(result.count("verbose") ? spdlog::level::debug : spdlog::level::info);

        IndexerConfig config;
        config.root_path = result["src"].as<std::string>();
        config.vendor_dir = result["vendor"].as<std::string>();
        config.include_tests = result.count("include-tests") > 0;
        config.num_threads = result["jobs"].as<unsigned int>();

        Analysis analysis = run_analysis(config);

        int status = 0;
        bool acted = false;
        auto run = [&](int code) {
            acted = true;
            if (code != 0) status = code;
        };

        if (result.count("list")) {
            run(cmd_list(analysis));
        }

        if (result.count("csv")) {
            run(cmd_export_csv(analysis, result["csv"].as<std::string>()));
        }

        if (result.count("json")) {
            run(cmd_export_json(analysis, result["json"].as<std::string>()));
        }

        if (result.count("graph-json")) {
            run(cmd_graph_json(analysis, result["graph-json"].as<std::string>()));
        }

        if (result.count("untested")) {
            run(cmd_untested(analysis, result["untested"].as<std::string>()));
        }

        if (result.count("search")) {
            auto patterns = result["search"].as<std::vector<std::string>>();
            if (!patterns.empty())
                run(cmd_search(analysis, patterns));
        }

        size_t depth = result["depth"].as<size_t>();
        if (result.count("callers")) {
            run(cmd_trace(analysis, result["callers"].as<std::string>(), Direction::Callers,
                          depth));
        }

        if (result.count("callees")) {
            run(cmd_trace(analysis, result["callees"].as<std::string>(), Direction::Callees,
                          depth));
        }

        if (result.count("dot") || !acted) {
            DotOptions dot;
            dot.hide_stdlib = result.count("hide-stdlib") > 0;
            dot.internal_only = result.count("internal-only") > 0;

            std::string output = result.count("output") ? result["output"].as<std::string>()
                                                        : default_output_name(config.root_path);
            run(cmd_dot(analysis, output, dot));
        }

        return status;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
