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

#include "codegraph/commands.hpp"
#include "codegraph/version.hpp"

using namespace codegraph;

void print_banner() {
    std::cout << R"(
   ___         _       ___                 _
  / __|___  __| |___  / __|_ _ __ _ _ __  | |_
 | (__/ _ \/ _` / -_)| (_ | '_/ _` | '_ \ | ' \
  \___\___/\__,_\___| \___|_| \__,_| .__/ |_||_|
                                   |_|
)" << "  Multi-Graph Code Analyzer v"
              << VERSION_STRING << "\n"
              << std::endl;
}

// "@=src" -> {"@", "src"}
bool parse_alias(const std::string &text, AliasMap &aliases) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;
    aliases.emplace_back(text.substr(0, eq), text.substr(eq + 1));
    return true;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "codegraph",
        "Multi-Graph Code Analyzer - syntax trees, control flow, data flow, call graphs, "
        "module dependencies and program dependence graphs");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("command", "syntax-tree | control-flow | data-flow | call-graph | dependency-graph | "
                    "program-dependency | all",
         cxxopts::value<std::string>());
    opts("path", "File or directory to analyze", cxxopts::value<std::string>()->default_value("."));
    opts("e,ext", "Only analyze these extensions (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("f,format", "Output format: text, json or dot",
         cxxopts::value<std::string>()->default_value("text"));
    opts("o,export", "Write the output to a file instead of stdout", cxxopts::value<std::string>());
    opts("j,jobs", "Number of worker threads (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("verbose", "Print every parsed file and statistics");
    opts("ignore", "Extra directory names to skip (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("entry", "Extra entry-point patterns for dead-function analysis",
         cxxopts::value<std::vector<std::string>>());
    opts("alias", "Import path alias, e.g. @=src (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("function", "Only graph this function (per-function graphs)",
         cxxopts::value<std::string>());
    opts("slice-line", "program-dependency: slice the statement at this line",
         cxxopts::value<unsigned int>());
    opts("taint-source", "program-dependency: taint source names (comma-separated)",
         cxxopts::value<std::vector<std::string>>());
    opts("taint-sink", "program-dependency: taint sink names (comma-separated)",
         cxxopts::value<std::vector<std::string>>());
    opts("root", "call-graph: report call depths from this function",
         cxxopts::value<std::string>());
    opts("chain", "call-graph: call chains FROM,TO", cxxopts::value<std::vector<std::string>>());
    opts("max-depth", "call-graph: longest chain reported",
         cxxopts::value<size_t>()->default_value("10"));

    options.parse_positional({"command", "path"});
    options.positional_help("<command> [path]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  codegraph syntax-tree src/           Declarations of every file"
                      << std::endl;
            std::cout << "  codegraph control-flow a.c -f dot    CFG of each function as DOT"
                      << std::endl;
            std::cout << "  codegraph data-flow a.py --function run   DFG of one function"
                      << std::endl;
            std::cout << "  codegraph call-graph . --root main   Call depths from main"
                      << std::endl;
            std::cout << "  codegraph call-graph . --chain main,save   Call chains main -> save"
                      << std::endl;
            std::cout << "  codegraph dependency-graph . --alias @=src   Module dependencies"
                      << std::endl;
            std::cout << "  codegraph program-dependency a.py --slice-line 12   Program slice"
                      << std::endl;
            std::cout << "  codegraph program-dependency a.py --taint-source input "
                         "--taint-sink exec"
                      << std::endl;
            std::cout << "  codegraph all a.py -f json -o a.json   Every graph of one file"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "codegraph v" << VERSION_STRING << std::endl;
            return 0;
        }

        if (!result.count("command")) {
            print_banner();
            std::cout << options.help() << std::endl;
            return 0;
        }

        CommandOptions cmd;
        cmd.analyzer.root_path = result["path"].as<std::string>();
        cmd.analyzer.verbose = result.count("verbose") > 0;
        cmd.analyzer.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("ext"))
            cmd.analyzer.extensions = result["ext"].as<std::vector<std::string>>();
        if (result.count("ignore")) {
            for (const auto &name : result["ignore"].as<std::vector<std::string>>())
                cmd.analyzer.ignore_patterns.push_back(name);
        }
        if (result.count("entry")) {
            for (const auto &pattern : result["entry"].as<std::vector<std::string>>())
                cmd.analyzer.entry_patterns.push_back(pattern);
        }
        if (result.count("alias")) {
            for (const auto &entry : result["alias"].as<std::vector<std::string>>()) {
                if (!parse_alias(entry, cmd.analyzer.aliases)) {
                    std::cerr << "Error: invalid alias (expected PREFIX=DIR): " << entry
                              << std::endl;
                    return 1;
                }
            }
        }

        cmd.format = parse_format(result["format"].as<std::string>());
        if (result.count("export"))
            cmd.export_path = result["export"].as<std::string>();
        if (result.count("function"))
            cmd.function = result["function"].as<std::string>();
        if (result.count("slice-line"))
            cmd.slice_line = result["slice-line"].as<unsigned int>();
        if (result.count("taint-source"))
            cmd.taint_sources = result["taint-source"].as<std::vector<std::string>>();
        if (result.count("taint-sink"))
            cmd.taint_sinks = result["taint-sink"].as<std::vector<std::string>>();
        if (result.count("root"))
            cmd.root = result["root"].as<std::string>();
        if (result.count("chain"))
            cmd.chain = result["chain"].as<std::vector<std::string>>();
        cmd.max_chain_depth = result["max-depth"].as<size_t>();

        // Built once, shared by every extractor call
        const ProfileRegistry profiles = ProfileRegistry::builtin();

        std::string command = result["command"].as<std::string>();
        if (command == "syntax-tree")
            return cmd_syntax_tree(profiles, cmd);
        if (command == "control-flow")
            return cmd_control_flow(profiles, cmd);
        if (command == "data-flow")
            return cmd_data_flow(profiles, cmd);
        if (command == "call-graph")
            return cmd_call_graph(profiles, cmd);
        if (command == "dependency-graph")
            return cmd_dependency_graph(profiles, cmd);
        if (command == "program-dependency")
            return cmd_program_dependency(profiles, cmd);
        if (command == "all")
            return cmd_all(profiles, cmd);

        std::cerr << "Error: unknown command: " << command << std::endl;
        std::cerr << "Run 'codegraph --help' for the list of commands." << std::endl;
        return 1;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
