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

#include "callgraph.hpp"
#include "cfg.hpp"
#include "depgraph.hpp"
#include "dfg.hpp"
#include "diagnostics.hpp"
#include "language.hpp"
#include "parser.hpp"
#include "pdg.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codegraph {

namespace fs = std::filesystem;

// Analyzer configuration
struct AnalyzerConfig {
    std::string root_path = ".";
    bool verbose = false;

    // Extensions to analyze, without the dot; empty = every registered language
    std::vector<std::string> extensions;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // File patterns to ignore
    std::vector<std::string> ignore_patterns = {"build",  "node_modules", "__pycache__", ".git",
                                                ".venv",  "venv",         "dist",        "target",
                                                ".cache", "CMakeFiles"};

    // Functions that count as called from outside (dead-function analysis)
    std::vector<std::string> entry_patterns = {"main", "__main__", "__init__", "test_*", "Test*"};

    // Import path aliases for the dependency graph ("@" -> "src")
    AliasMap aliases;
};

// Every graph of one function
struct FunctionAnalysis {
    std::string name; // qualified name within the file
    uint32_t line = 0;
    StatementTree statements;
    ControlFlowGraph cfg;
    DataFlowGraph dfg;
    ProgramDependenceGraph pdg;
};

class Analyzer {
public:
    Analyzer(const ProfileRegistry &profiles, const AnalyzerConfig &config = AnalyzerConfig{});

    // Source files under root_path (root_path itself when it is a file),
    // sorted. Throws InvalidRequest when root_path does not exist.
    std::vector<fs::path> discover_files() const;

    // Parse every file in parallel. Unreadable and unparsable files are
    // skipped and recorded in diagnostics(); trees keep the input order.
    std::vector<SyntaxTree> extract_all(const std::vector<fs::path> &files);

    // One file, or nullopt with a diagnostic
    std::optional<SyntaxTree> extract_file(const fs::path &file);

    CallGraph call_graph(const std::vector<SyntaxTree> &trees);

    DependencyGraph dependency_graph(const std::vector<fs::path> &files);

    // Statement tree, CFG, DFG and PDG of every function in the tree
    std::vector<FunctionAnalysis> analyze_functions(const SyntaxTree &tree);

    // Path relative to the project root, '/' separated
    std::string relative_path(const fs::path &file) const;

    const DiagnosticLog &diagnostics() const { return diagnostics_; }
    const AnalyzerConfig &config() const { return config_; }

    // Get statistics
    struct Stats {
        std::atomic<size_t> files_parsed{0};
        std::atomic<size_t> files_skipped{0};
        std::atomic<size_t> functions_found{0};
        std::atomic<size_t> call_sites_found{0};
    };
    const Stats &stats() const { return stats_; }

private:
    const ProfileRegistry &profiles_;
    AnalyzerConfig config_;
    WorkerPool pool_;
    DiagnosticLog diagnostics_;
    Stats stats_;
    fs::path base_dir_;

    // Thread synchronization
    mutable std::mutex output_mutex_;

    // Check if path should be ignored
    bool should_ignore(const fs::path &path) const;

    bool wants_extension(const std::string &ext) const;

    // Read and parse one file (thread-safe)
    std::optional<SyntaxTree> parse_file(const fs::path &file);
};

} // namespace codegraph
