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

#include "language.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <string>
#include <utility>
#include <vector>

namespace codegraph {

using ModuleId = NodeId;

// One import/use/include line, found by the profile's import patterns
struct ImportStatement {
    std::string target;             // as written: "a.b", "./util", "stdio.h"
    std::vector<std::string> names; // "from x import a, b" -> {a, b}
    uint32_t line = 0;
    std::string text;               // trimmed source line
};

// Import statements of a file, comments ignored
std::vector<ImportStatement> extract_imports(const std::string &text,
                                             const LanguageProfile &profile);

// Names matched by the profile's export patterns, first occurrence order
std::vector<std::string> extract_exports(const std::string &text, const LanguageProfile &profile);

// ============================================================================
// Module dependency graph
// ============================================================================
struct ModuleNode {
    std::string file;   // project-relative, '/' separated
    std::string module; // file without extension
    std::string language;
    std::vector<std::string> exports;
    size_t import_count = 0;
};

// One edge per (importer, imported) pair; `line` and `target` of the first import
struct DependencyEdge {
    ModuleId from;
    ModuleId to;
    uint32_t line;
    std::string target;
};

// Import that names nothing in the project (external package, system header)
struct UnresolvedImport {
    ModuleId module;
    std::string target;
    uint32_t line;
};

struct DependencyGraph {
    NodeArena<ModuleNode> modules; // sorted by file
    std::vector<DependencyEdge> edges;
    std::vector<UnresolvedImport> unresolved;

    // Module for a project-relative path, or INVALID_NODE
    ModuleId find(const std::string &file) const;

    std::vector<ModuleId> dependencies(ModuleId id) const;
    std::vector<ModuleId> dependents(ModuleId id) const;
};

// Input of the builder; the profile decides how imports are spelled
struct SourceFile {
    std::string path; // project-relative
    std::string text;
    const LanguageProfile *profile = nullptr;
};

// Import prefix rewrites, e.g. {"@", "src"} turns "@/util" into "src/util"
using AliasMap = std::vector<std::pair<std::string, std::string>>;

DependencyGraph build_dependency_graph(const std::vector<SourceFile> &files,
                                       const AliasMap &aliases, WorkerPool &pool);

// Every distinct cycle found through a back edge to a gray node. Each path
// starts at its smallest module and repeats it at the end: [A, B, C, A].
// A self-import is reported as [A, A].
std::vector<std::vector<ModuleId>> find_cycles(const DependencyGraph &graph);

// Stops at the first back edge; fills `cycle` the same way find_cycles does
bool detect_circular(const DependencyGraph &graph, std::vector<ModuleId> *cycle = nullptr);

// Modules nothing imports
std::vector<ModuleId> roots(const DependencyGraph &graph);

// Modules that import nothing in the project
std::vector<ModuleId> leaves(const DependencyGraph &graph);

// Longest import chain from any root to each module. Modules on a common
// cycle share one depth.
std::vector<size_t> depths(const DependencyGraph &graph);

} // namespace codegraph
