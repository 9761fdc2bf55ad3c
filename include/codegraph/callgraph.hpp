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

#include "parser.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegraph {

using FunctionId = NodeId;

// Pseudo-function owning the top-level code of a file
constexpr const char *MODULE_FUNCTION = "<module>";

struct FunctionEntry {
    std::string qualified_name; // "<module>::<Class.method>"
    std::string name;           // short name
    std::string class_name;     // enclosing class, empty for free functions
    std::string module;         // project-relative path without extension
    std::string file;
    uint32_t line = 0;
    bool entry_point = false;
    NodeId decl = INVALID_NODE; // Function DeclNode in the file's SyntaxTree
};

// ============================================================================
// Function Table - global name table shared by the registration workers
// ============================================================================
class FunctionTable {
public:
    FunctionTable() = default;
    FunctionTable(FunctionTable &&other) noexcept;
    FunctionTable &operator=(FunctionTable &&other) noexcept;

    FunctionTable(const FunctionTable &) = delete;
    FunctionTable &operator=(const FunctionTable &) = delete;

    // Thread-safe until seal(); throws std::logic_error afterwards
    FunctionId register_function(FunctionEntry entry);

    // Build the lookup indices. Lookups are lock-free and only valid after this.
    void seal();
    bool sealed() const { return sealed_; }

    const FunctionEntry &operator[](FunctionId id) const { return entries_[id]; }
    size_t size() const { return entries_.size(); }

    // Exact qualified name, or INVALID_NODE
    FunctionId find(const std::string &qualified_name) const;

    // Every function with this short name, sorted by qualified name
    const std::vector<FunctionId> &by_name(const std::string &name) const;

    // Functions whose short or qualified name equals `name`
    std::vector<FunctionId> lookup(const std::string &name) const;

private:
    std::mutex mutex_;
    bool sealed_ = false;
    NodeArena<FunctionEntry> entries_;
    StringPool names_;
    std::unordered_map<std::string, FunctionId> by_qualified_;
    std::unordered_map<size_t, std::vector<FunctionId>> by_name_;

    void require_sealed() const;
};

// callSiteLine is the line of the call expression
struct CallEdge {
    FunctionId caller;
    FunctionId callee;
    uint32_t line;
    bool ambiguous = false; // several project-wide candidates matched
};

struct UnresolvedCall {
    FunctionId caller;
    std::string target;
    uint32_t line;
};

struct CallGraph {
    FunctionTable functions;
    std::vector<CallEdge> edges;
    std::vector<UnresolvedCall> unresolved;

    std::vector<FunctionId> callers(FunctionId id) const;
    std::vector<FunctionId> callees(FunctionId id) const;
};

// Two phases separated by the pool's join: register every function, seal the
// table, then resolve every call site against it.
CallGraph build_call_graph(const std::vector<SyntaxTree> &trees,
                           const std::vector<std::string> &entry_patterns, WorkerPool &pool);

// Module name of a project-relative file ("pkg/util.py" -> "pkg/util")
std::string module_of(const std::string &file);

// Shell-style match supporting '*' and '?'
bool matches_glob(const std::string &name, const std::string &pattern);

// Functions on a directed cycle (including self-calls), ascending
std::vector<FunctionId> recursive_functions(const CallGraph &graph);

// No incoming call edge (a self-call counts) and not an entry point
std::vector<FunctionId> dead_functions(const CallGraph &graph);

// BFS distance from root for every function, -1 when unreachable
std::vector<int> call_depths(const CallGraph &graph, FunctionId root);

// Callback for streaming call chains
// Returns false to stop searching, true to continue
using ChainCallback = std::function<bool(const std::vector<FunctionId> &chain)>;

// Every simple call chain from -> to of at most max_depth calls
void find_call_chains(const CallGraph &graph, FunctionId from, FunctionId to, size_t max_depth,
                      const ChainCallback &callback);

} // namespace codegraph
