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

#include "codegraph/callgraph.hpp"
#include <algorithm>
#include <filesystem>
#include <queue>
#include <stdexcept>
#include <unordered_set>

namespace codegraph {

namespace fs = std::filesystem;

// ============================================================================
// FunctionTable
// ============================================================================

FunctionTable::FunctionTable(FunctionTable &&other) noexcept
    : sealed_(other.sealed_), entries_(std::move(other.entries_)), names_(std::move(other.names_)),
      by_qualified_(std::move(other.by_qualified_)), by_name_(std::move(other.by_name_)) {}

FunctionTable &FunctionTable::operator=(FunctionTable &&other) noexcept {
    if (this != &other) {
        sealed_ = other.sealed_;
        entries_ = std::move(other.entries_);
        names_ = std::move(other.names_);
        by_qualified_ = std::move(other.by_qualified_);
        by_name_ = std::move(other.by_name_);
    }
    return *this;
}

FunctionId FunctionTable::register_function(FunctionEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        throw std::logic_error("function table is sealed: " + entry.qualified_name);
    }
    return entries_.add(std::move(entry));
}

void FunctionTable::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_)
        return;

    // Registration order depends on scheduling; give ids a stable meaning
    std::vector<FunctionEntry> sorted(entries_.begin(), entries_.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const FunctionEntry &a, const FunctionEntry &b) {
        if (a.file != b.file)
            return a.file < b.file;
        if (a.line != b.line)
            return a.line < b.line;
        return a.qualified_name < b.qualified_name;
    });
    entries_ = NodeArena<FunctionEntry>();
    for (auto &e : sorted)
        entries_.add(std::move(e));

    for (FunctionId id = 0; id < entries_.size(); ++id) {
        const FunctionEntry &e = entries_[id];
        by_qualified_.emplace(e.qualified_name, id);
        by_name_[names_.intern(e.name)].push_back(id);
    }
    for (auto &[name, ids] : by_name_) {
        std::sort(ids.begin(), ids.end(), [this](FunctionId a, FunctionId b) {
            return entries_[a].qualified_name < entries_[b].qualified_name;
        });
    }
    sealed_ = true;
}

void FunctionTable::require_sealed() const {
    if (!sealed_) {
        throw std::logic_error("function table queried before seal()");
    }
}

FunctionId FunctionTable::find(const std::string &qualified_name) const {
    require_sealed();
    auto it = by_qualified_.find(qualified_name);
    return it != by_qualified_.end() ? it->second : INVALID_NODE;
}

const std::vector<FunctionId> &FunctionTable::by_name(const std::string &name) const {
    static const std::vector<FunctionId> empty;
    require_sealed();
    size_t idx = names_.find(name);
    if (idx == SIZE_MAX)
        return empty;
    auto it = by_name_.find(idx);
    return it != by_name_.end() ? it->second : empty;
}

std::vector<FunctionId> FunctionTable::lookup(const std::string &name) const {
    FunctionId exact = find(name);
    if (exact != INVALID_NODE)
        return {exact};

    std::vector<FunctionId> out = by_name(name);
    if (!out.empty())
        return out;

    // "Class.method" or "module::Class.method" suffix
    for (FunctionId id = 0; id < entries_.size(); ++id) {
        const std::string &q = entries_[id].qualified_name;
        if (q.size() > name.size() && q.compare(q.size() - name.size(), name.size(), name) == 0) {
            char before = q[q.size() - name.size() - 1];
            if (before == '.' || before == ':')
                out.push_back(id);
        }
    }
    return out;
}

// ============================================================================
// CallGraph queries
// ============================================================================

std::vector<FunctionId> CallGraph::callers(FunctionId id) const {
    std::vector<FunctionId> out;
    for (const auto &e : edges) {
        if (e.callee == id)
            out.push_back(e.caller);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<FunctionId> CallGraph::callees(FunctionId id) const {
    std::vector<FunctionId> out;
    for (const auto &e : edges) {
        if (e.caller == id)
            out.push_back(e.callee);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::string module_of(const std::string &file) {
    fs::path p(file);
    p.replace_extension();
    return p.generic_string();
}

bool matches_glob(const std::string &name, const std::string &pattern) {
    size_t n = 0, p = 0;
    size_t star = std::string::npos, mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++n;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

namespace {

// Split "a.b.c" / "ns::f" / "p->m" into qualifier and short name
std::pair<std::string, std::string> split_target(const std::string &target) {
    size_t best = std::string::npos;
    size_t len = 0;
    for (const char *sep : {".", "::", "->", "?."}) {
        size_t pos = target.rfind(sep);
        if (pos != std::string::npos && (best == std::string::npos || pos > best)) {
            best = pos;
            len = std::char_traits<char>::length(sep);
        }
    }
    if (best == std::string::npos)
        return {"", target};
    std::string qualifier = target.substr(0, best);
    if (!qualifier.empty() && qualifier.back() == '?')
        qualifier.pop_back();
    return {qualifier, target.substr(best + len)};
}

std::string last_segment(const std::string &qualifier) {
    return split_target(qualifier).second;
}

bool is_self_qualifier(const std::string &q) {
    return q == "self" || q == "this" || q == "Self" || q == "cls" || q == "$this" || q == "super";
}

// Class name of a function: the nearest Class ancestor, or the qualifier of
// an out-of-line / receiver-qualified name ("Foo::bar", "Recv.bar")
std::string class_of(const SyntaxTree &tree, const DeclNode &decl) {
    if (decl.parent != INVALID_NODE) {
        const DeclNode &parent = tree.decls[decl.parent];
        if (parent.kind == DeclKind::Class)
            return parent.name;
        if (parent.kind == DeclKind::Function)
            return "";
    }
    return last_segment(split_target(decl.qualified_name).first);
}

// Nearest enclosing Function decl, or INVALID_NODE
NodeId enclosing_function(const SyntaxTree &tree, NodeId decl) {
    NodeId cur = tree.decls[decl].parent;
    while (cur != INVALID_NODE) {
        if (tree.decls[cur].kind == DeclKind::Function)
            return cur;
        cur = tree.decls[cur].parent;
    }
    return INVALID_NODE;
}

class CallResolver {
public:
    explicit CallResolver(const FunctionTable &table) : table_(table) {}

    // Resolved callee and ambiguity flag; INVALID_NODE when nothing matches
    std::pair<FunctionId, bool> resolve(const FunctionEntry &caller, const std::string &target) const {
        auto [qualifier, name] = split_target(target);

        // self.method() / this->method()
        if (is_self_qualifier(qualifier) && !caller.class_name.empty()) {
            std::vector<FunctionId> members;
            for (FunctionId id : table_.by_name(name)) {
                if (table_[id].class_name == caller.class_name)
                    members.push_back(id);
            }
            auto same_module = filter(members, [&](const FunctionEntry &e) { return e.module == caller.module; });
            if (!same_module.empty())
                return pick(same_module);
            if (!members.empty())
                return pick(members);
        }

        // Exact qualified name inside the caller's module
        std::string dotted = target;
        FunctionId exact = table_.find(caller.module + "::" + dotted);
        if (exact != INVALID_NODE)
            return {exact, false};

        const std::vector<FunctionId> &candidates = table_.by_name(name);
        if (candidates.empty())
            return {INVALID_NODE, false};

        std::string q = last_segment(qualifier);
        bool qualified = !qualifier.empty() && !is_self_qualifier(qualifier);

        auto matches_qualifier = [&](const FunctionEntry &e) {
            if (e.class_name == q)
                return true;
            fs::path module(e.module);
            return module.filename().string() == q || module.parent_path().filename().string() == q;
        };

        // Same module, unqualified or qualified by a local class
        auto local = filter(candidates, [&](const FunctionEntry &e) {
            if (e.module != caller.module)
                return false;
            return qualified ? e.class_name == q : e.class_name.empty() || e.class_name == caller.class_name;
        });
        if (!local.empty())
            return pick(local);

        // Project-wide
        if (qualified) {
            auto named = filter(candidates, matches_qualifier);
            if (!named.empty())
                return pick(named);
            // obj.method() with an unknown receiver type: any method of that name
            auto methods = filter(candidates, [](const FunctionEntry &e) { return !e.class_name.empty(); });
            if (!methods.empty())
                return pick(methods);
            return {INVALID_NODE, false};
        }
        auto free = filter(candidates, [](const FunctionEntry &e) { return e.class_name.empty(); });
        if (!free.empty())
            return pick(free);
        return pick(candidates);
    }

private:
    const FunctionTable &table_;

    template <typename Pred>
    std::vector<FunctionId> filter(const std::vector<FunctionId> &ids, Pred pred) const {
        std::vector<FunctionId> out;
        for (FunctionId id : ids) {
            if (pred(table_[id]))
                out.push_back(id);
        }
        return out;
    }

    // First by qualified name; ambiguous when there was a choice
    std::pair<FunctionId, bool> pick(std::vector<FunctionId> ids) const {
        std::sort(ids.begin(), ids.end(), [this](FunctionId a, FunctionId b) {
            return table_[a].qualified_name < table_[b].qualified_name;
        });
        return {ids.front(), ids.size() > 1};
    }
};

} // namespace

// ============================================================================
// Build
// ============================================================================

CallGraph build_call_graph(const std::vector<SyntaxTree> &trees,
                           const std::vector<std::string> &entry_patterns, WorkerPool &pool) {
    CallGraph graph;

    auto is_entry = [&](const std::string &name) {
        for (const auto &pattern : entry_patterns) {
            if (matches_glob(name, pattern))
                return true;
        }
        return false;
    };

    // Phase 1: registration, one task per file
    pool.run(trees.size(), [&](size_t t) {
        const SyntaxTree &tree = trees[t];
        std::string module = module_of(tree.file);
        bool top_level_calls = false;

        for (NodeId id = 0; id < tree.decls.size(); ++id) {
            const DeclNode &decl = tree.decls[id];
            if (decl.kind == DeclKind::CallSite && enclosing_function(tree, id) == INVALID_NODE)
                top_level_calls = true;
            if (decl.kind != DeclKind::Function)
                continue;

            FunctionEntry entry;
            entry.qualified_name = module + "::" + decl.qualified_name;
            entry.name = decl.name;
            entry.class_name = class_of(tree, decl);
            entry.module = module;
            entry.file = tree.file;
            entry.line = decl.start_line;
            entry.entry_point = is_entry(decl.name);
            entry.decl = id;
            graph.functions.register_function(std::move(entry));
        }

        if (top_level_calls) {
            FunctionEntry entry;
            entry.qualified_name = module + "::" + MODULE_FUNCTION;
            entry.name = MODULE_FUNCTION;
            entry.module = module;
            entry.file = tree.file;
            entry.line = 1;
            entry.entry_point = true;
            graph.functions.register_function(std::move(entry));
        }
    });

    // Barrier: every registration task has joined
    graph.functions.seal();

    const FunctionTable &table = graph.functions;
    CallResolver resolver(table);

    // decl -> FunctionId per file, from the sealed table
    std::vector<std::unordered_map<NodeId, FunctionId>> decl_to_fn(trees.size());
    std::unordered_map<std::string, size_t> tree_index;
    for (size_t t = 0; t < trees.size(); ++t)
        tree_index.emplace(trees[t].file, t);
    std::vector<FunctionId> module_fn(trees.size(), INVALID_NODE);
    for (FunctionId id = 0; id < table.size(); ++id) {
        const FunctionEntry &e = table[id];
        auto it = tree_index.find(e.file);
        if (it == tree_index.end())
            continue;
        if (e.decl != INVALID_NODE)
            decl_to_fn[it->second].emplace(e.decl, id);
        else
            module_fn[it->second] = id;
    }

    // Phase 2: resolution, one task per file into per-file buffers
    std::vector<std::vector<CallEdge>> edges(trees.size());
    std::vector<std::vector<UnresolvedCall>> unresolved(trees.size());
    pool.run(trees.size(), [&](size_t t) {
        const SyntaxTree &tree = trees[t];
        for (NodeId id = 0; id < tree.decls.size(); ++id) {
            const DeclNode &decl = tree.decls[id];
            if (decl.kind != DeclKind::CallSite)
                continue;

            NodeId fn = enclosing_function(tree, id);
            FunctionId caller = fn == INVALID_NODE ? module_fn[t] : decl_to_fn[t].at(fn);
            if (caller == INVALID_NODE)
                continue;

            const std::string &target = decl.target.empty() ? decl.name : decl.target;
            auto [callee, ambiguous] = resolver.resolve(table[caller], target);
            if (callee == INVALID_NODE) {
                unresolved[t].push_back({caller, target, decl.start_line});
            } else {
                edges[t].push_back({caller, callee, decl.start_line, ambiguous});
            }
        }
    });

    for (size_t t = 0; t < trees.size(); ++t) {
        graph.edges.insert(graph.edges.end(), edges[t].begin(), edges[t].end());
        graph.unresolved.insert(graph.unresolved.end(), unresolved[t].begin(), unresolved[t].end());
    }
    return graph;
}

// ============================================================================
// Analyses
// ============================================================================

namespace {

Adjacency call_successors(const CallGraph &graph) {
    Adjacency adj(graph.functions.size());
    for (const auto &e : graph.edges)
        adj[e.caller].push_back(e.callee);
    for (auto &list : adj) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    return adj;
}

} // namespace

std::vector<FunctionId> recursive_functions(const CallGraph &graph) {
    size_t n = graph.functions.size();
    Adjacency adj = call_successors(graph);

    std::vector<bool> recursive(n, false);
    for (const auto &component : strongly_connected_components(adj)) {
        if (component.size() > 1) {
            for (FunctionId c : component)
                recursive[c] = true;
        }
    }

    for (const auto &e : graph.edges) {
        if (e.caller == e.callee)
            recursive[e.caller] = true;
    }

    std::vector<FunctionId> out;
    for (FunctionId id = 0; id < n; ++id) {
        if (recursive[id])
            out.push_back(id);
    }
    return out;
}

std::vector<FunctionId> dead_functions(const CallGraph &graph) {
    std::vector<bool> called(graph.functions.size(), false);
    for (const auto &e : graph.edges)
        called[e.callee] = true;
    std::vector<FunctionId> out;
    for (FunctionId id = 0; id < graph.functions.size(); ++id) {
        if (!called[id] && !graph.functions[id].entry_point)
            out.push_back(id);
    }
    return out;
}

std::vector<int> call_depths(const CallGraph &graph, FunctionId root) {
    std::vector<int> depth(graph.functions.size(), -1);
    if (root >= graph.functions.size())
        return depth;
    Adjacency adj = call_successors(graph);
    std::queue<FunctionId> queue;
    depth[root] = 0;
    queue.push(root);
    while (!queue.empty()) {
        FunctionId f = queue.front();
        queue.pop();
        for (FunctionId next : adj[f]) {
            if (depth[next] == -1) {
                depth[next] = depth[f] + 1;
                queue.push(next);
            }
        }
    }
    return depth;
}

void find_call_chains(const CallGraph &graph, FunctionId from, FunctionId to, size_t max_depth,
                      const ChainCallback &callback) {
    if (from >= graph.functions.size() || to >= graph.functions.size())
        return;
    Adjacency adj = call_successors(graph);

    // State keeps a cursor into the callee list instead of copying it
    struct State {
        FunctionId node;
        size_t next;
    };

    std::vector<State> stack;
    stack.reserve(64);
    std::vector<FunctionId> current_path;
    std::unordered_set<FunctionId> in_path;

    stack.push_back({from, 0});
    current_path.push_back(from);
    in_path.insert(from);

    while (!stack.empty()) {
        State &state = stack.back();

        // Check if we've reached the target
        if (state.node == to) {
            if (!callback(current_path)) {
                return; // Callback requested stop
            }
            in_path.erase(state.node);
            current_path.pop_back();
            stack.pop_back();
            continue;
        }

        bool found_next = false;
        if (current_path.size() <= max_depth) {
            while (state.next < adj[state.node].size()) {
                FunctionId callee = adj[state.node][state.next++];

                // Skip if already in path (cycle)
                if (in_path.count(callee)) {
                    continue;
                }
                stack.push_back({callee, 0});
                current_path.push_back(callee);
                in_path.insert(callee);
                found_next = true;
                break;
            }
        }

        if (!found_next) {
            in_path.erase(state.node);
            current_path.pop_back();
            stack.pop_back();
        }
    }
}

} // namespace codegraph
