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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codegraph {

// Index into a NodeArena. Edges always reference nodes by index.
using NodeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;

// ============================================================================
// String Pool - Intern strings to avoid duplication
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(const std::string &str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = strings_.size();
        strings_.push_back(str);
        // deque keeps element addresses stable, so the view stays valid
        index_[strings_.back()] = idx;
        return idx;
    }

    // Get string by index
    const std::string &get(size_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns SIZE_MAX if not found)
    size_t find(const std::string &str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : SIZE_MAX;
    }

    bool contains(const std::string &str) const { return index_.find(str) != index_.end(); }

    size_t size() const { return strings_.size(); }

    void clear() {
        strings_.clear();
        index_.clear();
    }

    auto begin() const { return strings_.begin(); }
    auto end() const { return strings_.end(); }

private:
    std::deque<std::string> strings_;
    std::unordered_map<std::string_view, size_t> index_;
};

// ============================================================================
// Node arena - contiguous, indexed storage that never frees mid-analysis
// ============================================================================
template <typename T>
class NodeArena {
public:
    NodeId add(T node) {
        NodeId id = static_cast<NodeId>(nodes_.size());
        nodes_.push_back(std::move(node));
        return id;
    }

    T &operator[](NodeId id) { return nodes_[id]; }
    const T &operator[](NodeId id) const { return nodes_[id]; }

    bool contains(NodeId id) const { return id < nodes_.size(); }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    auto begin() { return nodes_.begin(); }
    auto end() { return nodes_.end(); }
    auto begin() const { return nodes_.begin(); }
    auto end() const { return nodes_.end(); }

private:
    std::vector<T> nodes_;
};

// Typed edge between two arena indices
template <typename Kind>
struct Edge {
    NodeId from;
    NodeId to;
    Kind kind;
};

// Adjacency lists built from an edge list: out[n] / in[n]
using Adjacency = std::vector<std::vector<NodeId>>;

template <typename Kind>
Adjacency successors(size_t node_count, const std::vector<Edge<Kind>> &edges) {
    Adjacency adj(node_count);
    for (const auto &e : edges) {
        adj[e.from].push_back(e.to);
    }
    return adj;
}

template <typename Kind>
Adjacency predecessors(size_t node_count, const std::vector<Edge<Kind>> &edges) {
    Adjacency adj(node_count);
    for (const auto &e : edges) {
        adj[e.to].push_back(e.from);
    }
    return adj;
}

// Strongly connected components (iterative Tarjan), in reverse topological
// order of the condensation: a component is emitted after every component
// it reaches.
inline std::vector<std::vector<NodeId>> strongly_connected_components(const Adjacency &adj) {
    size_t n = adj.size();
    std::vector<int> index(n, -1), low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<NodeId> stack;
    std::vector<std::vector<NodeId>> components;
    int counter = 0;

    struct Frame {
        NodeId node;
        size_t next;
    };

    for (NodeId root = 0; root < n; ++root) {
        if (index[root] != -1)
            continue;
        std::vector<Frame> frames = {{root, 0}};
        index[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!frames.empty()) {
            Frame &f = frames.back();
            if (f.next < adj[f.node].size()) {
                NodeId w = adj[f.node][f.next++];
                if (index[w] == -1) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    frames.push_back({w, 0});
                } else if (on_stack[w]) {
                    low[f.node] = std::min(low[f.node], index[w]);
                }
                continue;
            }

            NodeId v = f.node;
            if (low[v] == index[v]) {
                std::vector<NodeId> component;
                NodeId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                components.push_back(std::move(component));
            }
            frames.pop_back();
            if (!frames.empty()) {
                NodeId parent = frames.back().node;
                low[parent] = std::min(low[parent], low[v]);
            }
        }
    }
    return components;
}

// ============================================================================
// Declarations produced by the syntax extractor
// ============================================================================
enum class DeclKind { Function, Class, Import, Variable, CallSite };

enum class Visibility { Public, Private, Protected, Unknown };

inline const char *decl_kind_to_string(DeclKind kind) {
    switch (kind) {
    case DeclKind::Function:
        return "function";
    case DeclKind::Class:
        return "class";
    case DeclKind::Import:
        return "import";
    case DeclKind::Variable:
        return "variable";
    case DeclKind::CallSite:
        return "call_site";
    }
    return "unknown";
}

inline const char *visibility_to_string(Visibility v) {
    switch (v) {
    case Visibility::Public:
        return "public";
    case Visibility::Private:
        return "private";
    case Visibility::Protected:
        return "protected";
    default:
        return "unknown";
    }
}

// One declaration in a file. Immutable once the extractor returns.
struct DeclNode {
    DeclKind kind = DeclKind::Function;
    std::string name;           // Simple name as written
    std::string qualified_name; // Class/namespace qualified, without module path
    std::string file;           // Project-relative source file
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    Visibility visibility = Visibility::Unknown;
    std::string language;
    NodeId parent = INVALID_NODE; // Enclosing class or function
    std::string target;           // CallSite: callee text, Import: import target
};

} // namespace codegraph
