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
#include "parser.hpp"
#include "pdg.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codegraph {

using json = nlohmann::json;

// ============================================================================
// Graph document - the one interchange shape every graph kind exports to
// ============================================================================

// Serialized as {"id", "kind", "label", <attrs...>}
struct DocNode {
    NodeId id = 0;
    std::string kind;
    std::string label;
    json attrs = json::object();
};

// Serialized as {"from", "to", "kind", <attrs...>}
struct DocEdge {
    NodeId from = 0;
    NodeId to = 0;
    std::string kind;
    json attrs = json::object();
};

class GraphDocument {
public:
    std::string graph_kind; // syntax-tree, control-flow, data-flow, ...
    std::string name;       // file or function the graph describes
    std::vector<DocNode> nodes;
    std::vector<DocEdge> edges;
    json metadata = json::object();

    json to_json() const;

    // Throws InvalidRequest naming the first missing or mistyped field, or
    // an incompatible schema version
    static GraphDocument from_json(const json &j);

    // Write JSON; throws InvalidRequest when the path is not writable
    void save(const std::string &path) const;

    static GraphDocument load(const std::string &path);

    // Graphviz description; colors and shapes encode node kinds
    std::string to_dot() const;

    // Human-readable findings recorded by the converter
    std::vector<std::string> findings() const;
};

// Node and edge counts plus the key findings, for --format text
struct GraphSummary {
    std::string graph_kind;
    std::string name;
    size_t node_count = 0;
    size_t edge_count = 0;
    std::vector<std::string> findings;

    std::string to_text() const;
};

GraphSummary summarize(const GraphDocument &doc);

// ============================================================================
// Converters
// ============================================================================

GraphDocument to_document(const SyntaxTree &tree);

GraphDocument to_document(const ControlFlowGraph &cfg, const StatementTree &statements,
                          const std::string &function);

GraphDocument to_document(const DataFlowGraph &dfg, const std::string &function);

GraphDocument to_document(const CallGraph &graph);

GraphDocument to_document(const DependencyGraph &graph);

GraphDocument to_document(const ProgramDependenceGraph &pdg, const std::string &function);

// Write text to a file; throws InvalidRequest when it cannot be written
void write_file(const std::string &path, const std::string &content);

} // namespace codegraph
