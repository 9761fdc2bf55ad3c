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

#include "cfg.hpp"
#include "dfg.hpp"
#include "statements.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace codegraph {

// ============================================================================
// Program dependence graph of one function
// ============================================================================
enum class DependenceKind { ControlDependence, DataDependence };

const char *dependence_kind_to_string(DependenceKind kind);

struct PdgNode {
    NodeId statement = INVALID_NODE; // INVALID_NODE for the entry node
    NodeId block = INVALID_NODE;
    StmtKind kind = StmtKind::Simple;
    std::string text;
    uint32_t line = 0;

    bool is_entry() const { return statement == INVALID_NODE; }
};

using PdgEdge = Edge<DependenceKind>;

struct ProgramDependenceGraph {
    NodeArena<PdgNode> nodes; // node 0 is the entry node
    std::vector<PdgEdge> edges;
    std::vector<NodeId> stmt_to_node; // by statement id, INVALID_NODE when not in a block

    NodeId node_of(NodeId statement) const;

    // First statement node on a source line, or INVALID_NODE
    NodeId at_line(uint32_t line) const;
};

constexpr NodeId PDG_ENTRY = 0;

// Data edges come from the DFG's def-use chains (parameters hang off the
// entry node). Control edges use single-branch reachability: a block depends
// on a decision block when exactly one of its branch successors reaches it
// without passing back through the decision. Loop headers only govern their
// body. Reachable statements governed by no decision depend on the entry node.
ProgramDependenceGraph build_pdg(const StatementTree &tree, const ControlFlowGraph &cfg,
                                 const DataFlowGraph &dfg);

// Nodes that can affect `node`, including `node`, ascending
std::vector<NodeId> backward_slice(const ProgramDependenceGraph &pdg, NodeId node);

// Nodes `node` can affect, including `node`, ascending
std::vector<NodeId> forward_slice(const ProgramDependenceGraph &pdg, NodeId node);

// Groups of statement nodes with no dependence path between any two members
std::vector<std::vector<NodeId>> parallel_candidates(const ProgramDependenceGraph &pdg);

// Sinks reachable from a source over data-flow edges only (intra-procedural)
std::vector<NodeId> taint(const DataFlowGraph &dfg, const std::vector<NodeId> &sources,
                          const std::vector<NodeId> &sinks);

// A tainted sink and one source that reaches it
struct TaintFlow {
    NodeId source;
    NodeId sink;
};

// Sources are nodes named in `source_names` that define or produce a value
// (Definition, Parameter, Call); sinks are Use and Call nodes named in `sink_names`.
std::vector<TaintFlow> taint_by_name(const DataFlowGraph &dfg,
                                     const std::vector<std::string> &source_names,
                                     const std::vector<std::string> &sink_names);

} // namespace codegraph
