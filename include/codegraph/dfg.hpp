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
#include "statements.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace codegraph {

// ============================================================================
// Data-flow graph of one function
// ============================================================================
enum class VarKind { Definition, Use, Parameter, Constant, Operation, Call };

// DefUse: reaching definition -> use. Flow: value feeds an operation, call or definition.
enum class DataKind { DefUse, Flow };

const char *var_kind_to_string(VarKind kind);
const char *data_kind_to_string(DataKind kind);

struct VarNode {
    VarKind kind = VarKind::Use;
    std::string name;               // variable, literal, operator or callee
    uint32_t line = 0;
    NodeId statement = INVALID_NODE; // INVALID_NODE for parameters
    bool exported = false;          // global/nonlocal/export
    std::string signature;          // Operation: operator plus operand definitions
};

using DataEdge = Edge<DataKind>;

struct DataFlowGraph {
    NodeArena<VarNode> nodes;
    std::vector<DataEdge> edges;

    std::vector<NodeId> of_kind(VarKind kind) const;
};

struct Lifetime {
    std::string name;
    NodeId definition = INVALID_NODE; // first definition for per-variable lifetimes
    uint32_t first_line = 0;
    uint32_t last_line = 0;
};

struct RedundantPair {
    NodeId first;
    NodeId second;
};

// `parameters_line` is the line parameters are attributed to
DataFlowGraph build_dfg(const StatementTree &tree, const std::vector<std::string> &parameters,
                        const LanguageProfile &profile, uint32_t parameters_line = 0);

// Definitions that reach no use and are not exported
std::vector<NodeId> unused_definitions(const DataFlowGraph &dfg);

// From a definition to the last use it reaches
Lifetime lifetime(const DataFlowGraph &dfg, NodeId definition);

// From the first definition of each variable to its last use, sorted by name
std::vector<Lifetime> variable_lifetimes(const DataFlowGraph &dfg);

// Later operation recomputing an earlier one from the same definitions
std::vector<RedundantPair> redundant_computations(const DataFlowGraph &dfg);

} // namespace codegraph
