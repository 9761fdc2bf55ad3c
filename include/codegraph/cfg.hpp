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
// Control-flow graph of one function
// ============================================================================
enum class BlockKind { Entry, Normal, Branch, Loop, Return, Exit };

enum class ControlKind { Sequential, TrueBranch, FalseBranch, LoopBack, Break, Continue };

const char *block_kind_to_string(BlockKind kind);
const char *control_kind_to_string(ControlKind kind);

struct BasicBlock {
    BlockKind kind = BlockKind::Normal;
    std::vector<NodeId> statements; // ids into the function's StatementTree
    uint32_t start_line = 0;
    uint32_t end_line = 0;
};

using ControlEdge = Edge<ControlKind>;

struct ControlFlowGraph {
    NodeArena<BasicBlock> blocks;
    std::vector<ControlEdge> edges;
    NodeId entry = 0;

    // Block holding a statement, or INVALID_NODE for headers that own no code (else)
    NodeId block_of(NodeId stmt) const;
};

// Natural loop: header block plus every block of its body
struct LoopInfo {
    NodeId header;
    std::vector<NodeId> blocks;
};

ControlFlowGraph build_cfg(const StatementTree &tree, const LanguageProfile &profile);

// Blocks reachable from Entry, ascending
std::vector<NodeId> reachable_blocks(const ControlFlowGraph &cfg);

// Blocks with no path from Entry (code after return, break, ...)
std::vector<NodeId> unreachable_blocks(const ControlFlowGraph &cfg);

// 1 + number of extra conditional successors of each decision block
int cyclomatic_complexity(const ControlFlowGraph &cfg);

std::vector<LoopInfo> find_loops(const ControlFlowGraph &cfg);

} // namespace codegraph
