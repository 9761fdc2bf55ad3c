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

#include <gtest/gtest.h>
#include "codegraph/cfg.hpp"
#include <algorithm>

using namespace codegraph;

class CfgTest : public ::testing::Test {
protected:
    ProfileRegistry registry = ProfileRegistry::builtin();

    struct Built {
        StatementTree statements;
        ControlFlowGraph cfg;
    };

    Built build(const std::string &body, const std::string &language = "JavaScript") const {
        const LanguageProfile &profile = *registry.find_by_name(language);
        Built out;
        out.statements = split_statements(body, 1, profile);
        out.cfg = build_cfg(out.statements, profile);
        return out;
    }

    static bool contains(const std::vector<NodeId> &ids, NodeId id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    static size_t count_edges(const ControlFlowGraph &cfg, ControlKind kind) {
        return static_cast<size_t>(std::count_if(cfg.edges.begin(), cfg.edges.end(),
                                                 [&](const ControlEdge &e) { return e.kind == kind; }));
    }
};

TEST_F(CfgTest, StraightLine_SingleEntryBlock) {
    auto b = build("let a = 1; let b = a + 1;");

    EXPECT_EQ(b.cfg.blocks[b.cfg.entry].kind, BlockKind::Entry);
    EXPECT_EQ(b.cfg.block_of(0), b.cfg.entry);
    EXPECT_EQ(b.cfg.block_of(1), b.cfg.entry);
    EXPECT_EQ(cyclomatic_complexity(b.cfg), 1);
    EXPECT_TRUE(unreachable_blocks(b.cfg).empty());
}

TEST_F(CfgTest, IfElseReturns_TrailingCodeUnreachable) {
    auto b = build("if (x) { return 1; } else { return 2; } log(\"unreachable\");");

    NodeId branch = b.cfg.block_of(0);
    ASSERT_NE(branch, INVALID_NODE);
    EXPECT_EQ(b.cfg.blocks[branch].kind, BlockKind::Branch);
    EXPECT_EQ(b.cfg.blocks[b.cfg.block_of(1)].kind, BlockKind::Return);
    EXPECT_EQ(b.cfg.blocks[b.cfg.block_of(3)].kind, BlockKind::Return);
    EXPECT_EQ(b.cfg.block_of(2), INVALID_NODE);

    NodeId trailing = b.cfg.block_of(4);
    ASSERT_NE(trailing, INVALID_NODE);
    auto dead = unreachable_blocks(b.cfg);
    EXPECT_TRUE(contains(dead, trailing));
    EXPECT_FALSE(contains(dead, b.cfg.entry));
    EXPECT_EQ(cyclomatic_complexity(b.cfg), 2);
}

TEST_F(CfgTest, ReachablePartition) {
    auto b = build("if (x) { return 1; } else { return 2; } log(\"unreachable\");");

    auto live = reachable_blocks(b.cfg);
    auto dead = unreachable_blocks(b.cfg);
    EXPECT_EQ(live.size() + dead.size(), b.cfg.blocks.size());
    for (NodeId id : live)
        EXPECT_FALSE(contains(dead, id));
    EXPECT_TRUE(contains(live, b.cfg.entry));
}

TEST_F(CfgTest, IfWithoutElse_JoinsBothPaths) {
    auto b = build("if (x) { y = 1; } z = 2;");

    NodeId branch = b.cfg.block_of(0);
    NodeId after = b.cfg.block_of(2);
    EXPECT_EQ(count_edges(b.cfg, ControlKind::TrueBranch), 1u);
    EXPECT_EQ(count_edges(b.cfg, ControlKind::FalseBranch), 1u);

    bool false_to_join = std::any_of(b.cfg.edges.begin(), b.cfg.edges.end(), [&](const ControlEdge &e) {
        return e.from == branch && e.to == after && e.kind == ControlKind::FalseBranch;
    });
    EXPECT_TRUE(false_to_join);
    EXPECT_TRUE(unreachable_blocks(b.cfg).empty());
}

TEST_F(CfgTest, WhileLoop_BackEdgeAndLoopInfo) {
    auto b = build("let i = 0; while (i < 3) { i = i + 1; } return i;");

    NodeId header = b.cfg.block_of(1);
    NodeId body = b.cfg.block_of(2);
    EXPECT_EQ(b.cfg.blocks[header].kind, BlockKind::Loop);
    EXPECT_EQ(count_edges(b.cfg, ControlKind::LoopBack), 1u);

    auto loops = find_loops(b.cfg);
    ASSERT_EQ(loops.size(), 1u);
    EXPECT_EQ(loops[0].header, header);
    EXPECT_TRUE(contains(loops[0].blocks, header));
    EXPECT_TRUE(contains(loops[0].blocks, body));
    EXPECT_FALSE(contains(loops[0].blocks, b.cfg.block_of(3)));
    EXPECT_EQ(cyclomatic_complexity(b.cfg), 2);
}

TEST_F(CfgTest, InfiniteLoop_CodeAfterIsUnreachable) {
    auto b = build("while (true) { step(); } done();");

    NodeId after = b.cfg.block_of(2);
    ASSERT_NE(after, INVALID_NODE);
    EXPECT_TRUE(contains(unreachable_blocks(b.cfg), after));
}

TEST_F(CfgTest, EarlyReturnInsideLoop_StaysReachable) {
    auto b = build("while (c) { if (x) { return 1; } y(); } z();");

    EXPECT_TRUE(unreachable_blocks(b.cfg).empty());
    EXPECT_EQ(count_edges(b.cfg, ControlKind::LoopBack), 1u);

    auto live = reachable_blocks(b.cfg);
    bool return_live = std::any_of(live.begin(), live.end(), [&](NodeId id) {
        return b.cfg.blocks[id].kind == BlockKind::Return;
    });
    EXPECT_TRUE(return_live);
}

TEST_F(CfgTest, BreakLeavesLoop) {
    auto b = build("while (true) { if (x) { break; } step(); } done();");

    NodeId after = b.cfg.block_of(4);
    ASSERT_NE(after, INVALID_NODE);
    EXPECT_FALSE(contains(unreachable_blocks(b.cfg), after));
    EXPECT_EQ(count_edges(b.cfg, ControlKind::Break), 1u);
}

TEST_F(CfgTest, ContinueJumpsToHeader) {
    auto b = build("for (let i = 0; i < n; i++) { if (skip) { continue; } work(); }");

    NodeId header = b.cfg.block_of(0);
    bool to_header = std::any_of(b.cfg.edges.begin(), b.cfg.edges.end(), [&](const ControlEdge &e) {
        return e.to == header && e.kind == ControlKind::Continue;
    });
    EXPECT_TRUE(to_header);
}

TEST_F(CfgTest, ElseIfChain_Complexity) {
    auto b = build("if (a) { x(); } else if (b) { y(); } else { z(); }");

    EXPECT_EQ(cyclomatic_complexity(b.cfg), 3);
}

TEST_F(CfgTest, SwitchWithFallthrough) {
    auto b = build("switch (k) { case 1: a(); case 2: b(); break; default: c(); } end();");

    NodeId first_arm = b.cfg.block_of(1);
    NodeId second_arm = b.cfg.block_of(3);
    ASSERT_NE(first_arm, INVALID_NODE);
    ASSERT_NE(second_arm, INVALID_NODE);
    bool falls = std::any_of(b.cfg.edges.begin(), b.cfg.edges.end(), [&](const ControlEdge &e) {
        return e.from == first_arm && e.to == second_arm;
    });
    EXPECT_TRUE(falls);
    EXPECT_TRUE(unreachable_blocks(b.cfg).empty());
}

TEST_F(CfgTest, PythonTryExcept) {
    auto b = build("try:\n    run()\nexcept ValueError:\n    recover()\nfinish()\n", "Python");

    NodeId branch = b.cfg.block_of(0);
    EXPECT_EQ(b.cfg.blocks[branch].kind, BlockKind::Branch);
    EXPECT_TRUE(unreachable_blocks(b.cfg).empty());
    EXPECT_EQ(cyclomatic_complexity(b.cfg), 2);
}

TEST_F(CfgTest, Empty_OnlyEntry) {
    auto b = build("");

    EXPECT_EQ(b.cfg.blocks.size(), 1u);
    EXPECT_TRUE(b.cfg.edges.empty());
    EXPECT_EQ(cyclomatic_complexity(b.cfg), 1);
}

TEST_F(CfgTest, KindNames) {
    EXPECT_STREQ(block_kind_to_string(BlockKind::Loop), "loop");
    EXPECT_STREQ(control_kind_to_string(ControlKind::LoopBack), "loop_back");
    EXPECT_STREQ(control_kind_to_string(ControlKind::TrueBranch), "true");
}
