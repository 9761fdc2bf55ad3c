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
#include "codegraph/pdg.hpp"
#include <algorithm>

using namespace codegraph;

class PdgTest : public ::testing::Test {
protected:
    ProfileRegistry registry = ProfileRegistry::builtin();

    struct Built {
        StatementTree statements;
        ControlFlowGraph cfg;
        DataFlowGraph dfg;
        ProgramDependenceGraph pdg;
    };

    Built build(const std::string &body, const std::vector<std::string> &parameters = {}) const {
        const LanguageProfile &profile = *registry.find_by_name("JavaScript");
        Built out;
        out.statements = split_statements(body, 1, profile);
        out.cfg = build_cfg(out.statements, profile);
        out.dfg = build_dfg(out.statements, parameters, profile, 1);
        out.pdg = build_pdg(out.statements, out.cfg, out.dfg);
        return out;
    }

    static bool has_edge(const ProgramDependenceGraph &pdg, NodeId from, NodeId to, DependenceKind kind) {
        return std::any_of(pdg.edges.begin(), pdg.edges.end(), [&](const PdgEdge &e) {
            return e.from == from && e.to == to && e.kind == kind;
        });
    }

    static NodeId find_var(const DataFlowGraph &dfg, VarKind kind, const std::string &name) {
        for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
            if (dfg.nodes[id].kind == kind && dfg.nodes[id].name == name)
                return id;
        }
        return INVALID_NODE;
    }

    const std::string guarded = "let a = 1;\nlet b = a + 1;\nif (b) {\n  log(b);\n}\n";
};

TEST_F(PdgTest, Nodes_EntryThenStatementsInBlockOrder) {
    auto b = build(guarded);

    ASSERT_EQ(b.pdg.nodes.size(), 5u);
    EXPECT_TRUE(b.pdg.nodes[PDG_ENTRY].is_entry());
    EXPECT_EQ(b.pdg.nodes[3].kind, StmtKind::If);
    EXPECT_EQ(b.pdg.node_of(3), 4u);
    EXPECT_EQ(b.pdg.at_line(4), 4u);
    EXPECT_EQ(b.pdg.at_line(99), INVALID_NODE);
}

TEST_F(PdgTest, ControlDependence) {
    auto b = build(guarded);
    const auto &pdg = b.pdg;

    EXPECT_TRUE(has_edge(pdg, PDG_ENTRY, 1, DependenceKind::ControlDependence));
    EXPECT_TRUE(has_edge(pdg, PDG_ENTRY, 2, DependenceKind::ControlDependence));
    EXPECT_TRUE(has_edge(pdg, PDG_ENTRY, 3, DependenceKind::ControlDependence));
    EXPECT_TRUE(has_edge(pdg, 3, 4, DependenceKind::ControlDependence));
    EXPECT_FALSE(has_edge(pdg, PDG_ENTRY, 4, DependenceKind::ControlDependence));
}

TEST_F(PdgTest, DataDependence) {
    auto b = build(guarded);
    const auto &pdg = b.pdg;

    EXPECT_TRUE(has_edge(pdg, 1, 2, DependenceKind::DataDependence));
    EXPECT_TRUE(has_edge(pdg, 2, 3, DependenceKind::DataDependence));
    EXPECT_TRUE(has_edge(pdg, 2, 4, DependenceKind::DataDependence));
    EXPECT_FALSE(has_edge(pdg, 1, 4, DependenceKind::DataDependence));
}

TEST_F(PdgTest, Parameters_HangOffEntry) {
    auto b = build("log(p);", {"p"});

    EXPECT_TRUE(has_edge(b.pdg, PDG_ENTRY, 1, DependenceKind::DataDependence));
}

TEST_F(PdgTest, BackwardSlice) {
    auto b = build(guarded);

    auto slice = backward_slice(b.pdg, b.pdg.at_line(4));
    EXPECT_EQ(slice, (std::vector<NodeId>{0, 1, 2, 3, 4}));

    auto first = backward_slice(b.pdg, 1);
    EXPECT_EQ(first, (std::vector<NodeId>{0, 1}));
}

TEST_F(PdgTest, ForwardSlice) {
    auto b = build(guarded);

    EXPECT_EQ(forward_slice(b.pdg, 1), (std::vector<NodeId>{1, 2, 3, 4}));
    EXPECT_EQ(forward_slice(b.pdg, 4), (std::vector<NodeId>{4}));
    EXPECT_TRUE(forward_slice(b.pdg, 42).empty());
}

TEST_F(PdgTest, ParallelCandidates_IndependentStatements) {
    auto b = build("let a = 1;\nlet b = 2;\n");

    auto groups = parallel_candidates(b.pdg);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (std::vector<NodeId>{1, 2}));
}

TEST_F(PdgTest, ParallelCandidates_ChainHasNone) {
    auto b = build(guarded);

    EXPECT_TRUE(parallel_candidates(b.pdg).empty());
}

TEST_F(PdgTest, ParallelCandidates_TwoIndependentChains) {
    auto b = build("let a = 1;\nlet b = 2;\nlet c = a + 1;\nlet d = b + 1;\n");

    auto groups = parallel_candidates(b.pdg);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (std::vector<NodeId>{1, 2}));
    EXPECT_EQ(groups[1], (std::vector<NodeId>{3, 4}));
}

TEST_F(PdgTest, ParallelCandidates_LongStraightLineFunction) {
    std::string body;
    for (int i = 0; i < 3000; ++i)
        body += "let v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
    auto b = build(body);

    auto groups = parallel_candidates(b.pdg);
    ASSERT_EQ(groups.size(), 1u);
    ASSERT_EQ(groups[0].size(), 3000u);
    EXPECT_EQ(groups[0].front(), 1u);
    EXPECT_EQ(groups[0].back(), 3000u);
}

TEST_F(PdgTest, UnreachableStatementsHaveNoControlParent) {
    auto b = build("return 1;\nlog(2);\n");

    NodeId dead = b.pdg.at_line(2);
    ASSERT_NE(dead, INVALID_NODE);
    bool governed = std::any_of(b.pdg.edges.begin(), b.pdg.edges.end(), [&](const PdgEdge &e) {
        return e.to == dead && e.kind == DependenceKind::ControlDependence;
    });
    EXPECT_FALSE(governed);
}

TEST_F(PdgTest, Taint_FollowsAssignments) {
    auto b = build("let x = input();\nlet y = x;\nexec(y);\n");

    NodeId source = find_var(b.dfg, VarKind::Call, "input");
    NodeId sink = find_var(b.dfg, VarKind::Call, "exec");
    ASSERT_NE(source, INVALID_NODE);
    ASSERT_NE(sink, INVALID_NODE);
    EXPECT_EQ(taint(b.dfg, {source}, {sink}), (std::vector<NodeId>{sink}));

    auto flows = taint_by_name(b.dfg, {"input"}, {"exec"});
    ASSERT_EQ(flows.size(), 1u);
    EXPECT_EQ(flows[0].source, source);
    EXPECT_EQ(flows[0].sink, sink);
}

TEST_F(PdgTest, Taint_UnrelatedSinkIsClean) {
    auto b = build("let x = input();\nexec(\"ls\");\n");

    EXPECT_TRUE(taint_by_name(b.dfg, {"input"}, {"exec"}).empty());
}

TEST_F(PdgTest, Taint_FlowsThroughCalledLocalFunction) {
    auto b = build("let h = source();\nlet res = h(1);\nsink(res);\n");

    auto flows = taint_by_name(b.dfg, {"source"}, {"sink"});
    ASSERT_EQ(flows.size(), 1u);
    EXPECT_EQ(flows[0].sink, find_var(b.dfg, VarKind::Call, "sink"));
}

TEST_F(PdgTest, KindNames) {
    EXPECT_STREQ(dependence_kind_to_string(DependenceKind::ControlDependence), "control");
    EXPECT_STREQ(dependence_kind_to_string(DependenceKind::DataDependence), "data");
}
