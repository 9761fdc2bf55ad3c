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
#include "codegraph/dfg.hpp"
#include <algorithm>

using namespace codegraph;

class DfgTest : public ::testing::Test {
protected:
    ProfileRegistry registry = ProfileRegistry::builtin();

    DataFlowGraph build(const std::string &body, const std::string &language = "JavaScript",
                        const std::vector<std::string> &parameters = {}) const {
        const LanguageProfile &profile = *registry.find_by_name(language);
        StatementTree tree = split_statements(body, 1, profile);
        return build_dfg(tree, parameters, profile, 1);
    }

    // First node of a kind with this name
    static NodeId find(const DataFlowGraph &dfg, VarKind kind, const std::string &name) {
        for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
            if (dfg.nodes[id].kind == kind && dfg.nodes[id].name == name)
                return id;
        }
        return INVALID_NODE;
    }

    static size_t reaching(const DataFlowGraph &dfg, NodeId use) {
        return static_cast<size_t>(std::count_if(dfg.edges.begin(), dfg.edges.end(), [&](const DataEdge &e) {
            return e.kind == DataKind::DefUse && e.to == use;
        }));
    }
};

TEST_F(DfgTest, DefUse_ChainsDefinitionToUse) {
    auto dfg = build("let a = 1; let b = a + 1;");

    NodeId def_a = find(dfg, VarKind::Definition, "a");
    NodeId use_a = find(dfg, VarKind::Use, "a");
    ASSERT_NE(def_a, INVALID_NODE);
    ASSERT_NE(use_a, INVALID_NODE);

    bool linked = std::any_of(dfg.edges.begin(), dfg.edges.end(), [&](const DataEdge &e) {
        return e.kind == DataKind::DefUse && e.from == def_a && e.to == use_a;
    });
    EXPECT_TRUE(linked);
    EXPECT_EQ(dfg.of_kind(VarKind::Operation).size(), 1u);
}

TEST_F(DfgTest, UnusedDefinitions_ReportsOnlyUnreadValues) {
    auto dfg = build("let a = 1; let b = a + 1;");

    auto unused = unused_definitions(dfg);
    ASSERT_EQ(unused.size(), 1u);
    EXPECT_EQ(dfg.nodes[unused[0]].name, "b");
}

TEST_F(DfgTest, UnusedDefinitions_IgnoresParameters) {
    auto dfg = build("return 1;", "JavaScript", {"p"});

    ASSERT_EQ(dfg.of_kind(VarKind::Parameter).size(), 1u);
    EXPECT_EQ(dfg.nodes[dfg.of_kind(VarKind::Parameter)[0]].line, 1u);
    EXPECT_TRUE(unused_definitions(dfg).empty());
}

TEST_F(DfgTest, UnusedDefinitions_IgnoresExported) {
    auto js = build("export let x = 1;");
    NodeId x = find(js, VarKind::Definition, "x");
    ASSERT_NE(x, INVALID_NODE);
    EXPECT_TRUE(js.nodes[x].exported);
    EXPECT_TRUE(unused_definitions(js).empty());

    auto py = build("global g\ng = 1\n", "Python");
    NodeId g = find(py, VarKind::Definition, "g");
    ASSERT_NE(g, INVALID_NODE);
    EXPECT_TRUE(py.nodes[g].exported);
    EXPECT_TRUE(unused_definitions(py).empty());
}

TEST_F(DfgTest, Branches_BothDefinitionsReachTheJoin) {
    auto dfg = build("let x = 1;\nif (c) {\n  x = 2;\n}\nlog(x);\n");

    NodeId use = INVALID_NODE;
    for (NodeId id : dfg.of_kind(VarKind::Use)) {
        if (dfg.nodes[id].name == "x")
            use = id;
    }
    ASSERT_NE(use, INVALID_NODE);
    EXPECT_EQ(dfg.nodes[use].line, 5u);
    EXPECT_EQ(reaching(dfg, use), 2u);
    EXPECT_TRUE(unused_definitions(dfg).empty());
}

TEST_F(DfgTest, Loop_CarriesDefinitionToNextIteration) {
    auto dfg = build("let i = 0;\nwhile (i < 3) {\n  i = i + 1;\n}\n");

    NodeId condition_use = find(dfg, VarKind::Use, "i");
    ASSERT_NE(condition_use, INVALID_NODE);
    EXPECT_EQ(dfg.nodes[condition_use].line, 2u);
    EXPECT_EQ(reaching(dfg, condition_use), 2u);
    EXPECT_TRUE(unused_definitions(dfg).empty());
}

TEST_F(DfgTest, CallsAndConstants) {
    auto dfg = build("let s = format(\"%d\", n);");

    NodeId call = find(dfg, VarKind::Call, "format");
    ASSERT_NE(call, INVALID_NODE);
    EXPECT_EQ(dfg.of_kind(VarKind::Constant).size(), 1u);

    NodeId n = find(dfg, VarKind::Use, "n");
    ASSERT_NE(n, INVALID_NODE);
    bool argument = std::any_of(dfg.edges.begin(), dfg.edges.end(), [&](const DataEdge &e) {
        return e.kind == DataKind::Flow && e.from == n && e.to == call;
    });
    EXPECT_TRUE(argument);
}

TEST_F(DfgTest, CalledFunctionValue_ReadsItsBinding) {
    auto dfg = build("const cb = (x) => x + 1;\nreturn cb(2);\n");

    NodeId def = find(dfg, VarKind::Definition, "cb");
    NodeId use = find(dfg, VarKind::Use, "cb");
    NodeId call = find(dfg, VarKind::Call, "cb");
    ASSERT_NE(def, INVALID_NODE);
    ASSERT_NE(use, INVALID_NODE);
    ASSERT_NE(call, INVALID_NODE);
    EXPECT_EQ(dfg.nodes[use].line, 2u);
    EXPECT_EQ(reaching(dfg, use), 1u);
    bool feeds_call = std::any_of(dfg.edges.begin(), dfg.edges.end(), [&](const DataEdge &e) {
        return e.kind == DataKind::Flow && e.from == use && e.to == call;
    });
    EXPECT_TRUE(feeds_call);
    EXPECT_TRUE(unused_definitions(dfg).empty());
}

TEST_F(DfgTest, CalledFunctionValue_PythonLambdaAndNestedDef) {
    auto lambda = build("f = lambda x: x + 1\nreturn f(3)\n", "Python");
    ASSERT_NE(find(lambda, VarKind::Definition, "f"), INVALID_NODE);
    EXPECT_TRUE(unused_definitions(lambda).empty());

    auto nested = build("def inner(y):\n    return y\nreturn inner(1)\n", "Python");
    ASSERT_NE(find(nested, VarKind::Definition, "inner"), INVALID_NODE);
    EXPECT_EQ(reaching(nested, find(nested, VarKind::Use, "inner")), 1u);
    EXPECT_TRUE(unused_definitions(nested).empty());
}

TEST_F(DfgTest, CallToUnknownName_CreatesNoUse) {
    auto dfg = build("let r = compute(1);\nlog(r);\n");

    EXPECT_EQ(find(dfg, VarKind::Use, "compute"), INVALID_NODE);
    EXPECT_NE(find(dfg, VarKind::Call, "compute"), INVALID_NODE);
}

TEST_F(DfgTest, Keywords_OtherLanguagesWordsAreVariables) {
    auto js = build("let end = start + 1;\nreturn end;\n");
    NodeId end = find(js, VarKind::Definition, "end");
    ASSERT_NE(end, INVALID_NODE);
    EXPECT_EQ(reaching(js, find(js, VarKind::Use, "end")), 1u);
    EXPECT_TRUE(unused_definitions(js).empty());

    auto py = build("type = get()\nout = type + 1\nreturn out\n", "Python");
    ASSERT_NE(find(py, VarKind::Definition, "type"), INVALID_NODE);
    ASSERT_NE(find(py, VarKind::Definition, "out"), INVALID_NODE);
    EXPECT_EQ(reaching(py, find(py, VarKind::Use, "type")), 1u);
    EXPECT_EQ(reaching(py, find(py, VarKind::Use, "out")), 1u);
    EXPECT_TRUE(unused_definitions(py).empty());
}

TEST_F(DfgTest, Keywords_ReservedWordsAreNotVariables) {
    auto dfg = build("int total = 0;\ntotal = total + sizeof(int);\n", "C");

    EXPECT_EQ(find(dfg, VarKind::Definition, "int"), INVALID_NODE);
    EXPECT_EQ(find(dfg, VarKind::Use, "int"), INVALID_NODE);
    EXPECT_NE(find(dfg, VarKind::Definition, "total"), INVALID_NODE);
}

TEST_F(DfgTest, VariableLifetimes_SortedByName) {
    auto dfg = build("let b = 2;\nlet a = 1;\nlog(a);\nlog(a, b);\n");

    auto lifetimes = variable_lifetimes(dfg);
    ASSERT_EQ(lifetimes.size(), 2u);
    EXPECT_EQ(lifetimes[0].name, "a");
    EXPECT_EQ(lifetimes[0].first_line, 2u);
    EXPECT_EQ(lifetimes[0].last_line, 4u);
    EXPECT_EQ(lifetimes[1].name, "b");
    EXPECT_EQ(lifetimes[1].first_line, 1u);
    EXPECT_EQ(lifetimes[1].last_line, 4u);
}

TEST_F(DfgTest, Lifetime_OfUnusedDefinitionIsOneLine) {
    auto dfg = build("let a = 1;\nlet b = 2;\n");

    Lifetime lt = lifetime(dfg, find(dfg, VarKind::Definition, "b"));
    EXPECT_EQ(lt.first_line, 2u);
    EXPECT_EQ(lt.last_line, 2u);
}

TEST_F(DfgTest, RedundantComputations) {
    auto dfg = build("let a = 1;\nlet x = a + 1;\nlet y = a + 1;\nlet z = a * 2;\n");

    auto pairs = redundant_computations(dfg);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(dfg.nodes[pairs[0].first].line, 2u);
    EXPECT_EQ(dfg.nodes[pairs[0].second].line, 3u);
}

TEST_F(DfgTest, RedundantComputations_DifferentDefinitionsDiffer) {
    auto dfg = build("let a = 1;\nlet x = a + 1;\na = 5;\nlet y = a + 1;\n");

    EXPECT_TRUE(redundant_computations(dfg).empty());
}

TEST_F(DfgTest, KindNames) {
    EXPECT_STREQ(var_kind_to_string(VarKind::Definition), "definition");
    EXPECT_STREQ(data_kind_to_string(DataKind::DefUse), "def_use");
}
