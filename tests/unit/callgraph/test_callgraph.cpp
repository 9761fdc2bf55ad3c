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
#include "codegraph/callgraph.hpp"
#include <stdexcept>

using namespace codegraph;

class CallGraphTest : public ::testing::Test {
protected:
    WorkerPool pool{2};
    std::vector<std::string> entries = {"main", "test_*"};

    static NodeId add_function(SyntaxTree &tree, const std::string &name, uint32_t line,
                               NodeId parent = INVALID_NODE) {
        DeclNode decl;
        decl.kind = DeclKind::Function;
        decl.name = name;
        decl.qualified_name = name;
        decl.file = tree.file;
        decl.start_line = line;
        decl.end_line = line + 2;
        decl.parent = parent;
        return tree.decls.add(std::move(decl));
    }

    static void add_call(SyntaxTree &tree, NodeId parent, const std::string &target, uint32_t line) {
        DeclNode decl;
        decl.kind = DeclKind::CallSite;
        decl.name = target;
        decl.target = target;
        decl.file = tree.file;
        decl.start_line = line;
        decl.end_line = line;
        decl.parent = parent;
        tree.decls.add(std::move(decl));
    }

    static SyntaxTree make_tree(const std::string &file) {
        SyntaxTree tree;
        tree.file = file;
        tree.language = "JavaScript";
        return tree;
    }

    // main -> f <-> g, h -> h
    std::vector<SyntaxTree> mutual() const {
        SyntaxTree tree = make_tree("a.js");
        NodeId main = add_function(tree, "main", 1);
        NodeId f = add_function(tree, "f", 2);
        NodeId g = add_function(tree, "g", 5);
        NodeId h = add_function(tree, "h", 8);
        add_call(tree, main, "f", 1);
        add_call(tree, f, "g", 3);
        add_call(tree, g, "f", 6);
        add_call(tree, h, "h", 9);
        return {tree};
    }
};

TEST_F(CallGraphTest, Build_QualifiedNamesAndEdges) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    ASSERT_EQ(graph.functions.size(), 4u);
    EXPECT_EQ(graph.functions[0].qualified_name, "a::main");
    EXPECT_EQ(graph.functions[1].qualified_name, "a::f");
    EXPECT_EQ(graph.functions[3].qualified_name, "a::h");
    EXPECT_TRUE(graph.functions[0].entry_point);
    EXPECT_FALSE(graph.functions[1].entry_point);

    EXPECT_EQ(graph.edges.size(), 4u);
    EXPECT_EQ(graph.callees(0), (std::vector<FunctionId>{1}));
    EXPECT_EQ(graph.callers(1), (std::vector<FunctionId>{0, 2}));
    EXPECT_TRUE(graph.unresolved.empty());
}

TEST_F(CallGraphTest, RecursiveFunctions_CyclesAndSelfCalls) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    EXPECT_EQ(recursive_functions(graph), (std::vector<FunctionId>{1, 2, 3}));
}

TEST_F(CallGraphTest, DeadFunctions_SelfCallCountsAsCaller) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    EXPECT_TRUE(dead_functions(graph).empty());
}

TEST_F(CallGraphTest, DeadFunctions_UncalledFunction) {
    SyntaxTree tree = make_tree("b.js");
    NodeId main = add_function(tree, "main", 1);
    NodeId walk = add_function(tree, "walk", 4);
    add_function(tree, "unused", 8);
    add_call(tree, main, "walk", 2);
    add_call(tree, walk, "walk", 5);

    CallGraph graph = build_call_graph({tree}, entries, pool);

    ASSERT_EQ(graph.functions.size(), 3u);
    EXPECT_EQ(graph.functions[2].qualified_name, "b::unused");
    EXPECT_EQ(recursive_functions(graph), (std::vector<FunctionId>{1}));
    EXPECT_EQ(dead_functions(graph), (std::vector<FunctionId>{2}));
}

TEST_F(CallGraphTest, CallDepths) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    EXPECT_EQ(call_depths(graph, 0), (std::vector<int>{0, 1, 2, -1}));
    EXPECT_EQ(call_depths(graph, 1)[2], 1);
    EXPECT_EQ(call_depths(graph, 99), (std::vector<int>{-1, -1, -1, -1}));
}

TEST_F(CallGraphTest, FindCallChains) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    std::vector<std::vector<FunctionId>> chains;
    find_call_chains(graph, 0, 2, 10, [&](const std::vector<FunctionId> &chain) {
        chains.push_back(chain);
        return true;
    });
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0], (std::vector<FunctionId>{0, 1, 2}));

    chains.clear();
    find_call_chains(graph, 0, 3, 10, [&](const std::vector<FunctionId> &chain) {
        chains.push_back(chain);
        return true;
    });
    EXPECT_TRUE(chains.empty());
}

TEST_F(CallGraphTest, FindCallChains_RespectsMaxDepth) {
    CallGraph graph = build_call_graph(mutual(), entries, pool);

    size_t found = 0;
    find_call_chains(graph, 0, 2, 1, [&](const std::vector<FunctionId> &) {
        ++found;
        return true;
    });
    EXPECT_EQ(found, 0u);
}

TEST_F(CallGraphTest, Resolve_AmbiguousPicksFirstByName) {
    SyntaxTree a = make_tree("a.js");
    add_function(a, "helper", 1);
    SyntaxTree b = make_tree("b.js");
    add_function(b, "helper", 1);
    SyntaxTree c = make_tree("c.js");
    NodeId run = add_function(c, "run", 1);
    add_call(c, run, "helper", 2);

    CallGraph graph = build_call_graph({a, b, c}, entries, pool);

    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.functions[graph.edges[0].callee].qualified_name, "a::helper");
    EXPECT_TRUE(graph.edges[0].ambiguous);
    EXPECT_EQ(graph.edges[0].line, 2u);
}

TEST_F(CallGraphTest, Resolve_LocalDefinitionWins) {
    SyntaxTree a = make_tree("a.js");
    add_function(a, "helper", 1);
    SyntaxTree b = make_tree("b.js");
    add_function(b, "helper", 1);
    NodeId run = add_function(b, "run", 5);
    add_call(b, run, "helper", 6);

    CallGraph graph = build_call_graph({a, b}, entries, pool);

    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.functions[graph.edges[0].callee].qualified_name, "b::helper");
    EXPECT_FALSE(graph.edges[0].ambiguous);
}

TEST_F(CallGraphTest, Resolve_SelfMethodCall) {
    SyntaxTree tree = make_tree("shop.js");
    DeclNode cls;
    cls.kind = DeclKind::Class;
    cls.name = "Cart";
    cls.qualified_name = "Cart";
    cls.file = tree.file;
    cls.start_line = 1;
    NodeId cart = tree.decls.add(std::move(cls));

    DeclNode add;
    add.kind = DeclKind::Function;
    add.name = "add";
    add.qualified_name = "Cart.add";
    add.file = tree.file;
    add.start_line = 2;
    add.parent = cart;
    NodeId add_id = tree.decls.add(std::move(add));

    DeclNode total;
    total.kind = DeclKind::Function;
    total.name = "total";
    total.qualified_name = "Cart.total";
    total.file = tree.file;
    total.start_line = 5;
    total.parent = cart;
    tree.decls.add(std::move(total));

    add_call(tree, add_id, "this.total", 3);

    CallGraph graph = build_call_graph({tree}, entries, pool);

    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.functions[graph.edges[0].callee].qualified_name, "shop::Cart.total");
    EXPECT_EQ(graph.functions[graph.edges[0].callee].class_name, "Cart");
}

TEST_F(CallGraphTest, Unresolved_RecordedWithCaller) {
    SyntaxTree tree = make_tree("a.js");
    NodeId main = add_function(tree, "main", 1);
    add_call(tree, main, "missing", 2);

    CallGraph graph = build_call_graph({tree}, entries, pool);

    EXPECT_TRUE(graph.edges.empty());
    ASSERT_EQ(graph.unresolved.size(), 1u);
    EXPECT_EQ(graph.unresolved[0].target, "missing");
    EXPECT_EQ(graph.unresolved[0].caller, 0u);
}

TEST_F(CallGraphTest, TopLevelCalls_BelongToModuleFunction) {
    SyntaxTree tree = make_tree("lib/boot.js");
    add_call(tree, INVALID_NODE, "start", 10);
    add_function(tree, "start", 2);

    CallGraph graph = build_call_graph({tree}, entries, pool);

    ASSERT_EQ(graph.functions.size(), 2u);
    EXPECT_EQ(graph.functions[0].qualified_name, "lib/boot::<module>");
    EXPECT_TRUE(graph.functions[0].entry_point);
    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.edges[0].caller, 0u);
    EXPECT_EQ(graph.edges[0].callee, 1u);
    EXPECT_TRUE(dead_functions(graph).empty());
}

TEST_F(CallGraphTest, FunctionTable_SealedLifecycle) {
    FunctionTable table;
    FunctionEntry entry;
    entry.qualified_name = "m::run";
    entry.name = "run";
    table.register_function(entry);

    EXPECT_THROW(table.find("m::run"), std::logic_error);
    table.seal();
    EXPECT_EQ(table.find("m::run"), 0u);
    EXPECT_EQ(table.find("m::nope"), INVALID_NODE);
    EXPECT_EQ(table.by_name("run").size(), 1u);
    EXPECT_TRUE(table.by_name("nope").empty());
    EXPECT_EQ(table.lookup("run"), (std::vector<FunctionId>{0}));
    EXPECT_THROW(table.register_function(entry), std::logic_error);
}

TEST_F(CallGraphTest, ModuleOf) {
    EXPECT_EQ(module_of("pkg/util.py"), "pkg/util");
    EXPECT_EQ(module_of("main.c"), "main");
}

TEST_F(CallGraphTest, MatchesGlob) {
    EXPECT_TRUE(matches_glob("test_parse", "test_*"));
    EXPECT_TRUE(matches_glob("main", "main"));
    EXPECT_TRUE(matches_glob("TestA", "Test?"));
    EXPECT_FALSE(matches_glob("maint", "main"));
    EXPECT_FALSE(matches_glob("parse_test", "test_*"));
}
