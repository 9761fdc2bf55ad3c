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
#include "codegraph/diagnostics.hpp"
#include "codegraph/graph.hpp"
#include "codegraph/version.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace codegraph;
namespace fs = std::filesystem;

class GraphDocumentTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    ProfileRegistry registry = ProfileRegistry::builtin();
    WorkerPool pool{2};

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "codegraph_graph_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    static GraphDocument sample() {
        GraphDocument doc;
        doc.graph_kind = "data-flow";
        doc.name = "run";
        doc.nodes.push_back({0, "definition", "x @1", json{{"line", 1}}});
        doc.nodes.push_back({1, "use", "x @2", json{{"line", 2}}});
        doc.edges.push_back({0, 1, "def_use", json::object()});
        doc.metadata["findings"] = json::array({"unused definition of 'y' at line 3"});
        return doc;
    }

    // to_json -> from_json keeps the shape and every node and edge kind
    static void expect_round_trip(const GraphDocument &doc) {
        GraphDocument back = GraphDocument::from_json(doc.to_json());
        EXPECT_EQ(back.graph_kind, doc.graph_kind);
        EXPECT_EQ(back.name, doc.name);
        ASSERT_EQ(back.nodes.size(), doc.nodes.size());
        ASSERT_EQ(back.edges.size(), doc.edges.size());
        for (size_t i = 0; i < doc.nodes.size(); ++i) {
            EXPECT_EQ(back.nodes[i].id, doc.nodes[i].id);
            EXPECT_EQ(back.nodes[i].kind, doc.nodes[i].kind);
            EXPECT_EQ(back.nodes[i].label, doc.nodes[i].label);
        }
        for (size_t i = 0; i < doc.edges.size(); ++i) {
            EXPECT_EQ(back.edges[i].from, doc.edges[i].from);
            EXPECT_EQ(back.edges[i].to, doc.edges[i].to);
            EXPECT_EQ(back.edges[i].kind, doc.edges[i].kind);
        }
        EXPECT_EQ(back.findings(), doc.findings());
    }

    static bool has_finding(const GraphDocument &doc, const std::string &text) {
        auto f = doc.findings();
        return std::find(f.begin(), f.end(), text) != f.end();
    }
};

TEST_F(GraphDocumentTest, ToJson_WritesMetadata) {
    json j = sample().to_json();

    EXPECT_EQ(j["metadata"]["version"], GRAPH_SCHEMA_VERSION);
    EXPECT_EQ(j["metadata"]["graph"], "data-flow");
    EXPECT_EQ(j["metadata"]["name"], "run");
    EXPECT_EQ(j["metadata"]["node_count"], 2);
    EXPECT_EQ(j["metadata"]["edge_count"], 1);
    EXPECT_EQ(j["nodes"][0]["line"], 1);
    EXPECT_EQ(j["edges"][0]["kind"], "def_use");
}

TEST_F(GraphDocumentTest, FromJson_RestoresDocument) {
    GraphDocument doc = GraphDocument::from_json(sample().to_json());

    EXPECT_EQ(doc.graph_kind, "data-flow");
    EXPECT_EQ(doc.name, "run");
    ASSERT_EQ(doc.nodes.size(), 2u);
    EXPECT_EQ(doc.nodes[1].kind, "use");
    EXPECT_EQ(doc.nodes[1].label, "x @2");
    EXPECT_EQ(doc.nodes[1].attrs["line"], 2);
    ASSERT_EQ(doc.edges.size(), 1u);
    EXPECT_EQ(doc.edges[0].to, 1u);
    EXPECT_EQ(doc.findings(), sample().findings());
    EXPECT_FALSE(doc.metadata.contains("version"));
}

TEST_F(GraphDocumentTest, FromJson_RejectsMalformedDocuments) {
    EXPECT_THROW(GraphDocument::from_json(json::array()), InvalidRequest);
    EXPECT_THROW(GraphDocument::from_json(json{{"edges", json::array()}}), InvalidRequest);
    EXPECT_THROW(GraphDocument::from_json(json{{"nodes", json::object()}, {"edges", json::array()}}),
                 InvalidRequest);
    EXPECT_THROW(GraphDocument::from_json(json{{"metadata", "v1"}, {"nodes", json::array()}, {"edges", json::array()}}),
                 InvalidRequest);
}

TEST_F(GraphDocumentTest, FromJson_RejectsBadNodesAndEdges) {
    json missing_kind = sample().to_json();
    missing_kind["nodes"][0].erase("kind");
    EXPECT_THROW(GraphDocument::from_json(missing_kind), InvalidRequest);

    json negative_id = sample().to_json();
    negative_id["nodes"][0]["id"] = -1;
    EXPECT_THROW(GraphDocument::from_json(negative_id), InvalidRequest);

    json duplicate = sample().to_json();
    duplicate["nodes"][1]["id"] = 0u;
    EXPECT_THROW(GraphDocument::from_json(duplicate), InvalidRequest);

    json dangling = sample().to_json();
    dangling["edges"][0]["to"] = 7u;
    EXPECT_THROW(GraphDocument::from_json(dangling), InvalidRequest);
}

TEST_F(GraphDocumentTest, FromJson_VersionCheck) {
    json newer = sample().to_json();
    newer["metadata"]["version"] = "2.0.0";
    EXPECT_THROW(GraphDocument::from_json(newer), InvalidRequest);

    json malformed = sample().to_json();
    malformed["metadata"]["version"] = "one";
    EXPECT_THROW(GraphDocument::from_json(malformed), InvalidRequest);

    json older_minor = sample().to_json();
    older_minor["metadata"]["version"] = "1.0.0";
    EXPECT_NO_THROW(GraphDocument::from_json(older_minor));
}

TEST_F(GraphDocumentTest, SaveAndLoad) {
    std::string path = (temp_dir / "doc.json").string();
    sample().save(path);

    GraphDocument doc = GraphDocument::load(path);
    EXPECT_EQ(doc.nodes.size(), 2u);
    EXPECT_EQ(doc.edges.size(), 1u);
    EXPECT_EQ(doc.graph_kind, "data-flow");
}

TEST_F(GraphDocumentTest, Load_Errors) {
    EXPECT_THROW(GraphDocument::load((temp_dir / "absent.json").string()), InvalidRequest);

    std::string path = (temp_dir / "broken.json").string();
    std::ofstream(path) << "{ not json";
    EXPECT_THROW(GraphDocument::load(path), InvalidRequest);
}

TEST_F(GraphDocumentTest, Save_UnwritablePathThrows) {
    EXPECT_THROW(sample().save((temp_dir / "missing_dir" / "doc.json").string()), InvalidRequest);
}

TEST_F(GraphDocumentTest, ToDot) {
    std::string dot = sample().to_dot();

    EXPECT_EQ(dot.rfind("digraph \"run\" {", 0), 0u);
    EXPECT_NE(dot.find("  n0 [label=\"x @1\""), std::string::npos);
    EXPECT_NE(dot.find("n0 -> n1 [label=\"def_use\"]"), std::string::npos);
    EXPECT_EQ(dot.back(), '\n');
}

TEST_F(GraphDocumentTest, ToDot_EscapesLabels) {
    GraphDocument doc;
    doc.graph_kind = "control-flow";
    doc.nodes.push_back({0, "normal", "print(\"hi\")", json::object()});

    std::string dot = doc.to_dot();
    EXPECT_EQ(dot.rfind("digraph \"control-flow\" {", 0), 0u);
    EXPECT_NE(dot.find("print(\\\"hi\\\")"), std::string::npos);
}

TEST_F(GraphDocumentTest, Summary_Text) {
    std::string text = summarize(sample()).to_text();

    EXPECT_EQ(text, "data-flow: run\n  Nodes: 2\n  Edges: 1\n  - unused definition of 'y' at line 3\n");
}

TEST_F(GraphDocumentTest, ControlFlowDocument_Findings) {
    const LanguageProfile &js = *registry.find_by_name("JavaScript");
    StatementTree tree = split_statements("if (x) { return 1; } else { return 2; } log(\"x\");", 1, js);
    ControlFlowGraph cfg = build_cfg(tree, js);

    GraphDocument doc = to_document(cfg, tree, "pick");
    EXPECT_EQ(doc.graph_kind, "control-flow");
    EXPECT_EQ(doc.nodes.size(), cfg.blocks.size());
    EXPECT_EQ(doc.metadata["complexity"], 2);
    EXPECT_TRUE(has_finding(doc, "cyclomatic complexity: 2"));
    EXPECT_TRUE(has_finding(doc, "unreachable code at line 1"));
}

TEST_F(GraphDocumentTest, DataFlowDocument_Findings) {
    const LanguageProfile &js = *registry.find_by_name("JavaScript");
    StatementTree tree = split_statements("let a = 1;\nlet b = a + 1;\n", 1, js);
    DataFlowGraph dfg = build_dfg(tree, {}, js);

    GraphDocument doc = to_document(dfg, "calc");
    EXPECT_EQ(doc.nodes.size(), dfg.nodes.size());
    EXPECT_TRUE(has_finding(doc, "unused definition of 'b' at line 2"));
}

TEST_F(GraphDocumentTest, CallGraphDocument_ExternalNodes) {
    SyntaxTree tree;
    tree.file = "a.js";
    DeclNode main;
    main.kind = DeclKind::Function;
    main.name = "main";
    main.qualified_name = "main";
    main.start_line = 1;
    NodeId main_id = tree.decls.add(main);
    DeclNode call;
    call.kind = DeclKind::CallSite;
    call.name = "fetch";
    call.target = "fetch";
    call.start_line = 2;
    call.parent = main_id;
    tree.decls.add(call);

    CallGraph graph = build_call_graph({tree}, {"main"}, pool);
    GraphDocument doc = to_document(graph);

    EXPECT_EQ(doc.graph_kind, "call-graph");
    ASSERT_EQ(doc.nodes.size(), 2u);
    EXPECT_EQ(doc.nodes[1].kind, "external");
    EXPECT_EQ(doc.nodes[1].label, "fetch");
    EXPECT_TRUE(doc.edges.empty());
    EXPECT_TRUE(has_finding(doc, "1 unresolved calls (external or dynamic)"));
}

TEST_F(GraphDocumentTest, DependencyDocument_CycleFinding) {
    auto source = [&](const std::string &path, const std::string &text) {
        return SourceFile{path, text, &registry.find_for_path(path)};
    };
    DependencyGraph graph = build_dependency_graph(
        {source("a.py", "import b\n"), source("b.py", "import c\n"), source("c.py", "import a\n")}, {}, pool);

    GraphDocument doc = to_document(graph);
    EXPECT_EQ(doc.graph_kind, "dependency-graph");
    EXPECT_EQ(doc.edges.size(), 3u);
    EXPECT_TRUE(has_finding(doc, "circular dependency: a.py -> b.py -> c.py -> a.py"));
    EXPECT_EQ(doc.nodes[0].attrs["in_cycle"], true);
}

TEST_F(GraphDocumentTest, SyntaxTreeDocument_ContainsEdges) {
    SyntaxTree tree;
    tree.file = "m.py";
    tree.language = "Python";
    DeclNode cls;
    cls.kind = DeclKind::Class;
    cls.name = "Foo";
    cls.qualified_name = "Foo";
    NodeId cls_id = tree.decls.add(cls);
    DeclNode method;
    method.kind = DeclKind::Function;
    method.name = "bar";
    method.qualified_name = "Foo.bar";
    method.parent = cls_id;
    tree.decls.add(method);

    GraphDocument doc = to_document(tree);
    EXPECT_EQ(doc.graph_kind, "syntax-tree");
    ASSERT_EQ(doc.edges.size(), 1u);
    EXPECT_EQ(doc.edges[0].kind, "contains");
    EXPECT_EQ(doc.nodes[1].label, "Foo.bar");
    EXPECT_TRUE(has_finding(doc, "1 functions, 1 classes, 0 imports, 0 call sites"));
}

TEST_F(GraphDocumentTest, RoundTrip_ControlFlowDocument) {
    const LanguageProfile &js = *registry.find_by_name("JavaScript");
    StatementTree tree = split_statements("let i = 0;\nwhile (i < 3) {\n  if (i == 1) { break; }\n  i = i + 1;\n}\nreturn i;\n", 1, js);
    ControlFlowGraph cfg = build_cfg(tree, js);

    GraphDocument doc = to_document(cfg, tree, "count");
    ASSERT_FALSE(doc.edges.empty());
    expect_round_trip(doc);
}

TEST_F(GraphDocumentTest, RoundTrip_CallGraphDocument) {
    SyntaxTree tree;
    tree.file = "a.js";
    tree.language = "JavaScript";
    auto function = [&](const std::string &name, uint32_t line) {
        DeclNode decl;
        decl.kind = DeclKind::Function;
        decl.name = name;
        decl.qualified_name = name;
        decl.file = tree.file;
        decl.start_line = line;
        decl.end_line = line + 2;
        return tree.decls.add(decl);
    };
    auto call = [&](NodeId parent, const std::string &target, uint32_t line) {
        DeclNode decl;
        decl.kind = DeclKind::CallSite;
        decl.name = target;
        decl.target = target;
        decl.start_line = line;
        decl.parent = parent;
        tree.decls.add(decl);
    };
    NodeId main = function("main", 1);
    NodeId walk = function("walk", 4);
    call(main, "walk", 2);
    call(walk, "walk", 5);
    call(walk, "fetch", 6);

    GraphDocument doc = to_document(build_call_graph({tree}, {"main"}, pool));
    ASSERT_EQ(doc.nodes.size(), 3u);
    EXPECT_EQ(doc.edges.size(), 2u);
    expect_round_trip(doc);
}

TEST_F(GraphDocumentTest, RoundTrip_DependencyDocument) {
    auto source = [&](const std::string &path, const std::string &text) {
        return SourceFile{path, text, &registry.find_for_path(path)};
    };
    DependencyGraph graph = build_dependency_graph(
        {source("app.py", "import util\nimport requests\n"), source("util.py", "import app\n")}, {}, pool);

    GraphDocument doc = to_document(graph);
    EXPECT_EQ(doc.edges.size(), 2u);
    expect_round_trip(doc);
}
