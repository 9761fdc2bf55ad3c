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
#include "codegraph/analyzer.hpp"
#include <filesystem>
#include <fstream>

using namespace codegraph;
namespace fs = std::filesystem;

class AnalyzerTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    ProfileRegistry registry = ProfileRegistry::builtin();

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "codegraph_analyzer_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path write(const std::string &relative, const std::string &content) {
        fs::path path = temp_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    AnalyzerConfig config() const {
        AnalyzerConfig c;
        c.root_path = temp_dir.string();
        c.num_threads = 2;
        return c;
    }

    std::vector<std::string> relative(const Analyzer &analyzer, const std::vector<fs::path> &files) const {
        std::vector<std::string> out;
        for (const auto &f : files)
            out.push_back(analyzer.relative_path(f));
        return out;
    }
};

TEST_F(AnalyzerTest, DiscoverFiles_SortedAndFiltered) {
    write("src/b.js", "");
    write("src/a.js", "");
    write("main.py", "");
    write("README.md", "");

    Analyzer analyzer(registry, config());
    auto files = analyzer.discover_files();

    EXPECT_EQ(relative(analyzer, files), (std::vector<std::string>{"main.py", "src/a.js", "src/b.js"}));
}

TEST_F(AnalyzerTest, DiscoverFiles_SkipsIgnoredAndHiddenDirectories) {
    write("app.js", "");
    write("build/gen.js", "");
    write("node_modules/lib/index.js", "");
    write(".hidden/secret.js", "");

    Analyzer analyzer(registry, config());
    EXPECT_EQ(relative(analyzer, analyzer.discover_files()), (std::vector<std::string>{"app.js"}));
}

TEST_F(AnalyzerTest, DiscoverFiles_ExtensionFilter) {
    write("a.js", "");
    write("b.py", "");

    AnalyzerConfig c = config();
    c.extensions = {".PY"};
    Analyzer analyzer(registry, c);
    EXPECT_EQ(relative(analyzer, analyzer.discover_files()), (std::vector<std::string>{"b.py"}));
}

TEST_F(AnalyzerTest, DiscoverFiles_SingleFileTarget) {
    fs::path file = write("lib/app.js", "");

    AnalyzerConfig c = config();
    c.root_path = file.string();
    Analyzer analyzer(registry, c);
    auto files = analyzer.discover_files();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(analyzer.relative_path(files[0]), "app.js");
}

TEST_F(AnalyzerTest, DiscoverFiles_MissingRootThrows) {
    AnalyzerConfig c = config();
    c.root_path = (temp_dir / "nope").string();
    Analyzer analyzer(registry, c);

    EXPECT_THROW(analyzer.discover_files(), InvalidRequest);
}

TEST_F(AnalyzerTest, ExtractAll_SkipsUndecodableFiles) {
    write("good.js", "function run() {\n  go();\n}\n");
    write("bad.js", std::string("\x00\x01\x02", 3));

    Analyzer analyzer(registry, config());
    auto trees = analyzer.extract_all(analyzer.discover_files());

    ASSERT_EQ(trees.size(), 1u);
    EXPECT_EQ(trees[0].file, "good.js");
    EXPECT_TRUE(trees[0].heuristic);

    auto items = analyzer.diagnostics().items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].kind, DiagnosticKind::ParseFailure);
    EXPECT_EQ(items[0].file, "bad.js");
    EXPECT_EQ(analyzer.stats().files_parsed.load(), 1u);
    EXPECT_EQ(analyzer.stats().files_skipped.load(), 1u);
    EXPECT_EQ(analyzer.stats().functions_found.load(), 1u);
}

TEST_F(AnalyzerTest, CallGraph_AcrossFiles) {
    write("app.js", "function main() {\n  helper();\n}\n");
    write("util.js", "function helper() {\n  return 1;\n}\n");

    Analyzer analyzer(registry, config());
    auto trees = analyzer.extract_all(analyzer.discover_files());
    CallGraph graph = analyzer.call_graph(trees);

    FunctionId main = graph.functions.find("app::main");
    FunctionId helper = graph.functions.find("util::helper");
    ASSERT_NE(main, INVALID_NODE);
    ASSERT_NE(helper, INVALID_NODE);
    EXPECT_EQ(graph.callees(main), (std::vector<FunctionId>{helper}));
    EXPECT_TRUE(dead_functions(graph).empty());
}

TEST_F(AnalyzerTest, DependencyGraph_UsesRelativePaths) {
    write("src/app.js", "import { u } from './util';\n");
    write("src/util.js", "export function u() {}\n");

    Analyzer analyzer(registry, config());
    DependencyGraph graph = analyzer.dependency_graph(analyzer.discover_files());

    ASSERT_EQ(graph.modules.size(), 2u);
    EXPECT_EQ(graph.modules[0].file, "src/app.js");
    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.edges[0].to, graph.find("src/util.js"));
    EXPECT_EQ(graph.modules[1].exports, (std::vector<std::string>{"u"}));
}

TEST_F(AnalyzerTest, AnalyzeFunctions_EveryGraphPerFunction) {
    fs::path file = write("calc.js", "function add(a, b) {\n  let c = a + b;\n  return c;\n}\n");

    Analyzer analyzer(registry, config());
    auto tree = analyzer.extract_file(file);
    ASSERT_TRUE(tree.has_value());

    auto functions = analyzer.analyze_functions(*tree);
    ASSERT_EQ(functions.size(), 1u);
    const FunctionAnalysis &fa = functions[0];
    EXPECT_EQ(fa.name, "add");
    EXPECT_EQ(fa.line, 1u);
    EXPECT_EQ(fa.statements.size(), 2u);
    EXPECT_EQ(cyclomatic_complexity(fa.cfg), 1);
    EXPECT_EQ(fa.dfg.of_kind(VarKind::Parameter).size(), 2u);
    EXPECT_TRUE(unused_definitions(fa.dfg).empty());
    EXPECT_EQ(fa.pdg.at_line(3), 2u);
}

TEST_F(AnalyzerTest, ExtractFile_MissingFileIsIOFailure) {
    Analyzer analyzer(registry, config());

    EXPECT_FALSE(analyzer.extract_file(temp_dir / "gone.js").has_value());
    ASSERT_EQ(analyzer.diagnostics().size(), 1u);
    EXPECT_EQ(analyzer.diagnostics().items()[0].kind, DiagnosticKind::IOFailure);
}
