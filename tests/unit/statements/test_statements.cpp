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
#include "codegraph/statements.hpp"

using namespace codegraph;

class StatementsTest : public ::testing::Test {
protected:
    ProfileRegistry registry = ProfileRegistry::builtin();

    const LanguageProfile &profile(const std::string &name) const {
        return *registry.find_by_name(name);
    }
};

TEST_F(StatementsTest, Split_IfElseThenTrailingStatement) {
    auto tree = split_statements(
        "if (x) { return 1; } else { return 2; } log(\"unreachable\");", 1,
        profile("JavaScript"));

    ASSERT_EQ(tree.size(), 5u);
    ASSERT_EQ(tree.roots.size(), 3u);
    EXPECT_EQ(tree[0].kind, StmtKind::If);
    EXPECT_EQ(tree[1].kind, StmtKind::Return);
    EXPECT_EQ(tree[1].parent, 0u);
    EXPECT_EQ(tree[2].kind, StmtKind::Else);
    EXPECT_EQ(tree[3].kind, StmtKind::Return);
    EXPECT_EQ(tree[3].parent, 2u);
    EXPECT_EQ(tree[4].kind, StmtKind::Simple);
    EXPECT_EQ(tree[4].text, "log(\"unreachable\")");
}

TEST_F(StatementsTest, Split_TracksLineNumbers) {
    auto tree = split_statements("\n  let a = 1;\n  let b = a + 1;\n", 10, profile("JavaScript"));

    ASSERT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree[0].line, 11u);
    EXPECT_EQ(tree[1].line, 12u);
}

TEST_F(StatementsTest, Split_LoopWithBody) {
    auto tree = split_statements("while (i < 3) { i = i + 1; }", 1, profile("JavaScript"));

    ASSERT_EQ(tree.roots.size(), 1u);
    EXPECT_EQ(tree[0].kind, StmtKind::Loop);
    ASSERT_EQ(tree[0].children.size(), 1u);
    EXPECT_EQ(tree[tree[0].children[0]].text, "i = i + 1");
}

TEST_F(StatementsTest, Split_PythonIndentation) {
    auto tree = split_statements("    x = 1\n    if x:\n        return x\n    return 0\n", 2,
                                 profile("Python"));

    ASSERT_EQ(tree.size(), 4u);
    ASSERT_EQ(tree.roots.size(), 3u);
    EXPECT_EQ(tree[0].kind, StmtKind::Simple);
    EXPECT_EQ(tree[0].line, 2u);
    EXPECT_EQ(tree[1].kind, StmtKind::If);
    EXPECT_EQ(tree[1].text, "if x");
    EXPECT_EQ(tree[2].kind, StmtKind::Return);
    EXPECT_EQ(tree[2].parent, 1u);
    EXPECT_EQ(tree[3].kind, StmtKind::Return);
    EXPECT_EQ(tree[3].line, 5u);
}

TEST_F(StatementsTest, Split_CommentsAreNotStatements) {
    auto tree = split_statements("// setup\nlet a = 1; /* done */\n", 1, profile("JavaScript"));

    ASSERT_EQ(tree.size(), 1u);
    EXPECT_EQ(tree[0].line, 2u);
}

TEST_F(StatementsTest, Split_EmptyBody) {
    EXPECT_TRUE(split_statements("   \n  ", 1, profile("C")).empty());
}

TEST_F(StatementsTest, Classify_Keywords) {
    const LanguageProfile &js = profile("JavaScript");
    EXPECT_EQ(classify_statement("for (;;)", false, js), StmtKind::Loop);
    EXPECT_EQ(classify_statement("else if (y)", false, js), StmtKind::ElseIf);
    EXPECT_EQ(classify_statement("throw err", false, js), StmtKind::Return);
    EXPECT_EQ(classify_statement("catch (e)", false, js), StmtKind::Handler);
    EXPECT_EQ(classify_statement("case 1:", true, js), StmtKind::Case);
    EXPECT_EQ(classify_statement("case 1:", false, js), StmtKind::Case);
    EXPECT_EQ(classify_statement("default:", false, js), StmtKind::Simple);
}

TEST_F(StatementsTest, Classify_KeywordUsedAsName) {
    const LanguageProfile &py = profile("Python");
    EXPECT_EQ(classify_statement("match = 1", false, py), StmtKind::Simple);
    EXPECT_EQ(classify_statement("loop.run()", false, py), StmtKind::Simple);
    EXPECT_EQ(classify_statement("returned = 2", false, py), StmtKind::Simple);
}

TEST_F(StatementsTest, InfiniteLoop) {
    EXPECT_TRUE(is_infinite_loop("while (true)"));
    EXPECT_TRUE(is_infinite_loop("for (;;)"));
    EXPECT_TRUE(is_infinite_loop("loop"));
    EXPECT_TRUE(is_infinite_loop("while True:"));
    EXPECT_FALSE(is_infinite_loop("while (x)"));
    EXPECT_FALSE(is_infinite_loop("do"));
}

TEST_F(StatementsTest, Parameters_Python) {
    auto params = parse_parameters("def f(self, a: int, b=1, *args)", profile("Python"));
    EXPECT_EQ(params, (std::vector<std::string>{"self", "a", "b", "args"}));
}

TEST_F(StatementsTest, Parameters_CTypes) {
    auto params = parse_parameters("int add(int a, const char *b)", profile("C"));
    EXPECT_EQ(params, (std::vector<std::string>{"a", "b"}));
}

TEST_F(StatementsTest, Parameters_GoNameBeforeType) {
    auto params = parse_parameters("func (s *Server) Handle(w Writer, r *Request)", profile("Go"));
    EXPECT_EQ(params, (std::vector<std::string>{"w", "r"}));
}

TEST_F(StatementsTest, Parameters_RustAndEmpty) {
    EXPECT_EQ(parse_parameters("fn f(x: i32, mut y: Vec<u8>)", profile("Rust")),
              (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(parse_parameters("fn main()", profile("Rust")).empty());
    EXPECT_TRUE(parse_parameters("int main(void)", profile("C")).empty());
}

TEST_F(StatementsTest, MaskSource_BlanksCommentsAndStrings) {
    auto src = mask_source("a = \"x;y\" // c\nb", profile("JavaScript"));

    ASSERT_EQ(src.clean.size(), src.masked.size());
    EXPECT_EQ(src.clean.find("//"), std::string::npos);
    EXPECT_NE(src.clean.find("x;y"), std::string::npos);
    EXPECT_EQ(src.masked.find("x;y"), std::string::npos);
    EXPECT_EQ(src.masked.find('\n'), src.clean.find('\n'));
}

TEST_F(StatementsTest, FindMatching) {
    std::string text = "f(a, (b), [c]) {}";
    EXPECT_EQ(find_matching(text, 1), 13u);
    EXPECT_EQ(find_matching(text, 15), 16u);
    EXPECT_EQ(find_matching("(", 0), std::string::npos);
}
