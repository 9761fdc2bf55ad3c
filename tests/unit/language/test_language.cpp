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
#include "codegraph/language.hpp"
#include <algorithm>

using namespace codegraph;

class LanguageTest : public ::testing::Test {
protected:
    ProfileRegistry registry = ProfileRegistry::builtin();
};

TEST_F(LanguageTest, FindByExtension_KnownLanguages) {
    ASSERT_NE(registry.find_by_extension("py"), nullptr);
    EXPECT_EQ(registry.find_by_extension("py")->name, "Python");
    EXPECT_EQ(registry.find_by_extension("rs")->name, "Rust");
    EXPECT_EQ(registry.find_by_extension("go")->name, "Go");
    EXPECT_EQ(registry.find_by_extension("hpp")->name, "C++");
    EXPECT_EQ(registry.find_by_extension("ts")->name, "TypeScript");
}

TEST_F(LanguageTest, FindByExtension_IgnoresDotAndCase) {
    const LanguageProfile *profile = registry.find_by_extension(".JS");
    ASSERT_NE(profile, nullptr);
    EXPECT_EQ(profile->name, "JavaScript");
}

TEST_F(LanguageTest, FindByExtension_Unknown) {
    EXPECT_EQ(registry.find_by_extension("xyz"), nullptr);
    EXPECT_EQ(registry.find_by_extension(""), nullptr);
}

TEST_F(LanguageTest, FindForPath_FallsBackToGeneric) {
    EXPECT_EQ(registry.find_for_path("src/main.c").name, "C");
    EXPECT_EQ(&registry.find_for_path("notes.unknown"), &registry.generic());
    EXPECT_EQ(registry.generic().name, "Generic");
}

TEST_F(LanguageTest, FindByName) {
    const LanguageProfile *java = registry.find_by_name("Java");
    ASSERT_NE(java, nullptr);
    EXPECT_TRUE(java->case_fallthrough);
    EXPECT_EQ(registry.find_by_name("Cobol"), nullptr);
}

TEST_F(LanguageTest, Grammars_OnlyPythonCAndCpp) {
    EXPECT_EQ(registry.find_by_name("Python")->grammar, Grammar::Python);
    EXPECT_EQ(registry.find_by_name("C")->grammar, Grammar::C);
    EXPECT_EQ(registry.find_by_name("C++")->grammar, Grammar::Cpp);
    EXPECT_FALSE(registry.find_by_name("Rust")->has_grammar());
    EXPECT_FALSE(registry.find_by_name("JavaScript")->has_grammar());
}

TEST_F(LanguageTest, Profiles_IndentationOnlyForPython) {
    EXPECT_FALSE(registry.find_by_name("Python")->brace_delimited);
    EXPECT_TRUE(registry.find_by_name("Go")->brace_delimited);
    EXPECT_TRUE(registry.find_by_name("Go")->type_after_name);
}

TEST_F(LanguageTest, Keywords_PerLanguage) {
    const LanguageProfile *python = registry.find_by_name("Python");
    EXPECT_TRUE(python->is_keyword("lambda"));
    EXPECT_FALSE(python->is_keyword("end"));
    EXPECT_FALSE(python->is_keyword("type"));
    EXPECT_FALSE(registry.find_by_name("JavaScript")->is_keyword("string"));
    EXPECT_TRUE(registry.find_by_name("TypeScript")->is_keyword("string"));
    EXPECT_TRUE(registry.find_by_name("C++")->is_keyword("int"));
    EXPECT_TRUE(registry.find_by_name("C++")->is_keyword("template"));
    EXPECT_TRUE(registry.find_by_name("C#")->is_keyword("out"));
    EXPECT_FALSE(registry.find_by_name("Java")->is_keyword("out"));
    EXPECT_TRUE(registry.generic().is_keyword("end"));
}

TEST_F(LanguageTest, Extensions_ListsEveryProfile) {
    auto all = registry.extensions();
    EXPECT_NE(std::find(all.begin(), all.end(), "py"), all.end());
    EXPECT_NE(std::find(all.begin(), all.end(), "kt"), all.end());
    EXPECT_NE(std::find(all.begin(), all.end(), "php"), all.end());
}

TEST_F(LanguageTest, ExtensionOf) {
    EXPECT_EQ(extension_of("src/a.PY"), "py");
    EXPECT_EQ(extension_of("Makefile"), "");
    EXPECT_EQ(extension_of("dir.d/file.tar.gz"), "gz");
}

TEST_F(LanguageTest, AddRegistersCustomProfile) {
    LanguageProfile lua;
    lua.name = "Lua";
    lua.extensions = {"lua"};
    lua.function_patterns.push_back(make_pattern(R"(^\s*function\s+([\w.]+))"));
    registry.add(lua);

    const LanguageProfile *found = registry.find_by_extension("lua");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->function_patterns.front().source, R"(^\s*function\s+([\w.]+))");
}
