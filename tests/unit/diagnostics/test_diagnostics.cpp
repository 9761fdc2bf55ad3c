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
#include <filesystem>
#include <fstream>
#include <thread>

using namespace codegraph;
namespace fs = std::filesystem;

class DiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "codegraph_diagnostics_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string write(const std::string &name, const std::string &content) const {
        fs::path path = temp_dir / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }

    fs::path temp_dir;
};

TEST_F(DiagnosticsTest, Log_ItemsSortedByFile) {
    DiagnosticLog log;
    EXPECT_TRUE(log.empty());

    log.add(DiagnosticKind::ParseFailure, "src/z.py", "syntax error near line 3");
    log.add(DiagnosticKind::IOFailure, "src/a.py", "cannot open file");

    auto items = log.items();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].file, "src/a.py");
    EXPECT_EQ(items[0].kind, DiagnosticKind::IOFailure);
    EXPECT_EQ(items[1].file, "src/z.py");
    EXPECT_EQ(log.size(), 2u);
}

TEST_F(DiagnosticsTest, Log_ConcurrentAppends) {
    DiagnosticLog log;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log, t]() {
            for (int i = 0; i < 100; ++i)
                log.add(DiagnosticKind::IOFailure, "f" + std::to_string(t), "x");
        });
    }
    for (auto &t : threads)
        t.join();
    EXPECT_EQ(log.size(), 400u);
}

TEST_F(DiagnosticsTest, KindNames) {
    EXPECT_STREQ(diagnostic_kind_to_string(DiagnosticKind::ParseFailure), "parse-failure");
    EXPECT_STREQ(diagnostic_kind_to_string(DiagnosticKind::IOFailure), "io-failure");
}

TEST_F(DiagnosticsTest, IsText) {
    EXPECT_TRUE(is_text(""));
    EXPECT_TRUE(is_text("plain ascii\n"));
    EXPECT_TRUE(is_text("caf\xc3\xa9"));
    EXPECT_TRUE(is_text("\xe2\x82\xac"));
    EXPECT_FALSE(is_text(std::string("a\0b", 3)));
    EXPECT_FALSE(is_text("\xff\xfe"));
    EXPECT_FALSE(is_text("caf\xc3"));
}

TEST_F(DiagnosticsTest, ReadSourceFile_Existing) {
    std::string path = write("a.py", "x = 1\n");
    ReadResult result = read_source_file(path);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.text, "x = 1\n");
}

TEST_F(DiagnosticsTest, ReadSourceFile_Missing) {
    ReadResult result = read_source_file((temp_dir / "missing.py").string());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.kind, DiagnosticKind::IOFailure);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(DiagnosticsTest, ReadSourceFile_BinaryIsParseFailure) {
    std::string path = write("blob.c", std::string("\x7f" "ELF\0\0\x01", 7));
    ReadResult result = read_source_file(path);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.kind, DiagnosticKind::ParseFailure);
}

TEST_F(DiagnosticsTest, InvalidRequestIsRuntimeError) {
    try {
        throw InvalidRequest("Path does not exist: nowhere");
    } catch (const std::runtime_error &e) {
        EXPECT_STREQ(e.what(), "Path does not exist: nowhere");
    }
}
