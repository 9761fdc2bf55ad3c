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

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace codegraph {

// Tree-sitter grammars linked into the binary
enum class Grammar { None, Python, C, Cpp };

// How import targets are spelled, and therefore resolved
enum class ImportStyle { Python, JavaScript, CInclude, Rust, Go, Dotted, Path };

// A regex with the source kept for messages; capture group 1 is the name/target
struct Pattern {
    std::string source;
    std::regex regex;
};

// Per-language table consumed by both extractors and the dependency builder
struct LanguageProfile {
    std::string name;
    std::vector<std::string> extensions; // lowercase, without the dot
    std::vector<Pattern> function_patterns;
    std::vector<Pattern> class_patterns;
    std::vector<Pattern> import_patterns; // optional group 2 = imported names
    std::vector<Pattern> export_patterns;
    std::vector<std::string> line_comments;
    std::string block_comment_open;
    std::string block_comment_close;
    bool brace_delimited = true;
    bool type_after_name = false; // parameters written "name type" (Go)
    bool case_fallthrough = false; // "case X:" arms run into the next arm
    std::string match_arrow;       // arm separator inside match/when bodies
    Grammar grammar = Grammar::None;
    ImportStyle import_style = ImportStyle::Path;
    std::unordered_set<std::string> keywords; // reserved words and builtin type names

    bool has_grammar() const { return grammar != Grammar::None; }
    bool is_keyword(const std::string &word) const { return keywords.count(word) > 0; }
};

Pattern make_pattern(const std::string &source);

// Explicit registry, built once at startup and passed by reference
class ProfileRegistry {
public:
    // Registry with the built-in language table
    static ProfileRegistry builtin();

    void add(LanguageProfile profile);

    // nullptr when no profile claims the extension
    const LanguageProfile *find_by_extension(const std::string &ext) const;

    // Profile for a path, or the generic fallback profile
    const LanguageProfile &find_for_path(const std::string &path) const;

    const LanguageProfile *find_by_name(const std::string &name) const;

    const LanguageProfile &generic() const { return generic_; }

    // Every registered extension
    std::vector<std::string> extensions() const;

    const std::vector<LanguageProfile> &profiles() const { return profiles_; }

private:
    std::vector<LanguageProfile> profiles_;
    LanguageProfile generic_;
};

// Lowercased extension without the dot ("src/a.PY" -> "py")
std::string extension_of(const std::string &path);

} // namespace codegraph
