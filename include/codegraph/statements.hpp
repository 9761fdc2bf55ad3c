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

#include "language.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace codegraph {

// ============================================================================
// Statement tree - the per-function input of the CFG and DFG builders
// ============================================================================
enum class StmtKind {
    Simple,
    If,
    ElseIf,
    Else,
    Switch,
    Case,
    Loop,
    Return, // also throw/raise
    Break,
    Continue,
    Goto,
    Label,
    Try,
    Handler, // catch/except
    Scope,   // bare block, finally, with, unsafe, ...
    Nested   // nested function or class, opaque
};

const char *stmt_kind_to_string(StmtKind kind);

struct Statement {
    StmtKind kind = StmtKind::Simple;
    std::string text; // header text for compound statements
    uint32_t line = 0;
    NodeId parent = INVALID_NODE;
    std::vector<NodeId> children;
    bool fallthrough = false; // Case: "case X:" arm that runs into the next arm
};

// Statements in source order; ids are pre-order positions
struct StatementTree {
    NodeArena<Statement> nodes;
    std::vector<NodeId> roots;

    NodeId add(Statement stmt, NodeId parent);

    const Statement &operator[](NodeId id) const { return nodes[id]; }
    size_t size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }
};

// Split a function body into statements. `first_line` is the line number of
// the first character of `body`.
StatementTree split_statements(const std::string &body, uint32_t first_line,
                               const LanguageProfile &profile);

// Parameter names from a function signature ("def f(a, b=1)", "fn f(x: i32)")
std::vector<std::string> parse_parameters(const std::string &signature,
                                          const LanguageProfile &profile);

// ============================================================================
// Source scanning helpers shared by the extractors
// ============================================================================

// Two views of the same text, equal length, newlines preserved:
// `clean` has comments blanked, `masked` also blanks string literal contents
struct MaskedSource {
    std::string clean;
    std::string masked;
};

MaskedSource mask_source(const std::string &text, const LanguageProfile &profile);

// Index of the bracket closing the one at `open` in masked text, or npos
size_t find_matching(const std::string &masked, size_t open);

// True when `text` starts with `keyword` as a whole word
bool starts_with_keyword(const std::string &text, const std::string &keyword);

// Classify one statement header; `in_switch` enables case-arm detection
StmtKind classify_statement(const std::string &text, bool in_switch,
                            const LanguageProfile &profile);

// Loop header that never exits on its own ("loop", "while (true)", "for (;;)")
bool is_infinite_loop(const std::string &header);

std::string trim(const std::string &s);

} // namespace codegraph
