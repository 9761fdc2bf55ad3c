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

#include "codegraph/statements.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace codegraph {

const char *stmt_kind_to_string(StmtKind kind) {
    switch (kind) {
    case StmtKind::Simple:
        return "simple";
    case StmtKind::If:
        return "if";
    case StmtKind::ElseIf:
        return "else_if";
    case StmtKind::Else:
        return "else";
    case StmtKind::Switch:
        return "switch";
    case StmtKind::Case:
        return "case";
    case StmtKind::Loop:
        return "loop";
    case StmtKind::Return:
        return "return";
    case StmtKind::Break:
        return "break";
    case StmtKind::Continue:
        return "continue";
    case StmtKind::Goto:
        return "goto";
    case StmtKind::Label:
        return "label";
    case StmtKind::Try:
        return "try";
    case StmtKind::Handler:
        return "handler";
    case StmtKind::Scope:
        return "scope";
    case StmtKind::Nested:
        return "nested";
    }
    return "unknown";
}

NodeId StatementTree::add(Statement stmt, NodeId parent) {
    stmt.parent = parent;
    NodeId id = nodes.add(std::move(stmt));
    if (parent == INVALID_NODE) {
        roots.push_back(id);
    } else {
        nodes[parent].children.push_back(id);
    }
    return id;
}

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_identifier(const std::string &s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0])))
        return false;
    return std::all_of(s.begin(), s.end(), is_ident_char);
}

// Leading modifiers that may precede a nested declaration
const std::vector<std::string> &declaration_modifiers() {
    static const std::vector<std::string> mods = {
        "async", "pub",    "static",   "export", "private", "public", "protected",
        "inline", "override", "suspend", "default", "final",  "abstract", "local"};
    return mods;
}

std::string strip_modifiers(const std::string &text) {
    std::string t = text;
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto &mod : declaration_modifiers()) {
            if (starts_with_keyword(t, mod)) {
                t = trim(t.substr(mod.size()));
                changed = true;
            }
        }
    }
    return t;
}

// Position of `token` outside brackets, or npos
size_t find_top_level(const std::string &masked, const std::string &token) {
    if (token.empty())
        return std::string::npos;
    int depth = 0;
    for (size_t i = 0; i + token.size() <= masked.size(); ++i) {
        char c = masked[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth > 0)
                --depth;
        } else if (depth == 0 && masked.compare(i, token.size(), token) == 0) {
            return i;
        }
    }
    return std::string::npos;
}

// Top-level `=` that is an assignment, not a comparison or arrow
bool has_top_level_assignment(const std::string &masked) {
    int depth = 0;
    for (size_t i = 0; i < masked.size(); ++i) {
        char c = masked[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth > 0)
                --depth;
        } else if (c == '=' && depth == 0) {
            char prev = i > 0 ? masked[i - 1] : '\0';
            char next = i + 1 < masked.size() ? masked[i + 1] : '\0';
            if (next == '=' || next == '>' || prev == '=' || prev == '!' || prev == '<' ||
                prev == '>')
                continue;
            return true;
        }
    }
    return false;
}

bool is_nested_header(const std::string &masked) {
    static const std::vector<std::string> keywords = {
        "def", "fn", "function", "func", "fun", "class", "struct",
        "impl", "trait", "interface", "enum", "object"};
    std::string t = strip_modifiers(trim(masked));
    if (has_top_level_assignment(t))
        return false;
    for (const auto &kw : keywords) {
        if (starts_with_keyword(t, kw))
            return true;
    }
    return false;
}

// Split `text` on a top-level separator character
std::vector<std::pair<size_t, size_t>> split_top_level(const std::string &masked, char sep) {
    std::vector<std::pair<size_t, size_t>> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < masked.size(); ++i) {
        char c = masked[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth > 0)
                --depth;
        } else if (c == sep && depth == 0) {
            parts.emplace_back(start, i);
            start = i + 1;
        }
    }
    parts.emplace_back(start, masked.size());
    return parts;
}

// A statement as both views; positions line up
struct Segment {
    std::string clean;
    std::string masked;

    Segment sub(size_t pos, size_t len = std::string::npos) const {
        return Segment{clean.substr(pos, len), masked.substr(pos, len)};
    }

    Segment trimmed() const {
        size_t b = 0;
        while (b < masked.size() && is_space(masked[b]) && is_space(clean[b]))
            ++b;
        size_t e = masked.size();
        while (e > b && is_space(masked[e - 1]) && is_space(clean[e - 1]))
            --e;
        return sub(b, e - b);
    }

    bool empty() const { return masked.empty(); }
};

// Header and inline body of `if (x) return 1` style statements
std::optional<std::pair<Segment, Segment>> split_inline(const Segment &seg, StmtKind kind,
                                                        const LanguageProfile &profile) {
    const std::string &m = seg.masked;
    auto make = [&](size_t header_end) -> std::optional<std::pair<Segment, Segment>> {
        Segment rest = seg.sub(header_end).trimmed();
        if (rest.empty())
            return std::nullopt;
        return std::make_pair(seg.sub(0, header_end).trimmed(), rest);
    };

    switch (kind) {
    case StmtKind::If:
    case StmtKind::ElseIf:
    case StmtKind::Loop:
    case StmtKind::Switch:
    case StmtKind::Handler: {
        static const std::vector<std::string> headers = {
            "if", "else if", "elseif", "while", "for", "foreach", "switch", "catch"};
        size_t open = m.find('(');
        if (open == std::string::npos)
            return std::nullopt;
        // Only a condition directly after the keyword(s) counts
        std::string keyword = trim(m.substr(0, open));
        if (std::find(headers.begin(), headers.end(), keyword) == headers.end())
            return std::nullopt;
        size_t close = find_matching(m, open);
        if (close == std::string::npos)
            return std::nullopt;
        return make(close + 1);
    }
    case StmtKind::Else: {
        size_t pos = 4; // "else"
        return make(pos);
    }
    case StmtKind::Case: {
        size_t arrow = find_top_level(m, "->");
        if (arrow == std::string::npos && !profile.match_arrow.empty())
            arrow = find_top_level(m, profile.match_arrow);
        if (arrow == std::string::npos)
            return std::nullopt;
        return make(arrow + 2);
    }
    default:
        return std::nullopt;
    }
}

bool is_compound(StmtKind kind) {
    switch (kind) {
    case StmtKind::If:
    case StmtKind::ElseIf:
    case StmtKind::Else:
    case StmtKind::Switch:
    case StmtKind::Case:
    case StmtKind::Loop:
    case StmtKind::Try:
    case StmtKind::Handler:
    case StmtKind::Scope:
        return true;
    default:
        return false;
    }
}

// ============================================================================
// Brace-delimited bodies
// ============================================================================
class BraceSplitter {
public:
    BraceSplitter(const std::string &body, uint32_t first_line, const LanguageProfile &profile)
        : profile_(profile), source_(mask_source(body, profile)), line_(first_line) {
        frames_.push_back({FrameKind::Block, INVALID_NODE});
    }

    StatementTree run() {
        const std::string &m = source_.masked;
        for (size_t i = 0; i < m.size(); ++i) {
            char c = m[i];
            if (c == '\n') {
                on_newline(i);
                ++line_;
                continue;
            }

            Frame &top = frames_.back();
            bool expr = top.kind == FrameKind::Expression || top.kind == FrameKind::Opaque;

            if (c == '(' || c == '[') {
                ++depth_;
                append(i);
                continue;
            }
            if (c == ')' || c == ']') {
                if (depth_ > 0)
                    --depth_;
                append(i);
                continue;
            }
            if (depth_ > 0) {
                append(i);
                continue;
            }
            if (c == '{') {
                on_open(i);
                continue;
            }
            if (c == '}') {
                on_close(i);
                continue;
            }
            if (expr) {
                append(i);
                continue;
            }
            if (c == ';') {
                if (is_go_style_header())
                    append(i);
                else
                    flush();
                continue;
            }
            if (c == ':' && try_label(i))
                continue;
            if (c == ',' && top.kind == FrameKind::Switch && !profile_.match_arrow.empty()) {
                flush();
                continue;
            }
            append(i);
        }
        flush();
        return std::move(tree_);
    }

private:
    enum class FrameKind { Block, Switch, Expression, Opaque };

    struct Frame {
        FrameKind kind;
        NodeId owner;
        NodeId current_case = INVALID_NODE;
        size_t header_len = 0;
    };

    const LanguageProfile &profile_;
    MaskedSource source_;
    uint32_t line_;
    uint32_t buf_line_ = 0;
    int depth_ = 0;
    std::string buf_;
    std::string mbuf_;
    std::vector<Frame> frames_;
    StatementTree tree_;

    void append(size_t i) {
        char c = source_.clean[i];
        char mc = source_.masked[i];
        if (is_space(c) && is_space(mc)) {
            if (!buf_.empty() && buf_.back() != ' ') {
                buf_.push_back(' ');
                mbuf_.push_back(' ');
            }
            return;
        }
        if (buf_.empty())
            buf_line_ = line_;
        buf_.push_back(c);
        mbuf_.push_back(mc);
    }

    void append_char(char c) {
        if (buf_.empty())
            buf_line_ = line_;
        buf_.push_back(c);
        mbuf_.push_back(c);
    }

    Segment take() {
        Segment seg = Segment{buf_, mbuf_}.trimmed();
        buf_.clear();
        mbuf_.clear();
        return seg;
    }

    bool is_go_style_header() const {
        std::string t = trim(mbuf_);
        if (starts_with_keyword(t, "else"))
            t = trim(t.substr(4));
        for (const char *kw : {"if", "for", "switch", "while"}) {
            if (starts_with_keyword(t, kw)) {
                std::string rest = trim(t.substr(std::string(kw).size()));
                return rest.empty() || rest[0] != '(';
            }
        }
        return false;
    }

    bool try_label(size_t i) {
        const std::string &m = source_.masked;
        if ((i + 1 < m.size() && m[i + 1] == ':') || (i > 0 && m[i - 1] == ':'))
            return false;
        std::string t = trim(mbuf_);
        if (t.empty() || t.find('?') != std::string::npos)
            return false;

        Frame &top = frames_.back();
        if (top.kind == FrameKind::Switch &&
            (starts_with_keyword(t, "case") || starts_with_keyword(t, "default"))) {
            Segment seg = take();
            Statement stmt;
            stmt.kind = StmtKind::Case;
            stmt.text = seg.clean;
            stmt.line = buf_line_;
            stmt.fallthrough = profile_.case_fallthrough;
            top.current_case = tree_.add(std::move(stmt), top.owner);
            return true;
        }

        static const std::vector<std::string> not_labels = {"default", "public", "private",
                                                            "protected", "else"};
        bool rust_label = t[0] == '\'' && is_identifier(t.substr(1));
        if ((is_identifier(t) || rust_label) &&
            std::find(not_labels.begin(), not_labels.end(), t) == not_labels.end()) {
            Segment seg = take();
            Statement stmt;
            stmt.kind = StmtKind::Label;
            stmt.text = seg.clean;
            stmt.line = buf_line_;
            attach(std::move(stmt));
            return true;
        }
        return false;
    }

    NodeId attach(Statement stmt) {
        Frame &top = frames_.back();
        NodeId parent = top.owner;
        if (top.kind == FrameKind::Switch && stmt.kind != StmtKind::Case &&
            top.current_case != INVALID_NODE)
            parent = top.current_case;
        return tree_.add(std::move(stmt), parent);
    }

    NodeId emit_into(const Segment &seg, uint32_t line, NodeId parent, bool in_switch) {
        StmtKind kind = classify_statement(seg.masked, in_switch, profile_);
        auto split = split_inline(seg, kind, profile_);
        Statement stmt;
        stmt.kind = kind;
        stmt.line = line;
        if (!split) {
            stmt.text = seg.clean;
            return tree_.add(std::move(stmt), parent);
        }
        stmt.text = split->first.clean;
        NodeId header = tree_.add(std::move(stmt), parent);
        emit_into(split->second, line, header, false);
        return header;
    }

    void emit(const Segment &seg) {
        if (seg.empty())
            return;
        Frame &top = frames_.back();
        bool in_switch = top.kind == FrameKind::Switch;
        StmtKind kind = classify_statement(seg.masked, in_switch, profile_);

        NodeId parent = top.owner;
        if (in_switch && kind != StmtKind::Case && top.current_case != INVALID_NODE)
            parent = top.current_case;

        // "do { ... } while (x);" folds the condition into the do header
        if (kind == StmtKind::Loop && starts_with_keyword(seg.masked, "while")) {
            const std::vector<NodeId> &siblings =
                parent == INVALID_NODE ? tree_.roots : tree_.nodes[parent].children;
            if (!siblings.empty()) {
                Statement &prev = tree_.nodes[siblings.back()];
                if (prev.kind == StmtKind::Loop && prev.text == "do" && !prev.children.empty()) {
                    prev.text += " " + seg.clean;
                    return;
                }
            }
        }

        emit_into(seg, buf_line_, parent, in_switch);
        if (in_switch && kind == StmtKind::Case)
            top.current_case = INVALID_NODE;
    }

    void flush() {
        Segment seg = take();
        emit(seg);
    }

    void on_open(size_t i) {
        Frame &top = frames_.back();
        if (top.kind == FrameKind::Expression || top.kind == FrameKind::Opaque) {
            frames_.push_back({FrameKind::Expression, top.owner});
            append(i);
            return;
        }

        std::string t = trim(mbuf_);
        bool in_switch = top.kind == FrameKind::Switch;
        if (t.empty()) {
            Statement stmt;
            stmt.kind = StmtKind::Scope;
            stmt.text = "{";
            stmt.line = line_;
            NodeId id = attach(std::move(stmt));
            frames_.push_back({FrameKind::Block, id});
            return;
        }

        StmtKind kind = classify_statement(t, in_switch, profile_);
        if (is_compound(kind)) {
            uint32_t line = buf_line_;
            Segment seg = take();
            Statement stmt;
            stmt.kind = kind;
            stmt.text = seg.clean;
            stmt.line = line;
            NodeId id = attach(std::move(stmt));
            if (in_switch && kind == StmtKind::Case)
                top.current_case = INVALID_NODE;
            frames_.push_back({kind == StmtKind::Switch ? FrameKind::Switch : FrameKind::Block, id});
            return;
        }

        if (is_nested_header(t)) {
            frames_.push_back({FrameKind::Opaque, top.owner, INVALID_NODE, buf_.size()});
            return;
        }

        frames_.push_back({FrameKind::Expression, top.owner});
        append(i);
    }

    void on_close(size_t i) {
        Frame top = frames_.back();
        if (top.kind == FrameKind::Expression) {
            append(i);
            frames_.pop_back();
            return;
        }
        if (top.kind == FrameKind::Opaque) {
            buf_.resize(top.header_len);
            mbuf_.resize(top.header_len);
            frames_.pop_back();
            uint32_t line = buf_line_;
            Segment seg = take();
            Statement stmt;
            stmt.kind = StmtKind::Nested;
            stmt.text = seg.clean;
            stmt.line = line;
            attach(std::move(stmt));
            return;
        }

        flush();
        if (frames_.size() > 1)
            frames_.pop_back();
    }

    // Newline ends a statement in languages without mandatory semicolons
    void on_newline(size_t i) {
        append(i);
        const Frame &top = frames_.back();
        if (depth_ > 0 || top.kind == FrameKind::Expression || top.kind == FrameKind::Opaque)
            return;
        std::string t = trim(mbuf_);
        if (t.empty())
            return;

        char last = t.back();
        bool inc_dec = t.size() >= 2 && (t.compare(t.size() - 2, 2, "++") == 0 ||
                                         t.compare(t.size() - 2, 2, "--") == 0);
        static const std::string continuation = ",+-*/%=&|^<>?:.\\";
        if (!inc_dec && continuation.find(last) != std::string::npos)
            return;

        bool in_switch = top.kind == FrameKind::Switch;
        StmtKind kind = classify_statement(t, in_switch, profile_);
        if (is_compound(kind) && kind != StmtKind::Scope) {
            Segment seg{buf_, mbuf_};
            if (!split_inline(seg.trimmed(), kind, profile_))
                return;
        }

        // Peek at the next non-blank character
        const std::string &m = source_.masked;
        size_t j = i + 1;
        while (j < m.size() && is_space(m[j]))
            ++j;
        if (j < m.size()) {
            char next = m[j];
            bool spread = m.compare(j, 3, "...") == 0;
            if ((next == '.' && !spread) || next == '?' || next == '{' ||
                m.compare(j, 2, "&&") == 0 || m.compare(j, 2, "||") == 0 ||
                m.compare(j, 2, "->") == 0 || m.compare(j, 2, "=>") == 0)
                return;
        }
        flush();
    }
};

// ============================================================================
// Indentation-delimited bodies
// ============================================================================
class IndentSplitter {
public:
    IndentSplitter(const std::string &body, uint32_t first_line, const LanguageProfile &profile)
        : profile_(profile), source_(mask_source(body, profile)), first_line_(first_line) {}

    StatementTree run() {
        struct Frame {
            int indent;
            NodeId owner;
            bool opaque;
        };
        std::vector<Frame> frames = {{-1, INVALID_NODE, false}};

        for (const auto &logical : logical_lines()) {
            while (frames.size() > 1 && logical.indent <= frames.back().indent)
                frames.pop_back();
            if (frames.back().opaque)
                continue;

            NodeId owner = frames.back().owner;
            bool in_switch = owner != INVALID_NODE && tree_[owner].kind == StmtKind::Switch;
            auto opened = process(logical, owner, in_switch);
            if (opened)
                frames.push_back({logical.indent, opened->first, opened->second});
        }
        return std::move(tree_);
    }

private:
    struct Logical {
        Segment seg;
        uint32_t line;
        int indent;
    };

    const LanguageProfile &profile_;
    MaskedSource source_;
    uint32_t first_line_;
    StatementTree tree_;

    static int indent_of(const std::string &line) {
        int col = 0;
        for (char c : line) {
            if (c == ' ')
                ++col;
            else if (c == '\t')
                col += 8 - (col % 8);
            else
                break;
        }
        return col;
    }

    static int count_triple_quotes(const std::string &masked) {
        int count = 0;
        for (size_t i = 0; i + 2 < masked.size(); ++i) {
            if ((masked[i] == '"' || masked[i] == '\'') && masked[i + 1] == masked[i] &&
                masked[i + 2] == masked[i]) {
                ++count;
                i += 2;
            }
        }
        return count;
    }

    std::vector<Logical> logical_lines() const {
        std::vector<Logical> out;
        const std::string &c = source_.clean;
        const std::string &m = source_.masked;

        size_t pos = 0;
        uint32_t line = first_line_;
        Logical current;
        bool open = false;
        int depth = 0;
        bool in_triple = false;

        while (pos <= m.size()) {
            size_t end = m.find('\n', pos);
            if (end == std::string::npos)
                end = m.size();
            std::string cl = c.substr(pos, end - pos);
            std::string ml = m.substr(pos, end - pos);

            if (!open) {
                if (trim(ml).empty()) {
                    pos = end + 1;
                    ++line;
                    continue;
                }
                current = Logical{Segment{}, line, indent_of(cl)};
                open = true;
            }

            Segment part = Segment{cl, ml}.trimmed();
            if (!current.seg.masked.empty() && !part.empty()) {
                current.seg.clean += ' ';
                current.seg.masked += ' ';
            }
            current.seg.clean += part.clean;
            current.seg.masked += part.masked;

            for (char ch : ml) {
                if (ch == '(' || ch == '[' || ch == '{')
                    ++depth;
                else if ((ch == ')' || ch == ']' || ch == '}') && depth > 0)
                    --depth;
            }
            if (count_triple_quotes(ml) % 2 == 1)
                in_triple = !in_triple;

            bool backslash = !part.masked.empty() && part.masked.back() == '\\';
            if (backslash) {
                current.seg.clean.pop_back();
                current.seg.masked.pop_back();
            }
            if (depth == 0 && !in_triple && !backslash) {
                current.seg = current.seg.trimmed();
                out.push_back(current);
                open = false;
            }
            pos = end + 1;
            ++line;
        }
        if (open && !current.seg.empty()) {
            current.seg = current.seg.trimmed();
            out.push_back(current);
        }
        return out;
    }

    void add_simple(const Segment &seg, uint32_t line, NodeId owner, bool in_switch) {
        for (const auto &[b, e] : split_top_level(seg.masked, ';')) {
            Segment part = seg.sub(b, e - b).trimmed();
            if (part.empty())
                continue;
            Statement stmt;
            stmt.kind = classify_statement(part.masked, in_switch, profile_);
            stmt.text = part.clean;
            stmt.line = line;
            tree_.add(std::move(stmt), owner);
        }
    }

    // Returns the header id and whether its body is opaque when a block opens
    std::optional<std::pair<NodeId, bool>> process(const Logical &logical, NodeId owner,
                                                   bool in_switch) {
        static const std::vector<std::string> compound = {
            "if",   "elif",  "else",    "for",   "while", "try",  "except",
            "finally", "with", "def",  "class", "async", "match", "case"};

        const Segment &seg = logical.seg;
        bool is_header = false;
        for (const auto &kw : compound) {
            if (starts_with_keyword(seg.masked, kw)) {
                is_header = true;
                break;
            }
        }
        size_t colon = is_header ? find_top_level(seg.masked, ":") : std::string::npos;
        while (colon != std::string::npos && colon + 1 < seg.masked.size() &&
               seg.masked[colon + 1] == '=') {
            size_t next = find_top_level(seg.masked.substr(colon + 2), ":");
            colon = next == std::string::npos ? next : colon + 2 + next;
        }
        if (colon == std::string::npos) {
            add_simple(seg, logical.line, owner, in_switch);
            return std::nullopt;
        }

        Segment header = seg.sub(0, colon).trimmed();
        Segment rest = seg.sub(colon + 1).trimmed();

        Statement stmt;
        stmt.kind = is_nested_header(header.masked)
                        ? StmtKind::Nested
                        : classify_statement(header.masked, in_switch, profile_);
        stmt.text = header.clean;
        stmt.line = logical.line;
        bool nested = stmt.kind == StmtKind::Nested;
        NodeId id = tree_.add(std::move(stmt), owner);

        if (rest.empty())
            return std::make_pair(id, nested);
        if (!nested)
            add_simple(rest, logical.line, id, false);
        return std::nullopt;
    }
};

} // namespace

// ============================================================================
// Public helpers
// ============================================================================

std::string trim(const std::string &s) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

bool starts_with_keyword(const std::string &text, const std::string &keyword) {
    if (text.compare(0, keyword.size(), keyword) != 0)
        return false;
    if (text.size() == keyword.size())
        return true;
    if (is_ident_char(text[keyword.size()]))
        return false;
    // "match = 1", "loop.run()" use the word as a name
    size_t j = keyword.size();
    while (j < text.size() && is_space(text[j]))
        ++j;
    if (j >= text.size())
        return true;
    char next = text[j];
    if (next == '=' && (j + 1 >= text.size() || (text[j + 1] != '=' && text[j + 1] != '>')))
        return false;
    return next != '.' && next != ',' && next != ')' && next != ']' && next != ';';
}

StmtKind classify_statement(const std::string &text, bool in_switch,
                            const LanguageProfile &profile) {
    std::string t = trim(text);
    if (t.empty())
        return StmtKind::Simple;

    if (in_switch) {
        if (starts_with_keyword(t, "case") || starts_with_keyword(t, "default"))
            return StmtKind::Case;
        if (!profile.match_arrow.empty() &&
            find_top_level(t, profile.match_arrow) != std::string::npos)
            return StmtKind::Case;
    }

    if (starts_with_keyword(t, "async"))
        t = trim(t.substr(5));

    if (starts_with_keyword(t, "else")) {
        std::string rest = trim(t.substr(4));
        return starts_with_keyword(rest, "if") ? StmtKind::ElseIf : StmtKind::Else;
    }

    struct Rule {
        const char *keyword;
        StmtKind kind;
    };
    static const Rule rules[] = {
        {"elif", StmtKind::ElseIf},      {"elsif", StmtKind::ElseIf},
        {"elseif", StmtKind::ElseIf},    {"if", StmtKind::If},
        {"unless", StmtKind::If},        {"guard", StmtKind::If},
        {"switch", StmtKind::Switch},    {"match", StmtKind::Switch},
        {"when", StmtKind::Switch},      {"select", StmtKind::Switch},
        {"case", StmtKind::Case},        {"for", StmtKind::Loop},
        {"foreach", StmtKind::Loop},     {"while", StmtKind::Loop},
        {"loop", StmtKind::Loop},        {"do", StmtKind::Loop},
        {"repeat", StmtKind::Loop},      {"return", StmtKind::Return},
        {"throw", StmtKind::Return},     {"raise", StmtKind::Return},
        {"break", StmtKind::Break},      {"continue", StmtKind::Continue},
        {"goto", StmtKind::Goto},        {"try", StmtKind::Try},
        {"catch", StmtKind::Handler},    {"except", StmtKind::Handler},
        {"rescue", StmtKind::Handler},   {"finally", StmtKind::Scope},
        {"ensure", StmtKind::Scope},     {"with", StmtKind::Scope},
        {"unsafe", StmtKind::Scope},     {"synchronized", StmtKind::Scope},
        {"using", StmtKind::Scope},      {"lock", StmtKind::Scope},
    };
    for (const auto &rule : rules) {
        if (starts_with_keyword(t, rule.keyword))
            return rule.kind;
    }
    return StmtKind::Simple;
}

MaskedSource mask_source(const std::string &text, const LanguageProfile &profile) {
    MaskedSource out{text, text};
    const size_t n = text.size();

    auto blank = [&](size_t from, size_t to, bool comment) {
        for (size_t k = from; k < to && k < n; ++k) {
            if (text[k] == '\n')
                continue;
            out.masked[k] = ' ';
            if (comment)
                out.clean[k] = ' ';
        }
    };

    size_t i = 0;
    while (i < n) {
        bool comment = false;
        for (const auto &lc : profile.line_comments) {
            if (text.compare(i, lc.size(), lc) == 0) {
                size_t j = text.find('\n', i);
                if (j == std::string::npos)
                    j = n;
                blank(i, j, true);
                i = j;
                comment = true;
                break;
            }
        }
        if (comment)
            continue;

        const std::string &open = profile.block_comment_open;
        if (!open.empty() && text.compare(i, open.size(), open) == 0) {
            size_t j = text.find(profile.block_comment_close, i + open.size());
            size_t end = j == std::string::npos ? n : j + profile.block_comment_close.size();
            blank(i, end, true);
            i = end;
            continue;
        }

        char c = text[i];
        if (c != '"' && c != '\'' && c != '`') {
            ++i;
            continue;
        }

        // Rust lifetimes ('a) are not character literals
        if (c == '\'' && profile.name == "Rust" && !(i + 1 < n && text[i + 1] == '\\') &&
            !(i + 2 < n && text[i + 2] == '\'')) {
            ++i;
            continue;
        }

        if (c != '`' && i + 2 < n && text[i + 1] == c && text[i + 2] == c) {
            std::string triple(3, c);
            size_t j = text.find(triple, i + 3);
            size_t end = j == std::string::npos ? n : j + 3;
            blank(i + 3, j == std::string::npos ? n : j, false);
            i = end;
            continue;
        }

        size_t j = i + 1;
        while (j < n) {
            if (text[j] == '\\') {
                j += 2;
                continue;
            }
            if (text[j] == c || (text[j] == '\n' && c != '`'))
                break;
            ++j;
        }
        blank(i + 1, j, false);
        i = (j < n && text[j] == c) ? j + 1 : j;
    }
    return out;
}

size_t find_matching(const std::string &masked, size_t open) {
    if (open >= masked.size())
        return std::string::npos;
    int depth = 0;
    for (size_t i = open; i < masked.size(); ++i) {
        char c = masked[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (--depth == 0)
                return i;
        }
    }
    return std::string::npos;
}

StatementTree split_statements(const std::string &body, uint32_t first_line,
                               const LanguageProfile &profile) {
    if (profile.brace_delimited) {
        BraceSplitter splitter(body, first_line, profile);
        return splitter.run();
    }
    IndentSplitter splitter(body, first_line, profile);
    return splitter.run();
}

std::vector<std::string> parse_parameters(const std::string &signature,
                                          const LanguageProfile &profile) {
    std::vector<std::string> params;
    MaskedSource src = mask_source(signature, profile);
    const std::string &m = src.masked;

    size_t open = m.find('(');
    if (open == std::string::npos)
        return params;
    // Go method receivers: func (r *T) name(...)
    if (starts_with_keyword(trim(m), "func") && trim(m.substr(0, open)) == "func") {
        size_t close = find_matching(m, open);
        if (close == std::string::npos)
            return params;
        open = m.find('(', close + 1);
        if (open == std::string::npos)
            return params;
    }
    size_t close = find_matching(m, open);
    if (close == std::string::npos)
        return params;

    std::string inner = m.substr(open + 1, close - open - 1);

    // Split on commas outside (), [], {}, and generic <>
    std::vector<std::string> parts;
    int depth = 0;
    int angle = 0;
    size_t start = 0;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (c == '<' && i > 0 && is_ident_char(inner[i - 1])) {
            ++angle;
        } else if (c == '>' && angle > 0 && inner[i - 1] != '-' && inner[i - 1] != '=') {
            --angle;
        } else if (c == ',' && depth == 0 && angle == 0) {
            parts.push_back(inner.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(inner.substr(start));

    static const std::vector<std::string> skip = {
        "const",  "mut",       "final",     "ref",       "out",      "in",      "params",
        "var",    "val",       "let",       "readonly",  "inout",    "public",  "private",
        "protected", "override", "volatile", "register", "struct", "unsigned", "signed",
        "void"};

    for (const auto &raw : parts) {
        std::string p = trim(raw);
        size_t eq = std::string::npos;
        for (size_t i = 0; i < p.size(); ++i) {
            if (p[i] == '=' && (i + 1 >= p.size() || p[i + 1] != '=') &&
                (i == 0 || (p[i - 1] != '=' && p[i - 1] != '!'))) {
                eq = i;
                break;
            }
        }
        if (eq != std::string::npos)
            p = trim(p.substr(0, eq));
        if (p.empty())
            continue;

        bool destructure = p[0] == '{' || p[0] == '[' || p[0] == '(';
        size_t fnptr = p.find("(*");
        if (fnptr != std::string::npos && !destructure) {
            p = p.substr(fnptr + 2);
        } else {
            size_t colon = std::string::npos;
            for (size_t i = 0; i < p.size(); ++i) {
                if (p[i] == ':' && !(i + 1 < p.size() && p[i + 1] == ':') &&
                    !(i > 0 && p[i - 1] == ':')) {
                    colon = i;
                    break;
                }
            }
            if (colon != std::string::npos)
                p = p.substr(0, colon);
        }

        std::vector<std::string> idents;
        for (size_t i = 0; i < p.size();) {
            if (is_ident_char(p[i]) && !std::isdigit(static_cast<unsigned char>(p[i]))) {
                size_t j = i;
                while (j < p.size() && is_ident_char(p[j]))
                    ++j;
                std::string word = p.substr(i, j - i);
                if (std::find(skip.begin(), skip.end(), word) == skip.end())
                    idents.push_back(word);
                i = j;
            } else {
                ++i;
            }
        }
        if (idents.empty())
            continue;

        if (destructure && fnptr == std::string::npos) {
            params.insert(params.end(), idents.begin(), idents.end());
        } else if (profile.type_after_name || fnptr != std::string::npos) {
            params.push_back(idents.front());
        } else {
            params.push_back(idents.back());
        }
    }
    return params;
}

bool is_infinite_loop(const std::string &header) {
    std::string compact;
    for (char c : header) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            compact += c;
    }
    if (!compact.empty() && compact.back() == ':')
        compact.pop_back();
    if (!compact.empty() && compact.back() == '{')
        compact.pop_back();
    static const std::vector<std::string> forms = {"loop",     "while(true)", "whiletrue",
                                                   "whileTrue", "while(1)",    "for(;;)",
                                                   "for",      "while(True)", "do"};
    if (std::find(forms.begin(), forms.end(), compact) != forms.end())
        return compact != "do";
    return false;
}

} // namespace codegraph
