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

#include "codegraph/dfg.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace codegraph {

const char *var_kind_to_string(VarKind kind) {
    switch (kind) {
    case VarKind::Definition:
        return "definition";
    case VarKind::Use:
        return "use";
    case VarKind::Parameter:
        return "parameter";
    case VarKind::Constant:
        return "constant";
    case VarKind::Operation:
        return "operation";
    case VarKind::Call:
        return "call";
    }
    return "unknown";
}

const char *data_kind_to_string(DataKind kind) {
    switch (kind) {
    case DataKind::DefUse:
        return "def_use";
    case DataKind::Flow:
        return "flow";
    }
    return "unknown";
}

std::vector<NodeId> DataFlowGraph::of_kind(VarKind kind) const {
    std::vector<NodeId> out;
    for (NodeId id = 0; id < nodes.size(); ++id) {
        if (nodes[id].kind == kind)
            out.push_back(id);
    }
    return out;
}

namespace {

// ============================================================================
// Expression tokens
// ============================================================================
enum class TokKind { Ident, Number, String, Op, Open, Close, Comma, Sep, Colon, Assign };

struct Token {
    TokKind kind;
    std::string text;
};

bool ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

bool ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

std::vector<Token> tokenize(const std::string &text) {
    static const std::vector<std::string> multi = {
        "<<=", ">>=", "**=", "//=", "...", "??=", "&&=", "||=", "->", "=>", "::", "?.",
        "==",  "!=",  "<=",  ">=",  "&&",  "||",  "<<",  ">>", "**", "//", "+=", "-=",
        "*=",  "/=",  "%=",  "&=",  "|=",  "^=",  ":=",  "++", "--", "??"};
    std::vector<Token> out;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (ident_start(c)) {
            size_t j = i;
            while (j < text.size() && ident_char(text[j]))
                ++j;
            std::string word = text.substr(i, j - i);
            // f"..", r"..", b".." string prefixes
            if (j < text.size() && (text[j] == '"' || text[j] == '\'') && word.size() <= 2 &&
                word.find_first_not_of("fFrRbBuU") == std::string::npos) {
                i = j;
                continue;
            }
            out.push_back({TokKind::Ident, word});
            i = j;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < text.size() && (ident_char(text[j]) || text[j] == '.'))
                ++j;
            out.push_back({TokKind::Number, text.substr(i, j - i)});
            i = j;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            bool triple = i + 2 < text.size() && text[i + 1] == c && text[i + 2] == c;
            size_t j = i + (triple ? 3 : 1);
            while (j < text.size()) {
                if (text[j] == '\\') {
                    j += 2;
                    continue;
                }
                if (text[j] == c) {
                    if (!triple)
                        break;
                    if (j + 2 < text.size() && text[j + 1] == c && text[j + 2] == c) {
                        j += 2;
                        break;
                    }
                }
                ++j;
            }
            size_t end = std::min(j + 1, text.size());
            out.push_back({TokKind::String, text.substr(i, end - i)});
            i = end;
            continue;
        }

        bool matched = false;
        for (const auto &op : multi) {
            if (text.compare(i, op.size(), op) == 0) {
                TokKind kind = TokKind::Op;
                if (op == "->" || op == "::" || op == "?.")
                    kind = TokKind::Sep;
                else if (op == ":=" || (op.back() == '=' && op != "==" && op != "!=" &&
                                        op != "<=" && op != ">="))
                    kind = TokKind::Assign;
                out.push_back({kind, op});
                i += op.size();
                matched = true;
                break;
            }
        }
        if (matched)
            continue;

        TokKind kind = TokKind::Op;
        switch (c) {
        case '(':
        case '[':
        case '{':
            kind = TokKind::Open;
            break;
        case ')':
        case ']':
        case '}':
            kind = TokKind::Close;
            break;
        case ',':
            kind = TokKind::Comma;
            break;
        case '.':
            kind = TokKind::Sep;
            break;
        case ':':
            kind = TokKind::Colon;
            break;
        case '=':
            kind = TokKind::Assign;
            break;
        default:
            break;
        }
        out.push_back({kind, std::string(1, c)});
        ++i;
    }
    return out;
}

bool is_literal_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {
        "true", "false", "True", "False", "None", "null", "nil", "undefined", "NULL", "nullptr",
        "NaN",  "Infinity"};
    return words.count(w) > 0;
}

bool is_word_operator(const std::string &w) {
    static const std::unordered_set<std::string> words = {"and", "or", "not", "in",
                                                          "is",  "instanceof", "typeof"};
    return words.count(w) > 0;
}

// Object references that never carry a local definition
bool is_receiver_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {"this", "self", "Self", "super", "base"};
    return words.count(w) > 0;
}

// Words that introduce a declaration of the following name
bool is_decl_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {"let", "const", "var", "val",
                                                          "auto", "my", "local"};
    return words.count(w) > 0;
}

// Modifiers that may precede a declaration and carry no data flow
bool is_modifier_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {
        "mut",      "static",   "final",    "pub",    "readonly", "volatile", "register",
        "constexpr", "unsigned", "signed",  "extern", "public",   "private",  "protected"};
    return words.count(w) > 0;
}

// Leading control words stripped before a statement is analyzed
bool is_control_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {
        "if",     "elif",   "else",  "elseif", "elsif",  "while",  "until",  "unless", "switch",
        "match",  "when",   "select", "case",  "return", "throw",  "raise",  "yield",  "await",
        "go",     "defer",  "del",   "delete", "assert", "echo",   "do",     "loop",   "try",
        "finally", "unsafe", "with", "using",  "lock",   "synchronized"};
    return words.count(w) > 0;
}

// Keywords that may be directly followed by "(" without being calls
bool is_non_call_word(const std::string &w) {
    static const std::unordered_set<std::string> words = {
        "for",    "foreach", "catch",  "except", "function", "fn",     "func",  "fun",
        "def",    "sizeof",  "alignof", "decltype", "typeof", "lambda", "class", "struct",
        "enum",   "new",     "delete", "in",     "not",      "and",    "or",    "is"};
    return words.count(w) > 0 || is_control_word(w);
}

// Split at top-level occurrences of `sep`, respecting brackets and quotes
std::vector<std::string> split_top_level(const std::string &text, const std::string &sep) {
    std::vector<std::string> parts;
    int depth = 0;
    char quote = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\')
                ++i;
            else if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (depth == 0 && text.compare(i, sep.size(), sep) == 0) {
            parts.push_back(text.substr(start, i - start));
            i += sep.size() - 1;
            start = i + 1;
        }
    }
    parts.push_back(text.substr(start));
    return parts;
}

// Text after the leading keyword, without one pair of wrapping parentheses
std::string header_inner(const std::string &header) {
    std::string t = trim(header);
    size_t i = 0;
    while (i < t.size() && ident_char(t[i]))
        ++i;
    std::string rest = trim(t.substr(i));
    while (!rest.empty() && (rest.back() == ':' || rest.back() == '{'))
        rest = trim(rest.substr(0, rest.size() - 1));
    if (!rest.empty() && rest.front() == '(') {
        size_t close = find_matching(rest, 0);
        if (close == rest.size() - 1)
            rest = rest.substr(1, rest.size() - 2);
    }
    return rest;
}

// ============================================================================
// Builder
// ============================================================================
using Bindings = std::unordered_map<std::string, std::set<NodeId>>;

struct State {
    std::vector<Bindings> scopes;
    bool dead = false;
};

class DfgBuilder {
public:
    DfgBuilder(const StatementTree &tree, const LanguageProfile &profile)
        : tree_(tree), profile_(profile) {}

    DataFlowGraph build(const std::vector<std::string> &parameters, uint32_t parameters_line) {
        state_.scopes.emplace_back();
        for (const auto &p : parameters) {
            VarNode node;
            node.kind = VarKind::Parameter;
            node.name = p;
            node.line = parameters_line;
            NodeId id = dfg_.nodes.add(std::move(node));
            state_.scopes[0][p] = {id};
        }
        visit_list(tree_.roots);
        return std::move(dfg_);
    }

private:
    struct Frame {
        bool is_loop;
        NodeId start;
        std::vector<std::pair<NodeId, std::string>> exposed;
        std::vector<State> continues;
        std::vector<State> breaks;
    };

    // Per-statement expression context
    struct StmtCtx {
        NodeId stmt;
        uint32_t line;
        std::vector<NodeId> items; // top-level uses, constants and calls
        std::vector<std::string> ops;
        std::vector<std::string> operands;
        bool has_call = false;
    };

    const StatementTree &tree_;
    const LanguageProfile &profile_;
    DataFlowGraph dfg_;
    State state_;
    std::vector<Frame> frames_;
    std::unordered_set<std::string> exported_;
    std::set<std::pair<NodeId, NodeId>> def_use_;

    // Reserved in this language, or a word with no data flow of its own
    bool reserved(const std::string &w) const {
        return profile_.is_keyword(w) || is_receiver_word(w) || is_literal_word(w) ||
               is_word_operator(w);
    }

    // ============ Environment ============

    const std::set<NodeId> *lookup(const State &state, const std::string &name) const {
        for (auto it = state.scopes.rbegin(); it != state.scopes.rend(); ++it) {
            auto found = it->find(name);
            if (found != it->end())
                return &found->second;
        }
        return nullptr;
    }

    void bind(const std::string &name, NodeId def, bool declare) {
        if (declare) {
            state_.scopes.back()[name] = {def};
            return;
        }
        for (auto it = state_.scopes.rbegin(); it != state_.scopes.rend(); ++it) {
            auto found = it->find(name);
            if (found != it->end()) {
                found->second = {def};
                return;
            }
        }
        state_.scopes.front()[name] = {def};
    }

    State merge(const std::vector<State> &states, size_t depth) const {
        State out;
        out.scopes.resize(depth);
        bool any_live = false;
        for (const auto &s : states) {
            if (s.dead)
                continue;
            any_live = true;
            for (size_t k = 0; k < depth && k < s.scopes.size(); ++k) {
                for (const auto &[name, ids] : s.scopes[k]) {
                    out.scopes[k][name].insert(ids.begin(), ids.end());
                }
            }
        }
        if (!any_live) {
            // Every path jumped away; keep the first snapshot so later code still resolves
            out = states.empty() ? state_ : states.front();
            out.scopes.resize(depth);
            out.dead = true;
        }
        return out;
    }

    void push_scope() { state_.scopes.emplace_back(); }

    void pop_to(size_t depth) {
        if (state_.scopes.size() > depth)
            state_.scopes.resize(depth);
    }

    void add_def_use(NodeId def, NodeId use) {
        if (def_use_.insert({def, use}).second)
            dfg_.edges.push_back({def, use, DataKind::DefUse});
    }

    void add_flow(NodeId from, NodeId to) { dfg_.edges.push_back({from, to, DataKind::Flow}); }

    NodeId add_node(VarKind kind, const std::string &name, const StmtCtx &ctx) {
        VarNode node;
        node.kind = kind;
        node.name = name;
        node.line = ctx.line;
        node.statement = ctx.stmt;
        return dfg_.nodes.add(std::move(node));
    }

    // ============ Uses and definitions ============

    NodeId add_use(const std::string &name, StmtCtx &ctx) {
        NodeId use = add_node(VarKind::Use, name, ctx);
        const std::set<NodeId> *reaching = lookup(state_, name);
        std::string signature;
        if (reaching) {
            for (NodeId def : *reaching) {
                add_def_use(def, use);
                signature += std::to_string(def) + "|";
            }
        }
        if (signature.empty())
            signature = "u:" + name;
        ctx.operands.push_back(signature);

        // Upward-exposed in every enclosing loop it may come from outside of
        for (auto &frame : frames_) {
            if (!frame.is_loop)
                continue;
            bool exposed = !reaching || reaching->empty() ||
                           std::any_of(reaching->begin(), reaching->end(),
                                       [&](NodeId d) { return d < frame.start; });
            if (exposed)
                frame.exposed.emplace_back(use, name);
        }
        return use;
    }

    NodeId add_def(const std::string &name, bool declare, StmtCtx &ctx) {
        NodeId def = add_node(VarKind::Definition, name, ctx);
        if (exported_.count(name))
            dfg_.nodes[def].exported = true;
        bind(name, def, declare);
        return def;
    }

    void mark_exported(const std::string &name) {
        exported_.insert(name);
        for (auto &node : dfg_.nodes) {
            if (node.kind == VarKind::Definition && node.name == name)
                node.exported = true;
        }
    }

    // Walk tokens [b, e) creating uses, constants, calls and collecting operators
    void walk(const std::vector<Token> &t, size_t b, size_t e, StmtCtx &ctx) {
        struct OpenCall {
            NodeId call;
            int depth;
        };
        std::vector<OpenCall> calls;
        std::vector<char> brackets;
        NodeId pending_call = INVALID_NODE;
        bool in_lambda_params = false;

        auto attach = [&](NodeId node) {
            if (!calls.empty())
                add_flow(node, calls.back().call);
            else
                ctx.items.push_back(node);
        };

        for (size_t i = b; i < e; ++i) {
            const Token &tok = t[i];
            switch (tok.kind) {
            case TokKind::Open:
                brackets.push_back(tok.text[0]);
                if (pending_call != INVALID_NODE && tok.text == "(") {
                    calls.push_back({pending_call, static_cast<int>(brackets.size())});
                }
                pending_call = INVALID_NODE;
                break;
            case TokKind::Close:
                if (!calls.empty() && calls.back().depth == static_cast<int>(brackets.size()))
                    calls.pop_back();
                if (!brackets.empty())
                    brackets.pop_back();
                break;
            case TokKind::Number:
            case TokKind::String: {
                NodeId c = add_node(VarKind::Constant, tok.text.substr(0, 40), ctx);
                ctx.operands.push_back("c:" + tok.text);
                attach(c);
                break;
            }
            case TokKind::Op:
                if (tok.text == "=>" || tok.text == "...")
                    break;
                if (calls.empty())
                    ctx.ops.push_back(tok.text);
                break;
            case TokKind::Colon:
                in_lambda_params = false;
                break;
            case TokKind::Ident: {
                if (in_lambda_params)
                    break;
                if (tok.text == "lambda") {
                    in_lambda_params = true;
                    break;
                }
                // Dotted chain a.b.c / a::b / a->b
                size_t j = i;
                std::string chain = tok.text;
                bool scoped = false;
                while (j + 2 < e && t[j + 1].kind == TokKind::Sep && t[j + 2].kind == TokKind::Ident) {
                    chain += t[j + 1].text + t[j + 2].text;
                    scoped = scoped || t[j + 1].text == "::";
                    j += 2;
                }
                bool after_sep = i > b && t[i - 1].kind == TokKind::Sep;
                bool is_call = j + 1 < e && t[j + 1].kind == TokKind::Open && t[j + 1].text == "(";
                const std::string &base = tok.text;

                if (is_word_operator(base)) {
                    if (calls.empty())
                        ctx.ops.push_back(base);
                    i = j;
                    break;
                }
                if (is_literal_word(base)) {
                    NodeId c = add_node(VarKind::Constant, base, ctx);
                    ctx.operands.push_back("c:" + base);
                    attach(c);
                    i = j;
                    break;
                }
                if (is_call && !(chain == base && is_non_call_word(base))) {
                    NodeId call = add_node(VarKind::Call, chain, ctx);
                    ctx.has_call = true;
                    attach(call);
                    // Receiver object flows into the method call
                    if (chain != base && !scoped && !after_sep && !reserved(base)) {
                        NodeId receiver = add_use(base, ctx);
                        add_flow(receiver, call);
                    }
                    // Calling a local function value reads its binding
                    if (chain == base && !after_sep && !reserved(base) && lookup(state_, base)) {
                        NodeId callee = add_use(base, ctx);
                        add_flow(callee, call);
                    }
                    pending_call = call;
                    i = j;
                    break;
                }
                if (after_sep || reserved(base) || scoped) {
                    i = j;
                    break;
                }
                // Keyword arguments and object keys are not variables
                bool next_assign = j + 1 < e && t[j + 1].kind == TokKind::Assign && t[j + 1].text == "=";
                bool next_colon = j + 1 < e && t[j + 1].kind == TokKind::Colon;
                if ((next_assign && !calls.empty()) ||
                    (next_colon && !brackets.empty() && brackets.back() == '{')) {
                    i = j;
                    break;
                }
                if (j + 1 < e && t[j + 1].kind == TokKind::Op && t[j + 1].text == "=>") {
                    i = j;
                    break;
                }
                attach(add_use(base, ctx));
                i = j;
                break;
            }
            default:
                break;
            }
        }
    }

    // Statement-level Operation node plus flow into the definitions
    void finish(StmtCtx &ctx, const std::vector<NodeId> &defs) {
        NodeId op = INVALID_NODE;
        if (!ctx.ops.empty()) {
            std::string name;
            for (const auto &o : ctx.ops) {
                if (name.find(o) == std::string::npos)
                    name += o;
            }
            op = add_node(VarKind::Operation, name, ctx);
            bool has_var = std::any_of(ctx.operands.begin(), ctx.operands.end(),
                                       [](const std::string &s) { return s.compare(0, 2, "c:") != 0; });
            if (!ctx.has_call && has_var) {
                std::vector<std::string> operands = ctx.operands;
                std::sort(operands.begin(), operands.end());
                std::string sig = name + "(";
                for (const auto &o : operands)
                    sig += o + ",";
                dfg_.nodes[op].signature = sig + ")";
            }
            for (NodeId item : ctx.items)
                add_flow(item, op);
        }
        for (NodeId def : defs) {
            if (op != INVALID_NODE) {
                add_flow(op, def);
            } else {
                for (NodeId item : ctx.items)
                    add_flow(item, def);
            }
        }
    }

    struct Target {
        std::vector<std::string> names; // defined names
        size_t use_begin = 0;           // token range read as uses (member/index targets)
        size_t use_end = 0;
        bool declare = false;
    };

    // Analyze one assignment target token range
    Target parse_target(const std::vector<Token> &t, size_t b, size_t e, bool declare) {
        Target target;
        target.declare = declare;
        // A lone "local" or "static" is the target itself
        while (b + 1 < e && t[b].kind == TokKind::Ident &&
               (is_decl_word(t[b].text) || is_modifier_word(t[b].text))) {
            target.declare = target.declare || is_decl_word(t[b].text);
            ++b;
        }
        // Type annotation: "x: int", "let y: Vec<T>"
        for (size_t k = b; k < e; ++k) {
            if (t[k].kind == TokKind::Colon) {
                e = k;
                break;
            }
            if (t[k].kind == TokKind::Open)
                break;
        }
        if (b < e && t[b].kind == TokKind::Op && t[b].text == "*" && !profile_.brace_delimited)
            ++b; // a, *rest = xs
        if (b >= e)
            return target;

        bool has_open = false;
        for (size_t k = b; k < e; ++k)
            has_open = has_open || t[k].kind == TokKind::Open;

        // Destructuring pattern
        if (t[b].kind == TokKind::Open || (has_open && target.declare && t[b].kind == TokKind::Ident &&
                                           std::isupper(static_cast<unsigned char>(t[b].text[0])))) {
            for (size_t k = b; k < e; ++k) {
                if (t[k].kind != TokKind::Ident || reserved(t[k].text))
                    continue;
                bool after_sep = k > b && t[k - 1].kind == TokKind::Sep;
                bool before = k + 1 < e && (t[k + 1].kind == TokKind::Open || t[k + 1].kind == TokKind::Sep ||
                                            t[k + 1].kind == TokKind::Colon);
                if (!after_sep && !before)
                    target.names.push_back(t[k].text);
            }
            return target;
        }

        if (e - b == 1 && t[b].kind == TokKind::Ident) {
            if (!reserved(t[b].text))
                target.names.push_back(t[b].text);
            return target;
        }

        // Typed declaration: "int x", "std::string s", "int *p", "var x int"
        const Token &last = t[e - 1];
        if (last.kind == TokKind::Ident && !has_open) {
            size_t prev = e - 2;
            while (prev > b && t[prev].kind == TokKind::Op && (t[prev].text == "*" || t[prev].text == "&"))
                --prev;
            bool typed = (t[prev].kind == TokKind::Ident || t[prev].text == ">") &&
                         !(t[prev].kind == TokKind::Op && (t[prev].text == "*" || t[prev].text == "&"));
            if (typed) {
                target.declare = true;
                if (profile_.type_after_name && t[b].kind == TokKind::Ident)
                    target.names.push_back(t[b].text);
                else
                    target.names.push_back(last.text);
                return target;
            }
        }

        // Member, index or dereference target: reads its base
        target.use_begin = b;
        target.use_end = e;
        return target;
    }

    // Split [b, e) at top-level commas
    static std::vector<std::pair<size_t, size_t>> split_commas(const std::vector<Token> &t, size_t b,
                                                               size_t e) {
        std::vector<std::pair<size_t, size_t>> parts;
        int depth = 0;
        int angle = 0;
        size_t start = b;
        for (size_t k = b; k < e; ++k) {
            if (t[k].kind == TokKind::Open)
                ++depth;
            else if (t[k].kind == TokKind::Close)
                --depth;
            else if (t[k].kind == TokKind::Op && t[k].text == "<")
                ++angle;
            else if (t[k].kind == TokKind::Op && t[k].text == ">" && angle > 0)
                --angle;
            else if (depth == 0 && angle == 0 && t[k].kind == TokKind::Comma) {
                parts.emplace_back(start, k);
                start = k + 1;
            }
        }
        parts.emplace_back(start, e);
        return parts;
    }

    // One simple statement (assignment, declaration, call, expression)
    void process_statement(const std::string &text, NodeId stmt, uint32_t line) {
        std::vector<Token> t = tokenize(text);
        size_t b = 0;
        size_t e = t.size();
        bool exported = false;
        while (b + 1 < e && t[b].kind == TokKind::Ident && t[b + 1].kind != TokKind::Assign &&
               (is_control_word(t[b].text) || t[b].text == "export")) {
            exported = exported || t[b].text == "export";
            ++b;
        }
        while (e > b && (t[e - 1].kind == TokKind::Colon || (t[e - 1].kind == TokKind::Op && t[e - 1].text == ";") ||
                         (t[e - 1].kind == TokKind::Open && t[e - 1].text == "{")))
            --e;
        if (b >= e)
            return;

        StmtCtx ctx{stmt, line, {}, {}, {}, false};

        // global x / nonlocal x
        if (t[b].kind == TokKind::Ident && (t[b].text == "global" || t[b].text == "nonlocal")) {
            for (size_t k = b + 1; k < e; ++k) {
                if (t[k].kind == TokKind::Ident)
                    mark_exported(t[k].text);
            }
            return;
        }

        // x++ / ++x / x--
        if (e - b == 2) {
            size_t name = t[b].kind == TokKind::Ident ? b : b + 1;
            size_t op = name == b ? b + 1 : b;
            if (t[name].kind == TokKind::Ident && !reserved(t[name].text) &&
                (t[op].text == "++" || t[op].text == "--")) {
                ctx.items.push_back(add_use(t[name].text, ctx));
                ctx.ops.push_back(t[op].text.substr(0, 1));
                NodeId def = add_def(t[name].text, false, ctx);
                finish(ctx, {def});
                return;
            }
        }

        // Top-level assignment operators
        std::vector<size_t> assigns;
        int depth = 0;
        for (size_t k = b; k < e; ++k) {
            if (t[k].kind == TokKind::Open)
                ++depth;
            else if (t[k].kind == TokKind::Close)
                --depth;
            else if (depth == 0 && t[k].kind == TokKind::Assign)
                assigns.push_back(k);
        }

        if (assigns.empty()) {
            // Declaration without initializer: "let x;", "int x;", "var x int"
            std::vector<Target> decls;
            bool all_decls = true;
            for (const auto &[pb, pe] : split_commas(t, b, e)) {
                bool declare = pb < pe && t[pb].kind == TokKind::Ident && is_decl_word(t[pb].text);
                Target target = parse_target(t, pb, pe, declare);
                if (!target.declare || target.names.empty()) {
                    all_decls = false;
                    break;
                }
                decls.push_back(std::move(target));
            }
            if (all_decls && !decls.empty()) {
                for (const auto &d : decls) {
                    for (const auto &n : d.names)
                        state_.scopes.back()[n] = {};
                }
                return;
            }
            walk(t, b, e, ctx);
            finish(ctx, {});
            return;
        }

        size_t last = assigns.back();
        std::string op = t[last].text;
        bool compound = op != "=" && op != ":=";

        // Targets: every segment before the last assignment operator
        std::vector<Target> targets;
        size_t seg_begin = b;
        for (size_t a : assigns) {
            bool declare = op == ":=" || (seg_begin + 1 < a && t[seg_begin].kind == TokKind::Ident &&
                                          is_decl_word(t[seg_begin].text));
            size_t seg_end = a;
            // "let x: T = ..." with a top-level colon before any comma
            for (const auto &[pb, pe] : split_commas(t, seg_begin, seg_end)) {
                targets.push_back(parse_target(t, pb, pe, declare));
            }
            seg_begin = a + 1;
        }

        // Reads on the left: compound operands and member/index bases
        for (const auto &target : targets) {
            if (target.use_end > target.use_begin)
                walk(t, target.use_begin, target.use_end, ctx);
            if (compound) {
                for (const auto &n : target.names)
                    ctx.items.push_back(add_use(n, ctx));
            }
        }
        if (compound) {
            std::string bare = op.substr(0, op.size() - 1);
            if (!bare.empty())
                ctx.ops.push_back(bare);
        }

        walk(t, last + 1, e, ctx);

        std::vector<NodeId> defs;
        for (const auto &target : targets) {
            for (const auto &n : target.names) {
                NodeId def = add_def(n, target.declare, ctx);
                if (exported)
                    dfg_.nodes[def].exported = true;
                defs.push_back(def);
            }
        }
        finish(ctx, defs);
    }

    void define_names(const std::vector<std::string> &names, NodeId stmt, uint32_t line,
                      const std::vector<NodeId> &sources) {
        StmtCtx ctx{stmt, line, {}, {}, {}, false};
        for (const auto &n : names) {
            NodeId def = add_def(n, true, ctx);
            for (NodeId s : sources)
                add_flow(s, def);
        }
    }

    // Expression whose top-level items are returned for flow wiring
    std::vector<NodeId> process_expression(const std::string &text, NodeId stmt, uint32_t line) {
        std::vector<Token> t = tokenize(text);
        StmtCtx ctx{stmt, line, {}, {}, {}, false};
        walk(t, 0, t.size(), ctx);
        std::vector<NodeId> items = ctx.items;
        finish(ctx, {});
        return items;
    }

    std::vector<std::string> binding_names(const std::string &text, bool last_only) const {
        std::vector<std::string> names;
        std::vector<Token> t = tokenize(text);
        bool structured = false;
        for (const auto &tok : t)
            structured = structured || (tok.kind == TokKind::Open && tok.text == "[");
        for (size_t k = 0; k < t.size(); ++k) {
            if (t[k].kind != TokKind::Ident || reserved(t[k].text))
                continue;
            bool before = k + 1 < t.size() && (t[k + 1].kind == TokKind::Sep ||
                                               (t[k + 1].kind == TokKind::Open && t[k + 1].text == "("));
            bool after = k > 0 && t[k - 1].kind == TokKind::Sep;
            if (!before && !after)
                names.push_back(t[k].text);
        }
        if (last_only && !structured && names.size() > 1)
            names.erase(names.begin(), names.end() - 1);
        return names;
    }

    // ============ Statements ============

    void visit_list(const std::vector<NodeId> &ids) {
        for (size_t i = 0; i < ids.size(); ++i) {
            NodeId id = ids[i];
            const Statement &s = tree_[id];
            switch (s.kind) {
            case StmtKind::If:
                i = visit_if_chain(ids, i);
                break;
            case StmtKind::Loop:
                i = visit_loop(ids, i);
                break;
            case StmtKind::Switch:
                visit_switch(id);
                break;
            case StmtKind::Try:
                i = visit_try(ids, i);
                break;
            case StmtKind::Simple:
                process_statement(s.text, id, s.line);
                break;
            case StmtKind::Return:
                process_statement(s.text, id, s.line);
                state_.dead = true;
                break;
            case StmtKind::Break:
            case StmtKind::Continue: {
                bool is_break = s.kind == StmtKind::Break;
                for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
                    if (is_break) {
                        it->breaks.push_back(state_);
                        break;
                    }
                    if (it->is_loop) {
                        it->continues.push_back(state_);
                        break;
                    }
                }
                state_.dead = true;
                break;
            }
            case StmtKind::Goto:
                state_.dead = true;
                break;
            case StmtKind::Label:
                state_.dead = false;
                break;
            case StmtKind::Nested:
                visit_nested(s, id);
                break;
            case StmtKind::Scope:
                visit_scope(s, id);
                break;
            case StmtKind::Else:
            case StmtKind::ElseIf:
            case StmtKind::Case:
            case StmtKind::Handler: {
                size_t depth = state_.scopes.size();
                push_scope();
                visit_list(s.children);
                pop_to(depth);
                break;
            }
            }
        }
    }

    void visit_nested(const Statement &s, NodeId id) {
        std::vector<Token> t = tokenize(s.text);
        for (const auto &tok : t) {
            if (tok.kind == TokKind::Assign) {
                process_statement(s.text, id, s.line);
                return;
            }
        }
        for (const auto &tok : t) {
            if (tok.kind == TokKind::Ident && !reserved(tok.text)) {
                define_names({tok.text}, id, s.line, {});
                return;
            }
        }
    }

    void visit_scope(const Statement &s, NodeId id) {
        std::string header = trim(s.text);
        size_t depth = state_.scopes.size();
        push_scope();
        if (starts_with_keyword(header, "with") || starts_with_keyword(header, "using") ||
            starts_with_keyword(header, "lock") || starts_with_keyword(header, "synchronized")) {
            std::string inner = header_inner(header);
            for (const auto &part : split_top_level(inner, ",")) {
                auto as = split_top_level(part, " as ");
                if (as.size() == 2) {
                    auto items = process_expression(as[0], id, s.line);
                    define_names(binding_names(as[1], false), id, s.line, items);
                } else {
                    process_statement(part, id, s.line);
                }
            }
        }
        visit_list(s.children);
        pop_to(depth);
    }

    // Condition of if/elif/while; Go-style "x := f(); x > 0" runs both parts
    void process_condition(const std::string &header, NodeId id, uint32_t line) {
        for (const auto &part : split_top_level(header, ";"))
            process_statement(part, id, line);
    }

    void visit_arm(const std::vector<NodeId> &children, size_t depth) {
        push_scope();
        visit_list(children);
        pop_to(depth);
    }

    size_t visit_if_chain(const std::vector<NodeId> &ids, size_t i) {
        size_t depth = state_.scopes.size();
        std::vector<State> outs;
        size_t j = i;
        process_condition(tree_[ids[j]].text, ids[j], tree_[ids[j]].line);
        State snapshot = state_;
        while (true) {
            state_ = snapshot;
            visit_arm(tree_[ids[j]].children, depth);
            outs.push_back(state_);
            state_ = snapshot;

            if (j + 1 < ids.size() && tree_[ids[j + 1]].kind == StmtKind::ElseIf) {
                ++j;
                process_condition(tree_[ids[j]].text, ids[j], tree_[ids[j]].line);
                snapshot = state_;
                continue;
            }
            if (j + 1 < ids.size() && tree_[ids[j + 1]].kind == StmtKind::Else) {
                ++j;
                visit_arm(tree_[ids[j]].children, depth);
            }
            outs.push_back(state_);
            break;
        }
        state_ = merge(outs, depth);
        return j;
    }

    size_t visit_loop(const std::vector<NodeId> &ids, size_t i) {
        const Statement &s = tree_[ids[i]];
        NodeId id = ids[i];
        size_t base_depth = state_.scopes.size();
        push_scope(); // loop-header scope: "for (int i = 0; ...)"
        size_t depth = state_.scopes.size();

        std::string inner = header_inner(s.text);
        std::string condition;
        std::string step;
        std::vector<std::string> vars;
        std::vector<NodeId> iter_items;
        bool foreach = false;

        bool is_for = starts_with_keyword(trim(s.text), "for") || starts_with_keyword(trim(s.text), "foreach");
        auto c_parts = split_top_level(inner, ";");
        if (is_for && c_parts.size() == 3) {
            process_statement(c_parts[0], id, s.line);
            condition = c_parts[1];
            step = c_parts[2];
        } else if (is_for) {
            auto in = split_top_level(inner, " in ");
            auto of = split_top_level(inner, " of ");
            auto as = split_top_level(inner, " as ");
            auto range_assign = split_top_level(inner, ":=");
            auto colon = split_top_level(inner, ":");
            foreach = true;
            if (in.size() == 2) {
                vars = binding_names(in[0], false);
                iter_items = process_expression(in[1], id, s.line);
            } else if (of.size() == 2) {
                vars = binding_names(of[0], false);
                iter_items = process_expression(of[1], id, s.line);
            } else if (as.size() == 2) {
                iter_items = process_expression(as[0], id, s.line);
                vars = binding_names(as[1], false);
            } else if (range_assign.size() == 2 && starts_with_keyword(trim(range_assign[1]), "range")) {
                vars = binding_names(range_assign[0], false);
                iter_items = process_expression(trim(range_assign[1]).substr(5), id, s.line);
            } else if (colon.size() == 2 && inner.find("::") == std::string::npos) {
                vars = binding_names(colon[0], true);
                iter_items = process_expression(colon[1], id, s.line);
            } else if (split_top_level(inner, " : ").size() == 2) {
                auto spaced = split_top_level(inner, " : ");
                vars = binding_names(spaced[0], true);
                iter_items = process_expression(spaced[1], id, s.line);
            } else {
                foreach = false;
                condition = inner;
            }
        } else if (!is_infinite_loop(s.text)) {
            condition = inner;
            // do { } while (x)
            if (starts_with_keyword(trim(s.text), "do"))
                condition = header_inner(trim(s.text).substr(2));
        }

        frames_.push_back({true, static_cast<NodeId>(dfg_.nodes.size()), {}, {}, {}});
        if (!condition.empty())
            process_statement(condition, id, s.line);
        State after_header = state_;

        push_scope();
        if (foreach)
            define_names(vars, id, s.line, iter_items);
        visit_list(s.children);
        pop_to(depth);

        if (!step.empty()) {
            std::vector<State> paths = frames_.back().continues;
            paths.push_back(state_);
            state_ = merge(paths, depth);
            state_.dead = false;
            process_statement(step, id, s.line);
            frames_.back().continues.clear();
        }

        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        State end = state_;

        // Loop-carried definitions reach upward-exposed uses of the next iteration
        std::vector<const State *> carriers;
        if (!end.dead)
            carriers.push_back(&end);
        for (const auto &c : frame.continues) {
            if (!c.dead)
                carriers.push_back(&c);
        }
        for (const auto &[use, name] : frame.exposed) {
            for (const State *carrier : carriers) {
                const std::set<NodeId> *defs = lookup(*carrier, name);
                if (!defs)
                    continue;
                for (NodeId def : *defs) {
                    if (def >= frame.start && dfg_.nodes[def].kind == VarKind::Definition)
                        add_def_use(def, use);
                }
            }
        }

        std::vector<State> exits;
        if (!is_infinite_loop(s.text))
            exits.push_back(after_header);
        exits.push_back(end);
        exits.insert(exits.end(), frame.continues.begin(), frame.continues.end());

        if (i + 1 < ids.size() && tree_[ids[i + 1]].kind == StmtKind::Else) {
            ++i;
            state_ = merge(exits, depth);
            state_.dead = false;
            visit_arm(tree_[ids[i]].children, depth);
            exits = {state_};
        }
        exits.insert(exits.end(), frame.breaks.begin(), frame.breaks.end());
        state_ = merge(exits, depth);
        pop_to(base_depth);
        return i;
    }

    void visit_switch(NodeId id) {
        const Statement &s = tree_[id];
        process_statement(header_inner(s.text), id, s.line);
        size_t depth = state_.scopes.size();
        State snapshot = state_;

        std::string header = trim(s.text);
        bool owns_break = starts_with_keyword(header, "switch") || starts_with_keyword(header, "select");
        if (owns_break)
            frames_.push_back({false, 0, {}, {}, {}});

        std::vector<State> outs;
        State carry;
        bool carrying = false;
        bool has_default = false;
        for (NodeId child : s.children) {
            const Statement &arm = tree_[child];
            state_ = carrying ? merge({snapshot, carry}, depth) : snapshot;
            state_.dead = false;
            carrying = false;
            push_scope();
            if (arm.kind == StmtKind::Case) {
                std::string t = trim(arm.text);
                has_default = has_default || starts_with_keyword(t, "default") ||
                              starts_with_keyword(t, "else") || t == "_" || t == "case _" ||
                              t == "case _:";
                process_statement(t, child, arm.line);
                visit_list(arm.children);
            } else {
                visit_list({child});
            }
            pop_to(depth);
            if (arm.kind == StmtKind::Case && arm.fallthrough && !state_.dead) {
                carry = state_;
                carrying = true;
            } else {
                outs.push_back(state_);
            }
        }
        if (carrying)
            outs.push_back(carry);
        if (!has_default)
            outs.push_back(snapshot);
        if (owns_break) {
            for (const auto &b : frames_.back().breaks)
                outs.push_back(b);
            frames_.pop_back();
        }
        state_ = merge(outs, depth);
    }

    std::vector<std::string> handler_names(const std::string &header) {
        auto as = split_top_level(header, " as ");
        if (as.size() == 2)
            return binding_names(as[1], true);
        std::string inner = header_inner(header);
        if (inner.find("...") != std::string::npos)
            return {};
        size_t arrow = inner.find("=>");
        if (arrow != std::string::npos)
            inner = inner.substr(arrow + 2);
        return binding_names(inner, true);
    }

    size_t visit_try(const std::vector<NodeId> &ids, size_t i) {
        size_t depth = state_.scopes.size();
        State snapshot = state_;
        visit_arm(tree_[ids[i]].children, depth);
        State body = state_;

        std::vector<State> outs;
        size_t j = i + 1;
        State handler_start = merge({snapshot, body}, depth);
        handler_start.dead = false;
        while (j < ids.size() && tree_[ids[j]].kind == StmtKind::Handler) {
            const Statement &h = tree_[ids[j]];
            state_ = handler_start;
            push_scope();
            define_names(handler_names(h.text), ids[j], h.line, {});
            visit_list(h.children);
            pop_to(depth);
            outs.push_back(state_);
            ++j;
        }
        if (j < ids.size() && tree_[ids[j]].kind == StmtKind::Else) {
            state_ = body;
            visit_arm(tree_[ids[j]].children, depth);
            body = state_;
            ++j;
        }
        outs.push_back(body);
        if (outs.size() == 1)
            outs.push_back(snapshot);
        state_ = merge(outs, depth);
        return j - 1;
    }
};

} // namespace

DataFlowGraph build_dfg(const StatementTree &tree, const std::vector<std::string> &parameters,
                        const LanguageProfile &profile, uint32_t parameters_line) {
    DfgBuilder builder(tree, profile);
    return builder.build(parameters, parameters_line);
}

std::vector<NodeId> unused_definitions(const DataFlowGraph &dfg) {
    std::vector<bool> used(dfg.nodes.size(), false);
    for (const auto &e : dfg.edges) {
        if (e.kind == DataKind::DefUse)
            used[e.from] = true;
    }
    std::vector<NodeId> out;
    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &n = dfg.nodes[id];
        if (n.kind == VarKind::Definition && !used[id] && !n.exported && n.name != "_")
            out.push_back(id);
    }
    return out;
}

Lifetime lifetime(const DataFlowGraph &dfg, NodeId definition) {
    const VarNode &def = dfg.nodes[definition];
    Lifetime out{def.name, definition, def.line, def.line};
    for (const auto &e : dfg.edges) {
        if (e.kind == DataKind::DefUse && e.from == definition)
            out.last_line = std::max(out.last_line, dfg.nodes[e.to].line);
    }
    return out;
}

std::vector<Lifetime> variable_lifetimes(const DataFlowGraph &dfg) {
    std::map<std::string, Lifetime> by_name;
    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &n = dfg.nodes[id];
        if (n.kind != VarKind::Definition && n.kind != VarKind::Parameter)
            continue;
        Lifetime one = lifetime(dfg, id);
        auto it = by_name.find(n.name);
        if (it == by_name.end()) {
            by_name.emplace(n.name, one);
            continue;
        }
        Lifetime &acc = it->second;
        if (one.first_line < acc.first_line) {
            acc.first_line = one.first_line;
            acc.definition = id;
        }
        acc.last_line = std::max(acc.last_line, one.last_line);
    }
    std::vector<Lifetime> out;
    for (auto &[name, lt] : by_name)
        out.push_back(std::move(lt));
    return out;
}

std::vector<RedundantPair> redundant_computations(const DataFlowGraph &dfg) {
    std::unordered_map<std::string, NodeId> first_seen;
    std::vector<RedundantPair> out;
    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &n = dfg.nodes[id];
        if (n.kind != VarKind::Operation || n.signature.empty())
            continue;
        auto [it, inserted] = first_seen.emplace(n.signature, id);
        if (!inserted && dfg.nodes[it->second].statement != n.statement)
            out.push_back({it->second, id});
    }
    return out;
}

} // namespace codegraph
