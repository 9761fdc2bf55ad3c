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

#include "codegraph/cfg.hpp"
#include <algorithm>
#include <cctype>
#include <queue>
#include <unordered_map>

namespace codegraph {

const char *block_kind_to_string(BlockKind kind) {
    switch (kind) {
    case BlockKind::Entry:
        return "entry";
    case BlockKind::Normal:
        return "normal";
    case BlockKind::Branch:
        return "branch";
    case BlockKind::Loop:
        return "loop";
    case BlockKind::Return:
        return "return";
    case BlockKind::Exit:
        return "exit";
    }
    return "unknown";
}

const char *control_kind_to_string(ControlKind kind) {
    switch (kind) {
    case ControlKind::Sequential:
        return "sequential";
    case ControlKind::TrueBranch:
        return "true";
    case ControlKind::FalseBranch:
        return "false";
    case ControlKind::LoopBack:
        return "loop_back";
    case ControlKind::Break:
        return "break";
    case ControlKind::Continue:
        return "continue";
    }
    return "unknown";
}

NodeId ControlFlowGraph::block_of(NodeId stmt) const {
    for (NodeId b = 0; b < blocks.size(); ++b) {
        const auto &stmts = blocks[b].statements;
        if (std::find(stmts.begin(), stmts.end(), stmt) != stmts.end())
            return b;
    }
    return INVALID_NODE;
}

namespace {

bool is_default_arm(const std::string &text) {
    std::string t = trim(text);
    if (starts_with_keyword(t, "default") || starts_with_keyword(t, "else"))
        return true;
    if (starts_with_keyword(t, "case")) {
        t = trim(t.substr(4));
        if (!t.empty() && t.back() == ':')
            t.pop_back();
        t = trim(t);
    }
    if (t == "_")
        return true;
    return t.size() > 1 && t[0] == '_' && !std::isalnum(static_cast<unsigned char>(t[1])) &&
           t[1] != '_';
}

// Top-level "c ? a : b" (not "?.", "??" or a trailing "?")
bool has_ternary(const std::string &text, const LanguageProfile &profile) {
    if (!profile.brace_delimited) {
        return text.find(" if ") != std::string::npos && text.find(" else ") != std::string::npos &&
               !starts_with_keyword(trim(text), "lambda");
    }
    int depth = 0;
    char quote = 0;
    bool question = false;
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
        } else if (depth == 0 && c == '?') {
            char next = i + 1 < text.size() ? text[i + 1] : '\0';
            char prev = i > 0 ? text[i - 1] : '\0';
            if (next != '.' && next != '?' && prev != '?' && next != '\0' && next != ';')
                question = true;
        } else if (depth == 0 && c == ':' && question) {
            bool scope = (i + 1 < text.size() && text[i + 1] == ':') || (i > 0 && text[i - 1] == ':');
            if (!scope)
                return true;
        }
    }
    return false;
}

// Label named by "break outer", "continue 'outer", "goto done"
std::string jump_target(const std::string &text) {
    std::string t = trim(text);
    size_t space = t.find_first_of(" \t");
    if (space == std::string::npos)
        return "";
    std::string rest = trim(t.substr(space));
    while (!rest.empty() && (rest.back() == ';' || std::isspace(static_cast<unsigned char>(rest.back()))))
        rest.pop_back();
    if (rest.empty())
        return "";
    size_t i = rest[0] == '\'' ? 1 : 0;
    for (; i < rest.size(); ++i) {
        char c = rest[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
            return "";
    }
    return rest;
}

std::string label_name(const std::string &text) {
    std::string t = trim(text);
    while (!t.empty() && (t.back() == ':' || std::isspace(static_cast<unsigned char>(t.back()))))
        t.pop_back();
    return t;
}

class CfgBuilder {
public:
    CfgBuilder(const StatementTree &tree, const LanguageProfile &profile)
        : tree_(tree), profile_(profile) {}

    ControlFlowGraph build() {
        BasicBlock entry;
        entry.kind = BlockKind::Entry;
        cfg_.entry = cfg_.blocks.add(std::move(entry));
        open_ = cfg_.entry;

        visit_list(tree_.roots);

        for (const auto &[from, label] : gotos_) {
            auto it = labels_.find(label);
            if (it != labels_.end())
                add_edge(from, it->second, ControlKind::Sequential);
        }

        std::vector<Pending> last = take_frontier();
        if (!last.empty() && cfg_.blocks.size() > 1) {
            BasicBlock exit;
            exit.kind = BlockKind::Exit;
            NodeId id = cfg_.blocks.add(std::move(exit));
            for (const auto &p : last)
                add_edge(p.from, id, p.kind);
        }

        for (auto &block : cfg_.blocks) {
            for (NodeId s : block.statements) {
                uint32_t line = tree_[s].line;
                if (block.start_line == 0 || line < block.start_line)
                    block.start_line = line;
                block.end_line = std::max(block.end_line, line);
            }
        }
        return std::move(cfg_);
    }

private:
    // Edge waiting for the next block to be created
    struct Pending {
        NodeId from;
        ControlKind kind;
    };

    struct Frame {
        bool is_loop;
        NodeId header;
        std::string label;
        std::vector<Pending> breaks;
    };

    const StatementTree &tree_;
    const LanguageProfile &profile_;
    ControlFlowGraph cfg_;

    // Current position: an open block, or edges waiting for a target
    NodeId open_ = INVALID_NODE;
    std::vector<Pending> pending_;

    std::vector<Frame> frames_;
    std::string next_label_;
    std::unordered_map<std::string, NodeId> labels_;
    std::vector<std::pair<NodeId, std::string>> gotos_;

    void add_edge(NodeId from, NodeId to, ControlKind kind) {
        cfg_.edges.push_back({from, to, kind});
    }

    std::vector<Pending> take_frontier() {
        std::vector<Pending> out = std::move(pending_);
        pending_.clear();
        if (open_ != INVALID_NODE)
            out.push_back({open_, ControlKind::Sequential});
        open_ = INVALID_NODE;
        return out;
    }

    void set_frontier(std::vector<Pending> frontier) {
        open_ = INVALID_NODE;
        pending_ = std::move(frontier);
    }

    NodeId start_block(BlockKind kind) {
        std::vector<Pending> incoming = take_frontier();
        BasicBlock block;
        block.kind = kind;
        NodeId id = cfg_.blocks.add(std::move(block));
        for (const auto &p : incoming)
            add_edge(p.from, id, p.kind);
        open_ = id;
        return id;
    }

    void append(NodeId stmt) {
        if (open_ == INVALID_NODE)
            start_block(BlockKind::Normal);
        cfg_.blocks[open_].statements.push_back(stmt);
    }

    Frame *find_frame(bool loop_only, const std::string &label) {
        if (!label.empty()) {
            for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
                if (it->label == label)
                    return &*it;
            }
        }
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (it->is_loop || !loop_only)
                return &*it;
        }
        return nullptr;
    }

    void visit_list(const std::vector<NodeId> &ids) {
        for (size_t i = 0; i < ids.size(); ++i) {
            NodeId id = ids[i];
            const Statement &s = tree_[id];
            if (s.kind != StmtKind::Label && s.kind != StmtKind::Loop)
                next_label_.clear();

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
            case StmtKind::Return:
                append(id);
                if (cfg_.blocks[open_].kind == BlockKind::Normal)
                    cfg_.blocks[open_].kind = BlockKind::Return;
                set_frontier({});
                break;
            case StmtKind::Break: {
                append(id);
                std::vector<Pending> from = take_frontier();
                Frame *frame = find_frame(false, jump_target(s.text));
                if (frame) {
                    for (const auto &p : from)
                        frame->breaks.push_back({p.from, ControlKind::Break});
                }
                break;
            }
            case StmtKind::Continue: {
                append(id);
                std::vector<Pending> from = take_frontier();
                Frame *frame = find_frame(true, jump_target(s.text));
                if (frame) {
                    for (const auto &p : from)
                        add_edge(p.from, frame->header, ControlKind::Continue);
                }
                break;
            }
            case StmtKind::Goto:
                append(id);
                gotos_.emplace_back(open_, jump_target(s.text));
                set_frontier({});
                break;
            case StmtKind::Label: {
                NodeId block = open_;
                if (block == INVALID_NODE || !cfg_.blocks[block].statements.empty() ||
                    cfg_.blocks[block].kind != BlockKind::Normal)
                    block = start_block(BlockKind::Normal);
                std::string name = label_name(s.text);
                labels_[name] = block;
                append(id);
                next_label_ = name;
                break;
            }
            case StmtKind::Simple:
                if (has_ternary(s.text, profile_)) {
                    NodeId b = start_block(BlockKind::Branch);
                    cfg_.blocks[b].statements.push_back(id);
                    set_frontier({{b, ControlKind::TrueBranch}, {b, ControlKind::FalseBranch}});
                } else {
                    append(id);
                }
                break;
            case StmtKind::Scope:
            case StmtKind::Handler:
            case StmtKind::Case:
                append(id);
                visit_list(s.children);
                break;
            case StmtKind::Else:
            case StmtKind::ElseIf:
                // Stray arm without a preceding header
                visit_list(s.children);
                break;
            case StmtKind::Nested:
                append(id);
                break;
            }
        }
    }

    size_t visit_if_chain(const std::vector<NodeId> &ids, size_t i) {
        std::vector<Pending> exits;
        size_t j = i;
        while (true) {
            NodeId branch = start_block(BlockKind::Branch);
            cfg_.blocks[branch].statements.push_back(ids[j]);
            set_frontier({{branch, ControlKind::TrueBranch}});
            visit_list(tree_[ids[j]].children);
            for (const auto &p : take_frontier())
                exits.push_back(p);
            set_frontier({{branch, ControlKind::FalseBranch}});

            if (j + 1 < ids.size() && tree_[ids[j + 1]].kind == StmtKind::ElseIf) {
                ++j;
                continue;
            }
            if (j + 1 < ids.size() && tree_[ids[j + 1]].kind == StmtKind::Else) {
                ++j;
                visit_list(tree_[ids[j]].children);
            }
            for (const auto &p : take_frontier())
                exits.push_back(p);
            set_frontier(std::move(exits));
            return j;
        }
    }

    size_t visit_loop(const std::vector<NodeId> &ids, size_t i) {
        const Statement &s = tree_[ids[i]];
        NodeId header = start_block(BlockKind::Loop);
        cfg_.blocks[header].statements.push_back(ids[i]);

        frames_.push_back({true, header, next_label_, {}});
        next_label_.clear();
        set_frontier({{header, ControlKind::TrueBranch}});
        visit_list(s.children);
        for (const auto &p : take_frontier()) {
            add_edge(p.from, header,
                     p.kind == ControlKind::Sequential ? ControlKind::LoopBack : p.kind);
        }
        Frame frame = std::move(frames_.back());
        frames_.pop_back();

        std::vector<Pending> exits;
        if (!is_infinite_loop(s.text))
            exits.push_back({header, ControlKind::FalseBranch});

        // for/while ... else: runs when the loop ends without break
        if (i + 1 < ids.size() && tree_[ids[i + 1]].kind == StmtKind::Else) {
            ++i;
            set_frontier(std::move(exits));
            visit_list(tree_[ids[i]].children);
            exits = take_frontier();
        }

        for (const auto &p : frame.breaks)
            exits.push_back(p);
        set_frontier(std::move(exits));
        return i;
    }

    void visit_switch(NodeId id) {
        const Statement &s = tree_[id];
        NodeId branch = start_block(BlockKind::Branch);
        cfg_.blocks[branch].statements.push_back(id);
        set_frontier({});

        // Only C-style switch/select statements own "break"
        std::string header = trim(s.text);
        bool owns_break = starts_with_keyword(header, "switch") || starts_with_keyword(header, "select");
        if (owns_break)
            frames_.push_back({false, branch, "", {}});

        std::vector<Pending> exits;
        std::vector<Pending> carry;
        bool has_default = false;
        for (NodeId child : s.children) {
            const Statement &arm = tree_[child];
            if (arm.kind != StmtKind::Case) {
                set_frontier(std::move(carry));
                visit_list({child});
                carry = take_frontier();
                continue;
            }

            bool is_default = is_default_arm(arm.text);
            has_default = has_default || is_default;
            std::vector<Pending> incoming = std::move(carry);
            carry.clear();
            incoming.push_back(
                {branch, is_default ? ControlKind::FalseBranch : ControlKind::TrueBranch});
            set_frontier(std::move(incoming));
            start_block(BlockKind::Normal);
            append(child);
            visit_list(arm.children);

            if (arm.fallthrough) {
                carry = take_frontier();
            } else {
                for (const auto &p : take_frontier())
                    exits.push_back(p);
            }
        }
        for (const auto &p : carry)
            exits.push_back(p);
        if (!has_default)
            exits.push_back({branch, ControlKind::FalseBranch});

        if (owns_break) {
            for (const auto &p : frames_.back().breaks)
                exits.push_back(p);
            frames_.pop_back();
        }
        set_frontier(std::move(exits));
    }

    size_t visit_try(const std::vector<NodeId> &ids, size_t i) {
        NodeId branch = start_block(BlockKind::Branch);
        cfg_.blocks[branch].statements.push_back(ids[i]);
        set_frontier({{branch, ControlKind::TrueBranch}});
        visit_list(tree_[ids[i]].children);
        std::vector<Pending> exits = take_frontier();

        size_t j = i + 1;
        bool has_handler = false;
        while (j < ids.size() && tree_[ids[j]].kind == StmtKind::Handler) {
            has_handler = true;
            set_frontier({{branch, ControlKind::FalseBranch}});
            start_block(BlockKind::Normal);
            append(ids[j]);
            visit_list(tree_[ids[j]].children);
            for (const auto &p : take_frontier())
                exits.push_back(p);
            ++j;
        }
        if (!has_handler)
            exits.push_back({branch, ControlKind::FalseBranch});

        // try ... else: approximated as running after the join
        if (j < ids.size() && tree_[ids[j]].kind == StmtKind::Else) {
            set_frontier(std::move(exits));
            visit_list(tree_[ids[j]].children);
            exits = take_frontier();
            ++j;
        }
        set_frontier(std::move(exits));
        return j - 1;
    }
};

} // namespace

ControlFlowGraph build_cfg(const StatementTree &tree, const LanguageProfile &profile) {
    CfgBuilder builder(tree, profile);
    return builder.build();
}

std::vector<NodeId> reachable_blocks(const ControlFlowGraph &cfg) {
    std::vector<NodeId> out;
    if (cfg.blocks.empty())
        return out;
    Adjacency succ = successors(cfg.blocks.size(), cfg.edges);
    std::vector<bool> seen(cfg.blocks.size(), false);
    std::queue<NodeId> queue;
    queue.push(cfg.entry);
    seen[cfg.entry] = true;
    while (!queue.empty()) {
        NodeId b = queue.front();
        queue.pop();
        for (NodeId next : succ[b]) {
            if (!seen[next]) {
                seen[next] = true;
                queue.push(next);
            }
        }
    }
    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        if (seen[b])
            out.push_back(b);
    }
    return out;
}

std::vector<NodeId> unreachable_blocks(const ControlFlowGraph &cfg) {
    std::vector<NodeId> reachable = reachable_blocks(cfg);
    std::vector<NodeId> out;
    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        if (!std::binary_search(reachable.begin(), reachable.end(), b))
            out.push_back(b);
    }
    return out;
}

int cyclomatic_complexity(const ControlFlowGraph &cfg) {
    std::vector<int> conditional(cfg.blocks.size(), 0);
    for (const auto &e : cfg.edges) {
        if (e.kind == ControlKind::TrueBranch || e.kind == ControlKind::FalseBranch)
            ++conditional[e.from];
    }
    int complexity = 1;
    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        BlockKind kind = cfg.blocks[b].kind;
        if ((kind == BlockKind::Branch || kind == BlockKind::Loop) && conditional[b] > 1)
            complexity += conditional[b] - 1;
    }
    return complexity;
}

std::vector<LoopInfo> find_loops(const ControlFlowGraph &cfg) {
    size_t n = cfg.blocks.size();
    Adjacency succ = successors(n, cfg.edges);
    Adjacency pred = predecessors(n, cfg.edges);

    auto forward_from = [&](NodeId start) {
        std::vector<bool> seen(n, false);
        std::vector<NodeId> stack = {start};
        seen[start] = true;
        while (!stack.empty()) {
            NodeId b = stack.back();
            stack.pop_back();
            for (NodeId next : succ[b]) {
                if (!seen[next]) {
                    seen[next] = true;
                    stack.push_back(next);
                }
            }
        }
        return seen;
    };

    std::vector<LoopInfo> loops;
    for (NodeId h = 0; h < n; ++h) {
        if (cfg.blocks[h].kind != BlockKind::Loop)
            continue;
        std::vector<bool> from_header = forward_from(h);

        // Back edges: p -> h where p is reachable from h
        std::vector<bool> in_loop(n, false);
        in_loop[h] = true;
        std::vector<NodeId> stack;
        for (NodeId p : pred[h]) {
            if (from_header[p] && !in_loop[p]) {
                in_loop[p] = true;
                stack.push_back(p);
            }
        }
        if (stack.empty() && std::none_of(pred[h].begin(), pred[h].end(),
                                          [&](NodeId p) { return p == h; }))
            continue;
        while (!stack.empty()) {
            NodeId b = stack.back();
            stack.pop_back();
            for (NodeId p : pred[b]) {
                if (!in_loop[p] && from_header[p]) {
                    in_loop[p] = true;
                    stack.push_back(p);
                }
            }
        }

        LoopInfo loop;
        loop.header = h;
        for (NodeId b = 0; b < n; ++b) {
            if (in_loop[b])
                loop.blocks.push_back(b);
        }
        loops.push_back(std::move(loop));
    }
    return loops;
}

} // namespace codegraph
