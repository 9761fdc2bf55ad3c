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

#include "codegraph/pdg.hpp"
#include <algorithm>
#include <queue>
#include <set>
#include <unordered_set>

namespace codegraph {

const char *dependence_kind_to_string(DependenceKind kind) {
    switch (kind) {
    case DependenceKind::ControlDependence:
        return "control";
    case DependenceKind::DataDependence:
        return "data";
    }
    return "unknown";
}

NodeId ProgramDependenceGraph::node_of(NodeId statement) const {
    if (statement >= stmt_to_node.size())
        return INVALID_NODE;
    return stmt_to_node[statement];
}

NodeId ProgramDependenceGraph::at_line(uint32_t line) const {
    for (NodeId id = 1; id < nodes.size(); ++id) {
        if (nodes[id].line == line)
            return id;
    }
    return INVALID_NODE;
}

namespace {

// Blocks reachable from `start` without entering `stop`
std::vector<bool> reach_avoiding(const Adjacency &succ, NodeId start, NodeId stop) {
    std::vector<bool> seen(succ.size(), false);
    if (start == stop)
        return seen;
    std::queue<NodeId> queue;
    queue.push(start);
    seen[start] = true;
    while (!queue.empty()) {
        NodeId b = queue.front();
        queue.pop();
        for (NodeId next : succ[b]) {
            if (next == stop || seen[next])
                continue;
            seen[next] = true;
            queue.push(next);
        }
    }
    return seen;
}

// Decision blocks each block is control dependent on
std::vector<std::vector<NodeId>> control_governors(const ControlFlowGraph &cfg) {
    size_t n = cfg.blocks.size();
    Adjacency succ = successors(n, cfg.edges);
    std::vector<std::vector<NodeId>> governors(n);

    std::vector<bool> reachable(n, false);
    for (NodeId b : reachable_blocks(cfg))
        reachable[b] = true;

    for (NodeId b = 0; b < n; ++b) {
        if (!reachable[b])
            continue;

        std::vector<NodeId> taken, not_taken;
        for (const auto &e : cfg.edges) {
            if (e.from != b)
                continue;
            if (e.kind == ControlKind::TrueBranch)
                taken.push_back(e.to);
            else if (e.kind == ControlKind::FalseBranch)
                not_taken.push_back(e.to);
        }
        std::vector<NodeId> children = taken;
        children.insert(children.end(), not_taken.begin(), not_taken.end());
        std::sort(children.begin(), children.end());
        children.erase(std::unique(children.begin(), children.end()), children.end());
        if (children.size() < 2)
            continue;

        std::vector<bool> dependent(n, false);
        if (cfg.blocks[b].kind == BlockKind::Loop) {
            // Only the body: code after the loop runs whether or not it iterates
            std::vector<bool> body(n, false), exit(n, false);
            for (NodeId c : taken) {
                auto r = reach_avoiding(succ, c, b);
                for (size_t i = 0; i < n; ++i)
                    body[i] = body[i] || r[i];
            }
            for (NodeId c : not_taken) {
                auto r = reach_avoiding(succ, c, b);
                for (size_t i = 0; i < n; ++i)
                    exit[i] = exit[i] || r[i];
            }
            for (size_t i = 0; i < n; ++i)
                dependent[i] = body[i] && !exit[i];
        } else {
            std::vector<int> count(n, 0);
            for (NodeId c : children) {
                auto r = reach_avoiding(succ, c, b);
                for (size_t i = 0; i < n; ++i) {
                    if (r[i])
                        ++count[i];
                }
            }
            for (size_t i = 0; i < n; ++i)
                dependent[i] = count[i] == 1;
        }

        for (NodeId x = 0; x < n; ++x) {
            if (dependent[x] && x != b)
                governors[x].push_back(b);
        }
    }
    return governors;
}

std::vector<NodeId> slice(const ProgramDependenceGraph &pdg, NodeId node, bool forward) {
    std::vector<NodeId> out;
    if (node >= pdg.nodes.size())
        return out;
    Adjacency adj = forward ? successors(pdg.nodes.size(), pdg.edges)
                            : predecessors(pdg.nodes.size(), pdg.edges);

    // Fixed point: every node reached once
    std::vector<bool> seen(pdg.nodes.size(), false);
    std::queue<NodeId> queue;
    queue.push(node);
    seen[node] = true;
    while (!queue.empty()) {
        NodeId n = queue.front();
        queue.pop();
        out.push_back(n);
        for (NodeId next : adj[n]) {
            if (!seen[next]) {
                seen[next] = true;
                queue.push(next);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<bool> data_reach(const DataFlowGraph &dfg, NodeId source) {
    std::vector<bool> seen(dfg.nodes.size(), false);
    if (source >= dfg.nodes.size())
        return seen;
    Adjacency succ = successors(dfg.nodes.size(), dfg.edges);
    std::queue<NodeId> queue;
    queue.push(source);
    seen[source] = true;
    while (!queue.empty()) {
        NodeId n = queue.front();
        queue.pop();
        for (NodeId next : succ[n]) {
            if (!seen[next]) {
                seen[next] = true;
                queue.push(next);
            }
        }
    }
    return seen;
}

} // namespace

// ============================================================================
// Build
// ============================================================================

ProgramDependenceGraph build_pdg(const StatementTree &tree, const ControlFlowGraph &cfg,
                                 const DataFlowGraph &dfg) {
    ProgramDependenceGraph pdg;
    pdg.nodes.add(PdgNode{});
    pdg.stmt_to_node.assign(tree.size(), INVALID_NODE);

    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        for (NodeId s : cfg.blocks[b].statements) {
            PdgNode node;
            node.statement = s;
            node.block = b;
            node.kind = tree[s].kind;
            node.text = tree[s].text;
            node.line = tree[s].line;
            pdg.stmt_to_node[s] = pdg.nodes.add(std::move(node));
        }
    }

    std::set<std::pair<NodeId, NodeId>> seen_control, seen_data;
    auto add_edge = [&](NodeId from, NodeId to, DependenceKind kind) {
        if (from == INVALID_NODE || to == INVALID_NODE || from == to)
            return;
        auto &seen = kind == DependenceKind::ControlDependence ? seen_control : seen_data;
        if (seen.insert({from, to}).second)
            pdg.edges.push_back({from, to, kind});
    };

    // Control dependence
    std::vector<std::vector<NodeId>> governors = control_governors(cfg);
    std::vector<bool> reachable(cfg.blocks.size(), false);
    for (NodeId b : reachable_blocks(cfg))
        reachable[b] = true;

    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        const BasicBlock &block = cfg.blocks[b];
        if (block.statements.empty())
            continue;
        if (governors[b].empty()) {
            if (!reachable[b])
                continue;
            for (NodeId s : block.statements)
                add_edge(PDG_ENTRY, pdg.node_of(s), DependenceKind::ControlDependence);
            continue;
        }
        for (NodeId g : governors[b]) {
            const BasicBlock &decision = cfg.blocks[g];
            if (decision.statements.empty())
                continue;
            NodeId header = pdg.node_of(decision.statements.back());
            for (NodeId s : block.statements)
                add_edge(header, pdg.node_of(s), DependenceKind::ControlDependence);
        }
    }

    // Data dependence, retagged def-use chains
    for (const auto &e : dfg.edges) {
        if (e.kind != DataKind::DefUse)
            continue;
        const VarNode &def = dfg.nodes[e.from];
        const VarNode &use = dfg.nodes[e.to];
        NodeId from = def.statement == INVALID_NODE ? PDG_ENTRY : pdg.node_of(def.statement);
        add_edge(from, pdg.node_of(use.statement), DependenceKind::DataDependence);
    }

    return pdg;
}

// ============================================================================
// Slicing and derived analyses
// ============================================================================

std::vector<NodeId> backward_slice(const ProgramDependenceGraph &pdg, NodeId node) {
    return slice(pdg, node, false);
}

std::vector<NodeId> forward_slice(const ProgramDependenceGraph &pdg, NodeId node) {
    return slice(pdg, node, true);
}

std::vector<std::vector<NodeId>> parallel_candidates(const ProgramDependenceGraph &pdg) {
    size_t n = pdg.nodes.size();
    Adjacency succ = successors(n, pdg.edges);
    Adjacency pred = predecessors(n, pdg.edges);

    // Marks every node reachable from start without revisiting marked ones
    auto spread = [](const Adjacency &adj, NodeId start, std::vector<bool> &marked) {
        std::queue<NodeId> queue;
        queue.push(start);
        while (!queue.empty()) {
            NodeId v = queue.front();
            queue.pop();
            for (NodeId next : adj[v]) {
                if (!marked[next]) {
                    marked[next] = true;
                    queue.push(next);
                }
            }
        }
    };

    // downstream: reached from some member; upstream: reaches some member.
    // A node is independent of the whole group iff it is in neither set.
    std::vector<std::vector<NodeId>> groups;
    std::vector<bool> grouped(n, false);
    std::vector<bool> downstream(n, false), upstream(n, false);
    for (NodeId a = 1; a < n; ++a) {
        if (grouped[a])
            continue;
        std::fill(downstream.begin(), downstream.end(), false);
        std::fill(upstream.begin(), upstream.end(), false);
        std::vector<NodeId> group = {a};
        spread(succ, a, downstream);
        spread(pred, a, upstream);
        for (NodeId b = a + 1; b < n; ++b) {
            if (grouped[b] || downstream[b] || upstream[b])
                continue;
            group.push_back(b);
            spread(succ, b, downstream);
            spread(pred, b, upstream);
        }
        if (group.size() > 1) {
            for (NodeId member : group)
                grouped[member] = true;
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

std::vector<NodeId> taint(const DataFlowGraph &dfg, const std::vector<NodeId> &sources,
                          const std::vector<NodeId> &sinks) {
    std::vector<bool> tainted(dfg.nodes.size(), false);
    for (NodeId source : sources) {
        std::vector<bool> r = data_reach(dfg, source);
        for (size_t i = 0; i < r.size(); ++i)
            tainted[i] = tainted[i] || r[i];
    }

    std::vector<NodeId> out;
    for (NodeId sink : sinks) {
        if (sink < tainted.size() && tainted[sink])
            out.push_back(sink);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<TaintFlow> taint_by_name(const DataFlowGraph &dfg,
                                     const std::vector<std::string> &source_names,
                                     const std::vector<std::string> &sink_names) {
    std::unordered_set<std::string> source_set(source_names.begin(), source_names.end());
    std::unordered_set<std::string> sink_set(sink_names.begin(), sink_names.end());

    std::vector<NodeId> sinks;
    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &node = dfg.nodes[id];
        if ((node.kind == VarKind::Use || node.kind == VarKind::Call) && sink_set.count(node.name))
            sinks.push_back(id);
    }

    std::vector<TaintFlow> flows;
    std::vector<bool> reported(dfg.nodes.size(), false);
    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &node = dfg.nodes[id];
        bool produces = node.kind == VarKind::Definition || node.kind == VarKind::Parameter ||
                        node.kind == VarKind::Call;
        if (!produces || !source_set.count(node.name))
            continue;
        for (NodeId sink : taint(dfg, {id}, sinks)) {
            if (!reported[sink]) {
                reported[sink] = true;
                flows.push_back({id, sink});
            }
        }
    }
    std::sort(flows.begin(), flows.end(),
              [](const TaintFlow &a, const TaintFlow &b) { return a.sink < b.sink; });
    return flows;
}

} // namespace codegraph
