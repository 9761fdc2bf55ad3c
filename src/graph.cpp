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

#include "codegraph/graph.hpp"
#include "codegraph/diagnostics.hpp"
#include "codegraph/version.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace codegraph {

// ============================================================================
// JSON
// ============================================================================

json GraphDocument::to_json() const {
    json j;

    j["metadata"] = metadata.is_object() ? metadata : json::object();
    j["metadata"]["version"] = GRAPH_SCHEMA_VERSION;
    j["metadata"]["generator"] = std::string("codegraph ") + VERSION_STRING;
    j["metadata"]["graph"] = graph_kind;
    j["metadata"]["name"] = name;
    j["metadata"]["node_count"] = nodes.size();
    j["metadata"]["edge_count"] = edges.size();

    json node_array = json::array();
    for (const auto &node : nodes) {
        json n = node.attrs.is_object() ? node.attrs : json::object();
        n["id"] = node.id;
        n["kind"] = node.kind;
        n["label"] = node.label;
        node_array.push_back(std::move(n));
    }
    j["nodes"] = std::move(node_array);

    json edge_array = json::array();
    for (const auto &edge : edges) {
        json e = edge.attrs.is_object() ? edge.attrs : json::object();
        e["from"] = edge.from;
        e["to"] = edge.to;
        e["kind"] = edge.kind;
        edge_array.push_back(std::move(e));
    }
    j["edges"] = std::move(edge_array);

    return j;
}

namespace {

const json &require_field(const json &object, const char *field, const std::string &where) {
    if (!object.is_object() || !object.contains(field))
        throw InvalidRequest("Invalid graph document: " + where + " is missing \"" + field + "\"");
    return object[field];
}

NodeId require_id(const json &object, const char *field, const std::string &where) {
    const json &value = require_field(object, field, where);
    if (!value.is_number_unsigned())
        throw InvalidRequest("Invalid graph document: " + where + " field \"" + field +
                             "\" must be a non-negative integer");
    return value.get<NodeId>();
}

std::string require_string(const json &object, const char *field, const std::string &where) {
    const json &value = require_field(object, field, where);
    if (!value.is_string())
        throw InvalidRequest("Invalid graph document: " + where + " field \"" + field +
                             "\" must be a string");
    return value.get<std::string>();
}

// Every key except the reserved ones
json attrs_of(const json &object, std::initializer_list<const char *> reserved) {
    json attrs = json::object();
    for (auto it = object.begin(); it != object.end(); ++it) {
        bool skip = std::any_of(reserved.begin(), reserved.end(),
                                [&](const char *key) { return it.key() == key; });
        if (!skip)
            attrs[it.key()] = it.value();
    }
    return attrs;
}

} // namespace

GraphDocument GraphDocument::from_json(const json &j) {
    if (!j.is_object())
        throw InvalidRequest("Invalid graph document: expected a JSON object");

    GraphDocument doc;

    // Check schema version compatibility
    if (j.contains("metadata")) {
        const json &meta = j["metadata"];
        if (!meta.is_object())
            throw InvalidRequest("Invalid graph document: \"metadata\" must be an object");
        if (meta.contains("version") && meta["version"].is_string()) {
            std::string file_version = meta["version"].get<std::string>();
            int major = 0, minor = 0, patch = 0;
            if (!parse_version(file_version, major, minor, patch))
                throw InvalidRequest("Invalid graph document: malformed version \"" +
                                     file_version + "\"");
            if (!is_schema_compatible(major, minor, patch)) {
                throw InvalidRequest("Graph document version " + file_version +
                                     " is not compatible with this version of codegraph "
                                     "(requires " +
                                     std::to_string(MIN_COMPAT_SCHEMA_MAJOR) + "." +
                                     std::to_string(MIN_COMPAT_SCHEMA_MINOR) + "." +
                                     std::to_string(MIN_COMPAT_SCHEMA_PATCH) + " to " +
                                     GRAPH_SCHEMA_VERSION + ")");
            }
        }
        doc.metadata = attrs_of(meta, {"version", "generator", "graph", "name", "node_count",
                                       "edge_count"});
        if (meta.contains("graph") && meta["graph"].is_string())
            doc.graph_kind = meta["graph"].get<std::string>();
        if (meta.contains("name") && meta["name"].is_string())
            doc.name = meta["name"].get<std::string>();
    }

    const json &nodes = require_field(j, "nodes", "document");
    if (!nodes.is_array())
        throw InvalidRequest("Invalid graph document: \"nodes\" must be an array");
    const json &edges = require_field(j, "edges", "document");
    if (!edges.is_array())
        throw InvalidRequest("Invalid graph document: \"edges\" must be an array");

    std::unordered_set<NodeId> ids;
    for (size_t i = 0; i < nodes.size(); ++i) {
        std::string where = "node " + std::to_string(i);
        DocNode node;
        node.id = require_id(nodes[i], "id", where);
        node.kind = require_string(nodes[i], "kind", where);
        if (nodes[i].contains("label") && nodes[i]["label"].is_string())
            node.label = nodes[i]["label"].get<std::string>();
        node.attrs = attrs_of(nodes[i], {"id", "kind", "label"});
        if (!ids.insert(node.id).second)
            throw InvalidRequest("Invalid graph document: duplicate node id " +
                                 std::to_string(node.id));
        doc.nodes.push_back(std::move(node));
    }

    for (size_t i = 0; i < edges.size(); ++i) {
        std::string where = "edge " + std::to_string(i);
        DocEdge edge;
        edge.from = require_id(edges[i], "from", where);
        edge.to = require_id(edges[i], "to", where);
        edge.kind = require_string(edges[i], "kind", where);
        edge.attrs = attrs_of(edges[i], {"from", "to", "kind"});
        if (!ids.count(edge.from) || !ids.count(edge.to))
            throw InvalidRequest("Invalid graph document: " + where +
                                 " references an unknown node");
        doc.edges.push_back(std::move(edge));
    }

    return doc;
}

void write_file(const std::string &path, const std::string &content) {
    std::ofstream file(path);
    if (!file.is_open())
        throw InvalidRequest("Failed to open file for writing: " + path);
    file << content;
    if (!file)
        throw InvalidRequest("Failed to write file: " + path);
}

void GraphDocument::save(const std::string &path) const { write_file(path, to_json().dump(2)); }

GraphDocument GraphDocument::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw InvalidRequest("Failed to open file for reading: " + path);

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error &e) {
        throw InvalidRequest("Failed to parse graph document " + path + ": " + e.what());
    }
    return from_json(j);
}

std::vector<std::string> GraphDocument::findings() const {
    std::vector<std::string> out;
    if (!metadata.is_object() || !metadata.contains("findings") ||
        !metadata["findings"].is_array())
        return out;
    for (const auto &f : metadata["findings"]) {
        if (f.is_string())
            out.push_back(f.get<std::string>());
    }
    return out;
}

// ============================================================================
// DOT
// ============================================================================

namespace {

struct DotStyle {
    const char *shape;
    const char *color;
    bool dashed;
};

bool flag(const json &attrs, const char *key) {
    return attrs.is_object() && attrs.contains(key) && attrs[key].is_boolean() &&
           attrs[key].get<bool>();
}

DotStyle style_for(const std::string &graph_kind, const DocNode &node) {
    const std::string &k = node.kind;
    if (k == "external")
        return {"note", "white", true};

    if (graph_kind == "control-flow") {
        if (!node.attrs.is_null() && node.attrs.contains("reachable") && !flag(node.attrs, "reachable"))
            return {"box", "lightgrey", true};
        if (k == "entry")
            return {"ellipse", "palegreen", false};
        if (k == "exit")
            return {"ellipse", "lightcoral", false};
        if (k == "return")
            return {"box", "lightsalmon", false};
        if (k == "branch")
            return {"diamond", "lightyellow", false};
        if (k == "loop")
            return {"hexagon", "lightblue", false};
        return {"box", "white", false};
    }
    if (graph_kind == "call-graph") {
        if (flag(node.attrs, "recursive"))
            return {"box", "tomato", false};
        if (flag(node.attrs, "root"))
            return {"box", "palegreen", false};
        if (flag(node.attrs, "dead"))
            return {"box", "lightgrey", false};
        return {"box", "lightblue", false};
    }
    if (graph_kind == "dependency-graph") {
        if (flag(node.attrs, "in_cycle"))
            return {"folder", "tomato", false};
        if (flag(node.attrs, "root"))
            return {"folder", "palegreen", false};
        if (flag(node.attrs, "leaf"))
            return {"folder", "lightyellow", false};
        return {"folder", "lightblue", false};
    }
    if (graph_kind == "data-flow") {
        if (k == "definition")
            return {"box", "lightblue", false};
        if (k == "parameter")
            return {"box", "palegreen", false};
        if (k == "constant")
            return {"plaintext", "white", false};
        if (k == "operation")
            return {"circle", "lightyellow", false};
        if (k == "call")
            return {"box", "orange", false};
        return {"ellipse", "white", false};
    }
    if (graph_kind == "program-dependency") {
        if (k == "entry")
            return {"ellipse", "palegreen", false};
        if (k == "if" || k == "else_if" || k == "switch" || k == "case" || k == "try")
            return {"diamond", "lightyellow", false};
        if (k == "loop")
            return {"hexagon", "lightblue", false};
        return {"box", "white", false};
    }
    // syntax-tree
    if (k == "function")
        return {"box", "lightblue", false};
    if (k == "class")
        return {"box3d", "palegreen", false};
    if (k == "import")
        return {"note", "lightyellow", false};
    if (k == "call_site")
        return {"ellipse", "orange", false};
    return {"ellipse", "white", false};
}

std::string dot_escape(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
        case '\t':
            out += ' ';
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string shorten(const std::string &s, size_t max = 60) {
    std::string line = s.substr(0, s.find('\n'));
    if (line.size() <= max)
        return line;
    return line.substr(0, max - 3) + "...";
}

} // namespace

std::string GraphDocument::to_dot() const {
    std::ostringstream out;
    out << "digraph \"" << dot_escape(name.empty() ? graph_kind : name) << "\" {\n";
    out << "  rankdir=TB;\n";
    out << "  node [fontname=\"Helvetica\", fontsize=10];\n";
    out << "  edge [fontname=\"Helvetica\", fontsize=9];\n";

    for (const auto &node : nodes) {
        DotStyle style = style_for(graph_kind, node);
        out << "  n" << node.id << " [label=\"" << dot_escape(node.label) << "\", shape="
            << style.shape << ", style=\"filled" << (style.dashed ? ",dashed" : "")
            << "\", fillcolor=\"" << style.color << "\"];\n";
    }

    for (const auto &edge : edges) {
        out << "  n" << edge.from << " -> n" << edge.to;
        bool plain = edge.kind == "contains" || edge.kind == "call" || edge.kind == "import" ||
                     edge.kind == "sequential";
        if (edge.kind == "data")
            out << " [style=dashed, color=\"blue\", label=\"data\"]";
        else if (edge.kind == "loop_back")
            out << " [style=bold, label=\"loop_back\"]";
        else if (!plain)
            out << " [label=\"" << dot_escape(edge.kind) << "\"]";
        out << ";\n";
    }

    out << "}\n";
    return out.str();
}

// ============================================================================
// Summary
// ============================================================================

GraphSummary summarize(const GraphDocument &doc) {
    GraphSummary summary;
    summary.graph_kind = doc.graph_kind;
    summary.name = doc.name;
    summary.node_count = doc.nodes.size();
    summary.edge_count = doc.edges.size();
    summary.findings = doc.findings();
    return summary;
}

std::string GraphSummary::to_text() const {
    std::ostringstream out;
    out << graph_kind;
    if (!name.empty())
        out << ": " << name;
    out << "\n";
    out << "  Nodes: " << node_count << "\n";
    out << "  Edges: " << edge_count << "\n";
    for (const auto &f : findings)
        out << "  - " << f << "\n";
    return out.str();
}

// ============================================================================
// Converters
// ============================================================================

GraphDocument to_document(const SyntaxTree &tree) {
    GraphDocument doc;
    doc.graph_kind = "syntax-tree";
    doc.name = tree.file;

    std::map<DeclKind, size_t> counts;
    for (NodeId id = 0; id < tree.decls.size(); ++id) {
        const DeclNode &decl = tree.decls[id];
        ++counts[decl.kind];

        DocNode node;
        node.id = id;
        node.kind = decl_kind_to_string(decl.kind);
        node.label = decl.kind == DeclKind::CallSite || decl.kind == DeclKind::Import
                         ? (decl.target.empty() ? decl.name : decl.target)
                         : decl.qualified_name;
        node.attrs["name"] = decl.name;
        node.attrs["qualified_name"] = decl.qualified_name;
        node.attrs["file"] = decl.file;
        node.attrs["start_line"] = decl.start_line;
        node.attrs["end_line"] = decl.end_line;
        node.attrs["visibility"] = visibility_to_string(decl.visibility);
        node.attrs["language"] = decl.language;
        if (!decl.target.empty())
            node.attrs["target"] = decl.target;
        doc.nodes.push_back(std::move(node));

        if (decl.parent != INVALID_NODE)
            doc.edges.push_back({decl.parent, id, "contains", json::object()});
    }

    json findings = json::array();
    findings.push_back(std::to_string(counts[DeclKind::Function]) + " functions, " +
                       std::to_string(counts[DeclKind::Class]) + " classes, " +
                       std::to_string(counts[DeclKind::Import]) + " imports, " +
                       std::to_string(counts[DeclKind::CallSite]) + " call sites");
    if (tree.heuristic)
        findings.push_back("pattern-based extraction (heuristic): nesting inferred from layout");

    doc.metadata["file"] = tree.file;
    doc.metadata["language"] = tree.language;
    doc.metadata["heuristic"] = tree.heuristic;
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

GraphDocument to_document(const ControlFlowGraph &cfg, const StatementTree &statements,
                          const std::string &function) {
    GraphDocument doc;
    doc.graph_kind = "control-flow";
    doc.name = function;

    std::vector<NodeId> unreachable = unreachable_blocks(cfg);
    std::set<NodeId> dead(unreachable.begin(), unreachable.end());

    for (NodeId b = 0; b < cfg.blocks.size(); ++b) {
        const BasicBlock &block = cfg.blocks[b];
        DocNode node;
        node.id = b;
        node.kind = block_kind_to_string(block.kind);

        json texts = json::array();
        std::string label;
        for (NodeId s : block.statements) {
            texts.push_back(statements[s].text);
            if (!label.empty())
                label += "\n";
            label += shorten(statements[s].text);
        }
        if (label.empty())
            label = node.kind;
        node.label = label;
        node.attrs["start_line"] = block.start_line;
        node.attrs["end_line"] = block.end_line;
        node.attrs["statements"] = std::move(texts);
        node.attrs["reachable"] = dead.count(b) == 0;
        doc.nodes.push_back(std::move(node));
    }
    for (const auto &e : cfg.edges)
        doc.edges.push_back({e.from, e.to, control_kind_to_string(e.kind), json::object()});

    int complexity = cyclomatic_complexity(cfg);
    std::vector<LoopInfo> loops = find_loops(cfg);

    json findings = json::array();
    findings.push_back("cyclomatic complexity: " + std::to_string(complexity));
    for (NodeId b : unreachable) {
        if (!cfg.blocks[b].statements.empty())
            findings.push_back("unreachable code at line " +
                               std::to_string(cfg.blocks[b].start_line));
    }
    json loop_array = json::array();
    for (const auto &loop : loops) {
        findings.push_back("loop at line " + std::to_string(cfg.blocks[loop.header].start_line) +
                           " spanning " + std::to_string(loop.blocks.size()) + " blocks");
        loop_array.push_back(json{{"header", loop.header}, {"blocks", loop.blocks}});
    }

    doc.metadata["function"] = function;
    doc.metadata["entry"] = cfg.entry;
    doc.metadata["complexity"] = complexity;
    doc.metadata["unreachable"] = unreachable;
    doc.metadata["loops"] = std::move(loop_array);
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

GraphDocument to_document(const DataFlowGraph &dfg, const std::string &function) {
    GraphDocument doc;
    doc.graph_kind = "data-flow";
    doc.name = function;

    for (NodeId id = 0; id < dfg.nodes.size(); ++id) {
        const VarNode &var = dfg.nodes[id];
        DocNode node;
        node.id = id;
        node.kind = var_kind_to_string(var.kind);
        node.label = var.name + " @" + std::to_string(var.line);
        node.attrs["name"] = var.name;
        node.attrs["line"] = var.line;
        node.attrs["exported"] = var.exported;
        if (var.statement != INVALID_NODE)
            node.attrs["statement"] = var.statement;
        if (!var.signature.empty())
            node.attrs["signature"] = var.signature;
        doc.nodes.push_back(std::move(node));
    }
    for (const auto &e : dfg.edges)
        doc.edges.push_back({e.from, e.to, data_kind_to_string(e.kind), json::object()});

    std::vector<NodeId> unused = unused_definitions(dfg);
    std::vector<RedundantPair> redundant = redundant_computations(dfg);

    json findings = json::array();
    for (NodeId id : unused) {
        findings.push_back("unused definition of '" + dfg.nodes[id].name + "' at line " +
                           std::to_string(dfg.nodes[id].line));
    }
    for (const auto &pair : redundant) {
        findings.push_back("redundant computation '" + dfg.nodes[pair.second].name +
                           "' at line " + std::to_string(dfg.nodes[pair.second].line) +
                           " repeats line " + std::to_string(dfg.nodes[pair.first].line));
    }
    json lifetimes = json::array();
    for (const auto &l : variable_lifetimes(dfg)) {
        lifetimes.push_back(
            json{{"name", l.name}, {"first_line", l.first_line}, {"last_line", l.last_line}});
    }

    doc.metadata["function"] = function;
    doc.metadata["unused"] = unused;
    doc.metadata["lifetimes"] = std::move(lifetimes);
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

GraphDocument to_document(const CallGraph &graph) {
    GraphDocument doc;
    doc.graph_kind = "call-graph";

    size_t n = graph.functions.size();
    std::vector<FunctionId> recursive = recursive_functions(graph);
    std::vector<FunctionId> dead = dead_functions(graph);
    std::set<FunctionId> recursive_set(recursive.begin(), recursive.end());
    std::set<FunctionId> dead_set(dead.begin(), dead.end());

    std::vector<bool> called(n, false);
    for (const auto &e : graph.edges) {
        if (e.caller != e.callee)
            called[e.callee] = true;
    }

    std::map<FunctionId, std::vector<std::string>> unresolved_by_caller;
    for (const auto &u : graph.unresolved)
        unresolved_by_caller[u.caller].push_back(u.target);

    for (FunctionId id = 0; id < n; ++id) {
        const FunctionEntry &f = graph.functions[id];
        DocNode node;
        node.id = id;
        node.kind = f.name == MODULE_FUNCTION ? "module" : "function";
        node.label = f.qualified_name;
        node.attrs["name"] = f.name;
        node.attrs["qualified_name"] = f.qualified_name;
        node.attrs["class"] = f.class_name;
        node.attrs["module"] = f.module;
        node.attrs["file"] = f.file;
        node.attrs["line"] = f.line;
        node.attrs["entry_point"] = f.entry_point;
        node.attrs["recursive"] = recursive_set.count(id) > 0;
        node.attrs["dead"] = dead_set.count(id) > 0;
        node.attrs["root"] = !called[id];
        auto it = unresolved_by_caller.find(id);
        if (it != unresolved_by_caller.end())
            node.attrs["unresolved_calls"] = it->second;
        doc.nodes.push_back(std::move(node));
    }

    size_t ambiguous = 0;
    for (const auto &e : graph.edges) {
        json attrs = {{"line", e.line}, {"ambiguous", e.ambiguous}};
        if (e.ambiguous)
            ++ambiguous;
        doc.edges.push_back({e.caller, e.callee, "call", std::move(attrs)});
    }

    // Unresolved targets are edge-less external nodes
    std::map<std::string, size_t> external;
    for (const auto &u : graph.unresolved)
        ++external[u.target];
    NodeId next = static_cast<NodeId>(n);
    for (const auto &[target, count] : external) {
        DocNode node;
        node.id = next++;
        node.kind = "external";
        node.label = target;
        node.attrs["target"] = target;
        node.attrs["unresolved"] = true;
        node.attrs["call_count"] = count;
        doc.nodes.push_back(std::move(node));
    }

    json findings = json::array();
    for (FunctionId id : recursive)
        findings.push_back("recursive: " + graph.functions[id].qualified_name);
    for (FunctionId id : dead)
        findings.push_back("never called: " + graph.functions[id].qualified_name);
    if (!graph.unresolved.empty())
        findings.push_back(std::to_string(graph.unresolved.size()) +
                           " unresolved calls (external or dynamic)");
    if (ambiguous > 0)
        findings.push_back(std::to_string(ambiguous) + " ambiguous calls");

    doc.metadata["functions"] = n;
    doc.metadata["recursive"] = recursive;
    doc.metadata["dead"] = dead;
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

GraphDocument to_document(const DependencyGraph &graph) {
    GraphDocument doc;
    doc.graph_kind = "dependency-graph";

    size_t n = graph.modules.size();
    std::vector<std::vector<ModuleId>> cycles = find_cycles(graph);
    std::vector<size_t> depth = depths(graph);
    std::vector<ModuleId> root_list = roots(graph);
    std::vector<ModuleId> leaf_list = leaves(graph);
    std::set<ModuleId> root_set(root_list.begin(), root_list.end());
    std::set<ModuleId> leaf_set(leaf_list.begin(), leaf_list.end());
    std::set<ModuleId> in_cycle;
    for (const auto &cycle : cycles)
        in_cycle.insert(cycle.begin(), cycle.end());

    std::map<ModuleId, std::vector<std::string>> unresolved_by_module;
    for (const auto &u : graph.unresolved)
        unresolved_by_module[u.module].push_back(u.target);

    for (ModuleId id = 0; id < n; ++id) {
        const ModuleNode &m = graph.modules[id];
        DocNode node;
        node.id = id;
        node.kind = "module";
        node.label = m.file;
        node.attrs["file"] = m.file;
        node.attrs["module"] = m.module;
        node.attrs["language"] = m.language;
        node.attrs["exports"] = m.exports;
        node.attrs["imports"] = m.import_count;
        node.attrs["depth"] = depth[id];
        node.attrs["root"] = root_set.count(id) > 0;
        node.attrs["leaf"] = leaf_set.count(id) > 0;
        node.attrs["in_cycle"] = in_cycle.count(id) > 0;
        auto it = unresolved_by_module.find(id);
        if (it != unresolved_by_module.end())
            node.attrs["unresolved_imports"] = it->second;
        doc.nodes.push_back(std::move(node));
    }
    for (const auto &e : graph.edges) {
        doc.edges.push_back(
            {e.from, e.to, "import", json{{"line", e.line}, {"target", e.target}}});
    }

    std::set<std::string> external;
    for (const auto &u : graph.unresolved)
        external.insert(u.target);
    NodeId next = static_cast<NodeId>(n);
    for (const auto &target : external) {
        DocNode node;
        node.id = next++;
        node.kind = "external";
        node.label = target;
        node.attrs["target"] = target;
        node.attrs["unresolved"] = true;
        doc.nodes.push_back(std::move(node));
    }

    json findings = json::array();
    json cycle_array = json::array();
    for (const auto &cycle : cycles) {
        std::string path;
        json files = json::array();
        for (ModuleId id : cycle) {
            if (!path.empty())
                path += " -> ";
            path += graph.modules[id].file;
            files.push_back(graph.modules[id].file);
        }
        findings.push_back("circular dependency: " + path);
        cycle_array.push_back(std::move(files));
    }
    size_t max_depth = depth.empty() ? 0 : *std::max_element(depth.begin(), depth.end());
    findings.push_back(std::to_string(root_list.size()) + " root modules, " +
                       std::to_string(leaf_list.size()) + " leaf modules, max depth " +
                       std::to_string(max_depth));

    doc.metadata["modules"] = n;
    doc.metadata["cycles"] = std::move(cycle_array);
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

GraphDocument to_document(const ProgramDependenceGraph &pdg, const std::string &function) {
    GraphDocument doc;
    doc.graph_kind = "program-dependency";
    doc.name = function;

    for (NodeId id = 0; id < pdg.nodes.size(); ++id) {
        const PdgNode &p = pdg.nodes[id];
        DocNode node;
        node.id = id;
        node.kind = p.is_entry() ? "entry" : stmt_kind_to_string(p.kind);
        node.label = p.is_entry() ? "entry" : shorten(p.text);
        node.attrs["line"] = p.line;
        if (!p.is_entry()) {
            node.attrs["statement"] = p.statement;
            node.attrs["block"] = p.block;
            node.attrs["text"] = p.text;
        }
        doc.nodes.push_back(std::move(node));
    }
    for (const auto &e : pdg.edges)
        doc.edges.push_back({e.from, e.to, dependence_kind_to_string(e.kind), json::object()});

    json findings = json::array();
    findings.push_back("control dependence approximated by single-branch reachability");
    json groups = json::array();
    for (const auto &group : parallel_candidates(pdg)) {
        std::string lines;
        for (NodeId id : group) {
            if (!lines.empty())
                lines += ", ";
            lines += std::to_string(pdg.nodes[id].line);
        }
        findings.push_back("independent statements at lines " + lines);
        groups.push_back(json(group));
    }

    doc.metadata["function"] = function;
    doc.metadata["control_dependence"] = "approximate";
    doc.metadata["parallel_groups"] = std::move(groups);
    doc.metadata["findings"] = std::move(findings);
    return doc;
}

} // namespace codegraph
