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

#include "codegraph/commands.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace codegraph {

namespace fs = std::filesystem;

constexpr size_t MAX_CHAINS = 100;
constexpr size_t MAX_SUGGESTIONS = 5;

OutputFormat parse_format(const std::string &name) {
    if (name == "text")
        return OutputFormat::Text;
    if (name == "json")
        return OutputFormat::Json;
    if (name == "dot")
        return OutputFormat::Dot;
    throw InvalidRequest("Unknown format: " + name + " (expected text, json or dot)");
}

std::string render(const std::vector<GraphDocument> &docs, OutputFormat format) {
    std::ostringstream out;
    switch (format) {
    case OutputFormat::Text:
        for (size_t i = 0; i < docs.size(); ++i) {
            if (i > 0)
                out << "\n";
            out << summarize(docs[i]).to_text();
        }
        break;
    case OutputFormat::Json:
        if (docs.size() == 1) {
            out << docs[0].to_json().dump(2) << "\n";
        } else {
            json array = json::array();
            for (const auto &doc : docs)
                array.push_back(doc.to_json());
            out << array.dump(2) << "\n";
        }
        break;
    case OutputFormat::Dot:
        for (const auto &doc : docs)
            out << doc.to_dot();
        break;
    }
    return out.str();
}

void print_diagnostics(const DiagnosticLog &log) {
    if (log.empty())
        return;
    auto items = log.items();
    std::cerr << "\n" << items.size() << " file(s) skipped:" << std::endl;
    for (const auto &d : items) {
        std::cerr << "  [" << diagnostic_kind_to_string(d.kind) << "] " << d.file << ": "
                  << d.message << std::endl;
    }
}

FunctionId resolve_function(const CallGraph &graph, const std::string &name,
                            const std::string &label) {
    auto matches = graph.functions.lookup(name);
    if (!matches.empty())
        return matches.front();

    std::vector<std::string> similar;
    for (FunctionId id = 0; id < graph.functions.size(); ++id) {
        const std::string &qualified = graph.functions[id].qualified_name;
        if (qualified.find(name) != std::string::npos)
            similar.push_back(qualified);
    }
    std::sort(similar.begin(), similar.end());

    std::string message = label + " not found: " + name;
    if (!similar.empty()) {
        message += " (did you mean:";
        for (size_t i = 0; i < std::min(similar.size(), MAX_SUGGESTIONS); ++i)
            message += " " + similar[i];
        message += ")";
    }
    throw InvalidRequest(message);
}

namespace {

// Print or export the rendered result, then the diagnostics
void emit(const std::string &content, size_t graph_count, const CommandOptions &options,
          const Analyzer &analyzer) {
    if (options.export_path.empty()) {
        std::cout << content;
    } else {
        write_file(options.export_path, content);
        std::cout << "Exported " << graph_count << " graph(s) to: " << options.export_path
                  << std::endl;
    }

    if (options.analyzer.verbose) {
        const auto &stats = analyzer.stats();
        std::cout << "\nFiles parsed: " << stats.files_parsed.load()
                  << ", skipped: " << stats.files_skipped.load()
                  << ", functions: " << stats.functions_found.load() << std::endl;
    }
    print_diagnostics(analyzer.diagnostics());
}

void emit(const std::vector<GraphDocument> &docs, const CommandOptions &options,
          const Analyzer &analyzer) {
    emit(render(docs, options.format), docs.size(), options, analyzer);
}

// Runs a command body, turning request failures into "Error: ..." and status 1
template <typename Body>
int guarded(Body body) {
    try {
        return body();
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// PDG and the per-file aggregate need one source file
void require_file(const std::string &path, const std::string &command) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw InvalidRequest("Path does not exist: " + path);
    if (fs::is_directory(path, ec))
        throw InvalidRequest(command + " needs a source file, but " + path + " is a directory");
}

bool wants_function(const CommandOptions &options, const std::string &name) {
    const std::string &f = options.function;
    auto ends_with = [&](const std::string &suffix) {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return f.empty() || name == f || ends_with("." + f) || ends_with("::" + f);
}

std::string function_label(const SyntaxTree &tree, const FunctionAnalysis &fa) {
    return tree.file + "::" + fa.name;
}

// Per-function analyses of every parsed file, filtered by --function
struct FileFunctions {
    const SyntaxTree *tree;
    std::vector<FunctionAnalysis> functions;
};

std::vector<FileFunctions> analyze_trees(Analyzer &analyzer, const std::vector<SyntaxTree> &trees,
                                         const CommandOptions &options) {
    std::vector<FileFunctions> out;
    for (const auto &tree : trees) {
        FileFunctions ff{&tree, {}};
        for (auto &fa : analyzer.analyze_functions(tree)) {
            if (wants_function(options, fa.name))
                ff.functions.push_back(std::move(fa));
        }
        if (!ff.functions.empty())
            out.push_back(std::move(ff));
    }
    if (out.empty() && !options.function.empty())
        throw InvalidRequest("Function not found: " + options.function);
    return out;
}

std::string join_lines(const std::vector<uint32_t> &lines) {
    std::string out;
    for (uint32_t line : lines) {
        if (!out.empty())
            out += ", ";
        out += std::to_string(line);
    }
    return out;
}

std::vector<uint32_t> lines_of(const ProgramDependenceGraph &pdg, const std::vector<NodeId> &ids) {
    std::vector<uint32_t> lines;
    for (NodeId id : ids) {
        if (!pdg.nodes[id].is_entry())
            lines.push_back(pdg.nodes[id].line);
    }
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
    return lines;
}

// Adds --slice-line results to the PDG document; false when the line is not in it
bool add_slice(GraphDocument &doc, const ProgramDependenceGraph &pdg, uint32_t line) {
    NodeId node = pdg.at_line(line);
    if (node == INVALID_NODE)
        return false;

    std::vector<uint32_t> backward = lines_of(pdg, backward_slice(pdg, node));
    std::vector<uint32_t> forward = lines_of(pdg, forward_slice(pdg, node));

    doc.metadata["slice"] = {{"line", line},
                             {"node", node},
                             {"backward", backward_slice(pdg, node)},
                             {"forward", forward_slice(pdg, node)},
                             {"backward_lines", backward},
                             {"forward_lines", forward}};
    doc.metadata["findings"].push_back("backward slice of line " + std::to_string(line) +
                                       ": lines " + join_lines(backward));
    doc.metadata["findings"].push_back("forward slice of line " + std::to_string(line) +
                                       ": lines " + join_lines(forward));
    return true;
}

void add_taint(GraphDocument &doc, const DataFlowGraph &dfg, const CommandOptions &options) {
    json flows = json::array();
    for (const auto &flow : taint_by_name(dfg, options.taint_sources, options.taint_sinks)) {
        const VarNode &source = dfg.nodes[flow.source];
        const VarNode &sink = dfg.nodes[flow.sink];
        flows.push_back(json{{"source", source.name},
                         {"source_line", source.line},
                         {"sink", sink.name},
                         {"sink_line", sink.line}});
        doc.metadata["findings"].push_back("tainted: '" + source.name + "' (line " +
                                           std::to_string(source.line) + ") reaches '" +
                                           sink.name + "' (line " + std::to_string(sink.line) +
                                           ")");
    }
    doc.metadata["taint"] = std::move(flows);
}

// Parsed tree of the single file a per-file command targets
std::vector<SyntaxTree> parse_target_file(Analyzer &analyzer, const CommandOptions &options,
                                          const std::string &command) {
    require_file(options.analyzer.root_path, command);
    auto trees = analyzer.extract_all(analyzer.discover_files());
    if (trees.empty()) {
        print_diagnostics(analyzer.diagnostics());
        throw InvalidRequest("Could not analyze " + options.analyzer.root_path);
    }
    return trees;
}

} // namespace

// ============================================================================
// Commands
// ============================================================================

int cmd_syntax_tree(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        Analyzer analyzer(profiles, options.analyzer);
        auto trees = analyzer.extract_all(analyzer.discover_files());

        std::vector<GraphDocument> docs;
        docs.reserve(trees.size());
        for (const auto &tree : trees)
            docs.push_back(to_document(tree));
        emit(docs, options, analyzer);
        return 0;
    });
}

int cmd_control_flow(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        Analyzer analyzer(profiles, options.analyzer);
        auto trees = analyzer.extract_all(analyzer.discover_files());

        std::vector<GraphDocument> docs;
        for (const auto &ff : analyze_trees(analyzer, trees, options)) {
            for (const auto &fa : ff.functions)
                docs.push_back(to_document(fa.cfg, fa.statements, function_label(*ff.tree, fa)));
        }
        emit(docs, options, analyzer);
        return 0;
    });
}

int cmd_data_flow(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        Analyzer analyzer(profiles, options.analyzer);
        auto trees = analyzer.extract_all(analyzer.discover_files());

        std::vector<GraphDocument> docs;
        for (const auto &ff : analyze_trees(analyzer, trees, options)) {
            for (const auto &fa : ff.functions)
                docs.push_back(to_document(fa.dfg, function_label(*ff.tree, fa)));
        }
        emit(docs, options, analyzer);
        return 0;
    });
}

int cmd_call_graph(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        if (!options.chain.empty() && options.chain.size() != 2)
            throw InvalidRequest("--chain expects FROM,TO");

        Analyzer analyzer(profiles, options.analyzer);
        auto trees = analyzer.extract_all(analyzer.discover_files());
        CallGraph graph = analyzer.call_graph(trees);
        GraphDocument doc = to_document(graph);

        if (!options.root.empty()) {
            FunctionId root = resolve_function(graph, options.root, "Root function");
            std::vector<int> depth = call_depths(graph, root);
            json depths = json::object();
            for (FunctionId id = 0; id < depth.size(); ++id) {
                if (depth[id] < 0)
                    continue;
                depths[graph.functions[id].qualified_name] = depth[id];
                if (id != root)
                    doc.metadata["findings"].push_back(
                        "depth " + std::to_string(depth[id]) + ": " +
                        graph.functions[id].qualified_name);
            }
            doc.metadata["root"] = graph.functions[root].qualified_name;
            doc.metadata["depths"] = std::move(depths);
        }

        if (options.chain.size() == 2) {
            FunctionId from = resolve_function(graph, options.chain[0], "Chain start");
            FunctionId to = resolve_function(graph, options.chain[1], "Chain end");
            json chains = json::array();
            find_call_chains(graph, from, to, options.max_chain_depth,
                             [&](const std::vector<FunctionId> &chain) {
                                 json names = json::array();
                                 std::string text;
                                 for (FunctionId id : chain) {
                                     if (!text.empty())
                                         text += " -> ";
                                     text += graph.functions[id].qualified_name;
                                     names.push_back(graph.functions[id].qualified_name);
                                 }
                                 chains.push_back(std::move(names));
                                 doc.metadata["findings"].push_back("chain: " + text);
                                 return chains.size() < MAX_CHAINS;
                             });
            if (chains.empty())
                doc.metadata["findings"].push_back("no call chain from " + options.chain[0] +
                                                   " to " + options.chain[1]);
            doc.metadata["chains"] = std::move(chains);
        }

        emit({doc}, options, analyzer);
        return 0;
    });
}

int cmd_dependency_graph(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        Analyzer analyzer(profiles, options.analyzer);
        DependencyGraph graph = analyzer.dependency_graph(analyzer.discover_files());
        emit({to_document(graph)}, options, analyzer);
        return 0;
    });
}

int cmd_program_dependency(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        if (options.taint_sources.empty() != options.taint_sinks.empty())
            throw InvalidRequest("--taint-source and --taint-sink must be given together");

        Analyzer analyzer(profiles, options.analyzer);
        auto trees = parse_target_file(analyzer, options, "program-dependency");

        std::vector<GraphDocument> docs;
        bool slice_found = false;
        for (const auto &ff : analyze_trees(analyzer, trees, options)) {
            for (const auto &fa : ff.functions) {
                GraphDocument doc = to_document(fa.pdg, function_label(*ff.tree, fa));
                if (options.slice_line > 0 && add_slice(doc, fa.pdg, options.slice_line))
                    slice_found = true;
                if (!options.taint_sources.empty())
                    add_taint(doc, fa.dfg, options);
                docs.push_back(std::move(doc));
            }
        }
        if (options.slice_line > 0 && !slice_found)
            throw InvalidRequest("No statement at line " + std::to_string(options.slice_line));

        emit(docs, options, analyzer);
        return 0;
    });
}

int cmd_all(const ProfileRegistry &profiles, const CommandOptions &options) {
    return guarded([&]() {
        Analyzer analyzer(profiles, options.analyzer);
        auto trees = parse_target_file(analyzer, options, "all");
        const SyntaxTree &tree = trees.front();

        GraphDocument syntax = to_document(tree);
        GraphDocument calls = to_document(analyzer.call_graph(trees));
        calls.name = tree.file;

        std::vector<FileFunctions> analyzed;
        if (!tree.functions.empty())
            analyzed = analyze_trees(analyzer, trees, options);

        std::vector<GraphDocument> docs = {syntax, calls};
        json functions = json::array();
        for (const auto &ff : analyzed) {
            for (const auto &fa : ff.functions) {
                std::string label = function_label(tree, fa);
                GraphDocument cfg = to_document(fa.cfg, fa.statements, label);
                GraphDocument dfg = to_document(fa.dfg, label);
                GraphDocument pdg = to_document(fa.pdg, label);
                functions.push_back(json{{"name", fa.name},
                                     {"line", fa.line},
                                     {"control_flow", cfg.to_json()},
                                     {"data_flow", dfg.to_json()},
                                     {"program_dependency", pdg.to_json()}});
                docs.push_back(std::move(cfg));
                docs.push_back(std::move(dfg));
                docs.push_back(std::move(pdg));
            }
        }

        if (options.format == OutputFormat::Json) {
            json result = {{"file", tree.file},
                           {"syntax_tree", syntax.to_json()},
                           {"call_graph", calls.to_json()},
                           {"functions", std::move(functions)}};
            emit(result.dump(2) + "\n", docs.size(), options, analyzer);
        } else {
            emit(docs, options, analyzer);
        }
        return 0;
    });
}

} // namespace codegraph
