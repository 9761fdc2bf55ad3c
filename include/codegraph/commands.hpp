#pragma once

#include "analyzer.hpp"
#include "graph.hpp"
#include "language.hpp"
#include <string>
#include <vector>

namespace codegraph {

enum class OutputFormat { Text, Json, Dot };

// "text", "json" or "dot"; throws InvalidRequest otherwise
OutputFormat parse_format(const std::string &name);

// Options shared by every graph command
struct CommandOptions {
    AnalyzerConfig analyzer; // root_path is the command target
    OutputFormat format = OutputFormat::Text;
    std::string export_path; // empty = stdout only
    std::string function;    // per-function graphs: only this function

    // program-dependency
    uint32_t slice_line = 0;
    std::vector<std::string> taint_sources;
    std::vector<std::string> taint_sinks;

    // call-graph
    std::string root;
    std::vector<std::string> chain; // {from, to}
    size_t max_chain_depth = 10;
};

// Command handlers
int cmd_syntax_tree(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_control_flow(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_data_flow(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_call_graph(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_dependency_graph(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_program_dependency(const ProfileRegistry &profiles, const CommandOptions &options);
int cmd_all(const ProfileRegistry &profiles, const CommandOptions &options);

// Helper functions
std::string render(const std::vector<GraphDocument> &docs, OutputFormat format);
void print_diagnostics(const DiagnosticLog &log);
FunctionId resolve_function(const CallGraph &graph, const std::string &name,
                            const std::string &label);

} // namespace codegraph
