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

#include "codegraph/analyzer.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace codegraph {

Analyzer::Analyzer(const ProfileRegistry &profiles, const AnalyzerConfig &config)
    : profiles_(profiles), config_(config), pool_(config.num_threads) {
    for (auto &ext : config_.extensions) {
        if (!ext.empty() && ext[0] == '.')
            ext.erase(0, 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    fs::path root(config_.root_path);
    std::error_code ec;
    base_dir_ = fs::is_regular_file(root, ec) ? root.parent_path() : root;
}

bool Analyzer::should_ignore(const fs::path &path) const {
    fs::path relative = path.lexically_relative(base_dir_);
    if (relative.empty())
        relative = path;

    for (const auto &component : relative) {
        std::string comp = component.string();
        for (const auto &pattern : config_.ignore_patterns) {
            if (comp == pattern)
                return true;
        }
        // Ignore hidden files/directories
        if (!comp.empty() && comp[0] == '.' && comp != "." && comp != "..")
            return true;
    }
    return false;
}

bool Analyzer::wants_extension(const std::string &ext) const {
    if (config_.extensions.empty())
        return profiles_.find_by_extension(ext) != nullptr;
    return std::find(config_.extensions.begin(), config_.extensions.end(), ext) !=
           config_.extensions.end();
}

std::vector<fs::path> Analyzer::discover_files() const {
    std::vector<fs::path> files;

    fs::path root(config_.root_path);
    std::error_code ec;
    if (!fs::exists(root, ec))
        throw InvalidRequest("Path does not exist: " + config_.root_path);

    if (fs::is_regular_file(root, ec)) {
        files.push_back(root);
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        for (const auto &entry : fs::directory_iterator(current_dir, ec)) {
            const fs::path &path = entry.path();
            if (should_ignore(path))
                continue;

            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(type_ec)) {
                if (wants_extension(extension_of(path.string())))
                    files.push_back(path);
            }
        }
        if (ec) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            std::cerr << "Warning: cannot list " << current_dir.string() << ": " << ec.message()
                      << std::endl;
            ec.clear();
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string Analyzer::relative_path(const fs::path &file) const {
    fs::path relative = file.lexically_normal().lexically_relative(base_dir_.lexically_normal());
    std::string out = relative.generic_string();
    if (out.empty() || out == "." || out.compare(0, 2, "..") == 0)
        return file.lexically_normal().generic_string();
    return out;
}

std::optional<SyntaxTree> Analyzer::parse_file(const fs::path &file) {
    std::string display = relative_path(file);

    ReadResult read = read_source_file(file.string());
    if (!read.ok()) {
        diagnostics_.add(read.kind, display, read.error);
        stats_.files_skipped++;
        return std::nullopt;
    }

    const LanguageProfile &profile = profiles_.find_for_path(file.string());
    ExtractionStrategy strategy = strategy_for(profile);

    SyntaxTree tree;
    try {
        tree = extract_syntax(strategy, display, *read.text);
    } catch (const ParseError &e) {
        diagnostics_.add(DiagnosticKind::ParseFailure, display, e.what());
        stats_.files_skipped++;
        return std::nullopt;
    }

    stats_.files_parsed++;
    stats_.functions_found += tree.of_kind(DeclKind::Function).size();
    stats_.call_sites_found += tree.of_kind(DeclKind::CallSite).size();

    if (config_.verbose) {
        // Print progress (with lock to avoid garbled output)
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << "Parsed: " << display << (tree.heuristic ? " (heuristic)" : "") << std::endl;
    }
    return tree;
}

std::optional<SyntaxTree> Analyzer::extract_file(const fs::path &file) { return parse_file(file); }

std::vector<SyntaxTree> Analyzer::extract_all(const std::vector<fs::path> &files) {
    std::vector<std::optional<SyntaxTree>> results(files.size());
    pool_.run(files.size(), [&](size_t i) { results[i] = parse_file(files[i]); });

    std::vector<SyntaxTree> trees;
    trees.reserve(files.size());
    for (auto &result : results) {
        if (result)
            trees.push_back(std::move(*result));
    }
    return trees;
}

CallGraph Analyzer::call_graph(const std::vector<SyntaxTree> &trees) {
    return build_call_graph(trees, config_.entry_patterns, pool_);
}

DependencyGraph Analyzer::dependency_graph(const std::vector<fs::path> &files) {
    // File reads complete before graph construction starts
    std::vector<std::optional<SourceFile>> read(files.size());
    pool_.run(files.size(), [&](size_t i) {
        std::string display = relative_path(files[i]);
        ReadResult result = read_source_file(files[i].string());
        if (!result.ok()) {
            diagnostics_.add(result.kind, display, result.error);
            stats_.files_skipped++;
            return;
        }
        SourceFile source;
        source.path = display;
        source.text = std::move(*result.text);
        source.profile = &profiles_.find_for_path(files[i].string());
        read[i] = std::move(source);
    });

    std::vector<SourceFile> sources;
    sources.reserve(files.size());
    for (auto &source : read) {
        if (source)
            sources.push_back(std::move(*source));
    }
    return build_dependency_graph(sources, config_.aliases, pool_);
}

std::vector<FunctionAnalysis> Analyzer::analyze_functions(const SyntaxTree &tree) {
    const LanguageProfile &profile = profiles_.find_for_path(tree.file);
    std::vector<FunctionAnalysis> out(tree.functions.size());

    pool_.run(tree.functions.size(), [&](size_t i) {
        const FunctionBody &body = tree.functions[i];
        const DeclNode &decl = tree.decls[body.decl];
        FunctionAnalysis &fa = out[i];
        fa.name = decl.qualified_name;
        fa.line = decl.start_line;
        fa.statements = split_statements(body.body, body.body_line, profile);
        fa.cfg = build_cfg(fa.statements, profile);
        fa.dfg = build_dfg(fa.statements, body.parameters, profile, decl.start_line);
        fa.pdg = build_pdg(fa.statements, fa.cfg, fa.dfg);
    });
    return out;
}

} // namespace codegraph
