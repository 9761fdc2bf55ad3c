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

#include "codegraph/depgraph.hpp"
#include "codegraph/statements.hpp"
#include <algorithm>
#include <filesystem>
#include <numeric>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace codegraph {

namespace fs = std::filesystem;

namespace {

// Minified sources are not worth matching line patterns against
constexpr size_t MAX_LINE_LENGTH = 4096;

template <typename Fn>
void for_each_line(const std::string &text, Fn fn) {
    uint32_t number = 1;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
            end = text.size();
        if (end - start <= MAX_LINE_LENGTH)
            fn(text.substr(start, end - start), number);
        if (end == text.size())
            break;
        start = end + 1;
        ++number;
    }
}

// "a, b as c" -> {a, b}
std::vector<std::string> split_names(const std::string &list) {
    std::vector<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        size_t space = item.find_first_of(" \t");
        if (space != std::string::npos)
            item = item.substr(0, space);
        if (!item.empty())
            names.push_back(item);
    }
    return names;
}

} // namespace

// ============================================================================
// Import / export extraction
// ============================================================================

std::vector<ImportStatement> extract_imports(const std::string &text,
                                             const LanguageProfile &profile) {
    std::vector<ImportStatement> imports;
    std::string clean = mask_source(text, profile).clean;

    for_each_line(clean, [&](const std::string &line, uint32_t number) {
        // Several patterns may describe the same import ("import \"fmt\"" in Go)
        std::unordered_set<std::string> seen;
        for (const auto &pattern : profile.import_patterns) {
            std::sregex_iterator it(line.begin(), line.end(), pattern.regex), end;
            for (; it != end; ++it) {
                const std::smatch &m = *it;
                if (m.size() < 2 || !m[1].matched)
                    continue;
                if (!seen.insert(m[1].str()).second)
                    continue;

                ImportStatement stmt;
                stmt.target = m[1].str();
                if (m.size() > 2 && m[2].matched)
                    stmt.names = split_names(m[2].str());
                stmt.line = number;
                stmt.text = trim(line);
                imports.push_back(std::move(stmt));
            }
        }
    });
    return imports;
}

std::vector<std::string> extract_exports(const std::string &text, const LanguageProfile &profile) {
    std::vector<std::string> exports;
    if (profile.export_patterns.empty())
        return exports;

    std::unordered_set<std::string> seen;
    std::string clean = mask_source(text, profile).clean;
    for_each_line(clean, [&](const std::string &line, uint32_t) {
        for (const auto &pattern : profile.export_patterns) {
            std::smatch m;
            if (std::regex_search(line, m, pattern.regex) && m.size() > 1 && m[1].matched) {
                if (seen.insert(m[1].str()).second)
                    exports.push_back(m[1].str());
            }
        }
    });
    return exports;
}

// ============================================================================
// Path helpers
// ============================================================================

namespace {

std::string normalize(const std::string &path) {
    std::string out = fs::path(path).lexically_normal().generic_string();
    if (out == ".")
        return "";
    if (out.compare(0, 2, "./") == 0)
        out.erase(0, 2);
    if (!out.empty() && out.back() == '/')
        out.pop_back();
    return out;
}

std::string parent_of(const std::string &path) {
    return fs::path(path).parent_path().generic_string();
}

std::string join(const std::string &dir, const std::string &rel) {
    return normalize(dir.empty() ? rel : dir + "/" + rel);
}

bool escapes_root(const std::string &path) {
    return path == ".." || path.compare(0, 3, "../") == 0 || path.compare(0, 1, "/") == 0;
}

// "a/b/c" ends with "b/c" on a segment boundary
bool ends_with_path(const std::string &path, const std::string &suffix) {
    if (suffix.empty())
        return false;
    if (path == suffix)
        return true;
    if (path.size() <= suffix.size())
        return false;
    return path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           path[path.size() - suffix.size() - 1] == '/';
}

std::string replace_all(std::string s, const std::string &from, const std::string &to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::vector<std::string> split_on(const std::string &s, const std::string &sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos)
            break;
        start = pos + sep.size();
    }
    return parts;
}

std::string strip_extension(const std::string &path) {
    return fs::path(path).replace_extension().generic_string();
}

// ============================================================================
// File index - project paths by exact path, suffix and directory
// ============================================================================
class FileIndex {
public:
    explicit FileIndex(const NodeArena<ModuleNode> &modules) {
        for (ModuleId id = 0; id < modules.size(); ++id) {
            const std::string &file = modules[id].file;
            paths_.push_back(file);
            by_path_.emplace(file, id);
            by_dir_[parent_of(file)].push_back(id);
        }
    }

    ModuleId find(const std::string &path) const {
        auto it = by_path_.find(path);
        return it == by_path_.end() ? INVALID_NODE : it->second;
    }

    // Files whose path (or path without extension) ends with `suffix`, ascending
    std::vector<ModuleId> with_suffix(const std::string &suffix, bool ignore_extension) const {
        std::vector<ModuleId> out;
        for (ModuleId id = 0; id < paths_.size(); ++id) {
            const std::string path = ignore_extension ? strip_extension(paths_[id]) : paths_[id];
            if (ends_with_path(path, suffix))
                out.push_back(id);
        }
        return out;
    }

    // Files directly inside `dir`, ascending
    const std::vector<ModuleId> &in_directory(const std::string &dir) const {
        static const std::vector<ModuleId> empty;
        auto it = by_dir_.find(dir);
        return it == by_dir_.end() ? empty : it->second;
    }

    // Longest directory that `path` ends with, or the deepest directory
    // ending with `path` when `path_is_suffix` is set
    std::string match_directory(const std::string &path, bool path_is_suffix) const {
        std::string best;
        bool found = false;
        for (const auto &entry : by_dir_) {
            const std::string &dir = entry.first;
            if (dir.empty())
                continue;
            bool match = path_is_suffix ? ends_with_path(dir, path) : ends_with_path(path, dir);
            if (!match)
                continue;
            if (!found || dir.size() > best.size() || (dir.size() == best.size() && dir < best)) {
                best = dir;
                found = true;
            }
        }
        return best;
    }

    const std::string &path(ModuleId id) const { return paths_[id]; }

private:
    std::vector<std::string> paths_;
    std::unordered_map<std::string, ModuleId> by_path_;
    std::unordered_map<std::string, std::vector<ModuleId>> by_dir_;
};

// ============================================================================
// Import resolution, one rule set per ImportStyle
// ============================================================================
class ImportResolver {
public:
    ImportResolver(const FileIndex &index, const AliasMap &aliases)
        : index_(index), aliases_(aliases) {}

    std::vector<ModuleId> resolve(const ImportStatement &stmt, const std::string &file,
                                  ImportStyle style) const {
        switch (style) {
        case ImportStyle::Python:
            return python(stmt, file);
        case ImportStyle::JavaScript:
            return one(javascript(stmt.target, file));
        case ImportStyle::CInclude:
            return one(relative_or_suffix(stmt.target, file, false));
        case ImportStyle::Rust:
            return one(rust(stmt, file));
        case ImportStyle::Go:
            return go(stmt.target);
        case ImportStyle::Dotted:
            return dotted(stmt.target, file);
        case ImportStyle::Path:
            return one(relative_or_suffix(aliased(stmt.target), file, true));
        }
        return {};
    }

private:
    const FileIndex &index_;
    const AliasMap &aliases_;

    static std::vector<ModuleId> one(ModuleId id) {
        if (id == INVALID_NODE)
            return {};
        return {id};
    }

    // First of base + suffix that names a project file
    ModuleId try_suffixes(const std::string &base, std::initializer_list<const char *> suffixes) const {
        for (const char *suffix : suffixes) {
            std::string candidate = base + suffix;
            if (base.empty() && candidate.compare(0, 1, "/") == 0)
                candidate.erase(0, 1);
            candidate = normalize(candidate);
            if (candidate.empty() || escapes_root(candidate))
                continue;
            ModuleId id = index_.find(candidate);
            if (id != INVALID_NODE)
                return id;
        }
        return INVALID_NODE;
    }

    // Apply the first alias whose prefix matches a whole path segment
    std::string aliased(const std::string &target) const {
        for (const auto &[prefix, replacement] : aliases_) {
            if (target == prefix)
                return replacement;
            if (target.size() > prefix.size() && target.compare(0, prefix.size(), prefix) == 0 &&
                (prefix.back() == '/' || target[prefix.size()] == '/')) {
                std::string rest = target.substr(prefix.size());
                if (!rest.empty() && rest[0] == '/')
                    rest.erase(0, 1);
                return join(replacement, rest);
            }
        }
        return target;
    }

    // ------------------------------------------------------------------------
    // Python: "a.b" from the root or the importing directory, ".x" relative to
    // the package, packages through __init__.py
    // ------------------------------------------------------------------------
    ModuleId python_module(const std::string &base) const {
        if (base.empty())
            return index_.find("__init__.py");
        return try_suffixes(base, {".py", "/__init__.py", ".pyi"});
    }

    std::vector<ModuleId> python(const ImportStatement &stmt, const std::string &file) const {
        const std::string &target = stmt.target;
        size_t dots = target.find_first_not_of('.');
        if (dots == std::string::npos)
            dots = target.size();
        std::string rest = replace_all(target.substr(dots), ".", "/");

        std::vector<std::string> bases;
        if (dots > 0) {
            std::string dir = parent_of(file);
            for (size_t i = 1; i < dots; ++i)
                dir = parent_of(dir);
            bases.push_back(rest.empty() ? dir : join(dir, rest));
        } else {
            bases.push_back(rest);
            bases.push_back(join(parent_of(file), rest));
        }

        for (const auto &base : bases) {
            // "from pkg import mod" names submodules
            std::vector<ModuleId> submodules;
            for (const auto &name : stmt.names) {
                ModuleId id = python_module(base.empty() ? name : base + "/" + name);
                if (id != INVALID_NODE)
                    submodules.push_back(id);
            }
            if (!submodules.empty())
                return submodules;

            ModuleId id = python_module(base);
            if (id != INVALID_NODE)
                return {id};
        }

        // src/ layouts: "pkg.mod" -> "src/pkg/mod.py"
        if (dots == 0 && !rest.empty()) {
            for (const char *suffix : {".py", "/__init__.py"}) {
                auto found = index_.with_suffix(rest + suffix, false);
                if (!found.empty())
                    return {found.front()};
            }
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // JavaScript / TypeScript: relative and aliased specifiers, extension and
    // index lookup. Bare specifiers are packages.
    // ------------------------------------------------------------------------
    ModuleId javascript(const std::string &target, const std::string &file) const {
        if (target.empty())
            return INVALID_NODE;
        std::string specifier = aliased(target);
        bool was_aliased = specifier != target;
        std::string base;
        if (was_aliased)
            base = normalize(specifier);
        else if (specifier[0] == '.')
            base = join(parent_of(file), specifier);
        else if (specifier[0] == '/')
            base = normalize(specifier.substr(1));
        else
            return INVALID_NODE;

        ModuleId id = try_suffixes(base, {"", ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".mts", ".cts",
                                   "/index.ts", "/index.tsx", "/index.js", "/index.jsx",
                                   "/index.mjs"});
        if (id != INVALID_NODE)
            return id;

        // "./util.js" written in a TypeScript source names util.ts
        std::string ext = extension_of(base);
        if (ext == "js" || ext == "jsx" || ext == "mjs" || ext == "cjs")
            return try_suffixes(strip_extension(base), {".ts", ".tsx", ".mts", ".cts"});
        return INVALID_NODE;
    }

    // ------------------------------------------------------------------------
    // #include, PHP require and generic paths: relative to the including
    // file, then the project root, then any file ending with the path
    // ------------------------------------------------------------------------
    ModuleId relative_or_suffix(const std::string &target, const std::string &file,
                                bool add_extension) const {
        if (target.empty())
            return INVALID_NODE;
        std::vector<std::string> candidates = {join(parent_of(file), target), normalize(target)};
        if (add_extension && extension_of(target).empty()) {
            std::string ext = "." + extension_of(file);
            candidates.push_back(join(parent_of(file), target + ext));
            candidates.push_back(normalize(target + ext));
        }
        for (const auto &candidate : candidates) {
            if (candidate.empty() || escapes_root(candidate))
                continue;
            ModuleId id = index_.find(candidate);
            if (id != INVALID_NODE)
                return id;
        }

        std::string suffix = normalize(target);
        if (suffix.empty() || escapes_root(suffix))
            return INVALID_NODE;
        auto found = index_.with_suffix(suffix, false);
        return found.empty() ? INVALID_NODE : found.front();
    }

    // ------------------------------------------------------------------------
    // Rust: "mod x;" next to the declaring module, "use crate::", "super::",
    // "self::" paths through x.rs or x/mod.rs
    // ------------------------------------------------------------------------
    static std::string rust_module_dir(const std::string &file) {
        std::string stem = fs::path(file).stem().string();
        std::string dir = parent_of(file);
        if (stem == "mod" || stem == "lib" || stem == "main")
            return dir;
        return join(dir, stem);
    }

    std::string rust_crate_root(const std::string &file) const {
        std::string dir = parent_of(file);
        while (true) {
            if (try_suffixes(dir, {"/lib.rs", "/main.rs"}) != INVALID_NODE)
                return dir;
            if (fs::path(dir).filename().string() == "src" || dir.empty())
                break;
            dir = parent_of(dir);
        }
        return fs::path(dir).filename().string() == "src" ? dir : parent_of(file);
    }

    ModuleId rust(const ImportStatement &stmt, const std::string &file) const {
        static const std::regex mod_decl(R"(^(?:pub(?:\([\w:]+\))?\s+)?mod\s)");
        std::string module_dir = rust_module_dir(file);
        if (std::regex_search(stmt.text, mod_decl))
            return try_suffixes(join(module_dir, stmt.target), {".rs", "/mod.rs"});

        std::vector<std::string> segments = split_on(stmt.target, "::");
        std::string base;
        size_t first = 0;
        if (segments[0] == "crate") {
            base = rust_crate_root(file);
            first = 1;
        } else if (segments[0] == "self") {
            base = module_dir;
            first = 1;
        } else if (segments[0] == "super") {
            base = module_dir;
            while (first < segments.size() && segments[first] == "super") {
                base = parent_of(base);
                ++first;
            }
        } else {
            base = rust_crate_root(file);
        }

        // Longest prefix that names a module file; the rest are items
        for (size_t n = segments.size(); n > first; --n) {
            std::string rel;
            for (size_t i = first; i < n; ++i)
                rel += (rel.empty() ? "" : "/") + segments[i];
            ModuleId id = try_suffixes(join(base, rel), {".rs", "/mod.rs"});
            if (id != INVALID_NODE)
                return id;
        }
        if (first == 0)
            return INVALID_NODE;
        return try_suffixes(base, {".rs", "/mod.rs", "/lib.rs", "/main.rs"});
    }

    // ------------------------------------------------------------------------
    // Go: the import path ends with a package directory; every non-test file
    // of that directory is a dependency
    // ------------------------------------------------------------------------
    std::vector<ModuleId> go(const std::string &target) const {
        std::string dir = index_.match_directory(target, false);
        if (dir.empty())
            return {};
        std::vector<ModuleId> out;
        for (ModuleId id : index_.in_directory(dir)) {
            const std::string &path = index_.path(id);
            if (extension_of(path) != "go")
                continue;
            if (path.size() >= 8 && path.compare(path.size() - 8, 8, "_test.go") == 0)
                continue;
            out.push_back(id);
        }
        return out;
    }

    // ------------------------------------------------------------------------
    // Java, C#, Kotlin, Swift: "a.b.C" is a file ending in a/b/C, "a.b.*" and
    // namespaces are every file of a directory ending in a/b
    // ------------------------------------------------------------------------
    ModuleId dotted_file(const std::string &path, const std::string &ext) const {
        auto found = index_.with_suffix(path, true);
        for (ModuleId id : found) {
            if (extension_of(index_.path(id)) == ext)
                return id;
        }
        return found.empty() ? INVALID_NODE : found.front();
    }

    std::vector<ModuleId> dotted_directory(const std::string &path, const std::string &ext) const {
        std::string dir = index_.match_directory(path, true);
        std::vector<ModuleId> out;
        if (dir.empty())
            return out;
        for (ModuleId id : index_.in_directory(dir)) {
            if (extension_of(index_.path(id)) == ext)
                out.push_back(id);
        }
        return out;
    }

    std::vector<ModuleId> dotted(const std::string &target, const std::string &file) const {
        std::string ext = extension_of(file);
        bool wildcard = target.size() > 2 && target.compare(target.size() - 2, 2, ".*") == 0;
        std::string path = replace_all(wildcard ? target.substr(0, target.size() - 2) : target,
                                       ".", "/");
        if (wildcard)
            return dotted_directory(path, ext);

        ModuleId id = dotted_file(path, ext);
        if (id != INVALID_NODE)
            return {id};
        auto package = dotted_directory(path, ext);
        if (!package.empty())
            return package;

        // Static member or nested type: "a.b.C.member"
        size_t slash = path.rfind('/');
        if (slash != std::string::npos)
            return one(dotted_file(path.substr(0, slash), ext));
        return {};
    }
};

Adjacency module_successors(const DependencyGraph &graph) {
    Adjacency adj(graph.modules.size());
    for (const auto &e : graph.edges)
        adj[e.from].push_back(e.to);
    for (auto &list : adj) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    return adj;
}

// Rotate so the smallest module comes first, then close the path
std::vector<ModuleId> canonical_cycle(std::vector<ModuleId> cycle) {
    std::rotate(cycle.begin(), std::min_element(cycle.begin(), cycle.end()), cycle.end());
    cycle.push_back(cycle.front());
    return cycle;
}

// Three-color DFS over every module. `on_cycle` receives each back edge's
// cycle and returns false to stop.
template <typename Fn>
void for_each_back_edge(const DependencyGraph &graph, Fn on_cycle) {
    enum class Color { White, Gray, Black };

    Adjacency adj = module_successors(graph);
    std::vector<Color> color(adj.size(), Color::White);

    struct Frame {
        ModuleId node;
        size_t next;
    };

    for (ModuleId root = 0; root < adj.size(); ++root) {
        if (color[root] != Color::White)
            continue;

        std::vector<Frame> stack = {{root, 0}};
        std::vector<ModuleId> path = {root};
        color[root] = Color::Gray;

        while (!stack.empty()) {
            Frame &frame = stack.back();
            if (frame.next < adj[frame.node].size()) {
                ModuleId next = adj[frame.node][frame.next++];
                if (color[next] == Color::Gray) {
                    auto pos = std::find(path.begin(), path.end(), next);
                    if (!on_cycle(canonical_cycle(std::vector<ModuleId>(pos, path.end()))))
                        return;
                } else if (color[next] == Color::White) {
                    color[next] = Color::Gray;
                    stack.push_back({next, 0});
                    path.push_back(next);
                }
                continue;
            }
            color[frame.node] = Color::Black;
            path.pop_back();
            stack.pop_back();
        }
    }
}

} // namespace

// ============================================================================
// DependencyGraph
// ============================================================================

ModuleId DependencyGraph::find(const std::string &file) const {
    auto it = std::lower_bound(modules.begin(), modules.end(), file,
                               [](const ModuleNode &m, const std::string &f) { return m.file < f; });
    if (it == modules.end() || it->file != file)
        return INVALID_NODE;
    return static_cast<ModuleId>(it - modules.begin());
}

std::vector<ModuleId> DependencyGraph::dependencies(ModuleId id) const {
    std::vector<ModuleId> out;
    for (const auto &e : edges) {
        if (e.from == id)
            out.push_back(e.to);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<ModuleId> DependencyGraph::dependents(ModuleId id) const {
    std::vector<ModuleId> out;
    for (const auto &e : edges) {
        if (e.to == id)
            out.push_back(e.from);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// ============================================================================
// Build
// ============================================================================

DependencyGraph build_dependency_graph(const std::vector<SourceFile> &files,
                                       const AliasMap &aliases, WorkerPool &pool) {
    DependencyGraph graph;

    std::vector<std::string> paths(files.size());
    for (size_t i = 0; i < files.size(); ++i)
        paths[i] = normalize(files[i].path);

    std::vector<size_t> order(files.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](size_t a, size_t b) { return paths[a] < paths[b]; });

    // Module id -> index into files; duplicates keep the first
    std::vector<size_t> source_of;
    for (size_t i : order) {
        if (!graph.modules.empty() && graph.modules[graph.modules.size() - 1].file == paths[i])
            continue;
        ModuleNode node;
        node.file = paths[i];
        node.module = strip_extension(paths[i]);
        node.language = files[i].profile ? files[i].profile->name : "";
        graph.modules.add(std::move(node));
        source_of.push_back(i);
    }

    FileIndex index(graph.modules);
    ImportResolver resolver(index, aliases);

    size_t count = graph.modules.size();
    std::vector<std::vector<std::string>> exports(count);
    std::vector<size_t> import_counts(count, 0);
    std::vector<std::vector<DependencyEdge>> edges(count);
    std::vector<std::vector<UnresolvedImport>> unresolved(count);

    pool.run(count, [&](size_t m) {
        const SourceFile &source = files[source_of[m]];
        if (!source.profile)
            return;
        const LanguageProfile &profile = *source.profile;
        const std::string &file = index.path(static_cast<ModuleId>(m));
        ModuleId from = static_cast<ModuleId>(m);

        exports[m] = extract_exports(source.text, profile);
        std::vector<ImportStatement> imports = extract_imports(source.text, profile);
        import_counts[m] = imports.size();

        std::unordered_set<ModuleId> seen;
        for (const auto &stmt : imports) {
            std::vector<ModuleId> targets = resolver.resolve(stmt, file, profile.import_style);
            if (targets.empty()) {
                unresolved[m].push_back({from, stmt.target, stmt.line});
                continue;
            }
            for (ModuleId to : targets) {
                if (seen.insert(to).second)
                    edges[m].push_back({from, to, stmt.line, stmt.target});
            }
        }
    });

    for (size_t m = 0; m < count; ++m) {
        graph.modules[static_cast<ModuleId>(m)].exports = std::move(exports[m]);
        graph.modules[static_cast<ModuleId>(m)].import_count = import_counts[m];
        graph.edges.insert(graph.edges.end(), edges[m].begin(), edges[m].end());
        graph.unresolved.insert(graph.unresolved.end(), unresolved[m].begin(), unresolved[m].end());
    }
    return graph;
}

// ============================================================================
// Analyses
// ============================================================================

std::vector<std::vector<ModuleId>> find_cycles(const DependencyGraph &graph) {
    std::vector<std::vector<ModuleId>> cycles;
    std::set<std::vector<ModuleId>> seen;
    for_each_back_edge(graph, [&](std::vector<ModuleId> cycle) {
        if (seen.insert(cycle).second)
            cycles.push_back(std::move(cycle));
        return true;
    });
    return cycles;
}

bool detect_circular(const DependencyGraph &graph, std::vector<ModuleId> *cycle) {
    bool found = false;
    for_each_back_edge(graph, [&](std::vector<ModuleId> path) {
        found = true;
        if (cycle)
            *cycle = std::move(path);
        return false;
    });
    return found;
}

std::vector<ModuleId> roots(const DependencyGraph &graph) {
    std::vector<bool> imported(graph.modules.size(), false);
    for (const auto &e : graph.edges) {
        if (e.from != e.to)
            imported[e.to] = true;
    }
    std::vector<ModuleId> out;
    for (ModuleId id = 0; id < graph.modules.size(); ++id) {
        if (!imported[id])
            out.push_back(id);
    }
    return out;
}

std::vector<ModuleId> leaves(const DependencyGraph &graph) {
    std::vector<bool> imports(graph.modules.size(), false);
    for (const auto &e : graph.edges) {
        if (e.from != e.to)
            imports[e.from] = true;
    }
    std::vector<ModuleId> out;
    for (ModuleId id = 0; id < graph.modules.size(); ++id) {
        if (!imports[id])
            out.push_back(id);
    }
    return out;
}

std::vector<size_t> depths(const DependencyGraph &graph) {
    Adjacency adj = module_successors(graph);
    std::vector<std::vector<NodeId>> components = strongly_connected_components(adj);

    std::vector<size_t> component_of(adj.size(), 0);
    for (size_t c = 0; c < components.size(); ++c) {
        for (NodeId node : components[c])
            component_of[node] = c;
    }

    // Components come out sinks first, so walking backwards visits every
    // importer before the modules it imports
    std::vector<size_t> component_depth(components.size(), 0);
    for (size_t c = components.size(); c-- > 0;) {
        for (NodeId node : components[c]) {
            for (NodeId next : adj[node]) {
                size_t d = component_of[next];
                if (d != c)
                    component_depth[d] = std::max(component_depth[d], component_depth[c] + 1);
            }
        }
    }

    std::vector<size_t> out(adj.size(), 0);
    for (NodeId id = 0; id < adj.size(); ++id)
        out[id] = component_depth[component_of[id]];
    return out;
}

} // namespace codegraph
