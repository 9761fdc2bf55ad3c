#include "codegraph/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <functional>
#include <regex>

namespace codegraph {

std::vector<NodeId> SyntaxTree::of_kind(DeclKind kind) const {
    std::vector<NodeId> out;
    for (NodeId id = 0; id < decls.size(); ++id) {
        if (decls[id].kind == kind)
            out.push_back(id);
    }
    return out;
}

const FunctionBody *SyntaxTree::body_of(NodeId decl) const {
    for (const auto &fn : functions) {
        if (fn.decl == decl)
            return &fn;
    }
    return nullptr;
}

bool is_reserved_word(const std::string &word) {
    static const std::vector<std::string> reserved = {
        "if",     "for",    "while",  "switch", "catch",  "return", "sizeof",  "typeof",
        "alignof", "decltype", "function", "fn",   "def",    "func",   "fun",     "elif",
        "match",  "when",   "else",   "do",     "case",   "with",   "assert",  "print",
        "not",    "and",    "or",     "in",     "lambda", "yield",  "await",   "foreach",
        "using",  "lock",   "guard",  "defined", "static_assert", "noexcept", "throw", "new",
        "delete", "super",  "this",   "self",   "except", "elseif", "until",   "unless"};
    return std::find(reserved.begin(), reserved.end(), word) != reserved.end();
}

std::vector<std::pair<std::string, size_t>> find_call_targets(const std::string &masked) {
    static const std::regex call_re(
        R"(((?:[A-Za-z_$][\w$]*\s*(?:\.|::|->|\?\.)\s*)*[A-Za-z_$][\w$]*)\s*\()");
    std::vector<std::pair<std::string, size_t>> out;
    auto begin = std::sregex_iterator(masked.begin(), masked.end(), call_re);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto &m = *it;
        size_t pos = static_cast<size_t>(m.position(1));
        if (pos > 0) {
            char prev = masked[pos - 1];
            if (std::isalnum(static_cast<unsigned char>(prev)) || prev == '_' || prev == '.')
                continue;
        }
        std::string target = m[1].str();
        target.erase(std::remove_if(target.begin(), target.end(),
                                    [](unsigned char c) { return std::isspace(c); }),
                     target.end());
        std::string head = target.substr(0, target.find_first_of(".:-?"));
        if (head == target && is_reserved_word(target))
            continue;
        out.emplace_back(target, pos);
    }
    return out;
}

namespace {

// ============================================================================
// Tree-sitter parser handle
// ============================================================================
class LanguageParser {
public:
    explicit LanguageParser(Grammar grammar) {
        parser_ = ts_parser_new();
        if (!parser_) {
            throw std::runtime_error("Failed to create tree-sitter parser");
        }

        const TSLanguage *ts_lang = nullptr;
        switch (grammar) {
        case Grammar::Python:
            ts_lang = tree_sitter_python();
            break;
        case Grammar::C:
            ts_lang = tree_sitter_c();
            break;
        case Grammar::Cpp:
            ts_lang = tree_sitter_cpp();
            break;
        default:
            ts_parser_delete(parser_);
            throw std::runtime_error("No grammar linked for this language");
        }

        if (!ts_parser_set_language(parser_, ts_lang)) {
            ts_parser_delete(parser_);
            throw std::runtime_error("Failed to set parser language");
        }
    }

    ~LanguageParser() {
        if (tree_)
            ts_tree_delete(tree_);
        if (parser_)
            ts_parser_delete(parser_);
    }

    LanguageParser(const LanguageParser &) = delete;
    LanguageParser &operator=(const LanguageParser &) = delete;

    bool parse(const std::string &source) {
        if (tree_) {
            ts_tree_delete(tree_);
            tree_ = nullptr;
        }
        tree_ = ts_parser_parse_string(parser_, nullptr, source.c_str(),
                                       static_cast<uint32_t>(source.size()));
        return tree_ != nullptr;
    }

    TSNode root() const { return tree_ ? ts_tree_root_node(tree_) : TSNode{}; }

private:
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
};

// Iterative pre-order walk
void visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) {
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        visitor(current);

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

bool is_type(TSNode node, const char *type) { return strcmp(ts_node_type(node), type) == 0; }

TSNode field(TSNode node, const char *name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

uint32_t line_of(TSNode node) { return ts_node_start_point(node).row + 1; }

uint32_t end_line_of(TSNode node) { return ts_node_end_point(node).row + 1; }

// First node of a syntax error, for the diagnostic message
TSNode first_error(TSNode root) {
    TSNode found{};
    bool done = false;
    visit_nodes(root, [&](TSNode node) {
        if (done)
            return;
        if (is_type(node, "ERROR") || ts_node_is_missing(node)) {
            found = node;
            done = true;
        }
    });
    return found;
}

class GrammarExtractor {
public:
    GrammarExtractor(const LanguageProfile &profile, const std::string &source, SyntaxTree &tree)
        : profile_(profile), source_(source), tree_(tree) {}

    void run(TSNode root) {
        visit_nodes(root, [&](TSNode node) {
            uint32_t start_byte = ts_node_start_byte(node);
            while (!contexts_.empty() && start_byte >= contexts_.back().end_byte) {
                contexts_.pop_back();
            }

            switch (profile_.grammar) {
            case Grammar::Python:
                visit_python(node);
                break;
            case Grammar::C:
            case Grammar::Cpp:
                visit_c_family(node);
                break;
            default:
                break;
            }
        });
    }

private:
    struct Context {
        NodeId decl;
        std::string qualified_name;
        bool is_class;
        uint32_t end_byte;
        Visibility access;
    };

    const LanguageProfile &profile_;
    const std::string &source_;
    SyntaxTree &tree_;
    std::vector<Context> contexts_;
    std::vector<std::pair<NodeId, std::string>> variables_seen_;

    std::string node_text(TSNode node) const {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        if (start < source_.size() && end <= source_.size()) {
            return source_.substr(start, end - start);
        }
        return "";
    }

    std::string first_identifier(TSNode node) const {
        std::string found;
        visit_nodes(node, [&](TSNode n) {
            if (found.empty() && is_type(n, "identifier"))
                found = node_text(n);
        });
        return found;
    }

    NodeId innermost_decl() const {
        return contexts_.empty() ? INVALID_NODE : contexts_.back().decl;
    }

    NodeId innermost_function() const {
        for (auto it = contexts_.rbegin(); it != contexts_.rend(); ++it) {
            if (!it->is_class)
                return it->decl;
        }
        return INVALID_NODE;
    }

    std::string qualify(const std::string &name, const char *sep) const {
        if (contexts_.empty())
            return name;
        return contexts_.back().qualified_name + sep + name;
    }

    NodeId add_decl(DeclKind kind, const std::string &name, const std::string &qualified,
                    TSNode node, Visibility visibility, NodeId parent) {
        DeclNode decl;
        decl.kind = kind;
        decl.name = name;
        decl.qualified_name = qualified;
        decl.file = tree_.file;
        decl.start_line = line_of(node);
        decl.end_line = end_line_of(node);
        decl.visibility = visibility;
        decl.language = profile_.name;
        decl.parent = parent;
        return tree_.decls.add(std::move(decl));
    }

    void add_call(const std::string &target, TSNode node) {
        if (target.empty())
            return;
        std::string name = target;
        size_t sep = name.find_last_of(".:>");
        if (sep != std::string::npos)
            name = name.substr(sep + 1);
        NodeId id =
            add_decl(DeclKind::CallSite, name, target, node, Visibility::Unknown, innermost_function());
        tree_.decls[id].target = target;
    }

    void add_import(const std::string &target, TSNode node) {
        if (target.empty())
            return;
        NodeId id =
            add_decl(DeclKind::Import, target, target, node, Visibility::Unknown, INVALID_NODE);
        tree_.decls[id].target = target;
    }

    void add_variable(const std::string &name, TSNode node, Visibility visibility) {
        if (name.empty() || innermost_function() != INVALID_NODE)
            return;
        NodeId parent = innermost_decl();
        for (const auto &[p, n] : variables_seen_) {
            if (p == parent && n == name)
                return;
        }
        variables_seen_.emplace_back(parent, name);
        add_decl(DeclKind::Variable, name, qualify(name, profile_.grammar == Grammar::Python ? "." : "::"),
                 node, visibility, parent);
    }

    void add_body(NodeId decl, TSNode node, TSNode body, const std::vector<std::string> &params) {
        FunctionBody fn;
        fn.decl = decl;
        fn.parameters = params;
        fn.end_line = end_line_of(node);

        uint32_t node_start = ts_node_start_byte(node);
        uint32_t body_start = ts_node_start_byte(body);
        fn.signature = trim(source_.substr(node_start, body_start - node_start));
        if (!fn.signature.empty() && fn.signature.back() == ':')
            fn.signature.pop_back();

        std::string text = node_text(body);
        if (profile_.grammar == Grammar::Python) {
            // Keep the first line's indentation so the splitter sees real columns
            fn.body = std::string(ts_node_start_point(body).column, ' ') + text;
            fn.body_line = line_of(body);
        } else {
            // compound_statement: strip the braces
            if (text.size() >= 2 && text.front() == '{' && text.back() == '}')
                text = text.substr(1, text.size() - 2);
            fn.body = text;
            fn.body_line = line_of(body);
        }
        tree_.functions.push_back(std::move(fn));
    }

    void push_context(NodeId decl, const std::string &qualified, bool is_class, TSNode node,
                      Visibility access) {
        contexts_.push_back({decl, qualified, is_class, ts_node_end_byte(node), access});
    }

    // ============ Python ============

    static Visibility python_visibility(const std::string &name) {
        if (name.size() > 4 && name.compare(0, 2, "__") == 0 &&
            name.compare(name.size() - 2, 2, "__") == 0)
            return Visibility::Public;
        return (!name.empty() && name[0] == '_') ? Visibility::Private : Visibility::Public;
    }

    void visit_python(TSNode node) {
        if (is_type(node, "class_definition")) {
            TSNode name_node = field(node, "name");
            if (ts_node_is_null(name_node))
                return;
            std::string name = node_text(name_node);
            std::string qualified = qualify(name, ".");
            NodeId id = add_decl(DeclKind::Class, name, qualified, node, python_visibility(name),
                                 innermost_decl());
            push_context(id, qualified, true, node, Visibility::Public);
        } else if (is_type(node, "function_definition")) {
            TSNode name_node = field(node, "name");
            if (ts_node_is_null(name_node))
                return;
            std::string name = node_text(name_node);
            std::string qualified = qualify(name, ".");

            std::vector<std::string> params;
            TSNode params_node = field(node, "parameters");
            if (!ts_node_is_null(params_node)) {
                uint32_t count = ts_node_named_child_count(params_node);
                for (uint32_t i = 0; i < count; ++i) {
                    std::string param = first_identifier(ts_node_named_child(params_node, i));
                    if (!param.empty())
                        params.push_back(param);
                }
            }

            NodeId id = add_decl(DeclKind::Function, name, qualified, node,
                                 python_visibility(name), innermost_decl());
            TSNode body = field(node, "body");
            if (!ts_node_is_null(body))
                add_body(id, node, body, params);
            push_context(id, qualified, false, node, Visibility::Public);
        } else if (is_type(node, "import_statement")) {
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (is_type(child, "aliased_import"))
                    child = field(child, "name");
                if (!ts_node_is_null(child))
                    add_import(node_text(child), node);
            }
        } else if (is_type(node, "import_from_statement")) {
            TSNode module = field(node, "module_name");
            if (!ts_node_is_null(module))
                add_import(node_text(module), node);
        } else if (is_type(node, "call")) {
            TSNode fn = field(node, "function");
            if (!ts_node_is_null(fn) && (is_type(fn, "identifier") || is_type(fn, "attribute")))
                add_call(node_text(fn), node);
        } else if (is_type(node, "assignment")) {
            TSNode left = field(node, "left");
            if (!ts_node_is_null(left) && is_type(left, "identifier")) {
                std::string name = node_text(left);
                add_variable(name, node, python_visibility(name));
            }
        }
    }

    // ============ C / C++ ============

    bool has_static_storage(TSNode node) const {
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (is_type(child, "storage_class_specifier") && node_text(child) == "static")
                return true;
        }
        return false;
    }

    Visibility member_visibility(TSNode node) const {
        if (!contexts_.empty() && contexts_.back().is_class)
            return contexts_.back().access;
        return has_static_storage(node) ? Visibility::Private : Visibility::Public;
    }

    // Walk pointer/reference declarators down to the function_declarator
    TSNode function_declarator(TSNode node) const {
        TSNode decl = field(node, "declarator");
        while (!ts_node_is_null(decl) && (is_type(decl, "pointer_declarator") ||
                                          is_type(decl, "reference_declarator"))) {
            TSNode inner = field(decl, "declarator");
            if (ts_node_is_null(inner)) {
                // reference_declarator has no field name on its child
                inner = ts_node_named_child(decl, 0);
            }
            decl = inner;
        }
        if (!ts_node_is_null(decl) && is_type(decl, "function_declarator"))
            return decl;
        return TSNode{};
    }

    void visit_c_family(TSNode node) {
        bool cpp = profile_.grammar == Grammar::Cpp;

        if (cpp && is_type(node, "namespace_definition")) {
            TSNode name_node = field(node, "name");
            if (!ts_node_is_null(name_node)) {
                std::string name = node_text(name_node);
                push_context(innermost_decl(), qualify(name, "::"), false, node,
                             Visibility::Public);
                // Namespaces are scopes for naming, not functions
                contexts_.back().is_class = true;
            }
        } else if (is_type(node, "class_specifier") || is_type(node, "struct_specifier") ||
                   is_type(node, "union_specifier")) {
            TSNode name_node = field(node, "name");
            TSNode body = field(node, "body");
            if (ts_node_is_null(name_node) || ts_node_is_null(body))
                return;
            std::string name = node_text(name_node);
            std::string qualified = qualify(name, "::");
            NodeId id = add_decl(DeclKind::Class, name, qualified, node, member_visibility(node),
                                 innermost_decl());
            Visibility access =
                is_type(node, "class_specifier") ? Visibility::Private : Visibility::Public;
            push_context(id, qualified, true, node, access);
        } else if (cpp && is_type(node, "access_specifier")) {
            if (!contexts_.empty() && contexts_.back().is_class) {
                std::string text = node_text(node);
                if (text.find("public") != std::string::npos)
                    contexts_.back().access = Visibility::Public;
                else if (text.find("protected") != std::string::npos)
                    contexts_.back().access = Visibility::Protected;
                else if (text.find("private") != std::string::npos)
                    contexts_.back().access = Visibility::Private;
            }
        } else if (is_type(node, "function_definition")) {
            TSNode decl = function_declarator(node);
            if (ts_node_is_null(decl))
                return;
            TSNode name_node = field(decl, "declarator");
            if (ts_node_is_null(name_node))
                return;
            std::string full = node_text(name_node);
            std::string name = full;
            size_t sep = name.rfind("::");
            if (sep != std::string::npos)
                name = name.substr(sep + 2);

            // Out-of-line definitions (Class::method) are already qualified
            std::string qualified = full.find("::") == std::string::npos ? qualify(full, "::") : full;

            std::vector<std::string> params;
            TSNode params_node = field(decl, "parameters");
            if (!ts_node_is_null(params_node)) {
                uint32_t count = ts_node_named_child_count(params_node);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode param = ts_node_named_child(params_node, i);
                    if (!is_type(param, "parameter_declaration") &&
                        !is_type(param, "optional_parameter_declaration"))
                        continue;
                    TSNode declarator = field(param, "declarator");
                    if (ts_node_is_null(declarator))
                        continue;
                    std::string p = first_identifier(declarator);
                    if (!p.empty())
                        params.push_back(p);
                }
            }

            NodeId id = add_decl(DeclKind::Function, name, qualified, node,
                                 member_visibility(node), innermost_decl());
            TSNode body = field(node, "body");
            if (!ts_node_is_null(body))
                add_body(id, node, body, params);
            push_context(id, qualified, false, node, Visibility::Public);
        } else if (is_type(node, "preproc_include")) {
            TSNode path = field(node, "path");
            if (!ts_node_is_null(path)) {
                std::string target = node_text(path);
                if (target.size() >= 2)
                    target = target.substr(1, target.size() - 2);
                add_import(target, node);
            }
        } else if (cpp && is_type(node, "using_declaration")) {
            std::string text = node_text(node);
            add_import(trim(text.substr(5, text.find(';') == std::string::npos
                                                ? std::string::npos
                                                : text.find(';') - 5)),
                       node);
        } else if (is_type(node, "call_expression")) {
            TSNode fn = field(node, "function");
            if (ts_node_is_null(fn))
                return;
            if (is_type(fn, "field_expression")) {
                // obj.method() or obj->method()
                add_call(node_text(fn), node);
            } else if (is_type(fn, "template_function")) {
                TSNode name = field(fn, "name");
                if (!ts_node_is_null(name))
                    add_call(node_text(name), node);
            } else if (is_type(fn, "identifier") || is_type(fn, "qualified_identifier") ||
                       is_type(fn, "scoped_identifier")) {
                add_call(node_text(fn), node);
            }
        } else if (cpp && is_type(node, "new_expression")) {
            TSNode type_node = field(node, "type");
            if (!ts_node_is_null(type_node))
                add_call(node_text(type_node), node);
        } else if (is_type(node, "declaration")) {
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (is_type(child, "init_declarator") || is_type(child, "identifier")) {
                    std::string name = first_identifier(child);
                    add_variable(name, node, member_visibility(node));
                }
            }
        }
    }
};

// ============================================================================
// Pattern extraction helpers
// ============================================================================
struct LineIndex {
    std::vector<size_t> starts;

    explicit LineIndex(const std::string &text) {
        starts.push_back(0);
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n')
                starts.push_back(i + 1);
        }
    }

    uint32_t line_at(size_t offset) const {
        auto it = std::upper_bound(starts.begin(), starts.end(), offset);
        return static_cast<uint32_t>(it - starts.begin());
    }

    size_t line_end(size_t line_idx, size_t text_size) const {
        return line_idx + 1 < starts.size() ? starts[line_idx + 1] - 1 : text_size;
    }
};

Visibility visibility_from_line(const std::string &line, const std::string &name,
                                const LanguageProfile &profile) {
    static const std::regex pub_re(R"(\b(pub|public|export|open)\b)");
    static const std::regex priv_re(R"(\b(private|fileprivate)\b)");
    static const std::regex prot_re(R"(\bprotected\b)");
    if (std::regex_search(line, priv_re))
        return Visibility::Private;
    if (std::regex_search(line, prot_re))
        return Visibility::Protected;
    if (std::regex_search(line, pub_re))
        return Visibility::Public;
    if (profile.import_style == ImportStyle::Go && !name.empty())
        return std::isupper(static_cast<unsigned char>(name[0])) ? Visibility::Public
                                                                  : Visibility::Private;
    if (profile.import_style == ImportStyle::Rust)
        return Visibility::Private;
    if (!profile.brace_delimited && !name.empty())
        return name[0] == '_' ? Visibility::Private : Visibility::Public;
    return Visibility::Unknown;
}

struct Candidate {
    DeclKind kind;
    std::string name;
    size_t offset;    // header position
    size_t name_pos = 0;
    size_t begin = 0; // body span (exclusive of delimiters)
    size_t end = 0;
    bool has_body = false;
    std::string receiver; // Go method receiver type
    Visibility visibility = Visibility::Unknown;
    std::string signature;
    std::string body;
    uint32_t body_line = 0;
};

} // namespace

// ============================================================================
// GrammarStrategy
// ============================================================================

SyntaxTree GrammarStrategy::extract(const std::string &path, const std::string &text) const {
    LanguageParser parser(profile_->grammar);
    if (!parser.parse(text)) {
        throw ParseError("tree-sitter failed to produce a tree");
    }

    TSNode root = parser.root();
    if (ts_node_has_error(root)) {
        TSNode err = first_error(root);
        std::string where = ts_node_is_null(err) ? "" : " near line " + std::to_string(line_of(err));
        throw ParseError("syntax error" + where);
    }

    SyntaxTree tree;
    tree.file = path;
    tree.language = profile_->name;
    tree.heuristic = false;

    GrammarExtractor extractor(*profile_, text, tree);
    extractor.run(root);
    return tree;
}

// ============================================================================
// PatternStrategy
// ============================================================================

SyntaxTree PatternStrategy::extract(const std::string &path, const std::string &text) const {
    const LanguageProfile &profile = *profile_;
    SyntaxTree tree;
    tree.file = path;
    tree.language = profile.name;
    tree.heuristic = true;

    MaskedSource src = mask_source(text, profile);
    const std::string &masked = src.masked;
    LineIndex lines(masked);

    auto line_text = [&](size_t idx, const std::string &from) {
        size_t begin = lines.starts[idx];
        return from.substr(begin, lines.line_end(idx, from.size()) - begin);
    };

    auto indent_of = [](const std::string &line) {
        size_t i = 0;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        return i;
    };

    // Locate the body of a declaration whose header starts at `from`
    auto locate_body = [&](Candidate &c, size_t from, size_t line_idx) {
        if (!profile.brace_delimited) {
            std::string header = line_text(line_idx, masked);
            size_t header_indent = indent_of(header);
            size_t last = line_idx;
            for (size_t k = line_idx + 1; k < lines.starts.size(); ++k) {
                std::string l = line_text(k, masked);
                if (trim(l).empty())
                    continue;
                if (indent_of(l) <= header_indent)
                    break;
                last = k;
            }
            if (last == line_idx)
                return;
            c.begin = lines.starts[line_idx + 1];
            c.end = lines.line_end(last, masked.size());
            c.has_body = true;
            c.signature = trim(text.substr(lines.starts[line_idx] + header_indent,
                                           lines.line_end(line_idx, text.size()) -
                                               lines.starts[line_idx] - header_indent));
            if (!c.signature.empty() && c.signature.back() == ':')
                c.signature.pop_back();
            c.body = src.clean.substr(c.begin, c.end - c.begin);
            c.body_line = static_cast<uint32_t>(line_idx + 2);
            return;
        }

        int depth = 0;
        for (size_t i = from; i < masked.size(); ++i) {
            char ch = masked[i];
            if (ch == '(' || ch == '[') {
                ++depth;
            } else if (ch == ')' || ch == ']') {
                --depth;
            } else if (depth == 0 && ch == ';') {
                return; // declaration only
            } else if (depth == 0 && ch == '=' && i + 1 < masked.size() && masked[i + 1] != '=' &&
                       c.kind == DeclKind::Function) {
                // Expression-bodied function: fun f() = x, int F() => x;
                size_t start = masked[i + 1] == '>' ? i + 2 : i + 1;
                size_t stop = masked.find_first_of(";\n", start);
                if (stop == std::string::npos)
                    stop = masked.size();
                c.begin = start;
                c.end = stop;
                c.has_body = true;
                c.signature = trim(src.clean.substr(c.offset, i - c.offset));
                c.body = src.clean.substr(start, stop - start);
                c.body_line = lines.line_at(start);
                return;
            } else if (depth == 0 && ch == '{') {
                size_t close = find_matching(masked, i);
                if (close == std::string::npos)
                    return;
                c.begin = i + 1;
                c.end = close;
                c.has_body = true;
                c.signature = trim(src.clean.substr(c.offset, i - c.offset));
                c.body = src.clean.substr(i + 1, close - i - 1);
                c.body_line = lines.line_at(i);
                return;
            }
        }
    };

    static const std::regex go_receiver(R"(func\s*\(\s*\w+\s+\*?\s*(\w+))");

    std::vector<Candidate> candidates;
    for (size_t idx = 0; idx < lines.starts.size(); ++idx) {
        std::string mline = line_text(idx, masked);
        std::string cline = line_text(idx, src.clean);
        if (trim(mline).empty())
            continue;

        auto match_kind = [&](const std::vector<Pattern> &patterns, DeclKind kind) {
            for (const auto &p : patterns) {
                std::smatch m;
                if (!std::regex_search(mline, m, p.regex) || m.size() < 2 || !m[1].matched)
                    continue;
                std::string name = m[1].str();
                if (is_reserved_word(name))
                    continue;
                Candidate c;
                c.kind = kind;
                c.name = name;
                c.offset = lines.starts[idx] + static_cast<size_t>(m.position(0)) +
                           indent_of(mline.substr(static_cast<size_t>(m.position(0))));
                c.name_pos = lines.starts[idx] + static_cast<size_t>(m.position(1));
                c.visibility = visibility_from_line(cline, name, profile);
                std::smatch r;
                if (kind == DeclKind::Function && std::regex_search(mline, r, go_receiver))
                    c.receiver = r[1].str();
                locate_body(c, lines.starts[idx] + static_cast<size_t>(m.position(1)) +
                                   m[1].length(),
                            idx);
                if (kind == DeclKind::Function && !c.has_body)
                    return true; // prototype or abstract declaration
                candidates.push_back(std::move(c));
                return true;
            }
            return false;
        };

        if (!match_kind(profile.class_patterns, DeclKind::Class))
            match_kind(profile.function_patterns, DeclKind::Function);

        for (const auto &p : profile.import_patterns) {
            std::smatch m;
            std::string raw = line_text(idx, text);
            if (std::regex_search(raw, m, p.regex) && m.size() >= 2 && m[1].matched) {
                Candidate c;
                c.kind = DeclKind::Import;
                c.name = m[1].str();
                c.offset = lines.starts[idx];
                candidates.push_back(std::move(c));
                break;
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate &a, const Candidate &b) { return a.offset < b.offset; });

    // Innermost enclosing span with a body, by brace depth / indentation
    auto enclosing = [&](size_t offset, size_t self) -> size_t {
        size_t best = SIZE_MAX;
        for (size_t k = 0; k < candidates.size(); ++k) {
            const Candidate &c = candidates[k];
            if (k == self || !c.has_body || c.kind == DeclKind::Import)
                continue;
            if (c.begin <= offset && offset < c.end) {
                if (best == SIZE_MAX || c.begin >= candidates[best].begin)
                    best = k;
            }
        }
        return best;
    };

    std::vector<NodeId> ids(candidates.size(), INVALID_NODE);
    for (size_t k = 0; k < candidates.size(); ++k) {
        const Candidate &c = candidates[k];
        size_t parent = c.kind == DeclKind::Import ? SIZE_MAX : enclosing(c.offset, k);

        DeclNode decl;
        decl.kind = c.kind;
        decl.name = c.name;
        decl.file = path;
        decl.start_line = lines.line_at(c.offset);
        decl.end_line = c.has_body ? lines.line_at(c.end) : decl.start_line;
        decl.visibility = c.visibility;
        decl.language = profile.name;
        decl.parent = parent == SIZE_MAX ? INVALID_NODE : ids[parent];
        if (c.kind == DeclKind::Import)
            decl.target = c.name;

        if (!c.receiver.empty()) {
            decl.qualified_name = c.receiver + "." + c.name;
        } else if (decl.parent != INVALID_NODE) {
            decl.qualified_name = tree.decls[decl.parent].qualified_name + "." + c.name;
        } else {
            decl.qualified_name = c.name;
        }
        ids[k] = tree.decls.add(std::move(decl));

        if (c.kind == DeclKind::Function) {
            FunctionBody fn;
            fn.decl = ids[k];
            fn.signature = c.signature;
            fn.parameters = parse_parameters(c.signature, profile);
            fn.body = c.body;
            fn.body_line = c.body_line;
            fn.end_line = lines.line_at(c.end);
            tree.functions.push_back(std::move(fn));
        }
    }

    // Call sites, attributed to the innermost function body around them
    static const std::vector<std::string> call_prefixes = {
        "return", "new",  "await", "yield", "throw", "else", "do",   "in",    "of",
        "case",   "not",  "and",   "or",    "go",    "defer", "typeof", "delete", "try"};
    for (const auto &[target, pos] : find_call_targets(masked)) {
        // "int foo(" is a declaration, "return foo(" a call
        size_t j = pos;
        while (j > 0 && (masked[j - 1] == ' ' || masked[j - 1] == '\t'))
            --j;
        size_t word_end = j;
        while (j > 0 && (std::isalnum(static_cast<unsigned char>(masked[j - 1])) ||
                         masked[j - 1] == '_'))
            --j;
        if (word_end > j && j < pos) {
            std::string prev = masked.substr(j, word_end - j);
            if (std::find(call_prefixes.begin(), call_prefixes.end(), prev) == call_prefixes.end())
                continue;
        }

        NodeId parent = INVALID_NODE;
        size_t best_begin = 0;
        bool is_header = false;
        for (size_t k = 0; k < candidates.size(); ++k) {
            const Candidate &c = candidates[k];
            if (c.kind != DeclKind::Function)
                continue;
            if (c.name_pos == pos || (pos >= c.name_pos && pos < c.name_pos + c.name.size()))
                is_header = true;
            if (c.has_body && c.begin <= pos && pos < c.end && c.begin >= best_begin) {
                parent = ids[k];
                best_begin = c.begin;
            }
        }
        if (is_header)
            continue;

        std::string name = target;
        size_t sep = name.find_last_of(".:>");
        if (sep != std::string::npos)
            name = name.substr(sep + 1);

        DeclNode decl;
        decl.kind = DeclKind::CallSite;
        decl.name = name;
        decl.qualified_name = target;
        decl.target = target;
        decl.file = path;
        decl.start_line = decl.end_line = lines.line_at(pos);
        decl.language = profile.name;
        decl.parent = parent;
        tree.decls.add(std::move(decl));
    }
    return tree;
}

// ============================================================================
// Strategy selection
// ============================================================================

ExtractionStrategy strategy_for(const LanguageProfile &profile) {
    if (profile.has_grammar())
        return GrammarStrategy(profile);
    return PatternStrategy(profile);
}

SyntaxTree extract_syntax(const ExtractionStrategy &strategy, const std::string &path,
                          const std::string &text) {
    return std::visit([&](const auto &s) { return s.extract(path, text); }, strategy);
}

} // namespace codegraph
