#pragma once

#include "language.hpp"
#include "statements.hpp"
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <tree_sitter/api.h>
#include <variant>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_c();
const TSLanguage *tree_sitter_cpp();
}

namespace codegraph {

// Raised when a grammar-based parse reports syntax errors
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string &message) : std::runtime_error(message) {}
};

// Body of one function, ready for split_statements()
struct FunctionBody {
    NodeId decl = INVALID_NODE; // Function DeclNode in SyntaxTree::decls
    std::string signature;      // Header text up to the body
    std::vector<std::string> parameters;
    std::string body;           // Text between the delimiters
    uint32_t body_line = 0;     // Line of the first character of `body`
    uint32_t end_line = 0;
};

// Structural tree of one file
struct SyntaxTree {
    std::string file;
    std::string language;
    bool heuristic = false; // produced by the pattern extractor
    NodeArena<DeclNode> decls;
    std::vector<FunctionBody> functions;

    // Declarations of one kind, in source order
    std::vector<NodeId> of_kind(DeclKind kind) const;

    // Function body for a Function decl, or nullptr
    const FunctionBody *body_of(NodeId decl) const;
};

// Tree-sitter backed extractor (Python, C, C++)
class GrammarStrategy {
public:
    explicit GrammarStrategy(const LanguageProfile &profile) : profile_(&profile) {}

    // Throws ParseError when the tree contains syntax errors
    SyntaxTree extract(const std::string &path, const std::string &text) const;

    const LanguageProfile &profile() const { return *profile_; }

private:
    const LanguageProfile *profile_;
};

// Line-by-line regex extractor for every other language; output is heuristic
class PatternStrategy {
public:
    explicit PatternStrategy(const LanguageProfile &profile) : profile_(&profile) {}

    SyntaxTree extract(const std::string &path, const std::string &text) const;

    const LanguageProfile &profile() const { return *profile_; }

private:
    const LanguageProfile *profile_;
};

using ExtractionStrategy = std::variant<GrammarStrategy, PatternStrategy>;

// Grammar when the profile has one, patterns otherwise
ExtractionStrategy strategy_for(const LanguageProfile &profile);

SyntaxTree extract_syntax(const ExtractionStrategy &strategy, const std::string &path,
                          const std::string &text);

// Call-site targets inside an arbitrary code fragment ("a.b(x)" -> "a.b")
std::vector<std::pair<std::string, size_t>> find_call_targets(const std::string &masked);

// Language keywords that look like calls ("if (", "sizeof(")
bool is_reserved_word(const std::string &word);

} // namespace codegraph
