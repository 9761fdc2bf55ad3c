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

#include "codegraph/language.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace codegraph {

namespace {

std::vector<Pattern> patterns(std::initializer_list<const char *> sources) {
    std::vector<Pattern> out;
    out.reserve(sources.size());
    for (const char *src : sources) {
        out.push_back(make_pattern(src));
    }
    return out;
}

LanguageProfile python_profile() {
    LanguageProfile p;
    p.name = "Python";
    p.extensions = {"py", "pyw", "pyi"};
    p.function_patterns = patterns({R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*)\s*\()"});
    p.class_patterns = patterns({R"(^\s*class\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*import\s+([\w.]+))",
                                  R"(^\s*from\s+(\.+[\w.]*|[\w.]+)\s+import\s+\(?\s*([\w, ]+))"});
    p.export_patterns = patterns({R"(^def\s+([A-Za-z]\w*))", R"(^class\s+([A-Za-z]\w*))"});
    p.line_comments = {"#"};
    p.brace_delimited = false;
    p.grammar = Grammar::Python;
    p.import_style = ImportStyle::Python;
    p.keywords = {"and",    "as",     "assert",   "async", "await",  "break",  "class",
                  "continue", "def",  "del",      "elif",  "else",   "except", "finally",
                  "for",    "from",   "global",   "if",    "import", "in",     "is",
                  "lambda", "nonlocal", "not",    "or",    "pass",   "raise",  "return",
                  "try",    "while",  "with",     "yield"};
    return p;
}

LanguageProfile c_profile() {
    LanguageProfile p;
    p.name = "C";
    p.extensions = {"c", "h"};
    p.function_patterns = patterns(
        {R"(^[\w\s\*]*?\b([A-Za-z_]\w*)\s*\([^;{}]*\)\s*\{?\s*$)"});
    p.class_patterns = patterns({R"(^\s*(?:typedef\s+)?(?:struct|union|enum)\s+([A-Za-z_]\w*)\s*\{?)"});
    p.import_patterns = patterns({R"(^\s*#\s*include\s*["<]([^">]+)[">])"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.case_fallthrough = true;
    p.grammar = Grammar::C;
    p.import_style = ImportStyle::CInclude;
    p.keywords = {"auto",     "break",    "case",   "char",   "const",    "continue", "default",
                  "do",       "double",   "else",   "enum",   "extern",   "float",    "for",
                  "goto",     "if",       "inline", "int",    "long",     "register", "restrict",
                  "return",   "short",    "signed", "sizeof", "static",   "struct",   "switch",
                  "typedef",  "union",    "unsigned", "void", "volatile", "while",    "bool",
                  "size_t",   "_Bool"};
    return p;
}

LanguageProfile cpp_profile() {
    LanguageProfile p = c_profile();
    p.name = "C++";
    p.extensions = {"cpp", "cc", "cxx", "hpp", "hh", "hxx"};
    p.function_patterns = patterns(
        {R"(^[\w\s\*&:<>,]*?\b([A-Za-z_~][\w:~]*)\s*\([^;{}]*\)\s*(?:const\s*)?(?:noexcept\s*)?(?:override\s*)?\{?\s*$)"});
    p.class_patterns = patterns({R"(^\s*(?:template\s*<[^>]*>\s*)?(?:class|struct)\s+([A-Za-z_]\w*))",
                                 R"(^\s*namespace\s+([A-Za-z_]\w*))"});
    p.grammar = Grammar::Cpp;
    p.keywords.insert({"alignas",   "alignof",    "catch",      "class",        "constexpr",
                       "const_cast", "decltype",  "delete",     "dynamic_cast", "explicit",
                       "export",    "friend",     "mutable",    "namespace",    "new",
                       "noexcept",  "operator",   "private",    "protected",    "public",
                       "reinterpret_cast", "static_assert", "static_cast", "template", "throw",
                       "try",       "typeid",     "typename",   "using",        "virtual",
                       "wchar_t",   "override",   "final",      "co_await",     "co_return",
                       "co_yield"});
    return p;
}

LanguageProfile rust_profile() {
    LanguageProfile p;
    p.name = "Rust";
    p.extensions = {"rs"};
    p.function_patterns = patterns(
        {R"(^\s*(?:pub(?:\([\w:]+\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"\w+"\s+)?fn\s+([A-Za-z_]\w*))"});
    p.class_patterns = patterns(
        {R"(^\s*(?:pub(?:\([\w:]+\))?\s+)?(?:struct|enum|trait|union)\s+([A-Za-z_]\w*))",
         R"(^\s*impl(?:<[^>]*>)?\s+(?:[\w:<>]+\s+for\s+)?([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*(?:pub(?:\([\w:]+\))?\s+)?use\s+([\w:]+))",
                                  R"(^\s*(?:pub(?:\([\w:]+\))?\s+)?mod\s+([A-Za-z_]\w*)\s*;)"});
    p.export_patterns = patterns({R"(^\s*pub\s+(?:async\s+)?(?:unsafe\s+)?fn\s+([A-Za-z_]\w*))",
                                  R"(^\s*pub\s+(?:struct|enum|trait)\s+([A-Za-z_]\w*))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.match_arrow = "=>";
    p.import_style = ImportStyle::Rust;
    p.keywords = {"as",    "async", "await", "break", "const",  "continue", "crate",  "dyn",
                  "else",  "enum",  "extern", "fn",   "for",    "if",       "impl",   "in",
                  "let",   "loop",  "match", "mod",   "move",   "mut",      "pub",    "ref",
                  "return", "static", "struct", "trait", "type", "unsafe",  "use",    "where",
                  "while", "i8",    "i16",   "i32",   "i64",    "i128",     "u8",     "u16",
                  "u32",   "u64",   "u128",  "f32",   "f64",    "usize",    "isize",  "bool",
                  "char",  "str"};
    return p;
}

LanguageProfile javascript_profile() {
    LanguageProfile p;
    p.name = "JavaScript";
    p.extensions = {"js", "mjs", "cjs", "jsx"};
    p.function_patterns = patterns(
        {R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()",
         R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s*)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*=>)",
         R"(^\s*(?:static\s+)?(?:async\s+)?([A-Za-z_$][\w$]*)\s*\([^)]*\)\s*\{\s*$)"});
    p.class_patterns = patterns({R"(^\s*(?:export\s+)?(?:default\s+)?class\s+([A-Za-z_$][\w$]*))"});
    p.import_patterns = patterns({R"(^\s*import\s+(?:[^'"]*\s+from\s+)?['"]([^'"]+)['"])",
                                  R"(require\(\s*['"]([^'"]+)['"]\s*\))",
                                  R"(^\s*export\s+[^'"]*\s+from\s+['"]([^'"]+)['"])"});
    p.export_patterns = patterns(
        {R"(^\s*export\s+(?:default\s+)?(?:async\s+)?(?:function|class|const|let|var)\s*\*?\s*([A-Za-z_$][\w$]*))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.case_fallthrough = true;
    p.import_style = ImportStyle::JavaScript;
    p.keywords = {"async",  "await",    "break",   "case",   "catch",  "class",      "const",
                  "continue", "debugger", "default", "delete", "do",   "else",       "export",
                  "extends", "finally", "for",     "function", "if",   "import",     "in",
                  "instanceof", "let",  "new",     "of",     "return", "static",     "switch",
                  "throw",  "try",      "typeof",  "var",    "void",   "while",      "with",
                  "yield"};
    return p;
}

LanguageProfile typescript_profile() {
    LanguageProfile p = javascript_profile();
    p.name = "TypeScript";
    p.extensions = {"ts", "tsx", "mts", "cts"};
    p.class_patterns =
        patterns({R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*))",
                  R"(^\s*(?:export\s+)?interface\s+([A-Za-z_$][\w$]*))"});
    p.keywords.insert({"abstract", "any",      "as",     "boolean", "declare", "enum",
                       "implements", "interface", "keyof", "namespace", "never", "number",
                       "private", "protected", "public", "readonly", "string",  "unknown"});
    return p;
}

LanguageProfile go_profile() {
    LanguageProfile p;
    p.name = "Go";
    p.extensions = {"go"};
    p.function_patterns = patterns({R"(^\s*func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*)\s*[\[(])"});
    p.class_patterns = patterns({R"(^\s*type\s+([A-Za-z_]\w*)\s+(?:struct|interface))"});
    p.import_patterns = patterns({R"re(^\s*import\s+(?:[\w.]+\s+)?"([^"]+)")re",
                                  R"re(^\s*(?:[\w.]+\s+)?"([^"]+)"\s*$)re"});
    p.export_patterns = patterns({R"(^func\s+(?:\([^)]*\)\s*)?([A-Z]\w*))",
                                  R"(^type\s+([A-Z]\w*))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.type_after_name = true;
    p.import_style = ImportStyle::Go;
    p.keywords = {"break",  "case",    "chan",   "const",  "continue", "default", "defer",
                  "else",   "fallthrough", "for", "func", "go",       "goto",    "if",
                  "import", "interface", "map",  "package", "range",  "return",  "select",
                  "struct", "switch",  "type",   "var",    "int",      "int8",    "int16",
                  "int32",  "int64",   "uint",   "uint8",  "uint16",   "uint32",  "uint64",
                  "float32", "float64", "string", "bool",  "byte",     "rune"};
    return p;
}

LanguageProfile java_profile() {
    LanguageProfile p;
    p.name = "Java";
    p.extensions = {"java"};
    p.function_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|static|final|abstract|synchronized|native|default)\s+)*(?:<[^>]+>\s+)?[\w<>\[\],.?]+\s+([A-Za-z_]\w*)\s*\([^;]*$)"});
    p.class_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|static|final|abstract|sealed)\s+)*(?:class|interface|enum|record)\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*import\s+(?:static\s+)?([\w.]+(?:\.\*)?)\s*;)"});
    p.export_patterns = patterns({R"(^\s*public\s+(?:(?:static|final|abstract)\s+)*(?:class|interface|enum|record)\s+([A-Za-z_]\w*))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.case_fallthrough = true;
    p.import_style = ImportStyle::Dotted;
    p.keywords = {"abstract", "assert",  "boolean", "break",   "byte",       "case",    "catch",
                  "char",     "class",   "const",   "continue", "default",   "do",      "double",
                  "else",     "enum",    "extends", "final",   "finally",    "float",   "for",
                  "goto",     "if",      "implements", "import", "instanceof", "int",   "interface",
                  "long",     "native",  "new",     "package", "private",    "protected", "public",
                  "return",   "short",   "static",  "strictfp", "switch",    "synchronized",
                  "throw",    "throws",  "transient", "try",   "var",        "void",    "volatile",
                  "while"};
    return p;
}

LanguageProfile csharp_profile() {
    LanguageProfile p = java_profile();
    p.name = "C#";
    p.extensions = {"cs"};
    p.function_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|internal|static|virtual|override|async|sealed|abstract)\s+)*[\w<>\[\],.?]+\s+([A-Za-z_]\w*)\s*\([^;]*$)"});
    p.class_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|internal|static|sealed|abstract|partial)\s+)*(?:class|interface|struct|enum|record)\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*using\s+(?:static\s+)?([\w.]+)\s*;)"});
    p.match_arrow = "=>";
    p.export_patterns = patterns({R"(^\s*public\s+(?:(?:static|sealed|abstract|partial)\s+)*(?:class|interface|struct|enum|record)\s+([A-Za-z_]\w*))"});
    p.keywords = {"abstract", "as",       "async",    "await",    "base",     "bool",     "break",
                  "byte",     "case",     "catch",    "char",     "checked",  "class",    "const",
                  "continue", "decimal",  "default",  "delegate", "do",       "double",   "else",
                  "enum",     "event",    "explicit", "extern",   "finally",  "fixed",    "float",
                  "for",      "foreach",  "goto",     "if",       "implicit", "in",       "int",
                  "interface", "internal", "is",      "lock",     "long",     "namespace", "new",
                  "object",   "operator", "out",      "override", "params",   "private",  "protected",
                  "public",   "readonly", "ref",      "return",   "sbyte",    "sealed",   "short",
                  "sizeof",   "stackalloc", "static", "string",   "struct",   "switch",   "throw",
                  "try",      "typeof",   "uint",     "ulong",    "unchecked", "unsafe",  "ushort",
                  "using",    "var",      "virtual",  "void",     "volatile", "while"};
    return p;
}

LanguageProfile kotlin_profile() {
    LanguageProfile p;
    p.name = "Kotlin";
    p.extensions = {"kt", "kts"};
    p.function_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|internal|override|suspend|inline|open|operator)\s+)*fun\s+(?:<[^>]+>\s*)?(?:[\w.]+\.)?([A-Za-z_]\w*)\s*\()"});
    p.class_patterns = patterns(
        {R"(^\s*(?:(?:public|private|internal|data|sealed|open|abstract|enum|inner)\s+)*(?:class|interface|object)\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*import\s+([\w.]+))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.match_arrow = "->";
    p.import_style = ImportStyle::Dotted;
    p.keywords = {"as",     "break",  "class", "continue", "do",    "else",  "for",   "fun",
                  "if",     "in",     "interface", "is",   "object", "package", "return",
                  "throw",  "try",    "typealias", "val",  "var",   "when",  "while",
                  "private", "public", "protected", "internal", "override", "open", "suspend"};
    return p;
}

LanguageProfile swift_profile() {
    LanguageProfile p;
    p.name = "Swift";
    p.extensions = {"swift"};
    p.function_patterns = patterns(
        {R"(^\s*(?:(?:public|private|internal|fileprivate|open|static|override|mutating|@objc)\s+)*func\s+([A-Za-z_]\w*))"});
    p.class_patterns = patterns(
        {R"(^\s*(?:(?:public|private|internal|final|open)\s+)*(?:class|struct|enum|protocol|extension)\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*import\s+(\w+))"});
    p.line_comments = {"//"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.import_style = ImportStyle::Dotted;
    p.keywords = {"as",      "break",   "case",    "catch",   "class",    "continue", "default",
                  "defer",   "do",      "else",    "enum",    "extension", "fallthrough", "fileprivate",
                  "for",     "func",    "guard",   "if",      "import",   "in",       "init",
                  "inout",   "internal", "is",     "let",     "open",     "private",  "protocol",
                  "public",  "repeat",  "return",  "static",  "struct",   "switch",   "throw",
                  "throws",  "try",     "var",     "where",   "while"};
    return p;
}

LanguageProfile php_profile() {
    LanguageProfile p;
    p.name = "PHP";
    p.extensions = {"php", "phtml"};
    p.function_patterns = patterns(
        {R"(^\s*(?:(?:public|private|protected|static|final|abstract)\s+)*function\s+&?([A-Za-z_]\w*)\s*\()"});
    p.class_patterns =
        patterns({R"(^\s*(?:(?:abstract|final)\s+)?(?:class|interface|trait)\s+([A-Za-z_]\w*))"});
    p.import_patterns =
        patterns({R"(^\s*(?:require|include)(?:_once)?\s*\(?\s*['"]([^'"]+)['"])"});
    p.line_comments = {"//", "#"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.case_fallthrough = true;
    p.match_arrow = "=>";
    p.import_style = ImportStyle::Path;
    p.keywords = {"abstract", "and",     "array",    "as",       "break",    "case",     "catch",
                  "class",    "clone",   "const",    "continue", "declare",  "default",  "do",
                  "echo",     "else",    "elseif",   "empty",    "extends",  "final",    "finally",
                  "fn",       "for",     "foreach",  "function", "global",   "goto",     "if",
                  "implements", "include", "instanceof", "interface", "isset", "list",   "namespace",
                  "new",      "or",      "print",    "private",  "protected", "public",  "require",
                  "return",   "static",  "switch",   "throw",    "trait",    "try",      "unset",
                  "use",      "var",     "while",    "xor",      "yield"};
    return p;
}

LanguageProfile generic_profile() {
    LanguageProfile p;
    p.name = "Generic";
    p.function_patterns =
        patterns({R"(\b(?:fn|def|function|func|fun|sub|proc)\s+([A-Za-z_]\w*))"});
    p.class_patterns = patterns({R"(\b(?:class|struct|interface|trait)\s+([A-Za-z_]\w*))"});
    p.import_patterns = patterns({R"(^\s*(?:import|use|require|include)\s+['"<]?([\w./:-]+))"});
    p.line_comments = {"//", "#"};
    p.block_comment_open = "/*";
    p.block_comment_close = "*/";
    p.import_style = ImportStyle::Path;
    // Unknown language: the union of the common reserved words
    p.keywords = {
        "if",       "else",     "elif",     "elseif",   "elsif",     "for",       "foreach",
        "while",    "until",    "unless",   "do",       "loop",      "switch",    "case",
        "default",  "break",    "continue", "return",   "try",       "catch",     "except",
        "finally",  "raise",    "throw",    "throws",   "new",       "delete",    "del",
        "as",       "import",   "from",     "def",      "function",  "fn",        "func",
        "fun",      "sub",      "proc",     "let",      "const",     "var",       "val",
        "mut",      "auto",     "static",   "pub",      "struct",    "class",     "enum",
        "impl",     "trait",    "interface", "void",    "int",       "long",      "short",
        "char",     "float",    "double",   "bool",     "boolean",   "unsigned",  "signed",
        "string",   "str",      "sizeof",   "await",    "async",     "yield",     "lambda",
        "with",     "pass",     "global",   "nonlocal", "match",     "when",      "where",
        "go",       "defer",    "goto",     "final",    "public",    "private",   "protected",
        "extern",   "template", "using",    "namespace", "echo",     "assert",    "select",
        "unsafe",   "type",     "export",   "my",       "local",     "then",      "end",
        "begin",    "of"};
    return p;
}

} // namespace

Pattern make_pattern(const std::string &source) {
    return Pattern{source, std::regex(source, std::regex::ECMAScript | std::regex::optimize)};
}

ProfileRegistry ProfileRegistry::builtin() {
    ProfileRegistry registry;
    registry.add(python_profile());
    registry.add(c_profile());
    registry.add(cpp_profile());
    registry.add(rust_profile());
    registry.add(javascript_profile());
    registry.add(typescript_profile());
    registry.add(go_profile());
    registry.add(java_profile());
    registry.add(csharp_profile());
    registry.add(kotlin_profile());
    registry.add(swift_profile());
    registry.add(php_profile());
    registry.generic_ = generic_profile();
    return registry;
}

void ProfileRegistry::add(LanguageProfile profile) { profiles_.push_back(std::move(profile)); }

const LanguageProfile *ProfileRegistry::find_by_extension(const std::string &ext) const {
    std::string lower = ext;
    if (!lower.empty() && lower[0] == '.')
        lower.erase(0, 1);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto &profile : profiles_) {
        for (const auto &e : profile.extensions) {
            if (e == lower)
                return &profile;
        }
    }
    return nullptr;
}

const LanguageProfile &ProfileRegistry::find_for_path(const std::string &path) const {
    const LanguageProfile *profile = find_by_extension(extension_of(path));
    return profile ? *profile : generic_;
}

const LanguageProfile *ProfileRegistry::find_by_name(const std::string &name) const {
    for (const auto &profile : profiles_) {
        if (profile.name == name)
            return &profile;
    }
    return nullptr;
}

std::vector<std::string> ProfileRegistry::extensions() const {
    std::vector<std::string> all;
    for (const auto &profile : profiles_) {
        all.insert(all.end(), profile.extensions.begin(), profile.extensions.end());
    }
    return all;
}

std::string extension_of(const std::string &path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace codegraph
