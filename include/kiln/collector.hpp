#pragma once

#include "kiln/domain.hpp"
#include "kiln/lexer.hpp"
#include "kiln/parser.hpp"
#include "kiln/path_tracker.hpp"
#include "kiln/syntax_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace kiln {

/** @brief Module-level declarations found by the top-level pre-pass. */
struct ModuleDeclarations {
    std::vector<ModuleImport> imports;
    std::vector<size_t> import_tokens; ///< Token of each import's local name, parallel to `imports`.
    std::vector<ModuleExport> exports;
    std::vector<std::string> root_bindings; ///< Top-level variable, function, class and enum names.
};

/**
 * @brief Reads import/export declarations and top-level binding names.
 *
 * Only statements at the module's top level are inspected; nested groups are skipped whole.
 */
ModuleDeclarations read_module_declarations(const TokenStream &ts);

/** @brief Token positions of one qualifying `NAMESPACE.MEMBER(factory)` call. */
struct CallSite {
    size_t ns;    ///< The namespace identifier.
    size_t open;  ///< '(' of the argument list.
    size_t close; ///< ')' of the argument list.
};

/**
 * @brief Backend-independent half of module analysis.
 *
 * Parser backends walk the source, drive `paths()` with scope events and hand every
 * qualifying call to `record()`. Everything derived from token ranges (expression text,
 * dependency refs, export flags, diagnostics) is computed here so both backends agree by
 * construction.
 */
class ModuleCollector {
public:
    ModuleCollector(const TokenStream &ts, std::string_view file_path, const AnalyzerOptions &options);

    /** @brief True if `name` is a local binding of the DSL entry import. */
    bool is_namespace(std::string_view name) const {
        return namespaces_.contains(std::string(name));
    }

    PathTracker &paths() {
        return paths_;
    }

    /** @brief Registers a definition, unless the call sits in a class field initializer. */
    void record(const CallSite &site);

    ModuleAnalysis finish();

private:
    struct Pending {
        CallSite site;
        RegisteredPath path;
    };

    std::vector<std::string> collect_refs(const Pending &pending) const;
    std::vector<Diagnostic> call_diagnostics() const;
    std::optional<Diagnostic> check_arguments(size_t ns, size_t open) const;

    const TokenStream &ts_;
    std::string file_path_;
    ModuleDeclarations decls_;
    std::unordered_set<std::string> namespaces_;
    std::vector<Diagnostic> import_diagnostics_;
    PathTracker paths_;
    std::vector<Pending> pending_;
    std::unordered_set<uint32_t> class_fields_;
    std::vector<Diagnostic> class_field_diagnostics_;
};

/**
 * @brief Index after the postfix chain following a call's ')' at `close`: member accesses,
 * further calls, index expressions, tagged templates and non-null assertions.
 */
size_t skip_postfix_chain(const TokenStream &ts, size_t close);

/** @brief Text of a property key token with string quotes removed. */
std::string_view key_text(const Token &tok);

/** @brief True for tokens that can name an object or class member. */
bool is_key_token(const Token &tok);

/**
 * @brief True if token `i` is a member modifier (`static`, `get`, `async`, ...) rather than
 * the member's key. `in_class` enables the class-only modifiers.
 */
bool is_member_modifier(const TokenStream &ts, size_t i, bool in_class);

/** @brief True for `[key: T]` index signatures at `open`. */
bool is_index_signature(const TokenStream &ts, size_t open);

/** @brief Index after a parameter list at `open` and its optional return type annotation. */
size_t after_signature(const TokenStream &ts, size_t open);

/** @brief Enables JSX lexing for .tsx and .jsx files. */
bool is_jsx_path(std::string_view file_path);

ParseError to_parse_error(std::string_view file_path, const LexError &err);
ParseError to_parse_error(std::string_view file_path, const TokenStream &ts, const SyntaxError &err);

/** @brief Upper-case code name ("MISSING_ARGUMENT"). */
std::string_view diagnostic_code_name(DiagnosticCode code);

} // namespace kiln
