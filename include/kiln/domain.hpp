#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

/** @brief Opaque identity of a definition: "<absolute file path>::<ast path>". */
using CanonicalId = std::string;

struct SourceLocation {
    uint32_t line = 0;
    uint32_t column = 0;

    bool operator==(const SourceLocation &) const = default;
};

/** @brief One recognized DSL call site plus its structural metadata. */
struct Definition {
    std::string ast_path;
    bool is_top_level = false;
    bool is_exported = false;
    std::optional<std::string> export_binding;
    std::string expression;
    std::vector<std::string> dependency_refs; ///< Imported or top-level bindings referenced by the call.
    std::string schema;                       ///< MEMBER of `NAMESPACE.MEMBER(factory)`.
    SourceLocation location;

    bool operator==(const Definition &) const = default;
};

enum class ImportKind : uint8_t { Named, Default, Namespace };

struct ModuleImport {
    std::string source;
    std::string imported; ///< "default" and "*" for default and namespace imports.
    std::string local;
    ImportKind kind = ImportKind::Named;
    bool is_type_only = false;

    bool operator==(const ModuleImport &) const = default;
};

enum class ExportKind : uint8_t { Named, Reexport };

struct ModuleExport {
    ExportKind kind = ExportKind::Named;
    std::string exported;
    std::optional<std::string> local;
    std::optional<std::string> source;
    bool is_type_only = false;

    bool operator==(const ModuleExport &) const = default;
};

enum class DiagnosticCode : uint8_t {
    DefaultImport,       ///< `import gql from "<entry>"`
    StarImport,          ///< `import * as system from "<entry>"`
    NonMemberCallee,     ///< `gql(...)`
    OptionalChaining,    ///< `gql?.default(...)`
    ComputedProperty,    ///< `gql["default"](...)`
    DynamicCallee,       ///< `(x || gql).default(...)`
    MissingArgument,     ///< `gql.default()`
    SpreadArgument,      ///< `gql.default(...args)`
    InvalidArgumentType, ///< First argument is not a function literal.
    ExtraArguments,      ///< `gql.default(factory, extra)`
    ClassProperty,       ///< Call inside a class field initializer; never recorded.
};

enum class Severity : uint8_t { Warning, Error };

/** @brief A use of the DSL namespace that the analyzer saw but did not accept. */
struct Diagnostic {
    DiagnosticCode code = DiagnosticCode::NonMemberCallee;
    Severity severity = Severity::Error;
    SourceLocation location;
    std::string message;

    bool operator==(const Diagnostic &) const = default;
};

/** @brief Everything a parser backend extracts from one module. */
struct ModuleAnalysis {
    std::string file_path;
    std::vector<Definition> definitions;
    std::vector<ModuleImport> imports;
    std::vector<ModuleExport> exports;
    std::vector<Diagnostic> diagnostics; ///< Import problems first, then calls in source order, then class fields.
};

struct FileMetadata {
    double mtime_ms = 0;
    uint64_t size = 0;

    bool operator==(const FileMetadata &) const = default;
};

using FileMap = std::map<std::string, FileMetadata>;

} // namespace kiln
