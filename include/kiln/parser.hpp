#pragma once

#include "kiln/domain.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/** @brief Decides whether an import specifier, seen from `file_path`, names the DSL entry module. */
using EntryImportPredicate = std::function<bool(std::string_view file_path, std::string_view specifier)>;

struct AnalyzerOptions {
    EntryImportPredicate is_entry_import;
    std::string entry_binding = "gql"; ///< Imported name that makes a local binding a DSL namespace.
};

struct ParseError {
    std::string file_path;
    uint32_t line = 0;
    uint32_t column = 0;
    std::string message;
};

/**
 * @brief Extracts DSL definitions, imports and exports from one module.
 *
 * Implementations must agree on every field of every Definition for the same input; they
 * differ only in how they walk the source.
 */
class ParserAdapter {
public:
    virtual ~ParserAdapter() = default;

    virtual std::string_view name() const = 0;

    /**
     * @brief Analyzes `source`, the text of the module at `file_path`.
     * @return The module analysis, or the first syntax error. Never throws.
     */
    virtual std::expected<ModuleAnalysis, ParseError> analyze(std::string_view file_path,
                                                              std::string_view source) const = 0;
};

/** @brief Recursive-descent backend that builds a syntax tree and then visits it. */
std::unique_ptr<ParserAdapter> make_tree_adapter(AnalyzerOptions options);

/** @brief Single-pass backend that drives the path tracker straight from the token stream. */
std::unique_ptr<ParserAdapter> make_stream_adapter(AnalyzerOptions options);

/**
 * @brief Creates a backend by name ("tree" or "stream").
 * @return The adapter, or nullptr for an unknown name.
 */
std::unique_ptr<ParserAdapter> make_adapter(std::string_view name, AnalyzerOptions options);

const std::vector<std::string_view> &adapter_names();

} // namespace kiln
