#pragma once

#include "kiln/domain.hpp"
#include "kiln/parser.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/** @brief Extensions tried, in order, when a specifier names a module without one. */
inline constexpr std::string_view MODULE_EXTENSIONS[] = {".ts", ".tsx", ".js", ".jsx"};

/** @brief Candidate files for a relative specifier: exact, with extensions, then `/index.*`. */
std::vector<std::string> specifier_candidates(std::string_view from_file, std::string_view specifier);

/** @brief Root binding of an ast path: "user.fields#2" -> "user". */
std::string_view root_segment(std::string_view ast_path);

/**
 * @brief Resolves imports and dependency refs across a set of analysed modules.
 *
 * Only relative specifiers resolve; package imports never name a project module.
 */
class ModuleResolver {
public:
    explicit ModuleResolver(const std::map<std::string, ModuleAnalysis> &modules);

    /** @brief The known module a specifier refers to from `from_file`, if any. */
    std::optional<std::string> resolve(std::string_view from_file, std::string_view specifier) const;

    /** @brief Ids exported under `name` by `file_path`, following re-exports. */
    std::vector<CanonicalId> exported(const std::string &file_path, const std::string &name) const;

    /**
     * @brief Canonical ids named by a definition's dependency refs.
     *
     * A ref to an import follows it to the exporting module; a ref to a top-level binding of
     * the same module names every definition rooted at that binding. `self` is left out and
     * the result keeps first-occurrence order without duplicates.
     */
    std::vector<CanonicalId> dependencies(const ModuleAnalysis &module, const Definition &definition) const;

private:
    using ExportTable = std::map<std::string, std::vector<CanonicalId>>;

    void build_export_tables();

    const std::map<std::string, ModuleAnalysis> &modules_;
    std::map<std::string, std::map<std::string, std::vector<CanonicalId>>> local_roots_; ///< file -> root -> ids
    std::map<std::string, ExportTable> exports_;
};

/**
 * @brief Default predicate for DSL entry imports.
 *
 * Accepts `alias` verbatim and, for relative specifiers, any spelling that resolves to
 * `system_path` with or without one of the module extensions.
 */
EntryImportPredicate make_entry_predicate(std::string alias, std::string system_path);

} // namespace kiln
