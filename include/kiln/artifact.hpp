#pragma once

#include "kiln/domain.hpp"

#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

/** @brief Evaluated form of one definition, as handed to codegen. */
struct ElementResult {
    CanonicalId id;
    std::string file_path;
    std::string ast_path;
    std::string schema;
    std::string kind; ///< "fragment", "operation" or "unknown".
    std::string expression;
    std::optional<std::string> export_binding;
    std::vector<CanonicalId> dependencies;

    bool operator==(const ElementResult &) const = default;
};

struct CacheStats {
    size_t hits = 0;   ///< Nodes carried over from the previous build.
    size_t misses = 0; ///< Nodes from freshly analysed files.

    bool operator==(const CacheStats &) const = default;
};

struct BuildReport {
    std::map<std::string, size_t> definition_counts; ///< Elements per kind.
    CacheStats cache;
    std::vector<std::string> warnings;
    double duration_ms = 0;
};

struct Artifact {
    std::map<CanonicalId, ElementResult> elements;
    BuildReport report;
};

nlohmann::json artifact_to_json(const Artifact &artifact);

} // namespace kiln
