#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kiln {

/** @brief What a graph node remembers about its definition and module. */
struct NodeSummary {
    Definition definition;
    std::vector<ModuleImport> runtime_imports; ///< Non-type-only imports of the owning module.

    bool operator==(const NodeSummary &) const = default;
};

/** @brief A definition in the dependency graph. */
struct GraphNode {
    CanonicalId id;
    std::string file_path;
    std::vector<CanonicalId> dependencies; ///< Ids this definition references, in reference order.
    NodeSummary summary;

    bool operator==(const GraphNode &) const = default;
};

/** @brief Import and export tables of one analysed module. */
struct ModuleSummary {
    std::string file_path;
    std::vector<ModuleImport> imports;
    std::vector<ModuleExport> exports;
};

/** @brief Id -> node. Ordered so iteration is deterministic. */
using Graph = std::map<CanonicalId, GraphNode>;

/** @brief File path -> ids declared in that file. */
using Index = std::map<std::string, std::set<CanonicalId>>;

/**
 * @brief One incremental change to a Graph and its Index.
 *
 * `module_summaries` is carried for the owner of the module table; apply_patch() ignores it.
 */
struct GraphPatch {
    std::vector<std::string> removed_modules;
    std::vector<CanonicalId> removed_nodes;
    std::vector<GraphNode> upsert_nodes;
    std::map<std::string, ModuleSummary> module_summaries;
};

/**
 * @brief Applies `patch` in three passes: whole modules are dropped first, then single
 * nodes, then upserts. The index is updated alongside the graph in every pass.
 */
void apply_patch(Graph &graph, Index &index, const GraphPatch &patch);

/** @brief Builds the file index from scratch. */
Index rebuild_index(const Graph &graph);

/**
 * @brief Verifies that `index` is exactly the index of `graph`.
 * @return An error naming the first inconsistency.
 */
Result<void> check_index(const Graph &graph, const Index &index);

/**
 * @brief Finds a dependency cycle.
 *
 * Dependencies on ids absent from the graph are ignored.
 *
 * @return The ids along the cycle, first id repeated at the end, or nothing.
 */
std::optional<std::vector<CanonicalId>> find_cycle(const Graph &graph);

/** @brief Ids in dependency order (dependencies first). Fails on a cycle. */
Result<std::vector<CanonicalId>> topo_sort(const Graph &graph);

} // namespace kiln
