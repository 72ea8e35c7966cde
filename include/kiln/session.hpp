#pragma once

#include "kiln/artifact.hpp"
#include "kiln/config.hpp"
#include "kiln/discovery.hpp"
#include "kiln/errors.hpp"
#include "kiln/evaluator.hpp"
#include "kiln/graph.hpp"
#include "kiln/parser.hpp"
#include "kiln/source.hpp"
#include "kiln/tracker.hpp"

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kiln {

enum class BuildMode : uint8_t {
    Async, ///< Wait for pending values.
    Sync,  ///< Fail as soon as a value would have to be waited for.
};

struct BuildOptions {
    bool force = false; ///< Ignore persisted tracker state and reanalyse every file.
    BuildMode mode = BuildMode::Async;
};

struct SessionSnapshot {
    size_t node_count = 0;
    size_t module_count = 0;
    bool has_artifact = false;
};

/** @brief Collaborators of a session. Null members are replaced by the defaults built from config. */
struct SessionServices {
    std::shared_ptr<ParserAdapter> adapter;
    std::shared_ptr<EntryResolver> entries;
    std::shared_ptr<SourceReader> reader;
    std::shared_ptr<ElementEvaluator> evaluator;
};

/**
 * @brief Incremental builder.
 *
 * Each build() rescans the entry files, reanalyses only what changed since the last
 * successful build, patches the dependency graph and evaluates every definition. Session state
 * and the persisted tracker are only updated when the whole build succeeds.
 */
class BuilderSession {
public:
    explicit BuilderSession(BuilderConfig config, SessionServices services = {});

    std::expected<Artifact, BuildError> build(const BuildOptions &options = {});

    /** @brief The artifact of the last successful build, or NoArtifact. */
    std::expected<Artifact, BuildError> artifact() const;

    SessionSnapshot snapshot() const;

    /** @brief Drops the in-memory graph, module table and cached artifact. */
    void reset();

    const Graph &graph() const {
        return graph_;
    }
    const Index &index() const {
        return index_;
    }

private:
    struct Analysed {
        std::map<std::string, ModuleAnalysis> fresh;
        std::set<std::string> failed;
        std::vector<std::string> warnings;
    };

    Analysed analyse(const std::set<std::string> &paths) const;

    GraphPatch make_patch(const std::map<std::string, ModuleAnalysis> &modules, const Analysed &analysed,
                          const std::set<std::string> &removed) const;

    std::expected<std::map<CanonicalId, ElementResult>, BuildError> evaluate(const Graph &graph,
                                                                             BuildMode mode) const;

    BuilderConfig config_;
    SessionServices services_;
    FileTracker tracker_;

    Graph graph_;
    Index index_;
    std::map<std::string, ModuleAnalysis> modules_;
    std::optional<Artifact> artifact_;
};

} // namespace kiln
