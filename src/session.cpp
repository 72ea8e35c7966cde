#include "kiln/session.hpp"

#include "kiln/canonical_id.hpp"
#include "kiln/collector.hpp"
#include "kiln/lazy.hpp"
#include "kiln/resolver.hpp"
#include "kiln/utility.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <ranges>

namespace kiln {

namespace {

using Element = LazyElement<ElementResult>;

std::vector<ModuleImport> runtime_imports(const ModuleAnalysis &module) {
    std::vector<ModuleImport> out;
    for (const auto &imp : module.imports) {
        if (!imp.is_type_only)
            out.push_back(imp);
    }
    return out;
}

BuilderConfig with_absolute_root(BuilderConfig config) {
    if (!is_absolute_path(config.root)) {
        std::error_code ec;
        std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (!ec)
            config.root = absolute_path(config.root, cwd.generic_string());
    }
    return config;
}

} // namespace

BuilderSession::BuilderSession(BuilderConfig config, SessionServices services)
    : config_(with_absolute_root(std::move(config))), services_(std::move(services)), tracker_(config_.cache_path()) {
    if (!services_.adapter) {
        std::string system_path =
            config_.graphql_system_path.empty() ? std::string() : absolute_path(config_.graphql_system_path, config_.root);
        AnalyzerOptions options{.is_entry_import = make_entry_predicate(config_.graphql_system, system_path),
                                .entry_binding = config_.entry_binding};
        services_.adapter = make_adapter(config_.analyzer, options);
        if (!services_.adapter)
            services_.adapter = make_tree_adapter(std::move(options));
    }
    if (!services_.entries)
        services_.entries = std::make_shared<GlobEntryResolver>(config_.root, config_.include, config_.exclude);
    if (!services_.reader)
        services_.reader = std::make_shared<MappedSourceReader>();
    if (!services_.evaluator)
        services_.evaluator = make_summary_evaluator();
}

std::expected<Artifact, BuildError> BuilderSession::artifact() const {
    if (!artifact_)
        return std::unexpected(
            BuildError{.code = BuildError::Code::NoArtifact, .message = "no build has completed in this session"});
    return *artifact_;
}

SessionSnapshot BuilderSession::snapshot() const {
    return {.node_count = graph_.size(), .module_count = modules_.size(), .has_artifact = artifact_.has_value()};
}

void BuilderSession::reset() {
    graph_.clear();
    index_.clear();
    modules_.clear();
    artifact_.reset();
}

BuilderSession::Analysed BuilderSession::analyse(const std::set<std::string> &paths) const {
    Analysed out;
    for (const auto &path : paths) {
        log(Verbosity::Verbose, "reprocessing {}", path);
        auto source = services_.reader->read(path);
        if (!source) {
            out.failed.insert(path);
            out.warnings.push_back(std::format("{}: cannot read: {}", path, source.error()));
            continue;
        }
        auto analysis = services_.adapter->analyze(path, source->text);
        if (!analysis) {
            const ParseError &err = analysis.error();
            out.failed.insert(path);
            out.warnings.push_back(std::format("{}:{}:{}: {}", err.file_path, err.line, err.column, err.message));
            continue;
        }
        analysis->file_path = path;
        out.fresh.insert_or_assign(path, std::move(*analysis));
    }
    return out;
}

GraphPatch BuilderSession::make_patch(const std::map<std::string, ModuleAnalysis> &modules, const Analysed &analysed,
                                      const std::set<std::string> &removed) const {
    GraphPatch patch;
    patch.removed_modules.assign(removed.begin(), removed.end());

    ModuleResolver resolver(modules);
    for (const auto &[path, module] : modules) {
        bool is_fresh = analysed.fresh.contains(path);
        std::vector<ModuleImport> imports = runtime_imports(module);
        std::set<CanonicalId> live;

        for (const auto &def : module.definitions) {
            GraphNode node{
                .id = encode_canonical_id(path, def.ast_path),
                .file_path = path,
                .dependencies = resolver.dependencies(module, def),
                .summary = {.definition = def, .runtime_imports = imports},
            };
            live.insert(node.id);
            if (!is_fresh) {
                auto old = graph_.find(node.id);
                if (old != graph_.end() && old->second == node)
                    continue;
            }
            patch.upsert_nodes.push_back(std::move(node));
        }

        if (is_fresh) {
            if (auto bucket = index_.find(path); bucket != index_.end()) {
                for (const auto &id : bucket->second) {
                    if (!live.contains(id))
                        patch.removed_nodes.push_back(id);
                }
            }
            patch.module_summaries.emplace(
                path, ModuleSummary{.file_path = path, .imports = module.imports, .exports = module.exports});
        }
    }
    return patch;
}

std::expected<std::map<CanonicalId, ElementResult>, BuildError> BuilderSession::evaluate(const Graph &graph,
                                                                                         BuildMode mode) const {
    std::map<CanonicalId, std::shared_ptr<Element>> elements;
    ElementEvaluator &evaluator = *services_.evaluator;

    for (const auto &[id, node] : graph) {
        const GraphNode *current = &node;
        auto deps = [&elements, current] {
            std::vector<std::shared_ptr<LazyNode>> out;
            for (const auto &dep : current->dependencies) {
                if (auto it = elements.find(dep); it != elements.end())
                    out.push_back(it->second);
            }
            return out;
        };
        auto factory = [&elements, &evaluator, current]() -> FactoryResult<ElementResult> {
            std::vector<ElementResult> inputs;
            for (const auto &dep : current->dependencies) {
                if (auto it = elements.find(dep); it != elements.end())
                    inputs.push_back(*it->second->cached());
            }
            return evaluator.evaluate(*current, inputs);
        };
        elements.emplace(id, std::make_shared<Element>(id, std::move(factory), std::move(deps)));
    }

    // Dependencies before dependents.
    auto order = topo_sort(graph);
    if (!order)
        return std::unexpected(BuildError{.code = BuildError::Code::CircularDependency, .message = order.error()});

    std::map<CanonicalId, ElementResult> out;
    for (const auto &id : *order) {
        Element &element = *elements.at(id);
        auto value = mode == BuildMode::Sync ? evaluate_sync(element) : evaluate_async(element);
        if (!value) {
            const EvaluationError &err = value.error();
            BuildError::Code code = err.kind == EvaluationError::Kind::WouldSuspend ? BuildError::Code::WouldSuspend
                                                                                     : BuildError::Code::EvaluationFailed;
            return std::unexpected(BuildError{
                .code = code, .file_path = graph.at(id).file_path, .canonical_id = id, .message = err.message});
        }
        out.emplace(id, std::move(*value));
    }
    return out;
}

std::expected<Artifact, BuildError> BuilderSession::build(const BuildOptions &options) {
    auto started = std::chrono::steady_clock::now();

    FileTrackerState previous = options.force ? FileTrackerState{} : tracker_.load_state();

    auto candidates = services_.entries->resolve();
    if (!candidates)
        return std::unexpected(BuildError{.code = BuildError::Code::EntryResolution, .message = candidates.error()});
    for (auto &path : *candidates) {
        path = absolute_path(path, config_.root);
        if (!is_absolute_path(path))
            return std::unexpected(BuildError{.code = BuildError::Code::EntryResolution,
                                              .file_path = path,
                                              .message = std::format("entry {} does not resolve to an absolute path", path)});
    }

    FileTrackerState current = tracker_.scan(*candidates);
    FileDiff diff = FileTracker::detect_changes(previous, current);

    // Files the tracker considers unchanged but this session has never analysed still need work.
    std::set<std::string> to_analyse = diff.added;
    to_analyse.insert(diff.updated.begin(), diff.updated.end());
    std::set<std::string> removed = diff.removed;
    for (const auto &path : current.files | std::views::keys) {
        if (options.force || !modules_.contains(path))
            to_analyse.insert(path);
    }
    for (const auto &path : modules_ | std::views::keys) {
        if (!current.files.contains(path))
            removed.insert(path);
    }

    if (to_analyse.empty() && removed.empty() && artifact_) {
        log(Verbosity::Verbose, "no changes, reusing the previous artifact");
        return *artifact_;
    }

    Analysed analysed = analyse(to_analyse);

    std::map<std::string, ModuleAnalysis> modules = modules_;
    for (const auto &path : removed)
        modules.erase(path);
    for (const auto &[path, module] : analysed.fresh)
        modules.insert_or_assign(path, module);

    GraphPatch patch = make_patch(modules, analysed, removed);
    Graph graph = graph_;
    Index index = index_;
    apply_patch(graph, index, patch);

    std::vector<std::string> warnings = std::move(analysed.warnings);
    for (const auto &[path, module] : modules) {
        for (const Diagnostic &d : module.diagnostics)
            warnings.push_back(std::format("{}:{}:{}: [{}] {}", path, d.location.line, d.location.column,
                                           diagnostic_code_name(d.code), d.message));
    }
#ifndef NDEBUG
    if (auto consistent = check_index(graph, index); !consistent)
        warnings.push_back(std::format("internal: {}", consistent.error()));
#endif

    if (auto cycle = find_cycle(graph)) {
        std::string chain;
        for (const auto &id : *cycle)
            chain += chain.empty() ? id : std::format(" -> {}", id);
        return std::unexpected(BuildError{.code = BuildError::Code::CircularDependency,
                                          .file_path = graph.at(cycle->front()).file_path,
                                          .canonical_id = cycle->front(),
                                          .message = std::format("circular dependency: {}", chain)});
    }

    auto elements = evaluate(graph, options.mode);
    if (!elements)
        return std::unexpected(elements.error());

    Artifact artifact;
    artifact.elements = std::move(*elements);
    for (const auto &[id, element] : artifact.elements) {
        ++artifact.report.definition_counts[element.kind];
        if (analysed.fresh.contains(element.file_path))
            ++artifact.report.cache.misses;
        else
            ++artifact.report.cache.hits;
    }

    // Failed files are retried next time: new ones stay untracked, known ones keep their old entry.
    for (const auto &path : analysed.failed) {
        if (auto old = previous.files.find(path); old != previous.files.end() && modules.contains(path))
            current.files.insert_or_assign(path, old->second);
        else
            current.files.erase(path);
    }
    if (auto persisted = tracker_.persist(current); !persisted)
        warnings.push_back(std::format("cannot persist file tracker: {}", persisted.error()));

    for (const auto &warning : warnings)
        log(Verbosity::Normal, "warning: {}", warning);
    artifact.report.warnings = std::move(warnings);
    artifact.report.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    graph_ = std::move(graph);
    index_ = std::move(index);
    modules_ = std::move(modules);
    artifact_ = artifact;
    return artifact;
}

} // namespace kiln
