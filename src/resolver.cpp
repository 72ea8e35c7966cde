#include "kiln/resolver.hpp"

#include "kiln/canonical_id.hpp"
#include "kiln/utility.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace kiln {

namespace {

void append_unique(std::vector<CanonicalId> &out, std::set<CanonicalId> &seen, const std::vector<CanonicalId> &ids) {
    for (const auto &id : ids) {
        if (seen.insert(id).second)
            out.push_back(id);
    }
}

bool is_relative(std::string_view specifier) {
    return specifier == "." || specifier == ".." || specifier.starts_with("./") || specifier.starts_with("../");
}

} // namespace

std::vector<std::string> specifier_candidates(std::string_view from_file, std::string_view specifier) {
    std::vector<std::string> out;
    if (!is_relative(specifier))
        return out;
    std::string base = absolute_path(specifier, parent_path(normalize_path(from_file)));
    out.push_back(base);
    for (std::string_view ext : MODULE_EXTENSIONS)
        out.push_back(std::format("{}{}", base, ext));
    for (std::string_view ext : MODULE_EXTENSIONS)
        out.push_back(std::format("{}/index{}", base, ext));
    return out;
}

std::string_view root_segment(std::string_view ast_path) {
    std::string_view root = ast_path.substr(0, ast_path.find('.'));
    return root.substr(0, root.find('#'));
}

ModuleResolver::ModuleResolver(const std::map<std::string, ModuleAnalysis> &modules) : modules_(modules) {
    for (const auto &[file_path, module] : modules_) {
        auto &roots = local_roots_[file_path];
        for (const auto &def : module.definitions)
            roots[std::string(root_segment(def.ast_path))].push_back(encode_canonical_id(file_path, def.ast_path));
    }
    build_export_tables();
}

std::optional<std::string> ModuleResolver::resolve(std::string_view from_file, std::string_view specifier) const {
    for (auto &candidate : specifier_candidates(from_file, specifier)) {
        if (modules_.contains(candidate))
            return candidate;
    }
    return std::nullopt;
}

void ModuleResolver::build_export_tables() {
    for (const auto &[file_path, module] : modules_) {
        ExportTable &table = exports_[file_path];
        const auto &roots = local_roots_[file_path];
        for (const auto &exp : module.exports) {
            if (exp.kind != ExportKind::Named || exp.is_type_only || !exp.local)
                continue;
            if (auto it = roots.find(*exp.local); it != roots.end())
                table[exp.exported] = it->second;
        }
    }

    // Re-exports may chain through several modules; iterate until nothing changes.
    for (size_t pass = 0; pass <= modules_.size(); ++pass) {
        bool changed = false;
        for (const auto &[file_path, module] : modules_) {
            ExportTable &table = exports_[file_path];
            for (const auto &exp : module.exports) {
                if (exp.kind != ExportKind::Reexport || exp.is_type_only || !exp.source)
                    continue;
                auto target = resolve(file_path, *exp.source);
                if (!target || *target == file_path)
                    continue;
                const ExportTable &source_table = exports_[*target];

                auto merge = [&](const std::string &name, const std::vector<CanonicalId> &ids) {
                    auto &slot = table[name];
                    if (slot != ids) {
                        slot = ids;
                        changed = true;
                    }
                };

                if (exp.exported == "*") {
                    for (const auto &[name, ids] : source_table) {
                        if (name != "default")
                            merge(name, ids);
                    }
                } else if (exp.local && *exp.local == "*") {
                    std::vector<CanonicalId> all;
                    std::set<CanonicalId> seen;
                    for (const auto &[name, ids] : source_table)
                        append_unique(all, seen, ids);
                    merge(exp.exported, all);
                } else if (auto it = source_table.find(exp.local.value_or(exp.exported)); it != source_table.end()) {
                    merge(exp.exported, it->second);
                }
            }
        }
        if (!changed)
            break;
    }
}

std::vector<CanonicalId> ModuleResolver::exported(const std::string &file_path, const std::string &name) const {
    auto table = exports_.find(file_path);
    if (table == exports_.end())
        return {};
    auto it = table->second.find(name);
    return it == table->second.end() ? std::vector<CanonicalId>{} : it->second;
}

std::vector<CanonicalId> ModuleResolver::dependencies(const ModuleAnalysis &module, const Definition &definition) const {
    const std::string &file_path = module.file_path;
    CanonicalId self = encode_canonical_id(file_path, definition.ast_path);

    std::vector<CanonicalId> out;
    std::set<CanonicalId> seen{self};

    for (const auto &ref : definition.dependency_refs) {
        auto imp = std::find_if(module.imports.begin(), module.imports.end(),
                                [&](const ModuleImport &i) { return i.local == ref && !i.is_type_only; });
        if (imp != module.imports.end()) {
            auto target = resolve(file_path, imp->source);
            if (!target)
                continue;
            if (imp->kind == ImportKind::Namespace) {
                if (auto table = exports_.find(*target); table != exports_.end()) {
                    for (const auto &[name, ids] : table->second)
                        append_unique(out, seen, ids);
                }
            } else {
                append_unique(out, seen, exported(*target, imp->imported));
            }
            continue;
        }

        auto roots = local_roots_.find(file_path);
        if (roots == local_roots_.end())
            continue;
        if (auto it = roots->second.find(ref); it != roots->second.end())
            append_unique(out, seen, it->second);
    }
    return out;
}

EntryImportPredicate make_entry_predicate(std::string alias, std::string system_path) {
    std::string target = system_path.empty() ? std::string() : normalize_path(system_path);
    std::string stem = target;
    for (std::string_view ext : MODULE_EXTENSIONS) {
        if (stem.ends_with(ext)) {
            stem.resize(stem.size() - ext.size());
            break;
        }
    }
    if (stem.ends_with("/index"))
        stem.resize(stem.size() - 6);

    return [alias = std::move(alias), target, stem](std::string_view file_path, std::string_view specifier) {
        if (!alias.empty() && specifier == alias)
            return true;
        if (target.empty() || !is_relative(specifier))
            return false;
        for (const auto &candidate : specifier_candidates(file_path, specifier)) {
            if (candidate == target || candidate == stem)
                return true;
        }
        return false;
    };
}

} // namespace kiln
