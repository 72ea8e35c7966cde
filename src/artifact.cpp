#include "kiln/artifact.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kiln {

nlohmann::json artifact_to_json(const Artifact &artifact) {
    json elements = json::object();
    for (const auto &[id, element] : artifact.elements) {
        json entry = {
            {"id", element.id},
            {"filePath", element.file_path},
            {"astPath", element.ast_path},
            {"schema", element.schema},
            {"kind", element.kind},
            {"expression", element.expression},
            {"dependencies", element.dependencies},
        };
        if (element.export_binding)
            entry["exportBinding"] = *element.export_binding;
        elements[id] = std::move(entry);
    }

    json counts = json::object();
    for (const auto &[kind, count] : artifact.report.definition_counts)
        counts[kind] = count;

    return {
        {"elements", std::move(elements)},
        {"report",
         {
             {"definitionCounts", std::move(counts)},
             {"cache", {{"hits", artifact.report.cache.hits}, {"misses", artifact.report.cache.misses}}},
             {"warnings", artifact.report.warnings},
             {"durationMs", artifact.report.duration_ms},
         }},
    };
}

} // namespace kiln
