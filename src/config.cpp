#include "kiln/config.hpp"

#include "kiln/parser.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

Result<std::string> read_string(const json &doc, const char *key, std::string fallback) {
    if (!doc.contains(key))
        return fallback;
    if (!doc[key].is_string())
        return std::unexpected(std::format("'{}' must be a string", key));
    return doc[key].get<std::string>();
}

Result<std::vector<std::string>> read_patterns(const json &doc, const char *key) {
    std::vector<std::string> out;
    if (!doc.contains(key))
        return out;
    const json &value = doc[key];
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return out;
    }
    if (!value.is_array())
        return std::unexpected(std::format("'{}' must be a string or an array of strings", key));
    for (const auto &item : value) {
        if (!item.is_string())
            return std::unexpected(std::format("'{}' must contain only strings", key));
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::string BuilderConfig::cache_path() const {
    return absolute_path(cache_dir, root);
}

Result<Verbosity> parse_verbosity(std::string_view name) {
    if (name == "quiet")
        return Verbosity::Quiet;
    if (name == "normal")
        return Verbosity::Normal;
    if (name == "verbose")
        return Verbosity::Verbose;
    return std::unexpected(std::format("unknown verbosity '{}' (expected quiet, normal or verbose)", name));
}

Result<BuilderConfig> parse_config(std::string_view text, const std::string &root) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded())
        return std::unexpected("configuration is not valid JSON");
    if (!doc.is_object())
        return std::unexpected("configuration must be a JSON object");

    BuilderConfig config;
    config.root = normalize_path(root);

    if (!doc.contains("include"))
        return std::unexpected("'include' is required");
    auto include = read_patterns(doc, "include");
    if (!include)
        return std::unexpected(include.error());
    if (include->empty())
        return std::unexpected("'include' must not be empty");
    config.include = std::move(*include);

    auto exclude = read_patterns(doc, "exclude");
    if (!exclude)
        return std::unexpected(exclude.error());
    config.exclude = std::move(*exclude);

    struct Field {
        const char *key;
        std::string *target;
    };
    for (auto [key, target] : {Field{"analyzer", &config.analyzer}, Field{"graphqlSystem", &config.graphql_system},
                               Field{"graphqlSystemPath", &config.graphql_system_path},
                               Field{"entryBinding", &config.entry_binding}, Field{"cacheDir", &config.cache_dir}}) {
        auto value = read_string(doc, key, *target);
        if (!value)
            return std::unexpected(value.error());
        *target = std::move(*value);
    }

    if (!std::ranges::contains(adapter_names(), std::string_view(config.analyzer)))
        return std::unexpected(std::format("unknown analyzer '{}' (expected tree or stream)", config.analyzer));

    auto level = read_string(doc, "verbosity", "normal");
    if (!level)
        return std::unexpected(level.error());
    auto verbosity = parse_verbosity(*level);
    if (!verbosity)
        return std::unexpected(verbosity.error());
    config.verbosity = *verbosity;

    return config;
}

Result<BuilderConfig> load_config(const fs::path &path) {
    std::ifstream in(path);
    if (!in)
        return std::unexpected(std::format("cannot open {}", path.string()));
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec)
        return std::unexpected(std::format("cannot resolve {}: {}", path.string(), ec.message()));
    auto config = parse_config(buffer.str(), parent_path(normalize_path(absolute.generic_string())));
    if (!config)
        return std::unexpected(std::format("{}: {}", path.string(), config.error()));
    return config;
}

} // namespace kiln
