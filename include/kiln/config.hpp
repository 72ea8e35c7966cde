#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

inline constexpr std::string_view CONFIG_FILE = "kiln.config.json";

struct BuilderConfig {
    std::string root;                 ///< Absolute project root; relative settings resolve against it.
    std::vector<std::string> include; ///< Entry globs.
    std::vector<std::string> exclude;
    std::string analyzer = "tree";
    std::string graphql_system = "@/graphql-system"; ///< Import alias of the DSL entry module.
    std::string graphql_system_path;                 ///< Path of the DSL entry module, relative to root.
    std::string entry_binding = "gql";
    std::string cache_dir = ".cache/kiln";
    Verbosity verbosity = Verbosity::Normal;

    /** @brief `cache_dir` resolved against `root`. */
    std::string cache_path() const;
};

Result<Verbosity> parse_verbosity(std::string_view name);

/**
 * @brief Parses configuration JSON. `root` becomes BuilderConfig::root.
 *
 * `include` is required; unknown `analyzer` or `verbosity` values are errors.
 */
Result<BuilderConfig> parse_config(std::string_view text, const std::string &root);

/** @brief Reads and parses a configuration file; its directory is the project root. */
Result<BuilderConfig> load_config(const std::filesystem::path &path);

} // namespace kiln
