#pragma once

#include "kiln/utility.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief Matches a normalized path against a glob.
 *
 * `*` and `?` never cross a '/', `**` spans any number of whole segments and `{a,b}`
 * alternates (nesting allowed).
 */
bool glob_match(std::string_view pattern, std::string_view path);

/** @brief Expands `{a,b}` groups: "src/*.{ts,tsx}" -> {"src/*.ts", "src/*.tsx"}. */
std::vector<std::string> expand_braces(std::string_view pattern);

/** @brief Produces the absolute paths of every candidate source file. */
class EntryResolver {
public:
    virtual ~EntryResolver() = default;

    /** @return Sorted, normalized absolute paths, or an error if nothing matched. */
    virtual Result<std::vector<std::string>> resolve() const = 0;
};

/**
 * @brief Resolves include/exclude globs relative to a project root by walking the file system.
 *
 * A leading '!' on an exclude pattern is ignored.
 */
class GlobEntryResolver final : public EntryResolver {
public:
    GlobEntryResolver(std::string root, std::vector<std::string> include, std::vector<std::string> exclude = {});

    Result<std::vector<std::string>> resolve() const override;

private:
    std::string root_;
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

} // namespace kiln
