#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <string>
#include <string_view>

namespace kiln {

inline constexpr std::string_view CANONICAL_ID_SEPARATOR = "::";

struct CanonicalIdParts {
    std::string file_path;
    std::string ast_path;
};

/**
 * @brief Builds the identity of a definition from its file and ast path.
 *
 * The file path is normalized (separators, `.` and `..`) before joining, so every spelling of
 * the same absolute path yields the same id.
 *
 * @throws std::logic_error if `file_path` is not absolute.
 */
CanonicalId encode_canonical_id(std::string_view file_path, std::string_view ast_path);

/** @brief Splits an id at its first separator. */
Result<CanonicalIdParts> decode_canonical_id(std::string_view id);

} // namespace kiln
