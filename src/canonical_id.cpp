#include "kiln/canonical_id.hpp"

#include <format>
#include <stdexcept>

namespace kiln {

CanonicalId encode_canonical_id(std::string_view file_path, std::string_view ast_path) {
    if (!is_absolute_path(file_path))
        throw std::logic_error(std::format("canonical id requires an absolute path, got '{}'", file_path));
    return std::format("{}{}{}", normalize_path(file_path), CANONICAL_ID_SEPARATOR, ast_path);
}

Result<CanonicalIdParts> decode_canonical_id(std::string_view id) {
    size_t sep = id.find(CANONICAL_ID_SEPARATOR);
    if (sep == std::string_view::npos || sep == 0)
        return std::unexpected(std::format("malformed canonical id '{}'", id));
    return CanonicalIdParts{
        .file_path = std::string(id.substr(0, sep)),
        .ast_path = std::string(id.substr(sep + CANONICAL_ID_SEPARATOR.size())),
    };
}

} // namespace kiln
