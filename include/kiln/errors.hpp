#pragma once

#include "kiln/domain.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kiln {

/** @brief Fatal failure of a build. */
struct BuildError {
    enum class Code : uint8_t {
        EntryResolution,
        CircularDependency,
        EvaluationFailed,
        WouldSuspend,
        NoArtifact,
    };

    Code code = Code::EvaluationFailed;
    std::string file_path; ///< Empty if not tied to a file.
    std::optional<CanonicalId> canonical_id;
    std::string message;
};

std::string_view to_string(BuildError::Code code);

/** @brief One-line human-readable rendering: "[CODE] message (at id)". */
std::string format_error(const BuildError &error);

} // namespace kiln
