#include "kiln/errors.hpp"

#include <format>

namespace kiln {

std::string_view to_string(BuildError::Code code) {
    switch (code) {
    case BuildError::Code::EntryResolution:
        return "ENTRY_RESOLUTION";
    case BuildError::Code::CircularDependency:
        return "CIRCULAR_DEPENDENCY";
    case BuildError::Code::EvaluationFailed:
        return "EVALUATION_FAILED";
    case BuildError::Code::WouldSuspend:
        return "WOULD_SUSPEND";
    case BuildError::Code::NoArtifact:
        return "NO_ARTIFACT";
    }
    return "UNKNOWN";
}

std::string format_error(const BuildError &error) {
    std::string out = std::format("[{}] {}", to_string(error.code), error.message);
    if (error.canonical_id)
        out += std::format(" (at {})", *error.canonical_id);
    else if (!error.file_path.empty())
        out += std::format(" (in {})", error.file_path);
    return out;
}

} // namespace kiln
