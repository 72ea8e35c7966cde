#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace kiln {

inline constexpr int FILE_TRACKER_VERSION = 1;
inline constexpr std::string_view FILE_TRACKER_FILE = "file-tracker.json";

struct FileTrackerState {
    int version = FILE_TRACKER_VERSION;
    FileMap files;

    bool operator==(const FileTrackerState &) const = default;
};

/** @brief Paths that appeared, changed or disappeared between two scans. Always disjoint. */
struct FileDiff {
    std::set<std::string> added;
    std::set<std::string> updated;
    std::set<std::string> removed;
};

bool is_empty(const FileDiff &diff);

/**
 * @brief Remembers size and mtime of every source file across restarts.
 *
 * State lives in `<cache_dir>/file-tracker.json`.
 */
class FileTracker {
public:
    explicit FileTracker(std::filesystem::path cache_dir);

    /**
     * @brief Reads the persisted state.
     *
     * A missing, corrupt or version-mismatched file yields an empty state; this is not an error.
     */
    FileTrackerState load_state() const;

    /** @brief Stats each path. Paths that do not exist are left out. */
    FileTrackerState scan(const std::vector<std::string> &paths) const;

    static FileDiff detect_changes(const FileTrackerState &previous, const FileTrackerState &current);

    /**
     * @brief Writes `state` atomically (temporary file in the cache directory, then rename).
     */
    Result<void> persist(const FileTrackerState &state) const;

    const std::filesystem::path &state_path() const {
        return state_path_;
    }

private:
    std::filesystem::path cache_dir_;
    std::filesystem::path state_path_;
};

} // namespace kiln
