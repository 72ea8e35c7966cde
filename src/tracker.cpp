#include "kiln/tracker.hpp"

#include "kiln/utility.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

double mtime_ms(fs::file_time_type time) {
    auto sys = std::chrono::clock_cast<std::chrono::system_clock>(time);
    return std::chrono::duration<double, std::milli>(sys.time_since_epoch()).count();
}

Result<FileTrackerState> from_json(const json &doc) {
    if (!doc.is_object() || !doc.contains("version") || !doc.contains("files"))
        return std::unexpected("missing version or files");
    if (!doc["version"].is_number_integer() || doc["version"].get<int>() != FILE_TRACKER_VERSION)
        return std::unexpected(std::format("unsupported version {}", doc["version"].dump()));
    const json &files = doc["files"];
    if (!files.is_object())
        return std::unexpected("files is not an object");

    FileTrackerState state;
    for (const auto &[path, entry] : files.items()) {
        if (!entry.is_object() || !entry.contains("mtimeMs") || !entry.contains("size") ||
            !entry["mtimeMs"].is_number() || !entry["size"].is_number_unsigned())
            return std::unexpected(std::format("malformed entry for {}", path));
        state.files.emplace(path, FileMetadata{.mtime_ms = entry["mtimeMs"].get<double>(),
                                               .size = entry["size"].get<uint64_t>()});
    }
    return state;
}

json to_json(const FileTrackerState &state) {
    json files = json::object();
    for (const auto &[path, meta] : state.files)
        files[path] = {{"mtimeMs", meta.mtime_ms}, {"size", meta.size}};
    return {{"version", state.version}, {"files", std::move(files)}};
}

} // namespace

bool is_empty(const FileDiff &diff) {
    return diff.added.empty() && diff.updated.empty() && diff.removed.empty();
}

FileTracker::FileTracker(fs::path cache_dir)
    : cache_dir_(std::move(cache_dir)), state_path_(cache_dir_ / FILE_TRACKER_FILE) {
}

FileTrackerState FileTracker::load_state() const {
    std::ifstream in(state_path_);
    if (!in) {
        log(Verbosity::Verbose, "file tracker: no state at {}, starting empty", state_path_.string());
        return {};
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        log(Verbosity::Verbose, "file tracker: {} is not valid JSON, starting empty", state_path_.string());
        return {};
    }
    auto state = from_json(doc);
    if (!state) {
        log(Verbosity::Verbose, "file tracker: ignoring {}: {}", state_path_.string(), state.error());
        return {};
    }
    return std::move(*state);
}

FileTrackerState FileTracker::scan(const std::vector<std::string> &paths) const {
    FileTrackerState state;
    for (const auto &path : paths) {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::is_regular_file(status))
            continue;
        auto size = fs::file_size(path, ec);
        if (ec)
            continue;
        auto time = fs::last_write_time(path, ec);
        if (ec)
            continue;
        state.files.insert_or_assign(normalize_path(path), FileMetadata{.mtime_ms = mtime_ms(time), .size = size});
    }
    return state;
}

FileDiff FileTracker::detect_changes(const FileTrackerState &previous, const FileTrackerState &current) {
    FileDiff diff;
    for (const auto &[path, meta] : current.files) {
        auto it = previous.files.find(path);
        if (it == previous.files.end())
            diff.added.insert(path);
        else if (it->second != meta)
            diff.updated.insert(path);
    }
    for (const auto &[path, meta] : previous.files) {
        if (!current.files.contains(path))
            diff.removed.insert(path);
    }
    return diff;
}

Result<void> FileTracker::persist(const FileTrackerState &state) const {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec)
        return std::unexpected(std::format("cannot create {}: {}", cache_dir_.string(), ec.message()));

    fs::path temp = cache_dir_ / std::format("{}.{}.tmp", FILE_TRACKER_FILE, ::getpid());
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out)
            return std::unexpected(std::format("cannot open {} for writing", temp.string()));
        out << to_json(state).dump(2);
        if (!out.flush()) {
            out.close();
            fs::remove(temp, ec);
            return std::unexpected(std::format("failed writing {}", temp.string()));
        }
    }

    fs::rename(temp, state_path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return std::unexpected(std::format("cannot replace {}: {}", state_path_.string(), ec.message()));
    }
    log(Verbosity::Verbose, "file tracker: wrote {} entries to {}", state.files.size(), state_path_.string());
    return {};
}

} // namespace kiln
