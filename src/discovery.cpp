#include "kiln/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln {

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos)
            slash = path.size();
        out.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

// `*` and `?` inside one segment.
bool match_segment(std::string_view pattern, std::string_view text) {
    size_t p = 0, t = 0;
    size_t star = std::string_view::npos, resume = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

bool match_from(const std::vector<std::string_view> &pattern, size_t pi, const std::vector<std::string_view> &path,
                size_t si) {
    if (pi == pattern.size())
        return si == path.size();
    if (pattern[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (match_from(pattern, pi + 1, path, k))
                return true;
        }
        return false;
    }
    return si < path.size() && match_segment(pattern[pi], path[si]) && match_from(pattern, pi + 1, path, si + 1);
}

bool has_wildcard(std::string_view segment) {
    return segment.find_first_of("*?") != std::string_view::npos;
}

// Directory to walk for an expanded absolute pattern: its leading wildcard-free segments.
std::string walk_base(std::string_view pattern) {
    auto segments = split_segments(pattern);
    std::string base;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (has_wildcard(segments[i]))
            break;
        if (i > 0)
            base += '/';
        base += segments[i];
    }
    return base.empty() ? std::string("/") : base;
}

std::vector<std::string> absolute_patterns(const std::vector<std::string> &patterns, const std::string &root,
                                           bool strip_negation) {
    std::vector<std::string> out;
    for (std::string_view pattern : patterns) {
        if (strip_negation && pattern.starts_with('!'))
            pattern.remove_prefix(1);
        for (auto &expanded : expand_braces(pattern))
            out.push_back(absolute_path(expanded, root));
    }
    return out;
}

} // namespace

std::vector<std::string> expand_braces(std::string_view pattern) {
    size_t open = pattern.find('{');
    if (open == std::string_view::npos)
        return {std::string(pattern)};

    int depth = 0;
    size_t close = std::string_view::npos;
    std::vector<size_t> commas;
    for (size_t i = open; i < pattern.size(); ++i) {
        if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}') {
            if (--depth == 0) {
                close = i;
                break;
            }
        } else if (pattern[i] == ',' && depth == 1) {
            commas.push_back(i);
        }
    }
    if (close == std::string_view::npos)
        return {std::string(pattern)};

    std::string_view head = pattern.substr(0, open);
    std::string_view tail = pattern.substr(close + 1);
    std::vector<std::string> out;
    size_t start = open + 1;
    commas.push_back(close);
    for (size_t comma : commas) {
        std::string_view option = pattern.substr(start, comma - start);
        for (auto &expanded : expand_braces(std::format("{}{}{}", head, option, tail)))
            out.push_back(std::move(expanded));
        start = comma + 1;
    }
    return out;
}

bool glob_match(std::string_view pattern, std::string_view path) {
    auto path_segments = split_segments(path);
    for (const auto &expanded : expand_braces(pattern)) {
        if (match_from(split_segments(expanded), 0, path_segments, 0))
            return true;
    }
    return false;
}

GlobEntryResolver::GlobEntryResolver(std::string root, std::vector<std::string> include, std::vector<std::string> exclude)
    : root_(normalize_path(root)), include_(std::move(include)), exclude_(std::move(exclude)) {
}

Result<std::vector<std::string>> GlobEntryResolver::resolve() const {
    if (include_.empty())
        return std::unexpected("no include patterns configured");

    auto excludes = absolute_patterns(exclude_, root_, true);
    auto excluded = [&](const std::string &path) {
        return std::ranges::any_of(excludes, [&](const std::string &pattern) { return glob_match(pattern, path); });
    };

    std::set<std::string> found;
    for (const auto &pattern : absolute_patterns(include_, root_, false)) {
        std::error_code ec;
        if (std::ranges::none_of(split_segments(pattern), has_wildcard)) {
            if (fs::is_regular_file(pattern, ec) && !excluded(pattern))
                found.insert(pattern);
            continue;
        }

        std::string base = walk_base(pattern);
        if (!fs::is_directory(base, ec))
            continue;
        for (auto it = fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code stat_ec;
            if (!it->is_regular_file(stat_ec))
                continue;
            std::string path = normalize_path(it->path().generic_string());
            if (glob_match(pattern, path) && !excluded(path))
                found.insert(path);
        }
        if (ec)
            log(Verbosity::Verbose, "entry resolver: stopped walking {}: {}", base, ec.message());
    }

    if (found.empty())
        return std::unexpected(std::format("no files matched the include patterns under {}", root_));
    return std::vector<std::string>(found.begin(), found.end());
}

} // namespace kiln
