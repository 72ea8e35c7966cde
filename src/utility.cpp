#include "kiln/utility.hpp"

#include <atomic>
#include <cctype>
#include <filesystem>

namespace kiln {

namespace {
std::atomic<Verbosity> g_verbosity{Verbosity::Normal};
} // namespace

Verbosity verbosity() {
    return g_verbosity.load(std::memory_order_relaxed);
}

void set_verbosity(Verbosity level) {
    g_verbosity.store(level, std::memory_order_relaxed);
}

std::string normalize_path(std::string_view path) {
    std::string raw(path);
    for (char &c : raw) {
        if (c == '\\')
            c = '/';
    }
    if (raw.empty())
        return raw;

    std::string out = std::filesystem::path(raw).lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/' && !(out.size() == 3 && out[1] == ':'))
        out.pop_back();
    return out;
}

bool is_absolute_path(std::string_view path) {
    if (path.starts_with('/'))
        return true;
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
           (path[2] == '/' || path[2] == '\\');
}

std::string absolute_path(std::string_view path, std::string_view base) {
    if (is_absolute_path(path))
        return normalize_path(path);
    std::string joined(base);
    if (!joined.empty() && joined.back() != '/')
        joined += '/';
    joined += path;
    return normalize_path(joined);
}

std::string parent_path(std::string_view path) {
    size_t slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return ".";
    if (slash == 0)
        return "/";
    return std::string(path.substr(0, slash));
}

} // namespace kiln
