#pragma once

#include <cstdint>
#include <cstdio>
#include <expected>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace kiln {

template <typename T>
using Result = std::expected<T, std::string>;

enum class Verbosity : uint8_t { Quiet, Normal, Verbose };

/** @brief Global diagnostic level used by log(). Defaults to Normal. */
Verbosity verbosity();
void set_verbosity(Verbosity level);

/**
 * @brief Prints a diagnostic line to stderr if `level` is enabled.
 */
template <typename... Args>
void log(Verbosity level, std::format_string<Args...> fmt, Args &&...args) {
    if (level == Verbosity::Quiet || level > verbosity())
        return;
    std::println(stderr, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Normalizes a path lexically: backslashes become '/', "." and ".." segments are
 * collapsed and a trailing separator is dropped. No filesystem access.
 */
std::string normalize_path(std::string_view path);

/** @brief True for POSIX-absolute paths and Windows drive paths ("C:/..."). */
bool is_absolute_path(std::string_view path);

/**
 * @brief Resolves `path` against `base` (when relative) and normalizes the result.
 */
std::string absolute_path(std::string_view path, std::string_view base);

/** @brief Directory part of a normalized path ("/a/b.ts" -> "/a"). */
std::string parent_path(std::string_view path);

} // namespace kiln
