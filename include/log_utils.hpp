/**
 * @file log_utils.hpp
 * @brief Common string utilities for the tagsink logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tagsink
{

namespace detail
{

inline bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string to_upper(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

/**
 * @brief Strip leading and trailing whitespace
 */
inline std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

/**
 * @brief Case-insensitive equality for ASCII tokens
 */
inline bool iequals(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() &&
           std::equal(a.begin(),
                      a.end(),
                      b.begin(),
                      [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

/**
 * @brief Keep the last @p keep_parts path components after the filename
 *
 * keep_parts = 0 yields the basename ("/dev/app/src/main.cpp" -> "main.cpp"),
 * keep_parts = 1 yields "src/main.cpp".
 */
template <size_t N, int KeepParts = 0> constexpr const char *get_path_suffix(const char (&path)[N])
{
    int total_separators = 0;
    for (size_t i = 0; i < N && path[i]; ++i)
    {
        if (path[i] == '/' || path[i] == '\\') { total_separators++; }
    }

    int skip_separators = total_separators - KeepParts;
    if (skip_separators <= 0) { return path; }

    const char *result = path;
    int skipped        = 0;
    for (size_t i = 0; i < N && path[i]; ++i)
    {
        if (path[i] == '/' || path[i] == '\\')
        {
            skipped++;
            if (skipped == skip_separators)
            {
                result = &path[i + 1];
                break;
            }
        }
    }

    return result;
}

/**
 * @brief Runtime variant of get_path_suffix() for paths that are not literals
 */
inline std::string_view path_basename(std::string_view path) noexcept
{
    auto pos = path.find_last_of("/\\");
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace detail

} // namespace tagsink
