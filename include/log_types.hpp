/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <chrono>
#include <concepts>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_utils.hpp"

namespace tagsink
{

// Reserved tags
inline constexpr std::string_view DEFAULT_TAG = "default"; // synthesized when an emission carries no tags
inline constexpr std::string_view TRACE_TAG   = "trace";   // requests call-site and exception capture

// Dynamic-name sugar
inline constexpr char TAG_NAME_DELIMITER = '_';    // "blog_sql_warning" -> {blog, sql, warning}
inline constexpr std::string_view EMIT_VERB = "emit"; // leading verb token dropped from dynamic names

// Fallback channel prefix for per-handler failure reports
inline constexpr std::string_view ERROR_REPORT_PREFIX = "tagsink: ";

/**
 * @brief Concept for types that can be streamed into a log line
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Concept for arguments accepted as explicit tags
 */
template <typename T>
concept TagLike = std::convertible_to<T, std::string_view>;

/**
 * @brief Whether the default handler sees an emission in addition to matching handlers
 */
enum class default_delivery : int8_t
{
    always    = 0, ///< Every emission also goes to the default handler
    unmatched = 1, ///< Only emissions no user handler subscribed to
    never     = 2, ///< The default handler is suppressed
};

/**
 * @brief Convert string to default_delivery
 * @param str Policy name (case insensitive)
 * @return Corresponding policy, or default_delivery::always if unrecognized
 *
 * Recognized values: "always", "unmatched", "fallback", "never", "off", "none"
 */
inline default_delivery default_delivery_from_string(const char *str)
{
    if (!str) return default_delivery::always;

    std::string lower = detail::to_lower(str);

    if (lower == "unmatched" || lower == "fallback") return default_delivery::unmatched;
    if (lower == "never" || lower == "off" || lower == "none") return default_delivery::never;

    return default_delivery::always;
}

/**
 * @brief Convert default_delivery to string
 */
inline const char *string_from_default_delivery(default_delivery policy)
{
    switch (policy)
    {
    case default_delivery::always: return "always";
    case default_delivery::unmatched: return "unmatched";
    case default_delivery::never: return "never";
    default: return "unknown";
    }
}

/// Clock used for emission timestamps; date and time items need wall-clock time
using log_clock = std::chrono::system_clock;

} // namespace tagsink

// Platform-specific wall clock
#if defined(__linux__)
    #include <time.h>

inline tagsink::log_clock::time_point log_wall_timestamp()
{
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);

    auto duration = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return tagsink::log_clock::time_point(std::chrono::duration_cast<tagsink::log_clock::duration>(duration));
}

#else
inline tagsink::log_clock::time_point log_wall_timestamp() { return tagsink::log_clock::now(); }
#endif
