/**
 * @file fmt_config.hpp
 * @brief Configuration for the fmt library used by tagsink
 *
 * tagsink is header-only and uses fmt in header-only mode. The named
 * argument store and the chrono formatters are pulled in here so every
 * header renders through the same configuration.
 */
#pragma once

// Enable fmt header-only mode
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/args.h>   // dynamic_format_arg_store for named placeholders
#include <fmt/chrono.h> // strftime-style date and time specs
#include <fmt/ranges.h> // fmt::join
