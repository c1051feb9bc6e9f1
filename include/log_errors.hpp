/**
 * @file log_errors.hpp
 * @brief Exception types raised by the tagsink pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Configuration errors (bad tags in a subscription, bad templates, unopenable
 * files) are thrown from constructors. Per-emission errors are caught per
 * handler by the logger and reported on its fallback channel, with the
 * exception of invalid_tag_error raised while building an emission's tag set,
 * which reaches the caller before any handler runs.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace tagsink
{

/**
 * @brief Base class for all errors raised by tagsink
 */
class log_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Malformed tag token (empty, or containing whitespace), or a reserved dynamic name
class invalid_tag_error final : public log_error
{
  public:
    using log_error::log_error;
};

/// Unknown or positional placeholder, malformed format spec, failing tag transform
class template_error final : public log_error
{
  public:
    using log_error::log_error;
};

/// A destination could not be opened or written
class sink_write_error final : public log_error
{
  public:
    using log_error::log_error;
};

/// Call-site or exception capture failed; the emission continues without trace data
class trace_capture_error final : public log_error
{
  public:
    using log_error::log_error;
};

} // namespace tagsink
