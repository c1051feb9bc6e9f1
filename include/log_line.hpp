/**
 * @file log_line.hpp
 * @brief Represents a single log message under construction
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <iterator>
#include <memory>
#include <string_view>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_site.hpp"
#include "log_tags.hpp"
#include "log_types.hpp"

namespace tagsink
{

class logger;

/**
 * @brief Collects message text for one emission and emits it on destruction
 *
 * Created by the TLOG() macros, which also record the call site. Tags are
 * validated when the line is created, so a malformed tag throws before any
 * text is collected.
 *
 * @code
 * TLOG(log, "sql", "warning") << "query took " << ms << "ms";
 * TLOG(log, "net").format("{} bytes from {}", n, peer);
 * @endcode
 */
class log_line
{
  public:
    log_line() = delete;

    log_line(const logger &log, call_site site, tag_set tags) : logger_(&log), site_(site), tags_(std::move(tags)) {}

    log_line(log_line &&other) noexcept
    : logger_(std::exchange(other.logger_, nullptr)),
      site_(other.site_),
      tags_(std::move(other.tags_)),
      text_(std::move(other.text_)),
      flushed_(other.flushed_)
    {
    }

    log_line(const log_line &)            = delete;
    log_line &operator=(const log_line &) = delete;
    log_line &operator=(log_line &&)      = delete;

    ~log_line();

    /// Emit what has been collected so far; later text starts a new emission
    log_line &flush();

    log_line &print(std::string_view str)
    {
        text_.append(str.data(), str.data() + str.size());
        return *this;
    }

    template <typename... Args> log_line &format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        fmt::format_to(std::back_inserter(text_), fmt, std::forward<Args>(args)...);
        return *this;
    }

    // Generic version for any formattable type
    template <typename T>
        requires Loggable<T>
    log_line &operator<<(const T &value)
    {
        fmt::format_to(std::back_inserter(text_), "{}", value);
        return *this;
    }

    template <typename T> log_line &operator<<(T *ptr)
    {
        if (ptr == nullptr) { print("nullptr"); }
        else { fmt::format_to(std::back_inserter(text_), "{}", static_cast<const void *>(ptr)); }
        return *this;
    }

    log_line &operator<<(std::string_view str) { return print(str); }
    log_line &operator<<(const char *str) { return print(str ? std::string_view(str) : std::string_view("nullptr")); }
    log_line &operator<<(const std::string &str) { return print(str); }

    template <typename T> log_line &operator<<(const std::shared_ptr<T> &ptr)
    {
        if (ptr) { fmt::format_to(std::back_inserter(text_), "{}", static_cast<const void *>(ptr.get())); }
        else { print("nullptr"); }
        return *this;
    }

    log_line &operator<<(log_line &(*func)(log_line &)) { return func(*this); }

    const tag_set &tags() const noexcept { return tags_; }
    const call_site &site() const noexcept { return site_; }
    std::string_view text() const noexcept { return {text_.data(), text_.size()}; }

  private:
    const logger *logger_;
    call_site site_;
    tag_set tags_;
    fmt::memory_buffer text_;
    bool flushed_ = false; ///< endl ran; the destructor emits only text collected after it
};

/**
 * @brief Stream manipulator that emits the line immediately
 *
 * @code
 * TLOG(log, "startup") << "config loaded" << endl;
 * @endcode
 */
inline log_line &endl(log_line &line) { return line.flush(); }

} // namespace tagsink
