/**
 * @file log_site.hpp
 * @brief Call-site description, trace capture and the emission record
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * An emission carrying the reserved "trace" tag gets a trace_info: the file,
 * line and function of the call site, and the text of the exception being
 * handled if the emission happens inside a catch block. Capture goes through
 * the trace_source interface so environments without call-site metadata can
 * plug in null_trace_source.
 */
#pragma once

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

#if defined(__GNUG__)
    #include <cxxabi.h>
#endif

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"
#include "log_tags.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"

namespace tagsink
{

/**
 * @brief Source location of a logging call
 *
 * Filled in by the TLOG() family of macros. A default-constructed call_site
 * means the location is unknown; its trace items render empty.
 */
struct call_site
{
    const char *file     = nullptr; ///< Source file (basename when captured by TLOG)
    uint32_t line        = 0;       ///< Line number, 0 if unknown
    const char *function = nullptr; ///< Enclosing function (__func__)

    bool known() const noexcept { return file != nullptr || line != 0 || function != nullptr; }
};

/**
 * @brief Trace data attached to an emission tagged "trace"
 */
struct trace_info
{
    std::string file;           ///< Empty if unknown
    uint32_t line = 0;          ///< 0 if unknown
    std::string module;         ///< Enclosing routine, empty if unknown
    std::string exception_text; ///< Pending exception chain, empty outside a catch block

    bool has_location() const noexcept { return !file.empty() || line != 0 || !module.empty(); }
};

/**
 * @brief One logging event as seen by handlers
 */
struct emission
{
    std::string message;
    tag_set tags;                   ///< Never empty; {default} when the caller gave none
    log_clock::time_point timestamp;
    std::optional<trace_info> trace; ///< Present only when tags contain "trace"
};

/**
 * @brief Capability that fills trace_info for an emission
 *
 * Implementations may throw trace_capture_error; the logger then continues
 * with an empty trace.
 */
class trace_source
{
  public:
    virtual ~trace_source() = default;

    virtual trace_info capture(const call_site &site) const = 0;
};

namespace detail
{

inline std::string demangle(const char *name)
{
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) { return demangled.get(); }
#endif
    return name;
}

inline void describe_exception(std::exception_ptr ep, std::string &out, int depth)
{
    if (!ep) return;

    std::string_view lead = depth == 0 ? "  " : "  caused by ";
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception &e)
    {
        fmt::format_to(std::back_inserter(out), "{}{}: {}\n", lead, demangle(typeid(e).name()), e.what());
        try
        {
            std::rethrow_if_nested(e);
        }
        catch (...)
        {
            describe_exception(std::current_exception(), out, depth + 1);
        }
    }
    catch (...)
    {
        fmt::format_to(std::back_inserter(out), "{}non-standard exception\n", lead);
    }
}

} // namespace detail

/**
 * @brief Render an exception and its std::nested_exception chain
 *
 * @code
 * Exception (most recent call first):
 *   std::runtime_error: query failed
 *   caused by std::system_error: connection reset
 * @endcode
 *
 * @return Text without a trailing newline, or an empty string for a null pointer
 */
inline std::string format_exception(std::exception_ptr ep)
{
    if (!ep) return {};

    std::string out = "Exception (most recent call first):\n";
    detail::describe_exception(ep, out, 0);
    if (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

/**
 * @brief Trace source backed by the macro-captured call site and std::current_exception()
 */
class default_trace_source final : public trace_source
{
  public:
    trace_info capture(const call_site &site) const override
    {
        trace_info info;
        if (site.file) info.file = std::string(detail::path_basename(site.file));
        info.line = site.line;
        if (site.function) info.module = site.function;
        info.exception_text = format_exception(std::current_exception());
        return info;
    }
};

/**
 * @brief Trace source for environments that cannot supply trace data
 */
class null_trace_source final : public trace_source
{
  public:
    trace_info capture(const call_site &) const override { return {}; }
};

} // namespace tagsink
