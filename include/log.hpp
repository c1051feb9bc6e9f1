/**
 * @file log.hpp
 * @brief Tag-based logging: handlers subscribe to tags instead of levels
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging system provides:
 * - Free-form tags on every emission instead of a fixed severity ladder
 * - Handlers subscribing to any-of tag sets, each with its own format and target
 * - A three-stage template formatter (item, item group, line)
 * - Call-site and exception capture for emissions tagged "trace"
 * - Per-handler failure isolation with a stderr fallback channel
 * - Shared, individually locked writers for files, stdout and stderr
 *
 * Basic Usage:
 * @code
 * logger log{{
 *     .handlers = {
 *         {.name = "debug", .tags = {"debug"}, .target = {.filename = "/tmp/debug.log"}},
 *         {.name = "db", .tags = {"sql", "blog", "warning"}, .target = {.to_stderr = true}},
 *     },
 * }};
 *
 * log("Hello World");              // tags {default}, stdout only
 * log.emit("x", "debug");          // debug.log and stdout
 * log.emit("slow", "blog", "sql"); // stderr once, and stdout
 * @endcode
 *
 * With the defaults a handler line looks like
 * @code
 * [2025-03-14 09:26:53][SQL,WARNING] : slow query
 * @endcode
 * and the default path (stdout) drops the date:
 * @code
 * [DEFAULT] : Hello World
 * @endcode
 *
 * Tag Sets From Names:
 * @code
 * // Runtime adapter: the name is split on '_', a leading "emit" is the verb
 * log.invoke("blog_sql_warning", "slow query");
 * log["emit_general_info"]("started");       // tags {general, info}
 *
 * // Bound partial logger for call sites that always use the same tags
 * auto audit = log.tagged("audit", "security");
 * audit("login from 10.0.0.7");
 * audit.format("{} failed attempts", count);
 * @endcode
 *
 * Call-Site Capture:
 * @code
 * // TLOG() records file, line and function; with the "trace" tag they are rendered
 * TLOG(log, "db", "trace") << "retrying " << attempt;
 * // [2025-03-14 09:26:53]store.cpp:88[DB,TRACE] : retrying 2
 *
 * // Identifier form of the dynamic-name sugar
 * TLOG_NAMED(log, blog_sql_warning) << "slow query";
 *
 * try { connect(); }
 * catch (const std::exception &) {
 *     // The pending exception chain is appended after the message
 *     TLOG(log, "net", "trace") << "connect failed";
 * }
 * @endcode
 *
 * Formatter Configuration:
 * @code
 * handler_config audit{
 *     .name      = "audit",
 *     .tags      = {"audit"},
 *     .target    = {.filename = "/var/log/audit.log"},
 *     .formatter = {
 *         .tag_formatter   = [](std::string_view t) { return std::string(t); },
 *         .tag_delimiter   = " ",
 *         .prefix_template = "{datetime} {handler} {tags}{trace} ",
 *         .utc             = true,
 *     },
 * };
 * @endcode
 *
 * Default Delivery:
 * - default_delivery::always: every emission also reaches the default handler (default)
 * - default_delivery::unmatched: only emissions no handler subscribed to
 * - default_delivery::never: the default handler is off
 *
 * Process-Wide Logger:
 * @code
 * int main() {
 *     logger::init({.handlers = load_handlers()}); // once, before any TLOG_DEFAULT
 *     TLOG_DEFAULT("startup") << "ready";
 * }
 * @endcode
 * logger::instance() builds a logger with the default configuration if init()
 * has not run.
 *
 * Error Handling:
 * - Bad subscription tags, bad templates and unopenable files throw from the
 *   logger constructor
 * - A malformed tag at emission time throws invalid_tag_error before any handler runs
 * - A handler that fails to render or write is reported on the fallback channel
 *   (stderr unless logger_config::error_channel is set) and the remaining
 *   handlers still receive the emission
 * - Trace capture failures degrade to an empty trace
 *
 * Thread Safety:
 * - A logger is immutable after construction; emit() may run concurrently
 * - Each writer serializes its own writes, so lines never interleave within a sink
 * - Targets naming the same file share one writer and one lock
 * - emit() returns after every write completes
 */
#pragma once

#include "fmt_config.hpp"         // IWYU pragma: keep
#include "log_types.hpp"          // IWYU pragma: keep
#include "log_errors.hpp"         // IWYU pragma: keep
#include "log_tags.hpp"           // IWYU pragma: keep
#include "log_site.hpp"           // IWYU pragma: keep
#include "log_template.hpp"       // IWYU pragma: keep
#include "log_formatters.hpp"     // IWYU pragma: keep
#include "log_writers.hpp"        // IWYU pragma: keep
#include "log_sink.hpp"           // IWYU pragma: keep
#include "log_sinks.hpp"          // IWYU pragma: keep
#include "log_handler.hpp"        // IWYU pragma: keep
#include "log_version.hpp"        // IWYU pragma: keep
#include "log_line.hpp"           // IWYU pragma: keep
#include "log_dispatcher.hpp"     // IWYU pragma: keep

/**
 * @brief Source file basename at compile time ("/src/app/db/store.cpp" -> "store.cpp")
 */
#define file_source() ::tagsink::detail::get_path_suffix(__FILE__)

/**
 * @brief call_site for the current location
 */
#define TLOG_SITE ::tagsink::call_site{file_source(), __LINE__, __func__}

/**
 * @brief Log line with explicit tags and the current call site
 *
 * @param _logger A tagsink::logger
 * @param ... Tags as string literals or string views; none means {default}
 *
 * @code
 * TLOG(log, "sql", "warning") << "slow query: " << elapsed_ms << "ms";
 * TLOG(log).format("{} jobs queued", jobs.size()); // {default}
 * @endcode
 */
#define TLOG(_logger, ...) ::tagsink::log_line((_logger), TLOG_SITE, ::tagsink::tag_set{__VA_ARGS__})

/**
 * @brief Log line whose tags are spelled as an identifier
 *
 * @code
 * TLOG_NAMED(log, blog_sql_warning) << "slow query"; // tags {blog, sql, warning}
 * @endcode
 */
#define TLOG_NAMED(_logger, _name) ::tagsink::log_line((_logger), TLOG_SITE, ::tagsink::logger::resolve_name(#_name))

/**
 * @brief TLOG() on the process-wide logger
 */
#define TLOG_DEFAULT(...) TLOG(::tagsink::logger::instance() __VA_OPT__(, ) __VA_ARGS__)

#include "log_line_impl.hpp"       // IWYU pragma: keep
#include "log_dispatcher_impl.hpp" // IWYU pragma: keep
