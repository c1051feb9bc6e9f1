/**
 * @file log_dispatcher.hpp
 * @brief Tag-routing logger
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The logger owns an ordered list of handlers plus a default handler. An
 * emission is delivered synchronously to every handler whose subscription
 * shares a tag with it, in configuration order, and to the default handler as
 * selected by default_delivery. A handler that fails to render or write is
 * reported on the fallback channel and skipped; the others still run.
 *
 * The logger is read-only once constructed, so emit() may be called from any
 * number of threads. Writers serialize their own output.
 */
#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <robin_hood.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"
#include "log_handler.hpp"
#include "log_site.hpp"
#include "log_tags.hpp"
#include "log_types.hpp"
#include "log_writers.hpp"

namespace tagsink
{

/**
 * @brief Logger construction parameters
 *
 * @code
 * logger log{{
 *     .handlers = {
 *         {.name = "debug", .tags = {"debug"}, .target = {.filename = "/tmp/debug.log"}},
 *         {.name = "db", .tags = {"sql", "blog", "warning"}, .target = {.to_stderr = true}},
 *     },
 *     .delivery = default_delivery::unmatched,
 * }};
 * @endcode
 */
struct logger_config
{
    std::vector<handler_config> handlers;
    handler_config default_handler = default_handler_config();
    default_delivery delivery       = default_delivery::always;

    std::shared_ptr<const trace_source> tracer;    ///< nullptr selects default_trace_source
    std::shared_ptr<log_writer> error_channel;     ///< nullptr selects the shared stderr writer
    std::function<log_clock::time_point()> clock; ///< nullptr selects log_wall_timestamp()
};

class logger;

/**
 * @brief Logger with a fixed tag set, callable with just a message
 *
 * @code
 * auto sql_warning = log.tagged("sql", "warning");
 * sql_warning("slow query");
 * sql_warning.format("{} rows scanned", rows);
 * @endcode
 */
class tagged_logger
{
  public:
    tagged_logger(const logger &log, tag_set tags) : logger_(&log), tags_(std::move(tags)) {}

    void operator()(std::string_view message) const;
    void operator()(std::string_view message, const call_site &site) const;

    template <typename... Args> void format(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        (*this)(fmt::format(fmt, std::forward<Args>(args)...));
    }

    const tag_set &tags() const noexcept { return tags_; }

  private:
    const logger *logger_;
    tag_set tags_;
};

class logger
{
  public:
    /// Names of logger operations that cannot be used as dynamic tag names
    static constexpr std::array<std::string_view, 7> RESERVED_NAMES = {
        "emit", "invoke", "tagged", "route", "handlers", "instance", "init"};

    /**
     * @throws invalid_tag_error, template_error, sink_write_error on bad handler declarations
     */
    explicit logger(logger_config config = {});

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    /**
     * @brief Emit with explicit tags: emit("x", "sql", "warning")
     *
     * No tags maps to {default}.
     *
     * @throws invalid_tag_error for a malformed tag, before any handler runs
     */
    template <TagLike... Tags> void emit(std::string_view message, Tags &&...tags) const
    {
        emit(message, tag_set{std::string_view(tags)...}, call_site{});
    }

    /**
     * @brief Emit with a prepared tag set and optional call site
     */
    void emit(std::string_view message, const tag_set &tags, const call_site &site = {}) const;

    /// Zero-tag call, tagged {default}
    void operator()(std::string_view message) const { emit(message, tag_set{}); }

    /**
     * @brief Dynamic-name emission: invoke("blog_sql_warning", msg)
     * @throws invalid_tag_error for reserved or malformed names
     */
    void invoke(std::string_view name, std::string_view message, const call_site &site = {}) const;

    /// Dynamic-name partial logger: log["general_info"]("msg")
    tagged_logger operator[](std::string_view name) const { return tagged_logger(*this, resolve_name(name)); }

    template <TagLike... Tags> tagged_logger tagged(Tags &&...tags) const
    {
        return tagged_logger(*this, tag_set{std::string_view(tags)...});
    }

    tagged_logger tagged(tag_set tags) const { return tagged_logger(*this, std::move(tags)); }

    /**
     * @brief Tag set for a dynamic name
     *
     * Splits on TAG_NAME_DELIMITER and drops a leading "emit" verb, so
     * "emit_general_info" and "general_info" both yield {general, info}.
     *
     * @throws invalid_tag_error if the name is a RESERVED_NAMES entry or yields no tags
     */
    static tag_set resolve_name(std::string_view name);

    /// Indices into handlers() of the handlers subscribed to any of @p tags, in order
    std::vector<size_t> route(const tag_set &tags) const;

    /// Build the emission record: default tag, timestamp, trace capture
    emission make_emission(std::string_view message, const tag_set &tags, const call_site &site) const;

    const std::vector<log_handler> &handlers() const noexcept { return handlers_; }
    const log_handler &default_handler() const noexcept { return default_; }
    default_delivery delivery() const noexcept { return delivery_; }

    /**
     * @brief Process-wide logger
     *
     * Constructed with the default configuration on first use unless init()
     * ran first.
     */
    static logger &instance();

    /**
     * @brief Construct the process-wide logger; call once at startup
     * @throws std::logic_error if it already exists
     */
    static logger &init(logger_config config);

  private:
    void deliver(const log_handler &handler, const emission &em) const noexcept;
    void report(std::string_view text) const noexcept;

    std::vector<log_handler> handlers_;
    log_handler default_;
    default_delivery delivery_;
    std::shared_ptr<const trace_source> tracer_;
    std::shared_ptr<log_writer> error_channel_;
    std::function<log_clock::time_point()> clock_;
    robin_hood::unordered_map<std::string, std::vector<size_t>> index_; ///< tag -> subscribed handler indices
};

} // namespace tagsink
