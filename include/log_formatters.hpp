/**
 * @file log_formatters.hpp
 * @brief Three-stage prefix formatter (item, item group, line)
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A handler renders every accepted emission as prefix + message. The prefix
 * is produced in three stages, each driven by templates from
 * formatter_options:
 *
 * 1. Items: each tag (tag_formatter, then tag_template), the date
 *    (date_format, then date_template), the time, and the trace file, line
 *    and module.
 * 2. Item groups: tags joined with tag_delimiter into tags_template, date and
 *    time into datetime_template, trace items into trace_template.
 * 3. Line: prefix_template over {datetime}, {tags}, {trace} and {handler}.
 *
 * With the defaults an emission tagged {sql, warning} renders as
 * @code
 * [2025-03-14 09:26:53][SQL,WARNING] :
 * @endcode
 *
 * Rendering is a pure function of the emission and the options.
 */
#pragma once

#include <ctime>
#include <functional>
#include <string>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"
#include "log_site.hpp"
#include "log_tags.hpp"
#include "log_template.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"

namespace tagsink
{

/// Per-tag transform applied before tag_template
using tag_transform = std::function<std::string(std::string_view)>;

/// Default tag transform: trim and uppercase
inline std::string upper_trim_tag(std::string_view tag) { return detail::to_upper(detail::trim(tag)); }

/**
 * @brief Formatter configuration; every option has a default
 *
 * @code
 * formatter_options opts{
 *     .tag_delimiter   = "|",
 *     .prefix_template = "{datetime} {tags} {handler}> ",
 *     .utc             = true,
 * };
 * @endcode
 */
struct formatter_options
{
    std::string tag_template    = "{tag}";
    tag_transform tag_formatter = upper_trim_tag;
    std::string tag_delimiter   = ",";

    std::string date_template = "{date}";
    std::string date_format   = "%Y-%m-%d";
    std::string time_template = "{time}";
    std::string time_format   = "%H:%M:%S";

    std::string file_template   = "{file}";
    std::string line_template   = ":{line}";
    std::string module_template = ":{module}";

    std::string tags_template     = "[{tags}]";
    std::string datetime_template = "[{date} {time}]";
    std::string trace_template    = "{file}{line}";

    std::string prefix_template = "{datetime}{trace}{tags} : "; ///< The top-level "template" option

    bool utc = false; ///< Render date and time in UTC instead of local time
};

class prefix_formatter
{
  public:
    /**
     * @throws template_error if any template or strftime pattern is invalid
     */
    explicit prefix_formatter(formatter_options options = {})
    : tag_formatter_(options.tag_formatter ? std::move(options.tag_formatter) : tag_transform(upper_trim_tag)),
      tag_delimiter_(std::move(options.tag_delimiter)),
      date_spec_(strftime_spec(options.date_format, "date_format")),
      time_spec_(strftime_spec(options.time_format, "time_format")),
      tag_template_(std::move(options.tag_template), {"tag"}, "tag_template"),
      date_template_(std::move(options.date_template), {"date"}, "date_template"),
      time_template_(std::move(options.time_template), {"time"}, "time_template"),
      file_template_(std::move(options.file_template), {"file"}, "file_template"),
      line_template_(std::move(options.line_template), {"line"}, "line_template"),
      module_template_(std::move(options.module_template), {"module"}, "module_template"),
      tags_template_(std::move(options.tags_template), {"tags"}, "tags_template"),
      datetime_template_(std::move(options.datetime_template), {"date", "time"}, "datetime_template"),
      trace_template_(std::move(options.trace_template), {"file", "line", "module"}, "trace_template"),
      prefix_template_(std::move(options.prefix_template), {"datetime", "tags", "trace", "handler"}, "template"),
      utc_(options.utc)
    {
        validate();
    }

    /**
     * @brief Render the prefix for one emission
     * @param em The emission
     * @param handler_name Bound to {handler}
     * @param tags Tags to render, normally em.tags
     * @throws template_error if the tag transform throws or a format spec fails
     */
    std::string format_prefix(const emission &em, std::string_view handler_name, const tag_set &tags) const
    {
        std::string tags_group;
        if (prefix_template_.uses("tags")) { tags_group = tags_template_.render({{"tags", join_tags(tags)}}); }

        std::string datetime_group;
        if (prefix_template_.uses("datetime"))
        {
            std::tm tm = to_tm(em.timestamp);
            auto date  = date_template_.render({{"date", format_tm(tm, date_spec_)}});
            auto time  = time_template_.render({{"time", format_tm(tm, time_spec_)}});
            datetime_group = datetime_template_.render({{"date", date}, {"time", time}});
        }

        std::string trace_group;
        if (em.trace && em.trace->has_location() && prefix_template_.uses("trace"))
        {
            trace_group = render_trace(*em.trace);
        }

        return prefix_template_.render(
            {{"datetime", datetime_group}, {"tags", tags_group}, {"trace", trace_group}, {"handler", handler_name}});
    }

    std::string format_prefix(const emission &em, std::string_view handler_name = {}) const
    {
        return format_prefix(em, handler_name, em.tags);
    }

    bool utc() const noexcept { return utc_; }

  private:
    static std::string strftime_spec(const std::string &pattern, const char *option)
    {
        if (pattern.find_first_of("{}") != std::string::npos)
        {
            throw template_error(fmt::format("{} '{}': braces are not allowed in a strftime pattern", option, pattern));
        }
        return pattern.empty() ? std::string{} : fmt::format("{{:{}}}", pattern);
    }

    static std::string format_tm(const std::tm &tm, const std::string &spec)
    {
        if (spec.empty()) return {};
        try
        {
            return fmt::format(fmt::runtime(spec), tm);
        }
        catch (const fmt::format_error &e)
        {
            throw template_error(fmt::format("strftime pattern '{}': {}", spec, e.what()));
        }
    }

    std::tm to_tm(log_clock::time_point tp) const
    {
        std::time_t t = log_clock::to_time_t(tp);
        std::tm tm{};
        if (utc_) { gmtime_r(&t, &tm); }
        else { localtime_r(&t, &tm); }
        return tm;
    }

    std::string join_tags(const tag_set &tags) const
    {
        std::string joined;
        bool first = true;
        for (const auto &tag : tags)
        {
            std::string transformed;
            try
            {
                transformed = tag_formatter_(tag);
            }
            catch (const std::exception &e)
            {
                throw template_error(fmt::format("tag_formatter failed for '{}': {}", tag, e.what()));
            }

            if (!first) joined += tag_delimiter_;
            joined += tag_template_.render({{"tag", transformed}});
            first = false;
        }
        return joined;
    }

    std::string render_trace(const trace_info &trace) const
    {
        std::string file, line, module;
        if (!trace.file.empty()) file = file_template_.render({{"file", trace.file}});
        if (trace.line != 0)
        {
            auto number = fmt::format("{}", trace.line);
            line        = line_template_.render({{"line", number}});
        }
        if (!trace.module.empty()) module = module_template_.render({{"module", trace.module}});

        return trace_template_.render({{"file", file}, {"line", line}, {"module", module}});
    }

    // Dry run over sample data so format-spec errors surface at construction
    void validate() const
    {
        emission sample;
        sample.message   = "validate";
        sample.tags      = tag_set{"validate"};
        sample.timestamp = log_clock::time_point{};
        sample.trace     = trace_info{"validate.cpp", 1, "validate", {}};

        std::tm tm = to_tm(sample.timestamp);
        format_tm(tm, date_spec_);
        format_tm(tm, time_spec_);
        tags_template_.render({{"tags", "VALIDATE"}});
        tag_template_.render({{"tag", "VALIDATE"}});
        render_trace(*sample.trace);
        format_prefix(sample, "validate", tag_set{});
    }

    tag_transform tag_formatter_;
    std::string tag_delimiter_;
    std::string date_spec_;
    std::string time_spec_;

    log_template tag_template_;
    log_template date_template_;
    log_template time_template_;
    log_template file_template_;
    log_template line_template_;
    log_template module_template_;
    log_template tags_template_;
    log_template datetime_template_;
    log_template trace_template_;
    log_template prefix_template_;

    bool utc_ = false;
};

} // namespace tagsink
