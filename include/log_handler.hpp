/**
 * @file log_handler.hpp
 * @brief Handlers: a tag subscription bound to a formatter and a target
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_formatters.hpp"
#include "log_site.hpp"
#include "log_sink.hpp"
#include "log_sinks.hpp"
#include "log_tags.hpp"

namespace tagsink
{

/**
 * @brief Handler declaration
 *
 * @code
 * handler_config sql{
 *     .name   = "sql",
 *     .tags   = {"sql", "database"},
 *     .target = {.filename = "/var/log/sql.log"},
 *     .formatter = {.tag_delimiter = " "},
 * };
 * @endcode
 */
struct handler_config
{
    std::string name;              ///< Diagnostics only, also bound to {handler}
    std::vector<std::string> tags; ///< Subscription; any shared tag matches
    target_spec target;
    formatter_options formatter;
    bool render_matched_only = false; ///< Render only the subscribed tags of an emission
};

/**
 * @brief Declaration of the handler behind the default path: stdout, no datetime
 */
inline handler_config default_handler_config()
{
    return handler_config{
        .name      = "default",
        .tags      = {},
        .target    = {.to_stdout = true},
        .formatter = {.prefix_template = "{trace}{tags} : "},
    };
}

class log_handler
{
  public:
    /**
     * @throws invalid_tag_error for malformed subscription tags
     * @throws template_error for invalid formatter options
     * @throws sink_write_error if a target file cannot be opened
     */
    explicit log_handler(handler_config config)
    : name_(std::move(config.name)),
      subscription_(config.tags),
      formatter_(std::move(config.formatter)),
      target_(make_target(config.target)),
      render_matched_only_(config.render_matched_only)
    {
    }

    log_handler(std::string name, tag_set subscription, prefix_formatter formatter, std::shared_ptr<log_target> target)
    : name_(std::move(name)),
      subscription_(std::move(subscription)),
      formatter_(std::move(formatter)),
      target_(target ? std::move(target) : std::make_shared<log_target>())
    {
    }

    const std::string &name() const noexcept { return name_; }
    const tag_set &subscription() const noexcept { return subscription_; }
    const prefix_formatter &formatter() const noexcept { return formatter_; }
    const log_target &target() const noexcept { return *target_; }

    /// An empty subscription accepts nothing
    bool accepts(const tag_set &tags) const { return matches(tags, subscription_); }

    /**
     * @brief Render the full line for @p em: prefix, message, exception block, newline
     * @throws template_error
     */
    std::string render(const emission &em) const
    {
        std::string line;
        if (render_matched_only_ && !subscription_.empty())
        {
            line = formatter_.format_prefix(em, name_, em.tags.intersection(subscription_));
        }
        else { line = formatter_.format_prefix(em, name_, em.tags); }

        line += em.message;
        if (em.trace && !em.trace->exception_text.empty())
        {
            line += '\n';
            line += em.trace->exception_text;
        }
        line += '\n';
        return line;
    }

    /**
     * @brief Render and write one emission
     * @throws template_error, sink_write_error
     */
    void handle(const emission &em) const
    {
        if (target_->empty()) return;
        target_->write(render(em));
    }

  private:
    std::string name_;
    tag_set subscription_;
    prefix_formatter formatter_;
    std::shared_ptr<log_target> target_;
    bool render_matched_only_ = false;
};

} // namespace tagsink
