/**
 * @file log_template.hpp
 * @brief Named-placeholder templates rendered through fmt
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Templates use fmt replacement-field syntax restricted to named fields:
 * "{name}" or "{name:spec}". Literal braces are written "{{" and "}}".
 * Positional fields ("{}", "{0}") and names outside the set a template is
 * compiled for are rejected when the template is constructed.
 *
 * A known name the caller does not bind at render time renders as an empty
 * string, which is how an absent "{trace}" disappears from a prefix.
 *
 * @code
 * log_template tmpl{"[{tags}] {handler}: ", {"tags", "handler", "trace"}, "template"};
 * tmpl.render({{"tags", "SQL,WARNING"}, {"handler", "db"}}); // "[SQL,WARNING] db: "
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"

namespace tagsink
{

/**
 * @brief One named value bound at render time
 *
 * The name must be a string with static storage duration; fmt's named
 * argument store keeps the pointer, not a copy.
 */
struct template_arg
{
    const char *name;
    std::string_view value;
};

class log_template
{
  public:
    log_template() = default;

    /**
     * @param text Template text
     * @param allowed Placeholder names this template may reference (static strings)
     * @param option Name of the configuration option, used in error messages
     * @throws template_error on unbalanced braces, positional or unknown placeholders
     */
    log_template(std::string text, std::initializer_list<const char *> allowed, const char *option)
    : text_(std::move(text)), option_(option)
    {
        parse(allowed);
    }

    const std::string &text() const noexcept { return text_; }
    const char *option() const noexcept { return option_; }

    /// True if the template references @p name
    bool uses(std::string_view name) const
    {
        return std::any_of(fields_.begin(), fields_.end(), [name](const char *f) { return name == f; });
    }

    /**
     * @brief Substitute named values
     * @throws template_error if fmt rejects a field's format spec
     */
    std::string render(std::initializer_list<template_arg> args) const
    {
        if (fields_.empty() && !has_escapes_) return text_;

        fmt::dynamic_format_arg_store<fmt::format_context> store;
        for (const char *field : fields_)
        {
            std::string_view value;
            for (const auto &arg : args)
            {
                if (field == std::string_view(arg.name))
                {
                    value = arg.value;
                    break;
                }
            }
            store.push_back(fmt::arg(field, value));
        }

        try
        {
            return fmt::vformat(text_, store);
        }
        catch (const fmt::format_error &e)
        {
            throw template_error(fmt::format("{} '{}': {}", option_, text_, e.what()));
        }
    }

  private:
    void parse(std::initializer_list<const char *> allowed)
    {
        for (size_t i = 0; i < text_.size(); ++i)
        {
            char c = text_[i];
            if (c == '}')
            {
                if (i + 1 < text_.size() && text_[i + 1] == '}')
                {
                    has_escapes_ = true;
                    ++i;
                    continue;
                }
                fail("unmatched '}'");
            }
            if (c != '{') continue;

            if (i + 1 < text_.size() && text_[i + 1] == '{')
            {
                has_escapes_ = true;
                ++i;
                continue;
            }

            size_t close = text_.find('}', i + 1);
            if (close == std::string::npos) fail("unterminated '{'");

            std::string_view field(text_.data() + i + 1, close - i - 1);
            if (field.find('{') != std::string_view::npos) fail("nested replacement fields are not supported");

            auto name = field.substr(0, field.find_first_of(":!"));
            if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_'))
            {
                fail(fmt::format("placeholder '{{{}}}' must be named", field));
            }

            auto known = std::find_if(allowed.begin(), allowed.end(), [name](const char *a) { return name == a; });
            if (known == allowed.end())
            {
                fail(fmt::format("unknown placeholder '{{{}}}', expected one of {{{}}}", name, fmt::join(allowed, "}, {")));
            }
            if (!uses(name)) fields_.push_back(*known);

            i = close;
        }
    }

    [[noreturn]] void fail(std::string_view reason) const
    {
        throw template_error(fmt::format("{} '{}': {}", option_, text_, reason));
    }

    std::string text_;
    const char *option_ = "template";
    std::vector<const char *> fields_; ///< Distinct placeholder names, in first-use order
    bool has_escapes_   = false;
};

} // namespace tagsink
