/**
 * @file log_tags.hpp
 * @brief Tag sets and subscription matching
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A tag is a single lowercase word. A tag_set is the deduplicated collection
 * of tags attached to an emission or a handler subscription. Identity and
 * matching ignore order and case; the order in which tags were first given is
 * kept for rendering.
 *
 * @code
 * tag_set emitted{"Blog", "sql", "warning"};
 * tag_set subscribed = tag_set::from_name("sql_error");
 *
 * matches(emitted, subscribed);     // true, "sql" is shared
 * emitted.intersection(subscribed); // {sql}
 * @endcode
 */
#pragma once

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"

namespace tagsink
{

/**
 * @brief Validate and case-normalize a single tag token
 * @throws invalid_tag_error if the token is empty or contains whitespace
 */
inline std::string normalize_tag(std::string_view tag)
{
    if (tag.empty()) { throw invalid_tag_error("tag must not be empty"); }
    if (std::any_of(tag.begin(), tag.end(), detail::is_space))
    {
        throw invalid_tag_error(fmt::format("tag '{}' must be a single word", tag));
    }
    return detail::to_lower(tag);
}

class tag_set
{
  public:
    using const_iterator = std::vector<std::string>::const_iterator;

    tag_set() = default;

    tag_set(std::initializer_list<std::string_view> tags)
    {
        for (auto tag : tags) { insert(tag); }
    }

    template <typename It> tag_set(It first, It last)
    {
        for (; first != last; ++first) { insert(std::string_view(*first)); }
    }

    explicit tag_set(const std::vector<std::string> &tags) : tag_set(tags.begin(), tags.end()) {}

    /**
     * @brief Derive a tag set from an identifier such as "blog_sql_warning"
     *
     * Empty tokens are skipped, so "general__info" yields {general, info}.
     *
     * @throws invalid_tag_error if the name yields no tokens or a token is malformed
     */
    static tag_set from_name(std::string_view name, char delimiter = TAG_NAME_DELIMITER)
    {
        tag_set result;
        size_t start = 0;
        while (start <= name.size())
        {
            size_t end = name.find(delimiter, start);
            if (end == std::string_view::npos) end = name.size();

            auto token = name.substr(start, end - start);
            if (!token.empty()) { result.insert(token); }
            start = end + 1;
        }

        if (result.empty()) { throw invalid_tag_error(fmt::format("name '{}' does not contain any tags", name)); }
        return result;
    }

    /// The synthesized set for emissions given no tags: {default}
    static const tag_set &default_tags()
    {
        static const tag_set tags{DEFAULT_TAG};
        return tags;
    }

    bool empty() const noexcept { return tags_.empty(); }
    size_t size() const noexcept { return tags_.size(); }

    const_iterator begin() const noexcept { return tags_.begin(); }
    const_iterator end() const noexcept { return tags_.end(); }

    /// Tags in first-seen order, lowercase
    const std::vector<std::string> &tags() const noexcept { return tags_; }

    bool contains(std::string_view tag) const
    {
        return std::any_of(tags_.begin(), tags_.end(), [tag](const std::string &t) { return detail::iequals(t, tag); });
    }

    bool intersects(const tag_set &other) const
    {
        return std::any_of(tags_.begin(), tags_.end(), [&other](const std::string &t) { return other.contains(t); });
    }

    /**
     * @brief Tags present in both sets, in this set's order
     */
    tag_set intersection(const tag_set &other) const
    {
        tag_set result;
        for (const auto &t : tags_)
        {
            if (other.contains(t)) { result.tags_.push_back(t); }
        }
        return result;
    }

    std::string to_string(std::string_view delimiter = ",") const { return fmt::format("{}", fmt::join(tags_, delimiter)); }

    /// Order-insensitive identity
    friend bool operator==(const tag_set &a, const tag_set &b)
    {
        return a.size() == b.size() && std::all_of(a.begin(), a.end(), [&b](const std::string &t) { return b.contains(t); });
    }

  private:
    void insert(std::string_view tag)
    {
        auto normalized = normalize_tag(tag);
        if (std::find(tags_.begin(), tags_.end(), normalized) == tags_.end()) { tags_.push_back(std::move(normalized)); }
    }

    std::vector<std::string> tags_;
};

/**
 * @brief Subscription test: true if the two sets share at least one tag
 *
 * Symmetric. An empty set matches nothing.
 */
inline bool matches(const tag_set &emission_tags, const tag_set &subscription) { return emission_tags.intersects(subscription); }

} // namespace tagsink
