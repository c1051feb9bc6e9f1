/**
 * @file log_dispatcher_impl.hpp
 * @brief Implementation of logger routing and delivery
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include "log_dispatcher.hpp"

namespace tagsink
{

namespace detail
{

inline std::vector<log_handler> build_handlers(std::vector<handler_config> &configs)
{
    std::vector<log_handler> handlers;
    handlers.reserve(configs.size());
    for (auto &config : configs) { handlers.emplace_back(std::move(config)); }
    return handlers;
}

struct default_logger_slot
{
    std::mutex mutex;
    std::unique_ptr<logger> instance;
    std::atomic<logger *> ready{nullptr};
};

inline default_logger_slot &default_logger()
{
    static default_logger_slot slot;
    return slot;
}

} // namespace detail

inline logger::logger(logger_config config)
: handlers_(detail::build_handlers(config.handlers)),
  default_(std::move(config.default_handler)),
  delivery_(config.delivery),
  tracer_(config.tracer ? std::move(config.tracer) : std::make_shared<default_trace_source>()),
  error_channel_(config.error_channel ? std::move(config.error_channel) : writer_registry::instance().stderr_writer()),
  clock_(config.clock ? std::move(config.clock) : std::function<log_clock::time_point()>(log_wall_timestamp))
{
    for (size_t i = 0; i < handlers_.size(); ++i)
    {
        for (const auto &tag : handlers_[i].subscription()) { index_[tag].push_back(i); }
    }
}

inline void logger::emit(std::string_view message, const tag_set &tags, const call_site &site) const
{
    auto em      = make_emission(message, tags, site);
    auto matched = route(em.tags);

    for (auto index : matched) { deliver(handlers_[index], em); }

    if (delivery_ == default_delivery::always || (delivery_ == default_delivery::unmatched && matched.empty()))
    {
        deliver(default_, em);
    }
}

inline void logger::invoke(std::string_view name, std::string_view message, const call_site &site) const
{
    emit(message, resolve_name(name), site);
}

inline tag_set logger::resolve_name(std::string_view name)
{
    for (auto reserved : RESERVED_NAMES)
    {
        if (detail::iequals(name, reserved))
        {
            throw invalid_tag_error(fmt::format("'{}' is a logger operation, not a tag name", name));
        }
    }

    // Leading verb: emit_general_info -> general_info
    auto first = name.find(TAG_NAME_DELIMITER);
    if (first != std::string_view::npos && detail::iequals(name.substr(0, first), EMIT_VERB))
    {
        auto rest = name.substr(first + 1);
        if (rest.find_first_not_of(TAG_NAME_DELIMITER) != std::string_view::npos) { return tag_set::from_name(rest); }
    }

    return tag_set::from_name(name);
}

inline std::vector<size_t> logger::route(const tag_set &tags) const
{
    std::vector<bool> hit(handlers_.size(), false);
    for (const auto &tag : tags)
    {
        auto it = index_.find(tag);
        if (it == index_.end()) continue;
        for (auto index : it->second) { hit[index] = true; }
    }

    std::vector<size_t> result;
    for (size_t i = 0; i < hit.size(); ++i)
    {
        if (hit[i]) result.push_back(i);
    }
    return result;
}

inline emission logger::make_emission(std::string_view message, const tag_set &tags, const call_site &site) const
{
    emission em;
    em.message   = std::string(message);
    em.tags      = tags.empty() ? tag_set::default_tags() : tags;
    em.timestamp = clock_();

    if (em.tags.contains(TRACE_TAG))
    {
        try
        {
            em.trace = tracer_->capture(site);
        }
        catch (const std::exception &e)
        {
            report(fmt::format("{}trace capture failed: {}\n", ERROR_REPORT_PREFIX, e.what()));
            em.trace = trace_info{};
        }
    }

    return em;
}

inline void logger::deliver(const log_handler &handler, const emission &em) const noexcept
{
    try
    {
        handler.handle(em);
    }
    catch (const std::exception &e)
    {
        report(fmt::format("{}handler '{}' dropped emission: {}\n", ERROR_REPORT_PREFIX, handler.name(), e.what()));
    }
    catch (...)
    {
        report(fmt::format("{}handler '{}' dropped emission: non-standard exception\n", ERROR_REPORT_PREFIX, handler.name()));
    }
}

inline void logger::report(std::string_view text) const noexcept
{
    try
    {
        error_channel_->write_line(text);
    }
    catch (const std::exception &e)
    {
        // Fallback channel is broken; stdio is all that is left
        std::fprintf(stderr, "%.*s(fallback channel failed: %s)\n", static_cast<int>(text.size()), text.data(), e.what());
    }
}

inline logger &logger::instance()
{
    auto &slot = detail::default_logger();
    if (auto *ready = slot.ready.load(std::memory_order_acquire)) return *ready;

    std::lock_guard<std::mutex> lock(slot.mutex);
    if (!slot.instance)
    {
        slot.instance = std::make_unique<logger>();
        slot.ready.store(slot.instance.get(), std::memory_order_release);
    }
    return *slot.instance;
}

inline logger &logger::init(logger_config config)
{
    auto &slot = detail::default_logger();

    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.instance) { throw std::logic_error("tagsink: default logger is already initialized"); }

    slot.instance = std::make_unique<logger>(std::move(config));
    slot.ready.store(slot.instance.get(), std::memory_order_release);
    return *slot.instance;
}

inline void tagged_logger::operator()(std::string_view message) const { logger_->emit(message, tags_, call_site{}); }

inline void tagged_logger::operator()(std::string_view message, const call_site &site) const
{
    logger_->emit(message, tags_, site);
}

} // namespace tagsink
