/**
 * @file log_sinks.hpp
 * @brief Factory functions for creating common log targets
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "log_sink.hpp"
#include "log_writers.hpp"

namespace tagsink
{

inline std::shared_ptr<log_target> make_stdout_target()
{
    return std::make_shared<log_target>(std::vector<std::shared_ptr<log_writer>>{writer_registry::instance().stdout_writer()});
}

inline std::shared_ptr<log_target> make_stderr_target()
{
    return std::make_shared<log_target>(std::vector<std::shared_ptr<log_writer>>{writer_registry::instance().stderr_writer()});
}

inline std::shared_ptr<log_target> make_file_target(std::string_view filename)
{
    return std::make_shared<log_target>(
        std::vector<std::shared_ptr<log_writer>>{writer_registry::instance().file(std::string(filename))});
}

/**
 * @brief Build the target a handler declaration asks for
 * @throws sink_write_error if the file cannot be opened
 */
inline std::shared_ptr<log_target> make_target(const target_spec &spec)
{
    std::vector<std::shared_ptr<log_writer>> writers;
    auto &registry = writer_registry::instance();

    if (!spec.filename.empty()) writers.push_back(registry.file(spec.filename));
    if (spec.to_stdout) writers.push_back(registry.stdout_writer());
    if (spec.to_stderr) writers.push_back(registry.stderr_writer());
    writers.insert(writers.end(), spec.writers.begin(), spec.writers.end());

    return std::make_shared<log_target>(std::move(writers));
}

} // namespace tagsink
