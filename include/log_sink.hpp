/**
 * @file log_sink.hpp
 * @brief Log targets: fan-out of one rendered line to several writers
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
#include "log_errors.hpp"
#include "log_writers.hpp"

namespace tagsink
{

/**
 * @brief Destination declaration for a handler
 *
 * Any combination may be set; the same line is written to each. A spec with
 * nothing set yields a target that writes nowhere.
 *
 * @code
 * target_spec both{.filename = "/var/log/app.log", .to_stderr = true};
 * @endcode
 */
struct target_spec
{
    std::string filename;                             ///< Append to this file if non-empty
    bool to_stdout = false;                           ///< Write to standard output
    bool to_stderr = false;                           ///< Write to standard error
    std::vector<std::shared_ptr<log_writer>> writers; ///< Additional custom writers
};

/**
 * @brief One or more writers receiving the same lines
 *
 * ## Usage Example:
 * @code
 * log_target target{{writer_registry::instance().stdout_writer()}};
 * target.write("[INFO] : started\n");
 * @endcode
 */
class log_target
{
  public:
    log_target() = default;

    explicit log_target(std::vector<std::shared_ptr<log_writer>> writers)
    {
        for (auto &writer : writers)
        {
            if (writer) writers_.push_back(std::move(writer));
        }
    }

    /**
     * @brief Write @p line to every writer
     *
     * A failing writer does not stop the others.
     *
     * @throws sink_write_error naming every writer that failed
     */
    void write(std::string_view line) const
    {
        std::string failures;
        for (const auto &writer : writers_)
        {
            try
            {
                writer->write_line(line);
            }
            catch (const std::exception &e)
            {
                if (!failures.empty()) failures += "; ";
                failures += fmt::format("{}: {}", writer->describe(), e.what());
            }
        }

        if (!failures.empty()) { throw sink_write_error(failures); }
    }

    bool empty() const noexcept { return writers_.empty(); }
    size_t size() const noexcept { return writers_.size(); }
    const std::vector<std::shared_ptr<log_writer>> &writers() const noexcept { return writers_; }

  private:
    std::vector<std::shared_ptr<log_writer>> writers_;
};

} // namespace tagsink
