/**
 * @file test_writers.hpp
 * @brief Writers and clocks shared by the tagsink tests
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "log.hpp"

// Writer that keeps every line in memory
class capture_writer : public tagsink::log_writer
{
  public:
    explicit capture_writer(std::string name = "capture") : name_(std::move(name)) {}

    std::string describe() const override { return name_; }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    size_t count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

    std::string last() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.empty() ? std::string{} : lines_.back();
    }

    bool contains(std::string_view text) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &line : lines_)
        {
            if (line.find(text) != std::string::npos) return true;
        }
        return false;
    }

  protected:
    void write(std::string_view data) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back(data);
    }

  private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// Writer that fails every write
class failing_writer : public tagsink::log_writer
{
  public:
    std::string describe() const override { return "failing"; }

  protected:
    void write(std::string_view) override { throw tagsink::sink_write_error("disk full"); }
};

// 2025-03-14 09:26:53 UTC
inline tagsink::log_clock::time_point fixed_time() { return tagsink::log_clock::from_time_t(1741944413); }

inline std::function<tagsink::log_clock::time_point()> fixed_clock()
{
    return [] { return fixed_time(); };
}

inline tagsink::target_spec capture_target(const std::shared_ptr<capture_writer> &writer)
{
    return tagsink::target_spec{.writers = {writer}};
}

inline tagsink::formatter_options utc_options()
{
    return tagsink::formatter_options{.utc = true};
}
