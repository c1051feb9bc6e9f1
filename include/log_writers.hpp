/**
 * @file log_writers.hpp
 * @brief Log output writer implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A writer is one sink: a file descriptor, an in-memory buffer, anything that
 * accepts bytes. Each writer serializes its own writes so concurrent emissions
 * never interleave bytes within a line. Targets that name the same file, or
 * stdout/stderr, obtain the same writer from writer_registry and therefore
 * share its lock.
 */
#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>

#include <robin_hood.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_errors.hpp"

namespace tagsink
{

/**
 * @brief Abstract sink for rendered lines
 *
 * write_line() takes the writer's lock and calls write(). Implementations
 * report failures by throwing, preferably sink_write_error.
 */
class log_writer
{
  public:
    virtual ~log_writer() = default;

    log_writer()                              = default;
    log_writer(const log_writer &)            = delete;
    log_writer &operator=(const log_writer &) = delete;

    void write_line(std::string_view data)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        write(data);
    }

    /// Destination description for diagnostics ("stdout", a file path, ...)
    virtual std::string describe() const = 0;

  protected:
    virtual void write(std::string_view data) = 0;

  private:
    std::mutex mutex_;
};

class file_writer final : public log_writer
{
  public:
    /**
     * @brief Open @p filename for appending
     * @throws sink_write_error if the file cannot be opened
     */
    explicit file_writer(const std::string &filename) : filename_(filename), close_fd_(true)
    {
        fd_ = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0)
        {
            throw sink_write_error(fmt::format("Failed to open log file {}: {}", filename, std::strerror(errno)));
        }
    }

    file_writer(int fd, std::string name, bool close_fd = false) : filename_(std::move(name)), fd_(fd), close_fd_(close_fd) {}

    ~file_writer() override
    {
        if (close_fd_ && fd_ >= 0)
        {
            close(fd_);
            fd_ = -1;
        }
    }

    std::string describe() const override { return filename_; }

    int fd() const noexcept { return fd_; }

  protected:
    void write(std::string_view data) override
    {
        if (fd_ < 0) { throw sink_write_error(fmt::format("{} is not open", filename_)); }

        size_t total_written = 0;
        while (total_written < data.size())
        {
            ssize_t written = ::write(fd_, data.data() + total_written, data.size() - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                throw sink_write_error(fmt::format("Failed to write to {}: {}", filename_, std::strerror(errno)));
            }
            total_written += static_cast<size_t>(written);
        }
    }

  private:
    std::string filename_; ///< File name, or "stdout"/"stderr"
    int fd_{-1};
    bool close_fd_{false}; ///< Whether to close fd on destruction
};

class discard_writer final : public log_writer
{
  public:
    std::string describe() const override { return "discard"; }

  protected:
    void write(std::string_view) override {}
};

/**
 * @brief Process-wide source of shared writers
 *
 * File writers are keyed by normalized absolute path and held weakly: the
 * file closes once no target uses it. The stdout and stderr writers live for
 * the whole process.
 */
class writer_registry
{
  public:
    static writer_registry &instance()
    {
        static writer_registry instance_;
        return instance_;
    }

    std::shared_ptr<log_writer> stdout_writer() const { return stdout_; }
    std::shared_ptr<log_writer> stderr_writer() const { return stderr_; }

    /**
     * @brief Shared writer for @p filename, opened on first request
     * @throws sink_write_error if the file cannot be opened
     */
    std::shared_ptr<log_writer> file(const std::string &filename)
    {
        auto key = normalize(filename);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(key);
        if (it != files_.end())
        {
            if (auto existing = it->second.lock()) { return existing; }
        }

        auto writer = std::make_shared<file_writer>(filename);
        files_[key] = writer;
        return writer;
    }

    /// Number of files currently open through the registry
    size_t open_files() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto &entry : files_)
        {
            if (!entry.second.expired()) count++;
        }
        return count;
    }

  private:
    writer_registry()
    : stdout_(std::make_shared<file_writer>(STDOUT_FILENO, "stdout")),
      stderr_(std::make_shared<file_writer>(STDERR_FILENO, "stderr"))
    {
    }

    static std::string normalize(const std::string &filename)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(filename, ec);
        if (ec) return filename;
        return absolute.lexically_normal().string();
    }

    std::shared_ptr<log_writer> stdout_;
    std::shared_ptr<log_writer> stderr_;
    robin_hood::unordered_map<std::string, std::weak_ptr<file_writer>> files_;
    mutable std::mutex mutex_;
};

} // namespace tagsink
