/**
 * @file log_writers.hpp
 * @brief Log output writer implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <utility>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>
#include <sys/stat.h>
#include <errno.h>

#include "log_types.hpp"

namespace chatrelay
{

namespace detail
{

// Write all of @p len bytes, retrying on EINTR
inline ssize_t write_fully(int fd, const char *data, size_t len)
{
    size_t total_written = 0;
    while (total_written < len)
    {
        ssize_t written = ::write(fd, data + total_written, len - total_written);
        if (written < 0)
        {
            if (errno == EINTR) { continue; }
            perror("Failed to write log output");
            return -1;
        }
        total_written += written;
    }
    return static_cast<ssize_t>(total_written);
}

inline int open_append(const std::string &filename)
{
    return ::open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

} // namespace detail

/**
 * @brief Writer for an already open descriptor (stdout, stderr) or a plain file
 */
class file_writer
{
  public:
    explicit file_writer(const std::string &filename) : fd_(detail::open_append(filename)), close_fd_(true)
    {
        if (fd_ < 0) { throw std::runtime_error("Failed to open log file: " + filename); }
    }

    file_writer(int fd, bool close_fd = false) : fd_(fd), close_fd_(close_fd) {}

    file_writer(file_writer &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      close_fd_(std::exchange(other.close_fd_, false))
    {
    }

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;
    file_writer &operator=(file_writer &&)      = delete;

    ~file_writer()
    {
        if (close_fd_ && fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ssize_t write(const char *data, size_t len) const
    {
        if (fd_ < 0) { return -1; }
        return detail::write_fully(fd_, data, len);
    }

  private:
    int fd_{-1};
    bool close_fd_{false};
};

/**
 * @brief Size based rotation policy
 *
 * When a write would push the active file past @ref max_bytes the file is
 * renamed to `<name>.1`, older backups shift up by one and anything beyond
 * @ref keep_files is deleted.
 */
struct rotate_policy
{
    uint64_t max_bytes = LOG_DEFAULT_ROTATE_BYTES; ///< Maximum file size before rotation (0 = never rotate)
    int keep_files     = LOG_DEFAULT_KEEP_FILES;   ///< Number of numbered backups to keep
};

/**
 * @brief File writer with numbered-backup rotation
 *
 * Only the dispatcher worker thread writes to a sink, so the rotation state
 * needs no locking.
 */
class rotating_file_writer
{
  public:
    rotating_file_writer(std::string filename, rotate_policy policy = {})
    : filename_(std::move(filename)),
      policy_(policy)
    {
        fd_ = detail::open_append(filename_);
        if (fd_ < 0) { throw std::runtime_error("Failed to open log file: " + filename_); }

        // Appending to an existing file continues its size accounting
        struct stat st;
        if (::fstat(fd_, &st) == 0) { bytes_written_ = static_cast<uint64_t>(st.st_size); }
    }

    rotating_file_writer(rotating_file_writer &&other) noexcept
    : filename_(std::move(other.filename_)),
      policy_(other.policy_),
      fd_(std::exchange(other.fd_, -1)),
      bytes_written_(other.bytes_written_),
      rotations_(other.rotations_)
    {
    }

    rotating_file_writer(const rotating_file_writer &)            = delete;
    rotating_file_writer &operator=(const rotating_file_writer &) = delete;
    rotating_file_writer &operator=(rotating_file_writer &&)      = delete;

    ~rotating_file_writer()
    {
        if (fd_ >= 0) { ::close(fd_); }
    }

    ssize_t write(const char *data, size_t len) const
    {
        if (policy_.max_bytes > 0 && bytes_written_ > 0 && bytes_written_ + len > policy_.max_bytes) { rotate(); }
        if (fd_ < 0) { return -1; }

        ssize_t written = detail::write_fully(fd_, data, len);
        if (written > 0) { bytes_written_ += static_cast<uint64_t>(written); }
        return written;
    }

    const std::string &filename() const { return filename_; }
    uint64_t rotations() const { return rotations_; }
    uint64_t bytes_written() const { return bytes_written_; }

    std::string backup_name(int index) const { return filename_ + "." + std::to_string(index); }

  private:
    void rotate() const
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }

        if (policy_.keep_files > 0)
        {
            ::unlink(backup_name(policy_.keep_files).c_str());
            for (int i = policy_.keep_files - 1; i >= 1; --i)
            {
                if (::rename(backup_name(i).c_str(), backup_name(i + 1).c_str()) != 0 && errno != ENOENT)
                {
                    perror("Failed to shift log backup");
                }
            }
            if (::rename(filename_.c_str(), backup_name(1).c_str()) != 0 && errno != ENOENT)
            {
                perror("Failed to rotate log file");
            }
        }
        else { ::unlink(filename_.c_str()); }

        fd_            = detail::open_append(filename_);
        bytes_written_ = 0;
        rotations_++;
        if (fd_ < 0) { perror("Failed to reopen log file after rotation"); }
    }

    std::string filename_;
    rotate_policy policy_;
    mutable int fd_{-1};
    mutable uint64_t bytes_written_{0};
    mutable uint64_t rotations_{0};
};

class discard_writer
{
  public:
    ssize_t write(const char *, size_t len) const { return static_cast<ssize_t>(len); }
};

} // namespace chatrelay
