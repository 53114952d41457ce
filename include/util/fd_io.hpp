#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

#include "util/error.hpp"

namespace fdio
{

// Owns one file descriptor, closes it on scope exit.
class UniqueFd
{
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(UniqueFd &&o) noexcept : fd_(o.release()) {}
    UniqueFd &operator=(UniqueFd &&o) noexcept
    {
        if (this != &o)
        {
            reset();
            fd_ = o.release();
        }
        return *this;
    }
    UniqueFd(const UniqueFd &)            = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    int  get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int  release()
    {
        int fd = fd_;
        fd_    = -1;
        return fd;
    }
    void reset();
    // close() with its result checked; needed after writes
    bool close_checked();

  private:
    int fd_{-1};
};

// Loops over short writes and EINTR. Returns false with errno set.
bool write_all(int fd, const std::uint8_t *data, std::size_t len);
// Reads exactly `len` bytes at `offset` unless EOF comes first; `got` is the count read.
bool pread_full(int fd, std::uint8_t *buf, std::size_t len, off_t offset, std::size_t &got);

// Whole file into `out`. A file larger than `max_size` is refused before any read.
bool read_file(const std::string &path, std::vector<std::uint8_t> &out, blobshard::Error &err,
               std::uint64_t max_size);
// Exactly `expected` bytes. Any other size on disk is a SizeMismatch, detected
// from fstat before the buffer is allocated.
bool read_file_exact(const std::string &path, std::uint64_t expected,
                     std::vector<std::uint8_t> &out, blobshard::Error &err);
// Write to "<path>.partial", fsync, rename over `path`. Nothing is left at `path` on failure.
bool write_file_atomic(const std::string &path, const std::uint8_t *data, std::size_t len,
                       blobshard::Error &err);

std::string errno_text(int e);

}  // namespace fdio
