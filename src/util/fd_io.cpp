#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "util/constants.hpp"
#include "util/fd_io.hpp"
#include "util/log.hpp"

namespace fdio
{

using blobshard::ErrorCode;
using blobshard::fail;

std::string errno_text(int e)
{
    return std::strerror(e);
}

void UniqueFd::reset()
{
    if (fd_ >= 0)
    {
        (void)::close(fd_);  // read-only paths, nothing to report
        fd_ = -1;
    }
}

bool UniqueFd::close_checked()
{
    if (fd_ < 0)
        return true;
    int rc = ::close(fd_);
    fd_    = -1;
    return rc == 0;
}

bool write_all(int fd, const std::uint8_t *data, std::size_t len)
{
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool pread_full(int fd, std::uint8_t *buf, std::size_t len, off_t offset, std::size_t &got)
{
    got = 0;
    while (got < len)
    {
        ssize_t n = ::pread(fd, buf + got, len - got, offset + static_cast<off_t>(got));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (n == 0)
            break;  // EOF
        got += static_cast<std::size_t>(n);
    }
    return true;
}

static bool open_sized(const std::string &path, UniqueFd &fd, std::uint64_t &size,
                       blobshard::Error &err)
{
    fd = UniqueFd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid())
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "open(" + path + ") failed: " + errno_text(saved));
    }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0)
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "fstat(" + path + ") failed: " + errno_text(saved));
    }
    if (!S_ISREG(st.st_mode))
        return fail(err, ErrorCode::Io, path + " is not a regular file");
    size = static_cast<std::uint64_t>(st.st_size);
    return true;
}

static bool read_into(const UniqueFd &fd, const std::string &path, std::uint64_t size,
                      std::vector<std::uint8_t> &out, std::size_t &got, blobshard::Error &err)
{
    out.resize(static_cast<std::size_t>(size));
    if (!pread_full(fd.get(), out.data(), out.size(), 0, got))
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "read(" + path + ") failed: " + errno_text(saved));
    }
    return true;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> &out, blobshard::Error &err,
               std::uint64_t max_size)
{
    UniqueFd      fd;
    std::uint64_t size = 0;
    if (!open_sized(path, fd, size, err))
        return false;
    if (size > max_size)
        return fail(err, ErrorCode::Io,
                    path + " is too large (" + std::to_string(size) + " bytes, limit " +
                        std::to_string(max_size) + ")");

    std::size_t got = 0;
    if (!read_into(fd, path, size, out, got, err))
        return false;
    // file may have shrunk since fstat
    out.resize(got);
    return true;
}

bool read_file_exact(const std::string &path, std::uint64_t expected,
                     std::vector<std::uint8_t> &out, blobshard::Error &err)
{
    UniqueFd      fd;
    std::uint64_t size = 0;
    if (!open_sized(path, fd, size, err))
        return false;
    if (size != expected)
        return fail(err, ErrorCode::SizeMismatch,
                    path + ": expected " + std::to_string(expected) + " bytes, got " +
                        std::to_string(size));

    std::size_t got = 0;
    if (!read_into(fd, path, size, out, got, err))
        return false;
    if (got != expected)
    {
        const std::size_t short_by = out.size() - got;
        out.resize(got);
        return fail(err, ErrorCode::SizeMismatch,
                    path + ": expected " + std::to_string(expected) + " bytes, got " +
                        std::to_string(got) + " (" + std::to_string(short_by) +
                        " missing after open)");
    }
    return true;
}

bool write_file_atomic(const std::string &path, const std::uint8_t *data, std::size_t len,
                       blobshard::Error &err)
{
    const std::string tmp = path + std::string(constants::PARTIAL_SUFFIX);
    UniqueFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid())
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "open(" + tmp + ") failed: " + errno_text(saved));
    }

    if (!write_all(fd.get(), data, len) || ::fsync(fd.get()) != 0)
    {
        int saved = errno;
        fd.reset();
        (void)::unlink(tmp.c_str());
        return fail(err, ErrorCode::Io, "write(" + tmp + ") failed: " + errno_text(saved));
    }
    if (!fd.close_checked())
    {
        int saved = errno;
        (void)::unlink(tmp.c_str());
        return fail(err, ErrorCode::Io, "close(" + tmp + ") failed: " + errno_text(saved));
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0)
    {
        int saved = errno;
        (void)::unlink(tmp.c_str());
        return fail(err, ErrorCode::Io, "rename(" + tmp + ") failed: " + errno_text(saved));
    }
    LOG_DEBUG("wrote %zu bytes to %s", len, path.c_str());
    return true;
}

}  // namespace fdio
