#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

#include "store/dir_chunk_store.hpp"
#include "util/fd_io.hpp"
#include "util/log.hpp"

namespace store
{
namespace fs = std::filesystem;

using blobshard::ErrorCode;
using blobshard::fail;

std::string DirChunkStore::path_of(const std::string &filename) const
{
    return (fs::path(dir_) / filename).string();
}

bool DirChunkStore::ensure_dir(blobshard::Error &err) const
{
    std::error_code ec;
    if (dir_.empty())
        return true;  // chunks in CWD
    if (fs::is_directory(dir_, ec))
        return true;
    if (!fs::create_directories(dir_, ec) && ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir_.c_str(), ec.message().c_str());
        return fail(err, ErrorCode::Io,
                    "create_directories(" + dir_ + ") failed: " + ec.message());
    }
    return true;
}

bool DirChunkStore::put(const std::string &filename, const std::uint8_t *data, std::size_t len,
                        blobshard::Error &err)
{
    const std::string path = path_of(filename);
    fdio::UniqueFd    fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid())
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "open(" + path + ") failed: " + fdio::errno_text(saved));
    }

    if (!fdio::write_all(fd.get(), data, len))
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "write(" + path + ") failed: " + fdio::errno_text(saved));
    }

    if (!fd.close_checked())
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "close(" + path + ") failed: " + fdio::errno_text(saved));
    }
    return true;
}

bool DirChunkStore::get(const std::string &filename, std::uint64_t expected_size, Bytes &out,
                        blobshard::Error &err) const
{
    return fdio::read_file_exact(path_of(filename), expected_size, out, err);
}

bool DirChunkStore::remove(const std::string &filename, blobshard::Error &err)
{
    const std::string path = path_of(filename);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT)
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "unlink(" + path + ") failed: " + fdio::errno_text(saved));
    }
    return true;
}

bool DirChunkStore::exists(const std::string &filename) const
{
    return ::access(path_of(filename).c_str(), F_OK) == 0;
}

}  // namespace store
