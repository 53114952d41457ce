#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "cid/content_id.hpp"
#include "crypto/chunk_hasher.hpp"
#include "shard/file_sharder.hpp"
#include "shard/worker_pool.hpp"
#include "util/constants.hpp"
#include "util/fd_io.hpp"
#include "util/log.hpp"

namespace shard
{

using blobshard::Error;
using blobshard::ErrorCode;
using blobshard::fail;

namespace
{
// One slot per chunk index, written by exactly one worker.
struct Slot
{
    bool                      done{false};
    manifest::ChunkDescriptor desc;
    Error                     err;
};

bool cancelled(const std::atomic<bool> *flag)
{
    return flag && flag->load(std::memory_order_relaxed);
}
}  // namespace

bool FileSharder::shard(const std::string       &input_path,
                        store::IChunkStore      &out,
                        manifest::ShardManifest &result,
                        Error                   &err) const
{
    const std::uint64_t cs = opts_.chunk_size_bytes;
    if (cs == 0)
        return fail(err, ErrorCode::Config, "chunk size must be > 0");
    if (static_cast<std::uint64_t>(static_cast<std::size_t>(cs)) != cs)
        return fail(err, ErrorCode::Config, "chunk size too large");
    if (opts_.workers > constants::MAX_WORKERS)
        return fail(err, ErrorCode::Config,
                    "workers must be <= " + std::to_string(constants::MAX_WORKERS));

    const std::string name = std::filesystem::path(input_path).filename().string();
    if (name.empty() || name == "." || name == "..")
        return fail(err, ErrorCode::Io, "input path has no file name: " + input_path);
    // the manifest could never be loaded back
    std::string why;
    if (!manifest::usable_original_name(name, why))
        return fail(err, ErrorCode::Config, "input file name '" + name + "' is " + why);

    fdio::UniqueFd fd(::open(input_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid())
    {
        const std::string reason = fdio::errno_text(errno);
        LOG_ERROR("open(%s) failed: %s", input_path.c_str(), reason.c_str());
        return fail(err, ErrorCode::Io, "open(" + input_path + ") failed: " + reason);
    }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0)
    {
        int saved = errno;
        return fail(err, ErrorCode::Io,
                    "fstat(" + input_path + ") failed: " + fdio::errno_text(saved));
    }
    if (!S_ISREG(st.st_mode))
        return fail(err, ErrorCode::Io, input_path + " is not a regular file");

    const std::uint64_t total  = static_cast<std::uint64_t>(st.st_size);
    const std::size_t   nchunk = total == 0 ? 0 : static_cast<std::size_t>((total - 1) / cs + 1);

    LOG_INFO("Sharding file: %s (%llu bytes)", input_path.c_str(), (unsigned long long)total);
    LOG_INFO("Creating %zu chunks of max %llu bytes each in %s store", nchunk,
             (unsigned long long)cs, out.name().c_str());

    std::vector<Slot>        slots(nchunk);
    std::atomic<std::size_t> next{0};
    std::atomic<bool>        failed{false};
    const int                in_fd = fd.get();

    auto worker = [&](std::size_t /*worker_id*/) {
        std::vector<std::uint8_t> buf;
        for (;;)
        {
            if (failed.load() || cancelled(opts_.cancel))
                return;
            const std::size_t i = next.fetch_add(1);
            if (i >= nchunk)
                return;

            Slot               &slot   = slots[i];
            const std::uint64_t offset = static_cast<std::uint64_t>(i) * cs;
            const std::size_t   len    = static_cast<std::size_t>(std::min(cs, total - offset));
            buf.resize(len);

            std::size_t got = 0;
            if (!fdio::pread_full(in_fd, buf.data(), len, static_cast<off_t>(offset), got))
            {
                int saved = errno;
                fail(slot.err, ErrorCode::Io,
                     "read(" + input_path + ") failed: " + fdio::errno_text(saved), i);
                failed.store(true);
                return;
            }
            if (got != len)
            {
                fail(slot.err, ErrorCode::Io,
                     "short read at offset " + std::to_string(offset) + " (expected " +
                         std::to_string(len) + " bytes, got " + std::to_string(got) +
                         "); input changed while sharding",
                     i);
                failed.store(true);
                return;
            }

            slot.desc.index    = i;
            slot.desc.filename = manifest::chunk_filename(i);
            slot.desc.size     = len;
            slot.desc.digest   = hasher::digest(buf.data(), len);

            if (!out.put(slot.desc.filename, buf.data(), len, slot.err))
            {
                slot.err.chunk_index = i;
                failed.store(true);
                return;
            }
            slot.done = true;
            LOG_DEBUG("Created chunk %zu: %zu bytes", i, len);
        }
    };

    if (nchunk > 0)
        run_workers(resolve_workers(opts_.workers, nchunk), worker);

    // barrier passed: every slot is final
    if (cancelled(opts_.cancel))
    {
        LOG_WARN("Sharding of %s cancelled", input_path.c_str());
        return fail(err, ErrorCode::Cancelled, "sharding cancelled");
    }
    for (std::size_t i = 0; i < nchunk; ++i)
    {
        if (slots[i].err)
        {
            err = slots[i].err;
            LOG_ERROR("Sharding failed: %s", blobshard::describe(err).c_str());
            return false;
        }
    }
    for (std::size_t i = 0; i < nchunk; ++i)
    {
        // a worker stopped early because another one failed
        if (!slots[i].done)
            return fail(err, ErrorCode::Io, "chunk was not written", i);
    }

    manifest::ShardManifest m;
    m.original_file = name;
    m.total_size    = total;
    m.chunk_size    = cs;
    m.chunk_count   = nchunk;
    m.chunks.reserve(nchunk);
    for (auto &s : slots)
        m.chunks.push_back(std::move(s.desc));
    m.identifier = cid::build(m.original_file, m.total_size, m.ordered_digests());

    LOG_INFO("Sharded %s into %zu chunks, cid %s", name.c_str(), nchunk,
             m.identifier.to_string().c_str());
    result = std::move(m);
    return true;
}

bool remove_chunks(const manifest::ShardManifest &m, store::IChunkStore &st, Error &err)
{
    for (const auto &c : m.chunks)
    {
        if (!st.remove(c.filename, err))
        {
            err.chunk_index = c.index;
            return false;
        }
    }
    LOG_DEBUG("Removed %zu chunks of %s", m.chunks.size(), m.original_file.c_str());
    return true;
}

bool remove_chunks(std::size_t count, store::IChunkStore &st, Error &err)
{
    for (std::size_t i = 0; i < count; ++i)
    {
        if (!st.remove(manifest::chunk_filename(i), err))
        {
            err.chunk_index = i;
            return false;
        }
    }
    return true;
}

}  // namespace shard
