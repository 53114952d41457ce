#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <thread>
#include <unistd.h>

#include "crypto/chunk_hasher.hpp"
#include "shard/reassembler.hpp"
#include "shard/worker_pool.hpp"
#include "util/constants.hpp"
#include "util/fd_io.hpp"
#include "util/log.hpp"

namespace shard
{

using blobshard::Error;
using blobshard::ErrorCode;
using blobshard::fail;
namespace fs = std::filesystem;

namespace
{
enum class SlotState
{
    Pending,
    Ready,
    Failed
};

struct Slot
{
    SlotState    state{SlotState::Pending};
    store::Bytes bytes;
    Error        err;
};

bool cancelled(const std::atomic<bool> *flag)
{
    return flag && flag->load(std::memory_order_relaxed);
}

// the writer polls the caller's cancel flag while waiting for a verifier
constexpr auto CANCEL_POLL = std::chrono::milliseconds(20);
}  // namespace

bool check_chunk(const manifest::ChunkDescriptor &desc, const store::Bytes &bytes, Error &err)
{
    if (bytes.size() != desc.size)
        return fail(err, ErrorCode::SizeMismatch,
                    desc.filename + ": expected " + std::to_string(desc.size) + " bytes, got " +
                        std::to_string(bytes.size()),
                    desc.index);

    const hasher::Digest got = hasher::digest(bytes);
    if (got != desc.digest)
        return fail(err, ErrorCode::Integrity,
                    desc.filename + ": expected sha256 " + hasher::to_hex(desc.digest) + ", got " +
                        hasher::to_hex(got),
                    desc.index);
    return true;
}

bool Reassembler::check_request(const manifest::ShardManifest &m, Error &err) const
{
    // fail fast on a manifest that cannot describe a valid file
    if (!manifest::validate(m, err))
    {
        LOG_ERROR("Refusing to reassemble: %s", blobshard::describe(err).c_str());
        return false;
    }
    if (opts_.workers > constants::MAX_WORKERS)
        return fail(err, ErrorCode::Config,
                    "workers must be <= " + std::to_string(constants::MAX_WORKERS));
    return true;
}

bool Reassembler::run(const manifest::ShardManifest &m,
                      const store::IChunkStore      &src,
                      const ChunkSink               &sink,
                      Error                         &err) const
{
    if (!check_request(m, err))
        return false;

    const std::size_t n      = m.chunks.size();
    const std::size_t window = resolve_workers(opts_.workers, n);

    LOG_INFO("Reassembling file: %s from %s store", m.original_file.c_str(), src.name().c_str());
    LOG_INFO("Expected total size: %llu bytes", (unsigned long long)m.total_size);

    std::vector<Slot>       slots(n);
    std::mutex              mu;
    std::condition_variable cv;
    std::size_t             next_claim = 0;  // guarded by mu
    std::size_t             written    = 0;  // guarded by mu
    bool                    stop       = false;

    auto verifier = [&](std::size_t /*worker_id*/) {
        for (;;)
        {
            std::size_t i;
            {
                std::unique_lock<std::mutex> lk(mu);
                // stay at most `window` chunks ahead of the writer
                cv.wait(lk, [&] { return stop || next_claim >= n || next_claim < written + window; });
                if (stop || next_claim >= n)
                    return;
                i = next_claim++;
            }

            const auto  &desc = m.chunks[i];
            store::Bytes bytes;
            Error        e;
            bool         ok = src.get(desc.filename, desc.size, bytes, e);
            if (!ok)
                e.chunk_index = desc.index;
            else
                ok = check_chunk(desc, bytes, e);

            {
                std::lock_guard<std::mutex> lk(mu);
                if (ok)
                {
                    slots[i].bytes = std::move(bytes);
                    slots[i].state = SlotState::Ready;
                }
                else
                {
                    slots[i].err   = std::move(e);
                    slots[i].state = SlotState::Failed;
                }
            }
            cv.notify_all();
        }
    };

    std::vector<std::thread> threads;
    if (n > 0)
    {
        threads.reserve(window);
        for (std::size_t w = 0; w < window; ++w)
            threads.emplace_back(verifier, w);
    }

    bool          ok           = true;
    std::uint64_t total_output = 0;
    for (std::size_t i = 0; i < n && ok; ++i)
    {
        store::Bytes bytes;
        {
            std::unique_lock<std::mutex> lk(mu);
            while (slots[i].state == SlotState::Pending && !cancelled(opts_.cancel))
                cv.wait_for(lk, CANCEL_POLL);

            if (cancelled(opts_.cancel))
            {
                ok = fail(err, ErrorCode::Cancelled, "reassembly cancelled", i);
                break;
            }
            if (slots[i].state == SlotState::Failed)
            {
                err = slots[i].err;
                ok  = false;
                break;
            }
            bytes = std::move(slots[i].bytes);
            slots[i].bytes.clear();
        }

        // writes are serialized here, in index order
        if (!sink(i, bytes, err))
        {
            if (!err.chunk_index)
                err.chunk_index = i;
            ok = false;
            break;
        }
        total_output += bytes.size();
        LOG_DEBUG("Reassembled chunk %zu: %zu bytes", i, bytes.size());

        {
            std::lock_guard<std::mutex> lk(mu);
            written = i + 1;
        }
        cv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lk(mu);
        stop = true;
    }
    cv.notify_all();
    for (auto &t : threads)
        t.join();

    if (!ok)
    {
        LOG_ERROR("Reassembly of %s failed: %s", m.original_file.c_str(),
                  blobshard::describe(err).c_str());
        return false;
    }
    if (total_output != m.total_size)
    {
        fail(err, ErrorCode::SizeMismatch,
             "size mismatch: expected " + std::to_string(m.total_size) + ", got " +
                 std::to_string(total_output));
        LOG_ERROR("%s", blobshard::describe(err).c_str());
        return false;
    }
    return true;
}

bool Reassembler::reassemble_to_file(const manifest::ShardManifest &m,
                                     const store::IChunkStore      &src,
                                     const std::string             &output_path,
                                     Error                         &err) const
{
    // nothing is created or truncated for a manifest that will be refused
    if (!check_request(m, err))
        return false;

    std::error_code ec;
    fs::path        parent = fs::path(output_path).parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec))
    {
        if (!fs::create_directories(parent, ec) && ec)
            return fail(err, ErrorCode::Io,
                        "create_directories(" + parent.string() + ") failed: " + ec.message());
    }

    const std::string tmp = output_path + std::string(constants::PARTIAL_SUFFIX);
    fdio::UniqueFd    fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid())
    {
        int saved = errno;
        return fail(err, ErrorCode::Io, "open(" + tmp + ") failed: " + fdio::errno_text(saved));
    }

    auto discard = [&] {
        fd.reset();
        (void)::unlink(tmp.c_str());
    };

    const int out_fd = fd.get();
    ChunkSink sink   = [&](std::size_t index, const store::Bytes &bytes, Error &e) {
        if (!fdio::write_all(out_fd, bytes.data(), bytes.size()))
        {
            int saved = errno;
            return fail(e, ErrorCode::Io, "write(" + tmp + ") failed: " + fdio::errno_text(saved),
                        index);
        }
        return true;
    };

    if (!run(m, src, sink, err))
    {
        discard();
        return false;
    }
    if (::fsync(out_fd) != 0)
    {
        int saved = errno;
        discard();
        return fail(err, ErrorCode::Io, "fsync(" + tmp + ") failed: " + fdio::errno_text(saved));
    }
    if (!fd.close_checked())
    {
        int saved = errno;
        (void)::unlink(tmp.c_str());
        return fail(err, ErrorCode::Io, "close(" + tmp + ") failed: " + fdio::errno_text(saved));
    }
    if (::rename(tmp.c_str(), output_path.c_str()) != 0)
    {
        int saved = errno;
        (void)::unlink(tmp.c_str());
        return fail(err, ErrorCode::Io,
                    "rename(" + tmp + ") failed: " + fdio::errno_text(saved));
    }

    LOG_INFO("File reassembled successfully: %s (%llu bytes)", output_path.c_str(),
             (unsigned long long)m.total_size);
    return true;
}

bool Reassembler::reassemble_to_bytes(const manifest::ShardManifest &m,
                                      const store::IChunkStore      &src,
                                      std::vector<std::uint8_t>     &out,
                                      Error                         &err) const
{
    std::vector<std::uint8_t> buf;
    ChunkSink sink = [&](std::size_t, const store::Bytes &bytes, Error &) {
        buf.insert(buf.end(), bytes.begin(), bytes.end());
        return true;
    };
    if (!run(m, src, sink, err))
        return false;
    out.swap(buf);
    return true;
}

bool Reassembler::verify(const manifest::ShardManifest &m,
                         const store::IChunkStore      &src,
                         Error                         &err) const
{
    ChunkSink sink = [](std::size_t, const store::Bytes &, Error &) { return true; };
    if (!run(m, src, sink, err))
        return false;
    LOG_INFO("All %zu chunks of %s verified", m.chunks.size(), m.original_file.c_str());
    return true;
}

}  // namespace shard
