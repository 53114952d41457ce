#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "shard/manifest.hpp"
#include "store/ichunk_store.hpp"
#include "util/error.hpp"

namespace shard
{

struct ShardOptions
{
    std::uint64_t            chunk_size_bytes{0};
    std::size_t              workers{0};         // 0 = default_workers()
    const std::atomic<bool> *cancel{nullptr};    // optional, owned by the caller
};

class FileSharder
{
  public:
    explicit FileSharder(ShardOptions opts) : opts_(opts) {}

    // Split `input_path` into chunks written to `out`. The manifest is only
    // filled in when every chunk has been written; on failure chunks that were
    // already written stay in the store (see remove_chunks).
    bool shard(const std::string       &input_path,
               store::IChunkStore      &out,
               manifest::ShardManifest &result,
               blobshard::Error        &err) const;

  private:
    ShardOptions opts_;
};

// Explicit cleanup of chunk files, e.g. after a failed or cancelled run.
bool remove_chunks(const manifest::ShardManifest &m, store::IChunkStore &st,
                   blobshard::Error &err);
// Same, for a run that produced no manifest: removes chunk_000..chunk_{count-1}.
bool remove_chunks(std::size_t count, store::IChunkStore &st, blobshard::Error &err);

}  // namespace shard
