#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "shard/manifest.hpp"
#include "store/ichunk_store.hpp"
#include "util/error.hpp"

namespace shard
{

struct ReassembleOptions
{
    std::size_t              workers{0};       // verifiers running ahead of the writer
    const std::atomic<bool> *cancel{nullptr};  // optional, owned by the caller
};

// Rebuilds a file from its manifest and chunk store. Chunks are read and
// verified (size, then digest) in parallel, but consumed strictly in index
// order; the first failing index aborts the run.
class Reassembler
{
  public:
    explicit Reassembler(ReassembleOptions opts = {}) : opts_(opts) {}

    // Writes "<output_path>.partial" and renames it over `output_path` only
    // after every chunk verified and the total size matched.
    bool reassemble_to_file(const manifest::ShardManifest &m,
                            const store::IChunkStore      &src,
                            const std::string             &output_path,
                            blobshard::Error              &err) const;

    bool reassemble_to_bytes(const manifest::ShardManifest &m,
                             const store::IChunkStore      &src,
                             std::vector<std::uint8_t>     &out,
                             blobshard::Error              &err) const;

    // Read and check every chunk, write nothing.
    bool verify(const manifest::ShardManifest &m,
                const store::IChunkStore      &src,
                blobshard::Error              &err) const;

  private:
    using ChunkSink =
        std::function<bool(std::size_t index, const store::Bytes &bytes, blobshard::Error &err)>;

    bool check_request(const manifest::ShardManifest &m, blobshard::Error &err) const;
    bool run(const manifest::ShardManifest &m,
             const store::IChunkStore      &src,
             const ChunkSink               &sink,
             blobshard::Error              &err) const;

    ReassembleOptions opts_;
};

// Size first, then digest. Errors name the chunk index.
bool check_chunk(const manifest::ChunkDescriptor &desc,
                 const store::Bytes              &bytes,
                 blobshard::Error                &err);

}  // namespace shard
