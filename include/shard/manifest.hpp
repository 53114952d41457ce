#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cid/content_id.hpp"
#include "crypto/chunk_hasher.hpp"
#include "util/error.hpp"

/*
<stem>_metadata.json:

{
  "original_file": "photo.raw",
  "total_size": 10,
  "chunk_size": 4,
  "chunk_count": 3,
  "chunks": [
    { "index": 0, "filename": "chunk_000.part", "size": 4, "sha256": "<64 hex>" },
    ...
  ],
  "cid": "bafkrei..."
}
*/

namespace manifest
{

struct ChunkDescriptor
{
    std::size_t    index{0};
    std::string    filename;
    std::uint64_t  size{0};
    hasher::Digest digest{};
};

// Produced once per sharding run, never mutated afterwards.
struct ShardManifest
{
    std::string                  original_file;
    std::uint64_t                total_size{0};
    std::uint64_t                chunk_size{0};
    std::size_t                  chunk_count{0};
    std::vector<ChunkDescriptor> chunks;  // sorted by index
    cid::ContentIdentifier       identifier;

    std::vector<hasher::Digest> ordered_digests() const;
};

std::string                chunk_filename(std::size_t index);
std::optional<std::size_t> chunk_index_from_filename(std::string_view filename);
std::string                manifest_filename(std::string_view original_file);

// A plain file name that cannot land on a chunk or manifest file when the file
// is rebuilt next to its shards. On false `why` says what is wrong.
bool usable_original_name(const std::string &name, std::string &why);

std::string serialize(const ShardManifest &m);

// Parses and fully validates; on failure `out` is left untouched.
bool parse(std::string_view text, ShardManifest &out, blobshard::Error &err);

// Structural invariants: contiguous indices, canonical filenames, chunk sizes,
// size sum and the identifier matching the contents.
bool validate(const ShardManifest &m, blobshard::Error &err);

bool save(const std::string &path, const ShardManifest &m, blobshard::Error &err);
bool load(const std::string &path, ShardManifest &out, blobshard::Error &err);

}  // namespace manifest
