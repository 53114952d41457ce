#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "util/error.hpp"

namespace store
{

using Bytes = std::vector<std::uint8_t>;

// Where chunk files go when sharding and where they come from when reassembling.
// Implementations must tolerate concurrent calls on distinct filenames.
struct IChunkStore
{
    virtual bool        put(const std::string &filename, const std::uint8_t *data,
                            std::size_t len, blobshard::Error &err)                  = 0;
    // A stored blob whose size is not `expected_size` fails with SizeMismatch
    // and is not read.
    virtual bool        get(const std::string &filename, std::uint64_t expected_size,
                            Bytes &out, blobshard::Error &err) const                 = 0;
    virtual bool        remove(const std::string &filename, blobshard::Error &err)   = 0;
    virtual bool        exists(const std::string &filename) const                    = 0;
    virtual std::string name() const { return ""; }
    virtual ~IChunkStore() = default;
};

}  // namespace store
