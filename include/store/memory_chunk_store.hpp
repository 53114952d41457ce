#pragma once
#include <mutex>
#include <unordered_map>

#include "store/ichunk_store.hpp"

namespace store
{

// In-process chunk store: lets a caller shard into memory and hand the blobs
// to an uploader, and keeps tests off the filesystem.
class MemoryChunkStore final : public IChunkStore
{
  public:
    bool        put(const std::string &filename, const std::uint8_t *data, std::size_t len,
                    blobshard::Error &err) override;
    bool        get(const std::string &filename, std::uint64_t expected_size, Bytes &out,
                    blobshard::Error &err) const override;
    bool        remove(const std::string &filename, blobshard::Error &err) override;
    bool        exists(const std::string &filename) const override;
    std::string name() const override { return "memory"; }

    std::size_t size() const;
    // direct access for tests that tamper with stored chunks; not synchronized
    // against concurrent put/remove
    Bytes      *find(const std::string &filename);

  private:
    mutable std::mutex                     mu_;
    std::unordered_map<std::string, Bytes> blobs_;
};

}  // namespace store
