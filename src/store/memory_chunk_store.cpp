#include <string>

#include "store/memory_chunk_store.hpp"

namespace store
{

bool MemoryChunkStore::put(const std::string &filename, const std::uint8_t *data, std::size_t len,
                           blobshard::Error & /*err*/)
{
    Bytes blob(data, data + len);
    std::lock_guard<std::mutex> lock(mu_);
    blobs_[filename] = std::move(blob);
    return true;
}

bool MemoryChunkStore::get(const std::string &filename, std::uint64_t expected_size, Bytes &out,
                           blobshard::Error &err) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto                        it = blobs_.find(filename);
    if (it == blobs_.end())
        return blobshard::fail(err, blobshard::ErrorCode::Io, "no such chunk: " + filename);
    if (it->second.size() != expected_size)
        return blobshard::fail(err, blobshard::ErrorCode::SizeMismatch,
                               filename + ": expected " + std::to_string(expected_size) +
                                   " bytes, got " + std::to_string(it->second.size()));
    out = it->second;
    return true;
}

bool MemoryChunkStore::remove(const std::string &filename, blobshard::Error & /*err*/)
{
    std::lock_guard<std::mutex> lock(mu_);
    blobs_.erase(filename);
    return true;
}

bool MemoryChunkStore::exists(const std::string &filename) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return blobs_.count(filename) != 0;
}

std::size_t MemoryChunkStore::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return blobs_.size();
}

Bytes *MemoryChunkStore::find(const std::string &filename)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto                        it = blobs_.find(filename);
    return it == blobs_.end() ? nullptr : &it->second;
}

}  // namespace store
