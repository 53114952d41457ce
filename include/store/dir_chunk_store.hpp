#pragma once
#include <string>

#include "store/ichunk_store.hpp"

namespace store
{

// Chunk files as plain files inside one directory.
class DirChunkStore final : public IChunkStore
{
  public:
    explicit DirChunkStore(std::string dir) : dir_(std::move(dir)) {}

    // mkdir -p; called once before the first put()
    bool ensure_dir(blobshard::Error &err) const;

    bool        put(const std::string &filename, const std::uint8_t *data, std::size_t len,
                    blobshard::Error &err) override;
    bool        get(const std::string &filename, std::uint64_t expected_size, Bytes &out,
                    blobshard::Error &err) const override;
    bool        remove(const std::string &filename, blobshard::Error &err) override;
    bool        exists(const std::string &filename) const override;
    std::string name() const override { return "dir"; }

    std::string path_of(const std::string &filename) const;

  private:
    std::string dir_;
};

}  // namespace store
