#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/chunk_hasher.hpp"

/*
Token layout (CIDv1):

  'b' + base32lower( uvarint(version=1)
                   | uvarint(codec=0x55 raw)
                   | uvarint(mh code=0x12 sha2-256)
                   | uvarint(mh len=32)
                   | composite digest[32] )

The composite digest is SHA2-256 over
  name bytes | u64 big-endian total size | chunk digest 0 | ... | chunk digest n-1
*/

namespace cid
{

inline constexpr std::uint64_t CID_VERSION       = 1;
inline constexpr std::uint64_t CODEC_RAW         = 0x55;
inline constexpr std::uint64_t MH_SHA2_256       = 0x12;
inline constexpr char          MULTIBASE_BASE32  = 'b';
inline constexpr std::size_t   TOKEN_SIZE        = 59;  // 1 + ceil(36 * 8 / 5)

struct ContentIdentifier
{
    std::uint64_t  version{CID_VERSION};
    std::uint64_t  codec{CODEC_RAW};
    std::uint64_t  hash_code{MH_SHA2_256};
    hasher::Digest digest{};

    std::string to_string() const;
    bool        operator==(const ContentIdentifier &o) const
    {
        return version == o.version && codec == o.codec && hash_code == o.hash_code &&
               digest == o.digest;
    }
    bool operator!=(const ContentIdentifier &o) const { return !(*this == o); }
};

hasher::Digest    composite_digest(std::string_view                   original_filename,
                                   std::uint64_t                      total_size,
                                   const std::vector<hasher::Digest> &ordered_chunk_digests);

ContentIdentifier build(std::string_view                   original_filename,
                        std::uint64_t                      total_size,
                        const std::vector<hasher::Digest> &ordered_chunk_digests);

std::string                      encode(const ContentIdentifier &id);
// Accepts only v1 / raw / sha2-256 / 32-byte digest tokens
std::optional<ContentIdentifier> decode(std::string_view token);

// --- building blocks, exposed for tests ---
void        put_uvarint(std::vector<std::uint8_t> &out, std::uint64_t v);
bool        get_uvarint(const std::vector<std::uint8_t> &in, std::size_t &pos, std::uint64_t &v);
std::string base32_encode(const std::vector<std::uint8_t> &bytes);
bool        base32_decode(std::string_view s, std::vector<std::uint8_t> &out);

}  // namespace cid
