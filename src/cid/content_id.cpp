#include <cstring>

#include "cid/content_id.hpp"
#include "util/log.hpp"

namespace cid
{

static constexpr char B32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

void put_uvarint(std::vector<std::uint8_t> &out, std::uint64_t v)
{
    while (v >= 0x80)
    {
        out.push_back(static_cast<std::uint8_t>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(v));
}

bool get_uvarint(const std::vector<std::uint8_t> &in, std::size_t &pos, std::uint64_t &v)
{
    v = 0;
    for (unsigned shift = 0; shift < 64; shift += 7)
    {
        if (pos >= in.size())
            return false;
        std::uint8_t b = in[pos++];
        v |= static_cast<std::uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0)
            return true;
    }
    return false;  // overlong
}

std::string base32_encode(const std::vector<std::uint8_t> &bytes)
{
    std::string out;
    out.reserve((bytes.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int           bits   = 0;
    for (std::uint8_t b : bytes)
    {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5)
        {
            out.push_back(B32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0)
        out.push_back(B32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    return out;
}

bool base32_decode(std::string_view s, std::vector<std::uint8_t> &out)
{
    out.clear();
    out.reserve(s.size() * 5 / 8);
    std::uint32_t buffer = 0;
    int           bits   = 0;
    for (char c : s)
    {
        const char *p = std::strchr(B32_ALPHABET, c);
        if (c == '\0' || p == nullptr)
            return false;
        buffer = (buffer << 5) | static_cast<std::uint32_t>(p - B32_ALPHABET);
        bits += 5;
        if (bits >= 8)
        {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    // leftover bits must be zero padding, and fewer than one full byte
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0)
        return false;
    return true;
}

hasher::Digest composite_digest(std::string_view                   original_filename,
                                std::uint64_t                      total_size,
                                const std::vector<hasher::Digest> &ordered_chunk_digests)
{
    hasher::Sha256Stream h;
    h.update(original_filename);

    std::uint8_t size_be[8];
    for (int i = 0; i < 8; ++i)
        size_be[i] = static_cast<std::uint8_t>(total_size >> (56 - 8 * i));
    h.update(size_be, sizeof(size_be));

    for (const auto &d : ordered_chunk_digests)
        h.update(d.data(), d.size());
    return h.finish();
}

ContentIdentifier build(std::string_view                   original_filename,
                        std::uint64_t                      total_size,
                        const std::vector<hasher::Digest> &ordered_chunk_digests)
{
    ContentIdentifier id;
    id.digest = composite_digest(original_filename, total_size, ordered_chunk_digests);
    return id;
}

std::string encode(const ContentIdentifier &id)
{
    std::vector<std::uint8_t> bytes;
    bytes.reserve(4 + id.digest.size());
    put_uvarint(bytes, id.version);
    put_uvarint(bytes, id.codec);
    put_uvarint(bytes, id.hash_code);
    put_uvarint(bytes, id.digest.size());
    bytes.insert(bytes.end(), id.digest.begin(), id.digest.end());

    std::string out(1, MULTIBASE_BASE32);
    out += base32_encode(bytes);
    return out;
}

std::string ContentIdentifier::to_string() const
{
    return encode(*this);
}

std::optional<ContentIdentifier> decode(std::string_view token)
{
    if (token.size() < 2 || token[0] != MULTIBASE_BASE32)
    {
        LOG_DEBUG("decode: missing base32 multibase prefix");
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes;
    if (!base32_decode(token.substr(1), bytes))
    {
        LOG_DEBUG("decode: invalid base32 body");
        return std::nullopt;
    }

    std::size_t       pos = 0;
    std::uint64_t     mh_len = 0;
    ContentIdentifier id;
    if (!get_uvarint(bytes, pos, id.version) || !get_uvarint(bytes, pos, id.codec) ||
        !get_uvarint(bytes, pos, id.hash_code) || !get_uvarint(bytes, pos, mh_len))
    {
        LOG_DEBUG("decode: truncated header");
        return std::nullopt;
    }
    if (id.version != CID_VERSION || id.codec != CODEC_RAW || id.hash_code != MH_SHA2_256 ||
        mh_len != hasher::DIGEST_SIZE)
    {
        LOG_DEBUG("decode: unsupported cid (version=%llu codec=0x%llx hash=0x%llx len=%llu)",
                  (unsigned long long)id.version, (unsigned long long)id.codec,
                  (unsigned long long)id.hash_code, (unsigned long long)mh_len);
        return std::nullopt;
    }
    if (bytes.size() - pos != hasher::DIGEST_SIZE)
    {
        LOG_DEBUG("decode: digest length mismatch (%zu)", bytes.size() - pos);
        return std::nullopt;
    }
    std::memcpy(id.digest.data(), bytes.data() + pos, hasher::DIGEST_SIZE);
    return id;
}

}  // namespace cid
