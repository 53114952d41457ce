#include <cstring>
#include <sodium.h>

#include "crypto/chunk_hasher.hpp"

namespace hasher
{

static_assert(DIGEST_SIZE == crypto_hash_sha256_BYTES, "digest size mismatch");
static_assert(sizeof(crypto_hash_sha256_state) <= 128, "sha256 state does not fit");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

static crypto_hash_sha256_state *as_state(std::uint8_t *p)
{
    return reinterpret_cast<crypto_hash_sha256_state *>(p);
}

Digest digest(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    Digest out{};
    crypto_hash_sha256(out.data(), data, static_cast<unsigned long long>(len));
    return out;
}

Digest digest(const std::vector<std::uint8_t> &bytes)
{
    return digest(bytes.data(), bytes.size());
}

Sha256Stream::Sha256Stream()
{
    ensure_sodium_init();
    crypto_hash_sha256_init(as_state(state_.data()));
}

void Sha256Stream::update(const std::uint8_t *data, std::size_t len)
{
    if (finished_ || len == 0)
        return;
    crypto_hash_sha256_update(as_state(state_.data()), data, static_cast<unsigned long long>(len));
}

void Sha256Stream::update(std::string_view s)
{
    update(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
}

Digest Sha256Stream::finish()
{
    Digest out{};
    if (!finished_)
    {
        crypto_hash_sha256_final(as_state(state_.data()), out.data());
        sodium_memzero(state_.data(), state_.size());
        finished_ = true;
    }
    return out;
}

std::string to_hex(const Digest &d)
{
    char buf[HEX_SIZE + 1];
    sodium_bin2hex(buf, sizeof(buf), d.data(), d.size());
    return std::string(buf, HEX_SIZE);
}

bool from_hex(std::string_view hex, Digest &out)
{
    if (hex.size() != HEX_SIZE)
        return false;
    ensure_sodium_init();
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) !=
            0 ||
        bin_len != out.size() || end != hex.data() + hex.size())
    {
        return false;
    }
    return true;
}

}  // namespace hasher
