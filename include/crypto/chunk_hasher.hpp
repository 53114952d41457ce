#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hasher
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_hash_sha256_BYTES
constexpr std::size_t HEX_SIZE    = DIGEST_SIZE * 2;

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// SHA2-256 of one buffer. Inputs are at most one chunk, never a whole file.
Digest digest(const std::uint8_t *data, std::size_t len);
Digest digest(const std::vector<std::uint8_t> &bytes);

// Incremental SHA2-256, used where the input is a concatenation of parts
class Sha256Stream
{
  public:
    Sha256Stream();
    void   update(const std::uint8_t *data, std::size_t len);
    void   update(std::string_view s);
    Digest finish();

  private:
    // storage for crypto_hash_sha256_state, kept opaque to avoid sodium.h here
    alignas(8) std::array<std::uint8_t, 128> state_{};
    bool finished_{false};
};

std::string to_hex(const Digest &d);
// Exactly HEX_SIZE hex characters, nothing else
bool        from_hex(std::string_view hex, Digest &out);

}  // namespace hasher
