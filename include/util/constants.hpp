#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Chunking defaults
inline constexpr std::uint64_t DEFAULT_CHUNK_SIZE_MB = 256;
inline constexpr std::uint64_t BYTES_PER_MB          = 1024 * 1024;
inline constexpr std::size_t   MAX_DEFAULT_WORKERS   = 4;
inline constexpr std::size_t   MAX_WORKERS           = 64;
// a manifest is a few hundred bytes per chunk; anything bigger is not one
inline constexpr std::uint64_t MAX_MANIFEST_BYTES    = 256ull * 1024 * 1024;

// On-disk naming
inline constexpr std::string_view DEFAULT_OUTPUT_DIR = "output";
inline constexpr std::string_view CHUNK_PREFIX       = "chunk_";
inline constexpr std::string_view CHUNK_SUFFIX       = ".part";
inline constexpr std::string_view MANIFEST_SUFFIX    = "_metadata.json";
inline constexpr std::string_view PARTIAL_SUFFIX     = ".partial";

// Environment overrides
inline constexpr const char *ENV_LOG_LEVEL     = "BLOBSHARD_LOG_LEVEL";
inline constexpr const char *ENV_CHUNK_SIZE_MB = "BLOBSHARD_CHUNK_SIZE_MB";
inline constexpr const char *ENV_WORKERS       = "BLOBSHARD_WORKERS";
inline constexpr const char *ENV_OUTPUT_DIR    = "BLOBSHARD_OUTPUT_DIR";

}  // namespace constants
