#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cli
{

enum class Command
{
    None,
    Help,
    Shard,
    Reassemble,
    Verify,
    Clean,
    Cid
};

struct ShardConfig
{
    std::string   input_path;
    std::string   output_dir;
    std::uint64_t chunk_size_bytes{0};
    std::size_t   workers{0};  // 0 = default
};

// Also used by verify / clean / cid, which only need manifest_path.
struct ReassembleConfig
{
    std::string manifest_path;
    std::string output_dir;
    std::size_t workers{0};
};

struct Options
{
    Command          cmd{Command::None};
    std::string      log_level;     // empty = keep BLOBSHARD_LOG_LEVEL / default
    std::string      config_error;  // well-formed args, unusable value (ConfigError)
    ShardConfig      shard;
    ReassembleConfig reassemble;
};

// Defaults with BLOBSHARD_* environment overrides applied. Invalid env values
// are ignored with a warning.
ShardConfig      default_shard_config();
ReassembleConfig default_reassemble_config();

// argv[1..] -> Options. Flags override the environment. On failure `error`
// holds a one-line reason. A chunk size that is not a positive number of MB
// that fits in 64 bits is not a usage error: it lands in `config_error`.
bool parse_args(const std::vector<std::string> &args, Options &out, std::string &error);

// Decimal, digits only, no sign, no overflow
bool parse_u64(const std::string &s, std::uint64_t &out);
// MB -> bytes, false on overflow. Zero passes through (rejected by the sharder).
bool mb_to_bytes(std::uint64_t mb, std::uint64_t &bytes);

// Directory that holds the chunks of the manifest at `manifest_path`
std::string chunk_dir_of(const std::string &manifest_path);

const char *usage();

}  // namespace cli
