#include <cstdint>
#include <cstdlib>
#include <filesystem>

#include "cli/options.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace cli
{

const char *usage()
{
    return "Usage:\n"
           "  blobshard [--log-level <level>] <command> [args]\n"
           "\n"
           "Commands:\n"
           "  shard <input> [--output-dir D] [--chunk-size-mb N] [--workers W]\n"
           "  reassemble <manifest> [--output-dir D] [--workers W]\n"
           "  verify <manifest> [--workers W]\n"
           "  clean <manifest>\n"
           "  cid <manifest>\n"
           "\n"
           "Environment:\n"
           "  BLOBSHARD_LOG_LEVEL, BLOBSHARD_CHUNK_SIZE_MB, BLOBSHARD_WORKERS,\n"
           "  BLOBSHARD_OUTPUT_DIR\n";
}

bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s.size() > 20)
        return false;
    std::uint64_t v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10)
            return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool mb_to_bytes(std::uint64_t mb, std::uint64_t &bytes)
{
    if (mb > UINT64_MAX / constants::BYTES_PER_MB)
        return false;
    bytes = mb * constants::BYTES_PER_MB;
    return true;
}

std::string chunk_dir_of(const std::string &manifest_path)
{
    std::string dir = std::filesystem::path(manifest_path).parent_path().string();
    return dir.empty() ? std::string(".") : dir;
}

static std::string env_output_dir()
{
    if (const char *e = std::getenv(constants::ENV_OUTPUT_DIR); e && *e)
        return e;
    return std::string(constants::DEFAULT_OUTPUT_DIR);
}

static std::size_t env_workers()
{
    const char *e = std::getenv(constants::ENV_WORKERS);
    if (!e)
        return 0;
    std::uint64_t v = 0;
    if (parse_u64(e, v) && v >= 1 && v <= constants::MAX_WORKERS)
    {
        LOG_DEBUG("Using workers=%llu (from %s)", (unsigned long long)v, constants::ENV_WORKERS);
        return static_cast<std::size_t>(v);
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect 1..%zu)", constants::ENV_WORKERS, e,
             constants::MAX_WORKERS);
    return 0;
}

ShardConfig default_shard_config()
{
    ShardConfig cfg;
    cfg.output_dir = env_output_dir();
    cfg.workers    = env_workers();

    std::uint64_t mb = constants::DEFAULT_CHUNK_SIZE_MB;
    if (const char *e = std::getenv(constants::ENV_CHUNK_SIZE_MB))
    {
        std::uint64_t v = 0, bytes = 0;
        if (parse_u64(e, v) && v > 0 && mb_to_bytes(v, bytes))
        {
            mb = v;
            LOG_INFO("Using chunk_size=%llu MB (from %s)", (unsigned long long)mb,
                     constants::ENV_CHUNK_SIZE_MB);
        }
        else
        {
            LOG_WARN("Ignoring invalid %s='%s' (expect a positive number of MB)",
                     constants::ENV_CHUNK_SIZE_MB, e);
        }
    }
    cfg.chunk_size_bytes = mb * constants::BYTES_PER_MB;
    return cfg;
}

ReassembleConfig default_reassemble_config()
{
    ReassembleConfig cfg;
    cfg.output_dir = env_output_dir();
    cfg.workers    = env_workers();
    return cfg;
}

static Command command_from_name(const std::string &name)
{
    if (name == "shard")
        return Command::Shard;
    if (name == "reassemble")
        return Command::Reassemble;
    if (name == "verify")
        return Command::Verify;
    if (name == "clean")
        return Command::Clean;
    if (name == "cid")
        return Command::Cid;
    return Command::None;
}

bool parse_args(const std::vector<std::string> &args, Options &out, std::string &error)
{
    Options opts;
    opts.shard      = default_shard_config();
    opts.reassemble = default_reassemble_config();

    std::vector<std::string> positional;
    bool                     have_output_dir = false;
    std::string              output_dir;
    std::size_t              workers      = 0;
    bool                     have_workers = false;
    bool                     have_chunk   = false;

    auto need_value = [&](std::size_t &i, const std::string &flag, std::string &value) -> bool {
        if (i + 1 >= args.size())
        {
            error = "missing value for " + flag;
            return false;
        }
        value = args[++i];
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        std::string        v;
        if (a == "--help" || a == "-h")
        {
            out.cmd = Command::Help;
            return true;
        }
        else if (a == "--log-level")
        {
            if (!need_value(i, a, v))
                return false;
            opts.log_level = v;
        }
        else if (a == "--output-dir" || a == "-o")
        {
            if (!need_value(i, a, v))
                return false;
            if (v.empty())
            {
                error = "empty output directory";
                return false;
            }
            output_dir      = v;
            have_output_dir = true;
        }
        else if (a == "--chunk-size-mb" || a == "-c")
        {
            if (!need_value(i, a, v))
                return false;
            std::uint64_t mb = 0, bytes = 0;
            if (!parse_u64(v, mb))
                opts.config_error = "invalid chunk size '" + v + "'";
            else if (!mb_to_bytes(mb, bytes))
                opts.config_error = "chunk size too large: " + v + " MB";
            else
                opts.shard.chunk_size_bytes = bytes;
            have_chunk = true;
        }
        else if (a == "--workers" || a == "-w")
        {
            if (!need_value(i, a, v))
                return false;
            std::uint64_t w = 0;
            if (!parse_u64(v, w) || w == 0 || w > constants::MAX_WORKERS)
            {
                error = "invalid worker count '" + v + "' (expect 1.." +
                        std::to_string(constants::MAX_WORKERS) + ")";
                return false;
            }
            workers      = static_cast<std::size_t>(w);
            have_workers = true;
        }
        else if (a.size() > 1 && a[0] == '-')
        {
            error = "unknown option " + a;
            return false;
        }
        else
        {
            positional.push_back(a);
        }
    }

    if (positional.empty())
    {
        error = "missing command";
        return false;
    }
    opts.cmd = command_from_name(positional[0]);
    if (opts.cmd == Command::None)
    {
        error = "unknown command '" + positional[0] + "'";
        return false;
    }
    if (positional.size() != 2)
    {
        error = positional[0] + " expects exactly one path argument";
        return false;
    }
    if (have_chunk && opts.cmd != Command::Shard)
    {
        error = "--chunk-size-mb only applies to shard";
        return false;
    }

    if (opts.cmd == Command::Shard)
    {
        opts.shard.input_path = positional[1];
        if (have_output_dir)
            opts.shard.output_dir = output_dir;
        if (have_workers)
            opts.shard.workers = workers;
    }
    else
    {
        opts.reassemble.manifest_path = positional[1];
        if (have_output_dir)
            opts.reassemble.output_dir = output_dir;
        if (have_workers)
            opts.reassemble.workers = workers;
    }
    out = std::move(opts);
    return true;
}

}  // namespace cli
