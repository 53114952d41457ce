#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/options.hpp"
#include "shard/file_sharder.hpp"
#include "shard/manifest.hpp"
#include "shard/reassembler.hpp"
#include "store/dir_chunk_store.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{
namespace fs = std::filesystem;

std::atomic<bool> g_cancel{false};

void on_signal(int)
{
    g_cancel.store(true);
}

static void install_signal_handlers()
{
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static int report(const blobshard::Error &err)
{
    std::fprintf(stderr, "error: %s\n", blobshard::describe(err).c_str());
    return exitc::from_error(err);
}

static int cmd_shard(const cli::ShardConfig &cfg)
{
    store::DirChunkStore chunks(cfg.output_dir);
    blobshard::Error     err;

    LOG_INFO("Input file: %s", cfg.input_path.c_str());
    LOG_INFO("Output directory: %s", cfg.output_dir.c_str());

    // validate before creating the output directory
    if (cfg.chunk_size_bytes == 0)
    {
        blobshard::fail(err, blobshard::ErrorCode::Config, "chunk size must be > 0");
        return report(err);
    }
    if (!chunks.ensure_dir(err))
        return report(err);

    shard::ShardOptions opts;
    opts.chunk_size_bytes = cfg.chunk_size_bytes;
    opts.workers          = cfg.workers;
    opts.cancel           = &g_cancel;

    manifest::ShardManifest m;
    if (!shard::FileSharder(opts).shard(cfg.input_path, chunks, m, err))
        return report(err);

    const std::string manifest_path =
        (fs::path(cfg.output_dir) / manifest::manifest_filename(m.original_file)).string();
    if (!manifest::save(manifest_path, m, err))
        return report(err);

    std::printf("Original file: %s\n", m.original_file.c_str());
    std::printf("Total size: %llu bytes\n", (unsigned long long)m.total_size);
    std::printf("Chunks created: %zu\n", m.chunk_count);
    std::printf("Manifest: %s\n", manifest_path.c_str());
    std::printf("Global CID: %s\n", m.identifier.to_string().c_str());
    for (const auto &c : m.chunks)
    {
        std::printf("  %zu: %s (%llu bytes, sha256: %s)\n", c.index, c.filename.c_str(),
                    (unsigned long long)c.size, hasher::to_hex(c.digest).c_str());
    }
    return exitc::ok;
}

static int cmd_reassemble(const cli::ReassembleConfig &cfg)
{
    blobshard::Error        err;
    manifest::ShardManifest m;
    if (!manifest::load(cfg.manifest_path, m, err))
        return report(err);

    store::DirChunkStore chunks(cli::chunk_dir_of(cfg.manifest_path));
    shard::ReassembleOptions opts;
    opts.workers = cfg.workers;
    opts.cancel  = &g_cancel;

    const std::string out_path = (fs::path(cfg.output_dir) / m.original_file).string();
    if (!shard::Reassembler(opts).reassemble_to_file(m, chunks, out_path, err))
        return report(err);

    std::printf("Reassembled: %s (%llu bytes)\n", out_path.c_str(),
                (unsigned long long)m.total_size);
    std::printf("Original CID: %s\n", m.identifier.to_string().c_str());
    return exitc::ok;
}

static int cmd_verify(const cli::ReassembleConfig &cfg)
{
    blobshard::Error        err;
    manifest::ShardManifest m;
    if (!manifest::load(cfg.manifest_path, m, err))
        return report(err);

    store::DirChunkStore     chunks(cli::chunk_dir_of(cfg.manifest_path));
    shard::ReassembleOptions opts;
    opts.workers = cfg.workers;
    opts.cancel  = &g_cancel;
    if (!shard::Reassembler(opts).verify(m, chunks, err))
        return report(err);

    std::printf("OK %s (%zu chunks)\n", m.identifier.to_string().c_str(), m.chunk_count);
    return exitc::ok;
}

static int cmd_clean(const cli::ReassembleConfig &cfg)
{
    blobshard::Error        err;
    manifest::ShardManifest m;
    if (!manifest::load(cfg.manifest_path, m, err))
        return report(err);

    // manifest first: leftover chunks are harmless, a manifest without chunks is not
    std::error_code ec;
    if (!fs::remove(cfg.manifest_path, ec) && ec)
    {
        blobshard::fail(err, blobshard::ErrorCode::Io,
                        "remove(" + cfg.manifest_path + ") failed: " + ec.message());
        return report(err);
    }
    store::DirChunkStore chunks(cli::chunk_dir_of(cfg.manifest_path));
    if (!shard::remove_chunks(m, chunks, err))
        return report(err);

    std::printf("Removed %s and %zu chunks\n", cfg.manifest_path.c_str(), m.chunk_count);
    return exitc::ok;
}

static int cmd_cid(const cli::ReassembleConfig &cfg)
{
    blobshard::Error        err;
    manifest::ShardManifest m;
    if (!manifest::load(cfg.manifest_path, m, err))
        return report(err);
    std::printf("%s\n", m.identifier.to_string().c_str());
    return exitc::ok;
}

static int run_cmd(const cli::Options &opts)
{
    std::unordered_map<int, std::function<int()>> cmd_map = {
        {static_cast<int>(cli::Command::Shard), [&] { return cmd_shard(opts.shard); }},
        {static_cast<int>(cli::Command::Reassemble),
         [&] { return cmd_reassemble(opts.reassemble); }},
        {static_cast<int>(cli::Command::Verify), [&] { return cmd_verify(opts.reassemble); }},
        {static_cast<int>(cli::Command::Clean), [&] { return cmd_clean(opts.reassemble); }},
        {static_cast<int>(cli::Command::Cid), [&] { return cmd_cid(opts.reassemble); }},
    };

    auto it = cmd_map.find(static_cast<int>(opts.cmd));
    if (it == cmd_map.end())
    {
        std::fputs(cli::usage(), stderr);
        return exitc::bad_args;
    }
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *lv = std::getenv(constants::ENV_LOG_LEVEL))
        blobshard::set_log_level_by_name(lv);

    std::vector<std::string> args(argv + 1, argv + argc);
    cli::Options             opts;
    std::string              error;
    if (!cli::parse_args(args, opts, error))
    {
        std::fputs(cli::usage(), stderr);
        std::fprintf(stderr, "error: %s\n", error.c_str());
        return exitc::bad_args;
    }
    if (opts.cmd == cli::Command::Help)
    {
        std::fputs(cli::usage(), stdout);
        return exitc::ok;
    }
    if (!opts.log_level.empty())
        blobshard::set_log_level_by_name(opts.log_level.c_str());
    if (!opts.config_error.empty())
    {
        blobshard::Error err;
        blobshard::fail(err, blobshard::ErrorCode::Config, opts.config_error);
        return report(err);
    }

    install_signal_handlers();
    return run_cmd(opts);
}
