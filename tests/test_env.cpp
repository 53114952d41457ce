// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cli/options.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(LogLevel, FiltersByThreshold)
{
    using namespace blobshard;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error %d", 42);
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error 42"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);
    EXPECT_EQ(out2.back(), '\n');

    // DEBUG: DEBUG should appear
    set_log_level_by_name("debug");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level_by_name("info");
}

TEST(Config, Defaults)
{
    EnvGuard g_mb(constants::ENV_CHUNK_SIZE_MB);
    EnvGuard g_w(constants::ENV_WORKERS);
    EnvGuard g_out(constants::ENV_OUTPUT_DIR);
    g_mb.unset();
    g_w.unset();
    g_out.unset();

    auto cfg = cli::default_shard_config();
    EXPECT_EQ(cfg.chunk_size_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(cfg.output_dir, "output");
    EXPECT_EQ(cfg.workers, 0u);
}

TEST(Config, EnvOverrides)
{
    EnvGuard g_mb(constants::ENV_CHUNK_SIZE_MB);
    EnvGuard g_w(constants::ENV_WORKERS);
    EnvGuard g_out(constants::ENV_OUTPUT_DIR);
    g_mb.set("8");
    g_w.set("3");
    g_out.set("/tmp/blobshard-env-out");

    auto cfg = cli::default_shard_config();
    EXPECT_EQ(cfg.chunk_size_bytes, 8ull * 1024 * 1024);
    EXPECT_EQ(cfg.workers, 3u);
    EXPECT_EQ(cfg.output_dir, "/tmp/blobshard-env-out");

    auto rcfg = cli::default_reassemble_config();
    EXPECT_EQ(rcfg.workers, 3u);
    EXPECT_EQ(rcfg.output_dir, "/tmp/blobshard-env-out");
}

TEST(Config, InvalidEnvIgnoredWithWarning)
{
    EnvGuard g_mb(constants::ENV_CHUNK_SIZE_MB);
    EnvGuard g_w(constants::ENV_WORKERS);
    g_mb.set("0");
    g_w.set("lots");

    blobshard::set_log_level_by_name("info");
    testing::internal::CaptureStderr();
    auto        cfg = cli::default_shard_config();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.chunk_size_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(cfg.workers, 0u);
    EXPECT_NE(err.find("Ignoring invalid BLOBSHARD_CHUNK_SIZE_MB"), std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid BLOBSHARD_WORKERS"), std::string::npos);
}

TEST(Config, ParseShardArgs)
{
    EnvGuard g_mb(constants::ENV_CHUNK_SIZE_MB);
    g_mb.set("8");

    cli::Options opts;
    std::string  error;
    ASSERT_TRUE(cli::parse_args({"shard", "in.bin", "--output-dir", "out", "--chunk-size-mb", "2",
                                 "--workers", "5"},
                                opts, error))
        << error;
    EXPECT_EQ(opts.cmd, cli::Command::Shard);
    EXPECT_EQ(opts.shard.input_path, "in.bin");
    EXPECT_EQ(opts.shard.output_dir, "out");
    // flag beats env
    EXPECT_EQ(opts.shard.chunk_size_bytes, 2ull * 1024 * 1024);
    EXPECT_EQ(opts.shard.workers, 5u);
}

TEST(Config, ParseReassembleArgs)
{
    cli::Options opts;
    std::string  error;
    ASSERT_TRUE(cli::parse_args({"--log-level", "debug", "reassemble", "out/x_metadata.json", "-o",
                                 "restored"},
                                opts, error))
        << error;
    EXPECT_EQ(opts.cmd, cli::Command::Reassemble);
    EXPECT_EQ(opts.log_level, "debug");
    EXPECT_EQ(opts.reassemble.manifest_path, "out/x_metadata.json");
    EXPECT_EQ(opts.reassemble.output_dir, "restored");
    EXPECT_EQ(cli::chunk_dir_of(opts.reassemble.manifest_path), "out");
    EXPECT_EQ(cli::chunk_dir_of("x_metadata.json"), ".");
}

TEST(Config, ParseRejectsBadArgs)
{
    cli::Options opts;
    std::string  error;
    EXPECT_FALSE(cli::parse_args({}, opts, error));
    EXPECT_FALSE(cli::parse_args({"explode", "x"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"shard"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"shard", "a", "b"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"shard", "a", "--workers", "0"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"shard", "a", "--output-dir"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"verify", "m.json", "--chunk-size-mb", "4"}, opts, error));
    EXPECT_FALSE(cli::parse_args({"shard", "a", "--bogus"}, opts, error));

    // zero parses; the sharder rejects it with ConfigError
    ASSERT_TRUE(cli::parse_args({"shard", "a", "--chunk-size-mb", "0"}, opts, error));
    EXPECT_EQ(opts.shard.chunk_size_bytes, 0u);
    EXPECT_TRUE(opts.config_error.empty());

    // unusable chunk sizes are configuration errors, not usage errors
    ASSERT_TRUE(cli::parse_args({"shard", "a", "--chunk-size-mb", "-1"}, opts, error));
    EXPECT_NE(opts.config_error.find("invalid chunk size"), std::string::npos);
    ASSERT_TRUE(cli::parse_args({"shard", "a", "--chunk-size-mb", "99999999999999999"}, opts,
                                error));
    EXPECT_NE(opts.config_error.find("too large"), std::string::npos);

    ASSERT_TRUE(cli::parse_args({"-h"}, opts, error));
    EXPECT_EQ(opts.cmd, cli::Command::Help);
}

TEST(ExitCodes, FromError)
{
    blobshard::Error err;
    EXPECT_EQ(exitc::from_error(err), exitc::ok);
    blobshard::fail(err, blobshard::ErrorCode::Integrity, "bad", 3);
    EXPECT_EQ(exitc::from_error(err), exitc::integrity);
    EXPECT_EQ(blobshard::describe(err), "IntegrityError (chunk 3): bad");
    blobshard::fail(err, blobshard::ErrorCode::Config, "zero");
    EXPECT_EQ(exitc::from_error(err), exitc::config);
    EXPECT_EQ(blobshard::describe(err), "ConfigError: zero");
}
