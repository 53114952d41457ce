// tests/test_manifest.cpp
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>
#include <vector>

#include "cid/content_id.hpp"
#include "shard/manifest.hpp"

using namespace manifest;
using blobshard::Error;
using blobshard::ErrorCode;
using json = nlohmann::json;

static ShardManifest make_manifest(const std::string &name, std::size_t total, std::size_t cs)
{
    std::vector<std::uint8_t> data(total);
    for (std::size_t i = 0; i < total; ++i)
        data[i] = static_cast<std::uint8_t>(i);

    ShardManifest m;
    m.original_file = name;
    m.total_size    = total;
    m.chunk_size    = cs;
    for (std::size_t off = 0, i = 0; off < total; off += cs, ++i)
    {
        const std::size_t len = std::min(cs, total - off);
        ChunkDescriptor   c;
        c.index    = i;
        c.filename = chunk_filename(i);
        c.size     = len;
        c.digest   = hasher::digest(data.data() + off, len);
        m.chunks.push_back(c);
    }
    m.chunk_count = m.chunks.size();
    m.identifier  = cid::build(m.original_file, m.total_size, m.ordered_digests());
    return m;
}

static json as_json(const ShardManifest &m)
{
    return json::parse(serialize(m));
}

static bool parse_json(const json &j, ShardManifest &out, Error &err)
{
    return parse(j.dump(), out, err);
}

TEST(Manifest, ChunkFilenames)
{
    EXPECT_EQ(chunk_filename(0), "chunk_000.part");
    EXPECT_EQ(chunk_filename(42), "chunk_042.part");
    EXPECT_EQ(chunk_filename(1234), "chunk_1234.part");

    EXPECT_EQ(chunk_index_from_filename("chunk_007.part"), 7u);
    EXPECT_EQ(chunk_index_from_filename("chunk_1234.part"), 1234u);
    EXPECT_FALSE(chunk_index_from_filename("chunk_7.part").has_value());
    EXPECT_FALSE(chunk_index_from_filename("chunk_0x1.part").has_value());
    EXPECT_FALSE(chunk_index_from_filename("piece_000.part").has_value());
    EXPECT_FALSE(chunk_index_from_filename("chunk_.part").has_value());
}

TEST(Manifest, ManifestFilename)
{
    EXPECT_EQ(manifest_filename("photo.raw"), "photo_metadata.json");
    EXPECT_EQ(manifest_filename("model.v2.glb"), "model_metadata.json");
    EXPECT_EQ(manifest_filename("noext"), "noext_metadata.json");
    EXPECT_EQ(manifest_filename(".hidden"), "file_metadata.json");
}

TEST(Manifest, ReservedOriginalNames_FormatError)
{
    std::string why;
    EXPECT_TRUE(usable_original_name("photo.raw", why));
    EXPECT_TRUE(usable_original_name("chunk_7.part", why));
    EXPECT_TRUE(usable_original_name("metadata.json", why));
    EXPECT_FALSE(usable_original_name("chunk_000.part", why));
    EXPECT_EQ(why, "reserved for chunk files");
    EXPECT_FALSE(usable_original_name("photo_metadata.json", why));
    EXPECT_EQ(why, "reserved for manifest files");
    EXPECT_FALSE(usable_original_name("a/b", why));
    EXPECT_FALSE(usable_original_name("..", why));

    // rebuilding next to the shards would overwrite a chunk
    for (const char *name : {"chunk_000.part", "other_metadata.json"})
    {
        auto  m = make_manifest(name, 10, 4);
        Error err;
        EXPECT_FALSE(validate(m, err)) << name;
        EXPECT_EQ(err.code, ErrorCode::Format);
        EXPECT_NE(err.message.find("reserved"), std::string::npos) << err.message;

        ShardManifest parsed;
        Error         perr;
        EXPECT_FALSE(parse(serialize(m), parsed, perr)) << name;
        EXPECT_EQ(perr.code, ErrorCode::Format);
    }
}

TEST(Manifest, SerializeHasExpectedFields)
{
    auto m = make_manifest("hello.bin", 10, 4);
    json j = as_json(m);
    EXPECT_EQ(j["original_file"], "hello.bin");
    EXPECT_EQ(j["total_size"], 10);
    EXPECT_EQ(j["chunk_size"], 4);
    EXPECT_EQ(j["chunk_count"], 3);
    ASSERT_EQ(j["chunks"].size(), 3u);
    EXPECT_EQ(j["chunks"][2]["filename"], "chunk_002.part");
    EXPECT_EQ(j["chunks"][2]["size"], 2);
    EXPECT_EQ(j["chunks"][0]["sha256"],
              "054edec1d0211f624fed0cbca9d4f9400b0e491c43742af2c5b0abebf0c990d8");
    EXPECT_EQ(j["cid"], "bafkreihulaezddu2zaaaw55piwo5n5nco363ghb42wr4rbc7yuzhdk5lsq");
}

TEST(Manifest, ParseSerialized)
{
    auto          m = make_manifest("hello.bin", 10, 4);
    ShardManifest back;
    Error         err;
    ASSERT_TRUE(parse(serialize(m), back, err)) << blobshard::describe(err);
    EXPECT_EQ(back.original_file, m.original_file);
    EXPECT_EQ(back.total_size, 10u);
    EXPECT_EQ(back.chunk_count, 3u);
    ASSERT_EQ(back.chunks.size(), 3u);
    EXPECT_EQ(back.chunks[1].digest, m.chunks[1].digest);
    EXPECT_EQ(back.identifier, m.identifier);
}

TEST(Manifest, CountMismatch_FormatError)
{
    auto m = make_manifest("hello.bin", 10, 4);
    json j = as_json(m);
    j["chunks"].erase(2);  // chunk_count still says 3

    ShardManifest out;
    Error         err;
    EXPECT_FALSE(parse_json(j, out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
    EXPECT_NE(err.message.find("chunk_count"), std::string::npos);
}

TEST(Manifest, ShuffledArrayIsSortedByIndex)
{
    auto m = make_manifest("hello.bin", 10, 4);
    json j = as_json(m);
    std::swap(j["chunks"][0], j["chunks"][2]);

    ShardManifest out;
    Error         err;
    ASSERT_TRUE(parse_json(j, out, err)) << blobshard::describe(err);
    for (std::size_t i = 0; i < out.chunks.size(); ++i)
    {
        EXPECT_EQ(out.chunks[i].index, i);
        EXPECT_EQ(out.chunks[i].digest, m.chunks[i].digest);
    }
}

TEST(Manifest, DuplicateIndex_FormatError)
{
    auto m = make_manifest("hello.bin", 12, 4);
    json j = as_json(m);
    j["chunks"][2]["index"] = 1;

    ShardManifest out;
    Error         err;
    EXPECT_FALSE(parse_json(j, out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
    ASSERT_TRUE(err.chunk_index.has_value());
    EXPECT_EQ(*err.chunk_index, 1u);
}

TEST(Manifest, IndexGap_FormatError)
{
    auto m = make_manifest("hello.bin", 12, 4);
    json j = as_json(m);
    j["chunks"][2]["index"]    = 3;
    j["chunks"][2]["filename"] = chunk_filename(3);

    ShardManifest out;
    Error         err;
    EXPECT_FALSE(parse_json(j, out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
}

TEST(Manifest, MissingFields_FormatError)
{
    auto m = make_manifest("hello.bin", 10, 4);
    for (const char *field : {"original_file", "total_size", "chunk_count", "chunks", "cid"})
    {
        json j = as_json(m);
        j.erase(field);
        ShardManifest out;
        Error         err;
        EXPECT_FALSE(parse_json(j, out, err)) << field;
        EXPECT_EQ(err.code, ErrorCode::Format) << field;
    }
    for (const char *field : {"filename", "size", "sha256"})
    {
        json j = as_json(m);
        j["chunks"][1].erase(field);
        ShardManifest out;
        Error         err;
        EXPECT_FALSE(parse_json(j, out, err)) << field;
        EXPECT_EQ(err.code, ErrorCode::Format) << field;
    }
}

TEST(Manifest, MalformedValues_FormatError)
{
    auto m = make_manifest("hello.bin", 10, 4);

    auto expect_reject = [](const json &j, const char *what) {
        ShardManifest out;
        Error         err;
        EXPECT_FALSE(parse_json(j, out, err)) << what;
        EXPECT_EQ(err.code, ErrorCode::Format) << what;
    };

    json j = as_json(m);
    j["total_size"] = -10;
    expect_reject(j, "negative total_size");

    j               = as_json(m);
    j["total_size"] = "10";
    expect_reject(j, "string total_size");

    j                        = as_json(m);
    j["chunks"][0]["sha256"] = "abcd";
    expect_reject(j, "short digest");

    j        = as_json(m);
    j["cid"] = "not-a-cid";
    expect_reject(j, "bad cid");

    j                  = as_json(m);
    j["original_file"] = "../etc/passwd";
    expect_reject(j, "path in original_file");

    j                      = as_json(m);
    j["chunks"][0]["size"] = 3;
    expect_reject(j, "short non-final chunk");

    j               = as_json(m);
    j["total_size"] = 11;
    expect_reject(j, "sizes do not sum");

    ShardManifest out;
    Error         err;
    EXPECT_FALSE(parse("{ not json", out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
    EXPECT_FALSE(parse("[1, 2, 3]", out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
}

TEST(Manifest, CidMustMatchContents)
{
    auto m     = make_manifest("hello.bin", 10, 4);
    auto other = make_manifest("other.bin", 10, 4);
    json j     = as_json(m);
    j["cid"]   = other.identifier.to_string();

    ShardManifest out;
    Error         err;
    EXPECT_FALSE(parse_json(j, out, err));
    EXPECT_EQ(err.code, ErrorCode::Format);
    EXPECT_NE(err.message.find("does not match"), std::string::npos);
}

TEST(Manifest, LegacyLayoutWithoutIndexOrChunkSize)
{
    auto m = make_manifest("hello.bin", 10, 4);
    json j = as_json(m);
    j.erase("chunk_size");
    for (auto &c : j["chunks"])
        c.erase("index");
    std::swap(j["chunks"][0], j["chunks"][1]);

    ShardManifest out;
    Error         err;
    ASSERT_TRUE(parse_json(j, out, err)) << blobshard::describe(err);
    EXPECT_EQ(out.chunk_size, 4u);
    EXPECT_EQ(out.chunks[0].filename, "chunk_000.part");
    EXPECT_EQ(out.chunks[1].filename, "chunk_001.part");
}

TEST(Manifest, IdentifierKeyAlias)
{
    auto m          = make_manifest("hello.bin", 10, 4);
    json j          = as_json(m);
    j["identifier"] = j["cid"];
    j.erase("cid");

    ShardManifest out;
    Error         err;
    ASSERT_TRUE(parse_json(j, out, err)) << blobshard::describe(err);
    EXPECT_EQ(out.identifier, m.identifier);
}

TEST(Manifest, EmptyFile)
{
    auto m = make_manifest("empty.bin", 0, 4);
    EXPECT_EQ(m.chunk_count, 0u);

    ShardManifest out;
    Error         err;
    ASSERT_TRUE(parse(serialize(m), out, err)) << blobshard::describe(err);
    EXPECT_EQ(out.total_size, 0u);
    EXPECT_TRUE(out.chunks.empty());
    EXPECT_EQ(out.identifier.to_string(),
              "bafkreifdor6rlkp34ske7jrscfucz2igq3icj4w7zjbbkawjt5m5wtypoa");
}

TEST(Manifest, SaveLoad)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("blobshard-manifest-" + std::to_string(getpid()));
    fs::create_directories(dir);
    const std::string path = (dir / "hello_metadata.json").string();

    auto  m = make_manifest("hello.bin", 10, 4);
    Error err;
    ASSERT_TRUE(save(path, m, err)) << blobshard::describe(err);
    EXPECT_FALSE(fs::exists(path + ".partial"));

    ShardManifest back;
    ASSERT_TRUE(load(path, back, err)) << blobshard::describe(err);
    EXPECT_EQ(back.identifier, m.identifier);

    Error missing;
    EXPECT_FALSE(load((dir / "nope.json").string(), back, missing));
    EXPECT_EQ(missing.code, ErrorCode::Io);

    fs::remove_all(dir);
}
