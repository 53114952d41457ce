#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

#include "shard/manifest.hpp"
#include "util/constants.hpp"
#include "util/fd_io.hpp"
#include "util/log.hpp"

namespace manifest
{

using blobshard::ErrorCode;
using blobshard::fail;
using json = nlohmann::ordered_json;

std::vector<hasher::Digest> ShardManifest::ordered_digests() const
{
    std::vector<hasher::Digest> out;
    out.reserve(chunks.size());
    for (const auto &c : chunks)
        out.push_back(c.digest);
    return out;
}

std::string chunk_filename(std::size_t index)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%03zu", index);
    return std::string(constants::CHUNK_PREFIX) + buf + std::string(constants::CHUNK_SUFFIX);
}

std::optional<std::size_t> chunk_index_from_filename(std::string_view filename)
{
    const auto prefix = constants::CHUNK_PREFIX;
    const auto suffix = constants::CHUNK_SUFFIX;
    if (filename.size() <= prefix.size() + suffix.size() ||
        filename.substr(0, prefix.size()) != prefix ||
        filename.substr(filename.size() - suffix.size()) != suffix)
        return std::nullopt;

    std::string_view digits =
        filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    if (digits.size() > 18)
        return std::nullopt;
    std::size_t index = 0;
    for (char c : digits)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    // only the canonical zero-padded spelling names a chunk
    if (chunk_filename(index) != filename)
        return std::nullopt;
    return index;
}

std::string manifest_filename(std::string_view original_file)
{
    std::string_view stem = original_file.substr(0, original_file.find('.'));
    if (stem.empty())
        stem = "file";
    return std::string(stem) + std::string(constants::MANIFEST_SUFFIX);
}

std::string serialize(const ShardManifest &m)
{
    json j;
    j["original_file"] = m.original_file;
    j["total_size"]    = m.total_size;
    j["chunk_size"]    = m.chunk_size;
    j["chunk_count"]   = m.chunk_count;
    j["chunks"]        = json::array();
    for (const auto &c : m.chunks)
    {
        json jc;
        jc["index"]    = c.index;
        jc["filename"] = c.filename;
        jc["size"]     = c.size;
        jc["sha256"]   = hasher::to_hex(c.digest);
        j["chunks"].push_back(std::move(jc));
    }
    j["cid"] = m.identifier.to_string();
    return j.dump(2) + "\n";
}

bool usable_original_name(const std::string &name, std::string &why)
{
    // the name becomes the reassembled file name inside an output directory
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\0') != std::string::npos)
    {
        why = "not a plain file name";
        return false;
    }
    if (chunk_index_from_filename(name))
    {
        why = "reserved for chunk files";
        return false;
    }
    const auto suffix = constants::MANIFEST_SUFFIX;
    if (name.size() >= suffix.size() &&
        std::string_view(name).substr(name.size() - suffix.size()) == suffix)
    {
        why = "reserved for manifest files";
        return false;
    }
    return true;
}

bool validate(const ShardManifest &m, blobshard::Error &err)
{
    std::string why;
    if (!usable_original_name(m.original_file, why))
        return fail(err, ErrorCode::Format,
                    "invalid original_file '" + m.original_file + "': " + why);

    if (m.chunk_count != m.chunks.size())
        return fail(err, ErrorCode::Format,
                    "chunk_count " + std::to_string(m.chunk_count) + " does not match " +
                        std::to_string(m.chunks.size()) + " listed chunks");

    if (m.total_size == 0)
    {
        if (m.chunk_count != 0)
            return fail(err, ErrorCode::Format, "empty file must have zero chunks");
    }
    else
    {
        if (m.chunk_size == 0)
            return fail(err, ErrorCode::Format, "chunk_size must be > 0");
        const std::uint64_t want = (m.total_size - 1) / m.chunk_size + 1;
        if (want != m.chunk_count)
            return fail(err, ErrorCode::Format,
                        "chunk_count " + std::to_string(m.chunk_count) + " inconsistent with " +
                            std::to_string(m.total_size) + " bytes at chunk_size " +
                            std::to_string(m.chunk_size) + " (expected " + std::to_string(want) +
                            ")");
    }

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < m.chunks.size(); ++i)
    {
        const auto &c = m.chunks[i];
        if (c.index != i)
            return fail(err, ErrorCode::Format,
                        "chunk indices not contiguous: expected " + std::to_string(i) + ", got " +
                            std::to_string(c.index),
                        i);
        if (c.filename != chunk_filename(i))
            return fail(err, ErrorCode::Format,
                        "filename '" + c.filename + "' does not match index", i);

        const bool last = (i + 1 == m.chunks.size());
        if (!last && c.size != m.chunk_size)
            return fail(err, ErrorCode::Format,
                        "size " + std::to_string(c.size) + " != chunk_size " +
                            std::to_string(m.chunk_size),
                        i);
        if (last && (c.size == 0 || c.size > m.chunk_size))
            return fail(err, ErrorCode::Format,
                        "last chunk size " + std::to_string(c.size) + " out of range", i);
        sum += c.size;
    }
    if (sum != m.total_size)
        return fail(err, ErrorCode::Format,
                    "chunk sizes sum to " + std::to_string(sum) + ", total_size is " +
                        std::to_string(m.total_size));

    const auto expect = cid::build(m.original_file, m.total_size, m.ordered_digests());
    if (expect != m.identifier)
        return fail(err, ErrorCode::Format,
                    "cid " + m.identifier.to_string() + " does not match contents (expected " +
                        expect.to_string() + ")");
    return true;
}

bool parse(std::string_view text, ShardManifest &out, blobshard::Error &err)
{
    json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return fail(err, ErrorCode::Format, "manifest is not a JSON object");

    ShardManifest m;
    try
    {
        if (!j.contains("original_file") || !j["original_file"].is_string())
            return fail(err, ErrorCode::Format, "missing or non-string 'original_file'");
        m.original_file = j["original_file"].get<std::string>();

        if (!j.contains("total_size") || !j["total_size"].is_number_unsigned())
            return fail(err, ErrorCode::Format, "missing or invalid 'total_size'");
        m.total_size = j["total_size"].get<std::uint64_t>();

        if (!j.contains("chunk_count") || !j["chunk_count"].is_number_unsigned())
            return fail(err, ErrorCode::Format, "missing or invalid 'chunk_count'");
        m.chunk_count = j["chunk_count"].get<std::size_t>();

        if (!j.contains("chunks") || !j["chunks"].is_array())
            return fail(err, ErrorCode::Format, "missing or non-array 'chunks'");

        const json &jchunks = j["chunks"];
        m.chunks.reserve(jchunks.size());
        for (std::size_t pos = 0; pos < jchunks.size(); ++pos)
        {
            const json &jc = jchunks[pos];
            if (!jc.is_object())
                return fail(err, ErrorCode::Format,
                            "chunks[" + std::to_string(pos) + "] is not an object");

            ChunkDescriptor c;
            if (!jc.contains("filename") || !jc["filename"].is_string())
                return fail(err, ErrorCode::Format,
                            "chunks[" + std::to_string(pos) + "] missing 'filename'");
            c.filename = jc["filename"].get<std::string>();

            // index is authoritative; array order is not. Older manifests carry
            // only the filename, which encodes the index.
            if (jc.contains("index"))
            {
                if (!jc["index"].is_number_unsigned())
                    return fail(err, ErrorCode::Format,
                                "chunks[" + std::to_string(pos) + "] invalid 'index'");
                c.index = jc["index"].get<std::size_t>();
            }
            else
            {
                auto idx = chunk_index_from_filename(c.filename);
                if (!idx)
                    return fail(err, ErrorCode::Format,
                                "chunks[" + std::to_string(pos) + "] has no index and filename '" +
                                    c.filename + "' does not encode one");
                c.index = *idx;
            }

            if (!jc.contains("size") || !jc["size"].is_number_unsigned())
                return fail(err, ErrorCode::Format, "missing or invalid 'size'", c.index);
            c.size = jc["size"].get<std::uint64_t>();

            if (!jc.contains("sha256") || !jc["sha256"].is_string() ||
                !hasher::from_hex(jc["sha256"].get<std::string>(), c.digest))
                return fail(err, ErrorCode::Format, "missing or malformed 'sha256'", c.index);

            m.chunks.push_back(std::move(c));
        }

        if (j.contains("chunk_size"))
        {
            if (!j["chunk_size"].is_number_unsigned())
                return fail(err, ErrorCode::Format, "invalid 'chunk_size'");
            m.chunk_size = j["chunk_size"].get<std::uint64_t>();
        }

        const char *cid_key = j.contains("cid") ? "cid" : "identifier";
        if (!j.contains(cid_key) || !j[cid_key].is_string())
            return fail(err, ErrorCode::Format, "missing or non-string 'cid'");
        auto id = cid::decode(j[cid_key].get<std::string>());
        if (!id)
            return fail(err, ErrorCode::Format,
                        "malformed cid '" + j[cid_key].get<std::string>() + "'");
        m.identifier = *id;
    }
    catch (const json::exception &e)
    {
        return fail(err, ErrorCode::Format, std::string("manifest field error: ") + e.what());
    }

    std::sort(m.chunks.begin(), m.chunks.end(),
              [](const ChunkDescriptor &a, const ChunkDescriptor &b) { return a.index < b.index; });
    for (std::size_t i = 1; i < m.chunks.size(); ++i)
    {
        if (m.chunks[i].index == m.chunks[i - 1].index)
            return fail(err, ErrorCode::Format, "duplicate chunk index", m.chunks[i].index);
    }

    if (!j.contains("chunk_size"))
        m.chunk_size = m.chunks.empty() ? 0 : m.chunks.front().size;

    if (!validate(m, err))
        return false;

    out = std::move(m);
    return true;
}

bool save(const std::string &path, const ShardManifest &m, blobshard::Error &err)
{
    const std::string text = serialize(m);
    if (!fdio::write_file_atomic(path, reinterpret_cast<const std::uint8_t *>(text.data()),
                                 text.size(), err))
    {
        LOG_ERROR("saving manifest failed: %s", blobshard::describe(err).c_str());
        return false;
    }
    LOG_INFO("Manifest saved to %s (cid %s)", path.c_str(), m.identifier.to_string().c_str());
    return true;
}

bool load(const std::string &path, ShardManifest &out, blobshard::Error &err)
{
    std::vector<std::uint8_t> raw;
    if (!fdio::read_file(path, raw, err, constants::MAX_MANIFEST_BYTES))
        return false;
    std::string_view text(reinterpret_cast<const char *>(raw.data()), raw.size());
    if (!parse(text, out, err))
    {
        LOG_ERROR("%s: %s", path.c_str(), blobshard::describe(err).c_str());
        return false;
    }
    return true;
}

}  // namespace manifest
