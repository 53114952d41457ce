#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace blobshard
{

enum class ErrorCode
{
    None = 0,
    Config,        // invalid chunk size / worker count
    Io,            // open/read/write failure on input, chunks or manifest
    Format,        // malformed manifest
    Integrity,     // chunk digest mismatch
    SizeMismatch,  // chunk or total size mismatch
    Cancelled      // caller raised the cancel flag
};

struct Error
{
    ErrorCode                  code{ErrorCode::None};
    std::optional<std::size_t> chunk_index;
    std::string                message;

    explicit operator bool() const { return code != ErrorCode::None; }
    void     clear()
    {
        code = ErrorCode::None;
        chunk_index.reset();
        message.clear();
    }
};

inline const char *error_code_name(ErrorCode c)
{
    switch (c)
    {
        case ErrorCode::None:
            return "OK";
        case ErrorCode::Config:
            return "ConfigError";
        case ErrorCode::Io:
            return "IoError";
        case ErrorCode::Format:
            return "FormatError";
        case ErrorCode::Integrity:
            return "IntegrityError";
        case ErrorCode::SizeMismatch:
            return "SizeMismatchError";
        case ErrorCode::Cancelled:
            return "Cancelled";
    }
    return "?";
}

// Fill `err` and return false, so call sites can `return fail(err, ...)`.
inline bool fail(Error &err, ErrorCode code, std::string msg,
                 std::optional<std::size_t> chunk_index = std::nullopt)
{
    err.code        = code;
    err.chunk_index = chunk_index;
    err.message     = std::move(msg);
    return false;
}

// "IntegrityError (chunk 1): ..." - one line suitable for logs and CLI output
inline std::string describe(const Error &err)
{
    std::string s = error_code_name(err.code);
    if (err.chunk_index)
        s += " (chunk " + std::to_string(*err.chunk_index) + ")";
    if (!err.message.empty())
        s += ": " + err.message;
    return s;
}

}  // namespace blobshard
