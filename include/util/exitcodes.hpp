#pragma once

#include "util/error.hpp"

namespace exitc
{
inline constexpr int ok        = 0;
inline constexpr int failure   = 1;
inline constexpr int bad_args  = 2;
inline constexpr int io        = 3;
inline constexpr int format    = 4;
inline constexpr int integrity = 5;
inline constexpr int size      = 6;
inline constexpr int config    = 7;
inline constexpr int cancelled = 8;

inline int from_error(const blobshard::Error &err)
{
    using blobshard::ErrorCode;
    switch (err.code)
    {
        case ErrorCode::None:
            return ok;
        case ErrorCode::Config:
            return config;
        case ErrorCode::Io:
            return io;
        case ErrorCode::Format:
            return format;
        case ErrorCode::Integrity:
            return integrity;
        case ErrorCode::SizeMismatch:
            return size;
        case ErrorCode::Cancelled:
            return cancelled;
    }
    return failure;
}
}  // namespace exitc
