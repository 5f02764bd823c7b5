/**
 * @file Error.cpp
 * @brief Error code names and error descriptions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "plr/core/Error.hpp"

#include <format>

namespace plr::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                return "none";
        case ErrorCode::kInvalidArgument:     return "invalid_argument";
        case ErrorCode::kInvalidState:        return "invalid_state";
        case ErrorCode::kOutOfRange:          return "out_of_range";
        case ErrorCode::kIoError:             return "io_error";
        case ErrorCode::kFileNotFound:        return "file_not_found";
        case ErrorCode::kDecompressionFailed: return "decompression_failed";
        case ErrorCode::kMalformedRecord:     return "malformed_record";
        case ErrorCode::kUnknownColorCode:    return "unknown_color_code";
        case ErrorCode::kEmptyStream:         return "empty_stream";
        case ErrorCode::kSinkFailed:          return "sink_failed";
        case ErrorCode::kInternalError:       return "internal_error";
    }
    return "unknown";
}

std::string Error::describe() const
{
    if (_offset)
        return std::format("{}: {} (byte offset {})", errorCodeName(_code), _message, *_offset);
    return std::format("{}: {}", errorCodeName(_code), _message);
}

} // namespace plr::core
