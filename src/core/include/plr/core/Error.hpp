/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the PlaceReplay error codes and a lightweight Error value type
 * carrying the code, a human-readable message, the source location where
 * the error was raised and, for decoder failures, the byte offset of the
 * offending record in the diff stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_ERROR_HPP
    #define PLR_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <optional>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace plr::core {

/**
 * @brief PlaceReplay error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kOutOfRange,

    kIoError,
    kFileNotFound,
    kDecompressionFailed,

    kMalformedRecord,
    kUnknownColorCode,
    kEmptyStream,

    kSinkFailed,

    kInternalError,
};

/**
 * @brief Stable lowercase name of an error code, for logs and tests.
 */
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief Byte offset in the diff stream, when the error comes from a record.
    [[nodiscard]] std::optional<u64>   offset()   const { return _offset; }

    /// @brief Attach the byte offset of the record that caused the error.
    Error &atOffset(u64 offset) { _offset = offset; return *this; }

    /// @brief "<code>: <message>" plus the offset when known.
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
    std::optional<u64>   _offset;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

/// @brief Same as makeError() for failures tied to a record of the diff stream.
[[nodiscard]] inline auto makeRecordError(
    ErrorCode code,
    std::string message,
    u64 offset,
    std::source_location loc = std::source_location::current())
{
    Error err{code, std::move(message), loc};
    err.atOffset(offset);
    return std::unexpected<Error>(std::move(err));
}

} // namespace plr::core

#endif // PLR_CORE_ERROR_HPP
