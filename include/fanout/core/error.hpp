#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace fanout {

enum class ErrorKind : std::uint8_t {
    InvalidArgument,
    UnsupportedType,
    TypeCoercionError,
    IoError,
};

/// Error raised by planning, flattening or I/O.
struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    /// "<kind>: <message>", used by the CLI for diagnostics.
    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for every fallible fanout operation.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]] inline auto invalid_argument(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::InvalidArgument, .message = std::move(message)});
}

[[nodiscard]] inline auto unsupported_type(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::UnsupportedType, .message = std::move(message)});
}

[[nodiscard]] inline auto type_coercion_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::TypeCoercionError, .message = std::move(message)});
}

[[nodiscard]] inline auto io_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::IoError, .message = std::move(message)});
}

}  // namespace fanout
