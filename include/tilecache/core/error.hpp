#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace tilecache {

enum class ErrorKind : std::uint8_t {
    /// Query or statement failure inside the engine.
    Engine,
    /// The engine's storage was locked by another holder.
    Lock,
    /// Scalar cache read before any precompute.
    NotInitialized,
    /// Byte length inconsistent with the header.
    MalformedBuffer,
    /// Operation or column type not wired for the requested layout.
    Unsupported,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Error carried by every fallible tilecache operation.
struct Error {
    ErrorKind kind = ErrorKind::Engine;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace tilecache
