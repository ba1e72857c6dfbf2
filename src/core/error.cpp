#include <tilecache/core/error.hpp>

#include <fmt/core.h>

namespace tilecache {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Engine:
            return "engine error";
        case ErrorKind::Lock:
            return "lock error";
        case ErrorKind::NotInitialized:
            return "not initialized";
        case ErrorKind::MalformedBuffer:
            return "malformed buffer";
        case ErrorKind::Unsupported:
            return "unsupported";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace tilecache
