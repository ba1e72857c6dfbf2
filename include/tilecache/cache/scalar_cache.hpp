#pragma once

#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace tilecache::cache {

/// Single-slot cache holding one fully computed byte buffer.
///
/// The slot is written only by precompute()/store() and replaced wholesale
/// each time. Concurrent writers race with last-write-wins; version() lets
/// readers detect that the slot changed.
class ScalarCache {
   public:
    using Producer = std::function<Result<codec::Bytes>()>;

    explicit ScalarCache(std::string name) : name_(std::move(name)) {}

    /// Run `produce` without holding the slot lock, then replace the slot
    /// with its output. On failure the slot is left untouched.
    [[nodiscard]] auto precompute(const Producer& produce) -> Result<std::chrono::milliseconds>;

    void store(codec::Bytes bytes);

    /// Copy of the stored buffer, or NotInitialized before the first store.
    [[nodiscard]] auto fetch() const -> Result<codec::Bytes>;

    [[nodiscard]] auto initialized() const -> bool;
    [[nodiscard]] auto version() const -> std::uint64_t;
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

   private:
    std::string name_;
    mutable std::mutex mutex_;
    std::optional<codec::Bytes> slot_;
    std::uint64_t version_ = 0;
};

}  // namespace tilecache::cache
