#include <tilecache/cache/scalar_cache.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace tilecache::cache {

auto ScalarCache::precompute(const Producer& produce) -> Result<std::chrono::milliseconds> {
    const auto start = std::chrono::steady_clock::now();
    auto bytes = produce();
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    const std::size_t size = bytes->size();
    store(std::move(*bytes));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("{} precomputed: bytes={}, elapsed_ms={}", name_, size, elapsed.count());
    return elapsed;
}

void ScalarCache::store(codec::Bytes bytes) {
    std::lock_guard<std::mutex> guard(mutex_);
    slot_ = std::move(bytes);
    ++version_;
}

auto ScalarCache::fetch() const -> Result<codec::Bytes> {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!slot_) {
        return make_error(ErrorKind::NotInitialized,
                          fmt::format("{} not initialized; precompute it first", name_));
    }
    return *slot_;
}

auto ScalarCache::initialized() const -> bool {
    std::lock_guard<std::mutex> guard(mutex_);
    return slot_.has_value();
}

auto ScalarCache::version() const -> std::uint64_t {
    std::lock_guard<std::mutex> guard(mutex_);
    return version_;
}

}  // namespace tilecache::cache
