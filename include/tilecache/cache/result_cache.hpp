#pragma once

#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>
#include <tilecache/engine/engine.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tilecache::cache {

struct CachedQuery {
    std::string query;
    std::size_t rows = 0;
};

struct CacheStats {
    std::uint64_t version = 0;
    std::size_t entries = 0;
    std::size_t total_rows = 0;
    /// One entry per cached query, sorted by query text.
    std::vector<CachedQuery> queries;
};

/// True when the statement's leading keyword (case-insensitive, after leading
/// whitespace) starts with INSERT, UPDATE, DELETE, DROP, CREATE or ALTER.
[[nodiscard]] auto is_write_statement(std::string_view sql) noexcept -> bool;

/// Query text -> materialized table.
///
/// Keys are the exact query text. Any write routed through
/// execute_with_invalidation() clears every entry; invalidation is never
/// scoped to the tables a statement touches.
class ResultCache {
   public:
    explicit ResultCache(engine::Engine& engine) noexcept : engine_(engine) {}

    /// Return the cached table for `query`, running it on a miss. The returned
    /// table shares column storage with the cached one.
    [[nodiscard]] auto get_or_compute(std::string_view query) -> Result<Table>;

    /// Drop every entry and advance the version by one.
    void invalidate_all();

    /// Execute `statement`; invalidate the whole cache afterwards when it is a
    /// write statement. The engine lock is released before the cache lock is
    /// taken.
    [[nodiscard]] auto execute_with_invalidation(std::string_view statement)
        -> Result<std::int64_t>;

    [[nodiscard]] auto stats() const -> CacheStats;
    [[nodiscard]] auto version() const -> std::uint64_t;
    [[nodiscard]] auto contains(std::string_view query) const -> bool;

   private:
    engine::Engine& engine_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Table> entries_;
    std::uint64_t version_ = 0;
};

}  // namespace tilecache::cache
