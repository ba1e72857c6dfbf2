#include <tilecache/cache/result_cache.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace tilecache::cache {

namespace {

constexpr std::array<std::string_view, 6> kWriteKeywords = {
    "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER",
};

auto starts_with_ignore_case(std::string_view text, std::string_view prefix) noexcept -> bool {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(text[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto is_write_statement(std::string_view sql) noexcept -> bool {
    const auto start = std::find_if_not(sql.begin(), sql.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    sql.remove_prefix(static_cast<std::size_t>(start - sql.begin()));
    return std::any_of(kWriteKeywords.begin(), kWriteKeywords.end(),
                       [&](std::string_view keyword) {
                           return starts_with_ignore_case(sql, keyword);
                       });
}

auto ResultCache::get_or_compute(std::string_view query) -> Result<Table> {
    std::uint64_t observed_version = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (auto it = entries_.find(std::string(query)); it != entries_.end()) {
            spdlog::debug("result cache hit: {}", query);
            return it->second;
        }
        observed_version = version_;
    }

    spdlog::debug("result cache miss: {}", query);
    auto batches = engine_.query_batches(query);
    if (!batches) {
        return std::unexpected(batches.error());
    }
    auto table = concat_tables(*batches);
    if (!table) {
        return std::unexpected(table.error());
    }

    std::lock_guard<std::mutex> guard(mutex_);
    // A write invalidated the cache while the query ran; the result may
    // predate it, so hand it back without storing it.
    if (version_ == observed_version) {
        entries_.insert_or_assign(std::string(query), *table);
    }
    return table;
}

void ResultCache::invalidate_all() {
    std::lock_guard<std::mutex> guard(mutex_);
    const std::size_t dropped = entries_.size();
    entries_.clear();
    ++version_;
    spdlog::debug("result cache invalidated: version={}, dropped={}", version_, dropped);
}

auto ResultCache::execute_with_invalidation(std::string_view statement) -> Result<std::int64_t> {
    // Engine::execute holds the engine lock only for the statement itself.
    auto rows = engine_.execute(statement);
    if (!rows) {
        return rows;
    }
    if (is_write_statement(statement)) {
        invalidate_all();
    }
    return rows;
}

auto ResultCache::stats() const -> CacheStats {
    std::lock_guard<std::mutex> guard(mutex_);
    CacheStats out;
    out.version = version_;
    out.entries = entries_.size();
    out.queries.reserve(entries_.size());
    for (const auto& [query, table] : entries_) {
        out.total_rows += table.rows();
        out.queries.push_back(CachedQuery{.query = query, .rows = table.rows()});
    }
    std::sort(out.queries.begin(), out.queries.end(),
              [](const CachedQuery& a, const CachedQuery& b) { return a.query < b.query; });
    return out;
}

auto ResultCache::version() const -> std::uint64_t {
    std::lock_guard<std::mutex> guard(mutex_);
    return version_;
}

auto ResultCache::contains(std::string_view query) const -> bool {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.contains(std::string(query));
}

}  // namespace tilecache::cache
