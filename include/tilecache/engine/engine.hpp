#pragma once

#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

struct sqlite3;

namespace tilecache::engine {

/// Connection settings applied when the engine is opened.
struct EngineConfig {
    /// Database file, or ":memory:" for a private in-memory database.
    std::string database_path = ":memory:";
    /// Maximum number of rows per materialized result batch.
    std::size_t batch_rows = 2048;
    /// Page cache budget in KiB (PRAGMA cache_size = -N).
    std::int64_t cache_size_kib = 64 * 1024;
    /// Keep temporary tables and indices in memory.
    bool temp_store_memory = true;
    std::string journal_mode = "MEMORY";
};

/// Positional statement parameter (bound to ?1, ?2, ...).
using SqlParam = std::variant<std::int64_t, double, std::string, Blob>;
using SqlParams = std::vector<SqlParam>;

/// Access to the connection while the engine lock is held.
///
/// A Session is only handed out by Engine::with_session and must not outlive
/// the callback it was passed to.
class Session {
   public:
    Session(sqlite3* db, std::size_t batch_rows) noexcept : db_(db), batch_rows_(batch_rows) {}

    /// Execute one statement; returns the number of rows it changed.
    [[nodiscard]] auto execute(std::string_view sql, const SqlParams& params = {})
        -> Result<std::int64_t>;

    /// Execute a batch of semicolon-separated statements.
    [[nodiscard]] auto execute_script(std::string_view sql) -> Result<void>;

    /// Run a query and return its result split into batches of at most
    /// `batch_rows` rows each. A query without rows yields one empty batch
    /// carrying the column names.
    [[nodiscard]] auto query_batches(std::string_view sql, const SqlParams& params = {})
        -> Result<std::vector<Table>>;

    /// Run a query and materialize all of its batches into one table.
    [[nodiscard]] auto query(std::string_view sql, const SqlParams& params = {})
        -> Result<Table>;

    /// Query plan for `sql`, one line per plan step.
    [[nodiscard]] auto explain(std::string_view sql) -> Result<std::string>;

   private:
    sqlite3* db_;
    std::size_t batch_rows_;
};

/// Shared handle to the embedded SQL engine.
///
/// All access is serialized by a single mutex: only one statement or query
/// runs at a time and contending callers block.
class Engine {
    struct OpenKey {
        explicit OpenKey() = default;
    };

   public:
    [[nodiscard]] static auto open(EngineConfig config = {}) -> Result<std::unique_ptr<Engine>>;

    Engine(OpenKey /*key*/, sqlite3* db, EngineConfig config) noexcept
        : db_(db), config_(std::move(config)) {}
    ~Engine();
    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return config_; }

    /// Run `fn(Session&)` with the engine lock held for its whole duration.
    template <typename Fn>
        requires std::invocable<Fn, Session&>
    auto with_session(Fn&& fn) -> std::invoke_result_t<Fn, Session&> {
        std::lock_guard<std::mutex> guard(mutex_);
        Session session(db_, config_.batch_rows);
        return std::forward<Fn>(fn)(session);
    }

    [[nodiscard]] auto execute(std::string_view sql, const SqlParams& params = {})
        -> Result<std::int64_t>;
    [[nodiscard]] auto execute_script(std::string_view sql) -> Result<void>;
    [[nodiscard]] auto query_batches(std::string_view sql, const SqlParams& params = {})
        -> Result<std::vector<Table>>;
    [[nodiscard]] auto query(std::string_view sql, const SqlParams& params = {})
        -> Result<Table>;
    [[nodiscard]] auto explain(std::string_view sql) -> Result<std::string>;

   private:
    sqlite3* db_;
    EngineConfig config_;
    std::mutex mutex_;
};

}  // namespace tilecache::engine
