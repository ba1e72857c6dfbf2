#include <tilecache/engine/engine.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace tilecache::engine {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

enum class SqlKind : std::uint8_t {
    Int,
    Real,
    Text,
    Blob,
};

/// Map an sqlite result code to the error taxonomy. Contention on the
/// database's own locks surfaces as a lock error, everything else as an
/// engine error carrying sqlite's message verbatim.
auto engine_error(sqlite3* db, int rc) -> std::unexpected<Error> {
    const int primary = rc & 0xff;
    const auto kind =
        (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) ? ErrorKind::Lock : ErrorKind::Engine;
    return make_error(kind, sqlite3_errmsg(db));
}

auto is_blank_tail(const char* tail, const char* end) -> bool {
    return std::all_of(tail, end, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0 || c == ';';
    });
}

auto prepare(sqlite3* db, std::string_view sql, const char** tail = nullptr)
    -> Result<StatementPtr> {
    sqlite3_stmt* raw = nullptr;
    const int rc =
        sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, tail);
    if (rc != SQLITE_OK) {
        return engine_error(db, rc);
    }
    if (raw == nullptr) {
        return make_error(ErrorKind::Engine, "empty statement");
    }
    return StatementPtr{raw};
}

auto bind_params(sqlite3* db, sqlite3_stmt* stmt, const SqlParams& params) -> Result<void> {
    const int expected = sqlite3_bind_parameter_count(stmt);
    if (static_cast<std::size_t>(expected) != params.size()) {
        return make_error(ErrorKind::Engine,
                          fmt::format("statement expects {} parameters, got {}", expected,
                                      params.size()));
    }
    for (std::size_t i = 0; i < params.size(); ++i) {
        const int slot = static_cast<int>(i) + 1;
        const int rc = std::visit(
            [&](const auto& value) -> int {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    return sqlite3_bind_int64(stmt, slot, value);
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(stmt, slot, value);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return sqlite3_bind_text(stmt, slot, value.data(),
                                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
                } else {
                    // A null pointer would bind SQL NULL, not an empty blob.
                    if (value.empty()) {
                        return sqlite3_bind_zeroblob(stmt, slot, 0);
                    }
                    return sqlite3_bind_blob(stmt, slot, value.data(),
                                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
                }
            },
            params[i]);
        if (rc != SQLITE_OK) {
            return engine_error(db, rc);
        }
    }
    return {};
}

/// Column kind from the declared type, following sqlite's affinity rules.
/// NUMERIC-affinity declarations and expressions return nullopt; those are
/// resolved from the storage class of the first non-null value instead.
auto kind_from_decltype(const char* decl) -> std::optional<SqlKind> {
    if (decl == nullptr) {
        return std::nullopt;
    }
    std::string upper(decl);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.find("INT") != std::string::npos) {
        return SqlKind::Int;
    }
    if (upper.find("CHAR") != std::string::npos || upper.find("CLOB") != std::string::npos ||
        upper.find("TEXT") != std::string::npos) {
        return SqlKind::Text;
    }
    if (upper.find("BLOB") != std::string::npos) {
        return SqlKind::Blob;
    }
    if (upper.find("REAL") != std::string::npos || upper.find("FLOA") != std::string::npos ||
        upper.find("DOUB") != std::string::npos) {
        return SqlKind::Real;
    }
    return std::nullopt;
}

auto kind_from_storage(int storage) -> std::optional<SqlKind> {
    switch (storage) {
        case SQLITE_INTEGER:
            return SqlKind::Int;
        case SQLITE_FLOAT:
            return SqlKind::Real;
        case SQLITE_TEXT:
            return SqlKind::Text;
        case SQLITE_BLOB:
            return SqlKind::Blob;
        default:
            return std::nullopt;
    }
}

auto empty_column(SqlKind kind) -> ColumnValue {
    switch (kind) {
        case SqlKind::Int:
            return Column<std::int64_t>{};
        case SqlKind::Real:
            return Column<double>{};
        case SqlKind::Blob:
            return Column<Blob>{};
        case SqlKind::Text:
            break;
    }
    return Column<std::string>{};
}

/// A column of `rows` placeholder values, for rows that are all null.
auto null_column(SqlKind kind, std::size_t rows) -> ColumnValue {
    auto column = empty_column(kind);
    std::visit(
        [&](auto& col) {
            using ColT = std::decay_t<decltype(col)>;
            col.reserve(rows);
            for (std::size_t i = 0; i < rows; ++i) {
                col.push_back(typename ColT::value_type{});
            }
        },
        column);
    return column;
}

/// Accumulates one result column of the current batch.
struct ColumnBuilder {
    std::string name;
    SqlKind kind = SqlKind::Text;
    // False until the kind is known from a declared type or a non-null value.
    bool resolved = false;
    // A later column with the same name replaces this one in each batch.
    bool shadowed = false;
    ColumnValue values;
    std::vector<bool> validity;
    bool has_null = false;

    void reset(std::size_t capacity) {
        values = empty_column(kind);
        std::visit([&](auto& col) { col.reserve(capacity); }, values);
        validity.clear();
        validity.reserve(capacity);
        has_null = false;
    }

    /// Switch to `next`. Only valid while every buffered row is null.
    void retype(SqlKind next) {
        kind = next;
        resolved = true;
        values = null_column(next, validity.size());
    }

    void append(sqlite3_stmt* stmt, int index) {
        const bool null = sqlite3_column_type(stmt, index) == SQLITE_NULL;
        has_null = has_null || null;
        validity.push_back(!null);
        std::visit(
            [&](auto& col) {
                using ColT = std::decay_t<decltype(col)>;
                if (null) {
                    col.push_back(typename ColT::value_type{});
                } else if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                    col.push_back(sqlite3_column_int64(stmt, index));
                } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                    col.push_back(sqlite3_column_double(stmt, index));
                } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                    const auto* text = sqlite3_column_text(stmt, index);
                    const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, index));
                    col.push_back(std::string(reinterpret_cast<const char*>(text), size));
                } else {
                    const auto* data = static_cast<const std::uint8_t*>(
                        sqlite3_column_blob(stmt, index));
                    const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, index));
                    col.push_back(data == nullptr ? Blob{} : Blob(data, data + size));
                }
            },
            values);
    }

    void finish_into(Table& table) {
        if (has_null) {
            table.add_column(name, std::move(values), std::move(validity));
        } else {
            table.add_column(name, std::move(values));
        }
    }
};

}  // namespace

auto Session::execute(std::string_view sql, const SqlParams& params) -> Result<std::int64_t> {
    const char* tail = nullptr;
    auto stmt = prepare(db_, sql, &tail);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (tail != nullptr && !is_blank_tail(tail, sql.data() + sql.size())) {
        return make_error(ErrorKind::Engine,
                          "execute() accepts a single statement; use execute_script()");
    }
    if (auto bound = bind_params(db_, stmt->get(), params); !bound) {
        return std::unexpected(bound.error());
    }

    const auto before = sqlite3_total_changes64(db_);
    int rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt->get());
    }
    if (rc != SQLITE_DONE) {
        return engine_error(db_, rc);
    }
    return static_cast<std::int64_t>(sqlite3_total_changes64(db_) - before);
}

auto Session::execute_script(std::string_view sql) -> Result<void> {
    char* message = nullptr;
    const std::string text(sql);
    const int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK) {
        return {};
    }
    std::string detail = message != nullptr ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    const int primary = rc & 0xff;
    const auto kind =
        (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) ? ErrorKind::Lock : ErrorKind::Engine;
    return make_error(kind, std::move(detail));
}

auto Session::query_batches(std::string_view sql, const SqlParams& params)
    -> Result<std::vector<Table>> {
    auto stmt = prepare(db_, sql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (auto bound = bind_params(db_, stmt->get(), params); !bound) {
        return std::unexpected(bound.error());
    }

    sqlite3_stmt* raw = stmt->get();
    const int ncols = sqlite3_column_count(raw);
    const std::size_t batch_rows = std::max<std::size_t>(batch_rows_, 1);

    std::vector<ColumnBuilder> builders(static_cast<std::size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        auto& builder = builders[static_cast<std::size_t>(c)];
        builder.name = sqlite3_column_name(raw, c);
        const auto declared = kind_from_decltype(sqlite3_column_decltype(raw, c));
        builder.kind = declared.value_or(SqlKind::Text);
        builder.resolved = declared.has_value();
        for (int prev = 0; prev < c; ++prev) {
            auto& earlier = builders[static_cast<std::size_t>(prev)];
            earlier.shadowed = earlier.shadowed || earlier.name == builder.name;
        }
    }

    std::vector<Table> batches;
    std::size_t pending = 0;
    auto flush = [&]() {
        Table batch;
        for (auto& builder : builders) {
            builder.finish_into(batch);
            builder.reset(batch_rows);
        }
        batches.push_back(std::move(batch));
        pending = 0;
    };

    for (auto& builder : builders) {
        builder.reset(batch_rows);
    }

    while (true) {
        const int rc = sqlite3_step(raw);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return engine_error(db_, rc);
        }
        // Columns without a usable declared type take the storage class of
        // their first non-null value. Rows before it are all null and are
        // retyped, including those in batches already flushed.
        for (int c = 0; c < ncols; ++c) {
            auto& builder = builders[static_cast<std::size_t>(c)];
            if (builder.resolved) {
                continue;
            }
            auto kind = kind_from_storage(sqlite3_column_type(raw, c));
            if (!kind) {
                continue;
            }
            builder.retype(*kind);
            if (builder.shadowed) {
                continue;
            }
            for (auto& batch : batches) {
                auto& entry = batch.columns[batch.index.at(builder.name)];
                entry.column =
                    std::make_shared<ColumnValue>(null_column(*kind, column_size(*entry.column)));
            }
        }
        for (int c = 0; c < ncols; ++c) {
            builders[static_cast<std::size_t>(c)].append(raw, c);
        }
        if (++pending == batch_rows) {
            flush();
        }
    }

    if (pending > 0 || batches.empty()) {
        flush();
    }
    return batches;
}

auto Session::query(std::string_view sql, const SqlParams& params) -> Result<Table> {
    auto batches = query_batches(sql, params);
    if (!batches) {
        return std::unexpected(batches.error());
    }
    return concat_tables(*batches);
}

auto Session::explain(std::string_view sql) -> Result<std::string> {
    auto plan = query(fmt::format("EXPLAIN QUERY PLAN {}", sql));
    if (!plan) {
        return std::unexpected(plan.error());
    }
    const auto* detail = std::get_if<Column<std::string>>(plan->find("detail"));
    if (detail == nullptr) {
        return make_error(ErrorKind::Unsupported, "query plan has no detail column");
    }
    std::string out;
    for (const auto& line : *detail) {
        out.append(line);
        out.push_back('\n');
    }
    return out;
}

auto Engine::open(EngineConfig config) -> Result<std::unique_ptr<Engine>> {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(config.database_path.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return make_error(ErrorKind::Engine,
                          fmt::format("failed to open '{}': {}", config.database_path, message));
    }

    auto engine = std::make_unique<Engine>(OpenKey{}, db, std::move(config));
    const auto& cfg = engine->config_;
    auto tuned = engine->execute_script(fmt::format(
        "PRAGMA cache_size = -{}; PRAGMA temp_store = {}; PRAGMA journal_mode = {};",
        cfg.cache_size_kib, cfg.temp_store_memory ? "MEMORY" : "DEFAULT", cfg.journal_mode));
    if (!tuned) {
        return std::unexpected(tuned.error());
    }
    spdlog::debug("engine opened: path={}, batch_rows={}", cfg.database_path, cfg.batch_rows);
    return engine;
}

Engine::~Engine() {
    sqlite3_close(db_);
}

auto Engine::execute(std::string_view sql, const SqlParams& params) -> Result<std::int64_t> {
    return with_session([&](Session& session) { return session.execute(sql, params); });
}

auto Engine::execute_script(std::string_view sql) -> Result<void> {
    return with_session([&](Session& session) { return session.execute_script(sql); });
}

auto Engine::query_batches(std::string_view sql, const SqlParams& params)
    -> Result<std::vector<Table>> {
    return with_session([&](Session& session) { return session.query_batches(sql, params); });
}

auto Engine::query(std::string_view sql, const SqlParams& params) -> Result<Table> {
    return with_session([&](Session& session) { return session.query(sql, params); });
}

auto Engine::explain(std::string_view sql) -> Result<std::string> {
    return with_session([&](Session& session) { return session.explain(sql); });
}

}  // namespace tilecache::engine
