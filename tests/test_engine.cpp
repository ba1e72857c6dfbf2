#include <tilecache/engine/engine.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <filesystem>
#include <memory>
#include <string>

using namespace tilecache;
using namespace tilecache::engine;

namespace {

auto require_engine(EngineConfig config = {}) -> std::unique_ptr<Engine> {
    auto engine = Engine::open(std::move(config));
    REQUIRE(engine.has_value());
    return std::move(engine.value());
}

}  // namespace

TEST_CASE("execute reports affected rows", "[engine]") {
    auto engine = require_engine();

    REQUIRE(engine->execute("CREATE TABLE t (a INTEGER, b REAL, c TEXT, d BLOB)").value() == 0);
    REQUIRE(engine->execute("INSERT INTO t VALUES (1, 1.5, 'one', x'0102'), "
                            "(2, 2.5, 'two', x'03')")
                .value() == 2);
    REQUIRE(engine->execute("UPDATE t SET b = 0 WHERE a = 2").value() == 1);
    REQUIRE(engine->execute("SELECT * FROM t").value() == 0);
}

TEST_CASE("query maps declared types to column types", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute("CREATE TABLE t (a INTEGER, b REAL, c TEXT, d BLOB)").has_value());
    REQUIRE(engine->execute("INSERT INTO t VALUES (7, 0.25, 'seven', x'0A0B')").has_value());

    auto table = engine->query("SELECT a, b, c, d FROM t");
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 1);
    REQUIRE(std::get<Column<std::int64_t>>(*table->find("a"))[0] == 7);
    REQUIRE(std::get<Column<double>>(*table->find("b"))[0] == 0.25);
    REQUIRE(std::get<Column<std::string>>(*table->find("c"))[0] == "seven");
    REQUIRE(std::get<Column<Blob>>(*table->find("d"))[0] == Blob{0x0A, 0x0B});
}

TEST_CASE("expression columns take the first row's storage class", "[engine]") {
    auto engine = require_engine();

    auto table = engine->query("SELECT 1 + 1 AS n, 0.5 * 3 AS r, 'a' || 'b' AS s");
    REQUIRE(table.has_value());
    REQUIRE(std::get<Column<std::int64_t>>(*table->find("n"))[0] == 2);
    REQUIRE(std::get<Column<double>>(*table->find("r"))[0] == 1.5);
    REQUIRE(std::get<Column<std::string>>(*table->find("s"))[0] == "ab");
}

TEST_CASE("expression columns skip leading nulls when picking a type", "[engine]") {
    auto config = GENERATE(EngineConfig{}, EngineConfig{.batch_rows = 1});
    auto engine = require_engine(config);
    REQUIRE(engine->execute_script("CREATE TABLE t (a INTEGER);"
                                   "INSERT INTO t VALUES (0), (1), (2);")
                .has_value());

    auto table = engine->query("SELECT CASE WHEN a > 0 THEN a END AS v, "
                               "CASE WHEN a > 1 THEN a * 0.5 END AS r FROM t ORDER BY a");
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 3);

    const auto* v = table->find_entry("v");
    const auto* ints = std::get_if<Column<std::int64_t>>(v->column.get());
    REQUIRE(ints != nullptr);
    REQUIRE(is_null(*v, 0));
    REQUIRE((*ints)[1] == 1);
    REQUIRE((*ints)[2] == 2);

    const auto* r = table->find_entry("r");
    const auto* reals = std::get_if<Column<double>>(r->column.get());
    REQUIRE(reals != nullptr);
    REQUIRE(is_null(*r, 1));
    REQUIRE((*reals)[2] == 1.0);
}

TEST_CASE("an all-null expression column stays text", "[engine]") {
    auto engine = require_engine();
    auto table = engine->query("SELECT NULL AS v");
    REQUIRE(table.has_value());
    REQUIRE(std::holds_alternative<Column<std::string>>(*table->find("v")));
    REQUIRE(is_null(*table->find_entry("v"), 0));
}

TEST_CASE("nulls are tracked in the validity bitmap", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute_script("CREATE TABLE t (a INTEGER);"
                                   "INSERT INTO t VALUES (1), (NULL), (3);")
                .has_value());

    auto table = engine->query("SELECT a FROM t ORDER BY rowid");
    REQUIRE(table.has_value());
    const auto* entry = table->find_entry("a");
    REQUIRE(entry->validity.has_value());
    REQUIRE_FALSE(is_null(*entry, 0));
    REQUIRE(is_null(*entry, 1));
    REQUIRE(std::get<Column<std::int64_t>>(*entry->column)[2] == 3);
}

TEST_CASE("query_batches splits results by batch_rows", "[engine]") {
    auto engine = require_engine(EngineConfig{.batch_rows = 2});
    REQUIRE(engine->execute_script("CREATE TABLE t (a INTEGER);"
                                   "INSERT INTO t VALUES (1), (2), (3), (4), (5);")
                .has_value());

    auto batches = engine->query_batches("SELECT a FROM t ORDER BY a");
    REQUIRE(batches.has_value());
    REQUIRE(batches->size() == 3);
    REQUIRE((*batches)[0].rows() == 2);
    REQUIRE((*batches)[2].rows() == 1);
    REQUIRE(std::get<Column<std::int64_t>>(*(*batches)[2].find("a"))[0] == 5);

    auto table = engine->query("SELECT a FROM t ORDER BY a");
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 5);
}

TEST_CASE("an empty result still carries its columns", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute("CREATE TABLE t (a INTEGER, b TEXT)").has_value());

    auto batches = engine->query_batches("SELECT a, b FROM t");
    REQUIRE(batches.has_value());
    REQUIRE(batches->size() == 1);
    const auto& batch = batches->front();
    REQUIRE(batch.rows() == 0);
    REQUIRE(batch.columns.size() == 2);
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*batch.find("a")));
    REQUIRE(std::holds_alternative<Column<std::string>>(*batch.find("b")));
}

TEST_CASE("parameters bind positionally", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute("CREATE TABLE t (a INTEGER, b TEXT, c BLOB)").has_value());
    REQUIRE(engine->execute("INSERT INTO t VALUES (?1, ?2, ?3)",
                            {std::int64_t{4}, std::string("four"), Blob{}})
                .has_value());

    auto table = engine->query("SELECT b, length(c) AS len, c IS NULL AS missing FROM t "
                               "WHERE a = ?1",
                               {std::int64_t{4}});
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 1);
    REQUIRE(std::get<Column<std::string>>(*table->find("b"))[0] == "four");
    REQUIRE(std::get<Column<std::int64_t>>(*table->find("len"))[0] == 0);
    REQUIRE(std::get<Column<std::int64_t>>(*table->find("missing"))[0] == 0);

    auto wrong = engine->query("SELECT * FROM t WHERE a = ?1");
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::Engine);
}

TEST_CASE("engine failures surface as engine errors", "[engine]") {
    auto engine = require_engine();

    SECTION("syntax error") {
        auto result = engine->execute("SELEC 1");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Engine);
        REQUIRE_FALSE(result.error().message.empty());
    }

    SECTION("missing table") {
        auto result = engine->query("SELECT * FROM nowhere");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message.find("nowhere") != std::string::npos);
    }

    SECTION("execute takes one statement") {
        auto result = engine->execute("CREATE TABLE a (x); CREATE TABLE b (x)");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Engine);
    }

    SECTION("script errors") {
        auto result = engine->execute_script("CREATE TABLE a (x); INSERT INTO nowhere VALUES (1);");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Engine);
    }
}

TEST_CASE("with_session runs a transaction under one lock", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute("CREATE TABLE t (a INTEGER)").has_value());

    auto committed = engine->with_session([](Session& session) -> Result<std::int64_t> {
        REQUIRE(session.execute("BEGIN").has_value());
        REQUIRE(session.execute("INSERT INTO t VALUES (1)").has_value());
        REQUIRE(session.execute("INSERT INTO t VALUES (2)").has_value());
        REQUIRE(session.execute("ROLLBACK").has_value());
        return session.query("SELECT count(*) AS n FROM t").transform([](const Table& table) {
            return std::get<Column<std::int64_t>>(*table.find("n"))[0];
        });
    });
    REQUIRE(committed.has_value());
    REQUIRE(*committed == 0);
}

TEST_CASE("explain returns the query plan", "[engine]") {
    auto engine = require_engine();
    REQUIRE(engine->execute_script("CREATE TABLE t (a INTEGER, b INTEGER);"
                                   "CREATE INDEX t_a ON t (a);")
                .has_value());

    auto plan = engine->explain("SELECT b FROM t WHERE a = 3");
    REQUIRE(plan.has_value());
    REQUIRE(plan->find("t_a") != std::string::npos);
}

TEST_CASE("contention on the database file is a lock error", "[engine]") {
    const auto path = std::filesystem::temp_directory_path() / "tilecache_test_engine_lock.db";
    std::filesystem::remove(path);
    {
        auto writer = require_engine(EngineConfig{.database_path = path.string()});
        auto holder = require_engine(EngineConfig{.database_path = path.string()});
        REQUIRE(writer->execute("CREATE TABLE t (a INTEGER)").has_value());

        REQUIRE(holder->execute("BEGIN EXCLUSIVE").has_value());
        auto blocked = writer->execute("INSERT INTO t VALUES (1)");
        REQUIRE_FALSE(blocked.has_value());
        REQUIRE(blocked.error().kind == ErrorKind::Lock);
        REQUIRE(holder->execute("ROLLBACK").has_value());

        REQUIRE(writer->execute("INSERT INTO t VALUES (1)").value() == 1);
    }
    std::filesystem::remove(path);
}
