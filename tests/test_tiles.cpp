#include <tilecache/engine/engine.hpp>
#include <tilecache/tiles/tiles.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tilecache;
using namespace tilecache::tiles;
using Catch::Approx;

namespace {

auto example_tiles() -> Table {
    Table table;
    table.add_column("x", Column<std::int64_t>{0, 1, 0});
    table.add_column("y", Column<std::int64_t>{0, 0, 1});
    table.add_column("tile_type", Column<std::int64_t>{1, 0, 9});
    table.add_column("elevation", Column<double>{2.0, 1.0, 0.0});
    return table;
}

void require_floats(const std::vector<float>& actual, const std::vector<float>& expected) {
    REQUIRE(actual.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        INFO("index " << i);
        REQUIRE(actual[i] == Approx(expected[i]));
    }
}

}  // namespace

TEST_CASE("tile_color maps known codes", "[tiles][color]") {
    REQUIRE(tile_color(0, 1.0F) == Rgb{0.2F, 0.5F, 0.8F});
    REQUIRE(tile_color(1, 1.0F) == Rgb{0.3F, 0.7F, 0.3F});
    REQUIRE(tile_color(2, 1.0F) == Rgb{0.6F, 0.6F, 0.5F});
    REQUIRE(tile_color(3, 1.0F) == Rgb{0.9F, 0.9F, 0.95F});
    REQUIRE(tile_color(4, 1.0F) == Rgb{0.8F, 0.7F, 0.4F});
    REQUIRE(tile_color(5, 1.0F) == Rgb{0.1F, 0.4F, 0.1F});
}

TEST_CASE("tile_color falls back to grey outside 0..5", "[tiles][color]") {
    for (const std::int64_t code : {-1, 6, 9, 1000}) {
        REQUIRE(tile_color(code, 1.0F) == Rgb{0.5F, 0.5F, 0.5F});
    }
    const Rgb scaled = tile_color(42, 2.0F);
    REQUIRE(scaled.r == Approx(1.0F));
    REQUIRE(scaled.g == Approx(1.0F));
    REQUIRE(scaled.b == Approx(1.0F));
}

TEST_CASE("tile_color scales every component", "[tiles][color]") {
    const Rgb half = tile_color(0, 0.5F);
    REQUIRE(half.r == Approx(0.1F));
    REQUIRE(half.g == Approx(0.25F));
    REQUIRE(half.b == Approx(0.4F));
    REQUIRE(tile_color(3, 0.5F) == tile_color(3, 0.5F));
}

TEST_CASE("to_gpu_buffer transforms rows in source order", "[tiles][gpu]") {
    auto gpu = to_gpu_buffer(example_tiles(), TileParams{.spacing = 1.0F, .color_scale = 1.0F});
    REQUIRE(gpu.has_value());
    REQUIRE(gpu->count() == 3);
    require_floats(gpu->positions, {0, 0, 2.0F, 1, 1, 0, 1.0F, 1, 0, 1, 0.0F, 1});
    require_floats(gpu->colors,
                   {0.3F, 0.7F, 0.3F, 1, 0.2F, 0.5F, 0.8F, 1, 0.5F, 0.5F, 0.5F, 1});
}

TEST_CASE("to_gpu_buffer applies spacing to x and y only", "[tiles][gpu]") {
    auto gpu = to_gpu_buffer(example_tiles(), TileParams{.spacing = 2.5F, .color_scale = 1.0F});
    REQUIRE(gpu.has_value());
    REQUIRE(gpu->positions[4] == Approx(2.5F));
    REQUIRE(gpu->positions[6] == Approx(1.0F));
    REQUIRE(gpu->positions[9] == Approx(2.5F));
    REQUIRE(gpu->positions[11] == Approx(1.0F));
}

TEST_CASE("to_raw_columns copies values unchanged", "[tiles][raw]") {
    auto raw = to_raw_columns(example_tiles());
    REQUIRE(raw.has_value());
    REQUIRE(raw->count() == 3);
    REQUIRE(raw->x == std::vector<std::int32_t>{0, 1, 0});
    REQUIRE(raw->y == std::vector<std::int32_t>{0, 0, 1});
    REQUIRE(raw->tile_type == std::vector<std::int32_t>{1, 0, 9});
    REQUIRE(raw->elevation == std::vector<float>{2.0F, 1.0F, 0.0F});
}

TEST_CASE("to_raw_columns rejects values outside i32", "[tiles][raw]") {
    auto engine = engine::Engine::open();
    REQUIRE(engine.has_value());
    REQUIRE(create_tile_table(**engine).has_value());
    REQUIRE((*engine)->execute("INSERT INTO tiles VALUES (3000000000, 0, 1, 0.5)").has_value());

    auto rows = (*engine)->query(kTileScanSql);
    REQUIRE(rows.has_value());
    auto raw = to_raw_columns(*rows);
    REQUIRE_FALSE(raw.has_value());
    REQUIRE(raw.error().kind == ErrorKind::Unsupported);
    REQUIRE(raw.error().message.find("'x'") != std::string::npos);
    REQUIRE(raw.error().message.find("3000000000") != std::string::npos);

    Table low = example_tiles();
    low.add_column("tile_type", Column<std::int64_t>{1, -2147483649LL, 0});
    auto rejected = to_raw_columns(low);
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().message.find("tile_type") != std::string::npos);

    Table edges = example_tiles();
    edges.add_column("y", Column<std::int64_t>{-2147483648LL, 2147483647LL, 0});
    auto accepted = to_raw_columns(edges);
    REQUIRE(accepted.has_value());
    REQUIRE(accepted->y[0] == -2147483648LL);
    REQUIRE(accepted->y[1] == 2147483647);
}

TEST_CASE("transforms reject columns of the wrong type", "[tiles]") {
    Table table;
    table.add_column("x", Column<std::string>{"a"});
    table.add_column("y", Column<std::int64_t>{0});
    table.add_column("tile_type", Column<std::int64_t>{0});
    table.add_column("elevation", Column<double>{0.0});

    auto gpu = to_gpu_buffer(table, {});
    REQUIRE_FALSE(gpu.has_value());
    REQUIRE(gpu.error().kind == ErrorKind::Unsupported);

    Table missing;
    missing.add_column("x", Column<std::int64_t>{0});
    auto raw = to_raw_columns(missing);
    REQUIRE_FALSE(raw.has_value());
    REQUIRE(raw.error().kind == ErrorKind::Unsupported);
}

TEST_CASE("integer elevation is accepted", "[tiles]") {
    Table table;
    table.add_column("x", Column<std::int64_t>{3});
    table.add_column("y", Column<std::int64_t>{4});
    table.add_column("tile_type", Column<std::int64_t>{2});
    table.add_column("elevation", Column<std::int64_t>{7});

    auto raw = to_raw_columns(table);
    REQUIRE(raw.has_value());
    REQUIRE(raw->elevation[0] == 7.0F);
}

TEST_CASE("seed_tile_grid fills a deterministic square grid", "[tiles][engine]") {
    auto engine = engine::Engine::open();
    REQUIRE(engine.has_value());
    auto& db = **engine;
    REQUIRE(create_tile_table(db).has_value());
    // Creating twice is harmless.
    REQUIRE(create_tile_table(db).has_value());

    auto inserted = seed_tile_grid(db, 4);
    REQUIRE(inserted.has_value());
    REQUIRE(*inserted == 16);

    auto table = db.query(kTileScanSql);
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 16);

    const auto& x = std::get<Column<std::int64_t>>(*table->find("x"));
    const auto& y = std::get<Column<std::int64_t>>(*table->find("y"));
    const auto& type = std::get<Column<std::int64_t>>(*table->find("tile_type"));
    const auto& elevation = std::get<Column<double>>(*table->find("elevation"));

    // Row-major: (0,0), (1,0), (2,0), (3,0), (0,1), ...
    REQUIRE(x[1] == 1);
    REQUIRE(y[1] == 0);
    REQUIRE(x[4] == 0);
    REQUIRE(y[4] == 1);
    // (0,0) hashes to 0 (water), (1,0) to 8 (grass).
    REQUIRE(type[0] == 0);
    REQUIRE(elevation[0] == 0.0);
    REQUIRE(type[1] == 1);
    REQUIRE(elevation[1] == 4.0);
    for (const auto code : type) {
        REQUIRE(code >= 0);
        REQUIRE(code <= 5);
    }

    REQUIRE_FALSE(seed_tile_grid(db, 0).has_value());
}

TEST_CASE("range scan covers a half-open rectangle", "[tiles][engine]") {
    auto engine = engine::Engine::open();
    REQUIRE(engine.has_value());
    auto& db = **engine;
    REQUIRE(create_tile_table(db).has_value());
    REQUIRE(seed_tile_grid(db, 8).has_value());

    auto table = db.query(kTileRangeSql, {std::int64_t{4}, std::int64_t{8}, std::int64_t{0},
                                          std::int64_t{4}});
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 16);
    const auto& x = std::get<Column<std::int64_t>>(*table->find("x"));
    REQUIRE(x[0] == 4);
    REQUIRE(x[3] == 7);
}
