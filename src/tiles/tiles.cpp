#include <tilecache/tiles/tiles.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <string>
#include <tuple>
#include <variant>

namespace tilecache::tiles {

namespace {

constexpr std::string_view kCreateTileTableSql =
    "CREATE TABLE IF NOT EXISTS tiles ("
    "x INTEGER NOT NULL, y INTEGER NOT NULL, "
    "tile_type INTEGER NOT NULL, elevation REAL NOT NULL);"
    "CREATE INDEX IF NOT EXISTS tiles_yx ON tiles (y, x);";

// Height h in [0, 23) from a cheap lattice hash; the type follows h in bands
// (water, sand, grass, forest, rock, snow) and elevation is h / 2.
constexpr std::string_view kSeedTileGridSql =
    "INSERT INTO tiles (x, y, tile_type, elevation) "
    "WITH RECURSIVE seq(i) AS (SELECT 0 UNION ALL SELECT i + 1 FROM seq WHERE i + 1 < ?1) "
    "SELECT x, y, "
    "CASE WHEN h < 3 THEN 0 WHEN h < 5 THEN 4 WHEN h < 12 THEN 1 "
    "WHEN h < 16 THEN 5 WHEN h < 20 THEN 2 ELSE 3 END, "
    "h * 0.5 "
    "FROM (SELECT i % ?2 AS x, i / ?2 AS y, ((i % ?2) * 31 + (i / ?2) * 17) % 23 AS h FROM seq)";

auto int_column(const Table& tiles, const std::string& name) -> Result<const Column<std::int64_t>*> {
    const auto* column = tiles.find(name);
    if (column == nullptr) {
        return make_error(ErrorKind::Unsupported, fmt::format("tile column '{}' missing", name));
    }
    const auto* values = std::get_if<Column<std::int64_t>>(column);
    if (values == nullptr) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("tile column '{}' is not an integer column", name));
    }
    return values;
}

/// Elevation as f32, accepting REAL or INTEGER storage.
auto elevation_column(const Table& tiles) -> Result<std::vector<float>> {
    const auto* column = tiles.find("elevation");
    if (column == nullptr) {
        return make_error(ErrorKind::Unsupported, "tile column 'elevation' missing");
    }
    if (const auto* reals = std::get_if<Column<double>>(column)) {
        std::vector<float> out;
        out.reserve(reals->size());
        for (const double value : *reals) {
            out.push_back(static_cast<float>(value));
        }
        return out;
    }
    if (const auto* ints = std::get_if<Column<std::int64_t>>(column)) {
        std::vector<float> out;
        out.reserve(ints->size());
        for (const std::int64_t value : *ints) {
            out.push_back(static_cast<float>(value));
        }
        return out;
    }
    return make_error(ErrorKind::Unsupported, "tile column 'elevation' is not numeric");
}

/// Integer column narrowed to i32; sqlite stores INTEGER as 64-bit.
auto i32_column(const Column<std::int64_t>& values, std::string_view name)
    -> Result<std::vector<std::int32_t>> {
    std::vector<std::int32_t> out;
    out.reserve(values.size());
    for (const std::int64_t value : values) {
        if (value < std::numeric_limits<std::int32_t>::min() ||
            value > std::numeric_limits<std::int32_t>::max()) {
            return make_error(ErrorKind::Unsupported,
                              fmt::format("tile column '{}' value {} does not fit i32", name, value));
        }
        out.push_back(static_cast<std::int32_t>(value));
    }
    return out;
}

struct TileColumns {
    const Column<std::int64_t>* x = nullptr;
    const Column<std::int64_t>* y = nullptr;
    const Column<std::int64_t>* tile_type = nullptr;
    std::vector<float> elevation;
};

auto tile_columns(const Table& tiles) -> Result<TileColumns> {
    auto x = int_column(tiles, "x");
    if (!x) {
        return std::unexpected(x.error());
    }
    auto y = int_column(tiles, "y");
    if (!y) {
        return std::unexpected(y.error());
    }
    auto tile_type = int_column(tiles, "tile_type");
    if (!tile_type) {
        return std::unexpected(tile_type.error());
    }
    auto elevation = elevation_column(tiles);
    if (!elevation) {
        return std::unexpected(elevation.error());
    }
    return TileColumns{
        .x = *x, .y = *y, .tile_type = *tile_type, .elevation = std::move(*elevation)};
}

}  // namespace

auto tile_color(std::int64_t tile_type, float color_scale) noexcept -> Rgb {
    Rgb base;
    switch (tile_type) {
        case 0:
            base = {0.2F, 0.5F, 0.8F};
            break;
        case 1:
            base = {0.3F, 0.7F, 0.3F};
            break;
        case 2:
            base = {0.6F, 0.6F, 0.5F};
            break;
        case 3:
            base = {0.9F, 0.9F, 0.95F};
            break;
        case 4:
            base = {0.8F, 0.7F, 0.4F};
            break;
        case 5:
            base = {0.1F, 0.4F, 0.1F};
            break;
        default:
            base = {0.5F, 0.5F, 0.5F};
            break;
    }
    return {base.r * color_scale, base.g * color_scale, base.b * color_scale};
}

auto create_tile_table(engine::Engine& engine) -> Result<void> {
    return engine.execute_script(kCreateTileTableSql);
}

auto seed_tile_grid(engine::Engine& engine, std::int32_t grid_size) -> Result<std::int64_t> {
    if (grid_size <= 0) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("grid size must be positive, got {}", grid_size));
    }
    const auto side = static_cast<std::int64_t>(grid_size);
    auto inserted = engine.execute(kSeedTileGridSql, {side * side, side});
    if (inserted) {
        spdlog::debug("seeded {}x{} tile grid ({} rows)", grid_size, grid_size, *inserted);
    }
    return inserted;
}

auto to_gpu_buffer(const Table& tiles, TileParams params) -> Result<codec::GpuBuffer> {
    auto columns = tile_columns(tiles);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    const std::size_t rows = tiles.rows();

    codec::GpuBuffer out;
    out.positions.reserve(rows * 4);
    out.colors.reserve(rows * 4);
    for (std::size_t i = 0; i < rows; ++i) {
        out.positions.push_back(static_cast<float>((*columns->x)[i]) * params.spacing);
        out.positions.push_back(static_cast<float>((*columns->y)[i]) * params.spacing);
        out.positions.push_back(columns->elevation[i]);
        out.positions.push_back(1.0F);

        const Rgb rgb = tile_color((*columns->tile_type)[i], params.color_scale);
        out.colors.push_back(rgb.r);
        out.colors.push_back(rgb.g);
        out.colors.push_back(rgb.b);
        out.colors.push_back(1.0F);
    }
    return out;
}

auto to_raw_columns(const Table& tiles) -> Result<codec::RawColumns> {
    auto columns = tile_columns(tiles);
    if (!columns) {
        return std::unexpected(columns.error());
    }

    codec::RawColumns out;
    for (auto [name, source, target] :
         {std::tuple{"x", columns->x, &out.x}, std::tuple{"y", columns->y, &out.y},
          std::tuple{"tile_type", columns->tile_type, &out.tile_type}}) {
        auto narrowed = i32_column(*source, name);
        if (!narrowed) {
            return std::unexpected(narrowed.error());
        }
        *target = std::move(*narrowed);
    }
    out.elevation = std::move(columns->elevation);
    return out;
}

}  // namespace tilecache::tiles
