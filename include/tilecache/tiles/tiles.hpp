#pragma once

#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>
#include <tilecache/engine/engine.hpp>

#include <cstdint>
#include <string_view>

namespace tilecache::tiles {

/// Full scan of the tile table. Every tile scan orders by (y, x) so buffers
/// built from it are row-major and reproducible.
inline constexpr std::string_view kTileScanSql =
    "SELECT x, y, tile_type, elevation FROM tiles ORDER BY y, x";

/// Scan restricted to [?1, ?2) x [?3, ?4), same ordering as kTileScanSql.
inline constexpr std::string_view kTileRangeSql =
    "SELECT x, y, tile_type, elevation FROM tiles "
    "WHERE x >= ?1 AND x < ?2 AND y >= ?3 AND y < ?4 ORDER BY y, x";

struct Rgb {
    float r = 0.0F;
    float g = 0.0F;
    float b = 0.0F;

    auto operator==(const Rgb&) const -> bool = default;
};

/// Spacing and color multiplier applied by the GPU-buffer transform.
struct TileParams {
    float spacing = 1.0F;
    float color_scale = 1.0F;
};

/// Base color of a tile type, each component multiplied by `color_scale`.
///
///   0 water  (0.2, 0.5, 0.8)     3 snow   (0.9, 0.9, 0.95)
///   1 grass  (0.3, 0.7, 0.3)     4 sand   (0.8, 0.7, 0.4)
///   2 rock   (0.6, 0.6, 0.5)     5 forest (0.1, 0.4, 0.1)
///   other    (0.5, 0.5, 0.5)
[[nodiscard]] auto tile_color(std::int64_t tile_type, float color_scale) noexcept -> Rgb;

/// Create the tile table (and its (y, x) index) if it does not exist.
[[nodiscard]] auto create_tile_table(engine::Engine& engine) -> Result<void>;

/// Insert a deterministic `grid_size` x `grid_size` terrain into the tile
/// table. Returns the number of rows inserted.
[[nodiscard]] auto seed_tile_grid(engine::Engine& engine, std::int32_t grid_size)
    -> Result<std::int64_t>;

/// Transform tile rows into positions (x*spacing, y*spacing, elevation, 1)
/// and colors (tile_color, 1), preserving row order.
[[nodiscard]] auto to_gpu_buffer(const Table& tiles, TileParams params)
    -> Result<codec::GpuBuffer>;

/// Copy tile rows into i32/i32/i32/f32 column arrays without transforming.
[[nodiscard]] auto to_raw_columns(const Table& tiles) -> Result<codec::RawColumns>;

}  // namespace tilecache::tiles
