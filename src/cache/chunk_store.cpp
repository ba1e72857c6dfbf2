#include <tilecache/cache/chunk_store.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <string_view>

namespace tilecache::cache {

namespace {

constexpr std::string_view kCreateChunkTableSql =
    "CREATE TABLE IF NOT EXISTS tile_chunks ("
    "chunk_x INTEGER NOT NULL, chunk_y INTEGER NOT NULL, gpu_data BLOB NOT NULL, "
    "PRIMARY KEY (chunk_x, chunk_y))";

constexpr std::string_view kInsertChunkSql =
    "INSERT INTO tile_chunks (chunk_x, chunk_y, gpu_data) VALUES (?1, ?2, ?3)";

constexpr std::string_view kSelectChunksSql =
    "SELECT chunk_x, chunk_y, gpu_data FROM tile_chunks ORDER BY chunk_y, chunk_x";

/// Rebuild every chunk inside the caller's open transaction.
/// Returns the number of tiles written across all chunks.
auto fill_chunks(engine::Session& session, std::int32_t per_side, std::int32_t chunk_size,
                 tiles::TileParams params) -> Result<std::size_t> {
    if (auto cleared = session.execute("DELETE FROM tile_chunks"); !cleared) {
        return std::unexpected(cleared.error());
    }

    std::size_t tiles_written = 0;
    for (std::int32_t cy = 0; cy < per_side; ++cy) {
        for (std::int32_t cx = 0; cx < per_side; ++cx) {
            const std::int64_t x_min = static_cast<std::int64_t>(cx) * chunk_size;
            const std::int64_t y_min = static_cast<std::int64_t>(cy) * chunk_size;
            auto rows = session.query(tiles::kTileRangeSql,
                                      {x_min, x_min + chunk_size, y_min, y_min + chunk_size});
            if (!rows) {
                return std::unexpected(rows.error());
            }
            auto gpu = tiles::to_gpu_buffer(*rows, params);
            if (!gpu) {
                return std::unexpected(gpu.error());
            }
            auto blob = codec::encode_gpu_buffer(*gpu);
            if (!blob) {
                return std::unexpected(blob.error());
            }
            auto inserted = session.execute(
                kInsertChunkSql,
                {static_cast<std::int64_t>(cx), static_cast<std::int64_t>(cy), std::move(*blob)});
            if (!inserted) {
                return std::unexpected(inserted.error());
            }
            tiles_written += gpu->count();
        }
    }
    return tiles_written;
}

}  // namespace

auto ChunkStore::generate(std::int32_t grid_size, std::int32_t chunk_size,
                          tiles::TileParams params) -> Result<ChunkLayout> {
    if (grid_size <= 0 || chunk_size <= 0 || grid_size % chunk_size != 0) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("chunk size {} must be positive and divide grid size {}",
                                      chunk_size, grid_size));
    }
    const std::int32_t per_side = grid_size / chunk_size;

    auto written = engine_.with_session([&](engine::Session& session) -> Result<std::size_t> {
        if (auto schema = session.execute_script(kCreateChunkTableSql); !schema) {
            return std::unexpected(schema.error());
        }
        if (auto begin = session.execute("BEGIN"); !begin) {
            return std::unexpected(begin.error());
        }
        auto filled = fill_chunks(session, per_side, chunk_size, params);
        if (filled) {
            auto commit = session.execute("COMMIT");
            if (commit) {
                return filled;
            }
            filled = std::unexpected(commit.error());
        }
        // Leave the previous generation intact.
        if (auto rollback = session.execute("ROLLBACK"); !rollback) {
            spdlog::warn("chunk generation rollback failed: {}", rollback.error().format());
        }
        return filled;
    });
    if (!written) {
        return std::unexpected(written.error());
    }

    std::lock_guard<std::mutex> guard(mutex_);
    layout_ = ChunkLayout{.grid_size = grid_size,
                          .chunk_size = chunk_size,
                          .params = params,
                          .chunk_count = static_cast<std::size_t>(per_side) *
                                         static_cast<std::size_t>(per_side),
                          .tile_count = *written,
                          .generation = ++generation_};
    spdlog::debug("generated {} chunks ({} tiles), grid={}, chunk={}", layout_->chunk_count,
                  layout_->tile_count, grid_size, chunk_size);
    return *layout_;
}

auto ChunkStore::query_combined() -> Result<CombinedChunks> {
    auto stored = engine_.with_session([](engine::Session& session) -> Result<Table> {
        if (auto schema = session.execute_script(kCreateChunkTableSql); !schema) {
            return std::unexpected(schema.error());
        }
        return session.query(kSelectChunksSql);
    });
    if (!stored) {
        return std::unexpected(stored.error());
    }

    const auto* chunk_x = std::get_if<Column<std::int64_t>>(stored->find("chunk_x"));
    const auto* chunk_y = std::get_if<Column<std::int64_t>>(stored->find("chunk_y"));
    const auto* blobs = std::get_if<Column<Blob>>(stored->find("gpu_data"));
    if (chunk_x == nullptr || chunk_y == nullptr || blobs == nullptr) {
        return make_error(ErrorKind::Unsupported, "tile_chunks has an unexpected schema");
    }

    CombinedChunks out;
    codec::Bytes positions;
    codec::Bytes colors;
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < blobs->size(); ++i) {
        auto decoded = codec::decode((*blobs)[i], codec::kGpuRowWidths);
        if (!decoded) {
            spdlog::warn("skipping chunk ({}, {}): {}", (*chunk_x)[i], (*chunk_y)[i],
                         decoded.error().format());
            ++out.chunks_skipped;
            continue;
        }
        positions.insert(positions.end(), decoded->slices[0].begin(), decoded->slices[0].end());
        colors.insert(colors.end(), decoded->slices[1].begin(), decoded->slices[1].end());
        total += decoded->count;
        ++out.chunks_read;
    }
    if (total > std::numeric_limits<std::uint32_t>::max()) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("{} combined tiles do not fit the u32 row count", total));
    }

    out.count = static_cast<std::uint32_t>(total);
    out.buffer = codec::encode_bytes(out.count, {positions, colors});
    return out;
}

auto ChunkStore::layout() const -> std::optional<ChunkLayout> {
    std::lock_guard<std::mutex> guard(mutex_);
    return layout_;
}

}  // namespace tilecache::cache
