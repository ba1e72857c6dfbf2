#include <tilecache/service/tile_service.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace tilecache::service {

auto TileService::open(ServiceConfig config) -> Result<std::unique_ptr<TileService>> {
    auto engine = engine::Engine::open(config.engine);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    if (auto created = tiles::create_tile_table(**engine); !created) {
        return std::unexpected(created.error());
    }
    spdlog::debug("tile service opened on {}", config.engine.database_path);
    return std::make_unique<TileService>(OpenKey{}, std::move(*engine), std::move(config));
}

TileService::TileService(OpenKey /*key*/, std::unique_ptr<engine::Engine> engine,
                         ServiceConfig config)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      result_cache_(*engine_),
      gpu_cache_("gpu buffer cache"),
      raw_cache_("raw column cache"),
      chunks_(*engine_) {}

auto TileService::execute(std::string_view sql) -> Result<std::int64_t> {
    return engine_->execute(sql);
}

auto TileService::execute_with_cache(std::string_view sql) -> Result<std::int64_t> {
    return result_cache_.execute_with_invalidation(sql);
}

auto TileService::query_table(std::string_view sql) -> Result<Table> {
    return engine_->query(sql);
}

auto TileService::query_batches(std::string_view sql) -> Result<std::vector<Table>> {
    return engine_->query_batches(sql);
}

auto TileService::query_cached() -> Result<codec::Bytes> {
    return query_cached(config_.tiles);
}

auto TileService::query_cached(tiles::TileParams params) -> Result<codec::Bytes> {
    auto table = result_cache_.get_or_compute(tiles::kTileScanSql);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto gpu = tiles::to_gpu_buffer(*table, params);
    if (!gpu) {
        return std::unexpected(gpu.error());
    }
    return codec::encode_gpu_buffer(*gpu);
}

auto TileService::scan_tiles() -> Result<Table> {
    return engine_->query(tiles::kTileScanSql);
}

auto TileService::query_gpu_ready(tiles::TileParams params) -> Result<codec::Bytes> {
    auto table = scan_tiles();
    if (!table) {
        return std::unexpected(table.error());
    }
    auto gpu = tiles::to_gpu_buffer(*table, params);
    if (!gpu) {
        return std::unexpected(gpu.error());
    }
    return codec::encode_gpu_buffer(*gpu);
}

auto TileService::precompute_gpu_data(tiles::TileParams params)
    -> Result<std::chrono::milliseconds> {
    return gpu_cache_.precompute([this, params] { return query_gpu_ready(params); });
}

auto TileService::fetch_precomputed() const -> Result<codec::Bytes> {
    return gpu_cache_.fetch();
}

auto TileService::export_raw_columns() -> Result<codec::Bytes> {
    auto table = scan_tiles();
    if (!table) {
        return std::unexpected(table.error());
    }
    auto raw = tiles::to_raw_columns(*table);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return codec::encode_raw_columns(*raw);
}

auto TileService::cache_raw_columns() -> Result<std::chrono::milliseconds> {
    return raw_cache_.precompute([this] { return export_raw_columns(); });
}

auto TileService::fetch_cached_raw() const -> Result<codec::Bytes> {
    return raw_cache_.fetch();
}

auto TileService::generate_chunks(std::int32_t grid_size, std::int32_t chunk_size,
                                  tiles::TileParams params) -> Result<cache::ChunkLayout> {
    return chunks_.generate(grid_size, chunk_size, params);
}

auto TileService::query_combined_chunks() -> Result<cache::CombinedChunks> {
    return chunks_.query_combined();
}

auto TileService::cache_stats() const -> cache::CacheStats {
    return result_cache_.stats();
}

void TileService::clear_cache() {
    result_cache_.invalidate_all();
}

auto TileService::explain_query(std::string_view sql) -> Result<std::string> {
    return engine_->explain(sql);
}

auto TileService::create_voxel_world(std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<voxels::VoxelChunkInfo> {
    return voxels::create_voxel_world(*engine_, chunk_x, chunk_z);
}

auto TileService::query_voxel_chunk_raw(std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<codec::Bytes> {
    return voxels::query_voxel_chunk_raw(*engine_, chunk_x, chunk_z);
}

auto TileService::query_voxel_chunk(std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<std::vector<Table>> {
    return voxels::query_voxel_chunk(*engine_, chunk_x, chunk_z);
}

}  // namespace tilecache::service
