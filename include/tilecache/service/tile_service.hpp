#pragma once

#include <tilecache/cache/chunk_store.hpp>
#include <tilecache/cache/result_cache.hpp>
#include <tilecache/cache/scalar_cache.hpp>
#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>
#include <tilecache/engine/engine.hpp>
#include <tilecache/tiles/tiles.hpp>
#include <tilecache/voxels/voxels.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tilecache::service {

struct ServiceConfig {
    engine::EngineConfig engine;
    /// Transform parameters used by query_cached() when none are given.
    tiles::TileParams tiles;
};

/// The boundary of the pipeline: one engine plus its caches.
///
/// Every operation returns a Result; buffers are returned by value and owned
/// by the caller. Operations may be called from any thread.
class TileService {
    struct OpenKey {
        explicit OpenKey() = default;
    };

   public:
    /// Open the engine and create the tile table if it is missing.
    [[nodiscard]] static auto open(ServiceConfig config = {}) -> Result<std::unique_ptr<TileService>>;

    TileService(OpenKey key, std::unique_ptr<engine::Engine> engine, ServiceConfig config);
    TileService(const TileService&) = delete;
    auto operator=(const TileService&) -> TileService& = delete;

    /// Run one statement directly; caches are not touched.
    [[nodiscard]] auto execute(std::string_view sql) -> Result<std::int64_t>;

    /// Run one statement and invalidate the result cache if it writes.
    [[nodiscard]] auto execute_with_cache(std::string_view sql) -> Result<std::int64_t>;

    /// Uncached query, materialized.
    [[nodiscard]] auto query_table(std::string_view sql) -> Result<Table>;
    /// Uncached query, one table per engine batch.
    [[nodiscard]] auto query_batches(std::string_view sql) -> Result<std::vector<Table>>;

    /// GPU buffer of the canonical tile scan, served through the result cache.
    [[nodiscard]] auto query_cached() -> Result<codec::Bytes>;
    [[nodiscard]] auto query_cached(tiles::TileParams params) -> Result<codec::Bytes>;

    /// GPU buffer of a fresh tile scan; no cache is read or filled.
    [[nodiscard]] auto query_gpu_ready(tiles::TileParams params) -> Result<codec::Bytes>;

    /// Build the GPU buffer from a fresh tile scan and store it.
    [[nodiscard]] auto precompute_gpu_data(tiles::TileParams params)
        -> Result<std::chrono::milliseconds>;
    [[nodiscard]] auto fetch_precomputed() const -> Result<codec::Bytes>;

    /// Raw tile columns from a fresh scan, bypassing every cache.
    [[nodiscard]] auto export_raw_columns() -> Result<codec::Bytes>;
    [[nodiscard]] auto cache_raw_columns() -> Result<std::chrono::milliseconds>;
    [[nodiscard]] auto fetch_cached_raw() const -> Result<codec::Bytes>;

    [[nodiscard]] auto generate_chunks(std::int32_t grid_size, std::int32_t chunk_size,
                                       tiles::TileParams params) -> Result<cache::ChunkLayout>;
    [[nodiscard]] auto query_combined_chunks() -> Result<cache::CombinedChunks>;

    [[nodiscard]] auto cache_stats() const -> cache::CacheStats;
    void clear_cache();

    [[nodiscard]] auto explain_query(std::string_view sql) -> Result<std::string>;

    [[nodiscard]] auto create_voxel_world(std::int32_t chunk_x, std::int32_t chunk_z)
        -> Result<voxels::VoxelChunkInfo>;
    [[nodiscard]] auto query_voxel_chunk_raw(std::int32_t chunk_x, std::int32_t chunk_z)
        -> Result<codec::Bytes>;
    /// Non-air voxels of one chunk as engine batches, ordered by (z, y, x).
    [[nodiscard]] auto query_voxel_chunk(std::int32_t chunk_x, std::int32_t chunk_z)
        -> Result<std::vector<Table>>;

    [[nodiscard]] auto engine() noexcept -> engine::Engine& { return *engine_; }
    [[nodiscard]] auto gpu_cache() const noexcept -> const cache::ScalarCache& { return gpu_cache_; }
    [[nodiscard]] auto chunk_store() const noexcept -> const cache::ChunkStore& { return chunks_; }

   private:
    [[nodiscard]] auto scan_tiles() -> Result<Table>;

    ServiceConfig config_;
    // Must outlive the caches below.
    std::unique_ptr<engine::Engine> engine_;
    cache::ResultCache result_cache_;
    cache::ScalarCache gpu_cache_;
    cache::ScalarCache raw_cache_;
    cache::ChunkStore chunks_;
};

}  // namespace tilecache::service
