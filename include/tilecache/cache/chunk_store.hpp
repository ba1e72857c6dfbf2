#pragma once

#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>
#include <tilecache/engine/engine.hpp>
#include <tilecache/tiles/tiles.hpp>

#include <cstdint>
#include <mutex>
#include <optional>

namespace tilecache::cache {

/// Parameters and size of the most recent chunk generation.
struct ChunkLayout {
    std::int32_t grid_size = 0;
    std::int32_t chunk_size = 0;
    tiles::TileParams params;
    std::size_t chunk_count = 0;
    std::size_t tile_count = 0;
    /// Incremented by every successful generate().
    std::uint64_t generation = 0;
};

/// Combined GPU buffer assembled from every stored chunk.
struct CombinedChunks {
    codec::Bytes buffer;
    std::uint32_t count = 0;
    std::size_t chunks_read = 0;
    std::size_t chunks_skipped = 0;
};

/// Precomputed per-chunk GPU buffers persisted in the engine.
///
/// Chunk (cx, cy) covers tiles with x in [cx*size, (cx+1)*size) and y in
/// [cy*size, (cy+1)*size). Chunks are only written by generate(), which
/// replaces all of them in one transaction; they are never patched. The store
/// is independent of the result cache: writes to the tile table leave
/// existing chunks in place until the next generate().
class ChunkStore {
   public:
    explicit ChunkStore(engine::Engine& engine) noexcept : engine_(engine) {}

    /// Partition the grid into (grid_size / chunk_size)^2 chunks and persist a
    /// GPU buffer for each. `chunk_size` must divide `grid_size`.
    [[nodiscard]] auto generate(std::int32_t grid_size, std::int32_t chunk_size,
                                tiles::TileParams params) -> Result<ChunkLayout>;

    /// Concatenate every chunk ordered by (chunk_y, chunk_x): all position
    /// arrays, then all color arrays. Chunks whose blob is shorter than its
    /// count implies are skipped.
    [[nodiscard]] auto query_combined() -> Result<CombinedChunks>;

    /// Layout of the last successful generate() through this store.
    [[nodiscard]] auto layout() const -> std::optional<ChunkLayout>;

   private:
    engine::Engine& engine_;
    mutable std::mutex mutex_;
    std::optional<ChunkLayout> layout_;
    std::uint64_t generation_ = 0;
};

}  // namespace tilecache::cache
