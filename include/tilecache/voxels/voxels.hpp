#pragma once

#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>
#include <tilecache/engine/engine.hpp>

#include <chrono>
#include <cstdint>
#include <vector>

namespace tilecache::voxels {

/// Chunk extents: x and z run 0..31, y (height, up) runs 0..63.
inline constexpr std::int32_t kChunkWidth = 32;
inline constexpr std::int32_t kChunkHeight = 64;
inline constexpr std::int32_t kChunkDepth = 32;
inline constexpr std::int64_t kVoxelsPerChunk =
    static_cast<std::int64_t>(kChunkWidth) * kChunkHeight * kChunkDepth;

/// Terrain surface height. Above it is air, at it grass, then three layers of
/// dirt, then stone down to y = 0.
inline constexpr std::int32_t kSurfaceY = 32;

enum class BlockType : std::uint8_t {
    Air = 0,
    Grass = 1,
    Dirt = 2,
    Stone = 3,
};

/// Block that create_voxel_world() writes at height `y` in every column of a
/// chunk. The generator itself runs in SQL with the same bands.
[[nodiscard]] auto block_at(std::int32_t y) noexcept -> BlockType;

struct VoxelChunkInfo {
    std::int32_t chunk_x = 0;
    std::int32_t chunk_z = 0;
    std::int64_t voxels = 0;
    std::chrono::milliseconds elapsed{0};
};

/// Create the voxel table if needed and regenerate chunk (chunk_x, chunk_z),
/// replacing whatever was stored for it.
[[nodiscard]] auto create_voxel_world(engine::Engine& engine, std::int32_t chunk_x,
                                      std::int32_t chunk_z) -> Result<VoxelChunkInfo>;

/// Non-air voxels of one chunk ordered by (z, y, x), as engine batches with
/// integer columns x, y, z and block_type. An unknown chunk yields no rows.
[[nodiscard]] auto query_voxel_chunk(engine::Engine& engine, std::int32_t chunk_x,
                                     std::int32_t chunk_z) -> Result<std::vector<Table>>;

/// Non-air voxels of one chunk ordered by (z, y, x), packed as
/// [u32 count][count u8 x][count u8 y][count u8 z][count u8 block type].
[[nodiscard]] auto query_voxel_chunk_raw(engine::Engine& engine, std::int32_t chunk_x,
                                         std::int32_t chunk_z) -> Result<codec::Bytes>;

}  // namespace tilecache::voxels
