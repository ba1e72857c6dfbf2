#include <tilecache/voxels/voxels.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tilecache::voxels {

namespace {

constexpr std::string_view kCreateVoxelTableSql =
    "CREATE TABLE IF NOT EXISTS voxels ("
    "chunk_x INTEGER NOT NULL, chunk_z INTEGER NOT NULL, "
    "x INTEGER NOT NULL, y INTEGER NOT NULL, z INTEGER NOT NULL, "
    "block_type INTEGER NOT NULL, "
    "PRIMARY KEY (chunk_x, chunk_z, x, y, z))";

constexpr std::string_view kDeleteChunkSql = "DELETE FROM voxels WHERE chunk_x = ?1 AND chunk_z = ?2";

// i walks the chunk x-fastest, then z, then y: x = i % 32, z = (i / 32) % 32,
// y = i / 1024. ?4 is the surface height; the bands match block_at().
constexpr std::string_view kFillChunkSql =
    "INSERT INTO voxels (chunk_x, chunk_z, x, y, z, block_type) "
    "WITH RECURSIVE seq(i) AS (SELECT 0 UNION ALL SELECT i + 1 FROM seq WHERE i + 1 < ?3) "
    "SELECT ?1, ?2, i % 32, i / 1024, (i / 32) % 32, "
    "CASE WHEN i / 1024 > ?4 THEN 0 WHEN i / 1024 = ?4 THEN 1 "
    "WHEN i / 1024 > ?4 - 4 THEN 2 ELSE 3 END "
    "FROM seq";

constexpr std::string_view kSelectChunkSql =
    "SELECT x, y, z, block_type FROM voxels "
    "WHERE chunk_x = ?1 AND chunk_z = ?2 AND block_type > 0 ORDER BY z, y, x";

auto u8_column(const Table& table, const std::string& name) -> Result<std::vector<std::uint8_t>> {
    const auto* values = std::get_if<Column<std::int64_t>>(table.find(name));
    if (values == nullptr) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("voxel column '{}' is not an integer column", name));
    }
    std::vector<std::uint8_t> out;
    out.reserve(values->size());
    for (const std::int64_t value : *values) {
        if (value < 0 || value > 0xFF) {
            return make_error(ErrorKind::Unsupported,
                              fmt::format("voxel column '{}' value {} does not fit u8", name, value));
        }
        out.push_back(static_cast<std::uint8_t>(value));
    }
    return out;
}

}  // namespace

auto block_at(std::int32_t y) noexcept -> BlockType {
    if (y > kSurfaceY) {
        return BlockType::Air;
    }
    if (y == kSurfaceY) {
        return BlockType::Grass;
    }
    if (y > kSurfaceY - 4) {
        return BlockType::Dirt;
    }
    return BlockType::Stone;
}

auto create_voxel_world(engine::Engine& engine, std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<VoxelChunkInfo> {
    const auto start = std::chrono::steady_clock::now();
    const std::int64_t cx = chunk_x;
    const std::int64_t cz = chunk_z;

    auto inserted = engine.with_session([&](engine::Session& session) -> Result<std::int64_t> {
        if (auto schema = session.execute_script(kCreateVoxelTableSql); !schema) {
            return std::unexpected(schema.error());
        }
        if (auto begin = session.execute("BEGIN"); !begin) {
            return std::unexpected(begin.error());
        }
        auto rows = session.execute(kDeleteChunkSql, {cx, cz});
        if (rows) {
            rows = session.execute(kFillChunkSql,
                                   {cx, cz, kVoxelsPerChunk, static_cast<std::int64_t>(kSurfaceY)});
        }
        if (rows) {
            if (auto commit = session.execute("COMMIT"); !commit) {
                rows = std::unexpected(commit.error());
            }
        }
        if (!rows) {
            if (auto rollback = session.execute("ROLLBACK"); !rollback) {
                spdlog::warn("voxel chunk rollback failed: {}", rollback.error().format());
            }
        }
        return rows;
    });
    if (!inserted) {
        return std::unexpected(inserted.error());
    }

    VoxelChunkInfo info{.chunk_x = chunk_x, .chunk_z = chunk_z, .voxels = *inserted};
    info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("voxel chunk ({}, {}) generated: voxels={}, elapsed_ms={}", chunk_x, chunk_z,
                  info.voxels, info.elapsed.count());
    return info;
}

auto query_voxel_chunk(engine::Engine& engine, std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<std::vector<Table>> {
    return engine.with_session([&](engine::Session& session) -> Result<std::vector<Table>> {
        if (auto schema = session.execute_script(kCreateVoxelTableSql); !schema) {
            return std::unexpected(schema.error());
        }
        return session.query_batches(
            kSelectChunkSql, {static_cast<std::int64_t>(chunk_x), static_cast<std::int64_t>(chunk_z)});
    });
}

auto query_voxel_chunk_raw(engine::Engine& engine, std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<codec::Bytes> {
    auto batches = query_voxel_chunk(engine, chunk_x, chunk_z);
    if (!batches) {
        return std::unexpected(batches.error());
    }
    auto rows = concat_tables(*batches);
    if (!rows) {
        return std::unexpected(rows.error());
    }

    codec::VoxelColumns columns;
    for (auto [name, target] : {std::pair{"x", &columns.x}, std::pair{"y", &columns.y},
                                std::pair{"z", &columns.z},
                                std::pair{"block_type", &columns.block_type}}) {
        auto values = u8_column(*rows, name);
        if (!values) {
            return std::unexpected(values.error());
        }
        *target = std::move(*values);
    }
    return codec::encode_voxel_columns(columns);
}

}  // namespace tilecache::voxels
