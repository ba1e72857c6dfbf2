#pragma once

#include <tilecache/codec/packer.hpp>
#include <tilecache/core/error.hpp>
#include <tilecache/core/table.hpp>
#include <tilecache/service/tile_service.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace tilecache::ipc {

/// Serialize `batches` as one Arrow IPC stream: the schema message, one record
/// batch per table, then the end-of-stream marker.
///
/// Column type mappings:
///   int64  -> Int64
///   double -> Float64
///   string -> Utf8
///   Blob   -> Binary
///
/// Nulls are preserved. All batches must share the first batch's schema. The
/// schema is written even when no batch has rows.
[[nodiscard]] auto write_ipc_stream(const std::vector<Table>& batches) -> Result<codec::Bytes>;
[[nodiscard]] auto write_ipc_stream(const Table& table) -> Result<codec::Bytes>;

/// Run `sql` on the service's engine, bypassing every cache, and return the
/// result as an Arrow IPC stream.
[[nodiscard]] auto query(service::TileService& service, std::string_view sql)
    -> Result<codec::Bytes>;

/// Non-air voxels of one chunk as an Arrow IPC stream with Int64 columns
/// x, y, z and block_type, ordered by (z, y, x).
[[nodiscard]] auto query_voxel_chunk(service::TileService& service, std::int32_t chunk_x,
                                     std::int32_t chunk_z) -> Result<codec::Bytes>;

}  // namespace tilecache::ipc
