#include <tilecache/codec/packer.hpp>

#include <fmt/core.h>

#include <limits>

namespace tilecache::codec {

namespace {

auto checked_count(std::size_t rows) -> Result<std::uint32_t> {
    if (rows > std::numeric_limits<std::uint32_t>::max()) {
        return make_error(ErrorKind::Unsupported,
                          fmt::format("{} rows do not fit the u32 row count", rows));
    }
    return static_cast<std::uint32_t>(rows);
}

}  // namespace

namespace detail {

void write_count(Bytes& out, std::uint32_t count) {
    out.push_back(static_cast<std::uint8_t>(count & 0xffU));
    out.push_back(static_cast<std::uint8_t>((count >> 8) & 0xffU));
    out.push_back(static_cast<std::uint8_t>((count >> 16) & 0xffU));
    out.push_back(static_cast<std::uint8_t>((count >> 24) & 0xffU));
}

}  // namespace detail

auto encode_bytes(std::uint32_t count, std::initializer_list<ByteView> arrays) -> Bytes {
    std::size_t total = kHeaderBytes;
    for (const auto& array : arrays) {
        total += array.size();
    }
    Bytes out;
    out.reserve(total);
    detail::write_count(out, count);
    for (const auto& array : arrays) {
        out.insert(out.end(), array.begin(), array.end());
    }
    return out;
}

auto encode(std::uint32_t count, std::span<const float> a, std::span<const float> b) -> Bytes {
    return encode_columns(count, a, b);
}

auto decode(ByteView bytes, std::span<const std::size_t> row_widths) -> Result<Decoded> {
    if (bytes.size() < kHeaderBytes) {
        return make_error(ErrorKind::MalformedBuffer,
                          fmt::format("{} bytes is shorter than the {}-byte header",
                                      bytes.size(), kHeaderBytes));
    }
    const std::uint32_t count = static_cast<std::uint32_t>(bytes[0]) |
                                (static_cast<std::uint32_t>(bytes[1]) << 8) |
                                (static_cast<std::uint32_t>(bytes[2]) << 16) |
                                (static_cast<std::uint32_t>(bytes[3]) << 24);

    // count < 2^32 and widths are small, so the sum cannot overflow 64 bits.
    std::uint64_t required = kHeaderBytes;
    for (const auto width : row_widths) {
        required += static_cast<std::uint64_t>(count) * width;
    }
    if (bytes.size() < required) {
        return make_error(ErrorKind::MalformedBuffer,
                          fmt::format("count {} implies {} bytes, buffer has {}", count,
                                      required, bytes.size()));
    }

    Decoded out;
    out.count = count;
    out.slices.reserve(row_widths.size());
    std::size_t offset = kHeaderBytes;
    for (const auto width : row_widths) {
        const std::size_t length = static_cast<std::size_t>(count) * width;
        out.slices.push_back(bytes.subspan(offset, length));
        offset += length;
    }
    return out;
}

auto encode_gpu_buffer(const GpuBuffer& buffer) -> Result<Bytes> {
    if (buffer.positions.size() % 4 != 0 || buffer.colors.size() != buffer.positions.size()) {
        return make_error(ErrorKind::MalformedBuffer,
                          fmt::format("positions ({}) and colors ({}) must be equal vec4 arrays",
                                      buffer.positions.size(), buffer.colors.size()));
    }
    auto count = checked_count(buffer.count());
    if (!count) {
        return std::unexpected(count.error());
    }
    return encode(*count, buffer.positions, buffer.colors);
}

auto decode_gpu_buffer(ByteView bytes) -> Result<GpuBuffer> {
    auto decoded = decode(bytes, kGpuRowWidths);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return GpuBuffer{.positions = read_array<float>(decoded->slices[0]),
                     .colors = read_array<float>(decoded->slices[1])};
}

auto encode_raw_columns(const RawColumns& columns) -> Result<Bytes> {
    const std::size_t rows = columns.count();
    if (columns.y.size() != rows || columns.tile_type.size() != rows ||
        columns.elevation.size() != rows) {
        return make_error(ErrorKind::MalformedBuffer, "raw columns differ in length");
    }
    auto count = checked_count(rows);
    if (!count) {
        return std::unexpected(count.error());
    }
    return encode_columns(*count, std::span<const std::int32_t>(columns.x),
                          std::span<const std::int32_t>(columns.y),
                          std::span<const std::int32_t>(columns.tile_type),
                          std::span<const float>(columns.elevation));
}

auto decode_raw_columns(ByteView bytes) -> Result<RawColumns> {
    auto decoded = decode(bytes, kRawRowWidths);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return RawColumns{.x = read_array<std::int32_t>(decoded->slices[0]),
                      .y = read_array<std::int32_t>(decoded->slices[1]),
                      .tile_type = read_array<std::int32_t>(decoded->slices[2]),
                      .elevation = read_array<float>(decoded->slices[3])};
}

auto encode_voxel_columns(const VoxelColumns& columns) -> Result<Bytes> {
    const std::size_t rows = columns.count();
    if (columns.y.size() != rows || columns.z.size() != rows ||
        columns.block_type.size() != rows) {
        return make_error(ErrorKind::MalformedBuffer, "voxel columns differ in length");
    }
    auto count = checked_count(rows);
    if (!count) {
        return std::unexpected(count.error());
    }
    return encode_columns(*count, std::span<const std::uint8_t>(columns.x),
                          std::span<const std::uint8_t>(columns.y),
                          std::span<const std::uint8_t>(columns.z),
                          std::span<const std::uint8_t>(columns.block_type));
}

auto decode_voxel_columns(ByteView bytes) -> Result<VoxelColumns> {
    auto decoded = decode(bytes, kVoxelRowWidths);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return VoxelColumns{.x = read_array<std::uint8_t>(decoded->slices[0]),
                        .y = read_array<std::uint8_t>(decoded->slices[1]),
                        .z = read_array<std::uint8_t>(decoded->slices[2]),
                        .block_type = read_array<std::uint8_t>(decoded->slices[3])};
}

}  // namespace tilecache::codec
