#pragma once

#include <tilecache/core/error.hpp>

#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <span>
#include <type_traits>
#include <vector>

namespace tilecache::codec {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

/// Size of the little-endian u32 row count that starts every buffer.
inline constexpr std::size_t kHeaderBytes = 4;

/// Per-row byte widths of each array, in wire order.
/// GPU buffer: vec4<f32> positions, vec4<f32> colors.
inline constexpr std::array<std::size_t, 2> kGpuRowWidths{16, 16};
/// Raw columns: i32 x, i32 y, i32 type, f32 elevation.
inline constexpr std::array<std::size_t, 4> kRawRowWidths{4, 4, 4, 4};
/// Voxel columns: u8 x, u8 y, u8 z, u8 block type.
inline constexpr std::array<std::size_t, 4> kVoxelRowWidths{1, 1, 1, 1};

template <typename T>
concept WireElement = std::is_arithmetic_v<T> && (sizeof(T) == 1 || sizeof(T) == 2 ||
                                                  sizeof(T) == 4 || sizeof(T) == 8);

/// GPU-ready tile buffer: one vec4 position and one vec4 color per row.
struct GpuBuffer {
    std::vector<float> positions;
    std::vector<float> colors;

    [[nodiscard]] auto count() const noexcept -> std::size_t { return positions.size() / 4; }
};

/// Untransformed tile columns in structure-of-arrays form.
struct RawColumns {
    std::vector<std::int32_t> x;
    std::vector<std::int32_t> y;
    std::vector<std::int32_t> tile_type;
    std::vector<float> elevation;

    [[nodiscard]] auto count() const noexcept -> std::size_t { return x.size(); }
};

/// Voxel coordinates and block types in structure-of-arrays form.
struct VoxelColumns {
    std::vector<std::uint8_t> x;
    std::vector<std::uint8_t> y;
    std::vector<std::uint8_t> z;
    std::vector<std::uint8_t> block_type;

    [[nodiscard]] auto count() const noexcept -> std::size_t { return x.size(); }
};

/// Header plus zero-copy views of each array inside a decoded buffer.
/// The views alias the input bytes and share their lifetime.
struct Decoded {
    std::uint32_t count = 0;
    std::vector<ByteView> slices;
};

namespace detail {

void write_count(Bytes& out, std::uint32_t count);

template <WireElement T>
void append_le(Bytes& out, std::span<const T> values) {
    const std::size_t offset = out.size();
    out.resize(offset + values.size_bytes());
    if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
        if (!values.empty()) {
            std::memcpy(out.data() + offset, values.data(), values.size_bytes());
        }
    } else {
        using U = std::conditional_t<
            sizeof(T) == 2, std::uint16_t,
            std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>;
        for (std::size_t i = 0; i < values.size(); ++i) {
            const U swapped = std::byteswap(std::bit_cast<U>(values[i]));
            std::memcpy(out.data() + offset + i * sizeof(T), &swapped, sizeof(T));
        }
    }
}

template <WireElement T>
auto read_le(ByteView bytes) -> std::vector<T> {
    std::vector<T> out(bytes.size() / sizeof(T));
    if (out.empty()) {
        return out;
    }
    if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
        std::memcpy(out.data(), bytes.data(), out.size() * sizeof(T));
    } else {
        using U = std::conditional_t<
            sizeof(T) == 2, std::uint16_t,
            std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>;
        for (std::size_t i = 0; i < out.size(); ++i) {
            U raw;
            std::memcpy(&raw, bytes.data() + i * sizeof(T), sizeof(T));
            out[i] = std::bit_cast<T>(std::byteswap(raw));
        }
    }
    return out;
}

}  // namespace detail

/// Write `count` followed by each array's bytes, already in wire order.
[[nodiscard]] auto encode_bytes(std::uint32_t count, std::initializer_list<ByteView> arrays)
    -> Bytes;

/// Write `count` as little-endian u32, then every array's elements in index
/// order, little-endian. The result is exactly
/// 4 + sum(len(array) * sizeof(element)) bytes long.
template <WireElement... Ts>
[[nodiscard]] auto encode_columns(std::uint32_t count, std::span<const Ts>... arrays) -> Bytes {
    Bytes out;
    out.reserve(kHeaderBytes + (arrays.size_bytes() + ... + 0));
    detail::write_count(out, count);
    (detail::append_le(out, arrays), ...);
    return out;
}

/// Two-array form used by the GPU buffer layout.
[[nodiscard]] auto encode(std::uint32_t count, std::span<const float> a, std::span<const float> b)
    -> Bytes;

/// Read the header and split the payload into one slice per entry of
/// `row_widths` (bytes per row of that array). Fails with MalformedBuffer when
/// `bytes` is shorter than the header, or shorter than the header implies.
/// Bytes past the last array are ignored.
[[nodiscard]] auto decode(ByteView bytes, std::span<const std::size_t> row_widths)
    -> Result<Decoded>;

/// Copy a decoded slice into typed little-endian elements.
template <WireElement T>
[[nodiscard]] auto read_array(ByteView slice) -> std::vector<T> {
    return detail::read_le<T>(slice);
}

[[nodiscard]] auto encode_gpu_buffer(const GpuBuffer& buffer) -> Result<Bytes>;
[[nodiscard]] auto decode_gpu_buffer(ByteView bytes) -> Result<GpuBuffer>;

[[nodiscard]] auto encode_raw_columns(const RawColumns& columns) -> Result<Bytes>;
[[nodiscard]] auto decode_raw_columns(ByteView bytes) -> Result<RawColumns>;

[[nodiscard]] auto encode_voxel_columns(const VoxelColumns& columns) -> Result<Bytes>;
[[nodiscard]] auto decode_voxel_columns(ByteView bytes) -> Result<VoxelColumns>;

}  // namespace tilecache::codec
