#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

namespace tilecache {

/// Opaque binary value (SQL BLOB).
using Blob = std::vector<std::uint8_t>;

/// The four storage classes a result column can hold: INTEGER, REAL, TEXT
/// and BLOB.
template <typename T>
concept StorageElement = std::same_as<T, std::int64_t> || std::same_as<T, double> ||
                         std::same_as<T, std::string> || std::same_as<T, Blob>;

/// Contiguous values of one result column.
///
/// Rows are appended batch by batch as the engine steps a statement; span()
/// hands the buffer to the transforms without copying.
template <StorageElement T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    Column() = default;
    explicit Column(std::vector<T> values) : values_(std::move(values)) {}
    Column(std::initializer_list<T> init) : values_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    /// Bounds-checked row access.
    [[nodiscard]] auto at(size_type row) const -> const T& { return values_.at(row); }
    [[nodiscard]] auto operator[](size_type row) const noexcept -> const T& { return values_[row]; }

    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return values_; }
    [[nodiscard]] auto data() const noexcept -> const T* { return values_.data(); }

    void push_back(T value) { values_.push_back(std::move(value)); }

    /// Append every row of `other` after the existing rows.
    void append(const Column& other) {
        values_.insert(values_.end(), other.values_.begin(), other.values_.end());
    }

    void reserve(size_type rows) { values_.reserve(rows); }

    [[nodiscard]] auto begin() const noexcept { return values_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return values_.cend(); }

   private:
    std::vector<T> values_;
};

}  // namespace tilecache
