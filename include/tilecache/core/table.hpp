#pragma once

#include <tilecache/core/column.hpp>
#include <tilecache/core/error.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tilecache {

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                 Column<Blob>>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;

/// In-memory columnar table.
///
/// Columns are held through shared pointers, so copying a Table is cheap and
/// the copy shares column storage with the original.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

/// Vertically stack `batches` into one table.
///
/// Every batch must have the same column names and types, in the same order.
/// An empty list yields an empty table.
[[nodiscard]] auto concat_tables(const std::vector<Table>& batches) -> Result<Table>;

}  // namespace tilecache
