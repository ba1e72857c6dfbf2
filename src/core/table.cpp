#include <tilecache/core/table.hpp>

#include <fmt/core.h>

namespace tilecache {

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column)),
                                  .validity = std::nullopt});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_column(name, std::move(column));
    columns[index.at(name)].validity = std::move(validity);
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto concat_tables(const std::vector<Table>& batches) -> Result<Table> {
    if (batches.empty()) {
        return Table{};
    }
    if (batches.size() == 1) {
        return batches.front();
    }

    const Table& first = batches.front();
    std::size_t total_rows = 0;
    bool any_nulls = false;
    for (const auto& batch : batches) {
        if (batch.columns.size() != first.columns.size()) {
            return make_error(ErrorKind::Engine, "batch column count mismatch");
        }
        for (std::size_t c = 0; c < first.columns.size(); ++c) {
            const auto& entry = batch.columns[c];
            if (entry.name != first.columns[c].name ||
                entry.column->index() != first.columns[c].column->index()) {
                return make_error(ErrorKind::Engine,
                                  fmt::format("batch schema mismatch at column '{}'",
                                              first.columns[c].name));
            }
            any_nulls = any_nulls || entry.validity.has_value();
        }
        total_rows += batch.rows();
    }

    Table out;
    for (std::size_t c = 0; c < first.columns.size(); ++c) {
        ColumnValue merged = std::visit(
            [&](const auto& head) -> ColumnValue {
                using ColT = std::decay_t<decltype(head)>;
                ColT col;
                col.reserve(total_rows);
                for (const auto& batch : batches) {
                    col.append(std::get<ColT>(*batch.columns[c].column));
                }
                return col;
            },
            *first.columns[c].column);

        if (!any_nulls) {
            out.add_column(first.columns[c].name, std::move(merged));
            continue;
        }
        std::vector<bool> validity;
        validity.reserve(total_rows);
        for (const auto& batch : batches) {
            const auto& entry = batch.columns[c];
            for (std::size_t r = 0; r < batch.rows(); ++r) {
                validity.push_back(!is_null(entry, r));
            }
        }
        out.add_column(first.columns[c].name, std::move(merged), std::move(validity));
    }
    return out;
}

}  // namespace tilecache
