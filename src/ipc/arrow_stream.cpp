#include <tilecache/ipc/arrow_stream.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <fmt/core.h>

#include <memory>
#include <type_traits>
#include <variant>

namespace tilecache::ipc {

namespace {

auto arrow_error(std::string_view step, const arrow::Status& status) -> std::unexpected<Error> {
    return make_error(ErrorKind::Engine,
                      fmt::format("arrow stream {} failed: {}", step, status.ToString()));
}

/// Fill `builder` from one column, honoring the entry's validity bitmap.
template <typename Builder, typename T>
auto build_array(Builder& builder, const ColumnEntry& entry, const Column<T>& col)
    -> Result<std::shared_ptr<arrow::Array>> {
    const std::size_t n = col.size();
    auto st = builder.Reserve(static_cast<std::int64_t>(n));
    if (!st.ok()) {
        return arrow_error("reserve", st);
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (is_null(entry, i)) {
            st = builder.AppendNull();
        } else if constexpr (std::is_same_v<T, std::string>) {
            st = builder.Append(col[i].data(), static_cast<std::int32_t>(col[i].size()));
        } else if constexpr (std::is_same_v<T, Blob>) {
            st = builder.Append(col[i].data(), static_cast<std::int32_t>(col[i].size()));
        } else {
            st = builder.Append(col[i]);
        }
        if (!st.ok()) {
            return arrow_error("append", st);
        }
    }
    std::shared_ptr<arrow::Array> arr;
    st = builder.Finish(&arr);
    if (!st.ok()) {
        return arrow_error("finish", st);
    }
    return arr;
}

auto build_arrow_array(const ColumnEntry& entry) -> Result<std::shared_ptr<arrow::Array>> {
    return std::visit(
        [&](const auto& col) -> Result<std::shared_ptr<arrow::Array>> {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                arrow::Int64Builder builder;
                return build_array(builder, entry, col);
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                arrow::DoubleBuilder builder;
                return build_array(builder, entry, col);
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                arrow::StringBuilder builder;
                return build_array(builder, entry, col);
            } else {
                static_assert(std::is_same_v<ColT, Column<Blob>>,
                              "unhandled column type in write_ipc_stream");
                arrow::BinaryBuilder builder;
                return build_array(builder, entry, col);
            }
        },
        *entry.column);
}

auto column_to_arrow_field(const ColumnEntry& entry) -> std::shared_ptr<arrow::Field> {
    return std::visit(
        [&](const auto& col) -> std::shared_ptr<arrow::Field> {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                return arrow::field(entry.name, arrow::int64());
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                return arrow::field(entry.name, arrow::float64());
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                return arrow::field(entry.name, arrow::utf8());
            } else {
                return arrow::field(entry.name, arrow::binary());
            }
        },
        *entry.column);
}

auto table_schema(const Table& table) -> std::shared_ptr<arrow::Schema> {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        fields.push_back(column_to_arrow_field(entry));
    }
    return arrow::schema(std::move(fields));
}

auto to_record_batch(const std::shared_ptr<arrow::Schema>& schema, const Table& table)
    -> Result<std::shared_ptr<arrow::RecordBatch>> {
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        auto arr = build_arrow_array(entry);
        if (!arr) {
            return std::unexpected(arr.error());
        }
        arrays.push_back(std::move(*arr));
    }
    return arrow::RecordBatch::Make(schema, static_cast<std::int64_t>(table.rows()),
                                    std::move(arrays));
}

}  // namespace

auto write_ipc_stream(const std::vector<Table>& batches) -> Result<codec::Bytes> {
    auto schema = batches.empty() ? arrow::schema(arrow::FieldVector{}) : table_schema(batches.front());

    auto sink = arrow::io::BufferOutputStream::Create();
    if (!sink.ok()) {
        return arrow_error("open", sink.status());
    }
    auto writer = arrow::ipc::MakeStreamWriter(*sink, schema);
    if (!writer.ok()) {
        return arrow_error("schema", writer.status());
    }
    for (const auto& table : batches) {
        if (!table_schema(table)->Equals(*schema)) {
            return make_error(ErrorKind::Unsupported, "batches do not share one schema");
        }
        if (table.rows() == 0) {
            continue;
        }
        auto batch = to_record_batch(schema, table);
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (auto st = (*writer)->WriteRecordBatch(**batch); !st.ok()) {
            return arrow_error("write", st);
        }
    }
    if (auto st = (*writer)->Close(); !st.ok()) {
        return arrow_error("close", st);
    }
    auto buffer = (*sink)->Finish();
    if (!buffer.ok()) {
        return arrow_error("finish", buffer.status());
    }
    const auto& data = *buffer;
    return codec::Bytes(data->data(), data->data() + data->size());
}

auto write_ipc_stream(const Table& table) -> Result<codec::Bytes> {
    return write_ipc_stream(std::vector<Table>{table});
}

auto query(service::TileService& service, std::string_view sql) -> Result<codec::Bytes> {
    auto batches = service.query_batches(sql);
    if (!batches) {
        return std::unexpected(batches.error());
    }
    return write_ipc_stream(*batches);
}

auto query_voxel_chunk(service::TileService& service, std::int32_t chunk_x, std::int32_t chunk_z)
    -> Result<codec::Bytes> {
    auto batches = service.query_voxel_chunk(chunk_x, chunk_z);
    if (!batches) {
        return std::unexpected(batches.error());
    }
    return write_ipc_stream(*batches);
}

}  // namespace tilecache::ipc
