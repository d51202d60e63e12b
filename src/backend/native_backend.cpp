#include <wsarrow/backend/native_backend.hpp>

#include <wsarrow/io/arrow_types.hpp>

#include <arrow/buffer_builder.h>
#include <fmt/core.h>

#include <limits>
#include <type_traits>
#include <utility>

namespace wsarrow::backend {

namespace native {

namespace {

auto empty_column(const ColumnSpec& spec) -> ColumnValue {
    if (spec.is_list()) {
        return ListColumn{.offsets = Column<std::int64_t>{0},
                          .elements = std::make_shared<Table>(make_table(spec.children))};
    }
    switch (*spec.scalar) {
        case ScalarKind::Integer:
            return Column<std::int64_t>{};
        case ScalarKind::Decimal:
            return Column<double>{};
        case ScalarKind::Boolean:
            return Column<bool>{};
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            return Column<std::string>{};
        case ScalarKind::Date:
            return Column<Date>{};
        case ScalarKind::DateTime:
            return Column<Timestamp>{};
    }
    return Column<std::string>{};
}

/// Record the validity of row `row`, materializing the bitmap on the first null.
void mark(ColumnEntry& entry, std::size_t row, bool valid) {
    if (!entry.validity) {
        if (valid) {
            return;
        }
        entry.validity = std::vector<bool>(row, true);
    }
    entry.validity->push_back(valid);
}

auto append_row(Table& table, const std::vector<Cell>& row, const std::vector<ColumnSpec>& specs)
    -> Result<void>;

auto append_cell(ColumnEntry& entry, const Cell& cell, const ColumnSpec& spec) -> Result<void> {
    return std::visit(
        [&](auto& column) -> Result<void> {
            using ColT = std::decay_t<decltype(column)>;

            if constexpr (std::is_same_v<ColT, ListColumn>) {
                const std::size_t row = column.offsets.size() - 1;
                const std::int64_t start = column.offsets.back();
                if (!cell.list_valid) {
                    column.offsets.push_back(start);
                    mark(entry, row, false);
                    return {};
                }
                for (const auto& element : cell.items) {
                    if (auto ok = append_row(*column.elements, element, spec.children); !ok) {
                        return ok;
                    }
                }
                column.offsets.push_back(start + static_cast<std::int64_t>(cell.items.size()));
                mark(entry, row, true);
                return {};
            } else {
                using T = typename ColT::value_type;
                const std::size_t row = column.size();
                if (cell.is_null_scalar()) {
                    column.push_default();
                    mark(entry, row, false);
                    return {};
                }
                const auto* value = std::get_if<T>(&cell.scalar);
                if (value == nullptr) {
                    return std::unexpected(internal_error(
                        fmt::format("column '{}': staged value has the wrong type", entry.name)));
                }
                column.push_back(*value);
                mark(entry, row, true);
                return {};
            }
        },
        *entry.column);
}

auto append_row(Table& table, const std::vector<Cell>& row, const std::vector<ColumnSpec>& specs)
    -> Result<void> {
    if (row.size() != table.columns.size() || specs.size() != table.columns.size()) {
        return std::unexpected(internal_error(fmt::format(
            "staged row has {} cells, table has {} columns", row.size(), table.columns.size())));
    }
    for (std::size_t c = 0; c < row.size(); ++c) {
        if (auto ok = append_cell(table.columns[c], row[c], specs[c]); !ok) {
            return ok;
        }
    }
    return {};
}

auto cell_at(const ColumnEntry& entry, std::size_t row, const ColumnSpec& spec) -> Cell {
    if (is_null(entry, row)) {
        return null_cell();
    }
    return std::visit(
        [&](const auto& column) -> Cell {
            using ColT = std::decay_t<decltype(column)>;

            if constexpr (std::is_same_v<ColT, ListColumn>) {
                const auto begin = static_cast<std::size_t>(column.offsets[row]);
                const auto end = static_cast<std::size_t>(column.offsets[row + 1]);
                std::vector<std::vector<Cell>> items;
                items.reserve(end - begin);
                for (std::size_t i = begin; i < end; ++i) {
                    std::vector<Cell> element;
                    element.reserve(spec.children.size());
                    for (std::size_t k = 0; k < spec.children.size(); ++k) {
                        element.push_back(cell_at(column.elements->columns[k], i, spec.children[k]));
                    }
                    items.push_back(std::move(element));
                }
                return list_cell(std::move(items));
            } else {
                using T = typename ColT::value_type;
                return scalar_cell(ScalarValue{std::in_place_type<T>, column[row]});
            }
        },
        *entry.column);
}

template <typename Builder, typename T, typename Convert>
auto build_scalar(const ColumnEntry& entry, const Column<T>& column, const ColumnSpec& spec,
                  Convert convert) -> arrow::Result<std::shared_ptr<arrow::Array>> {
    Builder builder(io::arrow_type(spec), arrow::default_memory_pool());
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<std::int64_t>(column.size())));
    for (std::size_t i = 0; i < column.size(); ++i) {
        if (is_null(entry, i)) {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
        } else {
            ARROW_RETURN_NOT_OK(builder.Append(convert(column[i])));
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

auto build_array(const ColumnEntry& entry, const ColumnSpec& spec)
    -> arrow::Result<std::shared_ptr<arrow::Array>>;

auto build_list(const ColumnEntry& entry, const ListColumn& column, const ColumnSpec& spec)
    -> arrow::Result<std::shared_ptr<arrow::Array>> {
    const auto type = io::arrow_type(spec);
    const auto& list_type = static_cast<const arrow::ListType&>(*type);

    arrow::ArrayVector children;
    children.reserve(spec.children.size());
    for (std::size_t k = 0; k < spec.children.size(); ++k) {
        ARROW_ASSIGN_OR_RAISE(auto child, build_array(column.elements->columns[k], spec.children[k]));
        children.push_back(std::move(child));
    }
    auto values = std::make_shared<arrow::StructArray>(
        list_type.value_type(), static_cast<std::int64_t>(column.elements->rows()), children);

    const std::size_t rows = column.offsets.size() - 1;
    arrow::TypedBufferBuilder<std::int32_t> offsets;
    ARROW_RETURN_NOT_OK(offsets.Reserve(static_cast<std::int64_t>(column.offsets.size())));
    for (auto offset : column.offsets) {
        if (offset > std::numeric_limits<std::int32_t>::max()) {
            return arrow::Status::CapacityError("list column '", entry.name,
                                                "' exceeds 32-bit offsets");
        }
        offsets.UnsafeAppend(static_cast<std::int32_t>(offset));
    }
    std::shared_ptr<arrow::Buffer> offset_buffer;
    ARROW_RETURN_NOT_OK(offsets.Finish(&offset_buffer));

    std::shared_ptr<arrow::Buffer> null_bitmap;
    std::int64_t null_count = 0;
    if (entry.validity) {
        arrow::TypedBufferBuilder<bool> bitmap;
        ARROW_RETURN_NOT_OK(bitmap.Reserve(static_cast<std::int64_t>(rows)));
        for (std::size_t i = 0; i < rows; ++i) {
            bitmap.UnsafeAppend(static_cast<bool>((*entry.validity)[i]));
        }
        null_count = bitmap.false_count();
        ARROW_RETURN_NOT_OK(bitmap.Finish(&null_bitmap));
        if (null_count == 0) {
            null_bitmap.reset();
        }
    }
    return std::make_shared<arrow::ListArray>(type, static_cast<std::int64_t>(rows),
                                              std::move(offset_buffer), std::move(values),
                                              std::move(null_bitmap), null_count);
}

auto build_array(const ColumnEntry& entry, const ColumnSpec& spec)
    -> arrow::Result<std::shared_ptr<arrow::Array>> {
    return std::visit(
        [&](const auto& column) -> arrow::Result<std::shared_ptr<arrow::Array>> {
            using ColT = std::decay_t<decltype(column)>;

            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                return build_scalar<arrow::Int64Builder>(entry, column, spec,
                                                         [](std::int64_t v) { return v; });
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                return build_scalar<arrow::DoubleBuilder>(entry, column, spec,
                                                          [](double v) { return v; });
            } else if constexpr (std::is_same_v<ColT, Column<bool>>) {
                return build_scalar<arrow::BooleanBuilder>(entry, column, spec,
                                                           [](bool v) { return v; });
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                return build_scalar<arrow::StringBuilder>(
                    entry, column, spec, [](const std::string& v) { return std::string_view(v); });
            } else if constexpr (std::is_same_v<ColT, Column<Date>>) {
                return build_scalar<arrow::Date32Builder>(entry, column, spec,
                                                          [](const Date& v) { return v.days; });
            } else if constexpr (std::is_same_v<ColT, Column<Timestamp>>) {
                return build_scalar<arrow::TimestampBuilder>(
                    entry, column, spec, [](const Timestamp& v) { return v.seconds; });
            } else {
                return build_list(entry, column, spec);
            }
        },
        *entry.column);
}

}  // namespace

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit(
        [](const auto& col) -> std::size_t {
            if constexpr (std::is_same_v<std::decay_t<decltype(col)>, ListColumn>) {
                return col.offsets.size() - 1;
            } else {
                return col.size();
            }
        },
        column);
}

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (const auto* entry = find_entry(name)) {
        return entry->column.get();
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

auto make_table(const std::vector<ColumnSpec>& specs) -> Table {
    Table table;
    for (const auto& spec : specs) {
        table.add_column(spec.name, empty_column(spec));
        if (spec.nullable) {
            table.columns.back().validity = std::vector<bool>{};
        }
    }
    return table;
}

auto build_arrow_array(const ColumnEntry& entry, const ColumnSpec& spec)
    -> Result<std::shared_ptr<arrow::Array>> {
    auto array = build_array(entry, spec);
    if (!array.ok()) {
        return std::unexpected(io::from_status(
            array.status(), fmt::format("cannot convert column '{}'", entry.name)));
    }
    return std::move(array).ValueOrDie();
}

}  // namespace native

NativeBatch::NativeBatch(std::shared_ptr<const native::Table> table, ColumnLayout layout)
    : table_(std::move(table)), layout_(std::move(layout)) {}

auto NativeBatch::cell(std::size_t column, std::size_t row) const -> Cell {
    return native::cell_at(table_->columns[column], row, layout_.columns[column]);
}

auto NativeBatch::to_record_batch() const -> Result<std::shared_ptr<arrow::RecordBatch>> {
    arrow::ArrayVector arrays;
    arrays.reserve(layout_.size());
    for (std::size_t c = 0; c < layout_.size(); ++c) {
        auto array = native::build_arrow_array(table_->columns[c], layout_.columns[c]);
        if (!array) {
            return std::unexpected(array.error());
        }
        arrays.push_back(std::move(*array));
    }
    return arrow::RecordBatch::Make(io::arrow_schema(layout_),
                                    static_cast<std::int64_t>(num_rows()), std::move(arrays));
}

NativeBatchBuilder::NativeBatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout)
    : BatchBuilder(std::move(schema), std::move(layout)),
      table_(std::make_shared<native::Table>(native::make_table(this->layout().columns))) {}

auto NativeBatchBuilder::commit(std::span<const StagedRow> rows) -> Result<void> {
    for (const auto& row : rows) {
        if (auto ok = native::append_row(*table_, row, layout().columns); !ok) {
            return ok;
        }
    }
    return {};
}

auto NativeBatchBuilder::seal() -> Result<std::shared_ptr<const batch::ColumnarBatch>> {
    return std::make_shared<const NativeBatch>(std::move(table_), layout());
}

NativeBatchWriter::NativeBatchWriter(io::WriterOptions options)
    : BatchWriter(options), sink_(std::move(options)) {}

auto NativeBatchWriter::do_write(const batch::ColumnarBatch& batch) -> Result<void> {
    const auto* native_batch = dynamic_cast<const NativeBatch*>(&batch);
    if (native_batch == nullptr) {
        return std::unexpected(write_error(
            fmt::format("native writer cannot write a {} batch", batch.backend())));
    }
    auto record_batch = native_batch->to_record_batch();
    if (!record_batch) {
        return std::unexpected(record_batch.error());
    }
    return sink_.write(**record_batch);
}

auto NativeBatchWriter::do_close() -> Result<void> {
    return sink_.close();
}

auto NativeBackend::make_builder(std::shared_ptr<const Schema> schema,
                                 batch::BuildOptions options) const
    -> Result<std::unique_ptr<batch::BatchBuilder>> {
    auto layout = make_layout(*schema, options.flatten);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    return std::make_unique<NativeBatchBuilder>(std::move(schema), std::move(*layout));
}

auto NativeBackend::make_writer(io::WriterOptions options) const
    -> Result<std::unique_ptr<io::BatchWriter>> {
    return std::make_unique<NativeBatchWriter>(std::move(options));
}

}  // namespace wsarrow::backend
