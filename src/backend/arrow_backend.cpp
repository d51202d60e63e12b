#include <wsarrow/backend/arrow_backend.hpp>

#include <wsarrow/io/arrow_types.hpp>

#include <fmt/core.h>

#include <utility>

namespace wsarrow::backend {

namespace {

template <typename Builder, typename T>
auto append_as(arrow::ArrayBuilder& builder, const ScalarValue& value) -> arrow::Status {
    const auto* typed = std::get_if<T>(&value);
    if (typed == nullptr) {
        return arrow::Status::TypeError("staged value does not match column type ",
                                        builder.type()->ToString());
    }
    return static_cast<Builder&>(builder).Append(*typed);
}

auto append_scalar(arrow::ArrayBuilder& builder, const ScalarValue& value, ScalarKind kind)
    -> arrow::Status {
    if (std::holds_alternative<std::monostate>(value)) {
        return builder.AppendNull();
    }
    switch (kind) {
        case ScalarKind::Integer:
            return append_as<arrow::Int64Builder, std::int64_t>(builder, value);
        case ScalarKind::Decimal:
            return append_as<arrow::DoubleBuilder, double>(builder, value);
        case ScalarKind::Boolean:
            return append_as<arrow::BooleanBuilder, bool>(builder, value);
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            return append_as<arrow::StringBuilder, std::string>(builder, value);
        case ScalarKind::Date:
            if (const auto* date = std::get_if<Date>(&value)) {
                return static_cast<arrow::Date32Builder&>(builder).Append(date->days);
            }
            break;
        case ScalarKind::DateTime:
            if (const auto* ts = std::get_if<Timestamp>(&value)) {
                return static_cast<arrow::TimestampBuilder&>(builder).Append(ts->seconds);
            }
            break;
    }
    return arrow::Status::TypeError("staged value does not match column type ",
                                    builder.type()->ToString());
}

auto append_cell(arrow::ArrayBuilder& builder, const Cell& cell, const ColumnSpec& spec)
    -> arrow::Status {
    if (!spec.is_list()) {
        return append_scalar(builder, cell.scalar, *spec.scalar);
    }
    auto& list = static_cast<arrow::ListBuilder&>(builder);
    if (!cell.list_valid) {
        return list.AppendNull();
    }
    ARROW_RETURN_NOT_OK(list.Append());
    auto& items = static_cast<arrow::StructBuilder&>(*list.value_builder());
    for (const auto& element : cell.items) {
        if (element.size() != spec.children.size()) {
            return arrow::Status::Invalid("list element of '", spec.name, "' has ",
                                          element.size(), " cells, expected ",
                                          spec.children.size());
        }
        ARROW_RETURN_NOT_OK(items.Append());
        for (std::size_t k = 0; k < element.size(); ++k) {
            ARROW_RETURN_NOT_OK(append_cell(*items.field_builder(static_cast<int>(k)), element[k],
                                            spec.children[k]));
        }
    }
    return arrow::Status::OK();
}

}  // namespace

ArrowBatch::ArrowBatch(std::shared_ptr<arrow::RecordBatch> batch, ColumnLayout layout)
    : batch_(std::move(batch)), layout_(std::move(layout)) {}

auto ArrowBatch::num_rows() const noexcept -> std::size_t {
    return static_cast<std::size_t>(batch_->num_rows());
}

auto ArrowBatch::cell(std::size_t column, std::size_t row) const -> Cell {
    return io::cell_from_array(*batch_->column(static_cast<int>(column)),
                               static_cast<std::int64_t>(row), layout_.columns[column]);
}

ArrowBatchBuilder::ArrowBatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout,
                                     std::vector<std::unique_ptr<arrow::ArrayBuilder>> builders)
    : BatchBuilder(std::move(schema), std::move(layout)), builders_(std::move(builders)) {
    arrow_schema_ = io::arrow_schema(this->layout());
}

auto ArrowBatchBuilder::make(std::shared_ptr<const Schema> schema, batch::BuildOptions options)
    -> Result<std::unique_ptr<ArrowBatchBuilder>> {
    auto layout = make_layout(*schema, options.flatten);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    std::vector<std::unique_ptr<arrow::ArrayBuilder>> builders;
    builders.reserve(layout->size());
    for (const auto& column : layout->columns) {
        auto builder = arrow::MakeBuilder(io::arrow_type(column), arrow::default_memory_pool());
        if (!builder.ok()) {
            return std::unexpected(io::from_status(
                builder.status(), fmt::format("cannot create builder for column '{}'", column.name),
                ErrorKind::Internal));
        }
        builders.push_back(std::move(builder).ValueOrDie());
    }
    return std::unique_ptr<ArrowBatchBuilder>(
        new ArrowBatchBuilder(std::move(schema), std::move(*layout), std::move(builders)));
}

auto ArrowBatchBuilder::commit(std::span<const StagedRow> rows) -> Result<void> {
    const auto& columns = layout().columns;
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (const auto st = append_cell(*builders_[c], row[c], columns[c]); !st.ok()) {
                return std::unexpected(
                    io::from_status(st, fmt::format("column '{}'", columns[c].name),
                                    ErrorKind::Internal));
            }
        }
    }
    return {};
}

auto ArrowBatchBuilder::seal() -> Result<std::shared_ptr<const batch::ColumnarBatch>> {
    arrow::ArrayVector arrays;
    arrays.reserve(builders_.size());
    for (std::size_t c = 0; c < builders_.size(); ++c) {
        std::shared_ptr<arrow::Array> array;
        if (const auto st = builders_[c]->Finish(&array); !st.ok()) {
            return std::unexpected(io::from_status(
                st, fmt::format("cannot finish column '{}'", layout().columns[c].name),
                ErrorKind::Internal));
        }
        arrays.push_back(std::move(array));
    }
    auto batch = arrow::RecordBatch::Make(arrow_schema_, static_cast<std::int64_t>(num_rows()),
                                          std::move(arrays));
    return std::make_shared<const ArrowBatch>(std::move(batch), layout());
}

ArrowBatchWriter::ArrowBatchWriter(io::WriterOptions options)
    : BatchWriter(options), sink_(std::move(options)) {}

auto ArrowBatchWriter::do_write(const batch::ColumnarBatch& batch) -> Result<void> {
    const auto* arrow_batch = dynamic_cast<const ArrowBatch*>(&batch);
    if (arrow_batch == nullptr) {
        return std::unexpected(write_error(
            fmt::format("arrow writer cannot write a {} batch", batch.backend())));
    }
    return sink_.write(*arrow_batch->record_batch());
}

auto ArrowBatchWriter::do_close() -> Result<void> {
    return sink_.close();
}

auto ArrowBackend::make_builder(std::shared_ptr<const Schema> schema,
                                batch::BuildOptions options) const
    -> Result<std::unique_ptr<batch::BatchBuilder>> {
    auto builder = ArrowBatchBuilder::make(std::move(schema), options);
    if (!builder) {
        return std::unexpected(builder.error());
    }
    return std::unique_ptr<batch::BatchBuilder>(std::move(*builder));
}

auto ArrowBackend::make_writer(io::WriterOptions options) const
    -> Result<std::unique_ptr<io::BatchWriter>> {
    return std::make_unique<ArrowBatchWriter>(std::move(options));
}

}  // namespace wsarrow::backend
