#include <wsarrow/io/arrow_sink.hpp>

#include <wsarrow/io/arrow_types.hpp>

#include <arrow/io/stdio.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <parquet/properties.h>

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace wsarrow::io {

namespace {

auto parquet_codec(Compression compression) -> parquet::Compression::type {
    switch (compression) {
        case Compression::Uncompressed:
            return parquet::Compression::UNCOMPRESSED;
        case Compression::Snappy:
            return parquet::Compression::SNAPPY;
        case Compression::Gzip:
            return parquet::Compression::GZIP;
        case Compression::Zstd:
            return parquet::Compression::ZSTD;
        case Compression::Lz4:
            return parquet::Compression::LZ4;
        case Compression::Brotli:
            return parquet::Compression::BROTLI;
    }
    return parquet::Compression::UNCOMPRESSED;
}

auto open_stream(const OutputTarget& target) -> Result<std::shared_ptr<arrow::io::OutputStream>> {
    if (target.is_stdout()) {
        return std::make_shared<arrow::io::StdoutStream>();
    }
    auto stream = arrow::io::FileOutputStream::Open(target.path);
    if (!stream.ok()) {
        return std::unexpected(from_status(stream.status(), fmt::format("cannot open '{}'", target.path)));
    }
    return std::move(stream).ValueOrDie();
}

auto json_scalar(const ScalarValue& value) -> nlohmann::json {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_datetime(v);
            } else {
                return v;
            }
        },
        value);
}

auto json_cell(const Cell& cell, const ColumnSpec& spec) -> nlohmann::json {
    if (!spec.is_list()) {
        return json_scalar(cell.scalar);
    }
    if (!cell.list_valid) {
        return nullptr;
    }
    auto items = nlohmann::json::array();
    for (const auto& item : cell.items) {
        auto element = nlohmann::json::object();
        for (std::size_t i = 0; i < spec.children.size() && i < item.size(); ++i) {
            element[spec.children[i].name] = json_cell(item[i], spec.children[i]);
        }
        items.push_back(std::move(element));
    }
    return items;
}

}  // namespace

ArrowSink::ArrowSink(WriterOptions options) : options_(std::move(options)) {}

auto ArrowSink::open(const std::shared_ptr<arrow::Schema>& schema) -> Result<void> {
    auto stream = open_stream(options_.target);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    stream_ = std::move(*stream);
    schema_ = schema;

    if (options_.format == OutputFormat::Json) {
        auto layout = layout_from_arrow(*schema_);
        if (!layout) {
            return std::unexpected(layout.error());
        }
        json_layout_ = std::move(*layout);
        return {};
    }

    if (options_.format == OutputFormat::Ipc) {
        auto writer = arrow::ipc::MakeStreamWriter(stream_, schema_);
        if (!writer.ok()) {
            return std::unexpected(from_status(writer.status(), "cannot start IPC stream"));
        }
        ipc_writer_ = std::move(writer).ValueOrDie();
        return {};
    }

    parquet::WriterProperties::Builder props_builder;
    props_builder.compression(parquet_codec(options_.compression));
    if (options_.max_row_group_rows > 0) {
        props_builder.max_row_group_length(static_cast<std::int64_t>(options_.max_row_group_rows));
    }
    // Embed the Arrow schema so timestamps, lists and field metadata read back
    // exactly as written.
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();

    auto writer = parquet::arrow::FileWriter::Open(*schema_, arrow::default_memory_pool(), stream_,
                                                   props_builder.build(), arrow_props);
    if (!writer.ok()) {
        return std::unexpected(from_status(writer.status(), "cannot start Parquet file"));
    }
    parquet_writer_ = std::move(writer).ValueOrDie();
    return {};
}

auto ArrowSink::write(const arrow::RecordBatch& batch) -> Result<void> {
    if (!schema_) {
        if (auto ok = open(batch.schema()); !ok) {
            return ok;
        }
    } else if (!schema_->Equals(*batch.schema(), /*check_metadata=*/false)) {
        return std::unexpected(write_error(fmt::format(
            "record batch schema differs from the stream schema\n  expected {}\n  got {}",
            schema_->ToString(), batch.schema()->ToString())));
    }

    if (json_layout_) {
        return write_json(batch);
    }
    const auto status = ipc_writer_ ? ipc_writer_->WriteRecordBatch(batch)
                                    : parquet_writer_->WriteRecordBatch(batch);
    if (!status.ok()) {
        return std::unexpected(from_status(status, "cannot write record batch"));
    }
    return {};
}

auto ArrowSink::write_json(const arrow::RecordBatch& batch) -> Result<void> {
    const auto& columns = json_layout_->columns;
    std::string lines;
    for (std::int64_t row = 0; row < batch.num_rows(); ++row) {
        auto object = nlohmann::json::object();
        for (std::size_t c = 0; c < columns.size(); ++c) {
            const auto cell = cell_from_array(*batch.column(static_cast<int>(c)), row, columns[c]);
            object[columns[c].name] = json_cell(cell, columns[c]);
        }
        lines += object.dump();
        lines.push_back('\n');
    }
    if (lines.empty()) {
        return {};
    }
    if (auto st = stream_->Write(lines.data(), static_cast<std::int64_t>(lines.size())); !st.ok()) {
        return std::unexpected(from_status(st, "cannot write JSON lines"));
    }
    return {};
}

auto ArrowSink::close() -> Result<void> {
    if (!stream_) {
        return {};
    }
    if (!json_layout_) {
        const auto status = ipc_writer_ ? ipc_writer_->Close() : parquet_writer_->Close();
        if (!status.ok()) {
            return std::unexpected(from_status(status, "cannot finish output"));
        }
    }
    ipc_writer_.reset();
    parquet_writer_.reset();
    json_layout_.reset();
    if (const auto closed = stream_->Close(); !closed.ok()) {
        return std::unexpected(from_status(closed, "cannot close output"));
    }
    stream_.reset();
    return {};
}

}  // namespace wsarrow::io
