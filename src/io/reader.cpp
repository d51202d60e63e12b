#include <wsarrow/io/reader.hpp>

#include <wsarrow/backend/arrow_backend.hpp>
#include <wsarrow/io/arrow_types.hpp>

#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <fmt/core.h>
#include <parquet/arrow/reader.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace wsarrow::io {

namespace {

using RecordBatches = std::vector<std::shared_ptr<arrow::RecordBatch>>;

auto read_ipc(const std::shared_ptr<arrow::io::ReadableFile>& input,
              std::shared_ptr<arrow::Schema>& schema, RecordBatches& out) -> Result<void> {
    auto reader = arrow::ipc::RecordBatchStreamReader::Open(input);
    if (!reader.ok()) {
        return std::unexpected(from_status(reader.status(), "not an Arrow IPC stream"));
    }
    auto stream = std::move(reader).ValueOrDie();
    schema = stream->schema();
    while (true) {
        std::shared_ptr<arrow::RecordBatch> batch;
        if (auto st = stream->ReadNext(&batch); !st.ok()) {
            return std::unexpected(from_status(st, "cannot read IPC record batch"));
        }
        if (!batch) {
            return {};
        }
        out.push_back(std::move(batch));
    }
}

auto read_parquet(const std::shared_ptr<arrow::io::ReadableFile>& input,
                  std::shared_ptr<arrow::Schema>& schema, RecordBatches& out) -> Result<void> {
    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto st = parquet::arrow::OpenFile(input, arrow::default_memory_pool(), &reader);
    if (!st.ok()) {
        return std::unexpected(from_status(st, "not a Parquet file"));
    }
    if (st = reader->GetSchema(&schema); !st.ok()) {
        return std::unexpected(from_status(st, "cannot read Parquet schema"));
    }
    for (int group = 0; group < reader->num_row_groups(); ++group) {
        std::shared_ptr<arrow::Table> table;
        if (st = reader->ReadRowGroup(group, &table); !st.ok()) {
            return std::unexpected(from_status(st, fmt::format("cannot read row group {}", group)));
        }
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return std::unexpected(from_status(combined.status(), "cannot combine row group"));
        }
        arrow::TableBatchReader batches(**combined);
        while (true) {
            std::shared_ptr<arrow::RecordBatch> batch;
            if (st = batches.ReadNext(&batch); !st.ok()) {
                return std::unexpected(from_status(st, "cannot slice row group"));
            }
            if (!batch) {
                break;
            }
            out.push_back(std::move(batch));
        }
    }
    return {};
}

}  // namespace

auto guess_output_format(std::string_view path) -> OutputFormat {
    if (path.ends_with(".parquet") || path.ends_with(".pq")) {
        return OutputFormat::Parquet;
    }
    if (path.ends_with(".json") || path.ends_with(".ndjson") || path.ends_with(".jsonl")) {
        return OutputFormat::Json;
    }
    return OutputFormat::Ipc;
}

auto read_output(std::string_view path, OutputFormat format)
    -> Result<std::vector<std::shared_ptr<const batch::ColumnarBatch>>> {
    if (format == OutputFormat::Json) {
        return std::unexpected(
            write_error(fmt::format("'{}': JSON lines output carries no schema to read back", path)));
    }
    auto input = arrow::io::ReadableFile::Open(std::string(path));
    if (!input.ok()) {
        return std::unexpected(from_status(input.status(), fmt::format("cannot open '{}'", path)));
    }
    auto file = std::move(input).ValueOrDie();

    std::shared_ptr<arrow::Schema> schema;
    RecordBatches record_batches;
    auto ok = format == OutputFormat::Ipc ? read_ipc(file, schema, record_batches)
                                          : read_parquet(file, schema, record_batches);
    if (!ok) {
        return std::unexpected(std::move(ok).error());
    }
    auto layout = layout_from_arrow(*schema);
    if (!layout) {
        return std::unexpected(layout.error());
    }

    if (record_batches.empty()) {
        auto empty = arrow::RecordBatch::MakeEmpty(schema);
        if (!empty.ok()) {
            return std::unexpected(from_status(empty.status(), "cannot create empty batch"));
        }
        record_batches.push_back(std::move(empty).ValueOrDie());
    }

    std::vector<std::shared_ptr<const batch::ColumnarBatch>> batches;
    batches.reserve(record_batches.size());
    for (auto& record_batch : record_batches) {
        batches.push_back(std::make_shared<const backend::ArrowBatch>(std::move(record_batch), *layout));
    }
    spdlog::debug("read {} batch(es) from {}", batches.size(), path);
    return batches;
}

}  // namespace wsarrow::io
