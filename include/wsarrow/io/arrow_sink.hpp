#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/layout.hpp>
#include <wsarrow/io/writer.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <parquet/arrow/writer.h>

#include <memory>
#include <optional>

namespace wsarrow::io {

/// Arrow record batch stream to a file or stdout, as IPC, Parquet or JSON
/// lines.
///
/// The container is opened with the schema of the first batch; later batches
/// must carry an equal schema. JSON lines output writes one object per row,
/// keyed by column name, with dates in the service's text form.
class ArrowSink {
   public:
    explicit ArrowSink(WriterOptions options);

    auto write(const arrow::RecordBatch& batch) -> Result<void>;

    /// Finish the container and close the stream. A sink that never saw a
    /// batch writes nothing.
    auto close() -> Result<void>;

   private:
    auto open(const std::shared_ptr<arrow::Schema>& schema) -> Result<void>;
    auto write_json(const arrow::RecordBatch& batch) -> Result<void>;

    WriterOptions options_;
    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<arrow::io::OutputStream> stream_;
    std::shared_ptr<arrow::ipc::RecordBatchWriter> ipc_writer_;
    std::unique_ptr<parquet::arrow::FileWriter> parquet_writer_;
    /// Set when writing JSON lines.
    std::optional<ColumnLayout> json_layout_;
};

}  // namespace wsarrow::io
