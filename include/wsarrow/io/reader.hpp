#pragma once

#include <wsarrow/batch/batch.hpp>
#include <wsarrow/core/error.hpp>
#include <wsarrow/io/writer.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace wsarrow::io {

/// Read a file written by a BatchWriter back into batches.
///
/// IPC streams yield one batch per record batch in the stream; Parquet files
/// yield one batch per row group. The layout is recovered from the embedded
/// schema; a file holding types outside the kind model is a write error.
/// JSON lines output has no embedded schema and cannot be read back.
[[nodiscard]] auto read_output(std::string_view path, OutputFormat format)
    -> Result<std::vector<std::shared_ptr<const batch::ColumnarBatch>>>;

/// Guess the format from the file extension: ".parquet" / ".pq", ".json" /
/// ".ndjson" / ".jsonl", anything else as IPC.
[[nodiscard]] auto guess_output_format(std::string_view path) -> OutputFormat;

}  // namespace wsarrow::io
