#pragma once

#include <wsarrow/batch/batch.hpp>
#include <wsarrow/core/error.hpp>
#include <wsarrow/core/layout.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wsarrow::io {

enum class OutputFormat : std::uint8_t {
    Ipc,      // Arrow IPC streaming format
    Parquet,
    Json,     // newline-delimited JSON, one object per row
};

enum class Compression : std::uint8_t {
    Uncompressed,
    Snappy,
    Gzip,
    Zstd,
    Lz4,
    Brotli,
};

[[nodiscard]] auto to_string(OutputFormat format) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Compression compression) noexcept -> std::string_view;
[[nodiscard]] auto parse_output_format(std::string_view name) -> std::optional<OutputFormat>;
[[nodiscard]] auto parse_compression(std::string_view name) -> std::optional<Compression>;

/// A file path, or "-" for standard output.
struct OutputTarget {
    std::string path = "-";

    [[nodiscard]] auto is_stdout() const noexcept -> bool { return path.empty() || path == "-"; }
};

struct WriterOptions {
    OutputTarget target;
    OutputFormat format = OutputFormat::Parquet;
    /// Parquet only.
    Compression compression = Compression::Snappy;
    /// Parquet row group length; 0 keeps the library default.
    std::size_t max_row_group_rows = 0;
};

/// Append-only sink for finalized batches.
///
/// Every batch must have the layout of the first one written. Backends
/// implement `do_write` and `do_close`; the layout guard and bookkeeping live
/// here.
class BatchWriter {
   public:
    virtual ~BatchWriter() = default;

    BatchWriter(const BatchWriter&) = delete;
    auto operator=(const BatchWriter&) -> BatchWriter& = delete;

    auto write(const batch::ColumnarBatch& batch) -> Result<void>;

    /// Finalize the container. Idempotent.
    auto close() -> Result<void>;

    [[nodiscard]] auto rows_written() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto batches_written() const noexcept -> std::size_t { return batches_; }
    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }
    [[nodiscard]] auto options() const noexcept -> const WriterOptions& { return options_; }

   protected:
    explicit BatchWriter(WriterOptions options);

    virtual auto do_write(const batch::ColumnarBatch& batch) -> Result<void> = 0;
    virtual auto do_close() -> Result<void> = 0;

   private:
    WriterOptions options_;
    std::optional<ColumnLayout> layout_;
    std::size_t rows_ = 0;
    std::size_t batches_ = 0;
    bool closed_ = false;
};

}  // namespace wsarrow::io
