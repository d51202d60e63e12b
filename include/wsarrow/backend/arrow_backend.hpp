#pragma once

#include <wsarrow/backend/backend.hpp>
#include <wsarrow/io/arrow_sink.hpp>

#include <arrow/api.h>

#include <memory>
#include <vector>

namespace wsarrow::backend {

/// Batch backed by an Arrow record batch.
class ArrowBatch final : public batch::ColumnarBatch {
   public:
    ArrowBatch(std::shared_ptr<arrow::RecordBatch> batch, ColumnLayout layout);

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t override;
    [[nodiscard]] auto layout() const noexcept -> const ColumnLayout& override { return layout_; }
    [[nodiscard]] auto backend() const noexcept -> std::string_view override { return "arrow"; }
    [[nodiscard]] auto cell(std::size_t column, std::size_t row) const -> Cell override;

    [[nodiscard]] auto record_batch() const noexcept -> const std::shared_ptr<arrow::RecordBatch>& {
        return batch_;
    }

   private:
    std::shared_ptr<arrow::RecordBatch> batch_;
    ColumnLayout layout_;
};

/// Appends staged rows straight into one ArrayBuilder per column.
class ArrowBatchBuilder final : public batch::BatchBuilder {
   public:
    [[nodiscard]] static auto make(std::shared_ptr<const Schema> schema, batch::BuildOptions options)
        -> Result<std::unique_ptr<ArrowBatchBuilder>>;

   protected:
    auto commit(std::span<const StagedRow> rows) -> Result<void> override;
    auto seal() -> Result<std::shared_ptr<const batch::ColumnarBatch>> override;

   private:
    ArrowBatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout,
                      std::vector<std::unique_ptr<arrow::ArrayBuilder>> builders);

    std::shared_ptr<arrow::Schema> arrow_schema_;
    std::vector<std::unique_ptr<arrow::ArrayBuilder>> builders_;
};

class ArrowBatchWriter final : public io::BatchWriter {
   public:
    explicit ArrowBatchWriter(io::WriterOptions options);

   protected:
    auto do_write(const batch::ColumnarBatch& batch) -> Result<void> override;
    auto do_close() -> Result<void> override;

   private:
    io::ArrowSink sink_;
};

class ArrowBackend final : public Backend {
   public:
    [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Arrow; }

    [[nodiscard]] auto make_builder(std::shared_ptr<const Schema> schema,
                                    batch::BuildOptions options) const
        -> Result<std::unique_ptr<batch::BatchBuilder>> override;

    [[nodiscard]] auto make_writer(io::WriterOptions options) const
        -> Result<std::unique_ptr<io::BatchWriter>> override;
};

}  // namespace wsarrow::backend
