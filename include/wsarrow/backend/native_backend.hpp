#pragma once

#include <wsarrow/backend/backend.hpp>
#include <wsarrow/core/column.hpp>
#include <wsarrow/core/time.hpp>
#include <wsarrow/io/arrow_sink.hpp>

#include <arrow/api.h>
#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wsarrow::backend {

namespace native {

struct Table;

/// Variable-length list of sub-records. Row i spans element rows
/// [offsets[i], offsets[i + 1]) of `elements`; `offsets` starts with 0.
struct ListColumn {
    Column<std::int64_t> offsets;
    std::shared_ptr<Table> elements;
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<bool>,
                                 Column<std::string>, Column<Date>, Column<Timestamp>, ListColumn>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;

struct Table {
    std::vector<ColumnEntry> columns;
    robin_hood::unordered_flat_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

/// Empty table with one column per spec, typed after the spec's kind.
/// Nullable columns start with an (empty) validity bitmap.
[[nodiscard]] auto make_table(const std::vector<ColumnSpec>& specs) -> Table;

/// Convert one column to Arrow. The entry must have been built for `spec`.
[[nodiscard]] auto build_arrow_array(const ColumnEntry& entry, const ColumnSpec& spec)
    -> Result<std::shared_ptr<arrow::Array>>;

}  // namespace native

/// Batch backed by the native column runtime.
class NativeBatch final : public batch::ColumnarBatch {
   public:
    NativeBatch(std::shared_ptr<const native::Table> table, ColumnLayout layout);

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t override { return table_->rows(); }
    [[nodiscard]] auto layout() const noexcept -> const ColumnLayout& override { return layout_; }
    [[nodiscard]] auto backend() const noexcept -> std::string_view override { return "native"; }
    [[nodiscard]] auto cell(std::size_t column, std::size_t row) const -> Cell override;

    [[nodiscard]] auto table() const noexcept -> const native::Table& { return *table_; }

    /// Arrow record batch with the same layout as the Arrow backend produces.
    [[nodiscard]] auto to_record_batch() const -> Result<std::shared_ptr<arrow::RecordBatch>>;

   private:
    std::shared_ptr<const native::Table> table_;
    ColumnLayout layout_;
};

class NativeBatchBuilder final : public batch::BatchBuilder {
   public:
    NativeBatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout);

   protected:
    auto commit(std::span<const StagedRow> rows) -> Result<void> override;
    auto seal() -> Result<std::shared_ptr<const batch::ColumnarBatch>> override;

   private:
    std::shared_ptr<native::Table> table_;
};

class NativeBatchWriter final : public io::BatchWriter {
   public:
    explicit NativeBatchWriter(io::WriterOptions options);

   protected:
    auto do_write(const batch::ColumnarBatch& batch) -> Result<void> override;
    auto do_close() -> Result<void> override;

   private:
    io::ArrowSink sink_;
};

class NativeBackend final : public Backend {
   public:
    [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Native; }

    [[nodiscard]] auto make_builder(std::shared_ptr<const Schema> schema,
                                    batch::BuildOptions options) const
        -> Result<std::unique_ptr<batch::BatchBuilder>> override;

    [[nodiscard]] auto make_writer(io::WriterOptions options) const
        -> Result<std::unique_ptr<io::BatchWriter>> override;
};

}  // namespace wsarrow::backend
