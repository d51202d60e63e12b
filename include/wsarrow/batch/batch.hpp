#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/layout.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/core/value.hpp>
#include <wsarrow/record/record.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace wsarrow::batch {

/// Immutable, equal-length set of typed columns.
///
/// Backends store columns their own way; `cell` gives a backend-neutral view
/// so batches from either backend can be compared value for value.
class ColumnarBatch {
   public:
    virtual ~ColumnarBatch() = default;

    [[nodiscard]] virtual auto num_rows() const noexcept -> std::size_t = 0;
    [[nodiscard]] virtual auto layout() const noexcept -> const ColumnLayout& = 0;
    [[nodiscard]] virtual auto backend() const noexcept -> std::string_view = 0;

    /// Value at (`column`, `row`). Both indices must be in range.
    [[nodiscard]] virtual auto cell(std::size_t column, std::size_t row) const -> Cell = 0;

    /// Value of the named column, or nullopt if no such column exists.
    [[nodiscard]] auto find_cell(std::string_view column, std::size_t row) const
        -> std::optional<Cell>;

    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return layout().size(); }
};

struct BuildOptions {
    bool flatten = false;
};

/// Stage one record: explode it and coerce every cell of every resulting row.
/// Fails with a coercion error without producing any row.
[[nodiscard]] auto stage_record(const record::RecordTree& record, const Schema& schema,
                                const ColumnLayout& layout) -> Result<std::vector<StagedRow>>;

/// Incremental batch construction.
///
/// Records are staged (exploded and coerced) before any column is touched, so
/// a failing record or page leaves the batch exactly as it was. Backends only
/// implement the commit of already typed rows and the final seal.
class BatchBuilder {
   public:
    virtual ~BatchBuilder() = default;

    BatchBuilder(const BatchBuilder&) = delete;
    auto operator=(const BatchBuilder&) -> BatchBuilder& = delete;

    /// Append one record; returns the number of rows it produced.
    auto append(const record::RecordTree& record) -> Result<std::size_t>;

    /// Append a whole page atomically; returns the number of rows produced.
    auto append_page(std::span<const record::RecordTree> records) -> Result<std::size_t>;

    /// Seal the batch. Any later call to append, append_page or finalize fails.
    auto finalize() -> Result<std::shared_ptr<const ColumnarBatch>>;

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto layout() const noexcept -> const ColumnLayout& { return layout_; }
    [[nodiscard]] auto schema() const noexcept -> const Schema& { return *schema_; }
    [[nodiscard]] auto finalized() const noexcept -> bool { return finalized_; }

   protected:
    BatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout);

    /// Append rows already coerced to the layout. Must not fail on well-typed
    /// input; a failure here is reported as an internal error.
    virtual auto commit(std::span<const StagedRow> rows) -> Result<void> = 0;

    virtual auto seal() -> Result<std::shared_ptr<const ColumnarBatch>> = 0;

   private:
    auto check_open() const -> Result<void>;
    auto commit_rows(std::span<const StagedRow> rows) -> Result<std::size_t>;

    std::shared_ptr<const Schema> schema_;
    ColumnLayout layout_;
    std::size_t rows_ = 0;
    bool finalized_ = false;
};

}  // namespace wsarrow::batch
