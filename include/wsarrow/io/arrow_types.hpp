#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/layout.hpp>
#include <wsarrow/core/value.hpp>

#include <arrow/api.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace wsarrow::io {

/// Field metadata key carrying the scalar kind, so HtmlText survives a round
/// trip through a file that only knows utf8.
inline constexpr std::string_view kKindMetadataKey = "wsarrow.kind";

/// Arrow type of a scalar kind:
///   Integer -> int64, Decimal -> float64, Boolean -> bool,
///   Text / HtmlText -> utf8, Date -> date32, DateTime -> timestamp[s].
[[nodiscard]] auto arrow_type(ScalarKind kind) -> std::shared_ptr<arrow::DataType>;

/// Arrow type of a column. A list column maps to list<item: struct<...>> with
/// non-nullable items.
[[nodiscard]] auto arrow_type(const ColumnSpec& spec) -> std::shared_ptr<arrow::DataType>;

[[nodiscard]] auto arrow_field(const ColumnSpec& spec) -> std::shared_ptr<arrow::Field>;

[[nodiscard]] auto arrow_schema(const ColumnLayout& layout) -> std::shared_ptr<arrow::Schema>;

/// Recover a layout from an Arrow schema written by this library.
/// Fails with a write error on types outside the kind model.
[[nodiscard]] auto layout_from_arrow(const arrow::Schema& schema) -> Result<ColumnLayout>;

/// Read one cell. `array` must have the type `arrow_type(spec)` produces.
[[nodiscard]] auto cell_from_array(const arrow::Array& array, std::int64_t row,
                                   const ColumnSpec& spec) -> Cell;

/// Convert a failed Arrow status into an Error of `kind`.
[[nodiscard]] auto from_status(const arrow::Status& status, std::string_view context,
                               ErrorKind kind = ErrorKind::Write) -> Error;

}  // namespace wsarrow::io
