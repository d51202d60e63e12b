#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsarrow {

/// One output column of a batch.
///
/// A scalar column carries `scalar`. A list column (an association kept
/// nested) has no scalar kind and describes its struct elements in `children`.
struct ColumnSpec {
    std::string name;
    std::optional<ScalarKind> scalar;
    bool nullable = true;
    std::vector<ColumnSpec> children;

    [[nodiscard]] auto is_list() const noexcept -> bool { return !scalar.has_value(); }

    auto operator==(const ColumnSpec&) const -> bool = default;
};

/// Where a column's value comes from in a (possibly exploded) record.
struct ColumnSource {
    std::size_t field;                        // index into the schema
    std::optional<std::size_t> element_field; // index into the association element schema
};

/// The column set a batch exposes. Two batches may share a stream only if
/// their layouts compare equal.
struct ColumnLayout {
    std::vector<ColumnSpec> columns;
    std::vector<ColumnSource> sources;
    bool flattened = false;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns.size(); }
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;

    /// Structural equality (names, kinds, nullability, nesting).
    [[nodiscard]] auto same_shape(const ColumnLayout& other) const -> bool {
        return columns == other.columns;
    }
};

/// Separator between association and element field in flattened column names.
inline constexpr std::string_view kFlattenSeparator = ".";

/// Derive the output columns of `schema`. With `flatten`, each top-level
/// association is replaced in place by one nullable column per element field
/// (named `assoc.field`); nested associations inside the element stay lists.
[[nodiscard]] auto make_layout(const Schema& schema, bool flatten) -> Result<ColumnLayout>;

/// List column spec for an association kept nested.
[[nodiscard]] auto list_column(std::string name, const Schema& element, bool nullable)
    -> ColumnSpec;

[[nodiscard]] auto format_layout(const ColumnLayout& layout) -> std::string;

}  // namespace wsarrow
