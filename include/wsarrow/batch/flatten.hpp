#pragma once

#include <wsarrow/core/types.hpp>
#include <wsarrow/record/record.hpp>

#include <cstddef>
#include <vector>

namespace wsarrow::batch {

/// One output row before coercion.
///
/// `elements` has one slot per schema field. When flattening, the slot of each
/// association field points at the element chosen for this row, or is null
/// when the association is empty. Every other slot is null.
struct ExplodedRow {
    const record::RecordTree* parent = nullptr;
    std::vector<const record::RecordTree*> elements;
};

/// Expand a record into output rows.
///
/// Without `flatten` this is always a single row. With it, the rows are the
/// cross product of the top-level association element sequences, first
/// association outermost; an empty or absent association contributes one null
/// element, so a record never disappears. Nested associations inside an
/// element are left alone.
[[nodiscard]] auto explode(const record::RecordTree& record, const Schema& schema, bool flatten)
    -> std::vector<ExplodedRow>;

/// Number of rows `explode` would produce.
[[nodiscard]] auto exploded_size(const record::RecordTree& record, const Schema& schema,
                                 bool flatten) -> std::size_t;

}  // namespace wsarrow::batch
