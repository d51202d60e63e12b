#include <wsarrow/batch/batch.hpp>

#include <wsarrow/batch/flatten.hpp>
#include <wsarrow/core/coerce.hpp>

#include <fmt/core.h>

#include <utility>

namespace wsarrow::batch {

namespace {

using record::RecordTree;

auto describe(const RecordTree::Value& value) -> std::string {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (std::holds_alternative<RecordTree::List>(value)) {
        return "<list>";
    }
    if (std::holds_alternative<RecordTree::Nested>(value)) {
        return "<record>";
    }
    return "null";
}

auto stage_list(const RecordTree::Value* value, const FieldSpec& field, std::string_view name)
    -> Result<Cell>;

auto stage_scalar(const RecordTree::Value* value, ScalarKind kind, bool nullable,
                  std::string_view name) -> Result<Cell> {
    if (value == nullptr || record::is_null(*value)) {
        if (nullable) {
            return null_cell();
        }
        return std::unexpected(coercion_error("missing value for non-nullable field",
                                              std::string(name),
                                              value == nullptr ? "" : "null"));
    }
    const auto* text = std::get_if<std::string>(value);
    if (text == nullptr) {
        return std::unexpected(coercion_error(
            fmt::format("expected a {} value", to_string(kind)), std::string(name), describe(*value)));
    }
    auto coerced = coerce_scalar(*text, kind, name);
    if (!coerced) {
        return std::unexpected(coerced.error());
    }
    if (std::holds_alternative<std::monostate>(*coerced) && !nullable) {
        return std::unexpected(
            coercion_error(fmt::format("empty value for non-nullable {} field", to_string(kind)),
                           std::string(name), *text));
    }
    return scalar_cell(std::move(*coerced));
}

/// Stage one element of a nested association into a row aligned with the
/// element schema.
auto stage_element(const RecordTree& element, const Schema& schema, std::string_view name)
    -> Result<StagedRow> {
    StagedRow row;
    row.reserve(schema.size());
    for (const auto& field : schema.fields()) {
        const auto child_name = fmt::format("{}.{}", name, field.name);
        const auto* value = element.get(field.name);
        auto cell = field.is_association()
                        ? stage_list(value, field, child_name)
                        : stage_scalar(value, *field.scalar_kind(), field.nullable, child_name);
        if (!cell) {
            return std::unexpected(cell.error());
        }
        row.push_back(std::move(*cell));
    }
    return row;
}

auto stage_list(const RecordTree::Value* value, const FieldSpec& field, std::string_view name)
    -> Result<Cell> {
    if (value == nullptr || record::is_null(*value)) {
        if (field.nullable) {
            return null_cell();
        }
        return list_cell({});
    }
    const auto* list = std::get_if<RecordTree::List>(value);
    if (list == nullptr) {
        return std::unexpected(coercion_error("expected a list of sub-records", std::string(name),
                                              describe(*value)));
    }
    const auto& element = *field.association()->element;
    std::vector<StagedRow> items;
    items.reserve(list->size());
    for (const auto& item : *list) {
        auto row = stage_element(item, element, name);
        if (!row) {
            return std::unexpected(row.error());
        }
        items.push_back(std::move(*row));
    }
    return list_cell(std::move(items));
}

/// Reject association values that are neither a list nor null before they
/// are exploded; explode itself treats them as empty.
auto check_associations(const RecordTree& record, const Schema& schema) -> Result<void> {
    for (auto index : schema.association_indices()) {
        const auto& field = schema.fields()[index];
        const auto* value = record.get(field.name);
        if (value != nullptr && !record::is_null(*value) &&
            !std::holds_alternative<RecordTree::List>(*value)) {
            return std::unexpected(coercion_error("expected a list of sub-records", field.name,
                                                  describe(*value)));
        }
    }
    return {};
}

}  // namespace

auto ColumnarBatch::find_cell(std::string_view column, std::size_t row) const
    -> std::optional<Cell> {
    if (auto index = layout().find(column)) {
        return cell(*index, row);
    }
    return std::nullopt;
}

auto stage_record(const RecordTree& record, const Schema& schema, const ColumnLayout& layout)
    -> Result<std::vector<StagedRow>> {
    if (layout.flattened) {
        if (auto ok = check_associations(record, schema); !ok) {
            return std::unexpected(ok.error());
        }
    }
    std::vector<StagedRow> rows;
    for (const auto& exploded : explode(record, schema, layout.flattened)) {
        StagedRow row;
        row.reserve(layout.size());
        for (std::size_t c = 0; c < layout.size(); ++c) {
            const auto& spec = layout.columns[c];
            const auto& source = layout.sources[c];
            const auto& field = schema.fields()[source.field];

            Result<Cell> cell;
            if (!source.element_field) {
                const auto* value = exploded.parent->get(field.name);
                cell = field.is_association()
                           ? stage_list(value, field, spec.name)
                           : stage_scalar(value, *field.scalar_kind(), field.nullable, spec.name);
            } else {
                const auto* element = exploded.elements[source.field];
                const auto& element_field =
                    field.association()->element->fields()[*source.element_field];
                if (element == nullptr) {
                    cell = null_cell();
                } else {
                    const auto* value = element->get(element_field.name);
                    cell = element_field.is_association()
                               ? stage_list(value, element_field, spec.name)
                               : stage_scalar(value, *element_field.scalar_kind(),
                                              element_field.nullable, spec.name);
                }
            }
            if (!cell) {
                return std::unexpected(cell.error());
            }
            row.push_back(std::move(*cell));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

BatchBuilder::BatchBuilder(std::shared_ptr<const Schema> schema, ColumnLayout layout)
    : schema_(std::move(schema)), layout_(std::move(layout)) {}

auto BatchBuilder::check_open() const -> Result<void> {
    if (finalized_) {
        return std::unexpected(internal_error("batch builder used after finalize()"));
    }
    return {};
}

auto BatchBuilder::commit_rows(std::span<const StagedRow> rows) -> Result<std::size_t> {
    if (rows.empty()) {
        return 0;
    }
    if (auto ok = commit(rows); !ok) {
        // A backend that fails mid-commit may hold a partial row; refuse further use.
        finalized_ = true;
        return std::unexpected(internal_error(
            fmt::format("backend failed to commit staged rows: {}", ok.error().message)));
    }
    rows_ += rows.size();
    return rows.size();
}

auto BatchBuilder::append(const record::RecordTree& record) -> Result<std::size_t> {
    if (auto ok = check_open(); !ok) {
        return std::unexpected(ok.error());
    }
    auto staged = stage_record(record, *schema_, layout_);
    if (!staged) {
        return std::unexpected(staged.error());
    }
    return commit_rows(*staged);
}

auto BatchBuilder::append_page(std::span<const record::RecordTree> records)
    -> Result<std::size_t> {
    if (auto ok = check_open(); !ok) {
        return std::unexpected(ok.error());
    }
    std::vector<StagedRow> staged;
    staged.reserve(records.size());
    for (const auto& record : records) {
        auto rows = stage_record(record, *schema_, layout_);
        if (!rows) {
            return std::unexpected(rows.error());
        }
        for (auto& row : *rows) {
            staged.push_back(std::move(row));
        }
    }
    return commit_rows(staged);
}

auto BatchBuilder::finalize() -> Result<std::shared_ptr<const ColumnarBatch>> {
    if (auto ok = check_open(); !ok) {
        return std::unexpected(ok.error());
    }
    finalized_ = true;
    return seal();
}

}  // namespace wsarrow::batch
