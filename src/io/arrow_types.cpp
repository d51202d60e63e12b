#include <wsarrow/io/arrow_types.hpp>

#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

namespace wsarrow::io {

namespace {

auto kind_metadata(ScalarKind kind) -> std::shared_ptr<const arrow::KeyValueMetadata> {
    return arrow::key_value_metadata({std::string(kKindMetadataKey)},
                                     {std::string(to_string(kind))});
}

auto kind_from_type(const arrow::DataType& type) -> std::optional<ScalarKind> {
    switch (type.id()) {
        case arrow::Type::INT64:
            return ScalarKind::Integer;
        case arrow::Type::DOUBLE:
            return ScalarKind::Decimal;
        case arrow::Type::BOOL:
            return ScalarKind::Boolean;
        case arrow::Type::STRING:
            return ScalarKind::Text;
        case arrow::Type::DATE32:
            return ScalarKind::Date;
        case arrow::Type::TIMESTAMP:
            if (static_cast<const arrow::TimestampType&>(type).unit() == arrow::TimeUnit::SECOND) {
                return ScalarKind::DateTime;
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

auto spec_from_field(const arrow::Field& field) -> Result<ColumnSpec> {
    const auto& type = *field.type();
    ColumnSpec spec{.name = field.name(), .nullable = field.nullable()};

    if (type.id() == arrow::Type::LIST) {
        const auto& value_type = *static_cast<const arrow::ListType&>(type).value_type();
        if (value_type.id() != arrow::Type::STRUCT) {
            return std::unexpected(write_error(
                fmt::format("column '{}': list items must be structs, found {}", field.name(),
                            value_type.ToString())));
        }
        for (const auto& child : value_type.fields()) {
            auto child_spec = spec_from_field(*child);
            if (!child_spec) {
                return std::unexpected(child_spec.error());
            }
            spec.children.push_back(std::move(*child_spec));
        }
        return spec;
    }

    auto kind = kind_from_type(type);
    if (!kind) {
        return std::unexpected(write_error(
            fmt::format("column '{}': unsupported Arrow type {}", field.name(), type.ToString())));
    }
    // utf8 columns may be HtmlText; only the metadata can tell.
    if (*kind == ScalarKind::Text && field.metadata() != nullptr) {
        const auto index = field.metadata()->FindKey(std::string(kKindMetadataKey));
        if (index >= 0) {
            auto tagged = parse_scalar_kind(field.metadata()->value(index));
            if (tagged == ScalarKind::HtmlText) {
                kind = tagged;
            }
        }
    }
    spec.scalar = kind;
    return spec;
}

auto scalar_from_array(const arrow::Array& array, std::int64_t row, ScalarKind kind)
    -> ScalarValue {
    switch (kind) {
        case ScalarKind::Integer:
            return static_cast<const arrow::Int64Array&>(array).Value(row);
        case ScalarKind::Decimal:
            return static_cast<const arrow::DoubleArray&>(array).Value(row);
        case ScalarKind::Boolean:
            return static_cast<const arrow::BooleanArray&>(array).Value(row);
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            return static_cast<const arrow::StringArray&>(array).GetString(row);
        case ScalarKind::Date:
            return Date{.days = static_cast<const arrow::Date32Array&>(array).Value(row)};
        case ScalarKind::DateTime:
            return Timestamp{.seconds = static_cast<const arrow::TimestampArray&>(array).Value(row)};
    }
    return std::monostate{};
}

}  // namespace

auto arrow_type(ScalarKind kind) -> std::shared_ptr<arrow::DataType> {
    switch (kind) {
        case ScalarKind::Integer:
            return arrow::int64();
        case ScalarKind::Decimal:
            return arrow::float64();
        case ScalarKind::Boolean:
            return arrow::boolean();
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            return arrow::utf8();
        case ScalarKind::Date:
            return arrow::date32();
        case ScalarKind::DateTime:
            return arrow::timestamp(arrow::TimeUnit::SECOND);
    }
    return arrow::utf8();
}

auto arrow_type(const ColumnSpec& spec) -> std::shared_ptr<arrow::DataType> {
    if (!spec.is_list()) {
        return arrow_type(*spec.scalar);
    }
    arrow::FieldVector children;
    children.reserve(spec.children.size());
    for (const auto& child : spec.children) {
        children.push_back(arrow_field(child));
    }
    return arrow::list(arrow::field("item", arrow::struct_(children), /*nullable=*/false));
}

auto arrow_field(const ColumnSpec& spec) -> std::shared_ptr<arrow::Field> {
    if (spec.is_list()) {
        return arrow::field(spec.name, arrow_type(spec), spec.nullable);
    }
    return arrow::field(spec.name, arrow_type(spec), spec.nullable, kind_metadata(*spec.scalar));
}

auto arrow_schema(const ColumnLayout& layout) -> std::shared_ptr<arrow::Schema> {
    arrow::FieldVector fields;
    fields.reserve(layout.size());
    for (const auto& column : layout.columns) {
        fields.push_back(arrow_field(column));
    }
    return arrow::schema(fields);
}

auto layout_from_arrow(const arrow::Schema& schema) -> Result<ColumnLayout> {
    ColumnLayout layout;
    for (int i = 0; i < schema.num_fields(); ++i) {
        auto spec = spec_from_field(*schema.field(i));
        if (!spec) {
            return std::unexpected(spec.error());
        }
        if (spec->name.find(kFlattenSeparator) != std::string::npos) {
            layout.flattened = true;
        }
        layout.columns.push_back(std::move(*spec));
        layout.sources.push_back(ColumnSource{.field = static_cast<std::size_t>(i)});
    }
    return layout;
}

auto cell_from_array(const arrow::Array& array, std::int64_t row, const ColumnSpec& spec) -> Cell {
    if (array.IsNull(row)) {
        return null_cell();
    }
    if (!spec.is_list()) {
        return scalar_cell(scalar_from_array(array, row, *spec.scalar));
    }

    const auto& list = static_cast<const arrow::ListArray&>(array);
    const auto& items = static_cast<const arrow::StructArray&>(*list.values());
    const auto begin = static_cast<std::int64_t>(list.value_offset(row));
    const auto length = static_cast<std::int64_t>(list.value_length(row));

    std::vector<std::vector<Cell>> elements;
    elements.reserve(static_cast<std::size_t>(length));
    for (std::int64_t i = begin; i < begin + length; ++i) {
        std::vector<Cell> element;
        element.reserve(spec.children.size());
        for (std::size_t k = 0; k < spec.children.size(); ++k) {
            element.push_back(
                cell_from_array(*items.field(static_cast<int>(k)), i, spec.children[k]));
        }
        elements.push_back(std::move(element));
    }
    return list_cell(std::move(elements));
}

auto from_status(const arrow::Status& status, std::string_view context, ErrorKind kind) -> Error {
    return Error{.kind = kind, .message = fmt::format("{}: {}", context, status.ToString())};
}

}  // namespace wsarrow::io
