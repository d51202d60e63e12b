#include <wsarrow/core/layout.hpp>

#include <fmt/core.h>

#include <unordered_set>

namespace wsarrow {

namespace {

auto element_column(const FieldSpec& field) -> ColumnSpec {
    if (const auto* assoc = field.association()) {
        return list_column(field.name, *assoc->element, field.nullable);
    }
    return ColumnSpec{.name = field.name, .scalar = field.scalar_kind(), .nullable = field.nullable};
}

void format_spec(const ColumnSpec& spec, std::size_t depth, std::string& out) {
    out.append(std::string(depth * 2, ' '));
    if (spec.is_list()) {
        out.append(fmt::format("{}: list<struct>{}\n", spec.name, spec.nullable ? "" : " not null"));
        for (const auto& child : spec.children) {
            format_spec(child, depth + 1, out);
        }
        return;
    }
    out.append(fmt::format("{}: {}{}\n", spec.name, to_string(*spec.scalar),
                           spec.nullable ? "" : " not null"));
}

}  // namespace

auto ColumnLayout::find(std::string_view name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

auto list_column(std::string name, const Schema& element, bool nullable) -> ColumnSpec {
    ColumnSpec spec{.name = std::move(name), .nullable = nullable};
    spec.children.reserve(element.size());
    for (const auto& child : element.fields()) {
        spec.children.push_back(element_column(child));
    }
    return spec;
}

auto make_layout(const Schema& schema, bool flatten) -> Result<ColumnLayout> {
    ColumnLayout layout;
    layout.flattened = flatten;
    std::unordered_set<std::string> seen;

    auto add = [&](ColumnSpec spec, ColumnSource source) -> Result<void> {
        if (!seen.insert(spec.name).second) {
            return std::unexpected(schema_error(
                fmt::format("flattened column '{}' collides with an existing column", spec.name),
                spec.name));
        }
        layout.columns.push_back(std::move(spec));
        layout.sources.push_back(source);
        return {};
    };

    const auto& fields = schema.fields();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        const auto* assoc = field.association();
        if (assoc == nullptr || !flatten) {
            if (auto ok = add(element_column(field), ColumnSource{.field = i}); !ok) {
                return std::unexpected(ok.error());
            }
            continue;
        }
        const auto& element = assoc->element->fields();
        for (std::size_t j = 0; j < element.size(); ++j) {
            auto spec = element_column(element[j]);
            spec.name = fmt::format("{}{}{}", field.name, kFlattenSeparator, element[j].name);
            // An empty association yields a null element.
            spec.nullable = true;
            if (auto ok = add(std::move(spec), ColumnSource{.field = i, .element_field = j}); !ok) {
                return std::unexpected(ok.error());
            }
        }
    }
    return layout;
}

auto format_layout(const ColumnLayout& layout) -> std::string {
    std::string out;
    for (const auto& spec : layout.columns) {
        format_spec(spec, 0, out);
    }
    return out;
}

}  // namespace wsarrow
