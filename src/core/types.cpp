#include <wsarrow/core/types.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace wsarrow {

namespace {

auto same_kind(const FieldKind& lhs, const FieldKind& rhs) -> bool {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (const auto* scalar = std::get_if<ScalarKind>(&lhs)) {
        return *scalar == std::get<ScalarKind>(rhs);
    }
    const auto& left = std::get<AssociationKind>(lhs);
    const auto& right = std::get<AssociationKind>(rhs);
    if (left.translated != right.translated) {
        return false;
    }
    if (left.element == nullptr || right.element == nullptr) {
        return left.element == right.element;
    }
    return *left.element == *right.element;
}

void format_record(const Schema& schema, std::size_t depth, std::size_t max_depth,
                   std::string& out) {
    const std::string indent(depth * 4, ' ');
    out.append("{\n");
    for (const auto& field : schema.fields()) {
        out.append(indent).append("    ").append(field.name).append(": ");
        if (const auto* assoc = field.association()) {
            if (depth + 1 >= max_depth) {
                out.append("[...]");
            } else {
                out.append("[");
                format_record(*assoc->element, depth + 1, max_depth, out);
                out.append("]");
            }
        } else {
            out.append(to_string(*field.scalar_kind()));
        }
        if (field.nullable) {
            out.append("?");
        }
        out.push_back('\n');
    }
    out.append(indent).append("}");
}

}  // namespace

auto Schema::make(std::vector<FieldSpec> fields) -> Result<Schema> {
    Schema schema;
    schema.index_.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (field.name.empty()) {
            return std::unexpected(schema_error("field name must not be empty"));
        }
        if (const auto* assoc = field.association(); assoc != nullptr && assoc->element == nullptr) {
            return std::unexpected(
                schema_error("association has no element schema", field.name));
        }
        if (!schema.index_.emplace(field.name, i).second) {
            return std::unexpected(
                schema_error(fmt::format("duplicate field name '{}'", field.name), field.name));
        }
    }
    schema.fields_ = std::move(fields);
    return schema;
}

auto Schema::find(std::string_view name) const -> const FieldSpec* {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &fields_[it->second];
    }
    return nullptr;
}

auto Schema::index_of(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::association_indices() const -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].is_association()) {
            out.push_back(i);
        }
    }
    return out;
}

auto Schema::project(const std::vector<std::string>& names) const -> Result<Schema> {
    std::unordered_set<std::string> wanted;
    for (const auto& name : names) {
        if (index_.find(name) == index_.end()) {
            return std::unexpected(
                query_error(fmt::format("selected field '{}' is not in the schema", name), name));
        }
        wanted.insert(name);
    }
    std::vector<FieldSpec> kept;
    kept.reserve(wanted.size());
    for (const auto& field : fields_) {
        if (wanted.contains(field.name)) {
            kept.push_back(field);
        }
    }
    return Schema::make(std::move(kept));
}

auto Schema::depth() const noexcept -> std::size_t {
    std::size_t deepest = 0;
    for (const auto& field : fields_) {
        if (const auto* assoc = field.association()) {
            deepest = std::max(deepest, 1 + assoc->element->depth());
        }
    }
    return deepest;
}

auto Schema::operator==(const Schema& other) const -> bool {
    return std::ranges::equal(fields_, other.fields_, [](const FieldSpec& a, const FieldSpec& b) {
        return a.name == b.name && a.nullable == b.nullable && same_kind(a.kind, b.kind);
    });
}

auto to_string(ScalarKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ScalarKind::Integer:
            return "Integer";
        case ScalarKind::Decimal:
            return "Decimal";
        case ScalarKind::Boolean:
            return "Boolean";
        case ScalarKind::Text:
            return "Text";
        case ScalarKind::HtmlText:
            return "HtmlText";
        case ScalarKind::Date:
            return "Date";
        case ScalarKind::DateTime:
            return "DateTime";
    }
    return "Unknown";
}

auto parse_scalar_kind(std::string_view name) -> std::optional<ScalarKind> {
    for (auto kind : {ScalarKind::Integer, ScalarKind::Decimal, ScalarKind::Boolean,
                      ScalarKind::Text, ScalarKind::HtmlText, ScalarKind::Date,
                      ScalarKind::DateTime}) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

auto is_temporal(ScalarKind kind) noexcept -> bool {
    return kind == ScalarKind::Date || kind == ScalarKind::DateTime;
}

auto format_schema(const Schema& schema, std::size_t max_depth) -> std::string {
    std::string out;
    format_record(schema, 0, max_depth, out);
    return out;
}

}  // namespace wsarrow
