#pragma once

#include <wsarrow/core/error.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wsarrow {

/// Closed set of scalar kinds a field may be declared as.
enum class ScalarKind : std::uint8_t {
    Integer,
    Decimal,
    Boolean,
    Text,
    HtmlText,
    Date,
    DateTime,
};

enum class Cardinality : std::uint8_t {
    Many,
};

class Schema;

/// Nested one-to-many relation; the element schema is shared and immutable.
struct AssociationKind {
    std::shared_ptr<const Schema> element;
    Cardinality cardinality = Cardinality::Many;
    /// Per-language values of one field (element `{id, value}`).
    bool translated = false;
};

using FieldKind = std::variant<ScalarKind, AssociationKind>;

struct FieldSpec {
    std::string name;
    FieldKind kind = ScalarKind::Text;
    bool nullable = true;

    [[nodiscard]] auto is_association() const noexcept -> bool {
        return std::holds_alternative<AssociationKind>(kind);
    }

    [[nodiscard]] auto scalar_kind() const noexcept -> std::optional<ScalarKind> {
        if (const auto* scalar = std::get_if<ScalarKind>(&kind)) {
            return *scalar;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto association() const noexcept -> const AssociationKind* {
        return std::get_if<AssociationKind>(&kind);
    }
};

/// Ordered, name-unique sequence of fields. Immutable once built.
class Schema {
   public:
    Schema() = default;

    /// Build a schema, rejecting duplicate or empty field names.
    [[nodiscard]] static auto make(std::vector<FieldSpec> fields) -> Result<Schema>;

    [[nodiscard]] auto fields() const noexcept -> const std::vector<FieldSpec>& { return fields_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

    [[nodiscard]] auto find(std::string_view name) const -> const FieldSpec*;
    [[nodiscard]] auto index_of(std::string_view name) const -> std::optional<std::size_t>;

    /// Indices of association fields, in field order.
    [[nodiscard]] auto association_indices() const -> std::vector<std::size_t>;

    /// Keep only `names`, in schema order. Unknown names are a query error.
    [[nodiscard]] auto project(const std::vector<std::string>& names) const -> Result<Schema>;

    /// Depth of association nesting (0 for a flat schema).
    [[nodiscard]] auto depth() const noexcept -> std::size_t;

    [[nodiscard]] auto operator==(const Schema& other) const -> bool;

   private:
    std::vector<FieldSpec> fields_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

[[nodiscard]] auto to_string(ScalarKind kind) noexcept -> std::string_view;
[[nodiscard]] auto parse_scalar_kind(std::string_view name) -> std::optional<ScalarKind>;

[[nodiscard]] auto is_temporal(ScalarKind kind) noexcept -> bool;

/// Indented, human-readable rendering of a schema. Nesting below `max_depth` prints as "...".
[[nodiscard]] auto format_schema(const Schema& schema, std::size_t max_depth = SIZE_MAX)
    -> std::string;

}  // namespace wsarrow
