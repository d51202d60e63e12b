#pragma once

#include <wsarrow/core/time.hpp>
#include <wsarrow/core/types.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace wsarrow {

/// A typed scalar after coercion. std::monostate is null.
using ScalarValue =
    std::variant<std::monostate, std::int64_t, double, bool, std::string, Date, Timestamp>;

/// One staged output cell.
///
/// Scalar columns use `scalar`. List columns (unflattened associations) use
/// `items`, one inner vector per element aligned with the element columns;
/// `list_valid == false` marks a null list.
struct Cell {
    ScalarValue scalar;
    std::vector<std::vector<Cell>> items;
    bool list_valid = false;

    [[nodiscard]] auto is_null_scalar() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(scalar);
    }

    auto operator==(const Cell&) const -> bool = default;
};

using StagedRow = std::vector<Cell>;

[[nodiscard]] inline auto null_cell() -> Cell {
    return Cell{};
}

[[nodiscard]] inline auto scalar_cell(ScalarValue value) -> Cell {
    return Cell{.scalar = std::move(value)};
}

[[nodiscard]] inline auto list_cell(std::vector<std::vector<Cell>> items) -> Cell {
    return Cell{.items = std::move(items), .list_valid = true};
}

/// True when `value` holds the alternative matching `kind` (or is null).
[[nodiscard]] auto value_matches(const ScalarValue& value, ScalarKind kind) noexcept -> bool;

/// Render a cell for display: "null", the scalar text, or "[{a, b}, ...]".
[[nodiscard]] auto format_cell(const Cell& cell) -> std::string;

}  // namespace wsarrow
