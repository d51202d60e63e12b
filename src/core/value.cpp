#include <wsarrow/core/value.hpp>

#include <fmt/core.h>

namespace wsarrow {

auto value_matches(const ScalarValue& value, ScalarKind kind) noexcept -> bool {
    switch (kind) {
        case ScalarKind::Integer:
            return std::holds_alternative<std::int64_t>(value) ||
                   std::holds_alternative<std::monostate>(value);
        case ScalarKind::Decimal:
            return std::holds_alternative<double>(value) ||
                   std::holds_alternative<std::monostate>(value);
        case ScalarKind::Boolean:
            return std::holds_alternative<bool>(value) ||
                   std::holds_alternative<std::monostate>(value);
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            return std::holds_alternative<std::string>(value) ||
                   std::holds_alternative<std::monostate>(value);
        case ScalarKind::Date:
            return std::holds_alternative<Date>(value) ||
                   std::holds_alternative<std::monostate>(value);
        case ScalarKind::DateTime:
            return std::holds_alternative<Timestamp>(value) ||
                   std::holds_alternative<std::monostate>(value);
    }
    return false;
}

auto format_cell(const Cell& cell) -> std::string {
    if (cell.list_valid) {
        std::string out = "[";
        for (std::size_t i = 0; i < cell.items.size(); ++i) {
            if (i > 0) {
                out.append(", ");
            }
            out.push_back('{');
            for (std::size_t j = 0; j < cell.items[i].size(); ++j) {
                if (j > 0) {
                    out.append(", ");
                }
                out.append(format_cell(cell.items[i][j]));
            }
            out.push_back('}');
        }
        out.push_back(']');
        return out;
    }
    return std::visit(
        [](const auto& value) -> std::string {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<V, std::string>) {
                return value;
            } else if constexpr (std::is_same_v<V, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_same_v<V, Date>) {
                return format_date(value);
            } else if constexpr (std::is_same_v<V, Timestamp>) {
                return format_datetime(value);
            } else {
                return fmt::format("{}", value);
            }
        },
        cell.scalar);
}

}  // namespace wsarrow
