#pragma once

#include <robin_hood.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wsarrow::record {

/// Schema-agnostic decoded record: field name to raw text, nested record, or
/// ordered list of records. Values stay textual until the batch builder
/// coerces them against the schema.
class RecordTree {
   public:
    struct Null {
        auto operator==(const Null&) const -> bool = default;
    };
    using List = std::vector<RecordTree>;
    using Nested = std::shared_ptr<const RecordTree>;
    using Value = std::variant<Null, std::string, Nested, List>;

    RecordTree() = default;

    /// Insert a field. Returns false (and leaves the record unchanged) if the
    /// name is already present.
    auto set(std::string name, Value value) -> bool;

    auto set_text(std::string name, std::string text) -> bool {
        return set(std::move(name), Value{std::move(text)});
    }

    /// nullptr when the field is absent.
    [[nodiscard]] auto get(std::string_view name) const -> const Value*;

    /// Raw text of a scalar field; nullptr when absent, null, or not a scalar.
    [[nodiscard]] auto text(std::string_view name) const -> const std::string*;

    [[nodiscard]] auto list(std::string_view name) const -> const List*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool { return get(name) != nullptr; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

    /// Field names in insertion order.
    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return order_; }

   private:
    robin_hood::unordered_flat_map<std::string, Value> fields_;
    std::vector<std::string> order_;
};

[[nodiscard]] inline auto is_null(const RecordTree::Value& value) noexcept -> bool {
    return std::holds_alternative<RecordTree::Null>(value);
}

}  // namespace wsarrow::record
