#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/time.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/core/value.hpp>
#include <wsarrow/record/record.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wsarrow::query {

enum class SortDirection : std::uint8_t {
    Ascending,
    Descending,
};

struct Sort {
    std::string field;
    SortDirection direction = SortDirection::Ascending;
};

/// Record window: skip `offset` records, take `count`.
struct Limit {
    std::size_t offset = 0;
    std::size_t count = 0;

    auto operator==(const Limit&) const -> bool = default;
};

/// Half-open `[low, high)` range over a Date or DateTime field.
struct DateRange {
    std::string field;
    Timestamp low;
    Timestamp high;
};

/// Field value must equal one of `literals`.
struct Membership {
    std::string field;
    std::vector<std::string> literals;
};

using FieldFilter = std::variant<DateRange, Membership>;

[[nodiscard]] auto filter_field(const FieldFilter& filter) noexcept -> const std::string&;

/// Unvalidated user constraints, as gathered from the command line or config.
struct Constraints {
    std::optional<std::vector<std::string>> fields;
    std::vector<FieldFilter> filters;
    std::optional<Limit> limit;
    std::optional<Sort> sort;
    std::optional<std::int64_t> language;
};

/// Membership after validation: literals deduplicated on their typed value,
/// first occurrence wins.
struct ResolvedMembership {
    std::string field;
    ScalarKind kind;
    std::vector<std::string> literals;
    std::vector<ScalarValue> values;
};

struct ResolvedDateRange {
    std::string field;
    ScalarKind kind;
    Timestamp low;
    Timestamp high;
};

using ResolvedFilter = std::variant<ResolvedDateRange, ResolvedMembership>;

[[nodiscard]] auto filter_field(const ResolvedFilter& filter) noexcept -> const std::string&;

/// Validated, immutable request description.
struct QueryDescriptor {
    std::optional<std::vector<std::string>> selected_fields;
    std::vector<ResolvedFilter> filters;
    std::optional<Limit> limit;
    std::optional<Sort> sort;
    std::optional<std::int64_t> language;

    /// Fields the service must return: the selection plus every filtered
    /// field. nullopt means all fields.
    [[nodiscard]] auto display_fields() const -> std::optional<std::vector<std::string>>;
};

/// Validate `constraints` against `schema`. Fails with a query error naming
/// the offending field and the kind it would need.
[[nodiscard]] auto build_query(const Schema& schema, const Constraints& constraints)
    -> Result<QueryDescriptor>;

/// Split `v1|v2,v3` into literals. `\` escapes the next character; empty
/// segments are dropped.
[[nodiscard]] auto split_literals(std::string_view text) -> Result<std::vector<std::string>>;

/// Parse `field=v1|v2|...`.
[[nodiscard]] auto parse_membership(std::string_view text) -> Result<Membership>;

/// Parse `LOW..HIGH` where each bound is `YYYY-MM-DD` or `YYYY-MM-DD HH:MM:SS`.
[[nodiscard]] auto parse_date_bounds(std::string_view text)
    -> Result<std::pair<Timestamp, Timestamp>>;

/// Parse `field=LOW..HIGH`.
[[nodiscard]] auto parse_date_range(std::string_view text) -> Result<DateRange>;

/// Parse `all` (nullopt), `N` or `OFFSET,N`.
[[nodiscard]] auto parse_limit(std::string_view text) -> Result<std::optional<Limit>>;

/// Parse `field` or `field:asc` / `field:desc`.
[[nodiscard]] auto parse_sort(std::string_view text) -> Result<Sort>;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Render the service's query string parameters. `window` overrides the
/// descriptor's limit (used for paging).
[[nodiscard]] auto render_query_params(const QueryDescriptor& descriptor,
                                       std::optional<Limit> window = std::nullopt) -> QueryParams;

/// Window of the page starting `consumed` records into the user's limit.
/// nullopt once the limit is exhausted.
[[nodiscard]] auto page_window(const std::optional<Limit>& limit, std::size_t page_size,
                               std::size_t consumed) -> std::optional<Limit>;

/// Evaluate every filter on a decoded record. Absent and null values never
/// match; unparseable values are a coercion error.
[[nodiscard]] auto matches(const QueryDescriptor& descriptor, const record::RecordTree& record)
    -> Result<bool>;

}  // namespace wsarrow::query
