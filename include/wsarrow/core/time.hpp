#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace wsarrow {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in whole seconds since 1970-01-01T00:00:00 (service-local wall clock).
struct Timestamp {
    std::int64_t seconds = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Parse `YYYY-MM-DD`. Returns nullopt on any malformed or out-of-range component.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse `YYYY-MM-DD HH:MM:SS` (a `T` separator is also accepted).
[[nodiscard]] auto parse_datetime(std::string_view text) -> std::optional<Timestamp>;

/// True for the all-zero sentinel the service emits for unset dates.
[[nodiscard]] auto is_zero_date(std::string_view text) noexcept -> bool;

[[nodiscard]] auto to_timestamp(Date date) noexcept -> Timestamp;

[[nodiscard]] auto format_date(Date date) -> std::string;
[[nodiscard]] auto format_datetime(Timestamp ts) -> std::string;

}  // namespace wsarrow

namespace std {

template <>
struct hash<wsarrow::Date> {
    auto operator()(const wsarrow::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<wsarrow::Timestamp> {
    auto operator()(const wsarrow::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.seconds);
    }
};

}  // namespace std
