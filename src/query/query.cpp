#include <wsarrow/query/query.hpp>

#include <wsarrow/core/coerce.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace wsarrow::query {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

auto require_field(const Schema& schema, const std::string& name) -> Result<const FieldSpec*> {
    const auto* field = schema.find(name);
    if (field == nullptr) {
        return std::unexpected(
            query_error(fmt::format("field '{}' is not in the schema", name), name));
    }
    return field;
}

auto require_scalar(const Schema& schema, const std::string& name, std::string_view use)
    -> Result<ScalarKind> {
    auto field = require_field(schema, name);
    if (!field) {
        return std::unexpected(field.error());
    }
    auto kind = (*field)->scalar_kind();
    if (!kind) {
        return std::unexpected(query_error(
            fmt::format("{} needs a scalar field, '{}' is an association", use, name), name));
    }
    return *kind;
}

auto resolve(const Schema& schema, const DateRange& range) -> Result<ResolvedFilter> {
    auto kind = require_scalar(schema, range.field, "date range");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (!is_temporal(*kind)) {
        return std::unexpected(query_error(
            fmt::format("date range needs a Date or DateTime field, '{}' is {}", range.field,
                        to_string(*kind)),
            range.field));
    }
    if (!(range.low < range.high)) {
        return std::unexpected(query_error(
            fmt::format("empty date range [{}, {})", format_datetime(range.low),
                        format_datetime(range.high)),
            range.field));
    }
    return ResolvedDateRange{
        .field = range.field, .kind = *kind, .low = range.low, .high = range.high};
}

auto resolve(const Schema& schema, const Membership& membership) -> Result<ResolvedFilter> {
    auto kind = require_scalar(schema, membership.field, "membership filter");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (membership.literals.empty()) {
        return std::unexpected(
            query_error("membership filter has no values", membership.field));
    }
    ResolvedMembership out{.field = membership.field, .kind = *kind};
    for (const auto& literal : membership.literals) {
        auto value = coerce_scalar(literal, *kind, membership.field);
        if (!value || std::holds_alternative<std::monostate>(*value)) {
            return std::unexpected(query_error(
                fmt::format("membership value '{}' is not a valid {}", literal, to_string(*kind)),
                membership.field));
        }
        if (std::ranges::find(out.values, *value) != out.values.end()) {
            continue;
        }
        out.literals.push_back(literal);
        out.values.push_back(std::move(*value));
    }
    return out;
}

auto timestamp_of(const ScalarValue& value) -> std::optional<Timestamp> {
    if (const auto* date = std::get_if<Date>(&value)) {
        return to_timestamp(*date);
    }
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return *ts;
    }
    return std::nullopt;
}

/// First day whose midnight is at or after `ts`.
auto ceil_day(Timestamp ts) -> Date {
    auto days = ts.seconds / kSecondsPerDay;
    if (ts.seconds % kSecondsPerDay > 0) {
        ++days;
    }
    return Date{static_cast<std::int32_t>(days)};
}

/// Inclusive `[first, last]` bounds the service compares against. A Date
/// field matches `[low, high)` exactly when its day lies in
/// `[ceil_day(low), ceil_day(high) - 1]`.
auto render_bounds(const ResolvedDateRange& range) -> std::pair<std::string, std::string> {
    if (range.kind == ScalarKind::Date) {
        const auto last = ceil_day(range.high);
        return {format_date(ceil_day(range.low)), format_date(Date{last.days - 1})};
    }
    return {format_datetime(range.low), format_datetime(Timestamp{range.high.seconds - 1})};
}

auto render_limit(const Limit& limit) -> std::string {
    if (limit.offset == 0) {
        return fmt::format("{}", limit.count);
    }
    return fmt::format("{},{}", limit.offset, limit.count);
}

auto parse_count(std::string_view text) -> std::optional<std::size_t> {
    auto value = parse_integer(text);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*value);
}

auto parse_bound(std::string_view text) -> std::optional<Timestamp> {
    if (auto ts = parse_datetime(text)) {
        return ts;
    }
    if (auto date = parse_date(text)) {
        return to_timestamp(*date);
    }
    return std::nullopt;
}

}  // namespace

auto filter_field(const FieldFilter& filter) noexcept -> const std::string& {
    return std::visit([](const auto& f) -> const std::string& { return f.field; }, filter);
}

auto filter_field(const ResolvedFilter& filter) noexcept -> const std::string& {
    return std::visit([](const auto& f) -> const std::string& { return f.field; }, filter);
}

auto QueryDescriptor::display_fields() const -> std::optional<std::vector<std::string>> {
    if (!selected_fields) {
        return std::nullopt;
    }
    auto out = *selected_fields;
    for (const auto& filter : filters) {
        const auto& name = filter_field(filter);
        if (std::ranges::find(out, name) == out.end()) {
            out.push_back(name);
        }
    }
    return out;
}

auto build_query(const Schema& schema, const Constraints& constraints) -> Result<QueryDescriptor> {
    QueryDescriptor descriptor;

    if (constraints.fields) {
        if (constraints.fields->empty()) {
            return std::unexpected(query_error("field selection is empty"));
        }
        std::vector<std::string> selected;
        for (const auto& name : *constraints.fields) {
            if (auto field = require_field(schema, name); !field) {
                return std::unexpected(field.error());
            }
            if (std::ranges::find(selected, name) == selected.end()) {
                selected.push_back(name);
            }
        }
        descriptor.selected_fields = std::move(selected);
    }

    for (const auto& filter : constraints.filters) {
        auto resolved = std::visit([&schema](const auto& f) { return resolve(schema, f); }, filter);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        descriptor.filters.push_back(std::move(*resolved));
    }

    if (constraints.limit) {
        if (constraints.limit->count == 0) {
            return std::unexpected(query_error("limit count must be positive"));
        }
        descriptor.limit = constraints.limit;
    }

    if (constraints.sort) {
        if (auto kind = require_scalar(schema, constraints.sort->field, "sort"); !kind) {
            return std::unexpected(kind.error());
        }
        descriptor.sort = constraints.sort;
    }

    if (constraints.language && *constraints.language <= 0) {
        return std::unexpected(query_error("language id must be positive"));
    }
    descriptor.language = constraints.language;
    return descriptor;
}

auto split_literals(std::string_view text) -> Result<std::vector<std::string>> {
    std::vector<std::string> out;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '\\') {
            if (i + 1 == text.size()) {
                return std::unexpected(query_error("dangling escape at end of value list"));
            }
            current.push_back(text[++i]);
        } else if (ch == '|' || ch == ',') {
            if (!current.empty()) {
                out.push_back(std::move(current));
            }
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

auto parse_membership(std::string_view text) -> Result<Membership> {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::unexpected(query_error(
            fmt::format("expected FIELD=V1|V2|..., got '{}'", text)));
    }
    auto literals = split_literals(text.substr(eq + 1));
    if (!literals) {
        return std::unexpected(literals.error());
    }
    return Membership{.field = std::string(text.substr(0, eq)), .literals = std::move(*literals)};
}

auto parse_date_bounds(std::string_view text) -> Result<std::pair<Timestamp, Timestamp>> {
    auto sep = text.find("..");
    if (sep == std::string_view::npos) {
        return std::unexpected(query_error(fmt::format("expected LOW..HIGH, got '{}'", text)));
    }
    auto low = parse_bound(text.substr(0, sep));
    auto high = parse_bound(text.substr(sep + 2));
    if (!low || !high) {
        return std::unexpected(query_error(fmt::format(
            "date range bounds must be YYYY-MM-DD or YYYY-MM-DD HH:MM:SS, got '{}'", text)));
    }
    return std::pair{*low, *high};
}

auto parse_date_range(std::string_view text) -> Result<DateRange> {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::unexpected(
            query_error(fmt::format("expected FIELD=LOW..HIGH, got '{}'", text)));
    }
    auto bounds = parse_date_bounds(text.substr(eq + 1));
    if (!bounds) {
        return std::unexpected(std::move(bounds.error()));
    }
    return DateRange{
        .field = std::string(text.substr(0, eq)), .low = bounds->first, .high = bounds->second};
}

auto parse_limit(std::string_view text) -> Result<std::optional<Limit>> {
    if (text == "all") {
        return std::optional<Limit>{};
    }
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        auto count = parse_count(text);
        if (!count || *count == 0) {
            return std::unexpected(query_error(fmt::format("invalid limit '{}'", text)));
        }
        return std::optional<Limit>{Limit{.count = *count}};
    }
    auto offset = parse_count(text.substr(0, comma));
    auto count = parse_count(text.substr(comma + 1));
    if (!offset || !count || *count == 0) {
        return std::unexpected(query_error(fmt::format("invalid limit '{}'", text)));
    }
    return std::optional<Limit>{Limit{.offset = *offset, .count = *count}};
}

auto parse_sort(std::string_view text) -> Result<Sort> {
    auto colon = text.find(':');
    Sort sort{.field = std::string(text.substr(0, colon))};
    if (sort.field.empty()) {
        return std::unexpected(query_error("sort field is empty"));
    }
    if (colon != std::string_view::npos) {
        auto dir = text.substr(colon + 1);
        if (dir == "desc") {
            sort.direction = SortDirection::Descending;
        } else if (dir != "asc") {
            return std::unexpected(
                query_error(fmt::format("sort direction must be asc or desc, got '{}'", dir)));
        }
    }
    return sort;
}

auto render_query_params(const QueryDescriptor& descriptor, std::optional<Limit> window)
    -> QueryParams {
    QueryParams params;
    if (auto display = descriptor.display_fields()) {
        std::string joined;
        for (const auto& name : *display) {
            if (!joined.empty()) {
                joined.push_back(',');
            }
            joined.append(name);
        }
        params.emplace_back("display", fmt::format("[{}]", joined));
    } else {
        params.emplace_back("display", "full");
    }

    bool date_filter = false;
    for (const auto& filter : descriptor.filters) {
        if (const auto* range = std::get_if<ResolvedDateRange>(&filter)) {
            const auto [first, last] = render_bounds(*range);
            params.emplace_back(fmt::format("filter[{}]", range->field),
                                fmt::format("[{},{}]", first, last));
            date_filter = true;
        } else {
            const auto& membership = std::get<ResolvedMembership>(filter);
            std::string joined;
            for (const auto& literal : membership.literals) {
                if (!joined.empty()) {
                    joined.push_back('|');
                }
                joined.append(literal);
            }
            params.emplace_back(fmt::format("filter[{}]", membership.field),
                                fmt::format("[{}]", joined));
        }
    }
    if (date_filter) {
        params.emplace_back("date", "1");
    }

    if (auto limit = window ? window : descriptor.limit) {
        params.emplace_back("limit", render_limit(*limit));
    }
    if (descriptor.sort) {
        params.emplace_back(
            "sort", fmt::format("[{}_{}]", descriptor.sort->field,
                                descriptor.sort->direction == SortDirection::Ascending ? "ASC"
                                                                                       : "DESC"));
    }
    if (descriptor.language) {
        params.emplace_back("language", fmt::format("{}", *descriptor.language));
    }
    return params;
}

auto page_window(const std::optional<Limit>& limit, std::size_t page_size, std::size_t consumed)
    -> std::optional<Limit> {
    if (!limit) {
        return Limit{.offset = consumed, .count = page_size};
    }
    if (consumed >= limit->count) {
        return std::nullopt;
    }
    return Limit{.offset = limit->offset + consumed,
                 .count = std::min(page_size, limit->count - consumed)};
}

auto matches(const QueryDescriptor& descriptor, const record::RecordTree& record) -> Result<bool> {
    for (const auto& filter : descriptor.filters) {
        const auto& field = filter_field(filter);
        const auto* text = record.text(field);
        if (text == nullptr) {
            return false;
        }
        if (const auto* range = std::get_if<ResolvedDateRange>(&filter)) {
            auto value = coerce_scalar(*text, range->kind, field);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto ts = timestamp_of(*value);
            if (!ts || *ts < range->low || !(*ts < range->high)) {
                return false;
            }
        } else {
            const auto& membership = std::get<ResolvedMembership>(filter);
            auto value = coerce_scalar(*text, membership.kind, field);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (std::ranges::find(membership.values, *value) == membership.values.end()) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace wsarrow::query
