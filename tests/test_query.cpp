#include <wsarrow/query/query.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace wsarrow;
using query::Constraints;
using query::Limit;

namespace {

auto order_schema() -> Schema {
    auto rows = std::make_shared<const Schema>(
        Schema::make({FieldSpec{.name = "product_id", .kind = ScalarKind::Integer}}).value());
    return Schema::make({
                            FieldSpec{.name = "id", .kind = ScalarKind::Integer, .nullable = false},
                            FieldSpec{.name = "reference", .kind = ScalarKind::Text},
                            FieldSpec{.name = "total_paid", .kind = ScalarKind::Decimal},
                            FieldSpec{.name = "date_add", .kind = ScalarKind::DateTime},
                            FieldSpec{.name = "invoice_date", .kind = ScalarKind::Date},
                            FieldSpec{.name = "order_rows", .kind = AssociationKind{.element = rows}},
                        })
        .value();
}

auto record_with(std::string field, std::string text) -> record::RecordTree {
    record::RecordTree record;
    record.set_text(std::move(field), std::move(text));
    return record;
}

auto ts(std::string_view text) -> Timestamp {
    return *parse_datetime(text);
}

}  // namespace

TEST_CASE("Literal lists split on bars and commas", "[query]") {
    auto literals = query::split_literals("12|54,5");
    REQUIRE(literals.has_value());
    REQUIRE(*literals == std::vector<std::string>{"12", "54", "5"});

    SECTION("escapes keep separators") {
        auto escaped = query::split_literals(R"(a\|b|c\,d)");
        REQUIRE(*escaped == std::vector<std::string>{"a|b", "c,d"});
    }

    SECTION("empty segments are dropped") {
        REQUIRE(*query::split_literals("|1||2|") == std::vector<std::string>{"1", "2"});
    }

    SECTION("dangling escape") {
        auto bad = query::split_literals("a\\");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().kind == ErrorKind::Query);
    }
}

TEST_CASE("Command line constraint parsing", "[query]") {
    SECTION("membership") {
        auto membership = query::parse_membership("id=12|54,5");
        REQUIRE(membership.has_value());
        REQUIRE(membership->field == "id");
        REQUIRE(membership->literals.size() == 3);
        REQUIRE_FALSE(query::parse_membership("=1").has_value());
        REQUIRE_FALSE(query::parse_membership("id").has_value());
    }

    SECTION("date range") {
        auto range = query::parse_date_range("date_add=2024-01-01..2024-02-01 12:00:00");
        REQUIRE(range.has_value());
        REQUIRE(range->field == "date_add");
        REQUIRE(range->low == ts("2024-01-01 00:00:00"));
        REQUIRE(range->high == ts("2024-02-01 12:00:00"));
        REQUIRE_FALSE(query::parse_date_range("date_add=2024-01-01").has_value());
        REQUIRE_FALSE(query::parse_date_range("date_add=yesterday..today").has_value());
    }

    SECTION("limit") {
        REQUIRE(query::parse_limit("all")->has_value() == false);
        REQUIRE(**query::parse_limit("25") == Limit{.offset = 0, .count = 25});
        REQUIRE(**query::parse_limit("10,5") == Limit{.offset = 10, .count = 5});
        REQUIRE_FALSE(query::parse_limit("0").has_value());
        REQUIRE_FALSE(query::parse_limit("-3").has_value());
        REQUIRE_FALSE(query::parse_limit("ten").has_value());
    }

    SECTION("sort") {
        auto sort = query::parse_sort("date_add:desc");
        REQUIRE(sort.has_value());
        REQUIRE(sort->field == "date_add");
        REQUIRE(sort->direction == query::SortDirection::Descending);
        REQUIRE(query::parse_sort("id")->direction == query::SortDirection::Ascending);
        REQUIRE_FALSE(query::parse_sort("id:sideways").has_value());
        REQUIRE_FALSE(query::parse_sort(":asc").has_value());
    }
}

TEST_CASE("Query validation against the schema", "[query]") {
    const auto schema = order_schema();

    SECTION("a date range on a text field is rejected") {
        Constraints constraints;
        constraints.filters.emplace_back(query::DateRange{
            .field = "reference", .low = ts("2024-01-01 00:00:00"), .high = ts("2024-02-01 00:00:00")});
        auto descriptor = query::build_query(schema, constraints);
        REQUIRE_FALSE(descriptor.has_value());
        REQUIRE(descriptor.error().kind == ErrorKind::Query);
        REQUIRE(descriptor.error().field == "reference");
    }

    SECTION("an empty date range is rejected") {
        Constraints constraints;
        constraints.filters.emplace_back(query::DateRange{
            .field = "date_add", .low = ts("2024-01-01 00:00:00"), .high = ts("2024-01-01 00:00:00")});
        REQUIRE_FALSE(query::build_query(schema, constraints).has_value());
    }

    SECTION("membership literals must coerce to the field kind") {
        Constraints constraints;
        constraints.filters.emplace_back(query::Membership{.field = "id", .literals = {"1", "x"}});
        auto descriptor = query::build_query(schema, constraints);
        REQUIRE_FALSE(descriptor.has_value());
        REQUIRE(descriptor.error().field == "id");
    }

    SECTION("membership literals are deduplicated on their typed value") {
        Constraints constraints;
        constraints.filters.emplace_back(
            query::Membership{.field = "id", .literals = {"5", "05", "+5", "6"}});
        auto descriptor = query::build_query(schema, constraints);
        REQUIRE(descriptor.has_value());
        const auto& membership = std::get<query::ResolvedMembership>(descriptor->filters[0]);
        REQUIRE(membership.literals == std::vector<std::string>{"5", "6"});
    }

    SECTION("filters on associations are rejected") {
        Constraints constraints;
        constraints.filters.emplace_back(
            query::Membership{.field = "order_rows", .literals = {"1"}});
        REQUIRE_FALSE(query::build_query(schema, constraints).has_value());
    }

    SECTION("unknown fields, empty selections and bad sorts") {
        Constraints unknown;
        unknown.fields = std::vector<std::string>{"id", "nope"};
        REQUIRE(query::build_query(schema, unknown).error().field == "nope");

        Constraints empty;
        empty.fields = std::vector<std::string>{};
        REQUIRE_FALSE(query::build_query(schema, empty).has_value());

        Constraints sort;
        sort.sort = query::Sort{.field = "order_rows"};
        REQUIRE_FALSE(query::build_query(schema, sort).has_value());

        Constraints language;
        language.language = 0;
        REQUIRE_FALSE(query::build_query(schema, language).has_value());
    }

    SECTION("filtered fields are displayed with the selection") {
        Constraints constraints;
        constraints.fields = std::vector<std::string>{"reference", "id", "reference"};
        constraints.filters.emplace_back(query::Membership{.field = "total_paid", .literals = {"1.5"}});
        auto descriptor = query::build_query(schema, constraints);
        REQUIRE(descriptor.has_value());
        REQUIRE(*descriptor->selected_fields == std::vector<std::string>{"reference", "id"});
        REQUIRE(*descriptor->display_fields() ==
                std::vector<std::string>{"reference", "id", "total_paid"});
    }
}

TEST_CASE("Query parameters for the service", "[query]") {
    const auto schema = order_schema();
    Constraints constraints;
    constraints.fields = std::vector<std::string>{"id", "reference"};
    constraints.filters.emplace_back(query::Membership{.field = "id", .literals = {"12", "54"}});
    constraints.filters.emplace_back(query::DateRange{
        .field = "date_add", .low = ts("2024-01-01 00:00:00"), .high = ts("2024-02-01 00:00:00")});
    constraints.filters.emplace_back(
        query::DateRange{.field = "invoice_date",
                         .low = ts("2024-01-01 00:00:00"),
                         .high = ts("2024-01-03 00:00:00")});
    constraints.limit = Limit{.offset = 0, .count = 10};
    constraints.sort = query::Sort{.field = "id", .direction = query::SortDirection::Descending};
    constraints.language = 2;
    auto descriptor = query::build_query(schema, constraints).value();

    const auto params = query::render_query_params(descriptor);
    const query::QueryParams expected{
        {"display", "[id,reference,date_add,invoice_date]"},
        {"filter[id]", "[12|54]"},
        {"filter[date_add]", "[2024-01-01 00:00:00,2024-01-31 23:59:59]"},
        {"filter[invoice_date]", "[2024-01-01,2024-01-02]"},
        {"date", "1"},
        {"limit", "10"},
        {"sort", "[id_DESC]"},
        {"language", "2"},
    };
    REQUIRE(params == expected);

    SECTION("a paging window overrides the limit") {
        auto paged = query::render_query_params(descriptor, Limit{.offset = 4, .count = 3});
        REQUIRE(std::ranges::find(paged, std::pair<std::string, std::string>{"limit", "4,3"}) !=
                paged.end());
    }

    SECTION("date bounds cover every day the local check accepts") {
        auto render = [&schema](std::string_view low, std::string_view high) {
            Constraints dated;
            dated.filters.emplace_back(
                query::DateRange{.field = "invoice_date", .low = ts(low), .high = ts(high)});
            auto rendered = query::build_query(schema, dated).value();
            const auto params = query::render_query_params(rendered);
            auto found = std::ranges::find_if(
                params, [](const auto& p) { return p.first == "filter[invoice_date]"; });
            REQUIRE(found != params.end());
            return found->second;
        };
        REQUIRE(render("2024-01-01 00:00:00", "2024-01-10 12:00:00") == "[2024-01-01,2024-01-10]");
        REQUIRE(render("2024-01-01 06:00:00", "2024-01-11 00:00:00") == "[2024-01-02,2024-01-10]");
        REQUIRE(render("1969-12-20 00:00:00", "1969-12-31 12:00:00") == "[1969-12-20,1969-12-31]");

        Constraints dated;
        dated.filters.emplace_back(query::DateRange{.field = "invoice_date",
                                                    .low = ts("2024-01-01 00:00:00"),
                                                    .high = ts("2024-01-10 12:00:00")});
        auto last_day = query::build_query(schema, dated).value();
        REQUIRE(*query::matches(last_day, record_with("invoice_date", "2024-01-10")));
        REQUIRE_FALSE(*query::matches(last_day, record_with("invoice_date", "2024-01-11")));
    }

    SECTION("no selection displays every field") {
        auto full = query::render_query_params(query::build_query(schema, Constraints{}).value());
        REQUIRE(full == query::QueryParams{{"display", "full"}});
    }
}

TEST_CASE("Paging windows", "[query]") {
    SECTION("without a limit pages never run out") {
        REQUIRE(query::page_window(std::nullopt, 100, 0) == Limit{.offset = 0, .count = 100});
        REQUIRE(query::page_window(std::nullopt, 100, 300) == Limit{.offset = 300, .count = 100});
    }

    SECTION("a limit is split into pages and shortens the last one") {
        const std::optional<Limit> limit = Limit{.offset = 20, .count = 250};
        REQUIRE(query::page_window(limit, 100, 0) == Limit{.offset = 20, .count = 100});
        REQUIRE(query::page_window(limit, 100, 200) == Limit{.offset = 220, .count = 50});
        REQUIRE_FALSE(query::page_window(limit, 100, 250).has_value());
    }
}

TEST_CASE("Local filter evaluation", "[query]") {
    const auto schema = order_schema();

    SECTION("membership") {
        Constraints constraints;
        constraints.filters.emplace_back(query::parse_membership("id=12,54,5").value());
        auto descriptor = query::build_query(schema, constraints).value();

        REQUIRE(*query::matches(descriptor, record_with("id", "54")));
        REQUIRE_FALSE(*query::matches(descriptor, record_with("id", "55")));
        REQUIRE_FALSE(*query::matches(descriptor, record_with("reference", "54")));
        REQUIRE_FALSE(*query::matches(descriptor, record_with("id", "")));

        auto bad = query::matches(descriptor, record_with("id", "N/A"));
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().kind == ErrorKind::Coercion);
    }

    SECTION("date ranges are half open") {
        Constraints constraints;
        constraints.filters.emplace_back(
            query::parse_date_range("date_add=2024-01-01..2024-02-01").value());
        auto descriptor = query::build_query(schema, constraints).value();

        REQUIRE(*query::matches(descriptor, record_with("date_add", "2024-01-01 00:00:00")));
        REQUIRE(*query::matches(descriptor, record_with("date_add", "2024-01-31 23:59:59")));
        REQUIRE_FALSE(*query::matches(descriptor, record_with("date_add", "2024-02-01 00:00:00")));
        REQUIRE_FALSE(*query::matches(descriptor, record_with("date_add", "0000-00-00 00:00:00")));
    }
}
