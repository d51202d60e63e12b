#include <wsarrow/core/coerce.hpp>
#include <wsarrow/core/time.hpp>
#include <wsarrow/core/value.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <variant>

using namespace wsarrow;

TEST_CASE("Integer coercion is strict", "[core][coerce]") {
    REQUIRE(parse_integer("42") == 42);
    REQUIRE(parse_integer("-7") == -7);
    REQUIRE(parse_integer("+7") == 7);
    REQUIRE_FALSE(parse_integer("4.2").has_value());
    REQUIRE_FALSE(parse_integer("12abc").has_value());
    REQUIRE_FALSE(parse_integer("99999999999999999999").has_value());
    REQUIRE_FALSE(parse_integer("").has_value());

    SECTION("surrounding whitespace is ignored for numeric kinds") {
        auto value = coerce_scalar(" 15\n", ScalarKind::Integer, "quantity");
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::int64_t>(*value) == 15);
    }

    SECTION("non-numeric text fails with field and literal") {
        auto value = coerce_scalar("N/A", ScalarKind::Integer, "quantity");
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().kind == ErrorKind::Coercion);
        REQUIRE(value.error().field == "quantity");
        REQUIRE(value.error().value == "N/A");
    }

    SECTION("empty text is null") {
        auto value = coerce_scalar("", ScalarKind::Integer, "quantity");
        REQUIRE(value.has_value());
        REQUIRE(std::holds_alternative<std::monostate>(*value));
    }
}

TEST_CASE("Decimal coercion", "[core][coerce]") {
    REQUIRE(parse_decimal("19.990000") == Catch::Approx(19.99));
    REQUIRE(parse_decimal("-0.5") == Catch::Approx(-0.5));
    REQUIRE(parse_decimal("1e3") == Catch::Approx(1000.0));
    REQUIRE(parse_decimal("12") == Catch::Approx(12.0));
    REQUIRE_FALSE(parse_decimal("1.").has_value());
    REQUIRE_FALSE(parse_decimal(".5").has_value());
    REQUIRE_FALSE(parse_decimal("1,5").has_value());
    REQUIRE_FALSE(parse_decimal("nan").has_value());

    auto value = coerce_scalar("0.000000", ScalarKind::Decimal, "price");
    REQUIRE(value.has_value());
    REQUIRE(std::get<double>(*value) == Catch::Approx(0.0));
}

TEST_CASE("Boolean coercion", "[core][coerce]") {
    REQUIRE(parse_boolean("1") == true);
    REQUIRE(parse_boolean("0") == false);
    REQUIRE(parse_boolean("TRUE") == true);
    REQUIRE(parse_boolean("False") == false);
    REQUIRE_FALSE(parse_boolean("yes").has_value());
    REQUIRE_FALSE(parse_boolean("2").has_value());

    auto bad = coerce_scalar("maybe", ScalarKind::Boolean, "active");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::Coercion);
}

TEST_CASE("Date and DateTime coercion", "[core][coerce]") {
    SECTION("calendar dates") {
        auto value = coerce_scalar("1970-01-02", ScalarKind::Date, "birthday");
        REQUIRE(value.has_value());
        REQUIRE(std::get<Date>(*value) == Date{.days = 1});
        REQUIRE_FALSE(coerce_scalar("2023-02-30", ScalarKind::Date, "birthday").has_value());
        REQUIRE_FALSE(coerce_scalar("2023/01/01", ScalarKind::Date, "birthday").has_value());
    }

    SECTION("date-times") {
        auto value = coerce_scalar("1970-01-01 01:00:05", ScalarKind::DateTime, "date_add");
        REQUIRE(value.has_value());
        REQUIRE(std::get<Timestamp>(*value) == Timestamp{.seconds = 3605});
        REQUIRE_FALSE(coerce_scalar("1970-01-01 24:00:00", ScalarKind::DateTime, "date_add")
                          .has_value());
    }

    SECTION("a bare date is midnight") {
        auto value = coerce_scalar("1970-01-02", ScalarKind::DateTime, "date_add");
        REQUIRE(value.has_value());
        REQUIRE(std::get<Timestamp>(*value) == Timestamp{.seconds = 86400});
    }

    SECTION("the zero date is null") {
        auto date = coerce_scalar("0000-00-00", ScalarKind::Date, "birthday");
        REQUIRE(date.has_value());
        REQUIRE(std::holds_alternative<std::monostate>(*date));

        auto stamp = coerce_scalar("0000-00-00 00:00:00", ScalarKind::DateTime, "date_upd");
        REQUIRE(stamp.has_value());
        REQUIRE(std::holds_alternative<std::monostate>(*stamp));
    }

    SECTION("formatting") {
        REQUIRE(format_date(Date{.days = 19000}) == "2022-01-08");
        REQUIRE(format_datetime(Timestamp{.seconds = 3605}) == "1970-01-01 01:00:05");
    }
}

TEST_CASE("Text coercion keeps the raw text", "[core][coerce]") {
    SECTION("empty text stays an empty string") {
        auto value = coerce_scalar("", ScalarKind::Text, "reference");
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::string>(*value).empty());
    }

    SECTION("text is not trimmed") {
        auto value = coerce_scalar("  spaced ", ScalarKind::Text, "reference");
        REQUIRE(std::get<std::string>(*value) == "  spaced ");
    }

    SECTION("HTML text has its entities unescaped") {
        auto value = coerce_scalar("&lt;p&gt;Fish &amp; chips&lt;/p&gt;", ScalarKind::HtmlText,
                                   "description");
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::string>(*value) == "<p>Fish & chips</p>");
        REQUIRE(unescape_html("a &unknown; b") == "a &unknown; b");
    }
}

TEST_CASE("Coerced values match their kind", "[core][coerce]") {
    REQUIRE(value_matches(ScalarValue{std::int64_t{1}}, ScalarKind::Integer));
    REQUIRE(value_matches(ScalarValue{}, ScalarKind::Date));
    REQUIRE_FALSE(value_matches(ScalarValue{1.0}, ScalarKind::Integer));
    REQUIRE(format_cell(scalar_cell(true)) == "true");
    REQUIRE(format_cell(null_cell()) == "null");
}
