#include <wsarrow/backend/native_backend.hpp>
#include <wsarrow/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <variant>

using wsarrow::Column;
using wsarrow::Date;

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
        REQUIRE(col.back() == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("push_default appends a placeholder") {
        col.push_default();
        REQUIRE(col.size() == 6);
        REQUIRE(col[5] == 0);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column<bool> stores flags", "[core][column]") {
    Column<bool> col;
    col.push_back(true);
    col.push_default();
    col.push_back(false);

    REQUIRE(col.size() == 3);
    REQUIRE(col[0]);
    REQUIRE_FALSE(col[1]);
    REQUIRE_FALSE(col.back());
}

TEST_CASE("Column<Date> holds calendar days", "[core][column]") {
    Column<Date> col{Date{.days = 0}, Date{.days = 19000}};

    REQUIRE(col.size() == 2);
    REQUIRE(col[1] == Date{.days = 19000});
    REQUIRE(col[0] < col[1]);
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    Column<std::int64_t> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Column range-for iteration", "[core][column]") {
    Column<std::int64_t> col{10, 20, 30};

    std::int64_t sum = 0;
    for (auto val : col) {
        sum += val;
    }
    REQUIRE(sum == 60);
}

TEST_CASE("Native table follows the column specs", "[core][column][native]") {
    using namespace wsarrow;
    using backend::native::ListColumn;

    const std::vector<ColumnSpec> specs{
        ColumnSpec{.name = "id", .scalar = ScalarKind::Integer, .nullable = false},
        ColumnSpec{.name = "price", .scalar = ScalarKind::Decimal},
        ColumnSpec{.name = "date_add", .scalar = ScalarKind::DateTime},
        ColumnSpec{.name = "categories",
                   .nullable = true,
                   .children = {ColumnSpec{.name = "id", .scalar = ScalarKind::Integer}}},
    };
    auto table = backend::native::make_table(specs);

    REQUIRE(table.columns.size() == 4);
    REQUIRE(table.rows() == 0);
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*table.find("id")));
    REQUIRE(std::holds_alternative<Column<double>>(*table.find("price")));
    REQUIRE(std::holds_alternative<Column<Timestamp>>(*table.find("date_add")));
    REQUIRE(std::holds_alternative<ListColumn>(*table.find("categories")));
    REQUIRE(table.find("missing") == nullptr);

    SECTION("non-nullable columns carry no validity bitmap") {
        REQUIRE_FALSE(table.find_entry("id")->validity.has_value());
        REQUIRE(table.find_entry("price")->validity.has_value());
    }

    SECTION("list columns start with a single zero offset") {
        const auto& list = std::get<ListColumn>(*table.find("categories"));
        REQUIRE(list.offsets.size() == 1);
        REQUIRE(list.offsets[0] == 0);
        REQUIRE(list.elements->rows() == 0);
    }

    SECTION("add_column replaces a column of the same name") {
        table.add_column("price", Column<double>{1.5, 2.5});
        REQUIRE(table.columns.size() == 4);
        REQUIRE(backend::native::column_size(*table.find("price")) == 2);
    }
}
