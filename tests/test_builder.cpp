#include <wsarrow/backend/backend.hpp>
#include <wsarrow/batch/batch.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace wsarrow;
using backend::BackendKind;
using record::RecordTree;

namespace {

auto category_schema() -> std::shared_ptr<const Schema> {
    return std::make_shared<const Schema>(
        Schema::make({FieldSpec{.name = "id", .kind = ScalarKind::Integer, .nullable = false},
                      FieldSpec{.name = "name", .kind = ScalarKind::Text}})
            .value());
}

auto product_schema() -> std::shared_ptr<const Schema> {
    return std::make_shared<const Schema>(
        Schema::make({
                         FieldSpec{.name = "id", .kind = ScalarKind::Integer, .nullable = false},
                         FieldSpec{.name = "price", .kind = ScalarKind::Decimal},
                         FieldSpec{.name = "active", .kind = ScalarKind::Boolean},
                         FieldSpec{.name = "date_add", .kind = ScalarKind::DateTime},
                         FieldSpec{.name = "birthday", .kind = ScalarKind::Date},
                         FieldSpec{.name = "description", .kind = ScalarKind::HtmlText},
                         FieldSpec{.name = "categories",
                                   .kind = AssociationKind{.element = category_schema()}},
                     })
            .value());
}

auto category(std::string id, std::string name) -> RecordTree {
    RecordTree element;
    element.set_text("id", std::move(id));
    element.set_text("name", std::move(name));
    return element;
}

auto product(std::string id, RecordTree::List categories) -> RecordTree {
    RecordTree record;
    record.set_text("id", std::move(id));
    record.set_text("price", "19.500000");
    record.set_text("active", "1");
    record.set_text("date_add", "2024-03-01 10:00:00");
    record.set_text("birthday", "0000-00-00");
    record.set_text("description", "&lt;b&gt;bold&lt;/b&gt;");
    record.set("categories", std::move(categories));
    return record;
}

auto builder_for(BackendKind kind, std::shared_ptr<const Schema> schema, bool flatten)
    -> std::unique_ptr<batch::BatchBuilder> {
    auto builder = backend::make_backend(kind)->make_builder(std::move(schema),
                                                             batch::BuildOptions{.flatten = flatten});
    REQUIRE(builder.has_value());
    return std::move(*builder);
}

}  // namespace

TEST_CASE("Builders coerce records into typed columns", "[batch][builder]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    auto builder = builder_for(kind, product_schema(), false);

    REQUIRE(*builder->append(product("1", {category("2", "Home"), category("5", "")})) == 1);
    REQUIRE(*builder->append(product("2", {})) == 1);
    REQUIRE(builder->num_rows() == 2);

    auto batch = builder->finalize();
    REQUIRE(batch.has_value());
    const auto& out = **batch;
    REQUIRE(out.backend() == backend::to_string(kind));
    REQUIRE(out.num_rows() == 2);
    REQUIRE(out.num_columns() == 7);

    REQUIRE(out.cell(0, 0) == scalar_cell(std::int64_t{1}));
    REQUIRE(out.cell(1, 0) == scalar_cell(19.5));
    REQUIRE(out.cell(2, 0) == scalar_cell(true));
    REQUIRE(out.cell(3, 0) == scalar_cell(*parse_datetime("2024-03-01 10:00:00")));
    REQUIRE(out.cell(4, 0) == null_cell());
    REQUIRE(out.cell(5, 0) == scalar_cell(std::string("<b>bold</b>")));

    const auto categories = out.cell(6, 0);
    REQUIRE(categories.list_valid);
    REQUIRE(categories.items.size() == 2);
    REQUIRE(categories.items[1][0] == scalar_cell(std::int64_t{5}));
    REQUIRE(categories.items[1][1] == scalar_cell(std::string()));

    // An empty association is an empty list, not null.
    REQUIRE(out.cell(6, 1) == list_cell({}));
    REQUIRE(*out.find_cell("id", 1) == scalar_cell(std::int64_t{2}));
    REQUIRE_FALSE(out.find_cell("missing", 0).has_value());
}

TEST_CASE("An empty record becomes an all-null row", "[batch][builder]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    auto schema = std::make_shared<const Schema>(
        Schema::make({FieldSpec{.name = "price", .kind = ScalarKind::Decimal},
                      FieldSpec{.name = "note", .kind = ScalarKind::Text},
                      FieldSpec{.name = "categories",
                                .kind = AssociationKind{.element = category_schema()}}})
            .value());
    auto builder = builder_for(kind, schema, false);

    REQUIRE(*builder->append(RecordTree{}) == 1);
    auto batch = builder->finalize().value();
    REQUIRE(batch->num_rows() == 1);
    for (std::size_t c = 0; c < batch->num_columns(); ++c) {
        REQUIRE(batch->cell(c, 0) == null_cell());
    }
}

TEST_CASE("Coercion failures leave the batch untouched", "[batch][builder]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    auto builder = builder_for(kind, product_schema(), false);
    REQUIRE(builder->append(product("1", {})).has_value());

    SECTION("a non-numeric value in a non-nullable integer field") {
        auto result = builder->append(product("N/A", {}));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Coercion);
        REQUIRE(result.error().field == "id");
        REQUIRE(result.error().value == "N/A");
    }

    SECTION("a bad element value inside an association") {
        auto result = builder->append(product("2", {category("x", "Bad")}));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().field == "categories.id");
    }

    SECTION("a failing record rejects the whole page") {
        const std::vector<RecordTree> page{product("2", {}), product("", {})};
        auto result = builder->append_page(page);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Coercion);
    }

    REQUIRE(builder->num_rows() == 1);
    auto batch = builder->finalize().value();
    REQUIRE(batch->num_rows() == 1);
    REQUIRE(batch->cell(0, 0) == scalar_cell(std::int64_t{1}));
}

TEST_CASE("Builders refuse use after finalize", "[batch][builder]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    auto builder = builder_for(kind, product_schema(), false);
    REQUIRE(builder->finalize().has_value());
    REQUIRE(builder->finalized());

    auto append = builder->append(product("1", {}));
    REQUIRE_FALSE(append.has_value());
    REQUIRE(append.error().kind == ErrorKind::Internal);

    auto again = builder->finalize();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().kind == ErrorKind::Internal);
}

TEST_CASE("Flattened builders emit one row per element", "[batch][builder]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    auto builder = builder_for(kind, product_schema(), true);

    const std::vector<RecordTree> page{
        product("1", {category("2", "Home"), category("5", "Garden")}),
        product("2", {}),
    };
    REQUIRE(*builder->append_page(page) == 3);

    auto batch = builder->finalize().value();
    REQUIRE(batch->layout().flattened);
    REQUIRE(batch->num_columns() == 8);
    REQUIRE(batch->num_rows() == 3);

    REQUIRE(*batch->find_cell("id", 1) == scalar_cell(std::int64_t{1}));
    REQUIRE(*batch->find_cell("categories.id", 0) == scalar_cell(std::int64_t{2}));
    REQUIRE(*batch->find_cell("categories.name", 1) == scalar_cell(std::string("Garden")));
    REQUIRE(*batch->find_cell("id", 2) == scalar_cell(std::int64_t{2}));
    REQUIRE(*batch->find_cell("categories.id", 2) == null_cell());
}

TEST_CASE("Both backends build identical batches", "[batch][builder]") {
    const bool flatten = GENERATE(false, true);
    auto arrow = builder_for(BackendKind::Arrow, product_schema(), flatten);
    auto native = builder_for(BackendKind::Native, product_schema(), flatten);

    RecordTree sparse;
    sparse.set_text("id", "3");
    sparse.set_text("price", "");
    sparse.set("categories", RecordTree::Null{});
    const std::vector<RecordTree> page{
        product("1", {category("2", "Home"), category("5", "Garden")}),
        product("2", {}),
        sparse,
    };
    REQUIRE(arrow->append_page(page).has_value());
    REQUIRE(native->append_page(page).has_value());

    auto left = arrow->finalize().value();
    auto right = native->finalize().value();
    REQUIRE(left->layout().same_shape(right->layout()));
    REQUIRE(left->num_rows() == right->num_rows());
    for (std::size_t c = 0; c < left->num_columns(); ++c) {
        for (std::size_t r = 0; r < left->num_rows(); ++r) {
            INFO("column " << left->layout().columns[c].name << " row " << r);
            REQUIRE(left->cell(c, r) == right->cell(c, r));
        }
    }
}

TEST_CASE("Backend names", "[batch][builder]") {
    REQUIRE(backend::parse_backend_kind("native") == BackendKind::Native);
    REQUIRE(backend::to_string(BackendKind::Arrow) == "arrow");
    REQUIRE_FALSE(backend::parse_backend_kind("pandas").has_value());
}
