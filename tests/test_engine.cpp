#include <wsarrow/engine/engine.hpp>
#include <wsarrow/io/reader.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace wsarrow;
using backend::BackendKind;
using engine::Engine;
using engine::RunOptions;
using io::OutputFormat;

namespace {

class TempDir {
   public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("wsarrow_engine_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    [[nodiscard]] auto file(const std::string& name) const -> std::string {
        return (path_ / name).string();
    }

   private:
    std::filesystem::path path_;
};

constexpr std::string_view kSynopsis = R"(<?xml version="1.0" encoding="UTF-8"?>
<prestashop>
  <product>
    <reference format="isReference"></reference>
    <price format="isPrice"></price>
    <date_add format="isDate"></date_add>
    <name format="isCatalogName">
      <language id="1"></language>
      <language id="2"></language>
    </name>
  </product>
</prestashop>
)";

/// In-memory shop serving `count` products, sliced by the requested window.
/// Filters are not applied server side, so the client re-check sees them all.
class FakeShop : public transport::Transport {
   public:
    explicit FakeShop(std::size_t count) : count_(count) {}

    auto fetch_schema(std::string_view resource) -> Result<std::string> override {
        if (resource != "products") {
            return std::unexpected(transport_error("no such resource", false));
        }
        return std::string(kSynopsis);
    }

    auto fetch_page(std::string_view /*resource*/, const query::QueryDescriptor& descriptor,
                    transport::PageToken token) -> Result<transport::Page> override {
        fetches_.fetch_add(1);
        if (on_fetch_) {
            std::lock_guard lock(mutex_);
            on_fetch_();
        }
        auto window = transport::page_request(descriptor, token);
        if (!window) {
            return std::unexpected(internal_error("page requested past the limit window"));
        }
        std::string bytes = "<prestashop><products>";
        for (std::size_t i = window->offset; i < std::min(count_, window->offset + window->count);
             ++i) {
            bytes += product(i + 1, descriptor.language.has_value());
        }
        bytes += "</products></prestashop>";
        return transport::Page{.bytes = std::move(bytes),
                               .requested = window->count,
                               .next = transport::next_token(descriptor, token)};
    }

    auto list_resources() -> Result<std::vector<std::string>> override {
        return std::vector<std::string>{"products"};
    }

    void on_fetch(std::function<void()> callback) { on_fetch_ = std::move(callback); }

    [[nodiscard]] auto fetches() const -> std::size_t { return fetches_.load(); }

   private:
    static auto product(std::size_t id, bool one_language) -> std::string {
        const auto name = one_language
                              ? fmt::format("<name>Item {}</name>", id)
                              : fmt::format("<name><language id=\"1\">Item {}</language>"
                                            "<language id=\"2\">Objet {}</language></name>",
                                            id, id);
        return fmt::format(
            "<product><id>{}</id><reference>REF-{}</reference><price>{}.50</price>"
            "<date_add>2024-01-{:02} 12:00:00</date_add>{}</product>",
            id, id, id, (id % 28) + 1, name);
    }

    std::size_t count_;
    std::atomic<std::size_t> fetches_{0};
    std::mutex mutex_;
    std::function<void()> on_fetch_;
};

auto options_for(OutputFormat format, std::size_t page_size) -> RunOptions {
    RunOptions options;
    options.output.format = format;
    options.page_size = page_size;
    return options;
}

auto count_rows(const std::string& path, OutputFormat format) -> std::size_t {
    auto batches = io::read_output(path, format);
    REQUIRE(batches.has_value());
    std::size_t rows = 0;
    for (const auto& batch : *batches) {
        rows += batch->num_rows();
    }
    return rows;
}

}  // namespace

TEST_CASE("A multi-page listing is written in full", "[engine]") {
    const auto format = GENERATE(OutputFormat::Ipc, OutputFormat::Parquet);
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    const std::size_t prefetch = GENERATE(0, 1, 3);
    TempDir dir;
    FakeShop shop(23);

    auto options = options_for(format, 5);
    options.backend = kind;
    options.prefetch_pages = prefetch;
    Engine runner(shop, options);

    const auto path = dir.file("products.out");
    auto summary = runner.run("products", {}, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 23);
    REQUIRE(summary->pages_fetched == 5);
    REQUIRE(summary->batches_flushed == 1);
    REQUIRE_FALSE(summary->cancelled);
    REQUIRE(count_rows(path, format) == 23);

    auto batches = io::read_output(path, format).value();
    const auto& first = *batches.front();
    REQUIRE(*first.find_cell("id", 0) == scalar_cell(std::int64_t{1}));
    REQUIRE(*first.find_cell("reference", 4) == scalar_cell(std::string("REF-5")));
    REQUIRE(first.layout().columns[*first.layout().find("name")].is_list());
}

TEST_CASE("A limit bounds the pages requested", "[engine]") {
    TempDir dir;
    FakeShop shop(100);
    Engine runner(shop, options_for(OutputFormat::Ipc, 4));

    query::Constraints constraints;
    constraints.limit = query::Limit{.offset = 10, .count = 9};
    auto summary =
        runner.run("products", constraints, io::OutputTarget{.path = dir.file("limited")});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 9);
    REQUIRE(summary->pages_fetched == 3);

    auto batches = io::read_output(dir.file("limited"), OutputFormat::Ipc).value();
    REQUIRE(*batches.front()->find_cell("id", 0) == scalar_cell(std::int64_t{11}));
}

TEST_CASE("A short page ends the listing", "[engine]") {
    TempDir dir;
    FakeShop shop(7);
    auto options = options_for(OutputFormat::Ipc, 5);
    options.prefetch_pages = 0;
    Engine runner(shop, options);

    auto summary = runner.run("products", {}, io::OutputTarget{.path = dir.file("short")});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 7);
    REQUIRE(summary->pages_fetched == 2);
    REQUIRE(shop.fetches() == 2);
}

TEST_CASE("Query errors surface before any page is fetched", "[engine]") {
    TempDir dir;
    FakeShop shop(10);
    Engine runner(shop, options_for(OutputFormat::Ipc, 5));

    query::Constraints constraints;
    constraints.filters.push_back(query::DateRange{.field = "reference",
                                                   .low = *parse_datetime("2024-01-01"),
                                                   .high = *parse_datetime("2024-02-01")});
    auto summary = runner.run("products", constraints, io::OutputTarget{.path = dir.file("bad")});
    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().kind == ErrorKind::Query);
    REQUIRE(summary.error().field == "reference");
    REQUIRE(summary.error().resource == "products");
    REQUIRE(shop.fetches() == 0);

    SECTION("an unknown resource fails at schema resolution") {
        auto missing = runner.run("carts", {}, io::OutputTarget{.path = dir.file("carts")});
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::Transport);
        REQUIRE(missing.error().resource == "carts");
        REQUIRE(shop.fetches() == 0);
    }
}

TEST_CASE("A zero page size is a configuration error", "[engine]") {
    TempDir dir;
    FakeShop shop(3);
    Engine runner(shop, options_for(OutputFormat::Ipc, 0));
    auto summary = runner.run("products", {}, io::OutputTarget{.path = dir.file("none")});
    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().kind == ErrorKind::Config);
    REQUIRE(shop.fetches() == 0);
}

TEST_CASE("Cancellation stops between pages and keeps a valid file", "[engine]") {
    TempDir dir;
    FakeShop shop(50);
    auto options = options_for(OutputFormat::Ipc, 5);
    options.prefetch_pages = 0;
    Engine runner(shop, options);

    std::size_t seen = 0;
    shop.on_fetch([&] {
        if (++seen == 2) {
            runner.cancellation().cancel();
        }
    });

    const auto path = dir.file("cancelled");
    auto summary = runner.run("products", {}, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    REQUIRE(summary->cancelled);
    REQUIRE(summary->pages_fetched == 2);
    REQUIRE(summary->rows_written == 10);
    REQUIRE(count_rows(path, OutputFormat::Ipc) == 10);
}

TEST_CASE("Batches are flushed at the row threshold", "[engine]") {
    TempDir dir;
    FakeShop shop(20);
    auto options = options_for(OutputFormat::Parquet, 4);
    options.max_rows_per_batch = 8;
    Engine runner(shop, options);

    const auto path = dir.file("flushed.parquet");
    auto summary = runner.run("products", {}, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 20);
    REQUIRE(summary->batches_flushed == 3);
    REQUIRE(count_rows(path, OutputFormat::Parquet) == 20);
}

TEST_CASE("An empty listing writes one empty batch", "[engine]") {
    const auto format = GENERATE(OutputFormat::Ipc, OutputFormat::Parquet);
    TempDir dir;
    FakeShop shop(0);
    Engine runner(shop, options_for(format, 10));

    const auto path = dir.file("empty");
    auto summary = runner.run("products", {}, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 0);
    REQUIRE(summary->batches_flushed == 1);
    REQUIRE(summary->pages_fetched == 1);

    auto batches = io::read_output(path, format);
    REQUIRE(batches.has_value());
    REQUIRE(batches->size() == 1);
    REQUIRE(batches->front()->num_rows() == 0);
    REQUIRE(batches->front()->layout().find("price").has_value());
}

TEST_CASE("Client-side filtering drops records the service let through", "[engine]") {
    TempDir dir;
    FakeShop shop(12);
    Engine runner(shop, options_for(OutputFormat::Ipc, 5));

    query::Constraints constraints;
    constraints.filters.push_back(query::Membership{.field = "id", .literals = {"2", "7", "11"}});
    const auto path = dir.file("filtered");
    auto summary = runner.run("products", constraints, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows_written == 3);
    REQUIRE(summary->records_filtered == 9);
    REQUIRE(count_rows(path, OutputFormat::Ipc) == 3);
}

TEST_CASE("Selecting a language collapses translated fields", "[engine]") {
    TempDir dir;
    FakeShop shop(3);
    Engine runner(shop, options_for(OutputFormat::Ipc, 10));

    query::Constraints constraints;
    constraints.language = 2;
    constraints.fields = std::vector<std::string>{"id", "name"};

    auto plan = runner.prepare("products", constraints);
    REQUIRE(plan.has_value());
    REQUIRE(plan->output_schema->size() == 2);
    REQUIRE(plan->output_schema->find("name")->scalar_kind() == ScalarKind::Text);

    const auto path = dir.file("localized");
    auto summary = runner.run("products", constraints, io::OutputTarget{.path = path});
    REQUIRE(summary.has_value());
    auto batches = io::read_output(path, OutputFormat::Ipc).value();
    const auto& out = *batches.front();
    REQUIRE(out.num_columns() == 2);
    REQUIRE(*out.find_cell("name", 2) == scalar_cell(std::string("Item 3")));
}
