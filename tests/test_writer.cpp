#include <wsarrow/backend/backend.hpp>
#include <wsarrow/io/reader.hpp>
#include <wsarrow/io/writer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace wsarrow;
using backend::BackendKind;
using io::OutputFormat;
using record::RecordTree;

namespace {

/// Scratch directory removed at the end of the test.
class TempDir {
   public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("wsarrow_test_" + std::to_string(std::random_device{}()));
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

auto customer_schema() -> std::shared_ptr<const Schema> {
    auto address = std::make_shared<const Schema>(
        Schema::make({FieldSpec{.name = "id", .kind = ScalarKind::Integer, .nullable = false},
                      FieldSpec{.name = "city", .kind = ScalarKind::Text}})
            .value());
    return std::make_shared<const Schema>(
        Schema::make({
                         FieldSpec{.name = "id", .kind = ScalarKind::Integer, .nullable = false},
                         FieldSpec{.name = "email", .kind = ScalarKind::Text},
                         FieldSpec{.name = "note", .kind = ScalarKind::HtmlText},
                         FieldSpec{.name = "newsletter", .kind = ScalarKind::Boolean},
                         FieldSpec{.name = "birthday", .kind = ScalarKind::Date},
                         FieldSpec{.name = "date_add", .kind = ScalarKind::DateTime},
                         FieldSpec{.name = "balance", .kind = ScalarKind::Decimal},
                         FieldSpec{.name = "addresses",
                                   .kind = AssociationKind{.element = address}},
                     })
            .value());
}

auto customer(std::string id, RecordTree::List addresses) -> RecordTree {
    RecordTree record;
    record.set_text("id", std::move(id));
    record.set_text("email", "pub@example.com");
    record.set_text("note", "caf&amp;e");
    record.set_text("newsletter", "0");
    record.set_text("birthday", "1990-05-17");
    record.set_text("date_add", "2023-11-02 08:15:00");
    record.set_text("balance", "-12.25");
    record.set("addresses", std::move(addresses));
    return record;
}

auto address(std::string id, std::string city) -> RecordTree {
    RecordTree element;
    element.set_text("id", std::move(id));
    element.set_text("city", std::move(city));
    return element;
}

auto build(const backend::Backend& backend, std::vector<RecordTree> records, bool flatten = false)
    -> std::shared_ptr<const batch::ColumnarBatch> {
    auto builder =
        backend.make_builder(customer_schema(), batch::BuildOptions{.flatten = flatten}).value();
    REQUIRE(builder->append_page(records).has_value());
    return builder->finalize().value();
}

auto writer_options(const std::string& path, OutputFormat format) -> io::WriterOptions {
    return io::WriterOptions{.target = io::OutputTarget{.path = path},
                             .format = format,
                             .compression = io::Compression::Snappy};
}

}  // namespace

TEST_CASE("Written batches read back unchanged", "[io][writer]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    const auto format = GENERATE(OutputFormat::Ipc, OutputFormat::Parquet);
    const bool flatten = GENERATE(false, true);
    TempDir dir;
    const auto path = dir.file(format == OutputFormat::Ipc ? "out.arrows" : "out.parquet");
    const auto impl = backend::make_backend(kind);

    auto first = build(*impl,
                       {customer("1", {address("3", "Lyon"), address("4", "")}), customer("2", {})},
                       flatten);
    RecordTree sparse;
    sparse.set_text("id", "3");
    auto second = build(*impl, {sparse}, flatten);

    auto writer = impl->make_writer(writer_options(path, format)).value();
    REQUIRE(writer->write(*first).has_value());
    REQUIRE(writer->write(*second).has_value());
    REQUIRE(writer->close().has_value());
    REQUIRE(writer->rows_written() == first->num_rows() + second->num_rows());
    REQUIRE(writer->batches_written() == 2);

    auto batches = io::read_output(path, format);
    REQUIRE(batches.has_value());
    REQUIRE_FALSE(batches->empty());

    std::vector<std::vector<Cell>> rows;
    for (const auto& batch : *batches) {
        REQUIRE(batch->layout().same_shape(first->layout()));
        for (std::size_t r = 0; r < batch->num_rows(); ++r) {
            std::vector<Cell> row;
            for (std::size_t c = 0; c < batch->num_columns(); ++c) {
                row.push_back(batch->cell(c, r));
            }
            rows.push_back(std::move(row));
        }
    }
    std::vector<std::vector<Cell>> expected;
    for (const auto* source : {first.get(), second.get()}) {
        for (std::size_t r = 0; r < source->num_rows(); ++r) {
            std::vector<Cell> row;
            for (std::size_t c = 0; c < source->num_columns(); ++c) {
                row.push_back(source->cell(c, r));
            }
            expected.push_back(std::move(row));
        }
    }
    REQUIRE(rows == expected);
}

TEST_CASE("HTML text survives the round trip as its own kind", "[io][writer]") {
    const auto format = GENERATE(OutputFormat::Ipc, OutputFormat::Parquet);
    TempDir dir;
    const auto path = dir.file("kinds");
    const auto impl = backend::make_backend(BackendKind::Arrow);

    auto batch = build(*impl, {customer("1", {})});
    auto writer = impl->make_writer(writer_options(path, format)).value();
    REQUIRE(writer->write(*batch).has_value());
    REQUIRE(writer->close().has_value());

    auto batches = io::read_output(path, format).value();
    const auto& layout = batches.front()->layout();
    REQUIRE(layout.columns[*layout.find("note")].scalar == ScalarKind::HtmlText);
    REQUIRE(layout.columns[*layout.find("birthday")].scalar == ScalarKind::Date);
    REQUIRE(layout.columns[*layout.find("date_add")].scalar == ScalarKind::DateTime);
    REQUIRE_FALSE(layout.columns[*layout.find("id")].nullable);
    REQUIRE(layout.columns[*layout.find("addresses")].is_list());
}

TEST_CASE("Writers keep one layout per output", "[io][writer]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    TempDir dir;
    const auto impl = backend::make_backend(kind);
    auto writer = impl->make_writer(writer_options(dir.file("out.arrows"), OutputFormat::Ipc))
                      .value();

    auto nested = build(*impl, {customer("1", {address("3", "Lyon")})}, false);
    auto flat = build(*impl, {customer("1", {address("3", "Lyon")})}, true);

    REQUIRE(writer->write(*nested).has_value());
    auto drift = writer->write(*flat);
    REQUIRE_FALSE(drift.has_value());
    REQUIRE(drift.error().kind == ErrorKind::Write);
    REQUIRE(writer->batches_written() == 1);

    REQUIRE(writer->close().has_value());
    SECTION("close is idempotent and later writes fail") {
        REQUIRE(writer->closed());
        REQUIRE(writer->close().has_value());
        auto late = writer->write(*nested);
        REQUIRE_FALSE(late.has_value());
        REQUIRE(late.error().kind == ErrorKind::Write);
    }
}

TEST_CASE("Writers reject batches of another backend", "[io][writer]") {
    TempDir dir;
    const auto arrow_impl = backend::make_backend(BackendKind::Arrow);
    const auto native_impl = backend::make_backend(BackendKind::Native);

    auto writer = arrow_impl->make_writer(writer_options(dir.file("out.parquet"), OutputFormat::Parquet))
                      .value();
    auto result = writer->write(*build(*native_impl, {customer("1", {})}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Write);
    REQUIRE(writer->close().has_value());
}

TEST_CASE("JSON lines output writes one object per row", "[io][writer]") {
    const auto kind = GENERATE(BackendKind::Arrow, BackendKind::Native);
    TempDir dir;
    const auto path = dir.file("customers.ndjson");
    REQUIRE(io::guess_output_format(path) == OutputFormat::Json);
    const auto impl = backend::make_backend(kind);

    RecordTree sparse;
    sparse.set_text("id", "2");
    auto writer = impl->make_writer(writer_options(path, OutputFormat::Json)).value();
    REQUIRE(writer->write(*build(*impl, {customer("1", {address("3", "Lyon")})})).has_value());
    REQUIRE(writer->write(*build(*impl, {sparse})).has_value());
    REQUIRE(writer->close().has_value());
    REQUIRE(writer->rows_written() == 2);

    std::ifstream in(path);
    std::vector<nlohmann::json> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(lines.size() == 2);

    const auto& full = lines[0];
    REQUIRE(full["id"] == 1);
    REQUIRE(full["email"] == "pub@example.com");
    REQUIRE(full["note"] == "caf&e");
    REQUIRE(full["newsletter"] == false);
    REQUIRE(full["birthday"] == "1990-05-17");
    REQUIRE(full["date_add"] == "2023-11-02 08:15:00");
    REQUIRE(full["balance"] == -12.25);
    REQUIRE(full["addresses"] ==
            nlohmann::json::array({nlohmann::json{{"id", 3}, {"city", "Lyon"}}}));

    const auto& bare = lines[1];
    REQUIRE(bare["id"] == 2);
    REQUIRE(bare["email"].is_null());
    REQUIRE(bare["addresses"].is_null());

    SECTION("flattened rows use the dotted column names") {
        const auto flat_path = dir.file("flat.json");
        auto flat_writer = impl->make_writer(writer_options(flat_path, OutputFormat::Json)).value();
        auto flat = build(*impl, {customer("1", {address("3", "Lyon"), address("4", "Nice")})}, true);
        REQUIRE(flat_writer->write(*flat).has_value());
        REQUIRE(flat_writer->close().has_value());

        std::ifstream flat_in(flat_path);
        std::vector<nlohmann::json> rows;
        for (std::string line; std::getline(flat_in, line);) {
            rows.push_back(nlohmann::json::parse(line));
        }
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[1]["id"] == 1);
        REQUIRE(rows[1]["addresses.city"] == "Nice");
    }

    SECTION("JSON lines cannot be read back as batches") {
        auto back = io::read_output(path, OutputFormat::Json);
        REQUIRE_FALSE(back.has_value());
        REQUIRE(back.error().kind == ErrorKind::Write);
    }
}

TEST_CASE("Reading a missing or foreign file fails", "[io][reader]") {
    TempDir dir;
    auto missing = io::read_output(dir.file("nope.parquet"), OutputFormat::Parquet);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::Write);
}

TEST_CASE("Output format and compression names", "[io][writer]") {
    REQUIRE(io::parse_output_format("arrow") == OutputFormat::Ipc);
    REQUIRE(io::parse_output_format("parquet") == OutputFormat::Parquet);
    REQUIRE(io::parse_output_format("ndjson") == OutputFormat::Json);
    REQUIRE(io::to_string(OutputFormat::Json) == "json");
    REQUIRE_FALSE(io::parse_output_format("csv").has_value());
    REQUIRE(io::parse_compression("none") == io::Compression::Uncompressed);
    REQUIRE(io::parse_compression("zstd") == io::Compression::Zstd);
    REQUIRE(io::guess_output_format("listing.pq") == OutputFormat::Parquet);
    REQUIRE(io::guess_output_format("listing.arrows") == OutputFormat::Ipc);
    REQUIRE(io::OutputTarget{}.is_stdout());
}
