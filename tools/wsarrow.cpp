#include <wsarrow/wsarrow.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace wsarrow;

engine::CancellationToken* g_cancel = nullptr;

void on_interrupt(int /*signal*/) {
    if (g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

auto report(const Error& error) -> int {
    fmt::print(stderr, "wsarrow: {}\n", error.format());
    return 1;
}

auto schema_to_json(const Schema& schema, std::size_t max_depth) -> nlohmann::json {
    auto fields = nlohmann::json::array();
    for (const auto& field : schema.fields()) {
        nlohmann::json entry{{"name", field.name}, {"nullable", field.nullable}};
        if (const auto* assoc = field.association()) {
            entry["kind"] = assoc->translated ? "Translated" : "Association";
            if (max_depth > 1) {
                entry["fields"] = schema_to_json(*assoc->element, max_depth - 1);
            }
        } else {
            entry["kind"] = std::string(to_string(*field.scalar_kind()));
        }
        fields.push_back(std::move(entry));
    }
    return fields;
}

struct CommonArgs {
    std::string conf;
    bool reject_unknown_hints = false;
};

auto load(const CommonArgs& args) -> Result<config::Config> {
    return config::load_config(args.conf);
}

auto resolve_options(const CommonArgs& args) -> schema::ResolveOptions {
    return schema::ResolveOptions{.unknown_hints = args.reject_unknown_hints
                                                       ? schema::UnknownHintPolicy::Reject
                                                       : schema::UnknownHintPolicy::NullableText};
}

auto run_resources(const CommonArgs& args) -> int {
    auto config = load(args);
    if (!config) {
        return report(config.error());
    }
    transport::HttpTransport http(std::move(*config));
    auto names = http.list_resources();
    if (!names) {
        return report(names.error());
    }
    for (const auto& name : *names) {
        fmt::print("{}\n", name);
    }
    return 0;
}

struct SchemaArgs {
    std::string resource;
    bool json = false;
    std::size_t max_depth = SIZE_MAX;
};

auto run_schema(const CommonArgs& common, const SchemaArgs& args) -> int {
    auto config = load(common);
    if (!config) {
        return report(config.error());
    }
    transport::HttpTransport http(std::move(*config));
    engine::RunOptions options{.resolve = resolve_options(common)};
    engine::Engine engine(http, std::move(options));
    auto schema = engine.resolve(args.resource);
    if (!schema) {
        return report(schema.error());
    }
    if (args.json) {
        nlohmann::json doc{{"resource", args.resource},
                           {"fields", schema_to_json(*schema, args.max_depth)}};
        fmt::print("{}\n", doc.dump(2));
    } else {
        fmt::print("{}\n", format_schema(*schema, args.max_depth));
    }
    return 0;
}

struct GetArgs {
    std::string resource;
    std::string output = "-";
    std::string format;
    std::string compression = "snappy";
    std::string backend = "arrow";
    bool flatten = false;
    std::vector<std::string> fields;
    std::vector<std::string> filters;
    std::vector<std::string> date_ranges;
    std::string date_add;
    std::string date_upd;
    std::string limit = "all";
    std::string sort;
    std::optional<std::size_t> page_size;
    std::size_t prefetch = 1;
    std::size_t max_rows_per_batch = 0;
    std::optional<std::int64_t> language;
};

auto gather_constraints(const GetArgs& args, const config::Config& config)
    -> Result<query::Constraints> {
    query::Constraints constraints;
    if (!args.fields.empty()) {
        constraints.fields = args.fields;
    }
    for (const auto& text : args.filters) {
        auto membership = query::parse_membership(text);
        if (!membership) {
            return std::unexpected(membership.error());
        }
        constraints.filters.emplace_back(std::move(*membership));
    }
    for (const auto& text : args.date_ranges) {
        auto range = query::parse_date_range(text);
        if (!range) {
            return std::unexpected(range.error());
        }
        constraints.filters.emplace_back(std::move(*range));
    }
    for (const auto& [field, text] : {std::pair{"date_add", &args.date_add},
                                      std::pair{"date_upd", &args.date_upd}}) {
        if (text->empty()) {
            continue;
        }
        auto bounds = query::parse_date_bounds(*text);
        if (!bounds) {
            return std::unexpected(bounds.error());
        }
        constraints.filters.emplace_back(
            query::DateRange{.field = field, .low = bounds->first, .high = bounds->second});
    }
    auto limit = query::parse_limit(args.limit);
    if (!limit) {
        return std::unexpected(limit.error());
    }
    constraints.limit = *limit;
    if (!args.sort.empty()) {
        auto sort = query::parse_sort(args.sort);
        if (!sort) {
            return std::unexpected(sort.error());
        }
        constraints.sort = std::move(*sort);
    }
    constraints.language = args.language ? args.language : config.language;
    return constraints;
}

auto run_get(const CommonArgs& common, const GetArgs& args) -> int {
    auto config = load(common);
    if (!config) {
        return report(config.error());
    }
    auto constraints = gather_constraints(args, *config);
    if (!constraints) {
        return report(constraints.error());
    }

    engine::RunOptions options{.flatten = args.flatten,
                               .page_size = args.page_size.value_or(config->page_size),
                               .prefetch_pages = args.prefetch,
                               .max_rows_per_batch = args.max_rows_per_batch,
                               .resolve = resolve_options(common)};
    auto backend_kind = backend::parse_backend_kind(args.backend);
    if (!backend_kind) {
        return report(config_error(fmt::format("unknown backend '{}'", args.backend), "backend"));
    }
    options.backend = *backend_kind;

    const io::OutputTarget target{.path = args.output};
    if (args.format.empty()) {
        options.output.format =
            target.is_stdout() ? io::OutputFormat::Json : io::guess_output_format(target.path);
    } else if (auto format = io::parse_output_format(args.format)) {
        options.output.format = *format;
    } else {
        return report(config_error(fmt::format("unknown output format '{}'", args.format), "format"));
    }
    auto compression = io::parse_compression(args.compression);
    if (!compression) {
        return report(
            config_error(fmt::format("unknown compression '{}'", args.compression), "compression"));
    }
    options.output.compression = *compression;

    transport::HttpTransport http(std::move(*config));
    engine::Engine engine(http, std::move(options));
    g_cancel = &engine.cancellation();
    std::signal(SIGINT, on_interrupt);

    auto summary = engine.run(args.resource, *constraints, target);
    g_cancel = nullptr;
    if (!summary) {
        return report(summary.error());
    }
    return 0;
}

struct InspectArgs {
    std::string path;
    std::string format;
    std::size_t head = 0;
};

auto run_inspect(const InspectArgs& args) -> int {
    auto format = args.format.empty() ? std::optional{io::guess_output_format(args.path)}
                                      : io::parse_output_format(args.format);
    if (!format) {
        return report(config_error(fmt::format("unknown output format '{}'", args.format), "format"));
    }
    auto batches = io::read_output(args.path, *format);
    if (!batches) {
        return report(batches.error());
    }
    std::size_t rows = 0;
    for (const auto& batch : *batches) {
        rows += batch->num_rows();
    }
    const auto& layout = batches->front()->layout();
    fmt::print("{}\n", format_layout(layout));
    fmt::print("{} row(s) in {} batch(es)\n", rows, batches->size());

    std::size_t printed = 0;
    for (const auto& batch : *batches) {
        for (std::size_t r = 0; r < batch->num_rows() && printed < args.head; ++r, ++printed) {
            std::vector<std::string> cells;
            cells.reserve(batch->num_columns());
            for (std::size_t c = 0; c < batch->num_columns(); ++c) {
                cells.push_back(format_cell(batch->cell(c, r)));
            }
            fmt::print("{}\n", fmt::join(cells, "\t"));
        }
    }
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"wsarrow: web service listings to Arrow IPC and Parquet"};
    app.set_version_flag("--version", "wsarrow 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors")->excludes("--verbose");

    CommonArgs common;

    auto* resources = app.add_subcommand("resources", "List the resource types of the service");
    resources->add_option("--conf", common.conf, "Configuration file")->required();

    SchemaArgs schema_args;
    auto* schema = app.add_subcommand("schema", "Print the resolved schema of a resource");
    schema->add_option("resource", schema_args.resource, "Resource type")->required();
    schema->add_option("--conf", common.conf, "Configuration file")->required();
    schema->add_flag("--json", schema_args.json, "Print the schema as JSON");
    schema->add_option("--max-depth", schema_args.max_depth, "Association levels to expand");
    schema->add_flag("--reject-unknown-hints", common.reject_unknown_hints,
                     "Fail on format hints outside the hint table");

    GetArgs get_args;
    auto* get = app.add_subcommand("get", "Fetch a resource listing into a columnar file");
    get->add_option("resource", get_args.resource, "Resource type")->required();
    get->add_option("--conf", common.conf, "Configuration file")->required();
    get->add_option("-o,--output", get_args.output, "Output file (default: stdout)");
    get->add_option("--format", get_args.format,
                    "json, ipc or parquet (default: json on stdout, else from the extension)");
    get->add_option("--compression", get_args.compression,
                    "Parquet codec: uncompressed, snappy, gzip, zstd, lz4, brotli");
    get->add_option("--backend", get_args.backend, "Batch backend: arrow or native");
    get->add_flag("--flatten", get_args.flatten,
                  "Explode associations into one row per element combination");
    get->add_option("-f,--field", get_args.fields, "Field to fetch (repeatable)");
    get->add_option("--filter", get_args.filters, "FIELD=V1|V2|... (repeatable)");
    get->add_option("--date-range", get_args.date_ranges, "FIELD=LOW..HIGH (repeatable)");
    get->add_option("--date-add", get_args.date_add, "LOW..HIGH on date_add");
    get->add_option("--date-upd", get_args.date_upd, "LOW..HIGH on date_upd");
    get->add_option("--limit", get_args.limit, "all, N or OFFSET,N");
    get->add_option("--sort", get_args.sort, "FIELD[:asc|:desc]");
    get->add_option("--page-size", get_args.page_size, "Records per request")
        ->check(CLI::PositiveNumber);
    get->add_option("--prefetch", get_args.prefetch, "Pages fetched ahead (0 disables)");
    get->add_option("--max-rows-per-batch", get_args.max_rows_per_batch,
                    "Flush a batch after this many rows (0: single batch)");
    get->add_option("--language", get_args.language, "Language id for translated fields")
        ->check(CLI::PositiveNumber);
    get->add_flag("--reject-unknown-hints", common.reject_unknown_hints,
                  "Fail on format hints outside the hint table");

    InspectArgs inspect_args;
    auto* inspect = app.add_subcommand("inspect", "Print the layout and row count of a written file");
    inspect->add_option("path", inspect_args.path, "File written by `get`")->required();
    inspect->add_option("--format", inspect_args.format, "ipc or parquet (default: from the extension)");
    inspect->add_option("--head", inspect_args.head, "Print the first N rows");

    CLI11_PARSE(app, argc, argv);

    // Data may go to stdout; logs never do.
    spdlog::set_default_logger(spdlog::stderr_color_mt("wsarrow"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (resources->parsed()) {
        return run_resources(common);
    }
    if (schema->parsed()) {
        return run_schema(common, schema_args);
    }
    if (get->parsed()) {
        return run_get(common, get_args);
    }
    return run_inspect(inspect_args);
}
