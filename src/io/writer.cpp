#include <wsarrow/io/writer.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace wsarrow::io {

namespace {

constexpr std::array<std::pair<std::string_view, Compression>, 6> kCompressions{{
    {"uncompressed", Compression::Uncompressed},
    {"snappy", Compression::Snappy},
    {"gzip", Compression::Gzip},
    {"zstd", Compression::Zstd},
    {"lz4", Compression::Lz4},
    {"brotli", Compression::Brotli},
}};

}  // namespace

auto to_string(OutputFormat format) noexcept -> std::string_view {
    switch (format) {
        case OutputFormat::Ipc:
            return "ipc";
        case OutputFormat::Parquet:
            return "parquet";
        case OutputFormat::Json:
            return "json";
    }
    return "unknown";
}

auto to_string(Compression compression) noexcept -> std::string_view {
    for (const auto& [name, value] : kCompressions) {
        if (value == compression) {
            return name;
        }
    }
    return "unknown";
}

auto parse_output_format(std::string_view name) -> std::optional<OutputFormat> {
    if (name == "ipc" || name == "arrow") {
        return OutputFormat::Ipc;
    }
    if (name == "parquet") {
        return OutputFormat::Parquet;
    }
    if (name == "json" || name == "ndjson") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

auto parse_compression(std::string_view name) -> std::optional<Compression> {
    for (const auto& [candidate, value] : kCompressions) {
        if (candidate == name) {
            return value;
        }
    }
    if (name == "none") {
        return Compression::Uncompressed;
    }
    return std::nullopt;
}

BatchWriter::BatchWriter(WriterOptions options) : options_(std::move(options)) {}

auto BatchWriter::write(const batch::ColumnarBatch& batch) -> Result<void> {
    if (closed_) {
        return std::unexpected(write_error("write after close"));
    }
    if (!layout_) {
        layout_ = batch.layout();
    } else if (!layout_->same_shape(batch.layout())) {
        return std::unexpected(write_error(
            fmt::format("batch layout differs from the first batch written\n  expected {}\n  got {}",
                        format_layout(*layout_), format_layout(batch.layout()))));
    }
    if (auto ok = do_write(batch); !ok) {
        return ok;
    }
    rows_ += batch.num_rows();
    ++batches_;
    spdlog::debug("wrote batch {} ({} rows) to {}", batches_, batch.num_rows(),
                  options_.target.is_stdout() ? "stdout" : options_.target.path);
    return {};
}

auto BatchWriter::close() -> Result<void> {
    if (closed_) {
        return {};
    }
    closed_ = true;
    return do_close();
}

}  // namespace wsarrow::io
