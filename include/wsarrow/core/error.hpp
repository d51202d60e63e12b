#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace wsarrow {

/// Error taxonomy shared by every stage of a run.
enum class ErrorKind : std::uint8_t {
    Schema,
    Query,
    Parse,
    Coercion,
    Write,
    Transport,
    Config,
    Internal,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// A failed operation, with whatever context identifies the offending input.
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string resource;
    std::string field;
    /// Literal that failed to convert (coercion) or was rejected (query).
    std::optional<std::string> value;
    /// Byte offset into the page or schema payload (parse errors).
    std::optional<std::size_t> offset;
    /// Zero-based page index within the run.
    std::optional<std::size_t> page;
    /// Only transport failures may be retried.
    bool retryable = false;

    [[nodiscard]] auto format() const -> std::string;

    auto with_resource(std::string name) && -> Error;
    auto with_page(std::size_t index) && -> Error;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto schema_error(std::string message, std::string field = {}) -> Error;
[[nodiscard]] auto query_error(std::string message, std::string field = {}) -> Error;
[[nodiscard]] auto parse_error(std::string message, std::size_t offset) -> Error;
[[nodiscard]] auto coercion_error(std::string message, std::string field, std::string value)
    -> Error;
[[nodiscard]] auto write_error(std::string message) -> Error;
[[nodiscard]] auto transport_error(std::string message, bool retryable) -> Error;
[[nodiscard]] auto config_error(std::string message, std::string key = {}) -> Error;
[[nodiscard]] auto internal_error(std::string message) -> Error;

}  // namespace wsarrow
