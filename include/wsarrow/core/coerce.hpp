#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wsarrow {

/// Strict `[-+]?[0-9]+` into int64. No whitespace, no truncation, no overflow.
[[nodiscard]] auto parse_integer(std::string_view text) -> std::optional<std::int64_t>;

/// Strict `[-+]?[0-9]+(\.[0-9]+)?([eE][-+]?[0-9]+)?` into double.
[[nodiscard]] auto parse_decimal(std::string_view text) -> std::optional<double>;

/// `1`, `0`, `true`, `false` (ASCII case-insensitive).
[[nodiscard]] auto parse_boolean(std::string_view text) -> std::optional<bool>;

/// Replace the markup entities the service escapes inside HTML-bearing fields.
[[nodiscard]] auto unescape_html(std::string_view text) -> std::string;

/// Convert raw wire text to the typed value of `kind`.
///
/// Empty text and the zero-date sentinel become null (monostate), except for
/// Text/HtmlText where empty text stays an empty string. Numeric and temporal
/// kinds ignore surrounding ASCII whitespace; a DateTime given a bare date is
/// taken at midnight. On failure returns a coercion
/// error naming `field` and carrying the literal.
[[nodiscard]] auto coerce_scalar(std::string_view text, ScalarKind kind, std::string_view field)
    -> Result<ScalarValue>;

}  // namespace wsarrow
