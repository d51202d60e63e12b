#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/record/record.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace wsarrow::record {

/// Wire encodings a listing page may arrive in.
enum class WireFormat : std::uint8_t {
    Xml,
    Json,
};

[[nodiscard]] auto to_string(WireFormat format) noexcept -> std::string_view;
[[nodiscard]] auto parse_wire_format(std::string_view name) -> std::optional<WireFormat>;

/// Decode one listing page into records, in page order.
///
/// The schema only steers structure (which elements are associations); values
/// stay raw text. A malformed page fails as a whole with a parse error that
/// carries a byte offset. Invalid UTF-8, bad entities and JSON syntax errors
/// point at the offending byte. XML structure errors only resolve to a line,
/// so their offset is the start of the line tinyxml2 reports; on a page
/// served as a single line that is 0.
[[nodiscard]] auto parse_page(std::string_view bytes, WireFormat format, const Schema& schema)
    -> Result<std::vector<RecordTree>>;

/// Offset of the first invalid UTF-8 sequence, if any.
[[nodiscard]] auto find_invalid_utf8(std::string_view bytes) noexcept -> std::optional<std::size_t>;

}  // namespace wsarrow::record
