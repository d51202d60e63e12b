#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsarrow::schema {

/// What to do with a `format` hint missing from the lookup table.
enum class UnknownHintPolicy : std::uint8_t {
    NullableText,  ///< Map to nullable Text and log a warning.
    Reject,        ///< Fail with a schema error.
};

struct ResolveOptions {
    UnknownHintPolicy unknown_hints = UnknownHintPolicy::NullableText;
};

/// Field holding the record identifier; always present, non-nullable Integer.
inline constexpr std::string_view kIdField = "id";

/// Element field names of translated (per-language) fields.
inline constexpr std::string_view kLanguageIdField = "id";
inline constexpr std::string_view kLanguageValueField = "value";

/// Parse a schema synopsis document for `resource` into a Schema.
///
/// The synopsis is the service's `schema=synopsis` XML: one element per field,
/// each carrying a `format` hint and an optional `required` flag, translated
/// fields as `<language>` children and one-to-many relations under
/// `<associations>` with a `nodeType` attribute and a single template child.
[[nodiscard]] auto resolve_schema(std::string_view resource, std::string_view bytes,
                                  const ResolveOptions& options = {}) -> Result<Schema>;

/// Replace every translated field by a nullable scalar of its value kind, the
/// shape the service returns when a single language is requested.
[[nodiscard]] auto collapse_translations(const Schema& schema) -> Result<Schema>;

/// Fixed hint table lookup; nullopt for hints the table does not know.
[[nodiscard]] auto kind_for_hint(std::string_view hint) -> std::optional<ScalarKind>;

/// Name-based fallback when a field carries no hint (`id`, `id_*`, `*_id`).
[[nodiscard]] auto kind_for_name(std::string_view name) -> std::optional<ScalarKind>;

/// Parse the API root listing into the resource type names it advertises.
[[nodiscard]] auto parse_resource_list(std::string_view bytes) -> Result<std::vector<std::string>>;

}  // namespace wsarrow::schema
