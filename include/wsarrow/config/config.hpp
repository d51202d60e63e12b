#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/record/parser.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wsarrow::config {

/// Environment variable that supplies (or overrides) the access key.
inline constexpr std::string_view kKeyEnvVar = "WSARROW_KEY";

enum class Authorization : std::uint8_t {
    Header,  // HTTP Basic, key as user name
    Query,   // ws_key query parameter
};

[[nodiscard]] auto to_string(Authorization authorization) noexcept -> std::string_view;

/// Connection settings for one service.
struct Config {
    std::string host;
    std::string key;
    Authorization authorization = Authorization::Header;
    record::WireFormat wire_format = record::WireFormat::Xml;
    std::chrono::milliseconds timeout{30000};
    std::size_t retries = 3;
    std::chrono::milliseconds retry_backoff{500};
    std::size_t page_size = 1000;
    std::optional<std::int64_t> language;
};

/// Parse a JSON configuration document. `key_override`, when set, replaces
/// the document's `key`.
[[nodiscard]] auto parse_config(std::string_view text,
                                std::optional<std::string> key_override = std::nullopt)
    -> Result<Config>;

/// Read and parse `path`, taking the key from WSARROW_KEY when it is set.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;

}  // namespace wsarrow::config
