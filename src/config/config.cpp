#include <wsarrow/config/config.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace wsarrow::config {

namespace {

using nlohmann::json;

constexpr std::array<std::string_view, 9> kKnownKeys{
    "host",    "key",     "authorization",    "wire_format", "timeout_ms",
    "retries", "retry_backoff_ms", "page_size", "language",
};

auto read_string(const json& doc, std::string_view key) -> Result<std::optional<std::string>> {
    auto it = doc.find(std::string(key));
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return std::unexpected(config_error(fmt::format("'{}' must be a string", key),
                                            std::string(key)));
    }
    return it->get<std::string>();
}

/// Non-negative integer setting; `min` bounds it from below.
auto read_count(const json& doc, std::string_view key, std::int64_t min)
    -> Result<std::optional<std::int64_t>> {
    auto it = doc.find(std::string(key));
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        return std::unexpected(config_error(fmt::format("'{}' must be an integer", key),
                                            std::string(key)));
    }
    const auto value = it->get<std::int64_t>();
    if (value < min) {
        return std::unexpected(
            config_error(fmt::format("'{}' must be at least {}, got {}", key, min, value),
                         std::string(key)));
    }
    return value;
}

auto normalize_host(std::string host) -> Result<std::string> {
    if (!host.starts_with("http://") && !host.starts_with("https://")) {
        return std::unexpected(
            config_error(fmt::format("host '{}' must start with http:// or https://", host), "host"));
    }
    while (host.ends_with('/')) {
        host.pop_back();
    }
    if (host.ends_with("/api")) {
        host.resize(host.size() - 4);
    }
    return host;
}

}  // namespace

auto to_string(Authorization authorization) noexcept -> std::string_view {
    switch (authorization) {
        case Authorization::Header:
            return "header";
        case Authorization::Query:
            return "query";
    }
    return "unknown";
}

auto parse_config(std::string_view text, std::optional<std::string> key_override)
    -> Result<Config> {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(config_error(fmt::format("malformed configuration: {}", e.what())));
    }
    if (!doc.is_object()) {
        return std::unexpected(config_error("configuration must be a JSON object"));
    }
    for (const auto& item : doc.items()) {
        if (std::find(kKnownKeys.begin(), kKnownKeys.end(), item.key()) == kKnownKeys.end()) {
            spdlog::warn("ignoring unknown configuration key '{}'", item.key());
        }
    }

    Config config;

    auto host = read_string(doc, "host");
    if (!host) {
        return std::unexpected(host.error());
    }
    if (!*host || (*host)->empty()) {
        return std::unexpected(config_error("'host' is required", "host"));
    }
    auto normalized = normalize_host(std::move(**host));
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    config.host = std::move(*normalized);

    auto key = read_string(doc, "key");
    if (!key) {
        return std::unexpected(key.error());
    }
    if (key_override && !key_override->empty()) {
        config.key = std::move(*key_override);
    } else if (*key) {
        config.key = std::move(**key);
    }
    if (config.key.empty()) {
        return std::unexpected(config_error(
            fmt::format("'key' is required (or set {})", kKeyEnvVar), "key"));
    }

    auto authorization = read_string(doc, "authorization");
    if (!authorization) {
        return std::unexpected(authorization.error());
    }
    if (*authorization) {
        if (**authorization == "header") {
            config.authorization = Authorization::Header;
        } else if (**authorization == "query") {
            config.authorization = Authorization::Query;
        } else {
            return std::unexpected(config_error(
                fmt::format("'authorization' must be \"header\" or \"query\", got \"{}\"",
                            **authorization),
                "authorization"));
        }
    }

    auto wire_format = read_string(doc, "wire_format");
    if (!wire_format) {
        return std::unexpected(wire_format.error());
    }
    if (*wire_format) {
        auto format = record::parse_wire_format(**wire_format);
        if (!format) {
            return std::unexpected(config_error(
                fmt::format("'wire_format' must be \"xml\" or \"json\", got \"{}\"", **wire_format),
                "wire_format"));
        }
        config.wire_format = *format;
    }

    struct CountSetting {
        std::string_view key;
        std::int64_t min;
    };
    for (const auto& [name, min] : {CountSetting{"timeout_ms", 1}, CountSetting{"retries", 0},
                                    CountSetting{"retry_backoff_ms", 0},
                                    CountSetting{"page_size", 1}, CountSetting{"language", 1}}) {
        auto value = read_count(doc, name, min);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (!*value) {
            continue;
        }
        const auto v = **value;
        if (name == "timeout_ms") {
            config.timeout = std::chrono::milliseconds(v);
        } else if (name == "retries") {
            config.retries = static_cast<std::size_t>(v);
        } else if (name == "retry_backoff_ms") {
            config.retry_backoff = std::chrono::milliseconds(v);
        } else if (name == "page_size") {
            config.page_size = static_cast<std::size_t>(v);
        } else {
            config.language = v;
        }
    }
    return config;
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            config_error(fmt::format("cannot open configuration file '{}'", path.string())));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::optional<std::string> key_override;
    if (const char* env = std::getenv(std::string(kKeyEnvVar).c_str()); env != nullptr) {
        key_override = env;
    }
    auto config = parse_config(buffer.str(), std::move(key_override));
    if (config) {
        spdlog::debug("loaded configuration for {} from {}", config->host, path.string());
    }
    return config;
}

}  // namespace wsarrow::config
