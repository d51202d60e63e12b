#include <wsarrow/transport/http.hpp>

#include <wsarrow/schema/resolver.hpp>

#include <curl/curl.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace wsarrow::transport {

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct CurlStringDeleter {
    void operator()(char* text) const noexcept { curl_free(text); }
};

constexpr std::size_t kMaxErrorBody = 300;

std::once_flag curl_init_flag;

auto write_body(char* data, std::size_t size, std::size_t count, void* user) -> std::size_t {
    static_cast<std::string*>(user)->append(data, size * count);
    return size * count;
}

auto escape(CURL* handle, std::string_view text) -> std::string {
    std::unique_ptr<char, CurlStringDeleter> escaped(
        curl_easy_escape(handle, text.data(), static_cast<int>(text.size())));
    if (!escaped) {
        return std::string(text);
    }
    return std::string(escaped.get());
}

auto is_retryable_status(long status) -> bool {
    return status == 429 || status >= 500;
}

}  // namespace

HttpTransport::HttpTransport(config::Config config) : config_(std::move(config)) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto HttpTransport::request_url(std::string_view path, const query::QueryParams& params) const
    -> std::string {
    CurlHandle handle(curl_easy_init());
    std::string url = fmt::format("{}/api/{}", config_.host, path);
    char separator = '?';
    auto append = [&](std::string_view name, std::string_view value) {
        url += separator;
        url += escape(handle.get(), name);
        url += '=';
        url += escape(handle.get(), value);
        separator = '&';
    };
    for (const auto& [name, value] : params) {
        append(name, value);
    }
    if (config_.authorization == config::Authorization::Query) {
        append("ws_key", config_.key);
    }
    return url;
}

auto HttpTransport::get_once(const std::string& url) const -> Result<std::string> {
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        return std::unexpected(transport_error("cannot initialize libcurl handle", false));
    }
    std::string body;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "wsarrow");
    if (config_.authorization == config::Authorization::Header) {
        // The service takes the key as the Basic user name with an empty password.
        curl_easy_setopt(handle.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(handle.get(), CURLOPT_USERNAME, config_.key.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_PASSWORD, "");
    }

    const CURLcode rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK) {
        // Timeouts and connection failures are transient by nature.
        return std::unexpected(
            transport_error(fmt::format("request failed: {}", curl_easy_strerror(rc)), true));
    }
    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        if (body.size() > kMaxErrorBody) {
            body.resize(kMaxErrorBody);
            body += "...";
        }
        return std::unexpected(transport_error(
            fmt::format("HTTP status {}: {}", status, body), is_retryable_status(status)));
    }
    return body;
}

auto HttpTransport::get(std::string_view path, const query::QueryParams& params) const
    -> Result<std::string> {
    const auto url = request_url(path, params);
    for (std::size_t attempt = 0;; ++attempt) {
        spdlog::debug("GET /api/{} ({} parameters, attempt {})", path, params.size(), attempt + 1);
        auto body = get_once(url);
        if (body || !body.error().retryable || attempt >= config_.retries) {
            return body;
        }
        const auto delay = config_.retry_backoff * static_cast<long>(attempt + 1);
        spdlog::warn("GET /api/{}: {}; retrying in {} ms ({} of {})", path, body.error().message,
                     delay.count(), attempt + 1, config_.retries);
        std::this_thread::sleep_for(delay);
    }
}

auto HttpTransport::fetch_schema(std::string_view resource) -> Result<std::string> {
    return get(resource, {{"schema", "synopsis"}});
}

auto HttpTransport::fetch_page(std::string_view resource, const query::QueryDescriptor& descriptor,
                               PageToken token) -> Result<Page> {
    auto window = page_request(descriptor, token);
    if (!window) {
        return Page{};
    }
    auto params = query::render_query_params(descriptor, window);
    if (config_.wire_format == record::WireFormat::Json) {
        params.emplace_back("output_format", "JSON");
    }
    auto bytes = get(resource, params);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return Page{.bytes = std::move(*bytes),
                .requested = window->count,
                .next = next_token(descriptor, token)};
}

auto HttpTransport::list_resources() -> Result<std::vector<std::string>> {
    auto bytes = get("", {});
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return schema::parse_resource_list(*bytes);
}

}  // namespace wsarrow::transport
