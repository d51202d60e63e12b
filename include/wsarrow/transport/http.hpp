#pragma once

#include <wsarrow/config/config.hpp>
#include <wsarrow/transport/transport.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace wsarrow::transport {

/// Transport over HTTP(S) using libcurl.
///
/// Each request uses its own easy handle, so pages may be fetched from
/// several threads at once. Network failures, timeouts, HTTP 5xx and 429 are
/// retried with linear backoff; other 4xx replies fail at once.
class HttpTransport final : public Transport {
   public:
    explicit HttpTransport(config::Config config);

    [[nodiscard]] auto fetch_schema(std::string_view resource) -> Result<std::string> override;
    [[nodiscard]] auto fetch_page(std::string_view resource,
                                  const query::QueryDescriptor& descriptor, PageToken token)
        -> Result<Page> override;
    [[nodiscard]] auto list_resources() -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto wire_format() const noexcept -> record::WireFormat override {
        return config_.wire_format;
    }

    [[nodiscard]] auto config() const noexcept -> const config::Config& { return config_; }

    /// Full request URL for `path` (relative to /api) and `params`, with the
    /// key added when query authorization is configured. Values are
    /// percent-encoded.
    [[nodiscard]] auto request_url(std::string_view path, const query::QueryParams& params) const
        -> std::string;

   private:
    auto get(std::string_view path, const query::QueryParams& params) const -> Result<std::string>;
    auto get_once(const std::string& url) const -> Result<std::string>;

    config::Config config_;
};

}  // namespace wsarrow::transport
