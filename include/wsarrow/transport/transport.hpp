#pragma once

#include <wsarrow/core/error.hpp>
#include <wsarrow/query/query.hpp>
#include <wsarrow/record/parser.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsarrow::transport {

inline constexpr std::size_t kDefaultPageSize = 1000;

/// Paging position: records consumed so far within the query's limit window.
struct PageToken {
    std::size_t consumed = 0;
    std::size_t page_size = kDefaultPageSize;

    auto operator==(const PageToken&) const -> bool = default;
};

struct Page {
    std::string bytes;
    /// Records asked for; fewer in the reply means the listing is exhausted.
    std::size_t requested = 0;
    /// Token of the following page, or nullopt once the limit window is used up.
    std::optional<PageToken> next;
};

/// Limit window the page at `token` covers; nullopt when there is none left.
[[nodiscard]] auto page_request(const query::QueryDescriptor& descriptor, PageToken token)
    -> std::optional<query::Limit>;

/// Token following `token`, or nullopt when the limit window ends with it.
[[nodiscard]] auto next_token(const query::QueryDescriptor& descriptor, PageToken token)
    -> std::optional<PageToken>;

/// Access to the remote service.
///
/// `fetch_page` may be called from several threads at once when pages are
/// prefetched; the other calls are made from the run's thread only.
class Transport {
   public:
    virtual ~Transport() = default;

    /// Raw schema synopsis of `resource`.
    [[nodiscard]] virtual auto fetch_schema(std::string_view resource) -> Result<std::string> = 0;

    [[nodiscard]] virtual auto fetch_page(std::string_view resource,
                                          const query::QueryDescriptor& descriptor,
                                          PageToken token) -> Result<Page> = 0;

    [[nodiscard]] virtual auto list_resources() -> Result<std::vector<std::string>> = 0;

    /// Format of the page payloads this transport returns.
    [[nodiscard]] virtual auto wire_format() const noexcept -> record::WireFormat {
        return record::WireFormat::Xml;
    }
};

}  // namespace wsarrow::transport
