#include <wsarrow/transport/transport.hpp>

namespace wsarrow::transport {

auto page_request(const query::QueryDescriptor& descriptor, PageToken token)
    -> std::optional<query::Limit> {
    return query::page_window(descriptor.limit, token.page_size, token.consumed);
}

auto next_token(const query::QueryDescriptor& descriptor, PageToken token)
    -> std::optional<PageToken> {
    auto window = page_request(descriptor, token);
    if (!window) {
        return std::nullopt;
    }
    PageToken next{.consumed = token.consumed + window->count, .page_size = token.page_size};
    if (!page_request(descriptor, next)) {
        return std::nullopt;
    }
    return next;
}

}  // namespace wsarrow::transport
