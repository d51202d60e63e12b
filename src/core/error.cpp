#include <wsarrow/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace wsarrow {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Schema:
            return "schema";
        case ErrorKind::Query:
            return "query";
        case ErrorKind::Parse:
            return "parse";
        case ErrorKind::Coercion:
            return "coercion";
        case ErrorKind::Write:
            return "write";
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Config:
            return "config";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

auto Error::format() const -> std::string {
    std::string context;
    const auto add = [&context](std::string part) {
        if (!context.empty()) {
            context.push_back(' ');
        }
        context.append(part);
    };
    if (!resource.empty()) {
        add(fmt::format("resource={}", resource));
    }
    if (!field.empty()) {
        add(fmt::format("field={}", field));
    }
    if (value.has_value()) {
        add(fmt::format("value=\"{}\"", *value));
    }
    if (page.has_value()) {
        add(fmt::format("page={}", *page));
    }
    if (offset.has_value()) {
        add(fmt::format("offset={}", *offset));
    }
    if (context.empty()) {
        return fmt::format("{} error: {}", to_string(kind), message);
    }
    return fmt::format("{} error [{}]: {}", to_string(kind), context, message);
}

auto Error::with_resource(std::string name) && -> Error {
    if (resource.empty()) {
        resource = std::move(name);
    }
    return std::move(*this);
}

auto Error::with_page(std::size_t index) && -> Error {
    page = index;
    return std::move(*this);
}

auto schema_error(std::string message, std::string field) -> Error {
    return Error{.kind = ErrorKind::Schema, .message = std::move(message), .field = std::move(field)};
}

auto query_error(std::string message, std::string field) -> Error {
    return Error{.kind = ErrorKind::Query, .message = std::move(message), .field = std::move(field)};
}

auto parse_error(std::string message, std::size_t offset) -> Error {
    return Error{.kind = ErrorKind::Parse, .message = std::move(message), .offset = offset};
}

auto coercion_error(std::string message, std::string field, std::string value) -> Error {
    return Error{.kind = ErrorKind::Coercion,
                 .message = std::move(message),
                 .field = std::move(field),
                 .value = std::move(value)};
}

auto write_error(std::string message) -> Error {
    return Error{.kind = ErrorKind::Write, .message = std::move(message)};
}

auto transport_error(std::string message, bool retryable) -> Error {
    return Error{
        .kind = ErrorKind::Transport, .message = std::move(message), .retryable = retryable};
}

auto config_error(std::string message, std::string key) -> Error {
    return Error{.kind = ErrorKind::Config, .message = std::move(message), .field = std::move(key)};
}

auto internal_error(std::string message) -> Error {
    return Error{.kind = ErrorKind::Internal, .message = std::move(message)};
}

}  // namespace wsarrow
