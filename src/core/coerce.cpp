#include <wsarrow/core/coerce.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cmath>
#include <utility>

namespace wsarrow {

namespace {

auto is_digit(char ch) noexcept -> bool {
    return ch >= '0' && ch <= '9';
}

auto to_lower(char ch) noexcept -> char {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (to_lower(lhs[i]) != to_lower(rhs[i])) {
            return false;
        }
    }
    return true;
}

auto trim(std::string_view text) noexcept -> std::string_view {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

/// Consume one or more digits starting at `pos`; returns the position after them.
auto skip_digits(std::string_view text, std::size_t pos) noexcept -> std::optional<std::size_t> {
    std::size_t end = pos;
    while (end < text.size() && is_digit(text[end])) {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return end;
}

struct Entity {
    std::string_view name;
    std::string_view replacement;
};

constexpr std::array kHtmlEntities = {
    Entity{"&amp;", "&"},   Entity{"&lt;", "<"},    Entity{"&gt;", ">"},
    Entity{"&quot;", "\""}, Entity{"&apos;", "'"},  Entity{"&#39;", "'"},
    Entity{"&nbsp;", "\xC2\xA0"},
};

auto mismatch(std::string_view text, ScalarKind kind, std::string_view field) -> Error {
    return coercion_error(fmt::format("cannot convert to {}", to_string(kind)), std::string(field),
                          std::string(text));
}

}  // namespace

auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        pos = 1;
    }
    auto end = skip_digits(text, pos);
    if (!end || *end != text.size()) {
        return std::nullopt;
    }
    // from_chars accepts '-' but not '+'.
    auto digits = text[0] == '+' ? text.substr(1) : text;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_decimal(std::string_view text) -> std::optional<double> {
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        pos = 1;
    }
    auto end = skip_digits(text, pos);
    if (!end) {
        return std::nullopt;
    }
    pos = *end;
    if (pos < text.size() && text[pos] == '.') {
        end = skip_digits(text, pos + 1);
        if (!end) {
            return std::nullopt;
        }
        pos = *end;
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            ++pos;
        }
        end = skip_digits(text, pos);
        if (!end) {
            return std::nullopt;
        }
        pos = *end;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    auto digits = text[0] == '+' ? text.substr(1) : text;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

auto parse_boolean(std::string_view text) -> std::optional<bool> {
    if (text == "1" || iequals(text, "true")) {
        return true;
    }
    if (text == "0" || iequals(text, "false")) {
        return false;
    }
    return std::nullopt;
}

auto unescape_html(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            bool replaced = false;
            for (const auto& entity : kHtmlEntities) {
                if (text.substr(i, entity.name.size()) == entity.name) {
                    out.append(entity.replacement);
                    i += entity.name.size();
                    replaced = true;
                    break;
                }
            }
            if (replaced) {
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

auto coerce_scalar(std::string_view text, ScalarKind kind, std::string_view field)
    -> Result<ScalarValue> {
    if (kind == ScalarKind::Text) {
        return ScalarValue{std::string(text)};
    }
    if (kind == ScalarKind::HtmlText) {
        return ScalarValue{unescape_html(text)};
    }

    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return ScalarValue{};
    }
    switch (kind) {
        case ScalarKind::Integer:
            if (auto value = parse_integer(trimmed)) {
                return ScalarValue{*value};
            }
            break;
        case ScalarKind::Decimal:
            if (auto value = parse_decimal(trimmed)) {
                return ScalarValue{*value};
            }
            break;
        case ScalarKind::Boolean:
            if (auto value = parse_boolean(trimmed)) {
                return ScalarValue{*value};
            }
            break;
        case ScalarKind::Date:
            if (is_zero_date(trimmed)) {
                return ScalarValue{};
            }
            if (auto value = parse_date(trimmed)) {
                return ScalarValue{*value};
            }
            break;
        case ScalarKind::DateTime:
            if (is_zero_date(trimmed)) {
                return ScalarValue{};
            }
            if (auto value = parse_datetime(trimmed)) {
                return ScalarValue{*value};
            }
            // A bare date means midnight.
            if (auto date = parse_date(trimmed)) {
                return ScalarValue{to_timestamp(*date)};
            }
            break;
        case ScalarKind::Text:
        case ScalarKind::HtmlText:
            break;
    }
    return std::unexpected(mismatch(text, kind, field));
}

}  // namespace wsarrow
