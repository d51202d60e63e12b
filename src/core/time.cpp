#include <wsarrow/core/time.hpp>

#include <fmt/core.h>

#include <chrono>

namespace wsarrow {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

/// Read exactly `width` ASCII digits starting at `pos`.
auto read_digits(std::string_view text, std::size_t pos, std::size_t width) -> std::optional<int> {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        const char ch = text[i];
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

auto parse_ymd(std::string_view text) -> std::optional<std::chrono::year_month_day> {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto y = read_digits(text, 0, 4);
    auto m = read_digits(text, 5, 2);
    auto d = read_digits(text, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{*y},
                                    std::chrono::month{static_cast<unsigned>(*m)},
                                    std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

}  // namespace

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10) {
        return std::nullopt;
    }
    auto ymd = parse_ymd(text);
    if (!ymd) {
        return std::nullopt;
    }
    auto days = std::chrono::sys_days{*ymd}.time_since_epoch().count();
    return Date{static_cast<std::int32_t>(days)};
}

auto parse_datetime(std::string_view text) -> std::optional<Timestamp> {
    if (text.size() != 19 || (text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    auto date = parse_date(text.substr(0, 10));
    auto hh = read_digits(text, 11, 2);
    auto mm = read_digits(text, 14, 2);
    auto ss = read_digits(text, 17, 2);
    if (!date || !hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59) {
        return std::nullopt;
    }
    return Timestamp{static_cast<std::int64_t>(date->days) * kSecondsPerDay +
                     static_cast<std::int64_t>(*hh) * 3600 + static_cast<std::int64_t>(*mm) * 60 +
                     *ss};
}

auto is_zero_date(std::string_view text) noexcept -> bool {
    return text == "0000-00-00" || text == "0000-00-00 00:00:00";
}

auto to_timestamp(Date date) noexcept -> Timestamp {
    return Timestamp{static_cast<std::int64_t>(date.days) * kSecondsPerDay};
}

auto format_date(Date date) -> std::string {
    std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{date.days}}};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_datetime(Timestamp ts) -> std::string {
    auto days = ts.seconds / kSecondsPerDay;
    auto rem = ts.seconds % kSecondsPerDay;
    if (rem < 0) {
        rem += kSecondsPerDay;
        --days;
    }
    return fmt::format("{} {:02}:{:02}:{:02}", format_date(Date{static_cast<std::int32_t>(days)}),
                       rem / 3600, (rem / 60) % 60, rem % 60);
}

}  // namespace wsarrow
