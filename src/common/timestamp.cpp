#include "common/timestamp.hpp"

#include <cctype>
#include <ctime>

#include <fmt/format.h>

namespace cvault {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return fmt::format("{:04}{:02}{:02}_{:02}{:02}{:02}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::optional<std::chrono::system_clock::time_point>
parse_timestamp(std::string_view token) {
    if (token.size() != kTimestampTokenSize || token[8] != '_') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (i == 8) continue;
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) {
            return std::nullopt;
        }
    }

    auto num = [&](std::size_t pos, std::size_t len) {
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            v = v * 10 + (token[i] - '0');
        }
        return v;
    };

    std::tm tm{};
    tm.tm_year = num(0, 4) - 1900;
    tm.tm_mon  = num(4, 2) - 1;
    tm.tm_mday = num(6, 2);
    tm.tm_hour = num(9, 2);
    tm.tm_min  = num(11, 2);
    tm.tm_sec  = num(13, 2);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    const std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

bool is_timestamp_token(std::string_view token) {
    return parse_timestamp(token).has_value();
}

} // namespace cvault
