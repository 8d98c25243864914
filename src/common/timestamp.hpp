#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cvault {

// Generation timestamp tokens: "YYYYMMDD_HHMMSS" in UTC.  Lexicographic
// order of tokens equals chronological order.

static constexpr std::size_t kTimestampTokenSize = 15;

[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Returns std::nullopt unless `token` is exactly a well-formed timestamp token.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_timestamp(std::string_view token);

[[nodiscard]] bool is_timestamp_token(std::string_view token);

} // namespace cvault
