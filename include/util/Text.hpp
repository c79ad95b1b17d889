#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace procstat::util {

// Display width used for command lines
inline constexpr size_t kMaxCommandWidth = 80;

// Replace every byte outside 0x20..0x7E with '?', then trim surrounding spaces.
[[nodiscard]] std::string sanitize_printable(std::string_view text);

// Cut to max_width characters, ending in "..." when something was dropped.
[[nodiscard]] std::string truncate_display(std::string text, size_t max_width = kMaxCommandWidth);

[[nodiscard]] std::string_view trim(std::string_view sv);

[[nodiscard]] std::string ascii_lower(std::string_view sv);

} // namespace procstat::util
