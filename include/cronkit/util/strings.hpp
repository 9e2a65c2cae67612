#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace cronkit::strings {

[[nodiscard]] inline auto is_space(char c) noexcept -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view {
  auto start = std::ranges::find_if_not(s, is_space);
  if (start == s.end())
    return {};
  auto last = std::ranges::find_if_not(s.rbegin(), s.rend(), is_space);
  return {start, last.base()};
}

[[nodiscard]] inline auto iequals(std::string_view a,
                                  std::string_view b) noexcept -> bool {
  if (a.size() != b.size())
    return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] inline auto to_upper(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

[[nodiscard]] inline auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size() && !s.empty()) {
    return value;
  }
  return std::nullopt;
}

}  // namespace cronkit::strings
