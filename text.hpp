#ifndef LUFSCHECK_TEXT_HPP
#define LUFSCHECK_TEXT_HPP

#include <cassert>
#include <charconv>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace lufscheck {

template<typename T>
requires (std::is_integral_v<T> || std::is_floating_point_v<T>)
[[nodiscard]] std::expected<T, std::string> parse_number(std::string_view s)
{
  static_assert(!std::is_same_v<T, bool>, "parse_number<bool> is not supported");
  T v{};
  const char* b = s.data();
  const char* e = b + s.size();

  auto to_msg = [](std::errc ec) -> std::string {
    assert(ec != std::errc());
    if (ec == std::errc::invalid_argument) return "not a number";
    if (ec == std::errc::result_out_of_range) return "out of range";
    return "parse error";
  };

  std::from_chars_result r = [&]{
    if constexpr (std::is_floating_point_v<T>)
      return std::from_chars(b, e, v, std::chars_format::general);
    return std::from_chars(b, e, v);
  }();

  constexpr std::errc ok{};
  if (r.ec == ok) {
    if (r.ptr != e) return std::unexpected(std::string("trailing characters"));
    return v;
  }
  return std::unexpected(to_msg(r.ec));
}

[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept
{
  constexpr std::string_view ws = " \t\r\n";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Split on every occurrence of sep; empty fields are kept.
[[nodiscard]] inline std::vector<std::string_view>
split(std::string_view s, char sep)
{
  std::vector<std::string_view> fields;
  size_t start = 0;
  for (;;) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      fields.push_back(s.substr(start));
      return fields;
    }
    fields.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace lufscheck

#endif
