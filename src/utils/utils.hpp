#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);

// Accept date as written by HAProxy: 09/Dec/2013:12:59:46.633
// The zone-less value is read as UTC. Milliseconds are optional.
struct AcceptDate {
  int64_t epoch_seconds = 0;
  uint32_t milliseconds = 0;
};
std::optional<AcceptDate> parse_accept_date(std::string_view text);

// User supplied window start. Accepts 11/Dec/2013, 11/Dec/2013:13,
// 11/Dec/2013:13:15, 11/Dec/2013:13:15:16 and 2013-12-11T13:15:16.
std::optional<int64_t> parse_start_time(std::string_view text);

// User supplied window length: <N>s, <N>m, <N>h or <N>d. Returns seconds.
std::optional<int64_t> parse_duration(std::string_view text);

// 2013-12-11T00:59:59 (UTC)
std::string format_epoch_seconds(int64_t epoch_seconds);

struct CIDRBlock {
  uint32_t network_address = 0;
  uint32_t netmask = 0;

  bool contains(uint32_t ip) const;
};

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string);
std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str);
bool is_valid_ip_address(std::string_view ip_str);
// Canonical inet_ntop text of an IPv4 or IPv6 address, or nullopt when it
// is neither
std::optional<std::string> normalize_ip_address(std::string_view ip_str);

// Strict conversion: the whole view must be a number. Unlike a log field
// reader this never maps "-" or an empty string to zero.
template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_upper_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
