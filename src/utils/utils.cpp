#include "utils.hpp"

#include <arpa/inet.h>

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

namespace {

std::optional<int> month_from_abbreviation(std::string_view abbreviation) {
  static constexpr std::string_view kMonths[] = {"Jan", "Feb", "Mar", "Apr",
                                                 "May", "Jun", "Jul", "Aug",
                                                 "Sep", "Oct", "Nov", "Dec"};
  for (int i = 0; i < 12; ++i)
    if (abbreviation == kMonths[i])
      return i;
  return std::nullopt;
}

// Converts a broken down UTC date to epoch seconds, rejecting values that
// timegm would silently normalise (31/Feb, 25:00, ...).
std::optional<int64_t> to_epoch_seconds(int year, int month0, int day,
                                        int hour, int minute, int second) {
  if (year < 1970 || month0 < 0 || month0 > 11 || day < 1 || day > 31 ||
      hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
      second > 59)
    return std::nullopt;

  std::tm t{};
  t.tm_year = year - 1900;
  t.tm_mon = month0;
  t.tm_mday = day;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = second;

  std::time_t epoch_seconds = timegm(&t);
  if (epoch_seconds == -1)
    return std::nullopt;

  // timegm rewrites the struct with the normalised date
  if (t.tm_mday != day || t.tm_mon != month0)
    return std::nullopt;

  return static_cast<int64_t>(epoch_seconds);
}

std::optional<int> fixed_digits(std::string_view text, std::size_t width) {
  if (text.size() != width)
    return std::nullopt;
  for (char c : text)
    if (c < '0' || c > '9')
      return std::nullopt;
  return string_to_number<int>(text);
}

// Parses "dd/Mon/yyyy" and leaves the remainder in `rest`.
bool parse_day_month_year(std::string_view text, int &day, int &month0,
                          int &year, std::string_view &rest) {
  size_t first_slash = text.find('/');
  if (first_slash == std::string_view::npos)
    return false;
  size_t second_slash = text.find('/', first_slash + 1);
  if (second_slash == std::string_view::npos)
    return false;

  auto day_opt = string_to_number<int>(text.substr(0, first_slash));
  auto month_opt = month_from_abbreviation(
      text.substr(first_slash + 1, second_slash - first_slash - 1));
  if (!day_opt || !month_opt)
    return false;

  std::string_view after_month = text.substr(second_slash + 1);
  size_t year_end = after_month.find(':');
  auto year_opt = fixed_digits(after_month.substr(0, year_end), 4);
  if (!year_opt)
    return false;

  day = *day_opt;
  month0 = *month_opt;
  year = *year_opt;
  rest = year_end == std::string_view::npos ? std::string_view{}
                                            : after_month.substr(year_end);
  return true;
}

} // namespace

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::optional<AcceptDate> parse_accept_date(std::string_view text) {
  // Expected format: 09/Dec/2013:12:59:46.633
  int day = 0, month0 = 0, year = 0;
  std::string_view rest;
  if (!parse_day_month_year(text, day, month0, year, rest))
    return std::nullopt;

  if (rest.size() < 9 || rest[0] != ':')
    return std::nullopt;
  rest.remove_prefix(1);

  std::string_view clock = rest.substr(0, 8);
  std::string_view fraction = rest.substr(8);
  if (clock[2] != ':' || clock[5] != ':')
    return std::nullopt;

  auto hour = fixed_digits(clock.substr(0, 2), 2);
  auto minute = fixed_digits(clock.substr(3, 2), 2);
  auto second = fixed_digits(clock.substr(6, 2), 2);
  if (!hour || !minute || !second)
    return std::nullopt;

  AcceptDate result;
  if (!fraction.empty()) {
    if (fraction[0] != '.')
      return std::nullopt;
    auto ms = fixed_digits(fraction.substr(1), 3);
    if (!ms)
      return std::nullopt;
    result.milliseconds = static_cast<uint32_t>(*ms);
  }

  auto epoch = to_epoch_seconds(year, month0, day, *hour, *minute, *second);
  if (!epoch)
    return std::nullopt;
  result.epoch_seconds = *epoch;
  return result;
}

std::optional<int64_t> parse_start_time(std::string_view text) {
  if (text.empty())
    return std::nullopt;

  // ISO form: 2013-12-11T13:15:16
  if (text.size() == 19 && text[4] == '-' && text[7] == '-' &&
      text[10] == 'T' && text[13] == ':' && text[16] == ':') {
    auto year = fixed_digits(text.substr(0, 4), 4);
    auto month = fixed_digits(text.substr(5, 2), 2);
    auto day = fixed_digits(text.substr(8, 2), 2);
    auto hour = fixed_digits(text.substr(11, 2), 2);
    auto minute = fixed_digits(text.substr(14, 2), 2);
    auto second = fixed_digits(text.substr(17, 2), 2);
    if (!year || !month || !day || !hour || !minute || !second)
      return std::nullopt;
    return to_epoch_seconds(*year, *month - 1, *day, *hour, *minute, *second);
  }

  // Log form with optional trailing :HH, :HH:MM or :HH:MM:SS
  int day = 0, month0 = 0, year = 0;
  std::string_view rest;
  if (!parse_day_month_year(text, day, month0, year, rest))
    return std::nullopt;

  int clock[3] = {0, 0, 0};
  int parts = 0;
  while (!rest.empty()) {
    if (rest[0] != ':' || parts == 3)
      return std::nullopt;
    rest.remove_prefix(1);
    auto value = fixed_digits(rest.substr(0, 2), 2);
    if (!value)
      return std::nullopt;
    clock[parts++] = *value;
    rest.remove_prefix(std::min<size_t>(2, rest.size()));
  }

  return to_epoch_seconds(year, month0, day, clock[0], clock[1], clock[2]);
}

std::optional<int64_t> parse_duration(std::string_view text) {
  if (text.size() < 2)
    return std::nullopt;

  int64_t multiplier = 0;
  switch (text.back()) {
  case 's':
    multiplier = 1;
    break;
  case 'm':
    multiplier = 60;
    break;
  case 'h':
    multiplier = 3600;
    break;
  case 'd':
    multiplier = 86400;
    break;
  default:
    return std::nullopt;
  }

  std::string_view digits = text.substr(0, text.size() - 1);
  if (digits.front() < '0' || digits.front() > '9')
    return std::nullopt;
  auto amount = string_to_number<int64_t>(digits);
  if (!amount || *amount > std::numeric_limits<int64_t>::max() / multiplier)
    return std::nullopt;
  return *amount * multiplier;
}

std::string format_epoch_seconds(int64_t epoch_seconds) {
  std::time_t as_time_t = static_cast<std::time_t>(epoch_seconds);
  std::tm t{};
  if (gmtime_r(&as_time_t, &t) == nullptr)
    return std::to_string(epoch_seconds);

  char buffer[32];
  size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &t);
  return std::string(buffer, written);
}

std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str) {
  std::vector<std::string_view> octets = split_string_view(ip_str, '.');
  if (octets.size() != 4)
    return std::nullopt;

  uint32_t ip_uint = 0;
  for (std::string_view octet : octets) {
    if (octet.empty() || octet.size() > 3)
      return std::nullopt;
    auto value = string_to_number<uint32_t>(octet);
    if (!value || *value > 255)
      return std::nullopt;
    ip_uint = (ip_uint << 8) | *value;
  }
  return ip_uint;
}

bool is_valid_ip_address(std::string_view ip_str) {
  return normalize_ip_address(ip_str).has_value();
}

std::optional<std::string> normalize_ip_address(std::string_view ip_str) {
  std::string address(ip_str);
  unsigned char buffer[sizeof(struct in6_addr)];
  char text[INET6_ADDRSTRLEN];

  int family = AF_INET;
  if (inet_pton(family, address.c_str(), buffer) != 1) {
    family = AF_INET6;
    if (inet_pton(family, address.c_str(), buffer) != 1)
      return std::nullopt;
  }
  if (inet_ntop(family, buffer, text, sizeof(text)) == nullptr)
    return std::nullopt;
  return std::string(text);
}

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string) {
  size_t slash_pos = cidr_string.find('/');
  if (slash_pos == std::string_view::npos) {
    auto ip = ip_string_to_uint32(cidr_string);
    if (!ip)
      return std::nullopt;
    return CIDRBlock{*ip, 0xFFFFFFFF};
  }

  auto ip = ip_string_to_uint32(cidr_string.substr(0, slash_pos));
  if (!ip)
    return std::nullopt;

  auto mask_len = string_to_number<int>(cidr_string.substr(slash_pos + 1));
  if (!mask_len || *mask_len < 0 || *mask_len > 32)
    return std::nullopt;

  uint32_t netmask = (*mask_len == 0) ? 0 : (0xFFFFFFFFu << (32 - *mask_len));

  return CIDRBlock{*ip & netmask, netmask};
}

bool CIDRBlock::contains(uint32_t ip) const {
  return (ip & netmask) == network_address;
}
} // namespace Utils
