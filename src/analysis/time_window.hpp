#ifndef TIME_WINDOW_HPP
#define TIME_WINDOW_HPP

#include "core/log_entry.hpp"

#include <cstdint>
#include <optional>

// Half-open accept-time interval [start, start + duration). Without a start
// every record is inside and the duration is ignored.
class TimeWindow {
public:
  TimeWindow() = default;
  TimeWindow(std::optional<int64_t> start_s, std::optional<int64_t> duration_s);

  bool in_window(const LogEntry &entry) const;
  bool in_window(int64_t timestamp_s) const;

  std::optional<int64_t> start() const { return start_s_; }
  std::optional<int64_t> duration() const { return duration_s_; }
  std::optional<int64_t> end() const;
  bool is_bounded() const { return end().has_value(); }

  bool operator==(const TimeWindow &other) const {
    return start_s_ == other.start_s_ && duration_s_ == other.duration_s_;
  }
  bool operator!=(const TimeWindow &other) const { return !(*this == other); }

private:
  std::optional<int64_t> start_s_;
  std::optional<int64_t> duration_s_;
};

#endif // TIME_WINDOW_HPP
