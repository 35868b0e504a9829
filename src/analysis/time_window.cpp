#include "time_window.hpp"

#include <limits>

TimeWindow::TimeWindow(std::optional<int64_t> start_s,
                       std::optional<int64_t> duration_s)
    : start_s_(start_s), duration_s_(duration_s) {}

std::optional<int64_t> TimeWindow::end() const {
  if (!start_s_ || !duration_s_)
    return std::nullopt;

  // Saturate instead of wrapping; an end past the representable range means
  // the window never closes.
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if (*duration_s_ > 0 && *start_s_ > kMax - *duration_s_)
    return kMax;
  if (*duration_s_ < 0 && *start_s_ < kMin - *duration_s_)
    return kMin;
  return *start_s_ + *duration_s_;
}

bool TimeWindow::in_window(int64_t timestamp_s) const {
  if (!start_s_)
    return true;
  if (timestamp_s < *start_s_)
    return false;
  if (!duration_s_)
    return true;
  // Compare the offset from start rather than computing start + duration.
  // An offset above INT64_MAX is longer than any duration.
  if (*start_s_ < 0 &&
      timestamp_s > std::numeric_limits<int64_t>::max() + *start_s_)
    return false;
  return timestamp_s - *start_s_ < *duration_s_;
}

bool TimeWindow::in_window(const LogEntry &entry) const {
  return in_window(entry.accept_timestamp_s);
}
