#ifndef LOG_SOURCE_HPP
#define LOG_SOURCE_HPP

#include "analysis/filters.hpp"
#include "analysis/time_window.hpp"
#include "core/log_entry.hpp"
#include "io/log_readers/base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ScanSummary {
  uint64_t lines_read = 0;
  uint64_t blank_lines = 0;
  uint64_t valid_count = 0;
  uint64_t filtered_out_count = 0;
  uint64_t malformed_count = 0;
  uint64_t structural_failures = 0;
  uint64_t value_failures = 0;
  bool stopped_early = false;

  // First few failures, for diagnostics only
  std::vector<ParseFailure> failure_samples;
};

// Forward-only sequence of records that survived parsing, the time window
// and the filter chain. Not restartable; reopen the input to scan again.
class IRecordSequence {
public:
  virtual ~IRecordSequence() = default;

  virtual std::optional<LogEntry> next() = 0;

  // Counters for everything consumed so far
  virtual const ScanSummary &summary() const = 0;
};

struct LogSourceOptions {
  size_t max_failure_samples = 20;
  size_t max_line_bytes = 65536;
  bool assume_time_ordered = false;
};

class LogSource : public IRecordSequence {
public:
  LogSource(ILogReader &reader, const TimeWindow &window,
            const FilterChain &filters, LogSourceOptions options = {});

  std::optional<LogEntry> next() override;
  const ScanSummary &summary() const override { return summary_; }

private:
  void record_failure(ParseFailure failure);
  // True when the scan may stop because every later line is past the window
  bool past_window_end(const LogEntry &entry);

  ILogReader &reader_;
  const TimeWindow &window_;
  const FilterChain &filters_;
  LogSourceOptions options_;

  ScanSummary summary_;
  std::optional<int64_t> last_timestamp_s_;
  bool out_of_order_seen_ = false;
  bool exhausted_ = false;
  std::string line_;
};

#endif // LOG_SOURCE_HPP
