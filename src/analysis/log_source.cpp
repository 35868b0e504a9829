#include "log_source.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <variant>

namespace {

bool is_blank(const std::string &line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

} // namespace

LogSource::LogSource(ILogReader &reader, const TimeWindow &window,
                     const FilterChain &filters, LogSourceOptions options)
    : reader_(reader), window_(window), filters_(filters), options_(options) {}

std::optional<LogEntry> LogSource::next() {
  while (!exhausted_) {
    if (!reader_.read_line(line_, options_.max_line_bytes)) {
      exhausted_ = true;
      break;
    }
    summary_.lines_read++;
    uint64_t line_num = reader_.line_number();

    if (is_blank(line_)) {
      summary_.blank_lines++;
      continue;
    }

    if (line_.size() > options_.max_line_bytes) {
      line_.resize(options_.max_line_bytes);
      record_failure(ParseFailure{ParseFailureReason::LineTooLong, line_num,
                                  line_,
                                  "line exceeds " +
                                      std::to_string(options_.max_line_bytes) +
                                      " bytes"});
      continue;
    }

    ParseResult result = LogEntry::parse_from_string(std::move(line_), line_num);
    line_.clear();
    if (auto *failure = std::get_if<ParseFailure>(&result)) {
      record_failure(std::move(*failure));
      continue;
    }

    LogEntry &entry = std::get<LogEntry>(result);
    if (past_window_end(entry)) {
      // The stopping record is outside the window like any other
      summary_.filtered_out_count++;
      summary_.stopped_early = true;
      exhausted_ = true;
      LOG(LogLevel::DEBUG, LogComponent::ENGINE,
          "Stopping scan at line " << line_num << ", past the time window");
      break;
    }

    if (!window_.in_window(entry) || !filters_.matches(entry)) {
      summary_.filtered_out_count++;
      continue;
    }

    summary_.valid_count++;
    return std::move(entry);
  }
  return std::nullopt;
}

void LogSource::record_failure(ParseFailure failure) {
  summary_.malformed_count++;
  if (failure.is_structural())
    summary_.structural_failures++;
  else
    summary_.value_failures++;

  LOG(LogLevel::DEBUG, LogComponent::PARSER,
      "Skipping malformed line " << failure.line_number << ": "
                                 << failure.detail);

  if (summary_.failure_samples.size() < options_.max_failure_samples)
    summary_.failure_samples.push_back(std::move(failure));
}

bool LogSource::past_window_end(const LogEntry &entry) {
  int64_t ts = entry.accept_timestamp_s;
  if (last_timestamp_s_ && ts < *last_timestamp_s_)
    out_of_order_seen_ = true;
  last_timestamp_s_ = ts;

  if (!options_.assume_time_ordered || out_of_order_seen_)
    return false;
  auto window_end = window_.end();
  return window_end && ts >= *window_end;
}
