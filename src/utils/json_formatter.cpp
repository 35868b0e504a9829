#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <optional>
#include <variant>

namespace {

template <typename T> nlohmann::json optional_to_json(const std::optional<T> &v) {
  if (!v)
    return nullptr;
  return *v;
}

} // namespace

nlohmann::json JsonFormatter::log_entry_to_json_object(const LogEntry &entry) {
  nlohmann::json j;

  j["line_number"] = entry.original_line_number;
  j["accept_date"] = Utils::format_epoch_seconds(entry.accept_timestamp_s);
  j["client_ip"] = entry.client_ip;
  j["client_port"] = entry.client_port;
  j["frontend"] = entry.frontend;
  j["backend"] = entry.backend;
  j["server"] = entry.server;

  // Absent timers and status stay null, never zero
  j["timers"] = {{"tq", optional_to_json(entry.timers.request_ms)},
                 {"tw", optional_to_json(entry.timers.queue_ms)},
                 {"tc", optional_to_json(entry.timers.connect_ms)},
                 {"tr", optional_to_json(entry.timers.response_ms)},
                 {"tt", optional_to_json(entry.timers.total_ms)}};
  j["status_code"] = optional_to_json(entry.http_status_code);
  j["bytes_read"] = entry.bytes_read;
  j["termination_state"] = entry.termination_state;

  if (entry.http_request) {
    j["method"] = entry.http_request->method;
    j["path"] = entry.http_request->path;
    j["protocol"] = entry.http_request->protocol;
  } else {
    j["method"] = nullptr;
    j["path"] = nullptr;
    j["protocol"] = nullptr;
  }

  j["raw"] = entry.raw_log_line;
  return j;
}

nlohmann::json
JsonFormatter::parse_failure_to_json_object(const ParseFailure &failure) {
  return {{"line_number", failure.line_number},
          {"reason", parse_failure_reason_to_string(failure.reason)},
          {"structural", failure.is_structural()},
          {"detail", failure.detail}};
}

nlohmann::json JsonFormatter::window_to_json_object(const TimeWindow &window) {
  nlohmann::json j;
  j["start"] = window.start()
                   ? nlohmann::json(Utils::format_epoch_seconds(*window.start()))
                   : nlohmann::json(nullptr);
  j["duration_s"] = optional_to_json(window.duration());
  j["end"] = window.end()
                 ? nlohmann::json(Utils::format_epoch_seconds(*window.end()))
                 : nlohmann::json(nullptr);
  return j;
}

nlohmann::json JsonFormatter::report_to_json_object(const Report &report) {
  nlohmann::json j;
  j["command"] = report.command;
  j["records_considered"] = report.records_considered;
  j["malformed_count"] = report.malformed_count;
  j["window"] = window_to_json_object(report.window);

  // Category counts are an array to keep the command's ordering
  if (const auto *counts = std::get_if<CategoryCounts>(&report.value)) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto &[key, count] : *counts)
      rows.push_back({{"key", key}, {"count", count}});
    j["type"] = "counts";
    j["value"] = rows;
  } else if (const auto *total = std::get_if<uint64_t>(&report.value)) {
    j["type"] = "integer";
    j["value"] = *total;
  } else if (const auto *mean = std::get_if<double>(&report.value)) {
    j["type"] = "real";
    j["value"] = *mean;
  } else if (const auto *records =
                 std::get_if<std::vector<LogEntry>>(&report.value)) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto &entry : *records)
      rows.push_back(log_entry_to_json_object(entry));
    j["type"] = "records";
    j["value"] = rows;
  }
  return j;
}

nlohmann::json JsonFormatter::summary_to_json_object(const ScanSummary &summary) {
  nlohmann::json j;
  j["lines_read"] = summary.lines_read;
  j["blank_lines"] = summary.blank_lines;
  j["valid_count"] = summary.valid_count;
  j["filtered_out_count"] = summary.filtered_out_count;
  j["malformed_count"] = summary.malformed_count;
  j["structural_failures"] = summary.structural_failures;
  j["value_failures"] = summary.value_failures;
  j["stopped_early"] = summary.stopped_early;

  nlohmann::json samples = nlohmann::json::array();
  for (const auto &failure : summary.failure_samples)
    samples.push_back(parse_failure_to_json_object(failure));
  j["failure_samples"] = samples;
  return j;
}

nlohmann::json JsonFormatter::result_to_json_object(const AnalysisResult &result) {
  nlohmann::json reports = nlohmann::json::array();
  for (const auto &report : result.reports)
    reports.push_back(report_to_json_object(report));
  return {{"reports", reports},
          {"summary", summary_to_json_object(result.summary)}};
}

std::string JsonFormatter::format_result_to_json(const AnalysisResult &result,
                                                 int indent) {
  // Raw log lines are not guaranteed to be UTF-8
  return result_to_json_object(result).dump(
      indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
