#include "analysis_engine.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "utils/scoped_timer.hpp"

#include <chrono>
#include <optional>
#include <utility>

namespace {

struct PendingCommand {
  std::string name;
  std::unique_ptr<IAggregator> aggregator;
};

LogSourceOptions source_options(const Config::AnalysisConfig &cfg) {
  LogSourceOptions options;
  options.max_failure_samples = cfg.max_failure_samples;
  options.max_line_bytes = cfg.max_line_bytes;
  options.assume_time_ordered = cfg.assume_time_ordered;
  return options;
}

std::unique_ptr<ILogReader> open_or_throw(const ReaderFactory &open_reader) {
  std::unique_ptr<ILogReader> reader = open_reader();
  if (!reader)
    throw ResourceError("log input could not be opened");
  return reader;
}

} // namespace

AnalysisEngine::AnalysisEngine(const FilterRegistry &filters,
                               const CommandRegistry &commands,
                               const Config::AppConfig &cfg,
                               MetricsRegistry *metrics)
    : filter_registry_(filters), command_registry_(commands), app_config_(cfg),
      metrics_(metrics) {}

AnalysisResult AnalysisEngine::run(const AnalysisRequest &request) const {
  return run(request, [&request]() -> std::unique_ptr<ILogReader> {
    return std::make_unique<FileLogReader>(request.log_path);
  });
}

void AnalysisEngine::validate(const AnalysisRequest &request) const {
  std::vector<std::string> errors;
  if (!Config::validate_analysis_config(app_config_.analysis, errors))
    throw ConfigurationError("invalid analysis settings: " + errors.front());

  if (request.commands.empty())
    throw ConfigurationError("no command requested");

  for (const auto &name : request.commands)
    if (!command_registry_.contains(name)) {
      LOG(LogLevel::ERROR, LogComponent::ENGINE,
          "Rejecting request, unknown command: " << name);
      throw ConfigurationError("unknown command: " + name);
    }

  if (request.duration_s) {
    if (!request.start_s)
      throw ConfigurationError("a time window duration needs a start");
    if (*request.duration_s < 0)
      throw ConfigurationError("time window duration must not be negative");
  }
}

AnalysisResult AnalysisEngine::run(const AnalysisRequest &request,
                                   const ReaderFactory &open_reader) const {
  // Everything that can be rejected is rejected before the input is touched
  validate(request);

  const Config::AnalysisConfig &cfg = app_config_.analysis;
  const TimeWindow window(request.start_s, request.duration_s);

  FilterChain chain(filter_registry_);
  for (const auto &activation : request.filters)
    chain.activate(activation);

  std::vector<PendingCommand> pending;
  pending.reserve(request.commands.size());
  for (const auto &name : request.commands)
    pending.push_back({name, command_registry_.create(name, cfg)});

  auto scan_start = std::chrono::steady_clock::now();
  std::optional<ScopedTimer> scan_timer;
  if (metrics_)
    scan_timer.emplace(metrics_->create_histogram(
        "haproxy_analyzer_scan_duration_seconds",
        "Time spent reading and aggregating the input",
        {0.01, 0.1, 0.5, 1, 5, 30, 120}));

  // Shared traversal: every single-pass aggregator sees each record once
  std::unique_ptr<ILogReader> reader = open_or_throw(open_reader);
  LogSource source(*reader, window, chain, source_options(cfg));
  while (auto entry = source.next())
    for (auto &command : pending)
      if (command.aggregator->passes() == 1)
        command.aggregator->consume(*entry);

  AnalysisResult result;
  result.summary = source.summary();

  for (auto &command : pending) {
    unsigned passes = command.aggregator->passes();
    if (passes == 1)
      continue;

    LOG(LogLevel::DEBUG, LogComponent::ENGINE,
        "Command " << command.name << " needs " << passes << " passes");
    for (unsigned pass = 0; pass < passes; ++pass) {
      command.aggregator->begin_pass(pass);
      std::unique_ptr<ILogReader> pass_reader = open_or_throw(open_reader);
      LogSource pass_source(*pass_reader, window, chain, source_options(cfg));
      while (auto entry = pass_source.next())
        command.aggregator->consume(*entry);
    }
  }

  scan_timer.reset();

  result.reports.reserve(pending.size());
  for (auto &command : pending) {
    Report report;
    report.command = command.name;
    report.value = command.aggregator->finish(result.summary);
    report.records_considered = result.summary.valid_count;
    report.malformed_count = result.summary.malformed_count;
    report.window = window;
    result.reports.push_back(std::move(report));
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - scan_start);
  LOG(LogLevel::INFO, LogComponent::ENGINE,
      "Scanned " << result.summary.lines_read << " lines in "
                 << elapsed.count() << " ms: " << result.summary.valid_count
                 << " valid, " << result.summary.filtered_out_count
                 << " filtered, " << result.summary.malformed_count
                 << " malformed");

  if (metrics_)
    record_metrics(result);
  return result;
}

void AnalysisEngine::record_metrics(const AnalysisResult &result) const {
  const ScanSummary &summary = result.summary;

  auto &lines = metrics_->create_counter_family(
      "haproxy_analyzer_lines_total", "Input lines by outcome");
  lines.Add({{"result", "valid"}}).Increment(summary.valid_count);
  lines.Add({{"result", "filtered"}}).Increment(summary.filtered_out_count);
  lines.Add({{"result", "malformed"}}).Increment(summary.malformed_count);
  lines.Add({{"result", "blank"}}).Increment(summary.blank_lines);

  auto &failures = metrics_->create_counter_family(
      "haproxy_analyzer_parse_failures_total", "Parse failures by class");
  failures.Add({{"class", "structural"}})
      .Increment(summary.structural_failures);
  failures.Add({{"class", "value"}}).Increment(summary.value_failures);

  metrics_
      ->create_counter("haproxy_analyzer_reports_total",
                       "Reports produced")
      .Increment(result.reports.size());
}
