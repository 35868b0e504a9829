#include "commands.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using KeyFn = std::function<std::optional<std::string>(const LogEntry &)>;
using TimerFn = std::function<std::optional<int64_t>(const LogEntry &)>;

class CountingAggregator : public IAggregator {
public:
  explicit CountingAggregator(std::function<bool(const LogEntry &)> predicate)
      : predicate_(std::move(predicate)) {}

  void consume(const LogEntry &entry) override {
    if (predicate_(entry))
      count_++;
  }
  ReportValue finish(const ScanSummary &) override { return count_; }

private:
  std::function<bool(const LogEntry &)> predicate_;
  uint64_t count_ = 0;
};

// Reports the scan's own malformed counter; records are irrelevant
class InvalidLinesAggregator : public IAggregator {
public:
  void consume(const LogEntry &) override {}
  ReportValue finish(const ScanSummary &summary) override {
    return summary.malformed_count;
  }
};

// Counts records per key. Records whose key is absent are skipped. With a
// limit the result is the busiest `limit` keys, ties broken by key.
class GroupingAggregator : public IAggregator {
public:
  GroupingAggregator(KeyFn key, std::optional<size_t> limit = std::nullopt)
      : key_(std::move(key)), limit_(limit) {}

  void consume(const LogEntry &entry) override {
    if (auto key = key_(entry))
      counts_[*key]++;
  }

  ReportValue finish(const ScanSummary &) override {
    CategoryCounts result(counts_.begin(), counts_.end());
    if (!limit_)
      return result;

    // map order already sorts keys, so a stable sort on count keeps ties
    // in ascending key order
    std::stable_sort(
        result.begin(), result.end(),
        [](const auto &a, const auto &b) { return a.second > b.second; });
    if (result.size() > *limit_)
      result.resize(*limit_);
    return result;
  }

private:
  KeyFn key_;
  std::optional<size_t> limit_;
  std::map<std::string, uint64_t> counts_;
};

class AverageAggregator : public IAggregator {
public:
  explicit AverageAggregator(TimerFn timer) : timer_(std::move(timer)) {}

  void consume(const LogEntry &entry) override {
    if (auto value = timer_(entry)) {
      sum_ += static_cast<double>(*value);
      samples_++;
    }
  }

  ReportValue finish(const ScanSummary &) override {
    if (samples_ == 0)
      return 0.0;
    return sum_ / static_cast<double>(samples_);
  }

private:
  TimerFn timer_;
  double sum_ = 0.0;
  uint64_t samples_ = 0;
};

class TotalBytesAggregator : public IAggregator {
public:
  void consume(const LogEntry &entry) override { total_ += entry.bytes_read; }
  ReportValue finish(const ScanSummary &) override { return total_; }

private:
  uint64_t total_ = 0;
};

class SlowRequestsAggregator : public IAggregator {
public:
  SlowRequestsAggregator(int64_t threshold_ms, size_t max_records)
      : threshold_ms_(threshold_ms), max_records_(max_records) {}

  void consume(const LogEntry &entry) override {
    if (flagged_.size() >= max_records_)
      return;
    if (entry.timers.total_ms && *entry.timers.total_ms > threshold_ms_)
      flagged_.push_back(entry);
  }

  ReportValue finish(const ScanSummary &) override {
    if (flagged_.size() == max_records_)
      LOG(LogLevel::INFO, LogComponent::COMMANDS,
          "slow_requests stopped collecting at " << max_records_
                                                 << " records");
    return std::move(flagged_);
  }

private:
  int64_t threshold_ms_;
  size_t max_records_;
  std::vector<LogEntry> flagged_;
};

std::optional<std::string> request_method(const LogEntry &e) {
  if (!e.http_request)
    return std::nullopt;
  return e.http_request->method;
}

std::optional<std::string> request_path(const LogEntry &e) {
  if (!e.http_request)
    return std::nullopt;
  return e.http_request->path;
}

std::optional<std::string> status_code(const LogEntry &e) {
  if (!e.http_status_code)
    return std::nullopt;
  return std::to_string(*e.http_status_code);
}

std::optional<std::string> status_class(const LogEntry &e) {
  if (!e.http_status_code)
    return std::nullopt;
  return std::to_string(*e.http_status_code / 100) + "xx";
}

// 2013-12-11T13:15:16 truncated to the hour or the minute
KeyFn accept_time_prefix(size_t length) {
  return [length](const LogEntry &e) -> std::optional<std::string> {
    return Utils::format_epoch_seconds(e.accept_timestamp_s).substr(0, length);
  };
}

AggregatorFactory grouping(KeyFn key) {
  return [key](const Config::AnalysisConfig &) {
    return std::make_unique<GroupingAggregator>(key);
  };
}

AggregatorFactory top_n(KeyFn key) {
  return [key](const Config::AnalysisConfig &config) {
    return std::make_unique<GroupingAggregator>(key, config.top_n);
  };
}

AggregatorFactory average(TimerFn timer) {
  return [timer](const Config::AnalysisConfig &) {
    return std::make_unique<AverageAggregator>(timer);
  };
}

} // namespace

void CommandRegistry::register_command(const std::string &name,
                                       const std::string &description,
                                       AggregatorFactory factory) {
  if (!commands_.emplace(name, Entry{description, std::move(factory)}).second)
    throw std::invalid_argument("command already registered: " + name);
}

bool CommandRegistry::contains(const std::string &name) const {
  return commands_.count(name) != 0;
}

std::unique_ptr<IAggregator>
CommandRegistry::create(const std::string &name,
                        const Config::AnalysisConfig &config) const {
  auto it = commands_.find(name);
  if (it == commands_.end()) {
    LOG(LogLevel::ERROR, LogComponent::COMMANDS, "Unknown command: " << name);
    throw ConfigurationError("unknown command: " + name);
  }
  return it->second.factory(config);
}

std::vector<CommandInfo> CommandRegistry::list() const {
  std::vector<CommandInfo> infos;
  infos.reserve(commands_.size());
  for (const auto &[name, entry] : commands_)
    infos.push_back(CommandInfo{name, entry.description});
  return infos;
}

Report CommandRegistry::run(const std::string &name, IRecordSequence &records,
                            const Config::AnalysisConfig &config) const {
  std::unique_ptr<IAggregator> aggregator = create(name, config);
  if (aggregator->passes() != 1)
    throw std::logic_error("command '" + name +
                           "' needs a reopenable input; run it through "
                           "AnalysisEngine");

  while (auto entry = records.next())
    aggregator->consume(*entry);

  const ScanSummary &summary = records.summary();
  Report report;
  report.command = name;
  report.value = aggregator->finish(summary);
  report.records_considered = summary.valid_count;
  report.malformed_count = summary.malformed_count;
  return report;
}

void register_builtin_commands(CommandRegistry &registry) {
  registry.register_command(
      "counter", "Number of valid requests",
      [](const Config::AnalysisConfig &) {
        return std::make_unique<CountingAggregator>(
            [](const LogEntry &) { return true; });
      });

  registry.register_command("counter_invalid",
                            "Number of lines that could not be parsed",
                            [](const Config::AnalysisConfig &) {
                              return std::make_unique<InvalidLinesAggregator>();
                            });

  registry.register_command("http_methods", "Requests per HTTP method",
                            grouping(request_method));
  registry.register_command(
      "ip_counter", "Requests per client IP",
      grouping([](const LogEntry &e) -> std::optional<std::string> {
        return e.client_ip;
      }));
  registry.register_command(
      "top_ips", "Client IPs with the most requests",
      top_n([](const LogEntry &e) -> std::optional<std::string> {
        return e.client_ip;
      }));
  registry.register_command("status_codes_counter", "Requests per status code",
                            grouping(status_code));
  registry.register_command("status_code_classes",
                            "Requests per status class (2xx, 5xx...)",
                            grouping(status_class));
  registry.register_command("request_path_counter", "Requests per path",
                            grouping(request_path));
  registry.register_command("top_request_paths",
                            "Paths with the most requests", top_n(request_path));

  registry.register_command(
      "slow_requests", "Requests slower than the configured threshold",
      [](const Config::AnalysisConfig &config) {
        return std::make_unique<SlowRequestsAggregator>(
            config.slow_request_threshold_ms, config.max_flagged_records);
      });
  registry.register_command(
      "counter_slow_requests",
      "Number of requests slower than the configured threshold",
      [](const Config::AnalysisConfig &config) {
        int64_t threshold = config.slow_request_threshold_ms;
        return std::make_unique<CountingAggregator>(
            [threshold](const LogEntry &e) {
              return e.timers.total_ms && *e.timers.total_ms > threshold;
            });
      });

  registry.register_command(
      "average_response_time", "Mean server response time (Tr) in ms",
      average([](const LogEntry &e) { return e.timers.response_ms; }));
  registry.register_command(
      "average_waiting_time", "Mean time spent in queues (Tw) in ms",
      average([](const LogEntry &e) { return e.timers.queue_ms; }));
  registry.register_command(
      "average_total_time", "Mean total session time (Tt) in ms",
      average([](const LogEntry &e) { return e.timers.total_ms; }));

  registry.register_command("total_bytes_read",
                            "Bytes sent to clients across all requests",
                            [](const Config::AnalysisConfig &) {
                              return std::make_unique<TotalBytesAggregator>();
                            });

  registry.register_command(
      "server_load", "Requests per backend/server",
      grouping([](const LogEntry &e) -> std::optional<std::string> {
        return e.backend + "/" + e.server;
      }));
  registry.register_command(
      "connection_type", "Requests over https versus http",
      grouping([](const LogEntry &e) -> std::optional<std::string> {
        return std::string(e.is_https() ? "https" : "http");
      }));
  registry.register_command("requests_per_hour", "Requests per hour (UTC)",
                            grouping(accept_time_prefix(13)));
  registry.register_command("requests_per_minute", "Requests per minute (UTC)",
                            grouping(accept_time_prefix(16)));
  registry.register_command(
      "termination_states", "Requests per termination cause",
      grouping([](const LogEntry &e) -> std::optional<std::string> {
        return std::string(1, e.termination_cause());
      }));
}
