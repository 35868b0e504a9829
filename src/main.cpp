#include "analysis/analysis_engine.hpp"
#include "analysis/commands.hpp"
#include "analysis/filters.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitResource = 2;

struct CliOptions {
  std::string log_path;
  std::vector<std::string> commands;
  std::optional<std::string> start;
  std::optional<std::string> delta;
  std::vector<std::string> filters;
  std::optional<std::string> config_path;
  std::optional<std::string> format;
  bool list_commands = false;
  bool list_filters = false;
  bool help = false;
};

void print_usage(std::ostream &os) {
  os << "Usage: haproxy_log_analyzer -l FILE -c CMD[,CMD...] [options]\n"
        "\n"
        "  -l, --log FILE          HAProxy log file to analyze\n"
        "  -c, --command CMD       command(s) to run, comma separated\n"
        "  -s, --start START       window start: 11/Dec/2013[:HH[:MM[:SS]]]\n"
        "                          or 2013-12-11T13:00:00 (UTC)\n"
        "  -d, --delta DELTA       window length: <N>s, <N>m, <N>h or <N>d\n"
        "  -f, --filter SPEC       name[:param[,param]], '!' prefix negates;\n"
        "                          may be repeated\n"
        "      --config FILE       INI configuration file\n"
        "      --format FORMAT     text or json\n"
        "      --list-commands     list available commands\n"
        "      --list-filters      list available filters\n"
        "  -h, --help              show this help\n";
}

CliOptions parse_args(int argc, char *argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw ConfigurationError("missing value for " + arg);
      return argv[++i];
    };

    if (arg == "-l" || arg == "--log") {
      opts.log_path = value();
    } else if (arg == "-c" || arg == "--command") {
      for (auto &name : Utils::split_string(value(), ',')) {
        std::string trimmed = Utils::trim_copy(name);
        if (!trimmed.empty())
          opts.commands.push_back(trimmed);
      }
    } else if (arg == "-s" || arg == "--start") {
      opts.start = value();
    } else if (arg == "-d" || arg == "--delta") {
      opts.delta = value();
    } else if (arg == "-f" || arg == "--filter") {
      opts.filters.push_back(value());
    } else if (arg == "--config") {
      opts.config_path = value();
    } else if (arg == "--format") {
      opts.format = Utils::to_lower_copy(value());
    } else if (arg == "--list-commands") {
      opts.list_commands = true;
    } else if (arg == "--list-filters") {
      opts.list_filters = true;
    } else if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else {
      throw ConfigurationError("unknown argument: " + arg);
    }
  }
  return opts;
}

AnalysisRequest build_request(const CliOptions &opts) {
  if (opts.log_path.empty())
    throw ConfigurationError("a log file is required (-l)");
  if (opts.commands.empty())
    throw ConfigurationError("at least one command is required (-c)");

  AnalysisRequest request;
  request.log_path = opts.log_path;
  request.commands = opts.commands;

  if (opts.start) {
    request.start_s = Utils::parse_start_time(*opts.start);
    if (!request.start_s)
      throw ConfigurationError("invalid start time: " + *opts.start);
  }
  if (opts.delta) {
    request.duration_s = Utils::parse_duration(*opts.delta);
    if (!request.duration_s)
      throw ConfigurationError("invalid delta: " + *opts.delta);
  }

  for (const auto &spec : opts.filters)
    request.filters.push_back(parse_filter_spec(spec));
  return request;
}

void print_report_text(std::ostream &os, const Report &report) {
  os << "====== " << report.command << " ======\n";

  if (const auto *counts = std::get_if<CategoryCounts>(&report.value)) {
    for (const auto &[key, count] : *counts)
      os << key << ": " << count << "\n";
  } else if (const auto *total = std::get_if<uint64_t>(&report.value)) {
    os << *total << "\n";
  } else if (const auto *mean = std::get_if<double>(&report.value)) {
    os << *mean << "\n";
  } else if (const auto *records =
                 std::get_if<std::vector<LogEntry>>(&report.value)) {
    for (const auto &entry : *records)
      os << entry.raw_log_line << "\n";
  }
}

void print_result_text(std::ostream &os, const AnalysisResult &result) {
  for (const auto &report : result.reports)
    print_report_text(os, report);

  const ScanSummary &summary = result.summary;
  os << "------\n"
     << "lines read: " << summary.lines_read << ", valid: "
     << summary.valid_count << ", filtered out: " << summary.filtered_out_count
     << ", malformed: " << summary.malformed_count
     << ", blank: " << summary.blank_lines;
  if (summary.stopped_early)
    os << " (stopped at window end)";
  os << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  CliOptions opts;
  try {
    opts = parse_args(argc, argv);
  } catch (const ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
  }

  if (opts.help) {
    print_usage(std::cout);
    return kExitOk;
  }

  Config::ConfigManager config_manager;
  if (opts.config_path &&
      !config_manager.load_configuration(*opts.config_path)) {
    std::cerr << "Error: could not load configuration " << *opts.config_path
              << "\n";
    for (const auto &error : config_manager.last_errors())
      std::cerr << "  " << error << "\n";
    return kExitUsage;
  }
  std::shared_ptr<const Config::AppConfig> config = config_manager.get_config();
  LogManager::instance().configure(config->logging);

  FilterRegistry filter_registry;
  register_builtin_filters(filter_registry);
  CommandRegistry command_registry;
  register_builtin_commands(command_registry);

  if (opts.list_commands || opts.list_filters) {
    if (opts.list_commands)
      for (const auto &info : command_registry.list())
        std::cout << info.name << ": " << info.description << "\n";
    if (opts.list_filters)
      for (const auto &info : filter_registry.list())
        std::cout << info.name << ": " << info.description << "\n";
    return kExitOk;
  }

  std::string format = opts.format.value_or(config->output.format);
  if (format != "text" && format != "json") {
    std::cerr << "Error: unknown output format '" << format << "'\n";
    return kExitUsage;
  }

  std::unique_ptr<MetricsRegistry> metrics;
  if (config->metrics.enabled)
    metrics = std::make_unique<MetricsRegistry>();

  AnalysisResult result;
  try {
    AnalysisRequest request = build_request(opts);
    AnalysisEngine engine(filter_registry, command_registry, *config,
                          metrics.get());
    result = engine.run(request);
  } catch (const ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  } catch (const ResourceError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitResource;
  }

  if (format == "json")
    std::cout << JsonFormatter::format_result_to_json(result) << std::endl;
  else
    print_result_text(std::cout, result);

  if (metrics) {
    try {
      metrics->write_textfile(config->metrics.textfile_path);
    } catch (const ResourceError &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return kExitResource;
    }
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Finished " << opts.log_path << " with " << result.reports.size()
                  << " report(s)");
  return kExitOk;
}
