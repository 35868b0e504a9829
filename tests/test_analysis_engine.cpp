#include "analysis/analysis_engine.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/metrics_registry.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "log_line_builder.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {

constexpr int64_t kDec11 = 1386720000; // 2013-12-11T00:00:00Z

// Reports first-pass records * 100 + second-pass records
class RecordsPerPass : public IAggregator {
public:
  void begin_pass(unsigned pass) override { pass_ = pass; }
  void consume(const LogEntry &) override {
    if (pass_ == 0)
      first_pass_records_++;
    else
      second_pass_records_++;
  }
  ReportValue finish(const ScanSummary &) override {
    return first_pass_records_ * 100 + second_pass_records_;
  }
  unsigned passes() const override { return 2; }

private:
  unsigned pass_ = 0;
  uint64_t first_pass_records_ = 0;
  uint64_t second_pass_records_ = 0;
};

class AnalysisEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    register_builtin_filters(filters);
    register_builtin_commands(commands);

    test_dir = std::filesystem::temp_directory_path() /
               (std::string("haproxy_analyzer_engine_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  std::string create_log(const std::vector<std::string> &lines) {
    std::string path = (test_dir / "haproxy.log").string();
    write_lines(path, lines);
    return path;
  }

  // Three GET-200 (the last one slow), one POST-500 and one malformed line
  std::string create_mixed_log() {
    return create_log({
        request_line("10.0.0.1", "11/Dec/2013:00:01:00.000", "GET", "200"),
        request_line("10.0.0.2", "11/Dec/2013:00:02:00.000", "GET", "200"),
        "this line is not an haproxy log line",
        request_line("10.0.0.5", "11/Dec/2013:00:03:00.000", "POST", "500"),
        request_line("10.0.0.5", "11/Dec/2013:00:04:00.000", "GET", "200",
                     "2500"),
    });
  }

  AnalysisRequest request_for(const std::string &path,
                              std::vector<std::string> command_names) {
    AnalysisRequest request;
    request.log_path = path;
    request.commands = std::move(command_names);
    return request;
  }

  FilterRegistry filters;
  CommandRegistry commands;
  Config::AppConfig config;
  std::filesystem::path test_dir;
};

const CategoryCounts &counts_of(const Report &report) {
  return std::get<CategoryCounts>(report.value);
}

} // namespace

TEST_F(AnalysisEngineTest, MixedFileScenario) {
  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result = engine.run(request_for(
      create_mixed_log(), {"counter", "http_methods", "status_code_classes"}));

  ASSERT_EQ(result.reports.size(), 3u);
  EXPECT_EQ(result.summary.valid_count, 4u);
  EXPECT_EQ(result.summary.malformed_count, 1u);
  EXPECT_EQ(result.summary.filtered_out_count, 0u);

  const Report &counter = result.reports[0];
  EXPECT_EQ(counter.command, "counter");
  EXPECT_EQ(std::get<uint64_t>(counter.value), 4u);
  EXPECT_EQ(counter.records_considered, 4u);
  EXPECT_EQ(counter.malformed_count, 1u);

  CategoryCounts methods = {{"GET", 3}, {"POST", 1}};
  EXPECT_EQ(counts_of(result.reports[1]), methods);

  CategoryCounts classes = {{"2xx", 3}, {"5xx", 1}};
  EXPECT_EQ(counts_of(result.reports[2]), classes);
}

TEST_F(AnalysisEngineTest, OneHourWindowScenario) {
  std::string path = create_log({
      request_line("10.0.0.1", "10/Dec/2013:23:59:59.999", "GET", "200"),
      request_line("10.0.0.1", "11/Dec/2013:00:00:00.000", "GET", "200"),
      request_line("10.0.0.1", "11/Dec/2013:00:59:59.000", "GET", "200"),
      request_line("10.0.0.1", "11/Dec/2013:01:00:00.000", "GET", "200"),
  });
  AnalysisRequest request = request_for(path, {"counter"});
  request.start_s = kDec11;
  request.duration_s = 3600;

  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result = engine.run(request);

  EXPECT_EQ(std::get<uint64_t>(result.reports[0].value), 2u);
  EXPECT_EQ(result.summary.filtered_out_count, 2u);
  EXPECT_EQ(result.reports[0].window, TimeWindow(kDec11, 3600));
}

TEST_F(AnalysisEngineTest, IpFilterScenario) {
  AnalysisRequest request =
      request_for(create_mixed_log(), {"status_code_classes"});
  request.filters.push_back(parse_filter_spec("ip:10.0.0.5"));

  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result = engine.run(request);

  CategoryCounts classes = {{"2xx", 1}, {"5xx", 1}};
  EXPECT_EQ(counts_of(result.reports[0]), classes);
  EXPECT_EQ(result.summary.valid_count, 2u);
  EXPECT_EQ(result.summary.filtered_out_count, 2u);
  EXPECT_EQ(result.summary.malformed_count, 1u);
}

TEST_F(AnalysisEngineTest, NegatedFilter) {
  AnalysisRequest request = request_for(create_mixed_log(), {"counter"});
  request.filters.push_back(parse_filter_spec("!ip:10.0.0.5"));

  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result = engine.run(request);
  EXPECT_EQ(std::get<uint64_t>(result.reports[0].value), 2u);
}

TEST_F(AnalysisEngineTest, FanOutMatchesSeparateRuns) {
  std::string path = create_mixed_log();
  AnalysisEngine engine(filters, commands, config);

  const std::vector<std::string> names = {"http_methods", "slow_requests",
                                          "average_total_time", "top_ips"};
  AnalysisResult together = engine.run(request_for(path, names));
  ASSERT_EQ(together.reports.size(), names.size());

  const auto &flagged =
      std::get<std::vector<LogEntry>>(together.reports[1].value);
  ASSERT_EQ(flagged.size(), 1u);
  EXPECT_EQ(flagged[0].original_line_number, 5u);

  for (size_t i = 0; i < names.size(); ++i) {
    AnalysisResult alone = engine.run(request_for(path, {names[i]}));
    ASSERT_EQ(alone.reports.size(), 1u);
    EXPECT_EQ(together.reports[i], alone.reports[0]) << names[i];
  }
}

TEST_F(AnalysisEngineTest, DuplicateCommandsYieldDuplicateReports) {
  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result =
      engine.run(request_for(create_mixed_log(), {"counter", "counter"}));
  ASSERT_EQ(result.reports.size(), 2u);
  EXPECT_EQ(result.reports[0], result.reports[1]);
}

TEST_F(AnalysisEngineTest, UnknownFilterFailsBeforeReading) {
  int opened = 0;
  ReaderFactory factory = [&opened]() -> std::unique_ptr<ILogReader> {
    opened++;
    return nullptr;
  };

  AnalysisRequest request = request_for("unused", {"counter"});
  request.filters.push_back(parse_filter_spec("no_such_filter:1"));

  AnalysisEngine engine(filters, commands, config);
  EXPECT_THROW(engine.run(request, factory), ConfigurationError);
  EXPECT_EQ(opened, 0);
}

TEST_F(AnalysisEngineTest, BadRequestsAreConfigurationErrors) {
  int opened = 0;
  ReaderFactory factory = [&opened]() -> std::unique_ptr<ILogReader> {
    opened++;
    return nullptr;
  };
  AnalysisEngine engine(filters, commands, config);

  EXPECT_THROW(engine.run(request_for("unused", {}), factory),
               ConfigurationError);
  EXPECT_THROW(engine.run(request_for("unused", {"counter", "nope"}), factory),
               ConfigurationError);

  AnalysisRequest bad_param = request_for("unused", {"counter"});
  bad_param.filters.push_back(parse_filter_spec("status_code:abc"));
  EXPECT_THROW(engine.run(bad_param, factory), ConfigurationError);

  AnalysisRequest no_start = request_for("unused", {"counter"});
  no_start.duration_s = 60;
  EXPECT_THROW(engine.run(no_start, factory), ConfigurationError);

  AnalysisRequest negative = request_for("unused", {"counter"});
  negative.start_s = kDec11;
  negative.duration_s = -1;
  EXPECT_THROW(engine.run(negative, factory), ConfigurationError);

  EXPECT_EQ(opened, 0);
}

TEST_F(AnalysisEngineTest, MissingFileIsResourceError) {
  AnalysisEngine engine(filters, commands, config);
  EXPECT_THROW(
      engine.run(request_for((test_dir / "missing.log").string(), {"counter"})),
      ResourceError);
}

TEST_F(AnalysisEngineTest, MultiPassCommandReopensInput) {
  commands.register_command("two_pass", "counts records on each pass",
                            [](const Config::AnalysisConfig &) {
                              return std::make_unique<RecordsPerPass>();
                            });

  std::string path = create_mixed_log();
  int opened = 0;
  ReaderFactory factory = [&opened, &path]() -> std::unique_ptr<ILogReader> {
    opened++;
    return std::make_unique<FileLogReader>(path);
  };

  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result =
      engine.run(request_for(path, {"counter", "two_pass"}), factory);

  // One shared scan plus one per pass
  EXPECT_EQ(opened, 3);
  EXPECT_EQ(std::get<uint64_t>(result.reports[0].value), 4u);
  EXPECT_EQ(std::get<uint64_t>(result.reports[1].value), 404u);
  EXPECT_EQ(result.reports[1].records_considered, 4u);
}

TEST_F(AnalysisEngineTest, StreamReaderThroughFactory) {
  std::istringstream input(
      request_line("10.0.0.1", "11/Dec/2013:00:01:00.000", "GET", "200") +
      "\n");
  ReaderFactory factory = [&input]() -> std::unique_ptr<ILogReader> {
    return std::make_unique<StreamLogReader>(input);
  };

  AnalysisEngine engine(filters, commands, config);
  AnalysisResult result = engine.run(request_for("", {"counter"}), factory);
  EXPECT_EQ(std::get<uint64_t>(result.reports[0].value), 1u);
}

TEST_F(AnalysisEngineTest, RecordsMetrics) {
  MetricsRegistry metrics;
  AnalysisEngine engine(filters, commands, config, &metrics);
  engine.run(request_for(create_mixed_log(), {"counter", "http_methods"}));

  std::string text = metrics.serialize_text();
  EXPECT_NE(text.find("haproxy_analyzer_lines_total{result=\"valid\"} 4"),
            std::string::npos);
  EXPECT_NE(text.find("haproxy_analyzer_lines_total{result=\"malformed\"} 1"),
            std::string::npos);
  EXPECT_NE(text.find("haproxy_analyzer_reports_total 2"), std::string::npos);
  EXPECT_NE(text.find("haproxy_analyzer_scan_duration_seconds_count 1"),
            std::string::npos);
}
