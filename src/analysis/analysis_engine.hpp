#ifndef ANALYSIS_ENGINE_HPP
#define ANALYSIS_ENGINE_HPP

#include "analysis/commands.hpp"
#include "analysis/filters.hpp"
#include "analysis/log_source.hpp"
#include "core/config.hpp"
#include "io/log_readers/base_log_reader.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class MetricsRegistry;

struct AnalysisRequest {
  std::string log_path;
  std::vector<std::string> commands;
  std::optional<int64_t> start_s;
  std::optional<int64_t> duration_s;
  std::vector<FilterActivation> filters;
};

struct AnalysisResult {
  // One report per requested command, in request order
  std::vector<Report> reports;
  ScanSummary summary;
};

// Opens a fresh traversal of the input. Called once for the shared scan and
// once more per extra pass of a multi-pass command.
using ReaderFactory = std::function<std::unique_ptr<ILogReader>()>;

class AnalysisEngine {
public:
  AnalysisEngine(const FilterRegistry &filters, const CommandRegistry &commands,
                 const Config::AppConfig &cfg,
                 MetricsRegistry *metrics = nullptr);

  // Reads request.log_path
  AnalysisResult run(const AnalysisRequest &request) const;
  AnalysisResult run(const AnalysisRequest &request,
                     const ReaderFactory &open_reader) const;

private:
  void validate(const AnalysisRequest &request) const;
  void record_metrics(const AnalysisResult &result) const;

  const FilterRegistry &filter_registry_;
  const CommandRegistry &command_registry_;
  const Config::AppConfig &app_config_;
  MetricsRegistry *metrics_;
};

#endif // ANALYSIS_ENGINE_HPP
