#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/analysis_engine.hpp"
#include "analysis/commands.hpp"
#include "analysis/log_source.hpp"
#include "core/log_entry.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json log_entry_to_json_object(const LogEntry &entry);
nlohmann::json parse_failure_to_json_object(const ParseFailure &failure);
nlohmann::json window_to_json_object(const TimeWindow &window);
nlohmann::json report_to_json_object(const Report &report);
nlohmann::json summary_to_json_object(const ScanSummary &summary);
nlohmann::json result_to_json_object(const AnalysisResult &result);

std::string format_result_to_json(const AnalysisResult &result,
                                  int indent = 2);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
