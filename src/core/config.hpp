#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Analysis Settings
constexpr const char *AN_SLOW_REQUEST_THRESHOLD_MS =
    "slow_request_threshold_ms";
constexpr const char *AN_TOP_N = "top_n";
constexpr const char *AN_MAX_FLAGGED_RECORDS = "max_flagged_records";
constexpr const char *AN_MAX_FAILURE_SAMPLES = "max_failure_samples";
constexpr const char *AN_MAX_LINE_BYTES = "max_line_bytes";
constexpr const char *AN_ASSUME_TIME_ORDERED = "assume_time_ordered";

// Output Settings
constexpr const char *OUT_FORMAT = "format";

// Metrics Settings
constexpr const char *METRICS_ENABLED = "enabled";
constexpr const char *METRICS_TEXTFILE_PATH = "textfile_path";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct AnalysisConfig {
  int64_t slow_request_threshold_ms = 1000;
  size_t top_n = 10;
  size_t max_flagged_records = 1000;
  size_t max_failure_samples = 20;
  size_t max_line_bytes = 65536;

  // Lets the scan stop at the first record past the window end as long as
  // no out-of-order timestamp has been seen. Off by default.
  bool assume_time_ordered = false;
};

struct OutputConfig {
  std::string format = "text";
};

struct MetricsConfig {
  bool enabled = false;
  std::string textfile_path;
};

struct AppConfig {
  AnalysisConfig analysis;
  OutputConfig output;
  MetricsConfig metrics;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_analysis_config(const AnalysisConfig &config,
                              std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

  const std::vector<std::string> &last_errors() const { return last_errors_; }

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  std::vector<std::string> last_errors_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
