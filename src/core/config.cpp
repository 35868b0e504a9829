#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

namespace {

const std::map<std::string, LogComponent> &key_to_component_map() {
  static const std::map<std::string, LogComponent> map = {
      {"core", LogComponent::CORE},
      {"config", LogComponent::CONFIG},
      {"io.reader", LogComponent::IO_READER},
      {"parser", LogComponent::PARSER},
      {"filters", LogComponent::FILTERS},
      {"commands", LogComponent::COMMANDS},
      {"engine", LogComponent::ENGINE},
      {"metrics", LogComponent::METRICS}};
  return map;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

template <typename T>
void assign_number(const std::string &key, const std::string &value,
                   int line_num, T &target) {
  auto parsed = Utils::string_to_number<T>(value);
  if (!parsed) {
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Config line " << line_num << ": invalid number '" << value
                       << "' for key '" << key << "', keeping " << target);
    return;
  }
  target = *parsed;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Could not open config file '" << filepath << "'.");
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Config line " << line_num
                         << ": invalid format (missing '='): " << trimmed_line);
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    // Inline comments
    size_t comment_pos = value.find(" ;");
    if (comment_pos != std::string::npos)
      value = Utils::trim_copy(value.substr(0, comment_pos));

    if (key.empty()) {
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Config line " << line_num << ": empty key found.");
      continue;
    }

    if (current_section == "Analysis") {
      if (key == Keys::AN_SLOW_REQUEST_THRESHOLD_MS)
        assign_number(key, value, line_num,
                      config.analysis.slow_request_threshold_ms);
      else if (key == Keys::AN_TOP_N)
        assign_number(key, value, line_num, config.analysis.top_n);
      else if (key == Keys::AN_MAX_FLAGGED_RECORDS)
        assign_number(key, value, line_num,
                      config.analysis.max_flagged_records);
      else if (key == Keys::AN_MAX_FAILURE_SAMPLES)
        assign_number(key, value, line_num,
                      config.analysis.max_failure_samples);
      else if (key == Keys::AN_MAX_LINE_BYTES)
        assign_number(key, value, line_num, config.analysis.max_line_bytes);
      else if (key == Keys::AN_ASSUME_TIME_ORDERED)
        config.analysis.assume_time_ordered = string_to_bool(value);
      else
        config.custom_settings["Analysis." + key] = value;

    } else if (current_section == "Output") {
      if (key == Keys::OUT_FORMAT)
        config.output.format = Utils::to_lower_copy(value);
      else
        config.custom_settings["Output." + key] = value;

    } else if (current_section == "Metrics") {
      if (key == Keys::METRICS_ENABLED)
        config.metrics.enabled = string_to_bool(value);
      else if (key == Keys::METRICS_TEXTFILE_PATH)
        config.metrics.textfile_path = value;
      else
        config.custom_settings["Metrics." + key] = value;

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel level = string_to_log_level(value);
        for (const auto &pair : key_to_component_map())
          config.logging.log_levels[pair.second] = level;
      } else {
        auto comp_it = key_to_component_map().find(key);
        if (comp_it != key_to_component_map().end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else
          LOG(LogLevel::WARN, LogComponent::CONFIG,
              "Config line " << line_num << ": unknown logging component '"
                             << key << "'");
      }

    } else {
      std::string prefix =
          current_section.empty() ? std::string() : current_section + ".";
      config.custom_settings[prefix + key] = value;
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Parsed " << line_num << " lines from " << filepath);
  return true;
}

} // namespace

AppConfig::AppConfig() {
  // By default, everything is set to WARN except the top-level run messages
  for (const auto &pair : key_to_component_map())
    logging.log_levels[pair.second] = LogLevel::WARN;
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::to_upper_copy(Utils::trim_copy(level_str_raw));
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

bool validate_analysis_config(const AnalysisConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.slow_request_threshold_ms < 0) {
    errors.push_back("Slow request threshold must not be negative");
    valid = false;
  }

  if (config.top_n < 1) {
    errors.push_back("top_n must be at least 1");
    valid = false;
  }

  if (config.max_line_bytes < 256) {
    errors.push_back("max_line_bytes must be at least 256");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = validate_analysis_config(config.analysis, errors);

  if (config.output.format != "text" && config.output.format != "json") {
    errors.push_back("Output format must be 'text' or 'json'");
    valid = false;
  }

  if (config.metrics.enabled && config.metrics.textfile_path.empty()) {
    errors.push_back("Metrics require a textfile_path when enabled");
    valid = false;
  }

  return valid;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  last_errors_.clear();
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    last_errors_.push_back("Failed to read configuration file: " + filepath);
    LOG(LogLevel::ERROR, LogComponent::CONFIG,
        "Failed to parse configuration file: "
            << filepath << ". Keeping existing settings.");
    return false;
  }

  // Validate the configuration
  if (!validate_app_config(*new_config, last_errors_)) {
    for (const auto &error : last_errors_)
      LOG(LogLevel::ERROR, LogComponent::CONFIG,
          "Configuration validation failed: " << error);
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
