#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "analysis/log_source.hpp"
#include "analysis/time_window.hpp"
#include "core/config.hpp"
#include "core/log_entry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Category -> count, in the order the command defines
using CategoryCounts = std::vector<std::pair<std::string, uint64_t>>;

// Counts, an integer scalar, a real scalar, or flagged records in input order
using ReportValue =
    std::variant<CategoryCounts, uint64_t, double, std::vector<LogEntry>>;

struct Report {
  std::string command;
  ReportValue value;
  uint64_t records_considered = 0;
  uint64_t malformed_count = 0;
  TimeWindow window;

  bool operator==(const Report &other) const {
    return command == other.command && value == other.value &&
           records_considered == other.records_considered &&
           malformed_count == other.malformed_count && window == other.window;
  }
  bool operator!=(const Report &other) const { return !(*this == other); }
};

class IAggregator {
public:
  virtual ~IAggregator() = default;

  virtual void consume(const LogEntry &entry) = 0;
  virtual ReportValue finish(const ScanSummary &summary) = 0;

  // Aggregators that need to see the records more than once ask for more
  // passes; each pass gets a fresh traversal of the same input.
  virtual unsigned passes() const { return 1; }
  virtual void begin_pass(unsigned pass) { (void)pass; }
};

using AggregatorFactory = std::function<std::unique_ptr<IAggregator>(
    const Config::AnalysisConfig &config)>;

struct CommandInfo {
  std::string name;
  std::string description;
};

class CommandRegistry {
public:
  void register_command(const std::string &name,
                        const std::string &description,
                        AggregatorFactory factory);

  bool contains(const std::string &name) const;
  std::unique_ptr<IAggregator>
  create(const std::string &name, const Config::AnalysisConfig &config) const;

  // Sorted by name
  std::vector<CommandInfo> list() const;

  // Runs one single-pass command to completion over `records`
  Report run(const std::string &name, IRecordSequence &records,
             const Config::AnalysisConfig &config) const;

private:
  struct Entry {
    std::string description;
    AggregatorFactory factory;
  };
  std::map<std::string, Entry> commands_;
};

void register_builtin_commands(CommandRegistry &registry);

#endif // COMMANDS_HPP
