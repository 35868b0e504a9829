#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Session timers in milliseconds. HAProxy writes -1 for a phase that never
// happened; those are kept as nullopt so they can't leak into sums.
struct SessionTimers {
  std::optional<int64_t> request_ms;  // Tq
  std::optional<int64_t> queue_ms;    // Tw
  std::optional<int64_t> connect_ms;  // Tc
  std::optional<int64_t> response_ms; // Tr
  std::optional<int64_t> total_ms;    // Tt
};

struct ConnectionCounts {
  uint32_t active = 0;
  uint32_t frontend = 0;
  uint32_t backend = 0;
  uint32_t server = 0;
  uint32_t retries = 0;
  bool redispatched = false;
};

struct QueueLengths {
  uint32_t server = 0;
  uint32_t backend = 0;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string protocol;
};

struct ParseFailure;

struct LogEntry {
  std::string raw_log_line;
  uint64_t original_line_number;

  std::string syslog_prefix;
  std::string process_name;

  int64_t accept_timestamp_s;
  uint32_t accept_milliseconds;

  std::string client_ip;
  uint16_t client_port;

  std::string frontend;
  std::string backend;
  std::string server;

  SessionTimers timers;
  std::optional<int> http_status_code;
  uint64_t bytes_read;

  std::string captured_request_cookie;
  std::string captured_response_cookie;
  std::string termination_state;

  ConnectionCounts connections;
  QueueLengths queues;

  std::vector<std::string> captured_headers;
  std::optional<HttpRequest> http_request;

  // Default constructor
  LogEntry();

  bool is_https() const;
  bool has_server() const;
  char termination_cause() const;
  char session_state_at_close() const;

  bool operator==(const LogEntry &other) const {
    return original_line_number == other.original_line_number &&
           raw_log_line == other.raw_log_line;
  }
  bool operator!=(const LogEntry &other) const { return !(*this == other); }

  // Parses one HAProxy HTTP log line as forwarded through syslog. Never
  // throws; a line that does not fully match yields a ParseFailure.
  static std::variant<LogEntry, ParseFailure>
  parse_from_string(std::string log_line, uint64_t line_num);
};

enum class ParseFailureReason {
  GrammarMismatch,
  FieldCountMismatch,
  InvalidRequest,
  LineTooLong,
  InvalidTimestamp,
  InvalidNumber
};

const char *parse_failure_reason_to_string(ParseFailureReason reason);

struct ParseFailure {
  ParseFailureReason reason;
  uint64_t line_number = 0;
  std::string raw_log_line;
  std::string detail;

  // Structural failures mean the line does not follow the grammar at all;
  // value failures mean the layout matched but a field could not be read.
  bool is_structural() const {
    return reason == ParseFailureReason::GrammarMismatch ||
           reason == ParseFailureReason::FieldCountMismatch ||
           reason == ParseFailureReason::InvalidRequest ||
           reason == ParseFailureReason::LineTooLong;
  }
};

using ParseResult = std::variant<LogEntry, ParseFailure>;

#endif // LOG_ENTRY_HPP
