#include "log_entry.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// The syslog header (date, host) precedes the "haproxy[pid]:" token. Its
// exact shape varies between syslog daemons so only its length is bounded.
constexpr size_t kMaxSyslogPrefixTokens = 8;
constexpr size_t kMaxCapturedHeaderBlocks = 2;

struct Failure {
  ParseFailureReason reason;
  std::string detail;
};

bool is_process_token(std::string_view token) {
  // name[pid]:
  if (token.size() < 5 || token.substr(token.size() - 2) != "]:")
    return false;
  size_t open = token.find('[');
  if (open == std::string_view::npos || open == 0)
    return false;
  std::string_view pid = token.substr(open + 1, token.size() - open - 3);
  if (pid.empty())
    return false;
  for (char c : pid)
    if (c < '0' || c > '9')
      return false;
  return true;
}

bool is_address_char(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) || c == '.' || c == ':';
}

// -1 is HAProxy's "phase not reached" marker; anything else negative is junk.
bool parse_timer(std::string_view field, bool allow_plus,
                 std::optional<int64_t> &out) {
  if (allow_plus && !field.empty() && field.front() == '+')
    field.remove_prefix(1);
  if (field == "-1") {
    out = std::nullopt;
    return true;
  }
  if (field.empty() || field.front() == '-')
    return false;
  auto value = Utils::string_to_number<int64_t>(field);
  if (!value)
    return false;
  out = *value;
  return true;
}

bool parse_counter(std::string_view field, uint32_t &out) {
  auto value = Utils::string_to_number<uint32_t>(field);
  if (!value)
    return false;
  out = *value;
  return true;
}

bool is_protocol(std::string_view protocol) {
  // NAME/major.minor
  size_t slash = protocol.find('/');
  if (slash == std::string_view::npos || slash == 0)
    return false;
  for (char c : protocol.substr(0, slash))
    if (!std::isalpha(static_cast<unsigned char>(c)))
      return false;

  std::string_view version = protocol.substr(slash + 1);
  size_t dot = version.find('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == version.size())
    return false;
  for (size_t i = 0; i < version.size(); ++i)
    if (i != dot && !std::isdigit(static_cast<unsigned char>(version[i])))
      return false;
  return true;
}

std::optional<HttpRequest> parse_request_details(std::string_view request) {
  size_t method_end = request.find(' ');
  size_t protocol_start = request.rfind(' ');
  if (method_end == std::string_view::npos || protocol_start <= method_end)
    return std::nullopt;

  std::string_view method = request.substr(0, method_end);
  std::string_view path =
      request.substr(method_end + 1, protocol_start - method_end - 1);
  std::string_view protocol = request.substr(protocol_start + 1);

  if (method.empty())
    return std::nullopt;
  for (char c : method)
    if (c < 'A' || c > 'Z')
      return std::nullopt;

  if (path.empty() || path.find(' ') != std::string_view::npos)
    return std::nullopt;

  if (!is_protocol(protocol))
    return std::nullopt;

  return HttpRequest{std::string(method), std::string(path),
                     std::string(protocol)};
}

// Single forward pass over one line. Fields are copied into the entry as
// they are recognised; the first mismatch stops the pass.
class LineParser {
public:
  explicit LineParser(std::string_view input) : input_(input), pos_(0) {}

  std::optional<Failure> parse_into(LogEntry &entry) {
    if (auto failure = parse_syslog_header(entry))
      return failure;
    if (auto failure = parse_client(entry))
      return failure;
    if (auto failure = parse_accept_date(entry))
      return failure;
    if (auto failure = parse_proxy_names(entry))
      return failure;
    if (auto failure = parse_timers(entry))
      return failure;
    if (auto failure = parse_status_and_bytes(entry))
      return failure;
    if (auto failure = parse_cookies_and_termination(entry))
      return failure;
    if (auto failure = parse_connections_and_queues(entry))
      return failure;
    if (auto failure = parse_captured_headers(entry))
      return failure;
    return parse_http_request(entry);
  }

private:
  std::string_view input_;
  size_t pos_;

  void skip_spaces() {
    while (pos_ < input_.size() && (input_[pos_] == ' ' || input_[pos_] == '\t'))
      ++pos_;
  }

  std::optional<std::string_view> next_token() {
    skip_spaces();
    if (pos_ >= input_.size())
      return std::nullopt;
    size_t start = pos_;
    while (pos_ < input_.size() && input_[pos_] != ' ' && input_[pos_] != '\t')
      ++pos_;
    return input_.substr(start, pos_ - start);
  }

  static Failure truncated(const char *field) {
    return Failure{ParseFailureReason::FieldCountMismatch,
                   std::string("line ends before ") + field};
  }

  std::optional<Failure> parse_syslog_header(LogEntry &entry) {
    size_t prefix_tokens = 0;
    while (true) {
      skip_spaces();
      size_t token_start = pos_;
      auto token = next_token();
      if (!token)
        return Failure{ParseFailureReason::GrammarMismatch,
                       "no process identifier found"};

      if (is_process_token(*token)) {
        if (prefix_tokens == 0)
          return Failure{ParseFailureReason::GrammarMismatch,
                         "missing syslog header"};
        entry.syslog_prefix = Utils::trim_copy(input_.substr(0, token_start));
        entry.process_name = std::string(token->substr(0, token->size() - 1));
        return std::nullopt;
      }

      if (++prefix_tokens > kMaxSyslogPrefixTokens)
        return Failure{ParseFailureReason::GrammarMismatch,
                       "no process identifier found"};
    }
  }

  std::optional<Failure> parse_client(LogEntry &entry) {
    auto token = next_token();
    if (!token)
      return truncated("client address");

    size_t colon = token->rfind(':');
    if (colon == std::string_view::npos || colon == 0)
      return Failure{ParseFailureReason::GrammarMismatch,
                     "client address has no port"};

    std::string_view ip = token->substr(0, colon);
    for (char c : ip)
      if (!is_address_char(c))
        return Failure{ParseFailureReason::GrammarMismatch,
                       "client address is not an IP address"};

    auto port = Utils::string_to_number<uint32_t>(token->substr(colon + 1));
    if (!port || *port > 65535)
      return Failure{ParseFailureReason::InvalidNumber, "invalid client port"};

    entry.client_ip = std::string(ip);
    entry.client_port = static_cast<uint16_t>(*port);
    return std::nullopt;
  }

  std::optional<Failure> parse_accept_date(LogEntry &entry) {
    auto token = next_token();
    if (!token)
      return truncated("accept date");
    if (token->size() < 2 || token->front() != '[' || token->back() != ']')
      return Failure{ParseFailureReason::GrammarMismatch,
                     "accept date is not bracketed"};

    auto date = Utils::parse_accept_date(token->substr(1, token->size() - 2));
    if (!date)
      return Failure{ParseFailureReason::InvalidTimestamp,
                     "unparsable accept date " + std::string(*token)};

    entry.accept_timestamp_s = date->epoch_seconds;
    entry.accept_milliseconds = date->milliseconds;
    return std::nullopt;
  }

  std::optional<Failure> parse_proxy_names(LogEntry &entry) {
    auto frontend = next_token();
    if (!frontend)
      return truncated("frontend name");
    auto backend_server = next_token();
    if (!backend_server)
      return truncated("backend/server");

    size_t slash = backend_server->find('/');
    if (slash == std::string_view::npos || slash == 0 ||
        slash + 1 == backend_server->size())
      return Failure{ParseFailureReason::GrammarMismatch,
                     "expected backend/server, got " +
                         std::string(*backend_server)};

    entry.frontend = std::string(*frontend);
    entry.backend = std::string(backend_server->substr(0, slash));
    entry.server = std::string(backend_server->substr(slash + 1));
    return std::nullopt;
  }

  std::optional<Failure> parse_timers(LogEntry &entry) {
    auto token = next_token();
    if (!token)
      return truncated("timers");

    std::vector<std::string_view> fields = Utils::split_string_view(*token, '/');
    if (fields.size() != 5)
      return Failure{ParseFailureReason::FieldCountMismatch,
                     "expected 5 timers, got " + std::to_string(fields.size())};

    std::optional<int64_t> *targets[5] = {
        &entry.timers.request_ms, &entry.timers.queue_ms,
        &entry.timers.connect_ms, &entry.timers.response_ms,
        &entry.timers.total_ms};
    for (size_t i = 0; i < fields.size(); ++i) {
      // Tt carries a '+' when the line was emitted before the session ended
      if (!parse_timer(fields[i], i == 4, *targets[i]))
        return Failure{ParseFailureReason::InvalidNumber,
                       "invalid timer value " + std::string(fields[i])};
    }
    return std::nullopt;
  }

  std::optional<Failure> parse_status_and_bytes(LogEntry &entry) {
    auto status = next_token();
    if (!status)
      return truncated("status code");
    if (*status == "-1") {
      entry.http_status_code = std::nullopt;
    } else {
      auto code = Utils::string_to_number<int>(*status);
      if (!code || *code < 100 || *code > 599)
        return Failure{ParseFailureReason::InvalidNumber,
                       "invalid status code " + std::string(*status)};
      entry.http_status_code = *code;
    }

    auto bytes = next_token();
    if (!bytes)
      return truncated("bytes read");
    std::string_view digits = *bytes;
    if (!digits.empty() && digits.front() == '+')
      digits.remove_prefix(1);
    auto value = Utils::string_to_number<uint64_t>(digits);
    if (!value)
      return Failure{ParseFailureReason::InvalidNumber,
                     "invalid byte count " + std::string(*bytes)};
    entry.bytes_read = *value;
    return std::nullopt;
  }

  std::optional<Failure> parse_cookies_and_termination(LogEntry &entry) {
    auto request_cookie = next_token();
    auto response_cookie = next_token();
    auto termination = next_token();
    if (!request_cookie || !response_cookie || !termination)
      return truncated("termination state");

    if (termination->size() < 2 || termination->size() > 4)
      return Failure{ParseFailureReason::GrammarMismatch,
                     "invalid termination state " + std::string(*termination)};
    for (char c : *termination)
      if (!std::isalpha(static_cast<unsigned char>(c)) && c != '-')
        return Failure{ParseFailureReason::GrammarMismatch,
                       "invalid termination state " +
                           std::string(*termination)};

    entry.captured_request_cookie = std::string(*request_cookie);
    entry.captured_response_cookie = std::string(*response_cookie);
    entry.termination_state = std::string(*termination);
    return std::nullopt;
  }

  std::optional<Failure> parse_connections_and_queues(LogEntry &entry) {
    auto connections = next_token();
    if (!connections)
      return truncated("connection counters");

    std::vector<std::string_view> counts =
        Utils::split_string_view(*connections, '/');
    if (counts.size() != 5)
      return Failure{ParseFailureReason::FieldCountMismatch,
                     "expected 5 connection counters, got " +
                         std::to_string(counts.size())};

    std::string_view retries = counts[4];
    if (!retries.empty() && retries.front() == '+') {
      entry.connections.redispatched = true;
      retries.remove_prefix(1);
    }
    if (!parse_counter(counts[0], entry.connections.active) ||
        !parse_counter(counts[1], entry.connections.frontend) ||
        !parse_counter(counts[2], entry.connections.backend) ||
        !parse_counter(counts[3], entry.connections.server) ||
        !parse_counter(retries, entry.connections.retries))
      return Failure{ParseFailureReason::InvalidNumber,
                     "invalid connection counter in " +
                         std::string(*connections)};

    auto queues = next_token();
    if (!queues)
      return truncated("queue counters");

    std::vector<std::string_view> depths =
        Utils::split_string_view(*queues, '/');
    if (depths.size() != 2)
      return Failure{ParseFailureReason::FieldCountMismatch,
                     "expected 2 queue counters, got " +
                         std::to_string(depths.size())};
    if (!parse_counter(depths[0], entry.queues.server) ||
        !parse_counter(depths[1], entry.queues.backend))
      return Failure{ParseFailureReason::InvalidNumber,
                     "invalid queue counter in " + std::string(*queues)};
    return std::nullopt;
  }

  std::optional<Failure> parse_captured_headers(LogEntry &entry) {
    skip_spaces();
    while (pos_ < input_.size() && input_[pos_] == '{') {
      if (entry.captured_headers.size() == kMaxCapturedHeaderBlocks)
        return Failure{ParseFailureReason::GrammarMismatch,
                       "too many captured header blocks"};

      size_t close = input_.find('}', pos_);
      if (close == std::string_view::npos)
        return Failure{ParseFailureReason::GrammarMismatch,
                       "unterminated captured header block"};

      entry.captured_headers.emplace_back(
          input_.substr(pos_ + 1, close - pos_ - 1));
      pos_ = close + 1;

      if (pos_ < input_.size() && input_[pos_] != ' ' && input_[pos_] != '\t')
        return Failure{ParseFailureReason::GrammarMismatch,
                       "unexpected text after captured headers"};
      skip_spaces();
    }
    return std::nullopt;
  }

  std::optional<Failure> parse_http_request(LogEntry &entry) {
    skip_spaces();
    std::string_view rest = input_.substr(pos_);
    if (rest.empty()) {
      entry.http_request = std::nullopt;
      return std::nullopt;
    }

    if (rest.size() < 2 || rest.front() != '"' || rest.back() != '"')
      return Failure{ParseFailureReason::GrammarMismatch,
                     "trailing text is not a quoted request"};

    std::string_view request = rest.substr(1, rest.size() - 2);
    auto parsed = parse_request_details(request);
    if (!parsed)
      return Failure{ParseFailureReason::InvalidRequest,
                     "malformed request line \"" + std::string(request) + "\""};

    entry.http_request = std::move(*parsed);
    return std::nullopt;
  }
};

} // namespace

LogEntry::LogEntry()
    : original_line_number(0), accept_timestamp_s(0), accept_milliseconds(0),
      client_port(0), bytes_read(0) {}

bool LogEntry::is_https() const {
  return !frontend.empty() && frontend.back() == '~';
}

bool LogEntry::has_server() const {
  return server != "<NOSRV>" && backend != "<NOSRV>";
}

char LogEntry::termination_cause() const {
  return termination_state.empty() ? '-' : termination_state[0];
}

char LogEntry::session_state_at_close() const {
  return termination_state.size() < 2 ? '-' : termination_state[1];
}

const char *parse_failure_reason_to_string(ParseFailureReason reason) {
  switch (reason) {
  case ParseFailureReason::GrammarMismatch:
    return "grammar_mismatch";
  case ParseFailureReason::FieldCountMismatch:
    return "field_count_mismatch";
  case ParseFailureReason::InvalidRequest:
    return "invalid_request";
  case ParseFailureReason::LineTooLong:
    return "line_too_long";
  case ParseFailureReason::InvalidTimestamp:
    return "invalid_timestamp";
  case ParseFailureReason::InvalidNumber:
    return "invalid_number";
  }
  return "unknown";
}

ParseResult LogEntry::parse_from_string(std::string log_line,
                                        uint64_t line_num) {
  while (!log_line.empty() &&
         std::isspace(static_cast<unsigned char>(log_line.back())))
    log_line.pop_back();

  if (log_line.empty())
    return ParseFailure{ParseFailureReason::GrammarMismatch, line_num,
                        std::move(log_line), "empty line"};

  LogEntry entry;
  std::optional<Failure> failure = LineParser(log_line).parse_into(entry);
  if (failure) {
    LOG(LogLevel::TRACE, LogComponent::PARSER,
        "Line " << line_num << " rejected ("
                << parse_failure_reason_to_string(failure->reason)
                << "): " << failure->detail);
    return ParseFailure{failure->reason, line_num, std::move(log_line),
                        std::move(failure->detail)};
  }

  // Every field above is an owned copy, so the line can move in last.
  entry.raw_log_line = std::move(log_line);
  entry.original_line_number = line_num;
  return entry;
}
