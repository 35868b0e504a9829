#include "core/log_entry.hpp"
#include "log_line_builder.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <variant>

namespace {

LogEntry expect_entry(const ParseResult &result) {
  if (const auto *failure = std::get_if<ParseFailure>(&result))
    ADD_FAILURE() << "unexpected parse failure: " << failure->detail;
  return std::get<LogEntry>(result);
}

ParseFailure expect_failure(const ParseResult &result) {
  EXPECT_TRUE(std::holds_alternative<ParseFailure>(result));
  return std::get<ParseFailure>(result);
}

ParseFailureReason failure_reason(const LogLineBuilder &b) {
  return expect_failure(LogEntry::parse_from_string(b.build(), 1)).reason;
}

std::string optional_field(const std::optional<int64_t> &value) {
  return value ? std::to_string(*value) : "-1";
}

// Writes the numeric fields back in log syntax
std::string timers_field(const SessionTimers &t) {
  return optional_field(t.request_ms) + "/" + optional_field(t.queue_ms) + "/" +
         optional_field(t.connect_ms) + "/" + optional_field(t.response_ms) +
         "/" + optional_field(t.total_ms);
}

std::string connections_field(const ConnectionCounts &c) {
  return std::to_string(c.active) + "/" + std::to_string(c.frontend) + "/" +
         std::to_string(c.backend) + "/" + std::to_string(c.server) + "/" +
         (c.redispatched ? "+" : "") + std::to_string(c.retries);
}

} // namespace

TEST(LogParsingTest, CorrectlyParsesValidLine) {
  // A real line from a syslog-forwarded HAProxy
  std::string line =
      "Dec  9 13:01:26 localhost haproxy[28029]: 127.0.0.1:39759 "
      "[09/Dec/2013:12:59:46.633] loadbalancer default/instance8 "
      "0/51536/1/48082/99627 200 83285 - - ---- 87/87/87/1/0 0/67 "
      "{77.24.148.74} \"GET /path/to/image HTTP/1.1\"";
  ParseResult result = LogEntry::parse_from_string(line, 1);
  ASSERT_TRUE(std::holds_alternative<LogEntry>(result));
  const LogEntry &entry = std::get<LogEntry>(result);

  EXPECT_EQ(entry.original_line_number, 1u);
  EXPECT_EQ(entry.raw_log_line, line);
  EXPECT_EQ(entry.syslog_prefix, "Dec  9 13:01:26 localhost");
  EXPECT_EQ(entry.process_name, "haproxy[28029]");

  EXPECT_EQ(entry.client_ip, "127.0.0.1");
  EXPECT_EQ(entry.client_port, 39759);
  EXPECT_EQ(entry.accept_timestamp_s, 1386593986); // 2013-12-09T12:59:46Z
  EXPECT_EQ(entry.accept_milliseconds, 633u);

  EXPECT_EQ(entry.frontend, "loadbalancer");
  EXPECT_EQ(entry.backend, "default");
  EXPECT_EQ(entry.server, "instance8");
  EXPECT_FALSE(entry.is_https());
  EXPECT_TRUE(entry.has_server());

  EXPECT_EQ(entry.timers.request_ms, 0);
  EXPECT_EQ(entry.timers.queue_ms, 51536);
  EXPECT_EQ(entry.timers.connect_ms, 1);
  EXPECT_EQ(entry.timers.response_ms, 48082);
  EXPECT_EQ(entry.timers.total_ms, 99627);

  ASSERT_TRUE(entry.http_status_code.has_value());
  EXPECT_EQ(*entry.http_status_code, 200);
  EXPECT_EQ(entry.bytes_read, 83285u);

  EXPECT_EQ(entry.captured_request_cookie, "-");
  EXPECT_EQ(entry.captured_response_cookie, "-");
  EXPECT_EQ(entry.termination_state, "----");
  EXPECT_EQ(entry.termination_cause(), '-');

  EXPECT_EQ(entry.connections.active, 87u);
  EXPECT_EQ(entry.connections.frontend, 87u);
  EXPECT_EQ(entry.connections.backend, 87u);
  EXPECT_EQ(entry.connections.server, 1u);
  EXPECT_EQ(entry.connections.retries, 0u);
  EXPECT_FALSE(entry.connections.redispatched);
  EXPECT_EQ(entry.queues.server, 0u);
  EXPECT_EQ(entry.queues.backend, 67u);

  ASSERT_EQ(entry.captured_headers.size(), 1u);
  EXPECT_EQ(entry.captured_headers[0], "77.24.148.74");

  ASSERT_TRUE(entry.http_request.has_value());
  EXPECT_EQ(entry.http_request->method, "GET");
  EXPECT_EQ(entry.http_request->path, "/path/to/image");
  EXPECT_EQ(entry.http_request->protocol, "HTTP/1.1");
}

TEST(LogParsingTest, MinusOneTimersAndStatusAreAbsent) {
  LogLineBuilder b;
  b.timers = "-1/-1/-1/-1/5000";
  b.status = "-1";
  b.termination = "CR--";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 7));

  EXPECT_FALSE(entry.timers.request_ms.has_value());
  EXPECT_FALSE(entry.timers.queue_ms.has_value());
  EXPECT_FALSE(entry.timers.connect_ms.has_value());
  EXPECT_FALSE(entry.timers.response_ms.has_value());
  EXPECT_EQ(entry.timers.total_ms, 5000);
  EXPECT_FALSE(entry.http_status_code.has_value());
  EXPECT_EQ(entry.termination_cause(), 'C');
  EXPECT_EQ(entry.session_state_at_close(), 'R');
}

TEST(LogParsingTest, AcceptsLogasapAndRedispatchMarkers) {
  LogLineBuilder b;
  b.timers = "1/0/2/3/+120";
  b.bytes = "+4096";
  b.connections = "5/4/3/2/+1";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

  EXPECT_EQ(entry.timers.total_ms, 120);
  EXPECT_EQ(entry.bytes_read, 4096u);
  EXPECT_EQ(entry.connections.retries, 1u);
  EXPECT_TRUE(entry.connections.redispatched);
}

TEST(LogParsingTest, LineWithoutRequestHasNoHttpRequest) {
  LogLineBuilder b;
  b.headers.clear();
  b.request.clear();
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

  EXPECT_TRUE(entry.captured_headers.empty());
  EXPECT_FALSE(entry.http_request.has_value());
}

TEST(LogParsingTest, ParsesRequestAndResponseHeaderBlocks) {
  LogLineBuilder b;
  b.headers = "{1.2.3.4|Mozilla/5.0 (X11)} {text/html}";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

  ASSERT_EQ(entry.captured_headers.size(), 2u);
  EXPECT_EQ(entry.captured_headers[0], "1.2.3.4|Mozilla/5.0 (X11)");
  EXPECT_EQ(entry.captured_headers[1], "text/html");
  ASSERT_TRUE(entry.http_request.has_value());
}

TEST(LogParsingTest, SslFrontendAndNoServer) {
  LogLineBuilder b;
  b.frontend = "https-in~";
  b.backend_server = "https-in/<NOSRV>";
  b.status = "503";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

  EXPECT_TRUE(entry.is_https());
  EXPECT_FALSE(entry.has_server());
  EXPECT_EQ(entry.server, "<NOSRV>");
}

TEST(LogParsingTest, ParsesIPv6ClientAddress) {
  LogLineBuilder b;
  b.client = "2001:db8::1:51234";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

  EXPECT_EQ(entry.client_ip, "2001:db8::1");
  EXPECT_EQ(entry.client_port, 51234);
}

TEST(LogParsingTest, StripsTrailingCarriageReturn) {
  LogLineBuilder b;
  std::string line = b.build();
  const LogEntry &entry =
      expect_entry(LogEntry::parse_from_string(line + "\r", 1));
  EXPECT_EQ(entry.raw_log_line, line);
}

TEST(LogParsingTest, AcceptDateWithoutMilliseconds) {
  LogLineBuilder b;
  b.accept_date = "11/Dec/2013:00:00:00";
  const LogEntry &entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(entry.accept_timestamp_s, 1386720000);
  EXPECT_EQ(entry.accept_milliseconds, 0u);
}

TEST(LogParsingTest, CorrectlyRejectsMalformedLine) {
  ParseFailure failure = expect_failure(LogEntry::parse_from_string(
      "this is a malformed log line with not enough fields", 2));
  EXPECT_EQ(failure.reason, ParseFailureReason::GrammarMismatch);
  EXPECT_TRUE(failure.is_structural());
  EXPECT_EQ(failure.line_number, 2u);
}

TEST(LogParsingTest, RejectsLineWithoutSyslogHeader) {
  LogLineBuilder b;
  b.syslog_header.clear();
  std::string line = b.build().substr(1);
  ParseFailure failure = expect_failure(LogEntry::parse_from_string(line, 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::GrammarMismatch);
}

TEST(LogParsingTest, TruncatedLineIsFieldCountMismatch) {
  LogLineBuilder b;
  std::string line = b.build();
  line = line.substr(0, line.find(" 200 "));
  ParseFailure failure = expect_failure(LogEntry::parse_from_string(line, 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::FieldCountMismatch);
  EXPECT_TRUE(failure.is_structural());
}

TEST(LogParsingTest, WrongTimerCountIsFieldCountMismatch) {
  LogLineBuilder b;
  b.timers = "0/1/2/3";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::FieldCountMismatch);
}

TEST(LogParsingTest, NegativeTimerOtherThanMinusOneIsInvalidNumber) {
  LogLineBuilder b;
  b.timers = "0/-2/1/1/10";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidNumber);
  EXPECT_FALSE(failure.is_structural());
}

TEST(LogParsingTest, NonNumericStatusIsInvalidNumber) {
  LogLineBuilder b;
  b.status = "abc";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidNumber);
}

TEST(LogParsingTest, StatusCodeOutsideHttpRangeIsInvalidNumber) {
  LogLineBuilder b;
  b.status = "600";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.status = "99";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.status = "599";
  EXPECT_EQ(expect_entry(LogEntry::parse_from_string(b.build(), 1))
                .http_status_code,
            599);
}

TEST(LogParsingTest, NonNumericBytesIsInvalidNumber) {
  LogLineBuilder b;
  b.bytes = "12kb";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.bytes = "-";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.bytes = "-5";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
}

TEST(LogParsingTest, BadClientPortIsInvalidNumber) {
  LogLineBuilder b;
  b.client = "127.0.0.1:abc";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.client = "127.0.0.1:70000";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.client = "127.0.0.1:65535";
  EXPECT_EQ(expect_entry(LogEntry::parse_from_string(b.build(), 1)).client_port,
            65535);
}

TEST(LogParsingTest, ConnectionCountersAreChecked) {
  LogLineBuilder b;
  b.connections = "87/87/87/1";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::FieldCountMismatch);
  b.connections = "87/87/87/1/0/0";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::FieldCountMismatch);
  b.connections = "87/x/87/1/0";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
  b.connections = "87/87/87/1/-";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
}

TEST(LogParsingTest, QueueCountersAreChecked) {
  LogLineBuilder b;
  b.queues = "0";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::FieldCountMismatch);
  b.queues = "0/1/2";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::FieldCountMismatch);
  b.queues = "0/x";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::InvalidNumber);
}

TEST(LogParsingTest, TerminationStateOfWrongLengthIsGrammarMismatch) {
  LogLineBuilder b;
  b.termination = "C";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::GrammarMismatch);
  b.termination = "CD---";
  EXPECT_EQ(failure_reason(b), ParseFailureReason::GrammarMismatch);
}

TEST(LogParsingTest, NumericFieldsSerializeBackToInput) {
  struct Fields {
    const char *timers;
    const char *status;
    const char *bytes;
    const char *connections;
    const char *queues;
  };
  const Fields cases[] = {
      {"0/51536/1/48082/99627", "200", "83285", "87/87/87/1/0", "0/67"},
      {"10/-1/0/-1/250", "-1", "0", "1/2/3/4/+5", "6/7"},
      {"-1/-1/-1/-1/-1", "503", "18446744073709551615", "0/0/0/0/0", "0/0"},
  };

  for (const auto &c : cases) {
    LogLineBuilder b;
    b.timers = c.timers;
    b.status = c.status;
    b.bytes = c.bytes;
    b.connections = c.connections;
    b.queues = c.queues;
    LogEntry entry = expect_entry(LogEntry::parse_from_string(b.build(), 1));

    EXPECT_EQ(timers_field(entry.timers), c.timers);
    EXPECT_EQ(entry.http_status_code ? std::to_string(*entry.http_status_code)
                                     : "-1",
              c.status);
    EXPECT_EQ(std::to_string(entry.bytes_read), c.bytes);
    EXPECT_EQ(connections_field(entry.connections), c.connections);
    EXPECT_EQ(std::to_string(entry.queues.server) + "/" +
                  std::to_string(entry.queues.backend),
              c.queues);
  }
}

TEST(LogParsingTest, CorrectlyRejectsLineWithInvalidTimestamp) {
  LogLineBuilder b;
  b.accept_date = "31/Feb/2013:12:00:00.000";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 3));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidTimestamp);
  EXPECT_FALSE(failure.is_structural());
}

TEST(LogParsingTest, BadRequestIsInvalidRequest) {
  LogLineBuilder b;
  b.request = "\"<BADREQ>\"";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidRequest);
  EXPECT_TRUE(failure.is_structural());
}

TEST(LogParsingTest, LowercaseMethodIsInvalidRequest) {
  LogLineBuilder b;
  b.request = "\"get /index.html HTTP/1.1\"";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidRequest);
}

TEST(LogParsingTest, RequestWithoutProtocolIsInvalidRequest) {
  LogLineBuilder b;
  b.request = "\"GET /index.html\"";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::InvalidRequest);
}

TEST(LogParsingTest, UnquotedTrailingTextIsGrammarMismatch) {
  LogLineBuilder b;
  b.request = "GET /index.html HTTP/1.1";
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::GrammarMismatch);
}

TEST(LogParsingTest, UnterminatedHeaderBlockIsGrammarMismatch) {
  LogLineBuilder b;
  b.headers = "{77.24.148.74";
  b.request.clear();
  ParseFailure failure =
      expect_failure(LogEntry::parse_from_string(b.build(), 1));
  EXPECT_EQ(failure.reason, ParseFailureReason::GrammarMismatch);
}

TEST(LogParsingTest, NeverThrowsOnGarbage) {
  const std::vector<std::string> garbage = {
      "", "   ", "haproxy[1]:", "a haproxy[1]: x", "a haproxy[1]: 1.2.3.4:5 [",
      "\"\"\"\"", std::string(300, '{')};
  for (const auto &line : garbage) {
    EXPECT_NO_THROW({
      ParseResult result = LogEntry::parse_from_string(line, 1);
      EXPECT_TRUE(std::holds_alternative<ParseFailure>(result)) << line;
    });
  }
}
