#include "file_log_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <limits>
#include <string>

namespace {

// getline without the unbounded growth: keeps max_bytes + 1 bytes of the
// line and discards the remainder up to the newline.
bool read_bounded_line(std::istream &input, std::string &line,
                       size_t max_bytes) {
  line.clear();
  char c;
  bool extracted = false;
  while (input.get(c)) {
    extracted = true;
    if (c == '\n')
      return true;
    if (line.size() > max_bytes) {
      input.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
      return true;
    }
    line.push_back(c);
  }
  return extracted;
}

} // namespace

StreamLogReader::StreamLogReader(std::istream &input) : input_(input) {}

bool StreamLogReader::read_line(std::string &line, size_t max_bytes) {
  if (!read_bounded_line(input_, line, max_bytes))
    return false;
  line_number_++;
  return true;
}

FileLogReader::FileLogReader(const std::string &filepath)
    : filepath_(filepath) {
  log_file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open log source file: " << filepath);
    throw ResourceError("Failed to open log source file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened log file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileLogReader closed. Total lines read: " << line_number_);
}

bool FileLogReader::is_open() const { return log_file_stream_.is_open(); }

bool FileLogReader::read_line(std::string &line, size_t max_bytes) {
  if (read_bounded_line(log_file_stream_, line, max_bytes)) {
    line_number_++;
    return true;
  }

  // Extraction stops on both end of file and a read error; only the latter
  // leaves eof unset.
  if (!log_file_stream_.eof()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Read error on " << filepath_ << " after line " << line_number_);
    throw ResourceError("Failed to read log source file: " + filepath_);
  }
  return false;
}
