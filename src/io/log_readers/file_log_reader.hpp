#ifndef FILE_LOG_READER_HPP
#define FILE_LOG_READER_HPP

#include "base_log_reader.hpp"

#include <cstddef>
#include <fstream>
#include <istream>
#include <string>

// Reads lines from a stream owned by the caller
class StreamLogReader : public ILogReader {
public:
  explicit StreamLogReader(std::istream &input);

  bool read_line(std::string &line, size_t max_bytes) override;
  uint64_t line_number() const override { return line_number_; }

private:
  std::istream &input_;
  uint64_t line_number_ = 0;
};

// An implementation of ILogReader that reads log lines from a text file
class FileLogReader : public ILogReader {
public:
  explicit FileLogReader(const std::string &filepath);
  ~FileLogReader() override;

  bool read_line(std::string &line, size_t max_bytes) override;
  uint64_t line_number() const override { return line_number_; }
  bool is_open() const;

private:
  std::string filepath_;
  std::ifstream log_file_stream_;
  uint64_t line_number_ = 0;
};

#endif // FILE_LOG_READER_HPP
