#ifndef BASE_LOG_READER_HPP
#define BASE_LOG_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

class ILogReader {
public:
  virtual ~ILogReader() = default;

  // Reads the next raw line into `line` without its terminator. At most
  // max_bytes + 1 bytes are stored; the rest of a longer line is skipped,
  // so callers detect it by size. Returns false once the input is exhausted.
  virtual bool read_line(std::string &line, size_t max_bytes) = 0;

  // 1-based number of the last line returned by read_line
  virtual uint64_t line_number() const = 0;
};

#endif // BASE_LOG_READER_HPP
