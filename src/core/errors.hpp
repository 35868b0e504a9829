#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Raised before any input is read when a request cannot be honoured:
// unknown command or filter, bad filter parameter, bad time window.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &message)
      : std::runtime_error(message) {}
};

// Raised when the log input cannot be opened or read.
class ResourceError : public std::runtime_error {
public:
  explicit ResourceError(const std::string &message)
      : std::runtime_error(message) {}
};

#endif // ERRORS_HPP
