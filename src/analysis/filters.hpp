#ifndef FILTERS_HPP
#define FILTERS_HPP

#include "core/log_entry.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class IFilter {
public:
  virtual ~IFilter() = default;

  virtual bool matches(const LogEntry &entry) const = 0;

  // Human readable form, e.g. "status_code(500)", used in diagnostics
  virtual std::string describe() const = 0;
};

// Builds a filter from its command line parameters. Factories validate the
// parameters up front and throw ConfigurationError on a bad value.
using FilterFactory = std::function<std::unique_ptr<IFilter>(
    const std::vector<std::string> &params)>;

struct FilterInfo {
  std::string name;
  std::string description;
};

class FilterRegistry {
public:
  void register_filter(const std::string &name, const std::string &description,
                       FilterFactory factory);

  bool contains(const std::string &name) const;
  std::unique_ptr<IFilter> create(const std::string &name,
                                  const std::vector<std::string> &params) const;

  // Sorted by name
  std::vector<FilterInfo> list() const;

private:
  struct Entry {
    std::string description;
    FilterFactory factory;
  };
  std::map<std::string, Entry> filters_;
};

struct FilterActivation {
  std::string name;
  std::vector<std::string> params;
  bool negate = false;
};

// "name", "name:param" or "name:p1,p2"; a leading '!' negates the filter.
FilterActivation parse_filter_spec(const std::string &spec);

// Conjunction of activated filters. An empty chain accepts everything.
class FilterChain {
public:
  explicit FilterChain(const FilterRegistry &registry);

  const IFilter &activate(const std::string &name,
                          const std::vector<std::string> &params,
                          bool negate = false);
  const IFilter &activate(const FilterActivation &activation);

  bool matches(const LogEntry &entry) const;

  size_t size() const { return filters_.size(); }
  bool empty() const { return filters_.empty(); }

private:
  const FilterRegistry &registry_;
  std::vector<std::unique_ptr<IFilter>> filters_;
};

void register_builtin_filters(FilterRegistry &registry);

#endif // FILTERS_HPP
