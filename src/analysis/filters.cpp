#include "filters.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

class PredicateFilter : public IFilter {
public:
  PredicateFilter(std::string description,
                  std::function<bool(const LogEntry &)> predicate)
      : description_(std::move(description)),
        predicate_(std::move(predicate)) {}

  bool matches(const LogEntry &entry) const override {
    return predicate_(entry);
  }
  std::string describe() const override { return description_; }

private:
  std::string description_;
  std::function<bool(const LogEntry &)> predicate_;
};

class NegatedFilter : public IFilter {
public:
  explicit NegatedFilter(std::unique_ptr<IFilter> inner)
      : inner_(std::move(inner)) {}

  bool matches(const LogEntry &entry) const override {
    return !inner_->matches(entry);
  }
  std::string describe() const override { return "!" + inner_->describe(); }

private:
  std::unique_ptr<IFilter> inner_;
};

[[noreturn]] void reject(const std::string &filter, const std::string &why) {
  LOG(LogLevel::ERROR, LogComponent::FILTERS,
      "Filter '" << filter << "': " << why);
  throw ConfigurationError("filter '" + filter + "': " + why);
}

void expect_params(const std::string &filter,
                   const std::vector<std::string> &params, size_t count) {
  if (params.size() != count)
    reject(filter, "expects " + std::to_string(count) + " parameter(s), got " +
                       std::to_string(params.size()));
}

int64_t milliseconds_param(const std::string &filter,
                           const std::string &value) {
  auto ms = Utils::string_to_number<int64_t>(value);
  if (!ms || *ms < 0)
    reject(filter, "'" + value + "' is not a millisecond count");
  return *ms;
}

std::unique_ptr<IFilter> make_filter(std::string description,
                                     std::function<bool(const LogEntry &)> fn) {
  return std::make_unique<PredicateFilter>(std::move(description),
                                           std::move(fn));
}

// Exact match on one of the proxy name fields
FilterFactory name_filter(const std::string &filter,
                          std::string LogEntry::*field) {
  return [filter, field](const std::vector<std::string> &params) {
    expect_params(filter, params, 1);
    if (params[0].empty())
      reject(filter, "name must not be empty");
    std::string name = params[0];
    return make_filter(filter + "(" + name + ")",
                       [field, name](const LogEntry &e) {
                         return e.*field == name;
                       });
  };
}

} // namespace

void FilterRegistry::register_filter(const std::string &name,
                                     const std::string &description,
                                     FilterFactory factory) {
  if (!filters_.emplace(name, Entry{description, std::move(factory)}).second)
    throw std::invalid_argument("filter already registered: " + name);
}

bool FilterRegistry::contains(const std::string &name) const {
  return filters_.count(name) != 0;
}

std::unique_ptr<IFilter>
FilterRegistry::create(const std::string &name,
                       const std::vector<std::string> &params) const {
  auto it = filters_.find(name);
  if (it == filters_.end()) {
    LOG(LogLevel::ERROR, LogComponent::FILTERS, "Unknown filter: " << name);
    throw ConfigurationError("unknown filter: " + name);
  }
  return it->second.factory(params);
}

std::vector<FilterInfo> FilterRegistry::list() const {
  std::vector<FilterInfo> infos;
  infos.reserve(filters_.size());
  for (const auto &[name, entry] : filters_)
    infos.push_back(FilterInfo{name, entry.description});
  return infos;
}

FilterActivation parse_filter_spec(const std::string &spec) {
  FilterActivation activation;
  std::string text = Utils::trim_copy(spec);

  if (!text.empty() && text[0] == '!') {
    activation.negate = true;
    text.erase(0, 1);
  }

  // Only the first ':' separates the name, IPv6 parameters keep theirs
  size_t colon = text.find(':');
  activation.name = text.substr(0, colon);
  if (colon != std::string::npos && colon + 1 < text.size())
    activation.params = Utils::split_string(text.substr(colon + 1), ',');

  if (activation.name.empty())
    throw ConfigurationError("empty filter name in '" + spec + "'");
  return activation;
}

FilterChain::FilterChain(const FilterRegistry &registry)
    : registry_(registry) {}

const IFilter &FilterChain::activate(const std::string &name,
                                     const std::vector<std::string> &params,
                                     bool negate) {
  std::unique_ptr<IFilter> filter = registry_.create(name, params);
  if (negate)
    filter = std::make_unique<NegatedFilter>(std::move(filter));

  LOG(LogLevel::DEBUG, LogComponent::FILTERS,
      "Activated filter " << filter->describe());
  filters_.push_back(std::move(filter));
  return *filters_.back();
}

const IFilter &FilterChain::activate(const FilterActivation &activation) {
  return activate(activation.name, activation.params, activation.negate);
}

bool FilterChain::matches(const LogEntry &entry) const {
  for (const auto &filter : filters_)
    if (!filter->matches(entry))
      return false;
  return true;
}

void register_builtin_filters(FilterRegistry &registry) {
  registry.register_filter(
      "ip", "Requests from the given client IP address",
      [](const std::vector<std::string> &params) {
        expect_params("ip", params, 1);
        auto normalized = Utils::normalize_ip_address(params[0]);
        if (!normalized)
          reject("ip", "'" + params[0] + "' is not an IP address");
        std::string ip = *normalized;
        return make_filter("ip(" + ip + ")", [ip](const LogEntry &e) {
          if (e.client_ip == ip)
            return true;
          // IPv6 has several spellings; HAProxy normally logs the canonical
          // one, so only fall back to normalizing on a miss.
          if (e.client_ip.find(':') == std::string::npos)
            return false;
          auto client = Utils::normalize_ip_address(e.client_ip);
          return client && *client == ip;
        });
      });

  registry.register_filter(
      "ip_range", "Requests from clients inside an IPv4 CIDR block",
      [](const std::vector<std::string> &params) {
        expect_params("ip_range", params, 1);
        auto block = Utils::parse_cidr(params[0]);
        if (!block)
          reject("ip_range", "'" + params[0] + "' is not an IPv4 CIDR block");
        Utils::CIDRBlock range = *block;
        return make_filter("ip_range(" + params[0] + ")",
                           [range](const LogEntry &e) {
                             auto ip = Utils::ip_string_to_uint32(e.client_ip);
                             return ip && range.contains(*ip);
                           });
      });

  registry.register_filter(
      "path", "Requests whose path contains the given text",
      [](const std::vector<std::string> &params) {
        expect_params("path", params, 1);
        if (params[0].empty())
          reject("path", "substring must not be empty");
        std::string needle = params[0];
        return make_filter("path(" + needle + ")", [needle](const LogEntry &e) {
          return e.http_request &&
                 e.http_request->path.find(needle) != std::string::npos;
        });
      });

  registry.register_filter(
      "ssl", "Requests received on an SSL frontend",
      [](const std::vector<std::string> &params) {
        expect_params("ssl", params, 0);
        return make_filter("ssl",
                           [](const LogEntry &e) { return e.is_https(); });
      });

  registry.register_filter(
      "status_code", "Requests answered with the given status code",
      [](const std::vector<std::string> &params) {
        expect_params("status_code", params, 1);
        auto code = Utils::string_to_number<int>(params[0]);
        if (!code || *code < 100 || *code > 599)
          reject("status_code", "'" + params[0] + "' is not a status code");
        int wanted = *code;
        return make_filter("status_code(" + params[0] + ")",
                           [wanted](const LogEntry &e) {
                             return e.http_status_code == wanted;
                           });
      });

  registry.register_filter(
      "status_code_family", "Requests whose status is in a class (2 or 2xx)",
      [](const std::vector<std::string> &params) {
        expect_params("status_code_family", params, 1);
        std::string digit = Utils::to_lower_copy(params[0]);
        if (digit.size() == 3 && digit.compare(1, 2, "xx") == 0)
          digit.resize(1);
        auto family = Utils::string_to_number<int>(digit);
        if (!family || *family < 1 || *family > 5)
          reject("status_code_family",
                 "'" + params[0] + "' is not a status class");
        int wanted = *family;
        return make_filter("status_code_family(" + std::to_string(wanted) +
                               "xx)",
                           [wanted](const LogEntry &e) {
                             return e.http_status_code &&
                                    *e.http_status_code / 100 == wanted;
                           });
      });

  registry.register_filter(
      "http_method", "Requests using the given HTTP method",
      [](const std::vector<std::string> &params) {
        expect_params("http_method", params, 1);
        if (params[0].empty())
          reject("http_method", "method must not be empty");
        std::string method = Utils::to_upper_copy(params[0]);
        return make_filter("http_method(" + method + ")",
                           [method](const LogEntry &e) {
                             return e.http_request &&
                                    e.http_request->method == method;
                           });
      });

  registry.register_filter("frontend", "Requests received on the frontend",
                           name_filter("frontend", &LogEntry::frontend));
  registry.register_filter("backend", "Requests routed to the backend",
                           name_filter("backend", &LogEntry::backend));
  registry.register_filter("server", "Requests served by the server",
                           name_filter("server", &LogEntry::server));

  registry.register_filter(
      "slow_requests", "Requests whose total time is at least N ms",
      [](const std::vector<std::string> &params) {
        expect_params("slow_requests", params, 1);
        int64_t threshold = milliseconds_param("slow_requests", params[0]);
        return make_filter("slow_requests(" + params[0] + ")",
                           [threshold](const LogEntry &e) {
                             return e.timers.total_ms &&
                                    *e.timers.total_ms >= threshold;
                           });
      });

  registry.register_filter(
      "wait_on_queues", "Requests that waited at least N ms in queues",
      [](const std::vector<std::string> &params) {
        expect_params("wait_on_queues", params, 1);
        int64_t threshold = milliseconds_param("wait_on_queues", params[0]);
        return make_filter("wait_on_queues(" + params[0] + ")",
                           [threshold](const LogEntry &e) {
                             return e.timers.queue_ms &&
                                    *e.timers.queue_ms >= threshold;
                           });
      });

  registry.register_filter(
      "response_size",
      "Responses bigger than N bytes (N or +N) or smaller (-N)",
      [](const std::vector<std::string> &params) {
        expect_params("response_size", params, 1);
        std::string_view text = params[0];
        bool smaller = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
          smaller = text.front() == '-';
          text.remove_prefix(1);
        }
        auto size = Utils::string_to_number<uint64_t>(text);
        if (!size)
          reject("response_size", "'" + params[0] + "' is not a byte count");
        uint64_t limit = *size;
        return make_filter("response_size(" + params[0] + ")",
                           [limit, smaller](const LogEntry &e) {
                             return smaller ? e.bytes_read < limit
                                            : e.bytes_read > limit;
                           });
      });

  registry.register_filter(
      "termination_state", "Requests whose termination state starts with text",
      [](const std::vector<std::string> &params) {
        expect_params("termination_state", params, 1);
        if (params[0].empty() || params[0].size() > 4)
          reject("termination_state",
                 "'" + params[0] + "' is not a termination state prefix");
        std::string prefix = params[0];
        return make_filter("termination_state(" + prefix + ")",
                           [prefix](const LogEntry &e) {
                             return e.termination_state.compare(
                                        0, prefix.size(), prefix) == 0;
                           });
      });
}
