#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

// Owns one prometheus registry for the lifetime of a run. Metrics are
// exported as a text exposition file rather than over HTTP.
class MetricsRegistry {
public:
  MetricsRegistry();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help,
                        const std::map<std::string, std::string> &labels = {});

  std::string serialize_text() const;

  // Writes the exposition next to `path` then renames it into place, so a
  // node_exporter textfile collector never sees a half written file.
  void write_textfile(const std::string &path) const;

private:
  std::shared_ptr<prometheus::Registry> registry_;
};

#endif // METRICS_REGISTRY_HPP
