#include "metrics_registry.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <cstdio>
#include <fstream>
#include <prometheus/text_serializer.h>
#include <sstream>

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  return histogram_family.Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &MetricsRegistry::create_counter_family(
    const std::string &name, const std::string &help,
    const std::map<std::string, std::string> &labels) {

  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Labels(labels)
      .Register(*registry_);
}

std::string MetricsRegistry::serialize_text() const {
  std::ostringstream out;
  prometheus::TextSerializer serializer;
  serializer.Serialize(out, registry_->Collect());
  return out.str();
}

void MetricsRegistry::write_textfile(const std::string &path) const {
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Cannot open metrics file " << tmp_path);
      throw ResourceError("cannot write metrics file: " + tmp_path);
    }
    out << serialize_text();
    if (!out.flush()) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Write to metrics file " << tmp_path << " failed");
      throw ResourceError("cannot write metrics file: " + tmp_path);
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Cannot move metrics file into place at " << path);
    throw ResourceError("cannot write metrics file: " + path);
  }
  LOG(LogLevel::INFO, LogComponent::METRICS, "Wrote metrics to " << path);
}
