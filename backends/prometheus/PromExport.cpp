#include "PromExport.hpp"

#include <prometheus/client_metric.h>
#include <prometheus/metric_family.h>
#include <prometheus/metric_type.h>
#include <prometheus/text_serializer.h>

#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promscope::prom {

prometheus::MetricType MetricTypeFromToken(std::string_view token) {
  if (token == "counter") return prometheus::MetricType::Counter;
  if (token == "gauge") return prometheus::MetricType::Gauge;
  return prometheus::MetricType::Untyped;
}

std::vector<prometheus::MetricFamily> ToMetricFamilies(const MetricSnapshot& snap) {
  std::vector<prometheus::MetricFamily> fams;
  std::unordered_map<std::string, size_t> pos; // name -> slot in fams
  for (const auto& s : snap.samples) {
    auto [it, fresh] = pos.try_emplace(s.name, fams.size());
    if (fresh) {
      fams.push_back({});
      auto& f = fams.back();
      f.name = s.name;
      if (auto mit = snap.meta.find(s.name); mit != snap.meta.end()) {
        f.help = mit->second.help;
        f.type = MetricTypeFromToken(mit->second.type);
      }
    }
    auto& f = fams[it->second];
    prometheus::ClientMetric m;
    m.label.reserve(s.labels.size());
    for (const auto& [k, v] : s.labels) m.label.push_back({k, v});
    switch (f.type) {
      case prometheus::MetricType::Counter: m.counter.value = s.value; break;
      case prometheus::MetricType::Gauge:   m.gauge.value = s.value; break;
      default:                              m.untyped.value = s.value; break;
    }
    f.metric.push_back(std::move(m));
  }
  return fams;
}

std::string RenderText(const MetricSnapshot& snap) {
  std::ostringstream out;
  prometheus::TextSerializer serializer;
  serializer.Serialize(out, ToMetricFamilies(snap));
  return out.str();
}

} // namespace promscope::prom
