// Snapshot -> prometheus-cpp data model, and back to exposition text
#pragma once
#include <promscope/promscope.hpp>

#include <prometheus/metric_family.h>
#include <prometheus/metric_type.h>

#include <string>
#include <string_view>
#include <vector>

namespace promscope::prom {

// "counter" / "gauge" map to their MetricType; anything else is Untyped,
// histograms and summaries included since their samples are kept flat.
prometheus::MetricType MetricTypeFromToken(std::string_view token);

// One family per distinct sample name, in first-seen order, each sample a
// ClientMetric. Help and type come from the snapshot metadata.
std::vector<prometheus::MetricFamily> ToMetricFamilies(const MetricSnapshot& snap);

// Re-render a snapshot through prometheus::TextSerializer.
std::string RenderText(const MetricSnapshot& snap);

} // namespace promscope::prom
