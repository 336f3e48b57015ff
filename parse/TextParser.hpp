// Exposition parser: text -> MetricSnapshot (samples, first-seen metadata, stats)
#pragma once
#include <promscope/promscope.hpp>

#include <memory>
#include <string_view>

namespace promscope::parse {

// Best-effort single pass. HELP/TYPE set a running context that applies to
// every later sample, whatever its name; it is not keyed per metric.
// Lines that fail to decode are dropped and counted in stats.
std::shared_ptr<const MetricSnapshot> ParseTextExposition(std::string_view text);

} // namespace promscope::parse
