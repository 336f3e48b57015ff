#include "Format.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>

namespace promscope {

std::string TruncateText(const std::string& s, std::size_t width) {
  if (s.size() <= width) return s;
  std::size_t cut = width;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return s.substr(0, cut) + "...";
}

std::string FormatStats(const MetricSnapshot& snap) {
  std::string out = fmt::format("{} lines, {} samples, {} metrics, {} skipped\n",
                                snap.stats.lines, snap.stats.samples, snap.meta.size(), snap.stats.skipped);
  for (const auto& [reason, n] : snap.stats.skipped_by_reason) {
    out += fmt::format("  skipped {}: {}\n", ToString(reason), n);
  }
  return out;
}

} // namespace promscope
