#include "MetricIndex.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace promscope {

namespace {

static inline std::string lower(std::string_view sv) {
  std::string out(sv);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

static inline bool containsLower(std::string_view hay, const std::string& needle_lc) {
  return lower(hay).find(needle_lc) != std::string::npos;
}

} // namespace

std::string PrefixOf(std::string_view name) {
  return std::string(name.substr(0, name.find('_')));
}

MetricIndex::MetricIndex(std::shared_ptr<const MetricSnapshot> snap)
    : snap_(snap ? std::move(snap) : std::make_shared<const MetricSnapshot>()) {}

std::vector<MetricGroup> MetricIndex::GroupByPrefix() const {
  std::vector<MetricGroup> groups;
  std::unordered_map<std::string, size_t> pos; // prefix -> slot in groups
  std::unordered_set<std::string> seen;
  for (const auto& s : snap_->samples) {
    if (!seen.insert(s.name).second) continue;
    auto prefix = PrefixOf(s.name);
    auto [it, fresh] = pos.try_emplace(prefix, groups.size());
    if (fresh) groups.push_back({std::move(prefix), {}});
    groups[it->second].names.push_back(s.name);
  }
  return groups;
}

std::vector<SearchHit> MetricIndex::Search(std::string_view term) const {
  std::vector<SearchHit> hits;
  std::unordered_set<std::string> seen;
  const auto needle = lower(term);
  for (const auto& s : snap_->samples) {
    if (seen.count(s.name)) continue;
    if (!containsLower(s.name, needle) && !containsLower(s.help, needle)) continue;
    seen.insert(s.name);
    hits.push_back({s.name, s.help, s.value});
  }
  return hits;
}

MetricDetails MetricIndex::Details(const std::string& name) const {
  MetricDetails d;
  if (auto it = snap_->meta.find(name); it != snap_->meta.end()) d.meta = it->second;
  for (const auto& s : snap_->samples) {
    if (s.name == name) d.values.push_back({s.value, s.labels});
  }
  return d;
}

std::vector<std::string> MetricIndex::Names() const {
  std::set<std::string> names;
  for (const auto& s : snap_->samples) names.insert(s.name);
  return {names.begin(), names.end()};
}

} // namespace promscope
