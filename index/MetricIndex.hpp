// MetricIndex: read-only queries over one parsed snapshot
#pragma once
#include <promscope/promscope.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace promscope {

class MetricIndex {
 public:
  // A null snapshot behaves as an empty one.
  explicit MetricIndex(std::shared_ptr<const MetricSnapshot> snap);

  // Names bucketed by the token before their first '_', prefixes and names
  // in first-seen order, names distinct.
  std::vector<MetricGroup> GroupByPrefix() const;

  // Case-insensitive substring match on name or help text. One hit per name,
  // taken from the first matching sample in document order.
  std::vector<SearchHit> Search(std::string_view term) const;

  // Metadata (absent for unknown names) plus every sample value of `name`.
  MetricDetails Details(const std::string& name) const;

  // Sorted distinct metric names.
  std::vector<std::string> Names() const;

  const MetricSnapshot& Snapshot() const noexcept { return *snap_; }
  bool Empty() const noexcept { return snap_->samples.empty(); }

 private:
  std::shared_ptr<const MetricSnapshot> snap_;
};

// Group key of a metric name: text before the first '_', or the whole name.
std::string PrefixOf(std::string_view name);

} // namespace promscope
