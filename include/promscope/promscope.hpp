#pragma once
// promscope-cpp public API
// - Parses Prometheus text exposition into immutable snapshots
// - Grouping, search and detail queries over one snapshot
// - Explorer binds a text source (HTTP /metrics or a file) to a refreshable index

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promscope {

struct Config {
  std::string host = "localhost";  // scrape target host
  int         port = 9100;         // scrape target port
  std::string path = "/metrics";   // scrape path
  int         timeout_ms = 5000;   // socket send/recv timeout; 0 = none
  std::string log_level = "warn";  // spdlog level name
  std::string log_file;            // optional log file, stderr only when empty
  std::size_t help_width = 100;    // help text truncation in tables
};

using Labels = std::map<std::string, std::string>;

struct MetricSample {
  std::string name;
  double      value = 0;
  Labels      labels;
  std::string help; // HELP text active when the sample was parsed
};

struct MetricMeta {
  std::string help;
  std::string type; // TYPE token, empty if none was seen
};

enum class SkipReason {
  BadSplit,    // not exactly "<name/labels> <value>"
  EmptyName,   // label block without a metric name
  BadLabels,   // unterminated or malformed label block
  BadValue,    // value token is not a float
  BadMetadata, // HELP/TYPE line without name or text separator
};

const char* ToString(SkipReason reason) noexcept;

struct ParseStats {
  std::size_t lines = 0;
  std::size_t samples = 0;
  std::size_t skipped = 0;
  std::map<SkipReason, std::size_t> skipped_by_reason;
};

// Result of one parse pass. Never mutated once built.
struct MetricSnapshot {
  std::vector<MetricSample> samples;          // document order
  std::map<std::string, MetricMeta> meta;     // first-seen HELP/TYPE per name
  ParseStats stats;
};

// Query results
struct MetricGroup {
  std::string prefix;
  std::vector<std::string> names; // first-seen order, distinct
};

struct SearchHit {
  std::string name;
  std::string help;
  double      value = 0;
};

struct MetricValue {
  double value = 0;
  Labels labels;
};

struct MetricDetails {
  std::optional<MetricMeta> meta; // absent for names the snapshot never saw
  std::vector<MetricValue> values;
};

// Parse a full exposition document. Malformed lines are skipped and counted.
std::shared_ptr<const MetricSnapshot> ParseExposition(std::string_view text);

class TextSource;
class MetricIndex;

// Explorer: one text source plus the index built from its last fetch.
// The index is loaded on the first query and kept until Refresh().
// Not thread-safe; indexes handed out stay valid after a refresh.
class Explorer {
 public:
  explicit Explorer(std::unique_ptr<TextSource> source);
  ~Explorer();
  Explorer(const Explorer&) = delete;
  Explorer& operator=(const Explorer&) = delete;

  // Fetch and parse now. On failure the previous index is kept.
  bool Refresh(std::string& err);
  // Current index, fetching first if none was loaded. Null on fetch failure.
  std::shared_ptr<const MetricIndex> Index(std::string& err);
  std::shared_ptr<const MetricIndex> Current() const noexcept { return index_; }

  bool ListGroups(std::vector<MetricGroup>& out, std::string& err);
  bool Search(std::string_view term, std::vector<SearchHit>& out, std::string& err);
  bool Details(const std::string& name, MetricDetails& out, std::string& err);

  std::string Describe() const;

 private:
  std::unique_ptr<TextSource> source_;
  std::shared_ptr<const MetricIndex> index_;
};

} // namespace promscope
