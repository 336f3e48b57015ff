#include "TextParser.hpp"
#include "LineClassifier.hpp"
#include "SampleDecoder.hpp"
#include "core/Log.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace promscope {

const char* ToString(SkipReason reason) noexcept {
  switch (reason) {
    case SkipReason::BadSplit:    return "bad_split";
    case SkipReason::EmptyName:   return "empty_name";
    case SkipReason::BadLabels:   return "bad_labels";
    case SkipReason::BadValue:    return "bad_value";
    case SkipReason::BadMetadata: return "bad_metadata";
  }
  return "unknown";
}

std::shared_ptr<const MetricSnapshot> ParseExposition(std::string_view text) {
  return parse::ParseTextExposition(text);
}

namespace parse {

namespace {

static void countSkip(ParseStats& st, SkipReason reason) {
  ++st.skipped;
  ++st.skipped_by_reason[reason];
}

} // namespace

std::shared_ptr<const MetricSnapshot> ParseTextExposition(std::string_view text) {
  auto snap = std::make_shared<MetricSnapshot>();
  auto& st = snap->stats;
  std::string cur_help;
  std::string cur_type;

  while (!text.empty()) {
    auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
    ++st.lines;

    auto cl = ClassifyLine(line);
    switch (cl.kind) {
      case LineKind::Help:
        cur_help = std::move(cl.text);
        break;
      case LineKind::Type:
        cur_type = std::move(cl.text);
        break;
      case LineKind::Skip:
        if (cl.reason) countSkip(st, *cl.reason);
        break;
      case LineKind::Sample: {
        auto res = DecodeSample(cl.raw);
        if (!res.ok()) { countSkip(st, res.reason); break; }
        auto& d = *res.sample;
        // first sample of a name pins its metadata
        snap->meta.try_emplace(d.name, MetricMeta{cur_help, cur_type});
        snap->samples.push_back({std::move(d.name), d.value, std::move(d.labels), cur_help});
        ++st.samples;
        break;
      }
    }
  }

  log::Get()->debug("parsed {} lines: {} samples, {} metrics, {} skipped",
                    st.lines, st.samples, snap->meta.size(), st.skipped);
  return snap;
}

} // namespace parse

} // namespace promscope
