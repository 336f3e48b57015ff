// Explorer: lazy first load, explicit refresh, query pass-through
#include <promscope/promscope.hpp>

#include "core/Log.hpp"
#include "fetch/TextSource.hpp"
#include "index/MetricIndex.hpp"
#include "parse/TextParser.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace promscope {

Explorer::Explorer(std::unique_ptr<TextSource> source) : source_(std::move(source)) {}

Explorer::~Explorer() = default;

std::string Explorer::Describe() const {
  return source_ ? source_->Describe() : std::string{"<none>"};
}

bool Explorer::Refresh(std::string& err) {
  if (!source_) { err = "no metrics source configured"; return false; }
  std::string text;
  if (!source_->Fetch(text, err)) return false;
  index_ = std::make_shared<const MetricIndex>(parse::ParseTextExposition(text));
  log::Get()->info("loaded {} samples from {}", index_->Snapshot().samples.size(), source_->Describe());
  return true;
}

std::shared_ptr<const MetricIndex> Explorer::Index(std::string& err) {
  if (!index_ && !Refresh(err)) return nullptr;
  return index_;
}

bool Explorer::ListGroups(std::vector<MetricGroup>& out, std::string& err) {
  auto idx = Index(err);
  if (!idx) return false;
  out = idx->GroupByPrefix();
  return true;
}

bool Explorer::Search(std::string_view term, std::vector<SearchHit>& out, std::string& err) {
  auto idx = Index(err);
  if (!idx) return false;
  out = idx->Search(term);
  return true;
}

bool Explorer::Details(const std::string& name, MetricDetails& out, std::string& err) {
  auto idx = Index(err);
  if (!idx) return false;
  out = idx->Details(name);
  return true;
}

} // namespace promscope
