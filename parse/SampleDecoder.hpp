// Sample decoder: "<name>{<labels>} <value>" -> name, labels, value
#pragma once
#include <promscope/promscope.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace promscope::parse {

struct DecodedSample {
  std::string name;
  Labels      labels;
  double      value = 0;
};

// Either a sample or the reason the line was dropped.
struct DecodeResult {
  std::optional<DecodedSample> sample;
  SkipReason reason = SkipReason::BadSplit; // meaningful only when !ok()

  bool ok() const noexcept { return sample.has_value(); }
};

DecodeResult DecodeSample(std::string_view line);

// Body of a label block, braces excluded: k="v",k2="v2". Last duplicate wins.
bool ParseLabels(std::string_view body, Labels& out);

// Float token incl. +Inf/-Inf/NaN. The whole token must be consumed.
bool ParseValue(std::string_view sv, double& out);

} // namespace promscope::parse
