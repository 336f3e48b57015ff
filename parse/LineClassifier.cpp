#include "LineClassifier.hpp"

#include <string>
#include <string_view>

namespace promscope::parse {

namespace {

constexpr std::string_view kHelpMarker = "# HELP ";
constexpr std::string_view kTypeMarker = "# TYPE ";

static bool isBlank(std::string_view sv) {
  return sv.find_first_not_of(" \t") == std::string_view::npos;
}

// "<name> <rest>" -> name, rest. False when the separator is missing; the
// name may be empty.
static bool splitMeta(std::string_view sv, std::string_view& name, std::string_view& rest) {
  auto sp = sv.find(' ');
  if (sp == std::string_view::npos) return false;
  name = sv.substr(0, sp);
  rest = sv.substr(sp + 1);
  return true;
}

} // namespace

std::string UnescapeHelp(std::string_view sv) {
  std::string out;
  out.reserve(sv.size());
  for (size_t i = 0; i < sv.size(); ++i) {
    if (sv[i] == '\\' && i + 1 < sv.size()) {
      if (sv[i + 1] == '\\') { out.push_back('\\'); ++i; continue; }
      if (sv[i + 1] == 'n')  { out.push_back('\n'); ++i; continue; }
    }
    out.push_back(sv[i]);
  }
  return out;
}

ClassifiedLine ClassifyLine(std::string_view line) {
  ClassifiedLine out;
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (isBlank(line)) return out;

  const bool help = line.starts_with(kHelpMarker);
  if (help || line.starts_with(kTypeMarker)) {
    std::string_view name, rest;
    if (!splitMeta(line.substr(kHelpMarker.size()), name, rest)) {
      out.reason = SkipReason::BadMetadata;
      return out;
    }
    out.kind = help ? LineKind::Help : LineKind::Type;
    out.name = std::string(name);
    out.text = help ? UnescapeHelp(rest) : std::string(rest);
    return out;
  }
  if (line.front() == '#') return out;

  out.kind = LineKind::Sample;
  out.raw = line;
  return out;
}

} // namespace promscope::parse
