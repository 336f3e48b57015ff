// Line classifier: sorts exposition lines into HELP / TYPE / SAMPLE / SKIP
#pragma once
#include <promscope/promscope.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace promscope::parse {

enum class LineKind { Help, Type, Sample, Skip };

struct ClassifiedLine {
  LineKind kind = LineKind::Skip;
  std::string name;                 // Help/Type: metric the line refers to
  std::string text;                 // Help: unescaped help text; Type: type token
  std::string_view raw;             // Sample: line without trailing '\r'
  std::optional<SkipReason> reason; // Skip: set only for malformed HELP/TYPE
};

// Classify one line (without its '\n'). `raw` views into `line`.
ClassifiedLine ClassifyLine(std::string_view line);

// Undo the HELP escapes "\\" and "\n"; other backslashes are kept verbatim.
std::string UnescapeHelp(std::string_view sv);

} // namespace promscope::parse
