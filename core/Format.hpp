// Text helpers for terminal output
#pragma once
#include <promscope/promscope.hpp>

#include <cstddef>
#include <string>

namespace promscope {

// Cut `s` to at most `width` bytes plus "...", never splitting a UTF-8 sequence.
std::string TruncateText(const std::string& s, std::size_t width);

// Parse totals and one line per skip reason, newline terminated.
std::string FormatStats(const MetricSnapshot& snap);

} // namespace promscope
