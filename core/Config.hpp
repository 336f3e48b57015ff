// Config file loading (TOML)
#pragma once
#include <promscope/promscope.hpp>

#include <string>

namespace promscope {

// Overlay values from a TOML file onto `out`; keys that are absent or of the
// wrong type keep the value already in `out`. Returns false on failure.
//
//   [target]  host, port, path, timeout_ms
//   [log]     level, file
//   [display] help_width
bool ParseConfigToml(const std::string& path, Config& out, std::string& err);

} // namespace promscope
