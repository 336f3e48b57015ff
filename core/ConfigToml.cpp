// TOML config loader using toml++ (header-only)
#include "Config.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <toml++/toml.h>

namespace promscope {

static inline std::string as_string_or(const toml::node_view<toml::node>& nv, const std::string& def) {
  if (!nv) return def;
  if (auto v = nv.value<std::string>()) return *v;
  return def;
}

static inline int64_t as_int_or(const toml::node_view<toml::node>& nv, int64_t def) {
  if (!nv) return def;
  if (auto v = nv.value<int64_t>()) return *v;
  return def;
}

// Narrow after a range check so large values cannot wrap into range.
static bool in_range(int64_t v, int64_t lo, int64_t hi, const char* key,
                     const std::string& path, std::string& err) {
  if (v >= lo && v <= hi) return true;
  err = path + ": " + key + " out of range: " + std::to_string(v);
  return false;
}

bool ParseConfigToml(const std::string& path, Config& out, std::string& err) {
  try {
    auto tbl = toml::parse_file(path);

    if (auto target = tbl["target"]; target.is_table()) {
      int64_t port    = as_int_or(target["port"], out.port);
      int64_t timeout = as_int_or(target["timeout_ms"], out.timeout_ms);
      if (!in_range(port, 1, 65535, "target.port", path, err)) return false;
      if (!in_range(timeout, 0, std::numeric_limits<int>::max(), "target.timeout_ms", path, err)) return false;
      out.host       = as_string_or(target["host"], out.host);
      out.port       = static_cast<int>(port);
      out.path       = as_string_or(target["path"], out.path);
      out.timeout_ms = static_cast<int>(timeout);
    }

    if (auto lg = tbl["log"]; lg.is_table()) {
      out.log_level = as_string_or(lg["level"], out.log_level);
      out.log_file  = as_string_or(lg["file"], out.log_file);
    }

    if (auto display = tbl["display"]; display.is_table()) {
      int64_t w = as_int_or(display["help_width"], static_cast<int64_t>(out.help_width));
      if (w > 0) out.help_width = static_cast<std::size_t>(w);
    }
    return true;
  } catch (const toml::parse_error& e) {
    err = path + ": " + std::string(e.description());
  } catch (const std::exception& e) {
    err = e.what();
  }
  return false;
}

} // namespace promscope
