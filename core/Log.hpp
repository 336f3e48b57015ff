// Logging: a single named spdlog logger shared by the library and the CLI
#pragma once
#include <promscope/promscope.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace promscope::log {

inline constexpr const char* kLoggerName = "promscope";

// (Re)build the logger from cfg.log_level / cfg.log_file.
// Returns false on an unknown level or an unopenable log file.
bool Init(const Config& cfg, std::string& err);

// The shared logger; a stderr logger at "warn" until Init() is called.
std::shared_ptr<spdlog::logger> Get();

} // namespace promscope::log
