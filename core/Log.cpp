// spdlog setup: stderr colour sink, optional file sink
#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace promscope::log {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::mutex& Mu() {
  static std::mutex mu;
  return mu;
}

} // namespace

bool Init(const Config& cfg, std::string& err) {
  auto level = spdlog::level::from_str(cfg.log_level);
  if (level == spdlog::level::off && cfg.log_level != "off") {
    err = "unknown log level: " + cfg.log_level;
    return false;
  }
  try {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!cfg.log_file.empty()) {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file, false));
    }
    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    lg->set_level(level);
    lg->set_pattern(kPattern);
    lg->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lk(Mu());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(lg);
    return true;
  } catch (const spdlog::spdlog_ex& e) {
    err = e.what();
  }
  return false;
}

std::shared_ptr<spdlog::logger> Get() {
  if (auto lg = spdlog::get(kLoggerName)) return lg;
  std::lock_guard<std::mutex> lk(Mu());
  if (auto lg = spdlog::get(kLoggerName)) return lg;
  auto lg = spdlog::stderr_color_mt(kLoggerName);
  lg->set_level(spdlog::level::warn);
  lg->set_pattern(kPattern);
  return lg;
}

} // namespace promscope::log
