#include "util/log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace masterprint {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get("masterprint");
    if (!instance) {
      instance = spdlog::stderr_color_mt("masterprint");
      instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      instance->set_level(spdlog::level::info);
    }
  });
  return instance;
}

void set_log_level(const std::string& level) {
  logger()->set_level(spdlog::level::from_str(level));
}

}  // namespace masterprint
