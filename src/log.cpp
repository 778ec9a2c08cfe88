#include "stackgit/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stackgit::log {

namespace {
constexpr const auto *kLogFormat = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const auto *kLoggerName = "stackgit";
} // namespace

std::shared_ptr<spdlog::logger> get() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(once, [] {
    logger = spdlog::get(kLoggerName);
    if (!logger) {
      logger = spdlog::stderr_color_mt(kLoggerName);
    }
    logger->set_pattern(kLogFormat);
    logger->set_level(spdlog::level::warn);
  });
  return logger;
}

bool set_level(std::string_view level) {
  const auto lvl = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to "off"
  if (lvl == spdlog::level::off && level != "off") {
    return false;
  }
  get()->set_level(lvl);
  return true;
}

} // namespace stackgit::log
