#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace rwd::common {

bool Logger::_bInitialized = false;

bool Logger::isValidLevel(const std::string& sLevel) {
  return sLevel == "off" || spdlog::level::from_str(sLevel) != spdlog::level::off;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  if (!isValidLevel(sLevel)) {
    throw std::invalid_argument("Unknown log level: " + sLevel);
  }
  return spdlog::level::from_str(sLevel);
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);
  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(level);
    return;
  }

  // stderr only: stdout carries the rollback tables and plans
  auto spLogger = spdlog::stderr_color_mt("rewind");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace rwd::common
