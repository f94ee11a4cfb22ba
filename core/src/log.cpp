#include "pontoon/core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pontoon::core {

namespace {

constexpr const char* kLoggerName = "pontoon";
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v";

std::shared_ptr<spdlog::logger> create_logger() {
  if (std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto created = std::make_shared<spdlog::logger>(kLoggerName, sink);
  created->set_pattern(kLogPattern);
  created->set_level(spdlog::level::info);
  spdlog::register_logger(created);
  return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = create_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace pontoon::core
