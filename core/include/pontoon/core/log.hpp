#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace pontoon::core {

// Shared "pontoon" logger, created on first use with a colour stdout sink.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace pontoon::core
