#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace pviz {

// Shared "pviz" logger (stdout, colour), created on first use.
std::shared_ptr<spdlog::logger> log();

// Convenience for hosts: e.g. set_log_level(spdlog::level::debug).
void set_log_level(spdlog::level::level_enum level);

} // namespace pviz
