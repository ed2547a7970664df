#include <pviz/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pviz {

static constexpr const char* kLoggerName = "pviz";

std::shared_ptr<spdlog::logger> log() {
  static const std::shared_ptr<spdlog::logger> logger = []{
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto l = spdlog::stdout_color_mt(kLoggerName);
    l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    l->set_level(spdlog::level::info);
    return l;
  }();
  return logger;
}

void set_log_level(spdlog::level::level_enum level) {
  log()->set_level(level);
}

} // namespace pviz
