#include "gleaner/logging.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gleaner::log {

namespace {
std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
}

auto configure(const logging_settings& s) -> std::expected<void, core::error> {
  const auto level = spdlog::level::from_str(s.level);
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (level == spdlog::level::off && s.level != "off") {
    return core::make_unexpected(core::error_code::config_invalid, "unknown log level: " + s.level, "log");
  }
  std::shared_ptr<spdlog::logger> logger;
  try {
    if (s.file.empty()) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    } else {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(s.file, /*truncate=*/false);
      logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    }
  } catch (const spdlog::spdlog_ex& e) {
    return core::make_unexpected(core::error_code::config_invalid, e.what(), "log");
  }
  logger->set_level(level);
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  std::lock_guard lock(g_mutex);
  g_logger = std::move(logger);
  return {};
}

auto get() -> std::shared_ptr<spdlog::logger> {
  std::lock_guard lock(g_mutex);
  if (!g_logger) {
    g_logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    g_logger->set_level(spdlog::level::info);
  }
  return g_logger;
}

} // namespace gleaner::log
