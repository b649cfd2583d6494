// xaml_bridge/basic/logging.hpp - Library logger (spdlog)
//
// All components log through one named spdlog logger ("xaml_bridge").
// Hosts may replace it with their own sinks via set_logger().
//
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>
#include <utility>

namespace xaml_bridge
{

/// Logger used by the library (created lazily with a stderr color sink)
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger
void set_logger(std::shared_ptr<spdlog::logger> replacement);

/// Set the minimum level ("trace", "debug", "info", "warn", "error", "off")
void set_log_level(std::string_view level);

template <typename... Args>
void log_trace(spdlog::format_string_t<Args...> fmt, Args &&... args)
{
  logger()->trace(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_debug(spdlog::format_string_t<Args...> fmt, Args &&... args)
{
  logger()->debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(spdlog::format_string_t<Args...> fmt, Args &&... args)
{
  logger()->info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(spdlog::format_string_t<Args...> fmt, Args &&... args)
{
  logger()->warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(spdlog::format_string_t<Args...> fmt, Args &&... args)
{
  logger()->error(fmt, std::forward<Args>(args)...);
}

}  // namespace xaml_bridge
