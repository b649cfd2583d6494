// xaml_bridge/basic/logging.cpp - Library logger
#include "xaml_bridge/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace xaml_bridge
{

namespace
{

constexpr const char * k_logger_name = "xaml_bridge";

std::mutex & logger_mutex()
{
  static std::mutex m;
  return m;
}

std::shared_ptr<spdlog::logger> & logger_slot()
{
  static std::shared_ptr<spdlog::logger> slot;
  return slot;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger()
{
  const std::lock_guard<std::mutex> lock(logger_mutex());
  auto & slot = logger_slot();
  if (!slot) {
    slot = spdlog::get(k_logger_name);
    if (!slot) {
      slot = spdlog::stderr_color_mt(k_logger_name);
      slot->set_level(spdlog::level::warn);
      slot->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
  }
  return slot;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement)
{
  const std::lock_guard<std::mutex> lock(logger_mutex());
  logger_slot() = std::move(replacement);
}

void set_log_level(std::string_view level)
{
  logger()->set_level(spdlog::level::from_str(std::string(level)));
}

}  // namespace xaml_bridge
