#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace tether::initiator::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const tether::initiator::domain::Settings& s) = 0;
  // lifecycle, configuration
  virtual void app(LogLevel level, const std::string& msg) = 0;
  // connect attempts, transports, session events
  virtual void link(LogLevel level, std::string_view msg) = 0;
};

}  // namespace tether::initiator::application::ports
