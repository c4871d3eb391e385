#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace tether::initiator::infrastructure::logging
{

class Logger_Spdlog final : public tether::initiator::application::ports::ILogger
{
 public:
  void init(const tether::initiator::domain::Settings& s) override;

  void app(tether::initiator::application::ports::LogLevel level, const std::string& msg) override;

  void link(tether::initiator::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(tether::initiator::application::ports::LogLevel level);

  void flush();

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> link_;

  // Helpers
  static spdlog::level::level_enum map_level(tether::initiator::application::ports::LogLevel l);
};

}  // namespace tether::initiator::infrastructure::logging
