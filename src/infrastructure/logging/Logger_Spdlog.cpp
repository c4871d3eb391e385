#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/filesystem.hpp>
#include <chrono>
#include <vector>

namespace fs = boost::filesystem;
using tether::initiator::application::ports::LogLevel;

namespace tether::initiator::infrastructure::logging {

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts ports::LogLevel to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m";
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - Rotating file sinks for the "app" and "link" channels.
//  - Colored console sink when settings.showConsole is true.
//  - Async loggers on the shared spdlog thread pool.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const tether::initiator::domain::Settings& s) {
  const fs::path dir      = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath  = dir / (s.appLogFilename.empty()  ? "initiator_app.log"  : s.appLogFilename);
  const fs::path linkPath = dir / (s.linkLogFilename.empty() ? "initiator_link.log" : s.linkLogFilename);

  boost::system::error_code ec;
  fs::create_directories(dir, ec);

  // Re-init: drop old named loggers if they exist
  if (auto prev = spdlog::get("app"))  spdlog::drop(prev->name());
  if (auto prev = spdlog::get("link")) spdlog::drop(prev->name());

  auto app_file  = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), 5 * 1024 * 1024, 3);
  auto link_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(linkPath.string(), 5 * 1024 * 1024, 3);
  app_file->set_level(spdlog::level::trace);
  link_file->set_level(spdlog::level::trace);

  std::vector<spdlog::sink_ptr> app_sinks{app_file};
  std::vector<spdlog::sink_ptr> link_sinks{link_file};

  if (s.showConsole) {
    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    configure_console_colors_(console_sink);
    console_sink->set_level(spdlog::level::debug);
    app_sinks.push_back(console_sink);
    link_sinks.push_back(console_sink);
  }

  const size_t qsize   = 8192;
  const size_t workers = 1;
  if (!spdlog::thread_pool()) spdlog::init_thread_pool(qsize, workers);

  app_  = std::make_shared<spdlog::async_logger>("app",  app_sinks.begin(),  app_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  link_ = std::make_shared<spdlog::async_logger>("link", link_sinks.begin(), link_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(link_);

  // ONLY console renders colors between %^ and %$.
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  link_->set_pattern(pattern);

  app_->set_level(spdlog::level::trace);
  link_->set_level(spdlog::level::trace);

  app_->flush_on(spdlog::level::err);
  link_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::link(LogLevel level, std::string_view msg) {
  if (link_) link_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both channels at runtime.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)  app_->set_level(lv);
  if (link_) link_->set_level(lv);
}

void Logger_Spdlog::flush() {
  if (app_)  app_->flush();
  if (link_) link_->flush();
}

} // namespace tether::initiator::infrastructure::logging
