#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <fstream>
#include <spdlog/common.h>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

using tether::initiator::application::ports::LogLevel;
using tether::initiator::domain::Settings;
using tether::initiator::infrastructure::logging::Logger_Spdlog;
namespace fs = boost::filesystem;

static fs::path tmp_dir(const std::string& name)
{
  auto dir = fs::temp_directory_path() / ("tether-initiator-logs-" + name);
  fs::create_directories(dir);
  return dir;
}

TEST(LoggerSpdlog, CreatesFilesAndIsIdempotent)
{
  Settings s;
  auto dir = tmp_dir("smoke");
  s.logsDir = dir.string();
  s.appLogFilename = "app.log";
  s.linkLogFilename = "link.log";
  s.showConsole = false;

  Logger_Spdlog log;
  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.app(LogLevel::info, "hello app"));
  EXPECT_NO_THROW(log.link(LogLevel::info, "hello link"));
  log.flush();

  EXPECT_TRUE(fs::exists(dir / "app.log"));
  EXPECT_TRUE(fs::exists(dir / "link.log"));

  EXPECT_NO_THROW(log.init(s));
  EXPECT_NO_THROW(log.set_level(LogLevel::warn));
  EXPECT_NO_THROW(log.link(LogLevel::debug, "filtered"));
}

TEST(LoggerSpdlog, LoggingBeforeInitIsHarmless)
{
  Logger_Spdlog log;
  EXPECT_NO_THROW(log.app(LogLevel::info, "early"));
  EXPECT_NO_THROW(log.link(LogLevel::err, "early"));
}

TEST(LoggerSpdlog, UnusableLogDirectoryIsReportedNotFatal)
{
  auto dir = tmp_dir("blocked");
  const auto blocker = dir / "not-a-dir";
  std::ofstream(blocker.string()) << "x";

  Settings s;
  s.logsDir = (blocker / "logs").string();
  s.showConsole = false;

  Logger_Spdlog log;
  EXPECT_THROW(log.init(s), spdlog::spdlog_ex);
  EXPECT_NO_THROW(log.app(LogLevel::info, "still usable"));
}
