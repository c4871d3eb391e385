#include "domain/ActivityWindow.hpp"

#include <cstdio>

#include "domain/Errors.hpp"

namespace tether::initiator::domain
{

namespace
{
constexpr std::chrono::seconds kDay{24 * 60 * 60};

std::chrono::seconds parse_time_of_day(const std::string& s)
{
  int h = 0, m = 0, sec = 0;
  char tail = 0;
  if (std::sscanf(s.c_str(), "%d:%d:%d%c", &h, &m, &sec, &tail) != 3 || h < 0 || h > 23 || m < 0 ||
      m > 59 || sec < 0 || sec > 59)
    throw ConfigError("invalid time of day '" + s + "' (expected HH:MM:SS)");
  return std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(sec);
}
}  // namespace

ActivityWindow::ActivityWindow(std::chrono::seconds start, std::chrono::seconds end)
    : start_(start % kDay), end_(end % kDay)
{
}

ActivityWindow ActivityWindow::parse(const std::string& start, const std::string& end)
{
  return ActivityWindow(parse_time_of_day(start), parse_time_of_day(end));
}

bool ActivityWindow::contains(std::chrono::system_clock::time_point t) const
{
  if (always()) return true;

  const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch());
  auto tod = since_epoch % kDay;
  if (tod.count() < 0) tod += kDay;

  if (start_ < end_) return tod >= start_ && tod < end_;
  return tod >= start_ || tod < end_;
}

}  // namespace tether::initiator::domain
