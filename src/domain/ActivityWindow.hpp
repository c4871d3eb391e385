#pragma once

#include <chrono>
#include <string>

namespace tether::initiator::domain
{

// Daily UTC time-of-day window. Equal bounds mean "always active"; a start
// later than the end wraps over midnight.
class ActivityWindow
{
 public:
  ActivityWindow() = default;
  ActivityWindow(std::chrono::seconds start, std::chrono::seconds end);

  // Parses "HH:MM:SS" pairs. Throws ConfigError.
  static ActivityWindow parse(const std::string& start, const std::string& end);

  bool contains(std::chrono::system_clock::time_point t) const;
  bool always() const { return start_ == end_; }

 private:
  std::chrono::seconds start_{0};
  std::chrono::seconds end_{0};
};

}  // namespace tether::initiator::domain
