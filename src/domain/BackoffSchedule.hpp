#pragma once

#include <chrono>
#include <vector>

namespace tether::initiator::domain
{

// Ordered reconnect intervals indexed by consecutive failure count. The last
// entry is a sticky ceiling.
class BackoffSchedule
{
 public:
  // Throws ConfigError if empty or any entry is not positive.
  explicit BackoffSchedule(std::vector<std::chrono::milliseconds> intervals);

  static BackoffSchedule from_seconds(const std::vector<int>& seconds);

  // failure #1 uses entry 0; counts <= 0 also use entry 0.
  std::chrono::milliseconds delay_for(int failure_count) const;

  const std::vector<std::chrono::milliseconds>& intervals() const { return intervals_; }

 private:
  std::vector<std::chrono::milliseconds> intervals_;
};

}  // namespace tether::initiator::domain
