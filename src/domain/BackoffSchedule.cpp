#include "domain/BackoffSchedule.hpp"

#include <string>

#include "domain/Errors.hpp"

namespace tether::initiator::domain
{

BackoffSchedule::BackoffSchedule(std::vector<std::chrono::milliseconds> intervals)
    : intervals_(std::move(intervals))
{
  if (intervals_.empty()) throw ConfigError("reconnect interval list must not be empty");
  for (std::size_t i = 0; i < intervals_.size(); ++i)
  {
    if (intervals_[i].count() <= 0)
      throw ConfigError("reconnect interval #" + std::to_string(i) + " must be positive");
  }
}

BackoffSchedule BackoffSchedule::from_seconds(const std::vector<int>& seconds)
{
  std::vector<std::chrono::milliseconds> v;
  v.reserve(seconds.size());
  for (int s : seconds) v.emplace_back(std::chrono::seconds(s));
  return BackoffSchedule(std::move(v));
}

std::chrono::milliseconds BackoffSchedule::delay_for(int failure_count) const
{
  std::size_t index = failure_count <= 0 ? 0 : static_cast<std::size_t>(failure_count - 1);
  if (index >= intervals_.size()) index = intervals_.size() - 1;
  return intervals_[index];
}

}  // namespace tether::initiator::domain
