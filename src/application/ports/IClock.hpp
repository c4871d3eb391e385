#pragma once

#include <chrono>

namespace tether::initiator::application::ports
{

struct IClock
{
  using time_point = std::chrono::system_clock::time_point;

  virtual ~IClock() = default;
  virtual time_point now() const = 0;
};

}  // namespace tether::initiator::application::ports
