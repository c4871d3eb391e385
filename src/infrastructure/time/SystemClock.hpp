#pragma once

#include "application/ports/IClock.hpp"

namespace tether::initiator::infrastructure::time
{

class SystemClock final : public tether::initiator::application::ports::IClock
{
 public:
  time_point now() const override { return std::chrono::system_clock::now(); }
};

}  // namespace tether::initiator::infrastructure::time
