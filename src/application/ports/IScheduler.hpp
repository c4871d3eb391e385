#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace tether::initiator::application::ports
{

struct IScheduledTask
{
  virtual ~IScheduledTask() = default;
  // Prevents future runs; a run already in progress completes.
  virtual void cancel() = 0;
  virtual bool cancelled() const = 0;
};

struct IScheduler
{
  virtual ~IScheduler() = default;

  virtual std::shared_ptr<IScheduledTask> schedule_periodic(std::function<void()> task,
                                                            std::chrono::milliseconds initial_delay,
                                                            std::chrono::milliseconds period) = 0;
};

}  // namespace tether::initiator::application::ports
