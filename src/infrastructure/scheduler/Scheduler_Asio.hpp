#pragma once

#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IScheduler.hpp"

namespace tether::initiator::infrastructure::scheduler
{

// Fixed-delay periodic tasks on a small Asio thread pool.
class Scheduler_Asio final : public tether::initiator::application::ports::IScheduler
{
 public:
  explicit Scheduler_Asio(tether::initiator::application::ports::ILogger& log,
                          std::size_t threads = 1);
  ~Scheduler_Asio() override;

  std::shared_ptr<tether::initiator::application::ports::IScheduledTask> schedule_periodic(
      std::function<void()> task, std::chrono::milliseconds initial_delay,
      std::chrono::milliseconds period) override;

  // Stops the pool; timers still pending never fire.
  void shutdown();

 private:
  class PeriodicTask;

  tether::initiator::application::ports::ILogger& log_;
  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
};

}  // namespace tether::initiator::infrastructure::scheduler
