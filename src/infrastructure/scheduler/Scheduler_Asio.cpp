#include "infrastructure/scheduler/Scheduler_Asio.hpp"

#include <atomic>

using tether::initiator::application::ports::IScheduledTask;
using tether::initiator::application::ports::LogLevel;

namespace tether::initiator::infrastructure::scheduler
{

// -------------------- PeriodicTask --------------------
// Re-arms only after a run returns, so runs of one task never overlap.
class Scheduler_Asio::PeriodicTask final : public IScheduledTask,
                                           public std::enable_shared_from_this<PeriodicTask>
{
 public:
  PeriodicTask(boost::asio::io_context& io, application::ports::ILogger& log,
               std::function<void()> task, std::chrono::milliseconds period)
      : log_(log), timer_(boost::asio::make_strand(io)), task_(std::move(task)), period_(period)
  {
  }

  void start(std::chrono::milliseconds initial_delay)
  {
    boost::asio::post(timer_.get_executor(),
                      [self = shared_from_this(), initial_delay] { self->arm(initial_delay); });
  }

  void cancel() override
  {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    boost::asio::post(timer_.get_executor(), [self = shared_from_this()] { self->timer_.cancel(); });
  }

  bool cancelled() const override { return cancelled_.load(std::memory_order_acquire); }

 private:
  void arm(std::chrono::milliseconds delay)
  {
    if (cancelled()) return;
    timer_.expires_after(delay);
    timer_.async_wait(
        [self = shared_from_this()](const boost::system::error_code& ec)
        {
          if (ec || self->cancelled()) return;
          self->run_once();
          self->arm(self->period_);
        });
  }

  void run_once()
  {
    try
    {
      task_();
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err, std::string("[Scheduler] periodic task failed: ") + e.what());
    }
  }

  application::ports::ILogger& log_;
  boost::asio::steady_timer timer_;
  std::function<void()> task_;
  const std::chrono::milliseconds period_;
  std::atomic<bool> cancelled_{false};
};

// -------------------- Scheduler_Asio --------------------
Scheduler_Asio::Scheduler_Asio(application::ports::ILogger& log, std::size_t threads)
    : log_(log), work_(std::in_place, boost::asio::make_work_guard(io_))
{
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) threads_.emplace_back([this] { io_.run(); });
}

Scheduler_Asio::~Scheduler_Asio()
{
  shutdown();
}

std::shared_ptr<IScheduledTask> Scheduler_Asio::schedule_periodic(std::function<void()> task,
                                                                  std::chrono::milliseconds initial_delay,
                                                                  std::chrono::milliseconds period)
{
  auto t = std::make_shared<PeriodicTask>(io_, log_, std::move(task), period);
  t->start(initial_delay);
  return t;
}

void Scheduler_Asio::shutdown()
{
  work_.reset();
  io_.stop();
  for (auto& th : threads_)
  {
    if (th.joinable() && th.get_id() != std::this_thread::get_id()) th.join();
  }
  threads_.clear();
}

}  // namespace tether::initiator::infrastructure::scheduler
