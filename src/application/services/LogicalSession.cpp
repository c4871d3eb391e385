#include "application/services/LogicalSession.hpp"

using tether::initiator::application::ports::LogLevel;

namespace tether::initiator::application::services
{

LogicalSession::LogicalSession(const domain::Settings::Session& cfg, const ports::IClock& clock,
                               ports::ILogger& log)
    : id_(cfg.id),
      window_(domain::ActivityWindow::parse(cfg.start_time, cfg.end_time)),
      clock_(clock),
      log_(log),
      enabled_(cfg.enabled)
{
}

bool LogicalSession::is_within_activity_window() const
{
  return window_.contains(clock_.now());
}

void LogicalSession::request_activation()
{
  if (!enabled_.exchange(true, std::memory_order_acq_rel))
    log_.app(LogLevel::info, "[" + id_ + "] session enabled");
}

void LogicalSession::request_deactivation()
{
  if (enabled_.exchange(false, std::memory_order_acq_rel))
    log_.app(LogLevel::info, "[" + id_ + "] session disabled");
}

void LogicalSession::on_event(const std::string& msg)
{
  log_.link(LogLevel::info, "[" + id_ + "] " + msg);
}

void LogicalSession::on_error_event(const std::string& msg)
{
  log_.link(LogLevel::err, "[" + id_ + "] " + msg);
}

}  // namespace tether::initiator::application::services
