#include "application/services/ConnectSupervisor.hpp"

#include <string>

#include "domain/Errors.hpp"

using tether::initiator::domain::ConnectErrorKind;
using tether::initiator::domain::TransientConnectError;

namespace tether::initiator::application::services
{

namespace
{
long long ms_between(ConnectSupervisor::time_point from, ConnectSupervisor::time_point to)
{
  return static_cast<long long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}
}  // namespace

ConnectSupervisor::ConnectSupervisor(ports::ISession& session, ports::IConnector& connector,
                                     ports::ITransportHandler& handler, const ports::IClock& clock,
                                     domain::AddressRotation addresses,
                                     domain::BackoffSchedule backoff,
                                     std::optional<domain::CandidateAddress> local_bind,
                                     SupervisorOptions opts)
    : session_(session),
      connector_(connector),
      handler_(handler),
      clock_(clock),
      local_bind_(std::move(local_bind)),
      backoff_(std::move(backoff)),
      opts_(opts),
      addresses_(std::move(addresses))
{
}

// -------------------- tick --------------------
void ConnectSupervisor::tick()
{
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return;
  if (!pending_)
  {
    if (should_reconnect_nolock()) connect_nolock();
  }
  else
  {
    poll_pending_nolock();
  }
}

void ConnectSupervisor::close()
{
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  pending_.reset();
}

void ConnectSupervisor::connect_nolock()
{
  last_attempt_ = clock_.now();
  const domain::CandidateAddress target = addresses_.next();
  try
  {
    pending_ = connector_.connect(target, local_bind_);
  }
  catch (const std::exception& e)
  {
    on_connect_failure_nolock(target, e);
    return;
  }
  // loopback and LAN connects usually finish right away
  poll_pending_nolock();
}

void ConnectSupervisor::poll_pending_nolock()
{
  const domain::CandidateAddress target = pending_->target();
  std::shared_ptr<ports::ITransport> transport;
  try
  {
    transport = pending_->poll(opts_.connect_poll_timeout);
  }
  catch (const std::exception& e)
  {
    on_connect_failure_nolock(target, e);
    return;
  }

  if (!transport)
  {
    session_.log().on_event("Pending connection not established after " +
                            std::to_string(ms_between(last_attempt_, clock_.now())) + " ms.");
    return;
  }

  failures_ = 0;
  last_connect_ = clock_.now();
  pending_.reset();
  transport_ = transport;
  session_.log().on_event("Connected to " + target.to_string());
  handler_.on_established(std::move(transport));
}

void ConnectSupervisor::on_connect_failure_nolock(const domain::CandidateAddress& target,
                                                  const std::exception& e)
{
  ++failures_;
  addresses_.mark_unresolved(target);
  pending_.reset();

  const std::string next_retry =
      " (Next retry in " + std::to_string(next_retry_delay_nolock().count()) + " milliseconds)";

  auto* ce = dynamic_cast<const TransientConnectError*>(&e);
  if (ce && ce->kind() == ConnectErrorKind::network)
  {
    session_.log().on_error_event(ce->category() + " during connection to " + target.to_string() +
                                  ": " + ce->what() + next_retry);
  }
  else
  {
    session_.log().on_error_event("Exception during connection to " + target.to_string() +
                                  next_retry + ": " + e.what());
  }
}

// -------------------- policy --------------------
bool ConnectSupervisor::should_reconnect_nolock() const
{
  auto live = transport_.lock();
  return (!live || !live->is_connected()) && is_time_for_reconnect_nolock() &&
         session_.is_enabled() && session_.is_within_activity_window();
}

bool ConnectSupervisor::is_time_for_reconnect_nolock() const
{
  return clock_.now() - last_attempt_ >= next_retry_delay_nolock();
}

std::chrono::milliseconds ConnectSupervisor::next_retry_delay_nolock() const
{
  return backoff_.delay_for(failures_);
}

// -------------------- diagnostics --------------------
int ConnectSupervisor::connection_failure_count() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return failures_;
}

ConnectSupervisor::time_point ConnectSupervisor::last_reconnect_attempt_time() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return last_attempt_;
}

ConnectSupervisor::time_point ConnectSupervisor::last_connect_time() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return last_connect_;
}

bool ConnectSupervisor::is_connecting() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return pending_ != nullptr;
}

}  // namespace tether::initiator::application::services
