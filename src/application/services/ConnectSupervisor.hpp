#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "application/ports/IClock.hpp"
#include "application/ports/IConnector.hpp"
#include "application/ports/ISession.hpp"
#include "application/ports/ITransportHandler.hpp"
#include "domain/AddressRotation.hpp"
#include "domain/BackoffSchedule.hpp"
#include "domain/CandidateAddress.hpp"

namespace tether::initiator::application::services
{

struct SupervisorOptions
{
  // Upper bound a single tick may block on a pending connect.
  std::chrono::milliseconds connect_poll_timeout{2000};
};

// Reconnect state machine for one logical session. Driven by periodic tick()
// calls; keeps at most one connect attempt in flight.
class ConnectSupervisor
{
 public:
  using time_point = ports::IClock::time_point;

  ConnectSupervisor(ports::ISession& session, ports::IConnector& connector,
                    ports::ITransportHandler& handler, const ports::IClock& clock,
                    domain::AddressRotation addresses, domain::BackoffSchedule backoff,
                    std::optional<domain::CandidateAddress> local_bind,
                    SupervisorOptions opts = {});

  // Polls the pending attempt, or starts a new one when a reconnect is due.
  // Never throws for per-attempt failures.
  void tick();

  // Waits for a running tick to return; every later tick is a no-op.
  void close();

  // diagnostics
  int connection_failure_count() const;
  time_point last_reconnect_attempt_time() const;
  time_point last_connect_time() const;
  bool is_connecting() const;

  ports::ISession& session() { return session_; }

 private:
  void connect_nolock();
  void poll_pending_nolock();
  void on_connect_failure_nolock(const domain::CandidateAddress& target, const std::exception& e);

  bool should_reconnect_nolock() const;
  bool is_time_for_reconnect_nolock() const;
  std::chrono::milliseconds next_retry_delay_nolock() const;

  ports::ISession& session_;
  ports::IConnector& connector_;
  ports::ITransportHandler& handler_;
  const ports::IClock& clock_;
  const std::optional<domain::CandidateAddress> local_bind_;
  const domain::BackoffSchedule backoff_;
  const SupervisorOptions opts_;

  mutable std::mutex mu_;
  domain::AddressRotation addresses_;
  std::unique_ptr<ports::IConnectAttempt> pending_;
  std::weak_ptr<ports::ITransport> transport_;
  bool closed_{false};
  int failures_{0};
  time_point last_attempt_{};
  time_point last_connect_{};
};

}  // namespace tether::initiator::application::services
