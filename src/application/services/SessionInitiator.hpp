#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "application/ports/IClock.hpp"
#include "application/ports/IConnector.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IScheduler.hpp"
#include "application/ports/ISession.hpp"
#include "application/ports/ITransportHandler.hpp"
#include "application/services/ConnectSupervisor.hpp"
#include "domain/Settings.hpp"

namespace tether::initiator::application::services
{

// Starts and stops periodic driving of a ConnectSupervisor and owns the
// connector it dials through.
class SessionInitiator
{
 public:
  // Throws domain::ConfigError on an invalid address list or interval list.
  // The connector arrives fully configured (TLS stage, codec).
  SessionInitiator(const domain::Settings::Initiator& cfg, ports::ISession& session,
                   ports::IScheduler& scheduler, std::unique_ptr<ports::IConnector> connector,
                   ports::ITransportHandler& handler, const ports::IClock& clock,
                   ports::ILogger& log, domain::AddressRotation::Resolver resolver);
  ~SessionInitiator();

  SessionInitiator(const SessionInitiator&) = delete;
  SessionInitiator& operator=(const SessionInitiator&) = delete;

  // No-op once stop() has disposed the connector.
  void start();
  void stop();

  bool is_running() const;

  const ConnectSupervisor& supervisor() const { return *supervisor_; }
  const ports::IConnector& connector() const { return *connector_; }

 private:
  ports::ISession& session_;
  ports::IScheduler& scheduler_;
  ports::ILogger& log_;
  std::unique_ptr<ports::IConnector> connector_;
  std::shared_ptr<ConnectSupervisor> supervisor_;
  const std::chrono::milliseconds period_;

  mutable std::mutex mu_;
  std::shared_ptr<ports::IScheduledTask> reconnect_task_;
};

}  // namespace tether::initiator::application::services
