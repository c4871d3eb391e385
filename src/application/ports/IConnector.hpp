#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "application/ports/ITransport.hpp"
#include "domain/CandidateAddress.hpp"

namespace tether::initiator::application::ports
{

// One outstanding connect.
struct IConnectAttempt
{
  virtual ~IConnectAttempt() = default;

  // Waits at most `timeout`. Returns the transport once established, nullptr
  // while still pending. Throws domain::TransientConnectError on failure.
  virtual std::shared_ptr<ITransport> poll(std::chrono::milliseconds timeout) = 0;

  virtual const tether::initiator::domain::CandidateAddress& target() const = 0;
};

struct IConnector
{
  virtual ~IConnector() = default;

  // Non-blocking. Throws domain::TransientConnectError if the connect cannot
  // even be issued.
  virtual std::unique_ptr<IConnectAttempt> connect(
      const tether::initiator::domain::CandidateAddress& target,
      const std::optional<tether::initiator::domain::CandidateAddress>& local_bind) = 0;

  // Aborts in-flight attempts and releases every socket and thread. Idempotent.
  virtual void dispose() = 0;
  virtual bool is_disposed() const = 0;
};

}  // namespace tether::initiator::application::ports
