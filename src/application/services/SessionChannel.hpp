#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "application/ports/ISession.hpp"
#include "application/ports/ITransportHandler.hpp"

namespace tether::initiator::application::services
{

// Per-connection handler: takes over transports handed off by the
// supervisor. A transport arriving after the session was disabled is stale
// and gets closed immediately.
class SessionChannel final : public ports::ITransportHandler
{
 public:
  explicit SessionChannel(ports::ISession& session) : session_(session) {}

  void on_established(std::shared_ptr<ports::ITransport> transport) override;

  std::shared_ptr<ports::ITransport> current() const;
  uint64_t frames_received() const { return frames_.load(std::memory_order_relaxed); }

 private:
  ports::ISession& session_;
  mutable std::mutex mu_;
  std::shared_ptr<ports::ITransport> current_;
  std::atomic<uint64_t> frames_{0};
};

}  // namespace tether::initiator::application::services
