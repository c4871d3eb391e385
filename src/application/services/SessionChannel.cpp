#include "application/services/SessionChannel.hpp"

#include <string>
#include <utility>

namespace tether::initiator::application::services
{

void SessionChannel::on_established(std::shared_ptr<ports::ITransport> transport)
{
  if (!session_.is_enabled())
  {
    session_.log().on_event("Discarding stale connection to " + transport->remote_endpoint() +
                            " (session disabled)");
    transport->close();
    return;
  }

  std::shared_ptr<ports::ITransport> previous;
  {
    std::lock_guard<std::mutex> lk(mu_);
    previous = std::exchange(current_, transport);
  }
  if (previous) previous->close();

  std::weak_ptr<ports::ITransport> weak = transport;
  transport->start(
      [this](std::span<const std::byte> frame)
      {
        frames_.fetch_add(1, std::memory_order_relaxed);
        session_.log().on_event("frame received (" + std::to_string(frame.size()) + " bytes)");
      },
      [this, weak](const std::string& reason)
      {
        session_.log().on_event("Disconnected: " + reason);
        auto closed = weak.lock();
        std::lock_guard<std::mutex> lk(mu_);
        if (closed && current_ == closed) current_.reset();
      });
}

std::shared_ptr<ports::ITransport> SessionChannel::current() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return current_;
}

}  // namespace tether::initiator::application::services
