#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string>

namespace tether::initiator::application::ports
{

// Established byte stream, already wired with TLS (when enabled) and the
// frame codec.
struct ITransport
{
  using FrameHandler = std::function<void(std::span<const std::byte>)>;
  using CloseHandler = std::function<void(const std::string& reason)>;

  virtual ~ITransport() = default;

  // Starts the read loop. Handlers run on the transport's I/O thread.
  virtual void start(FrameHandler on_frame, CloseHandler on_closed) = 0;

  virtual void send(std::span<const std::byte> payload) = 0;
  virtual void close() = 0;
  virtual bool is_connected() const = 0;
  virtual std::string remote_endpoint() const = 0;
};

}  // namespace tether::initiator::application::ports
