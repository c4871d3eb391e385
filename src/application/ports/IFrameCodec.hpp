#pragma once
#include <vector>
#include <span>
#include <cstddef>

namespace tether::initiator::application::ports {

  // Application wire codec installed in every transport after the TLS stage.
  struct IFrameCodec {
    virtual ~IFrameCodec() = default;

    // Consumes as many complete frames as available; returns bytes consumed.
    virtual std::size_t feed(std::span<const std::byte> in,
                             std::vector<std::vector<std::byte>>& out) = 0;

    virtual std::vector<std::byte> encode(std::span<const std::byte> payload) = 0;
  };

} // namespace tether::initiator::application::ports
