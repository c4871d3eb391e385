#pragma once

#include <array>
#include <cstdint>

#include "application/ports/IFrameCodec.hpp"

namespace tether::initiator::infrastructure::codec
{

// [len lo][len hi][payload...]; payloads up to 65535 bytes.
class FrameCodec_LengthPrefix final : public tether::initiator::application::ports::IFrameCodec
{
 public:
  static constexpr std::size_t kHeaderSize = 2;
  static constexpr std::size_t kMaxPayload = 0xFFFF;

  std::size_t feed(std::span<const std::byte> in,
                   std::vector<std::vector<std::byte>>& out) override;

  // Throws std::length_error above kMaxPayload.
  std::vector<std::byte> encode(std::span<const std::byte> payload) override;

 private:
  static std::array<std::byte, kHeaderSize> make_header(std::size_t len);
  static uint16_t le16(std::byte lo, std::byte hi);
};

}  // namespace tether::initiator::infrastructure::codec
