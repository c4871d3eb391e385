#include "infrastructure/codec/FrameCodec_LengthPrefix.hpp"

#include <stdexcept>
#include <string>

namespace tether::initiator::infrastructure::codec
{

std::size_t FrameCodec_LengthPrefix::feed(std::span<const std::byte> in,
                                          std::vector<std::vector<std::byte>>& out)
{
  std::size_t pos = 0;
  while (in.size() - pos >= kHeaderSize)
  {
    const std::size_t len = le16(in[pos], in[pos + 1]);
    if (in.size() - pos - kHeaderSize < len) break;

    const auto* body = in.data() + pos + kHeaderSize;
    out.emplace_back(body, body + len);
    pos += kHeaderSize + len;
  }
  return pos;
}

std::vector<std::byte> FrameCodec_LengthPrefix::encode(std::span<const std::byte> payload)
{
  if (payload.size() > kMaxPayload)
    throw std::length_error("frame payload too large (" + std::to_string(payload.size()) +
                            " > 65535)");

  const auto h = make_header(payload.size());
  std::vector<std::byte> buf;
  buf.reserve(kHeaderSize + payload.size());
  buf.insert(buf.end(), h.begin(), h.end());
  buf.insert(buf.end(), payload.begin(), payload.end());
  return buf;
}

// -------------------- framing helpers --------------------
std::array<std::byte, FrameCodec_LengthPrefix::kHeaderSize> FrameCodec_LengthPrefix::make_header(
    std::size_t len)
{
  const uint16_t L = static_cast<uint16_t>(len);
  return {std::byte{static_cast<unsigned char>(L & 0xFF)},
          std::byte{static_cast<unsigned char>((L >> 8) & 0xFF)}};
}

uint16_t FrameCodec_LengthPrefix::le16(std::byte lo, std::byte hi)
{
  return static_cast<uint16_t>(static_cast<unsigned>(lo) | (static_cast<unsigned>(hi) << 8));
}

}  // namespace tether::initiator::infrastructure::codec
