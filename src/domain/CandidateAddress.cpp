#include "domain/CandidateAddress.hpp"

#include <charconv>

#include "domain/Errors.hpp"

namespace tether::initiator::domain
{

CandidateAddress parse_candidate_address(const std::string& text)
{
  std::string host;
  std::string port_str;

  if (!text.empty() && text.front() == '[')
  {
    const auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':')
      throw ConfigError("invalid address '" + text + "' (expected [v6]:port)");
    host = text.substr(1, close - 1);
    port_str = text.substr(close + 2);
  }
  else
  {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) throw ConfigError("invalid address '" + text + "' (expected host:port)");
    host = text.substr(0, colon);
    port_str = text.substr(colon + 1);
  }

  if (host.empty()) throw ConfigError("invalid address '" + text + "' (empty host)");

  unsigned port = 0;
  const auto* first = port_str.data();
  const auto* last = port_str.data() + port_str.size();
  auto [p, ec] = std::from_chars(first, last, port);
  if (ec != std::errc{} || p != last || port == 0 || port > 65535)
    throw ConfigError("invalid address '" + text + "' (bad port)");

  return CandidateAddress{std::move(host), static_cast<uint16_t>(port)};
}

}  // namespace tether::initiator::domain
