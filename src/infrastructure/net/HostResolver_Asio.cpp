#include "infrastructure/net/HostResolver_Asio.hpp"

namespace tether::initiator::infrastructure::net
{

std::optional<std::string> HostResolver_Asio::resolve(const std::string& host, uint16_t port)
{
  boost::system::error_code ec;
  const auto results = resolver_.resolve(host, std::to_string(port), ec);
  if (ec || results.empty()) return std::nullopt;
  return results.begin()->endpoint().address().to_string();
}

}  // namespace tether::initiator::infrastructure::net
