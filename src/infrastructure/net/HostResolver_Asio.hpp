#pragma once

#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tether::initiator::infrastructure::net
{

// Blocking name lookup used when the address rotation refreshes an entry.
class HostResolver_Asio
{
 public:
  // First address for host:port, or nullopt if the lookup fails.
  std::optional<std::string> resolve(const std::string& host, uint16_t port);

 private:
  boost::asio::io_context io_;
  boost::asio::ip::tcp::resolver resolver_{io_};
};

}  // namespace tether::initiator::infrastructure::net
