#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

namespace tether::initiator::domain
{

// Static misconfiguration (settings file, address list, intervals).
struct ConfigError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// TLS material, cipher suite or protocol setup failed. Raised while the
// connector is built, never per attempt.
struct SecurityConfigurationError : ConfigError
{
  using ConfigError::ConfigError;
};

enum class ConnectErrorKind
{
  network,  // refused, unreachable, timeout, resolve or handshake failure
  other
};

class TransientConnectError : public std::runtime_error
{
 public:
  TransientConnectError(ConnectErrorKind kind, const std::string& what,
                        boost::system::error_code ec = {})
      : std::runtime_error(what), kind_(kind), ec_(ec)
  {
  }

  ConnectErrorKind kind() const noexcept { return kind_; }
  const boost::system::error_code& code() const noexcept { return ec_; }

  // Short label used in diagnostics, e.g. "system:111" for a refused connect.
  std::string category() const
  {
    if (kind_ == ConnectErrorKind::other) return "ConnectError";
    if (!ec_) return "NetworkError";
    return std::string(ec_.category().name()) + ":" + std::to_string(ec_.value());
  }

 private:
  ConnectErrorKind kind_;
  boost::system::error_code ec_;
};

}  // namespace tether::initiator::domain
