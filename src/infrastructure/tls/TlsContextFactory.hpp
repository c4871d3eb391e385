#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>
#include <vector>

#include "domain/Settings.hpp"

namespace tether::initiator::infrastructure::tls
{

// Builds the client-mode TLS context shared by every connect attempt.
class TlsContextFactory
{
 public:
  // Throws domain::SecurityConfigurationError on bad key/trust material or an
  // unsupported cipher suite / protocol.
  static std::shared_ptr<boost::asio::ssl::context> create(
      const tether::initiator::domain::SslSettings& cfg);

  // Cipher suites / protocol names the linked OpenSSL enables by default.
  static std::vector<std::string> default_cipher_suites(boost::asio::ssl::context& ctx);
  static std::vector<std::string> supported_protocols();

 private:
  static void apply_protocols(boost::asio::ssl::context& ctx,
                              const std::vector<std::string>& protocols);
  static void apply_cipher_suites(boost::asio::ssl::context& ctx,
                                  const std::vector<std::string>& suites);
  static void load_material(boost::asio::ssl::context& ctx,
                            const tether::initiator::domain::SslSettings& cfg);
};

}  // namespace tether::initiator::infrastructure::tls
