#include "infrastructure/tls/TlsContextFactory.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/system/system_error.hpp>
#include <sstream>

#include "domain/Errors.hpp"

using tether::initiator::domain::SecurityConfigurationError;
using tether::initiator::domain::SslSettings;
namespace ssl = boost::asio::ssl;

namespace tether::initiator::infrastructure::tls
{

namespace
{
struct ProtocolName
{
  const char* name;
  int version;
};

constexpr ProtocolName kProtocols[] = {
    {"TLSv1", TLS1_VERSION},
    {"TLSv1.1", TLS1_1_VERSION},
    {"TLSv1.2", TLS1_2_VERSION},
    {"TLSv1.3", TLS1_3_VERSION},
};

std::string openssl_error(const char* what)
{
  std::string msg(what);
  const unsigned long e = ERR_get_error();
  if (e != 0)
  {
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    msg += ": ";
    msg += buf;
  }
  ERR_clear_error();
  return msg;
}

std::string join(const std::vector<std::string>& v, char sep)
{
  std::ostringstream oss;
  for (std::size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << sep;
    oss << v[i];
  }
  return oss.str();
}

// TLS 1.3 suites are configured separately from the pre-1.3 cipher list.
bool is_tls13_suite(const std::string& s)
{
  return s.rfind("TLS_", 0) == 0;
}
}  // namespace

std::shared_ptr<ssl::context> TlsContextFactory::create(const SslSettings& cfg)
{
  ERR_clear_error();
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  ctx->set_options(ssl::context::default_workarounds | ssl::context::no_compression);

  apply_protocols(*ctx, cfg.protocols);
  apply_cipher_suites(*ctx, cfg.cipher_suites);
  load_material(*ctx, cfg);

  return ctx;
}

void TlsContextFactory::apply_protocols(ssl::context& ctx, const std::vector<std::string>& protocols)
{
  if (protocols.empty()) return;  // everything the library supports

  int lo = 0;
  int hi = 0;
  for (const auto& p : protocols)
  {
    int version = 0;
    for (const auto& known : kProtocols)
    {
      if (p == known.name) version = known.version;
    }
    if (version == 0) throw SecurityConfigurationError("unsupported TLS protocol '" + p + "'");
    if (lo == 0 || version < lo) lo = version;
    if (version > hi) hi = version;
  }

  if (SSL_CTX_set_min_proto_version(ctx.native_handle(), lo) != 1 ||
      SSL_CTX_set_max_proto_version(ctx.native_handle(), hi) != 1)
    throw SecurityConfigurationError(openssl_error("failed to restrict TLS protocols"));
}

void TlsContextFactory::apply_cipher_suites(ssl::context& ctx, const std::vector<std::string>& suites)
{
  if (suites.empty()) return;

  std::vector<std::string> legacy;
  std::vector<std::string> tls13;
  for (const auto& s : suites) (is_tls13_suite(s) ? tls13 : legacy).push_back(s);

  if (!legacy.empty() &&
      SSL_CTX_set_cipher_list(ctx.native_handle(), join(legacy, ':').c_str()) != 1)
    throw SecurityConfigurationError(
        openssl_error(("unsupported cipher suites '" + join(legacy, ',') + "'").c_str()));

  if (!tls13.empty() &&
      SSL_CTX_set_ciphersuites(ctx.native_handle(), join(tls13, ':').c_str()) != 1)
    throw SecurityConfigurationError(
        openssl_error(("unsupported TLSv1.3 suites '" + join(tls13, ',') + "'").c_str()));
}

void TlsContextFactory::load_material(ssl::context& ctx, const SslSettings& cfg)
{
  try
  {
    if (!cfg.ca_file.empty()) ctx.load_verify_file(cfg.ca_file);
    if (!cfg.ca_path.empty()) ctx.add_verify_path(cfg.ca_path);
    if (cfg.ca_file.empty() && cfg.ca_path.empty()) ctx.set_default_verify_paths();

    if (!cfg.key_password.empty())
    {
      const std::string password = cfg.key_password;
      ctx.set_password_callback([password](std::size_t, ssl::context::password_purpose)
                                { return password; });
    }
    if (!cfg.certificate_file.empty()) ctx.use_certificate_chain_file(cfg.certificate_file);
    if (!cfg.key_file.empty()) ctx.use_private_key_file(cfg.key_file, ssl::context::pem);

    ctx.set_verify_mode(cfg.verify_peer ? ssl::verify_peer : ssl::verify_none);
  }
  catch (const boost::system::system_error& e)
  {
    throw SecurityConfigurationError(std::string("TLS key/trust material: ") + e.what());
  }

  if (!cfg.certificate_file.empty() && !cfg.key_file.empty() &&
      SSL_CTX_check_private_key(ctx.native_handle()) != 1)
    throw SecurityConfigurationError(openssl_error("private key does not match certificate"));
}

std::vector<std::string> TlsContextFactory::default_cipher_suites(ssl::context& ctx)
{
  std::vector<std::string> out;
  SSL* s = SSL_new(ctx.native_handle());
  if (!s) return out;
  if (STACK_OF(SSL_CIPHER)* ciphers = SSL_get_ciphers(s))
  {
    for (int i = 0; i < sk_SSL_CIPHER_num(ciphers); ++i)
      out.emplace_back(SSL_CIPHER_get_name(sk_SSL_CIPHER_value(ciphers, i)));
  }
  SSL_free(s);
  return out;
}

std::vector<std::string> TlsContextFactory::supported_protocols()
{
  std::vector<std::string> out;
  for (const auto& p : kProtocols) out.emplace_back(p.name);
  return out;
}

}  // namespace tether::initiator::infrastructure::tls
