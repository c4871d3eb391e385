#pragma once

#include <atomic>
#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "application/ports/IConnector.hpp"
#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace tether::initiator::infrastructure::net
{

// Boost.Asio connector: resolve (unresolved targets only), optional local
// bind, connect, optional TLS client handshake. One I/O thread serves every
// attempt and every transport it produced.
class Connector_Asio final : public tether::initiator::application::ports::IConnector
{
 public:
  using CodecFactory =
      std::function<std::shared_ptr<tether::initiator::application::ports::IFrameCodec>()>;

  // `tls` may be null (plain TCP).
  Connector_Asio(tether::initiator::application::ports::ILogger& log,
                 tether::initiator::domain::NetworkingOptions net,
                 std::shared_ptr<boost::asio::ssl::context> tls, bool verify_peer,
                 std::string server_name, CodecFactory codec);
  ~Connector_Asio() override;

  // Builds the TLS stage from settings when enabled. Throws
  // domain::SecurityConfigurationError.
  static std::unique_ptr<Connector_Asio> create(tether::initiator::application::ports::ILogger& log,
                                                const tether::initiator::domain::Settings& s,
                                                CodecFactory codec);

  // IConnector
  std::unique_ptr<tether::initiator::application::ports::IConnectAttempt> connect(
      const tether::initiator::domain::CandidateAddress& target,
      const std::optional<tether::initiator::domain::CandidateAddress>& local_bind) override;
  void dispose() override;
  bool is_disposed() const override { return disposed_.load(std::memory_order_acquire); }

  bool tls_enabled() const { return tls_ != nullptr; }
  std::size_t in_flight() const;

 private:
  class Operation;
  class Attempt;
  friend class Operation;

  void track_transport(const std::shared_ptr<tether::initiator::application::ports::ITransport>& t);

  tether::initiator::application::ports::ILogger& log_;
  const tether::initiator::domain::NetworkingOptions net_;
  const std::shared_ptr<boost::asio::ssl::context> tls_;
  const bool verify_peer_;
  const std::string server_name_;
  const CodecFactory codec_;

  std::shared_ptr<boost::asio::io_context> io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::atomic<bool> disposed_{false};

  mutable std::mutex mu_;
  std::vector<std::weak_ptr<Operation>> ops_;
  std::vector<std::weak_ptr<tether::initiator::application::ports::ITransport>> transports_;
};

}  // namespace tether::initiator::infrastructure::net
