#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <iostream>

#include "application/services/Bootstrap.hpp"
#include "application/services/LogicalSession.hpp"
#include "application/services/SessionChannel.hpp"
#include "application/services/SessionInitiator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/codec/FrameCodec_LengthPrefix.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/net/Connector_Asio.hpp"
#include "infrastructure/net/HostResolver_Asio.hpp"
#include "infrastructure/scheduler/Scheduler_Asio.hpp"
#include "infrastructure/time/SystemClock.hpp"

namespace app_srv = tether::initiator::application::services;
namespace infra   = tether::initiator::infrastructure;
using tether::initiator::application::ports::LogLevel;

int main(int argc, char** argv) {
  std::string configPath = (argc > 1) ? argv[1] : std::string{"tether-initiator.toml"};

  infra::config::Config_Toml    cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::time::SystemClock      clock;

  try {
    app_srv::Bootstrap boot{cfg_impl, log_impl};
    const auto s = boot.run(configPath);

    infra::scheduler::Scheduler_Asio scheduler{log_impl};
    infra::net::HostResolver_Asio    resolver;

    app_srv::LogicalSession session{s.session, clock, log_impl};
    app_srv::SessionChannel channel{session};

    auto connector = infra::net::Connector_Asio::create(
        log_impl, s, [] { return std::make_shared<infra::codec::FrameCodec_LengthPrefix>(); });

    app_srv::SessionInitiator initiator{
        s.initiator, session, scheduler, std::move(connector), channel, clock, log_impl,
        [&resolver](const std::string& host, uint16_t port) { return resolver.resolve(host, port); }};

    initiator.start();

    // Block until SIGINT / SIGTERM
    boost::asio::io_context signals_io;
    boost::asio::signal_set signals{signals_io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code&, int sig) {
      log_impl.app(LogLevel::info, "signal " + std::to_string(sig) + " received, stopping");
    });
    signals_io.run();

    initiator.stop();
    scheduler.shutdown();
    log_impl.flush();
  } catch (const tether::initiator::domain::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    log_impl.app(LogLevel::critical, std::string("Configuration error: ") + e.what());
    log_impl.flush();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    log_impl.app(LogLevel::critical, std::string("Fatal error: ") + e.what());
    log_impl.flush();
    return 1;
  }

  return 0;
}
