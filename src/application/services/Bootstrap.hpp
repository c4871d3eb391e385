#pragma once
#include <sstream>
#include <string>
#include <vector>

#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"

namespace tether::initiator::application::services {

// Loads settings, brings up logging and reports the effective configuration.
struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  template <typename T>
  static std::string join(const std::vector<T>& v) {
    std::ostringstream oss;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i) oss << ", ";
      oss << v[i];
    }
    return oss.str();
  }

  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;

    log.app(LogLevel::info, "Tether initiator starting");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
    log.app(LogLevel::info, "Session: " + s.session.id + " | enabled: " + b2s(s.session.enabled) +
                                " | window: " + s.session.start_time + "-" + s.session.end_time);
    log.app(LogLevel::info, "Addresses: " + join(s.initiator.addresses));
    if (s.initiator.local_address)
      log.app(LogLevel::info, "Local address: " + *s.initiator.local_address);
    log.app(LogLevel::info, "Reconnect intervals (s): " + join(s.initiator.reconnect_intervals));

    std::ostringstream flags;
    flags << "TLS: " << b2s(s.initiator.ssl.enabled)
          << " | tcp_nodelay: " << b2s(s.networking.tcp_nodelay)
          << " | keep_alive: " << b2s(s.networking.keep_alive)
          << " | console: " << b2s(s.showConsole);
    log.app(LogLevel::info, flags.str());
    return s;
  }
};

} // namespace tether::initiator::application::services
