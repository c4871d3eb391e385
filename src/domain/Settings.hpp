#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tether::initiator::domain
{

struct NetworkingOptions
{
  bool tcp_nodelay{true};
  bool keep_alive{false};
  std::size_t receive_buffer{0};  // 0 = OS default
  std::size_t send_buffer{0};
};

struct SslSettings
{
  bool enabled{false};
  std::vector<std::string> cipher_suites;  // empty = library defaults
  std::vector<std::string> protocols;      // e.g. "TLSv1.2", "TLSv1.3"; empty = all supported
  std::string ca_file;
  std::string ca_path;
  std::string certificate_file;
  std::string key_file;
  std::string key_password;
  bool verify_peer{true};
  std::string server_name;  // SNI override; defaults to the target host
};

struct Settings
{
  struct Session
  {
    std::string id{"INITIATOR->ACCEPTOR"};
    bool enabled{true};
    std::string start_time{"00:00:00"};
    std::string end_time{"00:00:00"};
  } session;

  struct Initiator
  {
    std::vector<std::string> addresses{"127.0.0.1:9876"};
    std::optional<std::string> local_address;
    std::vector<int> reconnect_intervals{1, 5, 30};
    int connect_poll_timeout_ms{2000};
    int tick_period_ms{1000};
    SslSettings ssl;
  } initiator;

  NetworkingOptions networking;

  // Console / Logs
  bool showConsole{false};
  std::string logsDir{"logs"};
  std::string appLogFilename{"initiator_app.log"};
  std::string linkLogFilename{"initiator_link.log"};
  std::string configPath{"tether-initiator.toml"};
};

}  // namespace tether::initiator::domain
