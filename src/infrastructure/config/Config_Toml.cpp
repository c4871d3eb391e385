#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>
#include <vector>

#include "domain/ActivityWindow.hpp"
#include "domain/CandidateAddress.hpp"
#include "domain/Errors.hpp"

using tether::initiator::domain::ConfigError;
using tether::initiator::domain::Settings;
namespace fs = boost::filesystem;

namespace tether::initiator::infrastructure::config
{

namespace
{
template <typename T>
std::string join(const std::vector<T>& v, bool quoted)
{
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    if (quoted) oss << '"' << v[i] << '"';
    else oss << v[i];
  }
  return oss.str();
}

std::vector<std::string> read_strings(const toml::table& t, const char* key, const std::string& section)
{
  std::vector<std::string> out;
  auto arr = t[key].as_array();
  if (!arr)
  {
    if (t.contains(key)) throw ConfigError(section + "." + key + " must be an array of strings");
    return out;
  }
  for (auto& e : *arr)
  {
    auto v = e.value<std::string>();
    if (!v) throw ConfigError(section + "." + key + " must contain only strings");
    out.push_back(*v);
  }
  return out;
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, const Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());
  if (!out) throw ConfigError("cannot write default config to " + path.string());

  out << "# tether-initiator.toml - auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole     = " << (s.showConsole ? "true" : "false") << "\n";
  out << "logsDir         = \"" << s.logsDir << "\"\n";
  out << "appLogFilename  = \"" << s.appLogFilename << "\"\n";
  out << "linkLogFilename = \"" << s.linkLogFilename << "\"\n\n";

  // [session]
  out << "[session]\n";
  out << "id         = \"" << s.session.id << "\"\n";
  out << "enabled    = " << (s.session.enabled ? "true" : "false") << "\n";
  out << "# UTC, equal bounds = always active\n";
  out << "start_time = \"" << s.session.start_time << "\"\n";
  out << "end_time   = \"" << s.session.end_time << "\"\n\n";

  // [initiator]
  out << "[initiator]\n";
  out << "addresses               = [" << join(s.initiator.addresses, true) << "]\n";
  out << "# local_address         = \"0.0.0.0:0\"\n";
  out << "# seconds, the last entry repeats\n";
  out << "reconnect_intervals     = [" << join(s.initiator.reconnect_intervals, false) << "]\n";
  out << "connect_poll_timeout_ms = " << s.initiator.connect_poll_timeout_ms << "\n";
  out << "tick_period_ms          = " << s.initiator.tick_period_ms << "\n\n";

  // [initiator.ssl]
  out << "[initiator.ssl]\n";
  out << "enabled          = false\n";
  out << "cipher_suites    = []\n";
  out << "protocols        = []\n";
  out << "ca_file          = \"\"\n";
  out << "certificate_file = \"\"\n";
  out << "key_file         = \"\"\n";
  out << "verify_peer      = true\n\n";

  // [networking]
  out << "[networking]\n";
  out << "tcp_nodelay    = " << (s.networking.tcp_nodelay ? "true" : "false") << "\n";
  out << "keep_alive     = " << (s.networking.keep_alive ? "true" : "false") << "\n";
  out << "receive_buffer = " << s.networking.receive_buffer << "\n";
  out << "send_buffer    = " << s.networking.send_buffer << "\n";
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const toml::parse_error& e)
  {
    std::ostringstream oss;
    oss << "cannot parse " << path.string() << ": " << e.description() << " (line "
        << e.source().begin.line << ")";
    throw ConfigError(oss.str());
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["linkLogFilename"].value<std::string>()) s.linkLogFilename = *v;
  }

  if (s.logsDir.empty()) s.logsDir = "logs";
  if (s.appLogFilename.empty()) s.appLogFilename = "initiator_app.log";
  if (s.linkLogFilename.empty()) s.linkLogFilename = "initiator_link.log";

  // ---------------------------
  // [session]
  // ---------------------------
  if (auto ses = tbl["session"].as_table())
  {
    if (auto v = (*ses)["id"].value<std::string>()) s.session.id = *v;
    if (auto v = (*ses)["enabled"].value<bool>()) s.session.enabled = *v;
    if (auto v = (*ses)["start_time"].value<std::string>()) s.session.start_time = *v;
    if (auto v = (*ses)["end_time"].value<std::string>()) s.session.end_time = *v;
  }

  // ---------------------------
  // [initiator]
  // ---------------------------
  if (auto ini = tbl["initiator"].as_table())
  {
    if (ini->contains("addresses")) s.initiator.addresses = read_strings(*ini, "addresses", "initiator");
    if (auto v = (*ini)["local_address"].value<std::string>(); v && !v->empty())
      s.initiator.local_address = *v;

    if (auto arr = (*ini)["reconnect_intervals"].as_array())
    {
      s.initiator.reconnect_intervals.clear();
      for (auto& e : *arr)
      {
        auto v = e.value<int64_t>();
        if (!v) throw ConfigError("initiator.reconnect_intervals must contain only integers");
        s.initiator.reconnect_intervals.push_back(static_cast<int>(*v));
      }
    }
    if (auto v = (*ini)["connect_poll_timeout_ms"].value<int64_t>())
      s.initiator.connect_poll_timeout_ms = static_cast<int>(*v);
    if (auto v = (*ini)["tick_period_ms"].value<int64_t>())
      s.initiator.tick_period_ms = static_cast<int>(*v);

    // ---------------------------
    // [initiator.ssl]
    // ---------------------------
    if (auto ssl = (*ini)["ssl"].as_table())
    {
      auto& c = s.initiator.ssl;
      if (auto v = (*ssl)["enabled"].value<bool>()) c.enabled = *v;
      c.cipher_suites = read_strings(*ssl, "cipher_suites", "initiator.ssl");
      c.protocols = read_strings(*ssl, "protocols", "initiator.ssl");
      if (auto v = (*ssl)["ca_file"].value<std::string>()) c.ca_file = *v;
      if (auto v = (*ssl)["ca_path"].value<std::string>()) c.ca_path = *v;
      if (auto v = (*ssl)["certificate_file"].value<std::string>()) c.certificate_file = *v;
      if (auto v = (*ssl)["key_file"].value<std::string>()) c.key_file = *v;
      if (auto v = (*ssl)["key_password"].value<std::string>()) c.key_password = *v;
      if (auto v = (*ssl)["verify_peer"].value<bool>()) c.verify_peer = *v;
      if (auto v = (*ssl)["server_name"].value<std::string>()) c.server_name = *v;
    }
  }

  // ---------------------------
  // [networking]
  // ---------------------------
  if (auto net = tbl["networking"].as_table())
  {
    if (auto v = (*net)["tcp_nodelay"].value<bool>()) s.networking.tcp_nodelay = *v;
    if (auto v = (*net)["keep_alive"].value<bool>()) s.networking.keep_alive = *v;
    if (auto v = (*net)["receive_buffer"].value<int64_t>(); v && *v >= 0)
      s.networking.receive_buffer = static_cast<std::size_t>(*v);
    if (auto v = (*net)["send_buffer"].value<int64_t>(); v && *v >= 0)
      s.networking.send_buffer = static_cast<std::size_t>(*v);
  }

  validate(s);
  return s;
}

void Config_Toml::validate(const Settings& s)
{
  const auto& ini = s.initiator;
  if (ini.addresses.empty()) throw ConfigError("initiator.addresses must not be empty");
  for (const auto& a : ini.addresses) domain::parse_candidate_address(a);
  if (ini.local_address) domain::parse_candidate_address(*ini.local_address);

  if (ini.reconnect_intervals.empty())
    throw ConfigError("initiator.reconnect_intervals must not be empty");
  for (int v : ini.reconnect_intervals)
  {
    if (v <= 0) throw ConfigError("initiator.reconnect_intervals entries must be positive");
  }
  if (ini.connect_poll_timeout_ms <= 0)
    throw ConfigError("initiator.connect_poll_timeout_ms must be positive");
  if (ini.tick_period_ms <= 0) throw ConfigError("initiator.tick_period_ms must be positive");

  domain::ActivityWindow::parse(s.session.start_time, s.session.end_time);
}

}  // namespace tether::initiator::infrastructure::config
