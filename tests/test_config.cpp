#include "infrastructure/config/Config_Toml.hpp"
#include "domain/Errors.hpp"
#include "domain/Settings.hpp"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fstream>

using tether::initiator::infrastructure::config::Config_Toml;
using tether::initiator::domain::ConfigError;
using tether::initiator::domain::Settings;
namespace fs = boost::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "tether-initiator-tests";
  fs::create_directories(dir);
  return dir / name;
}

static fs::path write_file(const std::string& name, const std::string& body) {
  auto p = tmp_file(name);
  std::ofstream out(p.string());
  out << body;
  return p;
}

TEST(ConfigToml, CreatesWithDefaultsWhenMissing) {
  auto cfg = tmp_file("missing.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(fs::exists(cfg));
  ASSERT_EQ(s.initiator.addresses.size(), 1u);
  EXPECT_EQ(s.initiator.addresses[0], "127.0.0.1:9876");
  EXPECT_EQ(s.initiator.reconnect_intervals, (std::vector<int>{1, 5, 30}));
  EXPECT_EQ(s.initiator.connect_poll_timeout_ms, 2000);
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.linkLogFilename.empty());
  EXPECT_FALSE(s.logsDir.empty());
}

TEST(ConfigToml, GeneratedDefaultFileReadsBack) {
  auto cfg = tmp_file("roundtrip.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings first = impl.load_or_create(cfg.string());
  Settings second = impl.load_or_create(cfg.string());

  EXPECT_EQ(second.initiator.addresses, first.initiator.addresses);
  EXPECT_EQ(second.initiator.reconnect_intervals, first.initiator.reconnect_intervals);
  EXPECT_EQ(second.session.id, first.session.id);
  EXPECT_FALSE(second.initiator.ssl.enabled);
  EXPECT_FALSE(second.initiator.local_address.has_value());
}

TEST(ConfigToml, ReadsCustomValues) {
  auto cfg = write_file("custom.toml",
      "[logging]\nshowConsole=true\nlogsDir=\"logs-x\"\nappLogFilename=\"a.log\"\nlinkLogFilename=\"l.log\"\n"
      "\n[session]\nid=\"A->B\"\nenabled=true\nstart_time=\"08:00:00\"\nend_time=\"17:00:00\"\n"
      "\n[initiator]\naddresses=[\"hostA:1000\", \"[::1]:2000\"]\nlocal_address=\"0.0.0.0:0\"\n"
      "reconnect_intervals=[2, 4]\nconnect_poll_timeout_ms=500\ntick_period_ms=250\n"
      "\n[initiator.ssl]\nenabled=true\ncipher_suites=[\"AES128-SHA\"]\nprotocols=[\"TLSv1.2\"]\n"
      "server_name=\"peer.example\"\nverify_peer=false\n"
      "\n[networking]\ntcp_nodelay=false\nkeep_alive=true\nreceive_buffer=65536\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(s.showConsole);
  EXPECT_EQ(s.logsDir, "logs-x");
  EXPECT_EQ(s.appLogFilename, "a.log");
  EXPECT_EQ(s.linkLogFilename, "l.log");

  EXPECT_EQ(s.session.id, "A->B");
  EXPECT_TRUE(s.session.enabled);
  EXPECT_EQ(s.session.start_time, "08:00:00");
  EXPECT_EQ(s.session.end_time, "17:00:00");

  ASSERT_EQ(s.initiator.addresses.size(), 2u);
  EXPECT_EQ(s.initiator.addresses[1], "[::1]:2000");
  ASSERT_TRUE(s.initiator.local_address.has_value());
  EXPECT_EQ(*s.initiator.local_address, "0.0.0.0:0");
  EXPECT_EQ(s.initiator.reconnect_intervals, (std::vector<int>{2, 4}));
  EXPECT_EQ(s.initiator.connect_poll_timeout_ms, 500);
  EXPECT_EQ(s.initiator.tick_period_ms, 250);

  EXPECT_TRUE(s.initiator.ssl.enabled);
  EXPECT_EQ(s.initiator.ssl.cipher_suites, (std::vector<std::string>{"AES128-SHA"}));
  EXPECT_EQ(s.initiator.ssl.protocols, (std::vector<std::string>{"TLSv1.2"}));
  EXPECT_EQ(s.initiator.ssl.server_name, "peer.example");
  EXPECT_FALSE(s.initiator.ssl.verify_peer);

  EXPECT_FALSE(s.networking.tcp_nodelay);
  EXPECT_TRUE(s.networking.keep_alive);
  EXPECT_EQ(s.networking.receive_buffer, 65536u);
  EXPECT_EQ(s.networking.send_buffer, 0u);
}

TEST(ConfigToml, FallbackWhenSectionMissing) {
  auto cfg = write_file("no-logging.toml", "[initiator]\naddresses=[\"10.0.0.1:7000\"]\n");

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.linkLogFilename.empty());
  EXPECT_EQ(s.initiator.reconnect_intervals, (std::vector<int>{1, 5, 30}));
}

TEST(ConfigToml, MalformedTomlIsConfigError) {
  auto cfg = write_file("broken.toml", "[initiator\naddresses = [\n");
  Config_Toml impl;
  EXPECT_THROW(impl.load_or_create(cfg.string()), ConfigError);
}

TEST(ConfigToml, InvalidValuesAreConfigErrors) {
  Config_Toml impl;

  auto empty_addrs = write_file("empty-addrs.toml", "[initiator]\naddresses=[]\n");
  EXPECT_THROW(impl.load_or_create(empty_addrs.string()), ConfigError);

  auto bad_addr = write_file("bad-addr.toml", "[initiator]\naddresses=[\"no-port-here\"]\n");
  EXPECT_THROW(impl.load_or_create(bad_addr.string()), ConfigError);

  auto empty_intervals = write_file("empty-intervals.toml", "[initiator]\nreconnect_intervals=[]\n");
  EXPECT_THROW(impl.load_or_create(empty_intervals.string()), ConfigError);

  auto zero_interval = write_file("zero-interval.toml", "[initiator]\nreconnect_intervals=[1, 0]\n");
  EXPECT_THROW(impl.load_or_create(zero_interval.string()), ConfigError);

  auto bad_window = write_file("bad-window.toml", "[session]\nstart_time=\"25:00:00\"\n");
  EXPECT_THROW(impl.load_or_create(bad_window.string()), ConfigError);

  auto mixed = write_file("mixed.toml", "[initiator]\naddresses=[\"a:1\", 2]\n");
  EXPECT_THROW(impl.load_or_create(mixed.string()), ConfigError);
}
