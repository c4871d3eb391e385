#pragma once

#include <atomic>
#include <string>

#include "application/ports/IClock.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/ISession.hpp"
#include "domain/ActivityWindow.hpp"
#include "domain/Settings.hpp"

namespace tether::initiator::application::services
{

// Session gate backed by settings: an enable flag plus a daily activity
// window. Events go to the link channel prefixed with the session id.
class LogicalSession final : public ports::ISession, private ports::ISessionLog
{
 public:
  // Throws domain::ConfigError on a malformed activity window.
  LogicalSession(const domain::Settings::Session& cfg, const ports::IClock& clock,
                 ports::ILogger& log);

  // ISession
  const std::string& id() const override { return id_; }
  bool is_enabled() const override { return enabled_.load(std::memory_order_acquire); }
  bool is_within_activity_window() const override;
  void request_activation() override;
  ports::ISessionLog& log() override { return *this; }

  void request_deactivation();

 private:
  // ISessionLog
  void on_event(const std::string& msg) override;
  void on_error_event(const std::string& msg) override;

  const std::string id_;
  const domain::ActivityWindow window_;
  const ports::IClock& clock_;
  ports::ILogger& log_;
  std::atomic<bool> enabled_;
};

}  // namespace tether::initiator::application::services
