#pragma once

#include <string>

namespace tether::initiator::application::ports
{

// Per-session event sink.
struct ISessionLog
{
  virtual ~ISessionLog() = default;
  virtual void on_event(const std::string& msg) = 0;
  virtual void on_error_event(const std::string& msg) = 0;
};

// The logical session a connection ultimately serves.
struct ISession
{
  virtual ~ISession() = default;

  virtual const std::string& id() const = 0;
  virtual bool is_enabled() const = 0;
  virtual bool is_within_activity_window() const = 0;

  // Only enables the session; it does not connect.
  virtual void request_activation() = 0;

  virtual ISessionLog& log() = 0;
};

}  // namespace tether::initiator::application::ports
