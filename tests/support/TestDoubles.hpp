#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/IClock.hpp"
#include "application/ports/IConnector.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IScheduler.hpp"
#include "application/ports/ISession.hpp"
#include "application/ports/ITransportHandler.hpp"
#include "domain/Errors.hpp"

namespace tether::initiator::testing
{

namespace ports = tether::initiator::application::ports;
namespace domain = tether::initiator::domain;

// ----------------------------- Logger -----------------------------
struct TestLogger : ports::ILogger
{
  void init(const domain::Settings&) override {}
  void app(ports::LogLevel, const std::string& msg) override
  {
    std::lock_guard<std::mutex> lk(m);
    app_lines.push_back(msg);
  }
  void link(ports::LogLevel, std::string_view msg) override
  {
    std::lock_guard<std::mutex> lk(m);
    link_lines.emplace_back(msg);
  }

  std::mutex m;
  std::vector<std::string> app_lines;
  std::vector<std::string> link_lines;
};

// ----------------------------- Clock -----------------------------
struct ManualClock : ports::IClock
{
  time_point now() const override
  {
    std::lock_guard<std::mutex> lk(m);
    return t;
  }
  void advance(std::chrono::milliseconds d)
  {
    std::lock_guard<std::mutex> lk(m);
    t += d;
  }

  mutable std::mutex m;
  time_point t{std::chrono::hours(24 * 365 * 50)};
};

// ----------------------------- Session -----------------------------
struct FakeSession : ports::ISession, ports::ISessionLog
{
  const std::string& id() const override { return sid; }
  bool is_enabled() const override { return enabled; }
  bool is_within_activity_window() const override { return in_window; }
  void request_activation() override
  {
    ++activations;
    enabled = true;
  }
  ports::ISessionLog& log() override { return *this; }

  void on_event(const std::string& msg) override { events.push_back(msg); }
  void on_error_event(const std::string& msg) override { errors.push_back(msg); }

  std::string sid{"TEST->PEER"};
  bool enabled{true};
  bool in_window{true};
  int activations{0};
  std::vector<std::string> events;
  std::vector<std::string> errors;
};

// ----------------------------- Transport -----------------------------
struct FakeTransport : ports::ITransport
{
  explicit FakeTransport(std::string remote = "peer:1") : remote(std::move(remote)) {}

  void start(FrameHandler f, CloseHandler c) override
  {
    started = true;
    on_frame = std::move(f);
    on_closed = std::move(c);
  }
  void send(std::span<const std::byte> payload) override { sent.emplace_back(payload.begin(), payload.end()); }
  void close() override
  {
    if (!connected) return;
    connected = false;
    if (on_closed) on_closed("closed locally");
  }
  bool is_connected() const override { return connected; }
  std::string remote_endpoint() const override { return remote; }

  std::string remote;
  bool connected{true};
  bool started{false};
  FrameHandler on_frame;
  CloseHandler on_closed;
  std::vector<std::vector<std::byte>> sent;
};

// ----------------------------- Connector -----------------------------
// Scripted outcome of one connect. Tests may flip a pending outcome later.
struct AttemptScript
{
  enum class Outcome
  {
    pending,
    succeed,
    fail_network,
    fail_other,
    throw_on_connect
  };

  Outcome outcome{Outcome::succeed};
  std::shared_ptr<FakeTransport> transport;
  std::vector<std::chrono::milliseconds> polls;
};

class FakeAttempt : public ports::IConnectAttempt
{
 public:
  FakeAttempt(domain::CandidateAddress target, std::shared_ptr<AttemptScript> script)
      : target_(std::move(target)), script_(std::move(script))
  {
  }

  std::shared_ptr<ports::ITransport> poll(std::chrono::milliseconds timeout) override
  {
    script_->polls.push_back(timeout);
    switch (script_->outcome)
    {
      case AttemptScript::Outcome::pending:
        return nullptr;
      case AttemptScript::Outcome::succeed:
        if (!script_->transport) script_->transport = std::make_shared<FakeTransport>(target_.to_string());
        return script_->transport;
      case AttemptScript::Outcome::fail_other:
        throw domain::TransientConnectError(domain::ConnectErrorKind::other, "handler blew up");
      default:
        throw domain::TransientConnectError(domain::ConnectErrorKind::network, "Connection refused");
    }
  }

  const domain::CandidateAddress& target() const override { return target_; }

 private:
  domain::CandidateAddress target_;
  std::shared_ptr<AttemptScript> script_;
};

struct FakeConnector : ports::IConnector
{
  // Outcomes consumed in order; when empty every connect succeeds.
  std::shared_ptr<AttemptScript> script(AttemptScript::Outcome o)
  {
    auto s = std::make_shared<AttemptScript>();
    s->outcome = o;
    scripts.push_back(s);
    return s;
  }

  std::unique_ptr<ports::IConnectAttempt> connect(
      const domain::CandidateAddress& target,
      const std::optional<domain::CandidateAddress>& local_bind) override
  {
    if (disposed) throw domain::TransientConnectError(domain::ConnectErrorKind::other, "connector disposed");
    targets.push_back(target);
    local_binds.push_back(local_bind);

    std::shared_ptr<AttemptScript> s;
    if (scripts.empty())
    {
      s = std::make_shared<AttemptScript>();
    }
    else
    {
      s = scripts.front();
      scripts.pop_front();
    }
    if (s->outcome == AttemptScript::Outcome::throw_on_connect)
      throw domain::TransientConnectError(domain::ConnectErrorKind::network, "Network is unreachable");
    return std::make_unique<FakeAttempt>(target, s);
  }

  void dispose() override
  {
    ++dispose_calls;
    disposed = true;
  }
  bool is_disposed() const override { return disposed; }

  std::deque<std::shared_ptr<AttemptScript>> scripts;
  std::vector<domain::CandidateAddress> targets;
  std::vector<std::optional<domain::CandidateAddress>> local_binds;
  int dispose_calls{0};
  std::atomic<bool> disposed{false};
};

// ----------------------------- Handler -----------------------------
struct FakeHandler : ports::ITransportHandler
{
  void on_established(std::shared_ptr<ports::ITransport> t) override { received.push_back(std::move(t)); }
  std::vector<std::shared_ptr<ports::ITransport>> received;
};

// ----------------------------- Scheduler -----------------------------
struct FakeTask : ports::IScheduledTask
{
  void cancel() override { is_cancelled = true; }
  bool cancelled() const override { return is_cancelled; }

  std::function<void()> fn;
  std::chrono::milliseconds initial{0};
  std::chrono::milliseconds period{0};
  bool is_cancelled{false};
};

struct FakeScheduler : ports::IScheduler
{
  std::shared_ptr<ports::IScheduledTask> schedule_periodic(std::function<void()> task,
                                                           std::chrono::milliseconds initial_delay,
                                                           std::chrono::milliseconds period) override
  {
    auto t = std::make_shared<FakeTask>();
    t->fn = std::move(task);
    t->initial = initial_delay;
    t->period = period;
    tasks.push_back(t);
    return t;
  }

  // Runs every task that has not been cancelled, once.
  int fire()
  {
    int ran = 0;
    for (auto& t : tasks)
    {
      if (t->is_cancelled) continue;
      t->fn();
      ++ran;
    }
    return ran;
  }

  std::vector<std::shared_ptr<FakeTask>> tasks;
};

}  // namespace tether::initiator::testing
