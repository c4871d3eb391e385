#include "application/services/SessionInitiator.hpp"

#include <sstream>
#include <vector>

#include "domain/Errors.hpp"

using tether::initiator::application::ports::LogLevel;

namespace tether::initiator::application::services
{

namespace
{
std::vector<domain::CandidateAddress> parse_addresses(const std::vector<std::string>& v)
{
  std::vector<domain::CandidateAddress> out;
  out.reserve(v.size());
  for (const auto& a : v) out.push_back(domain::parse_candidate_address(a));
  return out;
}

std::string join_addresses(const std::vector<domain::CandidateAddress>& v)
{
  std::ostringstream oss;
  oss << '[';
  for (std::size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    oss << v[i].to_string();
  }
  oss << ']';
  return oss.str();
}
}  // namespace

SessionInitiator::SessionInitiator(const domain::Settings::Initiator& cfg,
                                   ports::ISession& session, ports::IScheduler& scheduler,
                                   std::unique_ptr<ports::IConnector> connector,
                                   ports::ITransportHandler& handler, const ports::IClock& clock,
                                   ports::ILogger& log, domain::AddressRotation::Resolver resolver)
    : session_(session),
      scheduler_(scheduler),
      log_(log),
      connector_(std::move(connector)),
      period_(cfg.tick_period_ms > 0 ? cfg.tick_period_ms : 1000)
{
  if (!connector_) throw domain::ConfigError("initiator requires a connector");
  if (cfg.connect_poll_timeout_ms <= 0)
    throw domain::ConfigError("connect_poll_timeout_ms must be positive");

  auto addresses = parse_addresses(cfg.addresses);
  const std::string listed = join_addresses(addresses);

  std::optional<domain::CandidateAddress> local_bind;
  if (cfg.local_address) local_bind = domain::parse_candidate_address(*cfg.local_address);

  SupervisorOptions opts;
  opts.connect_poll_timeout = std::chrono::milliseconds(cfg.connect_poll_timeout_ms);

  supervisor_ = std::make_shared<ConnectSupervisor>(
      session_, *connector_, handler, clock,
      domain::AddressRotation(std::move(addresses), std::move(resolver)),
      domain::BackoffSchedule::from_seconds(cfg.reconnect_intervals), std::move(local_bind), opts);

  log_.app(LogLevel::info, "[" + session_.id() + "] " + listed);
}

SessionInitiator::~SessionInitiator()
{
  stop();
  // a tick already running still holds the supervisor and uses connector_
  supervisor_->close();
}

void SessionInitiator::start()
{
  std::lock_guard<std::mutex> lk(mu_);
  if (reconnect_task_) return;
  if (connector_->is_disposed())
  {
    log_.app(LogLevel::err,
             "[" + session_.id() + "] connector disposed, initiator cannot be restarted");
    return;
  }

  // Enables the session only; the next tick does the actual connect.
  session_.request_activation();

  std::weak_ptr<ConnectSupervisor> weak = supervisor_;
  reconnect_task_ = scheduler_.schedule_periodic(
      [weak]
      {
        if (auto sup = weak.lock()) sup->tick();
      },
      std::chrono::milliseconds(0), period_);

  log_.app(LogLevel::info, "[" + session_.id() + "] initiator started");
}

void SessionInitiator::stop()
{
  std::lock_guard<std::mutex> lk(mu_);
  if (reconnect_task_)
  {
    reconnect_task_->cancel();
    reconnect_task_.reset();
    log_.app(LogLevel::info, "[" + session_.id() + "] initiator stopped");
  }
  connector_->dispose();
}

bool SessionInitiator::is_running() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return reconnect_task_ != nullptr;
}

}  // namespace tether::initiator::application::services
