#include "infrastructure/net/Connector_Asio.hpp"

#include <openssl/ssl.h>

#include <algorithm>
#include <future>

#include "domain/Errors.hpp"
#include "infrastructure/net/StreamTransport.hpp"
#include "infrastructure/tls/TlsContextFactory.hpp"

using tether::initiator::application::ports::IConnectAttempt;
using tether::initiator::application::ports::ITransport;
using tether::initiator::application::ports::LogLevel;
using tether::initiator::domain::CandidateAddress;
using tether::initiator::domain::ConnectErrorKind;
using tether::initiator::domain::TransientConnectError;

namespace tether::initiator::infrastructure::net
{

using tcp = boost::asio::ip::tcp;
namespace ssl = boost::asio::ssl;

namespace
{
std::string endpoint_string(const tcp::endpoint& ep)
{
  const auto a = ep.address();
  return (a.is_v6() ? "[" + a.to_string() + "]" : a.to_string()) + ":" + std::to_string(ep.port());
}
}  // namespace

// -------------------- Operation --------------------
// State of one connect, shared between the attempt handle and the handlers
// queued on the I/O thread. Completes its promise exactly once.
class Connector_Asio::Operation : public std::enable_shared_from_this<Operation>
{
 public:
  Operation(Connector_Asio& owner, CandidateAddress target, std::optional<CandidateAddress> local)
      : owner_(owner),
        io_(owner.io_),
        strand_(boost::asio::make_strand(*io_)),
        resolver_(strand_),
        socket_(strand_),
        target_(std::move(target)),
        local_(std::move(local)),
        future_(promise_.get_future().share())
  {
  }

  void start()
  {
    boost::asio::post(strand_, [self = shared_from_this()] { self->begin(); });
  }

  void abort(const std::string& why)
  {
    boost::asio::post(strand_,
                      [self = shared_from_this(), why]
                      {
                        self->resolver_.cancel();
                        boost::system::error_code ec;
                        if (self->socket_.is_open()) self->socket_.close(ec);
                        if (self->tls_) self->tls_->lowest_layer().close(ec);
                        self->fail(ConnectErrorKind::other, why);
                      });
  }

  bool done() const { return done_.load(std::memory_order_acquire); }
  const CandidateAddress& target() const { return target_; }
  const std::shared_future<std::shared_ptr<ITransport>>& future() const { return future_; }

 private:
  void begin()
  {
    if (done()) return;

    if (target_.is_resolved())
    {
      boost::system::error_code ec;
      const auto addr = boost::asio::ip::make_address(target_.ip(), ec);
      if (!ec)
      {
        connect_to({tcp::endpoint(addr, target_.port())});
        return;
      }
    }

    resolver_.async_resolve(
        target_.host(), std::to_string(target_.port()),
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    tcp::resolver::results_type results)
        {
          if (self->done()) return;
          if (ec)
          {
            self->fail(ConnectErrorKind::network,
                       "cannot resolve " + self->target_.host() + ": " + ec.message(), ec);
            return;
          }
          std::vector<tcp::endpoint> eps;
          for (const auto& r : results) eps.push_back(r.endpoint());
          self->connect_to(std::move(eps));
        });
  }

  void connect_to(std::vector<tcp::endpoint> eps)
  {
    if (done()) return;
    if (eps.empty())
    {
      fail(ConnectErrorKind::network, "no endpoints for " + target_.to_string());
      return;
    }

    owner_.log_.link(LogLevel::debug, "[Connector] connecting to " + target_.to_string());

    if (!local_)
    {
      boost::asio::async_connect(socket_, eps,
                                 [self = shared_from_this()](const boost::system::error_code& ec,
                                                             const tcp::endpoint&)
                                 { self->on_connect(ec); });
      return;
    }

    // A bound socket must not be reopened, so only one endpoint of the
    // local address family is tried.
    boost::system::error_code ec;
    const auto laddr = boost::asio::ip::make_address(local_->host(), ec);
    if (ec)
    {
      fail(ConnectErrorKind::network, "invalid local address " + local_->to_string(), ec);
      return;
    }
    const tcp::endpoint local_ep(laddr, local_->port());
    auto it = std::find_if(eps.begin(), eps.end(),
                           [&](const tcp::endpoint& e) { return e.protocol() == local_ep.protocol(); });
    if (it == eps.end())
    {
      fail(ConnectErrorKind::network,
           "no endpoint of " + target_.to_string() + " matches local address family");
      return;
    }

    socket_.open(local_ep.protocol(), ec);
    if (!ec) socket_.set_option(tcp::socket::reuse_address(true), ec);
    if (!ec) socket_.bind(local_ep, ec);
    if (ec)
    {
      fail(ConnectErrorKind::network, "cannot bind " + local_->to_string() + ": " + ec.message(), ec);
      return;
    }

    socket_.async_connect(*it, [self = shared_from_this()](const boost::system::error_code& e)
                          { self->on_connect(e); });
  }

  void on_connect(const boost::system::error_code& ec)
  {
    if (done()) return;
    if (ec)
    {
      fail(ConnectErrorKind::network, ec.message(), ec);
      return;
    }

    boost::system::error_code opt_ec;
    if (!tune_socket(opt_ec))
    {
      fail(ConnectErrorKind::network, "socket options: " + opt_ec.message(), opt_ec);
      return;
    }

    boost::system::error_code rep_ec;
    const auto rep = socket_.remote_endpoint(rep_ec);
    remote_ = rep_ec ? target_.to_string() : target_.host() + "/" + endpoint_string(rep);

    if (!owner_.tls_)
    {
      complete(std::make_shared<StreamTransport<tcp::socket>>(io_, std::move(socket_),
                                                              owner_.codec_(), remote_));
      return;
    }

    tls_ = std::make_unique<ssl::stream<tcp::socket>>(std::move(socket_), *owner_.tls_);

    const std::string sni = owner_.server_name_.empty() ? target_.host() : owner_.server_name_;
    boost::system::error_code ip_ec;
    boost::asio::ip::make_address(sni, ip_ec);
    if (ip_ec && SSL_set_tlsext_host_name(tls_->native_handle(), sni.c_str()) != 1)
    {
      fail(ConnectErrorKind::network, "cannot set TLS server name '" + sni + "'");
      return;
    }
    if (owner_.verify_peer_) tls_->set_verify_callback(ssl::host_name_verification(sni));

    tls_->async_handshake(ssl::stream_base::client,
                          [self = shared_from_this()](const boost::system::error_code& e)
                          { self->on_handshake(e); });
  }

  void on_handshake(const boost::system::error_code& ec)
  {
    if (done()) return;
    if (ec)
    {
      fail(ConnectErrorKind::network, "TLS handshake failed: " + ec.message(), ec);
      return;
    }
    auto t = std::make_shared<StreamTransport<ssl::stream<tcp::socket>>>(
        io_, std::move(*tls_), owner_.codec_(), remote_);
    tls_.reset();
    complete(std::move(t));
  }

  bool tune_socket(boost::system::error_code& ec)
  {
    const auto& o = owner_.net_;
    socket_.set_option(tcp::no_delay(o.tcp_nodelay), ec);
    if (!ec) socket_.set_option(boost::asio::socket_base::keep_alive(o.keep_alive), ec);
    if (!ec && o.receive_buffer)
      socket_.set_option(
          boost::asio::socket_base::receive_buffer_size(static_cast<int>(o.receive_buffer)), ec);
    if (!ec && o.send_buffer)
      socket_.set_option(boost::asio::socket_base::send_buffer_size(static_cast<int>(o.send_buffer)),
                         ec);
    return !ec;
  }

  void complete(std::shared_ptr<ITransport> t)
  {
    if (done_.exchange(true, std::memory_order_acq_rel)) return;
    owner_.track_transport(t);
    owner_.log_.link(LogLevel::info, "[Connector] established " + t->remote_endpoint() +
                                         (owner_.tls_ ? " (tls)" : ""));
    promise_.set_value(std::move(t));
  }

  void fail(ConnectErrorKind kind, const std::string& what, boost::system::error_code ec = {})
  {
    if (done_.exchange(true, std::memory_order_acq_rel)) return;
    boost::system::error_code ignored;
    if (socket_.is_open()) socket_.close(ignored);
    promise_.set_exception(std::make_exception_ptr(TransientConnectError(kind, what, ec)));
  }

  Connector_Asio& owner_;
  std::shared_ptr<boost::asio::io_context> io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  std::unique_ptr<ssl::stream<tcp::socket>> tls_;
  const CandidateAddress target_;
  const std::optional<CandidateAddress> local_;
  std::string remote_;

  std::atomic<bool> done_{false};
  std::promise<std::shared_ptr<ITransport>> promise_;
  std::shared_future<std::shared_ptr<ITransport>> future_;
};

// -------------------- Attempt --------------------
class Connector_Asio::Attempt final : public IConnectAttempt
{
 public:
  explicit Attempt(std::shared_ptr<Operation> op) : op_(std::move(op)) {}

  std::shared_ptr<ITransport> poll(std::chrono::milliseconds timeout) override
  {
    const auto& f = op_->future();
    if (f.wait_for(timeout) != std::future_status::ready) return nullptr;
    return f.get();  // rethrows TransientConnectError
  }

  const CandidateAddress& target() const override { return op_->target(); }

 private:
  std::shared_ptr<Operation> op_;
};

// -------------------- ctor/dtor --------------------
Connector_Asio::Connector_Asio(application::ports::ILogger& log, domain::NetworkingOptions net,
                               std::shared_ptr<ssl::context> tls, bool verify_peer,
                               std::string server_name, CodecFactory codec)
    : log_(log),
      net_(net),
      tls_(std::move(tls)),
      verify_peer_(verify_peer),
      server_name_(std::move(server_name)),
      codec_(std::move(codec)),
      io_(std::make_shared<boost::asio::io_context>()),
      work_(std::in_place, boost::asio::make_work_guard(*io_))
{
  io_thread_ = std::thread([io = io_] { io->run(); });
}

Connector_Asio::~Connector_Asio()
{
  dispose();
  if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id())
    io_thread_.join();
}

std::unique_ptr<Connector_Asio> Connector_Asio::create(application::ports::ILogger& log,
                                                       const domain::Settings& s,
                                                       CodecFactory codec)
{
  const auto& ssl_cfg = s.initiator.ssl;
  std::shared_ptr<ssl::context> tls;
  if (ssl_cfg.enabled) tls = tls::TlsContextFactory::create(ssl_cfg);

  return std::make_unique<Connector_Asio>(log, s.networking, std::move(tls), ssl_cfg.verify_peer,
                                          ssl_cfg.server_name, std::move(codec));
}

// -------------------- IConnector --------------------
std::unique_ptr<IConnectAttempt> Connector_Asio::connect(
    const CandidateAddress& target, const std::optional<CandidateAddress>& local_bind)
{
  auto op = std::make_shared<Operation>(*this, target, local_bind);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (is_disposed()) throw TransientConnectError(ConnectErrorKind::other, "connector disposed");
    ops_.erase(std::remove_if(ops_.begin(), ops_.end(),
                              [](const std::weak_ptr<Operation>& w)
                              {
                                auto o = w.lock();
                                return !o || o->done();
                              }),
               ops_.end());
    ops_.push_back(op);
  }
  op->start();
  return std::make_unique<Attempt>(std::move(op));
}

void Connector_Asio::dispose()
{
  std::vector<std::weak_ptr<Operation>> ops;
  std::vector<std::weak_ptr<ITransport>> transports;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;
    ops.swap(ops_);
    transports.swap(transports_);
  }

  for (auto& w : ops)
  {
    if (auto op = w.lock()) op->abort("connector disposed");
  }
  for (auto& w : transports)
  {
    if (auto t = w.lock()) t->close();
  }

  // queued aborts and closes drain, then run() returns
  work_.reset();
  if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id())
    io_thread_.join();

  log_.link(LogLevel::debug, "[Connector] disposed");
}

std::size_t Connector_Asio::in_flight() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::size_t>(std::count_if(ops_.begin(), ops_.end(),
                                                [](const std::weak_ptr<Operation>& w)
                                                {
                                                  auto o = w.lock();
                                                  return o && !o->done();
                                                }));
}

void Connector_Asio::track_transport(const std::shared_ptr<ITransport>& t)
{
  std::lock_guard<std::mutex> lk(mu_);
  if (is_disposed())
  {
    t->close();
    return;
  }
  transports_.erase(std::remove_if(transports_.begin(), transports_.end(),
                                   [](const std::weak_ptr<ITransport>& w) { return w.expired(); }),
                    transports_.end());
  transports_.push_back(t);
}

}  // namespace tether::initiator::infrastructure::net
