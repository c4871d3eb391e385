#pragma once

#include <array>
#include <atomic>
#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "application/ports/IFrameCodec.hpp"
#include "application/ports/ITransport.hpp"

namespace tether::initiator::infrastructure::net
{

// Established connection over a plain TCP socket or a TLS stream. All I/O
// runs on the stream's (strand) executor.
template <typename Stream>
class StreamTransport final : public tether::initiator::application::ports::ITransport,
                              public std::enable_shared_from_this<StreamTransport<Stream>>
{
 public:
  // `io` keeps the I/O context alive for as long as the stream exists.
  StreamTransport(std::shared_ptr<boost::asio::io_context> io, Stream stream,
                  std::shared_ptr<tether::initiator::application::ports::IFrameCodec> codec,
                  std::string remote)
      : io_(std::move(io)),
        stream_(std::move(stream)),
        codec_(std::move(codec)),
        remote_(std::move(remote))
  {
    connected_ = true;
  }

  // ITransport
  void start(FrameHandler on_frame, CloseHandler on_closed) override
  {
    auto self = this->shared_from_this();
    boost::asio::post(stream_.get_executor(),
                      [self, f = std::move(on_frame), c = std::move(on_closed)]() mutable
                      {
                        self->on_frame_ = std::move(f);
                        self->on_closed_ = std::move(c);
                        self->do_read();
                      });
  }

  void send(std::span<const std::byte> payload) override
  {
    auto msg = codec_->encode(payload);
    auto self = this->shared_from_this();
    boost::asio::post(stream_.get_executor(),
                      [self, msg = std::move(msg)]() mutable
                      {
                        self->send_q_.push_back(std::move(msg));
                        self->flush_sendq();
                      });
  }

  void close() override
  {
    auto self = this->shared_from_this();
    boost::asio::post(stream_.get_executor(), [self] { self->shutdown("closed locally"); });
  }

  bool is_connected() const override { return connected_.load(std::memory_order_acquire); }
  std::string remote_endpoint() const override { return remote_; }

 private:
  void do_read()
  {
    if (!connected_) return;
    auto self = this->shared_from_this();
    stream_.async_read_some(
        boost::asio::buffer(rbuf_),
        [self](const boost::system::error_code& ec, std::size_t n)
        {
          if (ec)
          {
            self->shutdown(ec == boost::asio::error::eof ? "peer closed connection" : ec.message());
            return;
          }

          self->inbound_.insert(self->inbound_.end(), self->rbuf_.begin(), self->rbuf_.begin() + n);
          std::vector<std::vector<std::byte>> frames;
          const auto used = self->codec_->feed(self->inbound_, frames);
          self->inbound_.erase(self->inbound_.begin(), self->inbound_.begin() + used);

          for (const auto& f : frames)
          {
            if (self->on_frame_) self->on_frame_(std::span<const std::byte>(f.data(), f.size()));
          }
          self->do_read();
        });
  }

  void flush_sendq()
  {
    if (!connected_ || sending_ || send_q_.empty()) return;

    sending_ = true;
    auto owned = std::make_shared<std::vector<std::byte>>(std::move(send_q_.front()));
    send_q_.pop_front();

    auto self = this->shared_from_this();
    boost::asio::async_write(stream_, boost::asio::buffer(*owned),
                             [self, owned](const boost::system::error_code& ec, std::size_t)
                             {
                               self->sending_ = false;
                               if (ec)
                               {
                                 self->shutdown("write failed: " + ec.message());
                                 return;
                               }
                               self->flush_sendq();
                             });
  }

  void shutdown(const std::string& reason)
  {
    if (!connected_.exchange(false, std::memory_order_acq_rel)) return;

    boost::system::error_code ec;
    stream_.lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    stream_.lowest_layer().close(ec);
    send_q_.clear();

    if (on_closed_)
    {
      auto cb = std::move(on_closed_);
      on_closed_ = nullptr;
      cb(reason);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_;
  Stream stream_;
  std::shared_ptr<tether::initiator::application::ports::IFrameCodec> codec_;
  const std::string remote_;
  std::atomic<bool> connected_{false};

  std::array<std::byte, 4096> rbuf_{};
  std::vector<std::byte> inbound_;
  std::deque<std::vector<std::byte>> send_q_;
  bool sending_{false};

  FrameHandler on_frame_;
  CloseHandler on_closed_;
};

}  // namespace tether::initiator::infrastructure::net
