// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_transport.hpp"

#include "util/logging.hpp"

#include <utility>

namespace quorumwire {
namespace network {

namespace {

void SetSocketOptions(asio::ip::tcp::socket& socket) {
  // Best-effort
  asio::error_code ec;
  socket.set_option(asio::ip::tcp::no_delay(true), ec);
  socket.set_option(asio::socket_base::keep_alive(true), ec);
}

// One outbound dial: resolve, connect, and a deadline racing both.
// All handlers run on strand_; done_ ensures the callback fires once.
class OutboundDial : public std::enable_shared_from_this<OutboundDial> {
public:
  OutboundDial(asio::io_context& io_context, std::string host, uint16_t port, ConnectCallback callback)
      : strand_(asio::make_strand(io_context)),
        resolver_(io_context),
        socket_(io_context),
        timer_(strand_),
        host_(std::move(host)),
        port_(port),
        callback_(std::move(callback)) {}

  void start(std::chrono::milliseconds timeout) {
    asio::dispatch(strand_, [self = shared_from_this(), timeout]() { self->start_impl(timeout); });
  }

private:
  void start_impl(std::chrono::milliseconds timeout) {
    if (timeout.count() > 0) {
      (void)timer_.expires_after(timeout);
      timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || self->done_) {
          return;
        }
        LOG_NET_DEBUG("connect timeout to {}:{}", self->host_, self->port_);
        self->resolver_.cancel();
        asio::error_code ignored;
        self->socket_.close(ignored);
        self->finish(asio::error::timed_out);
      });
    }

    resolver_.async_resolve(host_, std::to_string(port_),
                            asio::bind_executor(strand_, [self = shared_from_this()](
                                                             const asio::error_code& ec,
                                                             asio::ip::tcp::resolver::results_type results) {
                              if (self->done_) {
                                return;
                              }
                              if (ec) {
                                LOG_NET_DEBUG("failed to resolve {}: {}", self->host_, ec.message());
                                self->finish(ec);
                                return;
                              }
                              self->connect(results);
                            }));
  }

  void connect(const asio::ip::tcp::resolver::results_type& results) {
    asio::async_connect(socket_, results,
                        asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec,
                                                                                 const asio::ip::tcp::endpoint&) {
                          if (self->done_) {
                            return;
                          }
                          if (ec) {
                            LOG_NET_DEBUG("failed to connect to {}:{}: {}", self->host_, self->port_, ec.message());
                            self->finish(ec);
                            return;
                          }
                          SetSocketOptions(self->socket_);
                          self->finish({});
                        }));
  }

  void finish(const asio::error_code& ec) {
    done_ = true;
    (void)timer_.cancel();
    ConnectCallback callback = std::move(callback_);
    if (!callback) {
      return;
    }
    if (ec) {
      asio::error_code ignored;
      socket_.close(ignored);
    }
    callback(ec, std::move(socket_));
  }

  asio::strand<asio::io_context::executor_type> strand_;
  asio::ip::tcp::resolver resolver_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  std::string host_;
  uint16_t port_;
  ConnectCallback callback_;
  bool done_{false};
};

}  // namespace

std::shared_ptr<TcpTransport> TcpTransport::create(asio::io_context& io_context) {
  return std::make_shared<TcpTransport>(PrivateTag{}, io_context);
}

TcpTransport::TcpTransport(PrivateTag, asio::io_context& io_context) : io_context_(io_context) {}

TcpTransport::~TcpTransport() {
  stop();
}

void TcpTransport::connect(const std::string& host, uint16_t port, ConnectCallback callback) {
  if (!is_running()) {
    asio::post(io_context_, [callback = std::move(callback), &io = io_context_]() {
      if (callback) {
        callback(asio::error::operation_aborted, asio::ip::tcp::socket(io));
      }
    });
    return;
  }

  auto dial = std::make_shared<OutboundDial>(io_context_, host, port, std::move(callback));
  dial->start(connect_timeout());
}

bool TcpTransport::listen(uint16_t port, AcceptCallback accept_callback, const std::string& bind_address) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  using tcp = asio::ip::tcp;
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);

  try {
    if (!bind_address.empty()) {
      tcp::endpoint ep(asio::ip::make_address(bind_address), port);
      acceptor->open(ep.protocol());
      acceptor->set_option(tcp::acceptor::reuse_address(true));
      acceptor->bind(ep);
      acceptor->listen(asio::socket_base::max_listen_connections);
    } else {
      // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
      try {
        acceptor->open(tcp::v6());
        acceptor->set_option(asio::ip::v6_only(false));
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(tcp::endpoint(tcp::v6(), port));
        acceptor->listen(asio::socket_base::max_listen_connections);
      } catch (const std::exception&) {
        asio::error_code ec;
        acceptor->close(ec);
        acceptor->open(tcp::v4());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(tcp::endpoint(tcp::v4(), port));
        acceptor->listen(asio::socket_base::max_listen_connections);
      }
    }
  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    asio::error_code ec;
    acceptor->close(ec);
    return false;
  }

  // Record the actual bound port (handles ephemeral port 0)
  asio::error_code ec;
  auto ep = acceptor->local_endpoint(ec);
  last_listen_port_ = ec ? 0 : ep.port();

  acceptor_ = std::move(acceptor);
  accept_callback_ = std::move(accept_callback);

  LOG_NET_INFO("listening on port {}", last_listen_port_ ? last_listen_port_ : port);
  start_accept();
  return true;
}

// acceptor_mutex_ held
void TcpTransport::start_accept() {
  if (!acceptor_) {
    return;
  }

  std::weak_ptr<TcpTransport> weak_self = weak_from_this();
  acceptor_->async_accept([weak_self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (auto self = weak_self.lock()) {
      self->handle_accept(ec, std::move(socket));
    }
  });
}

void TcpTransport::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec == asio::error::operation_aborted) {
    return;
  }

  AcceptCallback callback;
  {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    if (!acceptor_) {
      return;
    }
    callback = accept_callback_;
    // Keep accepting regardless of this connection's fate
    start_accept();
  }

  if (ec) {
    LOG_NET_TRACE("accept error: {}", ec.message());
    return;
  }

  SetSocketOptions(socket);

  asio::error_code ep_ec;
  auto remote = socket.remote_endpoint(ep_ec);
  if (ep_ec) {
    LOG_NET_TRACE("accepted socket already disconnected: {}", ep_ec.message());
    return;
  }
  LOG_NET_DEBUG("connection from {}:{} accepted", remote.address().to_string(), remote.port());

  if (callback) {
    callback(std::move(socket));
  }
}

void TcpTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  // Release anything captured by the callback
  accept_callback_ = {};
}

uint16_t TcpTransport::listening_port() const {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  return last_listen_port_;
}

void TcpTransport::stop() {
  running_.store(false, std::memory_order_release);
  stop_listening();
}

}  // namespace network
}  // namespace quorumwire
