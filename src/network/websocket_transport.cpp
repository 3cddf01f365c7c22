// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/websocket_transport.hpp"
#include "util/logging.hpp"

namespace mintnode {
namespace network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// ============================================================================
// WebSocketConnection
// ============================================================================

std::atomic<uint64_t> WebSocketConnection::next_id_{1};

std::shared_ptr<WebSocketConnection>
WebSocketConnection::create_inbound(tcp::socket socket,
                                    size_t max_message_size) {
  return std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(std::move(socket), max_message_size));
}

WebSocketConnection::WebSocketConnection(tcp::socket socket,
                                         size_t max_message_size)
    : ws_(std::move(socket)), max_message_size_(max_message_size),
      id_(next_id_++) {
  boost::system::error_code ec;
  auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  if (!ec) {
    remote_addr_ = ep.address().to_string();
    remote_port_ = ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
}

WebSocketConnection::~WebSocketConnection() {
  // close() must run while the shared_ptr is alive; pending handlers hold it
  if (open_.load()) {
    LOG_NET_ERROR("WebSocketConnection {} destroyed without close() ({}:{})",
                  id_, remote_addr_, remote_port_);
  }
}

void WebSocketConnection::accept_upgrade(std::chrono::milliseconds timeout,
                                         std::function<void(bool)> callback) {
  auto self = shared_from_this();
  boost::asio::dispatch(ws_.get_executor(), [self, timeout, callback]() {
    beast::get_lowest_layer(self->ws_).expires_after(timeout);
    self->ws_.read_message_max(self->max_message_size_);

    self->ws_.async_accept([self, callback](beast::error_code ec) {
      if (ec) {
        LOG_NET_DEBUG("websocket upgrade failed from {}:{}: {}",
                      self->remote_addr_, self->remote_port_, ec.message());
        self->close_socket();
        callback(false);
        return;
      }

      // The websocket stream manages its own timeouts from here on
      beast::get_lowest_layer(self->ws_).expires_never();
      self->ws_.set_option(
          websocket::stream_base::timeout::suggested(beast::role_type::server));
      self->ws_.binary(true);
      self->open_ = true;
      callback(true);
    });
  });
}

void WebSocketConnection::start() {
  if (!open_)
    return;
  auto self = shared_from_this();
  boost::asio::dispatch(ws_.get_executor(), [self]() { self->do_read(); });
}

void WebSocketConnection::do_read() {
  if (!open_)
    return;

  ws_.async_read(read_buffer_, [self = shared_from_this()](
                                   beast::error_code ec, std::size_t bytes) {
    if (ec) {
      if (ec != websocket::error::closed &&
          ec != boost::asio::error::operation_aborted &&
          ec != boost::asio::error::eof) {
        LOG_NET_TRACE("read error from {}:{}: {}", self->remote_addr_,
                      self->remote_port_, ec.message());
      }
      self->handle_disconnect();
      return;
    }

    auto buffer = self->read_buffer_.data();
    const auto *begin = static_cast<const uint8_t *>(buffer.data());
    std::vector<uint8_t> data(begin, begin + buffer.size());
    self->read_buffer_.consume(self->read_buffer_.size());

    ReceiveCallback cb;
    {
      std::lock_guard<std::mutex> lock(self->callback_mutex_);
      cb = self->receive_callback_;
    }
    if (cb && !data.empty()) {
      LOG_NET_TRACE("received {} bytes from {}:{}", bytes, self->remote_addr_,
                    self->remote_port_);
      try {
        cb(data);
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in receive callback from {}:{}: {}",
                      self->remote_addr_, self->remote_port_, e.what());
      }
    }

    self->do_read();
  });
}

void WebSocketConnection::async_write(SharedFrame data,
                                      WriteCallback on_complete) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, data = std::move(data),
                                         on_complete]() mutable {
    if (!self->open_ || !data) {
      if (on_complete)
        on_complete(false);
      return;
    }
    self->write_queue_.emplace_back(std::move(data), std::move(on_complete));
    self->do_write();
  });
}

void WebSocketConnection::do_write() {
  if (write_in_flight_ || write_queue_.empty())
    return;

  write_in_flight_ = true;
  // The handler owns a reference so the buffer outlives the operation
  SharedFrame frame = write_queue_.front().first;
  ws_.async_write(
      boost::asio::buffer(*frame),
      [self = shared_from_this(), frame](beast::error_code ec, std::size_t) {
        self->write_in_flight_ = false;
        auto cb = std::move(self->write_queue_.front().second);
        self->write_queue_.pop_front();

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", self->remote_addr_,
                        self->remote_port_, ec.message());
          if (cb)
            cb(false);
          self->fail_pending_writes();
          self->handle_disconnect();
          return;
        }

        if (cb)
          cb(true);
        if (!self->open_) {
          self->fail_pending_writes();
          return;
        }
        self->do_write();
      });
}

void WebSocketConnection::fail_pending_writes() {
  // An in-flight entry stays at the front until its handler runs
  auto first = write_queue_.begin() + (write_in_flight_ ? 1 : 0);
  std::vector<WriteCallback> pending;
  for (auto it = first; it != write_queue_.end(); ++it) {
    pending.push_back(std::move(it->second));
  }
  write_queue_.erase(first, write_queue_.end());

  for (auto &cb : pending) {
    if (cb)
      cb(false);
  }
}

void WebSocketConnection::handle_disconnect() {
  if (!open_.exchange(false)) {
    return;
  }

  DisconnectCallback saved;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    saved = std::move(disconnect_callback_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }
  fail_pending_writes();
  close_socket();

  if (saved) {
    try {
      saved();
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in disconnect callback: {}", e.what());
    }
  }
}

void WebSocketConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }

  // Clear callbacks first so late completions cannot reach the owner
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    receive_callback_ = {};
    disconnect_callback_ = {};
  }

  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self]() {
    self->fail_pending_writes();
    if (!self->write_in_flight_ && self->ws_.is_open()) {
      // Nothing in flight: send a close frame
      self->ws_.async_close(websocket::close_code::normal,
                            [self](beast::error_code) { self->close_socket(); });
    } else {
      // The in-flight write completes with an error once the socket closes
      self->close_socket();
    }
  });
}

void WebSocketConnection::close_socket() {
  boost::system::error_code ec;
  auto &socket = beast::get_lowest_layer(ws_).socket();
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);
}

void WebSocketConnection::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void WebSocketConnection::set_disconnect_callback(DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  disconnect_callback_ = std::move(callback);
}

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(boost::asio::io_context &io_context,
                                       const Config &config)
    : io_context_(io_context), config_(config),
      acceptor_strand_(boost::asio::make_strand(io_context)) {}

WebSocketTransport::~WebSocketTransport() {
  // The io threads are gone by now; close synchronously
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }
}

bool WebSocketTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_WARN("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(acceptor_strand_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen();
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen();
    }

    local_port_ = acceptor_->local_endpoint().port();
    listening_ = true;
    LOG_NET_INFO("listening for websocket clients on port {}",
                 local_port_.load());
    boost::asio::post(acceptor_strand_, [this]() { start_accept(); });
    return true;

  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    acceptor_.reset();
    return false;
  }
}

void WebSocketTransport::start_accept() {
  if (!listening_ || !acceptor_)
    return;

  acceptor_->async_accept(
      boost::asio::make_strand(io_context_),
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
          if (ec == boost::asio::error::operation_aborted || !listening_) {
            return;
          }
          LOG_NET_WARN("accept failed: {}", ec.message());
          start_accept();
          return;
        }

        boost::system::error_code opt_ec;
        socket.set_option(tcp::no_delay(true), opt_ec);
        socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

        auto conn = WebSocketConnection::create_inbound(
            std::move(socket), config_.max_message_size);
        conn->accept_upgrade(config_.upgrade_timeout, [this, conn](bool ok) {
          if (!ok) {
            return;
          }
          if (!listening_) {
            conn->close();
            return;
          }
          try {
            accept_callback_(conn);
          } catch (const std::exception &e) {
            LOG_NET_ERROR("exception in accept callback: {}", e.what());
            conn->close();
          }
        });

        start_accept();
      });
}

void WebSocketTransport::stop_listening() {
  if (!listening_.exchange(false)) {
    return;
  }

  LOG_NET_INFO("stopped accepting websocket clients");
  boost::asio::post(acceptor_strand_, [this]() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
  });
}

} // namespace network
} // namespace mintnode
