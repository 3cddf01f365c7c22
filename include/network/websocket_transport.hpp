// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_WEBSOCKET_TRANSPORT_HPP
#define MINTNODE_WEBSOCKET_TRANSPORT_HPP

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

namespace mintnode {
namespace network {

/**
 * WebSocketConnection - one accepted client over a binary WebSocket
 *
 * All stream operations run on the connection's strand (the executor the
 * socket was accepted on). Public methods may be called from any thread.
 */
class WebSocketConnection
    : public TransportConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  static std::shared_ptr<WebSocketConnection>
  create_inbound(boost::asio::ip::tcp::socket socket, size_t max_message_size);

  ~WebSocketConnection() override;

  /**
   * Run the HTTP upgrade handshake
   * @param callback true once the WebSocket is open, false on failure or
   * timeout (the socket is closed in that case)
   */
  void accept_upgrade(std::chrono::milliseconds timeout,
                      std::function<void(bool)> callback);

  void start() override;
  void async_write(SharedFrame data, WriteCallback on_complete) override;
  void close() override;
  bool is_open() const override { return open_.load(); }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  uint64_t connection_id() const override { return id_; }

  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  WebSocketConnection(boost::asio::ip::tcp::socket socket,
                      size_t max_message_size);

  void do_read();
  void do_write();
  void fail_pending_writes();
  void handle_disconnect();
  void close_socket();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer read_buffer_;
  size_t max_message_size_;

  // Strand-only. While a write is in flight it is the front entry.
  std::deque<std::pair<SharedFrame, WriteCallback>> write_queue_;
  bool write_in_flight_{false};

  std::atomic<bool> open_{false};

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;

  std::string remote_addr_;
  uint16_t remote_port_{0};
  uint64_t id_;

  static std::atomic<uint64_t> next_id_;
};

/**
 * WebSocketTransport - accepts WebSocket clients on the shared io_context
 *
 * Failed upgrades and per-connection accept errors are logged and the accept
 * loop continues.
 */
class WebSocketTransport : public Transport {
public:
  struct Config {
    size_t max_message_size;
    std::chrono::milliseconds upgrade_timeout;

    Config()
        : max_message_size(protocol::MAX_FRAME_SIZE +
                           protocol::FRAME_HEADER_SIZE),
          upgrade_timeout(protocol::WEBSOCKET_UPGRADE_TIMEOUT_MS) {}
  };

  explicit WebSocketTransport(boost::asio::io_context &io_context,
                              const Config &config = Config{});
  ~WebSocketTransport() override;

  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  bool is_listening() const override { return listening_.load(); }
  uint16_t local_port() const override { return local_port_.load(); }

private:
  void start_accept();

  boost::asio::io_context &io_context_;
  Config config_;
  boost::asio::strand<boost::asio::io_context::executor_type> acceptor_strand_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<bool> listening_{false};
  std::atomic<uint16_t> local_port_{0};
};

} // namespace network
} // namespace mintnode

#endif // MINTNODE_WEBSOCKET_TRANSPORT_HPP
