// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CONNECTION_MANAGER_HPP
#define MINTNODE_CONNECTION_MANAGER_HPP

#include "network/protocol.hpp"
#include "network/session.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

namespace mintnode {

namespace metrics { class MetricsRegistry; }
namespace rpc { class RPCDispatcher; }

namespace network {

class SubscriptionHub;

// ConnectionManager - accepts client connections, spawns one Session per
// connection and tracks the live set for shutdown
class ConnectionManager {
public:
  struct Config {
    uint16_t listen_port;   // 0 = ephemeral
    bool listen_enabled;    // Accept inbound connections
    size_t max_connections; // Connections beyond this are closed on accept
    Session::Config session;

    Config()
        : listen_port(protocol::ports::RPC), listen_enabled(true),
          max_connections(protocol::DEFAULT_MAX_CONNECTIONS) {}
  };

  ConnectionManager(boost::asio::io_context &io_context,
                    std::shared_ptr<Transport> transport,
                    rpc::RPCDispatcher &dispatcher, SubscriptionHub &hub,
                    metrics::MetricsRegistry &metrics,
                    const Config &config = Config{});
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  // Start listening (when enabled). Returns false if the listener failed.
  bool start();

  // Shutdown steps, in the order the coordinator calls them
  void stop_accepting();
  void drain_all();
  // Block until every session has closed or the grace period elapses.
  // Returns true if all sessions closed in time.
  bool wait_for_sessions(std::chrono::milliseconds grace);
  void close_all(CloseReason reason);

  size_t session_count() const;
  bool is_accepting() const { return accepting_.load(); }
  uint16_t listen_port() const;

  // Called by the transport for each accepted connection (public for tests)
  void handle_inbound_connection(TransportConnectionPtr connection);

private:
  void on_session_closed(uint64_t id, CloseReason reason);
  std::vector<SessionPtr> snapshot_sessions() const;

  boost::asio::io_context &io_context_;
  std::shared_ptr<Transport> transport_;
  rpc::RPCDispatcher &dispatcher_;
  SubscriptionHub &hub_;
  metrics::MetricsRegistry &metrics_;
  Config config_;

  mutable std::mutex mutex_;
  std::condition_variable sessions_cv_;
  std::map<uint64_t, std::weak_ptr<Session>> sessions_;

  std::atomic<uint64_t> next_session_id_{1};
  std::atomic<bool> accepting_{false};
};

} // namespace network
} // namespace mintnode

#endif // MINTNODE_CONNECTION_MANAGER_HPP
