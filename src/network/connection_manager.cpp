// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/connection_manager.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/subscription_hub.hpp"
#include "util/logging.hpp"

namespace mintnode {
namespace network {

ConnectionManager::ConnectionManager(boost::asio::io_context &io_context,
                                     std::shared_ptr<Transport> transport,
                                     rpc::RPCDispatcher &dispatcher,
                                     SubscriptionHub &hub,
                                     metrics::MetricsRegistry &metrics,
                                     const Config &config)
    : io_context_(io_context), transport_(std::move(transport)),
      dispatcher_(dispatcher), hub_(hub), metrics_(metrics), config_(config) {}

ConnectionManager::~ConnectionManager() {
  if (transport_ && transport_->is_listening()) {
    transport_->stop_listening();
  }
}

bool ConnectionManager::start() {
  if (accepting_.exchange(true)) {
    return false;
  }

  if (!config_.listen_enabled || !transport_) {
    LOG_NET_INFO("inbound connections disabled");
    return true;
  }

  bool ok = transport_->listen(
      config_.listen_port, [this](TransportConnectionPtr connection) {
        handle_inbound_connection(std::move(connection));
      });
  if (!ok) {
    LOG_NET_ERROR("failed to start listener on port {}", config_.listen_port);
    accepting_ = false;
    return false;
  }
  return true;
}

uint16_t ConnectionManager::listen_port() const {
  return transport_ ? transport_->local_port() : 0;
}

void ConnectionManager::handle_inbound_connection(
    TransportConnectionPtr connection) {
  if (!connection) {
    return;
  }
  if (!accepting_.load()) {
    LOG_NET_TRACE("rejecting connection from {}: not accepting",
                  connection->remote_address());
    connection->close();
    return;
  }

  metrics_.connections_accepted.inc();

  SessionPtr session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.size() >= config_.max_connections) {
      LOG_NET_INFO("rejecting connection from {}:{} (limit of {} reached)",
                   connection->remote_address(), connection->remote_port(),
                   config_.max_connections);
      connection->close();
      return;
    }

    uint64_t id = next_session_id_++;
    session = Session::create(
        io_context_, connection, id, config_.session, dispatcher_, hub_,
        metrics_, [this](uint64_t closed_id, CloseReason reason) {
          on_session_closed(closed_id, reason);
        });
    sessions_[id] = session;
  }

  metrics_.sessions_active.inc();
  LOG_NET_DEBUG("accepted session {} from {}:{}", session->id(),
                connection->remote_address(), connection->remote_port());
  session->start();
}

void ConnectionManager::on_session_closed(uint64_t id, CloseReason reason) {
  size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) == 0) {
      return;
    }
    remaining = sessions_.size();
  }
  metrics_.sessions_active.dec();
  sessions_cv_.notify_all();
  LOG_NET_DEBUG("session {} removed ({}), {} remaining", id,
                close_reason_name(reason), remaining);
}

std::vector<SessionPtr> ConnectionManager::snapshot_sessions() const {
  std::vector<SessionPtr> result;
  std::lock_guard<std::mutex> lock(mutex_);
  result.reserve(sessions_.size());
  for (const auto &[id, weak] : sessions_) {
    if (auto session = weak.lock()) {
      result.push_back(std::move(session));
    }
  }
  return result;
}

void ConnectionManager::stop_accepting() {
  if (!accepting_.exchange(false)) {
    return;
  }
  if (transport_) {
    transport_->stop_listening();
  }
}

void ConnectionManager::drain_all() {
  auto sessions = snapshot_sessions();
  LOG_NET_INFO("draining {} sessions", sessions.size());
  for (auto &session : sessions) {
    session->begin_drain();
  }
}

bool ConnectionManager::wait_for_sessions(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(mutex_);
  return sessions_cv_.wait_for(lock, grace,
                               [this]() { return sessions_.empty(); });
}

void ConnectionManager::close_all(CloseReason reason) {
  auto sessions = snapshot_sessions();
  if (!sessions.empty()) {
    LOG_NET_INFO("force-closing {} sessions", sessions.size());
  }
  for (auto &session : sessions) {
    session->close(reason);
  }
}

size_t ConnectionManager::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace network
} // namespace mintnode
