// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/session.hpp"
#include "metrics/metrics_registry.hpp"
#include "rpc/rpc_dispatcher.hpp"
#include "util/logging.hpp"

namespace mintnode {
namespace network {

const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::HANDSHAKING:
    return "handshaking";
  case SessionState::ACTIVE:
    return "active";
  case SessionState::DRAINING:
    return "draining";
  case SessionState::CLOSED:
    return "closed";
  }
  return "unknown";
}

const char *close_reason_name(CloseReason reason) {
  switch (reason) {
  case CloseReason::NONE:
    return "none";
  case CloseReason::PEER_CLOSED:
    return "peer-closed";
  case CloseReason::TRANSPORT_ERROR:
    return "transport-error";
  case CloseReason::HANDSHAKE_FAILED:
    return "handshake-failed";
  case CloseReason::MALFORMED_FRAME:
    return "malformed-frame";
  case CloseReason::UNKNOWN_MESSAGE:
    return "unknown-message";
  case CloseReason::RESOURCE_EXHAUSTED:
    return "resource-exhausted";
  case CloseReason::INACTIVITY_TIMEOUT:
    return "inactivity-timeout";
  case CloseReason::SHUTDOWN:
    return "shutdown";
  case CloseReason::DRAIN_TIMEOUT:
    return "drain-timeout";
  }
  return "unknown";
}

Session::Session(boost::asio::io_context &io_context,
                 TransportConnectionPtr connection, uint64_t id,
                 const Config &config, rpc::RPCDispatcher &dispatcher,
                 SubscriptionHub &hub, metrics::MetricsRegistry &metrics,
                 CloseHandler on_close)
    : strand_(boost::asio::make_strand(io_context)),
      connection_(std::move(connection)), id_(id), config_(config),
      dispatcher_(dispatcher), hub_(hub), metrics_(metrics),
      on_close_(std::move(on_close)), handshake_timer_(strand_),
      inactivity_timer_(strand_), drain_timer_(strand_),
      decoder_(config.max_frame_size) {
  if (connection_) {
    remote_addr_ = connection_->remote_address() + ":" +
                   std::to_string(connection_->remote_port());
  }
}

Session::~Session() {
  // Teardown belongs in close(), while a shared_ptr is still alive
  if (state_ != SessionState::CLOSED && started_) {
    LOG_NET_ERROR("session {} destroyed in state {} without close()", id_,
                  session_state_name(state_));
  }
}

SessionPtr Session::create(boost::asio::io_context &io_context,
                           TransportConnectionPtr connection, uint64_t id,
                           const Config &config, rpc::RPCDispatcher &dispatcher,
                           SubscriptionHub &hub,
                           metrics::MetricsRegistry &metrics,
                           CloseHandler on_close) {
  return SessionPtr(new Session(io_context, std::move(connection), id, config,
                                dispatcher, hub, metrics, std::move(on_close)));
}

void Session::start() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->do_start(); });
}

void Session::begin_drain() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->enter_draining(CloseReason::SHUTDOWN);
  });
}

void Session::close(CloseReason reason) {
  boost::asio::post(strand_, [self = shared_from_this(), reason]() {
    self->do_close(reason);
  });
}

void Session::deliver_notification(SharedFrame frame) {
  boost::asio::post(strand_,
                    [self = shared_from_this(), frame = std::move(frame)]() {
                      self->enqueue_notification(frame);
                    });
}

// ----------------------------------------------------------------------------
// Lifecycle (strand-only from here on)
// ----------------------------------------------------------------------------

void Session::do_start() {
  if (started_ || state_ != SessionState::HANDSHAKING) {
    LOG_NET_TRACE("session {} already started, ignoring start()", id_);
    return;
  }
  if (!connection_ || !connection_->is_open()) {
    LOG_NET_DEBUG("session {} has no open connection", id_);
    started_ = true;
    do_close(CloseReason::PEER_CLOSED);
    return;
  }
  started_ = true;

  // Transport callbacks hold a strong reference; do_close() clears them
  SessionPtr self = shared_from_this();
  connection_->set_receive_callback([self](const std::vector<uint8_t> &data) {
    boost::asio::post(self->strand_,
                      [self, data]() { self->on_receive(data); });
  });
  connection_->set_disconnect_callback([self]() {
    boost::asio::post(self->strand_,
                      [self]() { self->do_close(CloseReason::PEER_CLOSED); });
  });

  connection_->start();
  start_handshake_timeout();
  LOG_NET_DEBUG("session {} started ({})", id_, remote_addr_);
}

void Session::enter_draining(CloseReason reason) {
  auto state = state_.load();
  if (state == SessionState::DRAINING || state == SessionState::CLOSED) {
    return;
  }
  if (state == SessionState::HANDSHAKING) {
    // Nothing owed to a client that never completed its handshake
    do_close(reason);
    return;
  }

  state_ = SessionState::DRAINING;
  drain_reason_ = reason;
  handshake_timer_.cancel();
  inactivity_timer_.cancel();
  LOG_NET_DEBUG("session {} draining ({}), {} frames queued", id_,
                close_reason_name(reason), queue_.size());

  if (output_idle()) {
    do_close(reason);
    return;
  }
  start_drain_timeout();
}

void Session::do_close(CloseReason reason) {
  if (state_ == SessionState::CLOSED) {
    return;
  }

  state_ = SessionState::CLOSED;
  close_reason_ = reason;
  cancel_all_timers();
  queue_.clear();

  // Leave the registry before anything else can observe CLOSED
  hub_.unsubscribe(id_);

  if (connection_) {
    connection_->set_receive_callback({});
    connection_->set_disconnect_callback({});
    connection_->close();
    connection_.reset();
  }

  LOG_NET_DEBUG("session {} closed ({})", id_, close_reason_name(reason));

  if (on_close_) {
    auto handler = std::move(on_close_);
    on_close_ = nullptr;
    try {
      handler(id_, reason);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in close handler for session {}: {}", id_,
                    e.what());
    }
  }
}

// ----------------------------------------------------------------------------
// Inbound
// ----------------------------------------------------------------------------

void Session::on_receive(const std::vector<uint8_t> &data) {
  if (state_ != SessionState::HANDSHAKING && state_ != SessionState::ACTIVE) {
    return;
  }
  if (close_after_flush_) {
    return;
  }

  decoder_.feed(data);
  if (decoder_.buffered() > config_.recv_flood_size) {
    metrics_.sessions_dropped_backpressure.inc();
    LOG_NET_WARN("session {} exceeded receive flood limit ({} > {} bytes), "
                 "disconnecting {}",
                 id_, decoder_.buffered(), config_.recv_flood_size,
                 remote_addr_);
    do_close(CloseReason::RESOURCE_EXHAUSTED);
    return;
  }

  process_frames();

  if (state_ == SessionState::ACTIVE) {
    start_inactivity_timeout();
  }
}

void Session::process_frames() {
  std::vector<uint8_t> payload;
  while ((state_ == SessionState::HANDSHAKING ||
          state_ == SessionState::ACTIVE) &&
         !request_in_flight_ && !close_after_flush_) {
    auto status = decoder_.next(payload);
    if (status == DecodeStatus::NEED_MORE) {
      break;
    }
    if (status == DecodeStatus::MALFORMED) {
      metrics_.frames_malformed.inc();
      LOG_NET_WARN("session {} sent a frame over {} bytes, disconnecting {}",
                   id_, decoder_.max_frame_size(), remote_addr_);
      do_close(CloseReason::MALFORMED_FRAME);
      return;
    }
    handle_payload(payload);
  }
}

void Session::handle_payload(const std::vector<uint8_t> &payload) {
  Envelope env;
  std::string error;
  bool decoded = decode_envelope(payload, env, error);

  if (state_ == SessionState::HANDSHAKING) {
    if (!decoded) {
      fail_handshake("expected handshake: " + error, std::nullopt);
      return;
    }
    handle_handshake(env);
    return;
  }

  if (decoded && env.kind != message::MessageKind::REQUEST) {
    decoded = false;
    error = std::string("unexpected ") + message::type_name(env.msg->type());
  }

  if (!decoded) {
    LOG_NET_DEBUG("session {} sent unknown message: {}", id_, error);
    message::ErrorResponse response(message::ErrorCode::UNKNOWN_MESSAGE, error);
    send_response(response, env.id);
    if (config_.strict_mode && state_ == SessionState::ACTIVE) {
      enter_draining(CloseReason::UNKNOWN_MESSAGE);
    }
    return;
  }

  rpc::RequestContext ctx;
  ctx.session_id = id_;
  ctx.sink = weak_from_this();

  // The response may arrive from the ledger strand; finish on ours
  request_in_flight_ = true;
  const std::optional<uint32_t> request_id = env.id;
  auto self = shared_from_this();
  dispatcher_.Dispatch(
      *env.msg, ctx,
      [self, request_id](std::unique_ptr<message::Message> response) {
        boost::asio::post(self->strand_, [self, request_id,
                                          response = std::move(response)]() {
          self->on_dispatch_complete(*response, request_id);
        });
      });
}

void Session::on_dispatch_complete(const message::Message &response,
                                   std::optional<uint32_t> id) {
  request_in_flight_ = false;
  if (state_ == SessionState::CLOSED) {
    return;
  }

  // Owed even while draining
  send_response(response, id);

  if (state_ == SessionState::DRAINING) {
    if (output_idle()) {
      do_close(drain_reason_);
    }
    return;
  }
  process_frames();
}

void Session::handle_handshake(const Envelope &env) {
  if (env.kind != message::MessageKind::REQUEST ||
      env.msg->type() != message::MessageType::HANDSHAKE) {
    fail_handshake(std::string("expected handshake, got ") +
                       message::type_name(env.msg->type()),
                   env.id);
    return;
  }

  const auto &hello = static_cast<const message::HandshakeRequest &>(*env.msg);
  if (hello.protocol_version < protocol::MIN_PROTOCOL_VERSION) {
    fail_handshake("protocol version " +
                       std::to_string(hello.protocol_version) +
                       " is too old",
                   env.id);
    return;
  }
  if (hello.network_magic != config_.network_magic) {
    fail_handshake("network magic mismatch", env.id);
    return;
  }

  handshake_timer_.cancel();
  state_ = SessionState::ACTIVE;
  LOG_NET_DEBUG("session {} handshake complete (version={}, agent={})", id_,
                hello.protocol_version, hello.user_agent);

  auto ack = dispatcher_.BuildHandshakeAck(id_);
  send_response(*ack, env.id);
  start_inactivity_timeout();
}

void Session::fail_handshake(const std::string &detail,
                             std::optional<uint32_t> id) {
  LOG_NET_DEBUG("session {} handshake failed: {}", id_, detail);
  message::ErrorResponse response(message::ErrorCode::HANDSHAKE_FAILED, detail);
  send_response(response, id);
  if (state_ == SessionState::CLOSED) {
    return;
  }

  // Still HANDSHAKING until the error is on the wire; the handshake timer
  // bounds a peer that never reads it
  if (output_idle()) {
    do_close(CloseReason::HANDSHAKE_FAILED);
    return;
  }
  close_after_flush_ = CloseReason::HANDSHAKE_FAILED;
}

// ----------------------------------------------------------------------------
// Outbound
// ----------------------------------------------------------------------------

void Session::send_response(const message::Message &msg,
                            std::optional<uint32_t> id) {
  if (state_ == SessionState::CLOSED) {
    return;
  }

  if (queue_.size() >= config_.outbound_queue_capacity &&
      !evict_oldest_notification()) {
    metrics_.sessions_dropped_backpressure.inc();
    LOG_NET_WARN("session {} outbound queue full of responses ({}), "
                 "draining {}",
                 id_, queue_.size(), remote_addr_);
    enter_draining(CloseReason::RESOURCE_EXHAUSTED);
    return;
  }

  auto frame =
      std::make_shared<const std::vector<uint8_t>>(encode_message_frame(msg, id));
  queue_.push_back({std::move(frame), false});
  flush();
}

void Session::enqueue_notification(SharedFrame frame) {
  if (state_ != SessionState::ACTIVE) {
    return;
  }

  if (queue_.size() >= config_.outbound_queue_capacity) {
    bool evicted = evict_oldest_notification();
    note_dropped_notification();
    if (!evicted || state_ != SessionState::ACTIVE) {
      return;
    }
  }

  queue_.push_back({std::move(frame), true});
  flush();
}

bool Session::evict_oldest_notification() {
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (it->notification) {
      queue_.erase(it);
      return true;
    }
  }
  return false;
}

void Session::note_dropped_notification() {
  metrics_.notifications_dropped.inc();
  ++dropped_since_progress_;
  if (dropped_since_progress_ > config_.max_dropped_notifications) {
    metrics_.sessions_dropped_backpressure.inc();
    LOG_NET_WARN("session {} stalled ({} notifications dropped without "
                 "write progress), draining {}",
                 id_, dropped_since_progress_, remote_addr_);
    enter_draining(CloseReason::RESOURCE_EXHAUSTED);
  }
}

void Session::flush() {
  if (write_in_flight_ || queue_.empty() || !connection_) {
    return;
  }

  OutboundFrame next = std::move(queue_.front());
  queue_.pop_front();
  write_in_flight_ = true;

  auto self = shared_from_this();
  connection_->async_write(std::move(next.bytes), [self](bool success) {
    boost::asio::post(self->strand_,
                      [self, success]() { self->on_write_complete(success); });
  });
}

void Session::on_write_complete(bool success) {
  write_in_flight_ = false;
  if (state_ == SessionState::CLOSED) {
    return;
  }

  if (!success) {
    LOG_NET_DEBUG("session {} write failed", id_);
    do_close(CloseReason::TRANSPORT_ERROR);
    return;
  }

  dropped_since_progress_ = 0;

  if (queue_.empty()) {
    if (close_after_flush_) {
      do_close(*close_after_flush_);
    } else if (state_ == SessionState::DRAINING && !request_in_flight_) {
      do_close(drain_reason_);
    }
    return;
  }
  flush();
}

bool Session::output_idle() const {
  return queue_.empty() && !write_in_flight_ && !request_in_flight_;
}

// ----------------------------------------------------------------------------
// Timers
// ----------------------------------------------------------------------------

void Session::start_handshake_timeout() {
  handshake_timer_.expires_after(config_.handshake_timeout);
  handshake_timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (self->state_ == SessionState::HANDSHAKING) {
          LOG_NET_DEBUG("session {} handshake timeout", self->id_);
          self->do_close(CloseReason::HANDSHAKE_FAILED);
        }
      });
}

void Session::start_inactivity_timeout() {
  inactivity_timer_.expires_after(config_.inactivity_timeout);
  inactivity_timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        // A completion queued before the timer was re-armed is stale
        if (self->inactivity_timer_.expiry() >
            boost::asio::steady_timer::clock_type::now()) {
          return;
        }
        if (self->state_ == SessionState::ACTIVE) {
          LOG_NET_DEBUG("session {} inactive for {} ms, disconnecting",
                        self->id_, self->config_.inactivity_timeout.count());
          self->do_close(CloseReason::INACTIVITY_TIMEOUT);
        }
      });
}

void Session::start_drain_timeout() {
  drain_timer_.expires_after(config_.drain_timeout);
  drain_timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (self->state_ == SessionState::DRAINING) {
          LOG_NET_DEBUG("session {} drain timeout with {} frames unsent",
                        self->id_, self->queue_.size());
          // A session drained for its own fault keeps that reason
          self->do_close(self->drain_reason_ == CloseReason::SHUTDOWN
                             ? CloseReason::DRAIN_TIMEOUT
                             : self->drain_reason_);
        }
      });
}

void Session::cancel_all_timers() {
  handshake_timer_.cancel();
  inactivity_timer_.cancel();
  drain_timer_.cancel();
}

} // namespace network
} // namespace mintnode
