// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_SESSION_HPP
#define MINTNODE_SESSION_HPP

#include "network/codec.hpp"
#include "network/protocol.hpp"
#include "network/subscription_hub.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace mintnode {

namespace metrics { class MetricsRegistry; }
namespace rpc { class RPCDispatcher; }

namespace network {

class Session;
using SessionPtr = std::shared_ptr<Session>;

// Session lifecycle. CLOSED is terminal.
enum class SessionState {
  HANDSHAKING, // Waiting for the client's Handshake
  ACTIVE,      // Serving requests and notifications
  DRAINING,    // Flushing queued output, ignoring input
  CLOSED
};

enum class CloseReason {
  NONE,
  PEER_CLOSED,
  TRANSPORT_ERROR,
  HANDSHAKE_FAILED,
  MALFORMED_FRAME,
  UNKNOWN_MESSAGE,    // strict mode only
  RESOURCE_EXHAUSTED, // outbound queue saturated or peer stalled
  INACTIVITY_TIMEOUT,
  SHUTDOWN,
  DRAIN_TIMEOUT
};

const char *session_state_name(SessionState state);
const char *close_reason_name(CloseReason reason);

/**
 * Session - protocol state machine for one client connection
 *
 * All state is owned by the session strand. Public methods post to it and
 * may be called from any thread. The transport's callbacks keep the session
 * alive until close() clears them; everyone else holds it weakly.
 *
 * Inbound: one request in flight. The next frame is decoded only after the
 * previous response has been queued, so responses keep request order.
 *
 * Outbound: bounded queue with one write in flight. Responses are never
 * dropped (the session drains and closes instead); notifications are dropped
 * oldest first when the queue is full.
 */
class Session : public NotificationSink,
                public std::enable_shared_from_this<Session> {
public:
  struct Config {
    std::chrono::milliseconds handshake_timeout;
    std::chrono::milliseconds drain_timeout;
    std::chrono::milliseconds inactivity_timeout;
    size_t outbound_queue_capacity;
    size_t max_dropped_notifications;
    size_t max_frame_size;
    size_t recv_flood_size;
    bool strict_mode;
    uint32_t network_magic;

    Config()
        : handshake_timeout(protocol::HANDSHAKE_TIMEOUT_MS),
          drain_timeout(protocol::DRAIN_TIMEOUT_MS),
          inactivity_timeout(protocol::INACTIVITY_TIMEOUT_MS),
          outbound_queue_capacity(protocol::DEFAULT_OUTBOUND_QUEUE_CAPACITY),
          max_dropped_notifications(
              protocol::DEFAULT_MAX_DROPPED_NOTIFICATIONS),
          max_frame_size(protocol::MAX_FRAME_SIZE),
          recv_flood_size(protocol::DEFAULT_RECV_FLOOD_SIZE),
          strict_mode(false),
          network_magic(protocol::magic::DEVNET) {}
  };

  // Runs once, on the session strand, when the session reaches CLOSED
  using CloseHandler = std::function<void(uint64_t id, CloseReason reason)>;

  static SessionPtr create(boost::asio::io_context &io_context,
                           TransportConnectionPtr connection, uint64_t id,
                           const Config &config, rpc::RPCDispatcher &dispatcher,
                           SubscriptionHub &hub,
                           metrics::MetricsRegistry &metrics,
                           CloseHandler on_close = nullptr);

  ~Session() override;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Install transport callbacks, start reading and arm the handshake timer
  void start();

  // Stop serving input and close once queued output is flushed (or the
  // drain timeout elapses)
  void begin_drain();

  void close(CloseReason reason);

  void deliver_notification(SharedFrame frame) override;

  uint64_t id() const { return id_; }
  SessionState state() const { return state_.load(); }
  CloseReason close_reason() const { return close_reason_.load(); }
  const std::string &remote_address() const { return remote_addr_; }

private:
  struct OutboundFrame {
    SharedFrame bytes;
    bool notification;
  };

  Session(boost::asio::io_context &io_context,
          TransportConnectionPtr connection, uint64_t id, const Config &config,
          rpc::RPCDispatcher &dispatcher, SubscriptionHub &hub,
          metrics::MetricsRegistry &metrics, CloseHandler on_close);

  // Strand-only
  void do_start();
  void do_close(CloseReason reason);
  void enter_draining(CloseReason reason);

  void on_receive(const std::vector<uint8_t> &data);
  void process_frames();
  void handle_payload(const std::vector<uint8_t> &payload);
  void on_dispatch_complete(const message::Message &response,
                            std::optional<uint32_t> id);
  void handle_handshake(const Envelope &env);
  void fail_handshake(const std::string &detail, std::optional<uint32_t> id);

  void send_response(const message::Message &msg, std::optional<uint32_t> id);
  void enqueue_notification(SharedFrame frame);
  bool evict_oldest_notification();
  void note_dropped_notification();
  void flush();
  void on_write_complete(bool success);
  bool output_idle() const;

  void start_handshake_timeout();
  void start_inactivity_timeout();
  void start_drain_timeout();
  void cancel_all_timers();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  TransportConnectionPtr connection_;
  uint64_t id_;
  Config config_;
  rpc::RPCDispatcher &dispatcher_;
  SubscriptionHub &hub_;
  metrics::MetricsRegistry &metrics_;
  CloseHandler on_close_;
  std::string remote_addr_;

  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer inactivity_timer_;
  boost::asio::steady_timer drain_timer_;

  std::atomic<SessionState> state_{SessionState::HANDSHAKING};
  std::atomic<CloseReason> close_reason_{CloseReason::NONE};
  CloseReason drain_reason_{CloseReason::SHUTDOWN};
  bool started_{false};

  FrameDecoder decoder_;
  bool request_in_flight_{false};
  // Set when a failed handshake is waiting for its error to be written
  std::optional<CloseReason> close_after_flush_;

  std::deque<OutboundFrame> queue_; // unsent frames only
  bool write_in_flight_{false};
  size_t dropped_since_progress_{0};
};

} // namespace network
} // namespace mintnode

#endif // MINTNODE_SESSION_HPP
