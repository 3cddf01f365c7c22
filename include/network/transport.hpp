// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_TRANSPORT_HPP
#define MINTNODE_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mintnode {
namespace network {

/**
 * Abstract transport interface for client connections
 *
 * Implementations:
 * - WebSocketTransport: binary WebSocket messages over boost::beast
 * - test MockConnection: scripted in-memory connection for session tests
 *
 * The transport only moves bytes. Framing lives in the codec, and write
 * pacing (one write in flight, bounded queue) lives in the Session.
 */

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Encoded frame. One broadcast shares a single buffer across every recipient.
using SharedFrame = std::shared_ptr<const std::vector<uint8_t>>;

using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using WriteCallback = std::function<void(bool success)>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

/**
 * TransportConnection - a single accepted connection
 */
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  /**
   * Start receiving data. Callbacks must be set before calling.
   */
  virtual void start() = 0;

  /**
   * Write one frame. The connection keeps `data` alive until the write
   * finishes. on_complete runs exactly once; writes still pending when the
   * connection closes complete with false.
   */
  virtual void async_write(SharedFrame data, WriteCallback on_complete) = 0;

  /**
   * Close this connection. Clears callbacks; idempotent.
   */
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  // Remote address (for logging)
  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;

  virtual uint64_t connection_id() const = 0;

  /**
   * Receive callback runs once per chunk of bytes; chunk boundaries carry no
   * meaning. Disconnect callback runs once when the peer goes away.
   */
  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

/**
 * Transport - accepts inbound connections
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * Start accepting inbound connections on the given port (0 = ephemeral)
   * @return true if listening started successfully
   */
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  // Stop accepting. Existing connections stay open.
  virtual void stop_listening() = 0;

  virtual bool is_listening() const = 0;

  // Bound port, 0 if not listening
  virtual uint16_t local_port() const = 0;
};

} // namespace network
} // namespace mintnode

#endif // MINTNODE_TRANSPORT_HPP
