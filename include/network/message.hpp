// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_MESSAGE_HPP
#define MINTNODE_MESSAGE_HPP

#include "chain/block.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mintnode {
namespace message {

// ============================================================================
// Serialization primitives
// ============================================================================

// Fixed-width integers are little-endian, lengths are CompactSize varints.
class MessageSerializer {
public:
  void write_uint8(uint8_t value);
  void write_bool(bool value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int64(int64_t value);
  void write_varint(uint64_t value);
  void write_bytes(const uint8_t *data, size_t size);
  void write_var_bytes(const std::vector<uint8_t> &bytes);
  void write_string(const std::string &str);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

// Reads never throw. A short read or an over-limit length sets the error flag
// and subsequent reads return zero values.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  uint8_t read_uint8();
  bool read_bool();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int64_t read_int64();
  uint64_t read_varint();
  std::vector<uint8_t> read_bytes(size_t size);
  std::vector<uint8_t> read_var_bytes(size_t max_size);
  std::string read_string(size_t max_length = protocol::MAX_STRING_LENGTH);

  // Semantic validation failures (bad enum value, count over limit)
  void mark_error() { error_ = true; }

  bool has_error() const { return error_; }
  size_t bytes_remaining() const { return error_ ? 0 : size_ - position_; }
  size_t position() const { return position_; }

private:
  bool check_available(size_t n);

  const uint8_t *data_;
  size_t size_;
  size_t position_{0};
  bool error_{false};
};

// Ledger types on the wire
void write_transaction(MessageSerializer &s, const chain::Transaction &tx);
chain::Transaction read_transaction(MessageDeserializer &d);
void write_block(MessageSerializer &s, const chain::Block &block);
chain::Block read_block(MessageDeserializer &d);

// Canonical byte encoding of a transaction (used for duplicate detection)
std::vector<uint8_t> serialize_transaction(const chain::Transaction &tx);

// ============================================================================
// Message types
// ============================================================================

enum class MessageKind : uint8_t {
  REQUEST = 0,
  RESPONSE = 1,
  NOTIFICATION = 2,
};

enum class MessageType : uint8_t {
  // Requests
  HANDSHAKE = 0x01,
  SUBMIT_TX = 0x02,
  GET_PROPERTIES = 0x03,
  GET_BLOCK = 0x04,
  GET_BALANCE = 0x05,
  SUBSCRIBE = 0x06,
  UNSUBSCRIBE = 0x07,
  PING = 0x08,

  // Responses
  HANDSHAKE_ACK = 0x41,
  TX_ACCEPTED = 0x42,
  TX_REJECTED = 0x43,
  PROPERTIES = 0x44,
  BLOCK = 0x45,
  BALANCE = 0x46,
  SUBSCRIBED = 0x47,
  UNSUBSCRIBED = 0x48,
  NOT_FOUND = 0x49,
  ERROR = 0x4A,
  PONG = 0x4B,

  // Notifications
  BLOCK_PRODUCED = 0x81,
};

// Codes carried by ErrorResponse
enum class ErrorCode : uint8_t {
  UNKNOWN_MESSAGE = 1,  // Payload did not parse into a known message
  PROTOCOL = 2,         // Valid message in the wrong place
  HANDSHAKE_FAILED = 3, // Version or network mismatch
  INTERNAL = 4,         // Engine fault while serving the request
};

const char *type_name(MessageType type);
const char *error_code_name(ErrorCode code);

// Returns false for values outside MessageType
bool kind_of(uint8_t type, MessageKind &kind);

class Message {
public:
  virtual ~Message() = default;

  virtual MessageType type() const = 0;
  MessageKind kind() const;

  std::vector<uint8_t> serialize() const;

  // Fails on short input and on trailing bytes
  bool deserialize(const uint8_t *data, size_t size);

protected:
  virtual void write(MessageSerializer &s) const = 0;
  virtual void read(MessageDeserializer &d) = 0;
};

// Body-less messages
template <MessageType T> class EmptyMessage : public Message {
public:
  MessageType type() const override { return T; }

protected:
  void write(MessageSerializer &) const override {}
  void read(MessageDeserializer &) override {}
};

using GetPropertiesRequest = EmptyMessage<MessageType::GET_PROPERTIES>;
using SubscribeRequest = EmptyMessage<MessageType::SUBSCRIBE>;
using UnsubscribeRequest = EmptyMessage<MessageType::UNSUBSCRIBE>;
using SubscribedResponse = EmptyMessage<MessageType::SUBSCRIBED>;
using UnsubscribedResponse = EmptyMessage<MessageType::UNSUBSCRIBED>;
using NotFoundResponse = EmptyMessage<MessageType::NOT_FOUND>;

class HandshakeRequest : public Message {
public:
  HandshakeRequest() = default;
  HandshakeRequest(uint32_t version, uint32_t magic, std::string agent)
      : protocol_version(version), network_magic(magic),
        user_agent(std::move(agent)) {}

  MessageType type() const override { return MessageType::HANDSHAKE; }

  uint32_t protocol_version{0};
  uint32_t network_magic{0};
  std::string user_agent;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class HandshakeResponse : public Message {
public:
  MessageType type() const override { return MessageType::HANDSHAKE_ACK; }

  uint32_t protocol_version{0};
  std::string user_agent;
  uint64_t session_id{0};
  uint64_t chain_height{0};

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class SubmitTxRequest : public Message {
public:
  SubmitTxRequest() = default;
  explicit SubmitTxRequest(chain::Transaction t) : tx(std::move(t)) {}

  MessageType type() const override { return MessageType::SUBMIT_TX; }

  chain::Transaction tx;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class GetBlockRequest : public Message {
public:
  GetBlockRequest() = default;
  explicit GetBlockRequest(uint64_t h) : height(h) {}

  MessageType type() const override { return MessageType::GET_BLOCK; }

  uint64_t height{0};

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class GetBalanceRequest : public Message {
public:
  GetBalanceRequest() = default;
  explicit GetBalanceRequest(std::string addr) : address(std::move(addr)) {}

  MessageType type() const override { return MessageType::GET_BALANCE; }

  std::string address;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

// PING and PONG share a body: an opaque nonce echoed back
template <MessageType T> class NonceMessage : public Message {
public:
  NonceMessage() = default;
  explicit NonceMessage(uint64_t n) : nonce(n) {}

  MessageType type() const override { return T; }

  uint64_t nonce{0};

protected:
  void write(MessageSerializer &s) const override { s.write_uint64(nonce); }
  void read(MessageDeserializer &d) override { nonce = d.read_uint64(); }
};

using PingMessage = NonceMessage<MessageType::PING>;
using PongMessage = NonceMessage<MessageType::PONG>;

class TxAcceptedResponse : public Message {
public:
  TxAcceptedResponse() = default;
  explicit TxAcceptedResponse(uint64_t id) : tx_id(id) {}

  MessageType type() const override { return MessageType::TX_ACCEPTED; }

  uint64_t tx_id{0};

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class TxRejectedResponse : public Message {
public:
  TxRejectedResponse() = default;
  TxRejectedResponse(uint32_t c, std::string r)
      : code(c), reason(std::move(r)) {}

  MessageType type() const override { return MessageType::TX_REJECTED; }

  uint32_t code{0}; // Engine-defined
  std::string reason;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class PropertiesResponse : public Message {
public:
  MessageType type() const override { return MessageType::PROPERTIES; }

  chain::ChainProperties properties;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class BlockResponse : public Message {
public:
  BlockResponse() = default;
  explicit BlockResponse(chain::Block b) : block(std::move(b)) {}

  MessageType type() const override { return MessageType::BLOCK; }

  chain::Block block;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class BalanceResponse : public Message {
public:
  MessageType type() const override { return MessageType::BALANCE; }

  std::string address;
  chain::Amount balance{0};
  chain::Amount min_fee{0};

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class ErrorResponse : public Message {
public:
  ErrorResponse() = default;
  ErrorResponse(ErrorCode c, std::string d) : code(c), detail(std::move(d)) {}

  MessageType type() const override { return MessageType::ERROR; }

  ErrorCode code{ErrorCode::INTERNAL};
  std::string detail;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

class BlockProducedNotification : public Message {
public:
  BlockProducedNotification() = default;
  explicit BlockProducedNotification(chain::Block b) : block(std::move(b)) {}

  MessageType type() const override { return MessageType::BLOCK_PRODUCED; }

  chain::Block block;

protected:
  void write(MessageSerializer &s) const override;
  void read(MessageDeserializer &d) override;
};

// Factory: empty message of the given type, nullptr if unknown
std::unique_ptr<Message> create_message(MessageType type);

} // namespace message
} // namespace mintnode

#endif // MINTNODE_MESSAGE_HPP
