// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/message.hpp"

namespace mintnode {
namespace message {

// ============================================================================
// MessageSerializer
// ============================================================================

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_bool(bool value) { write_uint8(value ? 1 : 0); }

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value & 0xff));
  buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
  }
}

void MessageSerializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
  }
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_varint(uint64_t value) {
  if (value < 0xfd) {
    write_uint8(static_cast<uint8_t>(value));
  } else if (value <= 0xffff) {
    write_uint8(0xfd);
    write_uint16(static_cast<uint16_t>(value));
  } else if (value <= 0xffffffff) {
    write_uint8(0xfe);
    write_uint32(static_cast<uint32_t>(value));
  } else {
    write_uint8(0xff);
    write_uint64(value);
  }
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

void MessageSerializer::write_var_bytes(const std::vector<uint8_t> &bytes) {
  write_varint(bytes.size());
  write_bytes(bytes.data(), bytes.size());
}

void MessageSerializer::write_string(const std::string &str) {
  write_varint(str.size());
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()) {}

bool MessageDeserializer::check_available(size_t n) {
  if (error_ || size_ - position_ < n) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

bool MessageDeserializer::read_bool() {
  uint8_t v = read_uint8();
  if (v > 1) {
    error_ = true;
    return false;
  }
  return v == 1;
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t v = static_cast<uint16_t>(data_[position_]) |
               static_cast<uint16_t>(data_[position_ + 1]) << 8;
  position_ += 2;
  return v;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v |= static_cast<uint32_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 4;
  return v;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 8;
  return v;
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

uint64_t MessageDeserializer::read_varint() {
  uint8_t prefix = read_uint8();
  uint64_t value = 0;
  // Non-canonical encodings are rejected so every value has one byte form
  if (prefix < 0xfd) {
    value = prefix;
  } else if (prefix == 0xfd) {
    value = read_uint16();
    if (value < 0xfd)
      error_ = true;
  } else if (prefix == 0xfe) {
    value = read_uint32();
    if (value <= 0xffff)
      error_ = true;
  } else {
    value = read_uint64();
    if (value <= 0xffffffff)
      error_ = true;
  }

  if (value > protocol::MAX_SIZE) {
    error_ = true;
  }
  return error_ ? 0 : value;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t size) {
  if (!check_available(size))
    return {};
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + size);
  position_ += size;
  return out;
}

std::vector<uint8_t> MessageDeserializer::read_var_bytes(size_t max_size) {
  uint64_t len = read_varint();
  if (error_ || len > max_size) {
    error_ = true;
    return {};
  }
  return read_bytes(static_cast<size_t>(len));
}

std::string MessageDeserializer::read_string(size_t max_length) {
  uint64_t len = read_varint();
  if (error_ || len > max_length) {
    error_ = true;
    return {};
  }
  if (!check_available(static_cast<size_t>(len)))
    return {};
  std::string out(reinterpret_cast<const char *>(data_ + position_),
                  static_cast<size_t>(len));
  position_ += static_cast<size_t>(len);
  return out;
}

// ============================================================================
// Ledger types
// ============================================================================

void write_transaction(MessageSerializer &s, const chain::Transaction &tx) {
  s.write_string(tx.from);
  s.write_string(tx.to);
  s.write_int64(tx.amount);
  s.write_int64(tx.fee);
  s.write_int64(tx.timestamp_ms);
  s.write_var_bytes(tx.signature);
}

chain::Transaction read_transaction(MessageDeserializer &d) {
  chain::Transaction tx;
  tx.from = d.read_string();
  tx.to = d.read_string();
  tx.amount = d.read_int64();
  tx.fee = d.read_int64();
  tx.timestamp_ms = d.read_int64();
  tx.signature = d.read_var_bytes(protocol::MAX_SIGNATURE_LENGTH);
  return tx;
}

void write_block(MessageSerializer &s, const chain::Block &block) {
  s.write_uint64(block.height);
  s.write_int64(block.timestamp_ms);
  s.write_string(block.minter);
  s.write_string(block.reward_wallet);
  s.write_int64(block.reward);
  s.write_varint(block.transactions.size());
  for (const auto &tx : block.transactions) {
    write_transaction(s, tx);
  }
}

chain::Block read_block(MessageDeserializer &d) {
  chain::Block block;
  block.height = d.read_uint64();
  block.timestamp_ms = d.read_int64();
  block.minter = d.read_string();
  block.reward_wallet = d.read_string();
  block.reward = d.read_int64();

  uint64_t count = d.read_varint();
  if (count > protocol::MAX_BLOCK_TRANSACTIONS) {
    d.mark_error();
    return block;
  }
  // Each transaction takes at least one byte per field, so a lying count
  // runs out of input before it can allocate much
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    block.transactions.push_back(read_transaction(d));
  }
  return block;
}

std::vector<uint8_t> serialize_transaction(const chain::Transaction &tx) {
  MessageSerializer s;
  write_transaction(s, tx);
  return s.take();
}

// ============================================================================
// Message base
// ============================================================================

const char *type_name(MessageType type) {
  switch (type) {
  case MessageType::HANDSHAKE:
    return "handshake";
  case MessageType::SUBMIT_TX:
    return "submit_tx";
  case MessageType::GET_PROPERTIES:
    return "get_properties";
  case MessageType::GET_BLOCK:
    return "get_block";
  case MessageType::GET_BALANCE:
    return "get_balance";
  case MessageType::SUBSCRIBE:
    return "subscribe";
  case MessageType::UNSUBSCRIBE:
    return "unsubscribe";
  case MessageType::PING:
    return "ping";
  case MessageType::HANDSHAKE_ACK:
    return "handshake_ack";
  case MessageType::TX_ACCEPTED:
    return "tx_accepted";
  case MessageType::TX_REJECTED:
    return "tx_rejected";
  case MessageType::PROPERTIES:
    return "properties";
  case MessageType::BLOCK:
    return "block";
  case MessageType::BALANCE:
    return "balance";
  case MessageType::SUBSCRIBED:
    return "subscribed";
  case MessageType::UNSUBSCRIBED:
    return "unsubscribed";
  case MessageType::NOT_FOUND:
    return "not_found";
  case MessageType::ERROR:
    return "error";
  case MessageType::PONG:
    return "pong";
  case MessageType::BLOCK_PRODUCED:
    return "block_produced";
  }
  return "unknown";
}

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::UNKNOWN_MESSAGE:
    return "unknown_message";
  case ErrorCode::PROTOCOL:
    return "protocol";
  case ErrorCode::HANDSHAKE_FAILED:
    return "handshake_failed";
  case ErrorCode::INTERNAL:
    return "internal";
  }
  return "unknown";
}

bool kind_of(uint8_t type, MessageKind &kind) {
  if (type >= static_cast<uint8_t>(MessageType::HANDSHAKE) &&
      type <= static_cast<uint8_t>(MessageType::PING)) {
    kind = MessageKind::REQUEST;
    return true;
  }
  if (type >= static_cast<uint8_t>(MessageType::HANDSHAKE_ACK) &&
      type <= static_cast<uint8_t>(MessageType::PONG)) {
    kind = MessageKind::RESPONSE;
    return true;
  }
  if (type == static_cast<uint8_t>(MessageType::BLOCK_PRODUCED)) {
    kind = MessageKind::NOTIFICATION;
    return true;
  }
  return false;
}

MessageKind Message::kind() const {
  MessageKind k = MessageKind::REQUEST;
  kind_of(static_cast<uint8_t>(type()), k);
  return k;
}

std::vector<uint8_t> Message::serialize() const {
  MessageSerializer s;
  write(s);
  return s.take();
}

bool Message::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  read(d);
  return !d.has_error() && d.bytes_remaining() == 0;
}

// ============================================================================
// Message bodies
// ============================================================================

void HandshakeRequest::write(MessageSerializer &s) const {
  s.write_uint32(protocol_version);
  s.write_uint32(network_magic);
  s.write_string(user_agent);
}

void HandshakeRequest::read(MessageDeserializer &d) {
  protocol_version = d.read_uint32();
  network_magic = d.read_uint32();
  user_agent = d.read_string();
}

void HandshakeResponse::write(MessageSerializer &s) const {
  s.write_uint32(protocol_version);
  s.write_string(user_agent);
  s.write_uint64(session_id);
  s.write_uint64(chain_height);
}

void HandshakeResponse::read(MessageDeserializer &d) {
  protocol_version = d.read_uint32();
  user_agent = d.read_string();
  session_id = d.read_uint64();
  chain_height = d.read_uint64();
}

void SubmitTxRequest::write(MessageSerializer &s) const {
  write_transaction(s, tx);
}

void SubmitTxRequest::read(MessageDeserializer &d) { tx = read_transaction(d); }

void GetBlockRequest::write(MessageSerializer &s) const {
  s.write_uint64(height);
}

void GetBlockRequest::read(MessageDeserializer &d) { height = d.read_uint64(); }

void GetBalanceRequest::write(MessageSerializer &s) const {
  s.write_string(address);
}

void GetBalanceRequest::read(MessageDeserializer &d) {
  address = d.read_string();
}

void TxAcceptedResponse::write(MessageSerializer &s) const {
  s.write_uint64(tx_id);
}

void TxAcceptedResponse::read(MessageDeserializer &d) { tx_id = d.read_uint64(); }

void TxRejectedResponse::write(MessageSerializer &s) const {
  s.write_uint32(code);
  s.write_string(reason);
}

void TxRejectedResponse::read(MessageDeserializer &d) {
  code = d.read_uint32();
  reason = d.read_string();
}

void PropertiesResponse::write(MessageSerializer &s) const {
  s.write_uint64(properties.height);
  s.write_string(properties.network);
  s.write_string(properties.minter);
  s.write_string(properties.owner_wallet);
  s.write_uint64(properties.transaction_count);
  s.write_int64(properties.token_supply);
}

void PropertiesResponse::read(MessageDeserializer &d) {
  properties.height = d.read_uint64();
  properties.network = d.read_string();
  properties.minter = d.read_string();
  properties.owner_wallet = d.read_string();
  properties.transaction_count = d.read_uint64();
  properties.token_supply = d.read_int64();
}

void BlockResponse::write(MessageSerializer &s) const { write_block(s, block); }

void BlockResponse::read(MessageDeserializer &d) { block = read_block(d); }

void BalanceResponse::write(MessageSerializer &s) const {
  s.write_string(address);
  s.write_int64(balance);
  s.write_int64(min_fee);
}

void BalanceResponse::read(MessageDeserializer &d) {
  address = d.read_string();
  balance = d.read_int64();
  min_fee = d.read_int64();
}

void ErrorResponse::write(MessageSerializer &s) const {
  s.write_uint8(static_cast<uint8_t>(code));
  s.write_string(detail);
}

void ErrorResponse::read(MessageDeserializer &d) {
  uint8_t raw = d.read_uint8();
  if (raw < static_cast<uint8_t>(ErrorCode::UNKNOWN_MESSAGE) ||
      raw > static_cast<uint8_t>(ErrorCode::INTERNAL)) {
    d.mark_error();
    return;
  }
  code = static_cast<ErrorCode>(raw);
  detail = d.read_string();
}

void BlockProducedNotification::write(MessageSerializer &s) const {
  write_block(s, block);
}

void BlockProducedNotification::read(MessageDeserializer &d) {
  block = read_block(d);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Message> create_message(MessageType type) {
  switch (type) {
  case MessageType::HANDSHAKE:
    return std::make_unique<HandshakeRequest>();
  case MessageType::SUBMIT_TX:
    return std::make_unique<SubmitTxRequest>();
  case MessageType::GET_PROPERTIES:
    return std::make_unique<GetPropertiesRequest>();
  case MessageType::GET_BLOCK:
    return std::make_unique<GetBlockRequest>();
  case MessageType::GET_BALANCE:
    return std::make_unique<GetBalanceRequest>();
  case MessageType::SUBSCRIBE:
    return std::make_unique<SubscribeRequest>();
  case MessageType::UNSUBSCRIBE:
    return std::make_unique<UnsubscribeRequest>();
  case MessageType::PING:
    return std::make_unique<PingMessage>();
  case MessageType::HANDSHAKE_ACK:
    return std::make_unique<HandshakeResponse>();
  case MessageType::TX_ACCEPTED:
    return std::make_unique<TxAcceptedResponse>();
  case MessageType::TX_REJECTED:
    return std::make_unique<TxRejectedResponse>();
  case MessageType::PROPERTIES:
    return std::make_unique<PropertiesResponse>();
  case MessageType::BLOCK:
    return std::make_unique<BlockResponse>();
  case MessageType::BALANCE:
    return std::make_unique<BalanceResponse>();
  case MessageType::SUBSCRIBED:
    return std::make_unique<SubscribedResponse>();
  case MessageType::UNSUBSCRIBED:
    return std::make_unique<UnsubscribedResponse>();
  case MessageType::NOT_FOUND:
    return std::make_unique<NotFoundResponse>();
  case MessageType::ERROR:
    return std::make_unique<ErrorResponse>();
  case MessageType::PONG:
    return std::make_unique<PongMessage>();
  case MessageType::BLOCK_PRODUCED:
    return std::make_unique<BlockProducedNotification>();
  }
  return nullptr;
}

} // namespace message
} // namespace mintnode
