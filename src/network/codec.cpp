// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "network/codec.hpp"

namespace mintnode {
namespace network {

FrameDecoder::FrameDecoder(size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

void FrameDecoder::feed(const uint8_t *data, size_t size) {
  if (malformed_ || size == 0) {
    return;
  }

  // Compact once the consumed prefix dominates the buffer
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + offset_);
    offset_ = 0;
  }

  buffer_.insert(buffer_.end(), data, data + size);
}

DecodeStatus FrameDecoder::next(std::vector<uint8_t> &payload) {
  if (malformed_) {
    return DecodeStatus::MALFORMED;
  }

  size_t available = buffer_.size() - offset_;
  if (available < protocol::FRAME_HEADER_SIZE) {
    return DecodeStatus::NEED_MORE;
  }

  const uint8_t *p = buffer_.data() + offset_;
  uint32_t length = static_cast<uint32_t>(p[0]) |
                    static_cast<uint32_t>(p[1]) << 8 |
                    static_cast<uint32_t>(p[2]) << 16 |
                    static_cast<uint32_t>(p[3]) << 24;

  // Reject before buffering the payload
  if (length > max_frame_size_) {
    malformed_ = true;
    buffer_.clear();
    offset_ = 0;
    return DecodeStatus::MALFORMED;
  }

  if (available < protocol::FRAME_HEADER_SIZE + length) {
    return DecodeStatus::NEED_MORE;
  }

  payload.assign(p + protocol::FRAME_HEADER_SIZE,
                 p + protocol::FRAME_HEADER_SIZE + length);
  offset_ += protocol::FRAME_HEADER_SIZE + length;

  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  return DecodeStatus::FRAME;
}

std::vector<uint8_t> encode_frame(const std::vector<uint8_t> &payload) {
  message::MessageSerializer s;
  s.write_uint32(static_cast<uint32_t>(payload.size()));
  s.write_bytes(payload.data(), payload.size());
  return s.take();
}

std::vector<uint8_t> encode_envelope(const message::Message &msg,
                                     std::optional<uint32_t> id) {
  message::MessageSerializer s;
  s.write_uint8(static_cast<uint8_t>(msg.kind()));
  s.write_bool(id.has_value());
  if (id) {
    s.write_uint32(*id);
  }
  s.write_uint8(static_cast<uint8_t>(msg.type()));

  auto body = msg.serialize();
  s.write_bytes(body.data(), body.size());
  return s.take();
}

std::vector<uint8_t> encode_message_frame(const message::Message &msg,
                                          std::optional<uint32_t> id) {
  return encode_frame(encode_envelope(msg, id));
}

bool decode_envelope(const std::vector<uint8_t> &payload, Envelope &out,
                     std::string &error) {
  message::MessageDeserializer d(payload);

  uint8_t raw_kind = d.read_uint8();
  bool has_id = d.read_bool();
  uint32_t id = has_id ? d.read_uint32() : 0;
  uint8_t raw_type = d.read_uint8();

  if (d.has_error()) {
    error = "truncated envelope";
    return false;
  }
  // Known even when the rest fails, so an error reply can carry it
  out.id = has_id ? std::optional<uint32_t>(id) : std::nullopt;

  if (raw_kind > static_cast<uint8_t>(message::MessageKind::NOTIFICATION)) {
    error = "unknown message kind " + std::to_string(raw_kind);
    return false;
  }
  auto kind = static_cast<message::MessageKind>(raw_kind);

  message::MessageKind type_kind;
  if (!message::kind_of(raw_type, type_kind)) {
    error = "unknown message type " + std::to_string(raw_type);
    return false;
  }
  if (type_kind != kind) {
    error = "message type " + std::to_string(raw_type) +
            " does not match its kind";
    return false;
  }

  auto msg = message::create_message(static_cast<message::MessageType>(raw_type));
  if (!msg) {
    error = "unknown message type " + std::to_string(raw_type);
    return false;
  }

  size_t body_offset = d.position();
  if (!msg->deserialize(payload.data() + body_offset,
                        payload.size() - body_offset)) {
    error = std::string("malformed ") +
            message::type_name(static_cast<message::MessageType>(raw_type)) +
            " body";
    return false;
  }

  out.kind = kind;
  out.msg = std::move(msg);
  return true;
}

} // namespace network
} // namespace mintnode
