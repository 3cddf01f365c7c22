// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CODEC_HPP
#define MINTNODE_CODEC_HPP

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mintnode {
namespace network {

/**
 * Protocol codec
 *
 * Wire format:
 *   frame    = u32 LE payload length || payload
 *   payload  = u8 kind || u8 has_id || [u32 LE id] || u8 type || body
 *
 * Framing and payload parsing fail differently. A bad length header means the
 * byte stream can no longer be trusted (MALFORMED, connection is dropped). A
 * payload that does not parse is a single bad message (the caller answers
 * with an error and carries on).
 */

enum class DecodeStatus {
  NEED_MORE, // Not enough bytes for a complete frame
  FRAME,     // One complete payload extracted
  MALFORMED, // Length header exceeds the limit; decoder is poisoned
};

// Restartable frame decoder. Bytes may arrive in arbitrary chunks.
class FrameDecoder {
public:
  explicit FrameDecoder(size_t max_frame_size = protocol::MAX_FRAME_SIZE);

  void feed(const uint8_t *data, size_t size);
  void feed(const std::vector<uint8_t> &data) { feed(data.data(), data.size()); }

  // Extract the next complete payload. Once MALFORMED is returned every later
  // call returns MALFORMED.
  DecodeStatus next(std::vector<uint8_t> &payload);

  // Bytes buffered but not yet returned as frames
  size_t buffered() const { return buffer_.size() - offset_; }

  size_t max_frame_size() const { return max_frame_size_; }

private:
  std::vector<uint8_t> buffer_;
  size_t offset_{0};
  size_t max_frame_size_;
  bool malformed_{false};
};

// Decoded payload
struct Envelope {
  message::MessageKind kind{message::MessageKind::REQUEST};
  std::optional<uint32_t> id;
  std::unique_ptr<message::Message> msg;
};

// Prefix a payload with its length header
std::vector<uint8_t> encode_frame(const std::vector<uint8_t> &payload);

// Build the payload (no length header) for a message
std::vector<uint8_t> encode_envelope(const message::Message &msg,
                                     std::optional<uint32_t> id = std::nullopt);

// encode_frame(encode_envelope(msg, id))
std::vector<uint8_t> encode_message_frame(const message::Message &msg,
                                          std::optional<uint32_t> id = std::nullopt);

/**
 * Parse a frame payload into an envelope
 * @param error Set to a short description on failure
 * @return false for unknown kind/type, kind/type mismatch, truncated body or
 * trailing bytes. out.id is filled in as soon as the header parses.
 */
bool decode_envelope(const std::vector<uint8_t> &payload, Envelope &out,
                     std::string &error);

} // namespace network
} // namespace mintnode

#endif // MINTNODE_CODEC_HPP
