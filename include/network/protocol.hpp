// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_PROTOCOL_HPP
#define MINTNODE_PROTOCOL_HPP

#include "version.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace mintnode {
namespace protocol {

// Protocol version - increment when the client protocol changes
constexpr uint32_t PROTOCOL_VERSION = 2;

// Clients announcing a lower version are rejected during the handshake
constexpr uint32_t MIN_PROTOCOL_VERSION = 1;

// Network magic, echoed by clients in the handshake
namespace magic {
constexpr uint32_t MAINNET = 0x4D494E54; // "MINT"
constexpr uint32_t DEVNET = 0x6D696E64;  // "mind"
} // namespace magic

namespace ports {
constexpr uint16_t RPC = 7777;
constexpr uint16_t METRICS = 7778;
} // namespace ports

// ============================================================================
// FRAMING
// ============================================================================

// Frame = 4-byte little-endian payload length + payload
constexpr size_t FRAME_HEADER_SIZE = 4;

// Maximum frame payload (64 KiB)
constexpr size_t MAX_FRAME_SIZE = 64 * 1024;

// Serialization limits
constexpr uint64_t MAX_SIZE = 0x02000000; // 32 MB - Maximum serialized object size
constexpr size_t MAX_STRING_LENGTH = 256;  // Addresses, reasons, user agents
constexpr size_t MAX_SIGNATURE_LENGTH = 1024;
constexpr size_t MAX_BLOCK_TRANSACTIONS = 10000;

// ============================================================================
// SESSIONS
// ============================================================================

constexpr size_t DEFAULT_OUTBOUND_QUEUE_CAPACITY = 64;
constexpr size_t DEFAULT_MAX_DROPPED_NOTIFICATIONS = 128;
// Undecoded input held while a request is being served
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = 4 * MAX_FRAME_SIZE;
constexpr unsigned int DEFAULT_MAX_CONNECTIONS = 256;

// Timeouts (in milliseconds)
constexpr int64_t HANDSHAKE_TIMEOUT_MS = 1000;
constexpr int64_t DRAIN_TIMEOUT_MS = 2000;
constexpr int64_t INACTIVITY_TIMEOUT_MS = 20 * 60 * 1000;
constexpr int64_t WEBSOCKET_UPGRADE_TIMEOUT_MS = 5000;

// ============================================================================
// MINTING
// ============================================================================

constexpr int64_t DEFAULT_MINT_INTERVAL_MS = 3000;
constexpr int64_t DEFAULT_SHUTDOWN_GRACE_MS = 5000;

inline std::string GetUserAgent() { return mintnode::GetUserAgent(); }

} // namespace protocol
} // namespace mintnode

#endif // MINTNODE_PROTOCOL_HPP
