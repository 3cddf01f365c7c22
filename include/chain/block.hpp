// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CHAIN_BLOCK_HPP
#define MINTNODE_CHAIN_BLOCK_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace mintnode {
namespace chain {

// Token amounts in base units
using Amount = int64_t;

// Transfer of `amount` from one wallet to another. The signature is opaque to
// the daemon; verifying it is the ledger engine's business.
struct Transaction {
  std::string from;
  std::string to;
  Amount amount{0};
  Amount fee{0};
  int64_t timestamp_ms{0};
  std::vector<uint8_t> signature;

  bool operator==(const Transaction &other) const;
  bool operator!=(const Transaction &other) const { return !(*this == other); }
};

struct Block {
  uint64_t height{0};
  int64_t timestamp_ms{0};
  std::string minter;        // Id of the node that produced the block
  std::string reward_wallet; // Receives the collected fees
  Amount reward{0};
  std::vector<Transaction> transactions;

  bool operator==(const Block &other) const;

  std::string ToString() const;
};

// Summary returned by GetProperties
struct ChainProperties {
  uint64_t height{0};
  std::string network;
  std::string minter;
  std::string owner_wallet;
  uint64_t transaction_count{0};
  Amount token_supply{0};
};

} // namespace chain
} // namespace mintnode

#endif // MINTNODE_CHAIN_BLOCK_HPP
