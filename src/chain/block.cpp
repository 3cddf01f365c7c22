// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "chain/block.hpp"
#include <sstream>

namespace mintnode {
namespace chain {

bool Transaction::operator==(const Transaction &other) const {
  return from == other.from && to == other.to && amount == other.amount &&
         fee == other.fee && timestamp_ms == other.timestamp_ms &&
         signature == other.signature;
}

bool Block::operator==(const Block &other) const {
  return height == other.height && timestamp_ms == other.timestamp_ms &&
         minter == other.minter && reward_wallet == other.reward_wallet &&
         reward == other.reward && transactions == other.transactions;
}

std::string Block::ToString() const {
  std::ostringstream s;
  s << "Block(height=" << height << ", time=" << timestamp_ms
    << ", minter=" << minter << ", txs=" << transactions.size()
    << ", reward=" << reward << ")";
  return s.str();
}

} // namespace chain
} // namespace mintnode
