// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "chain/memory_ledger.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <limits>

namespace mintnode {
namespace chain {

const char *RejectCodeName(RejectCode code) {
  switch (code) {
  case RejectCode::INVALID_ADDRESS:
    return "invalid-address";
  case RejectCode::INVALID_AMOUNT:
    return "invalid-amount";
  case RejectCode::INSUFFICIENT_FEE:
    return "insufficient-fee";
  case RejectCode::TX_TOO_LARGE:
    return "tx-too-large";
  case RejectCode::TX_EXPIRED:
    return "tx-expired";
  case RejectCode::INVALID_TIMESTAMP:
    return "invalid-timestamp";
  case RejectCode::INSUFFICIENT_BALANCE:
    return "insufficient-balance";
  }
  return "unknown";
}

static SubmitResult Reject(RejectCode code, const std::string &detail) {
  return SubmitResult::Rejected(static_cast<uint32_t>(code),
                                std::string(RejectCodeName(code)) + ": " +
                                    detail);
}

MemoryLedger::MemoryLedger(const Config &config) : config_(config) {
  if (config_.reward_wallet.empty()) {
    config_.reward_wallet = config_.owner_wallet;
  }

  Block genesis;
  genesis.height = 0;
  genesis.timestamp_ms = util::GetTimeMillis();
  genesis.minter = config_.minter_id;
  genesis.reward_wallet = config_.owner_wallet;
  genesis.reward = config_.genesis_balance;
  blocks_.push_back(genesis);

  balances_[config_.owner_wallet] = config_.genesis_balance;
  token_supply_ = config_.genesis_balance;

  LOG_CHAIN_INFO("Genesis block created at {} (network: {}, owner: {}, "
                 "balance: {})",
                 util::FormatTime(genesis.timestamp_ms), config_.network,
                 config_.owner_wallet, config_.genesis_balance);
}

bool MemoryLedger::IsValidAddress(const std::string &address) {
  if (address.empty() || address.size() > 64) {
    return false;
  }
  return std::all_of(address.begin(), address.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

SubmitResult MemoryLedger::SubmitTransaction(const Transaction &tx) {
  auto bytes = message::serialize_transaction(tx);

  // Idempotence: the same bytes always map to the first id
  auto seen = seen_.find(bytes);
  if (seen != seen_.end()) {
    LOG_CHAIN_DEBUG("Duplicate transaction id={}", seen->second.id);
    return SubmitResult::Duplicate(seen->second.id);
  }

  if (bytes.size() > config_.max_tx_size) {
    return Reject(RejectCode::TX_TOO_LARGE,
                  std::to_string(bytes.size()) + " bytes (max " +
                      std::to_string(config_.max_tx_size) + ")");
  }
  if (!IsValidAddress(tx.from) || !IsValidAddress(tx.to)) {
    return Reject(RejectCode::INVALID_ADDRESS, "malformed sender or recipient");
  }
  if (tx.from == tx.to) {
    return Reject(RejectCode::INVALID_ADDRESS, "sender equals recipient");
  }
  if (tx.amount <= 0) {
    return Reject(RejectCode::INVALID_AMOUNT, "amount must be positive");
  }
  if (tx.fee < config_.min_fee) {
    return Reject(RejectCode::INSUFFICIENT_FEE,
                  "fee " + std::to_string(tx.fee) + " below minimum " +
                      std::to_string(config_.min_fee));
  }

  int64_t now = util::GetTimeMillis();
  if (tx.timestamp_ms < now - config_.tx_expiry_ms) {
    return Reject(RejectCode::TX_EXPIRED, "timestamp too old");
  }
  if (tx.timestamp_ms > now + config_.max_future_drift_ms) {
    return Reject(RejectCode::INVALID_TIMESTAMP, "timestamp in the future");
  }

  auto from_it = balances_.find(tx.from);
  Amount available = from_it != balances_.end() ? from_it->second : 0;
  // amount and fee are positive, so only the sum can overflow
  if (tx.amount > std::numeric_limits<Amount>::max() - tx.fee ||
      available < tx.amount + tx.fee) {
    return Reject(RejectCode::INSUFFICIENT_BALANCE,
                  "available " + std::to_string(available));
  }

  // Apply to head state
  balances_[tx.from] -= tx.amount + tx.fee;
  balances_[tx.to] += tx.amount;

  uint64_t id = next_tx_id_++;
  seen_.emplace(std::move(bytes), SeenTx{id, tx.timestamp_ms});
  pending_.push_back(tx);
  ++accepted_count_;

  LOG_CHAIN_DEBUG("Accepted transaction id={} {} -> {} amount={} fee={}", id,
                  tx.from, tx.to, tx.amount, tx.fee);
  return SubmitResult::Accepted(id);
}

MintResult MemoryLedger::ProduceBlock() {
  if (!config_.is_minter) {
    return MintResult::Skipped("not the designated minter");
  }
  if (pending_.empty() && !config_.mint_empty_blocks) {
    return MintResult::Skipped("no pending transactions");
  }

  const Block &tip = blocks_.back();

  Block block;
  block.height = tip.height + 1;
  block.timestamp_ms = std::max(util::GetTimeMillis(), tip.timestamp_ms);
  block.minter = config_.minter_id;
  block.reward_wallet = config_.reward_wallet;
  for (const auto &tx : pending_) {
    block.reward += tx.fee;
  }
  block.transactions = std::move(pending_);
  pending_.clear();

  balances_[block.reward_wallet] += block.reward;
  blocks_.push_back(block);

  PruneSeen(block.timestamp_ms);

  LOG_CHAIN_DEBUG("Produced {}", block.ToString());
  return MintResult::Produced(std::move(block));
}

void MemoryLedger::PruneSeen(int64_t now_ms) {
  // Entries past the expiry window cannot be resubmitted successfully anyway
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (it->second.timestamp_ms < now_ms - config_.tx_expiry_ms) {
      it = seen_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<Block> MemoryLedger::GetBlock(uint64_t height) const {
  if (height >= blocks_.size()) {
    return std::nullopt;
  }
  return blocks_[height];
}

std::optional<Amount> MemoryLedger::GetBalance(const std::string &address) const {
  auto it = balances_.find(address);
  if (it == balances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ChainProperties MemoryLedger::GetProperties() const {
  ChainProperties props;
  props.height = blocks_.back().height;
  props.network = config_.network;
  props.minter = config_.minter_id;
  props.owner_wallet = config_.owner_wallet;
  props.transaction_count = accepted_count_;
  props.token_supply = token_supply_;
  return props;
}

} // namespace chain
} // namespace mintnode
