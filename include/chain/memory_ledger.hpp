// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CHAIN_MEMORY_LEDGER_HPP
#define MINTNODE_CHAIN_MEMORY_LEDGER_HPP

#include "chain/ledger_engine.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mintnode {
namespace chain {

// Rejection codes reported by MemoryLedger in TxRejected responses
enum class RejectCode : uint32_t {
  INVALID_ADDRESS = 1,
  INVALID_AMOUNT = 2,
  INSUFFICIENT_FEE = 3,
  TX_TOO_LARGE = 4,
  TX_EXPIRED = 5,
  INVALID_TIMESTAMP = 6,
  INSUFFICIENT_BALANCE = 7,
};

const char *RejectCodeName(RejectCode code);

/**
 * In-memory reference ledger engine
 *
 * Transactions are applied to the head state when accepted and packaged
 * into the next block. Block 0 credits the genesis balance to the owner
 * wallet; every later block pays the collected fees to the reward wallet.
 *
 * Not thread-safe. Wrap it in a LedgerHandle.
 */
class MemoryLedger : public LedgerEngine {
public:
  struct Config {
    std::string network;
    std::string minter_id;
    std::string owner_wallet;
    std::string reward_wallet; // Empty: fees go to owner_wallet
    Amount genesis_balance;
    Amount min_fee;
    bool is_minter;         // Only the designated minter produces blocks
    bool mint_empty_blocks; // Produce blocks with no transactions
    size_t max_tx_size;     // Serialized transaction size limit
    int64_t tx_expiry_ms;   // Transactions older than this are rejected
    int64_t max_future_drift_ms;

    Config()
        : network("devnet"), minter_id("minter-0"), owner_wallet("owner"),
          genesis_balance(1000000000), min_fee(10), is_minter(true),
          mint_empty_blocks(true), max_tx_size(1024),
          tx_expiry_ms(60 * 1000), max_future_drift_ms(15 * 1000) {}
  };

  explicit MemoryLedger(const Config &config = Config{});

  SubmitResult SubmitTransaction(const Transaction &tx) override;
  MintResult ProduceBlock() override;

  std::optional<Block> GetBlock(uint64_t height) const override;
  std::optional<Amount> GetBalance(const std::string &address) const override;
  ChainProperties GetProperties() const override;
  Amount GetMinFee() const override { return config_.min_fee; }

  size_t GetPendingCount() const { return pending_.size(); }

  static bool IsValidAddress(const std::string &address);

private:
  struct SeenTx {
    uint64_t id;
    int64_t timestamp_ms;
  };

  void PruneSeen(int64_t now_ms);

  Config config_;
  std::vector<Block> blocks_;
  std::map<std::string, Amount> balances_;
  std::vector<Transaction> pending_;
  std::map<std::vector<uint8_t>, SeenTx> seen_;
  uint64_t next_tx_id_{1};
  uint64_t accepted_count_{0};
  Amount token_supply_{0};
};

} // namespace chain
} // namespace mintnode

#endif // MINTNODE_CHAIN_MEMORY_LEDGER_HPP
