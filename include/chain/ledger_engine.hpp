// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CHAIN_LEDGER_ENGINE_HPP
#define MINTNODE_CHAIN_LEDGER_ENGINE_HPP

#include "chain/block.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mintnode {
namespace chain {

enum class SubmitStatus {
  ACCEPTED,  // Applied for the first time
  DUPLICATE, // Already applied; tx_id is the original id
  REJECTED,  // Failed validation; code/reason are engine-defined
};

struct SubmitResult {
  SubmitStatus status{SubmitStatus::REJECTED};
  uint64_t tx_id{0};
  uint32_t code{0};
  std::string reason;

  static SubmitResult Accepted(uint64_t id) {
    return {SubmitStatus::ACCEPTED, id, 0, {}};
  }
  static SubmitResult Duplicate(uint64_t id) {
    return {SubmitStatus::DUPLICATE, id, 0, {}};
  }
  static SubmitResult Rejected(uint32_t code, std::string reason) {
    return {SubmitStatus::REJECTED, 0, code, std::move(reason)};
  }
};

enum class MintStatus {
  PRODUCED, // block holds the new block
  SKIPPED,  // Nothing to do this interval (policy, not an error)
  FATAL,    // Engine cannot continue; the node must shut down
};

struct MintResult {
  MintStatus status{MintStatus::SKIPPED};
  std::shared_ptr<const Block> block;
  std::string reason;

  static MintResult Produced(Block b) {
    return {MintStatus::PRODUCED, std::make_shared<const Block>(std::move(b)),
            {}};
  }
  static MintResult Skipped(std::string reason) {
    return {MintStatus::SKIPPED, nullptr, std::move(reason)};
  }
  static MintResult Fatal(std::string reason) {
    return {MintStatus::FATAL, nullptr, std::move(reason)};
  }
};

/**
 * Ledger engine interface
 *
 * The engine owns validation, state transition and storage. It is not
 * thread-safe; LedgerHandle serializes every call. Implementations report
 * validation problems through the result types and throw only on faults.
 */
class LedgerEngine {
public:
  virtual ~LedgerEngine() = default;

  virtual SubmitResult SubmitTransaction(const Transaction &tx) = 0;
  virtual MintResult ProduceBlock() = 0;

  virtual std::optional<Block> GetBlock(uint64_t height) const = 0;
  virtual std::optional<Amount> GetBalance(const std::string &address) const = 0;
  virtual ChainProperties GetProperties() const = 0;

  // Minimum fee accepted for a transfer
  virtual Amount GetMinFee() const = 0;
};

} // namespace chain
} // namespace mintnode

#endif // MINTNODE_CHAIN_LEDGER_ENGINE_HPP
