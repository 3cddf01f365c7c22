// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_CHAIN_LEDGER_HANDLE_HPP
#define MINTNODE_CHAIN_LEDGER_HANDLE_HPP

#include "chain/ledger_engine.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <exception>
#include <functional>
#include <memory>

namespace mintnode {
namespace chain {

/**
 * LedgerHandle - the single shared entry point to ledger state
 *
 * Shared by the RPC dispatcher and the mint scheduler through a shared_ptr.
 * The engine is owned by a strand: every call is queued on it and runs alone,
 * so mutations never overlap each other or a query. A caller waiting its turn
 * holds no thread; its handler runs later.
 *
 * Handlers run on the ledger strand. Callers that own state on another
 * strand post back to it. An engine exception reaches the handler as the
 * exception_ptr (the result is then default-constructed).
 *
 * At most one block production is queued or running at any time; a second
 * request completes with Skipped.
 */
class LedgerHandle : public std::enable_shared_from_this<LedgerHandle> {
public:
  template <typename T>
  using Handler = std::function<void(std::exception_ptr error, T result)>;

  LedgerHandle(boost::asio::io_context &io_context,
               std::unique_ptr<LedgerEngine> engine);

  LedgerHandle(const LedgerHandle &) = delete;
  LedgerHandle &operator=(const LedgerHandle &) = delete;

  void SubmitTransaction(Transaction tx, Handler<SubmitResult> handler);
  void ProduceBlock(Handler<MintResult> handler);

  void GetBlock(uint64_t height, Handler<std::optional<Block>> handler);
  void GetBalance(std::string address, Handler<std::optional<Amount>> handler);
  void GetProperties(Handler<ChainProperties> handler);
  void GetMinFee(Handler<Amount> handler);

  bool IsMintInFlight() const { return mint_in_flight_.load(); }

private:
  template <typename T>
  void Run(std::function<T(LedgerEngine &)> op, Handler<T> handler);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::unique_ptr<LedgerEngine> engine_;
  std::atomic<bool> mint_in_flight_{false};
};

using LedgerHandlePtr = std::shared_ptr<LedgerHandle>;

} // namespace chain
} // namespace mintnode

#endif // MINTNODE_CHAIN_LEDGER_HANDLE_HPP
