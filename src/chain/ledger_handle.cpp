// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "chain/ledger_handle.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace mintnode {
namespace chain {

namespace {
// Clears the in-flight flag on every exit path, including engine exceptions
class MintFlagGuard {
public:
  explicit MintFlagGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~MintFlagGuard() { flag_.store(false); }

  MintFlagGuard(const MintFlagGuard &) = delete;
  MintFlagGuard &operator=(const MintFlagGuard &) = delete;

private:
  std::atomic<bool> &flag_;
};
} // namespace

LedgerHandle::LedgerHandle(boost::asio::io_context &io_context,
                           std::unique_ptr<LedgerEngine> engine)
    : strand_(boost::asio::make_strand(io_context)),
      engine_(std::move(engine)) {
  if (!engine_) {
    throw std::invalid_argument("LedgerHandle requires an engine");
  }
}

template <typename T>
void LedgerHandle::Run(std::function<T(LedgerEngine &)> op,
                       Handler<T> handler) {
  boost::asio::post(strand_, [self = shared_from_this(), op = std::move(op),
                              handler = std::move(handler)]() {
    T result{};
    std::exception_ptr error;
    try {
      result = op(*self->engine_);
    } catch (const std::exception &e) {
      LOG_CHAIN_DEBUG("ledger engine call failed: {}", e.what());
      error = std::current_exception();
    }
    if (handler) {
      handler(error, std::move(result));
    }
  });
}

void LedgerHandle::SubmitTransaction(Transaction tx,
                                     Handler<SubmitResult> handler) {
  Run<SubmitResult>(
      [tx = std::move(tx)](LedgerEngine &engine) {
        return engine.SubmitTransaction(tx);
      },
      std::move(handler));
}

void LedgerHandle::ProduceBlock(Handler<MintResult> handler) {
  if (mint_in_flight_.exchange(true)) {
    LOG_CHAIN_DEBUG("ProduceBlock called while another production is in flight");
    boost::asio::post(strand_, [handler = std::move(handler)]() {
      if (handler) {
        handler(nullptr,
                MintResult::Skipped("block production already in flight"));
      }
    });
    return;
  }

  Run<MintResult>(
      [this](LedgerEngine &engine) {
        MintFlagGuard guard(mint_in_flight_);
        return engine.ProduceBlock();
      },
      std::move(handler));
}

void LedgerHandle::GetBlock(uint64_t height,
                            Handler<std::optional<Block>> handler) {
  Run<std::optional<Block>>(
      [height](LedgerEngine &engine) { return engine.GetBlock(height); },
      std::move(handler));
}

void LedgerHandle::GetBalance(std::string address,
                              Handler<std::optional<Amount>> handler) {
  Run<std::optional<Amount>>(
      [address = std::move(address)](LedgerEngine &engine) {
        return engine.GetBalance(address);
      },
      std::move(handler));
}

void LedgerHandle::GetProperties(Handler<ChainProperties> handler) {
  Run<ChainProperties>(
      [](LedgerEngine &engine) { return engine.GetProperties(); },
      std::move(handler));
}

void LedgerHandle::GetMinFee(Handler<Amount> handler) {
  Run<Amount>([](LedgerEngine &engine) { return engine.GetMinFee(); },
              std::move(handler));
}

} // namespace chain
} // namespace mintnode
