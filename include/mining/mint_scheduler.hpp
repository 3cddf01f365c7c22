// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_MINING_MINT_SCHEDULER_HPP
#define MINTNODE_MINING_MINT_SCHEDULER_HPP

#include "chain/ledger_handle.hpp"
#include "network/protocol.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace mintnode {

namespace metrics { class MetricsRegistry; }
namespace network { class SubscriptionHub; }

namespace mining {

// Mint scheduler - produces a block every interval on the shared io_context
// and hands produced blocks to the subscription hub.
// Timer and ledger handlers reference the scheduler; destroy it only after the
// io_context has stopped running.
class MintScheduler {
public:
  struct Config {
    std::chrono::milliseconds interval;

    Config() : interval(protocol::DEFAULT_MINT_INTERVAL_MS) {}
  };

  // Invoked once when the engine reports a fatal condition
  using FatalCallback = std::function<void(const std::string &reason)>;

  MintScheduler(boost::asio::io_context &io_context,
                chain::LedgerHandlePtr ledger, network::SubscriptionHub &hub,
                metrics::MetricsRegistry &metrics,
                const Config &config = Config{},
                FatalCallback on_fatal = nullptr);
  ~MintScheduler();

  bool Start();
  void Stop();

  bool IsRunning() const { return running_.load(); }
  uint64_t GetBlocksProduced() const { return blocks_produced_.load(); }

  // Runs on the scheduler strand once the result has been published
  using MintCallback = std::function<void(const chain::MintResult &)>;

  // Produce one block now, outside the timer. Same publication path as a
  // timer fire.
  void ProduceNow(MintCallback on_done = nullptr);

  /**
   * Next fire time after a fire that was scheduled for `scheduled`.
   * Keeps the original cadence unless that moment has already passed, in
   * which case the schedule restarts from `now`.
   */
  static std::chrono::steady_clock::time_point
  ComputeNextFire(std::chrono::steady_clock::time_point scheduled,
                  std::chrono::steady_clock::time_point now,
                  std::chrono::milliseconds interval);

private:
  void ScheduleNext();
  void OnTimer(const boost::system::error_code &ec);
  void ProduceAndPublish(MintCallback then);
  void Publish(const chain::MintResult &result);
  void HandleFatal(const std::string &reason);

  chain::LedgerHandlePtr ledger_;
  network::SubscriptionHub &hub_;
  metrics::MetricsRegistry &metrics_;
  Config config_;
  FatalCallback on_fatal_;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::chrono::steady_clock::time_point next_fire_; // strand-only

  std::atomic<bool> running_{false};
  std::atomic<bool> fatal_{false};
  std::atomic<uint64_t> blocks_produced_{0};
};

} // namespace mining
} // namespace mintnode

#endif // MINTNODE_MINING_MINT_SCHEDULER_HPP
