// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "mining/mint_scheduler.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/subscription_hub.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace mintnode {
namespace mining {

MintScheduler::MintScheduler(boost::asio::io_context &io_context,
                             chain::LedgerHandlePtr ledger,
                             network::SubscriptionHub &hub,
                             metrics::MetricsRegistry &metrics,
                             const Config &config, FatalCallback on_fatal)
    : ledger_(std::move(ledger)), hub_(hub), metrics_(metrics),
      config_(config), on_fatal_(std::move(on_fatal)),
      strand_(boost::asio::make_strand(io_context)), timer_(strand_) {
  if (!ledger_) {
    throw std::invalid_argument("MintScheduler requires a ledger handle");
  }
  if (config_.interval.count() <= 0) {
    throw std::invalid_argument("mint interval must be positive");
  }
}

MintScheduler::~MintScheduler() { running_ = false; }

bool MintScheduler::Start() {
  if (fatal_.load()) {
    LOG_WARN("Minter: Not starting after a fatal engine error");
    return false;
  }
  if (running_.exchange(true)) {
    LOG_WARN("Minter: Already running");
    return false;
  }

  LOG_INFO("Minter: Starting (interval {} ms)", config_.interval.count());
  boost::asio::post(strand_, [this]() {
    next_fire_ = std::chrono::steady_clock::now() + config_.interval;
    ScheduleNext();
  });
  return true;
}

void MintScheduler::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  LOG_INFO("Minter: Stopping...");
  boost::asio::post(strand_, [this]() { timer_.cancel(); });
  LOG_INFO("Minter: Stopped");
  LOG_INFO("  Blocks produced: {}", blocks_produced_.load());
}

std::chrono::steady_clock::time_point
MintScheduler::ComputeNextFire(std::chrono::steady_clock::time_point scheduled,
                               std::chrono::steady_clock::time_point now,
                               std::chrono::milliseconds interval) {
  auto next = scheduled + interval;
  if (next <= now) {
    // Fell behind by a whole interval; don't fire a burst to catch up
    next = now + interval;
  }
  return next;
}

void MintScheduler::ScheduleNext() {
  if (!running_.load()) {
    return;
  }
  timer_.expires_at(next_fire_);
  timer_.async_wait(
      [this](const boost::system::error_code &ec) { OnTimer(ec); });
}

void MintScheduler::OnTimer(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::operation_aborted || !running_.load()) {
    return;
  }

  // The timer is re-armed only after the result comes back
  ProduceAndPublish([this](const chain::MintResult &) {
    if (!running_.load()) {
      return;
    }
    auto now = std::chrono::steady_clock::now();
    auto next = ComputeNextFire(next_fire_, now, config_.interval);
    if (next - next_fire_ > config_.interval) {
      LOG_DEBUG("Minter: Fell behind schedule by {} ms",
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - next_fire_)
                    .count());
    }
    next_fire_ = next;
    ScheduleNext();
  });
}

void MintScheduler::ProduceNow(MintCallback on_done) {
  if (fatal_.load()) {
    auto result =
        chain::MintResult::Fatal("engine already reported a fatal error");
    if (on_done) {
      boost::asio::post(strand_, [on_done = std::move(on_done), result]() {
        on_done(result);
      });
    }
    return;
  }
  ProduceAndPublish(std::move(on_done));
}

void MintScheduler::ProduceAndPublish(MintCallback then) {
  ledger_->ProduceBlock([this, then = std::move(then)](
                            std::exception_ptr error,
                            chain::MintResult result) mutable {
    if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception &e) {
        result =
            chain::MintResult::Fatal(std::string("engine fault: ") + e.what());
      }
    }
    // Ledger strand completes productions in order; so does this post
    boost::asio::post(strand_, [this, then = std::move(then),
                                result = std::move(result)]() {
      Publish(result);
      if (then) {
        then(result);
      }
    });
  });
}

void MintScheduler::Publish(const chain::MintResult &result) {
  switch (result.status) {
  case chain::MintStatus::PRODUCED: {
    const auto &block = *result.block;
    blocks_produced_++;
    metrics_.blocks_produced.inc();
    metrics_.chain_height.set(static_cast<int64_t>(block.height));
    LOG_INFO("Minter: Produced block {} ({} transactions, reward {})",
             block.height, block.transactions.size(), block.reward);
    hub_.broadcast(block);
    break;
  }
  case chain::MintStatus::SKIPPED:
    metrics_.mint_skipped.inc();
    LOG_DEBUG("Minter: Skipped ({})", result.reason);
    break;
  case chain::MintStatus::FATAL:
    HandleFatal(result.reason);
    break;
  }
}

void MintScheduler::HandleFatal(const std::string &reason) {
  if (fatal_.exchange(true)) {
    return;
  }
  LOG_ERROR("Minter: Fatal engine error: {}", reason);

  running_ = false;
  boost::asio::post(strand_, [this]() { timer_.cancel(); });

  if (on_fatal_) {
    try {
      on_fatal_(reason);
    } catch (const std::exception &e) {
      LOG_ERROR("Minter: Exception in fatal callback: {}", e.what());
    }
  }
}

} // namespace mining
} // namespace mintnode
