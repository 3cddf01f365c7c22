// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_TEST_FAKE_ENGINE_HPP
#define MINTNODE_TEST_FAKE_ENGINE_HPP

#include "chain/ledger_engine.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace mintnode {
namespace test {

/**
 * FakeEngine - LedgerEngine with scripted results
 *
 * ProduceBlock() pops the next scripted MintResult; when the script is empty
 * it produces a block at the next height. throw_on_* make the matching call
 * throw. Counters record every call. overlap_detected is set if two calls ever
 * run at the same time.
 */
class FakeEngine : public chain::LedgerEngine {
public:
    enum class Scripted { PRODUCE, SKIP, FATAL, THROW };

    chain::SubmitResult SubmitTransaction(const chain::Transaction& tx) override {
        Guard g(*this, true);
        submit_calls++;
        if (throw_on_submit) throw std::runtime_error("submit fault");
        auto it = seen_.find(tx.signature);
        if (it != seen_.end()) {
            return chain::SubmitResult::Duplicate(it->second);
        }
        if (tx.amount <= 0) {
            return chain::SubmitResult::Rejected(42, "amount must be positive");
        }
        uint64_t id = next_tx_id_++;
        seen_[tx.signature] = id;
        return chain::SubmitResult::Accepted(id);
    }

    chain::MintResult ProduceBlock() override {
        Guard g(*this, true);
        produce_calls++;
        if (produce_delay.count() > 0) {
            std::this_thread::sleep_for(produce_delay);
        }
        Scripted next = Scripted::PRODUCE;
        {
            std::lock_guard<std::mutex> lock(script_mutex_);
            if (!script_.empty()) {
                next = script_.front();
                script_.pop_front();
            }
        }
        switch (next) {
        case Scripted::SKIP:
            return chain::MintResult::Skipped("nothing to mint");
        case Scripted::FATAL:
            return chain::MintResult::Fatal("disk on fire");
        case Scripted::THROW:
            throw std::runtime_error("engine exploded");
        case Scripted::PRODUCE:
            break;
        }
        chain::Block block;
        block.height = ++height_;
        block.minter = "fake-minter";
        block.reward_wallet = "owner";
        return chain::MintResult::Produced(block);
    }

    std::optional<chain::Block> GetBlock(uint64_t height) const override {
        Guard g(*this, false);
        if (throw_on_query) throw std::runtime_error("query fault");
        if (height > height_) return std::nullopt;
        chain::Block block;
        block.height = height;
        return block;
    }

    std::optional<chain::Amount> GetBalance(const std::string& address) const override {
        Guard g(*this, false);
        if (throw_on_query) throw std::runtime_error("query fault");
        if (address == "owner") return chain::Amount(5000);
        return std::nullopt;
    }

    chain::ChainProperties GetProperties() const override {
        Guard g(*this, false);
        if (throw_on_query) throw std::runtime_error("query fault");
        chain::ChainProperties props;
        props.height = height_;
        props.network = "devnet";
        props.minter = "fake-minter";
        return props;
    }

    chain::Amount GetMinFee() const override { return 10; }

    void script(std::initializer_list<Scripted> steps) {
        std::lock_guard<std::mutex> lock(script_mutex_);
        script_.insert(script_.end(), steps.begin(), steps.end());
    }

    uint64_t height() const { return height_; }

    std::atomic<int> submit_calls{0};
    std::atomic<int> produce_calls{0};
    mutable std::atomic<bool> overlap_detected{false};
    std::atomic<bool> throw_on_submit{false};
    std::atomic<bool> throw_on_query{false};
    std::chrono::milliseconds produce_delay{0};

private:
    // Marks a call in progress. Any two calls running at once are flagged.
    struct Guard {
        Guard(const FakeEngine& e, bool mutation) : engine(e), mutation(mutation) {
            int before = engine.active_.fetch_add(1);
            if (before != 0 || engine.mutating_) {
                engine.overlap_detected = true;
            }
            if (mutation) engine.mutating_ = true;
        }
        ~Guard() {
            if (mutation) engine.mutating_ = false;
            engine.active_.fetch_sub(1);
        }
        const FakeEngine& engine;
        bool mutation;
    };

    mutable std::atomic<int> active_{0};
    mutable std::atomic<bool> mutating_{false};
    std::atomic<uint64_t> height_{0};
    uint64_t next_tx_id_{1};
    std::map<std::vector<uint8_t>, uint64_t> seen_;
    std::mutex script_mutex_;
    std::deque<Scripted> script_;
};

} // namespace test
} // namespace mintnode

#endif // MINTNODE_TEST_FAKE_ENGINE_HPP
