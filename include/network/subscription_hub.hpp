// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_SUBSCRIPTION_HUB_HPP
#define MINTNODE_SUBSCRIPTION_HUB_HPP

#include "chain/block.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace mintnode {

namespace metrics {
class MetricsRegistry;
}

namespace network {

/**
 * Receiving end of a broadcast. Implemented by Session.
 * deliver_notification() must not block.
 */
class NotificationSink {
public:
  virtual ~NotificationSink() = default;
  virtual void deliver_notification(SharedFrame frame) = 0;
};

/**
 * SubscriptionHub - registry of sessions subscribed to produced blocks
 *
 * Sinks are held weakly. The registry lock is held only to copy the sink
 * list, never across delivery.
 */
class SubscriptionHub {
public:
  explicit SubscriptionHub(metrics::MetricsRegistry &metrics);

  SubscriptionHub(const SubscriptionHub &) = delete;
  SubscriptionHub &operator=(const SubscriptionHub &) = delete;

  // Returns false if the session is already subscribed (no-op)
  bool subscribe(uint64_t session_id, std::weak_ptr<NotificationSink> sink);

  // Returns false if the session was not subscribed
  bool unsubscribe(uint64_t session_id);

  /**
   * Encode a BlockProduced notification once and offer it to every
   * subscriber. Callers issue broadcasts in production order.
   * @return number of sinks the frame was offered to
   */
  size_t broadcast(const chain::Block &block);

  size_t size() const;
  bool contains(uint64_t session_id) const;

private:
  void update_gauge_locked();

  mutable std::mutex mutex_;
  std::map<uint64_t, std::weak_ptr<NotificationSink>> sinks_;
  metrics::MetricsRegistry &metrics_;
};

} // namespace network
} // namespace mintnode

#endif // MINTNODE_SUBSCRIPTION_HUB_HPP
