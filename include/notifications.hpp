// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_NOTIFICATIONS_HPP
#define LUNACHAIN_NOTIFICATIONS_HPP

#include "chain/account_state.hpp"
#include "primitives/block.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace lunachain {

namespace chain {
class CBlockIndex;
}

/**
 * Active-chain change delivered after every tip update.
 *
 * disconnected lists blocks removed from the active chain, old tip first;
 * connected lists blocks added, fork point's child first. state is the
 * account state at new_tip and is only valid during the callback.
 */
struct TipUpdate {
  const chain::CBlockIndex *new_tip{nullptr};
  std::vector<std::shared_ptr<const CBlock>> disconnected;
  std::vector<std::shared_ptr<const CBlock>> connected;
  const chain::AccountState *state{nullptr};
  uint64_t tip_version{0};
};

/**
 * ChainNotifications - publish/subscribe for chain events
 *
 * Callbacks run synchronously on the thread that changed the tip, while the
 * chainstate write lock is held. Subscribers must not call back into the
 * ChainstateManager; everything they need is in the event.
 *
 * Subscriptions are RAII handles: destroying one unsubscribes.
 */
class ChainNotifications {
public:
  using TipUpdateCallback = std::function<void(const TipUpdate &)>;
  using BlockConnectedCallback =
      std::function<void(const CBlock &, const chain::CBlockIndex *)>;

  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications *owner, uint64_t id);

    // nullptr once unsubscribed or moved from
    ChainNotifications *owner_{nullptr};
    uint64_t id_{0};
  };

  ChainNotifications() = default;
  ChainNotifications(const ChainNotifications &) = delete;
  ChainNotifications &operator=(const ChainNotifications &) = delete;

  [[nodiscard]] Subscription SubscribeTipUpdate(TipUpdateCallback callback);
  [[nodiscard]] Subscription
  SubscribeBlockConnected(BlockConnectedCallback callback);

  void NotifyTipUpdate(const TipUpdate &update);
  void NotifyBlockConnected(const CBlock &block, const chain::CBlockIndex *pindex);

  size_t SubscriberCount() const;

private:
  void Unsubscribe(uint64_t id);

  // Keyed by subscription id, so delivery follows subscription order
  mutable std::mutex mutex_;
  std::map<uint64_t, TipUpdateCallback> tip_callbacks_;
  std::map<uint64_t, BlockConnectedCallback> connected_callbacks_;
  uint64_t next_id_{1};
};

} // namespace lunachain

#endif // LUNACHAIN_NOTIFICATIONS_HPP
