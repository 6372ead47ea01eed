// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_NODE_INBOUND_ROUTER_HPP
#define LUNACHAIN_NODE_INBOUND_ROUTER_HPP

#include "mempool/txmempool.hpp"
#include "validation/validation.hpp"
#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace lunachain {

namespace validation {
class ChainstateManager;
}

namespace node {

/**
 * InboundRouter - entry point for raw blocks and transactions
 *
 * Deserializes wire bytes and routes blocks to
 * ChainstateManager::ProcessNewBlock and transactions to CTxMemPool::Admit.
 * Malformed bytes are rejected as BLOCK_STRUCTURAL / TX_MALFORMED with
 * reject reason "deserialize-failed".
 *
 * The *Async variants post the work onto an internal Boost.Asio thread pool
 * and report through the callback on a pool thread.
 */
class InboundRouter {
public:
  using BlockCallback =
      std::function<void(bool accepted,
                         const validation::BlockValidationState &state)>;
  using TxCallback = std::function<void(const mempool::MempoolAcceptResult &)>;

  // LIFETIME: chainstate and mempool must outlive the router
  InboundRouter(validation::ChainstateManager &chainstate,
                mempool::CTxMemPool &mempool, size_t num_threads = 2);
  // Waits for posted work
  ~InboundRouter();

  InboundRouter(const InboundRouter &) = delete;
  InboundRouter &operator=(const InboundRouter &) = delete;

  bool ReceiveBlock(const std::vector<uint8_t> &raw,
                    validation::BlockValidationState &state,
                    int peer_id = -1);
  mempool::MempoolAcceptResult
  ReceiveTransaction(const std::vector<uint8_t> &raw);

  void ReceiveBlockAsync(std::vector<uint8_t> raw, int peer_id,
                         BlockCallback callback);
  void ReceiveTransactionAsync(std::vector<uint8_t> raw, TxCallback callback);

  // Block until every posted task has finished; no new work after this
  void Shutdown();

  uint64_t GetBlocksReceived() const { return blocks_received_.load(); }
  uint64_t GetTransactionsReceived() const { return txs_received_.load(); }
  uint64_t GetMalformedCount() const { return malformed_.load(); }

private:
  validation::ChainstateManager &chainstate_;
  mempool::CTxMemPool &mempool_;

  boost::asio::thread_pool pool_;
  std::atomic<bool> shutdown_{false};

  std::atomic<uint64_t> blocks_received_{0};
  std::atomic<uint64_t> txs_received_{0};
  std::atomic<uint64_t> malformed_{0};
};

} // namespace node
} // namespace lunachain

#endif // LUNACHAIN_NODE_INBOUND_ROUTER_HPP
