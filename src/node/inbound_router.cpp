// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "node/inbound_router.hpp"
#include "primitives/block.hpp"
#include "util/logging.hpp"
#include "validation/chainstate_manager.hpp"
#include <boost/asio/post.hpp>
#include <ios>
#include <utility>

namespace lunachain {
namespace node {

InboundRouter::InboundRouter(validation::ChainstateManager &chainstate,
                             mempool::CTxMemPool &mempool, size_t num_threads)
    : chainstate_(chainstate), mempool_(mempool),
      pool_(num_threads > 0 ? num_threads : 1) {}

InboundRouter::~InboundRouter() { Shutdown(); }

void InboundRouter::Shutdown() {
  shutdown_.store(true);
  pool_.join();
}

bool InboundRouter::ReceiveBlock(const std::vector<uint8_t> &raw,
                                 validation::BlockValidationState &state,
                                 int peer_id) {
  blocks_received_.fetch_add(1, std::memory_order_relaxed);

  CBlock block;
  try {
    block = DeserializeBlock(raw);
  } catch (const std::ios_base::failure &e) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    LOG_CHAIN_DEBUG("Malformed block from peer={} ({} bytes): {}", peer_id,
                    raw.size(), e.what());
    return state.Invalid(validation::BlockValidationResult::BLOCK_STRUCTURAL,
                         "deserialize-failed", e.what());
  }

  return chainstate_.ProcessNewBlock(block, state, peer_id);
}

mempool::MempoolAcceptResult
InboundRouter::ReceiveTransaction(const std::vector<uint8_t> &raw) {
  txs_received_.fetch_add(1, std::memory_order_relaxed);

  CTransactionRef tx;
  try {
    DataStream s(raw);
    tx = DeserializeTransaction(s);
    if (!s.empty()) {
      throw std::ios_base::failure("trailing bytes after transaction");
    }
  } catch (const std::ios_base::failure &e) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    LOG_MEMPOOL_DEBUG("Malformed transaction ({} bytes): {}", raw.size(),
                      e.what());
    validation::TxValidationState state;
    state.Invalid(validation::TxValidationResult::TX_MALFORMED,
                  "deserialize-failed", e.what());
    return mempool::MempoolAcceptResult::Failure(
        mempool::MempoolAcceptResult::ResultType::VALIDATION_ERROR, state);
  }

  return mempool_.Admit(tx);
}

void InboundRouter::ReceiveBlockAsync(std::vector<uint8_t> raw, int peer_id,
                                      BlockCallback callback) {
  if (shutdown_.load()) {
    LOG_CHAIN_WARN("InboundRouter: dropping block after shutdown");
    return;
  }
  boost::asio::post(pool_, [this, raw = std::move(raw), peer_id,
                            callback = std::move(callback)]() {
    validation::BlockValidationState state;
    bool accepted = ReceiveBlock(raw, state, peer_id);
    if (callback) {
      callback(accepted, state);
    }
  });
}

void InboundRouter::ReceiveTransactionAsync(std::vector<uint8_t> raw,
                                            TxCallback callback) {
  if (shutdown_.load()) {
    LOG_MEMPOOL_WARN("InboundRouter: dropping transaction after shutdown");
    return;
  }
  boost::asio::post(pool_, [this, raw = std::move(raw),
                            callback = std::move(callback)]() {
    mempool::MempoolAcceptResult result = ReceiveTransaction(raw);
    if (callback) {
      callback(result);
    }
  });
}

} // namespace node
} // namespace lunachain
