// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_MINING_MINER_HPP
#define LUNACHAIN_MINING_MINER_HPP

#include "mining/block_assembler.hpp"
#include "primitives/block.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lunachain {

namespace chain {
class ChainParams;
}

namespace validation {
class ChainstateManager;
}

namespace mempool {
class CTxMemPool;
}

namespace mining {

// Nonces tried between two checks of the chainstate tip version
static constexpr uint64_t TIP_POLL_INTERVAL = 256;

// CPU Miner - proof-of-work search over block templates
//
// Each search takes a template from the BlockAssembler and tries nonces
// start, start + step, start + 2 * step, ... Workers started with Start(n)
// use start = worker index and step = n, so their nonce ranges are
// disjoint. Every TIP_POLL_INTERVAL nonces the search compares the
// chainstate tip version with the template's and rebuilds the template when
// another block was integrated meanwhile.
//
// Found blocks are submitted through ChainstateManager::ProcessNewBlock like
// any remote block. Cancellation is cooperative: Stop() raises a flag that
// every search checks on each nonce.
class CPUMiner {
public:
  // LIFETIME: params, chainstate and mempool (if any) must outlive the miner
  CPUMiner(const chain::ChainParams &params,
           validation::ChainstateManager &chainstate,
           const mempool::CTxMemPool *mempool, std::string miner_address);
  ~CPUMiner();

  CPUMiner(const CPUMiner &) = delete;
  CPUMiner &operator=(const CPUMiner &) = delete;

  /**
   * Mine one block on the calling thread and submit it.
   *
   * @return the accepted block, or nullopt if the miner was stopped (or
   *         no template could be built)
   */
  std::optional<CBlock> MineBlock();

  // Start background workers (0 = hardware threads)
  bool Start(int num_threads = 1);
  // Interrupt every search (including MineBlock) and join the workers
  void Stop();
  // Allow MineBlock to run again after Stop()
  void ResetInterrupt() { interrupt_.store(false); }

  bool IsMining() const { return mining_.load(); }
  double GetHashrate() const;
  uint64_t GetTotalHashes() const { return total_hashes_.load(); }
  int GetBlocksFound() const { return blocks_found_.load(); }
  uint64_t GetTemplateRestarts() const { return template_restarts_.load(); }

private:
  std::optional<CBlock> MineBlockPartition(uint64_t nonce_start,
                                           uint64_t nonce_step);
  void MiningWorker(uint64_t index, uint64_t num_threads);
  bool ShouldRegenerateTemplate(const BlockTemplate &tmpl) const;

  const chain::ChainParams &params_;
  validation::ChainstateManager &chainstate_;
  BlockAssembler assembler_;
  const std::string miner_address_;

  std::atomic<bool> mining_{false};
  std::atomic<bool> interrupt_{false};
  std::atomic<uint64_t> total_hashes_{0};
  std::atomic<int> blocks_found_{0};
  std::atomic<uint64_t> template_restarts_{0};

  std::chrono::steady_clock::time_point start_time_;

  std::vector<std::thread> workers_;
};

} // namespace mining
} // namespace lunachain

#endif // LUNACHAIN_MINING_MINER_HPP
