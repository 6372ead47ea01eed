// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "mining/miner.hpp"
#include "chain/chainparams.hpp"
#include "consensus/pow.hpp"
#include "util/logging.hpp"
#include "validation/chainstate_manager.hpp"
#include <limits>
#include <utility>

namespace lunachain {
namespace mining {

CPUMiner::CPUMiner(const chain::ChainParams &params,
                   validation::ChainstateManager &chainstate,
                   const mempool::CTxMemPool *mempool,
                   std::string miner_address)
    : params_(params), chainstate_(chainstate),
      assembler_(params, chainstate, mempool),
      miner_address_(std::move(miner_address)) {}

CPUMiner::~CPUMiner() { Stop(); }

bool CPUMiner::Start(int num_threads) {
  if (mining_.load()) {
    LOG_MINING_WARN("Miner: Already mining");
    return false;
  }

  if (num_threads <= 0) {
    num_threads = static_cast<int>(std::thread::hardware_concurrency());
    if (num_threads <= 0) {
      num_threads = 1;
    }
  }

  LOG_MINING_INFO("Miner: Starting {} thread(s) (chain: {}, reward to {})",
                  num_threads, params_.GetChainTypeString(), miner_address_);

  interrupt_.store(false);
  mining_.store(true);
  total_hashes_.store(0);
  start_time_ = std::chrono::steady_clock::now();

  for (int i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i, num_threads]() {
      MiningWorker(static_cast<uint64_t>(i),
                   static_cast<uint64_t>(num_threads));
    });
  }

  return true;
}

void CPUMiner::Stop() {
  interrupt_.store(true);
  if (!mining_.load()) {
    return;
  }

  LOG_MINING_INFO("Miner: Stopping...");

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::steady_clock::now() - start_time_)
                     .count();

  uint64_t hashes = total_hashes_.load();
  double hashrate = GetHashrate();

  mining_.store(false);

  LOG_MINING_INFO("Miner: Stopped");
  LOG_MINING_INFO("  Total hashes: {}", hashes);
  LOG_MINING_INFO("  Time: {}s", elapsed);
  LOG_MINING_INFO("  Hashrate: {} H/s", hashrate);
  LOG_MINING_INFO("  Blocks found: {}", blocks_found_.load());
  LOG_MINING_INFO("  Template restarts: {}", template_restarts_.load());
}

double CPUMiner::GetHashrate() const {
  if (!mining_.load()) {
    return 0.0;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::steady_clock::now() - start_time_)
                     .count();

  if (elapsed == 0) {
    return 0.0;
  }

  return (double)total_hashes_.load() / elapsed;
}

std::optional<CBlock> CPUMiner::MineBlock() {
  return MineBlockPartition(0, 1);
}

void CPUMiner::MiningWorker(uint64_t index, uint64_t num_threads) {
  while (!interrupt_.load()) {
    if (!MineBlockPartition(index, num_threads) && !interrupt_.load()) {
      // No template could be built; do not spin
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

std::optional<CBlock> CPUMiner::MineBlockPartition(uint64_t nonce_start,
                                                   uint64_t nonce_step) {
  const crypto::PowHasher &hasher = params_.GetPowHasher();
  const uint256 &pow_limit = params_.GetConsensus().powLimit;

  while (!interrupt_.load()) {
    std::optional<BlockTemplate> tmpl = assembler_.CreateNewBlock(miner_address_);
    if (!tmpl) {
      return std::nullopt;
    }

    LOG_MINING_DEBUG("Miner: Mining block at height {} (prev {}, target "
                     "0x{:x}, {} txs)",
                     tmpl->nHeight, tmpl->hashPrevBlock.ToString().substr(0, 16),
                     tmpl->nBits, tmpl->block.vtx.size());

    CBlock &block = tmpl->block;
    uint64_t nonce = nonce_start;
    uint64_t tries = 0;
    bool found = false;

    while (!interrupt_.load()) {
      if (tries > 0 && tries % TIP_POLL_INTERVAL == 0 &&
          ShouldRegenerateTemplate(*tmpl)) {
        template_restarts_.fetch_add(1);
        LOG_MINING_DEBUG("Miner: Chain tip changed, regenerating template");
        break;
      }

      block.nNonce = nonce;
      uint256 pow_hash = hasher.Hash(block.GetHeader());
      ++tries;
      total_hashes_.fetch_add(1, std::memory_order_relaxed);

      if (consensus::CheckProofOfWork(pow_hash, tmpl->nBits, pow_limit)) {
        found = true;
        break;
      }

      if (nonce > std::numeric_limits<uint64_t>::max() - nonce_step) {
        // Nonce space exhausted; a new template gets a new timestamp
        template_restarts_.fetch_add(1);
        break;
      }
      nonce += nonce_step;
    }

    if (!found) {
      continue;
    }

    LOG_MINING_INFO("Miner: *** BLOCK FOUND *** Height: {}, Nonce: {}, Hash: {}",
                    tmpl->nHeight, block.nNonce,
                    block.GetHash().ToString().substr(0, 16));

    // Process block through chainstate manager
    // This validates, activates best chain, and emits notifications
    validation::BlockValidationState state;
    bool new_tip = false;
    if (!chainstate_.ProcessNewBlock(block, state, -1, &new_tip)) {
      LOG_MINING_ERROR("Miner: Failed to process mined block: {}",
                       state.ToString());
      continue;
    }

    blocks_found_.fetch_add(1);
    if (!new_tip) {
      LOG_MINING_INFO("Miner: Block {} accepted on a side branch",
                      block.GetHash().ToString().substr(0, 16));
    }
    return block;
  }

  return std::nullopt;
}

bool CPUMiner::ShouldRegenerateTemplate(const BlockTemplate &tmpl) const {
  return chainstate_.GetTipVersion() != tmpl.tip_version;
}

} // namespace mining
} // namespace lunachain
