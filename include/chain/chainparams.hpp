// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CHAIN_CHAINPARAMS_HPP
#define LUNACHAIN_CHAIN_CHAINPARAMS_HPP

#include "chain/account_state.hpp"
#include "crypto/pow_hasher.hpp"
#include "primitives/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lunachain {
namespace chain {

enum class ChainType {
  MAIN,    // Production mainnet
  TESTNET, // Public test network
  REGTEST  // Regression test (local testing)
};

/**
 * Operator-tunable settings, fixed for the lifetime of a chain manager.
 * Defaults are the mainnet values.
 */
struct ChainSettings {
  int64_t target_block_interval{120}; // seconds
  int32_t retarget_window{144};       // blocks per difficulty period
  int64_t max_retarget_factor{4};     // per-period bound in each direction

  // Easiest allowed target in compact form (nullopt = network default)
  std::optional<uint32_t> pow_limit_bits;
  // Keep every block at the pow limit (nullopt = network default, on for
  // regtest only)
  std::optional<bool> pow_no_retargeting;

  size_t mempool_max_entries{10000};
  size_t max_block_bytes{1'000'000};
  size_t max_block_transactions{2000};

  size_t max_orphan_blocks{100};
  size_t max_orphan_blocks_per_peer{20};
  int64_t orphan_expire_seconds{600};

  CAmount block_reward{50 * COIN};

  // Mempool admission policy; nullopt = network default
  std::optional<CAmount> min_tx_amount;
  std::optional<CAmount> max_tx_amount;
  std::optional<CAmount> min_tx_fee;
  // Admissions per sender within rate_limit_window_seconds (0 = unlimited)
  std::optional<size_t> rate_limit_max_txs;
  int64_t rate_limit_window_seconds{60};
  // Senders whose transactions are never admitted
  std::vector<std::string> blacklisted_addresses;

  // Pre-funded accounts in the genesis state
  std::vector<std::pair<std::string, CAmount>> genesis_allocations;
};

/**
 * Consensus parameters derived from the network and its settings
 */
struct ConsensusParams {
  uint256 powLimit;                  // easiest target
  int64_t nPowTargetSpacing{120};    // seconds between blocks
  int32_t nRetargetWindow{144};
  int64_t nMaxRetargetFactor{4};
  bool fPowNoRetargeting{false};

  crypto::PowAlgorithm powAlgorithm{crypto::PowAlgorithm::RANDOMX};
  uint32_t nRandomXEpochDuration{7 * 24 * 60 * 60}; // 1 week

  CAmount nBlockReward{50 * COIN};

  int64_t nMaxFutureBlockTime{2 * 60 * 60};
  int nMedianTimeSpan{11};

  uint256 hashGenesisBlock;

  int64_t DifficultyAdjustmentInterval() const { return nRetargetWindow; }
};

/**
 * Local admission rules of the mempool. Blocks are never checked against
 * them: a block may carry transactions this node would not relay.
 */
struct MempoolPolicy {
  CAmount nMinTxAmount{1};
  CAmount nMaxTxAmount{MAX_MONEY};
  CAmount nMinTxFee{0};
  size_t nRateLimitMaxTxs{0};
  int64_t nRateLimitWindow{60};
  std::set<std::string> blacklist; // canonical addresses
};

class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const ChainSettings &GetSettings() const { return settings; }
  const MempoolPolicy &GetMempoolPolicy() const { return policy; }
  const CBlock &GenesisBlock() const { return genesis; }
  // Account state committed to by the genesis block
  const AccountState &GenesisState() const { return genesis_state; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  const crypto::PowHasher &GetPowHasher() const { return *pow_hasher; }

  // Throw std::invalid_argument for unusable settings
  static std::unique_ptr<ChainParams>
  CreateMainNet(const ChainSettings &settings = {});
  static std::unique_ptr<ChainParams>
  CreateTestNet(const ChainSettings &settings = {});
  static std::unique_ptr<ChainParams>
  CreateRegTest(const ChainSettings &settings = {});

protected:
  // Validates settings and builds the genesis block and state
  void Finish(uint32_t nGenesisTime, uint32_t nDefaultPowLimitBits);

  ConsensusParams consensus;
  MempoolPolicy policy;
  ChainSettings settings;
  ChainType chainType{ChainType::MAIN};
  CBlock genesis;
  AccountState genesis_state;
  std::shared_ptr<const crypto::PowHasher> pow_hasher;
};

class CMainParams : public ChainParams {
public:
  explicit CMainParams(const ChainSettings &settings);
};

class CTestNetParams : public ChainParams {
public:
  explicit CTestNetParams(const ChainSettings &settings);
};

class CRegTestParams : public ChainParams {
public:
  explicit CRegTestParams(const ChainSettings &settings);
};

// Merkle commitment of a genesis allocation list
uint256 GenesisAllocationsRoot(
    const std::vector<std::pair<std::string, CAmount>> &allocations);

CBlock CreateGenesisBlock(
    uint32_t nTime, uint32_t nBits,
    const std::vector<std::pair<std::string, CAmount>> &allocations,
    int32_t nVersion = 1);

} // namespace chain
} // namespace lunachain

#endif // LUNACHAIN_CHAIN_CHAINPARAMS_HPP
