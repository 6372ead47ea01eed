// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "chain/arith_uint256.hpp"
#include "crypto/key.hpp"
#include "crypto/sha256.hpp"
#include <stdexcept>

namespace lunachain {
namespace chain {

uint256 GenesisAllocationsRoot(
    const std::vector<std::pair<std::string, CAmount>> &allocations) {
  DataStream s;
  s.WriteCompactSize(allocations.size());
  for (const auto &[address, amount] : allocations) {
    s.WriteString(address);
    s.WriteInt<int64_t>(amount);
  }
  return crypto::SHA256d(s.data());
}

CBlock CreateGenesisBlock(
    uint32_t nTime, uint32_t nBits,
    const std::vector<std::pair<std::string, CAmount>> &allocations,
    int32_t nVersion) {
  CBlock genesis;
  genesis.nVersion = nVersion;
  genesis.nHeight = 0;
  genesis.hashPrevBlock.SetNull();
  genesis.hashMerkleRoot = GenesisAllocationsRoot(allocations);
  genesis.minerAddress.SetNull();
  genesis.nTime = nTime;
  genesis.nBits = nBits;
  genesis.nNonce = 0;
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<ChainParams>
ChainParams::CreateMainNet(const ChainSettings &settings) {
  return std::make_unique<CMainParams>(settings);
}

std::unique_ptr<ChainParams>
ChainParams::CreateTestNet(const ChainSettings &settings) {
  return std::make_unique<CTestNetParams>(settings);
}

std::unique_ptr<ChainParams>
ChainParams::CreateRegTest(const ChainSettings &settings) {
  return std::make_unique<CRegTestParams>(settings);
}

void ChainParams::Finish(uint32_t nGenesisTime, uint32_t nDefaultPowLimitBits) {
  if (settings.target_block_interval <= 0) {
    throw std::invalid_argument("target block interval must be positive");
  }
  if (settings.retarget_window <= 0) {
    throw std::invalid_argument("retarget window must be positive");
  }
  if (settings.max_retarget_factor < 1) {
    throw std::invalid_argument("max retarget factor must be at least 1");
  }
  if (settings.mempool_max_entries == 0 || settings.max_block_bytes == 0 ||
      settings.max_block_transactions == 0) {
    throw std::invalid_argument("mempool and block limits must be positive");
  }
  if (!MoneyRange(settings.block_reward)) {
    throw std::invalid_argument("block reward out of range");
  }

  uint32_t pow_bits = settings.pow_limit_bits.value_or(nDefaultPowLimitBits);
  bool negative = false;
  bool overflow = false;
  arith_uint256 limit = SetCompact(pow_bits, &negative, &overflow);
  if (negative || overflow || limit == 0) {
    throw std::invalid_argument("invalid pow limit bits");
  }

  if (settings.min_tx_amount) {
    policy.nMinTxAmount = *settings.min_tx_amount;
  }
  if (settings.max_tx_amount) {
    policy.nMaxTxAmount = *settings.max_tx_amount;
  }
  if (settings.min_tx_fee) {
    policy.nMinTxFee = *settings.min_tx_fee;
  }
  if (settings.rate_limit_max_txs) {
    policy.nRateLimitMaxTxs = *settings.rate_limit_max_txs;
  }
  policy.nRateLimitWindow = settings.rate_limit_window_seconds;
  if (policy.nMinTxAmount <= 0 || !MoneyRange(policy.nMaxTxAmount) ||
      policy.nMaxTxAmount < policy.nMinTxAmount) {
    throw std::invalid_argument("invalid transaction amount bounds");
  }
  if (!MoneyRange(policy.nMinTxFee)) {
    throw std::invalid_argument("invalid minimum transaction fee");
  }
  if (policy.nRateLimitWindow <= 0) {
    throw std::invalid_argument("rate limit window must be positive");
  }
  for (const std::string &address : settings.blacklisted_addresses) {
    auto canonical = crypto::NormalizeAddress(address);
    if (!canonical) {
      throw std::invalid_argument("invalid blacklisted address: " + address);
    }
    policy.blacklist.insert(*canonical);
  }

  consensus.powLimit = ArithToUint256(limit);
  consensus.nPowTargetSpacing = settings.target_block_interval;
  consensus.nRetargetWindow = settings.retarget_window;
  consensus.nMaxRetargetFactor = settings.max_retarget_factor;
  consensus.nBlockReward = settings.block_reward;

  // Normalize allocations so the genesis commitment is independent of
  // how the operator spelled the addresses
  CAmount total = 0;
  for (auto &[address, amount] : settings.genesis_allocations) {
    auto canonical = crypto::NormalizeAddress(address);
    if (!canonical) {
      throw std::invalid_argument("invalid genesis allocation address: " +
                                  address);
    }
    if (amount <= 0 || !MoneyRange(amount) || !MoneyRange(total + amount)) {
      throw std::invalid_argument("invalid genesis allocation amount");
    }
    address = *canonical;
    total += amount;
    AccountInfo info = genesis_state.Get(address);
    info.balance += amount;
    genesis_state.Set(address, info);
  }

  genesis = CreateGenesisBlock(nGenesisTime, pow_bits,
                               settings.genesis_allocations);
  consensus.hashGenesisBlock = genesis.GetHash();
  pow_hasher = crypto::CreatePowHasher(consensus.powAlgorithm,
                                       consensus.nRandomXEpochDuration);
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams(const ChainSettings &s) {
  chainType = ChainType::MAIN;
  settings = s;
  consensus.powAlgorithm = crypto::PowAlgorithm::RANDOMX;
  consensus.nRandomXEpochDuration = 7 * 24 * 60 * 60; // 1 week
  consensus.fPowNoRetargeting = s.pow_no_retargeting.value_or(false);
  // 0.000001 coin minimum, 0.00001 coin fee, 10 transactions a minute
  policy.nMinTxAmount = COIN / 1'000'000;
  policy.nMaxTxAmount = 100'000'000 * COIN;
  policy.nMinTxFee = COIN / 100'000;
  policy.nRateLimitMaxTxs = 10;

  Finish(1760292878, 0x1f0fffff);
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams(const ChainSettings &s) {
  chainType = ChainType::TESTNET;
  settings = s;
  consensus.powAlgorithm = crypto::PowAlgorithm::RANDOMX;
  consensus.nRandomXEpochDuration = 7 * 24 * 60 * 60;
  consensus.fPowNoRetargeting = s.pow_no_retargeting.value_or(false);
  policy.nMinTxAmount = COIN / 1'000'000;
  policy.nMaxTxAmount = 100'000'000 * COIN;
  policy.nMinTxFee = COIN / 100'000;
  policy.nRateLimitMaxTxs = 10;

  Finish(1760549555, 0x1f7fffff);
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams(const ChainSettings &s) {
  chainType = ChainType::REGTEST;
  settings = s;
  consensus.powAlgorithm = crypto::PowAlgorithm::SHA256D;
  consensus.fPowNoRetargeting = s.pow_no_retargeting.value_or(true);
  // MempoolPolicy defaults: any positive amount, no fee, no rate limit

  Finish(1296688602, 0x207fffff);
}

} // namespace chain
} // namespace lunachain
