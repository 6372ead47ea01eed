// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "validation/chainstate_manager.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "consensus/pow.hpp"
#include "consensus/tx_verification.hpp"
#include "crypto/sha256.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <mutex>
#include <optional>
#include <set>
#include <nlohmann/json.hpp>

namespace lunachain {
namespace validation {

// Bumped whenever the export layout changes
static constexpr int STATE_EXPORT_VERSION = 1;

ChainstateManager::ChainstateManager(const chain::ChainParams &params,
                                     size_t verify_threads)
    : params_(params), verify_pool_(verify_threads) {}

ChainstateManager::~ChainstateManager() = default;

bool ChainstateManager::Initialize() {
  std::unique_lock<std::shared_mutex> lock(validation_mutex_);

  if (block_manager_.IsInitialized()) {
    LOG_CHAIN_ERROR("ChainstateManager already initialized");
    return false;
  }
  if (!ResetToGenesisLocked()) {
    return false;
  }

  LOG_CHAIN_INFO("Initialized {} chain at genesis {} ({} funded accounts)",
                 params_.GetChainTypeString(),
                 block_manager_.GetGenesisHash().ToString().substr(0, 16),
                 m_active_state->Size());
  return true;
}

bool ChainstateManager::ResetToGenesisLocked() {
  block_manager_ = chain::BlockManager();
  chain_selector_.ClearCandidates();
  m_failed_blocks.clear();
  m_invalidated.clear();
  m_confirmed_txs.clear();
  m_orphan_blocks.clear();
  m_peer_orphan_count.clear();

  if (!block_manager_.Initialize(params_.GenesisBlock(),
                                 params_.GenesisState())) {
    LOG_CHAIN_ERROR("Failed to initialize block manager with genesis");
    return false;
  }
  m_active_state =
      std::make_shared<const chain::AccountState>(params_.GenesisState());
  chain_selector_.AddCandidateUnchecked(block_manager_.GetTip());
  m_tip_version.fetch_add(1, std::memory_order_acq_rel);
  return true;
}

bool ChainstateManager::ProcessNewBlock(const CBlock &block,
                                        BlockValidationState &state,
                                        int peer_id, bool *new_tip) {
  if (new_tip) {
    *new_tip = false;
  }
  auto pblock = std::make_shared<const CBlock>(block);

  std::unique_lock<std::shared_mutex> lock(validation_mutex_);

  if (!block_manager_.IsInitialized()) {
    return state.Error("not-initialized", "chainstate has no genesis");
  }

  const chain::CBlockIndex *old_tip = block_manager_.GetTip();
  bool accepted = AcceptBlockLocked(pblock, state, peer_id);

  if (block_manager_.GetTip() != old_tip) {
    NotifyTipChangeLocked(old_tip);
    if (new_tip) {
      *new_tip = true;
    }
  }
  return accepted;
}

bool ChainstateManager::AcceptBlockLocked(
    const std::shared_ptr<const CBlock> &pblock, BlockValidationState &state,
    int peer_id) {
  const CBlock &block = *pblock;
  const uint256 hash = block.GetHash();

  // Step 1: Already known?
  chain::CBlockIndex *pindex = block_manager_.LookupBlockIndex(hash);
  if (pindex) {
    if (pindex->nStatus & chain::BLOCK_FAILED_MASK) {
      LOG_CHAIN_DEBUG("Block {} is marked invalid",
                      hash.ToString().substr(0, 16));
      return state.Invalid(BlockValidationResult::BLOCK_CACHED_INVALID,
                           "duplicate-invalid", "block is marked invalid");
    }
    return true;
  }
  if (m_orphan_blocks.count(hash)) {
    return state.Invalid(BlockValidationResult::BLOCK_ORPHAN, "orphan",
                         "already held in the orphan pool");
  }

  // Step 2: Proof of work against the header's own bits. Failures leave no
  // trace, so a cheap invalid header cannot pollute the index.
  if (!CheckBlockHeaderWrapper(block, state)) {
    LOG_CHAIN_DEBUG("Block {} failed PoW check: {}",
                    hash.ToString().substr(0, 16), state.ToString());
    return false;
  }

  // Step 3: Context-free structure
  if (!CheckBlock(block, params_, state)) {
    LOG_CHAIN_DEBUG("Block {} failed structural check: {}",
                    hash.ToString().substr(0, 16), state.ToString());
    // A body that does not match its header commitment says nothing about
    // the header itself
    if (state.GetRejectReason() != "bad-txnmrklroot" &&
        state.GetRejectReason() != "bad-txns-duplicate") {
      MarkBlockFailedLocked(block);
    }
    return false;
  }

  // Step 4: Parent must be known, otherwise hold as orphan
  chain::CBlockIndex *pindexPrev =
      block_manager_.LookupBlockIndex(block.hashPrevBlock);
  if (!pindexPrev) {
    if (TryAddOrphanBlockLocked(pblock, peer_id)) {
      LOG_CHAIN_DEBUG("Cached orphan block: hash={}, parent={}, peer={}",
                      hash.ToString().substr(0, 16),
                      block.hashPrevBlock.ToString().substr(0, 16), peer_id);
      return state.Invalid(BlockValidationResult::BLOCK_ORPHAN, "orphan",
                           "parent " + block.hashPrevBlock.ToString() +
                               " not found");
    }
    LOG_CHAIN_WARN("Failed to cache orphan block {} (limit exceeded)",
                   hash.ToString().substr(0, 16));
    return state.Invalid(BlockValidationResult::BLOCK_ORPHAN, "orphan-limit",
                         "orphan pool full or peer limit exceeded");
  }

  // Step 5: Parent already failed
  if (pindexPrev->nStatus & chain::BLOCK_FAILED_MASK) {
    pindex = block_manager_.AddToBlockIndex(block);
    if (pindex) {
      pindex->nStatus |= chain::BLOCK_FAILED_CHILD;
    }
    LOG_CHAIN_DEBUG("Block {} builds on invalid block {}",
                    hash.ToString().substr(0, 16),
                    block.hashPrevBlock.ToString().substr(0, 16));
    return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL, "bad-prevblk",
                         "previous block is invalid");
  }

  // Step 6: Height, required target and timestamps
  if (!ContextualCheckBlockWrapper(block, pindexPrev, GetAdjustedTime(),
                                   state)) {
    LOG_CHAIN_DEBUG("Contextual check failed for block {}: {}",
                    hash.ToString().substr(0, 16), state.ToString());
    // Wrong target counts as failed PoW and a future timestamp may become
    // valid later; neither is recorded
    if (state.GetRejectReason() == "bad-height" ||
        state.GetRejectReason() == "time-too-old") {
      MarkBlockFailedLocked(block);
    }
    return false;
  }

  // Step 7: Index it, then validate transactions against the parent state
  pindex = block_manager_.AddToBlockIndex(block);
  if (!pindex) {
    return state.Error("index-failed", "failed to add block to index");
  }
  pindex->nTimeReceived = util::GetTime();
  pindex->RaiseValidity(chain::BLOCK_VALID_TREE);

  if (!ConnectBlockLocked(pindex, pblock, state)) {
    const int height = pindex->nHeight;
    if (state.IsInvalid()) {
      pindex->nStatus |= chain::BLOCK_FAILED_VALID;
      m_failed_blocks.insert(pindex);
    } else {
      // Local failure: forget the block so it can be retried. pindex is
      // dangling afterwards.
      block_manager_.RemoveBlockIndex(hash);
      pindex = nullptr;
    }
    LOG_CHAIN_INFO("Rejected block {} at height {}: {}",
                   hash.ToString().substr(0, 16), height, state.ToString());
    return false;
  }

  LOG_CHAIN_DEBUG("Accepted block: hash={}, height={}, txs={}",
                  hash.ToString().substr(0, 16), pindex->nHeight,
                  block.vtx.size());

  // Step 8: Fork choice
  chain_selector_.TryAddBlockIndexCandidate(pindex, block_manager_);
  if (!ActivateBestChainLocked()) {
    LOG_CHAIN_ERROR("ActivateBestChain failed after accepting {}",
                    hash.ToString().substr(0, 16));
  }

  // Step 9: Children that were waiting for this block
  ProcessOrphanBlocksLocked(hash);
  return true;
}

bool ChainstateManager::ConnectBlockLocked(
    chain::CBlockIndex *pindex, const std::shared_ptr<const CBlock> &pblock,
    BlockValidationState &state) {
  const CBlock &block = *pblock;

  std::shared_ptr<const chain::AccountState> parent_state =
      GetParentStateWrapper(pindex->pprev);
  if (!parent_state) {
    LOG_CHAIN_ERROR("No account state for parent of {}",
                    pindex->GetBlockHash().ToString());
    return state.Error("missing-parent-state",
                       "cannot reconstruct the parent account state");
  }

  // Signatures are independent of each other and of the state
  if (!block.vtx.empty()) {
    std::vector<std::function<bool()>> checks;
    checks.reserve(block.vtx.size());
    for (const CTransactionRef &tx : block.vtx) {
      checks.emplace_back([tx]() {
        TxValidationState tx_state;
        return consensus::CheckTransactionSignature(*tx, tx_state);
      });
    }
    std::optional<size_t> failed = verify_pool_.RunChecks(checks);
    if (failed) {
      const CTransaction &bad = *block.vtx[*failed];
      TxValidationState tx_state;
      consensus::CheckTransactionSignature(bad, tx_state);
      return state.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                           "bad-txns-invalid",
                           "tx " + bad.GetHash().ToString() + ": " +
                               tx_state.GetRejectReason());
    }
  }

  chain::AccountState new_state = *parent_state;
  chain::BlockUndo undo;
  if (!consensus::ConnectBlockTransactions(block, params_.GetConsensus(),
                                           new_state, &undo, state,
                                           /*check_signatures=*/false)) {
    return false;
  }

  pindex->nTx = static_cast<uint32_t>(block.vtx.size());
  block_manager_.StoreBlock(*pindex, pblock);
  block_manager_.StoreUndo(*pindex, std::move(undo));
  block_manager_.MaybeStoreSnapshot(
      *pindex, std::make_shared<const chain::AccountState>(std::move(new_state)));
  pindex->RaiseValidity(chain::BLOCK_VALID_TRANSACTIONS);
  return true;
}

std::shared_ptr<const chain::AccountState>
ChainstateManager::GetStateAtLocked(const chain::CBlockIndex *pindex) const {
  if (!pindex) {
    return nullptr;
  }
  if (pindex == block_manager_.GetTip()) {
    return m_active_state;
  }

  std::shared_ptr<const chain::AccountState> snapshot;
  const chain::CBlockIndex *base =
      block_manager_.FindSnapshotAncestor(pindex, snapshot);
  if (!base) {
    return nullptr;
  }
  if (base == pindex) {
    return snapshot;
  }

  std::vector<const chain::CBlockIndex *> path;
  for (const chain::CBlockIndex *walk = pindex; walk != base;
       walk = walk->pprev) {
    path.push_back(walk);
  }

  // Blocks on the path were validated when accepted; replay without
  // re-checking signatures
  auto state = std::make_shared<chain::AccountState>(*snapshot);
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    std::shared_ptr<const CBlock> block =
        block_manager_.GetBlock((*it)->GetBlockHash());
    if (!block) {
      LOG_CHAIN_ERROR("Replay: block {} has no stored data",
                      (*it)->GetBlockHash().ToString());
      return nullptr;
    }
    BlockValidationState replay_state;
    if (!consensus::ConnectBlockTransactions(*block, params_.GetConsensus(),
                                             *state, nullptr, replay_state,
                                             /*check_signatures=*/false)) {
      LOG_CHAIN_ERROR("Replay of stored block {} failed: {}",
                      (*it)->GetBlockHash().ToString(),
                      replay_state.ToString());
      return nullptr;
    }
  }
  return state;
}

bool ChainstateManager::ActivateBestChainLocked() {
  while (true) {
    chain::CBlockIndex *pindexMostWork = chain_selector_.FindMostWorkChain();
    chain::CBlockIndex *pindexOldTip = block_manager_.GetTip();

    if (!pindexMostWork || !IsBetterTip(pindexMostWork, pindexOldTip)) {
      // Current tip is still the best chain
      return true;
    }

    const chain::CBlockIndex *pindexFork =
        chain::LastCommonAncestor(pindexOldTip, pindexMostWork);
    if (!pindexFork) {
      LOG_CHAIN_ERROR("ActivateBestChain: no common ancestor between {} and {}",
                      pindexOldTip->GetBlockHash().ToString().substr(0, 16),
                      pindexMostWork->GetBlockHash().ToString().substr(0, 16));
      return false;
    }

    // Disconnect blocks from old tip back to fork point
    std::vector<chain::CBlockIndex *> disconnected_blocks;
    while (block_manager_.GetTip() != pindexFork) {
      disconnected_blocks.push_back(block_manager_.GetTip());
      if (!DisconnectTipLocked()) {
        LOG_CHAIN_ERROR("Failed to disconnect block during reorg");
        return false;
      }
    }

    // Connect blocks from fork point to new tip
    std::vector<chain::CBlockIndex *> connect_blocks;
    for (chain::CBlockIndex *walk = pindexMostWork; walk != pindexFork;
         walk = walk->pprev) {
      connect_blocks.push_back(walk);
    }

    bool connect_failed = false;
    for (auto it = connect_blocks.rbegin(); it != connect_blocks.rend(); ++it) {
      if (ConnectTipLocked(*it)) {
        continue;
      }

      LOG_CHAIN_ERROR("Failed to connect block {} at height {}",
                      (*it)->GetBlockHash().ToString().substr(0, 16),
                      (*it)->nHeight);
      (*it)->nStatus |= chain::BLOCK_FAILED_VALID;
      m_failed_blocks.insert(*it);
      MarkDescendantsFailedLocked(*it);

      // Roll back to the old tip
      while (block_manager_.GetTip() != pindexFork) {
        if (!DisconnectTipLocked()) {
          LOG_CHAIN_ERROR("CRITICAL: Rollback failed! Chain state may be "
                          "inconsistent!");
          return false;
        }
      }
      for (auto rit = disconnected_blocks.rbegin();
           rit != disconnected_blocks.rend(); ++rit) {
        if (!ConnectTipLocked(*rit)) {
          LOG_CHAIN_ERROR("CRITICAL: Failed to restore old chain!");
          return false;
        }
      }
      LOG_CHAIN_WARN("Rolled back to old tip at height {}",
                     block_manager_.GetTip()->nHeight);
      connect_failed = true;
      break;
    }

    if (connect_failed) {
      // Try the next best candidate
      RebuildCandidatesLocked();
      continue;
    }

    if (!disconnected_blocks.empty()) {
      LOG_CHAIN_WARN("REORGANIZE: Disconnect {} blocks; Connect {} blocks",
                     disconnected_blocks.size(), connect_blocks.size());
      LOG_CHAIN_INFO("REORGANIZE: Old tip: height={}, hash={}",
                     pindexOldTip->nHeight,
                     pindexOldTip->GetBlockHash().ToString().substr(0, 16));
      LOG_CHAIN_INFO("REORGANIZE: Fork point: height={}, hash={}",
                     pindexFork->nHeight,
                     pindexFork->GetBlockHash().ToString().substr(0, 16));
    }
    LOG_CHAIN_INFO("New best chain activated! Height: {}, Hash: {}",
                   pindexMostWork->nHeight,
                   pindexMostWork->GetBlockHash().ToString().substr(0, 16));

    chain_selector_.PruneBlockIndexCandidates(block_manager_);
    return true;
  }
}

bool ChainstateManager::ConnectTipLocked(chain::CBlockIndex *pindexNew) {
  const uint256 &hash = pindexNew->GetBlockHash();
  if (pindexNew->pprev != block_manager_.GetTip()) {
    LOG_CHAIN_ERROR("ConnectTip: {} does not extend the tip",
                    hash.ToString().substr(0, 16));
    return false;
  }

  std::shared_ptr<const CBlock> block = block_manager_.GetBlock(hash);
  if (!block) {
    LOG_CHAIN_ERROR("ConnectTip: no data for block {}", hash.ToString());
    return false;
  }

  auto new_state = std::make_shared<chain::AccountState>(*m_active_state);
  BlockValidationState state;
  if (!consensus::ConnectBlockTransactions(*block, params_.GetConsensus(),
                                           *new_state, nullptr, state,
                                           /*check_signatures=*/false)) {
    LOG_CHAIN_ERROR("ConnectTip: block {} no longer applies: {}",
                    hash.ToString().substr(0, 16), state.ToString());
    return false;
  }

  m_active_state = std::move(new_state);
  for (const CTransactionRef &tx : block->vtx) {
    m_confirmed_txs.insert(tx->GetHash());
  }
  block_manager_.SetActiveTip(*pindexNew);
  m_tip_version.fetch_add(1, std::memory_order_acq_rel);

  LOG_CHAIN_DEBUG("ConnectTip: height={}, hash={}", pindexNew->nHeight,
                  hash.ToString().substr(0, 16));

  notifications_.NotifyBlockConnected(*block, pindexNew);
  return true;
}

bool ChainstateManager::DisconnectTipLocked() {
  chain::CBlockIndex *pindexDelete = block_manager_.GetTip();
  if (!pindexDelete) {
    LOG_CHAIN_ERROR("DisconnectTip: no tip to disconnect");
    return false;
  }
  if (!pindexDelete->pprev) {
    LOG_CHAIN_ERROR("DisconnectTip: cannot disconnect genesis block");
    return false;
  }

  const uint256 &hash = pindexDelete->GetBlockHash();
  const chain::BlockUndo *undo = block_manager_.GetUndo(hash);
  std::shared_ptr<const CBlock> block = block_manager_.GetBlock(hash);
  if (!undo || !block) {
    LOG_CHAIN_ERROR("DisconnectTip: no undo data for block {}",
                    hash.ToString());
    return false;
  }

  auto new_state = std::make_shared<chain::AccountState>(*m_active_state);
  chain::UndoBlock(*new_state, *undo);
  m_active_state = std::move(new_state);

  for (const CTransactionRef &tx : block->vtx) {
    m_confirmed_txs.erase(tx->GetHash());
  }
  block_manager_.SetActiveTip(*pindexDelete->pprev);
  m_tip_version.fetch_add(1, std::memory_order_acq_rel);

  LOG_CHAIN_DEBUG("DisconnectTip: height={}, hash={}", pindexDelete->nHeight,
                  hash.ToString().substr(0, 16));
  return true;
}

void ChainstateManager::NotifyTipChangeLocked(
    const chain::CBlockIndex *old_tip) {
  const chain::CBlockIndex *new_tip = block_manager_.GetTip();
  const chain::CBlockIndex *fork = chain::LastCommonAncestor(old_tip, new_tip);

  TipUpdate update;
  update.new_tip = new_tip;
  update.state = m_active_state.get();
  update.tip_version = GetTipVersion();

  for (const chain::CBlockIndex *walk = old_tip; walk && walk != fork;
       walk = walk->pprev) {
    if (auto block = block_manager_.GetBlock(walk->GetBlockHash())) {
      update.disconnected.push_back(std::move(block));
    }
  }
  for (const chain::CBlockIndex *walk = new_tip; walk && walk != fork;
       walk = walk->pprev) {
    if (auto block = block_manager_.GetBlock(walk->GetBlockHash())) {
      update.connected.push_back(std::move(block));
    }
  }
  std::reverse(update.connected.begin(), update.connected.end());

  notifications_.NotifyTipUpdate(update);
}

void ChainstateManager::MarkBlockFailedLocked(const CBlockHeader &header) {
  if (!block_manager_.LookupBlockIndex(header.hashPrevBlock)) {
    return;
  }
  chain::CBlockIndex *pindex = block_manager_.AddToBlockIndex(header);
  if (!pindex) {
    return;
  }
  pindex->nStatus |= chain::BLOCK_FAILED_VALID;
  m_failed_blocks.insert(pindex);
}

void ChainstateManager::MarkDescendantsFailedLocked(chain::CBlockIndex *pindex) {
  std::vector<chain::CBlockIndex *> queue =
      block_manager_.GetChildren(pindex->GetBlockHash());
  while (!queue.empty()) {
    chain::CBlockIndex *child = queue.back();
    queue.pop_back();
    child->nStatus |= chain::BLOCK_FAILED_CHILD;
    chain_selector_.RemoveCandidate(child);
    for (chain::CBlockIndex *grandchild :
         block_manager_.GetChildren(child->GetBlockHash())) {
      queue.push_back(grandchild);
    }
  }
}

void ChainstateManager::RebuildCandidatesLocked() {
  chain_selector_.ClearCandidates();
  for (const auto &[hash, block] : block_manager_.GetBlockIndex()) {
    chain::CBlockIndex *pindex = block_manager_.LookupBlockIndex(hash);
    chain_selector_.TryAddBlockIndexCandidate(pindex, block_manager_);
  }
  // The tip itself stays selectable even if it has valid children
  if (chain::CBlockIndex *tip = block_manager_.GetTip()) {
    if (tip->IsValid(chain::BLOCK_VALID_TRANSACTIONS)) {
      chain_selector_.AddCandidateUnchecked(tip);
    }
  }
}

// ============================================================================
// Orphan pool
// ============================================================================

void ChainstateManager::ProcessOrphanBlocksLocked(const uint256 &parent_hash) {
  std::vector<uint256> orphansToProcess;
  for (const auto &[hash, orphan] : m_orphan_blocks) {
    if (orphan.block->hashPrevBlock == parent_hash) {
      orphansToProcess.push_back(hash);
    }
  }

  if (orphansToProcess.empty()) {
    return;
  }

  LOG_CHAIN_DEBUG("Processing {} orphan blocks that were waiting for parent {}",
                  orphansToProcess.size(), parent_hash.ToString().substr(0, 16));

  for (const uint256 &hash : orphansToProcess) {
    auto it = m_orphan_blocks.find(hash);
    if (it == m_orphan_blocks.end()) {
      continue;
    }

    // Take ownership before erasing so the block outlives the pool entry
    std::shared_ptr<const CBlock> orphan = it->second.block;
    int orphan_peer_id = it->second.peer_id;
    EraseOrphanLocked(it);

    BlockValidationState orphan_state;
    if (AcceptBlockLocked(orphan, orphan_state, orphan_peer_id)) {
      LOG_CHAIN_DEBUG("Connected orphan block {}", hash.ToString().substr(0, 16));
    } else {
      LOG_CHAIN_DEBUG("Orphan block {} failed validation: {}",
                      hash.ToString().substr(0, 16), orphan_state.ToString());
    }
  }
}

bool ChainstateManager::TryAddOrphanBlockLocked(
    const std::shared_ptr<const CBlock> &block, int peer_id) {
  const auto &settings = params_.GetSettings();
  const uint256 hash = block->GetHash();

  if (m_orphan_blocks.count(hash)) {
    return true;
  }

  // DoS Protection 1: per-peer limit
  auto peer_it = m_peer_orphan_count.find(peer_id);
  int peer_orphan_count =
      peer_it == m_peer_orphan_count.end() ? 0 : peer_it->second;
  if (peer_orphan_count >= static_cast<int>(settings.max_orphan_blocks_per_peer)) {
    LOG_CHAIN_WARN("Peer {} exceeded orphan limit ({}/{}), rejecting orphan {}",
                   peer_id, peer_orphan_count,
                   settings.max_orphan_blocks_per_peer,
                   hash.ToString().substr(0, 16));
    return false;
  }

  // DoS Protection 2: total limit
  if (m_orphan_blocks.size() >= settings.max_orphan_blocks) {
    if (EvictOrphanBlocksLocked() == 0) {
      LOG_CHAIN_ERROR("Failed to evict any orphans, pool stuck at max size");
      return false;
    }
  }

  m_orphan_blocks[hash] = OrphanBlock{block, util::GetTime(), peer_id};
  m_peer_orphan_count[peer_id]++;

  LOG_CHAIN_DEBUG("Added orphan block to pool: hash={}, peer={}, pool_size={}",
                  hash.ToString().substr(0, 16), peer_id,
                  m_orphan_blocks.size());
  return true;
}

std::map<uint256, ChainstateManager::OrphanBlock>::iterator
ChainstateManager::EraseOrphanLocked(
    std::map<uint256, OrphanBlock>::iterator it) {
  auto peer_it = m_peer_orphan_count.find(it->second.peer_id);
  if (peer_it != m_peer_orphan_count.end()) {
    peer_it->second--;
    if (peer_it->second <= 0) {
      m_peer_orphan_count.erase(peer_it);
    }
  }
  return m_orphan_blocks.erase(it);
}

size_t ChainstateManager::EvictOrphanBlocks() {
  std::unique_lock<std::shared_mutex> lock(validation_mutex_);
  return EvictOrphanBlocksLocked();
}

size_t ChainstateManager::EvictOrphanBlocksLocked() {
  if (m_orphan_blocks.empty()) {
    return 0;
  }

  const auto &settings = params_.GetSettings();
  const int64_t now = util::GetTime();
  size_t evicted = 0;

  // Strategy 1: expired orphans
  for (auto it = m_orphan_blocks.begin(); it != m_orphan_blocks.end();) {
    if (now - it->second.nTimeReceived > settings.orphan_expire_seconds) {
      LOG_CHAIN_DEBUG("Evicting expired orphan block: hash={}, age={}s",
                      it->first.ToString().substr(0, 16),
                      now - it->second.nTimeReceived);
      it = EraseOrphanLocked(it);
      evicted++;
    } else {
      ++it;
    }
  }

  // Strategy 2: still full, evict the oldest
  if (evicted == 0 && m_orphan_blocks.size() >= settings.max_orphan_blocks) {
    auto oldest = m_orphan_blocks.begin();
    for (auto it = m_orphan_blocks.begin(); it != m_orphan_blocks.end(); ++it) {
      if (it->second.nTimeReceived < oldest->second.nTimeReceived) {
        oldest = it;
      }
    }
    LOG_CHAIN_DEBUG("Evicting oldest orphan block: hash={}",
                    oldest->first.ToString().substr(0, 16));
    EraseOrphanLocked(oldest);
    evicted++;
  }

  if (evicted > 0) {
    LOG_CHAIN_INFO("Evicted {} orphan blocks (pool size now: {})", evicted,
                   m_orphan_blocks.size());
  }
  return evicted;
}

size_t ChainstateManager::GetOrphanBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return m_orphan_blocks.size();
}

// ============================================================================
// Read API
// ============================================================================

const chain::CBlockIndex *ChainstateManager::GetTip() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetTip();
}

int ChainstateManager::GetChainHeight() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.ActiveChain().Height();
}

size_t ChainstateManager::GetBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetBlockCount();
}

chain::AccountInfo
ChainstateManager::GetBalance(const std::string &address) const {
  std::shared_ptr<const chain::AccountState> state = GetAccountStateSnapshot();
  if (!state) {
    return {};
  }
  return state->Get(address);
}

std::shared_ptr<const chain::AccountState>
ChainstateManager::GetAccountStateSnapshot(uint64_t *tip_version) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  if (tip_version) {
    *tip_version = GetTipVersion();
  }
  return m_active_state;
}

MiningSnapshot ChainstateManager::GetMiningSnapshot() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  MiningSnapshot snapshot;
  const chain::CBlockIndex *tip = block_manager_.GetTip();
  if (!tip) {
    return snapshot;
  }
  snapshot.prev_hash = tip->GetBlockHash();
  snapshot.height = tip->nHeight + 1;
  snapshot.nBits = consensus::GetNextWorkRequired(tip, params_);
  snapshot.median_time_past = tip->GetMedianTimePast();
  snapshot.state = m_active_state;
  snapshot.tip_version = GetTipVersion();
  return snapshot;
}

BlockState ChainstateManager::GetBlockState(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  if (m_orphan_blocks.count(hash)) {
    return BlockState::Orphan;
  }
  const chain::CBlockIndex *pindex = block_manager_.LookupBlockIndex(hash);
  if (!pindex) {
    return BlockState::Unknown;
  }
  if (pindex->nStatus & chain::BLOCK_FAILED_MASK) {
    return BlockState::Rejected;
  }
  if (block_manager_.ActiveChain().Contains(pindex)) {
    return BlockState::Canonical;
  }
  return BlockState::SideBranch;
}

std::shared_ptr<const CBlock>
ChainstateManager::GetBlock(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.GetBlock(hash);
}

const chain::CBlockIndex *
ChainstateManager::LookupBlockIndex(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return block_manager_.LookupBlockIndex(hash);
}

bool ChainstateManager::IsOnActiveChain(const chain::CBlockIndex *pindex) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return pindex && block_manager_.ActiveChain().Contains(pindex);
}

bool ChainstateManager::IsTransactionConfirmed(const uint256 &txid) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return m_confirmed_txs.count(txid) > 0;
}

// ============================================================================
// Operator API
// ============================================================================

bool ChainstateManager::InvalidateBlock(const uint256 &hash) {
  std::unique_lock<std::shared_mutex> lock(validation_mutex_);

  chain::CBlockIndex *pindex = block_manager_.LookupBlockIndex(hash);
  if (!pindex) {
    LOG_CHAIN_ERROR("InvalidateBlock: block {} not found", hash.ToString());
    return false;
  }

  const chain::CBlockIndex *old_tip = block_manager_.GetTip();
  if (!InvalidateBlockLocked(pindex)) {
    return false;
  }
  if (block_manager_.GetTip() != old_tip) {
    NotifyTipChangeLocked(old_tip);
  }
  return true;
}

bool ChainstateManager::InvalidateBlockLocked(chain::CBlockIndex *pindex) {
  if (!pindex->pprev) {
    LOG_CHAIN_ERROR("InvalidateBlock: cannot invalidate the genesis block");
    return false;
  }

  LOG_CHAIN_INFO("Invalidating block {} at height {}",
                 pindex->GetBlockHash().ToString(), pindex->nHeight);

  pindex->nStatus |= chain::BLOCK_FAILED_VALID;
  m_failed_blocks.insert(pindex);
  m_invalidated.insert(pindex->GetBlockHash());
  MarkDescendantsFailedLocked(pindex);

  // Move the tip off the invalidated branch first; the replacement may have
  // less work than the old tip
  if (block_manager_.ActiveChain().Contains(pindex)) {
    while (block_manager_.GetTip() != pindex->pprev) {
      if (!DisconnectTipLocked()) {
        LOG_CHAIN_ERROR("InvalidateBlock: failed to disconnect");
        return false;
      }
    }
  }

  RebuildCandidatesLocked();
  return ActivateBestChainLocked();
}

// ============================================================================
// Persistence
// ============================================================================

std::string ChainstateManager::ExportState() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return ExportStateLocked();
}

std::string ChainstateManager::ExportStateLocked() const {
  std::vector<const chain::CBlockIndex *> indexes;
  for (const auto &[hash, index] : block_manager_.GetBlockIndex()) {
    if (index.pprev && block_manager_.GetBlock(hash)) {
      indexes.push_back(&index);
    }
  }
  // Parents before children, ties by hash
  std::sort(indexes.begin(), indexes.end(),
            [](const chain::CBlockIndex *a, const chain::CBlockIndex *b) {
              if (a->nHeight != b->nHeight) {
                return a->nHeight < b->nHeight;
              }
              return a->GetBlockHash() < b->GetBlockHash();
            });

  nlohmann::json blocks = nlohmann::json::array();
  for (const chain::CBlockIndex *index : indexes) {
    std::shared_ptr<const CBlock> block =
        block_manager_.GetBlock(index->GetBlockHash());
    blocks.push_back({{"hash", index->GetBlockHash().GetHex()},
                      {"data", util::HexStr(SerializeBlock(*block))}});
  }

  nlohmann::json invalidated = nlohmann::json::array();
  for (const uint256 &hash : m_invalidated) {
    invalidated.push_back(hash.GetHex());
  }

  const chain::CBlockIndex *tip = block_manager_.GetTip();

  nlohmann::json payload;
  payload["version"] = STATE_EXPORT_VERSION;
  payload["network"] = params_.GetChainTypeString();
  payload["genesis"] = block_manager_.GetGenesisHash().GetHex();
  payload["tip"] = tip ? tip->GetBlockHash().GetHex() : std::string();
  payload["blocks"] = std::move(blocks);
  payload["invalidated"] = std::move(invalidated);

  nlohmann::json doc;
  doc["checksum"] = crypto::SHA256(payload.dump()).GetHex();
  doc["payload"] = std::move(payload);
  return doc.dump();
}

bool ChainstateManager::ImportState(const std::string &blob,
                                    BlockValidationState &state) {
  std::vector<std::shared_ptr<const CBlock>> blocks;
  std::vector<uint256> invalidated;
  uint256 expected_tip;

  // Step 1: Parse and check everything that does not need validation
  try {
    const nlohmann::json doc = nlohmann::json::parse(blob);
    const nlohmann::json &payload = doc.at("payload");

    const std::string checksum = doc.at("checksum").get<std::string>();
    if (crypto::SHA256(payload.dump()).GetHex() != checksum) {
      LOG_CHAIN_ERROR("ImportState: checksum mismatch");
      return state.Error("corrupt-state", "checksum mismatch");
    }
    if (payload.at("version").get<int>() != STATE_EXPORT_VERSION) {
      LOG_CHAIN_ERROR("ImportState: unsupported version");
      return state.Error("corrupt-state", "unsupported export version");
    }
    if (payload.at("network").get<std::string>() !=
            params_.GetChainTypeString() ||
        uint256S(payload.at("genesis").get<std::string>()) !=
            params_.GetConsensus().hashGenesisBlock) {
      LOG_CHAIN_ERROR("ImportState: export belongs to another network");
      return state.Error("corrupt-state", "network or genesis mismatch");
    }

    std::set<uint256> known{params_.GetConsensus().hashGenesisBlock};
    for (const nlohmann::json &entry : payload.at("blocks")) {
      const uint256 hash = uint256S(entry.at("hash").get<std::string>());
      auto raw = util::TryParseHex(entry.at("data").get<std::string>());
      if (!raw) {
        return state.Error("corrupt-state", "block data is not hex");
      }
      auto block = std::make_shared<const CBlock>(DeserializeBlock(*raw));
      if (block->GetHash() != hash) {
        LOG_CHAIN_ERROR("ImportState: block hash mismatch for {}",
                        hash.ToString());
        return state.Error("corrupt-state",
                           "block hash mismatch: " + hash.ToString());
      }
      if (!known.count(block->hashPrevBlock)) {
        LOG_CHAIN_ERROR("ImportState: block {} has unknown parent",
                        hash.ToString());
        return state.Error("corrupt-state",
                           "broken parent link: " + hash.ToString());
      }
      known.insert(hash);
      blocks.push_back(std::move(block));
    }

    for (const nlohmann::json &entry : payload.at("invalidated")) {
      const uint256 hash = uint256S(entry.get<std::string>());
      if (!known.count(hash)) {
        return state.Error("corrupt-state", "invalidated block not exported");
      }
      invalidated.push_back(hash);
    }
    expected_tip = uint256S(payload.at("tip").get<std::string>());
  } catch (const std::exception &e) {
    // nlohmann::json::exception and std::ios_base::failure from the block
    // decoder
    LOG_CHAIN_ERROR("ImportState: malformed export: {}", e.what());
    return state.Error("corrupt-state", e.what());
  }

  // Step 2: Replay through full validation, keeping the current tree aside
  std::unique_lock<std::shared_mutex> lock(validation_mutex_);

  chain::BlockManager saved_block_manager = std::move(block_manager_);
  ChainSelector saved_selector = std::move(chain_selector_);
  auto saved_state = std::move(m_active_state);
  auto saved_confirmed = std::move(m_confirmed_txs);
  auto saved_orphans = std::move(m_orphan_blocks);
  auto saved_peer_orphans = std::move(m_peer_orphan_count);
  auto saved_failed = std::move(m_failed_blocks);
  auto saved_invalidated = std::move(m_invalidated);

  std::string failure;
  if (!ResetToGenesisLocked()) {
    failure = "cannot initialize genesis";
  }
  for (const auto &block : blocks) {
    if (!failure.empty()) {
      break;
    }
    BlockValidationState block_state;
    if (!AcceptBlockLocked(block, block_state, -1)) {
      failure = "block " + block->GetHash().ToString() +
                " failed validation: " + block_state.ToString();
    }
  }
  for (const uint256 &hash : invalidated) {
    if (!failure.empty()) {
      break;
    }
    chain::CBlockIndex *pindex = block_manager_.LookupBlockIndex(hash);
    if (!pindex || !InvalidateBlockLocked(pindex)) {
      failure = "cannot re-apply invalidation of " + hash.ToString();
    }
  }
  if (failure.empty() &&
      (!block_manager_.GetTip() ||
       block_manager_.GetTip()->GetBlockHash() != expected_tip)) {
    failure = "replayed tip differs from exported tip";
  }

  if (!failure.empty()) {
    block_manager_ = std::move(saved_block_manager);
    chain_selector_ = std::move(saved_selector);
    m_active_state = std::move(saved_state);
    m_confirmed_txs = std::move(saved_confirmed);
    m_orphan_blocks = std::move(saved_orphans);
    m_peer_orphan_count = std::move(saved_peer_orphans);
    m_failed_blocks = std::move(saved_failed);
    m_invalidated = std::move(saved_invalidated);
    m_tip_version.fetch_add(1, std::memory_order_acq_rel);
    LOG_CHAIN_ERROR("ImportState: {}", failure);
    return state.Error("corrupt-state", failure);
  }

  LOG_CHAIN_INFO("Imported chain state: {} blocks, tip height {}",
                 block_manager_.GetBlockCount(),
                 block_manager_.ActiveChain().Height());

  // The previous index is gone; subscribers get the new tip and state
  TipUpdate update;
  update.new_tip = block_manager_.GetTip();
  update.state = m_active_state.get();
  update.tip_version = GetTipVersion();
  notifications_.NotifyTipUpdate(update);
  return true;
}

bool ChainstateManager::Save(const std::string &filepath) const {
  std::string blob = ExportState();
  if (!util::atomic_write_file(filepath, blob)) {
    LOG_CHAIN_ERROR("Failed to save chain state to {}", filepath);
    return false;
  }
  LOG_CHAIN_DEBUG("Saved chain state to {} ({} bytes)", filepath, blob.size());
  return true;
}

bool ChainstateManager::Load(const std::string &filepath) {
  std::optional<std::string> blob = util::read_file_string(filepath);
  if (!blob) {
    LOG_CHAIN_ERROR("Failed to read chain state from {}", filepath);
    return false;
  }
  BlockValidationState state;
  return ImportState(*blob, state);
}

// ============================================================================
// Test hooks
// ============================================================================

bool ChainstateManager::CheckBlockHeaderWrapper(
    const CBlockHeader &header, BlockValidationState &state) const {
  return CheckBlockHeader(header, params_, state);
}

bool ChainstateManager::ContextualCheckBlockWrapper(
    const CBlockHeader &header, const chain::CBlockIndex *pindexPrev,
    int64_t adjusted_time, BlockValidationState &state) const {
  return ContextualCheckBlock(header, pindexPrev, params_, adjusted_time,
                              state);
}

std::shared_ptr<const chain::AccountState>
ChainstateManager::GetParentStateWrapper(
    const chain::CBlockIndex *pindexPrev) const {
  return GetStateAtLocked(pindexPrev);
}

} // namespace validation
} // namespace lunachain
