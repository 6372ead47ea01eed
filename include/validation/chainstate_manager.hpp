// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP
#define LUNACHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP

#include "chain/account_state.hpp"
#include "chain/block_manager.hpp"
#include "notifications.hpp"
#include "primitives/block.hpp"
#include "util/threadpool.hpp"
#include "validation/chain_selector.hpp"
#include "validation/validation.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>

namespace lunachain {

namespace chain {
class ChainParams;
class CBlockIndex;
} // namespace chain

namespace validation {

// Where a block stands from this node's point of view
enum class BlockState {
  Unknown,    // never seen, or rejected before it was indexed
  Orphan,     // waiting in the orphan pool for its parent
  Rejected,   // indexed and marked failed (or descends from a failed block)
  Canonical,  // on the active chain
  SideBranch, // fully validated, not on the active chain
};

/**
 * Everything the block assembler needs, captured atomically under one
 * shared lock.
 */
struct MiningSnapshot {
  uint256 prev_hash;
  int height{0};           // height of the block to build
  uint32_t nBits{0};       // target required for that block
  int64_t median_time_past{0};
  std::shared_ptr<const chain::AccountState> state; // state at prev_hash
  uint64_t tip_version{0};
};

// ChainstateManager - owner of the block tree, the account state and
// fork choice
//
// Main entry point for adding blocks to the chain, whether mined locally
// or received from the network. Every accepted block is fully validated
// against the account state of its parent, so each candidate tip can be
// activated without further checks.
//
// THREAD SAFETY: one std::shared_mutex. Readers take it shared; integration
// (ProcessNewBlock, InvalidateBlock, ImportState, EvictOrphanBlocks) takes it
// exclusive. Private methods named *Locked assume it is held. The tip
// version counter is atomic and readable without the lock.
//
// Notifications are delivered while the exclusive lock is held; subscribers
// must not call back into this class.
class ChainstateManager {
public:
  // LIFETIME: ChainParams reference must outlive this ChainstateManager.
  // verify_threads sizes the signature-check pool (0 = hardware threads).
  explicit ChainstateManager(const chain::ChainParams &params,
                             size_t verify_threads = 0);
  virtual ~ChainstateManager();

  ChainstateManager(const ChainstateManager &) = delete;
  ChainstateManager &operator=(const ChainstateManager &) = delete;

  // Install the genesis block and its allocations as the active chain
  bool Initialize();

  /**
   * Validate a block and integrate it into the block tree.
   *
   * Returns true if the block was accepted now or earlier. On false, state
   * carries the classification: BLOCK_STRUCTURAL, BLOCK_INVALID_POW,
   * BLOCK_ORPHAN (held for later), BLOCK_DOUBLE_SPEND or
   * BLOCK_CACHED_INVALID.
   *
   * @param new_tip set to true if the active tip changed
   */
  bool ProcessNewBlock(const CBlock &block, BlockValidationState &state,
                       int peer_id = -1, bool *new_tip = nullptr);

  ChainNotifications &Notifications() { return notifications_; }
  const chain::ChainParams &GetParams() const { return params_; }

  // Read API

  const chain::CBlockIndex *GetTip() const;
  uint64_t GetTipVersion() const {
    return m_tip_version.load(std::memory_order_acquire);
  }
  int GetChainHeight() const;
  size_t GetBlockCount() const;

  // Confirmed (balance, nonce); (0, 0) for unknown addresses
  chain::AccountInfo GetBalance(const std::string &address) const;
  // tip_version, if given, receives the version the state belongs to
  std::shared_ptr<const chain::AccountState>
  GetAccountStateSnapshot(uint64_t *tip_version = nullptr) const;
  MiningSnapshot GetMiningSnapshot() const;

  BlockState GetBlockState(const uint256 &hash) const;
  std::shared_ptr<const CBlock> GetBlock(const uint256 &hash) const;
  const chain::CBlockIndex *LookupBlockIndex(const uint256 &hash) const;
  bool IsOnActiveChain(const chain::CBlockIndex *pindex) const;

  // True if a transaction with this hash is on the active chain
  bool IsTransactionConfirmed(const uint256 &txid) const;

  // Operator API

  // Drop expired orphans; if none expired and the pool is full, the oldest
  size_t EvictOrphanBlocks();
  size_t GetOrphanBlockCount() const;

  // Mark a block and its descendants invalid and move the tip off them
  bool InvalidateBlock(const uint256 &hash);

  // Persistence

  // Deterministic JSON: the same block tree always exports the same bytes
  std::string ExportState() const;

  /**
   * Replace the block tree with an exported one. The blob is checked
   * (checksum, network, hashes, parent links) and replayed through full
   * validation; on any failure nothing changes and state holds an Error().
   */
  bool ImportState(const std::string &blob, BlockValidationState &state);

  bool Save(const std::string &filepath) const;
  bool Load(const std::string &filepath);

protected:
  // Virtual methods for test mocking
  virtual bool CheckBlockHeaderWrapper(const CBlockHeader &header,
                                       BlockValidationState &state) const;
  virtual bool ContextualCheckBlockWrapper(const CBlockHeader &header,
                                           const chain::CBlockIndex *pindexPrev,
                                           int64_t adjusted_time,
                                           BlockValidationState &state) const;
  // Account state a new child of pindexPrev is validated against
  virtual std::shared_ptr<const chain::AccountState>
  GetParentStateWrapper(const chain::CBlockIndex *pindexPrev) const;

private:
  struct OrphanBlock {
    std::shared_ptr<const CBlock> block;
    int64_t nTimeReceived;
    int peer_id;
  };

  bool AcceptBlockLocked(const std::shared_ptr<const CBlock> &block,
                         BlockValidationState &state, int peer_id);

  // Validate transactions against the parent state and store the block
  bool ConnectBlockLocked(chain::CBlockIndex *pindex,
                          const std::shared_ptr<const CBlock> &block,
                          BlockValidationState &state);

  bool ActivateBestChainLocked();
  bool ConnectTipLocked(chain::CBlockIndex *pindexNew);
  bool DisconnectTipLocked();

  // Account state after pindex; replays from the nearest snapshot
  std::shared_ptr<const chain::AccountState>
  GetStateAtLocked(const chain::CBlockIndex *pindex) const;

  // Index header (if its parent is known) and mark it failed
  void MarkBlockFailedLocked(const CBlockHeader &header);
  void MarkDescendantsFailedLocked(chain::CBlockIndex *pindex);
  void RebuildCandidatesLocked();
  bool InvalidateBlockLocked(chain::CBlockIndex *pindex);

  void ProcessOrphanBlocksLocked(const uint256 &parent_hash);
  bool TryAddOrphanBlockLocked(const std::shared_ptr<const CBlock> &block,
                               int peer_id);
  size_t EvictOrphanBlocksLocked();
  std::map<uint256, OrphanBlock>::iterator
  EraseOrphanLocked(std::map<uint256, OrphanBlock>::iterator it);

  // Notify subscribers of the difference between old_tip and the current tip
  void NotifyTipChangeLocked(const chain::CBlockIndex *old_tip);

  std::string ExportStateLocked() const;
  bool ResetToGenesisLocked();

  const chain::ChainParams &params_;

  chain::BlockManager block_manager_;
  ChainSelector chain_selector_;

  std::shared_ptr<const chain::AccountState> m_active_state;
  std::set<uint256> m_confirmed_txs;

  // Blocks whose parent is unknown, keyed by block hash
  std::map<uint256, OrphanBlock> m_orphan_blocks;
  std::map<int, int> m_peer_orphan_count; // peer_id -> orphan count

  // Blocks marked BLOCK_FAILED_VALID (consensus failure or operator)
  std::set<chain::CBlockIndex *> m_failed_blocks;
  // Subset invalidated through InvalidateBlock; exported
  std::set<uint256> m_invalidated;

  std::atomic<uint64_t> m_tip_version{0};

  ChainNotifications notifications_;
  mutable util::ThreadPool verify_pool_;

  mutable std::shared_mutex validation_mutex_;
};

} // namespace validation
} // namespace lunachain

#endif // LUNACHAIN_VALIDATION_CHAINSTATE_MANAGER_HPP
