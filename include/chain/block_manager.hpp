// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CHAIN_BLOCK_MANAGER_HPP
#define LUNACHAIN_CHAIN_BLOCK_MANAGER_HPP

#include "chain/account_state.hpp"
#include "chain/block_index.hpp"
#include "chain/chain.hpp"
#include "primitives/block.hpp"
#include <map>
#include <memory>
#include <vector>

namespace lunachain {
namespace chain {

// Heights at which a full account-state snapshot is kept
static constexpr int STATE_SNAPSHOT_INTERVAL = 16;

// BlockManager - arena of every accepted block plus the active chain
//
// Holds, per block hash: the CBlockIndex, the full block, its undo record
// and (every STATE_SNAPSHOT_INTERVAL heights) the account state after the
// block. Children are indexed by parent hash; CBlockIndex itself only links
// to its parent.
//
// THREAD SAFETY: NO internal mutex - caller MUST hold
// ChainstateManager::validation_mutex_. BlockManager is a private member of
// ChainstateManager; all access goes through ChainstateManager.
class BlockManager {
public:
  BlockManager();
  ~BlockManager();

  // Moving keeps every CBlockIndex at its address (map nodes are stolen)
  BlockManager(BlockManager &&) noexcept;
  BlockManager &operator=(BlockManager &&) noexcept;
  BlockManager(const BlockManager &) = delete;
  BlockManager &operator=(const BlockManager &) = delete;

  bool Initialize(const CBlock &genesis, const AccountState &genesis_state);
  bool IsInitialized() const { return m_initialized; }

  // nullptr if not found
  CBlockIndex *LookupBlockIndex(const uint256 &hash);
  const CBlockIndex *LookupBlockIndex(const uint256 &hash) const;

  // Create the index entry (or return the existing one). Sets parent,
  // height, chain work and the skip pointer. The parent must already exist
  // unless header is the genesis block.
  CBlockIndex *AddToBlockIndex(const CBlockHeader &header);

  // Drop an index entry that has no children (used when a block fails
  // before it is ever exposed)
  void RemoveBlockIndex(const uint256 &hash);

  void StoreBlock(const CBlockIndex &index, std::shared_ptr<const CBlock> block);
  std::shared_ptr<const CBlock> GetBlock(const uint256 &hash) const;

  void StoreUndo(const CBlockIndex &index, BlockUndo undo);
  const BlockUndo *GetUndo(const uint256 &hash) const;

  // Keeps a snapshot only for genesis and heights on the snapshot interval
  void MaybeStoreSnapshot(const CBlockIndex &index,
                          std::shared_ptr<const AccountState> state);

  /**
   * Nearest ancestor of pindex (inclusive) with a stored snapshot.
   * Returns nullptr only if the block is not connected to genesis.
   */
  const CBlockIndex *
  FindSnapshotAncestor(const CBlockIndex *pindex,
                       std::shared_ptr<const AccountState> &snapshot) const;

  std::vector<CBlockIndex *> GetChildren(const uint256 &hash) const;
  bool HasChildren(const uint256 &hash) const;

  CChain &ActiveChain() { return m_active_chain; }
  const CChain &ActiveChain() const { return m_active_chain; }

  CBlockIndex *GetTip() { return m_active_chain.Tip(); }
  const CBlockIndex *GetTip() const { return m_active_chain.Tip(); }

  void SetActiveTip(CBlockIndex &block) { m_active_chain.SetTip(block); }

  size_t GetBlockCount() const { return m_block_index.size(); }

  const std::map<uint256, CBlockIndex> &GetBlockIndex() const {
    return m_block_index;
  }

  const uint256 &GetGenesisHash() const { return m_genesis_hash; }

private:
  // hash -> CBlockIndex (map owns CBlockIndex objects, keys are what
  // phashBlock points to)
  std::map<uint256, CBlockIndex> m_block_index;

  std::map<uint256, std::shared_ptr<const CBlock>> m_blocks;
  std::map<uint256, BlockUndo> m_undo;
  std::map<uint256, std::shared_ptr<const AccountState>> m_snapshots;

  // parent hash -> children
  std::multimap<uint256, CBlockIndex *> m_children;

  CChain m_active_chain;

  uint256 m_genesis_hash;
  bool m_initialized{false};
};

} // namespace chain
} // namespace lunachain

#endif // LUNACHAIN_CHAIN_BLOCK_MANAGER_HPP
