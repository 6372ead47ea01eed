// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/block_manager.hpp"
#include "util/logging.hpp"

namespace lunachain {
namespace chain {

BlockManager::BlockManager() = default;
BlockManager::~BlockManager() = default;
BlockManager::BlockManager(BlockManager &&) noexcept = default;
BlockManager &BlockManager::operator=(BlockManager &&) noexcept = default;

bool BlockManager::Initialize(const CBlock &genesis,
                              const AccountState &genesis_state) {
  LOG_CHAIN_TRACE("Initialize: called with genesis hash={}",
                  genesis.GetHash().ToString().substr(0, 16));

  if (m_initialized) {
    LOG_CHAIN_ERROR("BlockManager already initialized");
    return false;
  }

  CBlockIndex *pindex = AddToBlockIndex(genesis);
  if (!pindex) {
    LOG_CHAIN_ERROR("Failed to add genesis block");
    return false;
  }
  pindex->RaiseValidity(BLOCK_VALID_TRANSACTIONS);
  StoreBlock(*pindex, std::make_shared<const CBlock>(genesis));
  MaybeStoreSnapshot(*pindex, std::make_shared<const AccountState>(genesis_state));

  m_active_chain.SetTip(*pindex);
  m_genesis_hash = pindex->GetBlockHash();
  m_initialized = true;

  LOG_CHAIN_TRACE("BlockManager initialized with genesis: {}",
                  m_genesis_hash.ToString());
  return true;
}

CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

const CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) const {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

CBlockIndex *BlockManager::AddToBlockIndex(const CBlockHeader &header) {
  uint256 hash = header.GetHash();

  auto it = m_block_index.find(hash);
  if (it != m_block_index.end()) {
    return &it->second;
  }

  CBlockIndex *pprev = nullptr;
  if (!header.hashPrevBlock.IsNull()) {
    pprev = LookupBlockIndex(header.hashPrevBlock);
    if (!pprev) {
      LOG_CHAIN_ERROR("AddToBlockIndex: parent {} of {} unknown",
                      header.hashPrevBlock.ToString().substr(0, 16),
                      hash.ToString().substr(0, 16));
      return nullptr;
    }
  }

  auto [iter, inserted] = m_block_index.try_emplace(hash, header);
  CBlockIndex *pindex = &iter->second;
  pindex->phashBlock = &iter->first;
  pindex->pprev = pprev;

  // nHeight and nChainWork are set once here and never change: the
  // candidate set orders by them
  if (pprev) {
    pindex->nHeight = pprev->nHeight + 1;
    pindex->nChainWork = pprev->nChainWork + GetBlockProof(*pindex);
    m_children.emplace(pprev->GetBlockHash(), pindex);
  } else {
    pindex->nHeight = 0;
    pindex->nChainWork = GetBlockProof(*pindex);
  }
  pindex->BuildSkip();

  LOG_CHAIN_TRACE("AddToBlockIndex: hash={} height={}",
                  hash.ToString().substr(0, 16), pindex->nHeight);
  return pindex;
}

void BlockManager::RemoveBlockIndex(const uint256 &hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end() || HasChildren(hash)) {
    return;
  }
  CBlockIndex *pindex = &it->second;
  if (m_active_chain.Contains(pindex)) {
    return;
  }
  if (pindex->pprev) {
    auto range = m_children.equal_range(pindex->pprev->GetBlockHash());
    for (auto c = range.first; c != range.second; ++c) {
      if (c->second == pindex) {
        m_children.erase(c);
        break;
      }
    }
  }
  m_blocks.erase(hash);
  m_undo.erase(hash);
  m_snapshots.erase(hash);
  m_block_index.erase(it);
}

void BlockManager::StoreBlock(const CBlockIndex &index,
                              std::shared_ptr<const CBlock> block) {
  m_blocks[index.GetBlockHash()] = std::move(block);
}

std::shared_ptr<const CBlock> BlockManager::GetBlock(const uint256 &hash) const {
  auto it = m_blocks.find(hash);
  return it == m_blocks.end() ? nullptr : it->second;
}

void BlockManager::StoreUndo(const CBlockIndex &index, BlockUndo undo) {
  m_undo[index.GetBlockHash()] = std::move(undo);
}

const BlockUndo *BlockManager::GetUndo(const uint256 &hash) const {
  auto it = m_undo.find(hash);
  return it == m_undo.end() ? nullptr : &it->second;
}

void BlockManager::MaybeStoreSnapshot(const CBlockIndex &index,
                                      std::shared_ptr<const AccountState> state) {
  if (index.nHeight == 0 || index.nHeight % STATE_SNAPSHOT_INTERVAL == 0) {
    m_snapshots[index.GetBlockHash()] = std::move(state);
  }
}

const CBlockIndex *BlockManager::FindSnapshotAncestor(
    const CBlockIndex *pindex,
    std::shared_ptr<const AccountState> &snapshot) const {
  while (pindex) {
    auto it = m_snapshots.find(pindex->GetBlockHash());
    if (it != m_snapshots.end()) {
      snapshot = it->second;
      return pindex;
    }
    pindex = pindex->pprev;
  }
  snapshot.reset();
  return nullptr;
}

std::vector<CBlockIndex *> BlockManager::GetChildren(const uint256 &hash) const {
  std::vector<CBlockIndex *> out;
  auto range = m_children.equal_range(hash);
  for (auto it = range.first; it != range.second; ++it) {
    out.push_back(it->second);
  }
  return out;
}

bool BlockManager::HasChildren(const uint256 &hash) const {
  return m_children.find(hash) != m_children.end();
}

} // namespace chain
} // namespace lunachain
