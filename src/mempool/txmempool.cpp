// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "mempool/txmempool.hpp"
#include "consensus/tx_verification.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include <limits>
#include <mutex>
#include <queue>

namespace lunachain {
namespace mempool {

// A tip update can land between reading the chain and taking the pool lock
static constexpr int MAX_ADMIT_ATTEMPTS = 3;

// Saturates instead of overflowing for absurd fees
static CAmount FeePerK(CAmount fee, size_t size) {
  if (size == 0) {
    return 0;
  }
  const CAmount bytes = static_cast<CAmount>(size);
  const CAmount whole = fee / bytes;
  if (whole > std::numeric_limits<CAmount>::max() / 1000) {
    return std::numeric_limits<CAmount>::max();
  }
  return whole * 1000 + (fee % bytes) * 1000 / bytes;
}

CTxMemPoolEntry::CTxMemPoolEntry(CTransactionRef tx, int64_t time)
    : tx_(std::move(tx)), tx_size_(tx_->GetTotalSize()),
      fee_per_k_(FeePerK(tx_->fee, tx_size_)), time_(time) {}

bool CompareTxMemPoolEntryByPriority::operator()(const CTxMemPoolEntry *a,
                                                 const CTxMemPoolEntry *b) const {
  if (a->GetFeePerK() != b->GetFeePerK()) {
    return a->GetFeePerK() > b->GetFeePerK();
  }
  if (a->GetTime() != b->GetTime()) {
    return a->GetTime() < b->GetTime();
  }
  return a->GetTxHash() < b->GetTxHash();
}

const char *ResultTypeToString(MempoolAcceptResult::ResultType type) {
  switch (type) {
  case MempoolAcceptResult::ResultType::OK:
    return "ok";
  case MempoolAcceptResult::ResultType::VALIDATION_ERROR:
    return "validation-error";
  case MempoolAcceptResult::ResultType::DUPLICATE_TX:
    return "duplicate-tx";
  case MempoolAcceptResult::ResultType::POOL_FULL:
    return "pool-full";
  }
  return "unknown";
}

CTxMemPool::CTxMemPool(validation::ChainstateManager &chainstate,
                       size_t max_entries)
    : chainstate_(chainstate), policy_(chainstate.GetParams().GetMempoolPolicy()),
      max_entries_(max_entries),
      m_tip_version(chainstate.GetTipVersion()) {
  tip_subscription_ = chainstate_.Notifications().SubscribeTipUpdate(
      [this](const TipUpdate &update) { OnTipUpdate(update); });
}

CTxMemPool::~CTxMemPool() { tip_subscription_.Unsubscribe(); }

MempoolAcceptResult CTxMemPool::Admit(const CTransactionRef &tx) {
  using ResultType = MempoolAcceptResult::ResultType;
  validation::TxValidationState state;

  if (!tx) {
    state.Invalid(validation::TxValidationResult::TX_MALFORMED, "null-tx");
    return MempoolAcceptResult::Failure(ResultType::VALIDATION_ERROR, state);
  }
  const uint256 &hash = tx->GetHash();

  // Stateless checks need no lock
  if (!consensus::CheckTransaction(*tx, state) ||
      !consensus::CheckTransactionSignature(*tx, state) ||
      !CheckPolicy(*tx, state)) {
    LOG_MEMPOOL_DEBUG("Rejected tx {}: {}", hash.ToString().substr(0, 16),
                      state.ToString());
    return MempoolAcceptResult::Failure(ResultType::VALIDATION_ERROR, state);
  }

  if (chainstate_.IsTransactionConfirmed(hash)) {
    state.Invalid(validation::TxValidationResult::TX_DUPLICATE,
                  "txn-already-confirmed");
    return MempoolAcceptResult::Failure(ResultType::DUPLICATE_TX, state);
  }

  for (int attempt = 1;; ++attempt) {
    uint64_t snapshot_version = 0;
    std::shared_ptr<const chain::AccountState> confirmed =
        chainstate_.GetAccountStateSnapshot(&snapshot_version);
    if (!confirmed) {
      state.Error("no-chainstate", "chainstate not initialized");
      return MempoolAcceptResult::Failure(ResultType::VALIDATION_ERROR, state);
    }

    std::unique_lock<std::shared_mutex> lock(cs);
    if (snapshot_version < m_tip_version && attempt < MAX_ADMIT_ATTEMPTS) {
      continue;
    }

    const int64_t now = util::GetTime();
    if (!CheckRateLimitLocked(tx->sender, now)) {
      state.Invalid(validation::TxValidationResult::TX_POLICY, "rate-limited",
                    "more than " + std::to_string(policy_.nRateLimitMaxTxs) +
                        " transactions in " +
                        std::to_string(policy_.nRateLimitWindow) + "s");
      LOG_MEMPOOL_DEBUG("Rejected tx {}: {}", hash.ToString().substr(0, 16),
                        state.ToString());
      return MempoolAcceptResult::Failure(ResultType::VALIDATION_ERROR, state);
    }

    MempoolAcceptResult result = AdmitLocked(tx, *confirmed);
    if (result.IsOk()) {
      RecordAdmissionLocked(tx->sender, now);
    }
    return result;
  }
}

bool CTxMemPool::CheckPolicy(const CTransaction &tx,
                             validation::TxValidationState &state) const {
  using validation::TxValidationResult;
  if (tx.amount < policy_.nMinTxAmount) {
    return state.Invalid(TxValidationResult::TX_POLICY, "amount-too-small",
                         "minimum " + std::to_string(policy_.nMinTxAmount));
  }
  if (tx.amount > policy_.nMaxTxAmount) {
    return state.Invalid(TxValidationResult::TX_POLICY, "amount-too-large",
                         "maximum " + std::to_string(policy_.nMaxTxAmount));
  }
  if (tx.fee < policy_.nMinTxFee) {
    return state.Invalid(TxValidationResult::TX_POLICY, "fee-too-low",
                         "fee " + std::to_string(tx.fee) + " < " +
                             std::to_string(policy_.nMinTxFee));
  }
  if (policy_.blacklist.count(tx.sender)) {
    return state.Invalid(TxValidationResult::TX_POLICY, "sender-blacklisted");
  }
  return true;
}

bool CTxMemPool::CheckRateLimitLocked(const std::string &sender, int64_t now) {
  if (policy_.nRateLimitMaxTxs == 0) {
    return true;
  }
  auto it = mapRecentAdmissions.find(sender);
  if (it == mapRecentAdmissions.end()) {
    return true;
  }
  std::deque<int64_t> &times = it->second;
  while (!times.empty() && now - times.front() >= policy_.nRateLimitWindow) {
    times.pop_front();
  }
  if (times.empty()) {
    mapRecentAdmissions.erase(it);
    return true;
  }
  return times.size() < policy_.nRateLimitMaxTxs;
}

void CTxMemPool::RecordAdmissionLocked(const std::string &sender, int64_t now) {
  if (policy_.nRateLimitMaxTxs == 0) {
    return;
  }
  mapRecentAdmissions[sender].push_back(now);
}

MempoolAcceptResult CTxMemPool::AdmitLocked(const CTransactionRef &tx,
                                            const chain::AccountState &state) {
  using ResultType = MempoolAcceptResult::ResultType;
  const uint256 &hash = tx->GetHash();
  validation::TxValidationState vstate;

  if (mapTx.count(hash)) {
    vstate.Invalid(validation::TxValidationResult::TX_DUPLICATE,
                   "txn-already-in-mempool");
    return MempoolAcceptResult::Failure(ResultType::DUPLICATE_TX, vstate);
  }

  chain::AccountInfo sender = SpeculativeAccountLocked(tx->sender, state);
  if (!consensus::CheckTxAgainstAccount(*tx, sender, vstate)) {
    LOG_MEMPOOL_DEBUG("Rejected tx {}: {}", hash.ToString().substr(0, 16),
                      vstate.ToString());
    return MempoolAcceptResult::Failure(ResultType::VALIDATION_ERROR, vstate);
  }

  auto entry = std::make_shared<CTxMemPoolEntry>(tx, util::GetTime());

  if (mapTx.size() >= max_entries_) {
    const CTxMemPoolEntry *victim = FindEvictionCandidateLocked(tx->sender);
    if (!victim || !CompareTxMemPoolEntryByPriority()(entry.get(), victim)) {
      vstate.Invalid(validation::TxValidationResult::TX_POOL_FULL,
                     "mempool-full",
                     "fee rate " + std::to_string(entry->GetFeePerK()) +
                         " per kB too low");
      return MempoolAcceptResult::Failure(ResultType::POOL_FULL, vstate);
    }
    LOG_MEMPOOL_DEBUG("Evicting tx {} (fee rate {}) for {} (fee rate {})",
                      victim->GetTxHash().ToString().substr(0, 16),
                      victim->GetFeePerK(), hash.ToString().substr(0, 16),
                      entry->GetFeePerK());
    RemoveEntryLocked(mapTx.find(victim->GetTxHash()));
  }

  const CTxMemPoolEntry *raw = entry.get();
  mapTx.emplace(hash, std::move(entry));
  mapSender[tx->sender][tx->nonce] = raw;
  setEntries.insert(raw);

  LOG_MEMPOOL_DEBUG("Accepted tx {}: sender={} nonce={} fee={} (pool size {})",
                    hash.ToString().substr(0, 16), tx->sender, tx->nonce,
                    tx->fee, mapTx.size());
  return MempoolAcceptResult::Success();
}

chain::AccountInfo
CTxMemPool::SpeculativeAccountLocked(const std::string &sender,
                                     const chain::AccountState &state) const {
  chain::AccountInfo info = state.Get(sender);
  auto it = mapSender.find(sender);
  if (it == mapSender.end()) {
    return info;
  }
  for (const auto &[nonce, entry] : it->second) {
    if (nonce <= info.nonce) {
      // Confirmed since admission; the next tip update removes it
      continue;
    }
    if (nonce != info.nonce + 1) {
      break;
    }
    info.nonce = nonce;
    info.balance -= entry->GetTx().amount + entry->GetTx().fee;
  }
  return info;
}

const CTxMemPoolEntry *
CTxMemPool::FindEvictionCandidateLocked(const std::string &exclude_sender) const {
  for (auto it = setEntries.rbegin(); it != setEntries.rend(); ++it) {
    const CTxMemPoolEntry *entry = *it;
    const std::string &sender = entry->GetTx().sender;
    if (sender == exclude_sender) {
      continue;
    }
    auto chain_it = mapSender.find(sender);
    if (chain_it != mapSender.end() && !chain_it->second.empty() &&
        chain_it->second.rbegin()->second == entry) {
      return entry;
    }
  }
  return nullptr;
}

void CTxMemPool::RemoveEntryLocked(EntryMap::iterator it) {
  if (it == mapTx.end()) {
    return;
  }
  const CTxMemPoolEntry *entry = it->second.get();
  entry->MarkSuperseded();
  setEntries.erase(entry);

  auto chain_it = mapSender.find(entry->GetTx().sender);
  if (chain_it != mapSender.end()) {
    chain_it->second.erase(entry->GetTx().nonce);
    if (chain_it->second.empty()) {
      mapSender.erase(chain_it);
    }
  }
  mapTx.erase(it);
}

std::vector<CTransactionRef> CTxMemPool::SelectForBlock(size_t max_bytes,
                                                        size_t max_count) const {
  // Snapshot per-sender chains in nonce order
  std::vector<std::vector<CTxMemPoolEntryRef>> chains;
  {
    std::shared_lock<std::shared_mutex> lock(cs);
    chains.reserve(mapSender.size());
    for (const auto &[sender, by_nonce] : mapSender) {
      std::vector<CTxMemPoolEntryRef> sequence;
      sequence.reserve(by_nonce.size());
      for (const auto &[nonce, entry] : by_nonce) {
        sequence.push_back(mapTx.at(entry->GetTxHash()));
      }
      chains.push_back(std::move(sequence));
    }
  }

  struct Head {
    const std::vector<CTxMemPoolEntryRef> *sequence;
    size_t pos;
    const CTxMemPoolEntry *entry() const { return (*sequence)[pos].get(); }
  };
  auto lower_priority = [](const Head &a, const Head &b) {
    return CompareTxMemPoolEntryByPriority()(b.entry(), a.entry());
  };
  std::priority_queue<Head, std::vector<Head>, decltype(lower_priority)> heads(
      lower_priority);
  for (const auto &sequence : chains) {
    if (!sequence.empty()) {
      heads.push(Head{&sequence, 0});
    }
  }

  std::vector<CTransactionRef> selected;
  size_t total_bytes = 0;
  while (!heads.empty() && selected.size() < max_count) {
    Head head = heads.top();
    heads.pop();
    const CTxMemPoolEntry *entry = head.entry();

    // Superseded since the snapshot: later nonces of this sender depend on it
    if (!entry->IsPending()) {
      continue;
    }
    if (total_bytes + entry->GetTxSize() > max_bytes) {
      continue;
    }

    total_bytes += entry->GetTxSize();
    selected.push_back(entry->GetSharedTx());
    if (head.pos + 1 < head.sequence->size()) {
      heads.push(Head{head.sequence, head.pos + 1});
    }
  }

  LOG_MEMPOOL_TRACE("Selected {} transactions ({} bytes) for block template",
                    selected.size(), total_bytes);
  return selected;
}

size_t CTxMemPool::PurgeConfirmed(const std::vector<uint256> &tx_hashes) {
  std::unique_lock<std::shared_mutex> lock(cs);
  return PurgeConfirmedLocked(tx_hashes);
}

size_t CTxMemPool::PurgeConfirmedLocked(const std::vector<uint256> &tx_hashes) {
  size_t removed = 0;
  for (const uint256 &hash : tx_hashes) {
    auto it = mapTx.find(hash);
    if (it != mapTx.end()) {
      RemoveEntryLocked(it);
      removed++;
    }
  }
  return removed;
}

size_t CTxMemPool::InvalidateConflicting(const std::string &sender,
                                         uint64_t confirmed_nonce) {
  std::unique_lock<std::shared_mutex> lock(cs);
  return InvalidateConflictingLocked(sender, confirmed_nonce);
}

size_t CTxMemPool::InvalidateConflictingLocked(const std::string &sender,
                                               uint64_t confirmed_nonce) {
  auto chain_it = mapSender.find(sender);
  if (chain_it == mapSender.end()) {
    return 0;
  }

  std::vector<uint256> stale;
  for (const auto &[nonce, entry] : chain_it->second) {
    if (nonce > confirmed_nonce) {
      break;
    }
    stale.push_back(entry->GetTxHash());
  }
  for (const uint256 &hash : stale) {
    LOG_MEMPOOL_DEBUG("Superseded tx {} (sender {} confirmed nonce {})",
                      hash.ToString().substr(0, 16), sender, confirmed_nonce);
    RemoveEntryLocked(mapTx.find(hash));
  }
  return stale.size();
}

size_t CTxMemPool::RevalidateLocked(const chain::AccountState &state) {
  std::vector<uint256> stale;
  for (const auto &[sender, by_nonce] : mapSender) {
    chain::AccountInfo info = state.Get(sender);
    bool broken = false;
    for (const auto &[nonce, entry] : by_nonce) {
      validation::TxValidationState vstate;
      if (broken ||
          !consensus::CheckTxAgainstAccount(entry->GetTx(), info, vstate)) {
        broken = true;
        stale.push_back(entry->GetTxHash());
        continue;
      }
      info.nonce = nonce;
      info.balance -= entry->GetTx().amount + entry->GetTx().fee;
    }
  }
  for (const uint256 &hash : stale) {
    RemoveEntryLocked(mapTx.find(hash));
  }
  return stale.size();
}

void CTxMemPool::OnTipUpdate(const TipUpdate &update) {
  if (!update.state) {
    return;
  }
  const chain::AccountState &state = *update.state;

  std::unique_lock<std::shared_mutex> lock(cs);
  m_tip_version = update.tip_version;

  std::vector<uint256> confirmed;
  std::set<std::string> senders;
  for (const auto &block : update.connected) {
    for (const CTransactionRef &tx : block->vtx) {
      confirmed.push_back(tx->GetHash());
      senders.insert(tx->sender);
    }
  }

  size_t purged = PurgeConfirmedLocked(confirmed);
  size_t superseded = 0;
  for (const std::string &sender : senders) {
    superseded += InvalidateConflictingLocked(sender, state.Get(sender).nonce);
  }

  // Disconnected blocks arrive tip first; re-admit oldest first. This runs
  // before revalidation so that pending entries stacked on a disconnected
  // transaction find their predecessor back in the pool.
  size_t readmitted = 0;
  for (auto it = update.disconnected.rbegin(); it != update.disconnected.rend();
       ++it) {
    for (const CTransactionRef &tx : (*it)->vtx) {
      if (AdmitLocked(tx, state).IsOk()) {
        readmitted++;
      }
    }
  }

  // Balances may have moved for any account, not only senders
  superseded += RevalidateLocked(state);

  const int64_t now = util::GetTime();
  for (auto it = mapRecentAdmissions.begin(); it != mapRecentAdmissions.end();) {
    if (it->second.empty() ||
        now - it->second.back() >= policy_.nRateLimitWindow) {
      it = mapRecentAdmissions.erase(it);
    } else {
      ++it;
    }
  }

  if (purged || superseded || readmitted) {
    LOG_MEMPOOL_DEBUG("Tip update: purged={} superseded={} readmitted={} "
                      "(pool size {})",
                      purged, superseded, readmitted, mapTx.size());
  }
}

bool CTxMemPool::Exists(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(cs);
  return mapTx.count(hash) > 0;
}

CTransactionRef CTxMemPool::Get(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(cs);
  auto it = mapTx.find(hash);
  return it == mapTx.end() ? nullptr : it->second->GetSharedTx();
}

size_t CTxMemPool::Size() const {
  std::shared_lock<std::shared_mutex> lock(cs);
  return mapTx.size();
}

size_t CTxMemPool::GetPendingCount(const std::string &sender) const {
  std::shared_lock<std::shared_mutex> lock(cs);
  auto it = mapSender.find(sender);
  return it == mapSender.end() ? 0 : it->second.size();
}

std::optional<uint64_t>
CTxMemPool::GetLastPendingNonce(const std::string &sender) const {
  std::shared_lock<std::shared_mutex> lock(cs);
  auto it = mapSender.find(sender);
  if (it == mapSender.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.rbegin()->first;
}

} // namespace mempool
} // namespace lunachain
