// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_MEMPOOL_TXMEMPOOL_HPP
#define LUNACHAIN_MEMPOOL_TXMEMPOOL_HPP

#include "chain/account_state.hpp"
#include "chain/chainparams.hpp"
#include "notifications.hpp"
#include "primitives/transaction.hpp"
#include "validation/validation.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lunachain {

namespace validation {
class ChainstateManager;
}

namespace mempool {

static constexpr size_t DEFAULT_MAX_MEMPOOL_ENTRIES = 10000;

enum class EntryState : uint8_t {
  Pending,    // selectable
  Superseded, // removed from the pool; stale in any snapshot that holds it
};

class CTxMemPoolEntry {
public:
  CTxMemPoolEntry(CTransactionRef tx, int64_t time);

  const CTransaction &GetTx() const { return *tx_; }
  const CTransactionRef &GetSharedTx() const { return tx_; }
  const uint256 &GetTxHash() const { return tx_->GetHash(); }
  CAmount GetFee() const { return tx_->fee; }
  size_t GetTxSize() const { return tx_size_; }
  // Fee per 1000 serialized bytes
  CAmount GetFeePerK() const { return fee_per_k_; }
  int64_t GetTime() const { return time_; }

  EntryState GetState() const { return state_.load(std::memory_order_acquire); }
  bool IsPending() const { return GetState() == EntryState::Pending; }
  void MarkSuperseded() const {
    state_.store(EntryState::Superseded, std::memory_order_release);
  }

private:
  CTransactionRef tx_;
  size_t tx_size_;
  CAmount fee_per_k_;
  int64_t time_;
  mutable std::atomic<EntryState> state_{EntryState::Pending};
};

using CTxMemPoolEntryRef = std::shared_ptr<const CTxMemPoolEntry>;

// Best first: higher fee rate, then earlier admission, then smaller hash
struct CompareTxMemPoolEntryByPriority {
  bool operator()(const CTxMemPoolEntry *a, const CTxMemPoolEntry *b) const;
};

struct MempoolAcceptResult {
  enum class ResultType {
    OK,
    VALIDATION_ERROR, // rejected by the transaction validator
    DUPLICATE_TX,     // already pending or already confirmed
    POOL_FULL,        // at capacity and not better than any evictable entry
  };

  ResultType m_result_type;
  validation::TxValidationState m_state;

  bool IsOk() const { return m_result_type == ResultType::OK; }

  static MempoolAcceptResult Success() {
    return MempoolAcceptResult{ResultType::OK, {}};
  }
  static MempoolAcceptResult Failure(ResultType type,
                                     validation::TxValidationState state) {
    return MempoolAcceptResult{type, std::move(state)};
  }
};

const char *ResultTypeToString(MempoolAcceptResult::ResultType type);

/**
 * CTxMemPool - admitted, not yet confirmed transactions
 *
 * Per sender, pending entries form a contiguous nonce chain starting at the
 * confirmed nonce + 1. A transaction is validated against the confirmed
 * state extended by its sender's pending chain, so a wallet can queue
 * several transactions before any is mined.
 *
 * Tip updates from the ChainstateManager purge confirmed entries, supersede
 * entries that conflict with the new state and re-admit transactions from
 * disconnected blocks.
 *
 * New submissions must also pass the network's MempoolPolicy (amount
 * bounds, minimum fee, sender blacklist, per-sender rate limit).
 * Transactions returning from disconnected blocks were already confirmed
 * once and skip it.
 *
 * THREAD SAFETY: one std::shared_mutex. Lock order is chainstate before
 * mempool: Admit reads the chain before taking the mempool lock, and
 * OnTipUpdate runs under the chainstate write lock without calling back.
 */
class CTxMemPool {
public:
  // LIFETIME: chainstate must outlive the mempool
  explicit CTxMemPool(validation::ChainstateManager &chainstate,
                      size_t max_entries = DEFAULT_MAX_MEMPOOL_ENTRIES);
  ~CTxMemPool();

  CTxMemPool(const CTxMemPool &) = delete;
  CTxMemPool &operator=(const CTxMemPool &) = delete;

  MempoolAcceptResult Admit(const CTransactionRef &tx);

  /**
   * Greedy selection by descending fee rate. A sender's transaction is
   * eligible only after all its lower pending nonces were selected; a
   * sender whose next transaction does not fit is skipped entirely.
   */
  std::vector<CTransactionRef> SelectForBlock(size_t max_bytes,
                                              size_t max_count) const;

  // Returns the number of entries removed
  size_t PurgeConfirmed(const std::vector<uint256> &tx_hashes);
  size_t InvalidateConflicting(const std::string &sender,
                               uint64_t confirmed_nonce);

  void OnTipUpdate(const TipUpdate &update);

  bool Exists(const uint256 &hash) const;
  CTransactionRef Get(const uint256 &hash) const;
  size_t Size() const;
  size_t GetPendingCount(const std::string &sender) const;
  // Highest pending nonce of sender, if any
  std::optional<uint64_t> GetLastPendingNonce(const std::string &sender) const;
  size_t GetMaxEntries() const { return max_entries_; }

private:
  using EntryMap = std::map<uint256, std::shared_ptr<CTxMemPoolEntry>>;

  MempoolAcceptResult AdmitLocked(const CTransactionRef &tx,
                                  const chain::AccountState &state);

  // Stateless policy checks (amount, fee, blacklist)
  bool CheckPolicy(const CTransaction &tx,
                   validation::TxValidationState &state) const;
  // True if sender may be admitted once more at time now
  bool CheckRateLimitLocked(const std::string &sender, int64_t now);
  void RecordAdmissionLocked(const std::string &sender, int64_t now);
  size_t PurgeConfirmedLocked(const std::vector<uint256> &tx_hashes);
  size_t InvalidateConflictingLocked(const std::string &sender,
                                     uint64_t confirmed_nonce);

  // Sender account after its pending chain is applied to the confirmed one
  chain::AccountInfo SpeculativeAccountLocked(const std::string &sender,
                                              const chain::AccountState &state) const;

  // Lowest priority entry that is the last of its sender's chain
  const CTxMemPoolEntry *FindEvictionCandidateLocked(
      const std::string &exclude_sender) const;

  void RemoveEntryLocked(EntryMap::iterator it);

  // Drop every pending chain suffix that no longer applies to state
  size_t RevalidateLocked(const chain::AccountState &state);

  validation::ChainstateManager &chainstate_;
  const chain::MempoolPolicy &policy_;
  const size_t max_entries_;

  EntryMap mapTx;
  // sender -> nonce -> entry
  std::map<std::string, std::map<uint64_t, const CTxMemPoolEntry *>> mapSender;
  std::set<const CTxMemPoolEntry *, CompareTxMemPoolEntryByPriority> setEntries;

  // sender -> admission times inside the rate limit window
  std::map<std::string, std::deque<int64_t>> mapRecentAdmissions;

  // Version of the last tip update applied
  uint64_t m_tip_version{0};

  mutable std::shared_mutex cs;

  ChainNotifications::Subscription tip_subscription_;
};

} // namespace mempool
} // namespace lunachain

#endif // LUNACHAIN_MEMPOOL_TXMEMPOOL_HPP
