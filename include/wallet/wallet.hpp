// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_WALLET_WALLET_HPP
#define LUNACHAIN_WALLET_WALLET_HPP

#include "chain/account_state.hpp"
#include "crypto/key.hpp"
#include "mempool/txmempool.hpp"
#include "notifications.hpp"
#include "primitives/transaction.hpp"
#include "validation/validation.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lunachain {

namespace validation {
class ChainstateManager;
}

namespace wallet {

/**
 * Build and sign a transfer from key's address.
 *
 * Fills sender and sender_pubkey from the key, signs the signature hash and
 * returns the immutable transaction (nullptr if signing fails). No balance
 * or nonce checks are made.
 */
CTransactionRef CreateSignedTransaction(const crypto::CKey &key,
                                        const std::string &recipient,
                                        CAmount amount, CAmount fee,
                                        uint64_t nonce, int64_t timestamp);

/**
 * Wallet - key store plus a thin facade over the chainstate and mempool
 *
 * Owned addresses get a cached confirmed balance that is refreshed on every
 * tip update; BalanceChangedCallback fires for each owned address whose
 * (balance, nonce) changed.
 *
 * THREAD SAFETY: one mutex for keys and cached balances. The tip update
 * handler runs under the chainstate lock, so the wallet never calls the
 * chainstate while holding its own mutex.
 */
class Wallet {
public:
  using BalanceChangedCallback =
      std::function<void(const std::string &address,
                         const chain::AccountInfo &info)>;

  // LIFETIME: chainstate and mempool must outlive the wallet
  Wallet(validation::ChainstateManager &chainstate,
         mempool::CTxMemPool &mempool);
  ~Wallet();

  Wallet(const Wallet &) = delete;
  Wallet &operator=(const Wallet &) = delete;

  // Returns the new key's address (nullopt if OpenSSL fails)
  std::optional<std::string> GenerateKey();
  std::optional<std::string> ImportKey(const std::vector<uint8_t> &secret);
  bool HaveKey(const std::string &address) const;
  std::vector<std::string> GetAddresses() const;

  /**
   * Sign a transfer from an owned address with the next free nonce:
   * max(confirmed nonce, highest pending nonce) + 1.
   *
   * Returns nullptr with state set (TX_MALFORMED) for an unknown sender or a
   * malformed recipient. Funds are checked on Submit.
   */
  CTransactionRef CreateTransaction(const std::string &from,
                                    const std::string &to, CAmount amount,
                                    CAmount fee,
                                    validation::TxValidationState &state);

  mempool::MempoolAcceptResult Submit(const CTransactionRef &tx);

  // Confirmed (balance, nonce) of any address; input is normalized first
  chain::AccountInfo GetBalance(const std::string &address) const;

  void SetBalanceChangedCallback(BalanceChangedCallback callback);

private:
  void OnTipUpdate(const TipUpdate &update);

  validation::ChainstateManager &chainstate_;
  mempool::CTxMemPool &mempool_;

  mutable std::mutex mutex_;
  std::map<std::string, crypto::CKey> keys_;
  std::map<std::string, chain::AccountInfo> balances_;
  BalanceChangedCallback balance_changed_;

  ChainNotifications::Subscription tip_subscription_;
};

} // namespace wallet
} // namespace lunachain

#endif // LUNACHAIN_WALLET_WALLET_HPP
