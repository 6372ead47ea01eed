// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "wallet/wallet.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include <algorithm>
#include <utility>

namespace lunachain {
namespace wallet {

CTransactionRef CreateSignedTransaction(const crypto::CKey &key,
                                        const std::string &recipient,
                                        CAmount amount, CAmount fee,
                                        uint64_t nonce, int64_t timestamp) {
  if (!key.IsValid()) {
    return nullptr;
  }

  CMutableTransaction mtx;
  mtx.sender_pubkey = key.GetPubKey();
  mtx.sender = crypto::AddressFromPubKey(mtx.sender_pubkey);
  mtx.recipient = recipient;
  mtx.amount = amount;
  mtx.fee = fee;
  mtx.nonce = nonce;
  mtx.timestamp = timestamp;

  mtx.signature = key.Sign(mtx.GetSignatureHash());
  if (mtx.signature.empty()) {
    LOG_CRYPTO_ERROR("Failed to sign transaction from {}", mtx.sender);
    return nullptr;
  }
  return MakeTransactionRef(std::move(mtx));
}

Wallet::Wallet(validation::ChainstateManager &chainstate,
               mempool::CTxMemPool &mempool)
    : chainstate_(chainstate), mempool_(mempool) {
  tip_subscription_ = chainstate_.Notifications().SubscribeTipUpdate(
      [this](const TipUpdate &update) { OnTipUpdate(update); });
}

Wallet::~Wallet() { tip_subscription_.Unsubscribe(); }

std::optional<std::string> Wallet::GenerateKey() {
  crypto::CKey key;
  if (!key.MakeNewKey()) {
    LOG_CRYPTO_ERROR("Wallet: key generation failed");
    return std::nullopt;
  }
  std::string address = key.GetAddress();
  chain::AccountInfo info = chainstate_.GetBalance(address);

  std::lock_guard<std::mutex> lock(mutex_);
  keys_.emplace(address, std::move(key));
  balances_[address] = info;
  LOG_INFO("Wallet: new address {}", address);
  return address;
}

std::optional<std::string>
Wallet::ImportKey(const std::vector<uint8_t> &secret) {
  crypto::CKey key;
  if (!key.SetSecret(secret)) {
    return std::nullopt;
  }
  std::string address = key.GetAddress();
  chain::AccountInfo info = chainstate_.GetBalance(address);

  std::lock_guard<std::mutex> lock(mutex_);
  keys_.insert_or_assign(address, std::move(key));
  balances_[address] = info;
  return address;
}

bool Wallet::HaveKey(const std::string &address) const {
  auto normalized = crypto::NormalizeAddress(address);
  if (!normalized) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.count(*normalized) > 0;
}

std::vector<std::string> Wallet::GetAddresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(keys_.size());
  for (const auto &[address, key] : keys_) {
    result.push_back(address);
  }
  return result;
}

CTransactionRef
Wallet::CreateTransaction(const std::string &from, const std::string &to,
                          CAmount amount, CAmount fee,
                          validation::TxValidationState &state) {
  auto sender = crypto::NormalizeAddress(from);
  if (!sender) {
    state.Invalid(validation::TxValidationResult::TX_MALFORMED,
                  "bad-txns-sender", from);
    return nullptr;
  }
  auto recipient = crypto::NormalizeAddress(to);
  if (!recipient) {
    state.Invalid(validation::TxValidationResult::TX_MALFORMED,
                  "bad-txns-recipient", to);
    return nullptr;
  }

  // Chainstate and mempool reads happen before the wallet mutex is taken
  uint64_t nonce = chainstate_.GetBalance(*sender).nonce;
  if (auto pending = mempool_.GetLastPendingNonce(*sender)) {
    nonce = std::max(nonce, *pending);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(*sender);
  if (it == keys_.end()) {
    state.Invalid(validation::TxValidationResult::TX_MALFORMED,
                  "wallet-unknown-sender", *sender);
    return nullptr;
  }

  CTransactionRef tx = CreateSignedTransaction(it->second, *recipient, amount,
                                               fee, nonce + 1, util::GetTime());
  if (!tx) {
    state.Error("wallet-sign-failed");
    return nullptr;
  }
  return tx;
}

mempool::MempoolAcceptResult Wallet::Submit(const CTransactionRef &tx) {
  mempool::MempoolAcceptResult result = mempool_.Admit(tx);
  if (result.IsOk()) {
    LOG_INFO("Wallet: submitted {} ({} -> {}, amount {}, fee {})",
             tx->GetHash().ToString().substr(0, 16), tx->sender, tx->recipient,
             tx->amount, tx->fee);
  } else {
    LOG_WARN("Wallet: transaction {} rejected: {} ({})",
             tx->GetHash().ToString().substr(0, 16),
             mempool::ResultTypeToString(result.m_result_type),
             result.m_state.ToString());
  }
  return result;
}

chain::AccountInfo Wallet::GetBalance(const std::string &address) const {
  auto normalized = crypto::NormalizeAddress(address);
  if (!normalized) {
    return {};
  }
  return chainstate_.GetBalance(*normalized);
}

void Wallet::SetBalanceChangedCallback(BalanceChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  balance_changed_ = std::move(callback);
}

void Wallet::OnTipUpdate(const TipUpdate &update) {
  if (!update.state) {
    return;
  }

  std::vector<std::pair<std::string, chain::AccountInfo>> changed;
  BalanceChangedCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[address, cached] : balances_) {
      chain::AccountInfo current = update.state->Get(address);
      if (current != cached) {
        cached = current;
        changed.emplace_back(address, current);
      }
    }
    callback = balance_changed_;
  }

  for (const auto &[address, info] : changed) {
    LOG_DEBUG("Wallet: {} balance {} nonce {}", address, info.balance,
              info.nonce);
    if (callback) {
      callback(address, info);
    }
  }
}

} // namespace wallet
} // namespace lunachain
