// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CHAIN_ACCOUNT_STATE_HPP
#define LUNACHAIN_CHAIN_ACCOUNT_STATE_HPP

#include "primitives/transaction.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lunachain {
namespace chain {

struct AccountInfo {
  CAmount balance{0};
  uint64_t nonce{0}; // nonce of the last confirmed transaction (0 = none)

  bool IsEmpty() const { return balance == 0 && nonce == 0; }

  friend bool operator==(const AccountInfo &a, const AccountInfo &b) {
    return a.balance == b.balance && a.nonce == b.nonce;
  }
  friend bool operator!=(const AccountInfo &a, const AccountInfo &b) {
    return !(a == b);
  }
};

/**
 * Previous values of every account a block touched, in first-touch order.
 * Applying it in reverse restores the parent state exactly.
 */
struct BlockUndo {
  std::vector<std::pair<std::string, AccountInfo>> prev_entries;
};

/**
 * Address -> (balance, nonce)
 *
 * Empty accounts are not stored, so two states with the same observable
 * balances compare equal and serialize identically.
 */
class AccountState {
public:
  // Unknown addresses read as (0, 0)
  AccountInfo Get(const std::string &address) const;

  void Set(const std::string &address, const AccountInfo &info);

  // Records the previous value in undo (if any) the first time an address
  // is touched
  void SetWithUndo(const std::string &address, const AccountInfo &info,
                   BlockUndo *undo);

  const std::map<std::string, AccountInfo> &Entries() const { return accounts_; }
  size_t Size() const { return accounts_.size(); }

  CAmount TotalBalance() const;

  friend bool operator==(const AccountState &a, const AccountState &b) {
    return a.accounts_ == b.accounts_;
  }
  friend bool operator!=(const AccountState &a, const AccountState &b) {
    return !(a == b);
  }

private:
  std::map<std::string, AccountInfo> accounts_;
};

// Restore the state a block was applied to
void UndoBlock(AccountState &state, const BlockUndo &undo);

} // namespace chain
} // namespace lunachain

#endif // LUNACHAIN_CHAIN_ACCOUNT_STATE_HPP
