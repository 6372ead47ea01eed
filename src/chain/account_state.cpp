// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "chain/account_state.hpp"
#include <algorithm>

namespace lunachain {
namespace chain {

AccountInfo AccountState::Get(const std::string &address) const {
  auto it = accounts_.find(address);
  if (it == accounts_.end()) {
    return AccountInfo{};
  }
  return it->second;
}

void AccountState::Set(const std::string &address, const AccountInfo &info) {
  if (info.IsEmpty()) {
    accounts_.erase(address);
  } else {
    accounts_[address] = info;
  }
}

void AccountState::SetWithUndo(const std::string &address,
                               const AccountInfo &info, BlockUndo *undo) {
  if (undo) {
    auto &prev = undo->prev_entries;
    bool seen = std::any_of(prev.begin(), prev.end(), [&](const auto &e) {
      return e.first == address;
    });
    if (!seen) {
      prev.emplace_back(address, Get(address));
    }
  }
  Set(address, info);
}

CAmount AccountState::TotalBalance() const {
  CAmount total = 0;
  for (const auto &[addr, info] : accounts_) {
    total += info.balance;
  }
  return total;
}

void UndoBlock(AccountState &state, const BlockUndo &undo) {
  for (auto it = undo.prev_entries.rbegin(); it != undo.prev_entries.rend();
       ++it) {
    state.Set(it->first, it->second);
  }
}

} // namespace chain
} // namespace lunachain
