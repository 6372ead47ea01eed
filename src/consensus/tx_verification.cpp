// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "consensus/tx_verification.hpp"
#include "chain/chainparams.hpp"
#include "crypto/key.hpp"

namespace lunachain {
namespace consensus {

using validation::BlockValidationResult;
using validation::BlockValidationState;
using validation::TxValidationResult;
using validation::TxValidationState;

bool CheckTransaction(const CTransaction &tx, TxValidationState &state) {
  if (tx.sender.empty() || tx.recipient.empty()) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-empty-address");
  }
  if (!crypto::IsValidAddress(tx.sender)) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-sender",
                         "sender is not a canonical address");
  }
  if (!crypto::IsValidAddress(tx.recipient)) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-recipient",
                         "recipient is not a canonical address");
  }
  if (tx.sender == tx.recipient) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-self-transfer");
  }
  if (tx.amount <= 0) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-amount",
                         "amount must be positive");
  }
  if (tx.fee < 0) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-fee-negative");
  }
  if (!MoneyRange(tx.amount) || !MoneyRange(tx.fee) ||
      !MoneyRange(tx.amount + tx.fee)) {
    return state.Invalid(TxValidationResult::TX_MALFORMED, "bad-txns-amount-toolarge");
  }
  return true;
}

bool CheckTransactionSignature(const CTransaction &tx, TxValidationState &state) {
  if (tx.sender_pubkey.empty() || tx.signature.empty()) {
    return state.Invalid(TxValidationResult::TX_BAD_SIGNATURE, "bad-txns-unsigned");
  }
  if (crypto::AddressFromPubKey(tx.sender_pubkey) != tx.sender) {
    return state.Invalid(TxValidationResult::TX_BAD_SIGNATURE, "bad-txns-pubkey-mismatch",
                         "public key does not hash to sender");
  }
  if (!crypto::VerifySignature(tx.sender_pubkey, tx.GetSignatureHash(),
                               tx.signature)) {
    return state.Invalid(TxValidationResult::TX_BAD_SIGNATURE, "bad-txns-signature");
  }
  return true;
}

bool CheckTxAgainstAccount(const CTransaction &tx, const chain::AccountInfo &sender,
                           TxValidationState &state) {
  if (tx.nonce != sender.nonce + 1) {
    return state.Invalid(TxValidationResult::TX_NONCE_MISMATCH, "bad-txns-nonce",
                         "expected " + std::to_string(sender.nonce + 1) +
                             ", got " + std::to_string(tx.nonce));
  }
  if (sender.balance < tx.amount + tx.fee) {
    return state.Invalid(TxValidationResult::TX_INSUFFICIENT_FUNDS,
                         "bad-txns-insufficient-funds",
                         "balance " + std::to_string(sender.balance) + " < " +
                             std::to_string(tx.amount + tx.fee));
  }
  return true;
}

bool ValidateTransaction(const CTransaction &tx, const chain::AccountInfo &sender,
                         TxValidationState &state) {
  return CheckTransaction(tx, state) && CheckTransactionSignature(tx, state) &&
         CheckTxAgainstAccount(tx, sender, state);
}

bool ValidateTransaction(const CTransaction &tx, const chain::AccountState &view,
                         TxValidationState &state) {
  return ValidateTransaction(tx, view.Get(tx.sender), state);
}

void ApplyTransaction(const CTransaction &tx, chain::AccountState &state,
                      chain::BlockUndo *undo) {
  chain::AccountInfo sender = state.Get(tx.sender);
  sender.balance -= tx.amount + tx.fee;
  sender.nonce = tx.nonce;
  state.SetWithUndo(tx.sender, sender, undo);

  chain::AccountInfo recipient = state.Get(tx.recipient);
  recipient.balance += tx.amount;
  state.SetWithUndo(tx.recipient, recipient, undo);
}

bool ConnectBlockTransactions(const CBlock &block,
                              const chain::ConsensusParams &params,
                              chain::AccountState &state, chain::BlockUndo *undo,
                              BlockValidationState &vstate,
                              bool check_signatures) {
  CAmount fees = 0;
  for (size_t i = 0; i < block.vtx.size(); ++i) {
    const CTransaction &tx = *block.vtx[i];
    TxValidationState tx_state;

    if (!CheckTransaction(tx, tx_state) ||
        (check_signatures && !CheckTransactionSignature(tx, tx_state))) {
      return vstate.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                            "bad-txns-invalid",
                            "tx " + std::to_string(i) + ": " + tx_state.ToString());
    }
    if (!CheckTxAgainstAccount(tx, state.Get(tx.sender), tx_state)) {
      return vstate.Invalid(BlockValidationResult::BLOCK_DOUBLE_SPEND,
                            "bad-txns-double-spend",
                            "tx " + std::to_string(i) + ": " + tx_state.ToString());
    }
    ApplyTransaction(tx, state, undo);
    fees += tx.fee;
  }

  const std::string miner = block.GetMinerAddress();
  chain::AccountInfo miner_info = state.Get(miner);
  CAmount payout = params.nBlockReward + fees;
  if (!MoneyRange(payout) || !MoneyRange(miner_info.balance + payout)) {
    return vstate.Invalid(BlockValidationResult::BLOCK_STRUCTURAL,
                          "bad-cb-amount", "miner payout out of range");
  }
  miner_info.balance += payout;
  state.SetWithUndo(miner, miner_info, undo);
  return true;
}

} // namespace consensus
} // namespace lunachain
