// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_CONSENSUS_TX_VERIFICATION_HPP
#define LUNACHAIN_CONSENSUS_TX_VERIFICATION_HPP

#include "chain/account_state.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "validation/validation.hpp"

namespace lunachain {

namespace chain {
struct ConsensusParams;
}

namespace consensus {

/**
 * Transaction validation
 *
 * ValidateTransaction runs the four checks in order and stops at the first
 * failure:
 *   1. CheckTransaction          -> TX_MALFORMED
 *   2. CheckTransactionSignature -> TX_BAD_SIGNATURE
 *   3. nonce == sender.nonce + 1 -> TX_NONCE_MISMATCH
 *   4. balance >= amount + fee   -> TX_INSUFFICIENT_FUNDS
 *
 * None of these functions touch shared state, so independent transactions
 * can be checked from any number of threads.
 */

// Field well-formedness: canonical distinct addresses, amount > 0,
// fee >= 0, amount + fee within MoneyRange
bool CheckTransaction(const CTransaction &tx,
                      validation::TxValidationState &state);

// Public key hashes to the sender address and signs the signature hash
bool CheckTransactionSignature(const CTransaction &tx,
                               validation::TxValidationState &state);

// Checks 3 and 4 against the sender's account
bool CheckTxAgainstAccount(const CTransaction &tx,
                           const chain::AccountInfo &sender,
                           validation::TxValidationState &state);

bool ValidateTransaction(const CTransaction &tx,
                         const chain::AccountInfo &sender,
                         validation::TxValidationState &state);

bool ValidateTransaction(const CTransaction &tx,
                         const chain::AccountState &view,
                         validation::TxValidationState &state);

// Debit sender (amount + fee, nonce++) and credit recipient. The caller
// must have validated tx against state.
void ApplyTransaction(const CTransaction &tx, chain::AccountState &state,
                      chain::BlockUndo *undo);

/**
 * Apply every transaction of a non-genesis block in order, then credit the
 * miner with block reward + fees.
 *
 * Malformed or badly signed transactions fail with BLOCK_STRUCTURAL; nonce or
 * balance failures (including two transactions of one sender that are not
 * sequential) fail with BLOCK_DOUBLE_SPEND. On failure `state` is left
 * partially modified, so callers apply to a copy.
 *
 * check_signatures=false skips step 2 when signatures were verified
 * separately (in parallel).
 */
bool ConnectBlockTransactions(const CBlock &block,
                              const chain::ConsensusParams &params,
                              chain::AccountState &state,
                              chain::BlockUndo *undo,
                              validation::BlockValidationState &vstate,
                              bool check_signatures = true);

} // namespace consensus
} // namespace lunachain

#endif // LUNACHAIN_CONSENSUS_TX_VERIFICATION_HPP
