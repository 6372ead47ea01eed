// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_VALIDATION_VALIDATION_HPP
#define LUNACHAIN_VALIDATION_VALIDATION_HPP

#include "primitives/block.hpp"
#include <cstdint>
#include <string>

namespace lunachain {

namespace chain {
class ChainParams;
class CBlockIndex;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION LAYERS
 * ============================================================================
 *
 * LAYER 1: Context-free (CheckBlock, CheckBlockHeader)
 * - size and count limits, merkle root, duplicate transactions,
 *   well-formed transactions, PoW against the header's own nBits
 *
 * LAYER 2: Contextual (ContextualCheckBlock, requires the parent)
 * - height, nBits equal to the required target, median-time-past and
 *   future-time bounds
 *
 * LAYER 3: State (consensus::ConnectBlockTransactions)
 * - signatures, nonce sequencing and balances against the parent state
 *
 * ChainstateManager::ProcessNewBlock() orchestrates all three.
 * ============================================================================
 */

// Why a transaction was rejected
enum class TxValidationResult {
  TX_RESULT_UNSET = 0,
  TX_MALFORMED,          //!< missing/invalid fields
  TX_BAD_SIGNATURE,      //!< signature or public key does not match sender
  TX_NONCE_MISMATCH,     //!< nonce is not confirmed nonce + 1
  TX_INSUFFICIENT_FUNDS, //!< balance < amount + fee
  TX_DUPLICATE,          //!< already in the mempool or confirmed
  TX_POOL_FULL,          //!< mempool at capacity and priority too low
  TX_POLICY,             //!< valid, but refused by local admission policy
};

// Why a block was rejected
enum class BlockValidationResult {
  BLOCK_RESULT_UNSET = 0,
  BLOCK_STRUCTURAL,     //!< malformed block or contained transaction
  BLOCK_INVALID_POW,    //!< hash above target or wrong nBits
  BLOCK_ORPHAN,         //!< parent unknown; held in the orphan pool
  BLOCK_DOUBLE_SPEND,   //!< nonce/balance conflict against the parent state
  BLOCK_CACHED_INVALID, //!< already known to be invalid
};

/**
 * Validation state - tracks why validation failed
 *
 * INVALID is a property of the input (permanent); ERROR is a local failure
 * such as storage corruption.
 */
template <typename Result> class ValidationState {
public:
  enum class Mode {
    VALID,
    INVALID, // Invalid input (permanent failure)
    ERROR    // System error
  };

  bool Invalid(Result result, const std::string &reject_reason,
               const std::string &debug_message = "") {
    mode_ = Mode::INVALID;
    result_ = result;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    mode_ = Mode::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool IsValid() const { return mode_ == Mode::VALID; }
  bool IsInvalid() const { return mode_ == Mode::INVALID; }
  bool IsError() const { return mode_ == Mode::ERROR; }

  Result GetResult() const { return result_; }
  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid()) {
      return "Valid";
    }
    if (!debug_message_.empty()) {
      return reject_reason_ + ", " + debug_message_;
    }
    return reject_reason_;
  }

private:
  Mode mode_{Mode::VALID};
  Result result_{};
  std::string reject_reason_;
  std::string debug_message_;
};

class TxValidationState : public ValidationState<TxValidationResult> {};
class BlockValidationState : public ValidationState<BlockValidationResult> {};

/**
 * Proof of work against the header's own nBits.
 *
 * Does NOT check that nBits is the correct difficulty for the block's
 * position; ContextualCheckBlock does that.
 */
bool CheckBlockHeader(const CBlockHeader &header,
                      const chain::ChainParams &params,
                      BlockValidationState &state);

/**
 * Context-free structural checks (no PoW, no state):
 * version, size and transaction-count limits, merkle root, duplicate
 * transactions, well-formedness of every transaction.
 */
bool CheckBlock(const CBlock &block, const chain::ChainParams &params,
                BlockValidationState &state);

/**
 * Checks that need the parent:
 * - nHeight == parent height + 1
 * - nBits equals GetNextWorkRequired(parent)       -> BLOCK_INVALID_POW
 * - nTime > parent median time past
 * - nTime <= adjusted_time + consensus nMaxFutureBlockTime
 */
bool ContextualCheckBlock(const CBlockHeader &header,
                          const chain::CBlockIndex *pindexPrev,
                          const chain::ChainParams &params,
                          int64_t adjusted_time, BlockValidationState &state);

// Local clock (mockable through util::SetMockTime)
int64_t GetAdjustedTime();

} // namespace validation
} // namespace lunachain

#endif // LUNACHAIN_VALIDATION_VALIDATION_HPP
