// Copyright (c) 2024 LunaChain
// Test helper for ChainstateManager with PoW bypass

#ifndef LUNACHAIN_TEST_CHAINSTATE_MANAGER_HPP
#define LUNACHAIN_TEST_CHAINSTATE_MANAGER_HPP

#include "validation/chainstate_manager.hpp"

namespace lunachain {
namespace test {

/**
 * TestChainstateManager - Test version that bypasses PoW validation
 *
 * Chain-shape tests (orphans, reorgs, invalidation) build blocks without
 * searching for a nonce. Contextual checks (height, difficulty bits,
 * timestamps) and all transaction validation still run unless
 * bypass_contextual is set.
 *
 * Usage:
 *   TestChainstateManager chainstate(*params);
 *   chainstate.Initialize();
 *   // Now blocks can be accepted without valid PoW
 */
class TestChainstateManager : public validation::ChainstateManager {
public:
    explicit TestChainstateManager(const chain::ChainParams& params,
                                   bool bypass_contextual = false,
                                   size_t verify_threads = 2)
        : ChainstateManager(params, verify_threads),
          bypass_contextual_(bypass_contextual)
    {
    }

protected:
    // Always returns true; safe only where tests control all inputs
    bool CheckBlockHeaderWrapper(const CBlockHeader& header,
                                 validation::BlockValidationState& state) const override
    {
        return true;
    }

    bool ContextualCheckBlockWrapper(const CBlockHeader& header,
                                     const chain::CBlockIndex* pindexPrev,
                                     int64_t adjusted_time,
                                     validation::BlockValidationState& state) const override
    {
        if (bypass_contextual_) {
            return true;
        }
        return ChainstateManager::ContextualCheckBlockWrapper(header, pindexPrev,
                                                              adjusted_time, state);
    }

private:
    bool bypass_contextual_;
};

} // namespace test
} // namespace lunachain

#endif // LUNACHAIN_TEST_CHAINSTATE_MANAGER_HPP
