// Copyright (c) 2024 LunaChain
// Block acceptance, rejection classes and failure marking

#include "consensus/pow.hpp"
#include "test_helpers.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace lunachain;
using lunachain::validation::BlockState;
using lunachain::validation::BlockValidationResult;
using lunachain::validation::BlockValidationState;
using lunachain::validation::ChainstateManager;

namespace {

struct ChainFixture {
    crypto::CKey alice_key = test::MakeKey(1);
    crypto::CKey bob_key = test::MakeKey(2);
    std::string alice = alice_key.GetAddress();
    std::string bob = bob_key.GetAddress();
    std::string carol = test::AddressOf(3);

    std::unique_ptr<chain::ChainParams> params;
    std::unique_ptr<ChainstateManager> chainstate;

    explicit ChainFixture(chain::ChainSettings settings = {}) {
        params = test::MakeRegTestParams({{alice, 100}, {bob, 50}}, settings);
        chainstate = std::make_unique<ChainstateManager>(*params, 2);
        REQUIRE(chainstate->Initialize());
    }

    CBlock Child(std::vector<CTransactionRef> txs = {}, uint32_t time_offset = 0) const {
        return test::CreateChild(*params, chainstate->GetTip(), std::move(txs),
                                 test::MinerAddress(), time_offset);
    }

    bool Submit(const CBlock& block, BlockValidationState& state) {
        return chainstate->ProcessNewBlock(block, state);
    }
};

// Loses the parent account state for the first N lookups
class ForgetfulChainstateManager : public ChainstateManager {
public:
    ForgetfulChainstateManager(const chain::ChainParams& params, int failures)
        : ChainstateManager(params, 1), failures_(failures) {}

protected:
    std::shared_ptr<const chain::AccountState>
    GetParentStateWrapper(const chain::CBlockIndex* pindexPrev) const override {
        if (failures_ > 0) {
            --failures_;
            return nullptr;
        }
        return ChainstateManager::GetParentStateWrapper(pindexPrev);
    }

private:
    mutable int failures_;
};

// Search for a nonce whose hash misses the target
void BreakProofOfWork(CBlock& block, const chain::ChainParams& params) {
    while (consensus::CheckProofOfWork(block.GetHeader(), block.nBits, params)) {
        ++block.nNonce;
    }
}

} // namespace

TEST_CASE("Block validation - valid blocks", "[chain][validation]") {
    ChainFixture f;
    const CAmount reward = f.params->GetConsensus().nBlockReward;

    SECTION("Transfers, fees and reward are applied") {
        CBlock block = f.Child({test::MakeTx(f.alice_key, f.carol, 30, 1, 1),
                                test::MakeTx(f.bob_key, f.carol, 10, 2, 1)});
        BlockValidationState state;
        REQUIRE(f.Submit(block, state));
        REQUIRE(state.IsValid());

        REQUIRE(f.chainstate->GetChainHeight() == 1);
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Canonical);
        REQUIRE(f.chainstate->GetBalance(f.alice) == chain::AccountInfo{69, 1});
        REQUIRE(f.chainstate->GetBalance(f.bob) == chain::AccountInfo{38, 1});
        REQUIRE(f.chainstate->GetBalance(f.carol).balance == 40);
        REQUIRE(f.chainstate->GetBalance(test::MinerAddress()).balance == reward + 3);
        REQUIRE(f.chainstate->IsTransactionConfirmed(block.vtx[0]->GetHash()));
    }

    SECTION("Total supply grows by exactly the reward per block") {
        const CAmount genesis_supply = f.params->GenesisState().TotalBalance();
        uint64_t nonce = 0;
        for (int i = 0; i < 5; i++) {
            CBlock block = f.Child({test::MakeTx(f.alice_key, f.carol, 3, 1, ++nonce)});
            BlockValidationState state;
            REQUIRE(f.Submit(block, state));
            REQUIRE(f.chainstate->GetAccountStateSnapshot()->TotalBalance() ==
                    genesis_supply + reward * (i + 1));
        }
        REQUIRE(f.chainstate->GetBalance(f.alice) == chain::AccountInfo{80, 5});
    }

    SECTION("Resubmitting a known block succeeds without changes") {
        CBlock block = f.Child();
        BlockValidationState state;
        REQUIRE(f.Submit(block, state));
        const uint64_t version = f.chainstate->GetTipVersion();

        bool new_tip = true;
        BlockValidationState again;
        REQUIRE(f.chainstate->ProcessNewBlock(block, again, -1, &new_tip));
        REQUIRE_FALSE(new_tip);
        REQUIRE(f.chainstate->GetTipVersion() == version);
        REQUIRE(f.chainstate->GetBlockCount() == 2);
    }

    SECTION("Empty block only pays the miner") {
        CBlock block = f.Child({}, 0);
        BlockValidationState state;
        REQUIRE(f.Submit(block, state));
        REQUIRE(f.chainstate->GetBalance(f.alice) == chain::AccountInfo{100, 0});
        REQUIRE(f.chainstate->GetBlock(block.GetHash())->vtx.empty());
    }
}

TEST_CASE("Block validation - double spends", "[chain][validation]") {
    ChainFixture f;

    SECTION("Same nonce twice in one block") {
        CBlock block = f.Child({test::MakeTx(f.alice_key, f.carol, 30, 1, 1),
                                test::MakeTx(f.alice_key, f.bob, 30, 1, 1)});
        BlockValidationState state;
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_DOUBLE_SPEND);
        REQUIRE(state.GetRejectReason() == "bad-txns-double-spend");

        REQUIRE(f.chainstate->GetChainHeight() == 0);
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Rejected);
        REQUIRE(f.chainstate->GetBalance(f.alice) == chain::AccountInfo{100, 0});
    }

    SECTION("Spending more than the balance across transactions") {
        CBlock block = f.Child({test::MakeTx(f.alice_key, f.carol, 60, 0, 1),
                                test::MakeTx(f.alice_key, f.carol, 60, 0, 2)});
        BlockValidationState state;
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_DOUBLE_SPEND);
    }

    SECTION("Replaying a confirmed nonce in a later block") {
        CTransactionRef tx = test::MakeTx(f.alice_key, f.carol, 10, 0, 1);
        BlockValidationState first;
        REQUIRE(f.Submit(f.Child({tx}), first));

        // Different transaction, same nonce
        CBlock replay = f.Child({test::MakeTx(f.alice_key, f.carol, 11, 0, 1)});
        BlockValidationState state;
        REQUIRE_FALSE(f.Submit(replay, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_DOUBLE_SPEND);
        REQUIRE(f.chainstate->GetBalance(f.alice).nonce == 1);
    }

    SECTION("Rejected blocks are remembered and poison their children") {
        CBlock bad = f.Child({test::MakeTx(f.alice_key, f.carol, 500, 0, 1)});
        BlockValidationState state;
        REQUIRE_FALSE(f.Submit(bad, state));

        BlockValidationState cached;
        REQUIRE_FALSE(f.Submit(bad, cached));
        REQUIRE(cached.GetResult() == BlockValidationResult::BLOCK_CACHED_INVALID);
        REQUIRE(cached.GetRejectReason() == "duplicate-invalid");

        CBlock child = test::CreateChild(*f.params, bad.GetHeader());
        BlockValidationState child_state;
        REQUIRE_FALSE(f.Submit(child, child_state));
        REQUIRE(child_state.GetRejectReason() == "bad-prevblk");
        REQUIRE(f.chainstate->GetBlockState(child.GetHash()) == BlockState::Rejected);
    }
}

TEST_CASE("Block validation - structural errors", "[chain][validation]") {
    ChainFixture f;
    BlockValidationState state;

    SECTION("Merkle root mismatch is not recorded") {
        CBlock block = f.Child({test::MakeTx(f.alice_key, f.carol, 30, 1, 1)});
        CBlock tampered = block;
        tampered.vtx.push_back(test::MakeTx(f.bob_key, f.carol, 5, 0, 1));
        test::FinalizeBlock(tampered, *f.params, false);

        REQUIRE_FALSE(f.Submit(tampered, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_STRUCTURAL);
        REQUIRE(state.GetRejectReason() == "bad-txnmrklroot");
        REQUIRE(f.chainstate->GetBlockState(tampered.GetHash()) == BlockState::Unknown);
    }

    SECTION("Duplicate transaction") {
        CTransactionRef tx = test::MakeTx(f.alice_key, f.carol, 30, 1, 1);
        CBlock block = f.Child({tx, tx});
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "bad-txns-duplicate");
    }

    SECTION("Malformed transaction marks the block failed") {
        CMutableTransaction mtx;
        mtx.sender = f.alice;
        mtx.recipient = f.carol;
        mtx.amount = 0;
        mtx.nonce = 1;
        mtx.sender_pubkey = f.alice_key.GetPubKey();
        mtx.signature = f.alice_key.Sign(mtx.GetSignatureHash());
        CBlock block = f.Child({MakeTransactionRef(std::move(mtx))});

        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_STRUCTURAL);
        REQUIRE(state.GetRejectReason() == "bad-txns-malformed");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Rejected);
    }

    SECTION("Forged signature") {
        CTransactionRef honest = test::MakeTx(f.alice_key, f.carol, 30, 1, 1);
        CMutableTransaction mtx;
        mtx.sender = honest->sender;
        mtx.recipient = f.bob;
        mtx.amount = honest->amount;
        mtx.fee = honest->fee;
        mtx.nonce = honest->nonce;
        mtx.timestamp = honest->timestamp;
        mtx.sender_pubkey = honest->sender_pubkey;
        mtx.signature = honest->signature;
        CBlock block = f.Child({MakeTransactionRef(std::move(mtx))});

        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_STRUCTURAL);
        REQUIRE(state.GetRejectReason() == "bad-txns-invalid");
    }

    SECTION("Version below 1") {
        CBlock block = f.Child();
        block.nVersion = 0;
        test::FinalizeBlock(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "bad-version");
    }

    SECTION("Transaction count limit") {
        chain::ChainSettings settings;
        settings.max_block_transactions = 1;
        ChainFixture small(settings);
        CBlock block = small.Child({test::MakeTx(small.alice_key, small.carol, 1, 0, 1),
                                    test::MakeTx(small.alice_key, small.carol, 1, 0, 2)});
        REQUIRE_FALSE(small.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "bad-blk-tx-count");
    }

    SECTION("Serialized size limit") {
        chain::ChainSettings settings;
        settings.max_block_bytes = CBlockHeader::HEADER_SIZE + 50;
        ChainFixture small(settings);
        CBlock block = small.Child({test::MakeTx(small.alice_key, small.carol, 1, 0, 1)});
        REQUIRE_FALSE(small.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "bad-blk-length");
    }
}

TEST_CASE("Block validation - proof of work and context", "[chain][validation]") {
    ChainFixture f;
    BlockValidationState state;

    SECTION("Hash above target leaves no trace") {
        CBlock block = f.Child();
        BreakProofOfWork(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_INVALID_POW);
        REQUIRE(state.GetRejectReason() == "high-hash");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Unknown);
        REQUIRE(f.chainstate->GetBlockCount() == 1);
    }

    SECTION("Wrong difficulty bits") {
        CBlock block = f.Child();
        block.nBits = 0x1f7fffff;
        test::FinalizeBlock(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetResult() == BlockValidationResult::BLOCK_INVALID_POW);
        REQUIRE(state.GetRejectReason() == "bad-diffbits");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Unknown);
    }

    SECTION("Height must follow the parent") {
        CBlock block = f.Child();
        block.nHeight = 5;
        test::FinalizeBlock(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "bad-height");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Rejected);
    }

    SECTION("Timestamp not after median time past") {
        CBlock block = f.Child();
        block.nTime = f.params->GenesisBlock().nTime;
        test::FinalizeBlock(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "time-too-old");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Rejected);
    }

    SECTION("Timestamp too far in the future may become valid later") {
        const int64_t now = f.params->GenesisBlock().nTime + 10000;
        util::MockTimeScope mock(now);

        CBlock block = f.Child();
        block.nTime = static_cast<uint32_t>(now + 3 * 60 * 60);
        test::FinalizeBlock(block, *f.params);
        REQUIRE_FALSE(f.Submit(block, state));
        REQUIRE(state.GetRejectReason() == "time-too-new");
        REQUIRE(f.chainstate->GetBlockState(block.GetHash()) == BlockState::Unknown);

        util::SetMockTime(now + 2 * 60 * 60);
        BlockValidationState later;
        REQUIRE(f.Submit(block, later));
    }
}

TEST_CASE("Block validation - local failures", "[chain][validation]") {
    crypto::CKey alice_key = test::MakeKey(1);
    auto params = test::MakeRegTestParams({{alice_key.GetAddress(), 100}});
    ForgetfulChainstateManager chainstate(*params, 1);
    REQUIRE(chainstate.Initialize());

    CBlock block = test::CreateChild(*params, chainstate.GetTip(),
                                     {test::MakeTx(alice_key, test::AddressOf(3), 10, 1, 1)},
                                     test::MinerAddress());

    SECTION("Missing parent state is an error and leaves no index entry") {
        BlockValidationState state;
        REQUIRE_FALSE(chainstate.ProcessNewBlock(block, state));
        REQUIRE(state.IsError());
        REQUIRE(state.GetRejectReason() == "missing-parent-state");
        REQUIRE(chainstate.LookupBlockIndex(block.GetHash()) == nullptr);
        REQUIRE(chainstate.GetBlockState(block.GetHash()) == BlockState::Unknown);
        REQUIRE(chainstate.GetChainHeight() == 0);
    }

    SECTION("The same block is accepted once the state is available") {
        BlockValidationState first;
        REQUIRE_FALSE(chainstate.ProcessNewBlock(block, first));

        BlockValidationState second;
        REQUIRE(chainstate.ProcessNewBlock(block, second));
        REQUIRE(second.IsValid());
        REQUIRE(chainstate.GetChainHeight() == 1);
        REQUIRE(chainstate.GetBlockState(block.GetHash()) == BlockState::Canonical);
    }
}
