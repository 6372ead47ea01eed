// Copyright (c) 2024 LunaChain
// Block assembly and CPU mining against a live chainstate and mempool

#include "mempool/txmempool.hpp"
#include "mining/block_assembler.hpp"
#include "mining/miner.hpp"
#include "test_chainstate_manager.hpp"
#include "test_helpers.hpp"
#include "validation/chainstate_manager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace lunachain;
using lunachain::mempool::CTxMemPool;
using lunachain::mempool::MempoolAcceptResult;
using lunachain::mining::BlockAssembler;
using lunachain::mining::CPUMiner;
using lunachain::validation::ChainstateManager;

namespace {

struct MinerFixture {
    crypto::CKey alice_key = test::MakeKey(1);
    std::string alice = alice_key.GetAddress();
    std::string bob = test::AddressOf(2);
    std::string miner = test::MinerAddress();

    std::unique_ptr<chain::ChainParams> params;
    std::unique_ptr<ChainstateManager> chainstate;
    std::unique_ptr<CTxMemPool> mempool;

    MinerFixture() {
        params = test::MakeRegTestParams({{alice, 100}});
        chainstate = std::make_unique<ChainstateManager>(*params, 2);
        REQUIRE(chainstate->Initialize());
        mempool = std::make_unique<CTxMemPool>(*chainstate);
    }
};

} // namespace

TEST_CASE("BlockAssembler - templates", "[mining]") {
    MinerFixture f;
    BlockAssembler assembler(*f.params, *f.chainstate, f.mempool.get());

    SECTION("Empty mempool gives an empty block on the tip") {
        auto tmpl = assembler.CreateNewBlock(f.miner);
        REQUIRE(tmpl.has_value());
        REQUIRE(tmpl->nHeight == 1);
        REQUIRE(tmpl->hashPrevBlock == f.params->GenesisBlock().GetHash());
        REQUIRE(tmpl->block.vtx.empty());
        REQUIRE(tmpl->fees == 0);
        REQUIRE(tmpl->tip_version == f.chainstate->GetTipVersion());
        REQUIRE(tmpl->block.GetMinerAddress() == f.miner);
        REQUIRE(tmpl->block.nTime > f.params->GenesisBlock().nTime);
    }

    SECTION("Pending transactions are included in nonce order") {
        REQUIRE(f.mempool->Admit(test::MakeTx(f.alice_key, f.bob, 10, 1, 1)).IsOk());
        REQUIRE(f.mempool->Admit(test::MakeTx(f.alice_key, f.bob, 10, 3, 2)).IsOk());

        auto tmpl = assembler.CreateNewBlock(f.miner);
        REQUIRE(tmpl.has_value());
        REQUIRE(tmpl->block.vtx.size() == 2);
        REQUIRE(tmpl->block.vtx[0]->nonce == 1);
        REQUIRE(tmpl->block.vtx[1]->nonce == 2);
        REQUIRE(tmpl->fees == 4);
        REQUIRE(tmpl->block.hashMerkleRoot == BlockMerkleRoot(tmpl->block));
    }

    SECTION("Malformed miner address") {
        REQUIRE_FALSE(assembler.CreateNewBlock("not-an-address").has_value());
    }

    SECTION("Without a mempool") {
        BlockAssembler bare(*f.params, *f.chainstate, nullptr);
        auto tmpl = bare.CreateNewBlock(f.miner);
        REQUIRE(tmpl.has_value());
        REQUIRE(tmpl->block.vtx.empty());
    }
}

TEST_CASE("CPUMiner - mined blocks go through validation", "[mining]") {
    MinerFixture f;
    CPUMiner cpu(*f.params, *f.chainstate, f.mempool.get(), f.miner);

    SECTION("Single block") {
        auto block = cpu.MineBlock();
        REQUIRE(block.has_value());
        REQUIRE(f.chainstate->GetChainHeight() == 1);
        REQUIRE(f.chainstate->GetTip()->GetBlockHash() == block->GetHash());
        REQUIRE(f.chainstate->GetBalance(f.miner).balance ==
                f.params->GetConsensus().nBlockReward);
        REQUIRE(cpu.GetBlocksFound() == 1);
        REQUIRE(cpu.GetTotalHashes() >= 1);
    }

    SECTION("Transfer is confirmed and leaves the mempool") {
        CTransactionRef tx = test::MakeTx(f.alice_key, f.bob, 30, 1, 1);
        REQUIRE(f.mempool->Admit(tx).IsOk());

        MempoolAcceptResult again = f.mempool->Admit(tx);
        REQUIRE(again.m_result_type == MempoolAcceptResult::ResultType::DUPLICATE_TX);

        auto block = cpu.MineBlock();
        REQUIRE(block.has_value());
        REQUIRE(block->vtx.size() == 1);

        REQUIRE(f.chainstate->GetBalance(f.alice) == chain::AccountInfo{69, 1});
        REQUIRE(f.chainstate->GetBalance(f.bob).balance == 30);
        REQUIRE(f.chainstate->GetBalance(f.miner).balance ==
                f.params->GetConsensus().nBlockReward + 1);
        REQUIRE(f.mempool->Size() == 0);

        MempoolAcceptResult confirmed = f.mempool->Admit(tx);
        REQUIRE(confirmed.m_result_type == MempoolAcceptResult::ResultType::DUPLICATE_TX);
        REQUIRE(confirmed.m_state.GetRejectReason() == "txn-already-confirmed");
    }

    SECTION("Consecutive blocks extend the chain") {
        for (int i = 0; i < 3; i++) {
            REQUIRE(cpu.MineBlock().has_value());
        }
        REQUIRE(f.chainstate->GetChainHeight() == 3);
        REQUIRE(cpu.GetBlocksFound() == 3);
    }

    SECTION("Stopped miner returns nothing until reset") {
        cpu.Stop();
        REQUIRE_FALSE(cpu.MineBlock().has_value());
        REQUIRE(f.chainstate->GetChainHeight() == 0);

        cpu.ResetInterrupt();
        REQUIRE(cpu.MineBlock().has_value());
    }
}

TEST_CASE("CPUMiner - background workers", "[mining]") {
    SECTION("Workers find blocks until stopped") {
        MinerFixture f;
        CPUMiner cpu(*f.params, *f.chainstate, nullptr, f.miner);
        REQUIRE(cpu.Start(2));
        REQUIRE(cpu.IsMining());
        REQUIRE_FALSE(cpu.Start(1));

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (f.chainstate->GetChainHeight() < 3 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(cpu.GetTotalHashes() > 0);
        REQUIRE(cpu.GetHashrate() >= 0.0);

        cpu.Stop();
        REQUIRE_FALSE(cpu.IsMining());
        REQUIRE(cpu.GetHashrate() == 0.0);
        REQUIRE(f.chainstate->GetChainHeight() >= 3);
    }

    SECTION("Template is rebuilt when another block arrives") {
        // Target too hard to hit, so only the external block moves the tip
        chain::ChainSettings settings;
        settings.pow_limit_bits = 0x1d00ffff;
        auto params = test::MakeRegTestParams({}, settings);
        test::TestChainstateManager chainstate(*params);
        REQUIRE(chainstate.Initialize());

        CPUMiner cpu(*params, chainstate, nullptr, test::MinerAddress());
        REQUIRE(cpu.Start(1));

        // Let the worker build its first template
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (cpu.GetTotalHashes() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        CBlock external = test::CreateChild(*params, params->GenesisBlock().GetHeader(), {},
                                            test::AddressOf(9), 0, false);
        REQUIRE(test::Submit(chainstate, external));

        while (cpu.GetTemplateRestarts() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        cpu.Stop();

        REQUIRE(cpu.GetTemplateRestarts() >= 1);
        REQUIRE(cpu.GetBlocksFound() == 0);
        REQUIRE(chainstate.GetTip()->GetBlockHash() == external.GetHash());
    }
}
