// Copyright (c) 2024 LunaChain
// Test suite for chain parameters and genesis construction

#include "chain/arith_uint256.hpp"
#include "chain/chainparams.hpp"
#include "consensus/pow.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <stdexcept>

using namespace lunachain;
using namespace lunachain::chain;

TEST_CASE("ChainParams creation", "[chainparams]") {
    SECTION("Create MainNet") {
        auto params = ChainParams::CreateMainNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::MAIN);
        REQUIRE(params->GetChainTypeString() == "main");

        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.nPowTargetSpacing == 120);
        REQUIRE(consensus.nRetargetWindow == 144);
        REQUIRE(consensus.nMaxRetargetFactor == 4);
        REQUIRE(consensus.nRandomXEpochDuration == 7 * 24 * 60 * 60);
        REQUIRE(consensus.powAlgorithm == crypto::PowAlgorithm::RANDOMX);
        REQUIRE_FALSE(consensus.fPowNoRetargeting);
    }

    SECTION("Create TestNet") {
        auto params = ChainParams::CreateTestNet();
        REQUIRE(params->GetChainType() == ChainType::TESTNET);
        REQUIRE(params->GetChainTypeString() == "test");
        REQUIRE(params->GetConsensus().powAlgorithm == crypto::PowAlgorithm::RANDOMX);
    }

    SECTION("Create RegTest") {
        auto params = ChainParams::CreateRegTest();
        REQUIRE(params->GetChainType() == ChainType::REGTEST);
        REQUIRE(params->GetChainTypeString() == "regtest");

        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.powAlgorithm == crypto::PowAlgorithm::SHA256D);
        REQUIRE(consensus.fPowNoRetargeting);
        REQUIRE(GetCompact(UintToArith256(consensus.powLimit)) == 0x207fffff);
    }

    SECTION("Networks have distinct genesis blocks") {
        auto main = ChainParams::CreateMainNet();
        auto test = ChainParams::CreateTestNet();
        auto reg = ChainParams::CreateRegTest();
        REQUIRE(main->GetConsensus().hashGenesisBlock != test->GetConsensus().hashGenesisBlock);
        REQUIRE(test->GetConsensus().hashGenesisBlock != reg->GetConsensus().hashGenesisBlock);
    }
}

TEST_CASE("ChainParams - genesis block", "[chainparams]") {
    auto params = ChainParams::CreateRegTest();
    const CBlock& genesis = params->GenesisBlock();

    REQUIRE(genesis.nHeight == 0);
    REQUIRE(genesis.hashPrevBlock.IsNull());
    REQUIRE(genesis.vtx.empty());
    REQUIRE(genesis.nTime == 1296688602);
    REQUIRE(genesis.GetHash() == params->GetConsensus().hashGenesisBlock);
    REQUIRE(params->GenesisState().Size() == 0);
}

TEST_CASE("ChainParams - genesis allocations", "[chainparams]") {
    const std::string alice = test::AddressOf(1);
    const std::string bob = test::AddressOf(2);

    SECTION("Allocations fund the genesis state") {
        auto params = test::MakeRegTestParams({{alice, 100}, {bob, 250}});

        REQUIRE(params->GenesisState().Get(alice).balance == 100);
        REQUIRE(params->GenesisState().Get(bob).balance == 250);
        REQUIRE(params->GenesisState().Get(alice).nonce == 0);
        REQUIRE(params->GenesisState().TotalBalance() == 350);
    }

    SECTION("Allocations change the genesis hash") {
        auto empty = test::MakeRegTestParams();
        auto funded = test::MakeRegTestParams({{alice, 100}});
        REQUIRE(empty->GetConsensus().hashGenesisBlock !=
                funded->GetConsensus().hashGenesisBlock);
        REQUIRE(funded->GenesisBlock().hashMerkleRoot ==
                GenesisAllocationsRoot({{alice, 100}}));
    }

    SECTION("Address spelling does not change the commitment") {
        std::string shouting = alice;
        for (auto& c : shouting) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        auto a = test::MakeRegTestParams({{alice, 100}});
        auto b = test::MakeRegTestParams({{"  " + shouting + " ", 100}});
        REQUIRE(a->GetConsensus().hashGenesisBlock == b->GetConsensus().hashGenesisBlock);
        REQUIRE(b->GenesisState().Get(alice).balance == 100);
    }

    SECTION("Repeated addresses accumulate") {
        auto params = test::MakeRegTestParams({{alice, 10}, {alice, 5}});
        REQUIRE(params->GenesisState().Get(alice).balance == 15);
    }
}

TEST_CASE("ChainParams - settings validation", "[chainparams]") {
    SECTION("Overrides flow into consensus") {
        ChainSettings settings;
        settings.target_block_interval = 30;
        settings.retarget_window = 10;
        settings.max_retarget_factor = 2;
        settings.block_reward = 7 * COIN;
        auto params = ChainParams::CreateRegTest(settings);

        REQUIRE(params->GetConsensus().nPowTargetSpacing == 30);
        REQUIRE(params->GetConsensus().nRetargetWindow == 10);
        REQUIRE(params->GetConsensus().nMaxRetargetFactor == 2);
        REQUIRE(params->GetConsensus().nBlockReward == 7 * COIN);
        REQUIRE(params->GetSettings().target_block_interval == 30);
    }

    SECTION("Custom pow limit") {
        ChainSettings settings;
        settings.pow_limit_bits = 0x1d00ffff;
        auto params = ChainParams::CreateRegTest(settings);
        REQUIRE(params->GenesisBlock().nBits == 0x1d00ffff);
    }

    SECTION("Unusable settings throw") {
        ChainSettings bad_interval;
        bad_interval.target_block_interval = 0;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_interval), std::invalid_argument);

        ChainSettings bad_window;
        bad_window.retarget_window = -1;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_window), std::invalid_argument);

        ChainSettings bad_factor;
        bad_factor.max_retarget_factor = 0;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_factor), std::invalid_argument);

        ChainSettings bad_limit;
        bad_limit.pow_limit_bits = 0x00800000;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_limit), std::invalid_argument);

        ChainSettings bad_mempool;
        bad_mempool.mempool_max_entries = 0;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_mempool), std::invalid_argument);

        REQUIRE_THROWS_AS(test::MakeRegTestParams({{"not-an-address", 10}}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(test::MakeRegTestParams({{test::AddressOf(1), 0}}),
                          std::invalid_argument);
    }

    SECTION("Unusable admission policy throws") {
        ChainSettings zero_min;
        zero_min.min_tx_amount = 0;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(zero_min), std::invalid_argument);

        ChainSettings inverted;
        inverted.min_tx_amount = 100;
        inverted.max_tx_amount = 99;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(inverted), std::invalid_argument);

        ChainSettings negative_fee;
        negative_fee.min_tx_fee = -1;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(negative_fee), std::invalid_argument);

        ChainSettings bad_window;
        bad_window.rate_limit_window_seconds = 0;
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_window), std::invalid_argument);

        ChainSettings bad_blacklist;
        bad_blacklist.blacklisted_addresses = {"nobody"};
        REQUIRE_THROWS_AS(ChainParams::CreateRegTest(bad_blacklist), std::invalid_argument);
    }
}

TEST_CASE("ChainParams - mempool policy", "[chainparams][policy]") {
    SECTION("Public networks") {
        auto main = ChainParams::CreateMainNet();
        auto testnet = ChainParams::CreateTestNet();
        for (const ChainParams* params : {main.get(), testnet.get()}) {
            const MempoolPolicy& policy = params->GetMempoolPolicy();
            REQUIRE(policy.nMinTxAmount == COIN / 1'000'000);
            REQUIRE(policy.nMaxTxAmount == 100'000'000 * COIN);
            REQUIRE(policy.nMinTxFee == COIN / 100'000);
            REQUIRE(policy.nRateLimitMaxTxs == 10);
            REQUIRE(policy.nRateLimitWindow == 60);
            REQUIRE(policy.blacklist.empty());
        }
    }

    SECTION("Regtest is permissive") {
        const MempoolPolicy& policy = ChainParams::CreateRegTest()->GetMempoolPolicy();
        REQUIRE(policy.nMinTxAmount == 1);
        REQUIRE(policy.nMaxTxAmount == MAX_MONEY);
        REQUIRE(policy.nMinTxFee == 0);
        REQUIRE(policy.nRateLimitMaxTxs == 0);
    }

    SECTION("Overrides and address normalization") {
        ChainSettings settings;
        settings.min_tx_fee = 0;
        settings.rate_limit_max_txs = 0;
        std::string address = test::AddressOf(7);
        std::string shouted = address;
        for (size_t i = 4; i < shouted.size(); i++) {
            shouted[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(shouted[i])));
        }
        settings.blacklisted_addresses = {shouted};

        auto params = ChainParams::CreateMainNet(settings);
        const MempoolPolicy& policy = params->GetMempoolPolicy();
        REQUIRE(policy.nMinTxFee == 0);
        REQUIRE(policy.nRateLimitMaxTxs == 0);
        REQUIRE(policy.nMinTxAmount == COIN / 1'000'000);
        REQUIRE(policy.blacklist.count(address) == 1);
    }
}
