// Copyright (c) 2024 LunaChain
// Tests for compact targets, retargeting and proof-of-work checks

#include "chain/arith_uint256.hpp"
#include "chain/block_index.hpp"
#include "chain/chainparams.hpp"
#include "consensus/pow.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace lunachain;
using namespace lunachain::consensus;
using lunachain::chain::CBlockIndex;
using lunachain::chain::ChainSettings;

namespace {

// Regtest parameters with windowed retargeting switched on
std::unique_ptr<chain::ChainParams> MakeRetargetParams(int32_t window = 10) {
    ChainSettings settings;
    settings.pow_no_retargeting = false;
    settings.retarget_window = window;
    settings.target_block_interval = 120;
    settings.max_retarget_factor = 4;
    return chain::ChainParams::CreateRegTest(settings);
}

// Chain of `length` indices at constant bits, `spacing` seconds apart
void BuildIndexChain(std::vector<CBlockIndex>& chain, uint32_t nBits, uint32_t spacing) {
    for (size_t i = 0; i < chain.size(); i++) {
        chain[i].nHeight = static_cast<int>(i);
        chain[i].nBits = nBits;
        chain[i].nTime = 1000000 + static_cast<uint32_t>(i) * spacing;
        if (i > 0) {
            chain[i].pprev = &chain[i - 1];
        }
        chain[i].BuildSkip();
    }
}

} // namespace

TEST_CASE("Compact target encoding", "[pow]") {
    SECTION("Known values") {
        REQUIRE(SetCompact(0x1d00ffff) == (arith_uint256(0xffff) << 208));
        REQUIRE(SetCompact(0x207fffff) == (arith_uint256(0x7fffff) << 232));
        REQUIRE(SetCompact(0x01003456) == 0);
        REQUIRE(SetCompact(0x03123456) == 0x123456);
    }

    SECTION("Round trip of normalized values") {
        for (uint32_t bits : {0x1d00ffffu, 0x1b0404cbu, 0x207fffffu, 0x1f0fffffu}) {
            REQUIRE(GetCompact(SetCompact(bits)) == bits);
        }
    }

    SECTION("Sign and overflow flags") {
        bool negative = false;
        bool overflow = false;
        SetCompact(0x04923456, &negative, &overflow);
        REQUIRE(negative);
        REQUIRE_FALSE(overflow);

        SetCompact(0xff123456, &negative, &overflow);
        REQUIRE(overflow);

        REQUIRE(GetTargetFromBits(0x04923456) == 0);
        REQUIRE(GetTargetFromBits(0xff123456) == 0);
        REQUIRE(GetTargetFromBits(0) == 0);
    }

    SECTION("Encoding keeps the mantissa positive") {
        // 0x80 in the top mantissa byte would read as a sign bit
        REQUIRE(GetCompact(arith_uint256(0x80)) == 0x02008000);
        REQUIRE(SetCompact(0x02008000) == 0x80);
    }

    SECTION("Bits counts significant bits") {
        REQUIRE(Bits(arith_uint256(0)) == 0);
        REQUIRE(Bits(arith_uint256(1)) == 1);
        REQUIRE(Bits(arith_uint256(1) << 200) == 201);
    }
}

TEST_CASE("CalculateNextWorkRequired - retarget step", "[pow]") {
    auto params = MakeRetargetParams();
    const auto& consensus = params->GetConsensus();
    const int64_t expected = consensus.nPowTargetSpacing * consensus.nRetargetWindow;
    const uint32_t start_bits = 0x1d00ffff;
    const arith_uint256 start = SetCompact(start_bits);

    SECTION("On-schedule window keeps the target") {
        REQUIRE(CalculateNextWorkRequired(start_bits, expected, consensus) == start_bits);
    }

    SECTION("Fast blocks make it harder") {
        uint32_t bits = CalculateNextWorkRequired(start_bits, expected / 2, consensus);
        REQUIRE(SetCompact(bits) < start);
        REQUIRE(SetCompact(bits) == start / 2);
    }

    SECTION("Slow blocks make it easier") {
        uint32_t bits = CalculateNextWorkRequired(start_bits, expected * 2, consensus);
        REQUIRE(SetCompact(bits) > start);
    }

    SECTION("Adjustment is clamped to the retarget factor") {
        REQUIRE(CalculateNextWorkRequired(start_bits, expected * 100, consensus) ==
                CalculateNextWorkRequired(start_bits, expected * 4, consensus));
        REQUIRE(CalculateNextWorkRequired(start_bits, 0, consensus) ==
                CalculateNextWorkRequired(start_bits, expected / 4, consensus));
        REQUIRE(CalculateNextWorkRequired(start_bits, -5000, consensus) ==
                CalculateNextWorkRequired(start_bits, expected / 4, consensus));
        REQUIRE(SetCompact(CalculateNextWorkRequired(start_bits, expected * 4, consensus)) ==
                start * 4);
    }

    SECTION("Never easier than the pow limit") {
        uint32_t limit_bits = GetCompact(UintToArith256(consensus.powLimit));
        REQUIRE(CalculateNextWorkRequired(limit_bits, expected * 4, consensus) == limit_bits);
    }
}

TEST_CASE("GetNextWorkRequired - windows", "[pow]") {
    const uint32_t start_bits = 0x1f00ffff;

    SECTION("Genesis gets the pow limit") {
        auto params = MakeRetargetParams();
        REQUIRE(GetNextWorkRequired(nullptr, *params) ==
                GetCompact(UintToArith256(params->GetConsensus().powLimit)));
    }

    SECTION("Target is constant inside a window") {
        auto params = MakeRetargetParams(10);
        std::vector<CBlockIndex> chain(5);
        BuildIndexChain(chain, start_bits, 10);
        REQUIRE(GetNextWorkRequired(&chain[4], *params) == start_bits);
    }

    SECTION("First block of a window retargets") {
        auto params = MakeRetargetParams(10);

        std::vector<CBlockIndex> fast(10);
        BuildIndexChain(fast, start_bits, 60);
        uint32_t harder = GetNextWorkRequired(&fast[9], *params);
        REQUIRE(SetCompact(harder) < SetCompact(start_bits));
        // The first window starts at genesis: heights 0..9
        REQUIRE(harder == CalculateNextWorkRequired(start_bits, 9 * 60, params->GetConsensus()));

        std::vector<CBlockIndex> slow(10);
        BuildIndexChain(slow, start_bits, 240);
        uint32_t easier = GetNextWorkRequired(&slow[9], *params);
        REQUIRE(SetCompact(easier) > SetCompact(start_bits));
    }

    SECTION("On-target spacing keeps the target") {
        auto params = MakeRetargetParams(10);
        const uint32_t bits = 0x1d00ffff;
        std::vector<CBlockIndex> chain(31);
        BuildIndexChain(chain, bits, 120);
        REQUIRE(GetNextWorkRequired(&chain[19], *params) == bits);
        REQUIRE(GetNextWorkRequired(&chain[29], *params) == bits);
    }

    SECTION("A full window spans window intervals") {
        auto params = MakeRetargetParams(10);
        std::vector<CBlockIndex> chain(20);
        BuildIndexChain(chain, start_bits, 60);
        // Heights 9..19: ten intervals of 60 seconds
        REQUIRE(GetNextWorkRequired(&chain[19], *params) ==
                CalculateNextWorkRequired(start_bits, 10 * 60, params->GetConsensus()));
    }

    SECTION("Regtest never retargets") {
        auto params = test::MakeRegTestParams();
        std::vector<CBlockIndex> chain(200);
        BuildIndexChain(chain, 0x207fffff, 1);
        for (int h : {0, 143, 199}) {
            REQUIRE(GetNextWorkRequired(&chain[h], *params) == 0x207fffff);
        }
    }
}

TEST_CASE("CheckProofOfWork", "[pow]") {
    auto params = test::MakeRegTestParams();
    const uint256& limit = params->GetConsensus().powLimit;

    uint256 zero;
    uint256 max;
    REQUIRE(max.SetHex(std::string(64, 'f')));

    SECTION("Hash compared against the target") {
        REQUIRE(CheckProofOfWork(zero, 0x207fffff, limit));
        REQUIRE_FALSE(CheckProofOfWork(max, 0x207fffff, limit));
    }

    SECTION("Targets above the limit are rejected") {
        ChainSettings settings;
        settings.pow_limit_bits = 0x1d00ffff;
        auto strict = chain::ChainParams::CreateRegTest(settings);
        REQUIRE_FALSE(CheckProofOfWork(zero, 0x207fffff, strict->GetConsensus().powLimit));
        REQUIRE(CheckProofOfWork(zero, 0x1d00ffff, strict->GetConsensus().powLimit));
    }

    SECTION("Invalid bits are rejected") {
        REQUIRE_FALSE(CheckProofOfWork(zero, 0, limit));
        REQUIRE_FALSE(CheckProofOfWork(zero, 0x04923456, limit));
        REQUIRE_FALSE(CheckProofOfWork(zero, 0xff123456, limit));
    }

    SECTION("Mined headers pass with the network hasher") {
        CBlock block = test::CreateChild(*params, params->GenesisBlock());
        REQUIRE(CheckProofOfWork(block.GetHeader(), block.nBits, *params));
        // SHA256d hasher: the PoW hash is the block hash
        REQUIRE(params->GetPowHasher().Hash(block.GetHeader()) == block.GetHash());
    }

    SECTION("Difficulty is relative to the limit") {
        REQUIRE(GetDifficulty(0x207fffff, *params) == 1.0);
        REQUIRE(GetDifficulty(0x1f7fffff, *params) > 1.0);
        REQUIRE(GetDifficulty(0, *params) == 0.0);
    }
}
