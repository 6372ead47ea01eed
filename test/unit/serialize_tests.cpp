// Copyright (c) 2024 LunaChain
// Wire format tests for DataStream, transactions and blocks

#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "test_helpers.hpp"
#include "util/serialize.hpp"
#include <catch2/catch_test_macros.hpp>
#include <ios>

using namespace lunachain;

TEST_CASE("DataStream - integers and CompactSize", "[serialize]") {
    SECTION("Integers are little-endian") {
        DataStream s;
        s.WriteInt<uint32_t>(0x01020304);
        REQUIRE(s.data() == std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01});
        REQUIRE(s.ReadInt<uint32_t>() == 0x01020304);
        REQUIRE(s.empty());
    }

    SECTION("CompactSize boundaries") {
        DataStream s;
        s.WriteCompactSize(252);
        s.WriteCompactSize(253);
        s.WriteCompactSize(0x10000);
        REQUIRE(s.data().size() == 1 + 3 + 5);
        REQUIRE(s.ReadCompactSize() == 252);
        REQUIRE(s.ReadCompactSize() == 253);
        REQUIRE(s.ReadCompactSize() == 0x10000);
    }

    SECTION("Non-canonical CompactSize is rejected") {
        DataStream s(std::vector<uint8_t>{253, 0x10, 0x00});
        REQUIRE_THROWS_AS(s.ReadCompactSize(), std::ios_base::failure);
    }

    SECTION("Oversized length prefix is rejected") {
        DataStream s;
        s.WriteCompactSize(MAX_SERIALIZED_SIZE + 1);
        REQUIRE_THROWS_AS(s.ReadCompactSize(), std::ios_base::failure);
    }

    SECTION("Reading past the end throws") {
        DataStream s(std::vector<uint8_t>{0x01, 0x02});
        REQUIRE_THROWS_AS(s.ReadInt<uint32_t>(), std::ios_base::failure);

        DataStream str(std::vector<uint8_t>{0x05, 'a', 'b'});
        REQUIRE_THROWS_AS(str.ReadString(), std::ios_base::failure);
    }
}

TEST_CASE("Transaction serialization", "[serialize][transaction]") {
    crypto::CKey key = test::MakeKey(1);
    CTransactionRef tx = test::MakeTx(key, test::AddressOf(2), 30, 1, 1);

    SECTION("Deserialized transaction has the same identity") {
        DataStream s;
        s << *tx;
        REQUIRE(s.data().size() == tx->GetTotalSize());

        CTransactionRef copy = DeserializeTransaction(s);
        REQUIRE(s.empty());
        REQUIRE(copy->GetHash() == tx->GetHash());
        REQUIRE(copy->sender == tx->sender);
        REQUIRE(copy->signature == tx->signature);
    }

    SECTION("Signature hash ignores the signature") {
        CMutableTransaction mtx;
        mtx.sender = tx->sender;
        mtx.recipient = tx->recipient;
        mtx.amount = tx->amount;
        mtx.fee = tx->fee;
        mtx.nonce = tx->nonce;
        mtx.timestamp = tx->timestamp;
        mtx.sender_pubkey = tx->sender_pubkey;

        REQUIRE(mtx.GetSignatureHash() == tx->GetSignatureHash());
        mtx.signature = {0x01};
        REQUIRE(mtx.GetSignatureHash() == tx->GetSignatureHash());
        REQUIRE(CTransaction(mtx).GetHash() != tx->GetHash());

        mtx.amount += 1;
        REQUIRE(mtx.GetSignatureHash() != tx->GetSignatureHash());
    }

    SECTION("Truncated transaction throws") {
        DataStream s;
        s << *tx;
        std::vector<uint8_t> bytes = s.data();
        bytes.resize(bytes.size() - 3);
        DataStream truncated(bytes);
        REQUIRE_THROWS_AS(DeserializeTransaction(truncated), std::ios_base::failure);
    }
}

TEST_CASE("Block serialization", "[serialize][block]") {
    auto params = test::MakeRegTestParams();
    crypto::CKey key = test::MakeKey(1);
    CBlock block = test::CreateChild(
        *params, params->GenesisBlock(),
        {test::MakeTx(key, test::AddressOf(2), 5, 0, 1),
         test::MakeTx(key, test::AddressOf(3), 6, 0, 2)});

    SECTION("Header is exactly 108 bytes") {
        STATIC_REQUIRE(CBlockHeader::HEADER_SIZE == 108);
        CBlockHeader::HeaderBytes bytes = block.SerializeFixed();

        CBlockHeader decoded;
        REQUIRE(decoded.Deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded.GetHash() == block.GetHash());
        REQUIRE(decoded.nHeight == block.nHeight);
        REQUIRE(decoded.minerAddress == block.minerAddress);
        REQUIRE(decoded.GetMinerAddress() == test::MinerAddress());

        REQUIRE_FALSE(decoded.Deserialize(bytes.data(), bytes.size() - 1));
    }

    SECTION("Full block round trip") {
        std::vector<uint8_t> raw = SerializeBlock(block);
        REQUIRE(raw.size() == block.GetSerializedSize());

        CBlock decoded = DeserializeBlock(raw);
        REQUIRE(decoded.GetHash() == block.GetHash());
        REQUIRE(decoded.vtx.size() == 2);
        REQUIRE(BlockMerkleRoot(decoded) == block.hashMerkleRoot);
    }

    SECTION("Trailing bytes are rejected") {
        std::vector<uint8_t> raw = SerializeBlock(block);
        raw.push_back(0x00);
        REQUIRE_THROWS_AS(DeserializeBlock(raw), std::ios_base::failure);
    }

    SECTION("Truncated block is rejected") {
        std::vector<uint8_t> raw = SerializeBlock(block);
        raw.resize(raw.size() - 10);
        REQUIRE_THROWS_AS(DeserializeBlock(raw), std::ios_base::failure);
    }
}

TEST_CASE("Merkle root", "[serialize][block]") {
    uint256 a;
    uint256 b;
    uint256 c;
    a.SetHex("0000000000000000000000000000000000000000000000000000000000000001");
    b.SetHex("0000000000000000000000000000000000000000000000000000000000000002");
    c.SetHex("0000000000000000000000000000000000000000000000000000000000000003");

    REQUIRE(ComputeMerkleRoot({}).IsNull());
    REQUIRE(ComputeMerkleRoot({a}) == a);
    REQUIRE(ComputeMerkleRoot({a, b}) != ComputeMerkleRoot({b, a}));
    // Odd levels duplicate the last element
    REQUIRE(ComputeMerkleRoot({a, b, c}) == ComputeMerkleRoot({a, b, c, c}));
}
