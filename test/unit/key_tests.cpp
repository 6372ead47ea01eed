// Copyright (c) 2024 LunaChain
// Tests for keys, signatures and address handling

#include "crypto/key.hpp"
#include "crypto/sha256.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <string>

using namespace lunachain;
using namespace lunachain::crypto;

TEST_CASE("CKey - generation and secrets", "[crypto][key]") {
    SECTION("Fresh keys are valid and distinct") {
        CKey a;
        CKey b;
        REQUIRE_FALSE(a.IsValid());
        REQUIRE(a.MakeNewKey());
        REQUIRE(b.MakeNewKey());
        REQUIRE(a.IsValid());
        REQUIRE(a.GetPubKey().size() == 33);
        REQUIRE(a.GetAddress() != b.GetAddress());
    }

    SECTION("Secret round trip reproduces the key") {
        CKey original;
        REQUIRE(original.MakeNewKey());
        std::vector<uint8_t> secret = original.GetSecret();
        REQUIRE(secret.size() == 32);

        CKey restored;
        REQUIRE(restored.SetSecret(secret));
        REQUIRE(restored.GetPubKey() == original.GetPubKey());
        REQUIRE(restored.GetAddress() == original.GetAddress());
    }

    SECTION("Invalid secrets are rejected") {
        CKey key;
        REQUIRE_FALSE(key.SetSecret(std::vector<uint8_t>(32, 0)));
        REQUIRE_FALSE(key.SetSecret(std::vector<uint8_t>(31, 1)));
        // Above the curve order
        REQUIRE_FALSE(key.SetSecret(std::vector<uint8_t>(32, 0xff)));
        REQUIRE_FALSE(key.IsValid());
    }

    SECTION("An empty key produces nothing") {
        CKey key;
        REQUIRE(key.GetPubKey().empty());
        REQUIRE(key.GetSecret().empty());
        REQUIRE(key.Sign(uint256()).empty());
    }
}

TEST_CASE("CKey - signatures", "[crypto][key]") {
    CKey key = test::MakeKey(1);
    uint256 hash = SHA256(std::string("lunachain"));

    std::vector<uint8_t> sig = key.Sign(hash);
    REQUIRE_FALSE(sig.empty());

    SECTION("Valid signature verifies") {
        REQUIRE(VerifySignature(key.GetPubKey(), hash, sig));
    }

    SECTION("Other message fails") {
        uint256 other = SHA256(std::string("lunachain!"));
        REQUIRE_FALSE(VerifySignature(key.GetPubKey(), other, sig));
    }

    SECTION("Other key fails") {
        CKey other = test::MakeKey(2);
        REQUIRE_FALSE(VerifySignature(other.GetPubKey(), hash, sig));
    }

    SECTION("Tampered or malformed inputs fail") {
        std::vector<uint8_t> tampered = sig;
        tampered[tampered.size() / 2] ^= 0x01;
        REQUIRE_FALSE(VerifySignature(key.GetPubKey(), hash, tampered));
        REQUIRE_FALSE(VerifySignature(key.GetPubKey(), hash, {}));
        REQUIRE_FALSE(VerifySignature({}, hash, sig));
        REQUIRE_FALSE(VerifySignature(PubKey(33, 0x07), hash, sig));
    }
}

TEST_CASE("Address - derivation and normalization", "[crypto][address]") {
    CKey key = test::MakeKey(3);
    const std::string address = key.GetAddress();

    SECTION("Derived addresses are canonical") {
        REQUIRE(address.rfind(ADDRESS_PREFIX, 0) == 0);
        REQUIRE(address.size() == 4 + ADDRESS_HASH_BYTES * 2);
        REQUIRE(IsValidAddress(address));
        REQUIRE(AddressFromPubKey(key.GetPubKey()) == address);
    }

    SECTION("Normalization strips whitespace, quotes and case") {
        std::string upper = address;
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        REQUIRE_FALSE(IsValidAddress(upper));
        REQUIRE(NormalizeAddress(upper) == address);
        REQUIRE(NormalizeAddress("  " + address + "\n") == address);
        REQUIRE(NormalizeAddress("\"" + address + "\"") == address);
        REQUIRE(NormalizeAddress("'" + upper + "'") == address);
    }

    SECTION("Malformed addresses are rejected") {
        REQUIRE_FALSE(NormalizeAddress("").has_value());
        REQUIRE_FALSE(NormalizeAddress("LUN_").has_value());
        REQUIRE_FALSE(NormalizeAddress(address.substr(0, address.size() - 1)).has_value());
        REQUIRE_FALSE(NormalizeAddress(address + "0").has_value());
        REQUIRE_FALSE(NormalizeAddress("BTC_" + address.substr(4)).has_value());
        REQUIRE_FALSE(NormalizeAddress("LUN_" + std::string(40, 'g')).has_value());
    }

    SECTION("Payload round trip") {
        auto hash = AddressToHash(address);
        REQUIRE(hash.has_value());
        REQUIRE(AddressFromHash(*hash) == address);
        REQUIRE_FALSE(AddressToHash("nope").has_value());
    }
}
