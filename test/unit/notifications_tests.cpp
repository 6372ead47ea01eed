// Copyright (c) 2024 LunaChain
// Tests for chain notifications and the tip updates the chainstate publishes

#include "notifications.hpp"
#include "test_helpers.hpp"
#include "validation/chainstate_manager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace lunachain;

TEST_CASE("ChainNotifications - subscriptions", "[notifications]") {
    ChainNotifications notifications;
    int calls = 0;

    SECTION("Subscribers receive tip updates") {
        auto sub = notifications.SubscribeTipUpdate([&](const TipUpdate& update) {
            calls++;
            REQUIRE(update.tip_version == 7);
        });
        REQUIRE(notifications.SubscriberCount() == 1);

        TipUpdate update;
        update.tip_version = 7;
        notifications.NotifyTipUpdate(update);
        REQUIRE(calls == 1);
    }

    SECTION("Destroying the handle unsubscribes") {
        {
            auto sub = notifications.SubscribeTipUpdate([&](const TipUpdate&) { calls++; });
            REQUIRE(notifications.SubscriberCount() == 1);
        }
        REQUIRE(notifications.SubscriberCount() == 0);
        notifications.NotifyTipUpdate(TipUpdate{});
        REQUIRE(calls == 0);
    }

    SECTION("Moved handles keep the subscription") {
        ChainNotifications::Subscription outer;
        {
            auto inner = notifications.SubscribeTipUpdate([&](const TipUpdate&) { calls++; });
            outer = std::move(inner);
        }
        notifications.NotifyTipUpdate(TipUpdate{});
        REQUIRE(calls == 1);

        outer.Unsubscribe();
        outer.Unsubscribe();
        REQUIRE(notifications.SubscriberCount() == 0);
    }

    SECTION("Block-connected subscribers ignore tip updates") {
        int connected = 0;
        auto tip_sub = notifications.SubscribeTipUpdate([&](const TipUpdate&) { calls++; });
        auto block_sub = notifications.SubscribeBlockConnected(
            [&](const CBlock&, const chain::CBlockIndex*) { connected++; });

        notifications.NotifyTipUpdate(TipUpdate{});
        notifications.NotifyBlockConnected(CBlock{}, nullptr);
        REQUIRE(calls == 1);
        REQUIRE(connected == 1);
    }
}

TEST_CASE("ChainstateManager - tip update events", "[notifications][chain]") {
    auto params = test::MakeRegTestParams();
    validation::ChainstateManager chainstate(*params, 1);
    REQUIRE(chainstate.Initialize());

    std::vector<TipUpdate> updates;
    std::vector<std::vector<uint256>> disconnected;
    std::vector<std::vector<uint256>> connected;
    int blocks_connected = 0;

    auto sub = chainstate.Notifications().SubscribeTipUpdate([&](const TipUpdate& update) {
        updates.push_back(update);
        std::vector<uint256> d;
        std::vector<uint256> c;
        for (const auto& block : update.disconnected) d.push_back(block->GetHash());
        for (const auto& block : update.connected) c.push_back(block->GetHash());
        disconnected.push_back(d);
        connected.push_back(c);
        REQUIRE(update.state != nullptr);
        REQUIRE(update.state->Get(test::MinerAddress()).balance ==
                params->GetConsensus().nBlockReward * update.new_tip->nHeight);
    });
    auto block_sub = chainstate.Notifications().SubscribeBlockConnected(
        [&](const CBlock&, const chain::CBlockIndex*) { blocks_connected++; });

    SECTION("Extending the tip") {
        const uint64_t version_before = chainstate.GetTipVersion();
        CBlock block = test::CreateChild(*params, params->GenesisBlock());
        REQUIRE(test::Submit(chainstate, block));

        REQUIRE(updates.size() == 1);
        REQUIRE(disconnected[0].empty());
        REQUIRE(connected[0] == std::vector<uint256>{block.GetHash()});
        REQUIRE(updates[0].tip_version > version_before);
        REQUIRE(updates[0].tip_version == chainstate.GetTipVersion());
        REQUIRE(blocks_connected == 1);

        // Resubmitting changes nothing
        REQUIRE(test::Submit(chainstate, block));
        REQUIRE(updates.size() == 1);
    }

    SECTION("Reorganization lists both sides in order") {
        std::vector<CBlock> main = test::BuildChain(*params, params->GenesisBlock(), 2, 0);
        test::SubmitAll(chainstate, main);
        REQUIRE(updates.size() == 2);

        std::vector<CBlock> fork = test::BuildChain(*params, params->GenesisBlock(), 3, 7);
        REQUIRE(test::Submit(chainstate, fork[0]));
        REQUIRE_FALSE(test::Submit(chainstate, fork[2])); // orphan
        REQUIRE(updates.size() == 2);

        // Connecting fork[1] releases fork[2]: one event for the whole switch
        REQUIRE(test::Submit(chainstate, fork[1]));
        REQUIRE(updates.size() == 3);
        REQUIRE(disconnected[2] ==
                std::vector<uint256>{main[1].GetHash(), main[0].GetHash()});
        REQUIRE(connected[2] == std::vector<uint256>{fork[0].GetHash(), fork[1].GetHash(),
                                                     fork[2].GetHash()});
        REQUIRE(updates[2].new_tip->GetBlockHash() == fork[2].GetHash());
    }
}
