#ifndef LSNP_TEST_INTEGRATION_TEST_PEER_EXCHANGE_HPP
#define LSNP_TEST_INTEGRATION_TEST_PEER_EXCHANGE_HPP

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/node_config.hpp"
#include "network/codec.hpp"
#include "network/message_builder.hpp"
#include "node/events.hpp"
#include "node/peer_node.hpp"
#include "support/loopback_network.hpp"

/**
 * @file test_peer_exchange.hpp
 * @brief Complete PeerNodes talking over an in-memory LAN: discovery,
 *        direct messages, games, duplicate suppression and peer timeout.
 */

namespace {

using lsnp::network::Endpoint;
using lsnp::node::EventType;
using lsnp::node::PeerNode;

bool waitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

lsnp::config::NodeConfig fastConfig(const std::string& username) {
    lsnp::config::NodeConfig cfg;
    cfg.username = username;
    cfg.discoveryIntervalMs = 100;
    cfg.peerTimeoutMs = 400;
    cfg.receiveTimeoutMs = 20;
    return cfg;
}

class EventLog {
  public:
    void Record(const lsnp::node::Event& ev) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(ev);
    }

    size_t Count(EventType type, const std::string& userId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& ev : m_events) {
            if (ev.type == type && ev.userId == userId) {
                ++n;
            }
        }
        return n;
    }

  private:
    mutable std::mutex m_mutex;
    std::vector<lsnp::node::Event> m_events;
};

class PeerExchangeTest : public ::testing::Test {
  protected:
    PeerExchangeTest() : lan(std::make_shared<lsnp::test::LoopbackNetwork>()) {}

    void StartNode(PeerNode& node, EventLog& log, const lsnp::config::NodeConfig& cfg,
                   const Endpoint& ep) {
        ASSERT_TRUE(node.InitializeNode(cfg, std::make_unique<lsnp::test::LoopbackTransport>(lan, ep)));
        node.SetEventCallback([&log](const lsnp::node::Event& ev) { log.Record(ev); });
        node.StartEventLoop();
    }

    std::shared_ptr<lsnp::test::LoopbackNetwork> lan;
    // declared before the nodes: node threads write to them until the nodes are destroyed
    EventLog aliceEvents;
    EventLog bobEvents;
    PeerNode alice;
    PeerNode bob;
    const Endpoint aliceEp{"10.0.0.1", 9001};
    const Endpoint bobEp{"10.0.0.2", 9002};
};

TEST_F(PeerExchangeTest, PeersDiscoverEachOtherWithinOneInterval) {
    StartNode(alice, aliceEvents, fastConfig("alice"), aliceEp);
    StartNode(bob, bobEvents, fastConfig("bob"), bobEp);

    EXPECT_EQ(alice.UserId(), "alice@10.0.0.1");
    ASSERT_TRUE(waitFor([&] {
        return alice.GetRegistry().contains("bob@10.0.0.2") &&
               bob.GetRegistry().contains("alice@10.0.0.1");
    }));
    EXPECT_EQ(alice.GetRegistry().lookup("bob@10.0.0.2")->endpoint, bobEp);
    EXPECT_TRUE(waitFor([&] { return aliceEvents.Count(EventType::PEER_JOINED, "bob@10.0.0.2") == 1; }));
}

TEST_F(PeerExchangeTest, DirectMessageArrivesExactlyOnce) {
    StartNode(alice, aliceEvents, fastConfig("alice"), aliceEp);
    StartNode(bob, bobEvents, fastConfig("bob"), bobEp);
    ASSERT_TRUE(waitFor([&] { return alice.GetRegistry().contains("bob@10.0.0.2"); }));

    ASSERT_TRUE(alice.GetRouter().SendDm("bob@10.0.0.2", "hi"));
    ASSERT_TRUE(waitFor([&] { return bob.GetRouter().DmThreadWith("alice@10.0.0.1").size() == 1; }));

    // let a few housekeeping rounds pass, nothing may be replayed
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    auto thread = bob.GetRouter().DmThreadWith("alice@10.0.0.1");
    ASSERT_EQ(thread.size(), 1u);
    EXPECT_EQ(thread[0].content, "hi");
    EXPECT_EQ(bobEvents.Count(EventType::MESSAGE_RECEIVED, "alice@10.0.0.1"), 1u);
}

TEST_F(PeerExchangeTest, GameMovesTravelBothWays) {
    StartNode(alice, aliceEvents, fastConfig("alice"), aliceEp);
    StartNode(bob, bobEvents, fastConfig("bob"), bobEp);
    ASSERT_TRUE(waitFor([&] {
        return alice.GetRegistry().contains("bob@10.0.0.2") &&
               bob.GetRegistry().contains("alice@10.0.0.1");
    }));

    const std::string gameId = alice.GetRouter().InviteToGame("bob@10.0.0.2", 'X', 1);
    ASSERT_TRUE(waitFor([&] { return bob.GetRouter().Games().Contains(gameId); }));

    bob.GetRouter().SubmitMove(gameId, 5);
    ASSERT_TRUE(waitFor([&] {
        auto s = alice.GetRouter().Games().Find(gameId);
        return s && s->MoveCount() == 2;
    }));
    EXPECT_EQ(alice.GetRouter().Games().Find(gameId)->GetBoard().At(5), 'O');
}

TEST_F(PeerExchangeTest, SilentPeerIsSweptAfterTimeout) {
    StartNode(alice, aliceEvents, fastConfig("alice"), aliceEp);
    StartNode(bob, bobEvents, fastConfig("bob"), bobEp);
    ASSERT_TRUE(waitFor([&] { return alice.GetRegistry().contains("bob@10.0.0.2"); }));

    bob.ShutdownNode();
    EXPECT_TRUE(waitFor([&] { return !alice.GetRegistry().contains("bob@10.0.0.2"); }));
    EXPECT_EQ(aliceEvents.Count(EventType::PEER_LEFT, "bob@10.0.0.2"), 1u);
    EXPECT_THROW(alice.GetRouter().SendDm("bob@10.0.0.2", "are you there?"),
                 lsnp::core::RecipientUnknown);
}

TEST_F(PeerExchangeTest, PeerListFillsInPeersOutOfBroadcastRange) {
    // carol's broadcasts reach nobody, so alice only learns of her through bob
    StartNode(alice, aliceEvents, fastConfig("alice"), aliceEp);
    StartNode(bob, bobEvents, fastConfig("bob"), bobEp);
    ASSERT_TRUE(waitFor([&] { return bob.GetRegistry().contains("alice@10.0.0.1"); }));

    bob.GetRegistry().upsert("carol@10.0.0.3", Endpoint{"10.0.0.3", 9003},
                             lsnp::network::PeerRegistry::Clock::now());
    alice.GetDiscovery().requestPeerList(std::string("bob@10.0.0.2"));

    EXPECT_TRUE(waitFor([&] { return alice.GetRegistry().contains("carol@10.0.0.3"); }));
}

TEST_F(PeerExchangeTest, RetransmittedDatagramIsAppliedOnce) {
    ASSERT_TRUE(alice.InitializeNode(fastConfig("alice"),
                                     std::make_unique<lsnp::test::LoopbackTransport>(lan, aliceEp)));

    lsnp::network::MessageBuilder bobBuilder("bob@10.0.0.2");
    auto dm = bobBuilder.Create(lsnp::network::msgtype::DM);
    dm.Set(lsnp::network::field::TO, "alice@10.0.0.1");
    dm.Set(lsnp::network::field::CONTENT, "hello twice");
    lsnp::network::Datagram datagram{lsnp::network::Codec().encode(dm), bobEp};

    EXPECT_TRUE(alice.HandleDatagram(datagram));
    EXPECT_FALSE(alice.HandleDatagram(datagram));
    EXPECT_EQ(alice.GetRouter().DmThreadWith("bob@10.0.0.2").size(), 1u);

    // garbage is dropped, not thrown
    EXPECT_FALSE(alice.HandleDatagram(lsnp::network::Datagram{"not an lsnp message", bobEp}));
}

TEST_F(PeerExchangeTest, ZeroDedupCapacityAppliesEveryCopy) {
    auto cfg = fastConfig("alice");
    cfg.dedupCapacity = 0;
    ASSERT_TRUE(alice.InitializeNode(cfg, std::make_unique<lsnp::test::LoopbackTransport>(lan, aliceEp)));

    lsnp::network::MessageBuilder bobBuilder("bob@10.0.0.2");
    auto dm = bobBuilder.Create(lsnp::network::msgtype::DM);
    dm.Set(lsnp::network::field::TO, "alice@10.0.0.1");
    dm.Set(lsnp::network::field::CONTENT, "echo");
    lsnp::network::Datagram datagram{lsnp::network::Codec().encode(dm), bobEp};

    EXPECT_TRUE(alice.HandleDatagram(datagram));
    EXPECT_TRUE(alice.HandleDatagram(datagram));
    EXPECT_EQ(alice.GetRouter().DmThreadWith("bob@10.0.0.2").size(), 2u);
}

TEST(PeerNodeTest, StartBeforeInitializeThrows) {
    PeerNode node;
    EXPECT_THROW(node.StartEventLoop(), std::runtime_error);
    EXPECT_FALSE(node.IsRunning());
}

TEST(PeerNodeTest, ZeroIntervalsAreRefused) {
    auto lan = std::make_shared<lsnp::test::LoopbackNetwork>();
    auto cfg = fastConfig("alice");
    cfg.discoveryIntervalMs = 0;
    PeerNode node;
    EXPECT_FALSE(node.InitializeNode(
        cfg, std::make_unique<lsnp::test::LoopbackTransport>(lan, Endpoint{"10.0.0.1", 9001})));
    EXPECT_THROW(node.StartEventLoop(), std::runtime_error);
}

TEST(HousekeepingSchedulerTest, NonPositiveIntervalThrows) {
    lsnp::node::HousekeepingScheduler scheduler;
    EXPECT_THROW(scheduler.ConfigureInterval(std::chrono::milliseconds(0)), std::runtime_error);
    EXPECT_THROW(scheduler.ConfigureInterval(std::chrono::milliseconds(-5)), std::runtime_error);
    EXPECT_NO_THROW(scheduler.ConfigureInterval(std::chrono::milliseconds(1)));
}

TEST(HousekeepingSchedulerTest, FirstRoundRunsImmediatelyAndFailuresAreContained) {
    lsnp::node::HousekeepingScheduler scheduler;
    std::atomic<int> runs(0);
    scheduler.ConfigureInterval(std::chrono::milliseconds(50));
    scheduler.AddTask("boom", [] { throw std::runtime_error("task failure"); });
    scheduler.AddTask("count", [&runs] { ++runs; });

    scheduler.StartScheduling();
    EXPECT_TRUE(waitFor([&] { return runs.load() >= 3; }));
    scheduler.StopScheduling();
    EXPECT_FALSE(scheduler.IsRunning());

    int after = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_EQ(runs.load(), after);
}

} // namespace

#endif // LSNP_TEST_INTEGRATION_TEST_PEER_EXCHANGE_HPP
