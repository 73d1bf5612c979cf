#ifndef LSNP_TEST_INTEGRATION_TEST_UDP_TRANSPORT_HPP
#define LSNP_TEST_INTEGRATION_TEST_UDP_TRANSPORT_HPP

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "config/node_config.hpp"
#include "network/udp_transport.hpp"

/**
 * @file test_udp_transport.hpp
 * @brief Real sockets on 127.0.0.1. Skipped where the sandbox forbids binding.
 */

namespace {

using lsnp::network::UdpTransport;

constexpr uint16_t kTestDiscoveryPort = 53999;

lsnp::config::NodeConfig loopbackConfig() {
    lsnp::config::NodeConfig cfg;
    cfg.bindAddress = "127.0.0.1";
    cfg.advertisedIp = "127.0.0.1";
    cfg.peerPort = 0;
    cfg.discoveryPort = kTestDiscoveryPort;
    cfg.broadcastAddresses = {"127.0.0.1"};
    return cfg;
}

TEST(UdpTransportTest, UnicastBetweenTwoTransports) {
    auto cfg = loopbackConfig();
    cfg.discoveryPort = 0; // unicast only, keep the shared port out of this test
    UdpTransport a(cfg);
    UdpTransport b(cfg);
    if (!a.Open() || !b.Open()) {
        GTEST_SKIP() << "cannot bind UDP sockets on 127.0.0.1";
    }

    EXPECT_NE(a.LocalEndpoint().port, 0);
    EXPECT_NE(a.LocalEndpoint().port, b.LocalEndpoint().port);
    EXPECT_EQ(a.LocalEndpoint().ip, "127.0.0.1");

    ASSERT_TRUE(a.SendUnicast("TYPE:PING\n\n", b.LocalEndpoint()));
    auto dg = b.Receive(std::chrono::milliseconds(1000));
    ASSERT_TRUE(dg.has_value());
    EXPECT_EQ(dg->payload, "TYPE:PING\n\n");
    // sends leave from the listening socket
    EXPECT_EQ(dg->from, a.LocalEndpoint());
}

TEST(UdpTransportTest, BroadcastReachesDiscoverySocket) {
    UdpTransport a(loopbackConfig());
    if (!a.Open() || !a.HasDiscoverySocket()) {
        GTEST_SKIP() << "discovery port " << kTestDiscoveryPort << " unavailable";
    }

    ASSERT_TRUE(a.SendBroadcast("TYPE:PEER_DISCOVERY\n\n"));
    auto dg = a.Receive(std::chrono::milliseconds(1000));
    ASSERT_TRUE(dg.has_value());
    EXPECT_EQ(dg->payload, "TYPE:PEER_DISCOVERY\n\n");
    EXPECT_EQ(dg->from.port, a.LocalEndpoint().port);
}

TEST(UdpTransportTest, ReceiveTimesOutAndClosedTransportRefusesWork) {
    auto cfg = loopbackConfig();
    cfg.discoveryPort = 0;
    UdpTransport a(cfg);
    if (!a.Open()) {
        GTEST_SKIP() << "cannot bind UDP sockets on 127.0.0.1";
    }

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(a.Receive(std::chrono::milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));

    // negative waits are treated as a poll, never as "wait forever"
    start = std::chrono::steady_clock::now();
    EXPECT_FALSE(a.Receive(std::chrono::milliseconds(-1)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    a.Close();
    EXPECT_FALSE(a.IsOpen());
    EXPECT_FALSE(a.SendUnicast("x", lsnp::network::Endpoint{"127.0.0.1", 9}));
    EXPECT_FALSE(a.Receive(std::chrono::milliseconds(10)).has_value());
}

} // namespace

#endif // LSNP_TEST_INTEGRATION_TEST_UDP_TRANSPORT_HPP
