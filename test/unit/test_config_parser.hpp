#ifndef LSNP_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define LSNP_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "config/node_config.hpp"
#include "support/log_capture.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

using lsnp::config::NodeConfig;
using lsnp::util::ConfigParser;

TEST(NodeConfigTest, DefaultsMatchLanDeployment) {
    NodeConfig cfg;
    EXPECT_EQ(cfg.discoveryPort, 50999);
    EXPECT_EQ(cfg.peerPort, 0);
    EXPECT_EQ(cfg.discoveryIntervalMs, 30000u);
    EXPECT_EQ(cfg.peerTimeoutMs, 300000u);
    EXPECT_EQ(cfg.payloadSoftLimitBytes, 20480u);
    EXPECT_EQ(cfg.payloadHardLimitBytes, 65507u);
    EXPECT_EQ(cfg.tokenVerification, "none");
}

TEST(ConfigParserTest, LoadsKeysCommentsAndWhitespace) {
    NodeConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString("# peer settings\n"
                          "username = alice\n"
                          "\n"
                          "advertisedIp=192.168.1.10\n"
                          "discoveryPort=51999\n"
                          "peerPort = 52000\n"
                          "broadcastAddresses = 192.168.1.255, 127.0.0.1 ,\n"
                          "discoveryIntervalMs=5000\n"
                          "peerTimeoutMs=15000\n"
                          "attachTokens=yes\n"
                          "tokenVerification=scoped\n"
                          "logLevel=debug\n");

    EXPECT_EQ(cfg.username, "alice");
    EXPECT_EQ(cfg.advertisedIp, "192.168.1.10");
    EXPECT_EQ(cfg.discoveryPort, 51999);
    EXPECT_EQ(cfg.peerPort, 52000);
    ASSERT_EQ(cfg.broadcastAddresses.size(), 2u);
    EXPECT_EQ(cfg.broadcastAddresses[0], "192.168.1.255");
    EXPECT_EQ(cfg.broadcastAddresses[1], "127.0.0.1");
    EXPECT_EQ(cfg.discoveryIntervalMs, 5000u);
    EXPECT_EQ(cfg.peerTimeoutMs, 15000u);
    EXPECT_TRUE(cfg.attachTokens);
    EXPECT_EQ(cfg.tokenVerification, "scoped");
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(ConfigParserTest, MalformedValuesThrow) {
    NodeConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("username alice\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("username=al@ice\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("discoveryPort=70000\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("peerTimeoutMs=-1\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("peerTimeoutMs=10s\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("attachTokens=maybe\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("tokenVerification=strict\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("logLevel=loud\n"), std::runtime_error);
    EXPECT_EQ(cfg.username, "user");
}

TEST(ConfigParserTest, TimingValuesOutsideBoundsThrow) {
    NodeConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("discoveryIntervalMs=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("peerTimeoutMs=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("receiveTimeoutMs=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("receiveTimeoutMs=4294967296\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("discoveryIntervalMs=86400001\n"), std::runtime_error);
    EXPECT_EQ(cfg.discoveryIntervalMs, 30000u);
    EXPECT_EQ(cfg.receiveTimeoutMs, 1000u);

    parser.loadFromString("receiveTimeoutMs=60000\ndiscoveryIntervalMs=1\n");
    EXPECT_EQ(cfg.receiveTimeoutMs, 60000u);
    EXPECT_EQ(cfg.discoveryIntervalMs, 1u);
}

TEST(ConfigParserTest, UnknownKeyWarnsAndMissingFileKeepsDefaults) {
    lsnp::test::LogCapture capture;
    NodeConfig cfg;
    ConfigParser parser(cfg);

    parser.loadFromString("favouriteColour=blue\n");
    EXPECT_TRUE(capture.contains(lsnp::util::logger::LogLevel::WARN, "favouriteColour"));

    parser.loadFromFile("/nonexistent/lsnp_peer.conf");
    EXPECT_TRUE(capture.contains(lsnp::util::logger::LogLevel::WARN, "File not found"));
    EXPECT_EQ(cfg.discoveryPort, 50999);
}

TEST(LoggerTest, ParseLogLevelAcceptsAnyCase) {
    using lsnp::util::logger::LogLevel;
    using lsnp::util::logger::parseLogLevel;
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_THROW(parseLogLevel("verbose"), std::runtime_error);
}

TEST(LoggerTest, LevelFilterAppliesToCaptureHook) {
    using lsnp::util::logger::Logger;
    using lsnp::util::logger::LogLevel;

    lsnp::test::LogCapture capture;
    LogLevel previous = Logger::getInstance().getLogLevel();
    Logger::getInstance().setLogLevel(LogLevel::WARN);
    Logger::getInstance().info("[LoggerTest] filtered");
    Logger::getInstance().error("[LoggerTest] kept");
    Logger::getInstance().setLogLevel(previous);

    EXPECT_FALSE(capture.contains(LogLevel::INFO, "filtered"));
    EXPECT_TRUE(capture.contains(LogLevel::ERROR, "kept"));
}

} // namespace

#endif // LSNP_TEST_UNIT_TEST_CONFIG_PARSER_HPP
