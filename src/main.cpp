#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>

#include "config/node_config.hpp"
#include "node/events.hpp"
#include "node/peer_node.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

std::atomic<bool> g_stopRequested(false);

void onSignal(int) { g_stopRequested = true; }

std::string describe(const lsnp::node::Event& ev) {
    std::string line = std::string(lsnp::node::EventTypeName(ev.type)) + " " + ev.userId;
    if (ev.message) {
        line += " " + ev.message->Type();
        auto content = ev.message->Get(lsnp::network::field::CONTENT);
        if (content) {
            line += ": " + *content;
        }
    }
    if (!ev.detail.empty()) {
        line += " (" + ev.detail + ")";
    }
    return line;
}

} // namespace

int main(int argc, char** argv) {
    using lsnp::util::logger::Logger;

    Logger::getInstance().info("[main] LSNP peer starting...");

    // 1. Parse configuration
    lsnp::config::NodeConfig nodeConfig;
    lsnp::util::ConfigParser configParser(nodeConfig);

    std::string configPath = "lsnp_peer.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        configParser.loadFromFile(configPath);
        Logger::getInstance().setLogLevel(lsnp::util::logger::parseLogLevel(nodeConfig.logLevel));
    } catch (const std::exception& ex) {
        Logger::getInstance().critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!nodeConfig.logFile.empty()) {
        lsnp::util::logger::enableFileOutput(nodeConfig.logFile, true);
    }

    // 2. Bring the peer up
    lsnp::node::PeerNode peerNode;
    if (!peerNode.InitializeNode(nodeConfig)) {
        Logger::getInstance().error("[main] Failed to initialize PeerNode");
        return 1;
    }
    peerNode.SetEventCallback(
        [](const lsnp::node::Event& ev) { Logger::getInstance().info("[event] " + describe(ev)); });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    peerNode.StartEventLoop();
    Logger::getInstance().info("[main] Running as " + peerNode.UserId() + ", Ctrl+C to stop.");

    // 3. Idle until asked to stop; all work happens on the node's threads.
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // 4. Stop
    Logger::getInstance().info("[main] Stopping node.");
    peerNode.ShutdownNode();

    Logger::getInstance().info("[main] LSNP peer exiting.");
    return 0;
}
