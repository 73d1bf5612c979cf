#ifndef LSNP_NODE_PEER_NODE_HPP
#define LSNP_NODE_PEER_NODE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "config/node_config.hpp"
#include "events.hpp"
#include "housekeeping_scheduler.hpp"
#include "network/codec.hpp"
#include "network/discovery_service.hpp"
#include "network/message_builder.hpp"
#include "network/peer_registry.hpp"
#include "network/transport.hpp"
#include "network/udp_transport.hpp"
#include "router.hpp"
#include "security/token_verifier.hpp"
#include "util/logger.hpp"
#include "util/recent_message_cache.hpp"

namespace lsnp {
namespace node {

/*
  PeerNode
  --------------------------------
  Wires one LSNP peer together and runs it:
    transport -> receive thread -> codec -> duplicate filter -> router
    housekeeping thread -> announce / sweep / prune

  Lifecycle:
    InitializeNode(config[, transport])  opens the transport, derives user_id
    StartEventLoop()                     receive thread + housekeeping thread
    StopEventLoop()                      joins both threads
    ShutdownNode()                       stops and closes the transport

  Decode failures and rejected messages are logged per datagram; the loop never exits
  because of a bad packet.
*/
class PeerNode {
  public:
    PeerNode() : m_isNodeRunning(false) {}

    ~PeerNode() { ShutdownNode(); }

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    // Pass a transport to run over something other than UDP (tests use an in-memory one).
    bool InitializeNode(const lsnp::config::NodeConfig& config,
                        std::unique_ptr<network::Transport> transport = nullptr) {
        using lsnp::util::logger::Logger;
        std::lock_guard<std::mutex> lock(m_nodeMutex);

        if (m_router) {
            Logger::getInstance().warn("[PeerNode] InitializeNode called twice, ignoring.");
            return true;
        }

        if (config.discoveryIntervalMs == 0 || config.peerTimeoutMs == 0) {
            Logger::getInstance().error(
                "[PeerNode] discoveryIntervalMs and peerTimeoutMs must be positive.");
            return false;
        }

        m_config = config;
        m_transport = transport ? std::move(transport)
                                : std::make_unique<network::UdpTransport>(m_config);
        if (!m_transport->IsOpen() && !m_transport->Open()) {
            Logger::getInstance().error("[PeerNode] Transport could not be opened.");
            m_transport.reset();
            return false;
        }

        const std::string userId = m_config.username + "@" + m_transport->LocalEndpoint().ip;

        m_codec = std::make_unique<network::Codec>(m_config);
        m_registry = std::make_unique<network::PeerRegistry>(
            userId, std::chrono::milliseconds(m_config.peerTimeoutMs));
        m_builder = std::make_unique<network::MessageBuilder>(userId);
        if (m_config.attachTokens) {
            m_builder->SetTokenIssuer(
                std::make_shared<security::TokenIssuer>(userId, m_config.tokenTtlSeconds));
        }
        m_discovery = std::make_unique<network::DiscoveryService>(*m_transport, *m_codec,
                                                                  *m_registry, *m_builder);
        m_router = std::make_unique<Router>(*m_transport, *m_codec, *m_registry, *m_discovery,
                                            *m_builder, m_config.postTtlSeconds);
        if (m_config.tokenVerification == "scoped") {
            m_router->SetTokenVerifier(std::make_shared<security::ScopedTokenVerifier>());
        }
        m_dedup = std::make_unique<util::RecentMessageCache>(
            static_cast<size_t>(m_config.dedupCapacity));

        m_registry->addListener([this](network::PeerChange change, const network::Peer& peer) {
            Event ev;
            ev.type = change == network::PeerChange::JOINED ? EventType::PEER_JOINED
                                                             : EventType::PEER_LEFT;
            ev.userId = peer.userId;
            ev.detail = peer.endpoint.ToString();
            publish(ev);
        });
        m_router->SetEventCallback([this](const Event& ev) { publish(ev); });

        m_scheduler.ConfigureInterval(std::chrono::milliseconds(m_config.discoveryIntervalMs));
        m_scheduler.AddTask("announce", [this] { m_discovery->announce(); });
        m_scheduler.AddTask("sweep",
                            [this] { m_registry->sweep(network::PeerRegistry::Clock::now()); });
        m_scheduler.AddTask("prune-posts",
                            [this] { m_router->PruneExpiredPosts(security::unixNow()); });

        Logger::getInstance().info("[PeerNode] Initialized as " + userId + " on " +
                                   m_transport->LocalEndpoint().ToString());
        return true;
    }

    void StartEventLoop() {
        std::lock_guard<std::mutex> lock(m_nodeMutex);
        if (!m_router) {
            throw std::runtime_error("PeerNode::StartEventLoop called before InitializeNode");
        }
        if (m_isNodeRunning) {
            return;
        }

        m_isNodeRunning = true;
        m_receiveThread = std::thread(&PeerNode::receiveLoop, this);
        m_scheduler.StartScheduling();
    }

    void StopEventLoop() {
        {
            std::lock_guard<std::mutex> lock(m_nodeMutex);
            if (!m_isNodeRunning) {
                return;
            }
            m_isNodeRunning = false;
        }

        m_scheduler.StopScheduling();
        if (m_receiveThread.joinable()) {
            m_receiveThread.join();
        }
    }

    bool ShutdownNode() {
        StopEventLoop();
        std::lock_guard<std::mutex> lock(m_nodeMutex);
        if (m_transport && m_transport->IsOpen()) {
            m_transport->Close();
        }
        return true;
    }

    // Inbound events (peer joined/left, messages, game updates). Runs on node threads.
    void SetEventCallback(EventCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_eventCallback = std::move(callback);
    }

    /*
      Decode and route one datagram. Called by the receive loop; public so a
      datagram can be injected directly.
      Returns true if the router applied the message.
    */
    bool HandleDatagram(const network::Datagram& datagram) {
        using lsnp::util::logger::Logger;
        network::Message msg;
        try {
            msg = m_codec->decode(datagram.payload);
        } catch (const core::LsnpError& ex) {
            Logger::getInstance().warn("[PeerNode] Undecodable datagram from " +
                                       datagram.from.ToString() + ": " + ex.what());
            return false;
        }

        const std::string messageId = msg.MessageId();
        if (!messageId.empty() && !m_dedup->insertIfAbsent(msg.Sender() + "/" + messageId)) {
            Logger::getInstance().debug("[PeerNode] Duplicate " + msg.Type() + " " + messageId +
                                        " dropped");
            return false;
        }

        return m_router->Dispatch(msg, datagram.from);
    }

    bool IsRunning() const { return m_isNodeRunning; }

    const std::string& UserId() const { return m_builder->SelfUserId(); }
    Router& GetRouter() { return *m_router; }
    network::PeerRegistry& GetRegistry() { return *m_registry; }
    network::DiscoveryService& GetDiscovery() { return *m_discovery; }
    HousekeepingScheduler& GetScheduler() { return m_scheduler; }
    const lsnp::config::NodeConfig& GetConfig() const { return m_config; }

  private:
    void receiveLoop() {
        using lsnp::util::logger::Logger;
        const auto timeout = std::chrono::milliseconds(m_config.receiveTimeoutMs);

        Logger::getInstance().info("[PeerNode] Receive loop started.");
        while (m_isNodeRunning) {
            auto datagram = m_transport->Receive(timeout);
            if (!datagram) {
                continue;
            }
            try {
                HandleDatagram(*datagram);
            } catch (const std::exception& ex) {
                Logger::getInstance().error("[PeerNode] Failed to process datagram from " +
                                            datagram->from.ToString() + ": " + ex.what());
            }
        }
        Logger::getInstance().info("[PeerNode] Receive loop stopped.");
    }

    void publish(const Event& ev) {
        EventCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_eventCallback;
        }
        if (callback) {
            callback(ev);
        }
    }

    lsnp::config::NodeConfig m_config;
    std::unique_ptr<network::Transport> m_transport;
    std::unique_ptr<network::Codec> m_codec;
    std::unique_ptr<network::PeerRegistry> m_registry;
    std::unique_ptr<network::MessageBuilder> m_builder;
    std::unique_ptr<network::DiscoveryService> m_discovery;
    std::unique_ptr<Router> m_router;
    std::unique_ptr<util::RecentMessageCache> m_dedup;
    HousekeepingScheduler m_scheduler;

    std::atomic<bool> m_isNodeRunning;
    std::thread m_receiveThread;
    std::mutex m_nodeMutex;
    std::mutex m_callbackMutex;
    EventCallback m_eventCallback;
};

} // namespace node
} // namespace lsnp

#endif // LSNP_NODE_PEER_NODE_HPP
