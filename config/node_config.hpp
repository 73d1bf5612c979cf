#ifndef LSNP_CONFIG_NODE_CONFIG_HPP
#define LSNP_CONFIG_NODE_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

/**
 * @file node_config.hpp
 * @brief Defines configuration parameters for a single LSNP peer (local node settings).
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Contains identity, ports, timing of discovery/sweeps, payload limits, etc.
 */

namespace lsnp {
namespace config {

/**
 * @struct NodeConfig
 * @brief Holds essential local configuration for a single peer:
 *   - username: the local part of user_id ("username@ip").
 *   - discoveryPort / peerPort: well-known broadcast port and unicast listening port.
 *   - discoveryIntervalMs / peerTimeoutMs: announce cadence and liveness threshold.
 *   - payloadSoftLimitBytes / payloadHardLimitBytes: codec size policy.
 */
struct NodeConfig
{
    /**
     * @brief Construct a new NodeConfig with defaults matching the LAN deployment:
     *   discoveryPort = 50999, peerPort = 0 (ephemeral)
     *   discoveryIntervalMs = 30000, peerTimeoutMs = 300000
     *   payloadSoftLimitBytes = 20480, payloadHardLimitBytes = 65507
     */
    NodeConfig()
        : username("user"),
          advertisedIp(""),
          bindAddress("0.0.0.0"),
          discoveryPort(50999),
          peerPort(0),
          broadcastAddresses({"255.255.255.255", "127.0.0.1"}),
          discoveryIntervalMs(30000),
          peerTimeoutMs(300000),
          receiveTimeoutMs(1000),
          postTtlSeconds(3600),
          payloadSoftLimitBytes(20 * 1024),
          payloadHardLimitBytes(65507),
          dedupCapacity(1000),
          tokenVerification("none"),
          attachTokens(false),
          tokenTtlSeconds(3600),
          logLevel("INFO"),
          logFile("")
    {
    }

    /// Local user name; the full user_id is "username@advertisedIp".
    std::string username;

    /// IP placed in user_id; empty means auto-detect from the routing table.
    std::string advertisedIp;

    /// Local address both sockets bind to.
    std::string bindAddress;

    /// Well-known UDP port every peer listens on for PEER_DISCOVERY broadcasts.
    uint16_t discoveryPort;

    /// Unicast listening port, 0 lets the OS pick an ephemeral one.
    uint16_t peerPort;

    /// Destinations for broadcast sends (each at discoveryPort).
    std::vector<std::string> broadcastAddresses;

    uint64_t discoveryIntervalMs;

    /// A peer not heard from for longer than this is swept from the registry.
    uint64_t peerTimeoutMs;

    /// Upper bound of a single blocking receive, so shutdown stays responsive.
    uint64_t receiveTimeoutMs;

    uint64_t postTtlSeconds;

    uint64_t payloadSoftLimitBytes;
    uint64_t payloadHardLimitBytes;

    /// Size of the recently-seen MESSAGE_ID cache; 0 disables duplicate suppression.
    uint64_t dedupCapacity;

    /// "none" accepts everything, "scoped" enforces user|expiry|scope tokens.
    std::string tokenVerification;

    /// Attach a TOKEN field to every outbound message.
    bool attachTokens;

    uint64_t tokenTtlSeconds;

    std::string logLevel;

    /// Optional log file, console only when empty.
    std::string logFile;
};

} // namespace config
} // namespace lsnp

#endif // LSNP_CONFIG_NODE_CONFIG_HPP
