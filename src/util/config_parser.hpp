#ifndef LSNP_UTIL_CONFIG_PARSER_HPP
#define LSNP_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <limits>
#include <mutex>
#include "config/node_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" peer configuration file into lsnp::config::NodeConfig.
 *
 * FORMAT:
 *   - One "key=value" per line, whitespace around key and value is trimmed.
 *   - Lines starting with '#' and blank lines are skipped.
 *   - List values (broadcastAddresses) are comma separated.
 *   - Booleans accept true/false/1/0/yes/no.
 *
 * USAGE:
 *   @code
 *   lsnp::config::NodeConfig nodeConfig;
 *   lsnp::util::ConfigParser parser(nodeConfig);
 *   parser.loadFromFile("lsnp_peer.conf");
 *   @endcode
 *
 * A missing file is not an error: defaults are kept and a warning is logged.
 * Malformed lines and unparsable numbers throw std::runtime_error.
 */

namespace lsnp {
namespace util {

/**
 * @class ConfigParser
 * @brief Minimal parser that reads a plain text key=value config, updates NodeConfig fields.
 */
class ConfigParser
{
public:
    // Bounds for the millisecond settings; 0 would spin and huge values never wake.
    static constexpr uint64_t kMinIntervalMs = 1;
    static constexpr uint64_t kMaxIntervalMs = 86400000;
    static constexpr uint64_t kMaxReceiveTimeoutMs = 60000;

    /**
     * @brief Construct a new ConfigParser object, referencing a NodeConfig to populate.
     * @param nodeConfig A reference to an existing NodeConfig struct.
     */
    explicit ConfigParser(lsnp::config::NodeConfig &nodeConfig)
        : nodeConfig_(nodeConfig)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys in nodeConfig_.
     * @param filepath The path to the config file.
     * @throw std::runtime_error if lines are malformed.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            lsnp::util::logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return;
        }

        lsnp::util::logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile);
        lsnp::util::logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Same as loadFromFile but for in-memory text (used by tests and --set style overrides).
     */
    inline void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(text);
        parseStream(in);
    }

private:
    lsnp::config::NodeConfig &nodeConfig_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Helper to apply a recognized key-value pair to nodeConfig_ fields.
     *        Unknown keys are logged and ignored.
     */
    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        using lsnp::util::logger::debug;

        if (key == "username") {
            if (val.empty() || val.find('@') != std::string::npos) {
                throw std::runtime_error("ConfigParser: username must be non-empty and contain no '@'");
            }
            nodeConfig_.username = val;
            debug("ConfigParser: username set to " + val);
        }
        else if (key == "advertisedIp") {
            nodeConfig_.advertisedIp = val;
            debug("ConfigParser: advertisedIp set to " + val);
        }
        else if (key == "bindAddress") {
            nodeConfig_.bindAddress = val;
            debug("ConfigParser: bindAddress set to " + val);
        }
        else if (key == "discoveryPort") {
            nodeConfig_.discoveryPort = parsePort(val);
            debug("ConfigParser: discoveryPort set to " + std::to_string(nodeConfig_.discoveryPort));
        }
        else if (key == "peerPort") {
            nodeConfig_.peerPort = parsePort(val);
            debug("ConfigParser: peerPort set to " + std::to_string(nodeConfig_.peerPort));
        }
        else if (key == "broadcastAddresses") {
            nodeConfig_.broadcastAddresses = splitList(val);
            debug("ConfigParser: broadcastAddresses set to " + val);
        }
        else if (key == "discoveryIntervalMs") {
            nodeConfig_.discoveryIntervalMs = parseRange(key, val, kMinIntervalMs, kMaxIntervalMs);
        }
        else if (key == "peerTimeoutMs") {
            nodeConfig_.peerTimeoutMs = parseRange(key, val, kMinIntervalMs, kMaxIntervalMs);
        }
        else if (key == "receiveTimeoutMs") {
            nodeConfig_.receiveTimeoutMs =
                parseRange(key, val, kMinIntervalMs, kMaxReceiveTimeoutMs);
        }
        else if (key == "postTtlSeconds") {
            nodeConfig_.postTtlSeconds = parseUInt(val);
        }
        else if (key == "payloadSoftLimitBytes") {
            nodeConfig_.payloadSoftLimitBytes = parseUInt(val);
        }
        else if (key == "payloadHardLimitBytes") {
            nodeConfig_.payloadHardLimitBytes = parseUInt(val);
        }
        else if (key == "dedupCapacity") {
            nodeConfig_.dedupCapacity = parseUInt(val);
        }
        else if (key == "tokenVerification") {
            if (val != "none" && val != "scoped") {
                throw std::runtime_error("ConfigParser: tokenVerification must be 'none' or 'scoped', got '" + val + "'");
            }
            nodeConfig_.tokenVerification = val;
        }
        else if (key == "attachTokens") {
            nodeConfig_.attachTokens = parseBool(val);
        }
        else if (key == "tokenTtlSeconds") {
            nodeConfig_.tokenTtlSeconds = parseUInt(val);
        }
        else if (key == "logLevel") {
            // validate early so a typo fails at startup, not on first use
            lsnp::util::logger::parseLogLevel(val);
            nodeConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            nodeConfig_.logFile = val;
        }
        else {
            lsnp::util::logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

    /**
     * @brief Trim leading/trailing whitespace from a string.
     */
    inline void trim(std::string &s) const
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline std::vector<std::string> splitList(const std::string &val) const
    {
        std::vector<std::string> out;
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    /**
     * @brief Parse a string into an unsigned integer. If invalid, throw.
     * @param val The string to parse
     * @return The parsed uint64_t value
     */
    inline uint64_t parseUInt(const std::string &val) const
    {
        try {
            if (!val.empty() && val[0] == '-') {
                throw std::runtime_error("Negative value");
            }
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    /**
     * @brief Parse an unsigned integer and require min <= value <= max.
     */
    inline uint64_t parseRange(const std::string &key, const std::string &val,
                               uint64_t minValue, uint64_t maxValue) const
    {
        uint64_t n = parseUInt(val);
        if (n < minValue || n > maxValue) {
            throw std::runtime_error("ConfigParser: " + key + " must be between " +
                                     std::to_string(minValue) + " and " +
                                     std::to_string(maxValue) + ", got " + val);
        }
        return n;
    }

    inline uint16_t parsePort(const std::string &val) const
    {
        uint64_t n = parseUInt(val);
        if (n > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("ConfigParser: port out of range: " + val);
        }
        return static_cast<uint16_t>(n);
    }

    inline bool parseBool(const std::string &val) const
    {
        if (val == "true" || val == "1" || val == "yes") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no") {
            return false;
        }
        throw std::runtime_error("ConfigParser: expected boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace lsnp

#endif // LSNP_UTIL_CONFIG_PARSER_HPP
