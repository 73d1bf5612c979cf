#ifndef LSNP_NETWORK_CODEC_HPP
#define LSNP_NETWORK_CODEC_HPP

#include <cstddef>
#include <string>

#include "config/node_config.hpp"
#include "core/errors.hpp"
#include "protocol_messages.hpp"
#include "util/logger.hpp"

/**
 * @file codec.hpp
 * @brief Text wire format for LSNP messages.
 *
 * FORMAT:
 *   TYPE:POST\n
 *   USER_ID:alice@192.168.1.10\n
 *   CONTENT:hello\n
 *   \n
 *
 *   - One KEY:VALUE line per field, in field order, then a blank line.
 *   - A line splits on its first ':' so values may contain colons.
 *   - Values escape '\' as "\\", LF as "\n" and CR as "\r", so multi-line content
 *     survives the line framing. Keys are never escaped and must be plain.
 *   - A trailing CR at the end of a line is ignored on decode (CRLF senders).
 *   - Duplicate keys on decode: the last value wins.
 *
 * SIZE POLICY:
 *   - above softLimit bytes: a warning is logged, the payload is still produced.
 *   - above hardLimit bytes: PayloadTooLarge, nothing is produced.
 */

namespace lsnp {
namespace network {

class Codec
{
public:
    Codec()
        : softLimit_(20 * 1024)
        , hardLimit_(65507)
    {
    }

    Codec(size_t softLimit, size_t hardLimit)
        : softLimit_(softLimit)
        , hardLimit_(hardLimit)
    {
    }

    explicit Codec(const lsnp::config::NodeConfig &cfg)
        : Codec(static_cast<size_t>(cfg.payloadSoftLimitBytes),
                static_cast<size_t>(cfg.payloadHardLimitBytes))
    {
    }

    /**
     * @brief Serialize msg to wire bytes.
     * @throw FormatError if TYPE is missing or a key is not representable.
     * @throw PayloadTooLarge if the result exceeds the hard limit.
     */
    std::string encode(const Message &msg) const
    {
        if (!msg.Has(field::TYPE) || msg.Type().empty()) {
            throw core::FormatError("cannot encode a message without TYPE");
        }

        std::string out;
        for (const auto &f : msg.Fields()) {
            checkKey(f.first);
            out += f.first;
            out += ':';
            appendEscaped(out, f.second);
            out += '\n';
        }
        out += '\n';

        enforceSize(out.size(), msg.Type());
        return out;
    }

    /**
     * @brief Parse wire bytes into a Message.
     * @throw FormatError on any framing problem or a missing TYPE.
     * @throw PayloadTooLarge if the datagram exceeds the hard limit.
     */
    Message decode(const std::string &bytes) const
    {
        if (bytes.size() > hardLimit_) {
            throw core::PayloadTooLarge(bytes.size(), hardLimit_);
        }

        Message msg;
        size_t pos = 0;
        bool terminated = false;
        while (pos < bytes.size()) {
            size_t nl = bytes.find('\n', pos);
            if (nl == std::string::npos) {
                throw core::FormatError("message is not terminated by a blank line");
            }
            std::string line = bytes.substr(pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (line.empty()) {
                terminated = true;
                break;
            }

            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                throw core::FormatError("line without ':' separator: " + truncate(line));
            }
            if (colon == 0) {
                throw core::FormatError("line with empty key: " + truncate(line));
            }
            msg.Set(line.substr(0, colon), unescape(line.substr(colon + 1)));
        }

        if (!terminated) {
            throw core::FormatError("message is not terminated by a blank line");
        }
        if (bytes.find_first_not_of("\r\n", pos) != std::string::npos) {
            throw core::FormatError("unexpected data after message terminator");
        }
        if (!msg.Has(field::TYPE) || msg.Type().empty()) {
            throw core::FormatError("message has no TYPE field");
        }
        return msg;
    }

    size_t softLimit() const { return softLimit_; }
    size_t hardLimit() const { return hardLimit_; }

private:
    size_t softLimit_;
    size_t hardLimit_;

    void enforceSize(size_t size, const std::string &type) const
    {
        if (size > hardLimit_) {
            throw core::PayloadTooLarge(size, hardLimit_);
        }
        if (size > softLimit_) {
            lsnp::util::logger::warn("[Codec] " + type + " payload is " + std::to_string(size) +
                                     " bytes, above the recommended " +
                                     std::to_string(softLimit_));
        }
    }

    static void checkKey(const std::string &key)
    {
        if (key.empty() || key.find_first_of(":\r\n") != std::string::npos) {
            throw core::FormatError("field key is not representable on the wire: '" + key + "'");
        }
    }

    static void appendEscaped(std::string &out, const std::string &value)
    {
        for (char c : value) {
            switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
            }
        }
    }

    // Unknown or dangling escapes are kept literally, so text from peers that
    // never escape backslashes still decodes.
    static std::string unescape(const std::string &value)
    {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c != '\\' || i + 1 >= value.size()) {
                out += c;
                continue;
            }
            char next = value[i + 1];
            if (next == '\\') {
                out += '\\';
            }
            else if (next == 'n') {
                out += '\n';
            }
            else if (next == 'r') {
                out += '\r';
            }
            else {
                out += c;
                continue;
            }
            ++i;
        }
        return out;
    }

    static std::string truncate(const std::string &line)
    {
        return line.size() <= 64 ? line : line.substr(0, 64) + "...";
    }
};

} // namespace network
} // namespace lsnp

#endif // LSNP_NETWORK_CODEC_HPP
