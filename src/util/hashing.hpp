#ifndef LSNP_UTIL_HASHING_HPP
#define LSNP_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief OpenSSL-backed helpers: SHA-256 digests, base64 and random identifiers.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * USAGE:
 *   @code
 *   using namespace lsnp::util::hashing;
 *
 *   std::string key = sha256("alice@10.0.0.2|1700000000|chat"); // 64 hex chars
 *   std::string id  = randomHex(8);                             // 16 hex chars
 *   std::string b64 = base64Encode(pngBytes);
 *   @endcode
 */

namespace lsnp {
namespace util {
namespace hashing {

inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails somehow.
 */
inline std::string sha256(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash)) {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

/**
 * @brief Cryptographically random identifier of byteCount bytes, hex encoded
 *        (so the result has 2 * byteCount characters).
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::string randomHex(size_t byteCount)
{
    std::vector<unsigned char> buf(byteCount);
    if (byteCount > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("hashing::randomHex: RAND_bytes failed.");
    }
    return toHex(buf.data(), buf.size());
}

/**
 * @brief Base64 without line breaks (EVP_EncodeBlock), safe to embed in a single wire line.
 */
inline std::string base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("hashing::base64Encode: EVP_EncodeBlock failed.");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Inverse of base64Encode.
 * @throw std::runtime_error on malformed input.
 */
inline std::vector<uint8_t> base64Decode(const std::string &text)
{
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw std::runtime_error("hashing::base64Decode: length is not a multiple of 4.");
    }
    std::vector<uint8_t> out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw std::runtime_error("hashing::base64Decode: EVP_DecodeBlock failed.");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
    }
    if (text[text.size() - 2] == '=') {
        ++padding;
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace hashing
} // namespace util
} // namespace lsnp

#endif // LSNP_UTIL_HASHING_HPP
