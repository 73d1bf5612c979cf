#ifndef LSNP_CORE_ERRORS_HPP
#define LSNP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception types raised by the LSNP core.
 *
 * All of them are local: they are thrown to the caller of an outbound intent, or
 * caught and logged on the inbound path. None is ever serialized onto the wire.
 */

namespace lsnp {
namespace core {

/// Common base so callers can catch every protocol-level failure at once.
class LsnpError : public std::runtime_error
{
public:
    explicit LsnpError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/// Bytes could not be decoded: missing TYPE, bad terminator, line without ':'.
class FormatError : public LsnpError
{
public:
    using LsnpError::LsnpError;
};

/// Decoded message lacks a field mandatory for its TYPE, or a field value is unusable.
class InvalidMessageFormat : public LsnpError
{
public:
    using LsnpError::LsnpError;
};

/// Encoded payload exceeds the hard datagram limit.
class PayloadTooLarge : public LsnpError
{
public:
    PayloadTooLarge(size_t size, size_t limit)
        : LsnpError("payload of " + std::to_string(size) + " bytes exceeds limit of " +
                    std::to_string(limit) + " bytes")
        , size_(size)
        , limit_(limit)
    {
    }

    size_t size() const { return size_; }
    size_t limit() const { return limit_; }

private:
    size_t size_;
    size_t limit_;
};

/// Target user_id is not in the peer registry.
class RecipientUnknown : public LsnpError
{
public:
    explicit RecipientUnknown(const std::string &userId)
        : LsnpError("unknown recipient: " + userId)
        , userId_(userId)
    {
    }

    const std::string& userId() const { return userId_; }

private:
    std::string userId_;
};

class GameNotFound : public LsnpError
{
public:
    explicit GameNotFound(const std::string &gameId)
        : LsnpError("no active game with id " + gameId)
    {
    }
};

/// Move out of turn, out of range, onto an occupied cell, or in a finished game.
class InvalidMove : public LsnpError
{
public:
    using LsnpError::LsnpError;
};

/// Non-creator tried to change group membership, or non-member tried to post.
class PermissionDenied : public LsnpError
{
public:
    using LsnpError::LsnpError;
};

class GroupNotFound : public LsnpError
{
public:
    explicit GroupNotFound(const std::string &groupId)
        : LsnpError("unknown group: " + groupId)
    {
    }
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_ERRORS_HPP
