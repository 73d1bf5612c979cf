#ifndef LSNP_CORE_GAME_TABLE_HPP
#define LSNP_CORE_GAME_TABLE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "errors.hpp"
#include "tictactoe.hpp"

namespace lsnp {
namespace core {

struct MoveOutcome
{
    GameSession session; // state after the move
    Outcome outcome;
};

/*
  GameTable
  --------------------------------
  Active tic-tac-toe sessions keyed by game id, plus the id allocator.

  Ids are "g0" .. "g255" from a counter that wraps; AllocateId() is the raw
  sequence, NextFreeId() skips ids still held by an active session. Sessions leave the
  table as soon as they complete.
*/

class GameTable
{
public:
    static constexpr int kIdSpace = 256;

    GameTable() : m_nextId(0) {}

    std::string AllocateId()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return allocateLocked();
    }

    // Throws std::runtime_error if every id is in use
    std::string NextFreeId()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int i = 0; i < kIdSpace; ++i) {
            std::string id = allocateLocked();
            if (m_sessions.count(id) == 0) {
                return id;
            }
        }
        throw std::runtime_error("all " + std::to_string(kIdSpace) + " game ids are in use");
    }

    // Returns false if a session with the same id is already active
    bool Add(const GameSession &session)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sessions.emplace(session.GameId(), session).second;
    }

    bool Contains(const std::string &gameId) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sessions.count(gameId) > 0;
    }

    std::optional<GameSession> Find(const std::string &gameId) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(gameId);
        if (it == m_sessions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /*
      Apply a move under the table lock. Throws GameNotFound / InvalidMove with the
      session untouched. A terminal move purges the session.
    */
    MoveOutcome ApplyMove(const std::string &gameId, const std::string &player, int position)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(gameId);
        if (it == m_sessions.end()) {
            throw GameNotFound(gameId);
        }
        // work on a copy so a rejected move cannot leave partial state
        GameSession updated = it->second;
        Outcome outcome = updated.ApplyMove(player, position);
        if (outcome.IsTerminal()) {
            m_sessions.erase(it);
        } else {
            it->second = updated;
        }
        return MoveOutcome{updated, outcome};
    }

    // Returns the removed session, if it was still active
    std::optional<GameSession> Remove(const std::string &gameId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(gameId);
        if (it == m_sessions.end()) {
            return std::nullopt;
        }
        GameSession s = it->second;
        m_sessions.erase(it);
        return s;
    }

    size_t ActiveCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sessions.size();
    }

private:
    std::string allocateLocked()
    {
        std::string id = "g" + std::to_string(m_nextId);
        m_nextId = (m_nextId + 1) % kIdSpace;
        return id;
    }

    mutable std::mutex m_mutex;
    int m_nextId;
    std::map<std::string, GameSession> m_sessions;
};

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_GAME_TABLE_HPP
