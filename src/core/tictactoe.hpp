#ifndef LSNP_CORE_TICTACTOE_HPP
#define LSNP_CORE_TICTACTOE_HPP

#include <array>
#include <string>

#include "errors.hpp"

namespace lsnp {
namespace core {

/*
  tictactoe.hpp
  --------------------------------
  Board rules and a two-player session state machine.

  Positions are 1..9, row-major:
     1 | 2 | 3
     4 | 5 | 6
     7 | 8 | 9
  X always moves first. A session goes INVITED -> IN_PROGRESS -> COMPLETED and never
  moves backwards; an occupied cell is never overwritten.
*/

constexpr char kEmptyCell = ' ';

enum class GameState {
    INVITED,
    IN_PROGRESS,
    COMPLETED
};

enum class GameResult {
    NONE,
    WIN,
    DRAW
};

struct Outcome
{
    GameResult result = GameResult::NONE;
    char winner = kEmptyCell;
    std::array<int, 3> line{{0, 0, 0}}; // winning positions, 1-based

    bool IsTerminal() const { return result != GameResult::NONE; }
};

inline char OtherSymbol(char symbol)
{
    return symbol == 'X' ? 'O' : 'X';
}

inline bool IsValidSymbol(char symbol)
{
    return symbol == 'X' || symbol == 'O';
}

class Board
{
public:
    Board() { m_cells.fill(kEmptyCell); }

    char At(int position) const { return m_cells[static_cast<size_t>(position - 1)]; }

    bool IsOccupied(int position) const { return At(position) != kEmptyCell; }

    static bool IsValidPosition(int position) { return position >= 1 && position <= 9; }

    // Throws InvalidMove for out-of-range or occupied positions
    void Place(int position, char symbol)
    {
        if (!IsValidPosition(position)) {
            throw InvalidMove("position " + std::to_string(position) + " is outside 1-9");
        }
        if (IsOccupied(position)) {
            throw InvalidMove("position " + std::to_string(position) + " is already taken");
        }
        m_cells[static_cast<size_t>(position - 1)] = symbol;
    }

    bool IsFull() const
    {
        for (char c : m_cells) {
            if (c == kEmptyCell) {
                return false;
            }
        }
        return true;
    }

    // Eight lines first, then the full-board draw
    Outcome Evaluate() const
    {
        static const int kLines[8][3] = {
            {1, 2, 3}, {4, 5, 6}, {7, 8, 9}, // rows
            {1, 4, 7}, {2, 5, 8}, {3, 6, 9}, // columns
            {1, 5, 9}, {3, 5, 7}             // diagonals
        };

        Outcome out;
        for (const auto &l : kLines) {
            char c = At(l[0]);
            if (c != kEmptyCell && c == At(l[1]) && c == At(l[2])) {
                out.result = GameResult::WIN;
                out.winner = c;
                out.line = {{l[0], l[1], l[2]}};
                return out;
            }
        }
        if (IsFull()) {
            out.result = GameResult::DRAW;
        }
        return out;
    }

    // "XO X  O  " style, one char per cell
    std::string ToString() const { return std::string(m_cells.begin(), m_cells.end()); }

private:
    std::array<char, 9> m_cells;
};

class GameSession
{
public:
    GameSession(const std::string &gameId, const std::string &playerX, const std::string &playerO)
        : m_gameId(gameId), m_playerX(playerX), m_playerO(playerO), m_turn('X'), m_moveCount(0),
          m_state(GameState::INVITED)
    {
        if (playerX.empty() || playerO.empty() || playerX == playerO) {
            throw InvalidMove("a game needs two distinct players");
        }
    }

    // Invitations are accepted as soon as they exist
    void Accept()
    {
        if (m_state == GameState::INVITED) {
            m_state = GameState::IN_PROGRESS;
        }
    }

    /*
      Validate and apply one move by player. On a terminal board the session is
      COMPLETED. Throws InvalidMove without touching state when the move is illegal.
    */
    Outcome ApplyMove(const std::string &player, int position)
    {
        if (m_state != GameState::IN_PROGRESS) {
            throw InvalidMove("game " + m_gameId + " is not in progress");
        }
        char symbol = SymbolOf(player);
        if (symbol == kEmptyCell) {
            throw InvalidMove(player + " is not playing in game " + m_gameId);
        }
        if (symbol != m_turn) {
            throw InvalidMove(std::string("not ") + symbol + "'s turn in game " + m_gameId);
        }
        m_board.Place(position, symbol);
        ++m_moveCount;
        m_turn = OtherSymbol(m_turn);

        m_outcome = m_board.Evaluate();
        if (m_outcome.IsTerminal()) {
            m_state = GameState::COMPLETED;
        }
        return m_outcome;
    }

    // Ends the game on a peer's say-so (RESULT that overtook the final MOVE)
    void Complete(const Outcome &outcome)
    {
        m_outcome = outcome;
        m_state = GameState::COMPLETED;
    }

    char SymbolOf(const std::string &player) const
    {
        if (player == m_playerX) {
            return 'X';
        }
        if (player == m_playerO) {
            return 'O';
        }
        return kEmptyCell;
    }

    const std::string &PlayerFor(char symbol) const { return symbol == 'X' ? m_playerX : m_playerO; }

    const std::string &Opponent(const std::string &player) const
    {
        return player == m_playerX ? m_playerO : m_playerX;
    }

    const std::string &GameId() const { return m_gameId; }
    const std::string &PlayerX() const { return m_playerX; }
    const std::string &PlayerO() const { return m_playerO; }
    char Turn() const { return m_turn; }
    int MoveCount() const { return m_moveCount; }
    GameState State() const { return m_state; }
    const Board &GetBoard() const { return m_board; }
    const Outcome &GetOutcome() const { return m_outcome; }

private:
    std::string m_gameId;
    std::string m_playerX;
    std::string m_playerO;
    Board m_board;
    char m_turn;
    int m_moveCount;
    GameState m_state;
    Outcome m_outcome;
};

inline const char *GameStateName(GameState state)
{
    switch (state) {
    case GameState::INVITED:
        return "INVITED";
    case GameState::IN_PROGRESS:
        return "IN_PROGRESS";
    case GameState::COMPLETED:
        return "COMPLETED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace lsnp

#endif // LSNP_CORE_TICTACTOE_HPP
