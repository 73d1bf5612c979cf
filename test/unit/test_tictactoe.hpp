#ifndef LSNP_TEST_UNIT_TEST_TICTACTOE_HPP
#define LSNP_TEST_UNIT_TEST_TICTACTOE_HPP

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/game_table.hpp"
#include "core/tictactoe.hpp"

namespace {

using lsnp::core::Board;
using lsnp::core::GameResult;
using lsnp::core::GameSession;
using lsnp::core::GameState;
using lsnp::core::GameTable;

const std::string kAlice = "alice@10.0.0.1";
const std::string kBob = "bob@10.0.0.2";

TEST(BoardTest, EveryLineIsDetected) {
    const std::array<std::array<int, 3>, 8> lines = {{{{1, 2, 3}},
                                                      {{4, 5, 6}},
                                                      {{7, 8, 9}},
                                                      {{1, 4, 7}},
                                                      {{2, 5, 8}},
                                                      {{3, 6, 9}},
                                                      {{1, 5, 9}},
                                                      {{3, 5, 7}}}};
    for (const auto& line : lines) {
        Board board;
        for (int pos : line) {
            board.Place(pos, 'O');
        }
        auto outcome = board.Evaluate();
        EXPECT_EQ(outcome.result, GameResult::WIN);
        EXPECT_EQ(outcome.winner, 'O');
        EXPECT_EQ(outcome.line, line);
    }
}

TEST(BoardTest, OccupiedAndOutOfRangeCellsAreRejected) {
    Board board;
    board.Place(5, 'X');
    EXPECT_THROW(board.Place(5, 'O'), lsnp::core::InvalidMove);
    EXPECT_THROW(board.Place(0, 'O'), lsnp::core::InvalidMove);
    EXPECT_THROW(board.Place(10, 'O'), lsnp::core::InvalidMove);
    EXPECT_EQ(board.At(5), 'X');
    EXPECT_EQ(board.ToString(), "    X    ");
}

TEST(GameSessionTest, XMovesFirstAndTurnsAlternate) {
    GameSession game("g0", kAlice, kBob);
    EXPECT_THROW(game.ApplyMove(kAlice, 1), lsnp::core::InvalidMove); // not accepted yet
    game.Accept();
    EXPECT_EQ(game.State(), GameState::IN_PROGRESS);

    EXPECT_THROW(game.ApplyMove(kBob, 1), lsnp::core::InvalidMove);
    game.ApplyMove(kAlice, 1);
    EXPECT_THROW(game.ApplyMove(kAlice, 2), lsnp::core::InvalidMove);
    EXPECT_THROW(game.ApplyMove("mallory@10.0.0.66", 2), lsnp::core::InvalidMove);
    game.ApplyMove(kBob, 2);
    EXPECT_EQ(game.Turn(), 'X');
    EXPECT_EQ(game.MoveCount(), 2);
}

TEST(GameSessionTest, RejectedMoveLeavesStateUntouched) {
    GameSession game("g0", kAlice, kBob);
    game.Accept();
    game.ApplyMove(kAlice, 5);
    EXPECT_THROW(game.ApplyMove(kBob, 5), lsnp::core::InvalidMove);
    EXPECT_EQ(game.Turn(), 'O');
    EXPECT_EQ(game.MoveCount(), 1);
    EXPECT_EQ(game.GetBoard().At(5), 'X');
}

TEST(GameSessionTest, WinCompletesTheGame) {
    GameSession game("g1", kAlice, kBob);
    game.Accept();
    game.ApplyMove(kAlice, 1);
    game.ApplyMove(kBob, 4);
    game.ApplyMove(kAlice, 2);
    game.ApplyMove(kBob, 5);
    auto outcome = game.ApplyMove(kAlice, 3);

    EXPECT_EQ(outcome.result, GameResult::WIN);
    EXPECT_EQ(outcome.winner, 'X');
    EXPECT_EQ(game.State(), GameState::COMPLETED);
    EXPECT_THROW(game.ApplyMove(kBob, 6), lsnp::core::InvalidMove);
}

TEST(GameSessionTest, FullBoardWithoutLineIsDraw) {
    // X O X / X O O / O X X
    GameSession game("g2", kAlice, kBob);
    game.Accept();
    const std::vector<int> moves = {1, 2, 3, 5, 4, 6, 8, 7, 9};
    lsnp::core::Outcome outcome;
    for (size_t i = 0; i < moves.size(); ++i) {
        outcome = game.ApplyMove(i % 2 == 0 ? kAlice : kBob, moves[i]);
    }
    EXPECT_EQ(outcome.result, GameResult::DRAW);
    EXPECT_EQ(game.State(), GameState::COMPLETED);
}

TEST(GameSessionTest, PlayersMustBeDistinct) {
    EXPECT_THROW(GameSession("g0", kAlice, kAlice), lsnp::core::InvalidMove);
    EXPECT_THROW(GameSession("g0", "", kBob), lsnp::core::InvalidMove);
}

TEST(GameTableTest, IdsWrapAfter256) {
    GameTable table;
    std::vector<std::string> ids;
    for (int i = 0; i < 300; ++i) {
        ids.push_back(table.AllocateId());
    }
    EXPECT_EQ(ids[0], "g0");
    EXPECT_EQ(ids[255], "g255");
    EXPECT_EQ(ids[256], "g0");
    EXPECT_EQ(ids[299], "g43");
}

TEST(GameTableTest, NextFreeIdSkipsActiveSessions) {
    GameTable table;
    GameSession active("g0", kAlice, kBob);
    ASSERT_TRUE(table.Add(active));
    EXPECT_FALSE(table.Add(active));
    EXPECT_EQ(table.NextFreeId(), "g1");
}

TEST(GameTableTest, TerminalMovePurgesSession) {
    GameTable table;
    GameSession game("g7", kAlice, kBob);
    game.Accept();
    table.Add(game);

    table.ApplyMove("g7", kAlice, 1);
    table.ApplyMove("g7", kBob, 4);
    table.ApplyMove("g7", kAlice, 5);
    table.ApplyMove("g7", kBob, 6);
    auto result = table.ApplyMove("g7", kAlice, 9);

    EXPECT_TRUE(result.outcome.IsTerminal());
    EXPECT_EQ(result.session.State(), GameState::COMPLETED);
    EXPECT_FALSE(table.Contains("g7"));
    EXPECT_THROW(table.ApplyMove("g7", kBob, 2), lsnp::core::GameNotFound);
}

TEST(GameTableTest, InvalidMoveKeepsStoredSession) {
    GameTable table;
    GameSession game("g3", kAlice, kBob);
    game.Accept();
    table.Add(game);
    table.ApplyMove("g3", kAlice, 1);

    EXPECT_THROW(table.ApplyMove("g3", kBob, 1), lsnp::core::InvalidMove);
    auto stored = table.Find("g3");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->MoveCount(), 1);
    EXPECT_EQ(stored->Turn(), 'O');
}

} // namespace

#endif // LSNP_TEST_UNIT_TEST_TICTACTOE_HPP
