#pragma once
#include "core/Board.hpp"
#include "core/Player.hpp"
#include <array>
#include <optional>
#include <vector>

/**
 * Result of a terminal check: over = game ended, winner empty on a draw.
 */
struct Outcome {
    bool over{false};
    std::optional<Player> winner;
};

/**
 *Snapshot of a game position with the player to move.
 *
 * Value type: transitions return a new state and never touch the source.
 */
class GameState {
private:
    Board Cells;
    Player Turn_;
    int MoveCount_; // always equals Cells.occupiedCount()
public:
    /// Creates the empty position, First to move.
    GameState();
    /// Creates a state from a board and the player to move.
    GameState(const Board& b, Player turn);
    GameState(const GameState& other) = default;
    GameState& operator=(const GameState& other) = default;

    /// Returns every free coordinate in row-major order.
    std::vector<Move> GetAvailableMoves() const;
    /// Returns the successor state; throws IllegalMoveError.
    GameState Apply(const Move& m) const;
    /// Returns the outcome (over + winner, or over + draw, or not over).
    Outcome IsTerminal() const;
    /// Returns the owner of a complete line, if any.
    std::optional<Player> Winner() const;
    /// The 8 winning lines: rows, columns, diagonals.
    static const std::array<std::array<Move, 3>, 8>& Lines();

    Player Turn() const { return Turn_; }
    int MoveCount() const { return MoveCount_; }
    const Board& GetBoard() const { return Cells; }

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }
};
