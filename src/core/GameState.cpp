#include "core/GameState.hpp"
#include "core/Errors.hpp"
#include <stdexcept>
#include <vector>

const std::array<std::array<Move, 3>, 8>& GameState::Lines() {
    static const std::array<std::array<Move, 3>, 8> lines = {{
        {{{0, 0}, {0, 1}, {0, 2}}},
        {{{1, 0}, {1, 1}, {1, 2}}},
        {{{2, 0}, {2, 1}, {2, 2}}},
        {{{0, 0}, {1, 0}, {2, 0}}},
        {{{0, 1}, {1, 1}, {2, 1}}},
        {{{0, 2}, {1, 2}, {2, 2}}},
        {{{0, 0}, {1, 1}, {2, 2}}},
        {{{2, 0}, {1, 1}, {0, 2}}}
    }}; //rows, columns, diagonals
    return lines;
}

GameState::GameState() : Cells(), Turn_(Player::First), MoveCount_(0) {}
GameState::GameState(const Board& b, Player turn) : Cells(b), Turn_(turn), MoveCount_(b.occupiedCount()) {}

//Free cells for the current GameState, row-major
std::vector<Move> GameState::GetAvailableMoves() const {
    std::vector<Move> moves;
    if (MoveCount_ == Board::N * Board::N) return moves;
    moves.reserve(Board::N * Board::N - MoveCount_);
    for (int r = 0; r < Board::N; ++r) {
        for (int c = 0; c < Board::N; ++c) {
            if (!Cells.cells[r][c]) {
                moves.push_back({r, c});
            }
        }
    }
    return moves;
}

GameState GameState::Apply(const Move& m) const {
    if (!Board::inRange(m.row, m.col)) {
        throw IllegalMoveError(m, "coordinate out of range");
    }
    if (MoveCount_ == Board::N * Board::N) {
        throw IllegalMoveError(m, "board is full");
    }
    if (Winner()) {
        throw IllegalMoveError(m, "game is over");
    }
    GameState next(*this);
    if (!next.Cells.place(m, Turn_)) {
        throw IllegalMoveError(m, "cell is occupied");
    }
    next.MoveCount_++;
    next.Turn_ = Opponent(Turn_);
    return next;
}

//Determine if a line is complete in the current GameState
std::optional<Player> GameState::Winner() const {
    std::optional<Player> winner;
    for (const auto& line : Lines()) {
        const Cell& a = Cells.cells[line[0].row][line[0].col];
        if (!a) continue;
        if (a != Cells.cells[line[1].row][line[1].col]) continue;
        if (a != Cells.cells[line[2].row][line[2].col]) continue;
        if (winner && *winner != *a) {
            // Apply refuses moves after a win, so only a hand-built board gets here
            throw std::logic_error("GameState has complete lines for both players");
        }
        winner = a;
    }
    return winner;
}

//Verify if the game is over
Outcome GameState::IsTerminal() const {
    auto winner = Winner();
    if (winner) {
        return {true, winner};
    }
    if (MoveCount_ == Board::N * Board::N) {
        return {true, std::nullopt};
    }
    return {false, std::nullopt};
}

bool GameState::operator==(const GameState& other) const {
    return Turn_ == other.Turn_ && MoveCount_ == other.MoveCount_ && Cells == other.Cells;
}
