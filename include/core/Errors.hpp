#pragma once
#include "core/Board.hpp"
#include <stdexcept>
#include <string>

/**
 * Move targets an occupied or off-board cell, or the game is already over.
 */
class IllegalMoveError : public std::invalid_argument {
public:
    IllegalMoveError(const Move& m, const std::string& reason);
    const Move& move() const { return move_; }

private:
    Move move_;
};

/**
 * Move selection requested on a state without legal moves.
 */
class NoLegalMoveError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
