#pragma once

#include "core/Board.hpp"
#include "core/GameState.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

// Throws with msg when cond does not hold.
inline void check(bool cond, const std::string& msg)
{
    if(!cond)
        throw std::logic_error("error: " + msg);
}

// Builds a state from three rows of 'O', 'X' or '.'; 'O' is Player::First.
inline GameState fromRows(const std::vector<std::string>& rows, Player turn)
{
    Board board;
    for(int r = 0; r < Board::N; ++r)
        for(int c = 0; c < Board::N; ++c) {
            char ch = rows.at(r).at(c);
            if(ch == 'O')
                board.place(r, c, Player::First);
            else if(ch == 'X')
                board.place(r, c, Player::Second);
        }
    return GameState(board, turn);
}

inline bool contains(const std::vector<Move>& moves, const Move& m)
{
    return std::find(moves.begin(), moves.end(), m) != moves.end();
}

template<typename Exception, typename F>
bool throws(F&& f)
{
    try {
        f();
    } catch(const Exception&) {
        return true;
    }
    return false;
}
