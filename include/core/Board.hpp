#pragma once
#include "core/Player.hpp"
#include <array>
#include <iostream>

/**
 * Board coordinate, row and column in [0, 2].
 */
struct Move {
    int row;
    int col;

    /// Linear index helper (idx = row * 3 + col).
    int index() const { return row * 3 + col; }
    bool operator==(const Move& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Move& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Move& m);

class Board {
public:
    static constexpr int N = 3;
    std::array<std::array<Cell, N>, N> cells; // row-major, empty = free cell

    Board();
    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;

    /// Returns true if (r, c) lies on the board.
    static bool inRange(int r, int c);
    /// Cell at (r, c); throws std::out_of_range off the board.
    const Cell& at(int r, int c) const;
    bool isEmpty(int r, int c) const;
    /// Number of non-empty cells.
    int occupiedCount() const;
    void print(std::ostream& os = std::cout) const;
    bool place(int r, int c, Player player);
    bool place(const Move& m, Player player);

    bool operator==(const Board& other) const { return cells == other.cells; }
    bool operator!=(const Board& other) const { return !(*this == other); }
};
