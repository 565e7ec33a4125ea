#include "core/Board.hpp"
#include <iostream>
#include <stdexcept>

std::ostream& operator<<(std::ostream& os, const Move& m) {
    return os << "(" << m.row << "," << m.col << ")";
}

Board::Board() {
    for (auto& row : cells) {
        row.fill(std::nullopt);
    }
}

bool Board::inRange(int r, int c) {
    return r >= 0 && r < N && c >= 0 && c < N;
}

const Cell& Board::at(int r, int c) const {
    if (!inRange(r, c)) {
        throw std::out_of_range("Board::at row/column out of range");
    }
    return cells[r][c];
}

bool Board::isEmpty(int r, int c) const {
    return !at(r, c).has_value();
}

int Board::occupiedCount() const {
    int count = 0;
    for (const auto& row : cells) {
        for (const auto& cell : row) {
            if (cell) count++;
        }
    }
    return count;
}

void Board::print(std::ostream& os) const {
    os << "\n    0   1   2\n";
    for (int r = 0; r < N; ++r) {
        os << r << "  ";
        for (int c = 0; c < N; ++c) {
            os << " " << Symbol(cells[r][c]) << " ";
            if (c + 1 < N) os << "|";
        }
        os << "\n";
        if (r + 1 < N) os << "   ---+---+---\n";
    }
}

bool Board::place(int r, int c, Player player) {
    // User input placement validation
    if (!inRange(r, c)) {
        throw std::out_of_range("Board::place row/column out of range");
    }

    auto& cell = cells[r][c];
    if (cell) return false;

    cell = player;
    return true;
}

bool Board::place(const Move& m, Player player) {
    return place(m.row, m.col, player);
}
