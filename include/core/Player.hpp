#pragma once
#include <optional>

/**
 * The two marks of the game. First always opens the game.
 */
enum class Player { First, Second };

/// Cell content: empty optional = free cell, otherwise the owning player.
using Cell = std::optional<Player>;

/// Returns the other player.
inline Player Opponent(Player p) {
    return p == Player::First ? Player::Second : Player::First;
}

/// Display symbol ('O' opens the game, 'X' answers).
inline char Symbol(Player p) {
    return p == Player::First ? 'O' : 'X';
}

/// Display symbol for a cell, ' ' when empty.
inline char Symbol(const Cell& cell) {
    return cell ? Symbol(*cell) : ' ';
}
