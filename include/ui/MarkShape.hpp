#pragma once

#include <SFML/Graphics.hpp>

#include "core/Player.hpp"

/**
 * Drawable mark for one cell: a ring for O, two crossed bars for X.
 */
class MarkShape {
public:
    MarkShape(Player player, const sf::Vector2f& center, float cellSize);

    void setColor(const sf::Color& color);
    Player player() const { return player_; }
    sf::Vector2f getPosition() const { return center_; }

    void draw(sf::RenderTarget& target) const;

private:
    Player player_;
    sf::Vector2f center_;
    sf::CircleShape ring_;
    sf::RectangleShape bars_[2];
};
