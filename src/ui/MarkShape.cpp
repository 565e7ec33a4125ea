#include "ui/MarkShape.hpp"

#include <cmath>

constexpr float kMarkPadRatio = 0.1f;
constexpr float kStrokeWidth = 8.0f;

MarkShape::MarkShape(Player player, const sf::Vector2f& center, float cellSize)
    : player_(player), center_(center) {
    const float pad = kMarkPadRatio * cellSize;
    const float extent = cellSize - 2.0f * pad;

    const float radius = extent / 2.0f - kStrokeWidth;
    ring_.setRadius(radius);
    ring_.setOrigin(radius, radius); // enable positioning around center
    ring_.setPosition(center_);
    ring_.setFillColor(sf::Color::Transparent);
    ring_.setOutlineThickness(kStrokeWidth);

    const float length = extent * std::sqrt(2.0f);
    for (int i = 0; i < 2; ++i) {
        bars_[i].setSize(sf::Vector2f(length, kStrokeWidth));
        bars_[i].setOrigin(length / 2.0f, kStrokeWidth / 2.0f);
        bars_[i].setPosition(center_);
        bars_[i].setRotation(i == 0 ? 45.0f : -45.0f);
    }
    setColor(sf::Color::Black);
}

void MarkShape::setColor(const sf::Color& color) {
    ring_.setOutlineColor(color);
    bars_[0].setFillColor(color);
    bars_[1].setFillColor(color);
}

void MarkShape::draw(sf::RenderTarget& target) const {
    if (player_ == Player::First) {
        target.draw(ring_);
        return;
    }
    target.draw(bars_[0]);
    target.draw(bars_[1]);
}
