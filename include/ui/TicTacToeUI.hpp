#pragma once

#include <SFML/Graphics.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/GameController.hpp"
#include "ui/MarkShape.hpp"

class TicTacToeUI {
public:
    TicTacToeUI(const ControllerConfig& config, const std::string& fontPath);

    int run();

private:
    bool loadFont();
    void buildLayout();
    void rebuildMarks(const GameState& state);
    void handleGameOver(std::optional<Player> winner);
    bool pickCell(const sf::Vector2f& pos, Move& out) const;
    bool resetButtonHit(const sf::Vector2f& pos) const;
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateStatusText();
    void updateHover(const sf::RenderWindow& window);
    void resetGame();

    std::string fontPath_;
    GameController controller_;
    std::string status_;
    int hoveredIndex_ = -1;

    sf::Font font_;
    bool fontLoaded_ = false;
    sf::Text statusText_;
    sf::Text resetLabel_;
    sf::RectangleShape resetButton_;
    sf::RectangleShape hover_;
    std::vector<sf::RectangleShape> gridLines_;
    std::vector<MarkShape> marks_;
    std::string error_;
};
