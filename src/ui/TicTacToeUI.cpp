#include "ui/TicTacToeUI.hpp"

#include "core/GameState.hpp"

#include <iostream>
#include <string>

constexpr unsigned int kBoardSize = 500;
constexpr unsigned int kWindowHeight = 600;
constexpr float kCellSize = kBoardSize / 3.0f;
constexpr float kGridWidth = 8.0f;
constexpr float kStatusTop = kBoardSize + 12.0f;
constexpr float kButtonWidth = 140.0f;
constexpr float kButtonHeight = 32.0f;
constexpr float kButtonTop = kBoardSize + 58.0f;
constexpr sf::Uint8 kHoverAlpha = 40;
constexpr const char* kSystemFontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

TicTacToeUI::TicTacToeUI(const ControllerConfig& config, const std::string& fontPath)
    : fontPath_(fontPath), controller_(config), status_("Tic-tac-toe!") {
    controller_.setOnStateChanged([this](const GameState& state) {
        rebuildMarks(state);
    });
    controller_.setOnGameOver([this](std::optional<Player> winner) {
        handleGameOver(winner);
    });

    if (!loadFont()) {
        std::cerr << error_ << " Status is shown in the window title.\n";
    }
    buildLayout();
    // the first game was started before the handlers were installed
    rebuildMarks(controller_.state());
}

bool TicTacToeUI::loadFont() {
    fontLoaded_ = !fontPath_.empty() && font_.loadFromFile(fontPath_);
    if (!fontLoaded_) {
        fontLoaded_ = font_.loadFromFile(kSystemFontPath);
    }
    if (!fontLoaded_) {
        error_ = "Failed to load font: " + fontPath_;
        return false;
    }
    statusText_.setFont(font_);
    statusText_.setCharacterSize(28);
    statusText_.setFillColor(sf::Color::Black);
    resetLabel_.setFont(font_);
    resetLabel_.setString("Reset game");
    resetLabel_.setCharacterSize(18);
    resetLabel_.setFillColor(sf::Color::Black);
    return true;
}

void TicTacToeUI::buildLayout() {
    gridLines_.clear();
    for (int i = 1; i < 3; ++i) {
        const float offset = kCellSize * static_cast<float>(i) - kGridWidth / 2.0f;

        sf::RectangleShape vertical(sf::Vector2f(kGridWidth, static_cast<float>(kBoardSize)));
        vertical.setPosition(offset, 0.0f);
        vertical.setFillColor(sf::Color::Black);
        gridLines_.push_back(vertical);

        sf::RectangleShape horizontal(sf::Vector2f(static_cast<float>(kBoardSize), kGridWidth));
        horizontal.setPosition(0.0f, offset);
        horizontal.setFillColor(sf::Color::Black);
        gridLines_.push_back(horizontal);
    }

    hover_.setSize(sf::Vector2f(kCellSize, kCellSize));
    hover_.setFillColor(sf::Color(0, 0, 0, kHoverAlpha));

    resetButton_.setSize(sf::Vector2f(kButtonWidth, kButtonHeight));
    resetButton_.setPosition((kBoardSize - kButtonWidth) / 2.0f, kButtonTop);
    resetButton_.setFillColor(sf::Color(220, 220, 225));
    resetButton_.setOutlineColor(sf::Color(90, 90, 90));
    resetButton_.setOutlineThickness(2.0f);

    if (fontLoaded_) {
        const sf::FloatRect bounds = resetLabel_.getLocalBounds();
        resetLabel_.setPosition(
            (kBoardSize - bounds.width) / 2.0f - bounds.left,
            kButtonTop + (kButtonHeight - bounds.height) / 2.0f - bounds.top);
    }
    updateStatusText();
}

void TicTacToeUI::rebuildMarks(const GameState& state) {
    const sf::Color firstColor(70, 120, 210);
    const sf::Color secondColor(210, 70, 70);

    marks_.clear();
    const Board& board = state.GetBoard();
    for (int r = 0; r < Board::N; ++r) {
        for (int c = 0; c < Board::N; ++c) {
            const Cell& cell = board.cells[r][c];
            if (!cell) continue;
            sf::Vector2f center((c + 0.5f) * kCellSize, (r + 0.5f) * kCellSize);
            marks_.emplace_back(*cell, center, kCellSize);
            marks_.back().setColor(*cell == Player::First ? firstColor : secondColor);
        }
    }
    if (controller_.phase() != GamePhase::GameOver) {
        status_ = std::string("You play ") + Symbol(controller_.humanPlayer());
        updateStatusText();
    }
}

void TicTacToeUI::handleGameOver(std::optional<Player> winner) {
    status_ = winner ? std::string(1, Symbol(*winner)) + " wins!" : std::string("Draw!");
    updateStatusText();
}

bool TicTacToeUI::pickCell(const sf::Vector2f& pos, Move& out) const {
    if (pos.x < 0.0f || pos.y < 0.0f || pos.x >= kBoardSize || pos.y >= kBoardSize) {
        return false;
    }
    out.row = static_cast<int>(pos.y / kCellSize);
    out.col = static_cast<int>(pos.x / kCellSize);
    return Board::inRange(out.row, out.col);
}

bool TicTacToeUI::resetButtonHit(const sf::Vector2f& pos) const {
    return resetButton_.getGlobalBounds().contains(pos);
}

void TicTacToeUI::updateWindowTitle(sf::RenderWindow& window) const {
    window.setTitle("Tic-tac-toe - " + status_);
}

void TicTacToeUI::updateStatusText() {
    if (!fontLoaded_) {
        return;
    }
    statusText_.setString(status_);
    const sf::FloatRect bounds = statusText_.getLocalBounds();
    statusText_.setPosition((kBoardSize - bounds.width) / 2.0f - bounds.left, kStatusTop);
}

void TicTacToeUI::updateHover(const sf::RenderWindow& window) {
    hoveredIndex_ = -1;
    if (controller_.phase() != GamePhase::AwaitingInput) {
        return;
    }
    sf::Vector2f pos = window.mapPixelToCoords(sf::Mouse::getPosition(window));
    Move m{-1, -1};
    if (pickCell(pos, m) && controller_.state().GetBoard().isEmpty(m.row, m.col)) {
        hoveredIndex_ = m.index();
        hover_.setPosition(m.col * kCellSize, m.row * kCellSize);
    }
}

void TicTacToeUI::resetGame() {
    status_ = "Tic-tac-toe!";
    controller_.resetGame();
}

int TicTacToeUI::run() {
    sf::RenderWindow window(sf::VideoMode(kBoardSize, kWindowHeight), "Tic-tac-toe");
    window.setFramerateLimit(60);
    updateWindowTitle(window);

    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed ||
                (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::R) {
                resetGame();
                updateWindowTitle(window);
            }
            if (event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                Move m{-1, -1};
                if (resetButtonHit(pos)) {
                    resetGame();
                } else if (pickCell(pos, m)) {
                    controller_.submitHumanMove(m.row, m.col);
                }
                updateWindowTitle(window);
            }
        }

        updateHover(window);

        window.clear(sf::Color(245, 245, 240));
        if (hoveredIndex_ >= 0) {
            window.draw(hover_);
        }
        for (const auto& line : gridLines_) {
            window.draw(line);
        }
        for (const auto& mark : marks_) {
            mark.draw(window);
        }
        window.draw(resetButton_);
        if (fontLoaded_) {
            window.draw(resetLabel_);
            window.draw(statusText_);
        }
        window.display();
    }
    return 0;
}
