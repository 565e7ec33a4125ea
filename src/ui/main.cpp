#include "ui/TicTacToeUI.hpp"

#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <limits>

int main() {
    std::srand(static_cast<unsigned>(std::time(nullptr)));
    const std::string fontPath = "../assets/DejaVuSans.ttf";

    char modeChoice = 'm';
    std::cout << "Play against minimax (m) or random (r)? [m]: ";
    if (!(std::cin >> modeChoice)) {
        modeChoice = 'm';
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    ControllerConfig config;
    config.opponent = (modeChoice == 'r' || modeChoice == 'R') ? StrategyKind::Random
                                                               : StrategyKind::Minimax;
    try {
        TicTacToeUI game(config, fontPath);
        return game.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
