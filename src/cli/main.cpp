#include "core/Board.hpp"
#include "core/GameController.hpp"
#include "core/GameState.hpp"
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

int main(int argc, char** argv) {
    std::srand(static_cast<unsigned>(std::time(nullptr)));

    ControllerConfig config;
    if (argc > 1) config.searchDepth = std::atoi(argv[1]);
    if (config.searchDepth < 1) config.searchDepth = 1;
    if (config.searchDepth > 9) config.searchDepth = 9;

    char modeChoice = 'm';
    std::cout << "Play against minimax (m) or random (r)? [m]: ";
    if (!(std::cin >> modeChoice)) {
        modeChoice = 'm';
        std::cin.clear();
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    config.opponent = (modeChoice == 'r' || modeChoice == 'R') ? StrategyKind::Random
                                                               : StrategyKind::Minimax;

    try {
        GameController controller(config);
        controller.setOnStateChanged([](const GameState& state) {
            state.GetBoard().print();
        });
        controller.setOnGameOver([](std::optional<Player> winner) {
            if (winner) {
                std::cout << "\n" << Symbol(*winner) << " wins!\n";
            } else {
                std::cout << "\nDraw!\n";
            }
        });
        // first game started before the handlers were installed
        controller.state().GetBoard().print();

        std::string line;
        while (true) {
            if (controller.phase() == GamePhase::GameOver) {
                std::cout << "\n'r' to play again, 'q' to quit: ";
            } else {
                std::cout << "\nYou play " << Symbol(controller.humanPlayer())
                          << ". Enter row and column ('r' reset, 'q' quit): ";
            }
            if (!std::getline(std::cin, line)) break;
            if (line == "q" || line == "Q") break;
            if (line == "r" || line == "R") {
                controller.resetGame();
                continue;
            }

            std::istringstream iss(line);
            int r = 0, c = 0;
            if (!(iss >> r >> c) || !controller.submitHumanMove(r, c)) {
                std::cout << "Invalid move, try again.\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
