#include "core/GameController.hpp"
#include "core/MoveStrategy.hpp"
#include "TestUtil.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

/**
 * test the turn-alternating game controller
 */

static ControllerConfig quietConfig()
{
    ControllerConfig config;
    config.verbose = false;
    return config;
}

static void test_reset_assignment()
{
    GameController controller(quietConfig());

    controller.resetGame(Player::First);
    check(controller.humanPlayer() == Player::First, "human should play First");
    check(controller.state().MoveCount() == 0, "human opening should start from an empty board");
    check(controller.phase() == GamePhase::AwaitingInput, "human opening should await input");
    check(controller.opponent().player() == Player::Second, "computer should be bound to Second");

    controller.resetGame(Player::Second);
    check(controller.state().MoveCount() == 1, "computer opening should be played at reset");
    check(controller.state().Turn() == Player::Second, "human should move after the opening");
    check(controller.phase() == GamePhase::AwaitingInput, "computer opening should await input");
    check(!controller.winner(), "new game should have no winner");

    std::srand(2024);
    bool sawFirst = false, sawSecond = false;
    for(int i = 0; i < 200; ++i) {
        controller.resetGame();
        int moves = controller.state().MoveCount();
        check(moves == 0 || moves == 1, "reset should leave 0 or 1 moves");
        check((moves == 0) == (controller.humanPlayer() == Player::First),
              "only a computer opening should leave a move on the board");
        check(controller.state().Turn() == controller.humanPlayer(), "human should be to move after reset");
        sawFirst = sawFirst || controller.humanPlayer() == Player::First;
        sawSecond = sawSecond || controller.humanPlayer() == Player::Second;
    }
    check(sawFirst && sawSecond, "random reset should assign both marks");
}

static void test_opening_by_strategy()
{
    ControllerConfig config = quietConfig();
    config.randomOpening = false;
    config.searchDepth = 9;
    GameController controller(config);

    controller.resetGame(Player::Second);
    check(controller.state().MoveCount() == 1, "strategy opening should be played at reset");
    check(controller.phase() == GamePhase::AwaitingInput, "strategy opening should end awaiting input");
    // Every opening draws under full search, so the first maximum in row-major order is the corner
    check(!controller.state().GetBoard().isEmpty(0, 0), "minimax opening should take (0,0)");
}

static void test_illegal_input_ignored()
{
    GameController controller(quietConfig());
    controller.resetGame(Player::Second);

    int changes = 0;
    controller.setOnStateChanged([&](const GameState&) { changes++; });

    const GameState before = controller.state();
    Move taken = GameState().GetAvailableMoves().front();
    for(const auto& m : GameState().GetAvailableMoves())
        if(!before.GetBoard().isEmpty(m.row, m.col))
            taken = m;

    check(!controller.submitHumanMove(taken.row, taken.col), "occupied cell should be refused");
    check(!controller.submitHumanMove(3, 0), "row 3 should be refused");
    check(!controller.submitHumanMove(0, -1), "column -1 should be refused");
    check(controller.state() == before, "refused input should not change the state");
    check(changes == 0, "refused input should not notify");
    check(controller.phase() == GamePhase::AwaitingInput, "refused input should keep awaiting input");
}

static void test_accepted_move_answers()
{
    GameController controller(quietConfig());
    controller.resetGame(Player::First);

    int changes = 0;
    controller.setOnStateChanged([&](const GameState& s) {
        changes++;
        check(s.MoveCount() == s.GetBoard().occupiedCount(), "notified state should be consistent");
    });

    check(controller.submitHumanMove(1, 1), "free cell should be accepted");
    check(changes == 2, "human and computer moves should both notify");
    check(controller.state().MoveCount() == 2, "computer should answer immediately");
    check(controller.state().Turn() == Player::First, "turn should come back to the human");
    check(controller.phase() == GamePhase::AwaitingInput, "controller should await input again");
}

// Random human against the minimax computer: never a human win
static void test_full_games()
{
    std::srand(5);
    GameController controller(quietConfig());

    int gameOvers = 0;
    std::optional<Player> reported;
    controller.setOnGameOver([&](std::optional<Player> winner) {
        gameOvers++;
        reported = winner;
    });
    int terminalNotices = 0;
    controller.setOnStateChanged([&](const GameState& s) {
        Outcome outcome = s.IsTerminal();
        check(outcome.over == (controller.phase() == GamePhase::GameOver),
              "phase seen by observers should match the notified state");
        if(outcome.over) {
            terminalNotices++;
            check(controller.winner() == outcome.winner, "winner should be set before the final notification");
            check(gameOvers == 0, "final state should be notified before game over");
        }
    });

    for(int game = 0; game < 30; ++game) {
        gameOvers = 0;
        terminalNotices = 0;
        controller.resetGame();
        RandomStrategy human(controller.humanPlayer());
        human.setLogUsage(false);

        while(controller.phase() != GamePhase::GameOver) {
            check(controller.phase() == GamePhase::AwaitingInput, "controller should await input between turns");
            Move m = human.predictMove(controller.state());
            check(controller.submitHumanMove(m.row, m.col), "legal human move should be accepted");
        }

        check(gameOvers == 1, "game over should be reported once");
        check(terminalNotices == 1, "final state should be notified once");
        check(reported == controller.winner(), "reported winner should match the controller");
        check(controller.winner() != controller.humanPlayer(), "random play should never beat minimax");
        check(!controller.submitHumanMove(0, 0), "finished game should refuse input");
        check(controller.state().IsTerminal().over, "finished game should be terminal");
    }
}

static void test_config()
{
    ControllerConfig config = quietConfig();
    config.opponent = StrategyKind::Random;
    GameController controller(config);
    check(controller.opponent().name() == "Random", "random opponent should be selectable");

    controller.resetGame(Player::First);
    check(controller.submitHumanMove(0, 0), "move against random opponent should be accepted");

    ControllerConfig bad = quietConfig();
    bad.searchDepth = 0;
    check(throws<std::invalid_argument>([&] { GameController c(bad); }), "depth 0 should be rejected");

    int changes = 0;
    controller.setOnStateChanged([&](const GameState&) { changes++; });
    controller.resetGame(Player::First);
    check(changes == 1, "reset should notify once");
    check(controller.state() == GameState(), "reset should clear the board");
}

int main(int ac, char * av[])
{
    test_reset_assignment();
    test_opening_by_strategy();
    test_illegal_input_ignored();
    test_accepted_move_answers();
    test_full_games();
    test_config();

    std::cout << "test_controller: ok" << std::endl;
    return 0;
}
