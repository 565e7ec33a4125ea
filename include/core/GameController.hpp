#pragma once
#include <functional>
#include <memory>
#include <optional>
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"
#include "core/Player.hpp"

enum class GamePhase { AwaitingInput, AwaitingStrategy, GameOver };

/**
 * Per-game settings read by the controller at every reset.
 */
struct ControllerConfig {
    StrategyKind opponent{StrategyKind::Minimax};
    int searchDepth{MinimaxStrategy::DEFAULT_DEPTH};
    ScoreMode scoreMode{ScoreMode::DepthAware};
    bool randomOpening{true}; // computer opens with a random move when it plays First
    bool verbose{true};
};

/**
 * Owns the canonical game state and alternates human and computer turns.
 *
 * The presentation layer calls resetGame()/submitHumanMove() and is told
 * about changes only through the two handlers.
 */
class GameController {
public:
    using StateChangedHandler = std::function<void(const GameState&)>;
    using GameOverHandler = std::function<void(std::optional<Player>)>;

    /// Starts the first game with a random player assignment.
    explicit GameController(ControllerConfig config = ControllerConfig());

    void setOnStateChanged(StateChangedHandler handler);
    void setOnGameOver(GameOverHandler handler);

    /// New game; the human's mark is drawn at random.
    void resetGame();
    /// New game with the human playing the given mark.
    void resetGame(Player human);
    /// Plays (row, col) for the human and answers with the computer move.
    /// Returns false, without any change, when the move is not accepted.
    bool submitHumanMove(int row, int col);

    const GameState& state() const { return state_; }
    GamePhase phase() const { return phase_; }
    Player humanPlayer() const { return human_; }
    Player computerPlayer() const { return Opponent(human_); }
    /// Winner once the game is over (empty on a draw or while playing).
    std::optional<Player> winner() const { return winner_; }
    const IMoveStrategy& opponent() const { return *opponent_; }
    const ControllerConfig& config() const { return config_; }

private:
    /// Installs next as the canonical state and enters GameOver when terminal.
    void commit(const GameState& next);
    void playStrategyTurn();
    void notifyStateChanged() const;

    ControllerConfig config_;
    GameState state_;
    GamePhase phase_{GamePhase::AwaitingInput};
    Player human_{Player::First};
    std::optional<Player> winner_;
    std::unique_ptr<IMoveStrategy> opponent_;
    StateChangedHandler onStateChanged_;
    GameOverHandler onGameOver_;
};
