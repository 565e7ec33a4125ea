#include "core/GameController.hpp"
#include "core/Errors.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

GameController::GameController(ControllerConfig config) : config_(config) {
    if (config_.searchDepth < 1) {
        throw std::invalid_argument("ControllerConfig::searchDepth must be at least 1");
    }
    resetGame();
}

void GameController::setOnStateChanged(StateChangedHandler handler) {
    onStateChanged_ = std::move(handler);
}

void GameController::setOnGameOver(GameOverHandler handler) {
    onGameOver_ = std::move(handler);
}

void GameController::resetGame() {
    resetGame(std::rand() % 2 == 0 ? Player::First : Player::Second);
}

void GameController::resetGame(Player human) {
    human_ = human;
    state_ = GameState();
    winner_.reset();
    opponent_ = makeStrategy(config_.opponent, computerPlayer(), config_.searchDepth, config_.scoreMode);
    opponent_->setLogUsage(config_.verbose);
    if (config_.verbose) {
        std::cout << "[Controller] New game | human plays " << Symbol(human_)
                  << ", " << opponent_->name() << " plays " << Symbol(computerPlayer()) << "\n";
    }

    if (human_ == Player::First) {
        phase_ = GamePhase::AwaitingInput;
    } else if (config_.randomOpening) {
        // The computer opens at random instead of searching the empty board
        RandomStrategy opener(computerPlayer());
        opener.setLogUsage(config_.verbose);
        state_ = state_.Apply(opener.predictMove(state_));
        phase_ = GamePhase::AwaitingInput;
    } else {
        phase_ = GamePhase::AwaitingStrategy;
        state_ = state_.Apply(opponent_->predictMove(state_));
        phase_ = GamePhase::AwaitingInput;
    }
    notifyStateChanged();
}

bool GameController::submitHumanMove(int row, int col) {
    if (phase_ != GamePhase::AwaitingInput) {
        return false;
    }
    GameState next;
    try {
        next = state_.Apply(Move{row, col});
    } catch (const IllegalMoveError& e) {
        if (config_.verbose) {
            std::cout << "[Controller] Ignored input: " << e.what() << "\n";
        }
        return false;
    }
    commit(next);
    if (phase_ != GamePhase::GameOver) {
        phase_ = GamePhase::AwaitingStrategy;
        playStrategyTurn();
    }
    return true;
}

void GameController::playStrategyTurn() {
    // An illegal move here is a bug in the strategy, not user input
    const Move m = opponent_->predictMove(state_);
    commit(state_.Apply(m));
    if (phase_ != GamePhase::GameOver) {
        phase_ = GamePhase::AwaitingInput;
    }
}

void GameController::commit(const GameState& next) {
    state_ = next;
    const Outcome outcome = state_.IsTerminal();
    if (outcome.over) {
        phase_ = GamePhase::GameOver;
        winner_ = outcome.winner;
    }
    // Observers see the final phase and winner with the last state
    notifyStateChanged();
    if (!outcome.over) return;

    if (config_.verbose) {
        if (winner_) {
            std::cout << "[Controller] " << Symbol(*winner_) << " wins!\n";
        } else {
            std::cout << "[Controller] Draw!\n";
        }
    }
    if (onGameOver_) {
        onGameOver_(winner_);
    }
}

void GameController::notifyStateChanged() const {
    if (onStateChanged_) {
        onStateChanged_(state_);
    }
}
