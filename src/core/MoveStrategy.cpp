#include "core/MoveStrategy.hpp"
#include "core/Errors.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

void IMoveStrategy::checkCanMove(const GameState& state) const {
    if (state.IsTerminal().over) {
        throw NoLegalMoveError(name() + " strategy asked to move on a terminal state");
    }
    if (state.Turn() != bound) {
        throw std::logic_error(name() + " strategy asked to move out of turn");
    }
}

RandomStrategy::RandomStrategy(Player p) : IMoveStrategy(p) {}

//Random selection from the available moves list
Move RandomStrategy::predictMove(const GameState& state) {
    checkCanMove(state);
    const std::vector<Move> moves = state.GetAvailableMoves();
    const Move m = moves[std::rand() % moves.size()];
    if (logUsage) {
        std::cout << "[Random] " << Symbol(bound) << " plays " << m << "\n";
    }
    return m;
}

MinimaxStrategy::MinimaxStrategy(Player p, int maxDepth, ScoreMode mode)
    : IMoveStrategy(p), maxDepth(maxDepth), search(mode) {
    if (maxDepth < 1) {
        throw std::invalid_argument("MinimaxStrategy depth must be at least 1");
    }
}

Move MinimaxStrategy::predictMove(const GameState& state) {
    checkCanMove(state);
    last = search.bestMove(state, bound, maxDepth);
    if (logUsage) {
        std::cout << "[Minimax] " << Symbol(bound) << " plays " << last.bestMove
                  << " score=" << last.score
                  << " nodes=" << last.nodes
                  << (last.truncated ? " (depth-limited)" : "") << "\n";
    }
    return last.bestMove;
}

std::unique_ptr<IMoveStrategy> makeStrategy(StrategyKind kind, Player player, int depth, ScoreMode mode) {
    switch (kind) {
    case StrategyKind::Random:
        return std::make_unique<RandomStrategy>(player);
    case StrategyKind::Minimax:
        return std::make_unique<MinimaxStrategy>(player, depth, mode);
    }
    throw std::invalid_argument("Unknown strategy kind");
}
