#include "core/MinimaxSearch.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

MinimaxSearch::MinimaxSearch(ScoreMode mode) : mode(mode) {}

void MinimaxSearch::setParallelThreads(int threads) {
    parallelRootThreads = std::max(1, threads);
}

int MinimaxSearch::staticEval(const GameState& state, Player forPlayer) {
    const Board& board = state.GetBoard();
    int score = 0;
    for (const auto& line : GameState::Lines()) {
        int self = 0, opp = 0;
        for (const auto& m : line) {
            const Cell& cell = board.cells[m.row][m.col];
            if (!cell) continue;
            if (*cell == forPlayer) self++;
            else opp++;
        }
        if (self > 0 && opp == 0) score++;
        else if (opp > 0 && self == 0) score--;
    }
    return score;
}

int MinimaxSearch::terminalScore(const Outcome& outcome, Player forPlayer, int depth) const {
    if (!outcome.winner) return 0;
    const int magnitude = WIN_SCORE + (mode == ScoreMode::DepthAware ? depth : 0);
    return *outcome.winner == forPlayer ? magnitude : -magnitude;
}

int MinimaxSearch::minimax(const GameState& state, Player forPlayer, int depth, Counters& counters) const {
    counters.nodes++;
    const Outcome outcome = state.IsTerminal();
    if (outcome.over) {
        return terminalScore(outcome, forPlayer, depth);
    }
    if (depth <= 0) {
        counters.truncated = true;
        return staticEval(state, forPlayer);
    }

    const bool maximizing = (state.Turn() == forPlayer);
    int best = maximizing ? -(WIN_SCORE + depth + 1) : (WIN_SCORE + depth + 1);
    for (const Move& m : state.GetAvailableMoves()) {
        int score = minimax(state.Apply(m), forPlayer, depth - 1, counters);
        best = maximizing ? std::max(best, score) : std::min(best, score);
    }
    return best;
}

SearchResult MinimaxSearch::bestMove(const GameState& state, Player forPlayer, int maxDepth) const {
    if (maxDepth < 1) {
        throw std::invalid_argument("MinimaxSearch::bestMove depth must be at least 1");
    }
    if (state.IsTerminal().over) {
        throw NoLegalMoveError("MinimaxSearch::bestMove called on a terminal state");
    }

    const std::vector<Move> moves = state.GetAvailableMoves();
    std::vector<int> scores(moves.size(), 0);
    SearchResult result;
    result.nodes = 1; // root

    if (parallelRootThreads > 1 && moves.size() > 1) {
        // Siblings share nothing; scores land in generator order
        for (std::size_t begin = 0; begin < moves.size(); begin += parallelRootThreads) {
            const std::size_t end = std::min(moves.size(), begin + static_cast<std::size_t>(parallelRootThreads));
            std::vector<std::future<std::pair<int, Counters>>> futures;
            for (std::size_t i = begin; i < end; ++i) {
                GameState child = state.Apply(moves[i]);
                futures.push_back(std::async(std::launch::async, [this, child, forPlayer, maxDepth]() {
                    Counters local;
                    int score = minimax(child, forPlayer, maxDepth - 1, local);
                    return std::make_pair(score, local);
                }));
            }
            for (std::size_t i = begin; i < end; ++i) {
                auto scored = futures[i - begin].get();
                scores[i] = scored.first;
                result.nodes += scored.second.nodes;
                result.truncated = result.truncated || scored.second.truncated;
            }
        }
    } else {
        Counters counters;
        for (std::size_t i = 0; i < moves.size(); ++i) {
            scores[i] = minimax(state.Apply(moves[i]), forPlayer, maxDepth - 1, counters);
        }
        result.nodes += counters.nodes;
        result.truncated = counters.truncated;
    }

    // First maximum (or minimum when the opponent is to move) in generator order
    const bool maximizing = (state.Turn() == forPlayer);
    std::size_t bestIdx = 0;
    for (std::size_t i = 1; i < scores.size(); ++i) {
        if (maximizing ? scores[i] > scores[bestIdx] : scores[i] < scores[bestIdx]) {
            bestIdx = i;
        }
    }
    result.bestMove = moves[bestIdx];
    result.score = scores[bestIdx];
    return result;
}
