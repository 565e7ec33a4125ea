#pragma once
#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/Player.hpp"
#include <cstdint>

/// Terminal scoring: Flat = +10/-10/0, DepthAware adds the remaining depth to wins and losses.
enum class ScoreMode { Flat, DepthAware };

/**
 *  Minimax search result container.
 */
struct SearchResult {
    Move bestMove{-1, -1};
    int score{0};
    std::uint64_t nodes{0};
    bool truncated{false}; // some node was scored by the static evaluation
};

/**
 * Exhaustive minimax over cloned states, bounded by a ply depth.
 *
 * Recursive calls only return scores; the move is picked at the root as
 * the first maximum in GetAvailableMoves() order.
 */
class MinimaxSearch {
public:
    static constexpr int WIN_SCORE = 10;

    explicit MinimaxSearch(ScoreMode mode = ScoreMode::DepthAware);

    /// Returns the best move for forPlayer; throws NoLegalMoveError on a terminal state.
    SearchResult bestMove(const GameState& state, Player forPlayer, int maxDepth) const;
    /// Scores root children concurrently when threads > 1.
    void setParallelThreads(int threads);
    int parallelThreads() const { return parallelRootThreads; }
    ScoreMode scoreMode() const { return mode; }

    /// Open lines holding forPlayer marks minus the same for the opponent, in [-8, 8].
    static int staticEval(const GameState& state, Player forPlayer);

private:
    struct Counters {
        std::uint64_t nodes{0};
        bool truncated{false};
    };

    int minimax(const GameState& state, Player forPlayer, int depth, Counters& counters) const;
    int terminalScore(const Outcome& outcome, Player forPlayer, int depth) const;

    ScoreMode mode;
    int parallelRootThreads{1};
};
