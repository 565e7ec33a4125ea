#pragma once
#include <memory>
#include <string>
#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/MinimaxSearch.hpp"
#include "core/Player.hpp"

/**
 *Strategy interface for selecting a move.
 *
 * An instance is bound to one player for the lifetime of a game.
 */
class IMoveStrategy {
    public:
        explicit IMoveStrategy(Player p) : bound(p) {}
        /// Returns a legal move for the bound player; throws NoLegalMoveError on a terminal state.
        virtual Move predictMove(const GameState& state) = 0;
        /// Short name used in log lines.
        virtual std::string name() const = 0;
        /// Player this strategy moves for.
        Player player() const { return bound; }
        /// Enables or disables usage logging.
        void setLogUsage(bool enable) { logUsage = enable; }
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~IMoveStrategy() = default;
    protected:
        /// Throws unless state is non-terminal and it is the bound player's turn.
        void checkCanMove(const GameState& state) const;
        Player bound;
        bool logUsage{true};
};

/**
 *  Random move selection strategy.
 */
class RandomStrategy : public IMoveStrategy {
public:
    explicit RandomStrategy(Player p);
    /// Selects a legal move uniformly at random.
    Move predictMove(const GameState& state) override;
    std::string name() const override { return "Random"; }
};

/**
 * Minimax search strategy.
 */
class MinimaxStrategy : public IMoveStrategy {
public:
    static constexpr int DEFAULT_DEPTH = 8;

    /// Creates a minimax strategy searching maxDepth plies.
    MinimaxStrategy(Player p, int maxDepth = DEFAULT_DEPTH, ScoreMode mode = ScoreMode::DepthAware);
    /// Selects the best move for the bound player.
    Move predictMove(const GameState& state) override;
    std::string name() const override { return "Minimax"; }
    /// Returns the maximum search depth.
    int getMaxDepth() const { return maxDepth; }
    /// Sets the number of parallel root threads.
    void setParallelThreads(int threads) { search.setParallelThreads(threads); }
    /// Result of the last search.
    const SearchResult& lastResult() const { return last; }

private:
    int maxDepth;
    MinimaxSearch search;
    SearchResult last;
};

/// Opponent kinds selectable per game.
enum class StrategyKind { Random, Minimax };

/// Builds a strategy of the given kind bound to player.
std::unique_ptr<IMoveStrategy> makeStrategy(StrategyKind kind, Player player,
                                            int depth = MinimaxStrategy::DEFAULT_DEPTH,
                                            ScoreMode mode = ScoreMode::DepthAware);
