// include/mcts/mcts_engine.h
#ifndef UCTSEARCH_MCTS_ENGINE_H
#define UCTSEARCH_MCTS_ENGINE_H

#include <vector>
#include <random>
#include <cstdint>
#include "core/istate.h"
#include "core/export_macros.h"
#include "mcts/statistics_store.h"

namespace uctsearch {
namespace mcts {

struct UCTSEARCH_API MCTSSettings {
    // Weight of the exploration term in the UCT score
    double exploration_weight = 1.0;

    // Seed for random playouts; negative draws one from std::random_device
    int64_t seed = -1;

    // Emit a trace record for every rollout
    bool log_rollouts = false;
};

// States from the search root down to a newly reached leaf
using Path = std::vector<core::StatePtr>;

/**
 * @brief Monte Carlo Tree Search engine with the UCT tree policy
 *
 * Each rollout walks the already-expanded part of the state graph with UCT,
 * expands the first frontier state, scores it with a uniformly random
 * playout and backpropagates the reward with alternating perspective.
 * Statistics accumulate in the engine's store across rollouts and across
 * roots, so positions reached again later in a game reuse earlier work.
 *
 * Rewards are in [0, 1]. The value credited to a state is the reward of the
 * player who moved into it. Perspective flips once per ply, so the model must
 * be a two-player zero-sum game with strictly alternating turns.
 *
 * Ties are broken in favor of the first state in the model's successor
 * enumeration order.
 *
 * Single-threaded. The engine never checks a clock; callers decide how many
 * rollouts to run before calling choose().
 */
class UCTSEARCH_API MCTSEngine {
public:
    explicit MCTSEngine(const MCTSSettings& settings = MCTSSettings());

    /**
     * @brief Run one select/expand/simulate/backpropagate cycle from root
     *
     * A terminal root is its own leaf: it is expanded to an empty successor
     * set and credited with its terminal reward.
     */
    void rollout(const core::StatePtr& root);

    /**
     * @brief Pick the best move from root by mean reward
     *
     * Unvisited successors are never preferred over visited ones. If root
     * was never expanded a random successor is returned.
     *
     * @throws core::InvalidOperationException if root is terminal
     */
    core::StatePtr choose(const core::StatePtr& root);

    // Tree policy: path from root to the first unexpanded or terminal state
    Path select(const core::StatePtr& root) const;

    // Memoize the successors of state; no-op if already expanded
    void expand(const core::StatePtr& state);

    // Random playout from leaf, reward projected onto leaf's perspective
    double simulate(const core::StatePtr& leaf);

    // Credit reward to the last state of path, alternating towards the root
    void backpropagate(const Path& path, double reward);

    /**
     * @brief Select the successor of state with the highest UCT score
     *
     * @throws core::InvariantViolationException unless state and every one of
     *         its successors are expanded and visited
     */
    core::StatePtr uctSelect(const core::StatePtr& state) const;

    const StatisticsStore& getStore() const { return store_; }
    const MCTSSettings& getSettings() const { return settings_; }
    uint64_t getSeed() const { return seed_; }
    int getRolloutCount() const { return rollout_count_; }

private:
    MCTSSettings settings_;
    StatisticsStore store_;
    uint64_t seed_;
    std::mt19937 rng_;
    int rollout_count_ = 0;

    static void requireState(const core::StatePtr& state, const char* operation);
};

} // namespace mcts
} // namespace uctsearch

#endif // UCTSEARCH_MCTS_ENGINE_H
