// include/mcts/statistics_store.h
#ifndef UCTSEARCH_MCTS_STATISTICS_STORE_H
#define UCTSEARCH_MCTS_STATISTICS_STORE_H

#include <vector>
#include <unordered_map>
#include <cstddef>
#include "core/istate.h"
#include "core/export_macros.h"

namespace uctsearch {
namespace mcts {

/**
 * @brief Visit statistics of a single state
 */
struct UCTSEARCH_API NodeStats {
    // Number of rollouts whose path went through the state
    int visits = 0;

    // Sum of the rewards credited to the state, from the perspective of the
    // player who moved into it
    double total_reward = 0.0;
};

/**
 * @brief Search statistics keyed by state
 *
 * Holds a visit count and reward total for every state ever visited, and the
 * memoized successor list of every state ever expanded. Lookups of unseen
 * states yield zero. Entries are never removed except by clear().
 *
 * Not thread-safe; owned by a single engine.
 */
class UCTSEARCH_API StatisticsStore {
public:
    using StatsMap = std::unordered_map<core::StatePtr, NodeStats,
                                        core::StatePtrHash, core::StatePtrEqual>;
    using ChildrenMap = std::unordered_map<core::StatePtr, std::vector<core::StatePtr>,
                                           core::StatePtrHash, core::StatePtrEqual>;

    StatisticsStore() = default;

    /**
     * @brief Get the visit count of a state (0 if never visited)
     */
    int getVisits(const core::StatePtr& state) const;

    /**
     * @brief Get the accumulated reward of a state (0.0 if never visited)
     */
    double getTotalReward(const core::StatePtr& state) const;

    /**
     * @brief Get the mean reward of a state
     *
     * @throws core::InvalidOperationException if the state has no visits
     */
    double getAverageReward(const core::StatePtr& state) const;

    /**
     * @brief Credit one visit with the given reward to a state
     */
    void recordVisit(const core::StatePtr& state, double reward);

    /**
     * @brief Check whether a state's successors have been memoized
     */
    bool isExpanded(const core::StatePtr& state) const;

    /**
     * @brief Get the memoized successors of an expanded state
     *
     * @throws core::InvalidOperationException if the state was never expanded
     */
    const std::vector<core::StatePtr>& getChildren(const core::StatePtr& state) const;

    /**
     * @brief Memoize the successors of a state
     *
     * No-op if the state is already expanded. Equal successors are collapsed
     * into their first occurrence, so the stored order is the enumeration
     * order with duplicates removed.
     *
     * @return true if the entry was inserted
     */
    bool setChildren(const core::StatePtr& state, std::vector<core::StatePtr> children);

    size_t numTracked() const { return stats_.size(); }
    size_t numExpanded() const { return children_.size(); }

    const StatsMap& getStats() const { return stats_; }

    void clear();

private:
    StatsMap stats_;
    ChildrenMap children_;
};

} // namespace mcts
} // namespace uctsearch

#endif // UCTSEARCH_MCTS_STATISTICS_STORE_H
