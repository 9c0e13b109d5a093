// src/mcts/statistics_store.cpp
#include "mcts/statistics_store.h"
#include <unordered_set>
#include <utility>

namespace uctsearch {
namespace mcts {

int StatisticsStore::getVisits(const core::StatePtr& state) const {
    auto it = stats_.find(state);
    return it == stats_.end() ? 0 : it->second.visits;
}

double StatisticsStore::getTotalReward(const core::StatePtr& state) const {
    auto it = stats_.find(state);
    return it == stats_.end() ? 0.0 : it->second.total_reward;
}

double StatisticsStore::getAverageReward(const core::StatePtr& state) const {
    auto it = stats_.find(state);
    if (it == stats_.end() || it->second.visits == 0) {
        throw core::InvalidOperationException(
            "average reward requested for unvisited state " + state->toString());
    }
    return it->second.total_reward / it->second.visits;
}

void StatisticsStore::recordVisit(const core::StatePtr& state, double reward) {
    NodeStats& stats = stats_[state];
    stats.visits += 1;
    stats.total_reward += reward;
}

bool StatisticsStore::isExpanded(const core::StatePtr& state) const {
    return children_.find(state) != children_.end();
}

const std::vector<core::StatePtr>& StatisticsStore::getChildren(const core::StatePtr& state) const {
    auto it = children_.find(state);
    if (it == children_.end()) {
        throw core::InvalidOperationException(
            "children requested for unexpanded state " + state->toString());
    }
    return it->second;
}

bool StatisticsStore::setChildren(const core::StatePtr& state, std::vector<core::StatePtr> children) {
    if (isExpanded(state)) {
        return false;
    }

    std::unordered_set<core::StatePtr, core::StatePtrHash, core::StatePtrEqual> seen;
    std::vector<core::StatePtr> unique_children;
    unique_children.reserve(children.size());
    for (auto& child : children) {
        if (seen.insert(child).second) {
            unique_children.push_back(std::move(child));
        }
    }

    children_.emplace(state, std::move(unique_children));
    return true;
}

void StatisticsStore::clear() {
    stats_.clear();
    children_.clear();
}

} // namespace mcts
} // namespace uctsearch
