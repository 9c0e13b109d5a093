// src/mcts/mcts_engine.cpp
#include "mcts/mcts_engine.h"
#include "utils/logger.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace uctsearch {
namespace mcts {

namespace {

uint64_t resolveSeed(int64_t seed) {
    if (seed >= 0) {
        return static_cast<uint64_t>(seed);
    }
    std::random_device rd;
    return static_cast<uint64_t>(rd());
}

} // anonymous namespace

MCTSEngine::MCTSEngine(const MCTSSettings& settings)
    : settings_(settings),
      store_(),
      seed_(resolveSeed(settings.seed)),
      rng_(static_cast<std::mt19937::result_type>(seed_)) {

    if (!(settings_.exploration_weight >= 0.0) || std::isinf(settings_.exploration_weight)) {
        throw std::invalid_argument("Exploration weight must be a finite non-negative number");
    }
    LOG_MCTS_DEBUG("MCTS engine created: exploration_weight={} seed={}",
                   settings_.exploration_weight, seed_);
}

void MCTSEngine::requireState(const core::StatePtr& state, const char* operation) {
    if (!state) {
        throw std::invalid_argument(std::string(operation) + " called with a null state");
    }
}

void MCTSEngine::rollout(const core::StatePtr& root) {
    requireState(root, "rollout");

    Path path = select(root);
    const core::StatePtr leaf = path.back();
    expand(leaf);
    double reward = simulate(leaf);
    backpropagate(path, reward);

    ++rollout_count_;
    if (settings_.log_rollouts) {
        LOG_MCTS_TRACE("rollout {}: depth={} reward={:.3f} root_visits={}",
                       rollout_count_, path.size() - 1, reward, store_.getVisits(root));
    }
}

core::StatePtr MCTSEngine::choose(const core::StatePtr& root) {
    requireState(root, "choose");

    if (root->isTerminal()) {
        throw core::InvalidOperationException("choose called on terminal state " + root->toString());
    }

    if (!store_.isExpanded(root)) {
        LOG_MCTS_WARN("choose called on an unexplored state, falling back to a random move");
        return root->randomSuccessor(rng_);
    }

    const auto& children = store_.getChildren(root);
    core::StatePtr best;
    double best_score = -std::numeric_limits<double>::infinity();

    for (const auto& child : children) {
        int visits = store_.getVisits(child);
        double score = visits == 0
            ? -std::numeric_limits<double>::infinity()
            : store_.getTotalReward(child) / visits;

        // Strict comparison keeps the earliest successor on ties
        if (!best || score > best_score) {
            best = child;
            best_score = score;
        }
    }

    if (!best) {
        throw core::InvalidOperationException(
            "non-terminal state has no successors: " + root->toString());
    }

    LOG_MCTS_DEBUG("chose move with mean reward {:.3f} over {} visits ({} candidates)",
                   best_score, store_.getVisits(best), children.size());
    return best;
}

Path MCTSEngine::select(const core::StatePtr& root) const {
    requireState(root, "select");

    Path path;
    core::StatePtr node = root;
    while (true) {
        path.push_back(node);

        // Unexplored or terminal
        if (!store_.isExpanded(node)) {
            return path;
        }
        const auto& children = store_.getChildren(node);
        if (children.empty()) {
            return path;
        }

        for (const auto& child : children) {
            if (!store_.isExpanded(child)) {
                path.push_back(child);
                return path;
            }
        }

        node = uctSelect(node);
    }
}

void MCTSEngine::expand(const core::StatePtr& state) {
    requireState(state, "expand");

    if (store_.isExpanded(state)) {
        return;
    }
    store_.setChildren(state, state->successors());
}

double MCTSEngine::simulate(const core::StatePtr& leaf) {
    requireState(leaf, "simulate");

    core::StatePtr state = leaf;
    bool invert_reward = true;
    while (!state->isTerminal()) {
        state = state->randomSuccessor(rng_);
        if (!state) {
            throw core::InvalidOperationException("randomSuccessor returned no state");
        }
        invert_reward = !invert_reward;
    }

    double reward = state->reward();
    return invert_reward ? 1.0 - reward : reward;
}

void MCTSEngine::backpropagate(const Path& path, double reward) {
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        store_.recordVisit(*it, reward);
        reward = 1.0 - reward;
    }
}

core::StatePtr MCTSEngine::uctSelect(const core::StatePtr& state) const {
    requireState(state, "uctSelect");

    if (!store_.isExpanded(state)) {
        LOG_MCTS_ERROR("UCT selection on unexpanded state {}", state->toString());
        throw core::InvariantViolationException("UCT selection on unexpanded state");
    }
    const auto& children = store_.getChildren(state);
    if (children.empty()) {
        throw core::InvariantViolationException("UCT selection on a state without successors");
    }

    int parent_visits = store_.getVisits(state);
    if (parent_visits <= 0) {
        LOG_MCTS_ERROR("UCT selection on unvisited state {}", state->toString());
        throw core::InvariantViolationException("UCT selection on unvisited state");
    }

    for (const auto& child : children) {
        if (!store_.isExpanded(child) || store_.getVisits(child) <= 0) {
            LOG_MCTS_ERROR("UCT selection with unexpanded or unvisited successor {}", child->toString());
            throw core::InvariantViolationException("UCT selection requires every successor to be expanded and visited");
        }
    }

    const double log_parent_visits = std::log(static_cast<double>(parent_visits));
    core::StatePtr best;
    double best_score = -std::numeric_limits<double>::infinity();

    for (const auto& child : children) {
        const double visits = static_cast<double>(store_.getVisits(child));
        const double score = store_.getTotalReward(child) / visits +
            settings_.exploration_weight * std::sqrt(log_parent_visits / visits);

        if (!best || score > best_score) {
            best = child;
            best_score = score;
        }
    }

    return best;
}

} // namespace mcts
} // namespace uctsearch
