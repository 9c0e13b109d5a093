// include/core/istate.h
#ifndef UCTSEARCH_CORE_ISTATE_H
#define UCTSEARCH_CORE_ISTATE_H

#include <vector>
#include <string>
#include <memory>
#include <random>
#include <cstdint>
#include <cstddef>
#include "core/export_macros.h"
#include "core/exceptions.h"

namespace uctsearch {
namespace core {

class IState;

// States are immutable; shared ownership lets the engine key its tables
// on them without copying.
using StatePtr = std::shared_ptr<const IState>;

/**
 * @brief Interface for a decision state
 *
 * This interface defines the operations that every two-player, zero-sum,
 * perfect-information game model must provide. It is the only view the
 * search engine has of a game: the engine never constructs a state, it only
 * receives states and asks them for their successors.
 *
 * Implementations must be immutable once constructed. Moves are applied by
 * deriving a new state, never by mutating an existing one.
 */
class UCTSEARCH_API IState {
public:
    virtual ~IState() = default;

    /**
     * @brief Get all states reachable by one legal move
     *
     * The order of the returned vector is the model's enumeration order and
     * must be deterministic; the engine uses it to break ties.
     *
     * @return Successor states, empty iff the state is terminal
     */
    virtual std::vector<StatePtr> successors() const = 0;

    /**
     * @brief Sample one successor at random
     *
     * @param rng Generator owned by the caller
     * @return A successor state
     * @throws InvalidOperationException if the state is terminal
     */
    virtual StatePtr randomSuccessor(std::mt19937& rng) const = 0;

    /**
     * @brief Check if the state is terminal
     *
     * @return true if no further moves can be made
     */
    virtual bool isTerminal() const = 0;

    /**
     * @brief Get the outcome of a terminal state
     *
     * The reward is expressed from the perspective of the player who is
     * about to move in this state, in the range [0, 1].
     *
     * @return Reward value
     * @throws InvalidOperationException if the state is not terminal
     */
    virtual double reward() const = 0;

    /**
     * @brief Get a hash of the state
     *
     * Equal states must produce equal hashes.
     *
     * @return 64-bit hash
     */
    virtual uint64_t getHash() const = 0;

    /**
     * @brief Check structural equality with another state
     *
     * @param other The other state
     * @return true if both represent the same decision point
     */
    virtual bool equals(const IState& other) const = 0;

    /**
     * @brief Get a human-readable representation of the state
     */
    virtual std::string toString() const = 0;
};

/**
 * @brief Hash functor for StatePtr keys in unordered containers
 */
struct UCTSEARCH_API StatePtrHash {
    std::size_t operator()(const StatePtr& state) const;
};

/**
 * @brief Equality functor for StatePtr keys in unordered containers
 */
struct UCTSEARCH_API StatePtrEqual {
    bool operator()(const StatePtr& lhs, const StatePtr& rhs) const;
};

} // namespace core
} // namespace uctsearch

#endif // UCTSEARCH_CORE_ISTATE_H
