// File: core/exceptions.h
#ifndef UCTSEARCH_CORE_EXCEPTIONS_H
#define UCTSEARCH_CORE_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <sstream>

namespace uctsearch {
namespace core {

/**
 * @brief Thrown when an operation is invoked outside its documented precondition.
 *
 * Examples: choosing a move from a terminal state, asking a non-terminal
 * state for its reward, sampling a successor of a terminal state.
 */
class InvalidOperationException : public std::logic_error {
public:
    explicit InvalidOperationException(const std::string& message)
        : std::logic_error("Invalid Operation: " + message) {}
};

/**
 * @brief Thrown when the search engine detects that its own bookkeeping
 * is inconsistent (e.g. UCT selection over unvisited children).
 *
 * Should be unreachable through the public engine API.
 */
class InvariantViolationException : public std::logic_error {
public:
    explicit InvariantViolationException(const std::string& message)
        : std::logic_error("Invariant Violation: " + message) {}
};

/**
 * @brief Exception class for illegal moves attempted in a game state.
 *
 * This exception is thrown when a game model is asked to derive a successor
 * through a move that is not valid in the current state (e.g. placing a
 * piece on an occupied cell, or moving after the game has ended).
 */
class IllegalMoveException : public std::runtime_error {
public:
    /**
     * @brief Constructs an IllegalMoveException.
     *
     * @param message A descriptive message explaining why the move is illegal.
     * @param attempted_action The action that was attempted. Defaults to -1 if not applicable.
     */
    explicit IllegalMoveException(const std::string& message, int attempted_action = -1)
        : std::runtime_error(build_what_message(message, attempted_action)),
          action_(attempted_action),
          base_message_(message) {}

    /**
     * @brief Gets the action that was attempted, or -1 if not applicable.
     */
    int getAction() const noexcept {
        return action_;
    }

    /**
     * @brief Gets the base error message (without the action details).
     */
    const std::string& getBaseMessage() const noexcept {
        return base_message_;
    }

private:
    int action_;
    std::string base_message_;

    static std::string build_what_message(const std::string& message, int action) {
        std::stringstream ss;
        ss << "Illegal Move: " << message;
        if (action != -1) {
            ss << " (Action: " << action << ")";
        }
        return ss.str();
    }
};

} // namespace core
} // namespace uctsearch

#endif // UCTSEARCH_CORE_EXCEPTIONS_H
