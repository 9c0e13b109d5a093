// include/utils/config.h
#ifndef UCTSEARCH_UTILS_CONFIG_H
#define UCTSEARCH_UTILS_CONFIG_H

#include <string>
#include <yaml-cpp/yaml.h>
#include <spdlog/common.h>
#include "core/export_macros.h"
#include "utils/logger.h"
#include "mcts/mcts_engine.h"

namespace uctsearch {
namespace utils {

// How much search the caller runs before each move
struct UCTSEARCH_API SearchBudget {
    // Rollouts per move; 0 leaves only the time budget
    int rollouts_per_move = 200;

    // Wall-clock budget per move in milliseconds; 0 disables it
    int time_budget_ms = 0;
};

struct UCTSEARCH_API LoggingConfig {
    std::string level = "info";

    // Empty means console only
    std::string log_dir;

    bool async = false;
};

struct UCTSEARCH_API AppConfig {
    mcts::MCTSSettings mcts;
    SearchBudget search;
    LoggingConfig logging;
};

/**
 * @brief Load the application configuration from a YAML file
 *
 * Recognized keys (all optional):
 *
 *   mcts:
 *     exploration_weight: 1.0
 *     seed: -1
 *     log_rollouts: false
 *   search:
 *     rollouts_per_move: 200
 *     time_budget_ms: 0
 *   logging:
 *     level: info
 *     log_dir: ""
 *     async: false
 *
 * @throws YAML::Exception if the file cannot be read or parsed
 * @throws std::invalid_argument if a value is out of range
 */
UCTSEARCH_API AppConfig loadConfig(const std::string& path);

// Same as loadConfig, from an already parsed document
UCTSEARCH_API AppConfig parseConfig(const YAML::Node& root);

// Throws std::invalid_argument on an unknown level name
UCTSEARCH_API spdlog::level::level_enum parseLogLevel(const std::string& name);

// Console level from `level`; files keep debug output
UCTSEARCH_API LoggerOptions toLoggerOptions(const LoggingConfig& logging);

} // namespace utils
} // namespace uctsearch

#endif // UCTSEARCH_UTILS_CONFIG_H
