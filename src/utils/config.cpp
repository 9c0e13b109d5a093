// src/utils/config.cpp
#include "utils/config.h"
#include <cmath>
#include <stdexcept>

namespace uctsearch {
namespace utils {

namespace {

YAML::Node section(const YAML::Node& root, const char* name) {
    if (!root || !root.IsMap()) {
        return YAML::Node();
    }
    return root[name];
}

template <typename T>
T readOr(const YAML::Node& node, const char* key, const T& fallback) {
    if (!node || !node.IsMap()) {
        return fallback;
    }
    const YAML::Node value = node[key];
    return value ? value.as<T>() : fallback;
}

} // anonymous namespace

AppConfig loadConfig(const std::string& path) {
    return parseConfig(YAML::LoadFile(path));
}

AppConfig parseConfig(const YAML::Node& root) {
    AppConfig config;

    const YAML::Node mcts = section(root, "mcts");
    config.mcts.exploration_weight = readOr<double>(mcts, "exploration_weight", config.mcts.exploration_weight);
    config.mcts.seed = readOr<int64_t>(mcts, "seed", config.mcts.seed);
    config.mcts.log_rollouts = readOr<bool>(mcts, "log_rollouts", config.mcts.log_rollouts);

    const YAML::Node search = section(root, "search");
    config.search.rollouts_per_move = readOr<int>(search, "rollouts_per_move", config.search.rollouts_per_move);
    config.search.time_budget_ms = readOr<int>(search, "time_budget_ms", config.search.time_budget_ms);

    const YAML::Node logging = section(root, "logging");
    config.logging.level = readOr<std::string>(logging, "level", config.logging.level);
    config.logging.log_dir = readOr<std::string>(logging, "log_dir", config.logging.log_dir);
    config.logging.async = readOr<bool>(logging, "async", config.logging.async);

    if (!(config.mcts.exploration_weight >= 0.0) || std::isinf(config.mcts.exploration_weight)) {
        throw std::invalid_argument("mcts.exploration_weight must be a finite non-negative number");
    }
    if (config.search.rollouts_per_move < 0) {
        throw std::invalid_argument("search.rollouts_per_move must not be negative");
    }
    if (config.search.time_budget_ms < 0) {
        throw std::invalid_argument("search.time_budget_ms must not be negative");
    }
    if (config.search.rollouts_per_move == 0 && config.search.time_budget_ms == 0) {
        throw std::invalid_argument("search needs rollouts_per_move or time_budget_ms");
    }
    parseLogLevel(config.logging.level);

    return config;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw std::invalid_argument("Unknown log level: " + name);
}

LoggerOptions toLoggerOptions(const LoggingConfig& logging) {
    LoggerOptions options;
    options.log_dir = logging.log_dir;
    options.console_level = parseLogLevel(logging.level);
    options.async = logging.async;
    return options;
}

} // namespace utils
} // namespace uctsearch
