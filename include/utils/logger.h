// include/utils/logger.h
#ifndef UCTSEARCH_UTILS_LOGGER_H
#define UCTSEARCH_UTILS_LOGGER_H

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/async.h>
#include <array>
#include <memory>
#include <string>
#include "core/export_macros.h"

namespace uctsearch {
namespace utils {

// One named spdlog logger per subsystem
enum class LogChannel {
    MCTS,
    GAME,
    SYSTEM
};

constexpr size_t NUM_LOG_CHANNELS = 3;

struct LoggerOptions {
    std::string log_dir;  // empty: console only
    spdlog::level::level_enum console_level = spdlog::level::info;
    spdlog::level::level_enum file_level = spdlog::level::debug;
    size_t max_file_size = 1048576 * 10; // 10MB
    size_t max_files = 3;
    bool async = false;
};

/**
 * Logging using spdlog
 *
 * Every channel writes to a colored stderr sink, plus a rotating
 * "<channel>.log" file when a log directory is configured. Levels are
 * filtered per sink. The first log call before init() creates console-only
 * loggers with default options.
 */
class UCTSEARCH_API Logger {
public:
    // (Re)create all channels; loggers from an earlier init are replaced
    static void init(const LoggerOptions& options = LoggerOptions());

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);
    static const char* channelName(LogChannel channel);

    static bool is_initialized();
    static void shutdown();
    static void flush_all();

    // Applies to every sink of every channel
    static void set_level(spdlog::level::level_enum level);

private:
    static bool initialized_;
    static std::array<std::shared_ptr<spdlog::logger>, NUM_LOG_CHANNELS> loggers_;

    static std::shared_ptr<spdlog::logger> create_logger(const std::string& name,
                                                         const LoggerOptions& options);
};

// Convenience macros for logging
#define LOG_MCTS_TRACE(...) SPDLOG_LOGGER_TRACE(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::MCTS), __VA_ARGS__)
#define LOG_MCTS_DEBUG(...) SPDLOG_LOGGER_DEBUG(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::MCTS), __VA_ARGS__)
#define LOG_MCTS_INFO(...)  SPDLOG_LOGGER_INFO(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::MCTS), __VA_ARGS__)
#define LOG_MCTS_WARN(...)  SPDLOG_LOGGER_WARN(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::MCTS), __VA_ARGS__)
#define LOG_MCTS_ERROR(...) SPDLOG_LOGGER_ERROR(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::MCTS), __VA_ARGS__)

#define LOG_GAME_TRACE(...) SPDLOG_LOGGER_TRACE(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::GAME), __VA_ARGS__)
#define LOG_GAME_DEBUG(...) SPDLOG_LOGGER_DEBUG(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::GAME), __VA_ARGS__)
#define LOG_GAME_INFO(...)  SPDLOG_LOGGER_INFO(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::GAME), __VA_ARGS__)
#define LOG_GAME_WARN(...)  SPDLOG_LOGGER_WARN(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::GAME), __VA_ARGS__)
#define LOG_GAME_ERROR(...) SPDLOG_LOGGER_ERROR(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::GAME), __VA_ARGS__)

#define LOG_SYSTEM_TRACE(...) SPDLOG_LOGGER_TRACE(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::SYSTEM), __VA_ARGS__)
#define LOG_SYSTEM_DEBUG(...) SPDLOG_LOGGER_DEBUG(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::SYSTEM), __VA_ARGS__)
#define LOG_SYSTEM_INFO(...)  SPDLOG_LOGGER_INFO(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::SYSTEM), __VA_ARGS__)
#define LOG_SYSTEM_WARN(...)  SPDLOG_LOGGER_WARN(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::SYSTEM), __VA_ARGS__)
#define LOG_SYSTEM_ERROR(...) SPDLOG_LOGGER_ERROR(uctsearch::utils::Logger::get(uctsearch::utils::LogChannel::SYSTEM), __VA_ARGS__)

// Summary of one search run, logged by the play loop
struct SearchLogData {
    int rollouts;
    size_t tracked_states;
    size_t expanded_states;
    double elapsed_ms;

    std::string toString() const {
        return fmt::format("rollouts={} tracked={} expanded={} elapsed={:.1f}ms",
                           rollouts, tracked_states, expanded_states, elapsed_ms);
    }
};

} // namespace utils
} // namespace uctsearch

#endif // UCTSEARCH_UTILS_LOGGER_H
