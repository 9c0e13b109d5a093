// src/utils/logger.cpp
#include "utils/logger.h"
#include <filesystem>
#include <iostream>
#include <vector>

namespace uctsearch {
namespace utils {

namespace {

constexpr std::array<LogChannel, NUM_LOG_CHANNELS> ALL_CHANNELS = {
    LogChannel::MCTS, LogChannel::GAME, LogChannel::SYSTEM
};

size_t channelIndex(LogChannel channel) {
    return static_cast<size_t>(channel);
}

} // anonymous namespace

bool Logger::initialized_ = false;
std::array<std::shared_ptr<spdlog::logger>, NUM_LOG_CHANNELS> Logger::loggers_;

const char* Logger::channelName(LogChannel channel) {
    switch (channel) {
        case LogChannel::MCTS: return "mcts";
        case LogChannel::GAME: return "game";
        case LogChannel::SYSTEM: return "system";
    }
    return "unknown";
}

void Logger::init(const LoggerOptions& options) {
    if (initialized_) {
        shutdown();
    }

    try {
        if (!options.log_dir.empty()) {
            std::filesystem::create_directories(options.log_dir);
        }

        // The thread pool must exist before any async logger is created
        if (options.async) {
            spdlog::init_thread_pool(8192, 1);
        }

        for (LogChannel channel : ALL_CHANNELS) {
            loggers_[channelIndex(channel)] = create_logger(channelName(channel), options);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        throw;
    }

    initialized_ = true;
    get(LogChannel::SYSTEM)->debug("Logging initialized ({})",
        options.log_dir.empty() ? std::string("console only") : "log directory " + options.log_dir);
}

std::shared_ptr<spdlog::logger> Logger::create_logger(const std::string& name,
                                                      const LoggerOptions& options) {
    // A previous init/shutdown cycle may have left a registration behind
    spdlog::drop(name);

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(options.console_level);
    console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!options.log_dir.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.log_dir + "/" + name + ".log", options.max_file_size, options.max_files);
        file_sink->set_level(options.file_level);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    std::shared_ptr<spdlog::logger> logger;
    if (options.async) {
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }

    logger->set_level(spdlog::level::trace); // Sinks do the filtering
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> Logger::get(LogChannel channel) {
    if (!initialized_) {
        init();
    }
    return loggers_[channelIndex(channel)];
}

bool Logger::is_initialized() {
    return initialized_;
}

void Logger::shutdown() {
    if (!initialized_) {
        return;
    }
    flush_all();
    for (auto& logger : loggers_) {
        logger.reset();
    }
    // Destroys the registry and the async thread pool, if any
    spdlog::shutdown();
    initialized_ = false;
}

void Logger::flush_all() {
    if (!initialized_) {
        return;
    }
    for (const auto& logger : loggers_) {
        logger->flush();
    }
}

void Logger::set_level(spdlog::level::level_enum level) {
    if (!initialized_) {
        init();
    }
    for (const auto& logger : loggers_) {
        for (auto& sink : logger->sinks()) {
            sink->set_level(level);
        }
    }
}

} // namespace utils
} // namespace uctsearch
