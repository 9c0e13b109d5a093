// src/cli/cli_manager.cpp
#include "cli/cli_manager.h"
#include "utils/logger.h"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace uctsearch {
namespace cli {

namespace {

bool isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

} // anonymous namespace

CLIManager::CLIManager(std::string program_name, std::string version)
    : program_name_(std::move(program_name)), version_(std::move(version)) {

    addCommand("help", "Display help information",
               [this](const std::vector<std::string>& args) {
                   printHelp(std::cout, args.empty() ? std::string() : args[0]);
                   return exit_code::SUCCESS;
               },
               "[command]");
}

void CLIManager::addCommand(const std::string& command,
                            const std::string& description,
                            CommandHandler handler,
                            const std::string& usage) {
    if (command.empty() || !handler) {
        throw std::invalid_argument("Command needs a name and a handler");
    }
    commands_[command] = Command{description, usage, std::move(handler)};
}

bool CLIManager::hasCommand(const std::string& command) const {
    return commands_.count(command) > 0;
}

int CLIManager::executeCommand(const std::string& command,
                               const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << command << "\n\n";
        printHelp(std::cerr);
        return exit_code::USAGE;
    }

    LOG_SYSTEM_DEBUG("Running command '{}' with {} argument(s)", command, args.size());
    try {
        return it->second.handler(args);
    }
    catch (const std::invalid_argument& e) {
        LOG_SYSTEM_ERROR("Invalid arguments for '{}': {}", command, e.what());
        printUsage(std::cerr, it->first, it->second);
        return exit_code::USAGE;
    }
    catch (const std::exception& e) {
        LOG_SYSTEM_ERROR("Command '{}' failed: {}", command, e.what());
        return exit_code::FAILURE;
    }
}

int CLIManager::run(int argc, char** argv) {
    if (argc > 0 && argv[0] != nullptr) {
        program_name_ = std::filesystem::path(argv[0]).filename().string();
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    if (args.empty()) {
        printHelp(std::cout);
        return exit_code::SUCCESS;
    }

    const std::string& first = args.front();
    if (isHelpFlag(first)) {
        printHelp(std::cout, args.size() > 1 ? args[1] : std::string());
        return exit_code::SUCCESS;
    }
    if (first == "--version") {
        std::cout << program_name_ << " " << (version_.empty() ? "unknown" : version_) << std::endl;
        return exit_code::SUCCESS;
    }

    std::vector<std::string> command_args(args.begin() + 1, args.end());
    if (std::any_of(command_args.begin(), command_args.end(), isHelpFlag)) {
        printHelp(std::cout, first);
        return exit_code::SUCCESS;
    }

    return executeCommand(first, command_args);
}

std::map<std::string, std::string> CLIManager::getCommandDescriptions() const {
    std::map<std::string, std::string> descriptions;
    for (const auto& [name, command] : commands_) {
        descriptions.emplace(name, command.description);
    }
    return descriptions;
}

void CLIManager::printHelp(std::ostream& out, const std::string& command) const {
    auto it = commands_.find(command);
    if (it != commands_.end()) {
        printUsage(out, it->first, it->second);
        return;
    }

    out << "Usage: " << program_name_ << " <command> [args]\n\n";
    out << "Commands:\n";

    size_t width = 0;
    for (const auto& entry : commands_) {
        width = std::max(width, entry.first.size());
    }
    for (const auto& [name, cmd] : commands_) {
        out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << name
            << cmd.description << '\n';
    }

    out << "\nRun '" << program_name_ << " help <command>' for the arguments of a command."
        << std::endl;
}

void CLIManager::printUsage(std::ostream& out, const std::string& name, const Command& command) const {
    out << "Usage: " << program_name_ << " " << name;
    if (!command.usage.empty()) {
        out << " " << command.usage;
    }
    out << '\n' << command.description << std::endl;
}

} // namespace cli
} // namespace uctsearch
