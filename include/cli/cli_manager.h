// include/cli/cli_manager.h
#ifndef UCTSEARCH_CLI_MANAGER_H
#define UCTSEARCH_CLI_MANAGER_H

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include "core/export_macros.h"

namespace uctsearch {
namespace cli {

// Process exit codes produced by CLIManager
namespace exit_code {
constexpr int SUCCESS = 0;
constexpr int FAILURE = 1;
constexpr int USAGE = 2;
} // namespace exit_code

/**
 * @brief Command handler function type
 *
 * Receives the arguments following the command name. A handler that throws
 * std::invalid_argument is reported as a usage error.
 */
using CommandHandler = std::function<int(const std::vector<std::string>&)>;

/**
 * @brief Subcommand dispatcher for the command-line front end
 *
 * Commands are kept sorted by name so help output is stable. A built-in
 * "help" command is always registered.
 */
class UCTSEARCH_API CLIManager {
public:
    explicit CLIManager(std::string program_name = "uctsearch", std::string version = "");

    // The built-in help command refers back to this instance
    CLIManager(const CLIManager&) = delete;
    CLIManager& operator=(const CLIManager&) = delete;

    /**
     * @brief Register a command, replacing any command of the same name
     *
     * @param command Command name
     * @param description One-line description shown in help
     * @param handler Handler function
     * @param usage Argument synopsis, e.g. "[config.yaml]"
     */
    void addCommand(const std::string& command,
                    const std::string& description,
                    CommandHandler handler,
                    const std::string& usage = "");

    bool hasCommand(const std::string& command) const;

    /**
     * @brief Execute a command
     *
     * @return The handler's exit code; exit_code::USAGE for an unknown
     *         command or std::invalid_argument, exit_code::FAILURE for any
     *         other exception escaping the handler
     */
    int executeCommand(const std::string& command,
                       const std::vector<std::string>& args);

    /**
     * @brief Parse argv and dispatch
     *
     * Understands "-h"/"--help" and "--version" before the command and
     * "-h"/"--help" after it.
     */
    int run(int argc, char** argv);

    // Command name -> description
    std::map<std::string, std::string> getCommandDescriptions() const;

    /**
     * @brief Print the command list, or the usage of one command
     */
    void printHelp(std::ostream& out, const std::string& command = "") const;

    const std::string& getProgramName() const { return program_name_; }
    const std::string& getVersion() const { return version_; }

private:
    struct Command {
        std::string description;
        std::string usage;
        CommandHandler handler;
    };

    void printUsage(std::ostream& out, const std::string& name, const Command& command) const;

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace cli
} // namespace uctsearch

#endif // UCTSEARCH_CLI_MANAGER_H
