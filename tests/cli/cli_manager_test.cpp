// tests/cli/cli_manager_test.cpp
#include <gtest/gtest.h>
#include "cli/cli_manager.h"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace uctsearch;

class CLIManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cli = std::make_unique<cli::CLIManager>("uctsearch", "1.2.3");

        cli->addCommand("status", "Return the first argument as exit status",
                        [](const std::vector<std::string>& args) {
                            return args.empty() ? 0 : std::stoi(args[0]);
                        },
                        "[code]");

        cli->addCommand("fail", "Always throws",
                        [](const std::vector<std::string>&) -> int {
                            throw std::runtime_error("boom");
                        });
    }

    std::unique_ptr<cli::CLIManager> cli;
};

TEST_F(CLIManagerTest, AddCommand) {
    auto descriptions = cli->getCommandDescriptions();

    EXPECT_EQ(descriptions.size(), 3u);  // status, fail, help
    EXPECT_EQ(descriptions["status"], "Return the first argument as exit status");
    EXPECT_EQ(descriptions["fail"], "Always throws");
    EXPECT_EQ(descriptions["help"], "Display help information");
    EXPECT_TRUE(cli->hasCommand("status"));
    EXPECT_FALSE(cli->hasCommand("play"));
}

TEST_F(CLIManagerTest, AddCommandRejectsEmptyHandler) {
    EXPECT_THROW(cli->addCommand("noop", "No handler", cli::CommandHandler()), std::invalid_argument);
    EXPECT_THROW(cli->addCommand("", "No name", [](const std::vector<std::string>&) { return 0; }),
                 std::invalid_argument);
}

TEST_F(CLIManagerTest, ExecuteCommand) {
    EXPECT_EQ(cli->executeCommand("status", {}), cli::exit_code::SUCCESS);
    EXPECT_EQ(cli->executeCommand("status", {"42"}), 42);
    EXPECT_EQ(cli->executeCommand("unknown", {}), cli::exit_code::USAGE);
}

TEST_F(CLIManagerTest, HandlerExceptionsMapToExitCodes) {
    EXPECT_EQ(cli->executeCommand("fail", {}), cli::exit_code::FAILURE);
    // std::stoi reports a malformed number with std::invalid_argument
    EXPECT_EQ(cli->executeCommand("status", {"not-a-number"}), cli::exit_code::USAGE);
    // and an unrepresentable one with std::out_of_range
    EXPECT_EQ(cli->executeCommand("status", {"99999999999999999999"}), cli::exit_code::FAILURE);
}

TEST_F(CLIManagerTest, HelpCommand) {
    EXPECT_EQ(cli->executeCommand("help", {}), cli::exit_code::SUCCESS);
    EXPECT_EQ(cli->executeCommand("help", {"status"}), cli::exit_code::SUCCESS);
}

TEST_F(CLIManagerTest, HelpListsCommandsInOrder) {
    std::ostringstream out;
    cli->printHelp(out);
    const std::string text = out.str();

    size_t fail_pos = text.find("fail");
    size_t help_pos = text.find("help ");
    size_t status_pos = text.find("status");
    ASSERT_NE(fail_pos, std::string::npos);
    ASSERT_NE(help_pos, std::string::npos);
    ASSERT_NE(status_pos, std::string::npos);
    EXPECT_LT(fail_pos, help_pos);
    EXPECT_LT(help_pos, status_pos);
}

TEST_F(CLIManagerTest, CommandHelpShowsUsage) {
    std::ostringstream out;
    cli->printHelp(out, "status");
    EXPECT_NE(out.str().find("Usage: uctsearch status [code]"), std::string::npos);
}

TEST_F(CLIManagerTest, RunDispatchesArguments) {
    std::string program = "/usr/local/bin/uctsearch_cli";
    std::string command = "status";
    std::string value = "7";
    char* argv[] = {program.data(), command.data(), value.data()};

    EXPECT_EQ(cli->run(3, argv), 7);
    EXPECT_EQ(cli->getProgramName(), "uctsearch_cli");
}

TEST_F(CLIManagerTest, RunHandlesHelpAndVersionFlags) {
    std::string program = "uctsearch_cli";
    std::string help = "--help";
    std::string version = "--version";
    std::string command = "fail";

    char* help_argv[] = {program.data(), help.data()};
    EXPECT_EQ(cli->run(2, help_argv), cli::exit_code::SUCCESS);

    char* version_argv[] = {program.data(), version.data()};
    EXPECT_EQ(cli->run(2, version_argv), cli::exit_code::SUCCESS);
    EXPECT_EQ(cli->getVersion(), "1.2.3");

    // Help after the command name wins over running it
    char* command_help_argv[] = {program.data(), command.data(), help.data()};
    EXPECT_EQ(cli->run(3, command_help_argv), cli::exit_code::SUCCESS);
}
