#include <gtest/gtest.h>
#include "command_runner.h"

TEST(CommandRunnerTest, CapturesOutputAndExitCode) {
    ProcessCommandRunner runner;

    command_t command;
    command.argv = {"sh", "-c", "echo out; echo err 1>&2; exit 3"};

    command_result_t result = runner.run(command);
    ASSERT_EQ(3, result.exit_code);
    ASSERT_FALSE(result.ok());
    ASSERT_EQ("out\n", result.std_out);
    ASSERT_EQ("err\n", result.std_err);
}

TEST(CommandRunnerTest, ArgumentsAreNotInterpretedByAShell) {
    ProcessCommandRunner runner;

    command_t command;
    command.argv = {"echo", "$HOME", "a b"};

    command_result_t result = runner.run(command);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ("$HOME a b\n", result.std_out);
}

TEST(CommandRunnerTest, FeedsStdinAndEnvironment) {
    ProcessCommandRunner runner;

    command_t cat_command;
    cat_command.argv = {"cat"};
    cat_command.std_in = "backend line\n";

    command_result_t result = runner.run(cat_command);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ("backend line\n", result.std_out);

    command_t env_command;
    env_command.argv = {"sh", "-c", "printf %s \"$PGQUORUM_TEST_VALUE\""};
    env_command.env["PGQUORUM_TEST_VALUE"] = "root:secret";

    result = runner.run(env_command);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ("root:secret", result.std_out);
}

TEST(CommandRunnerTest, MissingBinary) {
    ProcessCommandRunner runner;

    command_t command;
    command.argv = {"/nonexistent/pgquorum-missing-binary"};

    ASSERT_EQ(127, runner.run(command).exit_code);

    command_t empty_command;
    ASSERT_EQ(-1, runner.run(empty_command).exit_code);
}

TEST(CommandRunnerTest, EnvironmentValuesAreMaskedInDescription) {
    command_t command;
    command.argv = {"etcdctl", "member", "list"};
    command.env["ETCDCTL_USERNAME"] = "root:secret";

    ASSERT_EQ("ETCDCTL_USERNAME=*** etcdctl member list", command.to_string());
}
