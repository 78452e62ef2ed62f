#pragma once

#include <map>
#include <string>
#include <vector>

struct command_result_t {
    int exit_code = -1;
    std::string std_out;
    std::string std_err;

    bool ok() const {
        return exit_code == 0;
    }
};

struct command_t {
    std::vector<std::string> argv;

    // added on top of the inherited environment
    std::map<std::string, std::string> env;

    std::string std_in;

    std::string to_string() const;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual command_result_t run(const command_t& command) = 0;
};

// Runs the command as a child process without going through a shell.
class ProcessCommandRunner: public CommandRunner {
public:
    command_result_t run(const command_t& command) override;
};
