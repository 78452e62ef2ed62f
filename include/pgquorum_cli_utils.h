#pragma once

#include <iostream>
#include <string>
#include <cmdline.h>
#include "logger.h"
#include "pgquorum_config.h"

class ClusterMonitor;
class MembershipController;
class ConsensusStore;

// process exit code of any failed operation; cluster status queries exit with the status value (0 to 2)
constexpr int EXIT_OPERATION_FAILED = 3;

void init_cmdline_options(cmdline::parser& options, int argc, char **argv);

// Console logging when no log directory is configured, otherwise a single pgquorum.log file.
int init_root_logger(const Config& config, const std::string& program_name);

// Runs a single sub-command against the given collaborators and returns the process exit code.
int dispatch_command(const std::string& command, const std::string& address, ClusterMonitor& monitor,
                     MembershipController& controller, ConsensusStore& store, std::ostream& out);

// Wires up the production collaborators for `config` and dispatches the sub-command.
int run_command(const Config& config, const std::string& command, const std::string& address);
