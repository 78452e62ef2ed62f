#include "service_manager.h"
#include "cluster_errors.h"
#include "logger.h"

SystemdServiceManager::SystemdServiceManager(CommandRunner& runner): runner(runner) {

}

Option<bool> SystemdServiceManager::restart(const std::string& service_name) {
    LOG(INFO) << "Restarting service " << service_name;

    command_t command;
    command.argv = {"systemctl", "restart", service_name};

    const command_result_t result = runner.run(command);
    if(!result.ok()) {
        LOG(ERROR) << "Restart of " << service_name << " failed with exit code " << result.exit_code
                   << ", stderr: " << result.std_err;
        return Option<bool>(cluster_error::COMMAND_FAILED, "Could not restart " + service_name + ": " + result.std_err);
    }

    return Option<bool>(true);
}
