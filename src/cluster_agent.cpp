#include "cluster_agent.h"
#include "cluster_errors.h"
#include "pgquorum_config.h"
#include "string_utils.h"
#include "logger.h"

namespace {
    std::string member_suffix(const node_address_t& address) {
        std::string suffix = address;
        StringUtils::replace_all(suffix, ".", "_");
        return suffix;
    }
}

std::string consensus_member_name(const node_address_t& address) {
    return "etcd" + member_suffix(address);
}

std::string agent_member_name(const node_address_t& address) {
    return "pg" + member_suffix(address);
}

PatroniClusterAgent::PatroniClusterAgent(const Config& config, CommandRunner& runner):
        config(config), runner(runner) {

}

Option<std::string> PatroniClusterAgent::patronictl(const std::vector<std::string>& args) {
    command_t command;
    command.argv = {config.get_patronictl_path(), "-c", config.get_agent_config_path()};
    command.argv.insert(command.argv.end(), args.begin(), args.end());

    const command_result_t result = runner.run(command);

    if(!result.ok()) {
        LOG(ERROR) << "Command failed with exit code " << result.exit_code << ": " << command.to_string()
                   << ", stderr: " << result.std_err;
        return Option<std::string>(cluster_error::COMMAND_FAILED,
                                   "Command `" + command.to_string() + "` failed: " + result.std_err);
    }

    return Option<std::string>(result.std_out);
}

Option<std::string> PatroniClusterAgent::primary_dsn() {
    return patronictl({"dsn"});
}

Option<bool> PatroniClusterAgent::reinit(const std::string& member_name) {
    const auto reinit_op = patronictl({"reinit", "--force", "postgres", member_name});
    if(!reinit_op.ok()) {
        return Option<bool>(reinit_op.code(), reinit_op.error());
    }

    return Option<bool>(true);
}

Option<bool> PatroniClusterAgent::switchover(const std::string& candidate_name) {
    const auto switchover_op = patronictl({"switchover", "--force", "--candidate", candidate_name});
    if(!switchover_op.ok()) {
        return Option<bool>(switchover_op.code(), switchover_op.error());
    }

    return Option<bool>(true);
}
