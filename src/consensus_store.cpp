#include "consensus_store.h"
#include "cluster_errors.h"
#include "pgquorum_config.h"
#include "status_probe.h"
#include "string_utils.h"
#include "logger.h"

EtcdConsensusStore::EtcdConsensusStore(const Config& config, CommandRunner& runner, sleep_fn_t sleep_fn):
        config(config), runner(runner), sleep_fn(std::move(sleep_fn)) {

}

std::string EtcdConsensusStore::endpoints(const bool local_only) const {
    std::vector<std::string> addresses;

    if(local_only) {
        addresses.push_back(config.get_private_ip());
    } else {
        addresses = config.get_nodes();
    }

    std::vector<std::string> urls;
    for(const auto& address: addresses) {
        urls.push_back("https://" + url_host(address) + ":" + std::to_string(config.get_consensus_client_port()));
    }

    return StringUtils::join(urls, ",");
}

command_t EtcdConsensusStore::etcdctl_command(const std::vector<std::string>& args, const bool local_only,
                                              const std::string& username) const {
    command_t command;
    command.argv = {config.get_etcdctl_path(), "--endpoints", endpoints(local_only),
                    "--ca-file", config.get_consensus_ca_path()};
    command.argv.insert(command.argv.end(), args.begin(), args.end());

    if(!username.empty()) {
        // passed through the environment to keep the password off the process list
        command.env["ETCDCTL_USERNAME"] = username + ":" + config.get_consensus_root_password();
    }

    return command;
}

Option<std::string> EtcdConsensusStore::run_checked(const command_t& command) {
    const command_result_t result = runner.run(command);

    if(!result.ok()) {
        LOG(ERROR) << "Command failed with exit code " << result.exit_code << ": " << command.to_string()
                   << ", stderr: " << result.std_err;
        return Option<std::string>(cluster_error::COMMAND_FAILED,
                                   "Command `" + command.to_string() + "` failed: " + result.std_err);
    }

    return Option<std::string>(result.std_out);
}

Option<std::string> EtcdConsensusStore::cluster_health() {
    command_t command;
    command.argv = {config.get_etcdctl_path(),
                    "--endpoint", "https://127.0.0.1:" + std::to_string(config.get_consensus_client_port()),
                    "--ca-file", config.get_consensus_ca_path(),
                    "cluster-health"};

    // an unhealthy cluster exits non-zero, the caller inspects the output instead
    const command_result_t result = runner.run(command);

    if(result.exit_code == 127) {
        return Option<std::string>(cluster_error::COMMAND_FAILED,
                                   "Could not run `" + config.get_etcdctl_path() + "`.");
    }

    return Option<std::string>(result.std_out + result.std_err);
}

Option<std::string> EtcdConsensusStore::member_list() {
    return run_checked(etcdctl_command({"member", "list"}, false, ""));
}

Option<bool> EtcdConsensusStore::remove_member(const std::string& member_id) {
    const auto remove_op = run_checked(etcdctl_command({"member", "remove", member_id}, true, "root"));
    if(!remove_op.ok()) {
        return Option<bool>(remove_op.code(), remove_op.error());
    }

    return Option<bool>(true);
}

Option<std::string> EtcdConsensusStore::get_key(const std::string& key, const bool local_only) {
    return run_checked(etcdctl_command({"get", key}, local_only, "root"));
}

Option<bool> EtcdConsensusStore::set_key(const std::string& key, const std::string& value, const bool local_only) {
    const auto set_op = run_checked(etcdctl_command({"set", key, value}, local_only, "root"));
    if(!set_op.ok()) {
        return Option<bool>(set_op.code(), set_op.error());
    }

    return Option<bool>(true);
}

Option<bool> EtcdConsensusStore::requires_auth() {
    LOG(INFO) << "Checking whether etcd requires auth.";

    const uint32_t attempts = config.get_auth_check_attempts();
    const command_t command = etcdctl_command({"ls", "/"}, false, "");

    for(uint32_t attempt = 0; attempt < attempts; attempt++) {
        const command_result_t result = runner.run(command);

        // listing only succeeds while the cluster is up and auth is not yet enabled
        if(result.exit_code == 0) {
            LOG(INFO) << "Etcd does not require auth.";
            return Option<bool>(false);
        }

        // NOTE: relies on etcdctl not localising its error messages
        if(result.exit_code == EXIT_CLUSTER_ERROR &&
           result.std_err.find("user authentication") != std::string::npos) {
            LOG(INFO) << "Etcd requires auth.";
            return Option<bool>(true);
        }

        LOG(INFO) << "Etcd connection error: " << result.std_err;

        if(attempt + 1 < attempts) {
            sleep_fn(config.get_auth_check_interval_ms());
        }
    }

    return Option<bool>(cluster_error::CONSENSUS_NOT_READY, "Etcd not up yet, this is likely the first node.");
}
