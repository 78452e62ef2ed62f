#include "pgquorum_cli_utils.h"
#include "cluster_agent.h"
#include "cluster_errors.h"
#include "cluster_monitor.h"
#include "command_runner.h"
#include "consensus_store.h"
#include "file_utils.h"
#include "membership_controller.h"
#include "proxy_backends.h"
#include "service_manager.h"
#include "status_probe.h"
#include "topology_resolver.h"

void init_cmdline_options(cmdline::parser & options, int argc, char **argv) {
    options.set_program_name("./pgquorum");

    options.add<std::string>("address", 'a', "Address of the DB node the command acts on.", false, "");

    options.add<std::string>("role", 'r', "Role of this node: `database` or `client`.", false);
    options.add<std::string>("private-ip", '\0', "Private IP of this node (required on a database node).", false);
    options.add<std::string>("nodes", '\0', "Comma separated list of the DB cluster nodes.", false);

    options.add<uint32_t>("agent-port", '\0', "Port on which the HA agent serves node status.", false, 8008);
    options.add<uint32_t>("consensus-client-port", '\0', "Client port of the etcd members.", false, 2379);
    options.add<uint32_t>("consensus-peer-port", '\0', "Peer port of the etcd members.", false, 2380);
    options.add<uint32_t>("db-port", '\0', "Port on which the database listens.", false, 5432);

    options.add<std::string>("consensus-ca-path", '\0', "Path to the etcd CA certificate.", false);
    options.add<std::string>("db-ca-path", '\0', "Path to the database CA certificate.", false);
    options.add<std::string>("agent-config-path", '\0', "Path to the HA agent's configuration file.", false);

    options.add<std::string>("proxy-config-path", '\0', "Path to the DB proxy configuration file.", false);
    options.add<std::string>("proxy-stats-socket", '\0', "Path to the DB proxy stats socket.", false);
    options.add<std::string>("dependent-services", '\0', "Comma separated services restarted after proxy changes.", false);

    options.add<uint32_t>("probe-timeout-ms", '\0', "Timeout of a single node status probe.", false, 5000);
    options.add<uint32_t>("promote-poll-attempts", '\0', "Number of topology polls after a switchover.", false, 30);
    options.add<uint32_t>("promote-poll-interval-ms", '\0', "Interval between topology polls after a switchover.", false, 1000);
    options.add<uint32_t>("auth-check-attempts", '\0', "Number of attempts to reach etcd when checking for auth.", false, 5);
    options.add<uint32_t>("auth-check-interval-ms", '\0', "Interval between attempts to reach etcd.", false, 3000);
    options.add<float>("lag-threshold-mib", '\0', "Replication lag above which an async replica is reported.", false, 2.0f);

    options.add<std::string>("log-dir", '\0', "Path to the log directory.", false, "");

    options.add<std::string>("config", '\0', "Path to the configuration file.", false, "");

    options.footer("<status|add|remove|reinit|promote|grant-access|requires-auth>");
}

int init_root_logger(const Config & config, const std::string & program_name) {
    google::InitGoogleLogging(program_name.c_str());

    std::string log_dir = config.get_log_dir();

    if(log_dir.empty()) {
        // use console logger if log dir is not specified
        FLAGS_logtostderr = true;
    } else {
        if(!directory_exists(log_dir)) {
            std::cerr << "Log directory " << log_dir << " does not exist." << std::endl;
            return EXIT_OPERATION_FAILED;
        }

        // flush log levels above -1 immediately (INFO=0)
        FLAGS_logbuflevel = -1;

        // ensures that log file name is constant
        FLAGS_timestamp_in_logfile_name = false;

        std::string log_path = log_dir + "/" + "pgquorum.log";

        // will log levels INFO **and above** to the given log file
        google::SetLogDestination(google::INFO, log_path.c_str());

        // don't create symlink for INFO log
        google::SetLogSymlink(google::INFO, "");

        // don't create separate log files for each level
        google::SetLogDestination(google::WARNING, "");
        google::SetLogDestination(google::ERROR, "");
        google::SetLogDestination(google::FATAL, "");
    }

    return 0;
}

namespace {
    int report_failure(const std::string& command, uint32_t code, const std::string& message, std::ostream& out) {
        LOG(ERROR) << "Command `" << command << "` failed: " << message;
        out << cluster_error::name(code) << ": " << message << std::endl;
        return EXIT_OPERATION_FAILED;
    }
}

int dispatch_command(const std::string& command, const std::string& address, ClusterMonitor& monitor,
                     MembershipController& controller, ConsensusStore& store, std::ostream& out) {
    if(command == "status") {
        const auto status_op = monitor.get_cluster_status();
        if(!status_op.ok()) {
            return report_failure(command, status_op.code(), status_op.error(), out);
        }

        out << status_op.get_ref().to_json().dump(4) << std::endl;
        return static_cast<int>(status_op.get_ref().status);
    }

    if(command == "requires-auth") {
        const auto auth_op = store.requires_auth();
        if(!auth_op.ok()) {
            return report_failure(command, auth_op.code(), auth_op.error(), out);
        }

        out << (auth_op.get() ? "true" : "false") << std::endl;
        return 0;
    }

    Option<bool> op(true);

    if(address.empty() && (command == "add" || command == "remove" || command == "reinit" ||
                           command == "promote" || command == "grant-access")) {
        return report_failure(command, cluster_error::INVALID_CONFIG,
                              "The `--address` option is required for `" + command + "`.", out);
    }

    if(command == "add") {
        op = controller.add(address);
    } else if(command == "remove") {
        op = controller.remove(address);
    } else if(command == "reinit") {
        op = controller.reinit(address);
    } else if(command == "promote") {
        op = controller.promote(address);
    } else if(command == "grant-access") {
        op = controller.grant_access(address);
    } else {
        return report_failure(command, cluster_error::INVALID_CONFIG, "Unknown command `" + command + "`.", out);
    }

    if(!op.ok()) {
        return report_failure(command, op.code(), op.error(), out);
    }

    return 0;
}

int run_command(const Config& config, const std::string& command, const std::string& address) {
    LOG(INFO) << "Running `" << command << "` with configuration: " << config.to_json().dump();

    ProcessCommandRunner runner;
    HttpStatusProbe probe(config);
    EtcdConsensusStore store(config, runner);
    PatroniClusterAgent agent(config, runner);
    HaproxyBackends backends(config);
    SystemdServiceManager services(runner);

    const auto resolver_op = create_topology_resolver(config, store, agent, backends);
    if(!resolver_op.ok()) {
        return report_failure(command, resolver_op.code(), resolver_op.error(), std::cerr);
    }

    TopologyResolver& resolver = *resolver_op.get_ref();

    ClusterMonitor monitor(resolver, probe, QuorumEvaluator(config));
    MembershipController controller(config, resolver, probe, store, agent, backends, services);

    return dispatch_command(command, address, monitor, controller, store, std::cout);
}
