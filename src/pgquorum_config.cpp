#include <INIReader.h>
#include "pgquorum_config.h"
#include "cluster_errors.h"
#include "logger.h"

NodeRole Config::get_node_role() const {
    std::string role_str = role;
    StringUtils::tolowercase(role_str);

    if(role_str == "database") {
        return NodeRole::DATABASE;
    }

    // older installs call the client role "manager"
    if(role_str == "client" || role_str == "manager") {
        return NodeRole::CLIENT;
    }

    return NodeRole::UNSUPPORTED;
}

std::string Config::get_probe_ca_path() const {
    if(get_node_role() == NodeRole::DATABASE) {
        return consensus_ca_path;
    }

    return db_ca_path;
}

void Config::load_config_env() {
    if(!get_env("PGQUORUM_ROLE").empty()) {
        this->role = get_env("PGQUORUM_ROLE");
    }

    if(!get_env("PGQUORUM_PRIVATE_IP").empty()) {
        this->private_ip = get_env("PGQUORUM_PRIVATE_IP");
    }

    if(!get_env("PGQUORUM_NODES").empty()) {
        this->nodes = split_list(get_env("PGQUORUM_NODES"));
    }

    if(!get_env("PGQUORUM_AGENT_PORT").empty()) {
        this->agent_port = std::stoi(get_env("PGQUORUM_AGENT_PORT"));
    }

    if(!get_env("PGQUORUM_CONSENSUS_CLIENT_PORT").empty()) {
        this->consensus_client_port = std::stoi(get_env("PGQUORUM_CONSENSUS_CLIENT_PORT"));
    }

    if(!get_env("PGQUORUM_CONSENSUS_PEER_PORT").empty()) {
        this->consensus_peer_port = std::stoi(get_env("PGQUORUM_CONSENSUS_PEER_PORT"));
    }

    if(!get_env("PGQUORUM_DB_PORT").empty()) {
        this->db_port = std::stoi(get_env("PGQUORUM_DB_PORT"));
    }

    if(!get_env("PGQUORUM_CONSENSUS_CA_PATH").empty()) {
        this->consensus_ca_path = get_env("PGQUORUM_CONSENSUS_CA_PATH");
    }

    if(!get_env("PGQUORUM_DB_CA_PATH").empty()) {
        this->db_ca_path = get_env("PGQUORUM_DB_CA_PATH");
    }

    // secrets are preferably passed through the environment rather than on the command line
    if(!get_env("PGQUORUM_CONSENSUS_ROOT_PASSWORD").empty()) {
        this->consensus_root_password = get_env("PGQUORUM_CONSENSUS_ROOT_PASSWORD");
    }

    if(!get_env("PGQUORUM_AGENT_CONFIG_PATH").empty()) {
        this->agent_config_path = get_env("PGQUORUM_AGENT_CONFIG_PATH");
    }

    if(!get_env("PGQUORUM_PROXY_CONFIG_PATH").empty()) {
        this->proxy_config_path = get_env("PGQUORUM_PROXY_CONFIG_PATH");
    }

    if(!get_env("PGQUORUM_PROXY_STATS_SOCKET").empty()) {
        this->proxy_stats_socket = get_env("PGQUORUM_PROXY_STATS_SOCKET");
    }

    if(!get_env("PGQUORUM_DEPENDENT_SERVICES").empty()) {
        this->dependent_services = split_list(get_env("PGQUORUM_DEPENDENT_SERVICES"));
    }

    if(!get_env("PGQUORUM_PROBE_TIMEOUT_MS").empty()) {
        this->probe_timeout_ms = std::stoi(get_env("PGQUORUM_PROBE_TIMEOUT_MS"));
    }

    if(!get_env("PGQUORUM_PROMOTE_POLL_ATTEMPTS").empty()) {
        this->promote_poll_attempts = std::stoi(get_env("PGQUORUM_PROMOTE_POLL_ATTEMPTS"));
    }

    if(!get_env("PGQUORUM_PROMOTE_POLL_INTERVAL_MS").empty()) {
        this->promote_poll_interval_ms = std::stoi(get_env("PGQUORUM_PROMOTE_POLL_INTERVAL_MS"));
    }

    if(!get_env("PGQUORUM_AUTH_CHECK_ATTEMPTS").empty()) {
        this->auth_check_attempts = std::stoi(get_env("PGQUORUM_AUTH_CHECK_ATTEMPTS"));
    }

    if(!get_env("PGQUORUM_AUTH_CHECK_INTERVAL_MS").empty()) {
        this->auth_check_interval_ms = std::stoi(get_env("PGQUORUM_AUTH_CHECK_INTERVAL_MS"));
    }

    if(!get_env("PGQUORUM_LAG_THRESHOLD_MIB").empty()) {
        this->lag_threshold_mib = std::stof(get_env("PGQUORUM_LAG_THRESHOLD_MIB"));
    }

    if(!get_env("PGQUORUM_LOG_DIR").empty()) {
        this->log_dir = get_env("PGQUORUM_LOG_DIR");
    }
}

void Config::load_config_file(cmdline::parser& options) {
    if(!options.exist("config") || options.get<std::string>("config").empty()) {
        config_file_validity = 0;
        return;
    }

    this->config_file = options.get<std::string>("config");

    INIReader reader(this->config_file);

    if (reader.ParseError() != 0) {
        LOG(ERROR) << "Error while parsing config file, code = " << reader.ParseError();
        config_file_validity = -1;
        return ;
    }

    config_file_validity = 1;

    if(reader.HasValue("cluster", "role")) {
        this->role = reader.Get("cluster", "role", "");
    }

    if(reader.HasValue("cluster", "private-ip")) {
        this->private_ip = reader.Get("cluster", "private-ip", "");
    }

    if(reader.HasValue("cluster", "nodes")) {
        this->nodes = split_list(reader.Get("cluster", "nodes", ""));
    }

    if(reader.HasValue("cluster", "agent-port")) {
        this->agent_port = (uint32_t) reader.GetInteger("cluster", "agent-port", 8008);
    }

    if(reader.HasValue("cluster", "consensus-client-port")) {
        this->consensus_client_port = (uint32_t) reader.GetInteger("cluster", "consensus-client-port", 2379);
    }

    if(reader.HasValue("cluster", "consensus-peer-port")) {
        this->consensus_peer_port = (uint32_t) reader.GetInteger("cluster", "consensus-peer-port", 2380);
    }

    if(reader.HasValue("cluster", "db-port")) {
        this->db_port = (uint32_t) reader.GetInteger("cluster", "db-port", 5432);
    }

    if(reader.HasValue("cluster", "consensus-ca-path")) {
        this->consensus_ca_path = reader.Get("cluster", "consensus-ca-path", "");
    }

    if(reader.HasValue("cluster", "db-ca-path")) {
        this->db_ca_path = reader.Get("cluster", "db-ca-path", "");
    }

    if(reader.HasValue("cluster", "consensus-root-password")) {
        this->consensus_root_password = reader.Get("cluster", "consensus-root-password", "");
    }

    if(reader.HasValue("cluster", "agent-config-path")) {
        this->agent_config_path = reader.Get("cluster", "agent-config-path", "");
    }

    if(reader.HasValue("proxy", "config-path")) {
        this->proxy_config_path = reader.Get("proxy", "config-path", "");
    }

    if(reader.HasValue("proxy", "stats-socket")) {
        this->proxy_stats_socket = reader.Get("proxy", "stats-socket", "");
    }

    if(reader.HasValue("proxy", "dependent-services")) {
        this->dependent_services = split_list(reader.Get("proxy", "dependent-services", ""));
    }

    if(reader.HasValue("checks", "probe-timeout-ms")) {
        this->probe_timeout_ms = (uint32_t) reader.GetInteger("checks", "probe-timeout-ms", 5000);
    }

    if(reader.HasValue("checks", "promote-poll-attempts")) {
        this->promote_poll_attempts = (uint32_t) reader.GetInteger("checks", "promote-poll-attempts", 30);
    }

    if(reader.HasValue("checks", "promote-poll-interval-ms")) {
        this->promote_poll_interval_ms = (uint32_t) reader.GetInteger("checks", "promote-poll-interval-ms", 1000);
    }

    if(reader.HasValue("checks", "auth-check-attempts")) {
        this->auth_check_attempts = (uint32_t) reader.GetInteger("checks", "auth-check-attempts", 5);
    }

    if(reader.HasValue("checks", "auth-check-interval-ms")) {
        this->auth_check_interval_ms = (uint32_t) reader.GetInteger("checks", "auth-check-interval-ms", 3000);
    }

    if(reader.HasValue("checks", "lag-threshold-mib")) {
        this->lag_threshold_mib = (float) reader.GetReal("checks", "lag-threshold-mib", 2.0);
    }

    if(reader.HasValue("server", "log-dir")) {
        this->log_dir = reader.Get("server", "log-dir", "");
    }
}

void Config::load_config_cmd_args(cmdline::parser& options) {
    if(options.exist("role")) {
        this->role = options.get<std::string>("role");
    }

    if(options.exist("private-ip")) {
        this->private_ip = options.get<std::string>("private-ip");
    }

    if(options.exist("nodes")) {
        this->nodes = split_list(options.get<std::string>("nodes"));
    }

    if(options.exist("agent-port")) {
        this->agent_port = options.get<uint32_t>("agent-port");
    }

    if(options.exist("consensus-client-port")) {
        this->consensus_client_port = options.get<uint32_t>("consensus-client-port");
    }

    if(options.exist("consensus-peer-port")) {
        this->consensus_peer_port = options.get<uint32_t>("consensus-peer-port");
    }

    if(options.exist("db-port")) {
        this->db_port = options.get<uint32_t>("db-port");
    }

    if(options.exist("consensus-ca-path")) {
        this->consensus_ca_path = options.get<std::string>("consensus-ca-path");
    }

    if(options.exist("db-ca-path")) {
        this->db_ca_path = options.get<std::string>("db-ca-path");
    }

    if(options.exist("agent-config-path")) {
        this->agent_config_path = options.get<std::string>("agent-config-path");
    }

    if(options.exist("proxy-config-path")) {
        this->proxy_config_path = options.get<std::string>("proxy-config-path");
    }

    if(options.exist("proxy-stats-socket")) {
        this->proxy_stats_socket = options.get<std::string>("proxy-stats-socket");
    }

    if(options.exist("dependent-services")) {
        this->dependent_services = split_list(options.get<std::string>("dependent-services"));
    }

    if(options.exist("probe-timeout-ms")) {
        this->probe_timeout_ms = options.get<uint32_t>("probe-timeout-ms");
    }

    if(options.exist("promote-poll-attempts")) {
        this->promote_poll_attempts = options.get<uint32_t>("promote-poll-attempts");
    }

    if(options.exist("promote-poll-interval-ms")) {
        this->promote_poll_interval_ms = options.get<uint32_t>("promote-poll-interval-ms");
    }

    if(options.exist("auth-check-attempts")) {
        this->auth_check_attempts = options.get<uint32_t>("auth-check-attempts");
    }

    if(options.exist("auth-check-interval-ms")) {
        this->auth_check_interval_ms = options.get<uint32_t>("auth-check-interval-ms");
    }

    if(options.exist("lag-threshold-mib")) {
        this->lag_threshold_mib = options.get<float>("lag-threshold-mib");
    }

    if(options.exist("log-dir")) {
        this->log_dir = options.get<std::string>("log-dir");
    }
}

Option<bool> Config::is_valid() const {
    if(this->config_file_validity == -1) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Error parsing the configuration file.");
    }

    if(role.empty()) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Node role is not specified.");
    }

    const NodeRole node_role = get_node_role();

    if(node_role == NodeRole::UNSUPPORTED) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Node role must be either `database` or `client`.");
    }

    if(node_role == NodeRole::DATABASE && private_ip.empty()) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Private IP is required on a database node.");
    }

    if(node_role == NodeRole::DATABASE && nodes.empty()) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Cluster nodes are required on a database node.");
    }

    if(agent_port == 0 || consensus_client_port == 0 || consensus_peer_port == 0 || db_port == 0) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Ports must be positive integers.");
    }

    if(probe_timeout_ms == 0) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Probe timeout must be a positive integer.");
    }

    if(promote_poll_attempts == 0) {
        return Option<bool>(cluster_error::INVALID_CONFIG, "Promote poll attempts must be a positive integer.");
    }

    return Option<bool>(true);
}

nlohmann::json Config::to_json() const {
    nlohmann::json config_json;
    config_json["role"] = role;
    config_json["private-ip"] = private_ip;
    config_json["nodes"] = nodes;
    config_json["agent-port"] = agent_port;
    config_json["consensus-client-port"] = consensus_client_port;
    config_json["consensus-peer-port"] = consensus_peer_port;
    config_json["db-port"] = db_port;
    config_json["proxy-config-path"] = proxy_config_path;
    config_json["dependent-services"] = dependent_services;
    config_json["probe-timeout-ms"] = probe_timeout_ms;
    config_json["lag-threshold-mib"] = lag_threshold_mib;

    // credentials are never echoed
    config_json["consensus-root-password"] = consensus_root_password.empty() ? "" : "***";
    return config_json;
}
