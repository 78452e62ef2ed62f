#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <cmdline.h>
#include <nlohmann/json.hpp>
#include "option.h"
#include "string_utils.h"

enum class NodeRole {
    DATABASE,   // node runs the database, its HA agent and a consensus store member
    CLIENT,     // node only reaches the database through the load balancer
    UNSUPPORTED
};

class Config {
private:
    std::string role;
    std::string private_ip;
    std::vector<std::string> nodes;

    uint32_t agent_port;
    uint32_t consensus_client_port;
    uint32_t consensus_peer_port;
    uint32_t db_port;

    std::string consensus_ca_path;
    std::string db_ca_path;
    std::string consensus_root_password;

    std::string etcdctl_path;
    std::string patronictl_path;
    std::string agent_config_path;
    std::string config_blob_key;

    std::string proxy_config_path;
    std::string proxy_stats_socket;
    std::string proxy_ca_path;
    std::vector<std::string> dependent_services;

    uint32_t probe_timeout_ms;
    uint32_t promote_poll_attempts;
    uint32_t promote_poll_interval_ms;
    uint32_t auth_check_attempts;
    uint32_t auth_check_interval_ms;
    float lag_threshold_mib;

    std::string log_dir;

    std::string config_file;
    int config_file_validity;

    static std::string get_env(const char *name) {
        const char *ret = getenv(name);
        if (!ret) {
            return std::string();
        }

        return std::string(ret);
    }

    static std::vector<std::string> split_list(const std::string& value) {
        std::vector<std::string> values;
        StringUtils::split(value, values, ",");
        return values;
    }

public:

    Config() {
        this->role = "";
        this->agent_port = 8008;
        this->consensus_client_port = 2379;
        this->consensus_peer_port = 2380;
        this->db_port = 5432;

        this->consensus_ca_path = "/etc/etcd/ca.crt";
        this->db_ca_path = "/etc/cloudify/ssl/postgresql_ca.crt";

        this->etcdctl_path = "etcdctl";
        this->patronictl_path = "/opt/patroni/bin/patronictl";
        this->agent_config_path = "/etc/patroni.conf";
        this->config_blob_key = "/db/postgres/config";

        this->proxy_config_path = "/etc/haproxy/haproxy.cfg";
        this->proxy_stats_socket = "/var/lib/haproxy/stats";
        this->proxy_ca_path = "/etc/haproxy/ca.crt";
        this->dependent_services = {"haproxy", "cloudify-amqp-postgres", "cloudify-restservice"};

        this->probe_timeout_ms = 5000;
        this->promote_poll_attempts = 30;
        this->promote_poll_interval_ms = 1000;
        this->auth_check_attempts = 5;
        this->auth_check_interval_ms = 3000;
        this->lag_threshold_mib = 2.0f;

        this->config_file_validity = 0;
    }

    // setters

    void set_role(const std::string& role) {
        this->role = role;
    }

    void set_private_ip(const std::string& private_ip) {
        this->private_ip = private_ip;
    }

    void set_nodes(const std::vector<std::string>& nodes) {
        this->nodes = nodes;
    }

    void set_agent_port(uint32_t agent_port) {
        this->agent_port = agent_port;
    }

    void set_consensus_client_port(uint32_t consensus_client_port) {
        this->consensus_client_port = consensus_client_port;
    }

    void set_consensus_root_password(const std::string& consensus_root_password) {
        this->consensus_root_password = consensus_root_password;
    }

    void set_proxy_config_path(const std::string& proxy_config_path) {
        this->proxy_config_path = proxy_config_path;
    }

    void set_proxy_stats_socket(const std::string& proxy_stats_socket) {
        this->proxy_stats_socket = proxy_stats_socket;
    }

    void set_dependent_services(const std::vector<std::string>& dependent_services) {
        this->dependent_services = dependent_services;
    }

    void set_probe_timeout_ms(uint32_t probe_timeout_ms) {
        this->probe_timeout_ms = probe_timeout_ms;
    }

    void set_promote_poll_attempts(uint32_t promote_poll_attempts) {
        this->promote_poll_attempts = promote_poll_attempts;
    }

    void set_promote_poll_interval_ms(uint32_t promote_poll_interval_ms) {
        this->promote_poll_interval_ms = promote_poll_interval_ms;
    }

    void set_auth_check_attempts(uint32_t auth_check_attempts) {
        this->auth_check_attempts = auth_check_attempts;
    }

    void set_lag_threshold_mib(float lag_threshold_mib) {
        this->lag_threshold_mib = lag_threshold_mib;
    }

    void set_log_dir(const std::string& log_dir) {
        this->log_dir = log_dir;
    }

    // getters

    std::string get_role() const {
        return this->role;
    }

    NodeRole get_node_role() const;

    std::string get_private_ip() const {
        return this->private_ip;
    }

    const std::vector<std::string>& get_nodes() const {
        return this->nodes;
    }

    uint32_t get_agent_port() const {
        return this->agent_port;
    }

    uint32_t get_consensus_client_port() const {
        return this->consensus_client_port;
    }

    uint32_t get_consensus_peer_port() const {
        return this->consensus_peer_port;
    }

    uint32_t get_db_port() const {
        return this->db_port;
    }

    std::string get_consensus_ca_path() const {
        return this->consensus_ca_path;
    }

    std::string get_db_ca_path() const {
        return this->db_ca_path;
    }

    std::string get_consensus_root_password() const {
        return this->consensus_root_password;
    }

    std::string get_etcdctl_path() const {
        return this->etcdctl_path;
    }

    std::string get_patronictl_path() const {
        return this->patronictl_path;
    }

    std::string get_agent_config_path() const {
        return this->agent_config_path;
    }

    std::string get_config_blob_key() const {
        return this->config_blob_key;
    }

    std::string get_proxy_config_path() const {
        return this->proxy_config_path;
    }

    std::string get_proxy_stats_socket() const {
        return this->proxy_stats_socket;
    }

    std::string get_proxy_ca_path() const {
        return this->proxy_ca_path;
    }

    const std::vector<std::string>& get_dependent_services() const {
        return this->dependent_services;
    }

    uint32_t get_probe_timeout_ms() const {
        return this->probe_timeout_ms;
    }

    uint32_t get_promote_poll_attempts() const {
        return this->promote_poll_attempts;
    }

    uint32_t get_promote_poll_interval_ms() const {
        return this->promote_poll_interval_ms;
    }

    uint32_t get_auth_check_attempts() const {
        return this->auth_check_attempts;
    }

    uint32_t get_auth_check_interval_ms() const {
        return this->auth_check_interval_ms;
    }

    float get_lag_threshold_mib() const {
        return this->lag_threshold_mib;
    }

    std::string get_log_dir() const {
        return this->log_dir;
    }

    std::string get_config_file() const {
        return this->config_file;
    }

    // CA used to verify node status endpoints: manager nodes cannot read the database node's
    // certificate directory, database nodes reuse the consensus CA which is the same certificate
    std::string get_probe_ca_path() const;

    // loaders

    void load_config_env();

    void load_config_file(cmdline::parser& options);

    void load_config_cmd_args(cmdline::parser& options);

    Option<bool> is_valid() const;

    nlohmann::json to_json() const;
};
