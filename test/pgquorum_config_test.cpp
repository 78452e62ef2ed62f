#include <gtest/gtest.h>
#include <stdlib.h>
#include <cmdline.h>
#include "pgquorum_cli_utils.h"
#include "pgquorum_config.h"
#include "cluster_errors.h"

std::vector<char*> get_argv(std::vector<std::string> & args) {
    std::vector<char*> argv;
    for (const auto& arg : args)
        argv.push_back((char*)arg.data());
    argv.push_back(nullptr);

    return argv;
}

TEST(ConfigTest, LoadCmdLineArguments) {
    cmdline::parser options;

    std::vector<std::string> args = {
        "./pgquorum",
        "--role=database",
        "--private-ip=10.0.0.11",
        "--nodes=10.0.0.11,10.0.0.12,10.0.0.13",
        "--agent-port=8010",
        "--lag-threshold-mib=3.5",
        "status"
    };

    std::vector<char*> argv = get_argv(args);

    init_cmdline_options(options, argv.size() - 1, argv.data());
    options.parse(argv.size() - 1, argv.data());

    Config config;
    config.load_config_cmd_args(options);

    ASSERT_EQ("database", config.get_role());
    ASSERT_EQ(NodeRole::DATABASE, config.get_node_role());
    ASSERT_EQ("10.0.0.11", config.get_private_ip());
    ASSERT_EQ(3, config.get_nodes().size());
    ASSERT_EQ("10.0.0.13", config.get_nodes()[2]);
    ASSERT_EQ(8010, config.get_agent_port());
    ASSERT_FLOAT_EQ(3.5f, config.get_lag_threshold_mib());

    // options left out keep their defaults
    ASSERT_EQ(2379, config.get_consensus_client_port());
    ASSERT_EQ(5432, config.get_db_port());

    ASSERT_EQ(1, options.rest().size());
    ASSERT_EQ("status", options.rest()[0]);
}

TEST(ConfigTest, LoadEnvVars) {
    putenv((char*)"PGQUORUM_ROLE=client");
    putenv((char*)"PGQUORUM_AGENT_PORT=9008");
    Config config;
    config.load_config_env();

    ASSERT_EQ(NodeRole::CLIENT, config.get_node_role());
    ASSERT_EQ(9008, config.get_agent_port());

    unsetenv("PGQUORUM_ROLE");
    unsetenv("PGQUORUM_AGENT_PORT");
}

TEST(ConfigTest, LoadRetrySettingsFromEnvVars) {
    putenv((char*)"PGQUORUM_PROMOTE_POLL_ATTEMPTS=12");
    putenv((char*)"PGQUORUM_PROMOTE_POLL_INTERVAL_MS=250");
    putenv((char*)"PGQUORUM_AUTH_CHECK_ATTEMPTS=7");
    putenv((char*)"PGQUORUM_AUTH_CHECK_INTERVAL_MS=1500");

    Config config;
    config.load_config_env();

    ASSERT_EQ(12, config.get_promote_poll_attempts());
    ASSERT_EQ(250, config.get_promote_poll_interval_ms());
    ASSERT_EQ(7, config.get_auth_check_attempts());
    ASSERT_EQ(1500, config.get_auth_check_interval_ms());

    unsetenv("PGQUORUM_PROMOTE_POLL_ATTEMPTS");
    unsetenv("PGQUORUM_PROMOTE_POLL_INTERVAL_MS");
    unsetenv("PGQUORUM_AUTH_CHECK_ATTEMPTS");
    unsetenv("PGQUORUM_AUTH_CHECK_INTERVAL_MS");
}

TEST(ConfigTest, CmdLineArgsOverrideEnvVars) {
    cmdline::parser options;

    std::vector<std::string> args = {
            "./pgquorum",
            "--role=database",
            "status"
    };

    putenv((char*)"PGQUORUM_ROLE=client");
    putenv((char*)"PGQUORUM_PROBE_TIMEOUT_MS=1500");

    std::vector<char*> argv = get_argv(args);

    init_cmdline_options(options, argv.size() - 1, argv.data());
    options.parse(argv.size() - 1, argv.data());

    Config config;
    config.load_config_env();
    config.load_config_cmd_args(options);

    ASSERT_EQ("database", config.get_role());
    ASSERT_EQ(1500, config.get_probe_timeout_ms());

    unsetenv("PGQUORUM_ROLE");
    unsetenv("PGQUORUM_PROBE_TIMEOUT_MS");
}

TEST(ConfigTest, LoadConfigFile) {
    cmdline::parser options;

    std::string config_path = std::string(ROOT_DIR) + "test/valid_config.ini";
    std::vector<std::string> args = {
            "./pgquorum",
            "--config=" + config_path,
            "--agent-port=8011",
            "status"
    };

    std::vector<char*> argv = get_argv(args);

    init_cmdline_options(options, argv.size() - 1, argv.data());
    options.parse(argv.size() - 1, argv.data());

    Config config;
    config.load_config_file(options);

    ASSERT_EQ(config_path, config.get_config_file());
    ASSERT_EQ("database", config.get_role());
    ASSERT_EQ("10.0.0.11", config.get_private_ip());
    ASSERT_EQ(3, config.get_nodes().size());
    ASSERT_EQ(8009, config.get_agent_port());
    ASSERT_EQ("/etc/etcd/test-ca.crt", config.get_consensus_ca_path());
    ASSERT_EQ("/etc/etcd/test-ca.crt", config.get_probe_ca_path());
    ASSERT_EQ(2, config.get_dependent_services().size());
    ASSERT_EQ("cloudify-restservice", config.get_dependent_services()[1]);
    ASSERT_EQ(2500, config.get_probe_timeout_ms());
    ASSERT_FLOAT_EQ(4.5f, config.get_lag_threshold_mib());
    ASSERT_EQ("/tmp/pgquorum-logs", config.get_log_dir());
    ASSERT_TRUE(config.is_valid().ok());

    config.load_config_cmd_args(options);
    ASSERT_EQ(8011, config.get_agent_port());
}

TEST(ConfigTest, BadConfigurationReturnsError) {
    Config config1;
    auto validation = config1.is_valid();

    ASSERT_EQ(false, validation.ok());
    ASSERT_EQ("Node role is not specified.", validation.error());

    Config config2;
    config2.set_role("witness");
    validation = config2.is_valid();

    ASSERT_EQ(false, validation.ok());
    ASSERT_EQ("Node role must be either `database` or `client`.", validation.error());

    Config config3;
    config3.set_role("database");
    validation = config3.is_valid();

    ASSERT_EQ(false, validation.ok());
    ASSERT_EQ("Private IP is required on a database node.", validation.error());

    config3.set_private_ip("10.0.0.11");
    validation = config3.is_valid();

    ASSERT_EQ(false, validation.ok());
    ASSERT_EQ("Cluster nodes are required on a database node.", validation.error());

    config3.set_nodes({"10.0.0.11", "10.0.0.12"});
    ASSERT_TRUE(config3.is_valid().ok());

    Config config4;
    config4.set_role("manager");
    ASSERT_TRUE(config4.is_valid().ok());
    ASSERT_EQ(NodeRole::CLIENT, config4.get_node_role());
    ASSERT_EQ("/etc/cloudify/ssl/postgresql_ca.crt", config4.get_probe_ca_path());

    config4.set_probe_timeout_ms(0);
    validation = config4.is_valid();
    ASSERT_EQ(cluster_error::INVALID_CONFIG, validation.code());
    ASSERT_EQ("Probe timeout must be a positive integer.", validation.error());
}

TEST(ConfigTest, UnparseableConfigFile) {
    cmdline::parser options;

    std::vector<std::string> args = {
            "./pgquorum",
            "--config=" + std::string(ROOT_DIR) + "test/bad_config.ini",
            "status"
    };

    std::vector<char*> argv = get_argv(args);

    init_cmdline_options(options, argv.size() - 1, argv.data());
    options.parse(argv.size() - 1, argv.data());

    Config config;
    config.load_config_file(options);

    auto validation = config.is_valid();
    ASSERT_FALSE(validation.ok());
    ASSERT_EQ("Error parsing the configuration file.", validation.error());
}

TEST(ConfigTest, CredentialsAreMaskedInJson) {
    Config config;
    config.set_role("client");
    config.set_consensus_root_password("s3cret");

    nlohmann::json config_json = config.to_json();
    ASSERT_EQ("***", config_json["consensus-root-password"].get<std::string>());
    ASSERT_EQ("client", config_json["role"].get<std::string>());
}
