#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "proxy_backends.h"
#include "pgquorum_config.h"
#include "file_utils.h"
#include "cluster_errors.h"

namespace {
    const char* SHOW_STAT =
        "# pxname,svname,qcur,qmax,scur,smax,slim,stot,bin,bout,dreq,dresp,ereq,econ,eresp,wretr,wredis,status,weight\n"
        "postgres,FRONTEND,,,0,2,100,14,0,0,0,0,0,,,,,OPEN,\n"
        "postgres,postgresql_192.0.2.1_5432,0,0,0,1,100,5,0,0,,0,,0,0,0,0,DOWN,1\n"
        "postgres,postgresql_192.0.2.2_5432,0,0,0,1,100,9,0,0,,0,,0,0,0,0,UP,1\n"
        "postgres,BACKEND,0,0,0,2,10,14,0,0,0,0,,0,0,0,0,UP,1\n"
        "\n";

    std::string read_file(const std::string& path) {
        std::ifstream infile(path);
        return std::string((std::istreambuf_iterator<char>(infile)), std::istreambuf_iterator<char>());
    }
}

class HaproxyBackendsTest : public ::testing::Test {
protected:
    Config config;
    HaproxyBackends backends{config};
    std::string test_dir;
    std::string config_path;

    void SetUp() override {
        test_dir = "/tmp/pgquorum_test/proxy_backends";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);

        config_path = test_dir + "/haproxy.cfg";
        config.set_proxy_config_path(config_path);
        config.set_role("client");

        std::ofstream outfile(config_path);
        outfile << "backend postgres\n"
                << "    option httpchk\n"
                << "    server postgresql_192.0.2.1_5432 192.0.2.1:5432 maxconn 100 check check-ssl port 8008 ca-file /etc/haproxy/ca.crt\n"
                << "    server postgresql_192.0.2.2_5432 192.0.2.2:5432 maxconn 100 check check-ssl port 8008 ca-file /etc/haproxy/ca.crt\n";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
};

TEST_F(HaproxyBackendsTest, ParseStatCsvKeepsServerRows) {
    std::vector<proxy_backend_t> rows = HaproxyBackends::parse_stat_csv(SHOW_STAT);

    ASSERT_EQ(2, rows.size());
    ASSERT_EQ("postgresql_192.0.2.1_5432", rows[0].svname);
    ASSERT_EQ("DOWN", rows[0].status);
    ASSERT_EQ("postgresql_192.0.2.2_5432", rows[1].svname);
    ASSERT_EQ("UP", rows[1].status);
}

TEST_F(HaproxyBackendsTest, ParseStatCsvWithoutHeaderColumns) {
    ASSERT_TRUE(HaproxyBackends::parse_stat_csv("").empty());
    ASSERT_TRUE(HaproxyBackends::parse_stat_csv("# pxname,qcur\npostgres,0\n").empty());
}

TEST_F(HaproxyBackendsTest, BackendAddress) {
    ASSERT_EQ("192.0.2.1", HaproxyBackends::backend_address("postgresql_192.0.2.1_5432"));
    ASSERT_EQ("2001:db8::1", HaproxyBackends::backend_address("postgresql_2001:db8::1_5432"));
    ASSERT_EQ("", HaproxyBackends::backend_address("BACKEND"));
    ASSERT_EQ("", HaproxyBackends::backend_address("postgresql_192.0.2.1"));
}

TEST_F(HaproxyBackendsTest, BackendLine) {
    ASSERT_EQ("    server postgresql_192.0.2.3_5432 192.0.2.3:5432 maxconn 100 check check-ssl port 8008 "
              "ca-file /etc/haproxy/ca.crt", backends.backend_line("192.0.2.3"));
}

TEST_F(HaproxyBackendsTest, AppendBackend) {
    auto append_op = backends.append_backend("192.0.2.3");
    ASSERT_TRUE(append_op.ok());

    std::vector<std::string> lines;
    ASSERT_TRUE(read_file_lines(config_path, lines));
    ASSERT_EQ(5, lines.size());
    ASSERT_EQ(backends.backend_line("192.0.2.3"), lines[4]);
}

TEST_F(HaproxyBackendsTest, RemoveBackendKeepsOtherLines) {
    const std::string original = read_file(config_path);

    auto remove_op = backends.remove_backend("192.0.2.1");
    ASSERT_TRUE(remove_op.ok());

    std::vector<std::string> lines;
    ASSERT_TRUE(read_file_lines(config_path, lines));
    ASSERT_EQ(3, lines.size());
    ASSERT_EQ("backend postgres", lines[0]);
    ASSERT_EQ("    option httpchk", lines[1]);
    ASSERT_EQ(backends.backend_line("192.0.2.2"), lines[2]);

    // no entry for the address: the file is left alone
    const std::string after_removal = read_file(config_path);
    remove_op = backends.remove_backend("192.0.2.9");
    ASSERT_TRUE(remove_op.ok());
    ASSERT_EQ(after_removal, read_file(config_path));
    ASSERT_NE(original, after_removal);
}

TEST_F(HaproxyBackendsTest, MissingConfigFileFails) {
    config.set_proxy_config_path(test_dir + "/missing/haproxy.cfg");

    ASSERT_FALSE(backends.remove_backend("192.0.2.1").ok());
    ASSERT_FALSE(backends.append_backend("192.0.2.1").ok());
}

TEST_F(HaproxyBackendsTest, UnreachableStatsSocketFails) {
    config.set_proxy_stats_socket(test_dir + "/stats");

    auto list_op = backends.list_backends();
    ASSERT_FALSE(list_op.ok());
    ASSERT_EQ(cluster_error::TOPOLOGY_UNAVAILABLE, list_op.code());
}
