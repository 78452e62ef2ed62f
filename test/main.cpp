#include <gtest/gtest.h>
#include "logger.h"
#include "http_client.h"

class PgQuorumTestEnvironment : public testing::Environment {
public:
    virtual void SetUp() {
        HttpClient::get_instance().init();
    }

    virtual void TearDown() {
        HttpClient::get_instance().dispose();
    }
};

int main(int argc, char **argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_ERROR;

    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new PgQuorumTestEnvironment);
    int exitCode = RUN_ALL_TESTS();
    return exitCode;
}
