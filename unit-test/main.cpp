#include <glog/logging.h>
#include <signal.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "validator/python_validator.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    virtual void SetUp() {
        // 与执行机的 main 一致
        signal(SIGPIPE, SIG_IGN);
        executor::initialize_python("unit_test");
    }
    virtual void TearDown() {
        //  Stub
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
