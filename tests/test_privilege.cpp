#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace lan_scan {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(PrivilegeTest, AvailabilityMatchesBuild) {
#ifdef LAN_SCAN_HAVE_LIBCAP
    EXPECT_TRUE(is_privilege_available());
#else
    EXPECT_FALSE(is_privilege_available());
#endif
}

TEST_F(PrivilegeTest, DropCapabilitiesWithoutLibcap) {
#ifndef LAN_SCAN_HAVE_LIBCAP
    testing::internal::CaptureStderr();
    EXPECT_NO_THROW(drop_capabilities(true));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_THAT(err, ::testing::HasSubstr("not available"));
#endif
}

// Dropping is irreversible, so it runs in a child process.
TEST_F(PrivilegeTest, DropCapabilitiesInChild) {
    pid_t pid = fork();
    ASSERT_NE(pid, -1) << "Failed to fork process";
    if (pid == 0) {
        drop_capabilities(true);
        drop_capabilities(false);
        _exit(0);
    }
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

} // namespace lan_scan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
