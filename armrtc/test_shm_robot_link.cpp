// test_shm_robot_link.cpp
//
// Plays the arm driver: creates the three streams in /dev/shm and checks what
// ShmRobotLink reads out of them.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "robot_link.h"
#include <fmt/core.h>
#include <thread>
#include <unistd.h>

#define TEST_JOINTS 6

// Driver side of <prefix>_state, _cmd and _flags.
struct FakeDriver {
    std::string prefix;
    IMAGE state_im, cmd_im, flags_im;

    FakeDriver() : prefix(fmt::format("armrtc_test_{}", getpid())) {
        create(state_im, prefix + "_state", 2 * TEST_JOINTS, _DATATYPE_DOUBLE);
        create(cmd_im, prefix + "_cmd", TEST_JOINTS, _DATATYPE_DOUBLE);
        create(flags_im, prefix + "_flags", 2, _DATATYPE_INT32);
        flags_im.array.SI32[0] = 0;
        flags_im.array.SI32[1] = 0;
    }

    ~FakeDriver() {
        ImageStreamIO_destroyIm(&state_im);
        ImageStreamIO_destroyIm(&cmd_im);
        ImageStreamIO_destroyIm(&flags_im);
    }

    // q(i) = 0.1 * i, qd(i) = -0.01 * i
    void publish_state() {
        state_im.md->write = 1;
        for (int i = 0; i < TEST_JOINTS; ++i) {
            state_im.array.D[i] = 0.1 * i;
            state_im.array.D[TEST_JOINTS + i] = -0.01 * i;
        }
        state_im.md->cnt0++;
        state_im.md->write = 0;
    }

private:
    static void create(IMAGE& im, const std::string& name, uint32_t n, uint8_t datatype) {
        uint32_t dims[2] = {n, 1};
        REQUIRE(ImageStreamIO_createIm_gpu(&im, name.c_str(), 2, dims, datatype, -1, 1, 2, 0, 0)
                == IMAGESTREAMIO_SUCCESS);
    }
};

TEST_CASE("State is copied out of the state stream", "[shm]") {
    FakeDriver driver;
    driver.publish_state();

    ShmRobotLink link(driver.prefix, TEST_JOINTS, 1000);
    link.connect();
    JointState s = link.get_state();
    REQUIRE(s.q.size() == TEST_JOINTS);
    REQUIRE(s.qd.size() == TEST_JOINTS);
    REQUIRE(s.q(3) == Approx(0.3));
    REQUIRE(s.qd(5) == Approx(-0.05));
    REQUIRE_FALSE(link.is_protective_stopped());

    driver.flags_im.array.SI32[0] = 1;
    REQUIRE(link.is_protective_stopped());
    REQUIRE_FALSE(link.is_emergency_stopped());
    link.disconnect();
}

TEST_CASE("A state stream held mid-write is a hardware fault", "[shm]") {
    FakeDriver driver;
    driver.publish_state();

    ShmRobotLink link(driver.prefix, TEST_JOINTS, 1000);
    link.connect();
    driver.state_im.md->write = 1;
    REQUIRE_THROWS_AS(link.get_state(), HardwareFault);

    driver.state_im.md->write = 0;
    REQUIRE(link.get_state().q(1) == Approx(0.1));
    link.disconnect();
}

TEST_CASE("A state stream that stops updating is a hardware fault", "[shm]") {
    FakeDriver driver;
    driver.publish_state();

    ShmRobotLink link(driver.prefix, TEST_JOINTS, 20);
    link.connect();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    REQUIRE_THROWS_AS(link.get_state(), HardwareFault);
    link.disconnect();
}

TEST_CASE("Commands land in the command stream", "[shm]") {
    FakeDriver driver;
    driver.publish_state();

    ShmRobotLink link(driver.prefix, TEST_JOINTS, 1000);
    link.connect();
    const uint64_t cnt = driver.cmd_im.md->cnt0;
    link.command(Eigen::VectorXd::Constant(TEST_JOINTS, 0.25), 0.01);
    REQUIRE(driver.cmd_im.md->cnt0 == cnt + 1);
    REQUIRE(driver.cmd_im.array.D[4] == Approx(0.25));
    REQUIRE_THROWS_AS(link.command(Eigen::VectorXd::Zero(3), 0.01), std::invalid_argument);
    link.disconnect();
    REQUIRE_THROWS_AS(link.get_state(), HardwareFault);
}
