// test_config.cpp

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "armrtc.h"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>

static const double kDeg = 3.14159265358979323846 / 180.0;

static arm_rtc_config parse(const std::string& text) {
    return readArmConfig(toml::parse(text));
}

static const char* kMinimal = R"(
[policy]
trajectory_file = "traj.toml"
)";

TEST_CASE("Missing keys keep their defaults", "[config]") {
    arm_rtc_config cfg = parse(kMinimal);

    REQUIRE(cfg.control_hz == Approx(30.0));
    REQUIRE(cfg.dt() == Approx(1.0 / 30.0));
    REQUIRE(cfg.max_episode_steps == 3000);
    REQUIRE_FALSE(cfg.enable_control);
    REQUIRE(cfg.telemetry_capacity == 6000);

    REQUIRE(cfg.robot.backend == "sim");
    REQUIRE(cfg.robot.n_joints == 6);
    REQUIRE(cfg.robot.limits.max_delta_rad == Approx(0.05));
    REQUIRE(cfg.robot.limits.max_joint_vel == Approx(1.0));
    REQUIRE(cfg.robot.limits.max_drift_rad == Approx(0.5));
    REQUIRE(cfg.robot.limits.joint_lower(1) == Approx(-190.0 * kDeg));
    REQUIRE(cfg.robot.limits.joint_upper(2) == Approx(160.0 * kDeg));
    REQUIRE(cfg.robot.drift_watchdog);
    REQUIRE(cfg.robot.initial_q.isApprox(cfg.robot.home_q));

    REQUIRE(cfg.camera.backend == "synthetic");
    REQUIRE(cfg.camera.width == 848);
    REQUIRE(cfg.camera.height == 480);

    REQUIRE(cfg.policy.action_mode == "delta");
    REQUIRE(cfg.policy.chunk_size == 100);
    REQUIRE_FALSE(cfg.policy.temporal_ensemble_coeff);
    REQUIRE(cfg.policy.joint_sign.isApprox(Eigen::VectorXd::Ones(6)));
    REQUIRE(cfg.policy.training_mean.size() == 0);
}

TEST_CASE("Every section is read", "[config]") {
    arm_rtc_config cfg = parse(R"(
name = "bench"
control_hz = 50.0
max_episode_steps = 120
enable_control = true
log_dir = "/tmp/armrtc_logs"
telemetry_capacity = 500

[robot]
backend = "shm"
shm_prefix = "arm0"
max_delta_rad = 0.02
max_joint_vel = 0.5
max_drift_rad = 0.3
joint_lower = [-3, -3, -3, -3, -3, -3]
joint_upper = [3, 3, 3, 3, 3, 3]
drift_watchdog = false
state_timeout_ms = 250
home_q = [0, -1.5, 1.5, -1.5, -1.5, 0]
home_speed = 0.2
home_before_episode = true

[camera]
backend = "shm"
stream = "wrist_cam"
width = 320
height = 240
max_retries = 3

[policy]
trajectory_file = "demo.toml"
action_mode = "absolute"
chunk_size = 20
temporal_ensemble_coeff = 0.01
joint_sign = [-1, -1, 1, -1, 1, 1]
training_mean = [0, 0, 0, 0, 0, 0]
training_std = [1, 1, 1, 1, 1, 1]
ood_threshold = 2.5
)");

    REQUIRE(cfg.name == "bench");
    REQUIRE(cfg.control_hz == Approx(50.0));
    REQUIRE(cfg.max_episode_steps == 120);
    REQUIRE(cfg.enable_control);
    REQUIRE(cfg.log_dir == "/tmp/armrtc_logs");
    REQUIRE(cfg.telemetry_capacity == 500);

    REQUIRE(cfg.robot.backend == "shm");
    REQUIRE(cfg.robot.shm_prefix == "arm0");
    REQUIRE(cfg.robot.limits.max_delta_rad == Approx(0.02));
    REQUIRE(cfg.robot.limits.joint_upper(4) == Approx(3.0));
    REQUIRE_FALSE(cfg.robot.drift_watchdog);
    REQUIRE(cfg.robot.state_timeout_ms == 250);
    REQUIRE(cfg.robot.home_q(1) == Approx(-1.5));
    REQUIRE(cfg.robot.home_before_episode);
    // initial_q follows home_q unless given
    REQUIRE(cfg.robot.initial_q.isApprox(cfg.robot.home_q));

    REQUIRE(cfg.camera.stream == "wrist_cam");
    REQUIRE(cfg.camera.width == 320);
    REQUIRE(cfg.camera.max_retries == 3);

    REQUIRE(cfg.policy.action_mode == "absolute");
    REQUIRE(cfg.policy.chunk_size == 20);
    REQUIRE(cfg.policy.temporal_ensemble_coeff);
    REQUIRE(*cfg.policy.temporal_ensemble_coeff == Approx(0.01));
    REQUIRE(cfg.policy.joint_sign(0) == -1.0);
    REQUIRE(cfg.policy.joint_sign(2) == 1.0);
    REQUIRE(cfg.policy.ood_threshold == Approx(2.5));
}

TEST_CASE("Invalid configurations are rejected", "[config]") {
    REQUIRE_THROWS_AS(parse("control_hz = 30.0\n"), std::runtime_error); // no trajectory_file
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "action_mode = \"velocity\"\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "chunk_size = 0\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "chunk_size = -4\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "temporal_ensemble_coeff = -0.1\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "temporal_ensemble_coeff = inf\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "temporal_ensemble_coeff = nan\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "joint_sign = [1, 1, 1]\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "joint_sign = [1, 1, 1, 1, 1, 0.5]\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse(std::string(kMinimal) + "training_mean = [0, 0, 0, 0, 0, 0]\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse("control_hz = 0.0\n" + std::string(kMinimal)), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[robot]\nbackend = \"tcp\"\n" + std::string(kMinimal)), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[robot]\nmax_delta_rad = 0.0\n" + std::string(kMinimal)), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[robot]\njoint_lower = [0, 0, \"x\", 0, 0, 0]\n" + std::string(kMinimal)), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[robot]\njoint_lower = [4, 4, 4, 4, 4, 4]\n" + std::string(kMinimal)), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[camera]\nwidth = 0\n" + std::string(kMinimal)), std::runtime_error);
}

TEST_CASE("TOML arrays convert to Eigen with shape checks", "[config]") {
    toml::table t = toml::parse(R"(
v = [1.0, 2, 3.5]
m = [[1, 2], [3, 4], [5, 6]]
ragged = [[1, 2], [3]]
)");
    Eigen::VectorXd v = convertTomlArrayToEigenMatrix(*t["v"].as_array(), Eigen::VectorXd(), "v");
    REQUIRE(v.size() == 3);
    REQUIRE(v(2) == Approx(3.5));

    Eigen::MatrixXd m = convertTomlArrayToEigenMatrix(*t["m"].as_array(), Eigen::MatrixXd(), "m");
    REQUIRE(m.rows() == 3);
    REQUIRE(m.cols() == 2);
    REQUIRE(m(2, 1) == Approx(6.0));

    REQUIRE_THROWS_AS(convertTomlArrayToEigenMatrix(*t["ragged"].as_array(), Eigen::MatrixXd(), "ragged"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(convertTomlArrayToEigenMatrix(*t["v"].as_array(), Eigen::Vector2d(), "v"),
                      std::runtime_error);
}

TEST_CASE("readConfig reports unreadable and malformed files", "[config]") {
    REQUIRE_THROWS_AS(readConfig("/nonexistent/armrtc.toml"), std::runtime_error);

    const auto path = std::filesystem::temp_directory_path() / "armrtc_test_bad_config.toml";
    {
        std::ofstream out(path);
        out << "control_hz = = 30\n";
    }
    REQUIRE_THROWS_AS(readConfig(path.string()), std::runtime_error);
    std::filesystem::remove(path);
}
