#define TOML_IMPLEMENTATION
#include "armrtc.h"
#include <cmath>
#include <fmt/core.h>

namespace {
constexpr double kDeg2Rad = 3.14159265358979323846 / 180.0;

// Conservative UR10e operating limits (narrower than the physical +-360 deg).
const double kSafeLowerDeg[N_JOINTS] = {-350, -190, -160, -350, -350, -350};
const double kSafeUpperDeg[N_JOINTS] = { 350,   10,  160,  350,  350,  350};

// Training-mean home pose, robot frame.
const double kHomeQ[N_JOINTS] = {-1.529079, -2.133681, 2.233993, -1.552526, -1.437930, -0.149820};

Eigen::VectorXd read_vector(const toml::node* n, const Eigen::VectorXd& fallback, const std::string& field) {
    if (!n) return fallback;
    const toml::array* arr = n->as_array();
    if (!arr)
        throw std::runtime_error("Field \"" + field + "\": expected an array of numbers");
    return convertTomlArrayToEigenMatrix(*arr, Eigen::VectorXd(), field);
}

template<typename T>
T read_positive_int(const toml::node* n, T fallback, const std::string& field) {
    if (!n) return fallback;
    auto v = n->value<int64_t>();
    if (!v || *v < 0)
        throw std::runtime_error("Field \"" + field + "\": expected a non-negative integer");
    return static_cast<T>(*v);
}
}

arm_robot::arm_robot()
    : home_q(N_JOINTS), initial_q(N_JOINTS)
{
    limits.joint_lower.resize(N_JOINTS);
    limits.joint_upper.resize(N_JOINTS);
    for (int i = 0; i < N_JOINTS; ++i) {
        limits.joint_lower(i) = kSafeLowerDeg[i] * kDeg2Rad;
        limits.joint_upper(i) = kSafeUpperDeg[i] * kDeg2Rad;
        home_q(i) = kHomeQ[i];
    }
    initial_q = home_q;
}

arm_rtc_config readArmConfig(const toml::table& config) {
    arm_rtc_config cfg;

    cfg.name = config["name"].value_or(cfg.name);
    cfg.control_hz = config["control_hz"].value_or(cfg.control_hz);
    cfg.max_episode_steps = read_positive_int(config["max_episode_steps"].node(), cfg.max_episode_steps, "max_episode_steps");
    cfg.enable_control = config["enable_control"].value_or(cfg.enable_control);
    cfg.log_dir = config["log_dir"].value_or(cfg.log_dir);
    cfg.telemetry_capacity = read_positive_int(config["telemetry_capacity"].node(), cfg.telemetry_capacity, "telemetry_capacity");

    // [robot]
    auto robot = config["robot"];
    arm_robot& r = cfg.robot;
    r.backend = robot["backend"].value_or(r.backend);
    r.shm_prefix = robot["shm_prefix"].value_or(r.shm_prefix);
    r.n_joints = read_positive_int(robot["n_joints"].node(), r.n_joints, "robot.n_joints");
    r.limits.max_delta_rad = robot["max_delta_rad"].value_or(r.limits.max_delta_rad);
    r.limits.max_joint_vel = robot["max_joint_vel"].value_or(r.limits.max_joint_vel);
    r.limits.max_drift_rad = robot["max_drift_rad"].value_or(r.limits.max_drift_rad);
    r.limits.joint_lower = read_vector(robot["joint_lower"].node(), r.limits.joint_lower, "robot.joint_lower");
    r.limits.joint_upper = read_vector(robot["joint_upper"].node(), r.limits.joint_upper, "robot.joint_upper");
    r.drift_watchdog = robot["drift_watchdog"].value_or(r.drift_watchdog);
    r.state_timeout_ms = read_positive_int(robot["state_timeout_ms"].node(), r.state_timeout_ms, "robot.state_timeout_ms");
    r.home_q = read_vector(robot["home_q"].node(), r.home_q, "robot.home_q");
    r.home_speed = robot["home_speed"].value_or(r.home_speed);
    r.home_before_episode = robot["home_before_episode"].value_or(r.home_before_episode);
    r.initial_q = read_vector(robot["initial_q"].node(), r.home_q, "robot.initial_q");

    // [camera]
    auto camera = config["camera"];
    arm_camera& c = cfg.camera;
    c.backend = camera["backend"].value_or(c.backend);
    c.stream = camera["stream"].value_or(c.stream);
    c.width = read_positive_int(camera["width"].node(), c.width, "camera.width");
    c.height = read_positive_int(camera["height"].node(), c.height, "camera.height");
    c.max_retries = read_positive_int(camera["max_retries"].node(), c.max_retries, "camera.max_retries");
    c.frame_timeout_ms = read_positive_int(camera["frame_timeout_ms"].node(), c.frame_timeout_ms, "camera.frame_timeout_ms");

    // [policy]
    auto policy = config["policy"];
    arm_policy& p = cfg.policy;
    p.backend = policy["backend"].value_or(p.backend);
    p.trajectory_file = policy["trajectory_file"].value_or(p.trajectory_file);
    p.action_mode = policy["action_mode"].value_or(p.action_mode);
    p.chunk_size = read_positive_int(policy["chunk_size"].node(), p.chunk_size, "policy.chunk_size");
    if (auto coeff = policy["temporal_ensemble_coeff"].value<double>())
        p.temporal_ensemble_coeff = *coeff;
    p.joint_sign = read_vector(policy["joint_sign"].node(), Eigen::VectorXd::Ones(r.n_joints), "policy.joint_sign");
    p.training_mean = read_vector(policy["training_mean"].node(), p.training_mean, "policy.training_mean");
    p.training_std = read_vector(policy["training_std"].node(), p.training_std, "policy.training_std");
    p.ood_threshold = policy["ood_threshold"].value_or(p.ood_threshold);

    cfg.validate();
    return cfg;
}

arm_rtc_config readConfig(const std::string& filename) {
    toml::table config;
    try {
        config = toml::parse_file(filename);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("Error parsing file " + filename + ": " + std::string(err.description()));
    }
    fmt::print("[CONFIG] Configuration file read: {}\n", filename);
    return readArmConfig(config);
}
