#pragma once

#define TOML_HEADER_ONLY 0
#include <toml++/toml.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "arm_types.h"
#include "safety_guard.h"

//----------Defines-----------
#define DEFAULT_CONTROL_HZ 30.0
#define DEFAULT_TELEMETRY_CAPACITY 6000 // ~200 s at 30 Hz

// Converts a TOML array (1D list of numbers, or 2D list of rows) to an Eigen
// type. The dummy argument only fixes the return type. fieldName is used in
// the error when the shape does not match a fixed-size Derived or an element
// is not a number.
template<typename Derived>
Derived convertTomlArrayToEigenMatrix(const toml::array& arr, const Derived& /*dummy*/, const std::string& fieldName = "") {
    using Scalar = typename Derived::Scalar;
    size_t rows = arr.size();
    size_t cols = 1;
    if (rows > 0 && arr[0].as_array()) {
        cols = arr[0].as_array()->size();
    }

    if(Derived::RowsAtCompileTime != Eigen::Dynamic && Derived::RowsAtCompileTime != static_cast<int>(rows)) {
        std::ostringstream oss;
        oss << "Field \"" << fieldName << "\": Expected " << Derived::RowsAtCompileTime
            << " rows but got " << rows;
        throw std::runtime_error(oss.str());
    }
    if(Derived::ColsAtCompileTime != Eigen::Dynamic && Derived::ColsAtCompileTime != static_cast<int>(cols)) {
        std::ostringstream oss;
        oss << "Field \"" << fieldName << "\": Expected " << Derived::ColsAtCompileTime
            << " cols but got " << cols;
        throw std::runtime_error(oss.str());
    }

    auto number_at = [&](const toml::node& n, size_t i, size_t j) -> Scalar {
        auto val_opt = n.value<double>();
        if (!val_opt) {
            std::ostringstream oss;
            oss << "Field \"" << fieldName << "\": element (" << i << "," << j << ") is not a number";
            throw std::runtime_error(oss.str());
        }
        return static_cast<Scalar>(*val_opt);
    };

    Derived result;
    result.resize(rows, cols);
    if (cols == 1 && !(rows > 0 && arr[0].as_array())) {
        for (size_t i = 0; i < rows; ++i) {
            result(i, 0) = number_at(arr[i], i, 0);
        }
    } else {
        for (size_t i = 0; i < rows; ++i) {
            const auto* rowArr = arr[i].as_array();
            if (!rowArr || rowArr->size() != cols) {
                std::ostringstream oss;
                oss << "Field \"" << fieldName << "\": row " << i << " is not a list of " << cols << " numbers";
                throw std::runtime_error(oss.str());
            }
            for (size_t j = 0; j < cols; ++j) {
                result(i, j) = number_at(rowArr->at(j), i, j);
            }
        }
    }
    return result;
}

//-----------------------------------------------------
// arm_robot: the arm link and its software limits.
struct arm_robot {
    std::string backend = "sim";      // sim | shm
    std::string shm_prefix = "ur10e";
    int n_joints = N_JOINTS;
    SafetyLimits limits;
    bool drift_watchdog = true;
    unsigned int state_timeout_ms = 100;
    Eigen::VectorXd home_q;           // robot frame
    double home_speed = 0.3;          // rad/s
    bool home_before_episode = false;
    Eigen::VectorXd initial_q;        // sim backend start pose

    arm_robot();

    void validate() const {
        if (backend != "sim" && backend != "shm")
            throw std::runtime_error("arm_robot: backend must be 'sim' or 'shm', got '" + backend + "'.");
        if (n_joints < 1)
            throw std::runtime_error("arm_robot: n_joints must be >= 1.");
        limits.validate();
        if (limits.joint_lower.size() != n_joints)
            throw std::runtime_error("arm_robot: joint_lower/joint_upper must have n_joints elements.");
        if (home_q.size() != n_joints || initial_q.size() != n_joints)
            throw std::runtime_error("arm_robot: home_q and initial_q must have n_joints elements.");
        if (home_speed <= 0.0)
            throw std::runtime_error("arm_robot: home_speed must be positive.");
        if (state_timeout_ms == 0)
            throw std::runtime_error("arm_robot: state_timeout_ms must be positive.");
    }
};

//-----------------------------------------------------
// arm_camera
struct arm_camera {
    std::string backend = "synthetic"; // synthetic | shm
    std::string stream = "ur10e_cam";
    unsigned int width = 848;
    unsigned int height = 480;
    int max_retries = 5;
    unsigned int frame_timeout_ms = 100;

    void validate() const {
        if (backend != "synthetic" && backend != "shm")
            throw std::runtime_error("arm_camera: backend must be 'synthetic' or 'shm', got '" + backend + "'.");
        if (width == 0 || height == 0)
            throw std::runtime_error("arm_camera: width and height must be positive.");
        if (max_retries < 1)
            throw std::runtime_error("arm_camera: max_retries must be >= 1.");
    }
};

//-----------------------------------------------------
// arm_policy: oracle, action interpretation and fusion.
struct arm_policy {
    std::string backend = "trajectory";
    std::string trajectory_file;
    std::string action_mode = "delta";            // delta | absolute
    int chunk_size = 100;
    std::optional<double> temporal_ensemble_coeff; // unset => chunk-buffer mode
    Eigen::VectorXd joint_sign;                    // robot <-> policy frame
    Eigen::VectorXd training_mean;                 // policy frame, empty => no OOD check
    Eigen::VectorXd training_std;
    double ood_threshold = 3.0;

    void validate(int n_joints) const {
        if (backend != "trajectory")
            throw std::runtime_error("arm_policy: unknown backend '" + backend + "'.");
        if (backend == "trajectory" && trajectory_file.empty())
            throw std::runtime_error("arm_policy: trajectory_file is required for the trajectory backend.");
        if (action_mode != "delta" && action_mode != "absolute")
            throw std::runtime_error("arm_policy: action_mode must be 'delta' or 'absolute', got '" + action_mode + "'.");
        if (chunk_size < 1)
            throw std::runtime_error("arm_policy: chunk_size must be >= 1.");
        if (temporal_ensemble_coeff && !(std::isfinite(*temporal_ensemble_coeff) && *temporal_ensemble_coeff >= 0.0))
            throw std::runtime_error("arm_policy: temporal_ensemble_coeff must be finite and >= 0.");
        if (joint_sign.size() != n_joints)
            throw std::runtime_error("arm_policy: joint_sign must have n_joints elements.");
        for (Eigen::Index i = 0; i < joint_sign.size(); ++i)
            if (joint_sign(i) != 1.0 && joint_sign(i) != -1.0)
                throw std::runtime_error("arm_policy: joint_sign entries must be +1 or -1.");
        if (training_mean.size() != training_std.size())
            throw std::runtime_error("arm_policy: training_mean and training_std size mismatch.");
        if (training_mean.size() != 0 && training_mean.size() != n_joints)
            throw std::runtime_error("arm_policy: training_mean must have n_joints elements.");
        if (training_std.size() != 0 && (training_std.array() <= 0.0).any())
            throw std::runtime_error("arm_policy: training_std entries must be positive.");
        if (ood_threshold <= 0.0)
            throw std::runtime_error("arm_policy: ood_threshold must be positive.");
    }
};

//-----------------------------------------------------
// Master configuration struct.
struct arm_rtc_config {
    std::string name = "ur10e";
    double control_hz = DEFAULT_CONTROL_HZ;
    long max_episode_steps = 3000;
    bool enable_control = false;  // dry-run unless explicitly enabled
    std::string log_dir = "./logs";
    size_t telemetry_capacity = DEFAULT_TELEMETRY_CAPACITY;

    arm_robot robot;
    arm_camera camera;
    arm_policy policy;

    arm_rtc_config() {
        policy.joint_sign = Eigen::VectorXd::Ones(robot.n_joints);
    }

    double dt() const { return 1.0 / control_hz; }

    void validate() const {
        if (control_hz <= 0.0)
            throw std::runtime_error("arm_rtc_config: control_hz must be positive.");
        if (max_episode_steps < 1)
            throw std::runtime_error("arm_rtc_config: max_episode_steps must be >= 1.");
        if (telemetry_capacity == 0)
            throw std::runtime_error("arm_rtc_config: telemetry_capacity must be > 0.");
        robot.validate();
        camera.validate();
        policy.validate(robot.n_joints);
    }
};

// Fill an arm_rtc_config from a parsed TOML table. Missing keys keep their
// defaults; the result is validated before it is returned.
arm_rtc_config readArmConfig(const toml::table& config);

// Parse and read in one go. Throws std::runtime_error on any failure.
arm_rtc_config readConfig(const std::string& filename);
