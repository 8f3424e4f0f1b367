#pragma once

#include <Eigen/Dense>
#include <optional>
#include <stdexcept>
#include <string>

// Software limits applied to every joint command before it reaches the arm.
struct SafetyLimits {
    double max_delta_rad = 0.05;   // per-tick displacement
    double max_joint_vel = 1.0;    // rad/s
    double max_drift_rad = 0.5;    // from the episode reference pose
    Eigen::VectorXd joint_lower;   // rad
    Eigen::VectorXd joint_upper;   // rad

    void validate() const {
        if (max_delta_rad <= 0.0)
            throw std::runtime_error("SafetyLimits: max_delta_rad must be positive.");
        if (max_joint_vel <= 0.0)
            throw std::runtime_error("SafetyLimits: max_joint_vel must be positive.");
        if (max_drift_rad <= 0.0)
            throw std::runtime_error("SafetyLimits: max_drift_rad must be positive.");
        if (joint_lower.size() == 0 || joint_lower.size() != joint_upper.size())
            throw std::runtime_error("SafetyLimits: joint_lower/joint_upper empty or size mismatch.");
        for (Eigen::Index i = 0; i < joint_lower.size(); ++i)
            if (joint_lower(i) > joint_upper(i))
                throw std::runtime_error("SafetyLimits: joint_lower > joint_upper for joint " + std::to_string(i));
    }
};

struct SafetyState {
    int violation_count = 0;
    bool frozen = false;
    std::optional<Eigen::VectorXd> reference_q;
};

// Clamp stages, in the order they are applied.
// 1. delta clamp    - per-joint |target - current| <= max_delta_rad
// 2. position clamp - lower <= target <= upper
// 3. velocity scale - whole displacement scaled so max |v| <= max_joint_vel (dt > 0 only)
// 4. drift watchdog - any |target - reference_q| > max_drift_rad freezes the guard
//
// A target with a NaN or inf is replaced by `current` before stage 1 and
// counts as a violation. A non-finite `current` is an invalid_argument.
//
// Once frozen every call returns `current` until reset().
class SafetyGuard {
public:
    explicit SafetyGuard(const SafetyLimits& limits);

    Eigen::VectorXd clamp(const Eigen::VectorXd& target,
                          const Eigen::VectorXd& current,
                          double dt);

    // First call per episode wins; later calls are ignored until reset().
    void set_initial_reference(const Eigen::VectorXd& q);
    void set_drift_watchdog_enabled(bool enabled) { drift_watchdog = enabled; }
    bool drift_watchdog_enabled() const { return drift_watchdog; }

    // New episode: clears count, frozen flag and reference.
    void reset();

    // |q - reference_q| per joint, zeros when no reference is set.
    Eigen::VectorXd get_drift(const Eigen::VectorXd& q) const;

    const SafetyState& get_state() const { return state; }
    const SafetyLimits& get_limits() const { return limits; }
    bool is_frozen() const { return state.frozen; }
    int get_violation_count() const { return state.violation_count; }

private:
    SafetyLimits limits;
    SafetyState state;
    bool drift_watchdog = true;

    void check_size(const Eigen::VectorXd& v, const char* what) const;
};
