#include "safety_guard.h"
#include "arm_types.h"
#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>

namespace {
// Round-off from current + (target - current) must not count as a clamp.
constexpr double kAlteredTol = 1e-12;

bool altered(const Eigen::VectorXd& before, const Eigen::VectorXd& after) {
    return (before - after).cwiseAbs().maxCoeff() > kAlteredTol;
}
}

SafetyGuard::SafetyGuard(const SafetyLimits& limits_in)
    : limits(limits_in)
{
    limits.validate();
}

void SafetyGuard::check_size(const Eigen::VectorXd& v, const char* what) const {
    if (v.size() != limits.joint_lower.size())
        throw std::invalid_argument(fmt::format("SafetyGuard: {} has {} joints, expected {}",
                                                what, v.size(), limits.joint_lower.size()));
}

Eigen::VectorXd SafetyGuard::clamp(const Eigen::VectorXd& target,
                                   const Eigen::VectorXd& current,
                                   double dt)
{
    check_size(target, "target");
    check_size(current, "current");
    if (!current.allFinite())
        throw std::invalid_argument("SafetyGuard: current joint state is not finite");

    if (state.frozen) return current;

    bool clamped = false;
    Eigen::VectorXd result = target;

    // 0. Non-finite target: hold current, then let the remaining stages bound it.
    if (!target.allFinite()) {
        clamped = true;
        fmt::print(stderr, "[SAFETY] Non-finite target rejected, holding current position\n");
        result = current;
    }

    // 1. Delta clamp
    {
        Eigen::VectorXd delta = result - current;
        Eigen::VectorXd clipped = delta.cwiseMax(-limits.max_delta_rad).cwiseMin(limits.max_delta_rad);
        if (altered(delta, clipped)) {
            clamped = true;
            fmt::print(stderr, "[SAFETY] Delta clamped: max |delta|={:.4f} rad (limit {:.4f})\n",
                       delta.cwiseAbs().maxCoeff(), limits.max_delta_rad);
            result = current + clipped;
        }
    }

    // 2. Position clamp
    {
        Eigen::VectorXd clipped = result.cwiseMax(limits.joint_lower).cwiseMin(limits.joint_upper);
        if (altered(result, clipped)) {
            clamped = true;
            fmt::print(stderr, "[SAFETY] Position clamped to joint limits\n");
        }
        result = clipped;
    }

    // 3. Velocity scale
    if (dt > 0.0) {
        const double max_vel = (result - current).cwiseAbs().maxCoeff() / dt;
        if (max_vel > limits.max_joint_vel) {
            const double scale = std::min(1.0, limits.max_joint_vel / max_vel);
            result = current + (result - current) * scale;
            // Only matters when current itself is outside the limits.
            result = result.cwiseMax(limits.joint_lower).cwiseMin(limits.joint_upper);
            clamped = true;
            fmt::print(stderr, "[SAFETY] Velocity scaled by {:.2f} (implied {:.2f} rad/s, limit {:.2f})\n",
                       scale, max_vel, limits.max_joint_vel);
        }
    }

    // 4. Drift watchdog
    if (drift_watchdog && state.reference_q) {
        const double drift = (result - *state.reference_q).cwiseAbs().maxCoeff();
        if (drift > limits.max_drift_rad) {
            state.frozen = true;
            state.violation_count++;
            fmt::print(stderr, "[SAFETY] Drift watchdog triggered: {:.4f} rad from reference (limit {:.4f}). Output frozen.\n",
                       drift, limits.max_drift_rad);
            return current;
        }
    }

    if (clamped) state.violation_count++;
    return result;
}

void SafetyGuard::set_initial_reference(const Eigen::VectorXd& q) {
    check_size(q, "reference");
    if (state.reference_q) return;
    state.reference_q = q;
    fmt::print("[SAFETY] Drift reference set to {}\n", format_joints(q));
}

void SafetyGuard::reset() {
    state = SafetyState{};
}

Eigen::VectorXd SafetyGuard::get_drift(const Eigen::VectorXd& q) const {
    if (!state.reference_q) return Eigen::VectorXd::Zero(q.size());
    check_size(q, "q");
    return (q - *state.reference_q).cwiseAbs();
}
