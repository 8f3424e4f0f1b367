#include "joint_convention.h"
#include "arm_types.h"
#include <fmt/core.h>
#include <cmath>
#include <stdexcept>

constexpr double kPi = 3.14159265358979323846;

const char* const JOINT_NAMES[N_JOINTS] = {"base", "shoulder", "elbow", "wrist1", "wrist2", "wrist3"};

Eigen::VectorXd wrap_to_pi(const Eigen::VectorXd& angles) {
    Eigen::VectorXd out(angles.size());
    for (Eigen::Index i = 0; i < angles.size(); ++i) {
        double a = std::fmod(angles(i) + kPi, 2.0 * kPi);
        if (a < 0.0) a += 2.0 * kPi;
        out(i) = a - kPi;
    }
    return out;
}

Eigen::VectorXd JointConvention::to_policy(const Eigen::VectorXd& q_robot) const {
    if (q_robot.size() != sign.size())
        throw std::invalid_argument("JointConvention: joint count does not match sign mask");
    return wrap_to_pi(q_robot.cwiseProduct(sign));
}

Eigen::VectorXd JointConvention::to_robot(const Eigen::VectorXd& a_policy) const {
    if (a_policy.size() != sign.size())
        throw std::invalid_argument("JointConvention: joint count does not match sign mask");
    return a_policy.cwiseProduct(sign);
}

std::vector<int> check_ood(const Eigen::VectorXd& q_policy,
                           const Eigen::VectorXd& training_mean,
                           const Eigen::VectorXd& training_std,
                           double threshold)
{
    if (training_mean.size() != q_policy.size() || training_std.size() != q_policy.size())
        throw std::invalid_argument("check_ood: training_mean/training_std size mismatch");

    std::vector<int> ood;
    for (Eigen::Index j = 0; j < q_policy.size(); ++j) {
        const double z = (q_policy(j) - training_mean(j)) / training_std(j);
        if (std::abs(z) > threshold) {
            ood.push_back(static_cast<int>(j));
            const char* name = (j < N_JOINTS) ? JOINT_NAMES[j] : "joint";
            fmt::print(stderr, "[RTC] OOD  {:<10}: policy_conv={:.3f} rad  train_mean={:.3f}  z={:+.1f}\n",
                       name, q_policy(j), training_mean(j), z);
        }
    }
    if (ood.empty())
        fmt::print("[RTC] All joints within {:.0f} sigma of the training distribution.\n", threshold);
    else
        fmt::print(stderr, "[RTC] One or more joints are far from the training distribution. Consider homing first (--home).\n");
    return ood;
}
