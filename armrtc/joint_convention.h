#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

// Wrap angles to [-pi, pi). The controller reports cumulative angles that
// can exceed 2*pi; the policy was trained on wrapped ones.
Eigen::VectorXd wrap_to_pi(const Eigen::VectorXd& angles);

// The policy's joint frame differs from the robot's by a per-joint sign.
// The mask is its own inverse.
struct JointConvention {
    Eigen::VectorXd sign;

    Eigen::VectorXd to_policy(const Eigen::VectorXd& q_robot) const;
    Eigen::VectorXd to_robot(const Eigen::VectorXd& a_policy) const;
};

// Joints whose policy-frame z-score against the training distribution
// exceeds threshold. Each one is logged; an empty result is logged too.
std::vector<int> check_ood(const Eigen::VectorXd& q_policy,
                           const Eigen::VectorXd& training_mean,
                           const Eigen::VectorXd& training_std,
                           double threshold);

extern const char* const JOINT_NAMES[];
