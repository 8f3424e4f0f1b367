#pragma once

#include "arm_types.h"
#include <memory>
#include <string>

// ----------------------------- Base Interface -------------------------------
// The learned policy, seen from the control loop. predict() receives the
// joint state already in the policy frame and returns L actions; the fuser
// stamps the chunk origin. Any exception is an oracle fault.
class PolicyOracle {
public:
    virtual ~PolicyOracle() = default;

    virtual void reset() = 0;
    virtual ActionChunk predict(const JointState& state, const RgbFrame& image) = 0;

    virtual int get_chunk_size() const = 0;
    virtual std::string get_type() const = 0;
};

// ============================= TrajectoryOracle ==============================
// Replays a recorded joint trajectory (policy frame, one row per tick) as if
// it were a policy. Each call returns the next L rows and advances the cursor
// by `stride`; past the end the last row is held.
//
// delta mode: row 0 is the step from the observed state to the next recorded
// pose, later rows are successive recorded steps.
class TrajectoryOracle : public PolicyOracle {
public:
    TrajectoryOracle(const Eigen::MatrixXd& positions, int chunk_size, int stride, bool delta_mode);

    void reset() override { cursor = 0; }
    ActionChunk predict(const JointState& state, const RgbFrame& image) override;

    int get_chunk_size() const override { return chunk_size; }
    std::string get_type() const override { return "trajectory"; }

    long get_cursor() const { return cursor; }

private:
    Eigen::MatrixXd positions; // rows = frames, cols = joints
    int chunk_size;
    int stride;
    bool delta_mode;
    long cursor = 0;

    Eigen::VectorXd row_at(long i) const;
};

// Reads `positions = [[...], ...]` from a TOML file.
Eigen::MatrixXd load_trajectory(const std::string& filename);

struct arm_policy;
// Factory. stride follows the fusion mode: L for chunk-buffer, 1 for ensemble.
std::unique_ptr<PolicyOracle> make_policy_oracle(const arm_policy& cfg, int n_joints);
