#include "policy_oracle.h"
#include "armrtc.h"
#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>

TrajectoryOracle::TrajectoryOracle(const Eigen::MatrixXd& positions_in, int chunk_size_in,
                                   int stride_in, bool delta_mode_in)
    : positions(positions_in), chunk_size(chunk_size_in), stride(stride_in), delta_mode(delta_mode_in)
{
    if (positions.rows() == 0 || positions.cols() == 0)
        throw std::invalid_argument("TrajectoryOracle: empty trajectory");
    if (chunk_size < 1 || stride < 1)
        throw std::invalid_argument("TrajectoryOracle: chunk_size and stride must be >= 1");
}

Eigen::VectorXd TrajectoryOracle::row_at(long i) const {
    const long last = static_cast<long>(positions.rows()) - 1;
    return positions.row(std::min(i, last)).transpose();
}

ActionChunk TrajectoryOracle::predict(const JointState& state, const RgbFrame& /*image*/) {
    if (state.q.size() != positions.cols())
        throw std::runtime_error(fmt::format("TrajectoryOracle: state has {} joints, trajectory has {}",
                                             state.q.size(), positions.cols()));
    ActionChunk chunk;
    chunk.actions.resize(chunk_size, positions.cols());
    for (int i = 0; i < chunk_size; ++i) {
        Eigen::VectorXd p = row_at(cursor + i);
        if (delta_mode) {
            Eigen::VectorXd prev = (i == 0) ? state.q : row_at(cursor + i - 1);
            chunk.actions.row(i) = (p - prev).transpose();
        } else {
            chunk.actions.row(i) = p.transpose();
        }
    }
    cursor += stride;
    return chunk;
}

Eigen::MatrixXd load_trajectory(const std::string& filename) {
    toml::table tbl;
    try {
        tbl = toml::parse_file(filename);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("Error parsing trajectory file " + filename + ": " + std::string(err.description()));
    }
    const toml::array* arr = tbl["positions"].as_array();
    if (!arr || arr->empty())
        throw std::runtime_error("Trajectory file " + filename + " has no 'positions' array");
    Eigen::MatrixXd M = convertTomlArrayToEigenMatrix(*arr, Eigen::MatrixXd(), "positions");
    fmt::print("[RTC] Loaded trajectory {} ({} frames x {} joints)\n", filename, M.rows(), M.cols());
    return M;
}

std::unique_ptr<PolicyOracle> make_policy_oracle(const arm_policy& cfg, int n_joints) {
    if (cfg.backend == "trajectory") {
        Eigen::MatrixXd positions = load_trajectory(cfg.trajectory_file);
        if (positions.cols() != n_joints)
            throw std::runtime_error(fmt::format("Trajectory {} has {} joints, robot has {}",
                                                 cfg.trajectory_file, positions.cols(), n_joints));
        const int stride = cfg.temporal_ensemble_coeff ? 1 : cfg.chunk_size;
        return std::make_unique<TrajectoryOracle>(positions, cfg.chunk_size, stride,
                                                  cfg.action_mode == "delta");
    }
    throw std::runtime_error("Invalid policy backend: " + cfg.backend);
}
