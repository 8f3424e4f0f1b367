#include "action_fuser.h"
#include <cmath>
#include <stdexcept>

ActionFuser::ActionFuser(int chunk_size_in, int n_joints_in, std::optional<double> ensemble_coeff)
    : chunk_size(chunk_size_in), n_joints(n_joints_in), coeff(ensemble_coeff)
{
    if (chunk_size < 1)
        throw std::invalid_argument("ActionFuser: chunk_size must be >= 1");
    if (n_joints < 1)
        throw std::invalid_argument("ActionFuser: n_joints must be >= 1");
    if (coeff && !(std::isfinite(*coeff) && *coeff >= 0.0))
        throw std::invalid_argument("ActionFuser: temporal_ensemble_coeff must be finite and >= 0");
}

void ActionFuser::reset() {
    tick = 0;
    oracle_calls = 0;
    queue.clear();
    chunks.clear();
}

int ActionFuser::get_buffer_depth() const {
    return is_ensemble() ? static_cast<int>(chunks.size()) : static_cast<int>(queue.size());
}

ActionChunk ActionFuser::call_oracle(const OracleCall& oracle_call) {
    ActionChunk chunk = oracle_call();
    oracle_calls++;
    if (chunk.actions.rows() != chunk_size || chunk.actions.cols() != n_joints) {
        throw std::runtime_error(fmt::format("ActionFuser: oracle returned a {}x{} chunk, expected {}x{}",
                                             chunk.actions.rows(), chunk.actions.cols(),
                                             chunk_size, n_joints));
    }
    if (!chunk.actions.allFinite())
        throw std::runtime_error("ActionFuser: oracle returned non-finite actions");
    chunk.origin = tick;
    return chunk;
}

Eigen::VectorXd ActionFuser::resolve(const OracleCall& oracle_call) {
    if (!is_ensemble()) {
        Eigen::VectorXd action;
        if (!queue.empty()) {
            action = queue.front();
            queue.pop_front();
        } else {
            ActionChunk chunk = call_oracle(oracle_call);
            action = chunk.actions.row(0).transpose();
            for (Eigen::Index i = 1; i < chunk.actions.rows(); ++i)
                queue.push_back(chunk.actions.row(i).transpose());
        }
        tick++;
        return action;
    }

    chunks.push_back(call_oracle(oracle_call));

    Eigen::VectorXd weighted = Eigen::VectorXd::Zero(n_joints);
    double weight_total = 0.0;
    for (const auto& c : chunks) {
        const long age = tick - c.origin;
        if (age < 0 || age >= chunk_size) continue;
        const double w = std::exp(-(*coeff) * static_cast<double>(age));
        weighted += w * c.actions.row(age).transpose();
        weight_total += w;
    }

    // Drop chunks whose last predicted tick is behind us.
    while (!chunks.empty() && chunks.front().origin + chunk_size - 1 < tick)
        chunks.pop_front();

    tick++;
    // The newest chunk always covers the current tick with w = 1.
    return weighted / weight_total;
}
