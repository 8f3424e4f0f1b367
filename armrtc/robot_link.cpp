#include "robot_link.h"
#include "armrtc.h"
#include <fmt/core.h>

//-------------------------------------------------------------
// SimRobotLink
SimRobotLink::SimRobotLink(const Eigen::VectorXd& initial_q)
    : q(initial_q),
      qd(Eigen::VectorXd::Zero(initial_q.size())),
      last_command(initial_q),
      t0(std::chrono::steady_clock::now())
{
    if (initial_q.size() == 0)
        throw std::invalid_argument("SimRobotLink: initial_q is empty");
}

void SimRobotLink::require_connected(const char* what) const {
    if (!connected)
        throw HardwareFault(fmt::format("SimRobotLink: {} while not connected", what));
}

void SimRobotLink::connect() {
    if (connected) return;
    connected = true;
    t0 = std::chrono::steady_clock::now();
    fmt::print("[ROBOT] Connected to simulated arm at {}\n", format_joints(q));
}

void SimRobotLink::disconnect() {
    if (!connected) return;
    connected = false;
    fmt::print("[ROBOT] Simulated arm disconnected\n");
}

JointState SimRobotLink::get_state() {
    require_connected("get_state");
    JointState s;
    s.q = q;
    s.qd = qd;
    s.timestamp = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return s;
}

void SimRobotLink::command(const Eigen::VectorXd& target, double dt) {
    require_connected("command");
    if (target.size() != q.size())
        throw std::invalid_argument("SimRobotLink: command has the wrong number of joints");
    n_commands++;
    last_command = target;
    // A stopped controller ignores servo commands.
    if (protective_stop || emergency_stop) return;
    qd = (dt > 0.0) ? Eigen::VectorXd((target - q) / dt) : Eigen::VectorXd::Zero(q.size());
    q = target;
}

void SimRobotLink::move_to(const Eigen::VectorXd& target, double speed) {
    require_connected("move_to");
    if (target.size() != q.size())
        throw std::invalid_argument("SimRobotLink: move_to target has the wrong number of joints");
    if (speed <= 0.0)
        throw std::invalid_argument("SimRobotLink: move_to speed must be positive");
    if (protective_stop || emergency_stop)
        throw HardwareFault("SimRobotLink: move_to refused, arm is stopped");
    fmt::print("[ROBOT] Moving to {} at {:.2f} rad/s\n", format_joints(target), speed);
    q = target;
    qd.setZero();
}

void SimRobotLink::stop() {
    n_stops++;
    qd.setZero();
}

//-------------------------------------------------------------
std::unique_ptr<RobotLink> make_robot_link(const arm_robot& cfg) {
    if (cfg.backend == "sim") {
        return std::make_unique<SimRobotLink>(cfg.initial_q);
    } else if (cfg.backend == "shm") {
        return std::make_unique<ShmRobotLink>(cfg.shm_prefix, cfg.n_joints, cfg.state_timeout_ms);
    }
    throw std::runtime_error("Invalid robot backend: " + cfg.backend);
}
