#include "robot_link.h"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <thread>

// Interpolation period for move_to, matching the driver's servo rate.
#define MOVE_PERIOD_MS 8
// Reads of the state stream before a busy or torn stream is a fault.
#define STATE_READ_ATTEMPTS 3

namespace {
void open_stream(IMAGE& im, const std::string& name, uint8_t datatype, uint64_t min_elements) {
    if (ImageStreamIO_openIm(&im, name.c_str()) != IMAGESTREAMIO_SUCCESS)
        throw HardwareFault("Failed to open SHM \"" + name + "\"");
    if (im.md->datatype != datatype || im.md->nelement < min_elements) {
        ImageStreamIO_closeIm(&im);
        throw HardwareFault(fmt::format("SHM \"{}\" has datatype {} and {} elements, expected datatype {} and at least {}",
                                        name, im.md->datatype, im.md->nelement, datatype, min_elements));
    }
}
}

ShmRobotLink::ShmRobotLink(const std::string& prefix_in, int n_joints_in, unsigned int state_timeout_ms)
    : prefix(prefix_in), n_joints(n_joints_in), state_timeout(state_timeout_ms)
{
    if (n_joints < 1)
        throw std::invalid_argument("ShmRobotLink: n_joints must be >= 1");
}

ShmRobotLink::~ShmRobotLink() {
    if (!connected) return;
    try {
        disconnect();
    } catch (const std::exception& e) {
        fmt::print(stderr, "[ROBOT] Error closing SHM streams: {}\n", e.what());
    }
}

void ShmRobotLink::connect() {
    if (connected) return;
    open_stream(state_im, prefix + "_state", _DATATYPE_DOUBLE, 2 * n_joints);
    try {
        open_stream(cmd_im, prefix + "_cmd", _DATATYPE_DOUBLE, n_joints);
    } catch (...) {
        ImageStreamIO_closeIm(&state_im);
        throw;
    }
    try {
        open_stream(flags_im, prefix + "_flags", _DATATYPE_INT32, 2);
    } catch (...) {
        ImageStreamIO_closeIm(&state_im);
        ImageStreamIO_closeIm(&cmd_im);
        throw;
    }
    last_state_cnt = state_im.md->cnt0;
    last_state_change = std::chrono::steady_clock::now();
    connected = true;
    fmt::print("[ROBOT] Connected to SHM streams {}_state/_cmd/_flags\n", prefix);
}

void ShmRobotLink::disconnect() {
    if (!connected) return;
    connected = false;
    ImageStreamIO_closeIm(&state_im);
    ImageStreamIO_closeIm(&cmd_im);
    ImageStreamIO_closeIm(&flags_im);
    fmt::print("[ROBOT] Disconnected from {}\n", prefix);
}

JointState ShmRobotLink::get_state() {
    if (!connected) throw HardwareFault("ShmRobotLink: get_state while not connected");

    const auto now = std::chrono::steady_clock::now();
    const uint64_t cnt = state_im.md->cnt0;
    if (cnt != last_state_cnt) {
        last_state_cnt = cnt;
        last_state_change = now;
    } else if (now - last_state_change > state_timeout) {
        throw HardwareFault(fmt::format("ShmRobotLink: {}_state not updated for {} ms",
                                        prefix, state_timeout.count()));
    }

    JointState s;
    s.q.resize(n_joints);
    s.qd.resize(n_joints);
    // Retry if the driver wrote while we copied.
    bool clean = false;
    for (int attempt = 0; attempt < STATE_READ_ATTEMPTS && !clean; ++attempt) {
        const uint64_t before = state_im.md->cnt0;
        if (state_im.md->write) {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            continue;
        }
        std::memcpy(s.q.data(), state_im.array.D, n_joints * sizeof(double));
        std::memcpy(s.qd.data(), state_im.array.D + n_joints, n_joints * sizeof(double));
        clean = (state_im.md->cnt0 == before) && !state_im.md->write;
    }
    if (!clean)
        throw HardwareFault(fmt::format("ShmRobotLink: {}_state busy or torn after {} reads",
                                        prefix, STATE_READ_ATTEMPTS));
    s.timestamp = std::chrono::duration<double>(now.time_since_epoch()).count();
    return s;
}

void ShmRobotLink::write_command(const Eigen::VectorXd& target) {
    if (target.size() != n_joints)
        throw std::invalid_argument("ShmRobotLink: command has the wrong number of joints");
    cmd_im.md->write = 1;
    std::memcpy(cmd_im.array.D, target.data(), n_joints * sizeof(double));
    cmd_im.md->cnt0++;
    cmd_im.md->cnt1 = 0;
    cmd_im.md->write = 0;
    ImageStreamIO_sempost(&cmd_im, -1);
}

void ShmRobotLink::command(const Eigen::VectorXd& target, double /*dt*/) {
    // The driver servos at its own rate; dt is implied by the command cadence.
    if (!connected) throw HardwareFault("ShmRobotLink: command while not connected");
    write_command(target);
}

void ShmRobotLink::move_to(const Eigen::VectorXd& target, double speed) {
    if (!connected) throw HardwareFault("ShmRobotLink: move_to while not connected");
    if (speed <= 0.0) throw std::invalid_argument("ShmRobotLink: move_to speed must be positive");

    const Eigen::VectorXd start = get_state().q;
    const double max_dist = (target - start).cwiseAbs().maxCoeff();
    const double step_rad = speed * MOVE_PERIOD_MS * 1e-3;
    const int n_steps = std::max(1, static_cast<int>(std::ceil(max_dist / step_rad)));
    fmt::print("[ROBOT] Moving to {} at {:.2f} rad/s ({} steps)\n", format_joints(target), speed, n_steps);

    for (int k = 1; k <= n_steps; ++k) {
        if (is_protective_stopped() || is_emergency_stopped())
            throw HardwareFault("ShmRobotLink: robot stopped during move_to");
        write_command(start + (target - start) * (static_cast<double>(k) / n_steps));
        std::this_thread::sleep_for(std::chrono::milliseconds(MOVE_PERIOD_MS));
    }
}

void ShmRobotLink::stop() {
    if (!connected) return;
    // Hold the current position.
    Eigen::VectorXd q(n_joints);
    std::memcpy(q.data(), state_im.array.D, n_joints * sizeof(double));
    write_command(q);
    fmt::print("[ROBOT] Stop: holding {}\n", format_joints(q));
}

int32_t ShmRobotLink::read_flag(int index) {
    if (!connected) throw HardwareFault("ShmRobotLink: flags read while not connected");
    return flags_im.array.SI32[index];
}

bool ShmRobotLink::is_protective_stopped() { return read_flag(0) != 0; }
bool ShmRobotLink::is_emergency_stopped() { return read_flag(1) != 0; }
