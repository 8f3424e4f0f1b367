#pragma once

#include "arm_types.h"
#include <ImageStreamIO.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

// Device failure: link down, stale state, protective or emergency stop.
class HardwareFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------- Base Interface -------------------------------
// Synchronous I/O to the arm controller. All calls are bounded-latency.
class RobotLink {
public:
    virtual ~RobotLink() = default;

    // Lifecycle
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    // Core RT step
    virtual JointState get_state() = 0;
    virtual void command(const Eigen::VectorXd& target, double dt) = 0;

    // Blocking point-to-point move at the given joint speed (rad/s).
    virtual void move_to(const Eigen::VectorXd& target, double speed) = 0;
    virtual void stop() = 0;

    // Hardware stop flags
    virtual bool is_protective_stopped() = 0;
    virtual bool is_emergency_stopped() = 0;

    virtual std::string get_type() const = 0;
};

// ============================== SimRobotLink =================================
// Kinematic stand-in for the arm: a command moves the joints straight to the
// target. Used for dry runs without hardware and by the tests.
class SimRobotLink : public RobotLink {
public:
    explicit SimRobotLink(const Eigen::VectorXd& initial_q);

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected; }

    JointState get_state() override;
    void command(const Eigen::VectorXd& target, double dt) override;
    void move_to(const Eigen::VectorXd& target, double speed) override;
    void stop() override;

    bool is_protective_stopped() override { return protective_stop; }
    bool is_emergency_stopped() override { return emergency_stop; }

    std::string get_type() const override { return "sim"; }

    // Fault injection
    void trigger_protective_stop() { protective_stop = true; }
    void trigger_emergency_stop() { emergency_stop = true; }

    long get_command_count() const { return n_commands; }
    long get_stop_count() const { return n_stops; }
    const Eigen::VectorXd& get_last_command() const { return last_command; }

private:
    Eigen::VectorXd q, qd;
    Eigen::VectorXd last_command;
    bool connected = false;
    bool protective_stop = false;
    bool emergency_stop = false;
    long n_commands = 0;
    long n_stops = 0;
    std::chrono::steady_clock::time_point t0;

    void require_connected(const char* what) const;
};

// ============================== ShmRobotLink =================================
// Arm driver process on the other side of three ImageStreamIO streams:
//   <prefix>_state : 2N doubles, q then qd, written by the driver
//   <prefix>_cmd   : N doubles, written here, semaphore posted per command
//   <prefix>_flags : 2 int32, protective stop then emergency stop
class ShmRobotLink : public RobotLink {
public:
    ShmRobotLink(const std::string& prefix, int n_joints, unsigned int state_timeout_ms);
    ~ShmRobotLink() override;

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected; }

    JointState get_state() override;
    void command(const Eigen::VectorXd& target, double dt) override;
    void move_to(const Eigen::VectorXd& target, double speed) override;
    void stop() override;

    bool is_protective_stopped() override;
    bool is_emergency_stopped() override;

    std::string get_type() const override { return "shm"; }

private:
    std::string prefix;
    int n_joints;
    std::chrono::milliseconds state_timeout;
    IMAGE state_im, cmd_im, flags_im;
    bool connected = false;
    uint64_t last_state_cnt = 0;
    std::chrono::steady_clock::time_point last_state_change;

    void write_command(const Eigen::VectorXd& target);
    int32_t read_flag(int index);
};

struct arm_robot;
// Factory: "sim" or "shm".
std::unique_ptr<RobotLink> make_robot_link(const arm_robot& cfg);
