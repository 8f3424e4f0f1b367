#include "rtc.h"
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

using rtc_clock = std::chrono::steady_clock;

const char* to_string(LoopState s) {
    switch (s) {
        case LoopState::Idle:      return "idle";
        case LoopState::Running:   return "running";
        case LoopState::Completed: return "completed";
        case LoopState::Aborted:   return "aborted";
    }
    return "unknown";
}

const char* to_string(AbortReason r) {
    switch (r) {
        case AbortReason::None:          return "none";
        case AbortReason::HardwareStop:  return "hardware_stop";
        case AbortReason::HardwareFault: return "hardware_fault";
        case AbortReason::DriftExceeded: return "drift_exceeded";
        case AbortReason::OracleFault:   return "oracle_fault";
        case AbortReason::Shutdown:      return "shutdown";
    }
    return "unknown";
}

namespace {
// Stops and releases the devices on every exit path. Each step is attempted
// even if an earlier one throws.
class DeviceCleanup {
public:
    DeviceCleanup(RobotLink& robot_in, CameraSource& camera_in, TelemetryHub& telemetry_in,
                  bool control_enabled_in, const bool& policy_ready_in)
        : robot(robot_in), camera(camera_in), telemetry(telemetry_in),
          control_enabled(control_enabled_in), policy_ready(policy_ready_in) {}

    ~DeviceCleanup() {
        fmt::print("[RTC] Shutting down devices ...\n");
        try {
            robot.stop();
        } catch (const std::exception& e) {
            fmt::print(stderr, "[RTC] Robot stop error: {}\n", e.what());
        }
        try {
            camera.stop();
        } catch (const std::exception& e) {
            fmt::print(stderr, "[RTC] Camera stop error: {}\n", e.what());
        }
        try {
            robot.disconnect();
        } catch (const std::exception& e) {
            fmt::print(stderr, "[RTC] Robot disconnect error: {}\n", e.what());
        }
        telemetry.set_status(control_enabled, policy_ready, robot.is_connected(), camera.is_running());
        fmt::print("[RTC] Shutdown complete\n");
    }

    DeviceCleanup(const DeviceCleanup&) = delete;
    DeviceCleanup& operator=(const DeviceCleanup&) = delete;

private:
    RobotLink& robot;
    CameraSource& camera;
    TelemetryHub& telemetry;
    bool control_enabled;
    const bool& policy_ready;
};

void abort_with(EpisodeSummary& s, AbortReason reason, const std::string& detail) {
    s.final_state = LoopState::Aborted;
    s.reason = reason;
    s.detail = detail;
    fmt::print(stderr, "[RTC] Aborting episode ({}): {}\n", to_string(reason), detail);
}
}

ControlLoop::ControlLoop(const arm_rtc_config& cfg_in,
                         std::unique_ptr<RobotLink> robot_in,
                         std::unique_ptr<CameraSource> camera_in,
                         std::unique_ptr<PolicyOracle> oracle_in,
                         TelemetryHub& telemetry_in)
    : cfg(cfg_in),
      robot(std::move(robot_in)),
      camera(std::move(camera_in)),
      oracle(std::move(oracle_in)),
      telemetry(telemetry_in),
      safety(cfg_in.robot.limits),
      fuser(cfg_in.policy.chunk_size, cfg_in.robot.n_joints, cfg_in.policy.temporal_ensemble_coeff)
{
    if (!robot || !camera || !oracle)
        throw std::invalid_argument("ControlLoop: robot, camera and oracle are all required");
    if (oracle->get_chunk_size() != cfg.policy.chunk_size)
        throw std::invalid_argument(fmt::format("ControlLoop: oracle chunk size {} != policy.chunk_size {}",
                                                oracle->get_chunk_size(), cfg.policy.chunk_size));
    convention.sign = cfg.policy.joint_sign;
    safety.set_drift_watchdog_enabled(cfg.robot.drift_watchdog);
}

std::optional<EpisodeSummary> ControlLoop::get_summary() const {
    std::lock_guard<std::mutex> lk(summary_mutex);
    return summary;
}

void ControlLoop::publish_status() {
    telemetry.set_status(cfg.enable_control, policy_ready, robot->is_connected(), camera->is_running());
}

EpisodeSummary ControlLoop::run_episode() {
    LoopState expected = LoopState::Idle;
    if (!loop_state.compare_exchange_strong(expected, LoopState::Running))
        throw std::logic_error("ControlLoop: run_episode called twice");

    EpisodeSummary s;
    s.enable_control = cfg.enable_control;
    const auto t_start = rtc_clock::now();

    fmt::print("[RTC] Starting episode: control_hz={:.0f}  enable_control={}  max_steps={}  fusion={}\n",
               cfg.control_hz, cfg.enable_control, cfg.max_episode_steps, fuser.get_mode());

    try {
        DeviceCleanup cleanup(*robot, *camera, telemetry, cfg.enable_control, policy_ready);
        if (prepare(s)) {
            telemetry.set_episode_active(true);
            run_ticks(s);
            telemetry.set_episode_active(false);
        }
    } catch (const std::exception& e) {
        telemetry.set_episode_active(false);
        abort_with(s, AbortReason::HardwareFault, std::string("unexpected error: ") + e.what());
        s.elapsed_s = std::chrono::duration<double>(rtc_clock::now() - t_start).count();
        s.violation_count = safety.get_violation_count();
        {
            std::lock_guard<std::mutex> lk(summary_mutex);
            summary = s;
        }
        loop_state = LoopState::Aborted;
        throw;
    }

    s.elapsed_s = std::chrono::duration<double>(rtc_clock::now() - t_start).count();
    s.avg_hz = (s.elapsed_s > 0.0) ? s.steps / s.elapsed_s : 0.0;
    s.violation_count = safety.get_violation_count();
    s.oracle_calls = fuser.get_oracle_calls();
    s.dropped_frames = camera->get_dropped();
    if (s.final_state != LoopState::Aborted) s.final_state = LoopState::Completed;

    fmt::print("[RTC] Episode {}: steps={} commands={} skipped={} overruns={} violations={} duration={:.2f}s avg_hz={:.1f}{}\n",
               to_string(s.final_state), s.steps, s.commands_sent, s.skipped_ticks, s.overruns,
               s.violation_count, s.elapsed_s, s.avg_hz,
               s.reason == AbortReason::None ? std::string() : fmt::format(" reason={} ({})", to_string(s.reason), s.detail));

    {
        std::lock_guard<std::mutex> lk(summary_mutex);
        summary = s;
    }
    loop_state = s.final_state;
    return s;
}

bool ControlLoop::prepare(EpisodeSummary& s) {
    try {
        robot->connect();
        camera->start();
    } catch (const std::exception& e) {
        publish_status();
        abort_with(s, AbortReason::HardwareFault, std::string("device start failed: ") + e.what());
        return false;
    }
    try {
        oracle->reset();
    } catch (const std::exception& e) {
        publish_status();
        abort_with(s, AbortReason::OracleFault, std::string("policy reset failed: ") + e.what());
        return false;
    }
    policy_ready = true;
    publish_status();

    fuser.reset();
    safety.reset();

    try {
        JointState init = robot->get_state();
        fmt::print("[RTC] Initial joints: {}\n", format_joints(init.q));
        fmt::print("[RTC] Wrapped joints: {}\n", format_joints(wrap_to_pi(init.q)));
        if (cfg.policy.training_mean.size() > 0)
            check_ood(convention.to_policy(init.q), cfg.policy.training_mean, cfg.policy.training_std,
                      cfg.policy.ood_threshold);

        if (cfg.robot.home_before_episode) {
            fmt::print("[RTC] Moving to home position {} ...\n", format_joints(cfg.robot.home_q));
            robot->move_to(cfg.robot.home_q, cfg.robot.home_speed);
            init = robot->get_state();
            fmt::print("[RTC] Post-home joints: {}\n", format_joints(init.q));
            if (cfg.policy.training_mean.size() > 0)
                check_ood(convention.to_policy(init.q), cfg.policy.training_mean, cfg.policy.training_std,
                          cfg.policy.ood_threshold);
        }
    } catch (const std::exception& e) {
        abort_with(s, AbortReason::HardwareFault, std::string("pre-episode: ") + e.what());
        return false;
    }

    return true;
}

void ControlLoop::run_ticks(EpisodeSummary& s) {
    const double dt = cfg.dt();
    const auto budget = std::chrono::duration_cast<rtc_clock::duration>(std::chrono::duration<double>(dt));
    const bool delta_mode = cfg.policy.action_mode == "delta";
    const long progress_every = std::max(1L, static_cast<long>(cfg.control_hz));
    const auto t_episode = rtc_clock::now();

    std::optional<RgbFrame> last_frame;
    bool have_reference = false;

    // Sleep out the rest of the tick. Overruns are logged, never caught up.
    auto pace = [&](rtc_clock::time_point t_loop) {
        const auto elapsed = rtc_clock::now() - t_loop;
        if (elapsed < budget) {
            std::this_thread::sleep_until(t_loop + budget);
        } else {
            const double over_ms = std::chrono::duration<double, std::milli>(elapsed - budget).count();
            if (over_ms > OVERRUN_LOG_THRESHOLD_MS) {
                s.overruns++;
                fmt::print(stderr, "[RTC] Loop overrun: {:.1f} ms (budget {:.1f} ms)\n",
                           std::chrono::duration<double, std::milli>(elapsed).count(), dt * 1e3);
            }
        }
    };

    long step = 0;
    while (step < cfg.max_episode_steps) {
        if (shutdown_requested) {
            abort_with(s, AbortReason::Shutdown, "shutdown requested");
            return;
        }
        const auto t_loop = rtc_clock::now();
        current_step = step;

        // 1. Robot state
        JointState js;
        try {
            js = robot->get_state();
            if (js.q.size() != cfg.robot.n_joints)
                throw HardwareFault(fmt::format("state has {} joints, expected {}", js.q.size(), cfg.robot.n_joints));
            if (!js.q.allFinite())
                throw HardwareFault("joint state is not finite");
        } catch (const std::exception& e) {
            abort_with(s, AbortReason::HardwareFault, e.what());
            return;
        }
        if (!have_reference) {
            safety.set_initial_reference(js.q);
            telemetry.set_initial_q(js.q);
            have_reference = true;
        }

        // 2. Frame
        if (auto f = camera->grab()) {
            last_frame = std::move(f);
            telemetry.record_image(*last_frame);
        } else if (!last_frame) {
            fmt::print(stderr, "[RTC] No frame available at step {}, skipping tick\n", step);
            s.skipped_ticks++;
            s.steps = ++step;
            pace(t_loop);
            continue;
        } else {
            fmt::print(stderr, "[RTC] Camera frame dropped at step {}, reusing last frame\n", step);
        }

        // 3. Fused action, policy frame
        JointState policy_state;
        policy_state.q = convention.to_policy(js.q);
        policy_state.qd = js.qd.size() == convention.sign.size() ? convention.to_robot(js.qd) : js.qd;
        policy_state.timestamp = js.timestamp;

        const auto t_infer = rtc_clock::now();
        Eigen::VectorXd raw_action;
        try {
            raw_action = fuser.resolve([&]() { return oracle->predict(policy_state, *last_frame); });
        } catch (const std::exception& e) {
            abort_with(s, AbortReason::OracleFault, e.what());
            return;
        }
        const double inference_ms = std::chrono::duration<double, std::milli>(rtc_clock::now() - t_infer).count();

        // 4. Target, robot frame
        const Eigen::VectorXd action = convention.to_robot(raw_action);
        const Eigen::VectorXd desired = delta_mode ? Eigen::VectorXd(js.q + action) : action;

        // 5. Safety
        const Eigen::VectorXd safe = safety.clamp(desired, js.q, dt);
        const bool was_clamped = (safe - desired).cwiseAbs().maxCoeff() > 1e-9;

        // 6. Dispatch
        AbortReason tick_abort = AbortReason::None;
        std::string detail;
        if (cfg.enable_control) {
            try {
                robot->command(safe, dt);
                s.commands_sent++;
            } catch (const std::exception& e) {
                tick_abort = AbortReason::HardwareFault;
                detail = e.what();
            }
        }

        // 7. Stop flags, drift freeze
        if (tick_abort == AbortReason::None) {
            try {
                if (robot->is_protective_stopped() || robot->is_emergency_stopped()) {
                    tick_abort = AbortReason::HardwareStop;
                    detail = robot->is_emergency_stopped() ? "emergency stop" : "protective stop";
                }
            } catch (const std::exception& e) {
                tick_abort = AbortReason::HardwareFault;
                detail = e.what();
            }
        }
        if (tick_abort == AbortReason::None && safety.is_frozen()) {
            tick_abort = AbortReason::DriftExceeded;
            detail = "drift watchdog triggered";
        }

        // 8. Telemetry
        StepRecord rec;
        rec.step = step;
        rec.timestamp = std::chrono::duration<double>(rtc_clock::now() - t_episode).count();
        rec.current_q = js.q;
        rec.target_q = safe;
        rec.raw_action = raw_action;
        rec.pre_clamp_target = desired;
        rec.drift = safety.get_drift(js.q);
        rec.was_clamped = was_clamped;
        rec.loop_dt_ms = std::chrono::duration<double, std::milli>(rtc_clock::now() - t_loop).count();
        rec.inference_dt_ms = inference_ms;
        rec.buffer_depth = fuser.get_buffer_depth();
        telemetry.record_step(rec);
        s.steps = ++step;

        if (rec.step % progress_every == 0)
            fmt::print("[RTC] Step {:4d} | q={} | buf={}\n", rec.step, format_joints(js.q), rec.buffer_depth);

        if (tick_abort != AbortReason::None) {
            abort_with(s, tick_abort, detail);
            return;
        }

        // 9. Timing
        pace(t_loop);
    }
    current_step = step;
}
