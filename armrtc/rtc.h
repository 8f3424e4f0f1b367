#pragma once

#include "armrtc.h"
#include "action_fuser.h"
#include "camera_source.h"
#include "joint_convention.h"
#include "policy_oracle.h"
#include "robot_link.h"
#include "safety_guard.h"
#include "telemetry_hub.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Overruns smaller than this are not worth a log line.
#define OVERRUN_LOG_THRESHOLD_MS 5.0

enum class LoopState { Idle, Running, Completed, Aborted };

enum class AbortReason {
    None,
    HardwareStop,   // protective or emergency stop flag
    HardwareFault,  // link error, stale state, failed connect
    DriftExceeded,  // safety guard froze
    OracleFault,    // policy threw or returned a malformed chunk
    Shutdown        // request_shutdown()
};

const char* to_string(LoopState s);
const char* to_string(AbortReason r);

struct EpisodeSummary {
    long steps = 0;            // ticks run, skipped ones included
    long commands_sent = 0;
    long skipped_ticks = 0;    // no frame yet, nothing dispatched
    long overruns = 0;
    long dropped_frames = 0;
    long oracle_calls = 0;
    double elapsed_s = 0.0;
    double avg_hz = 0.0;
    int violation_count = 0;
    LoopState final_state = LoopState::Idle;
    AbortReason reason = AbortReason::None;
    std::string detail;
    bool enable_control = false;
};

// One episode of fixed-period control. Owns the devices, the fuser and the
// safety guard for its lifetime; only the telemetry hub is shared.
//
// Per tick: state -> frame -> fused action -> target -> clamp -> dispatch
// (if enabled) -> stop/freeze checks -> telemetry -> sleep.
class ControlLoop {
public:
    ControlLoop(const arm_rtc_config& cfg,
                std::unique_ptr<RobotLink> robot,
                std::unique_ptr<CameraSource> camera,
                std::unique_ptr<PolicyOracle> oracle,
                TelemetryHub& telemetry);

    // Blocks until Completed or Aborted. Callable once, from Idle.
    EpisodeSummary run_episode();

    // Safe from any thread or a signal handler. Honoured at the next tick.
    void request_shutdown() { shutdown_requested = true; }

    LoopState get_state() const { return loop_state.load(); }
    long get_step() const { return current_step.load(); }
    std::optional<EpisodeSummary> get_summary() const;

    const SafetyGuard& get_safety_guard() const { return safety; }
    const ActionFuser& get_fuser() const { return fuser; }

private:
    arm_rtc_config cfg;
    std::unique_ptr<RobotLink> robot;
    std::unique_ptr<CameraSource> camera;
    std::unique_ptr<PolicyOracle> oracle;
    TelemetryHub& telemetry;

    SafetyGuard safety;
    ActionFuser fuser;
    JointConvention convention;
    bool policy_ready = false; // oracle reset succeeded; control thread only

    std::atomic<LoopState> loop_state{LoopState::Idle};
    std::atomic<bool> shutdown_requested{false};
    std::atomic<long> current_step{0};

    mutable std::mutex summary_mutex;
    std::optional<EpisodeSummary> summary;

    // Connect, reset, OOD check and optional homing. Returns false (with
    // s.reason set) if the episode cannot start.
    bool prepare(EpisodeSummary& s);
    void run_ticks(EpisodeSummary& s);
    void publish_status();
};
