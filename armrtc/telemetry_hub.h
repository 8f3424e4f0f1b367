#pragma once

#include "arm_types.h"
#include <boost/circular_buffer.hpp>
#include <mutex>
#include <optional>
#include <vector>

// Status flags shown next to the live plots.
struct TelemetryStatus {
    bool episode_active = false;
    bool control_enabled = false;
    bool policy_loaded = false;
    bool robot_connected = false;
    bool camera_connected = false;
    bool has_image = false;
    int total_safety_violations = 0; // clamped records this episode
    Eigen::VectorXd cumulative_delta; // drift of the latest record
    std::optional<Eigen::VectorXd> initial_q;
};

struct TelemetrySnapshot {
    std::optional<StepRecord> latest;
    TelemetryStatus status;
    size_t history_size = 0;
};

// Bounded, thread-safe history of control-loop ticks. One writer (the
// control thread) and any number of polling readers. Every accessor copies
// in or out under a single mutex; nothing slow happens while it is held.
class TelemetryHub {
public:
    explicit TelemetryHub(size_t capacity = 6000);

    void record_step(const StepRecord& step);
    void record_image(const RgbFrame& frame);

    std::optional<StepRecord> get_latest() const;
    // Up to n newest records, oldest first.
    std::vector<StepRecord> get_history(size_t n) const;
    std::optional<RgbFrame> get_image() const;
    TelemetrySnapshot get_snapshot() const;

    // Activating resets the per-episode counters. History is kept.
    void set_episode_active(bool active);
    void set_initial_q(const Eigen::VectorXd& q);
    void set_status(bool control_enabled, bool policy_loaded,
                    bool robot_connected, bool camera_connected);

    size_t get_capacity() const;
    size_t get_size() const;

private:
    mutable std::mutex telemetry_mutex;
    boost::circular_buffer<StepRecord> history;
    std::optional<RgbFrame> latest_image;
    TelemetryStatus status;
};
