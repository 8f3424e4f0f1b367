#include "telemetry_hub.h"
#include <algorithm>
#include <stdexcept>

TelemetryHub::TelemetryHub(size_t capacity)
    : history(capacity)
{
    if (capacity == 0)
        throw std::invalid_argument("TelemetryHub: capacity must be > 0");
}

void TelemetryHub::record_step(const StepRecord& step) {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    history.push_back(step); // evicts the oldest when full
    if (step.was_clamped) status.total_safety_violations++;
    status.cumulative_delta = step.drift;
}

void TelemetryHub::record_image(const RgbFrame& frame) {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    latest_image = frame;
    status.has_image = true;
}

std::optional<StepRecord> TelemetryHub::get_latest() const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    if (history.empty()) return std::nullopt;
    return history.back();
}

std::vector<StepRecord> TelemetryHub::get_history(size_t n) const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    const auto count = static_cast<std::ptrdiff_t>(std::min(n, history.size()));
    return std::vector<StepRecord>(history.end() - count, history.end());
}

std::optional<RgbFrame> TelemetryHub::get_image() const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    return latest_image;
}

TelemetrySnapshot TelemetryHub::get_snapshot() const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    TelemetrySnapshot snap;
    if (!history.empty()) snap.latest = history.back();
    snap.status = status;
    snap.history_size = history.size();
    return snap;
}

void TelemetryHub::set_episode_active(bool active) {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    if (active) {
        status.total_safety_violations = 0;
        status.cumulative_delta.resize(0);
    }
    status.episode_active = active;
}

void TelemetryHub::set_initial_q(const Eigen::VectorXd& q) {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    status.initial_q = q;
}

void TelemetryHub::set_status(bool control_enabled, bool policy_loaded,
                              bool robot_connected, bool camera_connected) {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    status.control_enabled = control_enabled;
    status.policy_loaded = policy_loaded;
    status.robot_connected = robot_connected;
    status.camera_connected = camera_connected;
}

size_t TelemetryHub::get_capacity() const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    return history.capacity();
}

size_t TelemetryHub::get_size() const {
    std::lock_guard<std::mutex> lk(telemetry_mutex);
    return history.size();
}
